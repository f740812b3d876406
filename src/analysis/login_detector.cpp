#include <pagescope/analysis/login_detector.h>
#include <pagescope/html/walker.h>

#include <array>
#include <string_view>

namespace pagescope::analysis {

namespace {

// ============================================================================
// Vocabularies
// ============================================================================

constexpr std::array<std::string_view, 11> kFormPatterns = {
    "login", "signin", "sign_in", "sign-in",
    "authenticate", "auth", "authentication",
    "logon", "signon", "sign_on", "sign-on",
};

constexpr std::array<std::string_view, 3> kAutocompleteValues = {
    "username", "current-password", "new-password",
};

constexpr std::array<std::string_view, 2> kAuthDataAttributes = {
    "data-auth", "data-login",
};

constexpr std::array<std::string_view, 13> kContextPhrases = {
    "sign in to", "log in to", "login to",
    "welcome back", "welcome to",
    "enter your", "provide your",
    "access your account", "access account",
    "your credentials", "your password",
    "authentication required", "login required",
};

constexpr std::array<std::string_view, 11> kFieldLabels = {
    "username", "user id", "userid", "user-id",
    "email address", "email addr", "e-mail",
    "password", "passwd", "pass word", "pass-word",
};

constexpr std::array<std::string_view, 10> kSubmitTexts = {
    "login", "sign in", "signin", "log in",
    "authenticate", "continue", "submit",
    "enter", "access", "proceed",
};

constexpr std::array<std::string_view, 10> kFieldKeywords = {
    "username", "userid", "user_id", "user-name",
    "password", "passwd", "pass_word", "pass-word",
    "login", "email",
};

template<size_t N>
bool contains_any(std::string_view text, const std::array<std::string_view, N>& words) {
    for (auto word : words) {
        if (html::contains_ci(text, word)) {
            return true;
        }
    }
    return false;
}

bool attribute_equals_ci(const html::Node& node, std::string_view name, std::string_view value) {
    auto attr = html::get_attribute(node, name);
    return attr && html::to_lower(html::trim(*attr)) == value;
}

// ============================================================================
// Signals
// ============================================================================

bool has_form_pattern(const html::Node& form) {
    for (const auto& attr : form.attributes) {
        if (attr.name == "action" || attr.name == "id" ||
            attr.name == "name" || attr.name == "class") {
            if (contains_any(attr.value, kFormPatterns)) {
                return true;
            }
        }
    }
    return false;
}

bool has_auth_attribute(const html::Node& node) {
    for (const auto& attr : node.attributes) {
        if (attr.name == "autocomplete" && contains_any(attr.value, kAutocompleteValues)) {
            return true;
        }
        if (contains_any(attr.name, kAuthDataAttributes)) {
            return true;
        }
    }
    return false;
}

bool is_submit_control(const html::Node& node) {
    if (node.is_element("input")) {
        return attribute_equals_ci(node, "type", "submit");
    }
    if (node.is_element("button")) {
        // A button with no type attribute submits its form.
        auto type = html::get_attribute(node, "type");
        return !type || html::to_lower(html::trim(*type)) == "submit";
    }
    return false;
}

std::string control_label(const html::Node& node) {
    if (node.is_element("input")) {
        return html::get_attribute(node, "value").value_or("");
    }
    return html::text_content(node);
}

bool is_login_field(const html::Node& input) {
    for (const auto& attr : input.attributes) {
        if ((attr.name == "name" || attr.name == "id") &&
            contains_any(attr.value, kFieldKeywords)) {
            return true;
        }
    }
    return false;
}

} // namespace

LoginSignals inspect_form(const html::Node& form) {
    LoginSignals signals;
    signals.form_attribute = has_form_pattern(form);

    html::walk(form, [&](const html::Node& node) {
        if (node.type != html::Node::Element) {
            return html::WalkAction::Continue;
        }
        if (!signals.auth_attribute && has_auth_attribute(node)) {
            signals.auth_attribute = true;
        }
        if (node.is_element("input")) {
            if (attribute_equals_ci(node, "type", "password")) {
                signals.password_field = true;
            }
            if (!signals.field_name && is_login_field(node)) {
                signals.field_name = true;
            }
        }
        if (!signals.submit_text && is_submit_control(node) &&
            contains_any(control_label(node), kSubmitTexts)) {
            signals.submit_text = true;
        }
        return html::WalkAction::Continue;
    });

    const std::string text = html::text_content(form);
    signals.contextual_text = contains_any(text, kContextPhrases) ||
                              contains_any(text, kFieldLabels);
    return signals;
}

bool is_login_form(const html::Node& form) {
    return inspect_form(form).is_login();
}

bool has_login_form(const html::Node& root) {
    bool found = false;
    html::walk(root, [&](const html::Node& node) {
        if (node.is_element("form") && is_login_form(node)) {
            found = true;
            return html::WalkAction::Stop;
        }
        return html::WalkAction::Continue;
    });
    return found;
}

} // namespace pagescope::analysis
