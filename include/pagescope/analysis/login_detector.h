#pragma once
#include <pagescope/html/tree_builder.h>

namespace pagescope::analysis {

// Independent heuristics evaluated over one <form> subtree. All matching is
// case-insensitive substring matching.
struct LoginSignals {
    // Necessary condition: an <input type="password"> somewhere in the form.
    bool password_field = false;

    // action/id/name/class of the form containing "login", "signin", "auth"...
    bool form_attribute = false;
    // autocomplete="username|current-password|new-password", or a
    // data-auth / data-login attribute, on the form or any descendant.
    bool auth_attribute = false;
    // Form text with a login phrase ("sign in to", "welcome back"...) or a
    // credential label ("username", "email address"...).
    bool contextual_text = false;
    // A submit control labelled "log in", "sign in", "continue"...
    bool submit_text = false;
    // An <input> whose name or id holds a login field keyword.
    bool field_name = false;

    bool corroborated() const {
        return form_attribute || auth_attribute || contextual_text || submit_text || field_name;
    }

    // Password field plus at least one corroborating signal.
    bool is_login() const { return password_field && corroborated(); }
};

LoginSignals inspect_form(const html::Node& form);

bool is_login_form(const html::Node& form);

// True when any <form> in the document is a login form.
bool has_login_form(const html::Node& root);

} // namespace pagescope::analysis
