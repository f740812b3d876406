#include <pagescope/html/walker.h>
#include <algorithm>

namespace pagescope::html {

namespace {

char to_lower_ascii(char c) {
    if (c >= 'A' && c <= 'Z') return static_cast<char>(c + 32);
    return c;
}

bool is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Tree depth is bounded by parse(), so recursion depth is bounded too.
WalkAction walk_impl(const Node& node, const Visitor& visit) {
    WalkAction action = visit(node);
    if (action == WalkAction::Stop) return WalkAction::Stop;
    if (action == WalkAction::SkipChildren) return WalkAction::Continue;
    for (const auto& child : node.children) {
        if (walk_impl(*child, visit) == WalkAction::Stop) {
            return WalkAction::Stop;
        }
    }
    return WalkAction::Continue;
}

void collect_text(const Node& node, std::string& out) {
    if (node.type == Node::Text) {
        out += node.data;
    }
    for (const auto& child : node.children) {
        collect_text(*child, out);
    }
}

} // namespace

bool walk(const Node& root, const Visitor& visit) {
    return walk_impl(root, visit) != WalkAction::Stop;
}

const Node* find_first(const Node& root, const std::function<bool(const Node&)>& pred) {
    const Node* found = nullptr;
    walk(root, [&](const Node& node) {
        if (pred(node)) {
            found = &node;
            return WalkAction::Stop;
        }
        return WalkAction::Continue;
    });
    return found;
}

const Node* find_element(const Node& root, std::string_view tag) {
    return find_first(root, [tag](const Node& node) { return node.is_element(tag); });
}

std::vector<const Node*> find_all_elements(const Node& root, std::string_view tag) {
    std::vector<const Node*> result;
    walk(root, [&](const Node& node) {
        if (node.is_element(tag)) {
            result.push_back(&node);
        }
        return WalkAction::Continue;
    });
    return result;
}

const Node* find_by_type(const Node& root, Node::Type type) {
    return find_first(root, [type](const Node& node) { return node.type == type; });
}

std::string text_content(const Node& node) {
    std::string result;
    collect_text(node, result);
    return result;
}

std::optional<std::string> get_attribute(const Node& node, std::string_view name) {
    for (const auto& attr : node.attributes) {
        if (attr.name.size() != name.size()) continue;
        bool match = true;
        for (size_t i = 0; i < name.size(); ++i) {
            if (to_lower_ascii(attr.name[i]) != to_lower_ascii(name[i])) {
                match = false;
                break;
            }
        }
        if (match) return attr.value;
    }
    return std::nullopt;
}

bool has_attribute(const Node& node, std::string_view name) {
    return get_attribute(node, name).has_value();
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(), to_lower_ascii);
    return result;
}

std::string trim(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && is_whitespace(s[start])) ++start;
    size_t end = s.size();
    while (end > start && is_whitespace(s[end - 1])) --end;
    return std::string(s.substr(start, end - start));
}

bool contains_ci(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) { return to_lower_ascii(a) == to_lower_ascii(b); });
    return it != haystack.end();
}

} // namespace pagescope::html
