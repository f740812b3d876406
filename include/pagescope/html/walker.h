#pragma once
#include <pagescope/html/tree_builder.h>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pagescope::html {

// Visitor result: Continue descends into children, SkipChildren moves on to
// the next sibling, Stop ends the walk.
enum class WalkAction { Continue, SkipChildren, Stop };

using Visitor = std::function<WalkAction(const Node&)>;

// Depth-first, document-order traversal starting at (and including) root.
// Returns false when a visitor stopped the walk early.
bool walk(const Node& root, const Visitor& visit);

// First node in document order matching pred, or nullptr.
const Node* find_first(const Node& root, const std::function<bool(const Node&)>& pred);

// First element with the given (lowercase) tag name, or nullptr.
const Node* find_element(const Node& root, std::string_view tag);
std::vector<const Node*> find_all_elements(const Node& root, std::string_view tag);

// First node of the given type, or nullptr.
const Node* find_by_type(const Node& root, Node::Type type);

// Concatenated text of every descendant text node.
std::string text_content(const Node& node);

// Attribute lookup by case-insensitive name.
std::optional<std::string> get_attribute(const Node& node, std::string_view name);
bool has_attribute(const Node& node, std::string_view name);

std::string to_lower(std::string_view s);
std::string trim(std::string_view s);
bool contains_ci(std::string_view haystack, std::string_view needle);

} // namespace pagescope::html
