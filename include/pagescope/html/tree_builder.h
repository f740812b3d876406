#pragma once
#include <pagescope/core/error.h>
#include <pagescope/html/tokenizer.h>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pagescope::html {

// Parsed document tree. Once parse() returns, the tree is never mutated, so
// any number of threads may read it concurrently.
struct Node {
    enum Type { Element, Text, Comment, Document, DocumentType };
    Type type = Element;
    std::string tag_name;  // lowercased; doctype name for DocumentType
    std::string data;      // for text/comment
    // Elements: tag attributes in source order. DocumentType: "public" then
    // "system" identifiers, each present only when declared.
    std::vector<Attribute> attributes;
    Node* parent = nullptr;
    std::vector<std::unique_ptr<Node>> children;

    Node* append_child(std::unique_ptr<Node> child);

    bool is_element(std::string_view tag) const {
        return type == Element && tag_name == tag;
    }
};

enum class InsertionMode {
    Initial,
    BeforeHtml,
    BeforeHead,
    InHead,
    AfterHead,
    InBody,
    Text,
    AfterBody
};

class TreeBuilder {
public:
    TreeBuilder();

    // Process a token
    void process_token(const Token& token);

    Node* document() const { return document_.get(); }
    std::unique_ptr<Node> take_document() { return std::move(document_); }

    // Set once an element would have been nested deeper than the limit.
    bool depth_exceeded() const { return depth_exceeded_; }

private:
    std::unique_ptr<Node> document_;
    Node* head_ = nullptr;
    Node* body_ = nullptr;
    Node* form_ = nullptr;
    std::vector<Node*> open_elements_;
    InsertionMode mode_ = InsertionMode::Initial;
    InsertionMode original_mode_ = InsertionMode::Initial;
    bool depth_exceeded_ = false;

    void handle_initial(const Token& token);
    void handle_before_html(const Token& token);
    void handle_before_head(const Token& token);
    void handle_in_head(const Token& token);
    void handle_after_head(const Token& token);
    void handle_in_body(const Token& token);
    void handle_text(const Token& token);
    void handle_after_body(const Token& token);

    Node* current_node();
    Node* insert_element(const Token& token);
    Node* insert_element(const std::string& tag);
    void insert_text(const std::string& data);
    void insert_comment(const std::string& data);
    void insert_doctype(const Token& token);
    void generate_implied_end_tags(const std::string& except = "");
    bool has_element_in_scope(const std::string& tag) const;
    void pop_until(const std::string& tag);
    void close_element(const std::string& tag);
    void close_p_if_open();
    void ensure_body();
};

// Parses markup into a document tree. Fails only for content that is not
// markup at all (embedded NUL bytes) or that nests deeper than
// core::config::kMaxTreeDepth; everything else is recovered into a tree.
// The error carries status_code 0 and no URL; callers fill both in.
core::Result<std::unique_ptr<Node>> parse(std::string_view html);

} // namespace pagescope::html
