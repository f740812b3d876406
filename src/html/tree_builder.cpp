#include <pagescope/html/tree_builder.h>
#include <pagescope/core/config.h>
#include <algorithm>
#include <unordered_set>

namespace pagescope::html {

// ============================================================================
// Helper utilities
// ============================================================================

static const std::unordered_set<std::string>& void_elements() {
    static const std::unordered_set<std::string> s = {
        "area", "base", "br", "col", "embed", "hr", "img", "input",
        "link", "meta", "source", "track", "wbr"
    };
    return s;
}

static const std::unordered_set<std::string>& special_elements() {
    static const std::unordered_set<std::string> s = {
        "address", "applet", "article", "aside", "blockquote", "body",
        "button", "caption", "center", "dd", "details", "dir", "div",
        "dl", "dt", "fieldset", "figcaption", "figure", "footer", "form",
        "h1", "h2", "h3", "h4", "h5", "h6", "head", "header", "hgroup",
        "html", "iframe", "li", "listing", "main", "marquee", "menu",
        "nav", "noscript", "object", "ol", "p", "pre", "section",
        "select", "summary", "table", "tbody", "td", "template",
        "textarea", "tfoot", "th", "thead", "tr", "ul", "xmp"
    };
    return s;
}

// Elements that implicitly close a <p> when encountered as a start tag
static bool closes_p(const std::string& tag) {
    static const std::unordered_set<std::string> s = {
        "address", "article", "aside", "blockquote", "center", "details",
        "dialog", "dir", "div", "dl", "fieldset", "figcaption", "figure",
        "footer", "header", "hgroup", "hr", "li", "listing", "main",
        "menu", "nav", "ol", "p", "pre", "search", "section", "summary",
        "table", "ul",
        "h1", "h2", "h3", "h4", "h5", "h6"
    };
    return s.count(tag) > 0;
}

static bool is_heading(const std::string& tag) {
    return tag.size() == 2 && tag[0] == 'h' && tag[1] >= '1' && tag[1] <= '6';
}

// Raw text elements: their content is parsed as raw text
static bool is_raw_text_element(const std::string& tag) {
    return tag == "script" || tag == "style" || tag == "xmp"
        || tag == "iframe" || tag == "noembed" || tag == "noframes";
}

// RCDATA elements: title, textarea
static bool is_rcdata_element(const std::string& tag) {
    return tag == "title" || tag == "textarea";
}

static bool is_head_element(const std::string& tag) {
    return tag == "title" || tag == "meta" || tag == "link" || tag == "style"
        || tag == "script" || tag == "base" || tag == "noscript";
}

static bool is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\f' || c == '\r';
}

static bool is_all_whitespace(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
        [](char c) { return is_whitespace(c); });
}

Node* Node::append_child(std::unique_ptr<Node> child) {
    child->parent = this;
    children.push_back(std::move(child));
    return children.back().get();
}

// ============================================================================
// TreeBuilder
// ============================================================================

TreeBuilder::TreeBuilder() {
    document_ = std::make_unique<Node>();
    document_->type = Node::Document;
}

Node* TreeBuilder::current_node() {
    if (open_elements_.empty()) return document_.get();
    return open_elements_.back();
}

Node* TreeBuilder::insert_element(const Token& token) {
    auto node = std::make_unique<Node>();
    node->type = Node::Element;
    node->tag_name = token.name;
    node->attributes = token.attributes;
    auto* raw = current_node()->append_child(std::move(node));
    if (!void_elements().count(token.name) && !token.self_closing) {
        if (open_elements_.size() >= core::config::kMaxTreeDepth) {
            depth_exceeded_ = true;
        } else {
            open_elements_.push_back(raw);
        }
    }
    return raw;
}

Node* TreeBuilder::insert_element(const std::string& tag) {
    Token token;
    token.type = Token::StartTag;
    token.name = tag;
    return insert_element(token);
}

void TreeBuilder::insert_text(const std::string& data) {
    if (data.empty()) return;
    auto* cur = current_node();
    // Merge with previous text node if possible
    if (!cur->children.empty() && cur->children.back()->type == Node::Text) {
        cur->children.back()->data += data;
        return;
    }
    auto node = std::make_unique<Node>();
    node->type = Node::Text;
    node->data = data;
    cur->append_child(std::move(node));
}

void TreeBuilder::insert_comment(const std::string& data) {
    auto node = std::make_unique<Node>();
    node->type = Node::Comment;
    node->data = data;
    current_node()->append_child(std::move(node));
}

void TreeBuilder::insert_doctype(const Token& token) {
    auto node = std::make_unique<Node>();
    node->type = Node::DocumentType;
    node->tag_name = token.name;
    if (token.has_public_id) {
        node->attributes.push_back({"public", token.public_id});
    }
    if (token.has_system_id) {
        node->attributes.push_back({"system", token.system_id});
    }
    document_->append_child(std::move(node));
}

void TreeBuilder::generate_implied_end_tags(const std::string& except) {
    static const std::unordered_set<std::string> implied = {
        "dd", "dt", "li", "optgroup", "option", "p", "rb", "rp", "rt", "rtc"
    };
    while (!open_elements_.empty()) {
        auto& tag = current_node()->tag_name;
        if (tag == except) break;
        if (implied.count(tag) == 0) break;
        open_elements_.pop_back();
    }
}

bool TreeBuilder::has_element_in_scope(const std::string& tag) const {
    static const std::unordered_set<std::string> scope_markers = {
        "applet", "caption", "html", "table", "td", "th", "marquee", "object", "template"
    };
    for (auto it = open_elements_.rbegin(); it != open_elements_.rend(); ++it) {
        if ((*it)->tag_name == tag) return true;
        if (scope_markers.count((*it)->tag_name)) return false;
    }
    return false;
}

void TreeBuilder::pop_until(const std::string& tag) {
    while (!open_elements_.empty()) {
        auto* node = open_elements_.back();
        open_elements_.pop_back();
        if (node->tag_name == tag) break;
    }
}

void TreeBuilder::close_element(const std::string& tag) {
    if (has_element_in_scope(tag)) {
        generate_implied_end_tags(tag);
        pop_until(tag);
    }
}

void TreeBuilder::close_p_if_open() {
    if (has_element_in_scope("p")) {
        close_element("p");
    }
}

void TreeBuilder::ensure_body() {
    if (body_) return;
    if (open_elements_.empty()) {
        insert_element("html");
    }
    body_ = insert_element("body");
    mode_ = InsertionMode::InBody;
}

// ============================================================================
// Token processing dispatch
// ============================================================================

void TreeBuilder::process_token(const Token& token) {
    switch (mode_) {
        case InsertionMode::Initial:    handle_initial(token); break;
        case InsertionMode::BeforeHtml: handle_before_html(token); break;
        case InsertionMode::BeforeHead: handle_before_head(token); break;
        case InsertionMode::InHead:     handle_in_head(token); break;
        case InsertionMode::AfterHead:  handle_after_head(token); break;
        case InsertionMode::InBody:     handle_in_body(token); break;
        case InsertionMode::Text:       handle_text(token); break;
        case InsertionMode::AfterBody:  handle_after_body(token); break;
    }
}

// ============================================================================
// Insertion mode handlers
// ============================================================================

void TreeBuilder::handle_initial(const Token& token) {
    if (token.type == Token::Character && is_all_whitespace(token.data)) {
        return;
    }
    if (token.type == Token::Comment) {
        insert_comment(token.data);
        return;
    }
    if (token.type == Token::DOCTYPE) {
        insert_doctype(token);
        mode_ = InsertionMode::BeforeHtml;
        return;
    }
    mode_ = InsertionMode::BeforeHtml;
    handle_before_html(token);
}

void TreeBuilder::handle_before_html(const Token& token) {
    if (token.type == Token::DOCTYPE) {
        return;
    }
    if (token.type == Token::Comment) {
        insert_comment(token.data);
        return;
    }
    if (token.type == Token::Character && is_all_whitespace(token.data)) {
        return;
    }
    if (token.type == Token::StartTag && token.name == "html") {
        insert_element(token);
        mode_ = InsertionMode::BeforeHead;
        return;
    }
    if (token.type == Token::EndTag) {
        if (token.name != "head" && token.name != "body"
            && token.name != "html" && token.name != "br") {
            return;
        }
    }
    if (token.type == Token::EndOfFile) {
        return;
    }
    insert_element("html");
    mode_ = InsertionMode::BeforeHead;
    process_token(token);
}

void TreeBuilder::handle_before_head(const Token& token) {
    if (token.type == Token::Character && is_all_whitespace(token.data)) {
        return;
    }
    if (token.type == Token::Comment) {
        insert_comment(token.data);
        return;
    }
    if (token.type == Token::DOCTYPE) {
        return;
    }
    if (token.type == Token::StartTag && token.name == "html") {
        return;
    }
    if (token.type == Token::StartTag && token.name == "head") {
        head_ = insert_element(token);
        mode_ = InsertionMode::InHead;
        return;
    }
    if (token.type == Token::EndTag) {
        if (token.name != "head" && token.name != "body"
            && token.name != "html" && token.name != "br") {
            return;
        }
    }
    if (token.type == Token::EndOfFile) {
        return;
    }
    // Implied head
    head_ = insert_element("head");
    mode_ = InsertionMode::InHead;
    process_token(token);
}

void TreeBuilder::handle_in_head(const Token& token) {
    if (token.type == Token::Character && is_all_whitespace(token.data)) {
        insert_text(token.data);
        return;
    }
    if (token.type == Token::Comment) {
        insert_comment(token.data);
        return;
    }
    if (token.type == Token::DOCTYPE) {
        return;
    }
    if (token.type == Token::StartTag) {
        if (token.name == "html" || token.name == "head") {
            return;
        }
        if (is_head_element(token.name)) {
            insert_element(token);
            if (!token.self_closing &&
                (is_raw_text_element(token.name) || is_rcdata_element(token.name))) {
                original_mode_ = mode_;
                mode_ = InsertionMode::Text;
            }
            return;
        }
    }
    if (token.type == Token::EndTag) {
        if (token.name == "head") {
            pop_until("head");
            mode_ = InsertionMode::AfterHead;
            return;
        }
        if (token.name != "body" && token.name != "html" && token.name != "br") {
            return;
        }
    }
    pop_until("head");
    mode_ = InsertionMode::AfterHead;
    process_token(token);
}

void TreeBuilder::handle_after_head(const Token& token) {
    if (token.type == Token::Character && is_all_whitespace(token.data)) {
        insert_text(token.data);
        return;
    }
    if (token.type == Token::Comment) {
        insert_comment(token.data);
        return;
    }
    if (token.type == Token::DOCTYPE) {
        return;
    }
    if (token.type == Token::StartTag && token.name == "body") {
        body_ = insert_element(token);
        mode_ = InsertionMode::InBody;
        return;
    }
    if (token.type == Token::EndOfFile) {
        return;
    }
    // Late head content and everything else lands in an implied body
    ensure_body();
    process_token(token);
}

void TreeBuilder::handle_in_body(const Token& token) {
    switch (token.type) {
        case Token::Character:
            insert_text(token.data);
            return;
        case Token::Comment:
            insert_comment(token.data);
            return;
        case Token::DOCTYPE:
        case Token::EndOfFile:
            return;
        case Token::StartTag:
            break;
        case Token::EndTag: {
            const auto& name = token.name;
            if (name == "body" || name == "html") {
                if (has_element_in_scope("body")) {
                    mode_ = InsertionMode::AfterBody;
                }
                return;
            }
            if (name == "form") {
                Node* node = form_;
                form_ = nullptr;
                if (!node) return;
                auto it = std::find(open_elements_.begin(), open_elements_.end(), node);
                if (it == open_elements_.end()) return;
                generate_implied_end_tags();
                open_elements_.erase(std::find(open_elements_.begin(), open_elements_.end(), node));
                return;
            }
            if (name == "p") {
                if (!has_element_in_scope("p")) {
                    insert_element("p");
                }
                close_element("p");
                return;
            }
            if (name == "br") {
                insert_element("br");
                return;
            }
            if (is_heading(name)) {
                // Any open heading closes on any heading end tag
                for (auto it = open_elements_.rbegin(); it != open_elements_.rend(); ++it) {
                    if (is_heading((*it)->tag_name)) {
                        generate_implied_end_tags();
                        pop_until((*it)->tag_name);
                        return;
                    }
                    if (special_elements().count((*it)->tag_name)) return;
                }
                return;
            }
            for (auto it = open_elements_.rbegin(); it != open_elements_.rend(); ++it) {
                if ((*it)->tag_name == name) {
                    generate_implied_end_tags(name);
                    Node* target = *it;
                    while (!open_elements_.empty()) {
                        Node* popped = open_elements_.back();
                        open_elements_.pop_back();
                        if (popped == target) break;
                    }
                    return;
                }
                if (special_elements().count((*it)->tag_name)) return;
            }
            return;
        }
    }

    // Start tags
    const auto& name = token.name;
    if (name == "html" || name == "body" || name == "head") {
        return;
    }
    if (name == "form") {
        if (form_) return;
        close_p_if_open();
        form_ = insert_element(token);
        return;
    }
    if (name == "li" || name == "dd" || name == "dt") {
        for (auto it = open_elements_.rbegin(); it != open_elements_.rend(); ++it) {
            const auto& tag = (*it)->tag_name;
            if (tag == "li" || tag == "dd" || tag == "dt") {
                if ((name == "li") == (tag == "li")) {
                    close_element(tag);
                }
                break;
            }
            if (special_elements().count(tag) && tag != "address" &&
                tag != "div" && tag != "p") {
                break;
            }
        }
    }
    if (closes_p(name)) {
        close_p_if_open();
    }
    if (is_heading(name) && is_heading(current_node()->tag_name)) {
        open_elements_.pop_back();
    }
    if (name == "a" && has_element_in_scope("a")) {
        close_element("a");
    }
    if (name == "option" && current_node()->tag_name == "option") {
        open_elements_.pop_back();
    }

    insert_element(token);
    if (!token.self_closing &&
        (is_raw_text_element(name) || is_rcdata_element(name))) {
        original_mode_ = mode_;
        mode_ = InsertionMode::Text;
    }
}

void TreeBuilder::handle_text(const Token& token) {
    if (token.type == Token::Character) {
        insert_text(token.data);
        return;
    }
    if (token.type == Token::EndTag || token.type == Token::EndOfFile) {
        if (!open_elements_.empty()) {
            open_elements_.pop_back();
        }
        mode_ = original_mode_;
        if (token.type == Token::EndOfFile) {
            process_token(token);
        }
    }
}

void TreeBuilder::handle_after_body(const Token& token) {
    if (token.type == Token::Comment) {
        Node* target = open_elements_.empty() ? document_.get() : open_elements_.front();
        auto node = std::make_unique<Node>();
        node->type = Node::Comment;
        node->data = token.data;
        target->append_child(std::move(node));
        return;
    }
    if (token.type == Token::EndTag && token.name == "html") {
        return;
    }
    if (token.type == Token::EndOfFile || token.type == Token::DOCTYPE) {
        return;
    }
    mode_ = InsertionMode::InBody;
    process_token(token);
}

// ============================================================================
// Convenience parse function
// ============================================================================

core::Result<std::unique_ptr<Node>> parse(std::string_view html) {
    if (html.find('\0') != std::string_view::npos) {
        return core::AnalysisError{0, "content contains NUL bytes and is not markup", ""};
    }

    Tokenizer tokenizer(html);
    TreeBuilder builder;

    while (true) {
        Token token = tokenizer.next_token();
        builder.process_token(token);

        // Switch the tokenizer for raw text and RCDATA content
        if (token.type == Token::StartTag && !token.self_closing) {
            if (is_raw_text_element(token.name)) {
                tokenizer.set_last_start_tag(token.name);
                tokenizer.set_state(TokenizerState::RAWTEXT);
            } else if (is_rcdata_element(token.name)) {
                tokenizer.set_last_start_tag(token.name);
                tokenizer.set_state(TokenizerState::RCDATA);
            } else if (token.name == "plaintext") {
                tokenizer.set_state(TokenizerState::PLAINTEXT);
            }
        }

        if (token.type == Token::EndOfFile) break;
    }

    if (builder.depth_exceeded()) {
        return core::AnalysisError{
            0,
            "document nesting exceeds " + std::to_string(core::config::kMaxTreeDepth) +
                " levels",
            ""};
    }
    return builder.take_document();
}

} // namespace pagescope::html
