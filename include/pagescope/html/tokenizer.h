#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace pagescope::html {

struct Attribute {
    std::string name;
    std::string value;
};

struct Token {
    enum Type { DOCTYPE, StartTag, EndTag, Character, Comment, EndOfFile };
    Type type = EndOfFile;
    std::string name;  // lowercased tag or doctype name
    std::vector<Attribute> attributes;
    bool self_closing = false;
    std::string data;  // For Character/Comment tokens

    // DOCTYPE-specific
    std::string public_id;
    std::string system_id;
    bool has_public_id = false;
    bool has_system_id = false;
};

enum class TokenizerState {
    Data,
    RAWTEXT,  // script, style, xmp, iframe, noembed, noframes
    RCDATA,   // title, textarea
    PLAINTEXT
};

// Lenient markup scanner. Consecutive character data is coalesced into one
// Character token; entities are decoded in data, RCDATA and attribute values.
class Tokenizer {
public:
    explicit Tokenizer(std::string_view input);

    Token next_token();
    void set_state(TokenizerState state);
    TokenizerState state() const { return state_; }
    void set_last_start_tag(const std::string& tag) { last_start_tag_ = tag; }

private:
    std::string_view input_;
    size_t pos_ = 0;
    TokenizerState state_ = TokenizerState::Data;
    std::string last_start_tag_;

    char consume();
    char peek(size_t offset = 0) const;
    bool at_end() const;
    bool starts_with_ci(std::string_view prefix) const;
    void skip_whitespace();

    Token data_token();
    Token text_until_end_tag(bool decode_entities);
    Token tag_token(bool end_tag);
    Token markup_declaration();
    Token bogus_comment();
    Token doctype_token();

    std::string attribute_value();
    std::string quoted_identifier();

    // HTML entity decoding: called after '&'. Returns the decoded text, or
    // "&" when no reference matches.
    std::string try_consume_entity();
};

// Decodes every character reference in text.
std::string decode_entities(std::string_view text);

} // namespace pagescope::html
