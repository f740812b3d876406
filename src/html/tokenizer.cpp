#include <pagescope/html/tokenizer.h>
#include <cctype>
#include <cstdlib>
#include <unordered_map>

namespace pagescope::html {

namespace {

bool is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

char to_lower_ascii(char c) {
    if (c >= 'A' && c <= 'Z') return static_cast<char>(c + 32);
    return c;
}

void append_utf8(std::string& out, unsigned long codepoint) {
    if (codepoint == 0 || codepoint > 0x10FFFF ||
        (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
        out += "\xEF\xBF\xBD";  // replacement char
        return;
    }
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

const std::unordered_map<std::string, std::string>& named_entities() {
    static const std::unordered_map<std::string, std::string> entities = {
        {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"},
        {"nbsp", "\xC2\xA0"},
        {"copy", "\xC2\xA9"}, {"reg", "\xC2\xAE"}, {"trade", "\xE2\x84\xA2"},
        {"mdash", "\xE2\x80\x94"}, {"ndash", "\xE2\x80\x93"},
        {"laquo", "\xC2\xAB"}, {"raquo", "\xC2\xBB"},
        {"ldquo", "\xE2\x80\x9C"}, {"rdquo", "\xE2\x80\x9D"},
        {"lsquo", "\xE2\x80\x98"}, {"rsquo", "\xE2\x80\x99"},
        {"hellip", "\xE2\x80\xA6"}, {"bull", "\xE2\x80\xA2"},
        {"middot", "\xC2\xB7"}, {"euro", "\xE2\x82\xAC"},
        {"pound", "\xC2\xA3"}, {"yen", "\xC2\xA5"}, {"cent", "\xC2\xA2"},
        {"sect", "\xC2\xA7"}, {"deg", "\xC2\xB0"}, {"times", "\xC3\x97"},
        {"larr", "\xE2\x86\x90"}, {"rarr", "\xE2\x86\x92"},
    };
    return entities;
}

// Decodes the reference starting at input[pos] (just past '&'). On success
// advances pos; on failure leaves pos untouched and returns "&".
std::string decode_reference(std::string_view input, size_t& pos) {
    size_t cursor = pos;
    if (cursor >= input.size()) return "&";

    if (input[cursor] == '#') {
        ++cursor;
        bool hex = false;
        if (cursor < input.size() && (input[cursor] == 'x' || input[cursor] == 'X')) {
            hex = true;
            ++cursor;
        }
        std::string digits;
        while (cursor < input.size() &&
               (hex ? std::isxdigit(static_cast<unsigned char>(input[cursor]))
                    : std::isdigit(static_cast<unsigned char>(input[cursor])))) {
            digits += input[cursor++];
        }
        if (digits.empty() || digits.size() > 8) return "&";
        if (cursor < input.size() && input[cursor] == ';') ++cursor;

        std::string result;
        append_utf8(result, std::strtoul(digits.c_str(), nullptr, hex ? 16 : 10));
        pos = cursor;
        return result;
    }

    std::string name;
    while (cursor < input.size() && name.size() < 32 &&
           std::isalnum(static_cast<unsigned char>(input[cursor]))) {
        name += input[cursor++];
    }
    auto it = named_entities().find(name);
    if (it == named_entities().end()) return "&";
    if (cursor < input.size() && input[cursor] == ';') ++cursor;
    pos = cursor;
    return it->second;
}

} // namespace

Tokenizer::Tokenizer(std::string_view input) : input_(input) {}

void Tokenizer::set_state(TokenizerState state) {
    state_ = state;
}

char Tokenizer::consume() {
    if (pos_ < input_.size()) {
        return input_[pos_++];
    }
    return '\0';
}

char Tokenizer::peek(size_t offset) const {
    if (pos_ + offset < input_.size()) {
        return input_[pos_ + offset];
    }
    return '\0';
}

bool Tokenizer::at_end() const {
    return pos_ >= input_.size();
}

bool Tokenizer::starts_with_ci(std::string_view prefix) const {
    if (input_.size() - pos_ < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (to_lower_ascii(input_[pos_ + i]) != to_lower_ascii(prefix[i])) return false;
    }
    return true;
}

void Tokenizer::skip_whitespace() {
    while (!at_end() && is_whitespace(peek())) {
        ++pos_;
    }
}

std::string Tokenizer::try_consume_entity() {
    return decode_reference(input_, pos_);
}

Token Tokenizer::next_token() {
    if (at_end()) {
        Token t;
        t.type = Token::EndOfFile;
        return t;
    }

    switch (state_) {
        case TokenizerState::RAWTEXT:
            return text_until_end_tag(false);
        case TokenizerState::RCDATA:
            return text_until_end_tag(true);
        case TokenizerState::PLAINTEXT: {
            Token t;
            t.type = Token::Character;
            t.data = std::string(input_.substr(pos_));
            pos_ = input_.size();
            return t;
        }
        case TokenizerState::Data:
            break;
    }
    return data_token();
}

Token Tokenizer::data_token() {
    Token t;
    t.type = Token::Character;

    if (peek() == '<') {
        char next = peek(1);
        if (std::isalpha(static_cast<unsigned char>(next))) {
            pos_ += 1;
            return tag_token(false);
        }
        if (next == '/') {
            char after = peek(2);
            if (std::isalpha(static_cast<unsigned char>(after))) {
                pos_ += 2;
                return tag_token(true);
            }
            if (after == '>') {
                // "</>" is dropped entirely
                pos_ += 3;
                return next_token();
            }
            pos_ += 2;
            return bogus_comment();
        }
        if (next == '!') {
            pos_ += 2;
            return markup_declaration();
        }
        if (next == '?') {
            pos_ += 1;
            return bogus_comment();
        }
        // A bare '<' is ordinary text
        t.data += consume();
    }

    while (!at_end()) {
        char c = peek();
        if (c == '<') break;
        if (c == '&') {
            ++pos_;
            t.data += try_consume_entity();
        } else {
            t.data += consume();
        }
    }
    return t;
}

Token Tokenizer::text_until_end_tag(bool decode) {
    size_t end = pos_;
    bool found = false;
    while (end < input_.size()) {
        end = input_.find("</", end);
        if (end == std::string_view::npos) {
            end = input_.size();
            break;
        }
        size_t name_start = end + 2;
        size_t name_end = name_start + last_start_tag_.size();
        if (!last_start_tag_.empty() && name_end <= input_.size()) {
            bool match = true;
            for (size_t i = 0; i < last_start_tag_.size(); ++i) {
                if (to_lower_ascii(input_[name_start + i]) != last_start_tag_[i]) {
                    match = false;
                    break;
                }
            }
            if (match && (name_end == input_.size() || is_whitespace(input_[name_end]) ||
                          input_[name_end] == '/' || input_[name_end] == '>')) {
                found = true;
                break;
            }
        }
        end += 2;
    }

    if (found) {
        state_ = TokenizerState::Data;
        if (end == pos_) {
            return next_token();
        }
    }

    std::string_view raw = input_.substr(pos_, end - pos_);
    pos_ = end;

    Token t;
    t.type = Token::Character;
    t.data = decode ? decode_entities(raw) : std::string(raw);
    return t;
}

Token Tokenizer::tag_token(bool end_tag) {
    Token t;
    t.type = end_tag ? Token::EndTag : Token::StartTag;

    while (!at_end() && !is_whitespace(peek()) && peek() != '/' && peek() != '>') {
        t.name += to_lower_ascii(consume());
    }

    while (!at_end()) {
        skip_whitespace();
        if (at_end()) break;
        char c = peek();
        if (c == '>') {
            ++pos_;
            break;
        }
        if (c == '/') {
            ++pos_;
            if (peek() == '>') {
                ++pos_;
                t.self_closing = true;
                break;
            }
            continue;
        }

        Attribute attr;
        attr.name += to_lower_ascii(consume());
        while (!at_end() && !is_whitespace(peek()) && peek() != '/' &&
               peek() != '>' && peek() != '=') {
            attr.name += to_lower_ascii(consume());
        }
        skip_whitespace();
        if (peek() == '=') {
            ++pos_;
            skip_whitespace();
            attr.value = attribute_value();
        }

        // Duplicate attributes keep the first occurrence
        bool duplicate = false;
        for (const auto& existing : t.attributes) {
            if (existing.name == attr.name) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            t.attributes.push_back(std::move(attr));
        }
    }

    if (!end_tag) {
        last_start_tag_ = t.name;
    }
    return t;
}

std::string Tokenizer::attribute_value() {
    std::string raw;
    char quote = peek();
    if (quote == '"' || quote == '\'') {
        ++pos_;
        while (!at_end() && peek() != quote) {
            raw += consume();
        }
        if (!at_end()) ++pos_;
    } else {
        while (!at_end() && !is_whitespace(peek()) && peek() != '>') {
            raw += consume();
        }
    }
    return decode_entities(raw);
}

Token Tokenizer::markup_declaration() {
    Token t;
    t.type = Token::Comment;

    if (peek() == '-' && peek(1) == '-') {
        pos_ += 2;
        // "<!-->" and "<!--->" are empty comments
        if (peek() == '>') {
            ++pos_;
            return t;
        }
        if (peek() == '-' && peek(1) == '>') {
            pos_ += 2;
            return t;
        }
        size_t end = input_.find("-->", pos_);
        if (end == std::string_view::npos) {
            t.data = std::string(input_.substr(pos_));
            pos_ = input_.size();
        } else {
            t.data = std::string(input_.substr(pos_, end - pos_));
            pos_ = end + 3;
        }
        return t;
    }

    if (starts_with_ci("doctype")) {
        pos_ += 7;
        return doctype_token();
    }

    if (starts_with_ci("[CDATA[")) {
        pos_ += 7;
        size_t end = input_.find("]]>", pos_);
        if (end == std::string_view::npos) {
            t.data = std::string(input_.substr(pos_));
            pos_ = input_.size();
        } else {
            t.data = std::string(input_.substr(pos_, end - pos_));
            pos_ = end + 3;
        }
        return t;
    }

    return bogus_comment();
}

Token Tokenizer::bogus_comment() {
    Token t;
    t.type = Token::Comment;
    while (!at_end() && peek() != '>') {
        t.data += consume();
    }
    if (!at_end()) ++pos_;
    return t;
}

std::string Tokenizer::quoted_identifier() {
    std::string value;
    char quote = peek();
    if (quote != '"' && quote != '\'') return value;
    ++pos_;
    while (!at_end() && peek() != quote && peek() != '>') {
        value += consume();
    }
    if (peek() == quote) ++pos_;
    return value;
}

Token Tokenizer::doctype_token() {
    Token t;
    t.type = Token::DOCTYPE;

    skip_whitespace();
    while (!at_end() && !is_whitespace(peek()) && peek() != '>') {
        t.name += to_lower_ascii(consume());
    }
    skip_whitespace();

    if (starts_with_ci("public")) {
        pos_ += 6;
        skip_whitespace();
        if (peek() == '"' || peek() == '\'') {
            t.public_id = quoted_identifier();
            t.has_public_id = true;
            skip_whitespace();
            if (peek() == '"' || peek() == '\'') {
                t.system_id = quoted_identifier();
                t.has_system_id = true;
            }
        }
    } else if (starts_with_ci("system")) {
        pos_ += 6;
        skip_whitespace();
        if (peek() == '"' || peek() == '\'') {
            t.system_id = quoted_identifier();
            t.has_system_id = true;
        }
    }

    while (!at_end() && peek() != '>') {
        ++pos_;
    }
    if (!at_end()) ++pos_;
    return t;
}

std::string decode_entities(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        char c = text[pos++];
        if (c == '&') {
            result += decode_reference(text, pos);
        } else {
            result += c;
        }
    }
    return result;
}

} // namespace pagescope::html
