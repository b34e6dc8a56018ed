#include <gem/markup/tokenizer.h>
#include <gem/core/config.h>
#include <algorithm>
#include <array>
#include <cctype>

namespace gem::markup {

namespace {

constexpr std::array<std::string_view, 14> kKnownTags = {
    "window", "text", "rect", "circle", "line", "include", "div",
    "h1", "h2", "h3", "b", "i", "bi", "u"
};

// Emphasis tag by asterisk count.
constexpr std::array<const char*, 3> kEmphasisTags = {"i", "b", "bi"};

bool is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_letter(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// Characters that end a bare text run.
bool ends_text(char c) {
    return c == '\n' || c == '<' || c == '>' || c == '"' || c == '\'';
}

std::string quote_char(char c) {
    if (c == '\0') return "end of input";
    return std::string("'") + c + "'";
}

} // namespace

// ---------------------------------------------------------------------------
// Token
// ---------------------------------------------------------------------------

bool Token::operator==(const Token& other) const {
    return type == other.type && value == other.value;
}

const char* token_type_name(Token::Type type) {
    switch (type) {
        case Token::Tag:       return "TAG";
        case Token::Close:     return "CLOSE";
        case Token::Text:      return "TEXT";
        case Token::Data:      return "DATA";
        case Token::Attribute: return "ATTRIBUTE";
        case Token::EndOfFile: return "EOF";
    }
    return "?";
}

std::string describe_token(const Token& token) {
    std::string result = token_type_name(token.type);
    if (!token.value.empty()) {
        result += ":'" + token.value + "'";
    }
    return result;
}

bool is_known_tag(std::string_view name) {
    return std::find(kKnownTags.begin(), kKnownTags.end(), name) != kKnownTags.end();
}

// ---------------------------------------------------------------------------
// Tokenizer
// ---------------------------------------------------------------------------

Tokenizer::Tokenizer(std::string file_name, std::string_view input)
    : input_(input), pos_(std::move(file_name)) {}

char Tokenizer::consume() {
    if (pos_.index < input_.size()) {
        char c = input_[pos_.index];
        pos_.advance(c);
        return c;
    }
    return '\0';
}

char Tokenizer::peek() const {
    if (pos_.index < input_.size()) {
        return input_[pos_.index];
    }
    return '\0';
}

bool Tokenizer::at_end() const {
    return pos_.index >= input_.size();
}

void Tokenizer::skip_whitespace() {
    while (!at_end() && is_whitespace(peek())) {
        consume();
    }
}

void Tokenizer::skip_inline_whitespace() {
    while (peek() == ' ' || peek() == '\t') {
        consume();
    }
}

bool Tokenizer::fail(core::ErrorKind kind, const core::Position& start,
                     const core::Position& end, std::string message) {
    error_.emplace(kind, start, end, std::move(message));
    return false;
}

LexResult Tokenizer::tokenize() {
    LexResult result;

    while (!at_end()) {
        const char c = peek();
        if (is_whitespace(c)) {
            consume();
            continue;
        }

        bool ok = false;
        switch (c) {
            case '<': ok = consume_tag(result.tokens); break;
            case '"': ok = consume_quoted(result.tokens); break;
            case '#': ok = consume_header(result.tokens); break;
            case '*': ok = consume_emphasis(result.tokens); break;
            default:  ok = consume_text(result.tokens); break;
        }
        if (!ok) {
            result.tokens.clear();
            result.error = error_;
            return result;
        }
    }

    result.tokens.push_back({Token::EndOfFile, "", pos_, pos_, std::nullopt});
    return result;
}

LexResult Tokenizer::tokenize_all(const std::string& file_name, std::string_view input) {
    Tokenizer tokenizer(file_name, input);
    return tokenizer.tokenize();
}

// '<' ['/'] name (attr '=' '"' value '"')* '>'
bool Tokenizer::consume_tag(std::vector<Token>& out) {
    const core::Position start = pos_;
    consume(); // '<'
    skip_whitespace();

    bool closing = false;
    if (peek() == '/') {
        closing = true;
        consume();
    }

    if (!is_letter(peek())) {
        return fail(core::ErrorKind::ExpectedCharacter, pos_, pos_,
                    std::string("Expected a letter after '") + (closing ? "</" : "<") + "'.");
    }

    std::string name;
    while (!at_end() && is_alnum(peek())) {
        name += consume();
    }
    if (!is_known_tag(name)) {
        return fail(core::ErrorKind::UnknownTag, start, pos_, "<" + name + ">");
    }

    std::vector<std::pair<std::string, std::string>> attributes;
    if (peek() != '>') {
        if (!is_whitespace(peek())) {
            return fail(core::ErrorKind::ExpectedCharacter, pos_, pos_,
                        "Expected '>' or a whitespace after tag name.");
        }
        skip_whitespace();
        while (!at_end() && peek() != '>') {
            if (!consume_attribute(attributes)) return false;
        }
        if (at_end()) {
            return fail(core::ErrorKind::ExpectedCharacter, pos_, pos_,
                        "Expected '>' to close <" + name + ">.");
        }
    }

    const core::Position end = pos_;
    consume(); // '>'

    out.push_back({closing ? Token::Close : Token::Tag, name, start, end, std::nullopt});
    for (const auto& [attribute, value] : attributes) {
        out.push_back({Token::Attribute, attribute, start, end, std::nullopt});
        out.push_back({Token::Data, value, start, end, std::nullopt});
    }
    return true;
}

bool Tokenizer::consume_attribute(std::vector<std::pair<std::string, std::string>>& attributes) {
    std::string name;
    while (!at_end() && is_letter(peek())) {
        name += consume();
    }

    skip_whitespace();
    if (peek() != '=') {
        return fail(core::ErrorKind::ExpectedCharacter, pos_, pos_,
                    "Expected '=' after attribute, found " + quote_char(peek()) + " instead.");
    }
    consume();
    skip_whitespace();

    if (peek() != '"') {
        return fail(core::ErrorKind::ExpectedCharacter, pos_, pos_,
                    "Expected '\"' after '='.");
    }
    consume();

    std::string value;
    while (!at_end() && peek() != '"' && peek() != '\n') {
        value += consume();
    }
    if (peek() != '"') {
        return fail(core::ErrorKind::ExpectedCharacter, pos_, pos_,
                    "Expected terminating '\"' character.");
    }
    consume();

    auto it = std::find_if(attributes.begin(), attributes.end(),
                           [&](const auto& attr) { return attr.first == name; });
    if (it != attributes.end()) {
        it->second = std::move(value);
    } else {
        attributes.emplace_back(std::move(name), std::move(value));
    }

    skip_whitespace();
    return true;
}

bool Tokenizer::consume_quoted(std::vector<Token>& out) {
    const core::Position start = pos_;
    consume(); // '"'

    std::string data;
    while (!at_end() && peek() != '"' && peek() != '\n') {
        data += consume();
    }
    if (peek() != '"') {
        return fail(core::ErrorKind::ExpectedCharacter, pos_, pos_,
                    "Expected terminating '\"' character.");
    }
    out.push_back({Token::Data, data, start, pos_, std::nullopt});
    consume();
    return true;
}

bool Tokenizer::consume_text(std::vector<Token>& out) {
    const core::Position start = pos_;
    std::string content;
    while (!at_end() && !ends_text(peek())) {
        content += consume();
    }
    if (content.empty()) {
        return fail(core::ErrorKind::UnexpectedCharacter, pos_, pos_,
                    "Unexpected character " + quote_char(peek()) + ".");
    }
    out.push_back({Token::Text, content, start, pos_, std::nullopt});
    return true;
}

// '#'{1,3} content-to-end-of-line  ->  TAG(hN) ... CLOSE(hN)
bool Tokenizer::consume_header(std::vector<Token>& out) {
    const core::Position start = pos_;
    size_t count = 0;
    while (peek() == '#') {
        ++count;
        consume();
    }
    skip_inline_whitespace();

    if (count > core::config::kMaxShorthandMarkers) {
        return fail(core::ErrorKind::InvalidSyntax, start, pos_,
                    "Expected a max of 3 '#' characters.");
    }

    const core::Position content_start = pos_;
    std::string content;
    while (!at_end() && peek() != '\n') {
        content += consume();
    }
    if (content.empty()) {
        return fail(core::ErrorKind::InvalidSyntax, content_start, pos_,
                    "Expected content after '" + std::string(count, '#') + "'.");
    }

    const std::string tag = "h" + std::to_string(count);
    const core::Span region{content_start, pos_};

    out.push_back({Token::Tag, tag, start, content_start, std::nullopt});
    if (!splice_shorthand(content, region, out)) return false;
    out.push_back({Token::Close, tag, pos_, pos_, std::nullopt});
    return true;
}

// '*'{n} content '*'{n}, n in 1..3  ->  TAG(i|b|bi) ... CLOSE(i|b|bi)
bool Tokenizer::consume_emphasis(std::vector<Token>& out) {
    const core::Position start = pos_;
    size_t count = 0;
    while (peek() == '*') {
        ++count;
        consume();
    }
    skip_inline_whitespace();

    if (count > core::config::kMaxShorthandMarkers) {
        return fail(core::ErrorKind::InvalidSyntax, start, pos_,
                    "Expected a max of 3 '*' characters.");
    }

    const core::Position content_start = pos_;
    std::string content;
    while (!at_end() && peek() != '*' && peek() != '\n') {
        content += consume();
    }
    if (content.empty()) {
        return fail(core::ErrorKind::InvalidSyntax, content_start, pos_,
                    "Expected content after '" + std::string(count, '*') + "'.");
    }
    if (at_end() || peek() == '\n') {
        return fail(core::ErrorKind::InvalidSyntax, pos_, pos_,
                    "Reached EOL when parsing Markdown tag.");
    }

    size_t end_count = 0;
    while (peek() == '*') {
        ++end_count;
        consume();
    }
    if (end_count != count) {
        return fail(core::ErrorKind::InvalidSyntax, pos_, pos_,
                    "Expected " + std::to_string(count) + " '*' characters, got " +
                    std::to_string(end_count) + " '*' characters instead.");
    }

    const std::string tag = kEmphasisTags[count - 1];
    const core::Span region{content_start, pos_};

    out.push_back({Token::Tag, tag, start, content_start, std::nullopt});
    if (!splice_shorthand(content, region, out)) return false;
    out.push_back({Token::Close, tag, pos_, pos_, std::nullopt});
    return true;
}

bool Tokenizer::splice_shorthand(const std::string& content, const core::Span& region,
                                 std::vector<Token>& out) {
    Tokenizer nested(core::config::kShorthandFileName, content);
    LexResult lexed = nested.tokenize();
    if (!lexed.ok()) {
        error_ = lexed.error->relocated(region);
        return false;
    }

    lexed.tokens.pop_back(); // nested EOF
    for (auto& token : lexed.tokens) {
        token.region = region;
        out.push_back(std::move(token));
    }
    return true;
}

} // namespace gem::markup
