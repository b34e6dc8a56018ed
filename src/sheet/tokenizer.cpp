#include <gem/sheet/tokenizer.h>
#include <cctype>

namespace gem::sheet {

namespace {

bool is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_letter(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
}

} // namespace

// ---------------------------------------------------------------------------
// SheetToken
// ---------------------------------------------------------------------------

bool SheetToken::operator==(const SheetToken& other) const {
    return type == other.type && value == other.value;
}

const char* sheet_token_type_name(SheetToken::Type type) {
    switch (type) {
        case SheetToken::LeftBrace:  return "LBR";
        case SheetToken::RightBrace: return "RBR";
        case SheetToken::Id:         return "ID";
        case SheetToken::Class:      return "CLASS";
        case SheetToken::Tag:        return "TAG";
        case SheetToken::Property:   return "PROPERTY";
        case SheetToken::Value:      return "VALUE";
        case SheetToken::EndOfFile:  return "EOF";
    }
    return "?";
}

// ---------------------------------------------------------------------------
// SheetTokenizer
// ---------------------------------------------------------------------------

SheetTokenizer::SheetTokenizer(std::string file_name, std::string_view input)
    : input_(input), pos_(std::move(file_name)) {}

char SheetTokenizer::consume() {
    if (pos_.index < input_.size()) {
        char c = input_[pos_.index];
        pos_.advance(c);
        return c;
    }
    return '\0';
}

char SheetTokenizer::peek() const {
    if (pos_.index < input_.size()) {
        return input_[pos_.index];
    }
    return '\0';
}

bool SheetTokenizer::at_end() const {
    return pos_.index >= input_.size();
}

bool SheetTokenizer::fail(core::ErrorKind kind, const core::Position& start,
                          std::string message) {
    error_.emplace(kind, start, pos_, std::move(message));
    return false;
}

std::string SheetTokenizer::consume_name() {
    std::string name;
    while (!at_end() && is_name_char(peek())) {
        name += consume();
    }
    return name;
}

// property ':' value ';'  (the value runs to the ';' verbatim)
bool SheetTokenizer::consume_declaration(std::vector<SheetToken>& out) {
    core::Position start = pos_;
    std::string property;
    while (!at_end() && (is_letter(peek()) || peek() == '-')) {
        property += consume();
    }
    core::Position property_end = pos_;

    while (peek() == ' ' || peek() == '\t') consume();
    if (peek() != ':') {
        return fail(core::ErrorKind::ExpectedCharacter, pos_,
                    "Expected ':' after property '" + property + "'.");
    }
    consume();
    out.push_back({SheetToken::Property, property, start, property_end});

    while (peek() == ' ' || peek() == '\t') consume();

    core::Position value_start = pos_;
    std::string value;
    while (!at_end() && peek() != ';' && peek() != '\n') {
        value += consume();
    }
    if (value.empty()) {
        return fail(core::ErrorKind::ExpectedCharacter, value_start,
                    "Expected a value after '" + property + ":'.");
    }
    if (peek() != ';') {
        return fail(core::ErrorKind::ExpectedCharacter, pos_,
                    "Expected ';' after value.");
    }
    out.push_back({SheetToken::Value, value, value_start, pos_});
    consume();
    return true;
}

SheetLexResult SheetTokenizer::tokenize() {
    SheetLexResult result;

    while (!at_end()) {
        core::Position start = pos_;
        char c = peek();

        if (is_whitespace(c)) {
            consume();
        } else if (c == '{') {
            consume();
            in_block_ = true;
            result.tokens.push_back({SheetToken::LeftBrace, "", start, pos_});
        } else if (c == '}') {
            consume();
            in_block_ = false;
            result.tokens.push_back({SheetToken::RightBrace, "", start, pos_});
        } else if (c == '#') {
            consume();
            result.tokens.push_back({SheetToken::Id, "", start, pos_});
        } else if (c == '.') {
            consume();
            result.tokens.push_back({SheetToken::Class, "", start, pos_});
        } else if (in_block_ && is_letter(c)) {
            if (!consume_declaration(result.tokens)) {
                result.error = error_;
                return result;
            }
        } else if (std::isalnum(static_cast<unsigned char>(c))) {
            std::string name = consume_name();
            result.tokens.push_back({SheetToken::Tag, name, start, pos_});
        } else {
            fail(core::ErrorKind::UnexpectedCharacter, start,
                 std::string("Unexpected character '") + c + "'.");
            result.error = error_;
            return result;
        }
    }

    result.tokens.push_back({SheetToken::EndOfFile, "", pos_, pos_});
    return result;
}

SheetLexResult SheetTokenizer::tokenize_all(const std::string& file_name,
                                            std::string_view input) {
    SheetTokenizer tokenizer(file_name, input);
    return tokenizer.tokenize();
}

} // namespace gem::sheet
