#pragma once
#include <gem/core/error.h>
#include <gem/core/position.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gem::markup {

struct Token {
    enum Type { Tag, Close, Text, Data, Attribute, EndOfFile };
    Type type;
    std::string value;
    core::Position start;
    core::Position end;
    // Set on tokens spliced in from a '#' or '*' shorthand: the shorthand's
    // span in the outer text. start/end then refer to the shorthand content.
    std::optional<core::Span> region;

    const core::Position& source_start() const { return region ? region->start : start; }
    const core::Position& source_end() const { return region ? region->end : end; }
    core::Span source_span() const { return {source_start(), source_end()}; }

    // Kind and value only; positions are ignored.
    bool operator==(const Token& other) const;
    bool operator!=(const Token& other) const { return !(*this == other); }
};

const char* token_type_name(Token::Type type);
std::string describe_token(const Token& token);

bool is_known_tag(std::string_view name);

struct LexResult {
    std::vector<Token> tokens;
    std::optional<core::Error> error;

    bool ok() const { return !error.has_value(); }
};

class Tokenizer {
public:
    Tokenizer(std::string file_name, std::string_view input);

    LexResult tokenize();

    static LexResult tokenize_all(const std::string& file_name, std::string_view input);

private:
    std::string_view input_;
    core::Position pos_;
    std::optional<core::Error> error_;

    char consume();
    char peek() const;
    bool at_end() const;
    void skip_whitespace();
    void skip_inline_whitespace();

    bool consume_tag(std::vector<Token>& out);
    bool consume_attribute(std::vector<std::pair<std::string, std::string>>& attributes);
    bool consume_quoted(std::vector<Token>& out);
    bool consume_text(std::vector<Token>& out);
    bool consume_header(std::vector<Token>& out);
    bool consume_emphasis(std::vector<Token>& out);

    // Lexes `content` with a fresh tokenizer and appends its tokens (minus
    // EOF) to `out`, each tagged with `region`. Every level copies the rest
    // of the line and strips at least one marker, so a line of n nested
    // markers recurses n deep and copies O(n^2) characters.
    bool splice_shorthand(const std::string& content, const core::Span& region,
                          std::vector<Token>& out);

    bool fail(core::ErrorKind kind, const core::Position& start,
              const core::Position& end, std::string message);
};

} // namespace gem::markup
