#pragma once
#include <gem/core/error.h>
#include <gem/markup/ast.h>
#include <gem/markup/tokenizer.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gem::markup {

struct ParseResult {
    NodeList document;
    std::optional<core::Error> error;

    bool ok() const { return !error.has_value(); }
};

class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    // Top-level sibling run, which must consume the stream up to EOF.
    ParseResult parse();

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    std::optional<core::Error> error_;

    const Token& current() const;
    void advance();
    bool fail(const Token& at, std::string message);

    // Siblings up to the next CLOSE or EOF; the caller checks which CLOSE.
    bool parse_tags(NodeList& out);
    bool parse_tag(Node& out);
};

// Lex + parse in one step.
ParseResult parse_markup(const std::string& file_name, std::string_view text);

} // namespace gem::markup
