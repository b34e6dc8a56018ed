#pragma once
#include <gem/core/error.h>
#include <gem/core/position.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gem::sheet {

struct SheetToken {
    enum Type {
        LeftBrace, RightBrace,
        Id, Class,      // '#' / '.' markers, the name follows as a Tag token
        Tag,            // selector name
        Property,       // declaration name, ':' consumed
        Value,          // raw value text, ';' consumed
        EndOfFile
    };
    Type type;
    std::string value;
    core::Position start;
    core::Position end;

    bool operator==(const SheetToken& other) const;
};

const char* sheet_token_type_name(SheetToken::Type type);

struct SheetLexResult {
    std::vector<SheetToken> tokens;
    std::optional<core::Error> error;

    bool ok() const { return !error.has_value(); }
};

class SheetTokenizer {
public:
    SheetTokenizer(std::string file_name, std::string_view input);

    SheetLexResult tokenize();

    static SheetLexResult tokenize_all(const std::string& file_name, std::string_view input);

private:
    std::string_view input_;
    core::Position pos_;
    bool in_block_ = false;
    std::optional<core::Error> error_;

    char consume();
    char peek() const;
    bool at_end() const;

    bool consume_declaration(std::vector<SheetToken>& out);
    std::string consume_name();
    bool fail(core::ErrorKind kind, const core::Position& start, std::string message);
};

} // namespace gem::sheet
