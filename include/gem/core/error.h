#pragma once
#include <gem/core/position.h>
#include <string>

namespace gem::core {

enum class ErrorKind {
    UnexpectedCharacter,
    ExpectedCharacter,
    InvalidSyntax,
    UnknownTag,
    MissingAttribute,
    WindowError,
    AttributeError,
    FileError,
    IdCollision,
};

const char* error_kind_name(ErrorKind kind);

class Error {
public:
    Error(ErrorKind kind, Position start, Position end, std::string message);
    Error(ErrorKind kind, const Span& span, std::string message);

    ErrorKind kind() const { return kind_; }
    const char* name() const { return error_kind_name(kind_); }
    const Position& start() const { return start_; }
    const Position& end() const { return end_; }
    const std::string& message() const { return message_; }

    // "File <name> (line L column C)\n\n<Kind>: <message>", one-based.
    std::string format() const;

    // Copy of this error with its span replaced.
    Error relocated(const Span& span) const;

private:
    ErrorKind kind_;
    Position start_;
    Position end_;
    std::string message_;
};

} // namespace gem::core
