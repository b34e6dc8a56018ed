#include <gem/core/error.h>
#include <sstream>

namespace gem::core {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnexpectedCharacter: return "UnexpectedCharacter";
        case ErrorKind::ExpectedCharacter:   return "ExpectedCharacter";
        case ErrorKind::InvalidSyntax:       return "InvalidSyntax";
        case ErrorKind::UnknownTag:          return "UnknownTag";
        case ErrorKind::MissingAttribute:    return "MissingAttribute";
        case ErrorKind::WindowError:         return "WindowError";
        case ErrorKind::AttributeError:      return "AttributeError";
        case ErrorKind::FileError:           return "FileError";
        case ErrorKind::IdCollision:         return "IdCollision";
    }
    return "Error";
}

Error::Error(ErrorKind kind, Position start, Position end, std::string message)
    : kind_(kind), start_(std::move(start)), end_(std::move(end)),
      message_(std::move(message)) {}

Error::Error(ErrorKind kind, const Span& span, std::string message)
    : Error(kind, span.start, span.end, std::move(message)) {}

std::string Error::format() const {
    std::ostringstream oss;
    oss << "File " << start_.file_name
        << " (line " << start_.line + 1 << " column " << start_.column + 1 << ")\n\n"
        << name() << ": " << message_;
    return oss.str();
}

Error Error::relocated(const Span& span) const {
    return Error(kind_, span, message_);
}

} // namespace gem::core
