#pragma once
#include <cstddef>
#include <string>
#include <utility>

namespace gem::core {

// Zero-based offset, line and column inside a named source buffer.
struct Position {
    size_t index = 0;
    size_t line = 0;
    size_t column = 0;
    std::string file_name;

    Position() = default;
    explicit Position(std::string file) : file_name(std::move(file)) {}

    // Step past `consumed`; a newline moves to column 0 of the next line.
    void advance(char consumed);
};

struct Span {
    Position start;
    Position end;
};

} // namespace gem::core
