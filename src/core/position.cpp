#include <gem/core/position.h>

namespace gem::core {

void Position::advance(char consumed) {
    ++index;
    ++column;
    if (consumed == '\n') {
        column = 0;
        ++line;
    }
}

} // namespace gem::core
