#include <gem/style/selector_matcher.h>
#include <algorithm>
#include <sstream>

namespace gem::style {

std::vector<std::string> SelectorMatcher::split_alternatives(const std::string& selector_text) {
    std::vector<std::string> result;
    std::istringstream iss(selector_text);
    std::string token;
    while (iss >> token) {
        result.push_back(token);
    }
    return result;
}

bool SelectorMatcher::matches_simple(const ElementView& element, const std::string& simple) const {
    if (simple.empty()) return false;

    if (simple[0] == '#') {
        return !element.id.empty() && simple.compare(1, std::string::npos, element.id) == 0;
    }
    if (simple[0] == '.') {
        return std::any_of(element.classes.begin(), element.classes.end(),
                           [&](const std::string& cls) {
                               return simple.compare(1, std::string::npos, cls) == 0;
                           });
    }
    return simple == element.kind_name;
}

bool SelectorMatcher::matches(const ElementView& element,
                              const std::vector<std::string>& alternatives) const {
    return std::any_of(alternatives.begin(), alternatives.end(),
                       [&](const std::string& simple) { return matches_simple(element, simple); });
}

bool SelectorMatcher::matches(const ElementView& element, const std::string& selector_text) const {
    return matches(element, split_alternatives(selector_text));
}

} // namespace gem::style
