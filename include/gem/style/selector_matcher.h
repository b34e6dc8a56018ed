#pragma once
#include <string>
#include <vector>

namespace gem::style {

// What a selector can see of a node: its kind name, id and classes.
struct ElementView {
    std::string kind_name;
    std::string id;  // empty when the node has none
    std::vector<std::string> classes;
};

// A selector is a whitespace-separated list of independent alternatives
// ("rect", "#main", ".box"); it matches when any alternative does.
class SelectorMatcher {
public:
    static std::vector<std::string> split_alternatives(const std::string& selector_text);

    bool matches(const ElementView& element, const std::vector<std::string>& alternatives) const;
    bool matches(const ElementView& element, const std::string& selector_text) const;
    bool matches_simple(const ElementView& element, const std::string& simple) const;
};

} // namespace gem::style
