#pragma once
#include <gem/core/error.h>
#include <gem/sheet/tokenizer.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gem::sheet {

struct Declaration {
    std::string property;
    std::string value;
};

struct StyleRule {
    // Space-joined simple selectors, e.g. "rect .box #main".
    std::string selector_text;
    std::vector<Declaration> declarations;
    core::Span span;

    const std::string* get(const std::string& property) const;
    // Last write wins; a redeclared property keeps its first position.
    void set(const std::string& property, const std::string& value);
};

struct StyleSheet {
    std::string file_name;
    std::vector<StyleRule> rules;

    const StyleRule* find(const std::string& selector_text) const;
    // Replaces the whole declaration list of an existing selector in place,
    // otherwise appends.
    void set_rule(StyleRule rule);
};

struct StyleSheetResult {
    StyleSheet sheet;
    std::optional<core::Error> error;

    bool ok() const { return !error.has_value(); }
};

StyleSheetResult parse_stylesheet(const std::string& file_name, std::string_view text);
StyleSheetResult parse_sheet_tokens(const std::string& file_name,
                                    std::vector<SheetToken> tokens);

} // namespace gem::sheet
