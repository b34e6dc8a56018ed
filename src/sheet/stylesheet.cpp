#include <gem/sheet/stylesheet.h>

namespace gem::sheet {

const std::string* StyleRule::get(const std::string& property) const {
    for (const auto& decl : declarations) {
        if (decl.property == property) return &decl.value;
    }
    return nullptr;
}

void StyleRule::set(const std::string& property, const std::string& value) {
    for (auto& decl : declarations) {
        if (decl.property == property) {
            decl.value = value;
            return;
        }
    }
    declarations.push_back({property, value});
}

const StyleRule* StyleSheet::find(const std::string& selector_text) const {
    for (const auto& rule : rules) {
        if (rule.selector_text == selector_text) return &rule;
    }
    return nullptr;
}

void StyleSheet::set_rule(StyleRule rule) {
    for (auto& existing : rules) {
        if (existing.selector_text == rule.selector_text) {
            existing.declarations = std::move(rule.declarations);
            existing.span = rule.span;
            return;
        }
    }
    rules.push_back(std::move(rule));
}

// ---------------------------------------------------------------------------
// Internal stylesheet parser
// ---------------------------------------------------------------------------

namespace {

class StyleSheetParser {
public:
    explicit StyleSheetParser(std::vector<SheetToken> tokens)
        : tokens_(std::move(tokens)), pos_(0) {}

    bool parse(StyleSheet& sheet);
    const std::optional<core::Error>& error() const { return error_; }

private:
    std::vector<SheetToken> tokens_;
    size_t pos_;
    std::optional<core::Error> error_;

    const SheetToken& current() const;
    void advance();
    bool fail(const SheetToken& at, std::string message);

    bool parse_selectors(StyleRule& rule);
    bool parse_block(StyleRule& rule);
};

const SheetToken& StyleSheetParser::current() const {
    if (pos_ < tokens_.size()) {
        return tokens_[pos_];
    }
    static const SheetToken eof{SheetToken::EndOfFile, "", {}, {}};
    return tokens_.empty() ? eof : tokens_.back();
}

void StyleSheetParser::advance() {
    if (pos_ < tokens_.size()) {
        ++pos_;
    }
}

bool StyleSheetParser::fail(const SheetToken& at, std::string message) {
    error_.emplace(core::ErrorKind::InvalidSyntax, at.start, at.end, std::move(message));
    return false;
}

bool StyleSheetParser::parse(StyleSheet& sheet) {
    while (current().type != SheetToken::EndOfFile) {
        StyleRule rule;
        if (!parse_selectors(rule)) return false;
        if (!parse_block(rule)) return false;
        sheet.set_rule(std::move(rule));
    }
    return true;
}

// selector := TAG | ('#' | '.') TAG, repeated; consumes the opening '{'.
bool StyleSheetParser::parse_selectors(StyleRule& rule) {
    rule.span.start = current().start;
    std::string text;

    while (current().type == SheetToken::Tag ||
           current().type == SheetToken::Id ||
           current().type == SheetToken::Class) {
        std::string selector;
        if (current().type != SheetToken::Tag) {
            const SheetToken marker = current();
            const char prefix = marker.type == SheetToken::Id ? '#' : '.';
            advance();
            if (current().type != SheetToken::Tag ||
                current().start.index != marker.end.index) {
                return fail(marker, std::string("Expected a name right after '") + prefix + "'.");
            }
            selector += prefix;
        }
        selector += current().value;
        advance();

        if (!text.empty()) text += ' ';
        text += selector;
    }

    if (current().type != SheetToken::LeftBrace) {
        return fail(current(), "Expected '{' after selectors.");
    }
    if (text.empty()) {
        return fail(current(), "Expected selectors (tags, IDs, or classes) before '{'.");
    }
    advance();

    rule.selector_text = std::move(text);
    return true;
}

// Anything inside the braces that is not a declaration is skipped.
bool StyleSheetParser::parse_block(StyleRule& rule) {
    while (current().type != SheetToken::RightBrace &&
           current().type != SheetToken::EndOfFile) {
        if (current().type == SheetToken::Property) {
            std::string property = current().value;
            advance();
            if (current().type != SheetToken::Value) {
                return fail(current(), "Expected a value after '" + property + ":'.");
            }
            rule.set(property, current().value);
        }
        advance();
    }

    if (current().type != SheetToken::RightBrace) {
        return fail(current(), "Expected '}' after block.");
    }
    rule.span.end = current().end;
    advance();
    return true;
}

} // namespace

StyleSheetResult parse_sheet_tokens(const std::string& file_name,
                                    std::vector<SheetToken> tokens) {
    StyleSheetResult result;
    result.sheet.file_name = file_name;

    StyleSheetParser parser(std::move(tokens));
    if (!parser.parse(result.sheet)) {
        result.error = parser.error();
        result.sheet.rules.clear();
    }
    return result;
}

StyleSheetResult parse_stylesheet(const std::string& file_name, std::string_view text) {
    auto lexed = SheetTokenizer::tokenize_all(file_name, text);
    if (!lexed.ok()) {
        StyleSheetResult result;
        result.sheet.file_name = file_name;
        result.error = lexed.error;
        return result;
    }
    return parse_sheet_tokens(file_name, std::move(lexed.tokens));
}

} // namespace gem::sheet
