#include <gem/markup/parser.h>

namespace gem::markup {

// ---------------------------------------------------------------------------
// AST helpers
// ---------------------------------------------------------------------------

std::optional<std::string> TagNode::attribute(const std::string& name) const {
    auto it = attributes.find(name);
    if (it == attributes.end()) return std::nullopt;
    return it->second;
}

const core::Span& Node::span() const {
    if (const auto* tag = as_tag()) return tag->span;
    return std::get<TextNode>(value).span;
}

// ---------------------------------------------------------------------------
// Parser
// ---------------------------------------------------------------------------

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().type != Token::EndOfFile) {
        core::Position end = tokens_.empty() ? core::Position() : tokens_.back().source_end();
        tokens_.push_back({Token::EndOfFile, "", end, end, std::nullopt});
    }
}

const Token& Parser::current() const {
    if (pos_ < tokens_.size()) {
        return tokens_[pos_];
    }
    return tokens_.back();
}

void Parser::advance() {
    if (pos_ < tokens_.size()) {
        ++pos_;
    }
}

bool Parser::fail(const Token& at, std::string message) {
    error_.emplace(core::ErrorKind::InvalidSyntax, at.source_span(), std::move(message));
    return false;
}

ParseResult Parser::parse() {
    ParseResult result;
    error_.reset();
    pos_ = 0;

    if (!parse_tags(result.document)) {
        result.error = error_;
        result.document = NodeList{};
        return result;
    }

    if (current().type != Token::EndOfFile) {
        fail(current(), "Cannot fully parse the file, found token " +
                        describe_token(current()) + " without a matching opening tag.");
        result.error = error_;
        result.document = NodeList{};
    }
    return result;
}

bool Parser::parse_tags(NodeList& out) {
    out.span = current().source_span();

    while (current().type != Token::Close && current().type != Token::EndOfFile) {
        Node node;
        if (!parse_tag(node)) return false;
        out.span.end = node.span().end;
        out.body.push_back(std::move(node));
    }
    return true;
}

bool Parser::parse_tag(Node& out) {
    const Token& token = current();

    if (token.type == Token::Text || token.type == Token::Data) {
        out.value = TextNode{token.source_span(), token.value};
        advance();
        return true;
    }

    if (token.type != Token::Tag) {
        return fail(token, "Expected a tag, found token " + describe_token(token) + " instead.");
    }

    TagNode tag;
    tag.span.start = token.source_start();
    tag.tag_name = token.value;
    advance();

    while (current().type == Token::Attribute) {
        std::string name = current().value;
        advance();
        if (current().type != Token::Data) {
            return fail(current(), "Expected a value for attribute '" + name + "'.");
        }
        tag.attributes[name] = current().value;
        advance();
    }

    if (!parse_tags(tag.content)) return false;

    const Token expected{Token::Close, tag.tag_name, {}, {}, std::nullopt};
    if (current() != expected) {
        return fail(current(), "Expected </" + tag.tag_name + ">, found token " +
                               describe_token(current()) + " instead.");
    }
    tag.span.end = current().source_end();
    advance();

    out.value = std::move(tag);
    return true;
}

ParseResult parse_markup(const std::string& file_name, std::string_view text) {
    LexResult lexed = Tokenizer::tokenize_all(file_name, text);
    if (!lexed.ok()) {
        ParseResult result;
        result.error = lexed.error;
        return result;
    }
    Parser parser(std::move(lexed.tokens));
    return parser.parse();
}

} // namespace gem::markup
