#pragma once
#include <gem/core/position.h>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gem::markup {

struct Node;

// Ordered siblings; the span runs from the first to the last child.
struct NodeList {
    core::Span span;
    std::vector<Node> body;
};

struct TextNode {
    core::Span span;
    std::string content;
};

struct TagNode {
    core::Span span;  // opening tag through closing tag
    std::string tag_name;
    std::map<std::string, std::string> attributes;
    NodeList content;

    std::optional<std::string> attribute(const std::string& name) const;
    bool has_attribute(const std::string& name) const { return attributes.count(name) > 0; }
};

struct Node {
    std::variant<TextNode, TagNode> value;

    const core::Span& span() const;
    const TagNode* as_tag() const { return std::get_if<TagNode>(&value); }
    const TextNode* as_text() const { return std::get_if<TextNode>(&value); }
};

} // namespace gem::markup
