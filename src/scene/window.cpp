#include <gem/scene/window.h>

namespace gem::scene {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

ContentNode* find_in(std::vector<ContentNode>& nodes, NodeId id) {
    for (auto& node : nodes) {
        if (node.id == id) return &node;
        if (auto* kids = children(node)) {
            if (auto* found = find_in(*kids, id)) return found;
        }
    }
    return nullptr;
}

size_t count_in(const std::vector<ContentNode>& nodes) {
    size_t total = 0;
    for (const auto& node : nodes) {
        ++total;
        if (const auto* kids = children(node)) total += count_in(*kids);
    }
    return total;
}

} // namespace

const char* text_style_tag(TextStyle style) {
    switch (style) {
        case TextStyle::Bold:       return "b";
        case TextStyle::Italic:     return "i";
        case TextStyle::BoldItalic: return "bi";
        case TextStyle::Underline:  return "u";
    }
    return "";
}

const char* kind_name(const ContentNode& node) {
    return std::visit(Overloaded{
        [](const Text&) { return "text"; },
        [](const Rect&) { return "rect"; },
        [](const Circle&) { return "circle"; },
        [](const Line&) { return "line"; },
        [](const Div&) { return "div"; },
        [](const Header&) { return "header"; },
        [](const StyledContent&) { return "styledcontent"; },
    }, node.content);
}

std::vector<ContentNode>* children(ContentNode& node) {
    return std::visit(Overloaded{
        [](Div& div) -> std::vector<ContentNode>* { return &div.contents; },
        [](Header& header) -> std::vector<ContentNode>* { return &header.contents; },
        [](StyledContent& styled) -> std::vector<ContentNode>* { return &styled.contents; },
        [](auto&) -> std::vector<ContentNode>* { return nullptr; },
    }, node.content);
}

const std::vector<ContentNode>* children(const ContentNode& node) {
    return children(const_cast<ContentNode&>(node));
}

ContentNode* find_node(Window& window, NodeId id) {
    return find_in(window.contents, id);
}

const ContentNode* find_node(const Window& window, NodeId id) {
    return find_node(const_cast<Window&>(window), id);
}

size_t count_nodes(const Window& window) {
    return count_in(window.contents);
}

} // namespace gem::scene
