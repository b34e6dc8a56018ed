#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace gem::scene {

using StyleMap = std::map<std::string, std::string>;

// Handle of a compiled content node, unique within one compile.
using NodeId = size_t;

struct ContentNode;

struct Text {
    std::string text;
};

struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

struct Circle {
    int x = 0;
    int y = 0;
    int radius = 0;
};

struct Line {
    int start_x = 0;
    int start_y = 0;
    int end_x = 0;
    int end_y = 0;
};

struct Div {
    std::vector<ContentNode> contents;
};

struct Header {
    int level = 1;  // 1..3
    std::vector<ContentNode> contents;
};

enum class TextStyle { Bold, Italic, BoldItalic, Underline };

struct StyledContent {
    TextStyle style = TextStyle::Bold;
    std::vector<ContentNode> contents;
};

using Content = std::variant<Text, Rect, Circle, Line, Div, Header, StyledContent>;

struct ContentNode {
    NodeId id = 0;
    Content content;
    StyleMap style;  // written only by the cascade
};

struct Window {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
    std::string title;
    std::vector<ContentNode> contents;
    StyleMap style;
};

const char* text_style_tag(TextStyle style);

// Lowercase runtime kind name matched by type selectors.
const char* kind_name(const ContentNode& node);
inline const char* kind_name(const Window&) { return "window"; }

// Children of a grouping node, nullptr for leaves.
std::vector<ContentNode>* children(ContentNode& node);
const std::vector<ContentNode>* children(const ContentNode& node);

ContentNode* find_node(Window& window, NodeId id);
const ContentNode* find_node(const Window& window, NodeId id);

// Number of content nodes below the window, at any depth.
size_t count_nodes(const Window& window);

} // namespace gem::scene
