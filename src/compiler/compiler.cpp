#include <gem/compiler/compiler.h>
#include <gem/core/config.h>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <unordered_map>

namespace gem::compiler {

namespace {

enum class ElementKind {
    Window, Text, Rect, Circle, Line, Include, Div,
    H1, H2, H3, Bold, Italic, BoldItalic, Underline
};

std::optional<ElementKind> element_kind(const std::string& tag_name) {
    static const std::unordered_map<std::string, ElementKind> kinds = {
        {"window", ElementKind::Window}, {"text", ElementKind::Text},
        {"rect", ElementKind::Rect}, {"circle", ElementKind::Circle},
        {"line", ElementKind::Line}, {"include", ElementKind::Include},
        {"div", ElementKind::Div},
        {"h1", ElementKind::H1}, {"h2", ElementKind::H2}, {"h3", ElementKind::H3},
        {"b", ElementKind::Bold}, {"i", ElementKind::Italic},
        {"bi", ElementKind::BoldItalic}, {"u", ElementKind::Underline},
    };
    auto it = kinds.find(tag_name);
    if (it == kinds.end()) return std::nullopt;
    return it->second;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::optional<int> parse_int(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(s.c_str(), &end, 10);
    if (end != s.c_str() + s.size() || errno == ERANGE) return std::nullopt;
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

// Rounds toward negative infinity, so odd and negative sizes centre the same way.
int floor_half(int value) {
    return value / 2 - (value % 2 < 0 ? 1 : 0);
}

} // namespace

std::vector<std::string> CompileResult::style_includes() const {
    std::vector<std::string> paths;
    for (const auto& include : includes) {
        if (include.kind == IncludeKind::Style) paths.push_back(include.path);
    }
    return paths;
}

Compiler::Compiler(const core::SourceProvider& sources) : sources_(sources) {}

void Compiler::reset() {
    window_.reset();
    classes_ = scene::ClassIndex();
    ids_ = scene::IdIndex();
    includes_.clear();
    next_id_ = 0;
    error_.reset();
}

bool Compiler::fail(core::ErrorKind kind, const core::Span& span, std::string message) {
    error_.emplace(kind, span, std::move(message));
    return false;
}

std::optional<core::Error> Compiler::validate(const markup::NodeList& document) const {
    if (document.body.size() != 1) {
        return core::Error(core::ErrorKind::WindowError, document.span,
                           "A GemXML file can only support one window at a time.");
    }
    const markup::TagNode* root = document.body.front().as_tag();
    if (!root || root->tag_name != "window") {
        return core::Error(core::ErrorKind::WindowError, document.span,
                           "Expected <window> tag at the start of the file.");
    }
    return std::nullopt;
}

CompileResult Compiler::compile(const markup::NodeList& document) {
    reset();
    CompileResult result;

    if (auto invalid = validate(document)) {
        result.error = std::move(invalid);
        return result;
    }

    std::vector<scene::ContentNode> unused;
    if (!visit_tag(*document.body.front().as_tag(), unused)) {
        result.error = error_;
        reset();
        return result;
    }

    result.window = std::move(window_);
    result.classes = std::move(classes_);
    result.ids = std::move(ids_);
    result.includes = std::move(includes_);
    reset();
    return result;
}

bool Compiler::visit_list(const markup::NodeList& list, std::vector<scene::ContentNode>& out) {
    for (const auto& node : list.body) {
        if (!visit(node, out)) return false;
    }
    return true;
}

bool Compiler::visit(const markup::Node& node, std::vector<scene::ContentNode>& out) {
    if (const auto* text = node.as_text()) {
        out.push_back(make_node(scene::Text{text->content}));
        return true;
    }
    return visit_tag(*node.as_tag(), out);
}

// Children are built first and become the group's own contents, so every
// nesting level owns exactly the nodes its markup encloses.
template <typename Group>
bool Compiler::build_group(const markup::TagNode& tag, Group group,
                           std::vector<scene::ContentNode>& out) {
    if (!visit_list(tag.content, group.contents)) return false;

    scene::ContentNode node = make_node(std::move(group));
    if (!register_node(tag, node)) return false;
    out.push_back(std::move(node));
    return true;
}

bool Compiler::visit_tag(const markup::TagNode& tag, std::vector<scene::ContentNode>& out) {
    auto kind = element_kind(tag.tag_name);
    if (!kind) {
        return fail(core::ErrorKind::UnknownTag, tag.span,
                    "<" + tag.tag_name + "> (when compiling)");
    }

    switch (*kind) {
        case ElementKind::Window:  return build_window(tag);
        case ElementKind::Text:    return build_text(tag, out);
        case ElementKind::Rect:    return build_rect(tag, out);
        case ElementKind::Circle:  return build_circle(tag, out);
        case ElementKind::Line:    return build_line(tag, out);
        case ElementKind::Include: return build_include(tag);
        case ElementKind::Div:     return build_group(tag, scene::Div{}, out);
        case ElementKind::H1:      return build_group(tag, scene::Header{1, {}}, out);
        case ElementKind::H2:      return build_group(tag, scene::Header{2, {}}, out);
        case ElementKind::H3:      return build_group(tag, scene::Header{3, {}}, out);
        case ElementKind::Bold:
            return build_group(tag, scene::StyledContent{scene::TextStyle::Bold, {}}, out);
        case ElementKind::Italic:
            return build_group(tag, scene::StyledContent{scene::TextStyle::Italic, {}}, out);
        case ElementKind::BoldItalic:
            return build_group(tag, scene::StyledContent{scene::TextStyle::BoldItalic, {}}, out);
        case ElementKind::Underline:
            return build_group(tag, scene::StyledContent{scene::TextStyle::Underline, {}}, out);
    }
    return fail(core::ErrorKind::UnknownTag, tag.span, "<" + tag.tag_name + "> (when compiling)");
}

scene::ContentNode Compiler::make_node(scene::Content content) {
    scene::ContentNode node;
    node.id = next_id_++;
    node.content = std::move(content);
    return node;
}

bool Compiler::register_node(const markup::TagNode& tag, const scene::ContentNode& node) {
    if (auto class_name = tag.attribute("class")) {
        classes_.add(*class_name, node.id);
    }
    if (auto id_name = tag.attribute("id")) {
        if (!ids_.insert(*id_name, node.id)) {
            return fail(core::ErrorKind::IdCollision, tag.span,
                        "ID '" + *id_name + "' is already used by another node.");
        }
    }
    return true;
}

bool Compiler::read_int(const markup::TagNode& tag, const std::string& name,
                        int fallback, int& out) {
    auto value = tag.attribute(name);
    if (!value) {
        out = fallback;
        return true;
    }
    auto parsed = parse_int(*value);
    if (!parsed) {
        return fail(core::ErrorKind::AttributeError, tag.span,
                    "Attribute '" + name + "' of <" + tag.tag_name +
                    "> must be an integer, got '" + *value + "'.");
    }
    out = *parsed;
    return true;
}

// ---------------------------------------------------------------------------
// Builders
// ---------------------------------------------------------------------------

bool Compiler::build_window(const markup::TagNode& tag) {
    if (window_) {
        return fail(core::ErrorKind::WindowError, tag.span, "There can only be one.");
    }

    scene::Window window;
    if (!read_int(tag, "x", core::config::kDefaultWindowX, window.x)) return false;
    if (!read_int(tag, "y", core::config::kDefaultWindowY, window.y)) return false;
    if (!read_int(tag, "width", core::config::kDefaultWindowWidth, window.width)) return false;
    if (!read_int(tag, "height", core::config::kDefaultWindowHeight, window.height)) return false;
    window.title = tag.attribute("title").value_or(core::config::kDefaultWindowTitle);
    window_ = std::move(window);

    std::vector<scene::ContentNode> contents;
    if (!visit_list(tag.content, contents)) return false;
    window_->contents = std::move(contents);
    return true;
}

bool Compiler::build_text(const markup::TagNode& tag, std::vector<scene::ContentNode>& out) {
    std::string text;
    for (const auto& child : tag.content.body) {
        const auto* literal = child.as_text();
        if (!literal) {
            return fail(core::ErrorKind::InvalidSyntax, child.span(),
                        "<text> can only contain literal text.");
        }
        text += literal->content;
    }

    scene::ContentNode node = make_node(scene::Text{std::move(text)});
    if (!register_node(tag, node)) return false;
    out.push_back(std::move(node));
    return true;
}

bool Compiler::build_rect(const markup::TagNode& tag, std::vector<scene::ContentNode>& out) {
    scene::Rect rect;
    const int default_x = floor_half(window_->width) - core::config::kRectCenterOffsetX;
    const int default_y = floor_half(window_->height) - core::config::kRectCenterOffsetY;
    if (!read_int(tag, "x", default_x, rect.x)) return false;
    if (!read_int(tag, "y", default_y, rect.y)) return false;
    if (!read_int(tag, "width", core::config::kDefaultRectWidth, rect.width)) return false;
    if (!read_int(tag, "height", core::config::kDefaultRectHeight, rect.height)) return false;

    scene::ContentNode node = make_node(rect);
    if (!register_node(tag, node)) return false;
    out.push_back(std::move(node));
    return true;
}

bool Compiler::build_circle(const markup::TagNode& tag, std::vector<scene::ContentNode>& out) {
    scene::Circle circle;
    if (!read_int(tag, "x", floor_half(window_->width), circle.x)) return false;
    if (!read_int(tag, "y", floor_half(window_->height), circle.y)) return false;
    if (!read_int(tag, "radius", core::config::kDefaultCircleRadius, circle.radius)) return false;

    scene::ContentNode node = make_node(circle);
    if (!register_node(tag, node)) return false;
    out.push_back(std::move(node));
    return true;
}

// No positional defaults: all four coordinates are required.
bool Compiler::build_line(const markup::TagNode& tag, std::vector<scene::ContentNode>& out) {
    for (const char* required : {"startx", "starty", "endx", "endy"}) {
        if (!tag.has_attribute(required)) {
            return fail(core::ErrorKind::MissingAttribute, tag.span,
                        std::string("Missing attribute: '") + required + "'");
        }
    }

    scene::Line line;
    if (!read_int(tag, "startx", 0, line.start_x)) return false;
    if (!read_int(tag, "starty", 0, line.start_y)) return false;
    if (!read_int(tag, "endx", 0, line.end_x)) return false;
    if (!read_int(tag, "endy", 0, line.end_y)) return false;

    scene::ContentNode node = make_node(line);
    if (!register_node(tag, node)) return false;
    out.push_back(std::move(node));
    return true;
}

bool Compiler::build_include(const markup::TagNode& tag) {
    auto as = tag.attribute("as");
    if (!as) {
        return fail(core::ErrorKind::MissingAttribute, tag.span, "Missing attribute: 'as'");
    }

    IncludeRef include;
    include.span = tag.span;
    if (*as == "style") {
        include.kind = IncludeKind::Style;
    } else if (*as == "md") {
        include.kind = IncludeKind::Markdown;
    } else {
        return fail(core::ErrorKind::AttributeError, tag.span,
                    "Expected one of the following for 'as' attribute: style, md.");
    }

    if (tag.content.body.empty()) {
        return fail(core::ErrorKind::MissingAttribute, tag.span, "File path cannot be empty.");
    }
    const auto* literal = tag.content.body.front().as_text();
    if (tag.content.body.size() != 1 || !literal) {
        return fail(core::ErrorKind::FileError, tag.span,
                    "Expected a single file path inside <include>.");
    }
    include.path = trim(literal->content);
    if (include.path.empty()) {
        return fail(core::ErrorKind::MissingAttribute, tag.span, "File path cannot be empty.");
    }

    if (include.kind == IncludeKind::Style) {
        if (!include.path.ends_with(core::config::kStylesheetExtension)) {
            return fail(core::ErrorKind::FileError, tag.span,
                        std::string("Stylesheet must end in '") +
                        core::config::kStylesheetExtension + "'.");
        }
        if (!sources_.exists(include.path)) {
            return fail(core::ErrorKind::FileError, tag.span,
                        "Cannot find file '" + include.path + "'.");
        }
    } else if (!include.path.ends_with(core::config::kMarkdownExtension)) {
        return fail(core::ErrorKind::FileError, tag.span,
                    std::string("Markdown file must end in '") +
                    core::config::kMarkdownExtension + "'.");
    }

    includes_.push_back(std::move(include));
    return true;
}

} // namespace gem::compiler
