#pragma once
#include <gem/core/error.h>
#include <gem/core/source_provider.h>
#include <gem/markup/ast.h>
#include <gem/scene/registry.h>
#include <gem/scene/window.h>
#include <optional>
#include <string>
#include <vector>

namespace gem::compiler {

enum class IncludeKind { Style, Markdown };

// An <include> left for the driver to resolve; never expanded here.
struct IncludeRef {
    IncludeKind kind = IncludeKind::Style;
    std::string path;
    core::Span span;
};

struct CompileResult {
    std::optional<scene::Window> window;
    scene::ClassIndex classes;
    scene::IdIndex ids;
    std::vector<IncludeRef> includes;
    std::optional<core::Error> error;

    bool ok() const { return !error.has_value(); }
    // Paths of the style includes, in document order.
    std::vector<std::string> style_includes() const;
};

// Turns a parsed GemXML document into a Window scene graph. All state
// (window under construction, class and id registries, includes) belongs to
// a single compile() call and is reset at its start.
class Compiler {
public:
    explicit Compiler(const core::SourceProvider& sources);

    // The document must hold exactly one top-level node, a <window> tag.
    std::optional<core::Error> validate(const markup::NodeList& document) const;

    CompileResult compile(const markup::NodeList& document);

private:
    const core::SourceProvider& sources_;

    std::optional<scene::Window> window_;
    scene::ClassIndex classes_;
    scene::IdIndex ids_;
    std::vector<IncludeRef> includes_;
    scene::NodeId next_id_ = 0;
    std::optional<core::Error> error_;

    void reset();
    bool fail(core::ErrorKind kind, const core::Span& span, std::string message);

    bool visit_list(const markup::NodeList& list, std::vector<scene::ContentNode>& out);
    bool visit(const markup::Node& node, std::vector<scene::ContentNode>& out);
    bool visit_tag(const markup::TagNode& tag, std::vector<scene::ContentNode>& out);

    bool build_window(const markup::TagNode& tag);
    bool build_text(const markup::TagNode& tag, std::vector<scene::ContentNode>& out);
    bool build_rect(const markup::TagNode& tag, std::vector<scene::ContentNode>& out);
    bool build_circle(const markup::TagNode& tag, std::vector<scene::ContentNode>& out);
    bool build_line(const markup::TagNode& tag, std::vector<scene::ContentNode>& out);
    bool build_include(const markup::TagNode& tag);
    template <typename Group>
    bool build_group(const markup::TagNode& tag, Group group,
                     std::vector<scene::ContentNode>& out);

    scene::ContentNode make_node(scene::Content content);
    // Class and id bookkeeping for a freshly built node.
    bool register_node(const markup::TagNode& tag, const scene::ContentNode& node);
    bool read_int(const markup::TagNode& tag, const std::string& name, int fallback, int& out);
};

} // namespace gem::compiler
