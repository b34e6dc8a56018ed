#pragma once
#include <gem/scene/registry.h>
#include <gem/scene/window.h>
#include <gem/sheet/stylesheet.h>
#include <gem/style/selector_matcher.h>
#include <vector>

namespace gem::style {

// Applies parsed stylesheets to a compiled window. Per node, parent first:
// copy the parent's resolved style, then let every matching rule overwrite
// it in source order. There is no specificity; order alone decides.
class CascadeResolver {
public:
    CascadeResolver(const scene::ClassIndex& classes, const scene::IdIndex& ids);

    // One full pass over the tree.
    void apply(const sheet::StyleSheet& sheet, scene::Window& window) const;
    // One pass per sheet, in order; later sheets win.
    void apply_all(const std::vector<sheet::StyleSheet>& sheets, scene::Window& window) const;

    ElementView view_of(const scene::ContentNode& node) const;
    ElementView view_of(const scene::Window& window) const;

private:
    struct CompiledRule {
        std::vector<std::string> alternatives;
        const sheet::StyleRule* rule;
    };

    const scene::ClassIndex& classes_;
    const scene::IdIndex& ids_;
    SelectorMatcher matcher_;

    static std::vector<CompiledRule> compile_rules(const sheet::StyleSheet& sheet);
    void apply_rules(const std::vector<CompiledRule>& rules, const ElementView& element,
                     scene::StyleMap& style) const;
    void cascade(const std::vector<CompiledRule>& rules, scene::ContentNode& node,
                 const scene::StyleMap& parent_style) const;
};

} // namespace gem::style
