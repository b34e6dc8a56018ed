#include <gem/style/cascade.h>

namespace gem::style {

CascadeResolver::CascadeResolver(const scene::ClassIndex& classes, const scene::IdIndex& ids)
    : classes_(classes), ids_(ids) {}

ElementView CascadeResolver::view_of(const scene::ContentNode& node) const {
    ElementView view;
    view.kind_name = scene::kind_name(node);
    view.id = ids_.id_of(node.id).value_or("");
    view.classes = classes_.classes_of(node.id);
    return view;
}

// The window is never registered, so only its kind name can select it.
ElementView CascadeResolver::view_of(const scene::Window& window) const {
    ElementView view;
    view.kind_name = scene::kind_name(window);
    return view;
}

std::vector<CascadeResolver::CompiledRule> CascadeResolver::compile_rules(
        const sheet::StyleSheet& sheet) {
    std::vector<CompiledRule> rules;
    rules.reserve(sheet.rules.size());
    for (const auto& rule : sheet.rules) {
        rules.push_back({SelectorMatcher::split_alternatives(rule.selector_text), &rule});
    }
    return rules;
}

void CascadeResolver::apply_rules(const std::vector<CompiledRule>& rules,
                                  const ElementView& element,
                                  scene::StyleMap& style) const {
    for (const auto& compiled : rules) {
        if (!matcher_.matches(element, compiled.alternatives)) continue;
        for (const auto& decl : compiled.rule->declarations) {
            style[decl.property] = decl.value;
        }
    }
}

void CascadeResolver::cascade(const std::vector<CompiledRule>& rules,
                              scene::ContentNode& node,
                              const scene::StyleMap& parent_style) const {
    for (const auto& [property, value] : parent_style) {
        node.style[property] = value;
    }
    apply_rules(rules, view_of(node), node.style);

    if (auto* kids = scene::children(node)) {
        for (auto& child : *kids) {
            cascade(rules, child, node.style);
        }
    }
}

void CascadeResolver::apply(const sheet::StyleSheet& sheet, scene::Window& window) const {
    const auto rules = compile_rules(sheet);

    apply_rules(rules, view_of(window), window.style);
    for (auto& child : window.contents) {
        cascade(rules, child, window.style);
    }
}

void CascadeResolver::apply_all(const std::vector<sheet::StyleSheet>& sheets,
                                scene::Window& window) const {
    for (const auto& sheet : sheets) {
        apply(sheet, window);
    }
}

} // namespace gem::style
