#include <loom/css/style/selector_matcher.h>
#include <algorithm>

namespace loom::css {

bool SelectorMatcher::matches_simple(const dom::Node& element, const SimpleSelector& simple) const {
    switch (simple.kind) {
        case SelectorKind::Universal:
            return true;
        case SelectorKind::Type:
            return element.tag_name == simple.value;
        case SelectorKind::Id: {
            const std::string* id = element.attribute("id");
            return id && *id == simple.value;
        }
        case SelectorKind::Class: {
            auto classes = element.class_list();
            return std::find(classes.begin(), classes.end(), simple.value) != classes.end();
        }
    }
    return false;
}

bool SelectorMatcher::matches_compound(const dom::Node& element,
                                       const CompoundSelector& compound) const {
    if (!element.is_element()) return false;
    for (auto& simple : compound.components) {
        if (!matches_simple(element, simple)) {
            return false;
        }
    }
    return true;
}

bool SelectorMatcher::matches(const dom::Document& document, dom::NodeId element,
                              const ComplexSelector& selector) const {
    if (selector.parts.empty()) return false;
    return matches_from(document, element, selector, selector.parts.size() - 1);
}

bool SelectorMatcher::matches_from(const dom::Document& document, dom::NodeId element,
                                   const ComplexSelector& selector, size_t part_index) const {
    const auto& part = selector.parts[part_index];
    if (!matches_compound(document.node(element), part.compound)) {
        return false;
    }
    if (part_index == 0) {
        return true;
    }

    // The combinator stored on this part links it to the part on its left.
    Combinator combinator = part.combinator.value_or(Combinator::Descendant);
    dom::NodeId ancestor = document.node(element).parent;

    if (combinator == Combinator::Child) {
        if (ancestor == dom::kInvalidNodeId || !document.node(ancestor).is_element()) {
            return false;
        }
        return matches_from(document, ancestor, selector, part_index - 1);
    }

    // Descendant: try every ancestor, backtracking on failure.
    while (ancestor != dom::kInvalidNodeId && document.node(ancestor).is_element()) {
        if (matches_from(document, ancestor, selector, part_index - 1)) {
            return true;
        }
        ancestor = document.node(ancestor).parent;
    }
    return false;
}

} // namespace loom::css
