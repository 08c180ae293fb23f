#pragma once
#include <loom/css/parser/selector.h>
#include <loom/dom/document.h>

namespace loom::css {

// Matches selectors against elements of a dom::Document arena. Complex
// selectors are matched right to left: the rightmost compound must match the
// element itself, then each combinator walks the parent chain.
class SelectorMatcher {
public:
    bool matches(const dom::Document& document, dom::NodeId element,
                 const ComplexSelector& selector) const;
    bool matches_compound(const dom::Node& element, const CompoundSelector& compound) const;
    bool matches_simple(const dom::Node& element, const SimpleSelector& simple) const;

private:
    bool matches_from(const dom::Document& document, dom::NodeId element,
                      const ComplexSelector& selector, size_t part_index) const;
};

} // namespace loom::css
