#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loom::css {

enum class SelectorKind { Type, Class, Id, Universal };

// One component of a compound: `div`, `.note`, `#main` or `*`.
struct SimpleSelector {
    SelectorKind kind;
    std::string value;
};

enum class Combinator { Descendant, Child };

struct CompoundSelector {
    std::vector<SimpleSelector> components;
};

// Compounds in source order. Each part after the first carries the
// combinator that joins it to the part on its left.
struct ComplexSelector {
    struct Part {
        CompoundSelector compound;
        std::optional<Combinator> combinator;
    };
    std::vector<Part> parts;
};

struct SelectorList {
    std::vector<ComplexSelector> selectors;
};

// (ids, classes, types), compared lexicographically.
struct Specificity {
    int ids = 0;
    int classes = 0;
    int types = 0;

    bool operator<(const Specificity& other) const;
    bool operator==(const Specificity& other) const;
    bool operator>(const Specificity& other) const { return other < *this; }
};

Specificity specificity_of(const ComplexSelector& selector);

// Parses a comma-separated selector list. Returns nullopt when any selector
// uses syntax outside the supported subset (attribute selectors,
// pseudo-classes, sibling combinators); `error` then describes why.
std::optional<SelectorList> parse_selector_list(std::string_view input,
                                                std::string* error = nullptr);

std::string selector_to_string(const ComplexSelector& selector);

} // namespace loom::css
