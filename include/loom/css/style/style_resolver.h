#pragma once
#include <loom/core/diagnostics.h>
#include <loom/css/parser/stylesheet.h>
#include <loom/css/style/computed_style.h>
#include <loom/css/style/selector_matcher.h>
#include <loom/dom/document.h>
#include <string>
#include <utility>
#include <vector>

namespace loom::css {

enum class Origin {
    UserAgent,
    Author,
    Inline
};

struct MatchedRule {
    const StyleRule* rule;
    Specificity specificity;
    size_t source_order;
    Origin origin;
};

// One declared value competing for a property on one element.
struct CascadeCandidate {
    std::string property;
    std::string value;
    bool important = false;
    Origin origin = Origin::Author;
    Specificity specificity;
    size_t source_order = 0;
    size_t declaration_index = 0;
};

// Sort order of the cascade: a candidate that compares less loses.
bool cascade_less(const CascadeCandidate& lhs, const CascadeCandidate& rhs);

// Expands a shorthand (margin, padding, border, border-width, border-color,
// border-<side>, background, font) into longhands. Longhand properties come
// back unchanged. Returns an empty list when a shorthand value cannot be
// parsed.
std::vector<std::pair<std::string, std::string>> expand_shorthand(const std::string& property,
                                                                  const std::string& value);

class PropertyCascade {
public:
    explicit PropertyCascade(core::DiagnosticScope diagnostics) : diagnostics_(std::move(diagnostics)) {}

    // Picks a winner per registered property, then fills the rest from the
    // parent (inherited properties) or the initial value. `parent` is null for
    // the root element.
    ComputedStyle cascade(std::vector<CascadeCandidate> candidates,
                          const ComputedStyle* parent) const;

private:
    core::DiagnosticScope diagnostics_;

    std::string compute_value(const std::string& property, const std::string& value,
                              const ComputedStyle* parent) const;
};

class StyleResolver {
public:
    explicit StyleResolver(core::DiagnosticScope diagnostics = core::DiagnosticScope(nullptr, "style"));

    // Sheets keep their add order; rules of later sheets win ties.
    void add_stylesheet(StyleSheet sheet, Origin origin = Origin::Author);
    size_t stylesheet_count() const { return stylesheets_.size(); }

    std::vector<MatchedRule> collect_matching_rules(const dom::Document& document,
                                                    dom::NodeId element) const;

    ComputedStyle resolve(const dom::Document& document, dom::NodeId element,
                          const ComputedStyle* parent_style) const;

    // Resolves every element in document pre-order and stores the result in
    // its computed_style slot. Non-element nodes are left untouched.
    void resolve_document(dom::Document& document) const;

private:
    struct SheetEntry {
        StyleSheet sheet;
        Origin origin;
        size_t first_source_order;
    };

    std::vector<SheetEntry> stylesheets_;
    size_t next_source_order_ = 0;
    SelectorMatcher matcher_;
    PropertyCascade cascade_;
    core::DiagnosticScope diagnostics_;

    void add_candidates(const std::vector<Declaration>& declarations, Origin origin,
                        Specificity specificity, size_t source_order,
                        std::vector<CascadeCandidate>& out) const;
};

} // namespace loom::css
