#pragma once
#include <loom/core/diagnostics.h>
#include <loom/css/parser/selector.h>
#include <string>
#include <string_view>
#include <vector>

namespace loom::css {

struct Declaration {
    std::string property;  // lowercased
    std::string value;     // re-serialized from tokens, whitespace collapsed
    bool important = false;
};

struct StyleRule {
    SelectorList selectors;
    std::vector<Declaration> declarations;
    std::string selector_text;  // original selector text
};

struct StyleSheet {
    std::vector<StyleRule> rules;
};

// Parse functions. Neither fails: unsupported selectors drop their rule,
// at-rules are skipped whole, malformed declarations are skipped one by one.
// Each recovery is reported as a warning on `diagnostics`.
StyleSheet parse_stylesheet(std::string_view css,
                            core::DiagnosticScope diagnostics = core::DiagnosticScope(nullptr, "css"));
std::vector<Declaration> parse_declaration_block(std::string_view css,
                            core::DiagnosticScope diagnostics = core::DiagnosticScope(nullptr, "css"));

} // namespace loom::css
