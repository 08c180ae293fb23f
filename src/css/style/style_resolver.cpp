#include <loom/css/style/style_resolver.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <map>

namespace loom::css {

namespace {

constexpr const char* kModule = "css.style";
constexpr std::array<const char*, 4> kSides = {"top", "right", "bottom", "left"};

std::string ascii_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r\f");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r\f");
    return s.substr(start, end - start + 1);
}

// Splits a value on whitespace outside parentheses.
std::vector<std::string> split_components(const std::string& value) {
    std::vector<std::string> parts;
    std::string current;
    int depth = 0;
    for (char c : value) {
        if (c == '(') ++depth;
        if (c == ')' && depth > 0) --depth;
        if (depth == 0 && std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) parts.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    if (!current.empty()) parts.push_back(current);
    return parts;
}

using Longhands = std::vector<std::pair<std::string, std::string>>;

std::vector<std::string> side_longhands(const std::string& prefix, const std::string& suffix) {
    std::vector<std::string> names;
    for (const char* side : kSides) {
        names.push_back(prefix + side + suffix);
    }
    return names;
}

std::vector<std::string> longhands_of(const std::string& property) {
    if (property == "margin") return side_longhands("margin-", "");
    if (property == "padding") return side_longhands("padding-", "");
    if (property == "border-width") return side_longhands("border-", "-width");
    if (property == "border-color") return side_longhands("border-", "-color");
    if (property == "border") {
        auto names = side_longhands("border-", "-width");
        auto colors = side_longhands("border-", "-color");
        names.insert(names.end(), colors.begin(), colors.end());
        return names;
    }
    for (const char* side : kSides) {
        if (property == std::string("border-") + side) {
            return {property + "-width", property + "-color"};
        }
    }
    if (property == "background") return {"background-color"};
    if (property == "font") {
        return {"font-style", "font-weight", "font-size", "line-height", "font-family"};
    }
    return {};
}

// Four-value box shorthand: top [right [bottom [left]]].
Longhands expand_quad(const std::vector<std::string>& names, const std::string& value) {
    auto parts = split_components(value);
    if (parts.empty() || parts.size() > 4) return {};
    std::array<std::string, 4> v;
    switch (parts.size()) {
        case 1: v = {parts[0], parts[0], parts[0], parts[0]}; break;
        case 2: v = {parts[0], parts[1], parts[0], parts[1]}; break;
        case 3: v = {parts[0], parts[1], parts[2], parts[1]}; break;
        default: v = {parts[0], parts[1], parts[2], parts[3]}; break;
    }
    Longhands result;
    for (size_t i = 0; i < 4; ++i) {
        result.emplace_back(names[i], v[i]);
    }
    return result;
}

bool is_border_style(const std::string& v) {
    static const std::array<const char*, 10> styles = {
        "none", "hidden", "solid", "dashed", "dotted", "double",
        "groove", "ridge", "inset", "outset"
    };
    return std::find(styles.begin(), styles.end(), v) != styles.end();
}

bool is_border_width(const std::string& v) {
    if (v == "thin" || v == "medium" || v == "thick") return true;
    auto length = parse_length(v);
    return length && !length->is_auto() && length->unit != Length::Unit::Percent;
}

bool is_color(const std::string& v) {
    return v == "currentcolor" || parse_color(v).has_value();
}

// border / border-<side>: any order of width, style and color. Without a
// visible style the used width is zero.
bool parse_border(const std::string& value, std::string& width, std::string& color) {
    std::string style;
    for (auto& part : split_components(value)) {
        std::string lc = ascii_lower(part);
        if (is_border_style(lc) && style.empty()) {
            style = lc;
        } else if (is_border_width(lc) && width.empty()) {
            width = lc;
        } else if (is_color(lc) && color.empty()) {
            color = lc;
        } else {
            return false;
        }
    }
    if (style.empty() || style == "none" || style == "hidden") {
        width = "0";
    } else if (width.empty()) {
        width = "medium";
    }
    if (color.empty()) color = "currentcolor";
    return true;
}

bool is_font_weight(const std::string& v) {
    if (v == "bold" || v == "bolder" || v == "lighter") return true;
    return v.size() == 3 && v[0] >= '1' && v[0] <= '9' && v[1] == '0' && v[2] == '0';
}

Longhands expand_font(const std::string& value) {
    auto parts = split_components(value);
    std::string style = "normal";
    std::string weight = "normal";
    size_t i = 0;
    for (; i < parts.size(); ++i) {
        std::string lc = ascii_lower(parts[i]);
        if (lc == "italic" || lc == "oblique") {
            style = lc;
        } else if (is_font_weight(lc)) {
            weight = lc;
        } else if (lc != "normal" && lc != "small-caps") {
            break;
        }
    }
    if (i >= parts.size()) return {};

    std::string size = parts[i++];
    std::string line_height = "normal";
    auto slash = size.find('/');
    if (slash != std::string::npos) {
        line_height = size.substr(slash + 1);
        size = size.substr(0, slash);
        if (line_height.empty() && i < parts.size()) {
            line_height = parts[i++];
        }
    } else if (i < parts.size() && parts[i][0] == '/') {
        line_height = parts[i].substr(1);
        ++i;
        if (line_height.empty() && i < parts.size()) {
            line_height = parts[i++];
        }
    }
    if (!resolve_font_size(size, 16.0f) || line_height.empty()) return {};

    std::string family;
    for (; i < parts.size(); ++i) {
        if (!family.empty()) family += ' ';
        family += parts[i];
    }
    if (family.empty()) return {};

    return {{"font-style", style}, {"font-weight", weight}, {"font-size", size},
            {"line-height", line_height}, {"font-family", family}};
}

std::vector<Declaration> expand_declarations(const std::vector<Declaration>& declarations,
                                             const core::DiagnosticScope& diagnostics) {
    std::vector<Declaration> expanded;
    for (auto& decl : declarations) {
        auto longhands = expand_shorthand(decl.property, decl.value);
        if (longhands.empty()) {
            diagnostics.warning(kModule, "invalid value '" + decl.value + "' for " +
                                decl.property + "; declaration skipped");
            continue;
        }
        for (auto& [name, value] : longhands) {
            if (!find_property(name)) {
                diagnostics.warning(kModule, "unknown property '" + name + "' skipped");
                continue;
            }
            expanded.push_back({name, value, decl.important});
        }
    }
    return expanded;
}

float parent_font_size(const ComputedStyle* parent) {
    if (!parent) return 16.0f;
    auto length = parse_length(parent->get("font-size"));
    if (!length || length->unit != Length::Unit::Px) return 16.0f;
    return length->value;
}

} // namespace

Longhands expand_shorthand(const std::string& property, const std::string& value) {
    std::string v = trim(value);
    auto names = longhands_of(property);
    if (names.empty()) {
        return {{property, v}};
    }

    std::string lc = ascii_lower(v);
    if (lc == "inherit" || lc == "initial") {
        Longhands result;
        for (auto& name : names) result.emplace_back(name, lc);
        return result;
    }

    if (property == "margin" || property == "padding" ||
        property == "border-width" || property == "border-color") {
        return expand_quad(names, v);
    }
    if (property == "background") {
        for (auto& part : split_components(lc)) {
            if (is_color(part)) return {{"background-color", part}};
        }
        return {{"background-color", "transparent"}};
    }
    if (property == "font") {
        return expand_font(v);
    }

    // border and border-<side>
    std::string width, color;
    if (!parse_border(v, width, color)) return {};
    Longhands result;
    if (property == "border") {
        for (const char* side : kSides) {
            result.emplace_back(std::string("border-") + side + "-width", width);
        }
        for (const char* side : kSides) {
            result.emplace_back(std::string("border-") + side + "-color", color);
        }
    } else {
        result.emplace_back(property + "-width", width);
        result.emplace_back(property + "-color", color);
    }
    return result;
}

bool cascade_less(const CascadeCandidate& lhs, const CascadeCandidate& rhs) {
    if (lhs.important != rhs.important) return !lhs.important;
    if (lhs.origin != rhs.origin) return lhs.origin < rhs.origin;
    if (!(lhs.specificity == rhs.specificity)) return lhs.specificity < rhs.specificity;
    if (lhs.source_order != rhs.source_order) return lhs.source_order < rhs.source_order;
    return lhs.declaration_index < rhs.declaration_index;
}

// ---------------------------------------------------------------------------
// PropertyCascade
// ---------------------------------------------------------------------------

std::string PropertyCascade::compute_value(const std::string& property, const std::string& value,
                                           const ComputedStyle* parent) const {
    if (property == "font-size") {
        auto px = resolve_font_size(value, parent_font_size(parent));
        if (!px) {
            diagnostics_.warning(kModule, "unusable font-size '" + value + "'; inheriting");
            return parent ? parent->get("font-size") : std::string("16px");
        }
        return format_px(*px);
    }
    if (property == "color" && ascii_lower(value) == "currentcolor") {
        return parent ? parent->get("color") : std::string(find_property("color")->initial_value);
    }
    if (property == "font-family") {
        return value;
    }
    return ascii_lower(value);
}

ComputedStyle PropertyCascade::cascade(std::vector<CascadeCandidate> candidates,
                                       const ComputedStyle* parent) const {
    std::stable_sort(candidates.begin(), candidates.end(), cascade_less);
    std::map<std::string, const CascadeCandidate*, std::less<>> winners;
    for (auto& candidate : candidates) {
        winners[candidate.property] = &candidate;
    }

    ComputedStyle style;
    for (auto& def : property_registry()) {
        std::string name(def.name);
        std::string initial(def.initial_value);
        auto it = winners.find(def.name);

        if (it == winners.end()) {
            style.set(name, def.inherited && parent ? parent->get(def.name) : initial);
            continue;
        }

        std::string value = trim(it->second->value);
        std::string keyword = ascii_lower(value);
        if (keyword == "inherit") {
            style.set(name, parent ? parent->get(def.name) : initial);
        } else if (keyword == "initial") {
            style.set(name, initial);
        } else {
            style.set(name, compute_value(name, value, parent));
        }
    }
    return style;
}

// ---------------------------------------------------------------------------
// StyleResolver
// ---------------------------------------------------------------------------

StyleResolver::StyleResolver(core::DiagnosticScope diagnostics)
    : cascade_(diagnostics), diagnostics_(diagnostics) {}

void StyleResolver::add_stylesheet(StyleSheet sheet, Origin origin) {
    for (auto& rule : sheet.rules) {
        rule.declarations = expand_declarations(rule.declarations, diagnostics_);
    }
    size_t first = next_source_order_;
    next_source_order_ += sheet.rules.size();
    stylesheets_.push_back({std::move(sheet), origin, first});
}

std::vector<MatchedRule> StyleResolver::collect_matching_rules(const dom::Document& document,
                                                               dom::NodeId element) const {
    std::vector<MatchedRule> result;
    for (auto& entry : stylesheets_) {
        for (size_t r = 0; r < entry.sheet.rules.size(); ++r) {
            const StyleRule& rule = entry.sheet.rules[r];
            bool matched = false;
            Specificity best;
            for (auto& selector : rule.selectors.selectors) {
                if (!matcher_.matches(document, element, selector)) continue;
                Specificity spec = specificity_of(selector);
                if (!matched || best < spec) best = spec;
                matched = true;
            }
            if (matched) {
                result.push_back({&rule, best, entry.first_source_order + r, entry.origin});
            }
        }
    }
    return result;
}

void StyleResolver::add_candidates(const std::vector<Declaration>& declarations, Origin origin,
                                   Specificity specificity, size_t source_order,
                                   std::vector<CascadeCandidate>& out) const {
    for (size_t i = 0; i < declarations.size(); ++i) {
        auto& decl = declarations[i];
        CascadeCandidate candidate;
        candidate.property = decl.property;
        candidate.value = decl.value;
        candidate.important = decl.important;
        candidate.origin = origin;
        candidate.specificity = specificity;
        candidate.source_order = source_order;
        candidate.declaration_index = i;
        out.push_back(std::move(candidate));
    }
}

ComputedStyle StyleResolver::resolve(const dom::Document& document, dom::NodeId element,
                                     const ComputedStyle* parent_style) const {
    std::vector<CascadeCandidate> candidates;
    for (auto& matched : collect_matching_rules(document, element)) {
        add_candidates(matched.rule->declarations, matched.origin, matched.specificity,
                       matched.source_order, candidates);
    }

    if (const std::string* inline_style = document.node(element).attribute("style")) {
        auto declarations = expand_declarations(
            parse_declaration_block(*inline_style, diagnostics_), diagnostics_);
        add_candidates(declarations, Origin::Inline, Specificity{}, next_source_order_,
                       candidates);
    }

    return cascade_.cascade(std::move(candidates), parent_style);
}

void StyleResolver::resolve_document(dom::Document& document) const {
    std::vector<dom::NodeId> stack{document.root()};
    while (!stack.empty()) {
        dom::NodeId id = stack.back();
        stack.pop_back();

        if (document.node(id).is_element()) {
            dom::NodeId parent = document.node(id).parent;
            const ComputedStyle* parent_style = nullptr;
            if (parent != dom::kInvalidNodeId && document.node(parent).is_element()) {
                parent_style = &document.node(parent).computed_style;
            }
            ComputedStyle style = resolve(document, id, parent_style);
            document.node(id).computed_style = std::move(style);
        }

        const auto& children = document.node(id).children;
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.push_back(*it);
        }
    }
}

} // namespace loom::css
