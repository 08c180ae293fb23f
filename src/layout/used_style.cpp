#include <loom/layout/used_style.h>
#include <cstdlib>
#include <string>
#include <string_view>

namespace loom::layout {

namespace {

constexpr const char* kModule = "layout.style";

class UsedStyleBuilder {
public:
    UsedStyleBuilder(const css::ComputedStyle& style, float containing_width,
                     const core::DiagnosticScope& diagnostics)
        : style_(style), containing_width_(containing_width), diagnostics_(diagnostics) {}

    UsedStyle build();

private:
    const css::ComputedStyle& style_;
    float containing_width_;
    const core::DiagnosticScope& diagnostics_;

    void fallback(std::string_view property, const std::string& value) const {
        std::string initial(css::find_property(property) ? css::find_property(property)->initial_value
                                                         : std::string_view());
        diagnostics_.warning(kModule, "unusable value '" + value + "' for " + std::string(property) +
                                          ", using initial value '" + initial + "'");
    }

    std::string initial_of(std::string_view property) const {
        const css::PropertyDefinition* def = css::find_property(property);
        return def ? std::string(def->initial_value) : std::string();
    }

    Display display();
    css::Color color(std::string_view property, const css::Color& current);
    FontSpec font();
    TextAlign text_align();
    WhiteSpace white_space();
    std::optional<float> line_height(float font_size);
    css::Length size(std::string_view property);
    float edge(std::string_view property, float font_size, bool allow_negative);
    float border_width(std::string_view property, float font_size);
};

Display UsedStyleBuilder::display() {
    std::string value = style_.get("display");
    if (value == "none") return Display::None;
    if (value == "inline" || value == "inline-block" || value == "inline-flex" ||
        value == "inline-grid" || value == "inline-table") {
        return Display::Inline;
    }
    if (value == "block" || value == "list-item" || value == "flex" || value == "grid" ||
        value == "table" || value == "table-row" || value == "table-cell" ||
        value == "table-row-group" || value == "table-header-group" ||
        value == "table-footer-group" || value == "table-caption" || value == "flow-root") {
        return Display::Block;
    }
    fallback("display", value);
    return Display::Inline;
}

css::Color UsedStyleBuilder::color(std::string_view property, const css::Color& current) {
    std::string value = style_.get(property);
    if (value == "currentcolor") {
        return current;
    }
    if (auto parsed = css::parse_color(value)) {
        return *parsed;
    }
    fallback(property, value);
    std::string initial = initial_of(property);
    if (initial == "currentcolor") {
        return current;
    }
    return css::parse_color(initial).value_or(css::Color::black());
}

FontSpec UsedStyleBuilder::font() {
    FontSpec spec;

    std::string size_value = style_.get("font-size");
    auto size = css::parse_length(size_value);
    if (size && size->unit == css::Length::Unit::Px && size->value >= 0) {
        spec.size = size->value;
    } else {
        fallback("font-size", size_value);
    }

    std::string weight = style_.get("font-weight");
    if (weight == "bold" || weight == "bolder") {
        spec.bold = true;
    } else if (weight == "normal" || weight == "lighter") {
        spec.bold = false;
    } else {
        char* end = nullptr;
        long numeric = std::strtol(weight.c_str(), &end, 10);
        if (end != weight.c_str() && *end == '\0' && numeric >= 1 && numeric <= 1000) {
            spec.bold = numeric >= 600;
        } else {
            fallback("font-weight", weight);
        }
    }

    std::string style = style_.get("font-style");
    if (style == "italic" || style == "oblique") {
        spec.italic = true;
    } else if (style != "normal") {
        fallback("font-style", style);
    }

    // First family of the list, quotes stripped.
    std::string family = style_.get("font-family");
    auto comma = family.find(',');
    if (comma != std::string::npos) {
        family = family.substr(0, comma);
    }
    while (!family.empty() && (family.front() == ' ' || family.front() == '"' || family.front() == '\'')) {
        family.erase(family.begin());
    }
    while (!family.empty() && (family.back() == ' ' || family.back() == '"' || family.back() == '\'')) {
        family.pop_back();
    }
    if (!family.empty()) {
        spec.family = family;
    }
    return spec;
}

TextAlign UsedStyleBuilder::text_align() {
    std::string value = style_.get("text-align");
    if (value == "left" || value == "start" || value == "justify") return TextAlign::Left;
    if (value == "center") return TextAlign::Center;
    if (value == "right" || value == "end") return TextAlign::Right;
    fallback("text-align", value);
    return TextAlign::Left;
}

WhiteSpace UsedStyleBuilder::white_space() {
    std::string value = style_.get("white-space");
    if (value == "normal" || value == "pre-line") return WhiteSpace::Normal;
    if (value == "nowrap") return WhiteSpace::NoWrap;
    if (value == "pre" || value == "pre-wrap") return WhiteSpace::Pre;
    fallback("white-space", value);
    return WhiteSpace::Normal;
}

std::optional<float> UsedStyleBuilder::line_height(float font_size) {
    std::string value = style_.get("line-height");
    if (value == "normal") {
        return std::nullopt;
    }

    char* end = nullptr;
    float number = std::strtof(value.c_str(), &end);
    if (end != value.c_str() && *end == '\0' && number >= 0) {
        return number * font_size;
    }

    auto length = css::parse_length(value);
    if (length && !length->is_auto() && length->value >= 0) {
        return length->to_px(font_size, font_size);
    }
    fallback("line-height", value);
    return std::nullopt;
}

css::Length UsedStyleBuilder::size(std::string_view property) {
    std::string value = style_.get(property);
    auto length = css::parse_length(value);
    if (length && length->value >= 0) {
        return *length;
    }
    fallback(property, value);
    return css::Length::auto_val();
}

float UsedStyleBuilder::edge(std::string_view property, float font_size, bool allow_negative) {
    std::string value = style_.get(property);
    auto length = css::parse_length(value);
    if (length && length->is_auto() && allow_negative) {
        // Auto margins resolve to zero; there is no centering.
        return 0;
    }
    if (length && !length->is_auto() && (allow_negative || length->value >= 0)) {
        return length->to_px(containing_width_, font_size);
    }
    fallback(property, value);
    return 0;
}

float UsedStyleBuilder::border_width(std::string_view property, float font_size) {
    std::string value = style_.get(property);
    if (value == "thin") return 1;
    if (value == "medium") return 3;
    if (value == "thick") return 5;
    auto length = css::parse_length(value);
    if (length && !length->is_auto() && length->unit != css::Length::Unit::Percent &&
        length->value >= 0) {
        return length->to_px(0, font_size);
    }
    fallback(property, value);
    return 0;
}

UsedStyle UsedStyleBuilder::build() {
    UsedStyle used;
    used.display = display();
    used.font = font();
    used.color = color("color", css::Color::black());
    used.background_color = color("background-color", used.color);
    used.text_align = text_align();
    used.white_space = white_space();
    used.line_height = line_height(used.font.size);
    used.width = size("width");
    used.height = size("height");

    float em = used.font.size;
    used.margin = {edge("margin-top", em, true), edge("margin-right", em, true),
                   edge("margin-bottom", em, true), edge("margin-left", em, true)};
    used.padding = {edge("padding-top", em, false), edge("padding-right", em, false),
                    edge("padding-bottom", em, false), edge("padding-left", em, false)};
    used.border = {border_width("border-top-width", em), border_width("border-right-width", em),
                   border_width("border-bottom-width", em), border_width("border-left-width", em)};
    used.border_color = {color("border-top-color", used.color), color("border-right-color", used.color),
                         color("border-bottom-color", used.color), color("border-left-color", used.color)};
    return used;
}

} // namespace

UsedStyle compute_used_style(const css::ComputedStyle& style, float containing_width,
                             const core::DiagnosticScope& diagnostics) {
    return UsedStyleBuilder(style, containing_width, diagnostics).build();
}

} // namespace loom::layout
