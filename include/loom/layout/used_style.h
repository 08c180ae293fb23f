#pragma once
#include <loom/core/diagnostics.h>
#include <loom/css/style/computed_style.h>
#include <loom/layout/font_metrics.h>
#include <optional>

namespace loom::layout {

enum class Display {
    Block,
    Inline,
    None
};

enum class TextAlign {
    Left,
    Center,
    Right
};

enum class WhiteSpace {
    Normal,
    NoWrap,
    Pre
};

struct EdgeSizes {
    float top = 0, right = 0, bottom = 0, left = 0;

    float horizontal() const { return left + right; }
    float vertical() const { return top + bottom; }

    bool operator==(const EdgeSizes& other) const {
        return top == other.top && right == other.right &&
               bottom == other.bottom && left == other.left;
    }
};

struct BorderColors {
    css::Color top, right, bottom, left;

    bool operator==(const BorderColors& other) const {
        return top == other.top && right == other.right &&
               bottom == other.bottom && left == other.left;
    }
};

// Computed values converted into the typed form layout and paint work with.
// Percentages that depend on the containing block are already resolved.
struct UsedStyle {
    Display display = Display::Inline;
    css::Color color = css::Color::black();
    css::Color background_color = css::Color::transparent();
    FontSpec font;
    TextAlign text_align = TextAlign::Left;
    WhiteSpace white_space = WhiteSpace::Normal;
    std::optional<float> line_height;  // unset for "normal"
    css::Length width = css::Length::auto_val();
    css::Length height = css::Length::auto_val();
    EdgeSizes margin;
    EdgeSizes padding;
    EdgeSizes border;
    BorderColors border_color;
};

// An unusable value falls back to the property's initial value and is
// reported as a warning under "layout.style".
UsedStyle compute_used_style(const css::ComputedStyle& style, float containing_width,
                             const core::DiagnosticScope& diagnostics);

} // namespace loom::layout
