#pragma once
#include <loom/css/style/computed_style.h>
#include <loom/dom/document.h>
#include <loom/layout/font_metrics.h>
#include <loom/layout/used_style.h>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace loom::layout {

struct Rect {
    float x = 0, y = 0;
    float width = 0, height = 0;

    float right() const { return x + width; }
    float bottom() const { return y + height; }

    // Half-open: the right and bottom edges are outside.
    bool contains(float px, float py) const {
        return px >= x && py >= y && px < x + width && py < y + height;
    }

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
};

// A positioned piece of one line: a run of text in a single style, or an
// atomic inline such as an image.
struct InlineFragment {
    enum class Kind { Text, Atomic };

    Kind kind = Kind::Text;
    dom::NodeId node = dom::kInvalidNodeId;        // Text node, or the atomic element
    dom::NodeId style_node = dom::kInvalidNodeId;  // element whose style applies
    std::string text;
    FontSpec font;
    css::Color color;
    Rect rect;            // absolute
    float baseline = 0;   // absolute y of the baseline
    float ascent = 0;
    float descent = 0;

    bool operator==(const InlineFragment& other) const {
        return kind == other.kind && node == other.node && style_node == other.style_node &&
               text == other.text && font == other.font && color == other.color &&
               rect == other.rect && baseline == other.baseline &&
               ascent == other.ascent && descent == other.descent;
    }
};

struct Line {
    Rect rect;
    float baseline = 0;
    std::vector<InlineFragment> fragments;

    bool operator==(const Line& other) const {
        return rect == other.rect && baseline == other.baseline && fragments == other.fragments;
    }
};

enum class BoxKind {
    Block,
    Inline
};

const char* box_kind_name(BoxKind kind);

// Block boxes own child boxes; Inline boxes own lines. Geometry is the
// absolute border box.
struct Box {
    BoxKind kind = BoxKind::Block;
    dom::NodeId node = dom::kInvalidNodeId;
    bool anonymous = false;
    uint64_t generation = 0;

    Rect geometry;
    EdgeSizes margin;
    EdgeSizes border;
    EdgeSizes padding;

    css::Color background_color = css::Color::transparent();
    BorderColors border_color;

    std::vector<std::unique_ptr<Box>> children;
    std::vector<Line> lines;

    Rect content_rect() const {
        return {geometry.x + border.left + padding.left,
                geometry.y + border.top + padding.top,
                geometry.width - border.horizontal() - padding.horizontal(),
                geometry.height - border.vertical() - padding.vertical()};
    }

    // Deep structural comparison; used to check that layout is repeatable.
    bool operator==(const Box& other) const;
};

class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Throws InvariantViolation when a box references a node outside `document`,
// carries a different generation, or mixes lines and children against its kind.
void validate_box_tree(const Box& root, const dom::Document& document);

// Deepest node whose box or fragment contains the point, or kInvalidNodeId.
dom::NodeId hit_test(const Box& root, float x, float y);

size_t count_boxes(const Box& root);

std::string dump_box_tree(const Box& root, const dom::Document& document);

} // namespace loom::layout
