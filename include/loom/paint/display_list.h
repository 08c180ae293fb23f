#pragma once
#include <loom/css/style/computed_style.h>
#include <loom/dom/document.h>
#include <loom/layout/box.h>
#include <loom/layout/font_metrics.h>
#include <string>
#include <vector>

namespace loom::paint {

using layout::Rect;
using css::Color;

struct PaintCommand {
    enum Type {
        FillRect, DrawBorder, DrawText, DrawImage
    };
    Type type = FillRect;
    Rect bounds;
    Color color;
    dom::NodeId node = dom::kInvalidNodeId;  // originating node, for hit regions

    // DrawText
    std::string text;
    layout::FontSpec font;
    float baseline = 0;

    // DrawBorder: top, right, bottom, left widths and colors
    float border_widths[4] = {0, 0, 0, 0};
    Color border_colors[4];

    // DrawImage
    std::string source;
};

// A rectangle that navigates when activated, taken from <a href>.
struct LinkRegion {
    Rect bounds;
    std::string href;
};

class DisplayList {
public:
    void fill_rect(const Rect& rect, const Color& color, dom::NodeId node);
    void draw_border(const Rect& rect, const layout::EdgeSizes& widths,
                     const layout::BorderColors& colors, dom::NodeId node);
    void draw_text(const std::string& text, const Rect& bounds, float baseline,
                   const layout::FontSpec& font, const Color& color, dom::NodeId node);
    void draw_image(const Rect& dest, const std::string& source, dom::NodeId node);
    void add_link(const Rect& bounds, const std::string& href);

    const std::vector<PaintCommand>& commands() const { return commands_; }
    const std::vector<LinkRegion>& links() const { return links_; }
    size_t size() const { return commands_.size(); }
    bool empty() const { return commands_.empty(); }
    void clear() { commands_.clear(); links_.clear(); }

    // One command per line, used by the CLI and tests.
    std::string dump() const;

private:
    std::vector<PaintCommand> commands_;
    std::vector<LinkRegion> links_;
};

const char* paint_command_name(PaintCommand::Type type);

// Walks the box tree in paint order: a block's background and border, then
// its children, then the text of its lines.
DisplayList build_display_list(const layout::Box& root, const dom::Document& document);

} // namespace loom::paint
