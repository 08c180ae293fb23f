#include <loom/paint/display_list.h>
#include <cstdio>

namespace loom::paint {

const char* paint_command_name(PaintCommand::Type type) {
    switch (type) {
        case PaintCommand::FillRect: return "FillRect";
        case PaintCommand::DrawBorder: return "DrawBorder";
        case PaintCommand::DrawText: return "DrawText";
        case PaintCommand::DrawImage: return "DrawImage";
    }
    return "Unknown";
}

void DisplayList::fill_rect(const Rect& rect, const Color& color, dom::NodeId node) {
    PaintCommand cmd;
    cmd.type = PaintCommand::FillRect;
    cmd.bounds = rect;
    cmd.color = color;
    cmd.node = node;
    commands_.push_back(cmd);
}

void DisplayList::draw_border(const Rect& rect, const layout::EdgeSizes& widths,
                              const layout::BorderColors& colors, dom::NodeId node) {
    PaintCommand cmd;
    cmd.type = PaintCommand::DrawBorder;
    cmd.bounds = rect;
    cmd.color = colors.top;
    cmd.node = node;
    cmd.border_widths[0] = widths.top;
    cmd.border_widths[1] = widths.right;
    cmd.border_widths[2] = widths.bottom;
    cmd.border_widths[3] = widths.left;
    cmd.border_colors[0] = colors.top;
    cmd.border_colors[1] = colors.right;
    cmd.border_colors[2] = colors.bottom;
    cmd.border_colors[3] = colors.left;
    commands_.push_back(cmd);
}

void DisplayList::draw_text(const std::string& text, const Rect& bounds, float baseline,
                            const layout::FontSpec& font, const Color& color, dom::NodeId node) {
    PaintCommand cmd;
    cmd.type = PaintCommand::DrawText;
    cmd.text = text;
    cmd.bounds = bounds;
    cmd.baseline = baseline;
    cmd.font = font;
    cmd.color = color;
    cmd.node = node;
    commands_.push_back(std::move(cmd));
}

void DisplayList::draw_image(const Rect& dest, const std::string& source, dom::NodeId node) {
    PaintCommand cmd;
    cmd.type = PaintCommand::DrawImage;
    cmd.bounds = dest;
    cmd.source = source;
    cmd.node = node;
    commands_.push_back(std::move(cmd));
}

void DisplayList::add_link(const Rect& bounds, const std::string& href) {
    links_.push_back({bounds, href});
}

std::string DisplayList::dump() const {
    std::string out;
    char buf[160];
    for (const auto& cmd : commands_) {
        std::snprintf(buf, sizeof(buf), "%s [%g,%g %gx%g]", paint_command_name(cmd.type),
                      cmd.bounds.x, cmd.bounds.y, cmd.bounds.width, cmd.bounds.height);
        out += buf;
        switch (cmd.type) {
            case PaintCommand::FillRect:
                out += " " + css::color_to_string(cmd.color);
                break;
            case PaintCommand::DrawBorder:
                std::snprintf(buf, sizeof(buf), " widths=%g,%g,%g,%g", cmd.border_widths[0],
                              cmd.border_widths[1], cmd.border_widths[2], cmd.border_widths[3]);
                out += buf;
                break;
            case PaintCommand::DrawText:
                std::snprintf(buf, sizeof(buf), " %s %gpx", cmd.font.family.c_str(), cmd.font.size);
                out += buf;
                out += " " + css::color_to_string(cmd.color) + " \"" + cmd.text + "\"";
                break;
            case PaintCommand::DrawImage:
                out += " src=\"" + cmd.source + "\"";
                break;
        }
        out += "\n";
    }
    return out;
}

// ============================================================================
// Box tree walk
// ============================================================================

namespace {

// href of the nearest <a href> ancestor of a node, or null.
const std::string* link_target(const dom::Document& document, dom::NodeId id) {
    while (id != dom::kInvalidNodeId) {
        const dom::Node& node = document.node(id);
        if (node.is_element() && node.tag_name == "a") {
            if (const std::string* href = node.attribute("href")) {
                return href;
            }
        }
        id = node.parent;
    }
    return nullptr;
}

void paint_box(const layout::Box& box, const dom::Document& document, DisplayList& list) {
    if (box.kind == layout::BoxKind::Block) {
        if (!box.background_color.is_transparent() && box.geometry.width > 0 &&
            box.geometry.height > 0) {
            list.fill_rect(box.geometry, box.background_color, box.node);
        }
        const auto& b = box.border;
        if (b.top > 0 || b.right > 0 || b.bottom > 0 || b.left > 0) {
            list.draw_border(box.geometry, b, box.border_color, box.node);
        }
    }

    for (const auto& child : box.children) {
        paint_box(*child, document, list);
    }

    for (const auto& line : box.lines) {
        for (const auto& fragment : line.fragments) {
            switch (fragment.kind) {
                case layout::InlineFragment::Kind::Text:
                    list.draw_text(fragment.text, fragment.rect, fragment.baseline,
                                   fragment.font, fragment.color, fragment.node);
                    break;
                case layout::InlineFragment::Kind::Atomic: {
                    const std::string* src = document.node(fragment.node).attribute("src");
                    list.draw_image(fragment.rect, src ? *src : std::string(), fragment.node);
                    break;
                }
            }
            if (const std::string* href = link_target(document, fragment.node)) {
                list.add_link(fragment.rect, *href);
            }
        }
    }
}

} // namespace

DisplayList build_display_list(const layout::Box& root, const dom::Document& document) {
    DisplayList list;
    paint_box(root, document, list);
    return list;
}

} // namespace loom::paint
