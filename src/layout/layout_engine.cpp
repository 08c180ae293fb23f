#include <loom/layout/layout_engine.h>
#include <loom/layout/line_breaker.h>
#include <loom/layout/used_style.h>
#include <algorithm>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace loom::layout {

namespace {

constexpr const char* kModule = "layout.engine";
// U+FFFC OBJECT REPLACEMENT CHARACTER stands in for atomic inlines so the
// line breaker sees a break opportunity on both sides of them.
constexpr const char kObjectReplacement[] = "\xEF\xBF\xBC";
constexpr float kFitEpsilon = 0.001f;

// Vertical extent a run of text contributes to its line. An explicit
// line-height splits the leading evenly above and below the glyphs; with
// `normal` the ascent sits on the line top and the leading goes below.
void text_extent(const TextMetrics& tm, std::optional<float> used_line_height,
                 float& ascent, float& descent, float& line_height) {
    ascent = tm.ascent;
    descent = tm.descent;
    line_height = tm.line_height;
    if (used_line_height) {
        line_height = *used_line_height;
        const float half_leading = (line_height - (tm.ascent + tm.descent)) / 2;
        ascent += half_leading;
        descent += half_leading;
    }
}

bool is_html_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

// One piece of inline content after white-space processing.
struct InlinePart {
    enum class Kind { Text, Atomic, Break };

    Kind kind = Kind::Text;
    dom::NodeId node = dom::kInvalidNodeId;
    dom::NodeId style_node = dom::kInvalidNodeId;
    const UsedStyle* style = nullptr;
    std::string text;
    float width = 0;   // Atomic only
    float height = 0;  // Atomic only

    bool collapsible() const {
        return kind == Kind::Text && style->white_space != WhiteSpace::Pre;
    }
};

struct LinePiece {
    size_t part;
    std::string text;
    float width;
};

// ============================================================================
// Inline formatting: breaks one run of inline parts into lines
// ============================================================================

class InlineFormatter {
public:
    InlineFormatter(const FontMetrics& metrics, LineBreaker& breaker,
                    const std::vector<InlinePart>& parts, const UsedStyle& block_style,
                    float x, float y, float width)
        : metrics_(metrics), breaker_(breaker), parts_(parts), block_style_(block_style),
          x_(x), cursor_y_(y), width_(width) {}

    std::vector<Line> format();

private:
    struct Span {
        size_t start;
        size_t end;
        size_t part;
    };

    const FontMetrics& metrics_;
    LineBreaker& breaker_;
    const std::vector<InlinePart>& parts_;
    const UsedStyle& block_style_;
    float x_;
    float cursor_y_;
    float width_;

    std::vector<Line> lines_;
    std::vector<LinePiece> current_;
    float current_width_ = 0;
    bool after_break_ = true;

    void format_paragraph(size_t begin, size_t end);
    void place_unit(const std::string& buffer, const std::vector<Span>& spans,
                    size_t unit_start, size_t unit_end);
    bool soft_wrap_allowed(const std::vector<Span>& spans, size_t offset) const;
    void strip_leading_spaces(std::vector<LinePiece>& pieces) const;
    float trailing_space_width(const LinePiece& piece) const;
    float measure_piece(const LinePiece& piece) const;
    void push_empty_line();
    void flush_line();

    void strut(float& ascent, float& descent, float& line_height) const;
};

std::vector<Line> InlineFormatter::format() {
    size_t begin = 0;
    for (size_t i = 0; i < parts_.size(); ++i) {
        if (parts_[i].kind != InlinePart::Kind::Break) {
            continue;
        }
        format_paragraph(begin, i);
        if (!current_.empty()) {
            flush_line();
        } else if (after_break_) {
            // Consecutive breaks, or a break opening the run, leave an empty line.
            push_empty_line();
        }
        after_break_ = true;
        begin = i + 1;
    }
    format_paragraph(begin, parts_.size());
    if (!current_.empty()) {
        flush_line();
    }
    return std::move(lines_);
}

void InlineFormatter::format_paragraph(size_t begin, size_t end) {
    std::string buffer;
    std::vector<Span> spans;
    for (size_t p = begin; p < end; ++p) {
        size_t start = buffer.size();
        if (parts_[p].kind == InlinePart::Kind::Atomic) {
            buffer += kObjectReplacement;
        } else {
            buffer += parts_[p].text;
        }
        if (buffer.size() > start) {
            spans.push_back({start, buffer.size(), p});
        }
    }
    if (buffer.empty()) {
        return;
    }

    size_t unit_start = 0;
    for (const auto& opportunity : breaker_.opportunities(buffer)) {
        bool at_end = opportunity.offset == buffer.size();
        if (!opportunity.mandatory && !at_end && !soft_wrap_allowed(spans, opportunity.offset)) {
            continue;
        }
        place_unit(buffer, spans, unit_start, opportunity.offset);
        unit_start = opportunity.offset;
        if (opportunity.mandatory && !at_end && !current_.empty()) {
            flush_line();
        }
    }
}

bool InlineFormatter::soft_wrap_allowed(const std::vector<Span>& spans, size_t offset) const {
    // The character ending the unit decides; nowrap and pre text never wraps.
    for (const auto& span : spans) {
        if (offset - 1 >= span.start && offset - 1 < span.end) {
            return parts_[span.part].style->white_space == WhiteSpace::Normal;
        }
    }
    return true;
}

float InlineFormatter::measure_piece(const LinePiece& piece) const {
    const InlinePart& part = parts_[piece.part];
    if (part.kind == InlinePart::Kind::Atomic) {
        return part.width;
    }
    return metrics_.measure(part.style->font, piece.text).width();
}

float InlineFormatter::trailing_space_width(const LinePiece& piece) const {
    const InlinePart& part = parts_[piece.part];
    if (!part.collapsible()) {
        return 0;
    }
    size_t last = piece.text.find_last_not_of(' ');
    size_t count = last == std::string::npos ? piece.text.size() : piece.text.size() - last - 1;
    if (count == 0) {
        return 0;
    }
    return metrics_.measure(part.style->font, std::string(count, ' ')).width();
}

void InlineFormatter::strip_leading_spaces(std::vector<LinePiece>& pieces) const {
    while (!pieces.empty()) {
        LinePiece& first = pieces.front();
        if (!parts_[first.part].collapsible()) {
            return;
        }
        size_t n = first.text.find_first_not_of(' ');
        if (n == 0) {
            return;
        }
        if (n == std::string::npos) {
            pieces.erase(pieces.begin());
            continue;
        }
        first.text.erase(0, n);
        first.width = measure_piece(first);
        return;
    }
}

void InlineFormatter::place_unit(const std::string& buffer, const std::vector<Span>& spans,
                                 size_t unit_start, size_t unit_end) {
    std::vector<LinePiece> pieces;
    for (const auto& span : spans) {
        size_t s = std::max(span.start, unit_start);
        size_t e = std::min(span.end, unit_end);
        if (s >= e) {
            continue;
        }
        LinePiece piece{span.part, buffer.substr(s, e - s), 0};
        if (parts_[span.part].kind == InlinePart::Kind::Atomic) {
            piece.text.clear();
        }
        piece.width = measure_piece(piece);
        pieces.push_back(std::move(piece));
    }
    if (pieces.empty()) {
        return;
    }

    float unit_width = 0;
    for (const auto& piece : pieces) {
        unit_width += piece.width;
    }
    float trailing = trailing_space_width(pieces.back());

    if (!current_.empty() && current_width_ + unit_width - trailing > width_ + kFitEpsilon) {
        flush_line();
    }

    if (current_.empty()) {
        strip_leading_spaces(pieces);
        if (pieces.empty()) {
            return;
        }
        unit_width = 0;
        for (const auto& piece : pieces) {
            unit_width += piece.width;
        }
    }

    // A unit wider than the line still goes on it when the line is empty;
    // the next unit then starts a new line.
    for (auto& piece : pieces) {
        current_.push_back(std::move(piece));
    }
    current_width_ += unit_width;
    after_break_ = false;
}

void InlineFormatter::strut(float& ascent, float& descent, float& line_height) const {
    text_extent(metrics_.measure(block_style_.font, ""), block_style_.line_height, ascent,
                descent, line_height);
}

void InlineFormatter::push_empty_line() {
    float ascent = 0, descent = 0, line_height = 0;
    strut(ascent, descent, line_height);
    Line line;
    line.rect = {x_, cursor_y_, width_, line_height};
    line.baseline = cursor_y_ + ascent;
    cursor_y_ += line_height;
    lines_.push_back(std::move(line));
}

void InlineFormatter::flush_line() {
    // Collapsible spaces at the end of a line are not rendered.
    while (!current_.empty()) {
        LinePiece& last = current_.back();
        if (!parts_[last.part].collapsible()) {
            break;
        }
        size_t n = last.text.find_last_not_of(' ');
        if (n == std::string::npos) {
            current_.pop_back();
            continue;
        }
        last.text.erase(n + 1);
        break;
    }

    std::vector<LinePiece> merged;
    for (auto& piece : current_) {
        if (!merged.empty() && merged.back().part == piece.part &&
            parts_[piece.part].kind == InlinePart::Kind::Text) {
            merged.back().text += piece.text;
        } else {
            merged.push_back(std::move(piece));
        }
    }
    current_.clear();
    current_width_ = 0;
    if (merged.empty()) {
        return;
    }

    float max_ascent = 0, max_descent = 0, max_line_height = 0;
    strut(max_ascent, max_descent, max_line_height);

    std::vector<InlineFragment> fragments;
    float line_width = 0;
    for (auto& piece : merged) {
        const InlinePart& part = parts_[piece.part];
        InlineFragment fragment;
        fragment.node = part.node;
        fragment.style_node = part.style_node;
        fragment.font = part.style->font;
        fragment.color = part.style->color;

        float ascent = 0, descent = 0, line_height = 0;
        if (part.kind == InlinePart::Kind::Atomic) {
            fragment.kind = InlineFragment::Kind::Atomic;
            fragment.rect.width = part.width;
            fragment.ascent = part.height;
            fragment.descent = 0;
            ascent = part.height;
            line_height = part.height;
        } else {
            TextMetrics tm = metrics_.measure(part.style->font, piece.text);
            fragment.text = std::move(piece.text);
            fragment.rect.width = tm.width();
            fragment.ascent = tm.ascent;
            fragment.descent = tm.descent;
            text_extent(tm, part.style->line_height, ascent, descent, line_height);
        }
        max_ascent = std::max(max_ascent, ascent);
        max_descent = std::max(max_descent, descent);
        max_line_height = std::max(max_line_height, line_height);
        line_width += fragment.rect.width;
        fragments.push_back(std::move(fragment));
    }

    float height = std::max(max_line_height, max_ascent + max_descent);
    float baseline = cursor_y_ + max_ascent;

    float offset = 0;
    if (line_width < width_) {
        switch (block_style_.text_align) {
            case TextAlign::Left: break;
            case TextAlign::Center: offset = (width_ - line_width) / 2; break;
            case TextAlign::Right: offset = width_ - line_width; break;
        }
    }

    float pen = x_ + offset;
    for (auto& fragment : fragments) {
        fragment.rect.x = pen;
        fragment.rect.y = baseline - fragment.ascent;
        fragment.rect.height = fragment.ascent + fragment.descent;
        fragment.baseline = baseline;
        pen += fragment.rect.width;
    }

    Line line;
    line.rect = {x_, cursor_y_, width_, height};
    line.baseline = baseline;
    line.fragments = std::move(fragments);
    cursor_y_ += height;
    lines_.push_back(std::move(line));
}

// ============================================================================
// Block formatting and box construction for one layout pass
// ============================================================================

class LayoutPass {
public:
    LayoutPass(const dom::Document& document, const FontMetrics& metrics,
               const core::DiagnosticScope& diagnostics)
        : document_(document), metrics_(metrics), diagnostics_(diagnostics) {
        root_style_.display = Display::Block;
    }

    std::unique_ptr<Box> run(float viewport_width);

private:
    const dom::Document& document_;
    const FontMetrics& metrics_;
    const core::DiagnosticScope& diagnostics_;
    LineBreaker breaker_;
    UsedStyle root_style_;
    std::unordered_map<dom::NodeId, UsedStyle> styles_;

    const UsedStyle& used_style(dom::NodeId id, float containing_width);
    dom::NodeId style_node_for(dom::NodeId id) const;

    std::unique_ptr<Box> layout_block(dom::NodeId id, const UsedStyle& style,
                                      float x, float y, float containing_width);
    std::unique_ptr<Box> layout_inline_run(dom::NodeId block_node, const UsedStyle& block_style,
                                           const std::vector<dom::NodeId>& items,
                                           float x, float y, float width);

    void collect_inline(dom::NodeId id, float containing_width,
                        std::vector<InlinePart>& parts, bool& last_was_space);
    void append_text(const std::string& data, dom::NodeId node, dom::NodeId style_node,
                     const UsedStyle& style, std::vector<InlinePart>& parts,
                     bool& last_was_space) const;
    InlinePart atomic_part(dom::NodeId id, const UsedStyle& style, float containing_width) const;
};

const UsedStyle& LayoutPass::used_style(dom::NodeId id, float containing_width) {
    if (id == document_.root()) {
        return root_style_;
    }
    auto it = styles_.find(id);
    if (it != styles_.end()) {
        return it->second;
    }
    UsedStyle used = compute_used_style(document_.node(id).computed_style, containing_width,
                                        diagnostics_);
    return styles_.emplace(id, std::move(used)).first->second;
}

dom::NodeId LayoutPass::style_node_for(dom::NodeId id) const {
    dom::NodeId current = document_.node(id).parent;
    while (current != dom::kInvalidNodeId && !document_.node(current).is_element()) {
        current = document_.node(current).parent;
    }
    return current == dom::kInvalidNodeId ? document_.root() : current;
}

std::unique_ptr<Box> LayoutPass::run(float viewport_width) {
    return layout_block(document_.root(), root_style_, 0, 0, std::max(0.0f, viewport_width));
}

std::unique_ptr<Box> LayoutPass::layout_block(dom::NodeId id, const UsedStyle& style,
                                              float x, float y, float containing_width) {
    auto box = std::make_unique<Box>();
    box->kind = BoxKind::Block;
    box->node = id;
    box->generation = document_.generation();
    box->margin = style.margin;
    box->border = style.border;
    box->padding = style.padding;
    box->background_color = style.background_color;
    box->border_color = style.border_color;

    float em = style.font.size;
    float content_width = 0;
    if (!style.width.is_auto()) {
        content_width = std::max(0.0f, style.width.to_px(containing_width, em));
    } else {
        content_width = std::max(0.0f, containing_width - style.margin.horizontal() -
                                           style.border.horizontal() - style.padding.horizontal());
    }

    box->geometry.x = x + style.margin.left;
    box->geometry.y = y + style.margin.top;
    box->geometry.width = content_width + style.border.horizontal() + style.padding.horizontal();

    float content_x = box->geometry.x + style.border.left + style.padding.left;
    float content_top = box->geometry.y + style.border.top + style.padding.top;
    float cursor = content_top;

    std::vector<dom::NodeId> pending;
    auto flush_inline = [&]() {
        if (pending.empty()) {
            return;
        }
        auto inline_box = layout_inline_run(id, style, pending, content_x, cursor, content_width);
        pending.clear();
        if (inline_box) {
            cursor = inline_box->geometry.bottom();
            box->children.push_back(std::move(inline_box));
        }
    };

    for (dom::NodeId child : document_.node(id).children) {
        const dom::Node& child_node = document_.node(child);
        switch (child_node.type) {
            case dom::NodeType::Document:
            case dom::NodeType::Comment:
                break;
            case dom::NodeType::Text:
                pending.push_back(child);
                break;
            case dom::NodeType::Element: {
                const UsedStyle& child_style = used_style(child, content_width);
                if (child_style.display == Display::None) {
                    break;
                }
                if (child_style.display == Display::Inline) {
                    pending.push_back(child);
                    break;
                }
                flush_inline();
                auto child_box = layout_block(child, child_style, content_x, cursor, content_width);
                cursor = child_box->geometry.bottom() + child_box->margin.bottom;
                box->children.push_back(std::move(child_box));
                break;
            }
        }
    }
    flush_inline();

    float content_height = cursor - content_top;
    // Percentage heights need a definite containing height; they act as auto.
    if (!style.height.is_auto() && style.height.unit != css::Length::Unit::Percent) {
        content_height = std::max(0.0f, style.height.to_px(0, em));
    }
    box->geometry.height = content_height + style.border.vertical() + style.padding.vertical();
    return box;
}

std::unique_ptr<Box> LayoutPass::layout_inline_run(dom::NodeId block_node,
                                                   const UsedStyle& block_style,
                                                   const std::vector<dom::NodeId>& items,
                                                   float x, float y, float width) {
    std::vector<InlinePart> parts;
    bool last_was_space = true;
    for (dom::NodeId item : items) {
        collect_inline(item, width, parts, last_was_space);
    }

    bool has_content = false;
    for (const auto& part : parts) {
        if (part.kind != InlinePart::Kind::Text || !part.collapsible() ||
            part.text.find_first_not_of(' ') != std::string::npos) {
            has_content = true;
            break;
        }
    }
    if (!has_content) {
        return nullptr;
    }

    InlineFormatter formatter(metrics_, breaker_, parts, block_style, x, y, width);
    std::vector<Line> lines = formatter.format();
    if (lines.empty()) {
        return nullptr;
    }

    auto box = std::make_unique<Box>();
    box->kind = BoxKind::Inline;
    box->node = block_node;
    box->anonymous = true;
    box->generation = document_.generation();
    box->geometry = {x, y, width, lines.back().rect.bottom() - y};
    box->lines = std::move(lines);
    return box;
}

void LayoutPass::collect_inline(dom::NodeId id, float containing_width,
                                std::vector<InlinePart>& parts, bool& last_was_space) {
    const dom::Node& node = document_.node(id);
    switch (node.type) {
        case dom::NodeType::Document:
        case dom::NodeType::Comment:
            return;
        case dom::NodeType::Text: {
            dom::NodeId style_node = style_node_for(id);
            append_text(node.data, id, style_node, used_style(style_node, containing_width),
                        parts, last_was_space);
            return;
        }
        case dom::NodeType::Element:
            break;
    }

    const UsedStyle& style = used_style(id, containing_width);
    if (style.display == Display::None) {
        return;
    }
    if (node.tag_name == "br") {
        InlinePart part;
        part.kind = InlinePart::Kind::Break;
        part.node = id;
        part.style_node = id;
        part.style = &style;
        parts.push_back(std::move(part));
        last_was_space = true;
        return;
    }
    if (node.tag_name == "img") {
        parts.push_back(atomic_part(id, style, containing_width));
        last_was_space = false;
        return;
    }
    // Block-level descendants of an inline element flow as inline content.
    for (dom::NodeId child : node.children) {
        collect_inline(child, containing_width, parts, last_was_space);
    }
}

void LayoutPass::append_text(const std::string& data, dom::NodeId node, dom::NodeId style_node,
                             const UsedStyle& style, std::vector<InlinePart>& parts,
                             bool& last_was_space) const {
    auto push_text = [&](std::string text) {
        if (text.empty()) {
            return;
        }
        InlinePart part;
        part.kind = InlinePart::Kind::Text;
        part.node = node;
        part.style_node = style_node;
        part.style = &style;
        part.text = std::move(text);
        parts.push_back(std::move(part));
    };

    if (style.white_space == WhiteSpace::Pre) {
        std::string current;
        for (char c : data) {
            if (c == '\n') {
                push_text(std::move(current));
                current.clear();
                InlinePart part;
                part.kind = InlinePart::Kind::Break;
                part.node = node;
                part.style_node = style_node;
                part.style = &style;
                parts.push_back(std::move(part));
                last_was_space = true;
            } else if (c == '\r') {
                continue;
            } else {
                current += (c == '\t' || c == '\f') ? ' ' : c;
                last_was_space = false;
            }
        }
        push_text(std::move(current));
        return;
    }

    std::string collapsed;
    collapsed.reserve(data.size());
    for (char c : data) {
        if (is_html_space(c)) {
            if (!last_was_space) {
                collapsed += ' ';
                last_was_space = true;
            }
        } else {
            collapsed += c;
            last_was_space = false;
        }
    }
    push_text(std::move(collapsed));
}

InlinePart LayoutPass::atomic_part(dom::NodeId id, const UsedStyle& style,
                                   float containing_width) const {
    const dom::Node& node = document_.node(id);
    auto dimension = [&](const css::Length& length, std::string_view attribute) -> float {
        if (!length.is_auto()) {
            return std::max(0.0f, length.to_px(containing_width, style.font.size));
        }
        if (const std::string* value = node.attribute(attribute)) {
            char* end = nullptr;
            float parsed = std::strtof(value->c_str(), &end);
            if (end != value->c_str() && parsed >= 0) {
                return parsed;
            }
            diagnostics_.warning(kModule, "ignoring <img " + std::string(attribute) + "=\"" +
                                              *value + "\">");
        }
        return 0.0f;
    };

    InlinePart part;
    part.kind = InlinePart::Kind::Atomic;
    part.node = id;
    part.style_node = id;
    part.style = &style;
    part.width = dimension(style.width, "width");
    part.height = dimension(style.height, "height");
    return part;
}

} // namespace

// ============================================================================
// LayoutEngine
// ============================================================================

LayoutEngine::LayoutEngine(std::shared_ptr<const FontMetrics> metrics,
                           core::DiagnosticScope diagnostics)
    : metrics_(std::move(metrics)), diagnostics_(std::move(diagnostics)) {
    if (!metrics_) {
        throw std::invalid_argument("LayoutEngine requires font metrics");
    }
}

std::unique_ptr<Box> LayoutEngine::layout(const dom::Document& document,
                                          float viewport_width) const {
    LayoutPass pass(document, *metrics_, diagnostics_);
    auto root = pass.run(viewport_width);
    diagnostics_.info(kModule, "laid out " + std::to_string(count_boxes(*root)) +
                                   " boxes at width " + std::to_string(static_cast<int>(viewport_width)));
    return root;
}

} // namespace loom::layout
