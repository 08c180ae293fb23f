#include <loom/layout/box.h>
#include <cstdio>

namespace loom::layout {

const char* box_kind_name(BoxKind kind) {
    switch (kind) {
        case BoxKind::Block: return "Block";
        case BoxKind::Inline: return "Inline";
    }
    return "Unknown";
}

bool Box::operator==(const Box& other) const {
    if (kind != other.kind || node != other.node || anonymous != other.anonymous ||
        generation != other.generation || !(geometry == other.geometry) ||
        !(margin == other.margin) || !(border == other.border) || !(padding == other.padding) ||
        background_color != other.background_color || !(border_color == other.border_color) ||
        lines != other.lines || children.size() != other.children.size()) {
        return false;
    }
    for (size_t i = 0; i < children.size(); ++i) {
        if (!(*children[i] == *other.children[i])) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Validation
// ============================================================================

namespace {

std::string describe(const Box& box) {
    return std::string(box_kind_name(box.kind)) + " box for node " + std::to_string(box.node);
}

void validate_box(const Box& box, const dom::Document& document) {
    if (!document.contains(box.node)) {
        throw InvariantViolation(describe(box) + " references a node outside the document (size " +
                                 std::to_string(document.size()) + ")");
    }
    if (box.generation != document.generation()) {
        throw InvariantViolation(describe(box) + " belongs to generation " +
                                 std::to_string(box.generation) + ", document is generation " +
                                 std::to_string(document.generation()));
    }

    switch (box.kind) {
        case BoxKind::Block:
            if (!box.lines.empty()) {
                throw InvariantViolation(describe(box) + " carries lines");
            }
            for (auto& child : box.children) {
                if (!child) {
                    throw InvariantViolation(describe(box) + " has a null child");
                }
                validate_box(*child, document);
            }
            break;
        case BoxKind::Inline:
            if (!box.children.empty()) {
                throw InvariantViolation(describe(box) + " carries child boxes");
            }
            for (auto& line : box.lines) {
                for (auto& fragment : line.fragments) {
                    if (!document.contains(fragment.node) || !document.contains(fragment.style_node)) {
                        throw InvariantViolation(describe(box) +
                                                 " has a fragment outside the document");
                    }
                }
            }
            break;
    }
}

} // namespace

void validate_box_tree(const Box& root, const dom::Document& document) {
    validate_box(root, document);
}

// ============================================================================
// Queries
// ============================================================================

dom::NodeId hit_test(const Box& root, float x, float y) {
    for (auto it = root.children.rbegin(); it != root.children.rend(); ++it) {
        dom::NodeId hit = hit_test(**it, x, y);
        if (hit != dom::kInvalidNodeId) {
            return hit;
        }
    }

    for (auto& line : root.lines) {
        if (!line.rect.contains(x, y)) {
            continue;
        }
        for (auto& fragment : line.fragments) {
            if (fragment.rect.contains(x, y)) {
                return fragment.node;
            }
        }
    }

    if (root.geometry.contains(x, y)) {
        return root.node;
    }
    return dom::kInvalidNodeId;
}

size_t count_boxes(const Box& root) {
    size_t count = 1;
    for (auto& child : root.children) {
        count += count_boxes(*child);
    }
    return count;
}

// ============================================================================
// Dump
// ============================================================================

namespace {

std::string format_rect(const Rect& rect) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "[%g,%g %gx%g]", rect.x, rect.y, rect.width, rect.height);
    return buf;
}

std::string node_label(const dom::Document& document, dom::NodeId id) {
    if (!document.contains(id)) {
        return "?";
    }
    const dom::Node& node = document.node(id);
    switch (node.type) {
        case dom::NodeType::Document: return "#document";
        case dom::NodeType::Element: return "<" + node.tag_name + ">";
        case dom::NodeType::Text: return "#text";
        case dom::NodeType::Comment: return "#comment";
    }
    return "?";
}

void dump_box(const Box& box, const dom::Document& document, int depth, std::string& out) {
    std::string indent(static_cast<size_t>(depth) * 2, ' ');
    out += indent + box_kind_name(box.kind) + " " + node_label(document, box.node);
    if (box.anonymous) {
        out += " (anonymous)";
    }
    out += " " + format_rect(box.geometry) + "\n";

    for (auto& line : box.lines) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), " baseline=%g", line.baseline);
        out += indent + "  line " + format_rect(line.rect) + buf + "\n";
        for (auto& fragment : line.fragments) {
            out += indent + "    ";
            if (fragment.kind == InlineFragment::Kind::Atomic) {
                out += "atomic " + node_label(document, fragment.node);
            } else {
                out += "text \"" + fragment.text + "\"";
            }
            out += " " + format_rect(fragment.rect) + "\n";
        }
    }

    for (auto& child : box.children) {
        dump_box(*child, document, depth + 1, out);
    }
}

} // namespace

std::string dump_box_tree(const Box& root, const dom::Document& document) {
    std::string out;
    dump_box(root, document, 0, out);
    return out;
}

} // namespace loom::layout
