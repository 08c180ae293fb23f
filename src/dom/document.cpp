#include <loom/dom/document.h>
#include <sstream>
#include <stdexcept>

namespace loom::dom {

const std::string* Node::attribute(std::string_view name) const {
    for (auto& attr : attributes) {
        if (attr.name == name) {
            return &attr.value;
        }
    }
    return nullptr;
}

std::vector<std::string> Node::class_list() const {
    std::vector<std::string> classes;
    const std::string* value = attribute("class");
    if (!value) return classes;

    std::istringstream iss(*value);
    std::string cls;
    while (iss >> cls) {
        classes.push_back(cls);
    }
    return classes;
}

std::string Node::id() const {
    const std::string* value = attribute("id");
    return value ? *value : std::string();
}

Document::Document(uint64_t generation) : generation_(generation) {
    allocate(NodeType::Document);
}

NodeId Document::allocate(NodeType type) {
    Node n;
    n.type = type;
    nodes_.push_back(std::move(n));
    return static_cast<NodeId>(nodes_.size() - 1);
}

Node& Document::node(NodeId id) {
    if (!contains(id)) {
        throw std::out_of_range("dom: node id " + std::to_string(id) + " out of range");
    }
    return nodes_[id];
}

const Node& Document::node(NodeId id) const {
    if (!contains(id)) {
        throw std::out_of_range("dom: node id " + std::to_string(id) + " out of range");
    }
    return nodes_[id];
}

NodeId Document::create_element(const std::string& tag) {
    NodeId id = allocate(NodeType::Element);
    nodes_[id].tag_name = tag;
    return id;
}

NodeId Document::create_text(const std::string& data) {
    NodeId id = allocate(NodeType::Text);
    nodes_[id].data = data;
    return id;
}

NodeId Document::create_comment(const std::string& data) {
    NodeId id = allocate(NodeType::Comment);
    nodes_[id].data = data;
    return id;
}

void Document::append_child(NodeId parent, NodeId child) {
    Node& c = node(child);
    if (c.parent != kInvalidNodeId) {
        throw std::logic_error("dom: node " + std::to_string(child) + " already has a parent");
    }
    if (child == root()) {
        throw std::logic_error("dom: the document node cannot be a child");
    }
    node(parent).children.push_back(child);
    c.parent = parent;
}

NodeId Document::last_child(NodeId id) const {
    const Node& n = node(id);
    return n.children.empty() ? kInvalidNodeId : n.children.back();
}

void Document::for_each_preorder(NodeId from, const std::function<void(NodeId)>& fn) const {
    std::vector<NodeId> stack{from};
    while (!stack.empty()) {
        NodeId id = stack.back();
        stack.pop_back();
        fn(id);
        const auto& children = nodes_[id].children;
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.push_back(*it);
        }
    }
}

NodeId Document::find_first(std::string_view tag) const {
    NodeId found = kInvalidNodeId;
    for_each_preorder(root(), [&](NodeId id) {
        if (found == kInvalidNodeId && nodes_[id].is_element() && nodes_[id].tag_name == tag) {
            found = id;
        }
    });
    return found;
}

NodeId Document::get_element_by_id(std::string_view id) const {
    NodeId found = kInvalidNodeId;
    for_each_preorder(root(), [&](NodeId n) {
        if (found != kInvalidNodeId || !nodes_[n].is_element()) return;
        const std::string* value = nodes_[n].attribute("id");
        if (value && *value == id) {
            found = n;
        }
    });
    return found;
}

std::string Document::text_content(NodeId id) const {
    std::string result;
    for_each_preorder(id, [&](NodeId n) {
        if (nodes_[n].is_text()) {
            result += nodes_[n].data;
        }
    });
    return result;
}

// ============================================================================
// Dump
// ============================================================================

static std::string escape_text(const std::string& text) {
    std::string out;
    for (char c : text) {
        switch (c) {
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '"':  out += "\\\""; break;
            default:   out += c;
        }
    }
    return out;
}

static void dump_node(const Document& doc, NodeId id, int depth, bool with_styles,
                      std::ostringstream& out) {
    const Node& n = doc.node(id);
    std::string indent(static_cast<size_t>(depth) * 2, ' ');
    switch (n.type) {
        case NodeType::Document:
            out << indent << "#document\n";
            break;
        case NodeType::Element:
            out << indent << "<" << n.tag_name;
            for (auto& attr : n.attributes) {
                out << " " << attr.name << "=\"" << escape_text(attr.value) << "\"";
            }
            out << ">\n";
            if (with_styles) {
                for (auto& [name, value] : n.computed_style.values()) {
                    out << indent << "  | " << name << ": " << value << "\n";
                }
            }
            break;
        case NodeType::Text:
            out << indent << "\"" << escape_text(n.data) << "\"\n";
            break;
        case NodeType::Comment:
            out << indent << "<!-- " << escape_text(n.data) << " -->\n";
            break;
    }
    for (NodeId child : n.children) {
        dump_node(doc, child, depth + 1, with_styles, out);
    }
}

std::string Document::dump(bool with_styles) const {
    std::ostringstream out;
    dump_node(*this, root(), 0, with_styles, out);
    return out.str();
}

} // namespace loom::dom
