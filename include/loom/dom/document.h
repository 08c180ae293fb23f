#pragma once
#include <loom/css/style/computed_style.h>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace loom::dom {

using NodeId = uint32_t;
inline constexpr NodeId kInvalidNodeId = std::numeric_limits<NodeId>::max();

enum class NodeType {
    Document, Element, Text, Comment
};

struct Attribute {
    std::string name;
    std::string value;
};

// One slot in the document arena. Elements use tag_name, attributes and
// computed_style; Text and Comment use data.
struct Node {
    NodeType type = NodeType::Element;
    NodeId parent = kInvalidNodeId;
    std::vector<NodeId> children;

    std::string tag_name;
    std::vector<Attribute> attributes;
    std::string data;

    css::ComputedStyle computed_style;

    bool is_element() const { return type == NodeType::Element; }
    bool is_text() const { return type == NodeType::Text; }

    const std::string* attribute(std::string_view name) const;
    bool has_attribute(std::string_view name) const { return attribute(name) != nullptr; }

    // Whitespace-separated tokens of the class attribute.
    std::vector<std::string> class_list() const;
    std::string id() const;
};

// Arena owning every node of one navigation's document. Node 0 is always the
// Document node; ids are stable for the lifetime of the document.
class Document {
public:
    explicit Document(uint64_t generation = 0);

    NodeId root() const { return 0; }
    uint64_t generation() const { return generation_; }
    void set_generation(uint64_t generation) { generation_ = generation; }

    const std::string& url() const { return url_; }
    void set_url(std::string url) { url_ = std::move(url); }

    Node& node(NodeId id);
    const Node& node(NodeId id) const;
    bool contains(NodeId id) const { return id < nodes_.size(); }
    size_t size() const { return nodes_.size(); }

    // Node factories. The returned node is detached until append_child.
    NodeId create_element(const std::string& tag);
    NodeId create_text(const std::string& data);
    NodeId create_comment(const std::string& data);

    void append_child(NodeId parent, NodeId child);

    NodeId last_child(NodeId id) const;

    // First element (pre-order) with the given tag name, or kInvalidNodeId.
    NodeId find_first(std::string_view tag) const;
    NodeId get_element_by_id(std::string_view id) const;

    // Concatenated text of all descendant Text nodes.
    std::string text_content(NodeId id) const;

    // Pre-order traversal starting at `from`.
    void for_each_preorder(NodeId from, const std::function<void(NodeId)>& fn) const;

    // Indented tree dump, one node per line, used by the CLI and tests.
    std::string dump(bool with_styles = false) const;

private:
    NodeId allocate(NodeType type);

    std::vector<Node> nodes_;
    uint64_t generation_ = 0;
    std::string url_;
};

} // namespace loom::dom
