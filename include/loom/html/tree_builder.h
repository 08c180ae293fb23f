#pragma once
#include <loom/core/diagnostics.h>
#include <loom/dom/document.h>
#include <loom/html/tokenizer.h>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace loom::html {

// Small set of tag classes that drive the implicit-close table.
enum class TagCategory {
    Paragraph,
    Heading,
    ListItem,
    DefinitionTerm,
    DefinitionDescription,
    Table,
    TableRow,
    TableCell,
    Form,
    Other
};

TagCategory categorize_tag(std::string_view tag);
bool is_void_element(std::string_view tag);

struct OpenElement {
    dom::NodeId node = dom::kInvalidNodeId;
    TagCategory category = TagCategory::Other;
    std::string tag_name;
};

// Builds a dom::Document from a token stream. The open-element stack is the
// only parser state; the Document node is the implicit bottom of the stack and
// is never popped.
class TreeBuilder {
public:
    explicit TreeBuilder(dom::Document& document,
                         core::DiagnosticScope diagnostics = core::DiagnosticScope(nullptr, "parse"));

    void process_token(const Token& token);

    // Insertion point: the top of the stack, or the Document node when the
    // stack is empty.
    dom::NodeId current_node() const;
    const std::vector<OpenElement>& open_elements() const { return open_elements_; }
    bool finished() const { return finished_; }

private:
    dom::Document& document_;
    std::vector<OpenElement> open_elements_;
    core::DiagnosticScope diagnostics_;
    bool finished_ = false;

    void handle_start_tag(const Token& token);
    void handle_end_tag(const Token& token);
    void insert_text(const std::string& data);
    void insert_comment(const std::string& data);

    void apply_implicit_closes(TagCategory incoming);
    bool stack_ends_with(const std::vector<TagCategory>& suffix) const;
};

// Convenience: tokenize and build in one pass.
std::unique_ptr<dom::Document> parse(std::string_view html,
                                     core::DiagnosticScope diagnostics = core::DiagnosticScope(nullptr, "parse"),
                                     uint64_t generation = 0);

} // namespace loom::html
