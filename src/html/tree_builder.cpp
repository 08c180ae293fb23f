#include <loom/html/tree_builder.h>
#include <algorithm>
#include <unordered_set>

namespace loom::html {

static const std::unordered_set<std::string_view>& void_elements() {
    static const std::unordered_set<std::string_view> s = {
        "area", "base", "br", "col", "embed", "hr", "img", "input",
        "link", "meta", "param", "source", "track", "wbr"
    };
    return s;
}

bool is_void_element(std::string_view tag) {
    return void_elements().count(tag) > 0;
}

TagCategory categorize_tag(std::string_view tag) {
    if (tag == "p") return TagCategory::Paragraph;
    if (tag.size() == 2 && tag[0] == 'h' && tag[1] >= '1' && tag[1] <= '6') {
        return TagCategory::Heading;
    }
    if (tag == "li") return TagCategory::ListItem;
    if (tag == "dt") return TagCategory::DefinitionTerm;
    if (tag == "dd") return TagCategory::DefinitionDescription;
    if (tag == "table") return TagCategory::Table;
    if (tag == "tr") return TagCategory::TableRow;
    if (tag == "td" || tag == "th") return TagCategory::TableCell;
    if (tag == "form") return TagCategory::Form;
    return TagCategory::Other;
}

namespace {

// An incoming tag in `incoming` pops `suffix` when the stack ends with it.
// Rules are applied in order, each against the stack left by the previous.
struct ImplicitCloseRule {
    std::vector<TagCategory> incoming;
    std::vector<TagCategory> suffix;
};

const std::vector<ImplicitCloseRule>& implicit_close_rules() {
    using C = TagCategory;
    static const std::vector<ImplicitCloseRule> rules = {
        {{C::Paragraph, C::Table, C::Form, C::Heading}, {C::Paragraph}},
        {{C::ListItem}, {C::ListItem}},
        {{C::DefinitionTerm, C::DefinitionDescription}, {C::DefinitionTerm}},
        {{C::DefinitionTerm, C::DefinitionDescription}, {C::DefinitionDescription}},
        {{C::TableRow}, {C::TableRow}},
        {{C::TableRow}, {C::TableRow, C::TableCell}},
        {{C::TableCell}, {C::TableCell}},
    };
    return rules;
}

} // namespace

TreeBuilder::TreeBuilder(dom::Document& document, core::DiagnosticScope diagnostics)
    : document_(document), diagnostics_(std::move(diagnostics)) {}

dom::NodeId TreeBuilder::current_node() const {
    if (open_elements_.empty()) return document_.root();
    return open_elements_.back().node;
}

bool TreeBuilder::stack_ends_with(const std::vector<TagCategory>& suffix) const {
    if (suffix.size() > open_elements_.size()) return false;
    size_t offset = open_elements_.size() - suffix.size();
    for (size_t i = 0; i < suffix.size(); ++i) {
        if (open_elements_[offset + i].category != suffix[i]) return false;
    }
    return true;
}

void TreeBuilder::apply_implicit_closes(TagCategory incoming) {
    if (incoming == TagCategory::Other) return;
    for (auto& rule : implicit_close_rules()) {
        if (std::find(rule.incoming.begin(), rule.incoming.end(), incoming) == rule.incoming.end()) {
            continue;
        }
        if (stack_ends_with(rule.suffix)) {
            open_elements_.resize(open_elements_.size() - rule.suffix.size());
        }
    }
}

void TreeBuilder::process_token(const Token& token) {
    if (finished_) return;

    switch (token.type) {
        case Token::DOCTYPE:
            break;
        case Token::StartTag:
            handle_start_tag(token);
            break;
        case Token::EndTag:
            handle_end_tag(token);
            break;
        case Token::Text:
            insert_text(token.data);
            break;
        case Token::Comment:
            insert_comment(token.data);
            break;
        case Token::EndOfFile:
            if (!open_elements_.empty()) {
                diagnostics_.info("html.tree_builder",
                    std::to_string(open_elements_.size()) + " element(s) left open at end of input");
            }
            open_elements_.clear();
            finished_ = true;
            break;
    }
}

void TreeBuilder::handle_start_tag(const Token& token) {
    TagCategory category = categorize_tag(token.name);
    apply_implicit_closes(category);

    dom::NodeId element = document_.create_element(token.name);
    auto& node = document_.node(element);
    node.attributes.reserve(token.attributes.size());
    for (auto& attr : token.attributes) {
        node.attributes.push_back({attr.name, attr.value});
    }
    document_.append_child(current_node(), element);

    if (is_void_element(token.name)) {
        return;
    }
    if (token.self_closing) {
        diagnostics_.warning("html.tree_builder",
            "self-closing syntax on non-void element <" + token.name + "> ignored");
    }
    open_elements_.push_back({element, category, token.name});
}

void TreeBuilder::handle_end_tag(const Token& token) {
    for (size_t i = open_elements_.size(); i-- > 0;) {
        if (open_elements_[i].tag_name == token.name) {
            open_elements_.resize(i);
            return;
        }
    }
    diagnostics_.warning("html.tree_builder",
        "no open element matches </" + token.name + ">; token dropped");
}

void TreeBuilder::insert_text(const std::string& data) {
    if (data.empty()) return;
    dom::NodeId parent = current_node();
    dom::NodeId last = document_.last_child(parent);
    if (last != dom::kInvalidNodeId && document_.node(last).is_text()) {
        document_.node(last).data += data;
        return;
    }
    dom::NodeId text = document_.create_text(data);
    document_.append_child(parent, text);
}

void TreeBuilder::insert_comment(const std::string& data) {
    dom::NodeId comment = document_.create_comment(data);
    document_.append_child(current_node(), comment);
}

std::unique_ptr<dom::Document> parse(std::string_view html,
                                     core::DiagnosticScope diagnostics,
                                     uint64_t generation) {
    auto document = std::make_unique<dom::Document>(generation);
    Tokenizer tokenizer(html, diagnostics.with_stage("lex"));
    TreeBuilder builder(*document, diagnostics);

    while (!builder.finished()) {
        builder.process_token(tokenizer.next_token());
    }
    return document;
}

} // namespace loom::html
