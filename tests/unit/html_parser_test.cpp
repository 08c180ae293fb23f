#include <loom/core/diagnostics.h>
#include <loom/html/tree_builder.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace loom;
using loom::dom::NodeId;

// Tag names of the element children of `id`, in order.
static std::vector<std::string> child_tags(const dom::Document& doc, NodeId id) {
    std::vector<std::string> tags;
    for (NodeId child : doc.node(id).children) {
        if (doc.node(child).is_element()) {
            tags.push_back(doc.node(child).tag_name);
        }
    }
    return tags;
}

// ============================================================================
// Tree shape
// ============================================================================

TEST(HtmlParser, BasicDocument) {
    auto doc = html::parse("<html><body><p>Hello</p></body></html>");
    ASSERT_NE(doc, nullptr);
    EXPECT_EQ(child_tags(*doc, doc->root()), (std::vector<std::string>{"html"}));
    NodeId p = doc->find_first("p");
    ASSERT_NE(p, dom::kInvalidNodeId);
    EXPECT_EQ(doc->node(doc->node(p).parent).tag_name, "body");
    EXPECT_EQ(doc->text_content(p), "Hello");
}

TEST(HtmlParser, FragmentsHangOffTheDocumentNode) {
    auto doc = html::parse("<p>one</p>text<div>two</div>");
    EXPECT_EQ(doc->node(doc->root()).children.size(), 3u);
    EXPECT_EQ(child_tags(*doc, doc->root()), (std::vector<std::string>{"p", "div"}));
}

TEST(HtmlParser, GenerationIsStamped) {
    auto doc = html::parse("<p>x</p>", core::DiagnosticScope(nullptr, "parse"), 9);
    EXPECT_EQ(doc->generation(), 9u);
}

TEST(HtmlParser, EmptyInputGivesBareDocument) {
    auto doc = html::parse("");
    EXPECT_EQ(doc->size(), 1u);
}

TEST(HtmlParser, DoctypeIsNotANode) {
    auto doc = html::parse("<!DOCTYPE html><p>x</p>");
    EXPECT_EQ(child_tags(*doc, doc->root()), (std::vector<std::string>{"p"}));
    EXPECT_EQ(doc->node(doc->root()).children.size(), 1u);
}

// ============================================================================
// Implicit closes
// ============================================================================

TEST(HtmlParser, ListItemsCloseEachOther) {
    auto doc = html::parse("<ul><li>a<li>b</ul>");
    NodeId ul = doc->find_first("ul");
    EXPECT_EQ(child_tags(*doc, ul), (std::vector<std::string>{"li", "li"}));
}

TEST(HtmlParser, DefinitionTermsAndDescriptionsAreSiblings) {
    auto doc = html::parse("<dl><dt>x<dd>y<dt>z</dl>");
    NodeId dl = doc->find_first("dl");
    EXPECT_EQ(child_tags(*doc, dl), (std::vector<std::string>{"dt", "dd", "dt"}));
}

TEST(HtmlParser, ParagraphClosedByBlockStarters) {
    auto doc = html::parse("<p>one<p>two<h1>head</h1><p>three<table></table>");
    EXPECT_EQ(child_tags(*doc, doc->root()),
              (std::vector<std::string>{"p", "p", "h1", "p", "table"}));
}

TEST(HtmlParser, ParagraphNotClosedByInlineContent) {
    auto doc = html::parse("<p>a<b>bold</b><span>s</span></p>");
    NodeId p = doc->find_first("p");
    EXPECT_EQ(child_tags(*doc, p), (std::vector<std::string>{"b", "span"}));
}

TEST(HtmlParser, TableRowsAndCells) {
    auto doc = html::parse("<table><tr><td>1<td>2<tr><td>3</table>");
    NodeId table = doc->find_first("table");
    EXPECT_EQ(child_tags(*doc, table), (std::vector<std::string>{"tr", "tr"}));
    NodeId first_row = doc->node(table).children[0];
    EXPECT_EQ(child_tags(*doc, first_row), (std::vector<std::string>{"td", "td"}));
}

// ============================================================================
// Void elements, text and comments
// ============================================================================

TEST(HtmlParser, VoidElementsTakeNoChildren) {
    auto doc = html::parse("<p>a<br>b<img src=x.png>c</p>");
    NodeId p = doc->find_first("p");
    EXPECT_EQ(child_tags(*doc, p), (std::vector<std::string>{"br", "img"}));
    EXPECT_TRUE(doc->node(doc->find_first("br")).children.empty());
    EXPECT_EQ(doc->node(p).children.size(), 5u);
}

TEST(HtmlParser, SelfClosingNonVoidIsIgnoredWithWarning) {
    core::DiagnosticEmitter emitter;
    auto doc = html::parse("<div/>inside", core::DiagnosticScope(&emitter, "parse"));
    NodeId div = doc->find_first("div");
    EXPECT_EQ(doc->text_content(div), "inside");
    auto warnings = emitter.events_by_severity(core::Severity::Warning);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].module, "html.tree_builder");
}

TEST(HtmlParser, AdjacentTextIsCoalesced) {
    auto doc = html::parse("<p>a<!-- c -->b &amp; c</p>");
    NodeId p = doc->find_first("p");
    const auto& children = doc->node(p).children;
    ASSERT_EQ(children.size(), 3u);
    EXPECT_EQ(doc->node(children[0]).data, "a");
    EXPECT_EQ(doc->node(children[1]).type, dom::NodeType::Comment);
    EXPECT_EQ(doc->node(children[2]).data, "b & c");

    auto merged = html::parse("<p>x</nothing>y</p>");
    NodeId p2 = merged->find_first("p");
    ASSERT_EQ(merged->node(p2).children.size(), 1u);
    EXPECT_EQ(merged->node(merged->node(p2).children[0]).data, "xy");
}

TEST(HtmlParser, AttributesAreCopied) {
    auto doc = html::parse(R"(<a href="/x" class="c d">link</a>)");
    const auto& a = doc->node(doc->find_first("a"));
    ASSERT_NE(a.attribute("href"), nullptr);
    EXPECT_EQ(*a.attribute("href"), "/x");
    EXPECT_EQ(a.class_list(), (std::vector<std::string>{"c", "d"}));
}

TEST(HtmlParser, ScriptAndStyleKeepRawText) {
    auto doc = html::parse("<style>p > a { color: red }</style><script>a<b</script>");
    EXPECT_EQ(doc->text_content(doc->find_first("style")), "p > a { color: red }");
    EXPECT_EQ(doc->text_content(doc->find_first("script")), "a<b");
}

// ============================================================================
// Error recovery
// ============================================================================

TEST(HtmlParser, UnmatchedEndTagIsDroppedWithWarning) {
    core::DiagnosticEmitter emitter;
    auto doc = html::parse("<div>a</span>b</div>", core::DiagnosticScope(&emitter, "parse", 2));
    EXPECT_EQ(doc->text_content(doc->find_first("div")), "ab");

    auto warnings = emitter.events_by_severity(core::Severity::Warning);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].module, "html.tree_builder");
    EXPECT_EQ(warnings[0].correlation_id, 2u);
    EXPECT_NE(warnings[0].message.find("</span>"), std::string::npos);
}

TEST(HtmlParser, EndTagClosesThroughNestedElements) {
    auto doc = html::parse("<div><span><b>x</div>after");
    EXPECT_EQ(child_tags(*doc, doc->root()), (std::vector<std::string>{"div"}));
    EXPECT_EQ(doc->node(doc->root()).children.size(), 2u);
}

TEST(HtmlParser, UnclosedElementsAreReportedAtEof) {
    core::DiagnosticEmitter emitter;
    html::parse("<div><p>open", core::DiagnosticScope(&emitter, "parse"));
    auto infos = emitter.events_by_severity(core::Severity::Info);
    ASSERT_EQ(infos.size(), 1u);
    EXPECT_NE(infos[0].message.find("2 element(s) left open"), std::string::npos);
}

TEST(HtmlParser, TreeBuilderStackIsEmptyAfterEof) {
    dom::Document doc;
    html::TreeBuilder builder(doc);
    html::Tokenizer tokenizer("<div><ul><li>x");
    while (!builder.finished()) {
        builder.process_token(tokenizer.next_token());
        if (!builder.finished() && !builder.open_elements().empty()) {
            EXPECT_EQ(builder.current_node(), builder.open_elements().back().node);
        }
    }
    EXPECT_TRUE(builder.open_elements().empty());
    EXPECT_EQ(builder.current_node(), doc.root());
}

TEST(HtmlParser, MalformedMarkupNeverThrows) {
    const char* inputs[] = {
        "<", "</", "<>", "</>", "<!", "<!-", "<!--", "<a b=", "<a b='x", "&#", "&#x;",
        "<table><td><tr></p></table>", "<<<>>>", "<script>", "</script>",
    };
    for (const char* input : inputs) {
        EXPECT_NO_THROW({
            auto doc = html::parse(input);
            EXPECT_GE(doc->size(), 1u);
        }) << input;
    }
}
