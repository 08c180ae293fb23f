#include <loom/css/parser/stylesheet.h>
#include <loom/css/style/style_resolver.h>
#include <loom/css/style/user_agent_stylesheet.h>
#include <loom/html/tree_builder.h>
#include <loom/layout/layout_engine.h>
#include <loom/paint/display_list.h>
#include <gtest/gtest.h>
#include <memory>
#include <string>

using namespace loom;
using paint::DisplayList;
using paint::PaintCommand;

// Parses, styles and lays out `html` at 800px, then paints it.
static DisplayList paint_page(const std::string& html, const std::string& css = "") {
    auto doc = html::parse(html);
    css::StyleResolver resolver;
    resolver.add_stylesheet(css::user_agent_stylesheet(), css::Origin::UserAgent);
    resolver.add_stylesheet(css::parse_stylesheet(css));
    resolver.resolve_document(*doc);
    layout::LayoutEngine engine(std::make_shared<layout::FixedFontMetrics>());
    auto root = engine.layout(*doc, 800);
    return paint::build_display_list(*root, *doc);
}

// ============================================================================
// DisplayList recording
// ============================================================================

TEST(DisplayList, RecordsCommandsInOrder) {
    DisplayList list;
    EXPECT_TRUE(list.empty());
    list.fill_rect({0, 0, 10, 10}, css::Color::white(), 1);
    list.draw_text("hi", {0, 0, 16, 16}, 12.8f, layout::FontSpec{}, css::Color::black(), 2);
    list.draw_image({0, 0, 5, 5}, "a.png", 3);
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list.commands()[0].type, PaintCommand::FillRect);
    EXPECT_EQ(list.commands()[1].text, "hi");
    EXPECT_EQ(list.commands()[2].source, "a.png");
    EXPECT_EQ(list.commands()[2].node, 3u);

    list.add_link({0, 0, 1, 1}, "/x");
    list.clear();
    EXPECT_TRUE(list.empty());
    EXPECT_TRUE(list.links().empty());
}

TEST(DisplayList, BorderKeepsPerSideWidthsAndColors) {
    DisplayList list;
    layout::EdgeSizes widths{1, 2, 3, 4};
    layout::BorderColors colors{css::Color::black(), css::Color::white(),
                                css::Color::black(), css::Color::white()};
    list.draw_border({0, 0, 20, 20}, widths, colors, 7);
    const auto& cmd = list.commands()[0];
    EXPECT_FLOAT_EQ(cmd.border_widths[1], 2.0f);
    EXPECT_FLOAT_EQ(cmd.border_widths[3], 4.0f);
    EXPECT_EQ(cmd.border_colors[1], css::Color::white());
}

TEST(DisplayList, CommandNames) {
    EXPECT_STREQ(paint::paint_command_name(PaintCommand::FillRect), "FillRect");
    EXPECT_STREQ(paint::paint_command_name(PaintCommand::DrawBorder), "DrawBorder");
    EXPECT_STREQ(paint::paint_command_name(PaintCommand::DrawText), "DrawText");
    EXPECT_STREQ(paint::paint_command_name(PaintCommand::DrawImage), "DrawImage");
}

// ============================================================================
// Painting a box tree
// ============================================================================

TEST(BuildDisplayList, EmptyDocumentPaintsNothing) {
    auto list = paint_page("");
    EXPECT_TRUE(list.empty());
}

TEST(BuildDisplayList, BackgroundThenBorderThenText) {
    auto list = paint_page(R"(<div style="background: yellow; border: 1px solid black">hi</div>)");
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list.commands()[0].type, PaintCommand::FillRect);
    EXPECT_EQ(list.commands()[0].color, (css::Color{255, 255, 0, 255}));
    EXPECT_EQ(list.commands()[1].type, PaintCommand::DrawBorder);
    EXPECT_EQ(list.commands()[2].type, PaintCommand::DrawText);
    EXPECT_EQ(list.commands()[2].text, "hi");
}

TEST(BuildDisplayList, ParentBackgroundPaintsBeforeChildren) {
    auto list = paint_page(
        R"(<div style="background: red"><p style="background: blue; margin: 0">x</p></div>)");
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list.commands()[0].color, (css::Color{255, 0, 0, 255}));
    EXPECT_EQ(list.commands()[1].color, (css::Color{0, 0, 255, 255}));
    EXPECT_EQ(list.commands()[2].type, PaintCommand::DrawText);
}

TEST(BuildDisplayList, ZeroSizeAndTransparentBackgroundsAreSkipped) {
    auto list = paint_page(R"(<div style="background: red"></div><div style="background: transparent">x</div>)");
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list.commands()[0].type, PaintCommand::DrawText);
}

TEST(BuildDisplayList, TextCarriesFontColorAndBaseline) {
    auto list = paint_page(R"(<p style="margin: 0; color: #102030"><b>bold</b></p>)");
    ASSERT_EQ(list.size(), 1u);
    const auto& cmd = list.commands()[0];
    EXPECT_TRUE(cmd.font.bold);
    EXPECT_EQ(cmd.color, (css::Color{0x10, 0x20, 0x30, 255}));
    EXPECT_FLOAT_EQ(cmd.baseline, 12.8f);
}

TEST(BuildDisplayList, ImagesAndLinks) {
    auto list = paint_page(
        R"(<p style="margin: 0"><a href="next.html">go <img src="a.png" width="10" height="10"></a> stop</p>)");
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list.commands()[1].type, PaintCommand::DrawImage);
    EXPECT_EQ(list.commands()[1].source, "a.png");

    ASSERT_EQ(list.links().size(), 2u);
    EXPECT_EQ(list.links()[0].href, "next.html");
    EXPECT_EQ(list.links()[1].bounds, list.commands()[1].bounds);
}

TEST(BuildDisplayList, DumpFormat) {
    auto list = paint_page(R"(<div style="width: 100px; background: #ff0000">ab</div>)");
    EXPECT_EQ(list.dump(),
              "FillRect [0,0 100x19.2] #ff0000\n"
              "DrawText [0,0 16x16] serif 16px #000000 \"ab\"\n");
}
