#include <loom/core/diagnostics.h>
#include <loom/engine/pipeline.h>
#include <loom/layout/font_metrics.h>
#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace loom;
using engine::ContentKind;
using engine::FetchResponse;
using engine::PipelineRequest;
using engine::PipelineResult;

namespace {

// Serves canned responses keyed by the requested URL.
class MapFetcher : public engine::Fetcher {
public:
    void add(const std::string& url, const std::string& content_type, const std::string& body) {
        FetchResponse response;
        response.ok = true;
        response.status = 200;
        response.content_type = content_type;
        response.body = body;
        response.url = url;
        responses_[url] = response;
    }

    FetchResponse fetch(const std::string& url, const std::string& base_url) override {
        requests.push_back(url);
        bases.push_back(base_url);
        auto it = responses_.find(url);
        if (it == responses_.end()) {
            FetchResponse missing;
            missing.status = 404;
            missing.error = "no such entry";
            return missing;
        }
        return it->second;
    }

    std::vector<std::string> requests;
    std::vector<std::string> bases;

private:
    std::map<std::string, FetchResponse> responses_;
};

// Serves pages from a MapFetcher but throws for one URL.
class ThrowingFetcher : public MapFetcher {
public:
    enum class Kind { Logic, Runtime };

    ThrowingFetcher(std::string url, Kind kind) : url_(std::move(url)), kind_(kind) {}

    FetchResponse fetch(const std::string& url, const std::string& base_url) override {
        if (url == url_) {
            if (kind_ == Kind::Logic) {
                throw std::logic_error("node id 99 out of range");
            }
            throw std::runtime_error("connection reset");
        }
        return MapFetcher::fetch(url, base_url);
    }

private:
    std::string url_;
    Kind kind_;
};

PipelineResult render(MapFetcher& fetcher, const std::string& url,
                      core::DiagnosticEmitter* emitter = nullptr,
                      std::uint64_t generation = 1, float width = 800) {
    PipelineRequest request;
    request.url = url;
    request.generation = generation;
    request.viewport_width = width;
    return engine::run_pipeline(request, fetcher, std::make_shared<layout::FixedFontMetrics>(),
                                emitter);
}

std::string color_of(const PipelineResult& result, const std::string& id) {
    const dom::Document& doc = *result.frame->document;
    return doc.node(doc.get_element_by_id(id)).computed_style.get("color");
}

} // namespace

// ============================================================================
// Content types
// ============================================================================

TEST(Pipeline, ClassifyContentType) {
    EXPECT_EQ(engine::classify_content_type("text/html"), ContentKind::Html);
    EXPECT_EQ(engine::classify_content_type("Text/HTML; charset=utf-8"), ContentKind::Html);
    EXPECT_EQ(engine::classify_content_type("application/xhtml+xml"), ContentKind::Html);
    EXPECT_EQ(engine::classify_content_type(""), ContentKind::Html);
    EXPECT_EQ(engine::classify_content_type(" text/plain ;charset=ascii"), ContentKind::PlainText);
    EXPECT_EQ(engine::classify_content_type("image/png"), ContentKind::Unsupported);
    EXPECT_EQ(engine::classify_content_type("text/css"), ContentKind::Unsupported);
}

// ============================================================================
// run_pipeline
// ============================================================================

TEST(Pipeline, RendersAPage) {
    MapFetcher fetcher;
    fetcher.add("page.html", "text/html", "<title>t</title><p id=x>hello world</p>");
    core::DiagnosticEmitter emitter;

    PipelineResult result = render(fetcher, "page.html", &emitter, 7, 320);
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.message, "Rendered page.html");

    ASSERT_NE(result.frame, nullptr);
    EXPECT_EQ(result.frame->generation, 7u);
    EXPECT_FLOAT_EQ(result.frame->viewport_width, 320.0f);
    EXPECT_EQ(result.frame->url, "page.html");
    ASSERT_NE(result.frame->document, nullptr);
    EXPECT_EQ(result.frame->document->generation(), 7u);
    EXPECT_EQ(result.frame->document->url(), "page.html");
    ASSERT_NE(result.frame->root, nullptr);
    EXPECT_FALSE(result.frame->display_list.empty());

    using core::LifecycleStage;
    for (auto stage : {LifecycleStage::Idle, LifecycleStage::Fetching, LifecycleStage::Parsing,
                       LifecycleStage::Styling, LifecycleStage::Layout,
                       LifecycleStage::Complete}) {
        EXPECT_TRUE(result.trace.reached(stage)) << core::lifecycle_stage_name(stage);
    }
    EXPECT_EQ(result.trace.last_stage(), LifecycleStage::Complete);
    EXPECT_FALSE(result.trace.reached(LifecycleStage::Error));

    EXPECT_TRUE(emitter.events_by_severity(core::Severity::Error).empty());
    for (const auto& event : emitter.events()) {
        EXPECT_EQ(event.correlation_id, 7u) << event.message;
    }
}

TEST(Pipeline, FetchFailureStopsAtError) {
    MapFetcher fetcher;
    core::DiagnosticEmitter emitter;

    PipelineResult result = render(fetcher, "missing.html", &emitter);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message, "Fetch failed: missing.html: no such entry");
    EXPECT_EQ(result.frame, nullptr);
    EXPECT_EQ(result.trace.last_stage(), core::LifecycleStage::Error);
    EXPECT_FALSE(result.trace.reached(core::LifecycleStage::Parsing));

    auto errors = emitter.events_by_severity(core::Severity::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].module, "engine.pipeline");
}

TEST(Pipeline, UnsupportedContentTypeIsAnError) {
    MapFetcher fetcher;
    fetcher.add("logo.png", "image/png", "\x89PNG");

    PipelineResult result = render(fetcher, "logo.png");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message, "Unsupported content type: image/png");
    EXPECT_TRUE(result.trace.reached(core::LifecycleStage::Parsing));
    EXPECT_EQ(result.trace.last_stage(), core::LifecycleStage::Error);
}

TEST(Pipeline, PlainTextIsNotParsedAsMarkup) {
    MapFetcher fetcher;
    fetcher.add("notes.txt", "text/plain; charset=utf-8", "<b>not bold</b>");

    PipelineResult result = render(fetcher, "notes.txt");
    ASSERT_TRUE(result.ok) << result.message;
    const dom::Document& doc = *result.frame->document;
    EXPECT_EQ(doc.find_first("b"), dom::kInvalidNodeId);
    const dom::NodeId body = doc.find_first("body");
    ASSERT_NE(body, dom::kInvalidNodeId);
    EXPECT_EQ(doc.text_content(body), "<b>not bold</b>");
}

// ============================================================================
// Author stylesheets
// ============================================================================

TEST(Pipeline, LinkedSheetsComeBeforeStyleElements) {
    MapFetcher fetcher;
    fetcher.add("page.html", "text/html",
                "<style>#x { color: green }</style>"
                "<link rel=\"Alternate StyleSheet\" href=\"site.css\">"
                "<p id=x>t</p><p id=y>u</p>");
    fetcher.add("site.css", "text/css", "#x { color: red } #y { color: blue }");

    PipelineResult result = render(fetcher, "page.html");
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(color_of(result, "x"), "green");
    EXPECT_EQ(color_of(result, "y"), "blue");

    ASSERT_EQ(fetcher.requests.size(), 2u);
    EXPECT_EQ(fetcher.requests[1], "site.css");
    EXPECT_EQ(fetcher.bases[1], "page.html");
}

TEST(Pipeline, FailedStylesheetIsReportedAndSkipped) {
    MapFetcher fetcher;
    fetcher.add("page.html", "text/html",
                "<link rel=stylesheet href=gone.css>"
                "<link rel=stylesheet href=fake.css>"
                "<link rel=icon href=icon.png>"
                "<p id=x>t</p>");
    fetcher.add("fake.css", "text/html", "#x { color: red }");
    core::DiagnosticEmitter emitter;

    PipelineResult result = render(fetcher, "page.html", &emitter);
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(color_of(result, "x"), "black");

    auto errors = emitter.events_by_severity(core::Severity::Error);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0].message, "Stylesheet request failed: gone.css: no such entry");
    EXPECT_EQ(errors[1].message, "Stylesheet fake.css has content type text/html");
    EXPECT_EQ(fetcher.requests.size(), 3u);
}

TEST(Pipeline, CollectAuthorStylesheets) {
    MapFetcher fetcher;
    fetcher.add("a.css", "", "p { margin: 0 }");
    dom::Document doc;
    const dom::NodeId html = doc.create_element("html");
    doc.append_child(doc.root(), html);
    const dom::NodeId style = doc.create_element("style");
    doc.append_child(html, style);
    doc.append_child(style, doc.create_text("p { color: red } q { color: blue }"));
    const dom::NodeId link = doc.create_element("link");
    doc.node(link).attributes.push_back({"rel", "stylesheet"});
    doc.node(link).attributes.push_back({"href", "a.css"});
    doc.append_child(html, link);

    auto sheets = engine::collect_author_stylesheets(doc, fetcher, core::DiagnosticScope(nullptr, "style"));
    ASSERT_EQ(sheets.size(), 2u);
    EXPECT_EQ(sheets[0].rules.size(), 1u);
    EXPECT_EQ(sheets[1].rules.size(), 2u);
}

TEST(Pipeline, LogicErrorWhileStylingStopsTheNavigation) {
    ThrowingFetcher fetcher("site.css", ThrowingFetcher::Kind::Logic);
    fetcher.add("page.html", "text/html", "<link rel=stylesheet href=site.css><p>t</p>");
    core::DiagnosticEmitter emitter;

    PipelineResult result;
    EXPECT_NO_THROW(result = render(fetcher, "page.html", &emitter));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message, "Invariant violation: node id 99 out of range");
    EXPECT_EQ(result.frame, nullptr);
    EXPECT_TRUE(result.trace.reached(core::LifecycleStage::Styling));
    EXPECT_FALSE(result.trace.reached(core::LifecycleStage::Layout));
    EXPECT_EQ(result.trace.last_stage(), core::LifecycleStage::Error);
    EXPECT_EQ(emitter.events_by_severity(core::Severity::Error).size(), 1u);
}

TEST(Pipeline, RuntimeErrorNamesTheStage) {
    ThrowingFetcher fetcher("page.html", ThrowingFetcher::Kind::Runtime);

    PipelineResult result;
    EXPECT_NO_THROW(result = render(fetcher, "page.html"));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message, "fetching failed: connection reset");
    EXPECT_EQ(result.trace.last_stage(), core::LifecycleStage::Error);
}

// ============================================================================
// relayout
// ============================================================================

TEST(Pipeline, RelayoutReusesTheStyledDocument) {
    MapFetcher fetcher;
    fetcher.add("page.html", "text/html", "<p>some words to wrap around</p>");
    PipelineResult first = render(fetcher, "page.html", nullptr, 1, 800);
    ASSERT_TRUE(first.ok) << first.message;

    PipelineResult second =
        engine::relayout(first.frame->document, "page.html", 2, 100,
                         std::make_shared<layout::FixedFontMetrics>(), nullptr);
    ASSERT_TRUE(second.ok) << second.message;
    EXPECT_EQ(second.message, "Relaid out page.html");
    EXPECT_EQ(second.frame->generation, 2u);
    EXPECT_FLOAT_EQ(second.frame->viewport_width, 100.0f);
    EXPECT_EQ(second.frame->document, first.frame->document);
    EXPECT_FALSE(second.trace.reached(core::LifecycleStage::Fetching));
    EXPECT_GT(second.frame->root->geometry.height, first.frame->root->geometry.height);
    EXPECT_EQ(fetcher.requests.size(), 1u);
}

TEST(Pipeline, RelayoutWithoutDocumentFails) {
    PipelineResult result = engine::relayout(nullptr, "page.html", 3, 100,
                                             std::make_shared<layout::FixedFontMetrics>(), nullptr);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message, "Nothing to lay out");
    EXPECT_EQ(result.trace.last_stage(), core::LifecycleStage::Error);
}
