#pragma once

#include <loom/core/config.h>
#include <loom/core/diagnostics.h>
#include <loom/core/lifecycle.h>
#include <loom/css/parser/stylesheet.h>
#include <loom/dom/document.h>
#include <loom/engine/fetcher.h>
#include <loom/layout/box.h>
#include <loom/layout/font_metrics.h>
#include <loom/paint/display_list.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace loom::engine {

// Everything the presentation side needs for one navigation at one width.
// Published frames are immutable.
struct Frame {
    std::uint64_t generation = 0;
    float viewport_width = 0;
    std::string url;
    std::shared_ptr<const dom::Document> document;
    std::shared_ptr<const layout::Box> root;
    paint::DisplayList display_list;
};

struct PipelineRequest {
    std::string url;
    std::uint64_t generation = 0;
    float viewport_width = static_cast<float>(core::config::kDefaultViewportWidth);
};

struct PipelineResult {
    bool ok = false;
    std::string message;
    std::shared_ptr<const Frame> frame;
    core::LifecycleTrace trace;
};

enum class ContentKind {
    Html,
    PlainText,
    Unsupported,
};

// Media type without parameters decides: text/html, application/xhtml+xml
// and empty are HTML, text/plain is plain text.
ContentKind classify_content_type(const std::string& content_type);

// Builds the document for a fetched page, or returns null and sets err for
// unsupported content.
std::unique_ptr<dom::Document> build_document(const FetchResponse& response,
                                              const core::DiagnosticScope& diagnostics,
                                              std::uint64_t generation, std::string& err);

// Author stylesheets of a document: <link rel=stylesheet> sheets fetched
// through the fetcher first, then <style> elements, each in document order.
// A failed fetch is reported and skipped.
std::vector<css::StyleSheet> collect_author_stylesheets(const dom::Document& document,
                                                        Fetcher& fetcher,
                                                        const core::DiagnosticScope& diagnostics);

// fetch -> parse -> style -> layout -> display list, as one unit on the
// calling thread.
PipelineResult run_pipeline(const PipelineRequest& request, Fetcher& fetcher,
                            std::shared_ptr<const layout::FontMetrics> metrics,
                            core::DiagnosticEmitter* diagnostics);

// Lays out an already styled document at a new width without fetching or
// restyling.
PipelineResult relayout(std::shared_ptr<const dom::Document> document, const std::string& url,
                        std::uint64_t generation, float viewport_width,
                        std::shared_ptr<const layout::FontMetrics> metrics,
                        core::DiagnosticEmitter* diagnostics);

}  // namespace loom::engine
