#include <loom/engine/pipeline.h>

#include <loom/css/style/style_resolver.h>
#include <loom/css/style/user_agent_stylesheet.h>
#include <loom/html/tree_builder.h>
#include <loom/layout/layout_engine.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace loom::engine {
namespace {

constexpr const char* kModule = "engine.pipeline";

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool has_stylesheet_rel(const std::string& rel) {
    std::istringstream tokens(to_lower(rel));
    std::string token;
    while (tokens >> token) {
        if (token == "stylesheet") {
            return true;
        }
    }
    return false;
}

void transition_to(PipelineResult& result, const core::DiagnosticScope& diagnostics,
                   core::LifecycleStage stage, const std::string& detail = {}) {
    result.trace.record(stage);
    std::string message = std::string("Stage transition: ") + core::lifecycle_stage_name(stage);
    if (!detail.empty()) {
        message += " (" + detail + ")";
    }
    if (stage == core::LifecycleStage::Error) {
        diagnostics.error(kModule, message);
    } else {
        diagnostics.info(kModule, message);
    }
}

PipelineResult fail(PipelineResult result, const core::DiagnosticScope& diagnostics,
                    const std::string& message) {
    transition_to(result, diagnostics, core::LifecycleStage::Error, message);
    result.ok = false;
    result.message = message;
    return result;
}

// Layout, validation and display list for a styled document; shared by
// navigation and resize.
bool lay_out_frame(PipelineResult& result, std::shared_ptr<const dom::Document> document,
                   const std::string& url, std::uint64_t generation, float viewport_width,
                   std::shared_ptr<const layout::FontMetrics> metrics,
                   const core::DiagnosticScope& diagnostics) {
    transition_to(result, diagnostics, core::LifecycleStage::Layout);
    try {
        layout::LayoutEngine engine(std::move(metrics), diagnostics.with_stage("layout"));
        std::unique_ptr<layout::Box> root = engine.layout(*document, viewport_width);
        layout::validate_box_tree(*root, *document);

        auto frame = std::make_shared<Frame>();
        frame->generation = generation;
        frame->viewport_width = viewport_width;
        frame->url = url;
        frame->display_list = paint::build_display_list(*root, *document);
        frame->document = std::move(document);
        frame->root = std::move(root);
        result.frame = std::move(frame);
    } catch (const std::logic_error& violation) {
        result = fail(std::move(result), diagnostics,
                      std::string("Invariant violation: ") + violation.what());
        return false;
    } catch (const std::runtime_error& error) {
        result = fail(std::move(result), diagnostics, std::string("Layout failed: ") + error.what());
        return false;
    }

    transition_to(result, diagnostics, core::LifecycleStage::Complete);
    result.ok = true;
    return true;
}

}  // namespace

ContentKind classify_content_type(const std::string& content_type) {
    std::string media = to_lower(content_type.substr(0, content_type.find(';')));
    media.erase(0, media.find_first_not_of(" \t"));
    const std::size_t end = media.find_last_not_of(" \t");
    media.erase(end == std::string::npos ? 0 : end + 1);

    if (media.empty() || media == "text/html" || media == "application/xhtml+xml") {
        return ContentKind::Html;
    }
    if (media == "text/plain") {
        return ContentKind::PlainText;
    }
    return ContentKind::Unsupported;
}

std::unique_ptr<dom::Document> build_document(const FetchResponse& response,
                                              const core::DiagnosticScope& diagnostics,
                                              std::uint64_t generation, std::string& err) {
    std::unique_ptr<dom::Document> document;
    switch (classify_content_type(response.content_type)) {
        case ContentKind::Html:
            document = html::parse(response.body, diagnostics.with_stage("parse"), generation);
            break;
        case ContentKind::PlainText: {
            document = std::make_unique<dom::Document>(generation);
            const dom::NodeId html = document->create_element("html");
            const dom::NodeId body = document->create_element("body");
            document->append_child(document->root(), html);
            document->append_child(html, body);
            document->append_child(body, document->create_text(response.body));
            break;
        }
        case ContentKind::Unsupported:
            err = "Unsupported content type: " + response.content_type;
            return nullptr;
    }
    document->set_url(response.url);
    return document;
}

std::vector<css::StyleSheet> collect_author_stylesheets(const dom::Document& document,
                                                        Fetcher& fetcher,
                                                        const core::DiagnosticScope& diagnostics) {
    std::vector<dom::NodeId> links;
    std::vector<dom::NodeId> styles;
    document.for_each_preorder(document.root(), [&](dom::NodeId id) {
        const dom::Node& node = document.node(id);
        if (!node.is_element()) {
            return;
        }
        if (node.tag_name == "link") {
            const std::string* rel = node.attribute("rel");
            if (rel && has_stylesheet_rel(*rel) && node.has_attribute("href")) {
                links.push_back(id);
            }
        } else if (node.tag_name == "style") {
            styles.push_back(id);
        }
    });

    std::vector<css::StyleSheet> sheets;
    for (dom::NodeId id : links) {
        const std::string& href = *document.node(id).attribute("href");
        FetchResponse response = fetcher.fetch(href, document.url());
        if (!response.ok) {
            diagnostics.error(kModule, "Stylesheet request failed: " + href + ": " + response.error);
            continue;
        }
        const std::string media = to_lower(response.content_type.substr(0, response.content_type.find(';')));
        if (!media.empty() && media != "text/css") {
            diagnostics.error(kModule, "Stylesheet " + href + " has content type " +
                                           response.content_type);
            continue;
        }
        sheets.push_back(css::parse_stylesheet(response.body, diagnostics.with_stage("css")));
    }
    for (dom::NodeId id : styles) {
        sheets.push_back(css::parse_stylesheet(document.text_content(id),
                                               diagnostics.with_stage("css")));
    }
    return sheets;
}

PipelineResult run_pipeline(const PipelineRequest& request, Fetcher& fetcher,
                            std::shared_ptr<const layout::FontMetrics> metrics,
                            core::DiagnosticEmitter* emitter) {
    core::DiagnosticScope diagnostics(emitter, "pipeline", request.generation);
    PipelineResult result;
    transition_to(result, diagnostics, core::LifecycleStage::Idle, request.url);

    std::unique_ptr<dom::Document> document;
    std::string page_url;
    try {
        transition_to(result, diagnostics, core::LifecycleStage::Fetching);
        FetchResponse response = fetcher.fetch(request.url, "");
        if (!response.ok) {
            std::string message = "Fetch failed: " + request.url;
            if (!response.error.empty()) {
                message += ": " + response.error;
            }
            return fail(std::move(result), diagnostics, message);
        }
        page_url = response.url.empty() ? request.url : response.url;
        response.url = page_url;

        transition_to(result, diagnostics, core::LifecycleStage::Parsing);
        std::string err;
        document = build_document(response, diagnostics, request.generation, err);
        if (!document) {
            return fail(std::move(result), diagnostics, err);
        }

        transition_to(result, diagnostics, core::LifecycleStage::Styling);
        css::StyleResolver resolver(diagnostics.with_stage("style"));
        resolver.add_stylesheet(css::user_agent_stylesheet(), css::Origin::UserAgent);
        for (auto& sheet : collect_author_stylesheets(*document, fetcher, diagnostics.with_stage("style"))) {
            resolver.add_stylesheet(std::move(sheet), css::Origin::Author);
        }
        resolver.resolve_document(*document);
    } catch (const std::logic_error& violation) {
        return fail(std::move(result), diagnostics,
                    std::string("Invariant violation: ") + violation.what());
    } catch (const std::runtime_error& error) {
        return fail(std::move(result), diagnostics,
                    std::string(core::lifecycle_stage_name(result.trace.last_stage())) +
                        " failed: " + error.what());
    }

    std::shared_ptr<const dom::Document> frozen = std::move(document);
    if (!lay_out_frame(result, std::move(frozen), page_url, request.generation,
                       request.viewport_width, std::move(metrics), diagnostics)) {
        return result;
    }
    result.message = "Rendered " + page_url;
    return result;
}

PipelineResult relayout(std::shared_ptr<const dom::Document> document, const std::string& url,
                        std::uint64_t generation, float viewport_width,
                        std::shared_ptr<const layout::FontMetrics> metrics,
                        core::DiagnosticEmitter* emitter) {
    core::DiagnosticScope diagnostics(emitter, "pipeline", generation);
    PipelineResult result;
    transition_to(result, diagnostics, core::LifecycleStage::Idle, "relayout of " + url);
    if (!document) {
        return fail(std::move(result), diagnostics, "Nothing to lay out");
    }
    if (!lay_out_frame(result, std::move(document), url, generation, viewport_width,
                       std::move(metrics), diagnostics)) {
        return result;
    }
    result.message = "Relaid out " + url;
    return result;
}

}  // namespace loom::engine
