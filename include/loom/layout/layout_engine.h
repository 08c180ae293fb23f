#pragma once
#include <loom/core/diagnostics.h>
#include <loom/dom/document.h>
#include <loom/layout/box.h>
#include <loom/layout/font_metrics.h>
#include <memory>

namespace loom::layout {

// Turns a styled document into a box tree. The engine holds no per-run
// state, so one instance may lay out several documents concurrently.
class LayoutEngine {
public:
    explicit LayoutEngine(std::shared_ptr<const FontMetrics> metrics,
                          core::DiagnosticScope diagnostics = core::DiagnosticScope(nullptr, "layout"));

    // The root is a Block box for the Document node spanning the viewport.
    // Identical inputs produce identical trees.
    std::unique_ptr<Box> layout(const dom::Document& document, float viewport_width) const;

    const FontMetrics& metrics() const { return *metrics_; }

private:
    std::shared_ptr<const FontMetrics> metrics_;
    core::DiagnosticScope diagnostics_;
};

} // namespace loom::layout
