#pragma once

#include <loom/core/config.h>
#include <loom/core/diagnostics.h>
#include <loom/core/lifecycle.h>
#include <loom/engine/fetcher.h>
#include <loom/engine/pipeline.h>
#include <loom/layout/font_metrics.h>
#include <loom/platform/channel.h>
#include <loom/platform/event_loop.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace loom::engine {

// Runs navigations on a background worker and publishes their frames on the
// interactive thread. navigate(), resize() and the callbacks belong to the
// thread running the event loop; current_frame() may be read from any thread.
class Navigator {
public:
    using FrameCallback = std::function<void(const Frame&)>;
    using FailureCallback = std::function<void(const PipelineResult&)>;

    Navigator(platform::EventLoop& loop, std::shared_ptr<Fetcher> fetcher,
              std::shared_ptr<const layout::FontMetrics> metrics,
              core::DiagnosticEmitter* diagnostics,
              float viewport_width = static_cast<float>(core::config::kDefaultViewportWidth),
              core::config::RuntimeConfig config = {});
    ~Navigator();

    Navigator(const Navigator&) = delete;
    Navigator& operator=(const Navigator&) = delete;

    // Starts a navigation and returns its generation. Earlier navigations
    // that have not completed are superseded. Returns 0 once halted.
    std::uint64_t navigate(const std::string& url);

    // Changes the viewport width. The current document is laid out again
    // under a new generation unless a navigation is in flight, which then
    // picks up the new width.
    void resize(float width);

    // Fired on the interactive thread for every accepted frame.
    void on_layout_complete(FrameCallback callback) { layout_complete_ = std::move(callback); }
    void on_navigation_failed(FailureCallback callback) { navigation_failed_ = std::move(callback); }

    std::shared_ptr<const Frame> current_frame() const;

    std::uint64_t latest_generation() const { return latest_generation_.load(); }
    float viewport_width() const { return viewport_width_; }
    bool in_flight() const { return in_flight_; }
    // Set after the first accepted layout when exit_after_first_layout is on.
    bool halted() const { return halted_; }

    const core::LifecycleTrace& last_trace() const { return last_trace_; }

    // Queued requests the worker skipped for a newer one.
    std::size_t skipped_requests() const { return skipped_requests_.load(); }
    // Completions dropped on arrival because a newer generation exists.
    std::size_t discarded_completions() const { return discarded_completions_; }

private:
    struct WorkItem {
        enum class Kind { Navigate, Relayout };
        Kind kind = Kind::Navigate;
        PipelineRequest request;
        std::shared_ptr<const dom::Document> document;  // Relayout only
    };

    void worker_loop();
    void send(WorkItem item);
    void complete(std::uint64_t generation, PipelineResult result);
    void request_relayout();

    platform::EventLoop& loop_;
    std::shared_ptr<Fetcher> fetcher_;
    std::shared_ptr<const layout::FontMetrics> metrics_;
    core::DiagnosticEmitter* diagnostics_;
    core::config::RuntimeConfig config_;

    float viewport_width_;
    std::atomic<std::uint64_t> latest_generation_{0};
    bool in_flight_ = false;
    bool halted_ = false;
    core::LifecycleTrace last_trace_;
    std::atomic<std::size_t> skipped_requests_{0};
    std::size_t discarded_completions_ = 0;

    FrameCallback layout_complete_;
    FailureCallback navigation_failed_;

    mutable std::mutex frame_mutex_;
    std::shared_ptr<const Frame> current_;

    // Cleared on destruction so completions still queued on the loop are
    // ignored.
    std::shared_ptr<std::atomic<bool>> alive_;

    platform::Channel<WorkItem> requests_;
    std::jthread worker_;
};

}  // namespace loom::engine
