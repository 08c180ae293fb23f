#include <loom/engine/navigator.h>

#include <exception>
#include <stdexcept>
#include <utility>

namespace loom::engine {
namespace {

constexpr const char* kModule = "engine.navigator";

}  // namespace

Navigator::Navigator(platform::EventLoop& loop, std::shared_ptr<Fetcher> fetcher,
                     std::shared_ptr<const layout::FontMetrics> metrics,
                     core::DiagnosticEmitter* diagnostics, float viewport_width,
                     core::config::RuntimeConfig config)
    : loop_(loop),
      fetcher_(std::move(fetcher)),
      metrics_(std::move(metrics)),
      diagnostics_(diagnostics),
      config_(config),
      viewport_width_(viewport_width),
      alive_(std::make_shared<std::atomic<bool>>(true)) {
    if (!fetcher_ || !metrics_) {
        throw std::invalid_argument("Navigator requires a fetcher and font metrics");
    }
    worker_ = std::jthread([this]() { worker_loop(); });
}

Navigator::~Navigator() {
    alive_->store(false);
    requests_.close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::uint64_t Navigator::navigate(const std::string& url) {
    if (halted_) {
        core::DiagnosticScope(diagnostics_, "navigate", latest_generation_.load())
            .warning(kModule, "Ignoring navigation to " + url + " after first layout");
        return 0;
    }

    const std::uint64_t generation = latest_generation_.load() + 1;
    latest_generation_.store(generation);
    in_flight_ = true;
    core::DiagnosticScope(diagnostics_, "navigate", generation)
        .info(kModule, "Navigate to " + url);

    WorkItem item;
    item.kind = WorkItem::Kind::Navigate;
    item.request.url = url;
    item.request.generation = generation;
    item.request.viewport_width = viewport_width_;
    send(std::move(item));
    return generation;
}

void Navigator::resize(float width) {
    if (width == viewport_width_) {
        return;
    }
    viewport_width_ = width;
    if (halted_ || in_flight_) {
        // The in-flight request is checked against the width on arrival.
        return;
    }
    request_relayout();
}

void Navigator::request_relayout() {
    std::shared_ptr<const Frame> frame = current_frame();
    if (!frame) {
        return;
    }

    const std::uint64_t generation = latest_generation_.load() + 1;
    latest_generation_.store(generation);
    in_flight_ = true;
    core::DiagnosticScope(diagnostics_, "resize", generation)
        .info(kModule, "Relayout of " + frame->url + " at width " +
                           std::to_string(static_cast<int>(viewport_width_)));

    WorkItem item;
    item.kind = WorkItem::Kind::Relayout;
    item.request.url = frame->url;
    item.request.generation = generation;
    item.request.viewport_width = viewport_width_;
    item.document = frame->document;
    send(std::move(item));
}

void Navigator::send(WorkItem item) {
    requests_.send(std::move(item));
}

std::shared_ptr<const Frame> Navigator::current_frame() const {
    std::lock_guard lock(frame_mutex_);
    return current_;
}

void Navigator::worker_loop() {
    while (auto item = requests_.receive()) {
        // Only the newest queued request is worth running.
        while (auto newer = requests_.try_receive()) {
            core::DiagnosticScope(diagnostics_, "worker", item->request.generation)
                .info(kModule, "Skipping stale request for " + item->request.url);
            skipped_requests_.fetch_add(1);
            item = std::move(newer);
        }

        PipelineResult result;
        try {
            switch (item->kind) {
                case WorkItem::Kind::Navigate:
                    result = run_pipeline(item->request, *fetcher_, metrics_, diagnostics_);
                    break;
                case WorkItem::Kind::Relayout:
                    result = relayout(item->document, item->request.url, item->request.generation,
                                      item->request.viewport_width, metrics_, diagnostics_);
                    break;
            }
        } catch (const std::exception& error) {
            // Anything the pipeline did not turn into a result ends this
            // request only; the worker keeps serving.
            result = PipelineResult{};
            result.trace.record(core::LifecycleStage::Error);
            result.message = "Navigation aborted: " + item->request.url + ": " + error.what();
        }

        const std::uint64_t generation = item->request.generation;
        loop_.post_task([this, alive = alive_, generation, result = std::move(result)]() mutable {
            if (!alive->load()) {
                return;
            }
            complete(generation, std::move(result));
        });
    }
}

void Navigator::complete(std::uint64_t generation, PipelineResult result) {
    core::DiagnosticScope diagnostics(diagnostics_, "complete", generation);
    if (generation != latest_generation_.load()) {
        ++discarded_completions_;
        result.trace.record(core::LifecycleStage::Superseded);
        diagnostics.info(kModule, "Discarding generation " + std::to_string(generation) +
                                      ", latest is " + std::to_string(latest_generation_.load()));
        return;
    }

    in_flight_ = false;
    last_trace_ = result.trace;
    diagnostics.info(kModule, "Trace: " + result.trace.summary());

    if (!result.ok) {
        diagnostics.error(kModule, result.message);
        if (navigation_failed_) {
            navigation_failed_(result);
        }
        return;
    }

    {
        std::lock_guard lock(frame_mutex_);
        current_ = result.frame;
    }
    if (layout_complete_) {
        layout_complete_(*result.frame);
    }

    if (config_.exit_after_first_layout) {
        halted_ = true;
        diagnostics.info(kModule, "First layout complete, halting");
        loop_.quit();
        return;
    }

    // The callback may already have started a newer request.
    if (!in_flight_ && result.frame->viewport_width != viewport_width_) {
        request_relayout();
    }
}

}  // namespace loom::engine
