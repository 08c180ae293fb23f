#include <loom/core/diagnostics.h>
#include <loom/engine/navigator.h>
#include <loom/layout/font_metrics.h>
#include <loom/platform/event_loop.h>
#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <new>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace loom;
using namespace std::chrono_literals;
using engine::FetchResponse;
using engine::Frame;
using engine::Navigator;

namespace {

// In-memory fetcher. Requests for the gated URL block until release().
class GatedFetcher : public engine::Fetcher {
public:
    explicit GatedFetcher(std::string gated_url = {}) : gated_url_(std::move(gated_url)) {}

    void add(const std::string& url, const std::string& body) {
        FetchResponse response;
        response.ok = true;
        response.status = 200;
        response.content_type = "text/html";
        response.body = body;
        response.url = url;
        responses_[url] = response;
    }

    bool wait_until_blocked() {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, 5s, [this]() { return blocked_; });
    }

    void release() {
        std::lock_guard lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

    std::vector<std::string> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    FetchResponse fetch(const std::string& url, const std::string&) override {
        std::unique_lock lock(mutex_);
        requests_.push_back(url);
        if (url == gated_url_ && !released_) {
            blocked_ = true;
            cv_.notify_all();
            cv_.wait(lock, [this]() { return released_; });
        }
        auto it = responses_.find(url);
        if (it == responses_.end()) {
            FetchResponse missing;
            missing.status = 404;
            missing.error = "no such entry";
            return missing;
        }
        return it->second;
    }

private:
    std::string gated_url_;
    std::map<std::string, FetchResponse> responses_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool blocked_ = false;
    bool released_ = false;
    std::vector<std::string> requests_;
};

// Fails every request with an exception outside the logic/runtime families.
class BrokenFetcher : public engine::Fetcher {
public:
    FetchResponse fetch(const std::string&, const std::string&) override {
        throw std::bad_alloc();
    }
};

struct SeenFrame {
    std::uint64_t generation;
    float width;
    std::string url;
};

std::shared_ptr<const layout::FontMetrics> metrics() {
    return std::make_shared<layout::FixedFontMetrics>();
}

} // namespace

// ============================================================================
// Navigation
// ============================================================================

TEST(Navigator, PublishesTheFrameOnTheLoopThread) {
    platform::EventLoop loop;
    auto fetcher = std::make_shared<GatedFetcher>();
    fetcher->add("a.html", "<p>first page</p>");
    core::DiagnosticEmitter emitter;
    Navigator navigator(loop, fetcher, metrics(), &emitter);

    const auto loop_thread = std::this_thread::get_id();
    std::thread::id callback_thread;
    navigator.on_layout_complete([&](const Frame& frame) {
        callback_thread = std::this_thread::get_id();
        EXPECT_EQ(frame.url, "a.html");
        loop.quit();
    });

    EXPECT_EQ(navigator.navigate("a.html"), 1u);
    EXPECT_TRUE(navigator.in_flight());
    ASSERT_TRUE(loop.run_for(5000ms));

    EXPECT_EQ(callback_thread, loop_thread);
    EXPECT_FALSE(navigator.in_flight());
    auto frame = navigator.current_frame();
    ASSERT_NE(frame, nullptr);
    EXPECT_EQ(frame->generation, 1u);
    EXPECT_EQ(navigator.last_trace().last_stage(), core::LifecycleStage::Complete);
    EXPECT_FALSE(emitter.events_by_module("engine.navigator").empty());
}

TEST(Navigator, StaleNavigationsAreSkippedAndDiscarded) {
    platform::EventLoop loop;
    auto fetcher = std::make_shared<GatedFetcher>("a.html");
    fetcher->add("a.html", "<p>a</p>");
    fetcher->add("b.html", "<p>b</p>");
    fetcher->add("c.html", "<p>c</p>");
    Navigator navigator(loop, fetcher, metrics(), nullptr);

    std::vector<SeenFrame> frames;
    navigator.on_layout_complete([&](const Frame& frame) {
        frames.push_back({frame.generation, frame.viewport_width, frame.url});
        if (frame.generation == 3) {
            loop.quit();
        }
    });

    EXPECT_EQ(navigator.navigate("a.html"), 1u);
    ASSERT_TRUE(fetcher->wait_until_blocked());
    EXPECT_EQ(navigator.navigate("b.html"), 2u);
    EXPECT_EQ(navigator.navigate("c.html"), 3u);
    EXPECT_EQ(navigator.latest_generation(), 3u);
    fetcher->release();

    ASSERT_TRUE(loop.run_for(5000ms));

    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].generation, 3u);
    EXPECT_EQ(frames[0].url, "c.html");
    EXPECT_EQ(navigator.skipped_requests(), 1u);
    EXPECT_EQ(navigator.discarded_completions(), 1u);
    EXPECT_EQ(navigator.current_frame()->url, "c.html");
    EXPECT_EQ(fetcher->requests(), (std::vector<std::string>{"a.html", "c.html"}));
}

TEST(Navigator, FailureCallbackKeepsThePreviousFrame) {
    platform::EventLoop loop;
    auto fetcher = std::make_shared<GatedFetcher>();
    fetcher->add("a.html", "<p>a</p>");
    core::DiagnosticEmitter emitter;
    Navigator navigator(loop, fetcher, metrics(), &emitter);

    navigator.on_layout_complete([&](const Frame&) { loop.quit(); });
    std::string failure;
    navigator.on_navigation_failed([&](const engine::PipelineResult& result) {
        failure = result.message;
        loop.quit();
    });

    navigator.navigate("a.html");
    ASSERT_TRUE(loop.run_for(5000ms));
    navigator.navigate("missing.html");
    ASSERT_TRUE(loop.run_for(5000ms));

    EXPECT_EQ(failure, "Fetch failed: missing.html: no such entry");
    EXPECT_FALSE(navigator.in_flight());
    EXPECT_EQ(navigator.last_trace().last_stage(), core::LifecycleStage::Error);
    ASSERT_NE(navigator.current_frame(), nullptr);
    EXPECT_EQ(navigator.current_frame()->url, "a.html");

    bool reported = false;
    for (const auto& event : emitter.events_for(2)) {
        if (event.severity == core::Severity::Error && event.module == "engine.navigator") {
            reported = true;
        }
    }
    EXPECT_TRUE(reported);
}

// ============================================================================
// Resize
// ============================================================================

TEST(Navigator, ResizeLaysOutTheCurrentDocumentAgain) {
    platform::EventLoop loop;
    auto fetcher = std::make_shared<GatedFetcher>();
    fetcher->add("a.html", "<p>words that will wrap at a narrow width</p>");
    Navigator navigator(loop, fetcher, metrics(), nullptr);

    std::vector<std::shared_ptr<const Frame>> frames;
    navigator.on_layout_complete([&](const Frame&) {
        frames.push_back(navigator.current_frame());
        if (frames.size() == 1) {
            navigator.resize(200);
        } else {
            loop.quit();
        }
    });

    navigator.navigate("a.html");
    ASSERT_TRUE(loop.run_for(5000ms));

    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0]->generation, 1u);
    EXPECT_FLOAT_EQ(frames[0]->viewport_width, 800.0f);
    EXPECT_EQ(frames[1]->generation, 2u);
    EXPECT_FLOAT_EQ(frames[1]->viewport_width, 200.0f);
    EXPECT_EQ(frames[1]->document, frames[0]->document);
    EXPECT_EQ(frames[1]->root->generation, frames[0]->document->generation());
    EXPECT_EQ(fetcher->requests().size(), 1u);
}

TEST(Navigator, ResizeDuringNavigationIsPickedUpOnArrival) {
    platform::EventLoop loop;
    auto fetcher = std::make_shared<GatedFetcher>("a.html");
    fetcher->add("a.html", "<p>a</p>");
    Navigator navigator(loop, fetcher, metrics(), nullptr);

    std::vector<SeenFrame> frames;
    navigator.on_layout_complete([&](const Frame& frame) {
        frames.push_back({frame.generation, frame.viewport_width, frame.url});
        if (frame.viewport_width == 300.0f) {
            loop.quit();
        }
    });

    navigator.navigate("a.html");
    ASSERT_TRUE(fetcher->wait_until_blocked());
    navigator.resize(300);
    EXPECT_EQ(navigator.latest_generation(), 1u);
    fetcher->release();

    ASSERT_TRUE(loop.run_for(5000ms));
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_FLOAT_EQ(frames[0].width, 800.0f);
    EXPECT_EQ(frames[1].generation, 2u);
    EXPECT_FLOAT_EQ(frames[1].width, 300.0f);
}

TEST(Navigator, ResizeWithoutAFrameOnlyRecordsTheWidth) {
    platform::EventLoop loop;
    auto fetcher = std::make_shared<GatedFetcher>();
    Navigator navigator(loop, fetcher, metrics(), nullptr, 640);

    navigator.resize(640);
    navigator.resize(320);
    EXPECT_FLOAT_EQ(navigator.viewport_width(), 320.0f);
    EXPECT_EQ(navigator.latest_generation(), 0u);
    EXPECT_FALSE(navigator.in_flight());
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST(Navigator, TimingModeHaltsAfterFirstLayout) {
    platform::EventLoop loop;
    auto fetcher = std::make_shared<GatedFetcher>();
    fetcher->add("a.html", "<p>a</p>");
    core::DiagnosticEmitter emitter;
    core::config::RuntimeConfig config;
    config.exit_after_first_layout = true;
    Navigator navigator(loop, fetcher, metrics(), &emitter, 800, config);

    int layouts = 0;
    navigator.on_layout_complete([&](const Frame&) { ++layouts; });

    navigator.navigate("a.html");
    EXPECT_TRUE(loop.run_for(5000ms));
    EXPECT_EQ(layouts, 1);
    EXPECT_TRUE(navigator.halted());

    EXPECT_EQ(navigator.navigate("a.html"), 0u);
    int ignored = 0;
    for (const auto& event : emitter.events_by_module("engine.navigator")) {
        if (event.severity == core::Severity::Warning) {
            ++ignored;
        }
    }
    EXPECT_EQ(ignored, 1);
    navigator.resize(100);
    loop.run_pending();
    EXPECT_EQ(layouts, 1);
}

TEST(Navigator, EscapedExceptionFailsOnlyThatNavigation) {
    platform::EventLoop loop;
    Navigator navigator(loop, std::make_shared<BrokenFetcher>(), metrics(), nullptr);

    std::vector<std::string> failures;
    navigator.on_navigation_failed([&](const engine::PipelineResult& result) {
        failures.push_back(result.message);
        loop.quit();
    });

    navigator.navigate("a.html");
    ASSERT_TRUE(loop.run_for(5000ms));
    navigator.navigate("b.html");
    ASSERT_TRUE(loop.run_for(5000ms));

    ASSERT_EQ(failures.size(), 2u);
    EXPECT_EQ(failures[0].rfind("Navigation aborted: a.html: ", 0), 0u);
    EXPECT_EQ(failures[1].rfind("Navigation aborted: b.html: ", 0), 0u);
    EXPECT_EQ(navigator.last_trace().last_stage(), core::LifecycleStage::Error);
    EXPECT_EQ(navigator.current_frame(), nullptr);
}

TEST(Navigator, RequiresFetcherAndMetrics) {
    platform::EventLoop loop;
    EXPECT_THROW(Navigator(loop, nullptr, metrics(), nullptr), std::invalid_argument);
    EXPECT_THROW(Navigator(loop, std::make_shared<GatedFetcher>(), nullptr, nullptr),
                 std::invalid_argument);
}

TEST(Navigator, CompletionsAfterDestructionAreIgnored) {
    platform::EventLoop loop;
    auto fetcher = std::make_shared<GatedFetcher>();
    fetcher->add("a.html", "<p>a</p>");
    bool called = false;
    {
        Navigator navigator(loop, fetcher, metrics(), nullptr);
        navigator.on_layout_complete([&](const Frame&) { called = true; });
        navigator.navigate("a.html");
    }
    EXPECT_EQ(loop.pending_count(), 1u);
    loop.run_pending();
    EXPECT_FALSE(called);
}
