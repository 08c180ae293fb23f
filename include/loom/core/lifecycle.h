#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace loom::core {

enum class LifecycleStage {
    Idle,
    Fetching,
    Parsing,
    Styling,
    Layout,
    Complete,
    Error,
    Superseded,
};

const char* lifecycle_stage_name(LifecycleStage stage);

struct StageTimingEntry {
    LifecycleStage stage;
    std::chrono::steady_clock::time_point entered_at;
    double elapsed_since_prev_ms = 0.0;
};

struct LifecycleTrace {
    std::vector<StageTimingEntry> entries;

    void record(LifecycleStage stage);

    LifecycleStage last_stage() const;
    bool reached(LifecycleStage stage) const;

    // e.g. "fetching(0.1ms) > parsing(0.3ms) > styling(0.2ms)"
    std::string summary() const;
};

} // namespace loom::core
