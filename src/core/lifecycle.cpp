#include <loom/core/lifecycle.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace loom::core {

const char* lifecycle_stage_name(LifecycleStage stage) {
    switch (stage) {
        case LifecycleStage::Idle:       return "idle";
        case LifecycleStage::Fetching:   return "fetching";
        case LifecycleStage::Parsing:    return "parsing";
        case LifecycleStage::Styling:    return "styling";
        case LifecycleStage::Layout:     return "layout";
        case LifecycleStage::Complete:   return "complete";
        case LifecycleStage::Error:      return "error";
        case LifecycleStage::Superseded: return "superseded";
    }
    return "unknown";
}

void LifecycleTrace::record(LifecycleStage stage) {
    const auto now = std::chrono::steady_clock::now();
    double elapsed_ms = 0.0;
    if (!entries.empty()) {
        elapsed_ms = std::chrono::duration<double, std::milli>(now - entries.back().entered_at).count();
    }
    entries.push_back({stage, now, elapsed_ms});
}

LifecycleStage LifecycleTrace::last_stage() const {
    return entries.empty() ? LifecycleStage::Idle : entries.back().stage;
}

bool LifecycleTrace::reached(LifecycleStage stage) const {
    return std::any_of(entries.begin(), entries.end(),
        [stage](const StageTimingEntry& e) { return e.stage == stage; });
}

std::string LifecycleTrace::summary() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) {
            oss << " > ";
        }
        oss << lifecycle_stage_name(entries[i].stage);
        // Time spent in a stage is known once the next stage is entered.
        if (i + 1 < entries.size()) {
            oss << "(" << entries[i + 1].elapsed_since_prev_ms << "ms)";
        }
    }
    return oss.str();
}

} // namespace loom::core
