#ifndef LOOM_CORE_CONFIG_H
#define LOOM_CORE_CONFIG_H

#include <loom/core/diagnostics.h>

#include <cstdint>

namespace loom::core::config {

inline constexpr std::uint32_t kDefaultViewportWidth = 800;
inline constexpr std::uint32_t kDefaultViewportHeight = 600;
inline constexpr float kDefaultFontSize = 16.0f;
inline constexpr const char kProgramName[] = "loom";
inline constexpr const char kVersionString[] = "loom 0.1.0";

// Environment variable that halts the pipeline after the first layout pass.
inline constexpr const char kTimingModeEnv[] = "LOOM_TIMING_MODE";
// Environment variable selecting the minimum diagnostic severity.
inline constexpr const char kLogLevelEnv[] = "LOOM_LOG_LEVEL";

struct RuntimeConfig {
    bool exit_after_first_layout = false;
    Severity min_severity = Severity::Warning;
};

// Reads the runtime configuration from the process environment. Unknown
// LOOM_LOG_LEVEL values keep the default severity.
RuntimeConfig load_runtime_config();

}  // namespace loom::core::config

#endif  // LOOM_CORE_CONFIG_H
