#include <loom/core/config.h>

#include <cstdlib>
#include <string>

namespace loom::core::config {

RuntimeConfig load_runtime_config() {
    RuntimeConfig config;

    // Any value other than empty or "0" enables timing mode.
    if (const char* timing = std::getenv(kTimingModeEnv)) {
        const std::string value(timing);
        config.exit_after_first_layout = !value.empty() && value != "0";
    }

    if (const char* level = std::getenv(kLogLevelEnv)) {
        Severity parsed = config.min_severity;
        if (parse_severity(level, parsed)) {
            config.min_severity = parsed;
        }
    }

    return config;
}

}  // namespace loom::core::config
