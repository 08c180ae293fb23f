#pragma once
#include <loom/css/parser/stylesheet.h>
#include <string_view>

namespace loom::css {

// Default presentation for the supported HTML subset, applied at the lowest
// cascade origin.
std::string_view user_agent_stylesheet_source();

// Parsed once on first use and shared afterwards.
const StyleSheet& user_agent_stylesheet();

} // namespace loom::css
