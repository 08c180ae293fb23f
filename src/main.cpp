#include <loom/core/config.h>
#include <loom/core/diagnostics.h>
#include <loom/engine/fetcher.h>
#include <loom/engine/navigator.h>
#include <loom/layout/font_metrics.h>
#include <loom/platform/event_loop.h>

#include <charconv>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace {

enum class DumpMode {
  Boxes,
  Dom,
  Styles,
  DisplayList,
};

void print_usage(std::ostream& stream) {
  stream << "usage: " << loom::core::config::kProgramName
         << " <path-or-file-url> [--width=N] [--dump=boxes|dom|styles|display-list]\n"
         << "environment:\n"
         << "  " << loom::core::config::kTimingModeEnv
         << "=1     stop after the first layout and print the stage timings\n"
         << "  " << loom::core::config::kLogLevelEnv
         << "=LEVEL  minimum diagnostic severity (info, warning, error)\n";
}

bool is_help_flag(std::string_view text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_positive_int(std::string_view text, int& value) {
  if (text.empty()) {
    return false;
  }

  int parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const std::from_chars_result result = std::from_chars(begin, end, parsed);
  if (result.ec != std::errc() || result.ptr != end || parsed <= 0) {
    return false;
  }

  value = parsed;
  return true;
}

bool parse_dump_mode(std::string_view text, DumpMode& mode) {
  if (text == "boxes") {
    mode = DumpMode::Boxes;
  } else if (text == "dom") {
    mode = DumpMode::Dom;
  } else if (text == "styles") {
    mode = DumpMode::Styles;
  } else if (text == "display-list") {
    mode = DumpMode::DisplayList;
  } else {
    return false;
  }
  return true;
}

std::string render_dump(const loom::engine::Frame& frame, DumpMode mode) {
  switch (mode) {
    case DumpMode::Boxes:
      return loom::layout::dump_box_tree(*frame.root, *frame.document);
    case DumpMode::Dom:
      return frame.document->dump(false);
    case DumpMode::Styles:
      return frame.document->dump(true);
    case DumpMode::DisplayList:
      return frame.display_list.dump();
  }
  return {};
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 2 && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return 0;
  }
  if (argc == 2 && is_version_flag(argv[1])) {
    std::cout << loom::core::config::kVersionString << "\n";
    return 0;
  }

  std::string url;
  int width = static_cast<int>(loom::core::config::kDefaultViewportWidth);
  DumpMode dump_mode = DumpMode::Boxes;

  for (int index = 1; index < argc; ++index) {
    const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
    if (starts_with(argument, "--width=")) {
      if (!parse_positive_int(argument.substr(8), width)) {
        std::cerr << "Invalid --width: '" << argument << "' (expected a positive integer)\n";
        print_usage(std::cerr);
        return 1;
      }
      continue;
    }
    if (starts_with(argument, "--dump=")) {
      if (!parse_dump_mode(argument.substr(7), dump_mode)) {
        std::cerr << "Invalid --dump: '" << argument << "'\n";
        print_usage(std::cerr);
        return 1;
      }
      continue;
    }
    if (starts_with(argument, "--")) {
      std::cerr << "Unknown option: '" << argument << "'\n";
      print_usage(std::cerr);
      return 1;
    }
    if (!url.empty()) {
      print_usage(std::cerr);
      return 1;
    }
    url = std::string(argument);
  }

  if (url.empty()) {
    print_usage(std::cerr);
    return 1;
  }

  const loom::core::config::RuntimeConfig config = loom::core::config::load_runtime_config();

  loom::core::DiagnosticEmitter diagnostics;
  diagnostics.set_min_severity(config.min_severity);
  diagnostics.add_observer([](const loom::core::DiagnosticEvent& event) {
    std::cerr << loom::core::format_diagnostic(event) << "\n";
  });

  loom::platform::EventLoop loop;
  loom::engine::Navigator navigator(loop, std::make_shared<loom::engine::FileFetcher>(),
                                    std::make_shared<loom::layout::FixedFontMetrics>(),
                                    &diagnostics, static_cast<float>(width), config);

  int exit_code = 0;
  navigator.on_layout_complete([&](const loom::engine::Frame& frame) {
    std::cout << render_dump(frame, dump_mode);
    if (config.exit_after_first_layout) {
      std::cout << "timing: " << navigator.last_trace().summary() << "\n";
    }
    loop.quit();
  });
  navigator.on_navigation_failed([&](const loom::engine::PipelineResult& result) {
    std::cerr << result.message << "\n";
    exit_code = 1;
    loop.quit();
  });

  navigator.navigate(url);
  loop.run();
  return exit_code;
}
