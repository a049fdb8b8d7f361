#pragma once

#include "event.h"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace fxlog {

struct cli_args {
  struct demo_cfg {
    std::optional<std::filesystem::path> output;  // log file instead of stderr
    bool async{ false };
    std::chrono::milliseconds interval{ 100 };
    std::chrono::milliseconds delay{ 20 };  // simulated work per item
    std::size_t items{ 40 };
    std::size_t nested{ 1 };
  };

  std::optional<demo_cfg> cfg;
  std::optional<log_level> verbosity;
  bool decorated_logging{ false };
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace fxlog
