#include "cli.h"

#include <CLI/CLI.hpp>

#include <map>
#include <string>

namespace fxlog {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "fxlog-demo - nested progress bars interleaved with log output" };
  app.allow_windows_style_options(false);

  cli_args::demo_cfg cfg{};

  std::string output;
  auto *output_option{
    app.add_option("-o,--output", output, "Write log lines to this file instead of stderr")
  };

  app.add_flag("--async", cfg.async, "Redraw progress bars from a background thread");

  int interval_ms{ static_cast<int>(cfg.interval.count()) };
  app.add_option("--interval", interval_ms, "Async redraw interval in milliseconds")
      ->check(CLI::Range(1, 10000));

  int delay_ms{ static_cast<int>(cfg.delay.count()) };
  app.add_option("--delay", delay_ms, "Simulated work per item in milliseconds")
      ->check(CLI::Range(0, 10000));

  app.add_option("--items", cfg.items, "Items in the outermost loop")
      ->check(CLI::Range(1, 100000));
  app.add_option("--nested", cfg.nested, "Depth of nested progress bars below the outer one")
      ->check(CLI::Range(0, 8));

  bool decorated{ false };
  app.add_flag("--decorated", decorated, "Prefix log lines with timestamp and process id");

  std::map<std::string, log_level> const levels{ { "debug", log_level::LOG_DEBUG },
                                                 { "info", log_level::LOG_INFO },
                                                 { "warning", log_level::LOG_WARNING },
                                                 { "error", log_level::LOG_ERROR } };
  log_level verbosity{ log_level::LOG_INFO };
  app.add_option("--verbosity", verbosity, "Lowest level rendered")
      ->transform(CLI::CheckedTransformer(levels, CLI::ignore_case));

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
    return args;
  } catch (CLI::ParseError const &e) {
    args.cli_output = std::string(e.what());
    return args;
  }

  if (output_option->count() > 0) { cfg.output = std::filesystem::path{ output }; }
  cfg.interval = std::chrono::milliseconds{ interval_ms };
  cfg.delay = std::chrono::milliseconds{ delay_ms };

  args.verbosity = verbosity;
  args.decorated_logging = decorated;
  args.cfg = cfg;
  return args;
}

}  // namespace fxlog
