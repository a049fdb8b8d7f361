#include "cli.h"
#include "log.h"
#include "progress.h"
#include "sink.h"
#include "text_writer.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <numeric>
#include <ranges>
#include <string>
#include <thread>
#include <vector>

namespace {

void simulate_work(fxlog::cli_args::demo_cfg const &cfg) {
  if (cfg.delay.count() > 0) { std::this_thread::sleep_for(cfg.delay); }
}

void run_stage(fxlog::context &ctx,
               fxlog::cli_args::demo_cfg const &cfg,
               std::size_t depth,
               std::size_t items) {
  std::vector<std::size_t> work(items);
  std::iota(work.begin(), work.end(), std::size_t{ 1 });

  auto const label{ "stage " + std::to_string(depth) };
  for (std::size_t const item : fxlog::progressbar(
           ctx,
           work,
           { .description = label,
             .describe = [&label](std::size_t const &i) {
               return label + " item " + std::to_string(i);
             } })) {
    simulate_work(cfg);

    if (item % 10 == 0) { fxlog::info(ctx, "%s reached item %zu", label.c_str(), item); }
    if (item % 7 == 0) {
      fxlog::debug(ctx, [label, item] {
        return label + ": item " + std::to_string(item) + " is a multiple of 7";
      });
    }
    if (depth < cfg.nested && item % 5 == 1) {
      run_stage(ctx, cfg, depth + 1, std::max<std::size_t>(items / 4, 3));
    }
  }
}

void run_scan(fxlog::context &ctx, fxlog::cli_args::demo_cfg const &cfg) {
  // Filtered ranges have no size, so this bar shows a spinner instead of a percentage.
  auto candidates{ std::views::iota(std::size_t{ 0 }, cfg.items * 3) |
                   std::views::filter([](std::size_t n) { return n % 3 != 0; }) };

  std::size_t found{ 0 };
  for (std::size_t const n : fxlog::progressbar(ctx, candidates, { .description = "scan" })) {
    simulate_work(cfg);
    if (n % 17 == 0) {
      ++found;
      fxlog::warn(ctx, "scan: candidate %zu needs attention", n);
    }
  }
  fxlog::info(ctx, "scan flagged %zu candidates", found);
}

}  // namespace

int main(int argc, char **argv) {
  auto args{ fxlog::cli_parse(argc, argv) };

  if (!args.cli_output.empty()) {
    if (!args.cfg.has_value()) {
      std::fprintf(stderr, "%s\n", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    std::fprintf(stdout, "%s\n", args.cli_output.c_str());
  }

  if (!args.cfg.has_value()) { return EXIT_FAILURE; }
  auto const &cfg{ *args.cfg };

  fxlog::context ctx;

  try {
    std::unique_ptr<fxlog::sink> destination;
    if (cfg.output) {
      destination = fxlog::file_sink::open(*cfg.output);
    } else {
      destination = std::make_unique<fxlog::file_sink>(stderr);
    }

    fxlog::text_writer writer{ ctx,
                               std::move(destination),
                               { .async = cfg.async,
                                 .refresh_interval = cfg.interval,
                                 .threshold = args.verbosity,
                                 .decorated = args.decorated_logging } };

    fxlog::info(ctx, "fxlog-demo: %zu items, %zu nested level(s), %s redraw",
                cfg.items, cfg.nested, writer.is_async() ? "async" : "sync");
    run_stage(ctx, cfg, 0, cfg.items);
    run_scan(ctx, cfg);
    fxlog::error(ctx, "fxlog-demo: simulated failure report");
    fxlog::info(ctx, "fxlog-demo: done");

    writer.close();
  } catch (std::exception const &ex) {
    std::fprintf(stderr, "fxlog-demo failed: %s\n", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
