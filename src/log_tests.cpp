#include "log.h"

#include <doctest/doctest.h>

#include <string>
#include <vector>

namespace {

struct log_recorder : fxlog::handler {
  fxlog::log_disposition on_log(fxlog::log_event const &event) override {
    events.push_back(event);
    return fxlog::log_disposition::share(event);
  }

  std::vector<fxlog::log_event> events;
};

}  // namespace

TEST_CASE("printf-style helpers emit at their level") {
  fxlog::context ctx;
  log_recorder recorder;
  auto const reg{ ctx.install(recorder) };

  fxlog::debug(ctx, "d%d", 1);
  fxlog::info(ctx, "i%s", "2");
  fxlog::warn(ctx, "w%c", '3');
  fxlog::error(ctx, "e%.1f", 4.0);

  REQUIRE(recorder.events.size() == 4);
  CHECK(recorder.events[0].level == fxlog::log_level::LOG_DEBUG);
  CHECK(recorder.events[0].message.str() == "d1");
  CHECK(recorder.events[1].level == fxlog::log_level::LOG_INFO);
  CHECK(recorder.events[1].message.str() == "i2");
  CHECK(recorder.events[2].level == fxlog::log_level::LOG_WARNING);
  CHECK(recorder.events[2].message.str() == "w3");
  CHECK(recorder.events[3].level == fxlog::log_level::LOG_ERROR);
  CHECK(recorder.events[3].message.str() == "e4.0");
}

TEST_CASE("printf-style helpers handle long messages") {
  fxlog::context ctx;
  log_recorder recorder;
  auto const reg{ ctx.install(recorder) };

  std::string const long_text(1000, 'z');
  fxlog::info(ctx, "[%s]", long_text.c_str());

  REQUIRE(recorder.events.size() == 1);
  CHECK(recorder.events[0].message.str() == "[" + long_text + "]");
}

TEST_CASE("log accepts custom levels and deferred messages") {
  fxlog::context ctx;
  log_recorder recorder;
  auto const reg{ ctx.install(recorder) };

  fxlog::log(ctx, fxlog::log_level{ 30 }, "between info and warning");

  int calls{ 0 };
  fxlog::log(ctx, fxlog::log_level::LOG_INFO, [&calls] {
    ++calls;
    return std::string{ "deferred" };
  });
  CHECK(calls == 0);

  REQUIRE(recorder.events.size() == 2);
  CHECK(recorder.events[0].level == fxlog::log_level{ 30 });
  CHECK(recorder.events[1].message.str() == "deferred");
  CHECK(calls == 1);
}

TEST_CASE("level helpers accept deferred messages") {
  fxlog::context ctx;
  log_recorder recorder;
  auto const reg{ ctx.install(recorder) };

  int calls{ 0 };
  fxlog::debug(ctx, [&calls] {
    ++calls;
    return std::string{ "lazy debug" };
  });
  fxlog::error(ctx, std::string{ "100% literal" });
  CHECK(calls == 0);

  REQUIRE(recorder.events.size() == 2);
  CHECK(recorder.events[0].level == fxlog::log_level::LOG_DEBUG);
  CHECK(recorder.events[0].message.is_deferred());
  CHECK(recorder.events[1].level == fxlog::log_level::LOG_ERROR);
  CHECK(recorder.events[1].message.str() == "100% literal");

  CHECK(recorder.events[0].message.str() == "lazy debug");
  CHECK(calls == 1);
}

TEST_CASE("log without handlers is harmless") {
  fxlog::context ctx;
  CHECK_NOTHROW(fxlog::info(ctx, "nobody listens"));
  CHECK_NOTHROW(fxlog::log(ctx, fxlog::log_level::LOG_ERROR, "still fine"));
}
