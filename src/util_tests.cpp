#include "util.h"

#include <doctest/doctest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

namespace {

std::filesystem::path make_temp_path(char const *tag) {
  static std::atomic<int> counter{ 0 };
  auto const id = counter.fetch_add(1, std::memory_order_relaxed);
  auto base{ std::filesystem::temp_directory_path() };
  return base / ("fxlog-util-test-" + std::string(tag) + "-" + std::to_string(id));
}

}  // namespace

TEST_CASE("util_open_file returns an RAII handle") {
  auto const path{ make_temp_path("open") };
  {
    auto file{ fxlog::util_open_file(path, "wb") };
    REQUIRE(file != nullptr);
    CHECK(std::fputs("fxlog", file.get()) >= 0);
  }

  std::ifstream in{ path };
  std::string contents;
  std::getline(in, contents);
  CHECK(contents == "fxlog");

  in.close();
  std::filesystem::remove(path);
}

TEST_CASE("util_open_file returns null for an unreachable path") {
  auto const path{ make_temp_path("missing") / "nested" / "file.txt" };
  auto const file{ fxlog::util_open_file(path, "rb") };
  CHECK(file == nullptr);
}

TEST_CASE("util_format_duration") {
  CHECK(fxlog::util_format_duration(0.0) == " 0s");
  CHECK(fxlog::util_format_duration(3.2) == " 3s");
  CHECK(fxlog::util_format_duration(42.0) == "42s");
  CHECK(fxlog::util_format_duration(65.0) == " 1m 5s");
  CHECK(fxlog::util_format_duration(3700.0) == " 1h 1m");
  CHECK(fxlog::util_format_duration(90000.0) == "1d 1h 0m");
  CHECK(fxlog::util_format_duration(-4.0) == " 0s");
  CHECK(fxlog::util_format_duration(std::numeric_limits<double>::infinity()) == "inf");
}

TEST_CASE("util_format_rate") {
  CHECK(fxlog::util_format_rate(5, 2.0) == "2.50it/s");
  CHECK(fxlog::util_format_rate(1, 4.0) == "4.00s/it");
  CHECK(fxlog::util_format_rate(0, 3.0) == "0.00it/s");
  CHECK(fxlog::util_format_rate(10, 0.0) == "0.00it/s");
}

TEST_CASE("util_strip_ansi removes every control sequence") {
  CHECK(fxlog::util_strip_ansi("\x1b[31mred\x1b[0m") == "red");
  CHECK(fxlog::util_strip_ansi("a\x1b[1;32mb") == "ab");
  CHECK(fxlog::util_strip_ansi("plain text") == "plain text");
  CHECK(fxlog::util_strip_ansi("") == "");

  SUBCASE("cursor control") {
    CHECK(fxlog::util_strip_ansi("\x1b[Kx") == "x");
    CHECK(fxlog::util_strip_ansi("a\x1b[2A\x1b[Jb") == "ab");
    CHECK(fxlog::util_strip_ansi("\x1b[?25lhidden\x1b[?25h") == "hidden");
    CHECK(fxlog::util_strip_ansi("\r\x1b[3Bdown") == "\rdown");
  }

  SUBCASE("unterminated sequence is dropped") {
    CHECK(fxlog::util_strip_ansi("x\x1b[31") == "x");
    CHECK(fxlog::util_strip_ansi("x\x1b") == "x");
  }

  SUBCASE("lone escape bytes are dropped") {
    CHECK(fxlog::util_strip_ansi("a\x1b" "7b") == "a7b");
  }
}
