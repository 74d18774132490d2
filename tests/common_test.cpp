/**
 * Logging and Helper Unit Tests
 */

#include <doctest/doctest.h>
#include <lats/common.hpp>
#include <string>
#include <utility>
#include <vector>

using namespace lats;

namespace {

/** Captures log output for the lifetime of the guard, then restores state */
struct CaptureLog {
  std::vector<std::pair<lats::log::Level, std::string>> lines;
  lats::log::Level saved;

  explicit CaptureLog(lats::log::Level level) : saved(lats::log::get_level()) {
    lats::log::set_level(level);
    lats::log::set_sink([this](lats::log::Level l, const std::string& msg) { lines.emplace_back(l, msg); });
  }

  ~CaptureLog() {
    lats::log::set_sink(nullptr);
    lats::log::set_level(saved);
  }
};

}  // namespace

TEST_CASE("common: truncate appends ellipsis only when cut") {
  CHECK(truncate("abc", 3) == "abc");
  CHECK(truncate("abcdef", 3) == "abc...");
  CHECK(truncate("", 0) == "");
}

TEST_CASE("common: messages below the level are dropped") {
  CaptureLog capture(lats::log::Level::Warn);

  LATS_LOG_DEBUG("[test::log] hidden %d", 1);
  LATS_LOG_INFO("[test::log] hidden %d", 2);
  LATS_LOG_WARN("[test::log] shown %d", 3);
  LATS_LOG_ERROR("[test::log] shown %s", "four");

  REQUIRE(capture.lines.size() == 2);
  CHECK(capture.lines[0].first == lats::log::Level::Warn);
  CHECK(capture.lines[0].second == "[test::log] shown 3");
  CHECK(capture.lines[1].first == lats::log::Level::Error);
  CHECK(capture.lines[1].second == "[test::log] shown four");
}

TEST_CASE("common: Off silences every level") {
  CaptureLog capture(lats::log::Level::Off);
  LATS_LOG_ERROR("[test::log] %s", "nothing");
  CHECK(capture.lines.empty());
  CHECK_FALSE(lats::log::enabled(lats::log::Level::Error));
}

TEST_CASE("common: debug level enables everything") {
  CaptureLog capture(lats::log::Level::Debug);
  CHECK(lats::log::enabled(lats::log::Level::Debug));
  LATS_LOG_DEBUG("[test::log] %.2f", 0.5);
  REQUIRE(capture.lines.size() == 1);
  CHECK(capture.lines[0].second == "[test::log] 0.50");
}

TEST_CASE("common: a sink may log through the macros") {
  lats::log::Level saved = lats::log::get_level();
  lats::log::set_level(lats::log::Level::Warn);

  std::vector<std::string> lines;
  int depth = 0;
  lats::log::set_sink([&](lats::log::Level, const std::string& msg) {
    lines.push_back(msg);
    if (depth++ == 0) LATS_LOG_WARN("[test::sink] forwarded %s", msg.c_str());
  });

  LATS_LOG_WARN("[test::log] outer");

  lats::log::set_sink(nullptr);
  lats::log::set_level(saved);

  REQUIRE(lines.size() == 2);
  CHECK(lines[0] == "[test::log] outer");
  CHECK(lines[1] == "[test::sink] forwarded [test::log] outer");
}
