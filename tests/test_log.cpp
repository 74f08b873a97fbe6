#include <catch2/catch.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fillcast/log.hpp>

using namespace fillcast;

namespace {

// Captures messages for the duration of a test and restores the defaults.
struct CapturedLog {
  std::vector<std::pair<LogLevel, std::string>> lines;
  LogLevel saved = get_log_level();

  CapturedLog() {
    set_log_sink([this](LogLevel lvl, const std::string& msg) { lines.emplace_back(lvl, msg); });
  }
  ~CapturedLog() {
    set_log_sink(nullptr);
    set_log_level(saved);
  }
};

} // namespace

TEST_CASE("log level filter") {
  CapturedLog cap;
  set_log_level(LogLevel::Warn);
  log_debug("d");
  log_info("i");
  log_warn("w");
  log_error("e");

  REQUIRE(cap.lines.size() == 2);
  REQUIRE(cap.lines[0] == std::make_pair(LogLevel::Warn, std::string("w")));
  REQUIRE(cap.lines[1] == std::make_pair(LogLevel::Error, std::string("e")));

  set_log_level(LogLevel::Debug);
  log_debug("now visible");
  REQUIRE(cap.lines.back().second == "now visible");
}

TEST_CASE("level names") {
  REQUIRE(std::string(to_string(LogLevel::Debug)) == "DEBUG");
  REQUIRE(std::string(to_string(LogLevel::Info)) == "INFO");
  REQUIRE(std::string(to_string(LogLevel::Warn)) == "WARN");
  REQUIRE(std::string(to_string(LogLevel::Error)) == "ERROR");
}

TEST_CASE("a throwing sink does not escape log()") {
  CapturedLog cap;
  set_log_sink([](LogLevel, const std::string&) { throw std::runtime_error("sink down"); });
  REQUIRE_NOTHROW(log_error("dropped"));
}

TEST_CASE("a sink throwing a non-standard exception does not escape log()") {
  CapturedLog cap;
  set_log_sink([](LogLevel, const std::string&) { throw 42; });
  REQUIRE_NOTHROW(log_error("dropped"));
}
