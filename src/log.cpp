#include <fillcast/log.hpp>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <utility>
#include <sstream>

namespace fillcast {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
static std::mutex g_log_mu;
static LogSink g_sink; // guarded by g_log_mu

const char* to_string(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

void set_log_sink(LogSink sink) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_sink = std::move(sink);
}

static std::string utc_timestamp() {
  using clock = std::chrono::system_clock;
  const std::time_t tt = clock::to_time_t(clock::now());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;
  try {
    std::lock_guard<std::mutex> lk(g_log_mu);
    if (g_sink) {
      g_sink(lvl, msg);
      return;
    }
    std::ostream& out = (lvl >= LogLevel::Warn) ? std::cerr : std::cout;
    out << "[" << utc_timestamp() << "][" << to_string(lvl) << "] fillcast: " << msg << "\n";
    out.flush();
  } catch (const std::exception& e) {
    // Sink failures are reported on stderr only.
    std::fputs("fillcast: log sink failed: ", stderr);
    std::fputs(e.what(), stderr);
    std::fputs("\n", stderr);
  } catch (...) {
    std::fputs("fillcast: log sink failed\n", stderr);
  }
}

} // namespace fillcast
