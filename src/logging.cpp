/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex and the optional log file
 *
 *          - TimingCollector static members and methods
 */

#include "vidshrink/logging.hpp"

#include <cstdio>
#include <map>

#include <fmt/color.h>
#include <fmt/core.h>

#include "vidshrink/system.hpp"

namespace vidshrink {

// **----- GLOBAL LOG STATE -----**

std::mutex log_mutex;

namespace {

/// Append-only mirror of the console output, guarded by log_mutex
std::FILE *log_file = nullptr;

const char *level_tag(LogLevel level) {
  switch (level) {
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Phase:
    return "PHASE";
  case LogLevel::Success:
    return "OK";
  }
  return "INFO";
}

} // anonymous namespace

void log_line(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(log_mutex);

  switch (level) {
  case LogLevel::Info:
    fmt::print("[INFO] {}\n", message);
    break;
  case LogLevel::Warn:
    fmt::print(fg(fmt::color::yellow), "[WARN] {}\n", message);
    break;
  case LogLevel::Error:
    fmt::print(fg(fmt::color::red), "[ERROR] {}\n", message);
    break;
  case LogLevel::Phase:
    fmt::print(fg(fmt::color::cyan), "{}\n", message);
    break;
  case LogLevel::Success:
    fmt::print(fg(fmt::color::green), "{}\n", message);
    break;
  }
  std::fflush(stdout);

  if (log_file) {
    fmt::print(log_file, "{} [{}] {}\n", local_timestamp(), level_tag(level),
               message);
    std::fflush(log_file);
  }
}

bool open_log_file(const std::filesystem::path &path) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file) {
    std::fclose(log_file);
    log_file = nullptr;
  }
  log_file = std::fopen(path.string().c_str(), "a");
  return log_file != nullptr;
}

void close_log_file() {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file) {
    std::fclose(log_file);
    log_file = nullptr;
  }
}

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  /// Aggregate per phase; a batch run records the same phase many times
  std::map<std::string, std::pair<int, long>> totals;
  for (const auto &e : entries) {
    auto &t = totals[e.name];
    t.first++;
    t.second += e.microseconds;
  }

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<20} {:>6} {:>24}\n", "Phase", "Count", "Total (us) [sec]");
  fmt::print("{:-<20} {:-<6} {:-<24}\n", "", "", "");

  for (const auto &kv : totals) {
    double seconds = kv.second.second / 1000000.0;
    fmt::print("{:<20} {:>6} {:>14} [{:.1f}s]\n", kv.first, kv.second.first,
               kv.second.second, seconds);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace vidshrink
