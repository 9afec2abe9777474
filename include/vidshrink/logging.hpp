/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - An append-only log file mirroring every console line
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for aggregating phase durations
 *
 * @note All logs use fmt for type-safe formatting and are flushed
 *       immediately so nothing is lost when the run is interrupted.
 *
 */

#ifndef VIDSHRINK_LOGGING_HPP
#define VIDSHRINK_LOGGING_HPP

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace vidshrink {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

enum class LogLevel { Info, Warn, Error, Phase, Success };

/**
 * @brief Write one formatted line to the console and the log file.
 * @note Takes log_mutex. Console output is coloured by level; the log file
 *       gets a timestamp and a level tag instead.
 */
void log_line(LogLevel level, const std::string &message);

/**
 * @brief Start mirroring log lines into an append-only file.
 * @param path Log file, created if missing
 * @return false if the file cannot be opened (console logging continues)
 */
bool open_log_file(const std::filesystem::path &path);

/// Flush and close the log file, if one is open.
void close_log_file();

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  vidshrink::log_line(vidshrink::LogLevel::Info,                               \
                      fmt::format(format_str, ##__VA_ARGS__))

#define LOG_WARN(format_str, ...)                                              \
  vidshrink::log_line(vidshrink::LogLevel::Warn,                               \
                      fmt::format(format_str, ##__VA_ARGS__))

#define LOG_ERROR(format_str, ...)                                             \
  vidshrink::log_line(vidshrink::LogLevel::Error,                              \
                      fmt::format(format_str, ##__VA_ARGS__))

#define LOG_PHASE(format_str, ...)                                             \
  vidshrink::log_line(vidshrink::LogLevel::Phase,                              \
                      fmt::format(format_str, ##__VA_ARGS__))

#define LOG_SUCCESS(format_str, ...)                                           \
  vidshrink::log_line(vidshrink::LogLevel::Success,                            \
                      fmt::format(format_str, ##__VA_ARGS__))
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 * @note Stores the phase name and duration in microseconds.
 */
struct TimingEntry {
  std::string name;  //< Phase name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Thread-safe singleton for collecting timing measurements.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Print per-phase totals as a formatted table.
   *        Called once with the run summary.
   */
  static void print_summary();

  /**
   * @brief Clear all collected timings.
   */
  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    vidshrink::TimingCollector::record(#name, timer_duration_##name);          \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace vidshrink

#endif // VIDSHRINK_LOGGING_HPP
