/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables, and
 *          the RunSettings value that collects them once per run so the
 *          pipeline components never read the environment themselves.
 *
 * @note Malformed numeric values make std::stod / std::stoi throw
 *       std::invalid_argument or std::out_of_range; main() turns that into a
 *       fatal configuration error.
 */

#ifndef VIDSHRINK_CONFIG_HPP
#define VIDSHRINK_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace vidshrink {

/**
 * @struct RunSettings
 * @brief All knobs that influence one run.
 * @note Defaults match the environment defaults so tests can construct one
 *       directly and override only what they exercise.
 */
struct RunSettings {
  std::filesystem::path root;          //< Scanned folder
  std::filesystem::path history_file;  //< Persisted history (JSON)
  std::filesystem::path log_file;      //< Append-only log
  uint64_t min_file_size_mb = 250;     //< Scan size floor
  double min_bitrate_kbps = 1500.0;    //< Bitrate gate floor
  double min_savings_pct = 10.0;       //< Static and trial gate floor
  double trial_duration_sec = 30.0;    //< Trial segment length
  int prefetch_count = 2;              //< Look-ahead window
  double download_timeout_sec = 1800.0; //< Materialization ceiling
  double download_poll_sec = 5.0;      //< Locality poll interval
  double disk_space_factor = 1.1;      //< Required free space / input size
  std::string ffmpeg_bin = "ffmpeg";   //< External encoder binary
  std::string forced_encoder;          //< Profile id, empty = auto
  std::string cloud_release_cmd;       //< Dehydrate command, empty = none
  bool dry_run = false;                //< Cheap gates only, no side effects
  int max_files = 0;                   //< Transcode cap, 0 = unlimited

  /**
   * @brief Reject values that would make the gates meaningless.
   * @throw std::invalid_argument naming the offending knob
   */
  void validate() const;
};

namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val = {}) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/// Root folder override (command line argument takes precedence)
inline std::string root_override() {
  static std::string val = get_env_string("VIDSHRINK_ROOT");
  return val;
}

/// Files smaller than this are never considered
inline int min_file_size_mb() {
  static int val = get_env_int("MIN_FILE_SIZE_MB", 250);
  return val;
}

/// Files below this video bitrate are already efficient enough
inline double min_bitrate_kbps() {
  static double val = get_env_double("MIN_BITRATE_KBPS", 1500.0);
  return val;
}

/**
 * @brief Minimum savings percentage worth a transcode
 * @note Applied twice: to the static codec estimate before download and to
 *       the measured trial encode after download.
 */
inline double min_savings_pct() {
  static double val = get_env_double("MIN_SAVINGS_PCT", 10.0);
  return val;
}

/// Length of the trial segment in seconds
inline double trial_duration_sec() {
  static double val = get_env_double("TRIAL_DURATION_SEC", 30.0);
  return val;
}

/**
 * @brief Number of upcoming candidates downloaded in the background
 * @note 0 disables prefetch entirely.
 */
inline int prefetch_count() {
  static int val = get_env_int("PREFETCH_COUNT", 2);
  return val;
}

/// Ceiling for a blocking download before the file is skipped for this run
inline double download_timeout_sec() {
  static double val = get_env_double("DOWNLOAD_TIMEOUT_SEC", 1800.0);
  return val;
}

/// Interval between locality checks while waiting for a download
inline double download_poll_sec() {
  static double val = get_env_double("DOWNLOAD_POLL_SEC", 5.0);
  return val;
}

/// Free space required at the destination, as a multiple of the input size
inline double disk_space_factor() {
  static double val = get_env_double("DISK_SPACE_FACTOR", 1.1);
  return val;
}

/// History file location (empty = inside the root folder)
inline std::string history_file() {
  static std::string val = get_env_string("HISTORY_FILE");
  return val;
}

/// Log file location (empty = inside the root folder)
inline std::string log_file() {
  static std::string val = get_env_string("LOG_FILE");
  return val;
}

/// ffmpeg executable, resolved through PATH when not absolute
inline std::string ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

/// Force one encoder profile id instead of probing the whole registry
inline std::string forced_encoder() {
  static std::string val = get_env_string("VIDSHRINK_ENCODER");
  return val;
}

/**
 * @brief Command that returns a file to cloud-only state
 * @note The file path is appended as the last argument.
 */
inline std::string cloud_release_cmd() {
  static std::string val = get_env_string("CLOUD_RELEASE_CMD");
  return val;
}

/**
 * @brief Evaluate header-only gates and report, without side effects
 * @note No history writes, downloads or transcodes happen in dry-run mode.
 */
inline bool dry_run() {
  static bool val = (get_env_int("DRY_RUN", 0) != 0);
  return val;
}

/// Maximum number of files transcoded in one run (0 = unlimited)
inline int max_files() {
  static int val = get_env_int("MAX_FILES", 0);
  return val;
}

/**
 * @brief Collect every knob into a RunSettings for the given root.
 * @param root Resolved root folder; history and log default inside it
 */
RunSettings run_settings(const std::filesystem::path &root);

} // namespace Config
} // namespace vidshrink

#endif // VIDSHRINK_CONFIG_HPP
