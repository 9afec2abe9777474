/**
 * @file config.cpp
 * @brief RunSettings assembly and validation
 */

#include "vidshrink/config.hpp"

#include <stdexcept>

#include <fmt/core.h>

namespace vidshrink {

void RunSettings::validate() const {
  if (min_savings_pct < 0.0 || min_savings_pct >= 100.0)
    throw std::invalid_argument(
        fmt::format("MIN_SAVINGS_PCT must be in [0, 100), got {}",
                    min_savings_pct));
  if (min_bitrate_kbps < 0.0)
    throw std::invalid_argument(fmt::format(
        "MIN_BITRATE_KBPS must not be negative, got {}", min_bitrate_kbps));
  if (trial_duration_sec <= 0.0)
    throw std::invalid_argument(fmt::format(
        "TRIAL_DURATION_SEC must be positive, got {}", trial_duration_sec));
  if (prefetch_count < 0)
    throw std::invalid_argument(fmt::format(
        "PREFETCH_COUNT must not be negative, got {}", prefetch_count));
  if (download_timeout_sec < 0.0 || download_poll_sec <= 0.0)
    throw std::invalid_argument(fmt::format(
        "DOWNLOAD_TIMEOUT_SEC must be >= 0 and DOWNLOAD_POLL_SEC > 0, got {} "
        "and {}",
        download_timeout_sec, download_poll_sec));
  if (disk_space_factor < 1.0)
    throw std::invalid_argument(fmt::format(
        "DISK_SPACE_FACTOR must be at least 1.0, got {}", disk_space_factor));
  if (max_files < 0)
    throw std::invalid_argument(
        fmt::format("MAX_FILES must not be negative, got {}", max_files));
}

namespace Config {

RunSettings run_settings(const std::filesystem::path &root) {
  RunSettings s;
  s.root = root;

  std::string history = history_file();
  s.history_file = history.empty() ? root / ".vidshrink_history.json"
                                   : std::filesystem::path(history);
  std::string log = log_file();
  s.log_file =
      log.empty() ? root / ".vidshrink.log" : std::filesystem::path(log);

  int min_size = min_file_size_mb();
  if (min_size < 0)
    throw std::invalid_argument(fmt::format(
        "MIN_FILE_SIZE_MB must not be negative, got {}", min_size));
  s.min_file_size_mb = static_cast<uint64_t>(min_size);

  s.min_bitrate_kbps = min_bitrate_kbps();
  s.min_savings_pct = min_savings_pct();
  s.trial_duration_sec = trial_duration_sec();
  s.prefetch_count = prefetch_count();
  s.download_timeout_sec = download_timeout_sec();
  s.download_poll_sec = download_poll_sec();
  s.disk_space_factor = disk_space_factor();
  s.ffmpeg_bin = ffmpeg_bin();
  s.forced_encoder = forced_encoder();
  s.cloud_release_cmd = cloud_release_cmd();
  s.dry_run = dry_run();
  s.max_files = max_files();

  s.validate();
  return s;
}

} // namespace Config
} // namespace vidshrink
