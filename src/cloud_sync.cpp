/**
 * @file cloud_sync.cpp
 * @brief POSIX cloud-sync integration
 */

#include "vidshrink/cloud_sync.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "vidshrink/logging.hpp"
#include "vidshrink/process.hpp"

namespace vidshrink {

namespace {

/// Fraction of the size that must be allocated for a file to count as local
constexpr double LOCAL_ALLOCATION_RATIO = 0.9;

} // anonymous namespace

PosixCloudSync::PosixCloudSync(const std::string &release_cmd) {
  std::istringstream words(release_cmd);
  std::string word;
  while (words >> word)
    release_cmd_.push_back(word);
}

bool PosixCloudSync::is_locally_available(const std::filesystem::path &path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0)
    return false;
  if (st.st_size == 0)
    return true;

  /// st_blocks is in 512-byte units regardless of the filesystem block size
  double allocated = static_cast<double>(st.st_blocks) * 512.0;
  return allocated >= static_cast<double>(st.st_size) * LOCAL_ALLOCATION_RATIO;
}

bool PosixCloudSync::request_download(const std::filesystem::path &path) {
  int fd = open(path.c_str(), O_RDONLY);
  if (fd == -1) {
    LOG_WARN("Cannot open {} to request download: {}",
             path.filename().string(), std::strerror(errno));
    return false;
  }

  bool ok = true;
#if defined(POSIX_FADV_WILLNEED)
  int ret = posix_fadvise(fd, 0, 0, POSIX_FADV_WILLNEED);
  if (ret != 0) {
    LOG_WARN("posix_fadvise failed for {}: {}", path.filename().string(),
             std::strerror(ret));
    ok = false;
  }
#else
  /// No read-ahead hint on this platform: touching the first byte makes the
  /// sync client start hydrating
  char byte;
  ok = read(fd, &byte, 1) >= 0;
#endif
  close(fd);
  return ok;
}

bool PosixCloudSync::release_to_cloud_only(const std::filesystem::path &path) {
  if (release_cmd_.empty())
    return false;

  std::vector<std::string> cmd = release_cmd_;
  cmd.push_back(path.string());
  ProcessResult r = run_process(cmd);
  if (!r.ok()) {
    LOG_WARN("Release to cloud-only failed for {} (exit {})",
             path.filename().string(), r.exit_code);
    return false;
  }
  return true;
}

} // namespace vidshrink
