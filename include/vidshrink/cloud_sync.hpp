/**
 * @file cloud_sync.hpp
 * @brief Host cloud-sync integration
 *
 * @details The pipeline needs exactly three things from the sync layer:
 *
 *          - Is the file content materialized locally?
 *
 *          - Ask for the content to be downloaded (non-blocking)
 *
 *          - Give the local copy back, keeping only the cloud placeholder
 */

#ifndef VIDSHRINK_CLOUD_SYNC_HPP
#define VIDSHRINK_CLOUD_SYNC_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace vidshrink {

/**
 * @class CloudSync
 * @brief Abstract cloud-sync layer.
 */
class CloudSync {
public:
  virtual ~CloudSync() = default;

  /// true if the content of @p path is on local storage
  virtual bool is_locally_available(const std::filesystem::path &path) = 0;

  /**
   * @brief Trigger materialization of @p path without waiting for it.
   * @return false if the trigger could not be issued
   */
  virtual bool request_download(const std::filesystem::path &path) = 0;

  /**
   * @brief Drop the local content of @p path, keeping the cloud copy.
   * @return false if unsupported or the sync layer refused
   */
  virtual bool release_to_cloud_only(const std::filesystem::path &path) = 0;
};

/**
 * @class PosixCloudSync
 * @brief Placeholder detection by allocated blocks.
 *
 * @attention HEURISTICS:
 *
 *   - A file is local when at least 90% of its size is allocated on disk;
 *     sync clients expose dehydrated placeholders as (nearly) unallocated
 *     files
 *
 *   - Downloads are triggered with posix_fadvise(POSIX_FADV_WILLNEED), which
 *     starts read-ahead and returns immediately
 *
 *   - Releasing needs a client-specific command (CLOUD_RELEASE_CMD); the
 *     file path is appended as the last argument. Without one, release is
 *     reported as unsupported.
 */
class PosixCloudSync : public CloudSync {
public:
  /// @param release_cmd Command line used to dehydrate a file (may be empty)
  explicit PosixCloudSync(const std::string &release_cmd = {});

  bool is_locally_available(const std::filesystem::path &path) override;
  bool request_download(const std::filesystem::path &path) override;
  bool release_to_cloud_only(const std::filesystem::path &path) override;

private:
  std::vector<std::string> release_cmd_;
};

} // namespace vidshrink

#endif // VIDSHRINK_CLOUD_SYNC_HPP
