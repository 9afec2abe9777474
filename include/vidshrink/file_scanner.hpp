/**
 * @file file_scanner.hpp
 * @brief Candidate enumeration and root folder discovery
 */

#ifndef VIDSHRINK_FILE_SCANNER_HPP
#define VIDSHRINK_FILE_SCANNER_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace vidshrink {

/// Whether @p path has one of the scanned video extensions (any case)
bool is_video_extension(const std::filesystem::path &path);

/**
 * @brief Whether @p path is something this tool wrote.
 * @note Matches "*_hevc.mkv", "*_av1.mkv" and "*.partial.mkv".
 */
bool is_own_artifact(const std::filesystem::path &path);

/**
 * @brief Recursively collect candidate files under @p root.
 *
 * @param root Folder to scan
 * @param min_size_bytes Smaller files are ignored
 * @return Candidates sorted by path
 *
 * @note Directories that cannot be read are skipped with a warning; the
 *       scan itself never throws.
 */
std::vector<CandidateFile> scan_candidates(const std::filesystem::path &root,
                                           uint64_t min_size_bytes);

/**
 * @brief Locate the cloud-synced root folder when none was given.
 *
 * @details Checked in order:
 *
 *          - $OneDrive, $OneDriveConsumer, $OneDriveCommercial
 *
 *          - $HOME/OneDrive
 *
 * @return First candidate that is an existing directory
 */
std::optional<std::filesystem::path> discover_root();

} // namespace vidshrink

#endif // VIDSHRINK_FILE_SCANNER_HPP
