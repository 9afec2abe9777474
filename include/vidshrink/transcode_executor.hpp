/**
 * @file transcode_executor.hpp
 * @brief Full conversion of one file and promotion of the result
 *
 * @details A conversion always writes to "<stem>_<family>.partial.mkv" next to
 *          the input, then resolves to exactly one of:
 *
 *          - Converted: output strictly smaller. Temp renamed to the final
 *            name, original deleted, new file released to cloud-only.
 *
 *          - Kept original: output not smaller. Temp deleted, original
 *            released to cloud-only.
 *
 *          - Failed / interrupted: temp deleted, nothing recorded, so the
 *            file is retried on the next run.
 *
 * @note The original is deleted only after the rename has succeeded.
 */

#ifndef VIDSHRINK_TRANSCODE_EXECUTOR_HPP
#define VIDSHRINK_TRANSCODE_EXECUTOR_HPP

#include <filesystem>
#include <string>

#include "cloud_sync.hpp"
#include "encoder.hpp"
#include "run_context.hpp"
#include "types.hpp"

namespace vidshrink {

/// Canonical output path: "<dir>/<stem>_<family>.mkv"
std::filesystem::path output_path_for(const std::filesystem::path &input,
                                      const std::string &codec_family);

/// Temporary output path: "<dir>/<stem>_<family>.partial.mkv"
std::filesystem::path temp_path_for(const std::filesystem::path &input,
                                    const std::string &codec_family);

/**
 * @class TranscodeExecutor
 * @brief Runs a full transcode and applies its outcome.
 */
class TranscodeExecutor {
public:
  TranscodeExecutor(Encoder &encoder, CloudSync &sync, RunContext &ctx);

  /**
   * @brief Convert @p file with @p profile.
   *
   * @return Outcome; converted and kept-original outcomes are already
   *         recorded in the history when this returns
   */
  TranscodeResult transcode(const CandidateFile &file,
                            const EncoderProfile &profile);

private:
  Encoder &encoder_;
  CloudSync &sync_;
  RunContext &ctx_;

  /// Delete the temp file and clear the in-flight mirror
  void discard(const std::filesystem::path &temp);

  /// Best effort: unsupported or refused releases leave the file local
  void release(const std::filesystem::path &path);
};

} // namespace vidshrink

#endif // VIDSHRINK_TRANSCODE_EXECUTOR_HPP
