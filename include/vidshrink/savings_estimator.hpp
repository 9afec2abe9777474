/**
 * @file savings_estimator.hpp
 * @brief Static and trial-based savings estimates
 *
 * @details Two independent methods used at different pipeline stages:
 *
 *          - Static: codec -> compression ratio table. Cheap, header-only,
 *            used before any download.
 *
 *          - Trial: encode a short segment from the middle of the file and
 *            compare it with a stream copy of the same segment. Accurate,
 *            needs the file locally, used right before a full transcode.
 */

#ifndef VIDSHRINK_SAVINGS_ESTIMATOR_HPP
#define VIDSHRINK_SAVINGS_ESTIMATOR_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "encoder.hpp"
#include "media_prober.hpp"
#include "types.hpp"

namespace vidshrink {

/// Ratio applied to codecs missing from the table
constexpr double DEFAULT_CODEC_RATIO = 0.70;

/**
 * @brief Expected new/old size ratio when re-encoding @p codec.
 * @note Case-insensitive; unknown codecs get DEFAULT_CODEC_RATIO.
 */
double codec_ratio(const std::string &codec);

/**
 * @brief Predict the converted size from codec and size alone.
 */
SavingsEstimate estimate_static(const std::string &codec, uint64_t size);

/**
 * @brief Where the trial segment starts.
 * @note One third into the file, clamped so the segment fits; 0 when the
 *       duration is unknown or shorter than the segment.
 */
double trial_start_offset(double total_duration, double segment_duration);

/**
 * @class SavingsEstimator
 * @brief Runs trial encodes through the Encoder collaborator.
 */
class SavingsEstimator {
public:
  /**
   * @param encoder Encoder used for both trial artifacts
   * @param prober Measures the artifact durations
   * @param scratch_dir Where trial artifacts are written
   */
  SavingsEstimator(Encoder &encoder, Prober &prober,
                   std::filesystem::path scratch_dir);

  /**
   * @brief Measure real savings on a segment of @p file.
   *
   * @param file Local candidate (probe result used for its duration)
   * @param profile Selected encoder profile
   * @param duration_sec Segment length
   * @return Measured bitrates and percent, nullopt if either encode failed
   *
   * @attention Both trial artifacts are deleted before returning, whatever
   *            the outcome.
   */
  std::optional<TrialResult> trial_encode(const CandidateFile &file,
                                          const EncoderProfile &profile,
                                          double duration_sec);

private:
  Encoder &encoder_;
  Prober &prober_;
  std::filesystem::path scratch_dir_;

  /// kbps of an artifact over its probed (or nominal) duration
  double artifact_kbps(const std::filesystem::path &artifact,
                       double nominal_duration);
};

} // namespace vidshrink

#endif // VIDSHRINK_SAVINGS_ESTIMATOR_HPP
