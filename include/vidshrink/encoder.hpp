/**
 * @file encoder.hpp
 * @brief External encoder collaborator
 *
 * @details Every invocation of the media tool goes through the Encoder
 *          interface so the decision logic can be tested with scripted
 *          fakes. FFmpegEncoder is the production implementation.
 *
 *          The tool is used three ways:
 *
 *          - Capability probe: tiny synthetic clip per profile
 *
 *          - Trial: stream-copy and encode of the same short segment
 *
 *          - Full transcode: whole file, audio copied verbatim
 */

#ifndef VIDSHRINK_ENCODER_HPP
#define VIDSHRINK_ENCODER_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "process.hpp"
#include "types.hpp"

namespace vidshrink {

/**
 * @class Encoder
 * @brief Abstract encoder; only exit status and output files matter.
 */
class Encoder {
public:
  virtual ~Encoder() = default;

  /**
   * @brief Encode a one-second solid colour clip with @p profile.
   * @param profile Profile under test
   * @param output Scratch output file
   */
  virtual ProcessResult probe_profile(const EncoderProfile &profile,
                                      const std::filesystem::path &output) = 0;

  /**
   * @brief Copy the video stream of [start, start + duration) unchanged.
   */
  virtual ProcessResult extract_segment(const std::filesystem::path &input,
                                        const std::filesystem::path &output,
                                        double start, double duration) = 0;

  /**
   * @brief Encode the video stream of [start, start + duration).
   */
  virtual ProcessResult encode_segment(const std::filesystem::path &input,
                                       const std::filesystem::path &output,
                                       const EncoderProfile &profile,
                                       double start, double duration) = 0;

  /**
   * @brief Encode the whole file; audio is copied, never re-encoded.
   */
  virtual ProcessResult transcode(const std::filesystem::path &input,
                                  const std::filesystem::path &output,
                                  const EncoderProfile &profile) = 0;
};

/**
 * @class FFmpegEncoder
 * @brief Encoder backed by the ffmpeg command line tool.
 */
class FFmpegEncoder : public Encoder {
public:
  /**
   * @param ffmpeg_bin ffmpeg executable (PATH lookup if not absolute)
   * @param threads Encoder/decoder threads, normally detect_cpu_limit()
   */
  FFmpegEncoder(std::string ffmpeg_bin, int threads);

  ProcessResult probe_profile(const EncoderProfile &profile,
                              const std::filesystem::path &output) override;

  ProcessResult extract_segment(const std::filesystem::path &input,
                                const std::filesystem::path &output,
                                double start, double duration) override;

  ProcessResult encode_segment(const std::filesystem::path &input,
                               const std::filesystem::path &output,
                               const EncoderProfile &profile, double start,
                               double duration) override;

  ProcessResult transcode(const std::filesystem::path &input,
                          const std::filesystem::path &output,
                          const EncoderProfile &profile) override;

  /// Command lines, exposed for logging and tests
  std::vector<std::string>
  probe_command(const EncoderProfile &profile,
                const std::filesystem::path &output) const;
  std::vector<std::string>
  segment_command(const std::filesystem::path &input,
                  const std::filesystem::path &output,
                  const EncoderProfile *profile, double start,
                  double duration) const;
  std::vector<std::string>
  transcode_command(const std::filesystem::path &input,
                    const std::filesystem::path &output,
                    const EncoderProfile &profile) const;

private:
  std::string ffmpeg_bin_;
  int threads_;

  /// "ffmpeg -nostdin -hide_banner -loglevel error -y"
  std::vector<std::string> base_command() const;
};

} // namespace vidshrink

#endif // VIDSHRINK_ENCODER_HPP
