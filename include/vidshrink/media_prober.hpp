/**
 * @file media_prober.hpp
 * @brief Container header probing (codec, bitrate, duration)
 *
 * @details The prober reads container and stream metadata only. With a
 *          small probe size libavformat touches just the first bytes of the
 *          file, so probing a cloud placeholder fetches the header rather
 *          than the whole payload.
 */

#ifndef VIDSHRINK_MEDIA_PROBER_HPP
#define VIDSHRINK_MEDIA_PROBER_HPP

#include <cstdint>
#include <filesystem>
#include <optional>

#include "types.hpp"

namespace vidshrink {

/**
 * @class Prober
 * @brief Abstract metadata source.
 */
class Prober {
public:
  virtual ~Prober() = default;

  /**
   * @brief Probe codec, bitrate and duration of @p path.
   * @return nullopt if the header is unreadable or has no video stream
   */
  virtual std::optional<ProbeResult>
  probe(const std::filesystem::path &path) = 0;
};

/**
 * @class LibavProber
 * @brief Prober backed by libavformat.
 *
 * @attention Bitrate resolution order:
 *
 *   1. Video stream bit rate from the codec parameters
 *
 *   2. (file size x 8) / duration when the stream does not expose one
 *
 *   3. 0 (unknown) when the duration is unknown as well
 */
class LibavProber : public Prober {
public:
  LibavProber();

  std::optional<ProbeResult> probe(const std::filesystem::path &path) override;
};

/**
 * @brief Bitrate estimate from size and duration.
 * @return kbps, or 0 if @p duration_sec is not positive
 */
double estimate_bitrate_kbps(uint64_t size_bytes, double duration_sec);

} // namespace vidshrink

#endif // VIDSHRINK_MEDIA_PROBER_HPP
