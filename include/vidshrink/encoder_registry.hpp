/**
 * @file encoder_registry.hpp
 * @brief Encoder profile registry and run-time selection
 *
 * @details Profiles are listed in priority order: hardware AV1, then
 *          hardware HEVC, then the libx265 and SVT-AV1 software encoders. A real (tiny) encode is the
 *          only portable way to know whether a hardware encoder works on
 *          this machine, so selection probes each profile in turn and keeps
 *          the first one that succeeds for the rest of the run.
 */

#ifndef VIDSHRINK_ENCODER_REGISTRY_HPP
#define VIDSHRINK_ENCODER_REGISTRY_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "encoder.hpp"
#include "types.hpp"

namespace vidshrink {

/**
 * @brief The built-in profiles in priority order.
 */
const std::vector<EncoderProfile> &default_profiles();

/**
 * @brief Pick the first profile whose probe encode works.
 *
 * @param encoder Encoder used for the probe encodes
 * @param profiles Candidates in priority order
 * @param scratch_dir Directory for probe outputs (deleted afterwards)
 * @param forced_id If non-empty, only this profile id is considered
 * @return Selected profile, or nullopt if none works
 */
std::optional<EncoderProfile>
select_encoder(Encoder &encoder, const std::vector<EncoderProfile> &profiles,
               const std::filesystem::path &scratch_dir,
               const std::string &forced_id = {});

} // namespace vidshrink

#endif // VIDSHRINK_ENCODER_REGISTRY_HPP
