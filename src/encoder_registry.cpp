/**
 * @file encoder_registry.cpp
 * @brief Profile table and probing policy
 */

#include "vidshrink/encoder_registry.hpp"

#include <system_error>

#include <unistd.h>

#include <fmt/core.h>

#include "vidshrink/logging.hpp"

namespace vidshrink {

namespace fs = std::filesystem;

const std::vector<EncoderProfile> &default_profiles() {
  static const std::vector<EncoderProfile> profiles = {
      {"av1_nvenc",
       "NVIDIA NVENC AV1",
       {"-c:v", "av1_nvenc", "-preset", "p5", "-rc", "vbr", "-cq", "32",
        "-b:v", "0"},
       "av1",
       {}},
      {"av1_qsv",
       "Intel Quick Sync AV1",
       {"-c:v", "av1_qsv", "-preset", "slower", "-global_quality", "28"},
       "av1",
       {}},
      {"av1_amf",
       "AMD AMF AV1",
       {"-c:v", "av1_amf", "-quality", "quality", "-rc", "cqp", "-qp_i", "30",
        "-qp_p", "32"},
       "av1",
       {}},
      {"av1_vaapi",
       "VA-API AV1",
       {"-vf", "format=nv12,hwupload", "-c:v", "av1_vaapi", "-rc_mode", "CQP",
        "-global_quality", "120"},
       "av1",
       {"-vaapi_device", "/dev/dri/renderD128"}},
      {"hevc_nvenc",
       "NVIDIA NVENC HEVC",
       {"-c:v", "hevc_nvenc", "-preset", "p5", "-rc", "vbr", "-cq", "28",
        "-b:v", "0"},
       "hevc",
       {}},
      {"hevc_qsv",
       "Intel Quick Sync HEVC",
       {"-c:v", "hevc_qsv", "-preset", "slow", "-global_quality", "25"},
       "hevc",
       {}},
      {"hevc_amf",
       "AMD AMF HEVC",
       {"-c:v", "hevc_amf", "-quality", "quality", "-rc", "cqp", "-qp_i", "26",
        "-qp_p", "28"},
       "hevc",
       {}},
      {"hevc_vaapi",
       "VA-API HEVC",
       {"-vf", "format=nv12,hwupload", "-c:v", "hevc_vaapi", "-qp", "26"},
       "hevc",
       {"-vaapi_device", "/dev/dri/renderD128"}},
      {"hevc_videotoolbox",
       "Apple VideoToolbox HEVC",
       {"-c:v", "hevc_videotoolbox", "-q:v", "60", "-tag:v", "hvc1"},
       "hevc",
       {}},
      {"libx265",
       "x265 software HEVC",
       {"-c:v", "libx265", "-preset", "medium", "-crf", "26", "-x265-params",
        "log-level=error"},
       "hevc",
       {}},
      {"libsvtav1",
       "SVT-AV1 software AV1",
       {"-c:v", "libsvtav1", "-preset", "8", "-crf", "32"},
       "av1",
       {}},
  };
  return profiles;
}

std::optional<EncoderProfile>
select_encoder(Encoder &encoder, const std::vector<EncoderProfile> &profiles,
               const fs::path &scratch_dir, const std::string &forced_id) {
  LOG_PHASE("Probing encoders...");

  bool forced_found = forced_id.empty();

  for (const auto &profile : profiles) {
    if (!forced_id.empty() && profile.id != forced_id)
      continue;
    forced_found = true;

    fs::path out = scratch_dir / fmt::format(".vidshrink_probe_{}_{}{}",
                                             getpid(), profile.id,
                                             OUTPUT_EXTENSION);
    ProcessResult r = encoder.probe_profile(profile, out);

    std::error_code ec;
    auto size = fs::file_size(out, ec);
    bool produced = !ec && size > 0;
    fs::remove(out, ec);

    if (r.interrupted)
      return std::nullopt;

    if (r.ok() && produced) {
      LOG_SUCCESS("Encoder: {} ({})", profile.label, profile.id);
      return profile;
    }
    LOG_INFO("Encoder {} unavailable (exit {}{})", profile.id, r.exit_code,
             produced ? "" : ", no output");
  }

  if (!forced_found) {
    LOG_ERROR("Unknown encoder profile '{}'", forced_id);
  }
  return std::nullopt;
}

} // namespace vidshrink
