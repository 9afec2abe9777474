/**
 * @file savings_estimator.cpp
 * @brief Savings estimation implementation
 */

#include "vidshrink/savings_estimator.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <system_error>
#include <utility>

#include <unistd.h>

#include <fmt/core.h>

#include "vidshrink/logging.hpp"
#include "vidshrink/system.hpp"

namespace vidshrink {

namespace fs = std::filesystem;

// **----- Static Estimate -----**

double codec_ratio(const std::string &codec) {
  static const std::map<std::string, double> ratios = {
      {"mpeg1video", 0.30}, {"mpeg2video", 0.30}, {"mpeg4", 0.35},
      {"msmpeg4v2", 0.35},  {"msmpeg4v3", 0.35},  {"wmv1", 0.35},
      {"wmv2", 0.35},       {"wmv3", 0.35},       {"vc1", 0.40},
      {"h264", 0.40},       {"vp8", 0.50},        {"prores", 0.15},
      {"mjpeg", 0.20},      {"vp9", 0.85},        {"hevc", 0.90},
      {"av1", 0.95},
  };

  std::string key = codec;
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  auto it = ratios.find(key);
  return it == ratios.end() ? DEFAULT_CODEC_RATIO : it->second;
}

SavingsEstimate estimate_static(const std::string &codec, uint64_t size) {
  double ratio = codec_ratio(codec);
  SavingsEstimate est;
  est.predicted_new_size =
      static_cast<uint64_t>(static_cast<double>(size) * ratio);
  est.predicted_percent = (1.0 - ratio) * 100.0;
  return est;
}

double trial_start_offset(double total_duration, double segment_duration) {
  if (total_duration <= segment_duration)
    return 0.0;
  double start = total_duration / 3.0;
  return std::min(start, total_duration - segment_duration);
}

// **----- Trial Estimate -----**

SavingsEstimator::SavingsEstimator(Encoder &encoder, Prober &prober,
                                   fs::path scratch_dir)
    : encoder_(encoder), prober_(prober), scratch_dir_(std::move(scratch_dir)) {
}

double SavingsEstimator::artifact_kbps(const fs::path &artifact,
                                       double nominal_duration) {
  std::error_code ec;
  auto size = fs::file_size(artifact, ec);
  if (ec || size == 0)
    return 0.0;

  double duration = nominal_duration;
  auto probed = prober_.probe(artifact);
  if (probed && probed->duration_sec > 0.0)
    duration = probed->duration_sec;
  return estimate_bitrate_kbps(size, duration);
}

std::optional<TrialResult>
SavingsEstimator::trial_encode(const CandidateFile &file,
                               const EncoderProfile &profile,
                               double duration_sec) {
  double total = file.probe ? file.probe->duration_sec : 0.0;
  double start = trial_start_offset(total, duration_sec);
  double length = (total > 0.0) ? std::min(duration_sec, total) : duration_sec;

  fs::path src = scratch_dir_ / fmt::format(".vidshrink_trial_{}_src{}",
                                            getpid(), OUTPUT_EXTENSION);
  fs::path enc = scratch_dir_ / fmt::format(".vidshrink_trial_{}_enc{}",
                                            getpid(), OUTPUT_EXTENSION);

  LOG_INFO("Trial: {:.0f}s segment at {} of {}", length, format_time(start),
           file.path.filename().string());

  std::optional<TrialResult> result;

  TIMER_START(trial_encode);
  ProcessResult copy = encoder_.extract_segment(file.path, src, start, length);
  ProcessResult encode;
  if (copy.ok())
    encode = encoder_.encode_segment(file.path, enc, profile, start, length);
  TIMER_END(trial_encode);

  if (!copy.ok()) {
    LOG_WARN("Trial: segment copy failed (exit {})", copy.exit_code);
  } else if (!encode.ok()) {
    LOG_WARN("Trial: segment encode failed (exit {})", encode.exit_code);
  } else {
    double orig_kbps = artifact_kbps(src, length);
    double new_kbps = artifact_kbps(enc, length);
    if (orig_kbps <= 0.0 || new_kbps <= 0.0) {
      LOG_WARN("Trial: empty trial artifact");
    } else {
      TrialResult r;
      r.orig_kbps = orig_kbps;
      r.new_kbps = new_kbps;
      r.percent = (1.0 - new_kbps / orig_kbps) * 100.0;
      result = r;
    }
  }

  std::error_code ec;
  fs::remove(src, ec);
  fs::remove(enc, ec);

  return result;
}

} // namespace vidshrink
