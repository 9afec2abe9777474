/**
 * @file encoder.cpp
 * @brief ffmpeg command construction and execution
 */

#include "vidshrink/encoder.hpp"

#include <utility>

#include <fmt/core.h>

#include "vidshrink/logging.hpp"

namespace vidshrink {

namespace fs = std::filesystem;

FFmpegEncoder::FFmpegEncoder(std::string ffmpeg_bin, int threads)
    : ffmpeg_bin_(std::move(ffmpeg_bin)), threads_(threads > 0 ? threads : 1) {
}

std::vector<std::string> FFmpegEncoder::base_command() const {
  return {ffmpeg_bin_, "-nostdin", "-hide_banner", "-loglevel", "error", "-y"};
}

// **----- Command Construction -----**

std::vector<std::string>
FFmpegEncoder::probe_command(const EncoderProfile &profile,
                             const fs::path &output) const {
  auto cmd = base_command();
  cmd.insert(cmd.end(), profile.pre_input_args.begin(),
             profile.pre_input_args.end());
  cmd.insert(cmd.end(), {"-f", "lavfi", "-i", "color=c=black:s=320x240:r=25:d=1",
                         "-frames:v", "25"});
  cmd.insert(cmd.end(), profile.args.begin(), profile.args.end());
  cmd.insert(cmd.end(), {"-an", output.string()});
  return cmd;
}

std::vector<std::string>
FFmpegEncoder::segment_command(const fs::path &input, const fs::path &output,
                               const EncoderProfile *profile, double start,
                               double duration) const {
  auto cmd = base_command();
  /// Input-side seek: fast, and both trial artifacts start at the same keyframe
  cmd.insert(cmd.end(), {"-ss", fmt::format("{:.3f}", start)});
  if (profile) {
    cmd.insert(cmd.end(), {"-hwaccel", "auto"});
    cmd.insert(cmd.end(), profile->pre_input_args.begin(),
               profile->pre_input_args.end());
  }
  cmd.insert(cmd.end(), {"-i", input.string(), "-t",
                         fmt::format("{:.3f}", duration), "-map", "0:v:0",
                         "-an", "-sn", "-dn"});
  if (profile) {
    cmd.insert(cmd.end(), {"-threads", std::to_string(threads_)});
    cmd.insert(cmd.end(), profile->args.begin(), profile->args.end());
  } else {
    cmd.insert(cmd.end(), {"-c:v", "copy"});
  }
  cmd.push_back(output.string());
  return cmd;
}

std::vector<std::string>
FFmpegEncoder::transcode_command(const fs::path &input, const fs::path &output,
                                 const EncoderProfile &profile) const {
  auto cmd = base_command();
  cmd.insert(cmd.end(), {"-hwaccel", "auto", "-threads",
                         std::to_string(threads_)});
  cmd.insert(cmd.end(), profile.pre_input_args.begin(),
             profile.pre_input_args.end());
  cmd.insert(cmd.end(), {"-i", input.string(), "-map", "0:v:0", "-map",
                         "0:a?", "-threads", std::to_string(threads_)});
  cmd.insert(cmd.end(), profile.args.begin(), profile.args.end());
  cmd.insert(cmd.end(), {"-c:a", "copy", output.string()});
  return cmd;
}

// **----- Execution -----**

ProcessResult FFmpegEncoder::probe_profile(const EncoderProfile &profile,
                                           const fs::path &output) {
  return run_process(probe_command(profile, output));
}

ProcessResult FFmpegEncoder::extract_segment(const fs::path &input,
                                             const fs::path &output,
                                             double start, double duration) {
  return run_process(segment_command(input, output, nullptr, start, duration));
}

ProcessResult FFmpegEncoder::encode_segment(const fs::path &input,
                                            const fs::path &output,
                                            const EncoderProfile &profile,
                                            double start, double duration) {
  return run_process(segment_command(input, output, &profile, start, duration));
}

ProcessResult FFmpegEncoder::transcode(const fs::path &input,
                                       const fs::path &output,
                                       const EncoderProfile &profile) {
  auto cmd = transcode_command(input, output, profile);
  LOG_INFO("Running: {}", describe_command(cmd));
  return run_process(cmd);
}

} // namespace vidshrink
