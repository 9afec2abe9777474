/**
 * @file media_prober.cpp
 * @brief libavformat-based header probing
 */

#include "vidshrink/media_prober.hpp"

#include <system_error>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/log.h>
}

#include "vidshrink/logging.hpp"

namespace vidshrink {

namespace fs = std::filesystem;

namespace {

/// Header-sized probe: enough for mp4/mkv/avi indexes, far less than a file
constexpr const char *PROBE_SIZE_BYTES = "5000000";
constexpr const char *ANALYZE_DURATION_US = "5000000";

/// Closes the format context on every return path
struct FormatContextGuard {
  AVFormatContext *ctx = nullptr;
  ~FormatContextGuard() {
    if (ctx)
      avformat_close_input(&ctx);
  }
};

} // anonymous namespace

double estimate_bitrate_kbps(uint64_t size_bytes, double duration_sec) {
  if (duration_sec <= 0.0)
    return 0.0;
  return static_cast<double>(size_bytes) * 8.0 / duration_sec / 1000.0;
}

LibavProber::LibavProber() {
  /// Corrupt headers are expected; we report them ourselves
  av_log_set_level(AV_LOG_ERROR);
}

std::optional<ProbeResult> LibavProber::probe(const fs::path &path) {
  FormatContextGuard guard;

  AVDictionary *opts = nullptr;
  av_dict_set(&opts, "probesize", PROBE_SIZE_BYTES, 0);
  av_dict_set(&opts, "analyzeduration", ANALYZE_DURATION_US, 0);
  int ret = avformat_open_input(&guard.ctx, path.string().c_str(), nullptr,
                                &opts);
  av_dict_free(&opts);
  if (ret < 0) {
    LOG_WARN("Probe: cannot open {}", path.filename().string());
    return std::nullopt;
  }

  if (avformat_find_stream_info(guard.ctx, nullptr) < 0) {
    LOG_WARN("Probe: no stream info in {}", path.filename().string());
    return std::nullopt;
  }

  int video_idx =
      av_find_best_stream(guard.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_idx < 0) {
    LOG_WARN("Probe: no video stream in {}", path.filename().string());
    return std::nullopt;
  }

  const AVCodecParameters *par = guard.ctx->streams[video_idx]->codecpar;

  ProbeResult result;
  result.codec = avcodec_get_name(par->codec_id);
  result.duration_sec =
      (guard.ctx->duration != AV_NOPTS_VALUE)
          ? guard.ctx->duration / static_cast<double>(AV_TIME_BASE)
          : 0.0;

  if (par->bit_rate > 0) {
    result.bitrate_kbps = par->bit_rate / 1000.0;
  } else {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    result.bitrate_kbps =
        ec ? 0.0 : estimate_bitrate_kbps(size, result.duration_sec);
  }

  return result;
}

} // namespace vidshrink
