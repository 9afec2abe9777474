/**
 * @file transcode_executor.cpp
 * @brief Full transcode execution and result promotion
 */

#include "vidshrink/transcode_executor.hpp"

#include <chrono>
#include <system_error>

#include <fmt/core.h>

#include "vidshrink/history_store.hpp"
#include "vidshrink/logging.hpp"
#include "vidshrink/system.hpp"

namespace vidshrink {

namespace fs = std::filesystem;

fs::path output_path_for(const fs::path &input,
                         const std::string &codec_family) {
  return input.parent_path() /
         fmt::format("{}_{}{}", input.stem().string(), codec_family,
                     OUTPUT_EXTENSION);
}

fs::path temp_path_for(const fs::path &input,
                       const std::string &codec_family) {
  return input.parent_path() /
         fmt::format("{}_{}{}{}", input.stem().string(), codec_family,
                     PARTIAL_MARKER, OUTPUT_EXTENSION);
}

TranscodeExecutor::TranscodeExecutor(Encoder &encoder, CloudSync &sync,
                                     RunContext &ctx)
    : encoder_(encoder), sync_(sync), ctx_(ctx) {}

void TranscodeExecutor::discard(const fs::path &temp) {
  std::error_code ec;
  fs::remove(temp, ec);
  if (ec)
    LOG_WARN("Could not remove {}: {}", temp.string(), ec.message());
  ctx_.end_attempt();
}

void TranscodeExecutor::release(const fs::path &path) {
  if (sync_.release_to_cloud_only(path))
    LOG_INFO("Released {} to cloud-only", path.filename().string());
}

TranscodeResult TranscodeExecutor::transcode(const CandidateFile &file,
                                             const EncoderProfile &profile) {
  TranscodeResult result;
  std::string name = file.path.filename().string();

  TranscodeAttempt attempt;
  attempt.input = file.path;
  attempt.temp_output = temp_path_for(file.path, profile.codec_family);
  result.temp_path = attempt.temp_output;

  std::error_code ec;
  uint64_t original_size = fs::file_size(file.path, ec);
  if (ec)
    original_size = file.size;

  ctx_.begin_attempt(attempt.temp_output);
  LOG_PHASE("Transcoding {} with {} ({})", name, profile.id,
            format_bytes(original_size));

  attempt.started = std::chrono::steady_clock::now();
  TIMER_START(transcode);
  ProcessResult run =
      encoder_.transcode(file.path, attempt.temp_output, profile);
  TIMER_END(transcode);
  attempt.finished = std::chrono::steady_clock::now();
  attempt.exit_status = run.exit_code;

  double elapsed =
      std::chrono::duration<double>(attempt.finished - attempt.started).count();

  // **----- Interrupted / Failed -----**

  if (run.interrupted) {
    LOG_WARN("Transcode of {} interrupted after {}", name,
             format_time(elapsed));
    discard(attempt.temp_output);
    result.outcome = TranscodeOutcome::Interrupted;
    return result;
  }

  uint64_t new_size = 0;
  if (run.ok()) {
    new_size = fs::file_size(attempt.temp_output, ec);
    if (ec)
      new_size = 0;
  }
  attempt.result_size = new_size;

  if (!run.ok() || new_size == 0) {
    LOG_ERROR("Transcode of {} failed (exit {})", name, run.exit_code);
    discard(attempt.temp_output);
    result.outcome = TranscodeOutcome::Failed;
    return result;
  }

  result.new_size = new_size;
  HistoryStore &history = ctx_.history();

  // **----- Kept Original -----**

  if (new_size >= original_size) {
    LOG_WARN("{}: output {} is not smaller than original {}, keeping original",
             name, format_bytes(new_size), format_bytes(original_size));
    discard(attempt.temp_output);
    if (!history.record_outcome(file.path, HistoryStatus::KeptOriginal, 0,
                                original_size, 0, profile.id))
      LOG_WARN("{}: outcome held in memory until the final flush", name);
    release(file.path);
    result.outcome = TranscodeOutcome::KeptOriginal;
    return result;
  }

  // **----- Converted -----**

  fs::path final_path = output_path_for(file.path, profile.codec_family);
  fs::rename(attempt.temp_output, final_path, ec);
  if (ec) {
    LOG_ERROR("Could not rename {} to {}: {}", attempt.temp_output.string(),
              final_path.filename().string(), ec.message());
    discard(attempt.temp_output);
    result.outcome = TranscodeOutcome::Failed;
    return result;
  }
  ctx_.end_attempt();

  fs::remove(file.path, ec);
  if (ec)
    LOG_WARN("Converted {} but could not delete the original: {}", name,
             ec.message());

  uint64_t saved = original_size - new_size;
  if (!history.record_outcome(file.path, HistoryStatus::Converted, saved,
                              original_size, new_size, profile.id))
    LOG_WARN("{}: outcome held in memory until the final flush", name);
  release(final_path);

  result.outcome = TranscodeOutcome::Converted;
  result.final_path = final_path;
  result.bytes_saved = saved;

  LOG_SUCCESS("{} -> {}: {} -> {} (saved {}, {:.1f}%) in {}", name,
              final_path.filename().string(), format_bytes(original_size),
              format_bytes(new_size), format_bytes(saved),
              100.0 * static_cast<double>(saved) /
                  static_cast<double>(original_size),
              format_time(elapsed));
  return result;
}

} // namespace vidshrink
