/**
 * @file types.hpp
 * @brief Core data types and constants for vidshrink
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - CandidateFile and its lazily attached probe result
 *
 *          - History outcome statuses
 *
 *          - EncoderProfile for the profile registry
 *
 *          - Per-file and per-run result records
 */

#ifndef VIDSHRINK_TYPES_HPP
#define VIDSHRINK_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vidshrink {

// **----- CONSTANTS -----**

constexpr uint64_t BYTES_PER_MB = 1024ULL * 1024ULL;

/// Extension of every artifact this tool writes (final and temporary)
constexpr const char *OUTPUT_EXTENSION = ".mkv";

/// Marker inserted before OUTPUT_EXTENSION for in-flight transcodes
constexpr const char *PARTIAL_MARKER = ".partial";

// **----- DATA STRUCTURES -----**

/**
 * @struct ProbeResult
 * @brief Stream metadata read from the container header.
 */
struct ProbeResult {
  std::string codec;     //< Video codec name (e.g. "h264")
  double bitrate_kbps;   //< Video bitrate, 0 when unknown
  double duration_sec;   //< Container duration, 0 when unknown
};

/**
 * @struct CandidateFile
 * @brief One on-disk media file eligible for processing.
 * @note Enumerated once per run. Only the probe result is ever attached
 *       afterwards; nothing here is persisted.
 */
struct CandidateFile {
  std::filesystem::path path;       //< Absolute path
  uint64_t size = 0;                //< Size in bytes at scan time
  std::optional<ProbeResult> probe; //< Filled by the probe gate or prefetch
};

/**
 * @enum HistoryStatus
 * @brief Permanent outcome recorded for a file.
 */
enum class HistoryStatus {
  Converted,
  KeptOriginal,
  SkippedLowBitrate,
  SkippedLowSavings,
  SkippedTestLowSavings,
};

/// Serialized name of a status (as stored in the history file)
const char *to_string(HistoryStatus status);

/// Parse a serialized status name; nullopt for unknown names
std::optional<HistoryStatus> parse_history_status(const std::string &name);

/**
 * @struct EncoderProfile
 * @brief One candidate encoder configuration.
 */
struct EncoderProfile {
  std::string id;                   //< ffmpeg encoder name, unique
  std::string label;                //< Human readable label
  std::vector<std::string> args;    //< Video encoding arguments, incl. -c:v
  std::string codec_family;         //< Produced codec ("hevc", "av1")
  std::vector<std::string> pre_input_args; //< Device setup before -i
};

/**
 * @struct SavingsEstimate
 * @brief Output of the static codec-ratio estimate.
 */
struct SavingsEstimate {
  uint64_t predicted_new_size;
  double predicted_percent;
};

/**
 * @struct TrialResult
 * @brief Output of a trial-segment encode.
 */
struct TrialResult {
  double orig_kbps;
  double new_kbps;
  double percent;
};

/**
 * @enum TranscodeOutcome
 * @brief Result category of a full transcode.
 */
enum class TranscodeOutcome {
  Converted,    //< Output strictly smaller, original replaced
  KeptOriginal, //< Output not smaller, discarded
  Failed,       //< Encoder error or missing output
  Interrupted,  //< Stop requested while the encoder was running
};

/**
 * @struct TranscodeAttempt
 * @brief One full conversion, owned by the executor while it runs.
 */
struct TranscodeAttempt {
  std::filesystem::path input;
  std::filesystem::path temp_output;
  std::chrono::steady_clock::time_point started;
  std::chrono::steady_clock::time_point finished;
  int exit_status = -1;
  uint64_t result_size = 0;
};

/**
 * @struct TranscodeResult
 * @brief What the executor reports back to the pipeline.
 */
struct TranscodeResult {
  TranscodeOutcome outcome = TranscodeOutcome::Failed;
  std::filesystem::path temp_path;
  std::filesystem::path final_path; //< Set only when converted
  uint64_t new_size = 0;
  uint64_t bytes_saved = 0;
};

} // namespace vidshrink

#endif // VIDSHRINK_TYPES_HPP
