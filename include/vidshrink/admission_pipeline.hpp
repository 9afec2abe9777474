/**
 * @file admission_pipeline.hpp
 * @brief Per-file gate chain deciding what happens to each candidate
 *
 * @details Gates run in a fixed order and the first decision other than
 *          Proceed ends the file. Cheap header-only gates come first, so a
 *          file that would be rejected never costs a download:
 *
 *          1. output_exists  : canonical output already present
 *
 *          2. history        : outcome already recorded
 *
 *          3. probe          : container header readable
 *
 *          4. bitrate        : video bitrate above the floor
 *
 *          5. static_savings : codec-ratio estimate above the floor
 *
 *          6. materialize    : file local (blocking download), then prefetch
 *
 *          7. trial          : measured segment savings above the floor
 *
 *          8. disk_space     : room for the output next to the input
 *
 *          9. transcode      : full conversion
 *
 * @note Gates 1 to 5 have no side effects; they double as the prefetch
 *       admission check and as the whole chain in dry-run mode.
 */

#ifndef VIDSHRINK_ADMISSION_PIPELINE_HPP
#define VIDSHRINK_ADMISSION_PIPELINE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cloud_sync.hpp"
#include "config.hpp"
#include "download_coordinator.hpp"
#include "media_prober.hpp"
#include "run_context.hpp"
#include "savings_estimator.hpp"
#include "transcode_executor.hpp"
#include "types.hpp"

namespace vidshrink {

/**
 * @enum GateVerdict
 * @brief What a gate decided for the current file.
 */
enum class GateVerdict {
  Proceed, //< Continue with the next gate
  Skip,    //< Done with this file (optionally recorded)
  Fail,    //< Error; retried next run
  Stop,    //< Interrupt requested, end the run
};

/**
 * @struct GateDecision
 * @brief Tagged gate result.
 */
struct GateDecision {
  GateVerdict verdict = GateVerdict::Proceed;
  std::string reason;
  std::optional<HistoryStatus> record; //< Skip only: permanent outcome
  bool release = false;                //< Skip only: release if local

  static GateDecision proceed() { return {}; }
  static GateDecision skip(std::string why) {
    return {GateVerdict::Skip, std::move(why), std::nullopt, false};
  }
  static GateDecision skip_recorded(std::string why, HistoryStatus status) {
    return {GateVerdict::Skip, std::move(why), status, true};
  }
  static GateDecision fail(std::string why) {
    return {GateVerdict::Fail, std::move(why), std::nullopt, false};
  }
  static GateDecision stop() {
    return {GateVerdict::Stop, "interrupted", std::nullopt, false};
  }
};

/**
 * @enum FileResult
 * @brief Final category of one file, used for the run summary.
 */
enum class FileResult {
  Converted,
  KeptOriginal,
  AlreadyHandled, //< Output exists or history record present
  SkippedRecorded,
  SkippedRetry,   //< Probe failure, timeout, disk space: retried next run
  Failed,
  Interrupted,
  DryRunAccepted, //< Dry run: would have been downloaded and transcoded
};

/**
 * @struct FileReport
 * @brief What happened to one file and which gate decided it.
 */
struct FileReport {
  FileResult result = FileResult::Failed;
  std::string gate;   //< Terminating gate ("" if the chain completed)
  std::string reason;
  uint64_t bytes_saved = 0;
};

/**
 * @struct RunSummary
 * @brief Per-run counters.
 */
struct RunSummary {
  size_t candidates = 0;
  size_t converted = 0;
  size_t kept_original = 0;
  size_t already_handled = 0;
  size_t skipped_recorded = 0;
  size_t skipped_retry = 0;
  size_t failed = 0;
  size_t dry_run_accepted = 0;
  uint64_t bytes_saved = 0;    //< This run only
  bool interrupted = false;
  bool limit_reached = false;  //< MAX_FILES stopped the run
};

/**
 * @class AdmissionPipeline
 * @brief Runs the gate chain over every candidate.
 */
class AdmissionPipeline {
public:
  /// Free bytes at a directory (nullopt when unknown)
  using FreeSpaceFn =
      std::function<std::optional<uint64_t>(const std::filesystem::path &)>;

  AdmissionPipeline(const RunSettings &settings, const EncoderProfile &profile,
                    Prober &prober, SavingsEstimator &estimator,
                    DownloadCoordinator &downloads, TranscodeExecutor &executor,
                    CloudSync &sync, RunContext &ctx);

  /// Gate names in evaluation order
  static const std::vector<std::string> &gate_names();

  /**
   * @brief Process all candidates in order.
   * @note Stops early on an interrupt or when MAX_FILES is reached.
   */
  RunSummary run(std::vector<CandidateFile> &files);

  /**
   * @brief Run the chain for files[index].
   * @note Filesystem exceptions are caught here and reported as Failed.
   */
  FileReport process_file(std::vector<CandidateFile> &files, size_t index);

  /**
   * @brief Side-effect free check of gates 1 to 5 (probe is cached).
   * @return true if the file would reach the materialize gate
   */
  bool admit_cheap(CandidateFile &file);

  /// Replace the free-space query (default: free_space_bytes)
  void set_free_space_fn(FreeSpaceFn fn) { free_space_ = std::move(fn); }

private:
  struct FileState;
  using Gate = GateDecision (AdmissionPipeline::*)(FileState &);
  struct GateEntry {
    const char *name;
    Gate fn;
    bool cheap; //< No side effects; evaluated in dry-run and prefetch
  };

  static const std::vector<GateEntry> &gates();

  // **----- Gates -----**
  GateDecision gate_output_exists(FileState &st);
  GateDecision gate_history(FileState &st);
  GateDecision gate_probe(FileState &st);
  GateDecision gate_bitrate(FileState &st);
  GateDecision gate_static_savings(FileState &st);
  GateDecision gate_materialize(FileState &st);
  GateDecision gate_trial(FileState &st);
  GateDecision gate_disk_space(FileState &st);
  GateDecision gate_transcode(FileState &st);

  /// Apply a Skip decision (history write and release)
  void apply_skip(const CandidateFile &file, const GateDecision &d);

  const RunSettings &settings_;
  const EncoderProfile &profile_;
  Prober &prober_;
  SavingsEstimator &estimator_;
  DownloadCoordinator &downloads_;
  TranscodeExecutor &executor_;
  CloudSync &sync_;
  RunContext &ctx_;
  FreeSpaceFn free_space_;
  size_t transcodes_started_ = 0;
};

/// Human readable result name
const char *to_string(FileResult result);

/**
 * @brief Log the end-of-run summary.
 * @param summary Counters of this run
 * @param total_saved Cumulative bytes saved across all runs
 */
void log_run_summary(const RunSummary &summary, uint64_t total_saved);

} // namespace vidshrink

#endif // VIDSHRINK_ADMISSION_PIPELINE_HPP
