/**
 * @file admission_pipeline.cpp
 * @brief Gate chain implementation
 */

#include "vidshrink/admission_pipeline.hpp"

#include <system_error>

#include <fmt/core.h>

#include "vidshrink/history_store.hpp"
#include "vidshrink/logging.hpp"
#include "vidshrink/system.hpp"

namespace vidshrink {

namespace fs = std::filesystem;

/// Mutable state of the file currently walking the chain
struct AdmissionPipeline::FileState {
  std::vector<CandidateFile> &files;
  size_t index;
  CandidateFile &file;
  std::optional<TranscodeResult> transcode;
};

const char *to_string(FileResult result) {
  switch (result) {
  case FileResult::Converted:
    return "converted";
  case FileResult::KeptOriginal:
    return "kept original";
  case FileResult::AlreadyHandled:
    return "already handled";
  case FileResult::SkippedRecorded:
    return "skipped (recorded)";
  case FileResult::SkippedRetry:
    return "skipped (retry next run)";
  case FileResult::Failed:
    return "failed";
  case FileResult::Interrupted:
    return "interrupted";
  case FileResult::DryRunAccepted:
    return "would convert";
  }
  return "failed";
}

// **----- Construction -----**

AdmissionPipeline::AdmissionPipeline(const RunSettings &settings,
                                     const EncoderProfile &profile,
                                     Prober &prober,
                                     SavingsEstimator &estimator,
                                     DownloadCoordinator &downloads,
                                     TranscodeExecutor &executor,
                                     CloudSync &sync, RunContext &ctx)
    : settings_(settings), profile_(profile), prober_(prober),
      estimator_(estimator), downloads_(downloads), executor_(executor),
      sync_(sync), ctx_(ctx), free_space_(free_space_bytes) {}

const std::vector<AdmissionPipeline::GateEntry> &AdmissionPipeline::gates() {
  static const std::vector<GateEntry> chain = {
      {"output_exists", &AdmissionPipeline::gate_output_exists, true},
      {"history", &AdmissionPipeline::gate_history, true},
      {"probe", &AdmissionPipeline::gate_probe, true},
      {"bitrate", &AdmissionPipeline::gate_bitrate, true},
      {"static_savings", &AdmissionPipeline::gate_static_savings, true},
      {"materialize", &AdmissionPipeline::gate_materialize, false},
      {"trial", &AdmissionPipeline::gate_trial, false},
      {"disk_space", &AdmissionPipeline::gate_disk_space, false},
      {"transcode", &AdmissionPipeline::gate_transcode, false},
  };
  return chain;
}

const std::vector<std::string> &AdmissionPipeline::gate_names() {
  static const std::vector<std::string> names = [] {
    std::vector<std::string> n;
    for (const auto &g : gates())
      n.emplace_back(g.name);
    return n;
  }();
  return names;
}

// **----- Gates -----**

GateDecision AdmissionPipeline::gate_output_exists(FileState &st) {
  std::error_code ec;
  fs::path out = output_path_for(st.file.path, profile_.codec_family);
  if (fs::exists(out, ec))
    return GateDecision::skip(
        fmt::format("output {} already exists", out.filename().string()));
  return GateDecision::proceed();
}

GateDecision AdmissionPipeline::gate_history(FileState &st) {
  const HistoryRecord *rec = ctx_.history().find(st.file.path);
  if (rec)
    return GateDecision::skip(
        fmt::format("already {} on {}", to_string(rec->status), rec->timestamp));
  return GateDecision::proceed();
}

GateDecision AdmissionPipeline::gate_probe(FileState &st) {
  if (!st.file.probe) {
    TIMER_START(probe);
    st.file.probe = prober_.probe(st.file.path);
    TIMER_END(probe);
  }
  if (!st.file.probe)
    return GateDecision::skip("cannot read media header");
  return GateDecision::proceed();
}

GateDecision AdmissionPipeline::gate_bitrate(FileState &st) {
  const ProbeResult &p = *st.file.probe;
  /// Unknown bitrate (0) is not evidence of an efficient file
  if (p.bitrate_kbps > 0.0 && p.bitrate_kbps < settings_.min_bitrate_kbps)
    return GateDecision::skip_recorded(
        fmt::format("{} at {:.0f} kbps is below {:.0f} kbps", p.codec,
                    p.bitrate_kbps, settings_.min_bitrate_kbps),
        HistoryStatus::SkippedLowBitrate);
  return GateDecision::proceed();
}

GateDecision AdmissionPipeline::gate_static_savings(FileState &st) {
  SavingsEstimate est = estimate_static(st.file.probe->codec, st.file.size);
  if (est.predicted_percent < settings_.min_savings_pct)
    return GateDecision::skip_recorded(
        fmt::format("{} predicted to save {:.1f}% (< {:.1f}%)",
                    st.file.probe->codec, est.predicted_percent,
                    settings_.min_savings_pct),
        HistoryStatus::SkippedLowSavings);
  return GateDecision::proceed();
}

GateDecision AdmissionPipeline::gate_materialize(FileState &st) {
  if (!downloads_.ensure_local(st.file)) {
    if (ctx_.interrupted())
      return GateDecision::stop();
    return GateDecision::skip("not available locally (download timed out)");
  }

  size_t triggered = downloads_.prefetch(
      st.files, st.index + 1, [this](CandidateFile &c) { return admit_cheap(c); });
  if (triggered > 0)
    LOG_INFO("Prefetch: {} download(s) in flight", downloads_.in_flight_count());
  return GateDecision::proceed();
}

GateDecision AdmissionPipeline::gate_trial(FileState &st) {
  auto trial =
      estimator_.trial_encode(st.file, profile_, settings_.trial_duration_sec);
  if (ctx_.interrupted())
    return GateDecision::stop();

  if (!trial) {
    LOG_WARN("Trial encode failed for {}, continuing with full conversion",
             st.file.path.filename().string());
    return GateDecision::proceed();
  }

  LOG_INFO("Trial: {:.0f} kbps -> {:.0f} kbps ({:.1f}%)", trial->orig_kbps,
           trial->new_kbps, trial->percent);
  if (trial->percent < settings_.min_savings_pct)
    return GateDecision::skip_recorded(
        fmt::format("trial saved {:.1f}% (< {:.1f}%)", trial->percent,
                    settings_.min_savings_pct),
        HistoryStatus::SkippedTestLowSavings);
  return GateDecision::proceed();
}

GateDecision AdmissionPipeline::gate_disk_space(FileState &st) {
  fs::path dir = st.file.path.parent_path();
  auto free = free_space_(dir);
  if (!free) {
    LOG_WARN("Free space at {} unknown, continuing", dir.string());
    return GateDecision::proceed();
  }

  auto required = static_cast<uint64_t>(static_cast<double>(st.file.size) *
                                        settings_.disk_space_factor);
  if (*free < required)
    return GateDecision::skip(fmt::format("needs {} free, {} available",
                                          format_bytes(required),
                                          format_bytes(*free)));
  return GateDecision::proceed();
}

GateDecision AdmissionPipeline::gate_transcode(FileState &st) {
  ++transcodes_started_;
  st.transcode = executor_.transcode(st.file, profile_);
  switch (st.transcode->outcome) {
  case TranscodeOutcome::Interrupted:
    return GateDecision::stop();
  case TranscodeOutcome::Failed:
    return GateDecision::fail("transcode failed");
  case TranscodeOutcome::Converted:
  case TranscodeOutcome::KeptOriginal:
    break;
  }
  return GateDecision::proceed();
}

// **----- Chain -----**

bool AdmissionPipeline::admit_cheap(CandidateFile &file) {
  std::vector<CandidateFile> single;
  FileState st{single, 0, file, std::nullopt};
  for (const auto &g : gates()) {
    if (!g.cheap)
      break;
    if ((this->*g.fn)(st).verdict != GateVerdict::Proceed)
      return false;
  }
  return true;
}

void AdmissionPipeline::apply_skip(const CandidateFile &file,
                                   const GateDecision &d) {
  if (!d.record)
    return;

  HistoryStore &history = ctx_.history();
  if (!history.record_outcome(file.path, *d.record, 0, file.size, 0,
                              profile_.id))
    LOG_WARN("{}: outcome held in memory until the final flush",
             file.path.filename().string());

  if (d.release && sync_.is_locally_available(file.path) &&
      sync_.release_to_cloud_only(file.path))
    LOG_INFO("Released {} to cloud-only", file.path.filename().string());
}

FileReport AdmissionPipeline::process_file(std::vector<CandidateFile> &files,
                                           size_t index) {
  FileState st{files, index, files[index], std::nullopt};
  FileReport report;
  std::string name = st.file.path.filename().string();

  try {
    for (const auto &g : gates()) {
      if (settings_.dry_run && !g.cheap) {
        LOG_INFO("[dry run] {}: would download, trial and transcode", name);
        report.result = FileResult::DryRunAccepted;
        return report;
      }

      GateDecision d = (this->*g.fn)(st);
      if (d.verdict == GateVerdict::Proceed)
        continue;

      report.gate = g.name;
      report.reason = d.reason;

      switch (d.verdict) {
      case GateVerdict::Stop:
        LOG_WARN("{}: stopped at {}", name, g.name);
        report.result = FileResult::Interrupted;
        break;
      case GateVerdict::Fail:
        LOG_ERROR("{}: {} (will retry next run)", name, d.reason);
        report.result = FileResult::Failed;
        break;
      case GateVerdict::Skip:
        if (report.gate == "output_exists" || report.gate == "history") {
          LOG_INFO("Skip {}: {}", name, d.reason);
          report.result = FileResult::AlreadyHandled;
        } else if (d.record) {
          LOG_INFO("{}Skip {}: {} [{}]", settings_.dry_run ? "[dry run] " : "",
                   name, d.reason, to_string(*d.record));
          if (!settings_.dry_run)
            apply_skip(st.file, d);
          report.result = FileResult::SkippedRecorded;
        } else {
          LOG_WARN("Skip {}: {} (will retry next run)", name, d.reason);
          report.result = FileResult::SkippedRetry;
        }
        break;
      case GateVerdict::Proceed:
        break;
      }
      return report;
    }
  } catch (const fs::filesystem_error &e) {
    LOG_ERROR("{}: filesystem error: {}", name, e.what());
    report.result = FileResult::Failed;
    report.reason = e.what();
    return report;
  }

  if (st.transcode && st.transcode->outcome == TranscodeOutcome::Converted) {
    report.result = FileResult::Converted;
    report.bytes_saved = st.transcode->bytes_saved;
  } else {
    report.result = FileResult::KeptOriginal;
  }
  return report;
}

RunSummary AdmissionPipeline::run(std::vector<CandidateFile> &files) {
  RunSummary summary;
  summary.candidates = files.size();

  for (size_t i = 0; i < files.size(); ++i) {
    if (ctx_.interrupted()) {
      summary.interrupted = true;
      break;
    }
    if (settings_.max_files > 0 &&
        transcodes_started_ >= static_cast<size_t>(settings_.max_files)) {
      LOG_INFO("MAX_FILES={} reached, stopping", settings_.max_files);
      summary.limit_reached = true;
      break;
    }

    LOG_PHASE("[{}/{}] {}", i + 1, files.size(), files[i].path.string());
    FileReport report = process_file(files, i);

    switch (report.result) {
    case FileResult::Converted:
      ++summary.converted;
      summary.bytes_saved += report.bytes_saved;
      break;
    case FileResult::KeptOriginal:
      ++summary.kept_original;
      break;
    case FileResult::AlreadyHandled:
      ++summary.already_handled;
      break;
    case FileResult::SkippedRecorded:
      ++summary.skipped_recorded;
      break;
    case FileResult::SkippedRetry:
      ++summary.skipped_retry;
      break;
    case FileResult::Failed:
      ++summary.failed;
      break;
    case FileResult::DryRunAccepted:
      ++summary.dry_run_accepted;
      break;
    case FileResult::Interrupted:
      summary.interrupted = true;
      break;
    }
    if (summary.interrupted)
      break;
  }
  return summary;
}

// **----- Summary -----**

void log_run_summary(const RunSummary &s, uint64_t total_saved) {
  LOG_PHASE("Run summary");
  LOG_INFO("  Candidates        : {}", s.candidates);
  LOG_INFO("  Converted         : {}", s.converted);
  LOG_INFO("  Kept original     : {}", s.kept_original);
  LOG_INFO("  Already handled   : {}", s.already_handled);
  LOG_INFO("  Skipped (recorded): {}", s.skipped_recorded);
  LOG_INFO("  Skipped (retry)   : {}", s.skipped_retry);
  LOG_INFO("  Failed            : {}", s.failed);
  if (s.dry_run_accepted > 0)
    LOG_INFO("  Would convert     : {}", s.dry_run_accepted);
  LOG_INFO("  Saved this run    : {}", format_bytes(s.bytes_saved));
  LOG_SUCCESS("  Saved overall     : {}", format_bytes(total_saved));
  if (s.interrupted)
    LOG_WARN("Run was interrupted; remaining files will be handled next run");
  else if (s.limit_reached)
    LOG_INFO("File limit reached; remaining files will be handled next run");
}

} // namespace vidshrink
