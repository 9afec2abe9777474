/**
 * @file main.cpp
 * @brief Entry point for vidshrink
 *
 * @details Main entry point that handles:
 *
 *          - Root resolution: argument, VIDSHRINK_ROOT, then discovery
 *
 *          - Configuration, log file and signal handler setup
 *
 *          - Encoder selection (fatal when nothing works)
 *
 *          - Scan, admission pipeline and run summary
 *
 * @note Exit codes: 0 when the run completed (per-file failures included),
 *       1 on a fatal error, 128 + N when stopped by signal N.
 */

#include <cstdio>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "vidshrink/admission_pipeline.hpp"
#include "vidshrink/cloud_sync.hpp"
#include "vidshrink/config.hpp"
#include "vidshrink/download_coordinator.hpp"
#include "vidshrink/encoder.hpp"
#include "vidshrink/encoder_registry.hpp"
#include "vidshrink/file_scanner.hpp"
#include "vidshrink/history_store.hpp"
#include "vidshrink/logging.hpp"
#include "vidshrink/media_prober.hpp"
#include "vidshrink/run_context.hpp"
#include "vidshrink/savings_estimator.hpp"
#include "vidshrink/system.hpp"
#include "vidshrink/transcode_executor.hpp"

using namespace vidshrink;
namespace fs = std::filesystem;

namespace {

constexpr int EXIT_FATAL = 1;

std::optional<fs::path> resolve_root(int argc, char *argv[]) {
  if (argc >= 2)
    return fs::path(argv[1]);
  std::string env_root = Config::root_override();
  if (!env_root.empty())
    return fs::path(env_root);
  return discover_root();
}

/// Exit status after the pipeline returned
int finish(RunContext &ctx) {
  if (!ctx.shutdown())
    LOG_WARN("Outcomes of this run may be retried next time");
  TimingCollector::print_summary();
  close_log_file();
  return ctx.exit_code();
}

} // anonymous namespace

// **----- MAIN -----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc > 2) {
    LOG_WARN("Usage: ./vidshrink [root]");
    return EXIT_FATAL;
  }

  auto root = resolve_root(argc, argv);
  std::error_code ec;
  if (!root || !fs::is_directory(*root, ec)) {
    LOG_ERROR("Root folder not found{}",
              root ? fmt::format(": {}", root->string()) : std::string());
    return EXIT_FATAL;
  }

  RunSettings settings;
  try {
    settings = Config::run_settings(*root);
  } catch (const std::invalid_argument &e) {
    LOG_ERROR("Invalid configuration: {}", e.what());
    return EXIT_FATAL;
  } catch (const std::out_of_range &e) {
    LOG_ERROR("Invalid configuration (value out of range): {}", e.what());
    return EXIT_FATAL;
  }

  if (!open_log_file(settings.log_file))
    LOG_WARN("Cannot open log file {}, logging to console only",
             settings.log_file.string());

  LOG_PHASE("vidshrink");
  LOG_INFO("Root: {}", settings.root.string());
  LOG_INFO("History: {}", settings.history_file.string());
  if (settings.dry_run)
    LOG_INFO("Dry run: no downloads, transcodes or history writes");

  if (!InterruptHandler::install()) {
    close_log_file();
    return EXIT_FATAL;
  }

  fs::path scratch = fs::temp_directory_path(ec);
  if (ec)
    scratch = settings.root;

  // **----- Encoder -----**

  int threads = detect_cpu_limit();
  FFmpegEncoder encoder(settings.ffmpeg_bin, threads);
  auto profile = select_encoder(encoder, default_profiles(), scratch,
                                settings.forced_encoder);
  if (!profile) {
    if (InterruptHandler::requested()) {
      close_log_file();
      return 128 + InterruptHandler::signal_number();
    }
    LOG_ERROR("No usable encoder");
    close_log_file();
    return EXIT_FATAL;
  }
  LOG_INFO("Encoding with {} threads", threads);

  // **----- Run -----**

  HistoryStore history = HistoryStore::load(settings.history_file, settings.root);
  RunContext ctx(history);
  LOG_INFO("History: {} records, {} saved so far", history.size(),
           format_bytes(history.total_saved_bytes()));

  TIMER_START(scan);
  std::vector<CandidateFile> files = scan_candidates(
      settings.root, settings.min_file_size_mb * BYTES_PER_MB);
  TIMER_END(scan);
  LOG_INFO("Found {} candidate files (>= {} MB)", files.size(),
           settings.min_file_size_mb);

  LibavProber prober;
  PosixCloudSync sync(settings.cloud_release_cmd);
  SavingsEstimator estimator(encoder, prober, scratch);
  DownloadCoordinator downloads(sync, settings);
  TranscodeExecutor executor(encoder, sync, ctx);
  AdmissionPipeline pipeline(settings, *profile, prober, estimator, downloads,
                             executor, sync, ctx);

  RunSummary summary = pipeline.run(files);
  log_run_summary(summary, history.total_saved_bytes());

  return finish(ctx);
}
