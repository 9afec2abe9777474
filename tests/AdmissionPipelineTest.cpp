#include <gtest/gtest.h>

#include "Fakes.hpp"
#include "vidshrink/admission_pipeline.hpp"
#include "vidshrink/history_store.hpp"

namespace vidshrink::tests {

class AdmissionPipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    InterruptHandler::reset();
    settings.root = dir.path();
    settings.history_file = dir.path() / ".vidshrink_history.json";
    settings.download_poll_sec = 0.001;
    settings.download_timeout_sec = 0.05;
    encoder.transcode_size = 420'000'000;
    history = HistoryStore(settings.history_file, settings.root);
  }
  void TearDown() override { InterruptHandler::reset(); }

  CandidateFile add(const std::string &name, uint64_t size,
                    const std::string &codec, double kbps,
                    double duration = 3600.0) {
    fs::path path = dir.path() / name;
    write_file(path, size);
    prober.results[path] = ProbeResult{codec, kbps, duration};
    CandidateFile c;
    c.path = path;
    c.size = size;
    return c;
  }

  RunSummary run(std::vector<CandidateFile> &files) {
    RunContext ctx(history);
    SavingsEstimator estimator(encoder, prober, dir.path() / "scratch");
    DownloadCoordinator downloads(sync, settings);
    TranscodeExecutor executor(encoder, sync, ctx);
    AdmissionPipeline pipeline(settings, profile, prober, estimator, downloads,
                               executor, sync, ctx);
    pipeline.set_free_space_fn(
        [this](const fs::path &) { return free_space; });
    RunSummary s = pipeline.run(files);
    EXPECT_TRUE(ctx.shutdown());
    return s;
  }

  /// Fresh scan-like copy of the candidates (no cached probe results)
  static std::vector<CandidateFile> rescan(const std::vector<CandidateFile> &f) {
    std::vector<CandidateFile> out;
    for (const auto &c : f) {
      if (!fs::exists(c.path))
        continue;
      CandidateFile copy;
      copy.path = c.path;
      copy.size = c.size;
      out.push_back(copy);
    }
    return out;
  }

  std::optional<HistoryStatus> status_of(const CandidateFile &c) const {
    const HistoryRecord *rec = history.find(c.path);
    if (!rec)
      return std::nullopt;
    return rec->status;
  }

  void SetUpScratch() { fs::create_directories(dir.path() / "scratch"); }

  TempDir dir;
  RunSettings settings;
  HistoryStore history{fs::path(), fs::path()};
  FakeProber prober;
  FakeEncoder encoder;
  FakeCloudSync sync;
  EncoderProfile profile = test_profile();
  std::optional<uint64_t> free_space = uint64_t{1} << 50;
};

TEST_F(AdmissionPipelineTest, gateOrder) {
  EXPECT_EQ(AdmissionPipeline::gate_names(),
            (std::vector<std::string>{"output_exists", "history", "probe",
                                      "bitrate", "static_savings",
                                      "materialize", "trial", "disk_space",
                                      "transcode"}));
}

TEST_F(AdmissionPipelineTest, h264IsConverted) {
  SetUpScratch();
  std::vector<CandidateFile> files = {
      add("Movies/holiday.mp4", 1'000'000'000, "h264", 8000.0)};

  RunSummary s = run(files);
  EXPECT_EQ(s.converted, 1u);
  EXPECT_EQ(s.bytes_saved, 580'000'000u);

  fs::path out = dir.path() / "Movies" / "holiday_hevc.mkv";
  EXPECT_TRUE(fs::exists(out));
  EXPECT_EQ(fs::file_size(out), 420'000'000u);
  EXPECT_FALSE(fs::exists(files[0].path));
  EXPECT_EQ(status_of(files[0]), HistoryStatus::Converted);
  EXPECT_EQ(history.total_saved_bytes(), 580'000'000u);

  /// Trial artifacts never stay behind
  EXPECT_TRUE(fs::is_empty(dir.path() / "scratch"));
}

TEST_F(AdmissionPipelineTest, lowBitrateIsRecordedWithoutDownload) {
  std::vector<CandidateFile> files = {
      add("old.mkv", 400'000'000, "hevc", 1200.0)};
  sync.cloud_only.insert(files[0].path);

  RunSummary s = run(files);
  EXPECT_EQ(s.skipped_recorded, 1u);
  EXPECT_EQ(status_of(files[0]), HistoryStatus::SkippedLowBitrate);
  EXPECT_TRUE(sync.download_requests.empty());
  EXPECT_TRUE(encoder.transcoded.empty());
  EXPECT_EQ(encoder.segment_encodes, 0u);
  /// Not local, so there is nothing to release
  EXPECT_TRUE(sync.released.empty());
}

TEST_F(AdmissionPipelineTest, localLowBitrateFileIsReleased) {
  std::vector<CandidateFile> files = {
      add("old.mkv", 400'000'000, "h264", 900.0)};

  run(files);
  EXPECT_EQ(status_of(files[0]), HistoryStatus::SkippedLowBitrate);
  EXPECT_TRUE(sync.was_released(files[0].path));
}

TEST_F(AdmissionPipelineTest, efficientCodecIsRecordedAsLowSavings) {
  std::vector<CandidateFile> files = {
      add("new.mkv", 2'000'000'000, "hevc", 9000.0)};
  sync.cloud_only.insert(files[0].path);

  run(files);
  EXPECT_EQ(status_of(files[0]), HistoryStatus::SkippedLowSavings);
  EXPECT_TRUE(sync.download_requests.empty());
}

TEST_F(AdmissionPipelineTest, lowTrialSavingsSkipsTranscode) {
  SetUpScratch();
  std::vector<CandidateFile> files = {
      add("grainy.mp4", 900'000'000, "h264", 6000.0)};
  encoder.segment_copy_size = 3'000'000;
  encoder.segment_encode_size = 2'820'000; // 6% smaller

  RunSummary s = run(files);
  EXPECT_EQ(s.skipped_recorded, 1u);
  EXPECT_EQ(status_of(files[0]), HistoryStatus::SkippedTestLowSavings);
  EXPECT_TRUE(encoder.transcoded.empty());
  EXPECT_TRUE(fs::exists(files[0].path));
  EXPECT_TRUE(sync.was_released(files[0].path));
  EXPECT_TRUE(fs::is_empty(dir.path() / "scratch"));
}

TEST_F(AdmissionPipelineTest, failedTrialFallsThroughToTranscode) {
  SetUpScratch();
  std::vector<CandidateFile> files = {
      add("odd.avi", 1'000'000'000, "mpeg4", 5000.0)};
  encoder.segment_encode_fails = true;

  RunSummary s = run(files);
  EXPECT_EQ(s.converted, 1u);
  EXPECT_EQ(encoder.transcoded.size(), 1u);
}

TEST_F(AdmissionPipelineTest, unknownBitrateIsNotLow) {
  SetUpScratch();
  std::vector<CandidateFile> files = {
      add("stream.ts", 1'000'000'000, "mpeg2video", 0.0)};

  RunSummary s = run(files);
  EXPECT_EQ(s.converted, 1u);
}

TEST_F(AdmissionPipelineTest, rerunIsIdempotent) {
  SetUpScratch();
  std::vector<CandidateFile> files = {
      add("a.mp4", 1'000'000'000, "h264", 8000.0),
      add("b.mkv", 400'000'000, "hevc", 1200.0),
      add("c.mp4", 900'000'000, "h264", 6000.0)};

  RunSummary first = run(files);
  EXPECT_EQ(first.converted + first.skipped_recorded, 3u);
  size_t transcodes = encoder.transcoded.size();
  size_t probes = prober.probed.size();
  uint64_t saved = history.total_saved_bytes();
  size_t records = history.size();

  history = HistoryStore::load(settings.history_file, settings.root);
  auto again = rescan(files);
  RunSummary second = run(again);

  EXPECT_EQ(second.converted, 0u);
  EXPECT_EQ(second.skipped_recorded, 0u);
  EXPECT_EQ(second.already_handled, again.size());
  EXPECT_EQ(encoder.transcoded.size(), transcodes);
  EXPECT_EQ(prober.probed.size(), probes);
  EXPECT_EQ(history.total_saved_bytes(), saved);
  EXPECT_EQ(history.size(), records);
}

TEST_F(AdmissionPipelineTest, existingOutputIsSkippedBeforeProbe) {
  std::vector<CandidateFile> files = {
      add("clip.mp4", 1'000'000'000, "h264", 8000.0)};
  write_file(dir.path() / "clip_hevc.mkv", 100);

  RunSummary s = run(files);
  EXPECT_EQ(s.already_handled, 1u);
  EXPECT_EQ(prober.probe_count(files[0].path), 0u);
  EXPECT_FALSE(history.has(files[0].path));
}

TEST_F(AdmissionPipelineTest, probeFailureIsRetried) {
  std::vector<CandidateFile> files = {
      add("broken.mp4", 1'000'000'000, "h264", 8000.0)};
  prober.results.clear();

  RunSummary s = run(files);
  EXPECT_EQ(s.skipped_retry, 1u);
  EXPECT_FALSE(history.has(files[0].path));
}

TEST_F(AdmissionPipelineTest, downloadTimeoutIsRetriedNextRun) {
  std::vector<CandidateFile> files = {
      add("far.mp4", 1'000'000'000, "h264", 8000.0)};
  sync.cloud_only.insert(files[0].path);
  sync.downloads_work = false;

  RunSummary s = run(files);
  EXPECT_EQ(s.skipped_retry, 1u);
  EXPECT_FALSE(history.has(files[0].path));
  EXPECT_TRUE(encoder.transcoded.empty());

  auto again = rescan(files);
  run(again);
  EXPECT_EQ(sync.download_requests.size(), 2u);
}

TEST_F(AdmissionPipelineTest, cloudFileIsDownloadedThenConverted) {
  SetUpScratch();
  std::vector<CandidateFile> files = {
      add("far.mp4", 1'000'000'000, "h264", 8000.0)};
  sync.cloud_only.insert(files[0].path);
  sync.polls_to_materialize = 2;

  RunSummary s = run(files);
  EXPECT_EQ(s.converted, 1u);
  EXPECT_TRUE(sync.was_requested(files[0].path));
}

TEST_F(AdmissionPipelineTest, insufficientDiskSpaceIsRetried) {
  SetUpScratch();
  std::vector<CandidateFile> files = {
      add("big.mp4", 1'000'000'000, "h264", 8000.0)};
  free_space = 1'050'000'000; // < 1.1 x input

  RunSummary s = run(files);
  EXPECT_EQ(s.skipped_retry, 1u);
  EXPECT_FALSE(history.has(files[0].path));
  EXPECT_TRUE(encoder.transcoded.empty());
}

TEST_F(AdmissionPipelineTest, transcodeFailureIsRetried) {
  SetUpScratch();
  std::vector<CandidateFile> files = {
      add("bad.mp4", 1'000'000'000, "h264", 8000.0)};
  encoder.transcode_size.reset();

  RunSummary s = run(files);
  EXPECT_EQ(s.failed, 1u);
  EXPECT_FALSE(history.has(files[0].path));
  EXPECT_TRUE(fs::exists(files[0].path));
  EXPECT_FALSE(fs::exists(dir.path() / "bad_hevc.partial.mkv"));
}

TEST_F(AdmissionPipelineTest, largerOutputKeepsOriginal) {
  SetUpScratch();
  std::vector<CandidateFile> files = {
      add("tight.mp4", 400'000'000, "h264", 8000.0)};
  encoder.transcode_size = 450'000'000;

  RunSummary s = run(files);
  EXPECT_EQ(s.kept_original, 1u);
  EXPECT_EQ(status_of(files[0]), HistoryStatus::KeptOriginal);
  EXPECT_TRUE(fs::exists(files[0].path));
  EXPECT_FALSE(fs::exists(dir.path() / "tight_hevc.mkv"));
  EXPECT_EQ(history.total_saved_bytes(), 0u);
}

TEST_F(AdmissionPipelineTest, prefetchOnlyAdmissibleCandidates) {
  SetUpScratch();
  std::vector<CandidateFile> files = {
      add("1.mp4", 1'000'000'000, "h264", 8000.0),
      add("2.mkv", 500'000'000, "hevc", 1000.0),
      add("3.mp4", 800'000'000, "h264", 8000.0)};
  sync.cloud_only.insert(files[1].path);
  sync.cloud_only.insert(files[2].path);
  sync.downloads_work = false;
  settings.max_files = 1;

  run(files);
  EXPECT_FALSE(sync.was_requested(files[1].path));
  EXPECT_TRUE(sync.was_requested(files[2].path));
  /// Prefetch never writes history
  EXPECT_FALSE(history.has(files[1].path));
}

TEST_F(AdmissionPipelineTest, maxFilesStopsTheRun) {
  SetUpScratch();
  std::vector<CandidateFile> files = {
      add("1.mp4", 1'000'000'000, "h264", 8000.0),
      add("2.mp4", 1'000'000'000, "h264", 8000.0)};
  settings.max_files = 1;

  RunSummary s = run(files);
  EXPECT_TRUE(s.limit_reached);
  EXPECT_EQ(encoder.transcoded.size(), 1u);
  EXPECT_FALSE(history.has(files[1].path));
}

TEST_F(AdmissionPipelineTest, dryRunHasNoSideEffects) {
  std::vector<CandidateFile> files = {
      add("a.mp4", 1'000'000'000, "h264", 8000.0),
      add("b.mkv", 400'000'000, "hevc", 1200.0)};
  sync.cloud_only.insert(files[0].path);
  settings.dry_run = true;

  RunSummary s = run(files);
  EXPECT_EQ(s.dry_run_accepted, 1u);
  EXPECT_EQ(s.skipped_recorded, 1u);
  EXPECT_EQ(history.size(), 0u);
  EXPECT_TRUE(sync.download_requests.empty());
  EXPECT_TRUE(sync.released.empty());
  EXPECT_TRUE(encoder.transcoded.empty());
}

TEST_F(AdmissionPipelineTest, interruptStopsRunWithoutRecord) {
  SetUpScratch();
  std::vector<CandidateFile> files = {
      add("1.mp4", 1'000'000'000, "h264", 8000.0),
      add("2.mp4", 1'000'000'000, "h264", 8000.0)};
  encoder.transcode_interrupts = true;

  RunSummary s = run(files);
  EXPECT_TRUE(s.interrupted);
  EXPECT_EQ(encoder.transcoded.size(), 1u);
  EXPECT_FALSE(history.has(files[0].path));
  EXPECT_FALSE(fs::exists(dir.path() / "1_hevc.partial.mkv"));
  EXPECT_TRUE(fs::exists(files[0].path));
}

TEST_F(AdmissionPipelineTest, pendingInterruptProcessesNothing) {
  std::vector<CandidateFile> files = {
      add("1.mp4", 1'000'000'000, "h264", 8000.0)};
  InterruptHandler::request();

  RunSummary s = run(files);
  EXPECT_TRUE(s.interrupted);
  EXPECT_TRUE(prober.probed.empty());
}

} // namespace vidshrink::tests
