#include <gtest/gtest.h>

#include <fstream>

#include <nlohmann/json.hpp>

#include "Fakes.hpp"
#include "vidshrink/history_store.hpp"

namespace vidshrink::tests {

namespace {

nlohmann::json read_json(const fs::path &p) {
  std::ifstream in(p);
  return nlohmann::json::parse(in);
}

void write_text(const fs::path &p, const std::string &text) {
  std::ofstream out(p, std::ios::trunc);
  out << text;
}

} // namespace

TEST(HistoryStore, missingFileGivesEmptyStore) {
  TempDir dir;
  HistoryStore store =
      HistoryStore::load(dir.path() / "history.json", dir.path());
  EXPECT_EQ(store.size(), 0u);
  EXPECT_EQ(store.total_saved_bytes(), 0u);
}

TEST(HistoryStore, recordIsWrittenThrough) {
  TempDir dir;
  fs::path file = dir.path() / "history.json";
  HistoryStore store(file, dir.path());

  ASSERT_TRUE(store.record_outcome(dir.path() / "Movies" / "a.mp4",
                                   HistoryStatus::Converted, 580, 1000, 420,
                                   "libx265"));
  ASSERT_TRUE(fs::exists(file));
  EXPECT_FALSE(fs::exists(dir.path() / "history.json.tmp"));

  auto doc = read_json(file);
  EXPECT_EQ(doc["version"], HISTORY_SCHEMA_VERSION);
  EXPECT_EQ(doc["total_saved_bytes"], 580u);
  const auto &entry = doc["files"]["Movies/a.mp4"];
  EXPECT_EQ(entry["status"], "converted");
  EXPECT_EQ(entry["bytes_saved"], 580u);
  EXPECT_EQ(entry["original_size"], 1000u);
  EXPECT_EQ(entry["new_size"], 420u);
  EXPECT_EQ(entry["profile"], "libx265");
  EXPECT_EQ(entry["timestamp"].get<std::string>().size(), 19u);

  HistoryStore reloaded = HistoryStore::load(file, dir.path());
  EXPECT_TRUE(reloaded.has(dir.path() / "Movies" / "a.mp4"));
  EXPECT_EQ(reloaded.total_saved_bytes(), 580u);
}

TEST(HistoryStore, counterMatchesConvertedRecords) {
  TempDir dir;
  HistoryStore store(dir.path() / "h.json", dir.path());

  store.record_outcome(dir.path() / "a.mp4", HistoryStatus::Converted, 100);
  store.record_outcome(dir.path() / "b.mp4", HistoryStatus::KeptOriginal, 50);
  store.record_outcome(dir.path() / "c.mp4", HistoryStatus::SkippedLowBitrate,
                       70);
  store.record_outcome(dir.path() / "d.mp4", HistoryStatus::Converted, 300);

  EXPECT_EQ(store.total_saved_bytes(), 400u);
  EXPECT_EQ(store.find(dir.path() / "b.mp4")->bytes_saved, 0u);
  EXPECT_EQ(store.find(dir.path() / "c.mp4")->bytes_saved, 0u);

  uint64_t sum = 0;
  for (const auto &kv : store.records())
    if (kv.second.status == HistoryStatus::Converted)
      sum += kv.second.bytes_saved;
  EXPECT_EQ(sum, store.total_saved_bytes());
}

TEST(HistoryStore, relativeKeys) {
  HistoryStore store("/tmp/h.json", "/data/cloud");

  EXPECT_EQ(store.relative_key("/data/cloud/Movies/x.mkv"), "Movies/x.mkv");
  EXPECT_EQ(store.relative_key("/data/cloud/./Movies/../Movies/x.mkv"),
            "Movies/x.mkv");
  EXPECT_EQ(store.relative_key("/elsewhere/y.mp4"), "elsewhere/y.mp4");
}

TEST(HistoryStore, invalidUtf8BytesAreEscapedInKeys) {
  HistoryStore store("/tmp/h.json", "/data/cloud");

  EXPECT_EQ(store.relative_key("/data/cloud/vacances_\xE9t\xE9.mp4"),
            "vacances_%E9t%E9.mp4");
  /// Well-formed multi-byte names are kept as they are
  EXPECT_EQ(store.relative_key("/data/cloud/caf\xC3\xA9.mp4"),
            "caf\xC3\xA9.mp4");
  /// Overlong encoding and a truncated sequence
  EXPECT_EQ(store.relative_key("/data/cloud/a\xC0\xAF.mp4"), "a%C0%AF.mp4");
  EXPECT_EQ(store.relative_key("/data/cloud/b\xE2\x82.mp4"), "b%E2%82.mp4");
}

TEST(HistoryStore, latin1FileNameRoundTrips) {
  TempDir dir;
  fs::path file = dir.path() / "history.json";
  fs::path video = dir.path() / "vacances_\xE9t\xE9.mp4";

  HistoryStore store(file, dir.path());
  ASSERT_TRUE(
      store.record_outcome(video, HistoryStatus::Converted, 250, 1000, 750));
  ASSERT_TRUE(store.flush());

  auto doc = read_json(file);
  EXPECT_TRUE(doc["files"].contains("vacances_%E9t%E9.mp4"));

  HistoryStore reloaded = HistoryStore::load(file, dir.path());
  EXPECT_TRUE(reloaded.has(video));
  EXPECT_EQ(reloaded.total_saved_bytes(), 250u);
}

TEST(HistoryStore, corruptFileIsSetAside) {
  TempDir dir;
  fs::path file = dir.path() / "history.json";
  write_text(file, "{ this is not json");

  HistoryStore store = HistoryStore::load(file, dir.path());
  EXPECT_EQ(store.size(), 0u);
  EXPECT_TRUE(fs::exists(dir.path() / "history.json.corrupt"));

  /// The next write replaces the corrupt file with a valid one
  ASSERT_TRUE(store.record_outcome(dir.path() / "a.mp4",
                                   HistoryStatus::KeptOriginal, 0));
  EXPECT_EQ(read_json(file)["version"], HISTORY_SCHEMA_VERSION);
}

TEST(HistoryStore, legacyDocumentIsMigrated) {
  TempDir dir;
  fs::path file = dir.path() / "history.json";
  write_text(file, R"({
    "total_saved": 999,
    "files": {
      "Videos\\old.avi": {"status": "converted", "timestamp": "2024-01-02 03:04:05", "saved_bytes": 700},
      "\\Videos\\low.mp4": {"status": "skipped_low_bitrate", "timestamp": "2024-01-02 03:04:06", "saved_bytes": 0},
      "Videos\\weird.mp4": {"status": "exploded", "timestamp": "2024-01-02 03:04:07"}
    }
  })");

  HistoryStore store = HistoryStore::load(file, dir.path());
  EXPECT_EQ(store.size(), 2u);
  EXPECT_TRUE(store.has(dir.path() / "Videos" / "old.avi"));
  EXPECT_TRUE(store.has(dir.path() / "Videos" / "low.mp4"));
  EXPECT_FALSE(store.has(dir.path() / "Videos" / "weird.mp4"));
  /// Recomputed from the records, not the stored 999
  EXPECT_EQ(store.total_saved_bytes(), 700u);

  ASSERT_TRUE(store.flush());
  auto doc = read_json(file);
  EXPECT_EQ(doc["version"], HISTORY_SCHEMA_VERSION);
  EXPECT_EQ(doc["total_saved_bytes"], 700u);
  EXPECT_TRUE(doc["files"].contains("Videos/old.avi"));
  EXPECT_EQ(doc["files"]["Videos/old.avi"]["bytes_saved"], 700u);
}

TEST(HistoryStore, statusNames) {
  for (auto status :
       {HistoryStatus::Converted, HistoryStatus::KeptOriginal,
        HistoryStatus::SkippedLowBitrate, HistoryStatus::SkippedLowSavings,
        HistoryStatus::SkippedTestLowSavings}) {
    auto parsed = parse_history_status(to_string(status));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, status);
  }
  EXPECT_FALSE(parse_history_status("deleted").has_value());
  EXPECT_STREQ(to_string(HistoryStatus::SkippedTestLowSavings),
               "skipped_test_low_savings");
}

TEST(HistoryStore, unwritableLocationReportsFailure) {
  TempDir dir;
  HistoryStore store(dir.path() / "missing_dir" / "h.json", dir.path());
  EXPECT_FALSE(store.record_outcome(dir.path() / "a.mp4",
                                    HistoryStatus::Converted, 10));
  /// The in-memory state still reflects the outcome
  EXPECT_TRUE(store.has(dir.path() / "a.mp4"));
  EXPECT_EQ(store.total_saved_bytes(), 10u);
}

} // namespace vidshrink::tests
