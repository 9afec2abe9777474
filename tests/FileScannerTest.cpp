#include <gtest/gtest.h>

#include "Fakes.hpp"
#include "vidshrink/file_scanner.hpp"

namespace vidshrink::tests {

TEST(FileScanner, extensions) {
  EXPECT_TRUE(is_video_extension("a.mp4"));
  EXPECT_TRUE(is_video_extension("a.MKV"));
  EXPECT_TRUE(is_video_extension("a.M2TS"));
  EXPECT_TRUE(is_video_extension("a.3gp"));
  EXPECT_FALSE(is_video_extension("a.jpg"));
  EXPECT_FALSE(is_video_extension("mp4"));
}

TEST(FileScanner, ownArtifacts) {
  EXPECT_TRUE(is_own_artifact("/v/movie_hevc.mkv"));
  EXPECT_TRUE(is_own_artifact("/v/movie_av1.mkv"));
  EXPECT_TRUE(is_own_artifact("/v/movie_hevc.partial.mkv"));
  EXPECT_FALSE(is_own_artifact("/v/movie_hevc.mp4"));
  EXPECT_FALSE(is_own_artifact("/v/movie.mkv"));
}

TEST(FileScanner, recursiveSortedAndFiltered) {
  TempDir dir;
  const uint64_t min = 1000;
  write_file(dir.path() / "b" / "second.mp4", 2000);
  write_file(dir.path() / "a" / "deep" / "first.MOV", 1000);
  write_file(dir.path() / "small.mp4", 999);
  write_file(dir.path() / "notes.txt", 5000);
  write_file(dir.path() / "c" / "done_hevc.mkv", 5000);
  write_file(dir.path() / "c" / "running_hevc.partial.mkv", 5000);
  write_file(dir.path() / "c" / "third.ts", 5000);

  auto files = scan_candidates(dir.path(), min);
  ASSERT_EQ(files.size(), 3u);
  EXPECT_EQ(files[0].path, dir.path() / "a" / "deep" / "first.MOV");
  EXPECT_EQ(files[1].path, dir.path() / "b" / "second.mp4");
  EXPECT_EQ(files[2].path, dir.path() / "c" / "third.ts");
  EXPECT_EQ(files[1].size, 2000u);
  EXPECT_FALSE(files[0].probe.has_value());
}

TEST(FileScanner, missingRootYieldsNothing) {
  TempDir dir;
  EXPECT_TRUE(scan_candidates(dir.path() / "nope", 0).empty());
}

} // namespace vidshrink::tests
