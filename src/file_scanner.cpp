/**
 * @file file_scanner.cpp
 * @brief Recursive candidate scan and root discovery
 */

#include "vidshrink/file_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>
#include <system_error>

#include "vidshrink/logging.hpp"

namespace vidshrink {

namespace fs = std::filesystem;

namespace {

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

bool is_video_extension(const fs::path &path) {
  static const std::set<std::string> extensions = {
      ".mp4", ".mkv",  ".avi", ".mov", ".wmv", ".m4v",  ".mpg",
      ".mpeg", ".ts",  ".m2ts", ".mts", ".flv", ".webm", ".3gp"};
  return extensions.count(lowercase(path.extension().string())) != 0;
}

bool is_own_artifact(const fs::path &path) {
  std::string name = lowercase(path.filename().string());
  std::string ext = OUTPUT_EXTENSION;
  return ends_with(name, std::string(PARTIAL_MARKER) + ext) ||
         ends_with(name, "_hevc" + ext) || ends_with(name, "_av1" + ext);
}

std::vector<CandidateFile> scan_candidates(const fs::path &root,
                                           uint64_t min_size_bytes) {
  std::vector<CandidateFile> files;
  std::vector<fs::path> pending{root};

  /// Explicit stack instead of recursive_directory_iterator so a single
  /// unreadable folder is reported and skipped without ending the walk
  while (!pending.empty()) {
    fs::path dir = std::move(pending.back());
    pending.pop_back();

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
      LOG_WARN("Skipping unreadable directory {}: {}", dir.string(),
               ec.message());
      continue;
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
      if (ec)
        break;
      const fs::directory_entry &entry = *it;
      std::error_code entry_ec;

      if (entry.is_symlink(entry_ec))
        continue;
      if (entry.is_directory(entry_ec)) {
        pending.push_back(entry.path());
        continue;
      }
      if (!entry.is_regular_file(entry_ec) ||
          !is_video_extension(entry.path()) || is_own_artifact(entry.path()))
        continue;

      uint64_t size = entry.file_size(entry_ec);
      if (entry_ec || size < min_size_bytes)
        continue;

      CandidateFile c;
      c.path = entry.path();
      c.size = size;
      files.push_back(std::move(c));
    }
    if (ec)
      LOG_WARN("Listing of {} ended early: {}", dir.string(), ec.message());
  }

  std::sort(files.begin(), files.end(),
            [](const CandidateFile &a, const CandidateFile &b) {
              return a.path < b.path;
            });
  return files;
}

std::optional<fs::path> discover_root() {
  std::vector<fs::path> candidates;
  for (const char *var : {"OneDrive", "OneDriveConsumer", "OneDriveCommercial"}) {
    const char *val = std::getenv(var);
    if (val && *val)
      candidates.emplace_back(val);
  }
  const char *home = std::getenv("HOME");
  if (home && *home)
    candidates.push_back(fs::path(home) / "OneDrive");

  for (const auto &c : candidates) {
    std::error_code ec;
    if (fs::is_directory(c, ec))
      return c;
  }
  return std::nullopt;
}

} // namespace vidshrink
