/**
 * @file Fakes.hpp
 * @brief Scripted collaborators and temp-dir helpers shared by the tests
 */

#ifndef VIDSHRINK_TESTS_FAKES_HPP
#define VIDSHRINK_TESTS_FAKES_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <system_error>
#include <vector>

#include "vidshrink/cloud_sync.hpp"
#include "vidshrink/encoder.hpp"
#include "vidshrink/media_prober.hpp"

namespace vidshrink::tests {

namespace fs = std::filesystem;

/// Unique directory under the system temp dir, removed on destruction
class TempDir {
public:
  TempDir() {
    std::random_device rd;
    path_ = fs::temp_directory_path() /
            ("vidshrink_test_" + std::to_string(rd()) + std::to_string(rd()));
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }

private:
  fs::path path_;
};

/// Create (or replace) a sparse file of exactly @p size bytes
inline void write_file(const fs::path &path, uint64_t size) {
  fs::create_directories(path.parent_path());
  { std::ofstream out(path, std::ios::binary | std::ios::trunc); }
  fs::resize_file(path, size);
}

/// Prober answering from a table; unknown paths fail to probe
class FakeProber : public Prober {
public:
  std::map<fs::path, ProbeResult> results;
  std::vector<fs::path> probed;

  std::optional<ProbeResult> probe(const fs::path &path) override {
    probed.push_back(path);
    auto it = results.find(path);
    if (it == results.end())
      return std::nullopt;
    return it->second;
  }

  size_t probe_count(const fs::path &path) const {
    size_t n = 0;
    for (const auto &p : probed)
      n += (p == path) ? 1 : 0;
    return n;
  }
};

/// Encoder that writes sparse outputs of scripted sizes
class FakeEncoder : public Encoder {
public:
  std::set<std::string> working_profiles;  //< probe_profile succeeds for these
  uint64_t segment_copy_size = 3'000'000;  //< Stream-copy artifact
  uint64_t segment_encode_size = 1'200'000; //< Encoded artifact
  bool segment_encode_fails = false;
  std::optional<uint64_t> transcode_size; //< nullopt = encoder fails
  bool transcode_interrupts = false;

  std::vector<std::string> probed_profiles;
  std::vector<fs::path> transcoded;
  size_t segment_encodes = 0;
  std::vector<fs::path> outputs_seen;

  ProcessResult probe_profile(const EncoderProfile &profile,
                              const fs::path &output) override {
    probed_profiles.push_back(profile.id);
    outputs_seen.push_back(output);
    if (!working_profiles.count(profile.id))
      return exited(1);
    write_file(output, 1024);
    return exited(0);
  }

  ProcessResult extract_segment(const fs::path &, const fs::path &output,
                                double, double) override {
    outputs_seen.push_back(output);
    write_file(output, segment_copy_size);
    return exited(0);
  }

  ProcessResult encode_segment(const fs::path &, const fs::path &output,
                               const EncoderProfile &, double,
                               double) override {
    ++segment_encodes;
    outputs_seen.push_back(output);
    if (segment_encode_fails)
      return exited(1);
    write_file(output, segment_encode_size);
    return exited(0);
  }

  ProcessResult transcode(const fs::path &input, const fs::path &output,
                          const EncoderProfile &) override {
    transcoded.push_back(input);
    outputs_seen.push_back(output);
    if (transcode_interrupts) {
      /// A partial file is left behind, like a killed ffmpeg would
      write_file(output, 4096);
      ProcessResult r = exited(143);
      r.interrupted = true;
      return r;
    }
    if (!transcode_size)
      return exited(1);
    write_file(output, *transcode_size);
    return exited(0);
  }

private:
  static ProcessResult exited(int code) {
    ProcessResult r;
    r.spawned = true;
    r.exit_code = code;
    return r;
  }
};

/**
 * @brief Cloud layer with a set of placeholder files.
 * @note A requested download completes after @c polls_to_materialize
 *       locality checks; downloads_work = false never completes.
 */
class FakeCloudSync : public CloudSync {
public:
  std::set<fs::path> cloud_only;
  bool downloads_work = true;
  int polls_to_materialize = 0;
  bool release_supported = true;

  std::vector<fs::path> download_requests;
  std::vector<fs::path> released;

  bool is_locally_available(const fs::path &path) override {
    if (!cloud_only.count(path))
      return true;
    auto it = pending_.find(path);
    if (it == pending_.end())
      return false;
    if (it->second <= 0) {
      cloud_only.erase(path);
      pending_.erase(it);
      return true;
    }
    --it->second;
    return false;
  }

  bool request_download(const fs::path &path) override {
    download_requests.push_back(path);
    if (downloads_work && cloud_only.count(path))
      pending_.emplace(path, polls_to_materialize);
    return true;
  }

  bool release_to_cloud_only(const fs::path &path) override {
    if (!release_supported)
      return false;
    released.push_back(path);
    return true;
  }

  bool was_requested(const fs::path &path) const {
    for (const auto &p : download_requests)
      if (p == path)
        return true;
    return false;
  }

  bool was_released(const fs::path &path) const {
    for (const auto &p : released)
      if (p == path)
        return true;
    return false;
  }

private:
  std::map<fs::path, int> pending_;
};

/// Minimal software profile used across tests
inline EncoderProfile test_profile() {
  EncoderProfile p;
  p.id = "libx265";
  p.label = "Software HEVC (x265)";
  p.args = {"-c:v", "libx265", "-crf", "26", "-preset", "medium"};
  p.codec_family = "hevc";
  return p;
}

} // namespace vidshrink::tests

#endif // VIDSHRINK_TESTS_FAKES_HPP
