/**
 * @file history_store.cpp
 * @brief History persistence with nlohmann::json
 *
 * @details Loading never fails the run:
 *
 *          - Missing file: empty store, first run
 *
 *          - Unparseable file: copied aside, empty store
 *
 *          - Legacy (unversioned) file: migrated in memory and rewritten
 *            as the current version on the next flush
 *
 *          - Individual malformed entries: dropped with a warning
 */

#include "vidshrink/history_store.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "vidshrink/logging.hpp"
#include "vidshrink/system.hpp"

namespace vidshrink {

namespace fs = std::filesystem;
using json = nlohmann::json;

// **----- Status Names -----**

const char *to_string(HistoryStatus status) {
  switch (status) {
  case HistoryStatus::Converted:
    return "converted";
  case HistoryStatus::KeptOriginal:
    return "kept_original";
  case HistoryStatus::SkippedLowBitrate:
    return "skipped_low_bitrate";
  case HistoryStatus::SkippedLowSavings:
    return "skipped_low_savings";
  case HistoryStatus::SkippedTestLowSavings:
    return "skipped_test_low_savings";
  }
  return "kept_original";
}

std::optional<HistoryStatus> parse_history_status(const std::string &name) {
  static const std::pair<const char *, HistoryStatus> names[] = {
      {"converted", HistoryStatus::Converted},
      {"kept_original", HistoryStatus::KeptOriginal},
      {"skipped_low_bitrate", HistoryStatus::SkippedLowBitrate},
      {"skipped_low_savings", HistoryStatus::SkippedLowSavings},
      {"skipped_test_low_savings", HistoryStatus::SkippedTestLowSavings},
  };
  for (const auto &n : names) {
    if (name == n.first)
      return n.second;
  }
  return std::nullopt;
}

// **----- Internal Helpers -----**

namespace {

/// Normalize a stored key: '/' separators, no leading separators
std::string normalize_key(std::string key) {
  std::replace(key.begin(), key.end(), '\\', '/');
  size_t first = key.find_first_not_of('/');
  return first == std::string::npos ? std::string() : key.substr(first);
}

/// Length of the well-formed UTF-8 sequence at @p i, 0 if ill-formed
size_t utf8_sequence_length(const std::string &s, size_t i) {
  auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
  unsigned char lead = byte(i);
  if (lead < 0x80)
    return 1;

  size_t len = 0;
  unsigned char lo = 0x80, hi = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    len = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    len = 3;
    if (lead == 0xE0)
      lo = 0xA0; // overlong
    else if (lead == 0xED)
      hi = 0x9F; // surrogates
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    len = 4;
    if (lead == 0xF0)
      lo = 0x90;
    else if (lead == 0xF4)
      hi = 0x8F; // > U+10FFFF
  } else {
    return 0;
  }

  if (i + len > s.size())
    return 0;
  if (byte(i + 1) < lo || byte(i + 1) > hi)
    return 0;
  for (size_t k = 2; k < len; ++k) {
    if (byte(i + k) < 0x80 || byte(i + k) > 0xBF)
      return 0;
  }
  return len;
}

/// Replace every byte that is not part of valid UTF-8 with "%XX"
std::string escape_invalid_utf8(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size();) {
    size_t len = utf8_sequence_length(s, i);
    if (len == 0) {
      out += fmt::format("%{:02X}", static_cast<unsigned char>(s[i]));
      ++i;
    } else {
      out.append(s, i, len);
      i += len;
    }
  }
  return out;
}

/// Parse one entry; throws nlohmann::json::exception on wrong types
std::optional<HistoryRecord> parse_record(const std::string &key,
                                          const json &entry) {
  if (!entry.is_object()) {
    LOG_WARN("History: dropping non-object entry '{}'", key);
    return std::nullopt;
  }

  std::string status_name = entry.value("status", std::string());
  auto status = parse_history_status(status_name);
  if (!status) {
    LOG_WARN("History: dropping entry '{}' with unknown status '{}'", key,
             status_name);
    return std::nullopt;
  }

  HistoryRecord rec;
  rec.status = *status;
  rec.timestamp = entry.value("timestamp", std::string());
  /// Version 1 stored the savings as "saved_bytes"
  rec.bytes_saved = entry.contains("bytes_saved")
                        ? entry.value("bytes_saved", uint64_t{0})
                        : entry.value("saved_bytes", uint64_t{0});
  rec.original_size = entry.value("original_size", uint64_t{0});
  rec.new_size = entry.value("new_size", uint64_t{0});
  rec.profile = entry.value("profile", std::string());
  if (rec.status != HistoryStatus::Converted)
    rec.bytes_saved = 0;
  return rec;
}

/// Keep a copy of an unreadable history file before it gets overwritten
void preserve_corrupt_file(const fs::path &file) {
  fs::path backup = file;
  backup += ".corrupt";
  std::error_code ec;
  fs::copy_file(file, backup, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    LOG_WARN("History: could not back up corrupt file to {}: {}",
             backup.string(), ec.message());
  } else {
    LOG_WARN("History: corrupt file backed up to {}", backup.string());
  }
}

} // anonymous namespace

// **----- Construction / Loading -----**

HistoryStore::HistoryStore(fs::path file, fs::path root)
    : file_(std::move(file)), root_(std::move(root)) {}

HistoryStore HistoryStore::load(const fs::path &file, const fs::path &root) {
  HistoryStore store(file, root);

  std::error_code ec;
  if (!fs::exists(file, ec)) {
    LOG_INFO("History: no file at {}, starting fresh", file.string());
    return store;
  }

  std::ifstream in(file);
  if (!in) {
    LOG_WARN("History: cannot open {}, starting fresh", file.string());
    return store;
  }

  json root_doc = json::parse(in, nullptr, false);
  if (root_doc.is_discarded() || !root_doc.is_object()) {
    LOG_WARN("History: {} is not valid JSON, starting fresh", file.string());
    preserve_corrupt_file(file);
    return store;
  }

  int version = 1;
  try {
    version = root_doc.value("version", 1);
  } catch (const json::exception &) {
    version = 1;
  }
  if (version > HISTORY_SCHEMA_VERSION) {
    LOG_WARN("History: schema version {} is newer than {}, reading known "
             "fields only",
             version, HISTORY_SCHEMA_VERSION);
  } else if (version < HISTORY_SCHEMA_VERSION) {
    LOG_INFO("History: migrating schema version {} to {}", version,
             HISTORY_SCHEMA_VERSION);
  }

  auto files = root_doc.find("files");
  if (files == root_doc.end() || !files->is_object()) {
    LOG_WARN("History: {} has no 'files' object, starting fresh",
             file.string());
    preserve_corrupt_file(file);
    return store;
  }

  for (auto it = files->begin(); it != files->end(); ++it) {
    std::string key = normalize_key(it.key());
    if (key.empty())
      continue;
    try {
      auto rec = parse_record(key, it.value());
      if (rec)
        store.records_[key] = std::move(*rec);
    } catch (const json::exception &e) {
      LOG_WARN("History: dropping malformed entry '{}': {}", key, e.what());
    }
  }

  /// The counter is derived from the records, never trusted from the file
  store.recount();

  uint64_t stored_total = 0;
  try {
    stored_total = root_doc.contains("total_saved_bytes")
                       ? root_doc.value("total_saved_bytes", uint64_t{0})
                       : root_doc.value("total_saved", uint64_t{0});
  } catch (const json::exception &) {
    stored_total = 0;
  }
  if (stored_total != store.total_saved_) {
    LOG_WARN("History: stored total {} disagrees with records ({}), using "
             "records",
             stored_total, store.total_saved_);
  }

  LOG_INFO("History: loaded {} records, {} saved so far", store.size(),
           format_bytes(store.total_saved_));
  return store;
}

// **----- Queries -----**

std::string HistoryStore::relative_key(const fs::path &file) const {
  fs::path normal = file.lexically_normal();
  fs::path rel = normal.lexically_relative(root_.lexically_normal());
  if (rel.empty() || *rel.begin() == "..")
    return escape_invalid_utf8(normalize_key(normal.generic_string()));
  return escape_invalid_utf8(normalize_key(rel.generic_string()));
}

bool HistoryStore::has(const fs::path &file) const {
  return records_.count(relative_key(file)) > 0;
}

const HistoryRecord *HistoryStore::find(const fs::path &file) const {
  auto it = records_.find(relative_key(file));
  return it == records_.end() ? nullptr : &it->second;
}

// **----- Mutation -----**

bool HistoryStore::record_outcome(const fs::path &file, HistoryStatus status,
                                  uint64_t bytes_saved, uint64_t original_size,
                                  uint64_t new_size,
                                  const std::string &profile) {
  HistoryRecord rec;
  rec.status = status;
  rec.timestamp = local_timestamp();
  rec.bytes_saved = (status == HistoryStatus::Converted) ? bytes_saved : 0;
  rec.original_size = original_size;
  rec.new_size = new_size;
  rec.profile = profile;

  std::string key = relative_key(file);
  auto it = records_.find(key);
  if (it != records_.end()) {
    total_saved_ -= it->second.bytes_saved;
    it->second = std::move(rec);
    total_saved_ += it->second.bytes_saved;
  } else {
    total_saved_ += rec.bytes_saved;
    records_.emplace(key, std::move(rec));
  }

  return flush();
}

bool HistoryStore::flush() const {
  json files = json::object();
  for (const auto &kv : records_) {
    const HistoryRecord &r = kv.second;
    json entry = {{"status", to_string(r.status)},
                  {"timestamp", r.timestamp},
                  {"bytes_saved", r.bytes_saved}};
    if (r.original_size > 0)
      entry["original_size"] = r.original_size;
    if (r.new_size > 0)
      entry["new_size"] = r.new_size;
    if (!r.profile.empty())
      entry["profile"] = r.profile;
    files[kv.first] = std::move(entry);
  }

  json doc = {{"version", HISTORY_SCHEMA_VERSION},
              {"total_saved_bytes", total_saved_},
              {"files", std::move(files)}};

  std::string text;
  try {
    text = doc.dump(2);
  } catch (const json::exception &e) {
    LOG_ERROR("History: cannot serialize {}: {}", file_.string(), e.what());
    return false;
  }

  fs::path tmp = file_;
  tmp += ".tmp";

  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      LOG_ERROR("History: cannot write {}", tmp.string());
      return false;
    }
    out << text << '\n';
    out.flush();
    if (!out) {
      LOG_ERROR("History: write to {} failed", tmp.string());
      return false;
    }
  }

  std::error_code ec;
  fs::rename(tmp, file_, ec);
  if (ec) {
    LOG_ERROR("History: cannot replace {}: {}", file_.string(), ec.message());
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

void HistoryStore::recount() {
  total_saved_ = 0;
  for (const auto &kv : records_) {
    if (kv.second.status == HistoryStatus::Converted)
      total_saved_ += kv.second.bytes_saved;
  }
}

} // namespace vidshrink
