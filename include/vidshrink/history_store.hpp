/**
 * @file history_store.hpp
 * @brief Durable per-file outcome history
 *
 * @details The HistoryStore is the authority for "already handled":
 *
 *          - One record per evaluated file, keyed by its path relative to
 *            the root so keys survive mount-point or drive-letter changes
 *
 *          - A cumulative bytes-saved counter that always equals the sum of
 *            bytes saved over converted records
 *
 *          - Write-through: every mutation rewrites the whole file (temp
 *            file + rename) before returning
 *
 * @note Schema (version 2):
 *       {"version":2,"total_saved_bytes":N,"files":{"<key>":{"status":...,
 *        "timestamp":...,"bytes_saved":N,"original_size":N,"new_size":N,
 *        "profile":...}}}
 *       Unversioned legacy files are migrated on load.
 */

#ifndef VIDSHRINK_HISTORY_STORE_HPP
#define VIDSHRINK_HISTORY_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

#include "types.hpp"

namespace vidshrink {

/// Current on-disk schema version
constexpr int HISTORY_SCHEMA_VERSION = 2;

/**
 * @struct HistoryRecord
 * @brief Permanent outcome of one file.
 */
struct HistoryRecord {
  HistoryStatus status = HistoryStatus::KeptOriginal;
  std::string timestamp;      //< Local time the outcome was recorded
  uint64_t bytes_saved = 0;   //< Non-zero only for converted files
  uint64_t original_size = 0; //< Informational
  uint64_t new_size = 0;      //< Informational, converted files only
  std::string profile;        //< Encoder profile id, if one ran
};

/**
 * @class HistoryStore
 * @brief Strongly typed history with a tolerant loader.
 *
 * @attention A missing or corrupt file never fails the run: load() returns
 *            an empty store (a corrupt file is first copied aside to
 *            "<file>.corrupt").
 */
class HistoryStore {
public:
  /**
   * @brief Construct an empty store bound to a file and a root folder.
   * @param file History file path (not read)
   * @param root Folder that keys are made relative to
   */
  HistoryStore(std::filesystem::path file, std::filesystem::path root);

  /**
   * @brief Load the store, tolerating absence and corruption.
   * @param file History file path
   * @param root Folder that keys are made relative to
   * @return Populated store, or an empty one on any read/parse problem
   */
  static HistoryStore load(const std::filesystem::path &file,
                           const std::filesystem::path &root);

  /// Whether a record exists for @p file
  bool has(const std::filesystem::path &file) const;

  /// Record for @p file, or nullptr
  const HistoryRecord *find(const std::filesystem::path &file) const;

  /**
   * @brief Insert or replace the record for @p file and persist.
   *
   * @param file Absolute file path
   * @param status Outcome
   * @param bytes_saved Bytes saved; ignored unless status is Converted
   * @param original_size Size before conversion (informational)
   * @param new_size Size after conversion (informational)
   * @param profile Encoder profile id (informational)
   * @return true if the store was written to disk
   */
  bool record_outcome(const std::filesystem::path &file, HistoryStatus status,
                      uint64_t bytes_saved, uint64_t original_size = 0,
                      uint64_t new_size = 0, const std::string &profile = {});

  /**
   * @brief Write the whole store to disk (temp file + rename).
   * @return false if the file could not be written; the in-memory state is
   *         unchanged
   */
  bool flush() const;

  /// Cumulative bytes saved over all converted records
  uint64_t total_saved_bytes() const { return total_saved_; }

  /// Number of records
  size_t size() const { return records_.size(); }

  /// All records by key
  const std::map<std::string, HistoryRecord> &records() const {
    return records_;
  }

  /**
   * @brief Key for @p file: relative to the root, normalized, '/'
   *        separators, no leading separator.
   * @note Files outside the root keep their full generic path as the key.
   *       Bytes that are not valid UTF-8 (legal in POSIX file names) are
   *       written as "%XX" so the key can be stored in JSON and still
   *       matches the same file on the next run.
   */
  std::string relative_key(const std::filesystem::path &file) const;

  const std::filesystem::path &file() const { return file_; }

private:
  std::filesystem::path file_;
  std::filesystem::path root_;
  std::map<std::string, HistoryRecord> records_;
  uint64_t total_saved_ = 0;

  /// Recompute the counter from the records
  void recount();
};

} // namespace vidshrink

#endif // VIDSHRINK_HISTORY_STORE_HPP
