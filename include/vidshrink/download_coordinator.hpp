/**
 * @file download_coordinator.hpp
 * @brief Blocking materialization and speculative prefetch of cloud files
 *
 * @details The coordinator hides download latency behind transcoding:
 *
 *          - ensure_local() blocks until the current file is materialized,
 *            polling the sync layer, bounded by a timeout
 *
 *          - prefetch() fires download triggers for the next admissible
 *            candidates so they are (ideally) local by the time the control
 *            thread reaches them
 *
 * @note Downloads are fire-and-forget hints to the sync layer. Nothing is
 *       joined or cancelled; the in-flight set only prevents re-triggering.
 *       All members are called from the control thread.
 */

#ifndef VIDSHRINK_DOWNLOAD_COORDINATOR_HPP
#define VIDSHRINK_DOWNLOAD_COORDINATOR_HPP

#include <cstddef>
#include <filesystem>
#include <functional>
#include <set>
#include <vector>

#include "cloud_sync.hpp"
#include "config.hpp"
#include "types.hpp"

namespace vidshrink {

/**
 * @class DownloadCoordinator
 * @brief Tracks triggered downloads and waits for materialization.
 */
class DownloadCoordinator {
public:
  /// Decides whether an upcoming candidate is worth downloading early
  using AdmitFn = std::function<bool(CandidateFile &)>;

  /**
   * @param sync Cloud-sync layer
   * @param settings Uses prefetch_count, download_timeout_sec and
   *                 download_poll_sec
   */
  DownloadCoordinator(CloudSync &sync, const RunSettings &settings);

  /**
   * @brief Make sure @p file is materialized locally.
   *
   * @return true once local; false on timeout, failed trigger or interrupt
   *
   * @note The file's in-flight entry (if any) is consumed either way.
   */
  bool ensure_local(const CandidateFile &file);

  /**
   * @brief Trigger downloads for upcoming candidates.
   *
   * @param files All candidates of the run
   * @param next_index First index after the current file
   * @param admit Cheap admission check (history, bitrate, static savings)
   * @return Number of downloads triggered by this call
   *
   * @attention Local and already in-flight candidates are passed over
   *            without counting; the walk stops when prefetch_count
   *            downloads are in flight.
   */
  size_t prefetch(std::vector<CandidateFile> &files, size_t next_index,
                  const AdmitFn &admit);

  /// Drop in-flight entries whose files have become local
  void refresh();

  /// Forget @p path (it is being processed now)
  void consume(const std::filesystem::path &path);

  bool in_flight(const std::filesystem::path &path) const {
    return in_flight_.count(path) != 0;
  }

  size_t in_flight_count() const { return in_flight_.size(); }

private:
  CloudSync &sync_;
  size_t prefetch_count_;
  double timeout_sec_;
  double poll_sec_;
  std::set<std::filesystem::path> in_flight_;
};

} // namespace vidshrink

#endif // VIDSHRINK_DOWNLOAD_COORDINATOR_HPP
