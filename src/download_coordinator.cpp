/**
 * @file download_coordinator.cpp
 * @brief Download coordination implementation
 */

#include "vidshrink/download_coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include "vidshrink/logging.hpp"
#include "vidshrink/run_context.hpp"
#include "vidshrink/system.hpp"

namespace vidshrink {

namespace fs = std::filesystem;

DownloadCoordinator::DownloadCoordinator(CloudSync &sync,
                                         const RunSettings &settings)
    : sync_(sync),
      prefetch_count_(static_cast<size_t>(std::max(settings.prefetch_count, 0))),
      timeout_sec_(settings.download_timeout_sec),
      poll_sec_(settings.download_poll_sec) {}

// **----- Blocking Download -----**

bool DownloadCoordinator::ensure_local(const CandidateFile &file) {
  bool was_prefetched = in_flight(file.path);
  consume(file.path);

  if (sync_.is_locally_available(file.path))
    return true;

  std::string name = file.path.filename().string();
  if (!was_prefetched) {
    if (!sync_.request_download(file.path)) {
      LOG_WARN("Could not request download of {}", name);
      return false;
    }
  }
  LOG_INFO("Waiting for download of {} ({})", name, format_bytes(file.size));

  using clock = std::chrono::steady_clock;
  auto deadline = clock::now() + std::chrono::duration_cast<clock::duration>(
                                     std::chrono::duration<double>(timeout_sec_));
  auto poll = std::chrono::duration<double>(poll_sec_);

  TIMER_START(download_wait);
  bool local = false;
  while (true) {
    if (InterruptHandler::requested())
      break;
    if (sync_.is_locally_available(file.path)) {
      local = true;
      break;
    }
    if (clock::now() >= deadline)
      break;
    std::this_thread::sleep_for(poll);
  }
  TIMER_END(download_wait);

  if (!local && !InterruptHandler::requested())
    LOG_WARN("Download of {} did not finish within {}", name,
             format_time(timeout_sec_));
  return local;
}

// **----- Prefetch -----**

size_t DownloadCoordinator::prefetch(std::vector<CandidateFile> &files,
                                     size_t next_index, const AdmitFn &admit) {
  if (prefetch_count_ == 0)
    return 0;

  refresh();

  size_t triggered = 0;
  for (size_t i = next_index; i < files.size(); ++i) {
    if (in_flight_.size() >= prefetch_count_)
      break;
    if (InterruptHandler::requested())
      break;

    CandidateFile &candidate = files[i];
    if (in_flight(candidate.path))
      continue;
    if (sync_.is_locally_available(candidate.path))
      continue;
    if (!admit(candidate))
      continue;

    if (sync_.request_download(candidate.path)) {
      in_flight_.insert(candidate.path);
      ++triggered;
      LOG_INFO("Prefetch: download requested for {}",
               candidate.path.filename().string());
    }
  }
  return triggered;
}

void DownloadCoordinator::refresh() {
  for (auto it = in_flight_.begin(); it != in_flight_.end();) {
    if (sync_.is_locally_available(*it))
      it = in_flight_.erase(it);
    else
      ++it;
  }
}

void DownloadCoordinator::consume(const fs::path &path) {
  in_flight_.erase(path);
}

} // namespace vidshrink
