/**
 * @file run_context.cpp
 * @brief Signal installation and run shutdown
 */

#include "vidshrink/run_context.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>

#include <signal.h>

#include "vidshrink/history_store.hpp"
#include "vidshrink/logging.hpp"

namespace vidshrink {

namespace {

volatile std::sig_atomic_t stop_signal = 0;
volatile std::sig_atomic_t stop_requested = 0;

extern "C" void on_stop_signal(int sig) {
  stop_signal = sig;
  stop_requested = 1;
}

} // anonymous namespace

// **----- InterruptHandler -----**

bool InterruptHandler::install() {
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = on_stop_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;

  bool ok = true;
  for (int sig : {SIGINT, SIGTERM, SIGHUP}) {
    if (sigaction(sig, &sa, nullptr) != 0) {
      LOG_ERROR("Failed to install handler for signal {}: {}", sig,
                std::strerror(errno));
      ok = false;
    }
  }
  return ok;
}

bool InterruptHandler::requested() { return stop_requested != 0; }

int InterruptHandler::signal_number() { return stop_signal; }

void InterruptHandler::request(int sig) {
  stop_signal = sig;
  stop_requested = 1;
}

void InterruptHandler::reset() {
  stop_signal = 0;
  stop_requested = 0;
}

// **----- RunContext -----**

RunContext::RunContext(HistoryStore &history) : history_(history) {}

void RunContext::begin_attempt(const std::filesystem::path &temp_output) {
  in_flight_ = temp_output;
}

void RunContext::end_attempt() { in_flight_.clear(); }

bool RunContext::shutdown() {
  if (!in_flight_.empty()) {
    std::error_code ec;
    if (std::filesystem::remove(in_flight_, ec)) {
      LOG_WARN("Removed in-flight artifact {}", in_flight_.string());
    } else if (ec) {
      LOG_ERROR("Failed to remove in-flight artifact {}: {}",
                in_flight_.string(), ec.message());
    }
    in_flight_.clear();
  }

  bool flushed = history_.flush();
  if (!flushed) {
    LOG_ERROR("History could not be flushed to {}",
              history_.file().string());
  }
  return flushed;
}

int RunContext::exit_code() const {
  if (!InterruptHandler::requested())
    return 0;
  int sig = InterruptHandler::signal_number();
  return sig > 0 ? 128 + sig : 1;
}

} // namespace vidshrink
