/**
 * @file run_context.hpp
 * @brief Interruption handling and per-run cancellation state
 *
 * @details Two pieces cooperate so an interrupted run never leaves stale
 *          state behind:
 *
 *          - InterruptHandler: installs SIGINT / SIGTERM / SIGHUP handlers
 *            that only record the request (async-signal-safe). The process
 *            runner polls the request while the encoder runs and stops it.
 *
 *          - RunContext: owned by the top-level run function and passed by
 *            reference to the executor. Holds the live history and the
 *            single in-flight temporary artifact; shutdown() removes the
 *            artifact and flushes the history on the control thread.
 */

#ifndef VIDSHRINK_RUN_CONTEXT_HPP
#define VIDSHRINK_RUN_CONTEXT_HPP

#include <filesystem>

namespace vidshrink {

class HistoryStore;

/**
 * @class InterruptHandler
 * @brief Process-wide stop request set from signal context.
 */
class InterruptHandler {
public:
  /**
   * @brief Install handlers for SIGINT, SIGTERM and SIGHUP.
   * @return false if any sigaction() call failed
   */
  static bool install();

  /// Whether a stop was requested
  static bool requested();

  /// Signal that caused the request (0 if requested programmatically)
  static int signal_number();

  /// Request a stop without a signal
  static void request(int sig = 0);

  /// Clear the request (tests only need this between cases)
  static void reset();
};

/**
 * @class RunContext
 * @brief Cancellation state reachable from the interrupt path.
 *
 * @attention OWNERSHIP:
 *
 *   - The history is owned by the run function; RunContext only refers to it
 *
 *   - At most one temporary artifact is in flight at any time
 */
class RunContext {
public:
  explicit RunContext(HistoryStore &history);

  RunContext(const RunContext &) = delete;
  RunContext &operator=(const RunContext &) = delete;

  /// Mirror the temp path of the attempt that is about to start
  void begin_attempt(const std::filesystem::path &temp_output);

  /// The attempt finished and dealt with its own temp file
  void end_attempt();

  /// Temp path of the running attempt (empty when idle)
  const std::filesystem::path &in_flight() const { return in_flight_; }

  /// Whether the run should stop at the next opportunity
  bool interrupted() const { return InterruptHandler::requested(); }

  HistoryStore &history() { return history_; }

  /**
   * @brief Remove the in-flight artifact and flush the history.
   * @note Idempotent; called on the interrupt path and at normal exit.
   * @return true if the history flush succeeded
   */
  bool shutdown();

  /**
   * @brief Process exit code once the run is over.
   * @return 128 + N after signal N, 1 after a stop without a signal, else 0
   * @note A failed history flush is logged by shutdown() and does not turn
   *       a finished run into a failure.
   */
  int exit_code() const;

private:
  HistoryStore &history_;
  std::filesystem::path in_flight_;
};

} // namespace vidshrink

#endif // VIDSHRINK_RUN_CONTEXT_HPP
