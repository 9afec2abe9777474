/**
 * @file process.hpp
 * @brief Child process execution for the external encoder
 *
 * @details Runs a program with an explicit argument vector (no shell, so
 *          paths never need quoting) and waits for it. While waiting, a stop
 *          request from the InterruptHandler terminates the child so the
 *          caller can clean up promptly.
 */

#ifndef VIDSHRINK_PROCESS_HPP
#define VIDSHRINK_PROCESS_HPP

#include <string>
#include <vector>

namespace vidshrink {

/**
 * @struct ProcessResult
 * @brief Outcome of one child process.
 */
struct ProcessResult {
  int exit_code = -1;       //< Exit status, 128+N if killed by signal N
  bool interrupted = false; //< Stopped because of an interrupt request
  bool spawned = false;     //< false if fork() failed

  bool ok() const { return spawned && !interrupted && exit_code == 0; }
};

/**
 * @brief Run a program and wait for it to finish.
 *
 * @param args Program followed by its arguments; args[0] is looked up in PATH
 * @return ProcessResult; a program that cannot be executed exits with 127
 *
 * @note stdin is redirected from /dev/null and stdout is discarded; stderr is
 *       inherited so encoder errors reach the console.
 */
ProcessResult run_process(const std::vector<std::string> &args);

/**
 * @brief Render an argument vector for logging.
 */
std::string describe_command(const std::vector<std::string> &args);

} // namespace vidshrink

#endif // VIDSHRINK_PROCESS_HPP
