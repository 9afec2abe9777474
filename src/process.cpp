/**
 * @file process.cpp
 * @brief Child process execution implementation
 */

#include "vidshrink/process.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iterator>
#include <thread>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "vidshrink/logging.hpp"
#include "vidshrink/run_context.hpp"

namespace vidshrink {

namespace {

/// How often a running child is checked for exit / stop requests
constexpr auto WAIT_POLL_INTERVAL = std::chrono::milliseconds(200);

int decode_wait_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

} // anonymous namespace

ProcessResult run_process(const std::vector<std::string> &args) {
  ProcessResult result;
  if (args.empty())
    return result;

  if (InterruptHandler::requested()) {
    result.interrupted = true;
    return result;
  }

  /// Build argv before fork; only async-signal-safe calls after it
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  std::transform(args.begin(), args.end(), std::back_inserter(argv),
                 [](const std::string &a) { return const_cast<char *>(a.c_str()); });
  argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid == -1) {
    LOG_ERROR("fork failed for {}: {}", args[0], std::strerror(errno));
    return result;
  }

  if (pid == 0) { // CHILD
    int devnull = open("/dev/null", O_RDWR);
    if (devnull != -1) {
      dup2(devnull, STDIN_FILENO);
      dup2(devnull, STDOUT_FILENO);
      close(devnull);
    }
    execvp(argv[0], argv.data());
    _exit(127);
  }

  // PARENT
  result.spawned = true;
  bool terminated = false;
  int status = 0;

  while (true) {
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid)
      break;
    if (r == -1) {
      if (errno == EINTR)
        continue;
      LOG_ERROR("waitpid failed for {}: {}", args[0], std::strerror(errno));
      result.exit_code = -1;
      return result;
    }

    if (!terminated && InterruptHandler::requested()) {
      LOG_WARN("Stop requested, terminating {} (pid {})", args[0], pid);
      kill(pid, SIGTERM);
      terminated = true;
    }
    std::this_thread::sleep_for(WAIT_POLL_INTERVAL);
  }

  result.exit_code = decode_wait_status(status);
  result.interrupted = terminated || InterruptHandler::requested();
  return result;
}

std::string describe_command(const std::vector<std::string> &args) {
  std::string out;
  for (const auto &a : args) {
    if (!out.empty())
      out += ' ';
    if (a.find(' ') != std::string::npos)
      out += '"' + a + '"';
    else
      out += a;
  }
  return out;
}

} // namespace vidshrink
