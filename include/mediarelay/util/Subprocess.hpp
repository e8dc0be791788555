// Repository: MediaRelay
// Component: Subprocess Runner
// Purpose: Launch an external tool with an argument vector, stream its output
//          line by line, and report the exit status.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_UTIL_SUBPROCESS_HPP_
#define MEDIARELAY_UTIL_SUBPROCESS_HPP_

#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace mediarelay::util {

struct ProcessOptions {
  // When set, stdout and stderr are merged into a pipe and each line is
  // delivered here (without the trailing newline). When unset, output goes
  // to /dev/null.
  std::function<void(const std::string&)> on_line;

  // Polled while the child runs; when it becomes true the child receives
  // SIGTERM, then SIGKILL after kKillGraceMs.
  const std::atomic<bool>* interrupt = nullptr;
};

struct ProcessResult {
  bool launched = false;
  int exit_code = -1;        // WEXITSTATUS, or -1 if killed by a signal
  bool interrupted = false;  // Terminated because options.interrupt was raised
  std::string error;         // Spawn failure description

  bool Succeeded() const { return launched && !interrupted && exit_code == 0; }
};

// argv[0] is resolved through PATH. Never throws; spawn failures are
// reported through ProcessResult.
ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const ProcessOptions& options = {});

inline constexpr int kKillGraceMs = 5000;

}  // namespace mediarelay::util

#endif  // MEDIARELAY_UTIL_SUBPROCESS_HPP_
