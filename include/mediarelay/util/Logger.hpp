// Repository: MediaRelay
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by every thread.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_UTIL_LOGGER_HPP_
#define MEDIARELAY_UTIL_LOGGER_HPP_

#include <fstream>
#include <functional>
#include <mutex>
#include <string>

namespace mediarelay::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from concurrent threads never interleave.
//
// Info  → stdout (lifecycle transitions)
// Debug → stdout only when MEDIARELAY_DEBUG env is set
// Warn  → stderr (recoverable problems, quarantine events)
// Error → stderr (delivery failures, missing configuration)
//
// Every line is prefixed "HH:MM:SS [LEVEL] ". When a log file is set, the
// same prefixed line is appended to it as well.
//
// Test-only: the sinks receive the unprefixed line for every call of the
// matching level. Call with nullptr to clear.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Mirror all subsequent lines into `path` (append). Returns false if the
  // file cannot be opened; console logging continues either way.
  static bool SetLogFile(const std::string& path);
  static void CloseLogFile();

  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static void Emit(const char* level, const std::string& line, bool to_stderr);

  static std::mutex mutex_;
  static std::ofstream log_file_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace mediarelay::util

#endif  // MEDIARELAY_UTIL_LOGGER_HPP_
