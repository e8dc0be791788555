// Repository: MediaRelay
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by every thread.
// Copyright (c) 2025 MediaRelay

#include "mediarelay/util/Logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>

namespace mediarelay::util {

std::mutex Logger::mutex_;
std::ofstream Logger::log_file_;
std::function<void(const std::string&)> Logger::info_sink_;
std::function<void(const std::string&)> Logger::warn_sink_;
std::function<void(const std::string&)> Logger::error_sink_;

namespace {

std::string ClockPrefix() {
  std::time_t now = std::time(nullptr);
  struct tm tm;
  if (localtime_r(&now, &tm) == nullptr) return "--:--:--";
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buf;
}

}  // namespace

bool Logger::SetLogFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (log_file_.is_open()) log_file_.close();
  log_file_.open(path, std::ios::out | std::ios::app);
  return log_file_.is_open();
}

void Logger::CloseLogFile() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (log_file_.is_open()) log_file_.close();
}

void Logger::SetInfoSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::SetWarnSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

// Caller holds mutex_.
void Logger::Emit(const char* level, const std::string& line, bool to_stderr) {
  const std::string full = ClockPrefix() + " [" + level + "] " + line;
  std::ostream& out = to_stderr ? std::cerr : std::cout;
  out << full << '\n';
  out.flush();
  if (log_file_.is_open()) {
    log_file_ << full << '\n';
    log_file_.flush();
  }
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (info_sink_) {
    info_sink_(line);
  }
  Emit("INFO", line, false);
}

void Logger::Debug(const std::string& line) {
  if (std::getenv("MEDIARELAY_DEBUG") == nullptr) return;
  std::lock_guard<std::mutex> lock(mutex_);
  Emit("DEBUG", line, false);
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (warn_sink_) {
    warn_sink_(line);
  }
  Emit("WARNING", line, true);
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  Emit("ERROR", line, true);
}

}  // namespace mediarelay::util
