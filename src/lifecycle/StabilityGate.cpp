// Repository: MediaRelay
// Component: Stability Gate
// Copyright (c) 2025 MediaRelay

#include "mediarelay/lifecycle/StabilityGate.hpp"

#include <sys/stat.h>

namespace mediarelay::lifecycle {

std::optional<FileStat> StatPath(const std::string& path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) return std::nullopt;
  FileStat out;
  out.size_bytes = static_cast<uint64_t>(st.st_size);
  out.mtime_ms = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000 +
                 static_cast<int64_t>(st.st_mtim.tv_nsec / 1'000'000);
  out.regular = S_ISREG(st.st_mode);
  return out;
}

bool IsStable(const FileStat& st, int min_age_s, const timing::ITimeSource& clock) {
  const int64_t age_ms = clock.NowUtcMs() - st.mtime_ms;
  return age_ms >= static_cast<int64_t>(min_age_s) * 1000;
}

bool IsStable(const std::string& path, int min_age_s, const timing::ITimeSource& clock) {
  auto st = StatPath(path);
  if (!st) return false;
  return IsStable(*st, min_age_s, clock);
}

}  // namespace mediarelay::lifecycle
