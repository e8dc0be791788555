// Repository: MediaRelay
// Component: Stability Gate
// Purpose: Decide whether a filesystem entry has stopped being written.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_LIFECYCLE_STABILITY_GATE_HPP_
#define MEDIARELAY_LIFECYCLE_STABILITY_GATE_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "mediarelay/timing/ITimeSource.hpp"

namespace mediarelay::lifecycle {

struct FileStat {
  uint64_t size_bytes = 0;
  int64_t mtime_ms = 0;
  bool regular = false;
};

// stat(2) wrapper; nullopt when the entry does not exist (or vanished).
std::optional<FileStat> StatPath(const std::string& path);

// True iff the entry exists and now - mtime >= min_age_s. A vanished entry
// is "not stable", never an error.
bool IsStable(const std::string& path, int min_age_s, const timing::ITimeSource& clock);

// Same decision on an already-taken stat, for callers that need size too.
bool IsStable(const FileStat& st, int min_age_s, const timing::ITimeSource& clock);

}  // namespace mediarelay::lifecycle

#endif  // MEDIARELAY_LIFECYCLE_STABILITY_GATE_HPP_
