// Repository: MediaRelay
// Component: Segment Planner
// Copyright (c) 2025 MediaRelay

#include "mediarelay/delivery/SegmentPlanner.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <system_error>
#include <vector>

#include "mediarelay/lifecycle/Artifact.hpp"
#include "mediarelay/util/TextUtil.hpp"

namespace mediarelay::delivery {

std::vector<SegmentWindow> PlanSegments(double duration_s, uint64_t total_bytes,
                                        uint64_t target_bytes, double min_segment_s) {
  std::vector<SegmentWindow> plan;
  if (!(duration_s > 0.0) || total_bytes == 0 || target_bytes == 0) return plan;

  const double seg = std::max(duration_s * static_cast<double>(target_bytes) /
                                  static_cast<double>(total_bytes),
                              std::max(min_segment_s, 0.0));
  if (seg >= duration_s) {
    plan.push_back({1, 0.0, duration_s});
    return plan;
  }

  constexpr double kEpsilon = 1e-6;
  for (int i = 0;; ++i) {
    const double start = seg * i;
    if (start >= duration_s - kEpsilon) break;
    plan.push_back({i + 1, start, std::min(seg, duration_s - start)});
  }
  // The last window absorbs rounding so the durations sum to D.
  plan.back().duration_s = duration_s - plan.back().start_s;
  return plan;
}

std::string SegmentPath(const std::string& source, int index) {
  const std::filesystem::path p(source);
  char num[16];
  std::snprintf(num, sizeof(num), "%03d", index);
  return (p.parent_path() /
          (p.stem().string() + lifecycle::kTempMarker + ".seg" + num + p.extension().string()))
      .string();
}

int RemoveSegmentFiles(const std::string& source) {
  namespace fs = std::filesystem;
  const fs::path p(source);
  const std::string prefix = p.stem().string() + lifecycle::kTempMarker + ".seg";
  const std::string ext = p.extension().string();

  std::error_code ec;
  fs::path dir = p.parent_path();
  if (dir.empty()) dir = ".";
  std::vector<fs::path> doomed;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (name.compare(0, prefix.size(), prefix) == 0 && util::EndsWith(name, ext)) doomed.push_back(it->path());
  }

  int removed = 0;
  for (const auto& f : doomed) {
    if (fs::remove(f, ec)) ++removed;
  }
  return removed;
}

}  // namespace mediarelay::delivery
