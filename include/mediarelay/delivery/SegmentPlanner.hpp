// Repository: MediaRelay
// Component: Segment Planner
// Purpose: Split an oversized artifact's timeline into contiguous windows
//          expected to land under a byte target each.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_DELIVERY_SEGMENT_PLANNER_HPP_
#define MEDIARELAY_DELIVERY_SEGMENT_PLANNER_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace mediarelay::delivery {

struct SegmentWindow {
  int index = 1;  // 1-based
  double start_s = 0.0;
  double duration_s = 0.0;
};

// Segment length is max(D * T / S, floor). Windows cover [0, D) without
// gaps or overlap; the last window is shortened so the durations sum to D.
// Empty for non-positive duration or size.
std::vector<SegmentWindow> PlanSegments(double duration_s, uint64_t total_bytes,
                                        uint64_t target_bytes, double min_segment_s);

// "<dir>/<stem>.__tmp__.segNNN<ext>" beside the source.
std::string SegmentPath(const std::string& source, int index);

// Removes every SegmentPath(source, *) file present beside source. Returns the
// number removed.
int RemoveSegmentFiles(const std::string& source);

}  // namespace mediarelay::delivery

#endif  // MEDIARELAY_DELIVERY_SEGMENT_PLANNER_HPP_
