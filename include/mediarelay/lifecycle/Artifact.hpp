// Repository: MediaRelay
// Component: Artifact Domain
// Purpose: One media file tracked through WRITING → PARTIAL → READY →
//          DELIVERED, with QUARANTINED reachable only from PARTIAL.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_LIFECYCLE_ARTIFACT_HPP_
#define MEDIARELAY_LIFECYCLE_ARTIFACT_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace mediarelay::lifecycle {

// Carried by every in-progress output (recovery attempts, segments). Names
// containing it are never treated as artifacts.
inline constexpr char kTempMarker[] = ".__tmp__";

enum class ArtifactState {
  kWriting = 0,
  kPartial = 1,
  kReady = 2,
  kDelivered = 3,
  kQuarantined = 4,
};

const char* ArtifactStateName(ArtifactState state);

// Forward-only table; self-transitions are not transitions.
bool IsLegalTransition(ArtifactState from, ArtifactState to);

// Probed container/codec descriptor. Every field is optional: a partial or
// unusual file may report any subset.
struct MediaInfo {
  std::optional<int> width;
  std::optional<int> height;
  std::optional<double> duration_s;

  bool HasGeometry() const { return width.has_value() && height.has_value(); }
};

struct Artifact {
  std::string path;
  uint64_t size_bytes = 0;
  int64_t mtime_ms = 0;
  ArtifactState state = ArtifactState::kReady;
  MediaInfo media;

  // Advances state when the table allows it; returns false otherwise and
  // leaves state untouched.
  bool Advance(ArtifactState to);
};

}  // namespace mediarelay::lifecycle

#endif  // MEDIARELAY_LIFECYCLE_ARTIFACT_HPP_
