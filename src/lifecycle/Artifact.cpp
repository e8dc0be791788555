// Repository: MediaRelay
// Component: Artifact Domain
// Copyright (c) 2025 MediaRelay

#include "mediarelay/lifecycle/Artifact.hpp"

namespace mediarelay::lifecycle {

const char* ArtifactStateName(ArtifactState state) {
  switch (state) {
    case ArtifactState::kWriting:
      return "WRITING";
    case ArtifactState::kPartial:
      return "PARTIAL";
    case ArtifactState::kReady:
      return "READY";
    case ArtifactState::kDelivered:
      return "DELIVERED";
    case ArtifactState::kQuarantined:
      return "QUARANTINED";
  }
  return "UNKNOWN";
}

bool IsLegalTransition(ArtifactState from, ArtifactState to) {
  switch (from) {
    case ArtifactState::kWriting:
      return to == ArtifactState::kPartial;
    case ArtifactState::kPartial:
      return to == ArtifactState::kReady || to == ArtifactState::kQuarantined;
    case ArtifactState::kReady:
      return to == ArtifactState::kDelivered;
    case ArtifactState::kDelivered:
    case ArtifactState::kQuarantined:
      return false;
  }
  return false;
}

bool Artifact::Advance(ArtifactState to) {
  if (!IsLegalTransition(state, to)) return false;
  state = to;
  return true;
}

}  // namespace mediarelay::lifecycle
