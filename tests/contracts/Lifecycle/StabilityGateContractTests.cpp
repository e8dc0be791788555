// Repository: MediaRelay
// Component: Stability gate and artifact lifecycle contract tests
// Copyright (c) 2025 MediaRelay

#include <gtest/gtest.h>

#include "mediarelay/lifecycle/Artifact.hpp"
#include "mediarelay/lifecycle/StabilityGate.hpp"
#include "support/DeterministicTimeSource.hpp"
#include "support/TempTree.hpp"

namespace mediarelay::lifecycle {
namespace {

// -----------------------------------------------------------------------------
// A file is stable exactly when now - mtime >= min_age.
// -----------------------------------------------------------------------------
TEST(StabilityGateContract, StableOnlyAfterMinimumAge) {
  TempTree tree("stability");
  const std::string path = tree.Write("clip.mp4", 128, kBaseMtimeMs);
  DeterministicTimeSource clock(kBaseMtimeMs);

  EXPECT_FALSE(IsStable(path, 20, clock));
  clock.AdvanceMs(19'999);
  EXPECT_FALSE(IsStable(path, 20, clock));
  clock.AdvanceMs(1);
  EXPECT_TRUE(IsStable(path, 20, clock)) << "age == min_age counts as stable";
  clock.AdvanceSeconds(3600);
  EXPECT_TRUE(IsStable(path, 20, clock));
}

TEST(StabilityGateContract, ZeroAgeIsImmediatelyStable) {
  TempTree tree("stability_zero");
  const std::string path = tree.Write("clip.mp4", 1, kBaseMtimeMs);
  DeterministicTimeSource clock(kBaseMtimeMs);
  EXPECT_TRUE(IsStable(path, 0, clock));
}

TEST(StabilityGateContract, RewriteResetsTheClock) {
  TempTree tree("stability_rewrite");
  const std::string path = tree.Write("clip.mp4", 10, kBaseMtimeMs);
  DeterministicTimeSource clock(kBaseMtimeMs + 30'000);
  ASSERT_TRUE(IsStable(path, 20, clock));

  TempTree::SetMtimeMs(path, kBaseMtimeMs + 25'000);
  EXPECT_FALSE(IsStable(path, 20, clock));
}

TEST(StabilityGateContract, MissingPathIsNotStableAndNotAnError) {
  DeterministicTimeSource clock(kBaseMtimeMs);
  EXPECT_FALSE(IsStable("/tmp/mediarelay_does_not_exist/clip.mp4", 0, clock));
  EXPECT_FALSE(StatPath("/tmp/mediarelay_does_not_exist/clip.mp4").has_value());
}

TEST(StabilityGateContract, StatReportsSizeAndMtime) {
  TempTree tree("stability_stat");
  const std::string path = tree.Write("a.mkv", 4321, kBaseMtimeMs + 500);
  auto st = StatPath(path);
  ASSERT_TRUE(st.has_value());
  EXPECT_EQ(st->size_bytes, 4321u);
  EXPECT_EQ(st->mtime_ms, kBaseMtimeMs + 500);
  EXPECT_TRUE(st->regular);
}

// -----------------------------------------------------------------------------
// Lifecycle moves forward only.
// -----------------------------------------------------------------------------
TEST(ArtifactLifecycleContract, ForwardTransitionsOnly) {
  EXPECT_TRUE(IsLegalTransition(ArtifactState::kWriting, ArtifactState::kPartial));
  EXPECT_TRUE(IsLegalTransition(ArtifactState::kPartial, ArtifactState::kReady));
  EXPECT_TRUE(IsLegalTransition(ArtifactState::kPartial, ArtifactState::kQuarantined));
  EXPECT_TRUE(IsLegalTransition(ArtifactState::kReady, ArtifactState::kDelivered));

  EXPECT_FALSE(IsLegalTransition(ArtifactState::kReady, ArtifactState::kPartial));
  EXPECT_FALSE(IsLegalTransition(ArtifactState::kDelivered, ArtifactState::kReady));
  EXPECT_FALSE(IsLegalTransition(ArtifactState::kQuarantined, ArtifactState::kReady));
  EXPECT_FALSE(IsLegalTransition(ArtifactState::kWriting, ArtifactState::kReady));
  EXPECT_FALSE(IsLegalTransition(ArtifactState::kReady, ArtifactState::kReady));
}

TEST(ArtifactLifecycleContract, AdvanceRefusesIllegalMoveAndKeepsState) {
  Artifact a;
  a.state = ArtifactState::kDelivered;
  EXPECT_FALSE(a.Advance(ArtifactState::kReady));
  EXPECT_EQ(a.state, ArtifactState::kDelivered);

  Artifact b;
  b.state = ArtifactState::kReady;
  EXPECT_TRUE(b.Advance(ArtifactState::kDelivered));
  EXPECT_STREQ(ArtifactStateName(b.state), "DELIVERED");
}

}  // namespace
}  // namespace mediarelay::lifecycle
