// Repository: MediaRelay
// Component: Concurrency scheduler contract tests
// Copyright (c) 2025 MediaRelay

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "fixtures/FakeAcquirer.h"
#include "mediarelay/acquisition/ConcurrencyScheduler.hpp"

namespace mediarelay::acquisition {
namespace {

using tests::fixtures::FakeAcquirer;
using namespace std::chrono_literals;

std::vector<std::string> Locators(int n) {
  std::vector<std::string> out;
  for (int i = 0; i < n; ++i) out.push_back("https://host/owner" + std::to_string(i) + "/");
  return out;
}

// -----------------------------------------------------------------------------
// Ceiling 8, 20 locators: never more than 8 at once, every job run exactly
// once, nothing left queued or running.
// -----------------------------------------------------------------------------
TEST(ConcurrencySchedulerContract, CapacityIsNeverExceededAndAllJobsRun) {
  FakeAcquirer acquirer(30ms);
  ConcurrencyScheduler scheduler(acquirer, 8, 1);
  const auto locators = Locators(20);

  SchedulerSnapshot snap = scheduler.Run(locators);

  EXPECT_LE(acquirer.max_running(), 8);
  EXPECT_EQ(snap.peak_active, 8) << "the ceiling is reached when the backlog is deep";
  EXPECT_EQ(snap.total, 20);
  EXPECT_EQ(snap.done, 20);
  EXPECT_EQ(snap.queued, 0);
  EXPECT_EQ(snap.running, 0);

  auto started = acquirer.started();
  EXPECT_EQ(started.size(), 20u);
  EXPECT_EQ(std::set<std::string>(started.begin(), started.end()).size(), 20u)
      << "each locator launched exactly once";
}

TEST(ConcurrencySchedulerContract, BacklogLaunchesInOrder) {
  FakeAcquirer acquirer(5ms);
  ConcurrencyScheduler scheduler(acquirer, 1, 1);
  const auto locators = Locators(5);

  scheduler.Run(locators);

  EXPECT_EQ(acquirer.started(), locators);
}

TEST(ConcurrencySchedulerContract, FewerLocatorsThanSlots) {
  FakeAcquirer acquirer(5ms);
  ConcurrencyScheduler scheduler(acquirer, 8, 1);
  SchedulerSnapshot snap = scheduler.Run(Locators(3));
  EXPECT_EQ(snap.done, 3);
  EXPECT_EQ(snap.peak_active, 3);
}

TEST(ConcurrencySchedulerContract, EmptyInputReturnsImmediately) {
  FakeAcquirer acquirer;
  ConcurrencyScheduler scheduler(acquirer, 4, 1);
  SchedulerSnapshot snap = scheduler.Run({});
  EXPECT_EQ(snap.total, 0);
  EXPECT_TRUE(acquirer.started().empty());
}

TEST(ConcurrencySchedulerContract, DuplicateLocatorsRunOnce) {
  FakeAcquirer acquirer(5ms);
  ConcurrencyScheduler scheduler(acquirer, 2, 1);
  SchedulerSnapshot snap = scheduler.Run({"https://h/a/", "https://h/b/", "https://h/a/"});
  EXPECT_EQ(snap.total, 2);
  EXPECT_EQ(acquirer.started().size(), 2u);
}

TEST(ConcurrencySchedulerContract, FailuresAndExceptionsDoNotStopTheRun) {
  FakeAcquirer acquirer(5ms);
  const auto locators = Locators(6);
  acquirer.SetOutcome(locators[1], FakeAcquirer::Outcome::kError);
  acquirer.SetOutcome(locators[2], FakeAcquirer::Outcome::kThrow);
  ConcurrencyScheduler scheduler(acquirer, 2, 1);

  SchedulerSnapshot snap = scheduler.Run(locators);

  EXPECT_EQ(snap.done, 4);
  EXPECT_EQ(snap.error, 2);
  auto jobs = scheduler.Jobs();
  ASSERT_EQ(jobs.size(), 6u);
  EXPECT_EQ(jobs[1].second, JobStatus::kError);
  EXPECT_EQ(jobs[2].second, JobStatus::kError);
  EXPECT_EQ(jobs[5].second, JobStatus::kDone);
}

TEST(ConcurrencySchedulerContract, StopLeavesBacklogQueuedAndInterruptsRunningJobs) {
  FakeAcquirer acquirer(10s);
  ConcurrencyScheduler scheduler(acquirer, 2, 1);
  const auto locators = Locators(6);

  std::thread stopper([&] {
    std::this_thread::sleep_for(100ms);
    scheduler.RequestStop();
  });
  const auto t0 = std::chrono::steady_clock::now();
  SchedulerSnapshot snap = scheduler.Run(locators);
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  stopper.join();

  EXPECT_LT(elapsed, 5s) << "running jobs observe the interrupt";
  EXPECT_EQ(acquirer.started().size(), 2u);
  EXPECT_EQ(acquirer.interrupted(), 2);
  EXPECT_EQ(snap.running, 0);
  EXPECT_EQ(snap.error, 2);
  EXPECT_EQ(snap.queued, 4);
}

TEST(ConcurrencySchedulerContract, StatusNames) {
  EXPECT_STREQ(JobStatusName(JobStatus::kQueued), "queued");
  EXPECT_STREQ(JobStatusName(JobStatus::kRunning), "running");
  EXPECT_STREQ(JobStatusName(JobStatus::kDone), "done");
  EXPECT_STREQ(JobStatusName(JobStatus::kError), "error");
}

}  // namespace
}  // namespace mediarelay::acquisition
