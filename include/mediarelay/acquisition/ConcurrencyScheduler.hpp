// Repository: MediaRelay
// Component: Concurrency Scheduler
// Purpose: Run one acquisition job per locator with at most max_active in
//          flight, refilling from a FIFO backlog as jobs finish.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_ACQUISITION_CONCURRENCY_SCHEDULER_HPP_
#define MEDIARELAY_ACQUISITION_CONCURRENCY_SCHEDULER_HPP_

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "mediarelay/acquisition/AcquisitionJob.hpp"

namespace mediarelay::acquisition {

struct SchedulerSnapshot {
  int queued = 0;
  int running = 0;
  int done = 0;
  int error = 0;
  int total = 0;
  int peak_active = 0;

  std::string ToString() const;
};

// Threading model:
//   - Each launched job runs on its own worker thread.
//   - A job's terminal transition, the removal from the active set, and the
//     launch of the next backlog item happen under one mutex.
//   - Run() blocks until active set and backlog are empty (or stop was
//     requested and the active set drained), then joins every worker.
//   - A monitor thread logs the counters every monitor_interval_s.
class ConcurrencyScheduler {
 public:
  ConcurrencyScheduler(IAcquirer& acquirer, int max_active, int monitor_interval_s = 5);
  ~ConcurrencyScheduler();

  ConcurrencyScheduler(const ConcurrencyScheduler&) = delete;
  ConcurrencyScheduler& operator=(const ConcurrencyScheduler&) = delete;

  // Duplicate locators are dropped, first occurrence wins.
  SchedulerSnapshot Run(const std::vector<std::string>& locators);

  // No further backlog launches; running jobs see their interrupt flag set.
  // Safe from any thread, including a signal-watching one.
  void RequestStop();

  SchedulerSnapshot Snapshot() const;

  // Statuses in launch-request order (after dedupe).
  std::vector<std::pair<std::string, JobStatus>> Jobs() const;

 private:
  struct Entry {
    std::string locator;
    JobStatus status = JobStatus::kQueued;
  };

  // Requires mutex_ held.
  void LaunchLocked(size_t index);
  SchedulerSnapshot SnapshotLocked() const;

  void WorkerLoop(size_t index);
  void MonitorLoop();

  IAcquirer& acquirer_;
  const int max_active_;
  const int monitor_interval_s_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<Entry> entries_;
  std::deque<size_t> backlog_;
  std::vector<std::thread> workers_;
  int active_ = 0;
  int peak_active_ = 0;
  bool finished_ = false;

  std::atomic<bool> stop_{false};
};

}  // namespace mediarelay::acquisition

#endif  // MEDIARELAY_ACQUISITION_CONCURRENCY_SCHEDULER_HPP_
