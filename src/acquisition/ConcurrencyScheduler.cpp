// Repository: MediaRelay
// Component: Concurrency Scheduler
// Copyright (c) 2025 MediaRelay

#include "mediarelay/acquisition/ConcurrencyScheduler.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <set>

#include "mediarelay/util/Logger.hpp"

namespace mediarelay::acquisition {

using util::Logger;

std::string SchedulerSnapshot::ToString() const {
  return "queued=" + std::to_string(queued) + " running=" + std::to_string(running) +
         " done=" + std::to_string(done) + " error=" + std::to_string(error) +
         " / total=" + std::to_string(total);
}

ConcurrencyScheduler::ConcurrencyScheduler(IAcquirer& acquirer, int max_active,
                                           int monitor_interval_s)
    : acquirer_(acquirer),
      max_active_(std::max(1, max_active)),
      monitor_interval_s_(std::max(1, monitor_interval_s)) {}

ConcurrencyScheduler::~ConcurrencyScheduler() {
  RequestStop();
  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    workers.swap(workers_);
  }
  for (auto& t : workers) {
    if (t.joinable()) t.join();
  }
}

void ConcurrencyScheduler::RequestStop() {
  stop_.store(true, std::memory_order_release);
  {
    // Empty critical section: orders the flag with waiters' predicate checks.
    std::lock_guard<std::mutex> lock(mutex_);
  }
  cv_.notify_all();
}

void ConcurrencyScheduler::LaunchLocked(size_t index) {
  entries_[index].status = JobStatus::kRunning;
  ++active_;
  peak_active_ = std::max(peak_active_, active_);
  Logger::Info("[ConcurrencyScheduler] Launch " + entries_[index].locator +
               " (active=" + std::to_string(active_) + ")");
  workers_.emplace_back([this, index] { WorkerLoop(index); });
}

void ConcurrencyScheduler::WorkerLoop(size_t index) {
  std::string locator;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    locator = entries_[index].locator;
  }

  JobStatus result = JobStatus::kError;
  try {
    result = acquirer_.Acquire(locator, stop_);
  } catch (const std::exception& e) {
    Logger::Error("[ConcurrencyScheduler] Job " + locator + " threw: " + e.what());
    result = JobStatus::kError;
  } catch (...) {
    Logger::Error("[ConcurrencyScheduler] Job " + locator + " threw a non-standard exception");
    result = JobStatus::kError;
  }
  if (result != JobStatus::kDone) result = JobStatus::kError;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[index].status = result;
    --active_;
    Logger::Info("[ConcurrencyScheduler] " + std::string(JobStatusName(result)) + ": " + locator);
    if (!stop_.load(std::memory_order_acquire) && !backlog_.empty()) {
      const size_t next = backlog_.front();
      backlog_.pop_front();
      LaunchLocked(next);
    }
  }
  cv_.notify_all();
}

void ConcurrencyScheduler::MonitorLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!finished_) {
    if (cv_.wait_for(lock, std::chrono::seconds(monitor_interval_s_),
                     [this] { return finished_; })) {
      break;
    }
    Logger::Info("[ConcurrencyScheduler] Status: " + SnapshotLocked().ToString());
  }
}

SchedulerSnapshot ConcurrencyScheduler::Run(const std::vector<std::string>& locators) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    backlog_.clear();
    active_ = 0;
    peak_active_ = 0;
    finished_ = false;

    std::set<std::string> seen;
    for (const auto& l : locators) {
      if (seen.insert(l).second) entries_.push_back({l, JobStatus::kQueued});
    }
    for (size_t i = 0; i < entries_.size(); ++i) {
      if (static_cast<int>(i) < max_active_ && !stop_.load(std::memory_order_acquire)) {
        LaunchLocked(i);
      } else {
        backlog_.push_back(i);
      }
    }
    Logger::Info("[ConcurrencyScheduler] " + std::to_string(entries_.size()) + " jobs, " +
                 std::to_string(active_) + " launched, " + std::to_string(backlog_.size()) +
                 " in backlog (max_active=" + std::to_string(max_active_) + ")");
  }

  std::thread monitor([this] { MonitorLoop(); });

  {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] {
      return active_ == 0 && (backlog_.empty() || stop_.load(std::memory_order_acquire));
    });
    finished_ = true;
  }
  cv_.notify_all();
  monitor.join();

  // No worker can launch another once the active set is empty.
  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    workers.swap(workers_);
  }
  for (auto& t : workers) t.join();

  SchedulerSnapshot snap = Snapshot();
  Logger::Info("[ConcurrencyScheduler] Finished: " + snap.ToString() +
               " peak_active=" + std::to_string(snap.peak_active));
  return snap;
}

SchedulerSnapshot ConcurrencyScheduler::SnapshotLocked() const {
  SchedulerSnapshot s;
  for (const auto& e : entries_) {
    switch (e.status) {
      case JobStatus::kQueued: ++s.queued; break;
      case JobStatus::kRunning: ++s.running; break;
      case JobStatus::kDone: ++s.done; break;
      case JobStatus::kError: ++s.error; break;
    }
  }
  s.total = static_cast<int>(entries_.size());
  s.peak_active = peak_active_;
  return s;
}

SchedulerSnapshot ConcurrencyScheduler::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return SnapshotLocked();
}

std::vector<std::pair<std::string, JobStatus>> ConcurrencyScheduler::Jobs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::pair<std::string, JobStatus>> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) out.emplace_back(e.locator, e.status);
  return out;
}

}  // namespace mediarelay::acquisition
