// Repository: MediaRelay
// Component: Acquisition Job
// Purpose: One locator's download: owner, pre-assigned output paths, status.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_ACQUISITION_ACQUISITION_JOB_HPP_
#define MEDIARELAY_ACQUISITION_ACQUISITION_JOB_HPP_

#include <atomic>
#include <string>

namespace mediarelay::acquisition {

enum class JobStatus { kQueued, kRunning, kDone, kError };

const char* JobStatusName(JobStatus status);

struct AcquisitionJob {
  std::string locator;
  std::string owner;
  std::string target_path;   // <download_dir>/<owner>/<stamp>_<owner>.mp4
  std::string partial_path;  // target_path + partial suffix
  JobStatus status = JobStatus::kQueued;
};

// First path component of the locator URL, made filesystem-safe;
// "unknown" when there is none.
//   "https://host/alice/" -> "alice"
std::string OwnerFromLocator(const std::string& locator);

// Paths only; nothing is created on disk.
AcquisitionJob MakeJob(const std::string& locator, const std::string& download_dir,
                       const std::string& stamp, const std::string& partial_suffix = ".part");

// Runs one job to a terminal status. Implementations must honour interrupt
// by stopping external work promptly.
class IAcquirer {
 public:
  virtual ~IAcquirer() = default;
  virtual JobStatus Acquire(const std::string& locator, const std::atomic<bool>& interrupt) = 0;
};

}  // namespace mediarelay::acquisition

#endif  // MEDIARELAY_ACQUISITION_ACQUISITION_JOB_HPP_
