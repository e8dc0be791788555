// Repository: MediaRelay
// Component: Acquisition Job
// Copyright (c) 2025 MediaRelay

#include "mediarelay/acquisition/AcquisitionJob.hpp"

#include <filesystem>

#include "mediarelay/util/TextUtil.hpp"

namespace mediarelay::acquisition {

const char* JobStatusName(JobStatus status) {
  switch (status) {
    case JobStatus::kQueued: return "queued";
    case JobStatus::kRunning: return "running";
    case JobStatus::kDone: return "done";
    case JobStatus::kError: return "error";
  }
  return "unknown";
}

std::string OwnerFromLocator(const std::string& locator) {
  const std::string s = util::Trim(locator);
  size_t pos = 0;
  const size_t scheme = s.find("://");
  if (scheme != std::string::npos) {
    pos = s.find('/', scheme + 3);
    if (pos == std::string::npos) return "unknown";
  }
  while (pos < s.size() && s[pos] == '/') ++pos;
  const size_t end = s.find_first_of("/?#", pos);
  const std::string component = s.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
  const std::string owner = util::SafeName(component);
  return owner.empty() || owner == "_" ? "unknown" : owner;
}

AcquisitionJob MakeJob(const std::string& locator, const std::string& download_dir,
                       const std::string& stamp, const std::string& partial_suffix) {
  AcquisitionJob job;
  job.locator = locator;
  job.owner = OwnerFromLocator(locator);
  job.target_path = (std::filesystem::path(download_dir) / job.owner /
                     (stamp + "_" + job.owner + ".mp4"))
                        .string();
  job.partial_path = job.target_path + partial_suffix;
  return job;
}

}  // namespace mediarelay::acquisition
