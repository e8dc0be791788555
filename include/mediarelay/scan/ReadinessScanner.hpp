// Repository: MediaRelay
// Component: Readiness Scanner
// Purpose: Enumerate finished, stable, deliverable media under a root.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_SCAN_READINESS_SCANNER_HPP_
#define MEDIARELAY_SCAN_READINESS_SCANNER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "mediarelay/lifecycle/Artifact.hpp"
#include "mediarelay/timing/ITimeSource.hpp"

namespace mediarelay::config {
struct PipelineConfig;
}

namespace mediarelay::scan {

struct ScanOptions {
  std::vector<std::string> extensions;  // lower-case, with leading dot
  int min_age_s = 20;
  uint64_t min_size_bytes = 0;
  uint64_t max_size_bytes = 0;  // 0 = unlimited
  std::string partial_suffix = ".part";
  std::string quarantine_dir;

  static ScanOptions FromConfig(const config::PipelineConfig& config);
};

class ReadinessScanner {
 public:
  explicit ReadinessScanner(const timing::ITimeSource& clock) : clock_(clock) {}

  // READY artifacts, oldest mtime first (path breaks ties).
  std::vector<lifecycle::Artifact> Scan(const std::string& root, const ScanOptions& options) const;

  // Name and size filters applied to one known path, without the stability
  // check (used for files recovery has just written). Returns false and
  // leaves *out untouched when it does not qualify.
  bool Qualifies(const std::string& path, const ScanOptions& options,
                 lifecycle::Artifact* out) const;

 private:
  bool NameAccepted(const std::string& path, const ScanOptions& options) const;
  bool Admit(const std::string& path, const ScanOptions& options, bool check_stability,
             lifecycle::Artifact* out) const;

  const timing::ITimeSource& clock_;
};

}  // namespace mediarelay::scan

#endif  // MEDIARELAY_SCAN_READINESS_SCANNER_HPP_
