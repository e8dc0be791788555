// Repository: MediaRelay
// Component: Readiness Scanner
// Copyright (c) 2025 MediaRelay

#include "mediarelay/scan/ReadinessScanner.hpp"

#include <algorithm>
#include <filesystem>

#include "mediarelay/config/PipelineConfig.hpp"
#include "mediarelay/lifecycle/StabilityGate.hpp"
#include "mediarelay/scan/FileWalker.hpp"
#include "mediarelay/util/Logger.hpp"
#include "mediarelay/util/TextUtil.hpp"

namespace fs = std::filesystem;

namespace mediarelay::scan {

using util::Logger;

ScanOptions ScanOptions::FromConfig(const config::PipelineConfig& config) {
  ScanOptions o;
  for (const auto& ext : config.extensions) o.extensions.push_back(util::ToLower(ext));
  o.min_age_s = config.stable_age_s;
  o.min_size_bytes = config.min_size_bytes;
  o.max_size_bytes = config.max_size_bytes;
  o.partial_suffix = config.recovery.partial_suffix;
  o.quarantine_dir = config.recovery.quarantine_dir;
  return o;
}

bool ReadinessScanner::NameAccepted(const std::string& path, const ScanOptions& options) const {
  const std::string name = fs::path(path).filename().string();
  if (name.empty() || name[0] == '.') return false;
  if (!options.partial_suffix.empty() && util::EndsWith(name, options.partial_suffix)) {
    return false;
  }
  if (name.find(lifecycle::kTempMarker) != std::string::npos) return false;
  const std::string ext = util::ToLower(fs::path(path).extension().string());
  return std::find(options.extensions.begin(), options.extensions.end(), ext) !=
         options.extensions.end();
}

bool ReadinessScanner::Admit(const std::string& path, const ScanOptions& options,
                             bool check_stability, lifecycle::Artifact* out) const {
  auto st = lifecycle::StatPath(path);
  if (!st || !st->regular) return false;  // vanished mid-scan

  // An acquisition writing straight into this file keeps "<path><suffix>"
  // beside it until the download has finished.
  if (!options.partial_suffix.empty() && lifecycle::StatPath(path + options.partial_suffix)) {
    Logger::Debug("[ReadinessScanner] still being written, skipping " + path);
    return false;
  }

  if (st->size_bytes < options.min_size_bytes) return false;
  if (check_stability && !lifecycle::IsStable(*st, options.min_age_s, clock_)) return false;
  if (options.max_size_bytes > 0 && st->size_bytes > options.max_size_bytes) {
    Logger::Debug("[ReadinessScanner] over size ceiling, skipping " + path + " (" +
                  util::HumanSize(st->size_bytes) + ")");
    return false;
  }

  out->path = path;
  out->size_bytes = st->size_bytes;
  out->mtime_ms = st->mtime_ms;
  out->state = lifecycle::ArtifactState::kReady;
  out->media = {};
  return true;
}

std::vector<lifecycle::Artifact> ReadinessScanner::Scan(const std::string& root,
                                                        const ScanOptions& options) const {
  std::vector<lifecycle::Artifact> ready;
  WalkFiles(root, options.quarantine_dir, [&](const std::string& path) {
    if (!NameAccepted(path, options)) return;
    lifecycle::Artifact a;
    if (Admit(path, options, true, &a)) ready.push_back(std::move(a));
  });

  std::sort(ready.begin(), ready.end(),
            [](const lifecycle::Artifact& a, const lifecycle::Artifact& b) {
              if (a.mtime_ms != b.mtime_ms) return a.mtime_ms < b.mtime_ms;
              return a.path < b.path;
            });
  return ready;
}

bool ReadinessScanner::Qualifies(const std::string& path, const ScanOptions& options,
                                 lifecycle::Artifact* out) const {
  if (!NameAccepted(path, options)) return false;
  lifecycle::Artifact a;
  // A file the recovery engine just renamed into place is complete; its
  // fresh mtime must not hold it back.
  if (!Admit(path, options, false, &a)) return false;
  *out = std::move(a);
  return true;
}

}  // namespace mediarelay::scan
