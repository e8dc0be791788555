// Repository: MediaRelay
// Component: Artifact Pipeline
// Copyright (c) 2025 MediaRelay

#include "mediarelay/pipeline/ArtifactPipeline.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <set>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "mediarelay/delivery/SegmentPlanner.hpp"
#include "mediarelay/util/Logger.hpp"

namespace fs = std::filesystem;

namespace mediarelay::pipeline {

using util::Logger;

namespace {

constexpr int kSleepSliceMs = 200;

}  // namespace

std::string PassSummary::ToString() const {
  return "recovered=" + std::to_string(recovered) + " quarantined=" + std::to_string(quarantined) +
         " candidates=" + std::to_string(candidates) + " delivered=" + std::to_string(delivered) +
         " failed=" + std::to_string(failed) + " set_aside=" + std::to_string(set_aside);
}

ArtifactPipeline::ArtifactPipeline(const config::PipelineConfig& config,
                                   recovery::RecoveryEngine& recovery,
                                   delivery::DeliveryRouter& router,
                                   media::IMediaProbe& probe,
                                   const timing::ITimeSource& clock)
    : config_(config),
      recovery_(recovery),
      router_(router),
      probe_(probe),
      scanner_(clock),
      scan_options_(scan::ScanOptions::FromConfig(config)),
      ledger_(config.delivery.max_delivery_failures) {}

bool ArtifactPipeline::SetAside(const std::string& path) {
  if (config_.recovery.quarantine_dir.empty()) return false;
  std::string dst;
  std::string error;
  if (!recovery::MoveToFreeName(
          path,
          (fs::path(config_.recovery.quarantine_dir) / "undeliverable" / fs::path(path).filename())
              .string(),
          &dst, &error)) {
    Logger::Error("[ArtifactPipeline] cannot set aside " + path + ": " + error);
    return false;
  }
  const int cuts = delivery::RemoveSegmentFiles(path);
  Logger::Warn("[ArtifactPipeline] Undeliverable after " +
               std::to_string(ledger_.Failures(path)) + " passes, moved " + path + " -> " + dst +
               (cuts > 0 ? " (removed " + std::to_string(cuts) + " segment files)" : ""));
  ledger_.Forget(path);
  return true;
}

void ArtifactPipeline::DeliverOne(lifecycle::Artifact& artifact, PassSummary* summary) {
  artifact.media = probe_.Probe(artifact.path);
  delivery::DeliveryReport report = router_.Deliver(artifact);
  if (report.delivered()) {
    ++summary->delivered;
    ledger_.RecordSuccess(artifact.path);
    return;
  }

  ++summary->failed;
  ledger_.RecordFailure(artifact.path);
  if (ledger_.Exhausted(artifact.path) && SetAside(artifact.path)) {
    ++summary->set_aside;
  }
}

PassSummary ArtifactPipeline::RunOnce(const std::atomic<bool>* stop) {
  PassSummary summary;
  const std::string& root = config_.watch_dir;

  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    Logger::Warn("[ArtifactPipeline] Watch root missing: " + root);
    summary.root_missing = true;
    return summary;
  }

  recovery::RecoverySweepSummary sweep;
  try {
    sweep = recovery_.RecoverPartials(root, config_.partial_stable_age_s);
  } catch (const std::exception& e) {
    Logger::Error(std::string("[ArtifactPipeline] Recovery sweep failed: ") + e.what());
  }
  summary.recovered = static_cast<int>(sweep.recovered.size());
  summary.quarantined = static_cast<int>(sweep.quarantined.size());

  // Freshly recovered files first, then the scan oldest-first.
  std::vector<lifecycle::Artifact> queue;
  std::set<std::string> queued;
  for (const auto& path : sweep.recovered) {
    lifecycle::Artifact a;
    if (scanner_.Qualifies(path, scan_options_, &a) && queued.insert(a.path).second) {
      queue.push_back(std::move(a));
    }
  }
  for (auto& a : scanner_.Scan(root, scan_options_)) {
    if (queued.insert(a.path).second) queue.push_back(std::move(a));
  }
  summary.candidates = static_cast<int>(queue.size());
  ledger_.Retain(queued);

  for (auto& artifact : queue) {
    if (stop && stop->load(std::memory_order_acquire)) break;
    try {
      DeliverOne(artifact, &summary);
    } catch (const std::exception& e) {
      ++summary.failed;
      Logger::Error("[ArtifactPipeline] Unexpected error on " + artifact.path + ": " + e.what());
    }
  }

  if (summary.candidates > 0 || summary.recovered > 0 || summary.quarantined > 0) {
    Logger::Info("[ArtifactPipeline] Pass: " + summary.ToString());
  } else {
    Logger::Debug("[ArtifactPipeline] Pass: nothing to do");
  }
  return summary;
}

recovery::RecoverySweepSummary ArtifactPipeline::FinalSweep(int min_age_s) {
  std::error_code ec;
  if (!fs::is_directory(config_.watch_dir, ec)) return {};
  try {
    return recovery_.RecoverPartials(config_.watch_dir, min_age_s);
  } catch (const std::exception& e) {
    Logger::Error(std::string("[ArtifactPipeline] Final sweep failed: ") + e.what());
    return {};
  }
}

void ArtifactPipeline::Run(const std::atomic<bool>& stop) {
  Logger::Info("[ArtifactPipeline] Watching " + config_.watch_dir +
               (config_.watch ? " every " + std::to_string(config_.watch_interval_s) + "s"
                              : " (single pass)"));
  while (!stop.load(std::memory_order_acquire)) {
    RunOnce(&stop);
    if (!config_.watch) break;

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::seconds(config_.watch_interval_s);
    while (!stop.load(std::memory_order_acquire) &&
           std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(kSleepSliceMs));
    }
  }

  Logger::Info("[ArtifactPipeline] Final recovery sweep");
  FinalSweep(config_.partial_stable_age_s);
}

}  // namespace mediarelay::pipeline
