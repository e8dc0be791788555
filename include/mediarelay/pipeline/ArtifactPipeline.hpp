// Repository: MediaRelay
// Component: Artifact Pipeline
// Purpose: The uploader's periodic pass: proactive recovery, readiness scan,
//          tiered delivery, failure bookkeeping.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_PIPELINE_ARTIFACT_PIPELINE_HPP_
#define MEDIARELAY_PIPELINE_ARTIFACT_PIPELINE_HPP_

#include <atomic>
#include <string>

#include "mediarelay/config/PipelineConfig.hpp"
#include "mediarelay/delivery/DeliveryFailureLedger.hpp"
#include "mediarelay/delivery/DeliveryRouter.hpp"
#include "mediarelay/media/IMediaProbe.hpp"
#include "mediarelay/recovery/RecoveryEngine.hpp"
#include "mediarelay/scan/ReadinessScanner.hpp"
#include "mediarelay/timing/ITimeSource.hpp"

namespace mediarelay::pipeline {

struct PassSummary {
  int recovered = 0;
  int quarantined = 0;
  int candidates = 0;
  int delivered = 0;
  int failed = 0;
  int set_aside = 0;  // moved to <quarantine>/undeliverable
  bool root_missing = false;

  std::string ToString() const;
};

class ArtifactPipeline {
 public:
  // Collaborators are not owned.
  ArtifactPipeline(const config::PipelineConfig& config,
                   recovery::RecoveryEngine& recovery,
                   delivery::DeliveryRouter& router,
                   media::IMediaProbe& probe,
                   const timing::ITimeSource& clock);

  ArtifactPipeline(const ArtifactPipeline&) = delete;
  ArtifactPipeline& operator=(const ArtifactPipeline&) = delete;

  // One full pass. Never throws; per-artifact failures are logged. When stop
  // is given and raised, the pass ends after the artifact in progress.
  PassSummary RunOnce(const std::atomic<bool>* stop = nullptr);

  // RunOnce every watch_interval_s until stop is raised (a single pass when
  // watch is off), then one last recovery sweep.
  void Run(const std::atomic<bool>& stop);

  // Best-effort recovery of every stable partial under the root.
  recovery::RecoverySweepSummary FinalSweep(int min_age_s);

  const delivery::DeliveryFailureLedger& ledger() const { return ledger_; }

 private:
  void DeliverOne(lifecycle::Artifact& artifact, PassSummary* summary);
  bool SetAside(const std::string& path);

  config::PipelineConfig config_;
  recovery::RecoveryEngine& recovery_;
  delivery::DeliveryRouter& router_;
  media::IMediaProbe& probe_;
  scan::ReadinessScanner scanner_;
  scan::ScanOptions scan_options_;
  delivery::DeliveryFailureLedger ledger_;
};

}  // namespace mediarelay::pipeline

#endif  // MEDIARELAY_PIPELINE_ARTIFACT_PIPELINE_HPP_
