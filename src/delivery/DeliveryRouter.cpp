// Repository: MediaRelay
// Component: Delivery Router
// Copyright (c) 2025 MediaRelay

#include "mediarelay/delivery/DeliveryRouter.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

#include "mediarelay/delivery/Caption.hpp"
#include "mediarelay/delivery/SegmentPlanner.hpp"
#include "mediarelay/lifecycle/StabilityGate.hpp"
#include "mediarelay/util/Logger.hpp"
#include "mediarelay/util/TextUtil.hpp"

namespace mediarelay::delivery {

using util::Logger;

namespace {

DeliveryStage HighCapacityEntry(uint64_t size_bytes, const DeliveryPolicy& policy) {
  if (!policy.high_capacity_configured) return DeliveryStage::kFailed;
  if (size_bytes <= policy.high_capacity_ceiling_bytes) return DeliveryStage::kHighCapacity;
  return policy.segmentation_enabled ? DeliveryStage::kSegmented : DeliveryStage::kFailed;
}

const char* OutcomeName(AttemptOutcome outcome) {
  switch (outcome) {
    case AttemptOutcome::kNone: return "none";
    case AttemptOutcome::kSuccess: return "success";
    case AttemptOutcome::kTooLarge: return "too-large";
    case AttemptOutcome::kRejected: return "rejected";
  }
  return "unknown";
}

void RemoveFiles(const std::vector<std::string>& paths) {
  for (const auto& p : paths) {
    std::error_code ec;
    std::filesystem::remove(p, ec);
  }
}

}  // namespace

const char* TransportStatusName(TransportStatus status) {
  switch (status) {
    case TransportStatus::kOk: return "ok";
    case TransportStatus::kTooLarge: return "too-large";
    case TransportStatus::kRejected: return "rejected";
  }
  return "unknown";
}

const char* DeliveryStageName(DeliveryStage stage) {
  switch (stage) {
    case DeliveryStage::kStart: return "start";
    case DeliveryStage::kLightweight: return "lightweight";
    case DeliveryStage::kHighCapacity: return "high-capacity";
    case DeliveryStage::kSegmented: return "segmented";
    case DeliveryStage::kDelivered: return "delivered";
    case DeliveryStage::kFailed: return "failed";
  }
  return "unknown";
}

AttemptOutcome ToOutcome(TransportStatus status) {
  switch (status) {
    case TransportStatus::kOk: return AttemptOutcome::kSuccess;
    case TransportStatus::kTooLarge: return AttemptOutcome::kTooLarge;
    case TransportStatus::kRejected: return AttemptOutcome::kRejected;
  }
  return AttemptOutcome::kRejected;
}

DeliveryStage NextStage(DeliveryStage stage, AttemptOutcome outcome, uint64_t size_bytes,
                        const DeliveryPolicy& policy) {
  switch (stage) {
    case DeliveryStage::kStart:
      if (policy.lightweight_configured && size_bytes <= policy.lightweight_limit_bytes) {
        return DeliveryStage::kLightweight;
      }
      return HighCapacityEntry(size_bytes, policy);

    case DeliveryStage::kLightweight:
      switch (outcome) {
        case AttemptOutcome::kSuccess: return DeliveryStage::kDelivered;
        case AttemptOutcome::kTooLarge: return HighCapacityEntry(size_bytes, policy);
        case AttemptOutcome::kRejected:
          return policy.fallthrough_on_reject ? HighCapacityEntry(size_bytes, policy)
                                              : DeliveryStage::kFailed;
        case AttemptOutcome::kNone: return stage;
      }
      return DeliveryStage::kFailed;

    case DeliveryStage::kHighCapacity:
      if (outcome == AttemptOutcome::kNone) return stage;
      if (outcome == AttemptOutcome::kSuccess) return DeliveryStage::kDelivered;
      return policy.segmentation_enabled ? DeliveryStage::kSegmented : DeliveryStage::kFailed;

    case DeliveryStage::kSegmented:
      if (outcome == AttemptOutcome::kNone) return stage;
      return outcome == AttemptOutcome::kSuccess ? DeliveryStage::kDelivered
                                                 : DeliveryStage::kFailed;

    case DeliveryStage::kDelivered:
    case DeliveryStage::kFailed:
      return stage;
  }
  return DeliveryStage::kFailed;
}

DeliveryRouter::DeliveryRouter(config::DeliveryConfig config,
                               ITransport* lightweight,
                               ITransport* high_capacity,
                               media::ITranscoder& transcoder)
    : config_(std::move(config)),
      lightweight_(lightweight),
      high_capacity_(high_capacity),
      transcoder_(transcoder) {
  policy_.lightweight_configured = lightweight_ != nullptr;
  policy_.lightweight_limit_bytes = config_.lightweight.limit_bytes;
  policy_.high_capacity_configured = high_capacity_ != nullptr;
  policy_.high_capacity_ceiling_bytes = config_.high_capacity.CeilingBytes();
  // Parts travel over the high-capacity transport.
  policy_.segmentation_enabled = config_.segmentation_enabled && high_capacity_ != nullptr;
  policy_.fallthrough_on_reject = config_.fallthrough_on_reject;
  policy_.segment_target_bytes =
      std::min(config_.segment_target_bytes, policy_.high_capacity_ceiling_bytes);
  if (policy_.segmentation_enabled &&
      policy_.segment_target_bytes < config_.segment_target_bytes) {
    Logger::Warn("[DeliveryRouter] Segment target " +
                 util::HumanSize(config_.segment_target_bytes) + " exceeds the " +
                 util::HumanSize(policy_.high_capacity_ceiling_bytes) +
                 " high-capacity ceiling; parts are planned at the ceiling");
  }
}

DeliveryAttempt DeliveryRouter::SendSegmented(const lifecycle::Artifact& artifact,
                                              const std::string& caption,
                                              std::vector<std::string>* segment_files,
                                              int* parts_sent) {
  DeliveryAttempt attempt;
  attempt.tier = DeliveryStage::kSegmented;
  attempt.outcome = AttemptOutcome::kRejected;

  if (!artifact.media.duration_s) {
    attempt.diagnostic = "duration unknown; cannot plan segments";
    return attempt;
  }

  const auto plan = PlanSegments(*artifact.media.duration_s, artifact.size_bytes,
                                 policy_.segment_target_bytes, config_.segment_min_seconds);
  if (plan.empty()) {
    attempt.diagnostic = "empty segment plan";
    return attempt;
  }

  const int count = static_cast<int>(plan.size());
  Logger::Info("[DeliveryRouter] Segmenting " + artifact.path + " into " +
               std::to_string(count) + " parts");

  for (const auto& window : plan) {
    const std::string part_path = SegmentPath(artifact.path, window.index);
    const std::string tag = std::to_string(window.index) + "/" + std::to_string(count);

    media::TranscodeRequest cut;
    cut.input = artifact.path;
    cut.output = part_path;
    cut.mode = media::TranscodeMode::kCut;
    cut.start_s = window.start_s;
    cut.duration_s = window.duration_s;
    media::TranscodeResult cut_result = transcoder_.Run(cut);
    segment_files->push_back(part_path);

    auto st = lifecycle::StatPath(part_path);
    if (!cut_result.ExitedCleanly() || !st || st->size_bytes == 0) {
      attempt.diagnostic = "cut failed for part " + tag + " exit=" +
                           std::to_string(cut_result.exit_code) + " " + cut_result.detail;
      return attempt;
    }

    TransportRequest req;
    req.path = part_path;
    req.caption = caption + PartSuffix(window.index, count);
    req.size_bytes = st->size_bytes;
    req.media.width = artifact.media.width;
    req.media.height = artifact.media.height;
    req.media.duration_s = window.duration_s;

    TransportResult sent = high_capacity_->Send(req);
    if (!sent.ok()) {
      attempt.diagnostic = "part " + tag + " " + TransportStatusName(sent.status) + ": " +
                           sent.message;
      return attempt;
    }
    ++*parts_sent;
    Logger::Info("[DeliveryRouter] Sent part " + tag + " of " + artifact.path);
  }

  attempt.outcome = AttemptOutcome::kSuccess;
  attempt.diagnostic = std::to_string(count) + " parts sent";
  return attempt;
}

DeliveryReport DeliveryRouter::Deliver(lifecycle::Artifact& artifact) {
  DeliveryReport report;
  if (artifact.state != lifecycle::ArtifactState::kReady) {
    report.message = std::string("artifact not ready (") +
                     lifecycle::ArtifactStateName(artifact.state) + "): " + artifact.path;
    Logger::Error("[DeliveryRouter] " + report.message);
    return report;
  }

  const std::string caption = BuildCaption(config_.caption_template, artifact.path);
  std::vector<std::string> segment_files;

  DeliveryStage stage = NextStage(DeliveryStage::kStart, AttemptOutcome::kNone,
                                  artifact.size_bytes, policy_);
  while (stage != DeliveryStage::kDelivered && stage != DeliveryStage::kFailed) {
    DeliveryAttempt attempt;
    if (stage == DeliveryStage::kSegmented) {
      attempt = SendSegmented(artifact, caption, &segment_files, &report.parts_sent);
    } else {
      ITransport* transport = stage == DeliveryStage::kLightweight ? lightweight_ : high_capacity_;
      TransportRequest req;
      req.path = artifact.path;
      req.caption = caption;
      req.size_bytes = artifact.size_bytes;
      req.media = artifact.media;
      TransportResult r = transport->Send(req);
      attempt.tier = stage;
      attempt.outcome = ToOutcome(r.status);
      attempt.diagnostic = r.message;
    }
    report.attempts.push_back(attempt);

    const std::string line = std::string("[DeliveryRouter] ") + DeliveryStageName(stage) +
                             " " + OutcomeName(attempt.outcome) + " for " + artifact.path +
                             (attempt.diagnostic.empty() ? "" : ": " + attempt.diagnostic);
    if (attempt.outcome == AttemptOutcome::kRejected) {
      Logger::Error(line);
    } else {
      Logger::Info(line);
    }

    stage = NextStage(stage, attempt.outcome, artifact.size_bytes, policy_);
  }

  report.final_stage = stage;
  if (stage == DeliveryStage::kFailed) {
    report.message = report.attempts.empty()
                         ? "no transport can carry " + util::HumanSize(artifact.size_bytes)
                         : report.attempts.back().diagnostic;
    Logger::Error("[DeliveryRouter] Delivery FAILED for " + artifact.path + ": " +
                  report.message);
    return report;
  }

  artifact.Advance(lifecycle::ArtifactState::kDelivered);
  RemoveFiles(segment_files);
  report.message = DeliveryStageName(report.attempts.back().tier);
  if (config_.delete_after_send) {
    std::error_code ec;
    std::filesystem::remove(artifact.path, ec);
    if (ec) {
      Logger::Warn("[DeliveryRouter] Delivered but could not delete " + artifact.path + ": " +
                   ec.message());
    } else {
      Logger::Info("[DeliveryRouter] Delivered and deleted " + artifact.path);
    }
  } else {
    Logger::Info("[DeliveryRouter] Delivered " + artifact.path);
  }
  return report;
}

}  // namespace mediarelay::delivery
