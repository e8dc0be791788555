// Repository: MediaRelay
// Component: Delivery Router
// Purpose: Deliver one READY artifact through the cheapest transport tier
//          that accepts it: lightweight -> high-capacity -> segmented.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_DELIVERY_DELIVERY_ROUTER_HPP_
#define MEDIARELAY_DELIVERY_DELIVERY_ROUTER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "mediarelay/config/PipelineConfig.hpp"
#include "mediarelay/delivery/ITransport.hpp"
#include "mediarelay/lifecycle/Artifact.hpp"
#include "mediarelay/media/ITranscoder.hpp"

namespace mediarelay::delivery {

enum class DeliveryStage {
  kStart = 0,
  kLightweight = 1,
  kHighCapacity = 2,
  kSegmented = 3,
  kDelivered = 4,
  kFailed = 5,
};

const char* DeliveryStageName(DeliveryStage stage);

// Outcome of the stage just executed. kNone only for kStart.
enum class AttemptOutcome { kNone, kSuccess, kTooLarge, kRejected };

AttemptOutcome ToOutcome(TransportStatus status);

struct DeliveryPolicy {
  bool lightweight_configured = false;
  uint64_t lightweight_limit_bytes = 0;
  bool high_capacity_configured = false;
  uint64_t high_capacity_ceiling_bytes = 0;
  bool segmentation_enabled = false;
  bool fallthrough_on_reject = true;
  // Configured segment target, capped at the high-capacity ceiling.
  uint64_t segment_target_bytes = 0;
};

// Pure transition function of the per-artifact delivery state machine.
// Terminal stages map to themselves.
DeliveryStage NextStage(DeliveryStage stage, AttemptOutcome outcome, uint64_t size_bytes,
                        const DeliveryPolicy& policy);

struct DeliveryAttempt {
  DeliveryStage tier = DeliveryStage::kLightweight;
  AttemptOutcome outcome = AttemptOutcome::kRejected;
  std::string diagnostic;
};

struct DeliveryReport {
  DeliveryStage final_stage = DeliveryStage::kFailed;
  std::vector<DeliveryAttempt> attempts;
  int parts_sent = 0;
  std::string message;

  bool delivered() const { return final_stage == DeliveryStage::kDelivered; }
};

class DeliveryRouter {
 public:
  // Either transport may be null (tier not configured). None are owned.
  DeliveryRouter(config::DeliveryConfig config,
                 ITransport* lightweight,
                 ITransport* high_capacity,
                 media::ITranscoder& transcoder);

  // Artifact must be READY; on success it is advanced to DELIVERED and,
  // with delete_after_send, removed from disk. On failure nothing is
  // deleted and the artifact stays READY.
  DeliveryReport Deliver(lifecycle::Artifact& artifact);

  const DeliveryPolicy& policy() const { return policy_; }

 private:
  DeliveryAttempt SendSegmented(const lifecycle::Artifact& artifact, const std::string& caption,
                                std::vector<std::string>* segment_files, int* parts_sent);

  config::DeliveryConfig config_;
  ITransport* lightweight_;
  ITransport* high_capacity_;
  media::ITranscoder& transcoder_;
  DeliveryPolicy policy_;
};

}  // namespace mediarelay::delivery

#endif  // MEDIARELAY_DELIVERY_DELIVERY_ROUTER_HPP_
