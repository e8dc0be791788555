// Repository: MediaRelay
// Component: Upload gateway gRPC transport (high-capacity tier)
// Purpose: Streams a file to MediaUploadService.Upload: one header message,
//          then fixed-size chunks, then a single response.
// Copyright (c) 2025 MediaRelay

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "media_upload_v1.grpc.pb.h"

#include "mediarelay/config/PipelineConfig.hpp"
#include "mediarelay/delivery/ITransport.hpp"

namespace mediarelay::delivery {

// Status mapping:
//   RESOURCE_EXHAUSTED          -> kTooLarge (over the account's limit)
//   any other non-OK status     -> kRejected
//   OK with accepted == false   -> kRejected (gateway's error text kept)
//   OK with accepted == true    -> kOk
class GrpcUploadTransport : public ITransport {
 public:
  // interrupt (optional, not owned) cancels an upload in flight.
  explicit GrpcUploadTransport(config::HighCapacityTransportConfig config,
                               const std::atomic<bool>* interrupt = nullptr);

  // Uses an existing channel (in-process channel in tests).
  GrpcUploadTransport(config::HighCapacityTransportConfig config,
                      std::shared_ptr<grpc::Channel> channel,
                      const std::atomic<bool>* interrupt = nullptr);

  GrpcUploadTransport(const GrpcUploadTransport&) = delete;
  GrpcUploadTransport& operator=(const GrpcUploadTransport&) = delete;

  TransportResult Send(const TransportRequest& request) override;
  const char* Name() const override { return "upload-gateway"; }

  static TransportStatus ClassifyStatus(const grpc::Status& status, bool accepted);

  // Whole-call deadline: a fixed allowance plus the time the file takes at
  // the slowest acceptable rate.
  static std::chrono::seconds UploadDeadline(uint64_t size_bytes);

 private:
  mediarelay::upload::v1::UploadHeader MakeHeader(const TransportRequest& request) const;

  config::HighCapacityTransportConfig config_;
  std::shared_ptr<grpc::Channel> grpc_channel_;
  std::unique_ptr<mediarelay::upload::v1::MediaUploadService::Stub> stub_;
  const std::atomic<bool>* interrupt_;
};

}  // namespace mediarelay::delivery
