// Repository: MediaRelay
// Component: Transport Interface
// Purpose: One way of handing a file to the remote messaging endpoint.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_DELIVERY_I_TRANSPORT_HPP_
#define MEDIARELAY_DELIVERY_I_TRANSPORT_HPP_

#include <cstdint>
#include <string>
#include <utility>

#include "mediarelay/lifecycle/Artifact.hpp"

namespace mediarelay::delivery {

enum class TransportStatus {
  kOk,
  kTooLarge,  // endpoint refused on size; drives fallback to a bigger tier
  kRejected,  // any other refusal or transport error
};

const char* TransportStatusName(TransportStatus status);

struct TransportRequest {
  std::string path;
  std::string caption;
  uint64_t size_bytes = 0;
  // Width/height/duration hints; any subset may be absent.
  lifecycle::MediaInfo media;
};

struct TransportResult {
  TransportStatus status = TransportStatus::kRejected;
  long http_code = 0;  // lightweight transport only
  std::string message;

  bool ok() const { return status == TransportStatus::kOk; }

  static TransportResult Ok(std::string message = {}) {
    return {TransportStatus::kOk, 0, std::move(message)};
  }
  static TransportResult TooLarge(std::string message) {
    return {TransportStatus::kTooLarge, 0, std::move(message)};
  }
  static TransportResult Rejected(std::string message) {
    return {TransportStatus::kRejected, 0, std::move(message)};
  }
};

class ITransport {
 public:
  virtual ~ITransport() = default;

  virtual TransportResult Send(const TransportRequest& request) = 0;

  // Short tag for logs ("bot-http", "upload-gateway").
  virtual const char* Name() const = 0;
};

}  // namespace mediarelay::delivery

#endif  // MEDIARELAY_DELIVERY_I_TRANSPORT_HPP_
