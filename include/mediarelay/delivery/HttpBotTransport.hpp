// Repository: MediaRelay
// Component: Bot HTTP Transport
// Purpose: Lightweight tier. Multipart POST of the file to the bot API
//          ({api_base}/bot{token}/{method}) through libcurl.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_DELIVERY_HTTP_BOT_TRANSPORT_HPP_
#define MEDIARELAY_DELIVERY_HTTP_BOT_TRANSPORT_HPP_

#include <atomic>
#include <string>

#include "mediarelay/config/PipelineConfig.hpp"
#include "mediarelay/delivery/ITransport.hpp"

namespace mediarelay::delivery {

class HttpBotTransport : public ITransport {
 public:
  // interrupt (optional, not owned) aborts an upload in flight.
  explicit HttpBotTransport(config::LightweightTransportConfig config,
                            const std::atomic<bool>* interrupt = nullptr);

  TransportResult Send(const TransportRequest& request) override;
  const char* Name() const override { return "bot-http"; }

  std::string EndpointUrl() const;

  // 2xx -> kOk, 413 -> kTooLarge, everything else -> kRejected.
  static TransportStatus ClassifyHttpStatus(long http_code);

  // Multipart field carrying the file: "sendVideo" -> "video",
  // "sendDocument" -> "document". Unknown shapes fall back to "document".
  static std::string FileFieldForMethod(const std::string& method);

 private:
  config::LightweightTransportConfig config_;
  const std::atomic<bool>* interrupt_;
};

}  // namespace mediarelay::delivery

#endif  // MEDIARELAY_DELIVERY_HTTP_BOT_TRANSPORT_HPP_
