// Repository: MediaRelay
// Component: Upload gateway gRPC transport implementation
// Copyright (c) 2025 MediaRelay

#include "delivery/GrpcUploadTransport.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <thread>
#include <utility>
#include <vector>

#include "mediarelay/util/Logger.hpp"
#include "mediarelay/util/TextUtil.hpp"

namespace mediarelay::delivery {

namespace proto = mediarelay::upload::v1;
using util::Logger;

namespace {

constexpr int64_t kDeadlineAllowanceS = 120;
constexpr uint64_t kSlowestRateBytesPerS = 64 * 1024;
constexpr auto kInterruptPoll = std::chrono::milliseconds(100);

bool Raised(const std::atomic<bool>* flag) {
  return flag && flag->load(std::memory_order_acquire);
}

}  // namespace

GrpcUploadTransport::GrpcUploadTransport(config::HighCapacityTransportConfig config,
                                         const std::atomic<bool>* interrupt)
    : GrpcUploadTransport(config,
                          grpc::CreateChannel(config.gateway,
                                              grpc::InsecureChannelCredentials()),
                          interrupt) {}

GrpcUploadTransport::GrpcUploadTransport(config::HighCapacityTransportConfig config,
                                         std::shared_ptr<grpc::Channel> channel,
                                         const std::atomic<bool>* interrupt)
    : config_(std::move(config)),
      grpc_channel_(std::move(channel)),
      stub_(proto::MediaUploadService::NewStub(grpc_channel_)),
      interrupt_(interrupt) {
  if (config_.chunk_bytes == 0) config_.chunk_bytes = 1024 * 1024;
}

TransportStatus GrpcUploadTransport::ClassifyStatus(const grpc::Status& status, bool accepted) {
  if (status.error_code() == grpc::StatusCode::RESOURCE_EXHAUSTED) {
    return TransportStatus::kTooLarge;
  }
  if (!status.ok() || !accepted) return TransportStatus::kRejected;
  return TransportStatus::kOk;
}

std::chrono::seconds GrpcUploadTransport::UploadDeadline(uint64_t size_bytes) {
  return std::chrono::seconds(kDeadlineAllowanceS +
                              static_cast<int64_t>(size_bytes / kSlowestRateBytesPerS));
}

proto::UploadHeader GrpcUploadTransport::MakeHeader(const TransportRequest& request) const {
  proto::UploadHeader h;
  h.set_chat_id(config_.chat_id);
  h.set_file_name(std::filesystem::path(request.path).filename().string());
  h.set_caption(request.caption);
  h.set_total_bytes(request.size_bytes);
  h.set_supports_streaming(true);
  if (request.media.duration_s) h.set_duration_seconds(*request.media.duration_s);
  if (request.media.width) h.set_width(*request.media.width);
  if (request.media.height) h.set_height(*request.media.height);
  return h;
}

TransportResult GrpcUploadTransport::Send(const TransportRequest& request) {
  if (Raised(interrupt_)) return TransportResult::Rejected("interrupted");

  std::ifstream in(request.path, std::ios::binary);
  if (!in) return TransportResult::Rejected("cannot open " + request.path);

  Logger::Info("[GrpcUploadTransport] Uploading " + request.path + " (" +
               util::HumanSize(request.size_bytes) + ") to " + config_.gateway);

  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + UploadDeadline(request.size_bytes));
  proto::UploadResponse response;
  auto writer = stub_->Upload(&context, &response);

  // Cancels the call from a second thread once interrupt is raised; a Write
  // or Finish blocked on a stalled gateway then returns.
  std::atomic<bool> call_done{false};
  std::thread watcher;
  if (interrupt_) {
    watcher = std::thread([this, &context, &call_done] {
      while (!call_done.load(std::memory_order_acquire)) {
        if (Raised(interrupt_)) {
          context.TryCancel();
          return;
        }
        std::this_thread::sleep_for(kInterruptPoll);
      }
    });
  }

  proto::UploadRequest header_msg;
  *header_msg.mutable_header() = MakeHeader(request);
  bool stream_ok = writer->Write(header_msg);

  // --- Chunks; a failed Write means the gateway closed the stream early and
  // Finish() carries the reason. ---
  std::vector<char> buf(config_.chunk_bytes);
  uint64_t sent = 0;
  int last_step = -1;
  while (stream_ok && in && !Raised(interrupt_)) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const std::streamsize n = in.gcount();
    if (n <= 0) break;

    proto::UploadRequest chunk_msg;
    chunk_msg.set_chunk(buf.data(), static_cast<size_t>(n));
    stream_ok = writer->Write(chunk_msg);
    sent += static_cast<uint64_t>(n);

    if (request.size_bytes > 0) {
      const int step = static_cast<int>(std::min<uint64_t>(sent * 10 / request.size_bytes, 10));
      if (step > last_step) {
        last_step = step;
        Logger::Info("[GrpcUploadTransport] " + std::to_string(step * 10) + "% (" +
                     util::HumanSize(sent) + " / " + util::HumanSize(request.size_bytes) + ")");
      }
    }
  }
  const bool read_failed = stream_ok && in.bad();
  // Never let the gateway take a short stream for a complete file.
  if (Raised(interrupt_)) context.TryCancel();

  writer->WritesDone();
  grpc::Status status = writer->Finish();
  call_done.store(true, std::memory_order_release);
  if (watcher.joinable()) watcher.join();

  if (Raised(interrupt_) && !status.ok()) {
    Logger::Warn("[GrpcUploadTransport] Upload of " + request.path + " interrupted");
    return TransportResult::Rejected("interrupted");
  }

  if (read_failed && status.ok()) {
    return TransportResult::Rejected("read error on " + request.path);
  }

  switch (ClassifyStatus(status, response.accepted())) {
    case TransportStatus::kOk:
      return TransportResult::Ok("message_id=" + std::to_string(response.message_id()));
    case TransportStatus::kTooLarge:
      return TransportResult::TooLarge("gateway: " + status.error_message());
    case TransportStatus::kRejected:
      break;
  }
  if (!status.ok()) {
    return TransportResult::Rejected("grpc code=" + std::to_string(status.error_code()) + ": " +
                                     status.error_message());
  }
  return TransportResult::Rejected("gateway refused: " + response.error());
}

}  // namespace mediarelay::delivery
