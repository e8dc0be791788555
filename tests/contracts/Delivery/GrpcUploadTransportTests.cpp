// Repository: MediaRelay
// Component: Upload gateway transport tests (in-process gRPC server)
// Copyright (c) 2025 MediaRelay

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "delivery/GrpcUploadTransport.hpp"
#include "media_upload_v1.grpc.pb.h"
#include "support/TempTree.hpp"

namespace mediarelay::delivery {
namespace {

namespace proto = mediarelay::upload::v1;

// Records the header and reassembles the chunks. The reply is scripted.
class RecordingGateway final : public proto::MediaUploadService::Service {
 public:
  grpc::Status Upload(grpc::ServerContext* /*context*/,
                      grpc::ServerReader<proto::UploadRequest>* reader,
                      proto::UploadResponse* response) override {
    proto::UploadRequest msg;
    std::lock_guard<std::mutex> lock(mutex_);
    header_ = {};
    body_.clear();
    chunks_ = 0;
    bool first = true;
    while (reader->Read(&msg)) {
      if (first) {
        header_seen_first_ = msg.has_header();
        if (msg.has_header()) header_ = msg.header();
        first = false;
        continue;
      }
      body_ += msg.chunk();
      ++chunks_;
    }
    if (!status_.ok()) return status_;
    response->set_accepted(accepted_);
    response->set_message_id(77);
    if (!accepted_) response->set_error("CHAT_WRITE_FORBIDDEN");
    return grpc::Status::OK;
  }

  void Script(grpc::Status status, bool accepted) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = std::move(status);
    accepted_ = accepted;
  }

  proto::UploadHeader header() {
    std::lock_guard<std::mutex> lock(mutex_);
    return header_;
  }
  std::string body() {
    std::lock_guard<std::mutex> lock(mutex_);
    return body_;
  }
  int chunks() {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_;
  }
  bool header_seen_first() {
    std::lock_guard<std::mutex> lock(mutex_);
    return header_seen_first_;
  }

 private:
  std::mutex mutex_;
  grpc::Status status_ = grpc::Status::OK;
  bool accepted_ = true;
  proto::UploadHeader header_;
  std::string body_;
  int chunks_ = 0;
  bool header_seen_first_ = false;
};

// Never answers; holds the call until the client cancels it.
class StallingGateway final : public proto::MediaUploadService::Service {
 public:
  grpc::Status Upload(grpc::ServerContext* context,
                      grpc::ServerReader<proto::UploadRequest>* /*reader*/,
                      proto::UploadResponse* /*response*/) override {
    while (!context->IsCancelled()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return grpc::Status(grpc::StatusCode::CANCELLED, "client went away");
  }
};

class GrpcUploadTransportTest : public ::testing::Test {
 protected:
  void SetUp() override {
    grpc::ServerBuilder builder;
    builder.RegisterService(&gateway_);
    server_ = builder.BuildAndStart();
    ASSERT_NE(server_, nullptr);

    config_.enabled = true;
    config_.gateway = "in-process";
    config_.chat_id = "-100123";
    config_.chunk_bytes = 1000;
    transport_ = std::make_unique<GrpcUploadTransport>(
        config_, server_->InProcessChannel(grpc::ChannelArguments()), &stop_);
  }

  void TearDown() override {
    transport_.reset();
    if (server_) server_->Shutdown();
  }

  TransportRequest RequestFor(const std::string& path, uint64_t size) {
    TransportRequest r;
    r.path = path;
    r.caption = "#alice clip";
    r.size_bytes = size;
    r.media.width = 1280;
    r.media.height = 720;
    r.media.duration_s = 42.0;
    return r;
  }

  RecordingGateway gateway_;
  std::atomic<bool> stop_{false};
  std::unique_ptr<grpc::Server> server_;
  config::HighCapacityTransportConfig config_;
  std::unique_ptr<GrpcUploadTransport> transport_;
};

TEST_F(GrpcUploadTransportTest, StreamsHeaderThenChunks) {
  TempTree tree("grpc_upload");
  const std::string path = tree.Write("alice/clip.mp4", 2500);

  TransportResult r = transport_->Send(RequestFor(path, 2500));

  ASSERT_TRUE(r.ok()) << r.message;
  EXPECT_EQ(r.message, "message_id=77");
  EXPECT_TRUE(gateway_.header_seen_first());
  EXPECT_EQ(gateway_.chunks(), 3) << "2500 bytes at 1000 per chunk";
  EXPECT_EQ(gateway_.body(), std::string(2500, 'x'));

  const proto::UploadHeader h = gateway_.header();
  EXPECT_EQ(h.chat_id(), "-100123");
  EXPECT_EQ(h.file_name(), "clip.mp4");
  EXPECT_EQ(h.caption(), "#alice clip");
  EXPECT_EQ(h.total_bytes(), 2500u);
  EXPECT_EQ(h.width(), 1280);
  EXPECT_EQ(h.height(), 720);
  EXPECT_DOUBLE_EQ(h.duration_seconds(), 42.0);
  EXPECT_TRUE(h.supports_streaming());
}

TEST_F(GrpcUploadTransportTest, ResourceExhaustedIsTooLarge) {
  gateway_.Script(grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED, "FILE_PARTS_INVALID"),
                  false);
  TempTree tree("grpc_upload_big");
  const std::string path = tree.Write("big.mp4", 10);

  TransportResult r = transport_->Send(RequestFor(path, 10));

  EXPECT_EQ(r.status, TransportStatus::kTooLarge);
  EXPECT_NE(r.message.find("FILE_PARTS_INVALID"), std::string::npos);
}

TEST_F(GrpcUploadTransportTest, RefusalIsRejectedWithGatewayError) {
  gateway_.Script(grpc::Status::OK, false);
  TempTree tree("grpc_upload_refused");
  const std::string path = tree.Write("clip.mp4", 10);

  TransportResult r = transport_->Send(RequestFor(path, 10));

  EXPECT_EQ(r.status, TransportStatus::kRejected);
  EXPECT_EQ(r.message, "gateway refused: CHAT_WRITE_FORBIDDEN");
}

TEST_F(GrpcUploadTransportTest, OtherErrorsAreRejected) {
  gateway_.Script(grpc::Status(grpc::StatusCode::PERMISSION_DENIED, "banned"), false);
  TempTree tree("grpc_upload_denied");
  const std::string path = tree.Write("clip.mp4", 10);

  TransportResult r = transport_->Send(RequestFor(path, 10));

  EXPECT_EQ(r.status, TransportStatus::kRejected);
  EXPECT_NE(r.message.find("banned"), std::string::npos);
}

TEST_F(GrpcUploadTransportTest, MissingFileIsRejectedWithoutCall) {
  TransportResult r = transport_->Send(RequestFor("/tmp/mediarelay_no_such_file.mp4", 10));
  EXPECT_EQ(r.status, TransportStatus::kRejected);
  EXPECT_EQ(gateway_.chunks(), 0);
}

TEST_F(GrpcUploadTransportTest, RaisedStopRejectsWithoutCall) {
  TempTree tree("grpc_upload_stopped");
  const std::string path = tree.Write("clip.mp4", 2500);
  stop_.store(true);

  TransportResult r = transport_->Send(RequestFor(path, 2500));

  EXPECT_EQ(r.status, TransportStatus::kRejected);
  EXPECT_EQ(r.message, "interrupted");
  EXPECT_EQ(gateway_.chunks(), 0);
}

TEST_F(GrpcUploadTransportTest, StopCancelsAStalledUpload) {
  StallingGateway stalling;
  grpc::ServerBuilder builder;
  builder.RegisterService(&stalling);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  ASSERT_NE(server, nullptr);
  std::atomic<bool> stop{false};
  GrpcUploadTransport transport(config_, server->InProcessChannel(grpc::ChannelArguments()),
                                &stop);
  TempTree tree("grpc_upload_stalled");
  const std::string path = tree.Write("clip.mp4", 2500);

  std::thread raiser([&stop] {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    stop.store(true);
  });
  const auto started = std::chrono::steady_clock::now();
  TransportResult r = transport.Send(RequestFor(path, 2500));
  const auto elapsed = std::chrono::steady_clock::now() - started;
  raiser.join();
  server->Shutdown();

  EXPECT_EQ(r.status, TransportStatus::kRejected);
  EXPECT_EQ(r.message, "interrupted");
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(GrpcUploadTransportStatusTest, DeadlineGrowsWithSize) {
  EXPECT_EQ(GrpcUploadTransport::UploadDeadline(0), std::chrono::seconds(120));
  EXPECT_EQ(GrpcUploadTransport::UploadDeadline(100 * 64 * 1024), std::chrono::seconds(220));
  EXPECT_GT(GrpcUploadTransport::UploadDeadline(2000ull * 1024 * 1024),
            std::chrono::hours(8));
}

}  // namespace
}  // namespace mediarelay::delivery
