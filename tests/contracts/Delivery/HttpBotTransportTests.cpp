// Repository: MediaRelay
// Component: Bot HTTP transport tests (local socket that never answers)
// Copyright (c) 2025 MediaRelay

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include "mediarelay/delivery/HttpBotTransport.hpp"
#include "support/TempTree.hpp"

namespace mediarelay::delivery {
namespace {

// Listens on 127.0.0.1 but never accepts: the kernel completes the
// handshake, the request is buffered, and no response ever comes.
class SilentListener {
 public:
  SilentListener() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (fd_ >= 0 && ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
        ::listen(fd_, 4) == 0 &&
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
      port_ = ntohs(addr.sin_port);
    }
  }
  ~SilentListener() {
    if (fd_ >= 0) ::close(fd_);
  }
  SilentListener(const SilentListener&) = delete;
  SilentListener& operator=(const SilentListener&) = delete;

  int port() const { return port_; }

 private:
  int fd_ = -1;
  int port_ = 0;
};

class HttpBotTransportSendTest : public ::testing::Test {
 protected:
  HttpBotTransportSendTest() : tree_("http_bot") {
    config_.api_base = "http://127.0.0.1:" + std::to_string(listener_.port());
    config_.token = "123:abc";
    config_.chat_id = "-100123";
    config_.method = "sendVideo";
  }

  TransportRequest RequestFor(const std::string& path) {
    TransportRequest r;
    r.path = path;
    r.caption = "#alice clip";
    r.size_bytes = TempTree::SizeOf(path);
    return r;
  }

  SilentListener listener_;
  TempTree tree_;
  config::LightweightTransportConfig config_;
  std::atomic<bool> stop_{false};
};

TEST_F(HttpBotTransportSendTest, RaisedStopRejectsBeforeConnecting) {
  HttpBotTransport transport(config_, &stop_);
  stop_.store(true);

  TransportResult r = transport.Send(RequestFor(tree_.Write("clip.mp4", 2048)));

  EXPECT_EQ(r.status, TransportStatus::kRejected);
  EXPECT_EQ(r.message, "interrupted");
}

TEST_F(HttpBotTransportSendTest, StopAbortsAnUnansweredUpload) {
  ASSERT_GT(listener_.port(), 0);
  HttpBotTransport transport(config_, &stop_);
  const std::string path = tree_.Write("clip.mp4", 2048);

  std::thread raiser([this] {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    stop_.store(true);
  });
  const auto started = std::chrono::steady_clock::now();
  TransportResult r = transport.Send(RequestFor(path));
  const auto elapsed = std::chrono::steady_clock::now() - started;
  raiser.join();

  EXPECT_EQ(r.status, TransportStatus::kRejected);
  EXPECT_EQ(r.message, "interrupted");
  EXPECT_LT(elapsed, std::chrono::seconds(10));
  EXPECT_TRUE(TempTree::Exists(path));
}

}  // namespace
}  // namespace mediarelay::delivery
