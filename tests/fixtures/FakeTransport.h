// Scripted ITransport: returns queued results in order, then the default.
// Records each request and whether its file existed when sent.

#ifndef MEDIARELAY_TESTS_FIXTURES_FAKE_TRANSPORT_H_
#define MEDIARELAY_TESTS_FIXTURES_FAKE_TRANSPORT_H_

#include <deque>
#include <filesystem>
#include <string>
#include <vector>

#include "mediarelay/delivery/ITransport.hpp"

namespace mediarelay::tests::fixtures {

class FakeTransport : public delivery::ITransport {
 public:
  explicit FakeTransport(const char* name = "fake")
      : name_(name), default_result_(delivery::TransportResult::Ok("sent")) {}

  void Enqueue(delivery::TransportResult r) { scripted_.push_back(std::move(r)); }
  void SetDefault(delivery::TransportResult r) { default_result_ = std::move(r); }

  delivery::TransportResult Send(const delivery::TransportRequest& request) override {
    requests_.push_back(request);
    std::error_code ec;
    file_existed_.push_back(std::filesystem::exists(request.path, ec));
    if (!scripted_.empty()) {
      auto r = scripted_.front();
      scripted_.pop_front();
      return r;
    }
    return default_result_;
  }

  const char* Name() const override { return name_; }

  const std::vector<delivery::TransportRequest>& requests() const { return requests_; }
  const std::vector<bool>& file_existed() const { return file_existed_; }
  size_t calls() const { return requests_.size(); }

 private:
  const char* name_;
  delivery::TransportResult default_result_;
  std::deque<delivery::TransportResult> scripted_;
  std::vector<delivery::TransportRequest> requests_;
  std::vector<bool> file_existed_;
};

}  // namespace mediarelay::tests::fixtures

#endif  // MEDIARELAY_TESTS_FIXTURES_FAKE_TRANSPORT_H_
