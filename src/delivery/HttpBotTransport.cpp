// Repository: MediaRelay
// Component: Bot HTTP Transport
// Copyright (c) 2025 MediaRelay

#include "mediarelay/delivery/HttpBotTransport.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <mutex>
#include <utility>

#include <curl/curl.h>

#include "mediarelay/util/Logger.hpp"
#include "mediarelay/util/TextUtil.hpp"

namespace mediarelay::delivery {

using util::Logger;

namespace {

constexpr long kConnectTimeoutMs = 15000;
// A transfer slower than this for kLowSpeedTimeS is a stalled connection.
constexpr long kLowSpeedLimitBytes = 1024;
constexpr long kLowSpeedTimeS = 60;
constexpr size_t kMaxResponseBytes = 16 * 1024;

struct CurlHandle {
  CURL* h = nullptr;
  CurlHandle() { h = curl_easy_init(); }
  ~CurlHandle() {
    if (h) curl_easy_cleanup(h);
  }
  CurlHandle(const CurlHandle&) = delete;
  CurlHandle& operator=(const CurlHandle&) = delete;
};

struct CurlMime {
  curl_mime* m = nullptr;
  explicit CurlMime(CURL* h) { m = curl_mime_init(h); }
  ~CurlMime() {
    if (m) curl_mime_free(m);
  }
  CurlMime(const CurlMime&) = delete;
  CurlMime& operator=(const CurlMime&) = delete;
};

void GlobalInitOnce() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t CollectBody(char* data, size_t size, size_t nmemb, void* userp) {
  auto* body = static_cast<std::string*>(userp);
  const size_t n = size * nmemb;
  if (body->size() < kMaxResponseBytes) {
    body->append(data, std::min(n, kMaxResponseBytes - body->size()));
  }
  return n;
}

// Upload progress in 10% steps. Also polled while idle, so a raised
// interrupt aborts the transfer within about a second.
struct ProgressState {
  std::string name;
  int last_step = -1;
  const std::atomic<bool>* interrupt = nullptr;
};

bool Raised(const std::atomic<bool>* flag) {
  return flag && flag->load(std::memory_order_acquire);
}

int OnProgress(void* userp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
               curl_off_t ultotal, curl_off_t ulnow) {
  auto* state = static_cast<ProgressState*>(userp);
  if (Raised(state->interrupt)) return 1;
  if (ultotal <= 0) return 0;
  const int step = static_cast<int>((ulnow * 10) / ultotal);
  if (step > state->last_step) {
    state->last_step = step;
    Logger::Info("[HttpBotTransport] " + state->name + " " + std::to_string(step * 10) +
                 "% (" + util::HumanSize(static_cast<uint64_t>(ulnow)) + " / " +
                 util::HumanSize(static_cast<uint64_t>(ultotal)) + ")");
  }
  return 0;
}

void AddTextPart(curl_mime* mime, const char* name, const std::string& value) {
  curl_mimepart* part = curl_mime_addpart(mime);
  curl_mime_name(part, name);
  curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

}  // namespace

HttpBotTransport::HttpBotTransport(config::LightweightTransportConfig config,
                                   const std::atomic<bool>* interrupt)
    : config_(std::move(config)), interrupt_(interrupt) {
  GlobalInitOnce();
}

std::string HttpBotTransport::EndpointUrl() const {
  std::string base = config_.api_base;
  while (!base.empty() && base.back() == '/') base.pop_back();
  return base + "/bot" + config_.token + "/" + config_.method;
}

TransportStatus HttpBotTransport::ClassifyHttpStatus(long http_code) {
  if (http_code >= 200 && http_code < 300) return TransportStatus::kOk;
  if (http_code == 413) return TransportStatus::kTooLarge;
  return TransportStatus::kRejected;
}

std::string HttpBotTransport::FileFieldForMethod(const std::string& method) {
  if (method.size() > 4 && method.compare(0, 4, "send") == 0 &&
      std::isupper(static_cast<unsigned char>(method[4]))) {
    std::string field = method.substr(4);
    field[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(field[0])));
    return field;
  }
  return "document";
}

TransportResult HttpBotTransport::Send(const TransportRequest& request) {
  if (Raised(interrupt_)) return TransportResult::Rejected("interrupted");

  CurlHandle ch;
  if (!ch.h) return TransportResult::Rejected("curl init failed");
  CurlMime mime(ch.h);
  if (!mime.m) return TransportResult::Rejected("curl mime init failed");

  AddTextPart(mime.m, "chat_id", config_.chat_id);
  if (!request.caption.empty()) AddTextPart(mime.m, "caption", request.caption);
  if (config_.method == "sendVideo") {
    AddTextPart(mime.m, "supports_streaming", "true");
    if (request.media.width) AddTextPart(mime.m, "width", std::to_string(*request.media.width));
    if (request.media.height) {
      AddTextPart(mime.m, "height", std::to_string(*request.media.height));
    }
    if (request.media.duration_s) {
      AddTextPart(mime.m, "duration",
                  std::to_string(static_cast<long>(std::lround(*request.media.duration_s))));
    }
  }

  const std::string field = FileFieldForMethod(config_.method);
  curl_mimepart* file_part = curl_mime_addpart(mime.m);
  curl_mime_name(file_part, field.c_str());
  if (curl_mime_filedata(file_part, request.path.c_str()) != CURLE_OK) {
    return TransportResult::Rejected("cannot read " + request.path);
  }

  std::string body;
  ProgressState progress{std::filesystem::path(request.path).filename().string(), -1,
                         interrupt_};
  const std::string url = EndpointUrl();

  curl_easy_setopt(ch.h, CURLOPT_URL, url.c_str());
  curl_easy_setopt(ch.h, CURLOPT_MIMEPOST, mime.m);
  curl_easy_setopt(ch.h, CURLOPT_WRITEFUNCTION, CollectBody);
  curl_easy_setopt(ch.h, CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(ch.h, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(ch.h, CURLOPT_XFERINFOFUNCTION, OnProgress);
  curl_easy_setopt(ch.h, CURLOPT_XFERINFODATA, &progress);
  curl_easy_setopt(ch.h, CURLOPT_CONNECTTIMEOUT_MS, kConnectTimeoutMs);
  curl_easy_setopt(ch.h, CURLOPT_LOW_SPEED_LIMIT, kLowSpeedLimitBytes);
  curl_easy_setopt(ch.h, CURLOPT_LOW_SPEED_TIME, kLowSpeedTimeS);
  curl_easy_setopt(ch.h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(ch.h, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(ch.h, CURLOPT_SSL_VERIFYHOST, 2L);

  Logger::Info("[HttpBotTransport] Uploading " + request.path + " (" +
               util::HumanSize(request.size_bytes) + ") via " + config_.method);

  CURLcode rc = curl_easy_perform(ch.h);
  if (rc == CURLE_ABORTED_BY_CALLBACK && Raised(interrupt_)) {
    Logger::Warn("[HttpBotTransport] Upload of " + request.path + " interrupted");
    return TransportResult::Rejected("interrupted");
  }
  if (rc != CURLE_OK) {
    return TransportResult::Rejected(std::string("curl: ") + curl_easy_strerror(rc));
  }

  long http_code = 0;
  curl_easy_getinfo(ch.h, CURLINFO_RESPONSE_CODE, &http_code);

  TransportResult result;
  result.status = ClassifyHttpStatus(http_code);
  result.http_code = http_code;
  result.message = "HTTP " + std::to_string(http_code);
  if (result.status != TransportStatus::kOk && !body.empty()) {
    result.message += ": " + body.substr(0, 300);
  }
  return result;
}

}  // namespace mediarelay::delivery
