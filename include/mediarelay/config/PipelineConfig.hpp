// Repository: MediaRelay
// Component: Pipeline Configuration
// Purpose: Immutable configuration value loaded from environment-style
//          key/value pairs and passed into every component.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_CONFIG_PIPELINE_CONFIG_HPP_
#define MEDIARELAY_CONFIG_PIPELINE_CONFIG_HPP_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mediarelay::config {

// Returns the value for a key, or nullopt if unset. Production uses
// getenv; tests pass a map.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup ProcessEnvironment();

enum class AccountTier { kStandard, kPremium };

struct RecoveryConfig {
  std::string ffmpeg_bin = "ffmpeg";
  std::string partial_suffix = ".part";
  std::string quarantine_dir;
  int reencode_box_width = 1280;
  int reencode_box_height = 720;
  std::string audio_bitrate = "128k";
};

struct LightweightTransportConfig {
  std::string api_base = "https://api.telegram.org";
  std::string token;
  std::string chat_id;
  std::string method = "sendDocument";
  uint64_t limit_bytes = 50ull * 1024 * 1024;

  bool Configured() const { return !token.empty() && !chat_id.empty(); }
};

struct HighCapacityTransportConfig {
  bool enabled = false;
  std::string gateway;  // gRPC target host:port
  std::string chat_id;
  AccountTier tier = AccountTier::kStandard;
  uint64_t standard_limit_bytes = 2000ull * 1024 * 1024;
  uint64_t premium_limit_bytes = 4000ull * 1024 * 1024;
  size_t chunk_bytes = 1024 * 1024;

  bool Configured() const { return enabled && !gateway.empty() && !chat_id.empty(); }
  uint64_t CeilingBytes() const {
    return tier == AccountTier::kPremium ? premium_limit_bytes : standard_limit_bytes;
  }
};

struct DeliveryConfig {
  LightweightTransportConfig lightweight;
  HighCapacityTransportConfig high_capacity;
  bool fallthrough_on_reject = true;
  bool segmentation_enabled = false;
  uint64_t segment_target_bytes = 1950ull * 1024 * 1024;
  double segment_min_seconds = 30.0;
  std::string caption_template = "{folder_tag} {filename}";
  bool delete_after_send = true;
  // 0 = retry forever.
  int max_delivery_failures = 0;
};

struct PipelineConfig {
  std::string watch_dir;
  std::string log_dir = "logs";
  std::vector<std::string> extensions = {".mp4", ".mkv", ".mov", ".m4v"};
  uint64_t min_size_bytes = 64 * 1024;
  uint64_t max_size_bytes = 0;  // 0 = unlimited
  int stable_age_s = 20;
  int partial_stable_age_s = 60;
  bool watch = true;
  int watch_interval_s = 10;
  int max_active = 8;
  int monitor_interval_s = 5;
  std::string ytdlp_bin = "yt-dlp";

  RecoveryConfig recovery;
  DeliveryConfig delivery;

  std::string Describe() const;
};

struct ConfigLoadResult {
  bool success = false;
  std::string message;
  PipelineConfig config;
};

// Parse and validate. watch_dir falls back to ResolveWatchRoot() when
// DOWNLOAD_DIR is unset; the quarantine dir defaults to a sibling of the
// watch root named "quarantine".
ConfigLoadResult LoadPipelineConfig(const EnvLookup& env);

// Empty when the uploader can run; otherwise names the missing settings.
// The collector has no transport requirements.
std::string MissingUploaderSettings(const PipelineConfig& config);

// First existing candidate of ./download and $HOME/mediarelay/download; if
// none exists, the first candidate is created.
std::string ResolveWatchRoot(const EnvLookup& env);

// "1280x720" -> {1280, 720}; nullopt on malformed input.
std::optional<std::pair<int, int>> ParseBox(const std::string& s);

}  // namespace mediarelay::config

#endif  // MEDIARELAY_CONFIG_PIPELINE_CONFIG_HPP_
