// Repository: MediaRelay
// Component: Pipeline Configuration
// Copyright (c) 2025 MediaRelay

#include "mediarelay/config/PipelineConfig.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <system_error>

#include "mediarelay/util/Logger.hpp"
#include "mediarelay/util/TextUtil.hpp"

namespace mediarelay::config {

namespace fs = std::filesystem;
using util::Logger;

namespace {

constexpr uint64_t kMiB = 1024ull * 1024;

// Collects parse errors so a single load reports every bad key at once.
class EnvReader {
 public:
  explicit EnvReader(const EnvLookup& env) : env_(env) {}

  std::string String(const std::string& key, const std::string& def) const {
    auto v = env_(key);
    if (!v) return def;
    std::string t = util::Trim(*v);
    return t.empty() ? def : t;
  }

  bool Bool(const std::string& key, bool def) const {
    auto v = env_(key);
    if (!v || util::Trim(*v).empty()) return def;
    std::string t = util::ToLower(util::Trim(*v));
    return t == "1" || t == "true" || t == "yes" || t == "on";
  }

  int64_t Int(const std::string& key, int64_t def) {
    auto v = env_(key);
    if (!v || util::Trim(*v).empty()) return def;
    std::string t = util::Trim(*v);
    size_t used = 0;
    try {
      int64_t parsed = std::stoll(t, &used);
      if (used == t.size()) return parsed;
    } catch (const std::exception&) {
    }
    errors_.push_back(key + "=" + t + " is not an integer");
    return def;
  }

  double Double(const std::string& key, double def) {
    auto v = env_(key);
    if (!v || util::Trim(*v).empty()) return def;
    std::string t = util::Trim(*v);
    size_t used = 0;
    try {
      double parsed = std::stod(t, &used);
      if (used == t.size()) return parsed;
    } catch (const std::exception&) {
    }
    errors_.push_back(key + "=" + t + " is not a number");
    return def;
  }

  void Require(bool condition, const std::string& message) {
    if (!condition) errors_.push_back(message);
  }

  const std::vector<std::string>& errors() const { return errors_; }

 private:
  const EnvLookup& env_;
  std::vector<std::string> errors_;
};

std::vector<std::string> NormalizeExtensions(const std::string& raw) {
  std::vector<std::string> out;
  for (auto& e : util::SplitTrimmed(raw, ',')) {
    std::string ext = util::ToLower(e);
    if (ext.front() != '.') ext = "." + ext;
    out.push_back(ext);
  }
  return out;
}

}  // namespace

EnvLookup ProcessEnvironment() {
  return [](const std::string& key) -> std::optional<std::string> {
    const char* v = std::getenv(key.c_str());
    if (v == nullptr) return std::nullopt;
    return std::string(v);
  };
}

std::optional<std::pair<int, int>> ParseBox(const std::string& s) {
  auto x = s.find_first_of("xX");
  if (x == std::string::npos) return std::nullopt;
  try {
    size_t used_w = 0;
    size_t used_h = 0;
    std::string ws = s.substr(0, x);
    std::string hs = s.substr(x + 1);
    int w = std::stoi(ws, &used_w);
    int h = std::stoi(hs, &used_h);
    if (used_w != ws.size() || used_h != hs.size() || w <= 0 || h <= 0) return std::nullopt;
    return std::make_pair(w, h);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::string ResolveWatchRoot(const EnvLookup& env) {
  std::vector<fs::path> candidates;
  std::error_code ec;
  fs::path cwd = fs::current_path(ec);
  if (!ec) candidates.push_back(cwd / "download");
  if (auto home = env("HOME"); home && !home->empty()) {
    candidates.push_back(fs::path(*home) / "mediarelay" / "download");
  }
  for (const auto& c : candidates) {
    if (fs::is_directory(c, ec)) return c.string();
  }
  if (candidates.empty()) return "download";
  fs::create_directories(candidates.front(), ec);
  if (ec) {
    Logger::Warn("[Config] cannot create " + candidates.front().string() + ": " + ec.message());
  }
  return candidates.front().string();
}

ConfigLoadResult LoadPipelineConfig(const EnvLookup& env) {
  ConfigLoadResult result;
  PipelineConfig& c = result.config;
  EnvReader r(env);

  c.watch_dir = r.String("DOWNLOAD_DIR", "");
  if (c.watch_dir.empty()) c.watch_dir = ResolveWatchRoot(env);
  {
    std::error_code ec;
    fs::path abs = fs::absolute(c.watch_dir, ec);
    if (!ec) c.watch_dir = abs.lexically_normal().string();
    while (c.watch_dir.size() > 1 && c.watch_dir.back() == '/') c.watch_dir.pop_back();
  }
  c.log_dir = r.String("LOG_DIR", c.log_dir);

  c.extensions = NormalizeExtensions(r.String("EXTENSIONS", ".mp4,.mkv,.mov,.m4v"));
  r.Require(!c.extensions.empty(), "EXTENSIONS must name at least one extension");

  int64_t min_kb = r.Int("MIN_FILE_KB", 64);
  r.Require(min_kb >= 0, "MIN_FILE_KB must be >= 0");
  c.min_size_bytes = static_cast<uint64_t>(std::max<int64_t>(min_kb, 0)) * 1024;
  double max_gb = r.Double("MAX_FILE_GB", 0.0);
  r.Require(max_gb >= 0.0, "MAX_FILE_GB must be >= 0");
  c.max_size_bytes = max_gb > 0.0
      ? static_cast<uint64_t>(max_gb * 1024.0 * 1024.0 * 1024.0)
      : 0;

  c.stable_age_s = static_cast<int>(r.Int("STABLE_AGE", 20));
  c.partial_stable_age_s = static_cast<int>(r.Int("PART_STABLE_AGE", 60));
  r.Require(c.stable_age_s >= 0 && c.partial_stable_age_s >= 0,
            "STABLE_AGE and PART_STABLE_AGE must be >= 0");
  c.watch = r.Bool("WATCH", true);
  c.watch_interval_s = static_cast<int>(r.Int("WATCH_INTERVAL", 10));
  r.Require(c.watch_interval_s > 0, "WATCH_INTERVAL must be > 0");
  c.max_active = static_cast<int>(r.Int("MAX_ACTIVE", 8));
  r.Require(c.max_active > 0, "MAX_ACTIVE must be > 0");
  c.monitor_interval_s = static_cast<int>(r.Int("MONITOR_INTERVAL", 5));
  r.Require(c.monitor_interval_s > 0, "MONITOR_INTERVAL must be > 0");
  c.ytdlp_bin = r.String("YTDLP_BIN", c.ytdlp_bin);

  RecoveryConfig& rc = c.recovery;
  rc.ffmpeg_bin = r.String("FFMPEG_BIN", rc.ffmpeg_bin);
  rc.partial_suffix = r.String("PARTIAL_SUFFIX", rc.partial_suffix);
  rc.quarantine_dir = r.String(
      "QUARANTINE_DIR", (fs::path(c.watch_dir).parent_path() / "quarantine").string());
  if (auto box = ParseBox(r.String("REENCODE_BOX", "1280x720"))) {
    rc.reencode_box_width = box->first;
    rc.reencode_box_height = box->second;
  } else {
    r.Require(false, "REENCODE_BOX must look like 1280x720");
  }
  rc.audio_bitrate = r.String("RECOVERY_AUDIO_BITRATE", rc.audio_bitrate);

  DeliveryConfig& d = c.delivery;
  d.lightweight.api_base = r.String("BOT_API_BASE", d.lightweight.api_base);
  d.lightweight.token = r.String("TELEGRAM_TOKEN", "");
  d.lightweight.chat_id = r.String("TELEGRAM_CHAT_ID", "");
  d.lightweight.method = r.String("BOT_METHOD", d.lightweight.method);
  int64_t light_mb = r.Int("LIGHTWEIGHT_LIMIT_MB", 50);
  r.Require(light_mb > 0, "LIGHTWEIGHT_LIMIT_MB must be > 0");
  d.lightweight.limit_bytes = static_cast<uint64_t>(std::max<int64_t>(light_mb, 1)) * kMiB;

  HighCapacityTransportConfig& hc = d.high_capacity;
  hc.enabled = r.Bool("ENABLE_HIGH_CAPACITY", false);
  hc.gateway = r.String("UPLOAD_GATEWAY", "");
  hc.chat_id = d.lightweight.chat_id;
  std::string tier = util::ToLower(r.String("HIGH_CAPACITY_TIER", "standard"));
  if (tier == "premium") {
    hc.tier = AccountTier::kPremium;
  } else {
    r.Require(tier == "standard", "HIGH_CAPACITY_TIER must be standard or premium");
    hc.tier = AccountTier::kStandard;
  }
  int64_t std_mb = r.Int("STANDARD_LIMIT_MB", 2000);
  int64_t prem_mb = r.Int("PREMIUM_LIMIT_MB", 4000);
  r.Require(std_mb > 0 && prem_mb > 0, "STANDARD_LIMIT_MB and PREMIUM_LIMIT_MB must be > 0");
  hc.standard_limit_bytes = static_cast<uint64_t>(std::max<int64_t>(std_mb, 1)) * kMiB;
  hc.premium_limit_bytes = static_cast<uint64_t>(std::max<int64_t>(prem_mb, 1)) * kMiB;
  int64_t part_kb = r.Int("MT_PART_KB", 1024);
  r.Require(part_kb > 0, "MT_PART_KB must be > 0");
  hc.chunk_bytes = static_cast<size_t>(std::max<int64_t>(part_kb, 1)) * 1024;

  d.fallthrough_on_reject = r.Bool("FALLTHROUGH_ON_REJECT", true);
  d.segmentation_enabled = r.Bool("ENABLE_SEGMENTATION", false);
  int64_t seg_mb = r.Int("SEGMENT_TARGET_MB", 1950);
  r.Require(seg_mb > 0, "SEGMENT_TARGET_MB must be > 0");
  d.segment_target_bytes = static_cast<uint64_t>(std::max<int64_t>(seg_mb, 1)) * kMiB;
  d.segment_min_seconds = r.Double("SEGMENT_MIN_SECONDS", 30.0);
  r.Require(d.segment_min_seconds > 0.0, "SEGMENT_MIN_SECONDS must be > 0");
  d.caption_template = r.String("CAPTION_TEMPLATE", d.caption_template);
  d.delete_after_send = r.Bool("DELETE_AFTER_SEND", true);
  d.max_delivery_failures = static_cast<int>(r.Int("MAX_DELIVERY_FAILURES", 0));
  r.Require(d.max_delivery_failures >= 0, "MAX_DELIVERY_FAILURES must be >= 0");

  if (!r.errors().empty()) {
    std::ostringstream msg;
    for (size_t i = 0; i < r.errors().size(); ++i) {
      if (i > 0) msg << "; ";
      msg << r.errors()[i];
    }
    result.message = msg.str();
    return result;
  }
  result.success = true;
  return result;
}

std::string MissingUploaderSettings(const PipelineConfig& config) {
  const auto& d = config.delivery;
  if (d.lightweight.Configured() || d.high_capacity.Configured()) return "";
  if (d.high_capacity.enabled) {
    return "ENABLE_HIGH_CAPACITY is set but UPLOAD_GATEWAY or TELEGRAM_CHAT_ID is missing";
  }
  return "TELEGRAM_TOKEN/TELEGRAM_CHAT_ID missing and no high-capacity transport configured";
}

std::string PipelineConfig::Describe() const {
  std::ostringstream o;
  o << "watch_dir=" << watch_dir
    << " quarantine_dir=" << recovery.quarantine_dir
    << " stable_age=" << stable_age_s << "s"
    << " partial_stable_age=" << partial_stable_age_s << "s"
    << " interval=" << watch_interval_s << "s"
    << " lightweight=" << (delivery.lightweight.Configured() ? "on" : "off")
    << " high_capacity=" << (delivery.high_capacity.Configured() ? "on" : "off")
    << " segmentation=" << (delivery.segmentation_enabled ? "on" : "off")
    << " delete_after_send=" << (delivery.delete_after_send ? 1 : 0);
  return o.str();
}

}  // namespace mediarelay::config
