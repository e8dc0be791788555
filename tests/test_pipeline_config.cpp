// Repository: MediaRelay
// Component: Pipeline configuration tests
// Copyright (c) 2025 MediaRelay

#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "mediarelay/config/PipelineConfig.hpp"

namespace mediarelay::config {
namespace {

EnvLookup MapEnv(std::map<std::string, std::string> values) {
  return [values](const std::string& key) -> std::optional<std::string> {
    auto it = values.find(key);
    if (it == values.end()) return std::nullopt;
    return it->second;
  };
}

TEST(PipelineConfigTest, DefaultsWithOnlyWatchDir) {
  auto r = LoadPipelineConfig(MapEnv({{"DOWNLOAD_DIR", "/srv/media/download/"}}));
  ASSERT_TRUE(r.success) << r.message;
  const PipelineConfig& c = r.config;
  EXPECT_EQ(c.watch_dir, "/srv/media/download");
  EXPECT_EQ(c.recovery.quarantine_dir, "/srv/media/quarantine");
  EXPECT_EQ(c.stable_age_s, 20);
  EXPECT_EQ(c.partial_stable_age_s, 60);
  EXPECT_TRUE(c.watch);
  EXPECT_EQ(c.max_active, 8);
  EXPECT_EQ(c.recovery.partial_suffix, ".part");
  EXPECT_EQ(c.recovery.reencode_box_width, 1280);
  EXPECT_EQ(c.recovery.reencode_box_height, 720);
  EXPECT_TRUE(c.delivery.fallthrough_on_reject);
  EXPECT_FALSE(c.delivery.segmentation_enabled);
  EXPECT_TRUE(c.delivery.delete_after_send);
  EXPECT_EQ(c.delivery.max_delivery_failures, 0);
  EXPECT_EQ(c.delivery.lightweight.limit_bytes, 50ull * 1024 * 1024);
}

TEST(PipelineConfigTest, ParsesOverrides) {
  auto r = LoadPipelineConfig(MapEnv({
      {"DOWNLOAD_DIR", "/data/dl"},
      {"EXTENSIONS", "MP4, mkv ,.webm"},
      {"MIN_FILE_KB", "10"},
      {"MAX_FILE_GB", "1.5"},
      {"STABLE_AGE", "5"},
      {"WATCH", "no"},
      {"MAX_ACTIVE", "3"},
      {"REENCODE_BOX", "854x480"},
      {"TELEGRAM_TOKEN", "t"},
      {"TELEGRAM_CHAT_ID", "42"},
      {"ENABLE_HIGH_CAPACITY", "1"},
      {"UPLOAD_GATEWAY", "localhost:50051"},
      {"HIGH_CAPACITY_TIER", "Premium"},
      {"ENABLE_SEGMENTATION", "true"},
      {"MAX_DELIVERY_FAILURES", "4"},
      {"QUARANTINE_DIR", "/data/q"},
  }));
  ASSERT_TRUE(r.success) << r.message;
  const PipelineConfig& c = r.config;
  EXPECT_EQ(c.extensions, (std::vector<std::string>{".mp4", ".mkv", ".webm"}));
  EXPECT_EQ(c.min_size_bytes, 10u * 1024);
  EXPECT_EQ(c.max_size_bytes, static_cast<uint64_t>(1.5 * 1024 * 1024 * 1024));
  EXPECT_EQ(c.stable_age_s, 5);
  EXPECT_FALSE(c.watch);
  EXPECT_EQ(c.max_active, 3);
  EXPECT_EQ(c.recovery.reencode_box_width, 854);
  EXPECT_EQ(c.recovery.quarantine_dir, "/data/q");
  EXPECT_TRUE(c.delivery.lightweight.Configured());
  EXPECT_TRUE(c.delivery.high_capacity.Configured());
  EXPECT_EQ(c.delivery.high_capacity.chat_id, "42");
  EXPECT_EQ(c.delivery.high_capacity.CeilingBytes(), 4000ull * 1024 * 1024);
  EXPECT_TRUE(c.delivery.segmentation_enabled);
  EXPECT_EQ(c.delivery.max_delivery_failures, 4);
}

TEST(PipelineConfigTest, ReportsEveryBadKeyAtOnce) {
  auto r = LoadPipelineConfig(MapEnv({
      {"DOWNLOAD_DIR", "/data/dl"},
      {"MAX_ACTIVE", "lots"},
      {"WATCH_INTERVAL", "0"},
      {"REENCODE_BOX", "wide"},
      {"HIGH_CAPACITY_TIER", "gold"},
  }));
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.message.find("MAX_ACTIVE=lots"), std::string::npos) << r.message;
  EXPECT_NE(r.message.find("WATCH_INTERVAL"), std::string::npos);
  EXPECT_NE(r.message.find("REENCODE_BOX"), std::string::npos);
  EXPECT_NE(r.message.find("HIGH_CAPACITY_TIER"), std::string::npos);
}

TEST(PipelineConfigTest, UploaderNeedsAtLeastOneTransport) {
  auto none = LoadPipelineConfig(MapEnv({{"DOWNLOAD_DIR", "/d"}}));
  ASSERT_TRUE(none.success);
  EXPECT_FALSE(MissingUploaderSettings(none.config).empty());

  auto half = LoadPipelineConfig(MapEnv({{"DOWNLOAD_DIR", "/d"}, {"ENABLE_HIGH_CAPACITY", "1"}}));
  ASSERT_TRUE(half.success);
  EXPECT_NE(MissingUploaderSettings(half.config).find("UPLOAD_GATEWAY"), std::string::npos);

  auto bot = LoadPipelineConfig(
      MapEnv({{"DOWNLOAD_DIR", "/d"}, {"TELEGRAM_TOKEN", "t"}, {"TELEGRAM_CHAT_ID", "1"}}));
  ASSERT_TRUE(bot.success);
  EXPECT_EQ(MissingUploaderSettings(bot.config), "");
}

TEST(PipelineConfigTest, ParseBox) {
  auto box = ParseBox("1920x1080");
  ASSERT_TRUE(box.has_value());
  EXPECT_EQ(box->first, 1920);
  EXPECT_EQ(box->second, 1080);
  EXPECT_FALSE(ParseBox("1920").has_value());
  EXPECT_FALSE(ParseBox("0x720").has_value());
  EXPECT_FALSE(ParseBox("12ax7").has_value());
}

TEST(PipelineConfigTest, DescribeMentionsTransports) {
  auto r = LoadPipelineConfig(MapEnv({{"DOWNLOAD_DIR", "/d"}}));
  ASSERT_TRUE(r.success);
  const std::string d = r.config.Describe();
  EXPECT_NE(d.find("watch_dir=/d"), std::string::npos);
  EXPECT_NE(d.find("lightweight=off"), std::string::npos);
}

}  // namespace
}  // namespace mediarelay::config
