// Repository: MediaRelay
// Component: Uploader executable
// Purpose: Periodically recover partials, scan for ready media, and deliver
//          each file through the tiered transports.
// Copyright (c) 2025 MediaRelay

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include "delivery/GrpcUploadTransport.hpp"
#include "mediarelay/config/PipelineConfig.hpp"
#include "mediarelay/delivery/DeliveryRouter.hpp"
#include "mediarelay/delivery/HttpBotTransport.hpp"
#include "mediarelay/media/FFmpegMediaProbe.hpp"
#include "mediarelay/media/FfmpegTranscoder.hpp"
#include "mediarelay/pipeline/ArtifactPipeline.hpp"
#include "mediarelay/recovery/RecoveryEngine.hpp"
#include "mediarelay/timing/ITimeSource.hpp"
#include "mediarelay/util/Logger.hpp"

namespace {

using mediarelay::util::Logger;

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::map<std::string, std::string> overrides;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "  --once               Single pass, then exit (WATCH=0)\n"
            << "  --download-dir PATH  Watched root (DOWNLOAD_DIR)\n"
            << "  --log-dir PATH       Log directory (LOG_DIR)\n"
            << "  --interval SECONDS   Pause between passes (WATCH_INTERVAL)\n"
            << "  --help               Show this help message\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--once") {
      args.overrides["WATCH"] = "0";
    } else if (arg == "--download-dir" && i + 1 < argc) {
      args.overrides["DOWNLOAD_DIR"] = argv[++i];
    } else if (arg == "--log-dir" && i + 1 < argc) {
      args.overrides["LOG_DIR"] = argv[++i];
    } else if (arg == "--interval" && i + 1 < argc) {
      args.overrides["WATCH_INTERVAL"] = argv[++i];
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }
  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  const mediarelay::config::EnvLookup process_env = mediarelay::config::ProcessEnvironment();
  const auto overrides = args.overrides;
  mediarelay::config::EnvLookup env =
      [&process_env, overrides](const std::string& key) -> std::optional<std::string> {
    auto it = overrides.find(key);
    if (it != overrides.end()) return it->second;
    return process_env(key);
  };

  auto loaded = mediarelay::config::LoadPipelineConfig(env);
  if (!loaded.success) {
    Logger::Error("[Uploader] Invalid configuration: " + loaded.message);
    return 1;
  }
  const mediarelay::config::PipelineConfig& config = loaded.config;

  const std::string missing = mediarelay::config::MissingUploaderSettings(config);
  if (!missing.empty()) {
    Logger::Error("[Uploader] " + missing);
    return 2;
  }

  {
    std::error_code ec;
    std::filesystem::create_directories(config.log_dir, ec);
    const std::string log_path =
        (std::filesystem::path(config.log_dir) / "mediarelay_uploader.log").string();
    if (!Logger::SetLogFile(log_path)) {
      Logger::Warn("[Uploader] cannot open log file " + log_path + "; console only");
    }
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  Logger::Info("[Uploader] " + config.Describe());

  std::unique_ptr<mediarelay::delivery::HttpBotTransport> lightweight;
  if (config.delivery.lightweight.Configured()) {
    lightweight = std::make_unique<mediarelay::delivery::HttpBotTransport>(
        config.delivery.lightweight, &g_termination_requested);
  }
  std::unique_ptr<mediarelay::delivery::GrpcUploadTransport> high_capacity;
  if (config.delivery.high_capacity.Configured()) {
    high_capacity = std::make_unique<mediarelay::delivery::GrpcUploadTransport>(
        config.delivery.high_capacity, &g_termination_requested);
  }

  mediarelay::timing::SystemTimeSource clock;
  mediarelay::media::FFmpegMediaProbe probe;
  mediarelay::media::FfmpegTranscoder transcoder(config.recovery.ffmpeg_bin);
  mediarelay::recovery::RecoveryEngine engine(config.recovery, transcoder, probe, clock);
  mediarelay::delivery::DeliveryRouter router(config.delivery, lightweight.get(),
                                              high_capacity.get(), transcoder);
  mediarelay::pipeline::ArtifactPipeline pipeline(config, engine, router, probe, clock);

  pipeline.Run(g_termination_requested);

  Logger::Info("[Uploader] Stopped.");
  Logger::CloseLogFile();
  return 0;
}
