// Repository: MediaRelay
// Component: Collector executable
// Purpose: Read locators, download them with bounded concurrency, recover
//          interrupted downloads, and sweep remaining partials on exit.
// Copyright (c) 2025 MediaRelay
//
// Locators come from --locators FILE (one per line) or standard input.
// Settings come from the environment (see PipelineConfig); the flags below
// override the matching keys.

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include "mediarelay/acquisition/ConcurrencyScheduler.hpp"
#include "mediarelay/acquisition/LocatorSource.hpp"
#include "mediarelay/acquisition/YtDlpAcquirer.hpp"
#include "mediarelay/config/PipelineConfig.hpp"
#include "mediarelay/media/FFmpegMediaProbe.hpp"
#include "mediarelay/media/FfmpegTranscoder.hpp"
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
  std::map<std::string, std::string> overrides;  // environment keys
  std::string locators_path;                     // empty = stdin
  size_t limit = 0;
  std::vector<std::string> extra_args;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "  --locators PATH      Locator list, one per line ('-' = stdin, default)\n"
            << "  --limit N            Use at most N locators (default: all)\n"
            << "  --download-dir PATH  Output root (DOWNLOAD_DIR)\n"
            << "  --log-dir PATH       Log directory (LOG_DIR)\n"
            << "  --max-active N       Concurrent downloads (MAX_ACTIVE)\n"
            << "  --ytdlp PATH         yt-dlp executable (YTDLP_BIN)\n"
            << "  --extra-arg ARG      Extra yt-dlp argument (repeatable)\n"
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
    } else if (arg == "--locators" && i + 1 < argc) {
      args.locators_path = argv[++i];
    } else if (arg == "--limit" && i + 1 < argc) {
      try {
        args.limit = static_cast<size_t>(std::stoul(argv[++i]));
      } catch (const std::exception&) {
        args.error = "--limit expects a number";
        return args;
      }
    } else if (arg == "--download-dir" && i + 1 < argc) {
      args.overrides["DOWNLOAD_DIR"] = argv[++i];
    } else if (arg == "--log-dir" && i + 1 < argc) {
      args.overrides["LOG_DIR"] = argv[++i];
    } else if (arg == "--max-active" && i + 1 < argc) {
      args.overrides["MAX_ACTIVE"] = argv[++i];
    } else if (arg == "--ytdlp" && i + 1 < argc) {
      args.overrides["YTDLP_BIN"] = argv[++i];
    } else if (arg == "--extra-arg" && i + 1 < argc) {
      args.extra_args.push_back(argv[++i]);
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }
  args.valid = true;
  return args;
}

void OpenLogFile(const std::string& log_dir, const std::string& program) {
  std::error_code ec;
  std::filesystem::create_directories(log_dir, ec);
  const std::string path = (std::filesystem::path(log_dir) / (program + ".log")).string();
  if (!Logger::SetLogFile(path)) {
    Logger::Warn("[Collector] cannot open log file " + path + "; console only");
  }
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
    Logger::Error("[Collector] Invalid configuration: " + loaded.message);
    return 1;
  }
  const mediarelay::config::PipelineConfig& config = loaded.config;
  OpenLogFile(config.log_dir, "mediarelay_collector");

  auto locators = mediarelay::acquisition::LoadLocators(args.locators_path, args.limit);
  if (!locators.success) {
    Logger::Error("[Collector] " + locators.message);
    return 1;
  }
  if (locators.locators.empty()) {
    Logger::Warn("[Collector] No locators given; nothing to do.");
    return 0;
  }
  if (static_cast<int>(locators.locators.size()) < config.max_active) {
    Logger::Warn("[Collector] Fewer locators than slots (" +
                 std::to_string(locators.locators.size()) + " < " +
                 std::to_string(config.max_active) + ")");
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  Logger::Info("[Collector] " + config.Describe());

  mediarelay::timing::SystemTimeSource clock;
  mediarelay::media::FFmpegMediaProbe probe;
  mediarelay::media::FfmpegTranscoder transcoder(config.recovery.ffmpeg_bin);
  mediarelay::recovery::RecoveryEngine engine(config.recovery, transcoder, probe, clock);

  mediarelay::acquisition::AcquirerOptions acquirer_options;
  acquirer_options.ytdlp_bin = config.ytdlp_bin;
  acquirer_options.download_dir = config.watch_dir;
  acquirer_options.partial_suffix = config.recovery.partial_suffix;
  acquirer_options.extra_args = args.extra_args;
  mediarelay::acquisition::YtDlpAcquirer acquirer(acquirer_options, engine);

  mediarelay::acquisition::ConcurrencyScheduler scheduler(acquirer, config.max_active,
                                                         config.monitor_interval_s);

  // Forwards a signal to the scheduler; the handler itself only sets a flag.
  std::atomic<bool> scheduler_done{false};
  std::thread signal_watch([&] {
    while (!scheduler_done.load(std::memory_order_acquire)) {
      if (g_termination_requested.load(std::memory_order_acquire)) {
        Logger::Warn("[Collector] Interrupted; stopping after running jobs.");
        scheduler.RequestStop();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
  });

  auto snapshot = scheduler.Run(locators.locators);
  scheduler_done.store(true, std::memory_order_release);
  signal_watch.join();

  // Every job has been joined, so any partial left behind is final.
  Logger::Info("[Collector] Final recovery sweep of " + config.watch_dir);
  auto sweep = engine.RecoverPartials(config.watch_dir, 0);

  Logger::Info("[Collector] Done: " + snapshot.ToString() +
               " recovered=" + std::to_string(sweep.recovered.size()) +
               " quarantined=" + std::to_string(sweep.quarantined.size()));
  Logger::CloseLogFile();
  return 0;
}
