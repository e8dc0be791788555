// Repository: MediaRelay
// Component: yt-dlp Acquirer
// Copyright (c) 2025 MediaRelay

#include "mediarelay/acquisition/YtDlpAcquirer.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include "mediarelay/lifecycle/StabilityGate.hpp"
#include "mediarelay/util/Logger.hpp"
#include "mediarelay/util/Subprocess.hpp"
#include "mediarelay/util/TextUtil.hpp"

namespace fs = std::filesystem;

namespace mediarelay::acquisition {

using util::Logger;

namespace {

bool Exists(const std::string& path) {
  std::error_code ec;
  return fs::exists(path, ec);
}

uint64_t SizeOf(const std::string& path) {
  auto st = lifecycle::StatPath(path);
  return st ? st->size_bytes : 0;
}

}  // namespace

YtDlpAcquirer::YtDlpAcquirer(AcquirerOptions options, recovery::RecoveryEngine& engine)
    : options_(std::move(options)), engine_(engine) {}

AcquisitionJob YtDlpAcquirer::Prepare(const std::string& locator) {
  std::lock_guard<std::mutex> lock(prepare_mutex_);
  const std::string stamp = util::LocalStamp();
  AcquisitionJob job = MakeJob(locator, options_.download_dir, stamp, options_.partial_suffix);

  // Two jobs for one owner within the same second share a stamp.
  for (int n = 2; Exists(job.target_path) || Exists(job.partial_path); ++n) {
    job = MakeJob(locator, options_.download_dir, stamp + "-" + std::to_string(n),
                  options_.partial_suffix);
  }

  std::error_code ec;
  fs::create_directories(fs::path(job.target_path).parent_path(), ec);
  if (ec) {
    Logger::Warn("[YtDlpAcquirer] cannot create " +
                 fs::path(job.target_path).parent_path().string() + ": " + ec.message());
  }
  std::ofstream marker(job.partial_path, std::ios::app);
  return job;
}

std::vector<std::string> YtDlpAcquirer::BuildArgs(const AcquisitionJob& job) const {
  std::vector<std::string> args = {options_.ytdlp_bin,
                                   "--no-color",
                                   "--newline",
                                   "--no-part",
                                   "--retries", "3",
                                   "--fragment-retries", "3",
                                   "--concurrent-fragments", "5",
                                   "-o", job.target_path};
  args.insert(args.end(), options_.extra_args.begin(), options_.extra_args.end());
  args.push_back(job.locator);
  return args;
}

JobStatus YtDlpAcquirer::Salvage(const AcquisitionJob& job) {
  // The downloader wrote straight to the target; what it left behind is the
  // partial now.
  if (SizeOf(job.target_path) > 0) {
    if (std::rename(job.target_path.c_str(), job.partial_path.c_str()) != 0) {
      Logger::Error("[YtDlpAcquirer] cannot move interrupted " + job.target_path +
                    " to " + job.partial_path);
      return JobStatus::kError;
    }
  }

  if (SizeOf(job.partial_path) == 0) {
    std::error_code ec;
    fs::remove(job.partial_path, ec);
    Logger::Warn("[YtDlpAcquirer] nothing downloaded for " + job.locator);
    return JobStatus::kError;
  }

  recovery::RecoveryResult r = engine_.Finalize(job.partial_path);
  if (r.success()) return JobStatus::kDone;
  Logger::Warn("[YtDlpAcquirer] recovery " + std::string(recovery::RecoveryStatusName(r.status)) +
               " for " + job.locator + ": " + r.message);
  return JobStatus::kError;
}

JobStatus YtDlpAcquirer::Acquire(const std::string& locator, const std::atomic<bool>& interrupt) {
  const AcquisitionJob job = Prepare(locator);
  Logger::Info("[YtDlpAcquirer] Starting " + locator + " -> " + job.target_path);

  util::ProcessOptions options;
  options.interrupt = &interrupt;
  options.on_line = [](const std::string& line) {
    if (line.find("[download]") != std::string::npos) {
      Logger::Info("[yt-dlp] " + line);
    } else {
      Logger::Debug("[yt-dlp] " + line);
    }
  };

  util::ProcessResult proc = util::RunProcess(BuildArgs(job), options);
  if (!proc.launched) {
    Logger::Error("[YtDlpAcquirer] cannot launch " + options_.ytdlp_bin + ": " + proc.error);
  } else {
    Logger::Info("[YtDlpAcquirer] yt-dlp exit=" + std::to_string(proc.exit_code) +
                 (proc.interrupted ? " (interrupted)" : "") + " for " + locator);
  }

  if (proc.Succeeded() && SizeOf(job.target_path) > 0) {
    std::error_code ec;
    fs::remove(job.partial_path, ec);
    return JobStatus::kDone;
  }
  return Salvage(job);
}

}  // namespace mediarelay::acquisition
