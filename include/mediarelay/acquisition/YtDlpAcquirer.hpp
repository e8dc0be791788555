// Repository: MediaRelay
// Component: yt-dlp Acquirer
// Purpose: Download one locator with the yt-dlp executable and hand an
//          interrupted download to the recovery engine.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_ACQUISITION_YT_DLP_ACQUIRER_HPP_
#define MEDIARELAY_ACQUISITION_YT_DLP_ACQUIRER_HPP_

#include <mutex>
#include <string>
#include <vector>

#include "mediarelay/acquisition/AcquisitionJob.hpp"
#include "mediarelay/recovery/RecoveryEngine.hpp"

namespace mediarelay::acquisition {

struct AcquirerOptions {
  std::string ytdlp_bin = "yt-dlp";
  std::string download_dir;
  std::string partial_suffix = ".part";
  std::vector<std::string> extra_args;
};

// Per job:
//   1. Reserve the output paths and create an empty partial marker.
//   2. Run yt-dlp writing to the target path.
//   3. Exit 0 with a target on disk -> done, marker removed.
//   4. Otherwise the interrupted target (if any) replaces the marker and the
//      partial is finalized by the recovery engine -> done or error.
class YtDlpAcquirer : public IAcquirer {
 public:
  YtDlpAcquirer(AcquirerOptions options, recovery::RecoveryEngine& engine);

  JobStatus Acquire(const std::string& locator, const std::atomic<bool>& interrupt) override;

  // Paths for the locator, made unique against files already on disk, with
  // the owner directory and the partial marker created. Thread-safe.
  AcquisitionJob Prepare(const std::string& locator);

  std::vector<std::string> BuildArgs(const AcquisitionJob& job) const;

 private:
  JobStatus Salvage(const AcquisitionJob& job);

  AcquirerOptions options_;
  recovery::RecoveryEngine& engine_;
  std::mutex prepare_mutex_;
};

}  // namespace mediarelay::acquisition

#endif  // MEDIARELAY_ACQUISITION_YT_DLP_ACQUIRER_HPP_
