// Repository: MediaRelay
// Component: Recovery Engine
// Purpose: Turn an interrupted download (partial file) into a playable MP4
//          through an ordered cascade of increasingly expensive transcodes,
//          quarantining it when every tier fails.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_RECOVERY_RECOVERY_ENGINE_HPP_
#define MEDIARELAY_RECOVERY_RECOVERY_ENGINE_HPP_

#include <atomic>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "mediarelay/config/PipelineConfig.hpp"
#include "mediarelay/media/IMediaProbe.hpp"
#include "mediarelay/media/ITranscoder.hpp"
#include "mediarelay/timing/ITimeSource.hpp"

namespace mediarelay::recovery {

// Cascade stages. kRecovered and kQuarantine are terminal.
enum class RecoveryStage {
  kRemuxCopy = 0,
  kAudioRepair = 1,
  kFullReencode = 2,
  kRecovered = 3,
  kQuarantine = 4,
};

const char* RecoveryStageName(RecoveryStage stage);

// Success on any attempt stage ends in kRecovered; failure moves to the next
// tier, and past kFullReencode to kQuarantine. Terminal stages are fixed points.
RecoveryStage NextStage(RecoveryStage stage, bool succeeded);

enum class RecoveryStatus {
  kRecovered,
  kQuarantined,
  kBusy,               // another caller is finalizing the same path
  kSourceMissing,      // nothing to recover, nothing to keep
  kIoError,            // rename into place or quarantine move failed; source kept
};

const char* RecoveryStatusName(RecoveryStatus status);

struct RecoveryResult {
  RecoveryStatus status = RecoveryStatus::kSourceMissing;
  // Recovered file, or the partial's location inside the quarantine dir.
  std::string final_path;
  // Stage that produced the outcome (the successful tier, or kQuarantine).
  RecoveryStage stage = RecoveryStage::kRemuxCopy;
  std::string message;

  bool success() const { return status == RecoveryStatus::kRecovered; }
};

struct RecoverySweepSummary {
  std::vector<std::string> recovered;    // final paths, processing order
  std::vector<std::string> quarantined;  // quarantine destinations
  int failed = 0;                        // busy, vanished, or I/O error
};

class RecoveryEngine {
 public:
  // Collaborators are not owned and must outlive the engine.
  RecoveryEngine(config::RecoveryConfig config,
                 media::ITranscoder& transcoder,
                 media::IMediaProbe& probe,
                 const timing::ITimeSource& clock);

  RecoveryEngine(const RecoveryEngine&) = delete;
  RecoveryEngine& operator=(const RecoveryEngine&) = delete;

  // Thread-safe: distinct paths may be finalized concurrently. The same path
  // is finalized by at most one caller at a time, across engines and
  // processes (an flock on the source); the others get kBusy. The result
  // is published under a name that was free at that moment; an existing
  // file is never replaced.
  RecoveryResult Finalize(const std::string& partial_path);

  // Walks root for stable partial files and finalizes them oldest-first.
  RecoverySweepSummary RecoverPartials(const std::string& root, int min_age_s);

  // Partial suffix stripped, extension forced to .mp4, and a
  // __fixed_<epoch>[_<n>] suffix appended while the name is taken.
  std::string FinalPathFor(const std::string& partial_path) const;

  // "<dir>/<stem>.__tmp__.<token>.mp4" for a final path "<dir>/<stem>.mp4".
  // Finalize passes a token unique to the process and call.
  static std::string TempPathFor(const std::string& final_path, const std::string& token);

  const config::RecoveryConfig& config() const { return config_; }

 private:
  bool Claim(const std::string& path);
  void Release(const std::string& path);

  // One transcode into temp_path. Exit 0 with a non-empty output counts as
  // success; any output of a failed attempt is removed.
  bool Attempt(RecoveryStage stage, const std::string& source,
               const std::string& temp_path, const lifecycle::MediaInfo& info,
               std::string* detail);

  RecoveryResult Quarantine(const std::string& source, const std::string& reason);

  config::RecoveryConfig config_;
  media::ITranscoder& transcoder_;
  media::IMediaProbe& probe_;
  const timing::ITimeSource& clock_;

  std::mutex claims_mutex_;
  std::set<std::string> claims_;
  std::atomic<uint64_t> attempt_seq_{0};
};

// Moves src to UniqueDestination(dst), falling back to copy + remove when
// rename(2) reports a cross-device move. Parent directories are created. An
// existing file is never replaced: when another writer takes the chosen name
// first, a fresh one is picked. *moved_to receives the final name.
bool MoveToFreeName(const std::string& src, const std::string& dst, std::string* moved_to,
                    std::string* error);

// dst if free, else dst with _1, _2... before the extension.
std::string UniqueDestination(const std::string& dst);

}  // namespace mediarelay::recovery

#endif  // MEDIARELAY_RECOVERY_RECOVERY_ENGINE_HPP_
