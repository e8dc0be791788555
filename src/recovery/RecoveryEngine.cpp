// Repository: MediaRelay
// Component: Recovery Engine
// Purpose: remux-copy -> audio repair -> full re-encode -> quarantine.
// Copyright (c) 2025 MediaRelay

#include "mediarelay/recovery/RecoveryEngine.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <functional>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <stdio.h>
#include <sys/file.h>
#include <unistd.h>

#include "mediarelay/lifecycle/Artifact.hpp"
#include "mediarelay/lifecycle/StabilityGate.hpp"
#include "mediarelay/media/ScaleGeometry.hpp"
#include "mediarelay/scan/FileWalker.hpp"
#include "mediarelay/util/Logger.hpp"
#include "mediarelay/util/TextUtil.hpp"

namespace fs = std::filesystem;

namespace mediarelay::recovery {

using util::Logger;

namespace {

bool PathExists(const std::string& path) {
  std::error_code ec;
  return fs::exists(path, ec);
}

void RemoveQuietly(const std::string& path) {
  std::error_code ec;
  fs::remove(path, ec);
}

media::TranscodeMode ModeFor(RecoveryStage stage) {
  switch (stage) {
    case RecoveryStage::kAudioRepair: return media::TranscodeMode::kAudioRepair;
    case RecoveryStage::kFullReencode: return media::TranscodeMode::kFullReencode;
    default: return media::TranscodeMode::kRemuxCopy;
  }
}

bool IsAttemptStage(RecoveryStage stage) {
  return stage == RecoveryStage::kRemuxCopy || stage == RecoveryStage::kAudioRepair ||
         stage == RecoveryStage::kFullReencode;
}

// Releases a path claim on scope exit.
class ClaimGuard {
 public:
  explicit ClaimGuard(std::function<void()> release) : release_(std::move(release)) {}
  ~ClaimGuard() { release_(); }
  ClaimGuard(const ClaimGuard&) = delete;
  ClaimGuard& operator=(const ClaimGuard&) = delete;

 private:
  std::function<void()> release_;
};

// Exclusive advisory lock on a source file. Every engine, in this process or
// another, takes it before touching the source; closing the descriptor
// releases it.
class SourceLock {
 public:
  explicit SourceLock(const std::string& path) {
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
      error_ = errno;
      return;
    }
    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
      error_ = errno;
      ::close(fd_);
      fd_ = -1;
    }
  }
  ~SourceLock() {
    if (fd_ >= 0) ::close(fd_);
  }
  SourceLock(const SourceLock&) = delete;
  SourceLock& operator=(const SourceLock&) = delete;

  bool held() const { return fd_ >= 0; }
  bool contended() const { return error_ == EWOULDBLOCK; }
  int error() const { return error_; }

 private:
  int fd_ = -1;
  int error_ = 0;
};

enum class PublishStatus { kPublished, kTargetExists, kFailed };

constexpr int kPublishAttempts = 8;

// Renames src to dst unless dst already exists. *err receives errno on
// kFailed.
PublishStatus RenameNoReplace(const std::string& src, const std::string& dst, int* err) {
  if (::renameat2(AT_FDCWD, src.c_str(), AT_FDCWD, dst.c_str(), RENAME_NOREPLACE) == 0) {
    return PublishStatus::kPublished;
  }
  int e = errno;
  if (e == EINVAL || e == ENOSYS || e == EOPNOTSUPP) {
    // Filesystem without RENAME_NOREPLACE; link(2) refuses an existing name too.
    if (::link(src.c_str(), dst.c_str()) == 0) {
      ::unlink(src.c_str());
      return PublishStatus::kPublished;
    }
    e = errno;
  }
  if (e == EEXIST) return PublishStatus::kTargetExists;
  *err = e;
  return PublishStatus::kFailed;
}

// Same-device rename, or copy + remove across devices; never replaces dst.
PublishStatus MoveNoReplace(const std::string& src, const std::string& dst, std::string* error) {
  std::error_code ec;
  fs::path parent = fs::path(dst).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      *error = "create " + parent.string() + ": " + ec.message();
      return PublishStatus::kFailed;
    }
  }

  int err = 0;
  PublishStatus status = RenameNoReplace(src, dst, &err);
  if (status != PublishStatus::kFailed) return status;
  if (err != EXDEV) {
    *error = "rename: " + std::string(std::strerror(err));
    return PublishStatus::kFailed;
  }

  // Different filesystems: copy (which refuses an existing dst), then drop
  // the source.
  if (PathExists(dst)) return PublishStatus::kTargetExists;
  fs::copy_file(src, dst, fs::copy_options::none, ec);
  if (ec) {
    if (ec == std::errc::file_exists) return PublishStatus::kTargetExists;
    *error = "copy: " + ec.message();
    return PublishStatus::kFailed;
  }
  fs::remove(src, ec);
  if (ec) {
    Logger::Warn("[RecoveryEngine] copied " + src + " but could not remove it: " + ec.message());
  }
  return PublishStatus::kPublished;
}

}  // namespace

const char* RecoveryStageName(RecoveryStage stage) {
  switch (stage) {
    case RecoveryStage::kRemuxCopy: return "remux-copy";
    case RecoveryStage::kAudioRepair: return "audio-repair";
    case RecoveryStage::kFullReencode: return "full-reencode";
    case RecoveryStage::kRecovered: return "recovered";
    case RecoveryStage::kQuarantine: return "quarantine";
  }
  return "unknown";
}

const char* RecoveryStatusName(RecoveryStatus status) {
  switch (status) {
    case RecoveryStatus::kRecovered: return "recovered";
    case RecoveryStatus::kQuarantined: return "quarantined";
    case RecoveryStatus::kBusy: return "busy";
    case RecoveryStatus::kSourceMissing: return "source-missing";
    case RecoveryStatus::kIoError: return "io-error";
  }
  return "unknown";
}

RecoveryStage NextStage(RecoveryStage stage, bool succeeded) {
  if (!IsAttemptStage(stage)) return stage;
  if (succeeded) return RecoveryStage::kRecovered;
  switch (stage) {
    case RecoveryStage::kRemuxCopy: return RecoveryStage::kAudioRepair;
    case RecoveryStage::kAudioRepair: return RecoveryStage::kFullReencode;
    default: return RecoveryStage::kQuarantine;
  }
}

bool MoveToFreeName(const std::string& src, const std::string& dst, std::string* moved_to,
                    std::string* error) {
  std::string detail;
  for (int n = 0; n < kPublishAttempts; ++n) {
    const std::string candidate = UniqueDestination(dst);
    switch (MoveNoReplace(src, candidate, &detail)) {
      case PublishStatus::kPublished:
        if (moved_to) *moved_to = candidate;
        return true;
      case PublishStatus::kTargetExists:
        detail = "destination kept being taken: " + candidate;
        continue;
      case PublishStatus::kFailed:
        if (error) *error = detail;
        return false;
    }
  }
  if (error) *error = detail;
  return false;
}

std::string UniqueDestination(const std::string& dst) {
  if (!PathExists(dst)) return dst;
  fs::path p(dst);
  const std::string stem = p.stem().string();
  const std::string ext = p.extension().string();
  for (int n = 1;; ++n) {
    fs::path candidate = p.parent_path() / (stem + "_" + std::to_string(n) + ext);
    if (!PathExists(candidate.string())) return candidate.string();
  }
}

RecoveryEngine::RecoveryEngine(config::RecoveryConfig config,
                               media::ITranscoder& transcoder,
                               media::IMediaProbe& probe,
                               const timing::ITimeSource& clock)
    : config_(std::move(config)), transcoder_(transcoder), probe_(probe), clock_(clock) {}

std::string RecoveryEngine::FinalPathFor(const std::string& partial_path) const {
  fs::path p(partial_path);
  std::string name = p.filename().string();
  if (!config_.partial_suffix.empty() && util::EndsWith(name, config_.partial_suffix)) {
    name.resize(name.size() - config_.partial_suffix.size());
  }
  fs::path base = p.parent_path() / name;
  base.replace_extension(".mp4");
  if (!PathExists(base.string())) return base.string();

  const std::string stem =
      base.stem().string() + "__fixed_" + std::to_string(clock_.NowUtcMs() / 1000);
  fs::path fixed = base.parent_path() / (stem + ".mp4");
  for (int n = 2; PathExists(fixed.string()); ++n) {
    fixed = base.parent_path() / (stem + "_" + std::to_string(n) + ".mp4");
  }
  return fixed.string();
}

std::string RecoveryEngine::TempPathFor(const std::string& final_path, const std::string& token) {
  fs::path p(final_path);
  return (p.parent_path() /
          (p.stem().string() + lifecycle::kTempMarker + "." + token + ".mp4"))
      .string();
}

bool RecoveryEngine::Claim(const std::string& path) {
  std::lock_guard<std::mutex> lock(claims_mutex_);
  return claims_.insert(path).second;
}

void RecoveryEngine::Release(const std::string& path) {
  std::lock_guard<std::mutex> lock(claims_mutex_);
  claims_.erase(path);
}

bool RecoveryEngine::Attempt(RecoveryStage stage, const std::string& source,
                             const std::string& temp_path, const lifecycle::MediaInfo& info,
                             std::string* detail) {
  media::TranscodeRequest request;
  request.input = source;
  request.output = temp_path;
  request.mode = ModeFor(stage);
  request.audio_bitrate = config_.audio_bitrate;
  request.box_width = config_.reencode_box_width;
  request.box_height = config_.reencode_box_height;
  if (stage == RecoveryStage::kFullReencode && info.HasGeometry()) {
    media::FitSize fit = media::FitWithinBox(*info.width, *info.height,
                                             config_.reencode_box_width,
                                             config_.reencode_box_height);
    if (fit.width > 0 && fit.height > 0) {
      request.width = fit.width;
      request.height = fit.height;
    }
  }

  media::TranscodeResult result = transcoder_.Run(request);

  auto out = lifecycle::StatPath(temp_path);
  const bool ok = result.ExitedCleanly() && out.has_value() && out->size_bytes > 0;
  if (!ok) {
    RemoveQuietly(temp_path);
    *detail = std::string(RecoveryStageName(stage)) + " exit=" +
              std::to_string(result.exit_code) +
              (result.detail.empty() ? "" : " " + result.detail);
  }
  return ok;
}

RecoveryResult RecoveryEngine::Quarantine(const std::string& source, const std::string& reason) {
  RecoveryResult result;
  result.stage = RecoveryStage::kQuarantine;

  if (config_.quarantine_dir.empty()) {
    result.status = RecoveryStatus::kIoError;
    result.message = "no quarantine directory configured; kept " + source;
    Logger::Error("[RecoveryEngine] " + result.message);
    return result;
  }

  std::string dst;
  std::string error;
  if (!MoveToFreeName(source,
                      (fs::path(config_.quarantine_dir) / fs::path(source).filename()).string(),
                      &dst, &error)) {
    result.status = RecoveryStatus::kIoError;
    result.message = "quarantine move failed for " + source + ": " + error;
    Logger::Error("[RecoveryEngine] " + result.message);
    return result;
  }

  result.status = RecoveryStatus::kQuarantined;
  result.final_path = dst;
  result.message = reason;
  Logger::Warn("[RecoveryEngine] QUARANTINED " + source + " -> " + dst + " (" + reason + ")");
  return result;
}

RecoveryResult RecoveryEngine::Finalize(const std::string& partial_path) {
  const std::string source = scan::NormalizePath(partial_path);

  RecoveryResult result;
  if (!Claim(source)) {
    result.status = RecoveryStatus::kBusy;
    result.message = "already being finalized: " + source;
    Logger::Debug("[RecoveryEngine] " + result.message);
    return result;
  }
  ClaimGuard guard([this, &source] { Release(source); });

  SourceLock lock(source);
  if (lock.contended()) {
    result.status = RecoveryStatus::kBusy;
    result.message = "locked by another process: " + source;
    Logger::Info("[RecoveryEngine] " + result.message);
    return result;
  }

  // Checked after locking: a previous holder may have consumed the source.
  auto st = lifecycle::StatPath(source);
  if (!st || st->size_bytes == 0) {
    result.status = RecoveryStatus::kSourceMissing;
    result.message = (st ? "empty source: " : "missing source: ") + source;
    Logger::Warn("[RecoveryEngine] " + result.message);
    return result;
  }
  if (!lock.held()) {
    result.status = RecoveryStatus::kIoError;
    result.message = "cannot lock " + source + ": " + std::strerror(lock.error());
    Logger::Error("[RecoveryEngine] " + result.message);
    return result;
  }

  const lifecycle::MediaInfo info = probe_.Probe(source);
  std::string final_path = FinalPathFor(source);
  const std::string temp_path = TempPathFor(
      final_path, std::to_string(::getpid()) + "-" + std::to_string(attempt_seq_.fetch_add(1)));

  Logger::Info("[RecoveryEngine] Finalizing " + source + " (" +
               util::HumanSize(st->size_bytes) + ")");

  std::string last_detail;
  RecoveryStage stage = RecoveryStage::kRemuxCopy;
  while (IsAttemptStage(stage)) {
    std::string detail;
    const bool ok = Attempt(stage, source, temp_path, info, &detail);
    if (ok) {
      int err = 0;
      PublishStatus published = RenameNoReplace(temp_path, final_path, &err);
      for (int n = 1; published == PublishStatus::kTargetExists && n < kPublishAttempts; ++n) {
        Logger::Info("[RecoveryEngine] " + final_path + " appeared during recovery; renaming");
        final_path = FinalPathFor(source);
        published = RenameNoReplace(temp_path, final_path, &err);
      }
      if (published != PublishStatus::kPublished) {
        RemoveQuietly(temp_path);
        result.status = RecoveryStatus::kIoError;
        result.stage = stage;
        result.message = "publish " + temp_path + " -> " + final_path + ": " +
                         (published == PublishStatus::kTargetExists ? std::string("name taken")
                                                                    : std::strerror(err));
        Logger::Error("[RecoveryEngine] " + result.message);
        return result;
      }
      std::error_code ec;
      fs::remove(source, ec);
      if (ec) {
        Logger::Warn("[RecoveryEngine] recovered but could not remove " + source + ": " +
                     ec.message());
      }
      result.status = RecoveryStatus::kRecovered;
      result.stage = stage;
      result.final_path = final_path;
      result.message = RecoveryStageName(stage);
      Logger::Info("[RecoveryEngine] Recovered via " + std::string(RecoveryStageName(stage)) +
                   ": " + final_path);
      return result;
    }

    Logger::Info("[RecoveryEngine] " + detail + " for " + source);
    last_detail = detail;
    stage = NextStage(stage, false);
  }

  return Quarantine(source, "all recovery tiers failed; last: " + last_detail);
}

RecoverySweepSummary RecoveryEngine::RecoverPartials(const std::string& root, int min_age_s) {
  struct Candidate {
    int64_t mtime_ms;
    std::string path;
  };
  std::vector<Candidate> candidates;

  scan::WalkFiles(root, config_.quarantine_dir, [&](const std::string& path) {
    const std::string name = fs::path(path).filename().string();
    if (config_.partial_suffix.empty() || !util::EndsWith(name, config_.partial_suffix)) return;
    if (name.find(lifecycle::kTempMarker) != std::string::npos) return;
    auto st = lifecycle::StatPath(path);
    // An empty marker belongs to a download still writing its target.
    if (!st || st->size_bytes == 0) return;
    if (!lifecycle::IsStable(*st, min_age_s, clock_)) return;
    candidates.push_back({st->mtime_ms, path});
  });

  std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
    if (a.mtime_ms != b.mtime_ms) return a.mtime_ms < b.mtime_ms;
    return a.path < b.path;
  });

  RecoverySweepSummary summary;
  for (const auto& c : candidates) {
    RecoveryResult r = Finalize(c.path);
    switch (r.status) {
      case RecoveryStatus::kRecovered:
        summary.recovered.push_back(r.final_path);
        break;
      case RecoveryStatus::kQuarantined:
        summary.quarantined.push_back(r.final_path);
        break;
      default:
        ++summary.failed;
        break;
    }
  }

  if (!candidates.empty()) {
    Logger::Info("[RecoveryEngine] Sweep " + root + ": recovered=" +
                 std::to_string(summary.recovered.size()) +
                 " quarantined=" + std::to_string(summary.quarantined.size()) +
                 " failed=" + std::to_string(summary.failed));
  }
  return summary;
}

}  // namespace mediarelay::recovery
