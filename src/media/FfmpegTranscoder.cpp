// Repository: MediaRelay
// Component: FFmpeg Transcoder
// Purpose: Maps a TranscodeRequest onto ffmpeg command lines.
// Copyright (c) 2025 MediaRelay

#include "mediarelay/media/FfmpegTranscoder.hpp"

#include <cstdio>
#include <deque>
#include <utility>

#include "mediarelay/media/ScaleGeometry.hpp"
#include "mediarelay/util/Logger.hpp"
#include "mediarelay/util/Subprocess.hpp"

namespace mediarelay::media {

using util::Logger;

namespace {

constexpr size_t kTailLines = 6;

std::string Seconds(double s) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3f", s);
  return buf;
}

}  // namespace

const char* TranscodeModeName(TranscodeMode mode) {
  switch (mode) {
    case TranscodeMode::kRemuxCopy: return "remux-copy";
    case TranscodeMode::kAudioRepair: return "audio-repair";
    case TranscodeMode::kFullReencode: return "full-reencode";
    case TranscodeMode::kCut: return "cut";
  }
  return "unknown";
}

FfmpegTranscoder::FfmpegTranscoder(std::string ffmpeg_bin, const std::atomic<bool>* interrupt)
    : ffmpeg_bin_(std::move(ffmpeg_bin)), interrupt_(interrupt) {}

std::vector<std::string> FfmpegTranscoder::BuildArgs(const TranscodeRequest& request) const {
  std::vector<std::string> args = {ffmpeg_bin_, "-hide_banner", "-nostdin", "-y",
                                   "-loglevel", "error"};

  switch (request.mode) {
    case TranscodeMode::kRemuxCopy:
      args.insert(args.end(), {"-i", request.input, "-c", "copy",
                               "-movflags", "+faststart"});
      break;

    case TranscodeMode::kAudioRepair:
      args.insert(args.end(), {"-i", request.input, "-c:v", "copy",
                               "-c:a", "aac", "-b:a", request.audio_bitrate,
                               "-movflags", "+faststart"});
      break;

    case TranscodeMode::kFullReencode: {
      std::string vf;
      if (request.width && request.height) {
        vf = "scale=" + std::to_string(*request.width) + ":" +
             std::to_string(*request.height) + ",setsar=1";
      } else {
        vf = BoxFitFilter(request.box_width, request.box_height);
      }
      args.insert(args.end(), {"-i", request.input, "-vf", vf,
                               "-c:v", "libx264", "-preset", "veryfast", "-crf", "23",
                               "-c:a", "aac", "-b:a", request.audio_bitrate,
                               "-movflags", "+faststart"});
      break;
    }

    case TranscodeMode::kCut:
      // Input-side seek: fast, lands on the keyframe at or before start.
      args.insert(args.end(), {"-ss", Seconds(request.start_s), "-i", request.input,
                               "-t", Seconds(request.duration_s),
                               "-map", "0", "-c", "copy",
                               "-avoid_negative_ts", "make_zero"});
      break;
  }

  args.push_back(request.output);
  return args;
}

TranscodeResult FfmpegTranscoder::Run(const TranscodeRequest& request) {
  // Keep the last few diagnostic lines for the failure message.
  std::deque<std::string> tail;
  util::ProcessOptions options;
  options.interrupt = interrupt_;
  options.on_line = [&tail](const std::string& line) {
    Logger::Debug("[FfmpegTranscoder] " + line);
    tail.push_back(line);
    if (tail.size() > kTailLines) tail.pop_front();
  };

  Logger::Debug(std::string("[FfmpegTranscoder] ") + TranscodeModeName(request.mode) +
                " " + request.input + " -> " + request.output);
  util::ProcessResult proc = util::RunProcess(BuildArgs(request), options);

  TranscodeResult result;
  result.launched = proc.launched;
  result.exit_code = proc.interrupted ? -1 : proc.exit_code;
  if (!proc.launched) {
    result.detail = proc.error;
  } else if (proc.interrupted) {
    result.detail = "interrupted";
  } else {
    for (const auto& line : tail) {
      if (!result.detail.empty()) result.detail += " | ";
      result.detail += line;
    }
  }
  return result;
}

}  // namespace mediarelay::media
