// Repository: MediaRelay
// Component: FFmpeg Media Probe
// Purpose: Width/height/duration via libavformat.
// Copyright (c) 2025 MediaRelay

#include "mediarelay/media/FFmpegMediaProbe.hpp"

#include <cmath>

#include "mediarelay/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
#include <libavutil/rational.h>
}

namespace mediarelay::media {

using util::Logger;

namespace {

// Closes an opened input on scope exit.
struct FormatContextGuard {
  AVFormatContext* ctx = nullptr;
  ~FormatContextGuard() {
    if (ctx) avformat_close_input(&ctx);
  }
};

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace

FFmpegMediaProbe::FFmpegMediaProbe() {
  // Partial files make the demuxers noisy; keep errors only.
  av_log_set_level(AV_LOG_ERROR);
}

lifecycle::MediaInfo FFmpegMediaProbe::Probe(const std::string& path) {
  lifecycle::MediaInfo info;
  FormatContextGuard guard;

  int ret = avformat_open_input(&guard.ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    Logger::Debug("[FFmpegMediaProbe] open_input FAILED path=" + path +
                  " err=" + AvErrorString(ret));
    guard.ctx = nullptr;
    return info;
  }

  ret = avformat_find_stream_info(guard.ctx, nullptr);
  if (ret < 0) {
    Logger::Debug("[FFmpegMediaProbe] find_stream_info FAILED path=" + path +
                  " err=" + AvErrorString(ret));
    return info;
  }

  const int vidx = av_find_best_stream(guard.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  const AVStream* vstream = vidx >= 0 ? guard.ctx->streams[vidx] : nullptr;

  if (vstream && vstream->codecpar->width > 0 && vstream->codecpar->height > 0) {
    int width = vstream->codecpar->width;
    const int height = vstream->codecpar->height;
    AVRational sar = av_guess_sample_aspect_ratio(guard.ctx, const_cast<AVStream*>(vstream), nullptr);
    if (sar.num > 0 && sar.den > 0 && sar.num != sar.den) {
      width = static_cast<int>(std::lround(width * av_q2d(sar)));
    }
    info.width = width;
    info.height = height;
  }

  if (guard.ctx->duration != AV_NOPTS_VALUE && guard.ctx->duration > 0) {
    info.duration_s = static_cast<double>(guard.ctx->duration) / AV_TIME_BASE;
  } else if (vstream && vstream->duration != AV_NOPTS_VALUE && vstream->duration > 0) {
    info.duration_s = static_cast<double>(vstream->duration) * av_q2d(vstream->time_base);
  }

  return info;
}

}  // namespace mediarelay::media
