// Repository: MediaRelay
// Component: FFmpeg Media Probe
// Purpose: In-process probing through libavformat.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_MEDIA_FFMPEG_MEDIA_PROBE_HPP_
#define MEDIARELAY_MEDIA_FFMPEG_MEDIA_PROBE_HPP_

#include "mediarelay/media/IMediaProbe.hpp"

namespace mediarelay::media {

// Opens the container, reads stream info, and reports the best video
// stream's display size (sample aspect ratio applied) and the container
// duration, falling back to the stream duration.
class FFmpegMediaProbe : public IMediaProbe {
 public:
  FFmpegMediaProbe();

  lifecycle::MediaInfo Probe(const std::string& path) override;
};

}  // namespace mediarelay::media

#endif  // MEDIARELAY_MEDIA_FFMPEG_MEDIA_PROBE_HPP_
