// Repository: MediaRelay
// Component: FFmpeg Transcoder
// Purpose: ITranscoder backed by the ffmpeg executable.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_MEDIA_FFMPEG_TRANSCODER_HPP_
#define MEDIARELAY_MEDIA_FFMPEG_TRANSCODER_HPP_

#include <atomic>
#include <string>
#include <vector>

#include "mediarelay/media/ITranscoder.hpp"

namespace mediarelay::media {

class FfmpegTranscoder : public ITranscoder {
 public:
  // interrupt (optional, not owned) terminates a running transcode.
  explicit FfmpegTranscoder(std::string ffmpeg_bin,
                            const std::atomic<bool>* interrupt = nullptr);

  TranscodeResult Run(const TranscodeRequest& request) override;

  // Full argument vector, argv[0] included.
  std::vector<std::string> BuildArgs(const TranscodeRequest& request) const;

 private:
  std::string ffmpeg_bin_;
  const std::atomic<bool>* interrupt_;
};

}  // namespace mediarelay::media

#endif  // MEDIARELAY_MEDIA_FFMPEG_TRANSCODER_HPP_
