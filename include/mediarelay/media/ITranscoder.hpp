// Repository: MediaRelay
// Component: Transcoder Interface
// Purpose: Narrow seam to the external transcoding engine. The engine itself
//          is never re-implemented here; callers observe only the exit code
//          and whether the output file exists.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_MEDIA_I_TRANSCODER_HPP_
#define MEDIARELAY_MEDIA_I_TRANSCODER_HPP_

#include <optional>
#include <string>

namespace mediarelay::media {

enum class TranscodeMode {
  kRemuxCopy,     // all streams copied into a fresh MP4 container
  kAudioRepair,   // video copied, audio re-encoded to AAC
  kFullReencode,  // H.264 + AAC, scaled into a box
  kCut,           // stream-copy a [start, start + duration) window
};

const char* TranscodeModeName(TranscodeMode mode);

struct TranscodeRequest {
  std::string input;
  std::string output;
  TranscodeMode mode = TranscodeMode::kRemuxCopy;

  // kFullReencode: explicit target size when the source geometry is known;
  // otherwise the box is applied through a scale expression.
  std::optional<int> width;
  std::optional<int> height;
  int box_width = 1280;
  int box_height = 720;

  std::string audio_bitrate = "128k";

  // kCut
  double start_s = 0.0;
  double duration_s = 0.0;
};

struct TranscodeResult {
  bool launched = false;
  int exit_code = -1;
  std::string detail;

  bool ExitedCleanly() const { return launched && exit_code == 0; }
};

class ITranscoder {
 public:
  virtual ~ITranscoder() = default;
  virtual TranscodeResult Run(const TranscodeRequest& request) = 0;
};

}  // namespace mediarelay::media

#endif  // MEDIARELAY_MEDIA_I_TRANSCODER_HPP_
