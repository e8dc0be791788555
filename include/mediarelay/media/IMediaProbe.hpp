// Repository: MediaRelay
// Component: Media Probe Interface
// Purpose: Extract width, height and duration from a media file.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_MEDIA_I_MEDIA_PROBE_HPP_
#define MEDIARELAY_MEDIA_I_MEDIA_PROBE_HPP_

#include <string>

#include "mediarelay/lifecycle/Artifact.hpp"

namespace mediarelay::media {

// Absent fields mean "unknown", never an error. Implementations must not
// throw for unreadable or truncated files.
class IMediaProbe {
 public:
  virtual ~IMediaProbe() = default;
  virtual lifecycle::MediaInfo Probe(const std::string& path) = 0;
};

}  // namespace mediarelay::media

#endif  // MEDIARELAY_MEDIA_I_MEDIA_PROBE_HPP_
