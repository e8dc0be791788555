// Repository: MediaRelay
// Component: Scale Geometry
// Purpose: Aspect-preserving fit of a source raster into a bounding box.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_MEDIA_SCALE_GEOMETRY_HPP_
#define MEDIARELAY_MEDIA_SCALE_GEOMETRY_HPP_

#include <string>

namespace mediarelay::media {

struct FitSize {
  int width = 0;
  int height = 0;
};

// Largest size with the source aspect ratio that fits inside the box,
// never larger than the source itself. Both dimensions are rounded to the
// nearest even number (H.264 4:2:0) and are at least 2.
// Returns {0,0} for a non-positive source or box.
FitSize FitWithinBox(int src_width, int src_height, int box_width, int box_height);

// ffmpeg -vf expression doing the same fit when the source geometry is not
// known ahead of time, e.g. for 1280x720:
//   scale='if(gt(a,1280/720),1280,-2)':'if(gt(a,1280/720),-2,720)',setsar=1
std::string BoxFitFilter(int box_width, int box_height);

}  // namespace mediarelay::media

#endif  // MEDIARELAY_MEDIA_SCALE_GEOMETRY_HPP_
