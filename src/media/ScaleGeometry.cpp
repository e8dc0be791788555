// Repository: MediaRelay
// Component: Scale Geometry
// Copyright (c) 2025 MediaRelay

#include "mediarelay/media/ScaleGeometry.hpp"

#include <algorithm>
#include <cmath>

namespace mediarelay::media {

namespace {

int RoundEven(double v) {
  int r = static_cast<int>(std::lround(v / 2.0)) * 2;
  return std::max(r, 2);
}

}  // namespace

FitSize FitWithinBox(int src_width, int src_height, int box_width, int box_height) {
  if (src_width <= 0 || src_height <= 0 || box_width <= 0 || box_height <= 0) {
    return {};
  }
  // Downscale only: a source already inside the box keeps its size.
  const double scale = std::min({1.0,
                                 static_cast<double>(box_width) / src_width,
                                 static_cast<double>(box_height) / src_height});
  FitSize out;
  out.width = std::min(RoundEven(src_width * scale), std::max(box_width - box_width % 2, 2));
  out.height = std::min(RoundEven(src_height * scale), std::max(box_height - box_height % 2, 2));
  return out;
}

std::string BoxFitFilter(int box_width, int box_height) {
  const std::string w = std::to_string(box_width);
  const std::string h = std::to_string(box_height);
  const std::string ratio = w + "/" + h;
  return "scale='if(gt(a," + ratio + ")," + w + ",-2)':'if(gt(a," + ratio + "),-2," + h +
         ")',setsar=1";
}

}  // namespace mediarelay::media
