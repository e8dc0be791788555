// Repository: MediaRelay
// Component: Caption Builder
// Purpose: Expand the caption template for one artifact.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_DELIVERY_CAPTION_HPP_
#define MEDIARELAY_DELIVERY_CAPTION_HPP_

#include <string>

namespace mediarelay::delivery {

// Placeholders:
//   {folder}      parent directory name
//   {folder_tag}  parent directory as a hashtag (#NoFolder when empty)
//   {filename}    file stem (alias {stem})
//   {name}        full file name
// Unknown placeholders are left as written.
std::string BuildCaption(const std::string& caption_template, const std::string& path);

// " [part 2/5]"
std::string PartSuffix(int index, int count);

}  // namespace mediarelay::delivery

#endif  // MEDIARELAY_DELIVERY_CAPTION_HPP_
