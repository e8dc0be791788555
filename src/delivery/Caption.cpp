// Repository: MediaRelay
// Component: Caption Builder
// Copyright (c) 2025 MediaRelay

#include "mediarelay/delivery/Caption.hpp"

#include <filesystem>
#include <map>

#include "mediarelay/util/TextUtil.hpp"

namespace mediarelay::delivery {

std::string BuildCaption(const std::string& caption_template, const std::string& path) {
  const std::filesystem::path p(path);
  const std::string folder = p.parent_path().filename().string();
  const std::map<std::string, std::string> values = {
      {"folder", folder},
      {"folder_tag", util::SanitizeHashtag(folder)},
      {"filename", p.stem().string()},
      {"stem", p.stem().string()},
      {"name", p.filename().string()},
  };

  std::string out;
  size_t i = 0;
  while (i < caption_template.size()) {
    const char c = caption_template[i];
    if (c == '{') {
      const size_t close = caption_template.find('}', i + 1);
      if (close != std::string::npos) {
        auto it = values.find(caption_template.substr(i + 1, close - i - 1));
        if (it != values.end()) {
          out += it->second;
          i = close + 1;
          continue;
        }
      }
    }
    out += c;
    ++i;
  }
  return util::Trim(out);
}

std::string PartSuffix(int index, int count) {
  return " [part " + std::to_string(index) + "/" + std::to_string(count) + "]";
}

}  // namespace mediarelay::delivery
