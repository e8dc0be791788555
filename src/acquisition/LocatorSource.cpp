// Repository: MediaRelay
// Component: Locator Source
// Copyright (c) 2025 MediaRelay

#include "mediarelay/acquisition/LocatorSource.hpp"

#include <fstream>
#include <iostream>

#include "mediarelay/util/TextUtil.hpp"

namespace mediarelay::acquisition {

std::vector<std::string> ParseLocators(std::istream& in, size_t limit) {
  std::vector<std::string> out;
  std::string line;
  while (std::getline(in, line)) {
    line = util::Trim(line);
    if (line.empty() || line[0] == '#') continue;
    out.push_back(line);
    if (limit > 0 && out.size() >= limit) break;
  }
  return out;
}

LocatorLoadResult LoadLocators(const std::string& path, size_t limit) {
  LocatorLoadResult result;
  if (path.empty() || path == "-") {
    result.locators = ParseLocators(std::cin, limit);
    result.success = true;
    return result;
  }

  std::ifstream in(path);
  if (!in) {
    result.message = "cannot open locator file: " + path;
    return result;
  }
  result.locators = ParseLocators(in, limit);
  result.success = true;
  return result;
}

}  // namespace mediarelay::acquisition
