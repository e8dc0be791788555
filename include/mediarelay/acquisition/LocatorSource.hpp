// Repository: MediaRelay
// Component: Locator Source
// Purpose: Read the list of work items for the collector.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_ACQUISITION_LOCATOR_SOURCE_HPP_
#define MEDIARELAY_ACQUISITION_LOCATOR_SOURCE_HPP_

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace mediarelay::acquisition {

// One locator per line. Blank lines and lines starting with '#' are
// ignored; surrounding whitespace is trimmed. limit == 0 means no limit.
// Duplicates are kept (the scheduler drops them).
std::vector<std::string> ParseLocators(std::istream& in, size_t limit = 0);

struct LocatorLoadResult {
  bool success = false;
  std::string message;
  std::vector<std::string> locators;
};

// path "-" or empty reads standard input.
LocatorLoadResult LoadLocators(const std::string& path, size_t limit = 0);

}  // namespace mediarelay::acquisition

#endif  // MEDIARELAY_ACQUISITION_LOCATOR_SOURCE_HPP_
