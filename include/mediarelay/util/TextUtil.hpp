// Repository: MediaRelay
// Component: Text Utilities
// Purpose: Small string helpers shared by captions, naming and logging.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_UTIL_TEXT_UTIL_HPP_
#define MEDIARELAY_UTIL_TEXT_UTIL_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace mediarelay::util {

// 1536 -> "1.50KB". Binary units up to TB.
std::string HumanSize(uint64_t bytes);

// "My Folder!" -> "#My_Folder". Empty result becomes "#NoFolder".
std::string SanitizeHashtag(const std::string& name);

// Replace anything outside [A-Za-z0-9_.-] with '_', trim, cap at 180 chars.
std::string SafeName(const std::string& s);

std::string ToLower(std::string s);

// Split on `sep`, trimming whitespace; empty items dropped.
std::vector<std::string> SplitTrimmed(const std::string& s, char sep);

std::string Trim(const std::string& s);

bool EndsWith(const std::string& s, const std::string& suffix);

// Local time "YYYYmmdd-HHMMSS".
std::string LocalStamp();

}  // namespace mediarelay::util

#endif  // MEDIARELAY_UTIL_TEXT_UTIL_HPP_
