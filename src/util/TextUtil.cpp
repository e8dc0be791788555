// Repository: MediaRelay
// Component: Text Utilities
// Copyright (c) 2025 MediaRelay

#include "mediarelay/util/TextUtil.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace mediarelay::util {

std::string HumanSize(uint64_t bytes) {
  static const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
  double f = static_cast<double>(bytes);
  size_t i = 0;
  while (f >= 1024.0 && i < 4) {
    f /= 1024.0;
    ++i;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f%s", f, kUnits[i]);
  return buf;
}

std::string SanitizeHashtag(const std::string& name) {
  std::string base;
  base.reserve(name.size());
  for (char c : name) {
    if (c == ' ') {
      base += '_';
    } else if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
      base += c;
    }
  }
  return "#" + (base.empty() ? std::string("NoFolder") : base);
}

std::string SafeName(const std::string& s) {
  std::string trimmed = Trim(s);
  std::string out;
  out.reserve(trimmed.size());
  bool last_was_sub = false;
  for (char c : trimmed) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) || c == '_' || c == '-' || c == '.') {
      out += c;
      last_was_sub = false;
    } else if (!last_was_sub) {
      // Runs of disallowed characters collapse into one underscore.
      out += '_';
      last_was_sub = true;
    }
  }
  if (out.size() > 180) out.resize(180);
  return out;
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string Trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::vector<std::string> SplitTrimmed(const std::string& s, char sep) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, sep)) {
    item = Trim(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string LocalStamp() {
  std::time_t now = std::time(nullptr);
  struct tm tm;
  if (localtime_r(&now, &tm) == nullptr) return "00000000-000000";
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d%02d%02d-%02d%02d%02d",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buf;
}

}  // namespace mediarelay::util
