// Repository: MediaRelay
// Component: File Walker
// Copyright (c) 2025 MediaRelay

#include "mediarelay/scan/FileWalker.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace mediarelay::scan {

std::string NormalizePath(const std::string& path) {
  std::error_code ec;
  fs::path abs = fs::absolute(fs::path(path), ec);
  if (ec) abs = fs::path(path);
  std::string out = abs.lexically_normal().string();
  // "/a/b/" normalizes to "/a/b/"; drop the trailing separator.
  while (out.size() > 1 && out.back() == '/') out.pop_back();
  return out;
}

void WalkFiles(const std::string& root, const std::string& excluded_dir,
               const std::function<void(const std::string& path)>& visit) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) return;

  const std::string excluded = excluded_dir.empty() ? std::string() : NormalizePath(excluded_dir);

  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  const fs::recursive_directory_iterator end;
  while (!ec && it != end) {
    const fs::path& p = it->path();
    const std::string name = p.filename().string();
    std::error_code entry_ec;
    const bool is_dir = it->is_directory(entry_ec);

    if (!name.empty() && name[0] == '.') {
      if (is_dir) it.disable_recursion_pending();
    } else if (is_dir) {
      if (!excluded.empty() && NormalizePath(p.string()) == excluded) {
        it.disable_recursion_pending();
      }
    } else if (it->is_regular_file(entry_ec)) {
      visit(p.string());
    }

    it.increment(ec);
  }
}

}  // namespace mediarelay::scan
