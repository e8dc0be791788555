// Repository: MediaRelay
// Component: File Walker
// Purpose: Recursive traversal shared by the readiness scanner and the
//          partial-file sweep.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_SCAN_FILE_WALKER_HPP_
#define MEDIARELAY_SCAN_FILE_WALKER_HPP_

#include <functional>
#include <string>

namespace mediarelay::scan {

// Calls visit(path) for every regular file under root. Hidden entries (name
// starting with '.') are skipped, and so is the subtree at excluded_dir when
// it is non-empty. Entries that vanish or cannot be read are skipped
// silently; a missing root visits nothing.
void WalkFiles(const std::string& root, const std::string& excluded_dir,
               const std::function<void(const std::string& path)>& visit);

// Absolute, lexically normalized form of path (no filesystem access beyond
// the current directory).
std::string NormalizePath(const std::string& path);

}  // namespace mediarelay::scan

#endif  // MEDIARELAY_SCAN_FILE_WALKER_HPP_
