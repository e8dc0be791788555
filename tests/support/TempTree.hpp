#pragma once
// Scratch directory under /tmp, removed on destruction, plus helpers that
// create files with a controlled size and mtime.

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

// Fixed epoch for file mtimes so stability decisions do not depend on the
// wall clock (2023-11-14T22:13:20Z).
inline constexpr int64_t kBaseMtimeMs = 1'700'000'000'000;

class TempTree {
public:
  explicit TempTree(const std::string& tag) {
    static std::atomic<int> counter{0};
    root_ = "/tmp/mediarelay_" + tag + "_" + std::to_string(getpid()) + "_" +
            std::to_string(counter.fetch_add(1));
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_, ec);
  }

  ~TempTree() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempTree(const TempTree&) = delete;
  TempTree& operator=(const TempTree&) = delete;

  const std::string& root() const { return root_; }

  std::string Path(const std::string& relative) const {
    return (std::filesystem::path(root_) / relative).string();
  }

  // Creates parents as needed; content is `size` bytes of 'x'.
  std::string Write(const std::string& relative, size_t size,
                    int64_t mtime_ms = kBaseMtimeMs) const {
    const std::string path = Path(relative);
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    {
      std::ofstream out(path, std::ios::binary | std::ios::trunc);
      out << std::string(size, 'x');
    }
    SetMtimeMs(path, mtime_ms);
    return path;
  }

  static void SetMtimeMs(const std::string& path, int64_t mtime_ms) {
    struct timespec times[2];
    times[0].tv_sec = static_cast<time_t>(mtime_ms / 1000);
    times[0].tv_nsec = static_cast<long>((mtime_ms % 1000) * 1'000'000);
    times[1] = times[0];
    utimensat(AT_FDCWD, path.c_str(), times, 0);
  }

  static bool Exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
  }

  static uint64_t SizeOf(const std::string& path) {
    std::error_code ec;
    auto n = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(n);
  }

private:
  std::string root_;
};
