// Repository: MediaRelay
// Component: Time Source
// Purpose: Injectable wall clock for age-based decisions (stability, naming).
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_TIMING_I_TIME_SOURCE_HPP_
#define MEDIARELAY_TIMING_I_TIME_SOURCE_HPP_

#include <chrono>
#include <cstdint>

namespace mediarelay::timing {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowUtcMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
  }
};

}  // namespace mediarelay::timing

#endif  // MEDIARELAY_TIMING_I_TIME_SOURCE_HPP_
