// Repository: nestlapse
// Component: Wall-Clock Source Interface
// Purpose: Decouple "now" from interval math so trailing windows are testable.
//          Production: SystemTimeSource reads system_clock.
//          Tests: FixedTimeSource (settable, advanceable).
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_TIMING_ITIME_SOURCE_HPP_
#define NESTLAPSE_TIMING_ITIME_SOURCE_HPP_

#include <chrono>

namespace nestlapse::timing {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual std::chrono::system_clock::time_point Now() const = 0;
};

class SystemTimeSource : public ITimeSource {
 public:
  std::chrono::system_clock::time_point Now() const override {
    return std::chrono::system_clock::now();
  }
};

}  // namespace nestlapse::timing

#endif  // NESTLAPSE_TIMING_ITIME_SOURCE_HPP_
