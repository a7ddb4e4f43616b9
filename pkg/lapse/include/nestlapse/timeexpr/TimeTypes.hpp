// Repository: nestlapse
// Component: Time Expression Types
// Purpose: Timestamp, duration and inclusive interval shared by the parser,
//          the scheduler and artifact discovery.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_TIMEEXPR_TIME_TYPES_HPP_
#define NESTLAPSE_TIMEEXPR_TIME_TYPES_HPP_

#include <chrono>
#include <optional>
#include <string>

namespace nestlapse::timeexpr {

using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::system_clock::duration;

// Earliest representable instant; used as the open lower bound of an
// interval built without a start or a duration.
inline constexpr Timestamp kBeginningOfTime = Timestamp::min();

// Inclusive on both ends. start <= end always holds: the only way to build
// one is Make(), which refuses inverted bounds.
class TimeInterval {
 public:
  static std::optional<TimeInterval> Make(Timestamp start, Timestamp end) {
    if (end < start) return std::nullopt;
    return TimeInterval(start, end);
  }

  Timestamp start() const { return start_; }
  Timestamp end() const { return end_; }

  bool Contains(Timestamp t) const { return t >= start_ && t <= end_; }

  bool operator==(const TimeInterval& other) const {
    return start_ == other.start_ && end_ == other.end_;
  }

 private:
  TimeInterval(Timestamp start, Timestamp end) : start_(start), end_(end) {}

  Timestamp start_;
  Timestamp end_;
};

// Local-time rendering ("2024-03-20 14:30:00"), or "-inf" for
// kBeginningOfTime. Diagnostics only.
std::string FormatTimestamp(Timestamp t);

}  // namespace nestlapse::timeexpr

#endif  // NESTLAPSE_TIMEEXPR_TIME_TYPES_HPP_
