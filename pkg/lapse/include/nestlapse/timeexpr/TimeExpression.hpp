// Repository: nestlapse
// Component: Time Expression Parser
// Purpose: Parse user-facing timestamps, compound durations and speedup
//          ratios, and combine start/end/duration into an interval.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_TIMEEXPR_TIME_EXPRESSION_HPP_
#define NESTLAPSE_TIMEEXPR_TIME_EXPRESSION_HPP_

#include <optional>
#include <string>

#include "nestlapse/timeexpr/TimeTypes.hpp"
#include "nestlapse/timing/ITimeSource.hpp"

namespace nestlapse::timeexpr {

enum class TimeExprError {
  kNone = 0,

  // Text is not HH:MM, YYYY-MM-DD or YYYY-MM-DD<sep>HH:MM
  kMalformedTimestamp,

  // Not a concatenation of <integer><w|d|h|m> terms
  kMalformedDuration,

  // Not <duration>/<duration> or a positive number
  kMalformedSpeedup,

  // start, end and duration all given
  kOverdeterminedInterval,

  // end precedes start
  kInvertedInterval,

  // start + dur or end - dur falls outside the representable time range
  kIntervalOutOfRange,
};

const char* TimeExprErrorToString(TimeExprError error);

// Empty input is valid and yields no value ("not given"), which is distinct
// from a zero value.
struct TimestampParseResult {
  bool valid;
  TimeExprError error;
  std::string detail;
  std::optional<Timestamp> value;

  static TimestampParseResult Success(std::optional<Timestamp> v) {
    return {true, TimeExprError::kNone, "", v};
  }
  static TimestampParseResult Failure(const std::string& detail) {
    return {false, TimeExprError::kMalformedTimestamp, detail, std::nullopt};
  }
};

struct DurationParseResult {
  bool valid;
  TimeExprError error;
  std::string detail;
  std::optional<Duration> value;

  static DurationParseResult Success(std::optional<Duration> v) {
    return {true, TimeExprError::kNone, "", v};
  }
  static DurationParseResult Failure(const std::string& detail) {
    return {false, TimeExprError::kMalformedDuration, detail, std::nullopt};
  }
};

struct SpeedupParseResult {
  bool valid;
  TimeExprError error;
  std::string detail;
  double ratio;  // realSeconds / outputSeconds, > 0 when valid

  static SpeedupParseResult Success(double r) {
    return {true, TimeExprError::kNone, "", r};
  }
  static SpeedupParseResult Failure(const std::string& detail) {
    return {false, TimeExprError::kMalformedSpeedup, detail, 0.0};
  }
};

struct IntervalResult {
  bool valid;
  TimeExprError error;
  std::string detail;
  std::optional<TimeInterval> interval;  // set iff valid

  static IntervalResult Success(TimeInterval i) {
    return {true, TimeExprError::kNone, "", i};
  }
  static IntervalResult Failure(TimeExprError err, const std::string& detail) {
    return {false, err, detail, std::nullopt};
  }
};

// Accepts, in local time:
//   "HH:MM"              today's date, seconds 0
//   "YYYY-MM-DD"         start of that day
//   "YYYY-MM-DD<sep>HH:MM"
// where <sep> is any run of characters other than letters, digits, ':' and
// '-'. A seconds component is never accepted.
TimestampParseResult ParseTimestamp(const std::string& text,
                                    const timing::ITimeSource& clock);
TimestampParseResult ParseTimestamp(const std::string& text);

// "2w3d6h30m" style; terms are summed, repeated units simply add.
DurationParseResult ParseDuration(const std::string& text);

// "1h/1s" (3600), "1d/30s" (2880), or a bare positive number ("3600", "2.5").
// Both halves of the ratio form also accept the unit 's'.
SpeedupParseResult ParseSpeedup(const std::string& text);

// Combines the three optional inputs into an inclusive interval:
//
//   start end dur | result
//   ------------- | ---------------------------------------------
//     y    y   y  | kOverdeterminedInterval
//     y    y   n  | [start, end]; kInvertedInterval if end < start
//     y    n   y  | [start, start + dur]
//     n    y   y  | [end - dur, end]
//     n    n   y  | [now - dur, now]
//     y    n   n  | [start, now]; kInvertedInterval if now < start
//     n    y   n  | [kBeginningOfTime, end]
//     n    n   n  | [kBeginningOfTime, now]
//
// A computed bound that would leave the representable range fails with
// kIntervalOutOfRange.
// "now" is read from |clock| on every call; nothing is cached.
IntervalResult MakeInterval(std::optional<Timestamp> start,
                            std::optional<Timestamp> end,
                            std::optional<Duration> duration,
                            const timing::ITimeSource& clock);
IntervalResult MakeInterval(std::optional<Timestamp> start,
                            std::optional<Timestamp> end,
                            std::optional<Duration> duration);

}  // namespace nestlapse::timeexpr

#endif  // NESTLAPSE_TIMEEXPR_TIME_EXPRESSION_HPP_
