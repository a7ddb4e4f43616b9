// Repository: nestlapse
// Component: Time Expression Parser Implementation
// Copyright (c) 2025 nestlapse

#include "nestlapse/timeexpr/TimeExpression.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>

namespace nestlapse::timeexpr {

namespace {

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

bool IsAlnum(char c) {
  return IsDigit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// Separator characters between the date and the time-of-day.
bool IsSeparator(char c) { return !IsAlnum(c) && c != ':' && c != '-'; }

bool AllDigits(const std::string& s, size_t pos, size_t len) {
  if (pos + len > s.size()) return false;
  for (size_t i = pos; i < pos + len; ++i) {
    if (!IsDigit(s[i])) return false;
  }
  return true;
}

int ToInt(const std::string& s, size_t pos, size_t len) {
  int v = 0;
  for (size_t i = pos; i < pos + len; ++i) {
    v = v * 10 + (s[i] - '0');
  }
  return v;
}

bool IsLeapYear(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int DaysInMonth(int y, int m) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2 && IsLeapYear(y)) return 29;
  return kDays[m - 1];
}

struct CivilDate {
  int year;
  int month;
  int day;
};

struct ClockTime {
  int hour;
  int minute;
};

// YYYY-MM-DD, fixed widths, calendar-checked.
std::optional<CivilDate> ParseDate(const std::string& s) {
  if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
  if (!AllDigits(s, 0, 4) || !AllDigits(s, 5, 2) || !AllDigits(s, 8, 2)) {
    return std::nullopt;
  }
  CivilDate d{ToInt(s, 0, 4), ToInt(s, 5, 2), ToInt(s, 8, 2)};
  if (d.month < 1 || d.month > 12) return std::nullopt;
  if (d.day < 1 || d.day > DaysInMonth(d.year, d.month)) return std::nullopt;
  return d;
}

// H:MM or HH:MM. A third ":SS" component is rejected.
std::optional<ClockTime> ParseClock(const std::string& s) {
  const size_t colon = s.find(':');
  if (colon == std::string::npos || colon == 0 || colon > 2) return std::nullopt;
  if (s.size() != colon + 3) return std::nullopt;
  if (!AllDigits(s, 0, colon) || !AllDigits(s, colon + 1, 2)) return std::nullopt;
  ClockTime t{ToInt(s, 0, colon), ToInt(s, colon + 1, 2)};
  if (t.hour > 23 || t.minute > 59) return std::nullopt;
  return t;
}

Timestamp LocalToTimestamp(int year, int month, int day, int hour, int minute) {
  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = 0;
  tm.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

CivilDate LocalDateOf(Timestamp t) {
  const std::time_t tt = std::chrono::system_clock::to_time_t(t);
  std::tm tm{};
  localtime_r(&tt, &tm);
  return {tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

std::vector<std::string> SplitOnSeparators(const std::string& text) {
  std::vector<std::string> parts;
  std::string current;
  for (char c : text) {
    if (IsSeparator(c)) {
      if (!current.empty()) {
        parts.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty()) parts.push_back(current);
  return parts;
}

// Sums <integer><unit> terms into seconds. Units: w d h m, plus s when
// |allow_seconds|. Returns false with |error| describing the first problem.
bool ParseCompoundSeconds(const std::string& text, bool allow_seconds,
                          int64_t* total_seconds, std::string* error) {
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  int64_t total = 0;
  int64_t quantity = 0;
  std::string digits;

  for (char c : text) {
    if (IsDigit(c)) {
      if (quantity > (kMax - (c - '0')) / 10) {
        *error = "quantity too large in duration: " + digits + c;
        return false;
      }
      quantity = quantity * 10 + (c - '0');
      digits.push_back(c);
      continue;
    }

    int64_t unit_seconds = 0;
    switch (c) {
      case 'w': unit_seconds = 7 * 24 * 3600; break;
      case 'd': unit_seconds = 24 * 3600; break;
      case 'h': unit_seconds = 3600; break;
      case 'm': unit_seconds = 60; break;
      case 's':
        if (allow_seconds) unit_seconds = 1;
        break;
      default:
        break;
    }
    if (unit_seconds == 0) {
      std::ostringstream oss;
      oss << "invalid character in duration: '" << c << "' (must be digits or units "
          << (allow_seconds ? "w,d,h,m,s" : "w,d,h,m") << ")";
      *error = oss.str();
      return false;
    }
    if (digits.empty()) {
      *error = std::string("unit '") + c + "' without a quantity";
      return false;
    }
    if (quantity > kMax / unit_seconds || total > kMax - quantity * unit_seconds) {
      *error = "duration too large: " + text;
      return false;
    }
    total += quantity * unit_seconds;
    quantity = 0;
    digits.clear();
  }

  if (!digits.empty()) {
    *error = "incomplete duration: missing unit after " + digits;
    return false;
  }
  *total_seconds = total;
  return true;
}

}  // namespace

const char* TimeExprErrorToString(TimeExprError error) {
  switch (error) {
    case TimeExprError::kNone:
      return "NONE";
    case TimeExprError::kMalformedTimestamp:
      return "MALFORMED_TIMESTAMP";
    case TimeExprError::kMalformedDuration:
      return "MALFORMED_DURATION";
    case TimeExprError::kMalformedSpeedup:
      return "MALFORMED_SPEEDUP";
    case TimeExprError::kOverdeterminedInterval:
      return "OVERDETERMINED_INTERVAL";
    case TimeExprError::kInvertedInterval:
      return "INVERTED_INTERVAL";
    case TimeExprError::kIntervalOutOfRange:
      return "INTERVAL_OUT_OF_RANGE";
  }
  return "UNKNOWN";
}

std::string FormatTimestamp(Timestamp t) {
  if (t == kBeginningOfTime) return "-inf";
  const std::time_t tt = std::chrono::system_clock::to_time_t(t);
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

TimestampParseResult ParseTimestamp(const std::string& text,
                                    const timing::ITimeSource& clock) {
  if (text.empty()) {
    return TimestampParseResult::Success(std::nullopt);
  }

  // Time of day only, anchored to today's local date.
  if (text.find(':') != std::string::npos && text.find('-') == std::string::npos) {
    auto t = ParseClock(text);
    if (!t) {
      return TimestampParseResult::Failure("invalid time format: " + text +
                                           " (must be HH:MM)");
    }
    const CivilDate today = LocalDateOf(clock.Now());
    return TimestampParseResult::Success(
        LocalToTimestamp(today.year, today.month, today.day, t->hour, t->minute));
  }

  const std::vector<std::string> parts = SplitOnSeparators(text);
  if (parts.empty()) {
    return TimestampParseResult::Failure("invalid time value: '" + text +
                                         "' is empty after splitting");
  }

  if (parts.size() == 1) {
    auto d = ParseDate(parts[0]);
    if (!d) {
      return TimestampParseResult::Failure("invalid date format: " + parts[0] +
                                           " (must be YYYY-MM-DD)");
    }
    return TimestampParseResult::Success(
        LocalToTimestamp(d->year, d->month, d->day, 0, 0));
  }

  if (parts.size() == 2) {
    auto d = ParseDate(parts[0]);
    if (!d) {
      return TimestampParseResult::Failure("invalid date format: " + parts[0] +
                                           " (must be YYYY-MM-DD)");
    }
    auto t = ParseClock(parts[1]);
    if (!t) {
      return TimestampParseResult::Failure("invalid time format: " + parts[1] +
                                           " (must be HH:MM)");
    }
    return TimestampParseResult::Success(
        LocalToTimestamp(d->year, d->month, d->day, t->hour, t->minute));
  }

  return TimestampParseResult::Failure(
      "invalid time value: '" + text +
      "' (must be 'HH:MM', 'YYYY-MM-DD', or 'YYYY-MM-DD HH:MM')");
}

TimestampParseResult ParseTimestamp(const std::string& text) {
  timing::SystemTimeSource clock;
  return ParseTimestamp(text, clock);
}

DurationParseResult ParseDuration(const std::string& text) {
  if (text.empty()) {
    return DurationParseResult::Success(std::nullopt);
  }

  int64_t seconds = 0;
  std::string error;
  if (!ParseCompoundSeconds(text, /*allow_seconds=*/false, &seconds, &error)) {
    return DurationParseResult::Failure(error);
  }

  // Duration is nanoseconds on common libraries; reject what cannot fit.
  const int64_t max_seconds =
      std::chrono::duration_cast<std::chrono::seconds>(Duration::max()).count();
  if (seconds > max_seconds) {
    return DurationParseResult::Failure("duration too large: " + text);
  }
  return DurationParseResult::Success(
      std::chrono::duration_cast<Duration>(std::chrono::seconds(seconds)));
}

SpeedupParseResult ParseSpeedup(const std::string& text) {
  if (text.empty()) {
    return SpeedupParseResult::Failure("empty speedup ratio");
  }

  const size_t slash = text.find('/');
  if (slash == std::string::npos) {
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == text.c_str() || *end != '\0' || !std::isfinite(value)) {
      return SpeedupParseResult::Failure("invalid speedup ratio: " + text +
                                         " (e.g. '1h/1s' or '3600')");
    }
    if (value <= 0.0) {
      return SpeedupParseResult::Failure("speedup ratio must be positive: " + text);
    }
    return SpeedupParseResult::Success(value);
  }

  const std::string real_text = text.substr(0, slash);
  const std::string output_text = text.substr(slash + 1);
  if (real_text.empty() || output_text.empty()) {
    return SpeedupParseResult::Failure("speedup ratio needs both sides: " + text);
  }

  int64_t real_seconds = 0;
  int64_t output_seconds = 0;
  std::string error;
  if (!ParseCompoundSeconds(real_text, /*allow_seconds=*/true, &real_seconds, &error)) {
    return SpeedupParseResult::Failure("invalid real-time side of '" + text + "': " + error);
  }
  if (!ParseCompoundSeconds(output_text, /*allow_seconds=*/true, &output_seconds, &error)) {
    return SpeedupParseResult::Failure("invalid output side of '" + text + "': " + error);
  }
  if (real_seconds <= 0 || output_seconds <= 0) {
    return SpeedupParseResult::Failure("speedup ratio sides must be non-zero: " + text);
  }
  return SpeedupParseResult::Success(static_cast<double>(real_seconds) /
                                     static_cast<double>(output_seconds));
}

namespace {

IntervalResult OutOfRange(const char* bound, Timestamp anchor, const char* op,
                          Duration duration) {
  std::ostringstream oss;
  oss << bound << " out of range: " << FormatTimestamp(anchor) << " " << op << " "
      << std::chrono::duration_cast<std::chrono::hours>(duration).count()
      << "h is not representable";
  return IntervalResult::Failure(TimeExprError::kIntervalOutOfRange, oss.str());
}

}  // namespace

IntervalResult MakeInterval(std::optional<Timestamp> start,
                            std::optional<Timestamp> end,
                            std::optional<Duration> duration,
                            const timing::ITimeSource& clock) {
  if (start && end) {
    if (duration) {
      return IntervalResult::Failure(
          TimeExprError::kOverdeterminedInterval,
          "cannot provide duration when both start and end times are specified");
    }
    auto interval = TimeInterval::Make(*start, *end);
    if (!interval) {
      return IntervalResult::Failure(
          TimeExprError::kInvertedInterval,
          "end time " + FormatTimestamp(*end) + " is before start time " +
              FormatTimestamp(*start));
    }
    return IntervalResult::Success(*interval);
  }

  Timestamp lo;
  Timestamp hi;
  if (duration) {
    // Durations are never negative, so these bound checks cannot overflow.
    if (start) {
      if (*start > Timestamp::max() - *duration) {
        return OutOfRange("end time", *start, "+", *duration);
      }
      lo = *start;
      hi = *start + *duration;
    } else {
      const Timestamp anchor = end ? *end : clock.Now();
      if (anchor < Timestamp::min() + *duration) {
        return OutOfRange("start time", anchor, "-", *duration);
      }
      lo = anchor - *duration;
      hi = anchor;
    }
  } else {
    lo = start ? *start : kBeginningOfTime;
    hi = end ? *end : clock.Now();
  }

  auto interval = TimeInterval::Make(lo, hi);
  if (!interval) {
    return IntervalResult::Failure(
        TimeExprError::kInvertedInterval,
        "end time " + FormatTimestamp(hi) + " is before start time " +
            FormatTimestamp(lo));
  }
  return IntervalResult::Success(*interval);
}

IntervalResult MakeInterval(std::optional<Timestamp> start,
                            std::optional<Timestamp> end,
                            std::optional<Duration> duration) {
  timing::SystemTimeSource clock;
  return MakeInterval(start, end, duration, clock);
}

}  // namespace nestlapse::timeexpr
