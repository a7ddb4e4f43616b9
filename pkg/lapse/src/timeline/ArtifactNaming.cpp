// Repository: nestlapse
// Component: Artifact Naming Implementation
// Copyright (c) 2025 nestlapse

#include "nestlapse/timeline/ArtifactNaming.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace nestlapse::timeline {

namespace {

std::tm ToLocal(timeexpr::Timestamp t) {
  const std::time_t tt = std::chrono::system_clock::to_time_t(t);
  std::tm tm{};
  localtime_r(&tt, &tm);
  return tm;
}

bool AllDigits(const std::string& s, size_t pos, size_t len) {
  if (pos + len > s.size()) return false;
  for (size_t i = pos; i < pos + len; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
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

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

int DaysInMonth(int year, int month) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2) {
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return leap ? 29 : 28;
  }
  return kDays[month - 1];
}

}  // namespace

std::string ArtifactNaming::FileNameFor(timeexpr::Timestamp t) const {
  const std::tm tm = ToLocal(t);
  std::ostringstream oss;
  oss << prefix << std::put_time(&tm, "%Y%m%d_%H%M%S") << "." << extension;
  return oss.str();
}

std::string ArtifactNaming::DatedPathFor(const std::string& output_dir,
                                         timeexpr::Timestamp t) const {
  const std::tm tm = ToLocal(t);
  std::ostringstream year, month, day;
  year << std::put_time(&tm, "%Y");
  month << std::put_time(&tm, "%m");
  day << std::put_time(&tm, "%d");
  const std::filesystem::path path = std::filesystem::path(output_dir) /
                                     year.str() / month.str() / day.str() /
                                     FileNameFor(t);
  return path.string();
}

std::optional<timeexpr::Timestamp> ArtifactNaming::ParseTimestamp(
    const std::string& path) const {
  const std::string name = std::filesystem::path(path).filename().string();

  // <prefix>YYYYMMDD_HHMMSS.<ext>
  const size_t stamp_len = 15;
  if (name.size() != prefix.size() + stamp_len + 1 + extension.size()) {
    return std::nullopt;
  }
  if (name.compare(0, prefix.size(), prefix) != 0) return std::nullopt;

  const size_t p = prefix.size();
  if (!AllDigits(name, p, 8) || name[p + 8] != '_' || !AllDigits(name, p + 9, 6)) {
    return std::nullopt;
  }
  if (name[p + stamp_len] != '.') return std::nullopt;
  if (!EqualsIgnoreCase(name.substr(p + stamp_len + 1), extension)) {
    return std::nullopt;
  }

  const int year = ToInt(name, p, 4);
  const int month = ToInt(name, p + 4, 2);
  const int day = ToInt(name, p + 6, 2);
  const int hour = ToInt(name, p + 9, 2);
  const int minute = ToInt(name, p + 11, 2);
  const int second = ToInt(name, p + 13, 2);
  if (year < 1900 || month < 1 || month > 12) return std::nullopt;
  if (day < 1 || day > DaysInMonth(year, month)) return std::nullopt;
  if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  tm.tm_isdst = -1;
  const std::time_t tt = std::mktime(&tm);
  if (tt == static_cast<std::time_t>(-1)) return std::nullopt;
  return std::chrono::system_clock::from_time_t(tt);
}

}  // namespace nestlapse::timeline
