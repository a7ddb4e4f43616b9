// Repository: nestlapse
// Component: Artifact Scanner Implementation
// Copyright (c) 2025 nestlapse

#include "nestlapse/timeline/ArtifactScanner.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <utility>

#include "nestlapse/util/Logger.hpp"

namespace nestlapse::timeline {

namespace fs = std::filesystem;
using nestlapse::util::Logger;

const char* ScanErrorToString(ScanError error) {
  switch (error) {
    case ScanError::kNone:
      return "NONE";
    case ScanError::kInputMissing:
      return "INPUT_MISSING";
    case ScanError::kNotADirectory:
      return "NOT_A_DIRECTORY";
    case ScanError::kWalkFailed:
      return "WALK_FAILED";
  }
  return "UNKNOWN";
}

ArtifactScanner::ArtifactScanner(ArtifactNaming naming)
    : naming_(std::move(naming)) {}

ScanResult ArtifactScanner::Scan(const std::string& input_dir) const {
  std::error_code ec;
  const fs::path root(input_dir);

  const fs::file_status status = fs::status(root, ec);
  if (status.type() == fs::file_type::not_found) {
    return ScanResult::Failure(ScanError::kInputMissing,
                               "input directory does not exist: " + input_dir);
  }
  if (ec) {
    // Exists but cannot be examined, e.g. permission denied.
    return ScanResult::Failure(ScanError::kWalkFailed,
                               "checking " + input_dir + ": " + ec.message());
  }
  if (!fs::is_directory(status)) {
    return ScanResult::Failure(ScanError::kNotADirectory,
                               "input is not a directory: " + input_dir);
  }

  std::vector<std::string> paths;
  size_t skipped = 0;

  fs::recursive_directory_iterator it(root, ec);
  const fs::recursive_directory_iterator end;
  while (!ec && it != end) {
    const fs::directory_entry& entry = *it;
    std::error_code type_ec;
    if (entry.is_regular_file(type_ec)) {
      const std::string path = entry.path().string();
      if (naming_.ParseTimestamp(path)) {
        paths.push_back(path);
      } else {
        ++skipped;
        Logger::Debug("[ArtifactScanner] SKIP path=" + path);
      }
    }
    it.increment(ec);
  }
  if (ec) {
    return ScanResult::Failure(ScanError::kWalkFailed,
                               "walking " + input_dir + ": " + ec.message());
  }

  std::sort(paths.begin(), paths.end());

  ScanResult result{true, ScanError::kNone, "", {}, skipped};
  result.artifacts.reserve(paths.size());
  for (auto& path : paths) {
    // Already validated above; ParseTimestamp is deterministic.
    const auto ts = naming_.ParseTimestamp(path);
    result.artifacts.push_back(TimestampedArtifact{std::move(path), *ts});
  }

  std::ostringstream oss;
  oss << "[ArtifactScanner] SCANNED dir=" << input_dir
      << " artifacts=" << result.artifacts.size() << " skipped=" << skipped;
  Logger::Debug(oss.str());
  return result;
}

}  // namespace nestlapse::timeline
