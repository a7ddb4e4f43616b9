// Repository: nestlapse
// Component: Artifact Scanner
// Purpose: Recursive directory walk producing TimestampedArtifacts.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_TIMELINE_ARTIFACT_SCANNER_HPP_
#define NESTLAPSE_TIMELINE_ARTIFACT_SCANNER_HPP_

#include <cstddef>
#include <string>
#include <vector>

#include "nestlapse/timeline/ArtifactNaming.hpp"
#include "nestlapse/timeline/TimelineTypes.hpp"

namespace nestlapse::timeline {

enum class ScanError {
  kNone = 0,
  kInputMissing,
  kNotADirectory,
  kWalkFailed,
};

const char* ScanErrorToString(ScanError error);

struct ScanResult {
  bool valid;
  ScanError error;
  std::string detail;
  std::vector<TimestampedArtifact> artifacts;  // lexicographic path order
  size_t skipped = 0;  // regular files that did not match the naming

  static ScanResult Failure(ScanError err, const std::string& detail) {
    return {false, err, detail, {}, 0};
  }
};

// Files whose names do not carry a timestamp are skipped, not errors. An
// empty result is still valid; the scheduler reports the empty set.
class ArtifactScanner {
 public:
  explicit ArtifactScanner(ArtifactNaming naming = ArtifactNaming());

  ScanResult Scan(const std::string& input_dir) const;

 private:
  ArtifactNaming naming_;
};

}  // namespace nestlapse::timeline

#endif  // NESTLAPSE_TIMELINE_ARTIFACT_SCANNER_HPP_
