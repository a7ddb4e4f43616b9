// Repository: nestlapse
// Component: Artifact Naming
// Purpose: The <prefix><YYYYMMDD>_<HHMMSS>.<ext> convention shared by the
//          still-image writer and the timelapse scan.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_TIMELINE_ARTIFACT_NAMING_HPP_
#define NESTLAPSE_TIMELINE_ARTIFACT_NAMING_HPP_

#include <optional>
#include <string>

#include "nestlapse/timeexpr/TimeTypes.hpp"

namespace nestlapse::timeline {

// Timestamps in names are local time, second resolution.
struct ArtifactNaming {
  std::string prefix = "nest_camera_frame_";
  std::string extension = "jpg";  // without the dot

  // "nest_camera_frame_20240320_143000.jpg"
  std::string FileNameFor(timeexpr::Timestamp t) const;

  // "<output_dir>/2024/03/20/nest_camera_frame_20240320_143000.jpg"
  std::string DatedPathFor(const std::string& output_dir, timeexpr::Timestamp t) const;

  // Recovers the capture time from the base name of |path|. Returns nullopt
  // unless the name matches the convention exactly (extension compared
  // case-insensitively, calendar fields validated).
  std::optional<timeexpr::Timestamp> ParseTimestamp(const std::string& path) const;
};

}  // namespace nestlapse::timeline

#endif  // NESTLAPSE_TIMELINE_ARTIFACT_NAMING_HPP_
