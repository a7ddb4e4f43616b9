// Repository: nestlapse
// Component: Timeline Types
// Purpose: Artifacts discovered on disk and the frames scheduled from them.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_TIMELINE_TIMELINE_TYPES_HPP_
#define NESTLAPSE_TIMELINE_TIMELINE_TYPES_HPP_

#include <chrono>
#include <string>
#include <vector>

#include "nestlapse/timeexpr/TimeTypes.hpp"

namespace nestlapse::timeline {

// A still capture with a recoverable capture time. Immutable once discovered.
struct TimestampedArtifact {
  std::string identifier;  // file path
  timeexpr::Timestamp captured_at;
};

// Output seconds a frame stays on screen.
using DisplayDuration = std::chrono::duration<double>;

// display_duration == 0 marks the final frame of a schedule ("hold and
// terminate"); no other frame carries zero.
struct ScheduledFrame {
  TimestampedArtifact artifact;
  DisplayDuration display_duration{0.0};
};

using Schedule = std::vector<ScheduledFrame>;

}  // namespace nestlapse::timeline

#endif  // NESTLAPSE_TIMELINE_TIMELINE_TYPES_HPP_
