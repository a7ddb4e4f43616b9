// Repository: nestlapse
// Component: Frame Timeline Scheduler
// Purpose: Turn timestamped captures + speedup ratio into a variable-duration
//          playback schedule with an output frame-rate ceiling.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_TIMELINE_FRAME_TIMELINE_SCHEDULER_HPP_
#define NESTLAPSE_TIMELINE_FRAME_TIMELINE_SCHEDULER_HPP_

#include <optional>
#include <string>
#include <vector>

#include "nestlapse/timeexpr/TimeTypes.hpp"
#include "nestlapse/timeline/TimelineTypes.hpp"

namespace nestlapse::timeline {

enum class ScheduleError {
  kNone = 0,

  // Nothing left after interval filtering (or nothing discovered)
  kNoArtifacts,

  // Speedup ratio not a positive finite number
  kInvalidRatio,

  // Max output rate not a positive finite number
  kInvalidFrameRate,
};

const char* ScheduleErrorToString(ScheduleError error);

struct SchedulerConfig {
  double max_output_rate = 60.0;  // frames per second
};

struct ScheduleResult {
  bool valid;
  ScheduleError error;
  std::string detail;
  Schedule frames;  // empty unless valid

  static ScheduleResult Success(Schedule f) {
    return {true, ScheduleError::kNone, "", std::move(f)};
  }
  static ScheduleResult Failure(ScheduleError err, const std::string& detail) {
    return {false, err, detail, {}};
  }
};

// Single forward pass with a pending "current" artifact:
//   gap = (next.captured_at - current.captured_at) / ratio
//   gap <  1/max_output_rate  -> next is merged into current's frame
//   gap >= 1/max_output_rate  -> emit {current, gap}, current = next
// then a final {current, 0}.
//
// Guarantees on success: artifacts strictly increasing in captured_at, every
// non-final duration >= 1/max_output_rate, last duration == 0, and
// 1 <= size <= filtered artifact count.
//
// Pure; safe to call concurrently on independent inputs.
class FrameTimelineScheduler {
 public:
  explicit FrameTimelineScheduler(SchedulerConfig config = SchedulerConfig());

  // |ratio| is realSeconds / outputSeconds. When |interval| is set, artifacts
  // outside it (inclusive bounds) are discarded first. Equal capture times
  // keep their input order.
  ScheduleResult Build(std::vector<TimestampedArtifact> artifacts,
                       double ratio,
                       const std::optional<timeexpr::TimeInterval>& interval) const;

  const SchedulerConfig& config() const { return config_; }

 private:
  SchedulerConfig config_;
};

}  // namespace nestlapse::timeline

#endif  // NESTLAPSE_TIMELINE_FRAME_TIMELINE_SCHEDULER_HPP_
