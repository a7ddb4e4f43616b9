// Repository: nestlapse
// Component: Frame Timeline Scheduler Implementation
// Copyright (c) 2025 nestlapse

#include "nestlapse/timeline/FrameTimelineScheduler.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "nestlapse/util/Logger.hpp"

namespace nestlapse::timeline {

using nestlapse::util::Logger;

const char* ScheduleErrorToString(ScheduleError error) {
  switch (error) {
    case ScheduleError::kNone:
      return "NONE";
    case ScheduleError::kNoArtifacts:
      return "NO_ARTIFACTS";
    case ScheduleError::kInvalidRatio:
      return "INVALID_RATIO";
    case ScheduleError::kInvalidFrameRate:
      return "INVALID_FRAME_RATE";
  }
  return "UNKNOWN";
}

FrameTimelineScheduler::FrameTimelineScheduler(SchedulerConfig config)
    : config_(config) {}

ScheduleResult FrameTimelineScheduler::Build(
    std::vector<TimestampedArtifact> artifacts,
    double ratio,
    const std::optional<timeexpr::TimeInterval>& interval) const {
  if (!(ratio > 0.0) || !std::isfinite(ratio)) {
    std::ostringstream detail;
    detail << "speedup ratio must be positive, got " << ratio;
    return ScheduleResult::Failure(ScheduleError::kInvalidRatio, detail.str());
  }
  if (!(config_.max_output_rate > 0.0) || !std::isfinite(config_.max_output_rate)) {
    std::ostringstream detail;
    detail << "max output rate must be positive, got " << config_.max_output_rate;
    return ScheduleResult::Failure(ScheduleError::kInvalidFrameRate, detail.str());
  }

  const size_t discovered = artifacts.size();
  if (interval) {
    artifacts.erase(
        std::remove_if(artifacts.begin(), artifacts.end(),
                       [&interval](const TimestampedArtifact& a) {
                         return !interval->Contains(a.captured_at);
                       }),
        artifacts.end());
  }

  if (artifacts.empty()) {
    std::ostringstream detail;
    if (interval) {
      detail << "no artifacts within [" << timeexpr::FormatTimestamp(interval->start())
             << ", " << timeexpr::FormatTimestamp(interval->end()) << "] ("
             << discovered << " discovered)";
    } else {
      detail << "no artifacts to schedule";
    }
    return ScheduleResult::Failure(ScheduleError::kNoArtifacts, detail.str());
  }

  std::stable_sort(artifacts.begin(), artifacts.end(),
                   [](const TimestampedArtifact& a, const TimestampedArtifact& b) {
                     return a.captured_at < b.captured_at;
                   });

  const DisplayDuration min_duration(1.0 / config_.max_output_rate);

  Schedule frames;
  size_t current = 0;
  for (size_t i = 1; i < artifacts.size(); ++i) {
    const DisplayDuration real_gap =
        artifacts[i].captured_at - artifacts[current].captured_at;
    const DisplayDuration gap = real_gap / ratio;

    // Would play faster than max_output_rate: fold into the pending frame.
    if (gap < min_duration) {
      continue;
    }

    frames.push_back(ScheduledFrame{artifacts[current], gap});
    current = i;
  }
  frames.push_back(ScheduledFrame{artifacts[current], DisplayDuration(0.0)});

  std::ostringstream oss;
  oss << "[FrameTimelineScheduler] SCHEDULED frames=" << frames.size()
      << " candidates=" << artifacts.size() << " discovered=" << discovered
      << " ratio=" << ratio << " max_rate=" << config_.max_output_rate;
  Logger::Debug(oss.str());

  return ScheduleResult::Success(std::move(frames));
}

}  // namespace nestlapse::timeline
