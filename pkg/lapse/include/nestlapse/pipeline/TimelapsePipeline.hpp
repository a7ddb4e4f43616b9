// Repository: nestlapse
// Component: Timelapse Pipeline
// Purpose: Textual request -> interval -> scan -> schedule -> (script) ->
//          encoded video.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_PIPELINE_TIMELAPSE_PIPELINE_HPP_
#define NESTLAPSE_PIPELINE_TIMELAPSE_PIPELINE_HPP_

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "nestlapse/encode/EncodeTypes.hpp"
#include "nestlapse/pipeline/PipelineTypes.hpp"
#include "nestlapse/timeexpr/TimeTypes.hpp"
#include "nestlapse/timeline/ArtifactNaming.hpp"
#include "nestlapse/timeline/FrameTimelineScheduler.hpp"
#include "nestlapse/timing/ITimeSource.hpp"

namespace nestlapse::pipeline {

// Raw user input; every field is parsed by Run().
struct TimelapseRequest {
  std::string input_dir = ".";
  std::string speedup = "1h/1s";
  std::string start_time;
  std::string end_time;
  std::string duration;
  std::string crop_x;
  std::string crop_y;
  std::string script_path;  // empty: no script written
  bool dry_run = false;     // schedule (and script) only

  std::string output_path = "timelapse.mp4";
  bool overwrite = false;

  timeline::SchedulerConfig scheduler;
  timeline::ArtifactNaming naming;
};

struct TimelapseRunResult {
  bool valid;
  PipelineError error;
  std::string detail;
  std::optional<timeexpr::TimeInterval> interval;
  double ratio = 0.0;
  size_t discovered = 0;
  timeline::Schedule schedule;
  std::string output_path;  // empty on dry run

  static TimelapseRunResult Failure(PipelineError err, const std::string& detail) {
    return {false, err, detail, std::nullopt, 0.0, 0, {}, ""};
  }
};

class TimelapsePipeline {
 public:
  using EncoderFactory = std::function<std::unique_ptr<encode::ITimelineEncoder>(
      const encode::TimelapseEncodeConfig& config)>;

  TimelapsePipeline(EncoderFactory encoders, const timing::ITimeSource& clock);

  TimelapseRunResult Run(const TimelapseRequest& request) const;

 private:
  EncoderFactory encoders_;
  const timing::ITimeSource& clock_;
};

}  // namespace nestlapse::pipeline

#endif  // NESTLAPSE_PIPELINE_TIMELAPSE_PIPELINE_HPP_
