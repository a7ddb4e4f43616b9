// Repository: nestlapse
// Component: Timelapse Pipeline Implementation
// Copyright (c) 2025 nestlapse

#include "nestlapse/pipeline/TimelapsePipeline.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include "nestlapse/timeexpr/TimeExpression.hpp"
#include "nestlapse/timeline/ArtifactScanner.hpp"
#include "nestlapse/timeline/ConcatScript.hpp"
#include "nestlapse/util/Logger.hpp"

namespace nestlapse::pipeline {

using nestlapse::util::Logger;

namespace {

TimelapseRunResult Fail(PipelineError error, const std::string& detail) {
  Logger::Error(std::string("[TimelapsePipeline] ") + PipelineErrorToString(error) + " " +
                detail);
  return TimelapseRunResult::Failure(error, detail);
}

}  // namespace

TimelapsePipeline::TimelapsePipeline(EncoderFactory encoders, const timing::ITimeSource& clock)
    : encoders_(std::move(encoders)), clock_(clock) {}

TimelapseRunResult TimelapsePipeline::Run(const TimelapseRequest& request) const {
  // Arguments
  const timeexpr::SpeedupParseResult speedup = timeexpr::ParseSpeedup(request.speedup);
  if (!speedup.valid) {
    return Fail(PipelineError::kInvalidArgument, "speedup: " + speedup.detail);
  }
  const timeexpr::TimestampParseResult start = timeexpr::ParseTimestamp(request.start_time, clock_);
  if (!start.valid) {
    return Fail(PipelineError::kInvalidArgument, "start time: " + start.detail);
  }
  const timeexpr::TimestampParseResult end = timeexpr::ParseTimestamp(request.end_time, clock_);
  if (!end.valid) {
    return Fail(PipelineError::kInvalidArgument, "end time: " + end.detail);
  }
  const timeexpr::DurationParseResult duration = timeexpr::ParseDuration(request.duration);
  if (!duration.valid) {
    return Fail(PipelineError::kInvalidArgument, "duration: " + duration.detail);
  }
  const encode::CropParseResult crop_x = encode::ParseCropRange(request.crop_x, "crop-x");
  if (!crop_x.valid) {
    return Fail(PipelineError::kInvalidArgument, crop_x.detail);
  }
  const encode::CropParseResult crop_y = encode::ParseCropRange(request.crop_y, "crop-y");
  if (!crop_y.valid) {
    return Fail(PipelineError::kInvalidArgument, crop_y.detail);
  }

  const timeexpr::IntervalResult interval =
      timeexpr::MakeInterval(start.value, end.value, duration.value, clock_);
  if (!interval.valid) {
    return Fail(PipelineError::kInvalidArgument,
                std::string("time range: ") + timeexpr::TimeExprErrorToString(interval.error) +
                    ": " + interval.detail);
  }

  // Discovery
  const timeline::ArtifactScanner scanner(request.naming);
  timeline::ScanResult scan = scanner.Scan(request.input_dir);
  if (!scan.valid) {
    return Fail(PipelineError::kScanFailed, scan.detail);
  }
  const size_t discovered = scan.artifacts.size();

  // Schedule
  const timeline::FrameTimelineScheduler scheduler(request.scheduler);
  timeline::ScheduleResult scheduled =
      scheduler.Build(std::move(scan.artifacts), speedup.ratio, interval.interval);
  if (!scheduled.valid) {
    return Fail(PipelineError::kScheduleFailed,
                std::string(timeline::ScheduleErrorToString(scheduled.error)) + ": " +
                    scheduled.detail);
  }

  std::ostringstream oss;
  oss << "[TimelapsePipeline] SCHEDULED dir=" << request.input_dir
      << " discovered=" << discovered << " frames=" << scheduled.frames.size()
      << " ratio=" << speedup.ratio << " start="
      << timeexpr::FormatTimestamp(interval.interval->start())
      << " end=" << timeexpr::FormatTimestamp(interval.interval->end());
  Logger::Info(oss.str());

  TimelapseRunResult result{true,      PipelineError::kNone, "", interval.interval,
                            speedup.ratio, discovered,         {}, ""};

  if (!request.script_path.empty()) {
    std::ofstream script(request.script_path, std::ios::trunc);
    script << timeline::ConcatScript::Render(scheduled.frames);
    script.close();
    if (!script) {
      return Fail(PipelineError::kScriptWriteFailed, "writing " + request.script_path);
    }
    Logger::Info("[TimelapsePipeline] SCRIPT path=" + request.script_path);
  }

  if (request.dry_run) {
    result.schedule = std::move(scheduled.frames);
    return result;
  }

  encode::TimelapseEncodeConfig config;
  config.output_path = request.output_path;
  config.overwrite = request.overwrite;
  config.crop_x = crop_x.range;
  config.crop_y = crop_y.range;

  std::unique_ptr<encode::ITimelineEncoder> encoder = encoders_(config);
  if (!encoder) {
    return Fail(PipelineError::kEncodeFailed, "no timelapse encoder available");
  }
  const encode::EncodeResult encoded = encoder->Encode(scheduled.frames);
  if (!encoded.valid) {
    return Fail(PipelineError::kEncodeFailed,
                std::string(encode::EncodeErrorToString(encoded.error)) + ": " + encoded.detail);
  }

  result.schedule = std::move(scheduled.frames);
  result.output_path = encoded.output_path;
  return result;
}

}  // namespace nestlapse::pipeline
