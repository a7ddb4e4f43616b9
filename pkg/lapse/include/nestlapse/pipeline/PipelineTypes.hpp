// Repository: nestlapse
// Component: Pipeline Types
// Purpose: Stage-level errors shared by the capture and timelapse pipelines.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_PIPELINE_PIPELINE_TYPES_HPP_
#define NESTLAPSE_PIPELINE_PIPELINE_TYPES_HPP_

namespace nestlapse::pipeline {

enum class PipelineError {
  kNone = 0,

  // Capture stages
  kCredentialUnavailable,
  kDeviceNotFound,
  kCaptureFailed,

  // Timelapse stages
  kInvalidArgument,
  kScanFailed,
  kScheduleFailed,
  kScriptWriteFailed,

  // Both
  kEncodeFailed,
};

const char* PipelineErrorToString(PipelineError error);

}  // namespace nestlapse::pipeline

#endif  // NESTLAPSE_PIPELINE_PIPELINE_TYPES_HPP_
