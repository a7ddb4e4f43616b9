// Repository: nestlapse
// Component: Pipeline Types
// Copyright (c) 2025 nestlapse

#include "nestlapse/pipeline/PipelineTypes.hpp"

namespace nestlapse::pipeline {

const char* PipelineErrorToString(PipelineError error) {
  switch (error) {
    case PipelineError::kNone:
      return "NONE";
    case PipelineError::kCredentialUnavailable:
      return "CREDENTIAL_UNAVAILABLE";
    case PipelineError::kDeviceNotFound:
      return "DEVICE_NOT_FOUND";
    case PipelineError::kCaptureFailed:
      return "CAPTURE_FAILED";
    case PipelineError::kInvalidArgument:
      return "INVALID_ARGUMENT";
    case PipelineError::kScanFailed:
      return "SCAN_FAILED";
    case PipelineError::kScheduleFailed:
      return "SCHEDULE_FAILED";
    case PipelineError::kScriptWriteFailed:
      return "SCRIPT_WRITE_FAILED";
    case PipelineError::kEncodeFailed:
      return "ENCODE_FAILED";
  }
  return "UNKNOWN";
}

}  // namespace nestlapse::pipeline
