// Repository: nestlapse
// Component: Capture Pipeline
// Purpose: Credential -> device lookup -> capture session -> still image.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_PIPELINE_CAPTURE_PIPELINE_HPP_
#define NESTLAPSE_PIPELINE_CAPTURE_PIPELINE_HPP_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "nestlapse/capture/CaptureTypes.hpp"
#include "nestlapse/capture/INegotiator.hpp"
#include "nestlapse/device/ICredentialSource.hpp"
#include "nestlapse/device/IDeviceDirectory.hpp"
#include "nestlapse/encode/EncodeTypes.hpp"
#include "nestlapse/pipeline/PipelineTypes.hpp"
#include "nestlapse/timing/ITimeSource.hpp"

namespace nestlapse::pipeline {

struct CaptureRunResult {
  bool valid;
  PipelineError error;
  std::string detail;
  capture::CaptureError capture_error = capture::CaptureError::kNone;
  std::string image_path;
  std::vector<std::string> warnings;

  static CaptureRunResult Failure(PipelineError err, const std::string& detail) {
    return {false, err, detail, capture::CaptureError::kNone, "", {}};
  }
};

// One capture per Run(); no retries. The remote-answer step relays the local
// offer through IDeviceDirectory::RelaySignal.
class CapturePipeline {
 public:
  using DirectoryFactory =
      std::function<std::unique_ptr<device::IDeviceDirectory>(const std::string& access_token)>;
  using NegotiatorFactory = std::function<std::unique_ptr<capture::INegotiator>()>;

  CapturePipeline(device::ICredentialSource& credentials,
                  DirectoryFactory directories,
                  NegotiatorFactory negotiators,
                  encode::IStillEncoder& encoder,
                  const timing::ITimeSource& clock,
                  capture::CaptureSessionConfig session_config = capture::CaptureSessionConfig());

  CaptureRunResult Run(const std::string& account_id);

 private:
  device::ICredentialSource& credentials_;
  DirectoryFactory directories_;
  NegotiatorFactory negotiators_;
  encode::IStillEncoder& encoder_;
  const timing::ITimeSource& clock_;
  const capture::CaptureSessionConfig session_config_;
};

}  // namespace nestlapse::pipeline

#endif  // NESTLAPSE_PIPELINE_CAPTURE_PIPELINE_HPP_
