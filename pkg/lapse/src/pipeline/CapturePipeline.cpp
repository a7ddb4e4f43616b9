// Repository: nestlapse
// Component: Capture Pipeline Implementation
// Copyright (c) 2025 nestlapse

#include "nestlapse/pipeline/CapturePipeline.hpp"

#include <sstream>
#include <utility>

#include "nestlapse/capture/CaptureSessionController.hpp"
#include "nestlapse/util/Logger.hpp"

namespace nestlapse::pipeline {

using nestlapse::util::Logger;

CapturePipeline::CapturePipeline(device::ICredentialSource& credentials,
                                 DirectoryFactory directories,
                                 NegotiatorFactory negotiators,
                                 encode::IStillEncoder& encoder,
                                 const timing::ITimeSource& clock,
                                 capture::CaptureSessionConfig session_config)
    : credentials_(credentials),
      directories_(std::move(directories)),
      negotiators_(std::move(negotiators)),
      encoder_(encoder),
      clock_(clock),
      session_config_(session_config) {}

CaptureRunResult CapturePipeline::Run(const std::string& account_id) {
  const device::CredentialResult credential = credentials_.AccessToken();
  if (!credential.valid || credential.access_token.empty()) {
    const std::string detail =
        "credentials: " + (credential.detail.empty() ? std::string("no access token")
                                                     : credential.detail);
    Logger::Error("[CapturePipeline] CREDENTIAL_UNAVAILABLE " + detail);
    return CaptureRunResult::Failure(PipelineError::kCredentialUnavailable, detail);
  }

  std::unique_ptr<device::IDeviceDirectory> directory = directories_(credential.access_token);
  if (!directory) {
    return CaptureRunResult::Failure(PipelineError::kDeviceNotFound,
                                     "device lookup: no device directory");
  }
  const device::DeviceLookupResult lookup = directory->FindCaptureDevice(account_id);
  if (!lookup.valid) {
    const std::string detail = "device lookup for " + account_id + ": " + lookup.detail;
    Logger::Error("[CapturePipeline] DEVICE_NOT_FOUND " + detail);
    return CaptureRunResult::Failure(PipelineError::kDeviceNotFound, detail);
  }
  Logger::Info("[CapturePipeline] DEVICE name=" + lookup.device.name);

  std::unique_ptr<capture::INegotiator> negotiator = negotiators_();
  if (!negotiator) {
    return CaptureRunResult::Failure(PipelineError::kCaptureFailed,
                                     "capture: no negotiator available");
  }

  capture::CaptureResult captured;
  {
    capture::CaptureSessionController controller(*negotiator, session_config_);
    const device::DeviceHandle device = lookup.device;
    device::IDeviceDirectory* relay = directory.get();
    captured = controller.Run([relay, &device](const capture::SessionDescription& offer) {
      const device::SignalRelayResult answer = relay->RelaySignal(device, offer.sdp);
      if (!answer.valid) {
        return capture::AnswerResult::Failure(answer.detail);
      }
      return capture::AnswerResult::Success(answer.answer_sdp);
    });
  }

  if (!captured.valid) {
    CaptureRunResult failure = CaptureRunResult::Failure(
        PipelineError::kCaptureFailed,
        std::string("capture: ") + capture::CaptureErrorToString(captured.error) + ": " +
            captured.detail);
    failure.capture_error = captured.error;
    failure.warnings = std::move(captured.warnings);
    Logger::Error("[CapturePipeline] CAPTURE_FAILED " + failure.detail);
    return failure;
  }

  const encode::EncodeResult still = encoder_.EncodeStill(captured.buffer, clock_.Now());
  if (!still.valid) {
    CaptureRunResult failure = CaptureRunResult::Failure(
        PipelineError::kEncodeFailed,
        std::string("still image: ") + encode::EncodeErrorToString(still.error) + ": " +
            still.detail);
    failure.warnings = std::move(captured.warnings);
    Logger::Error("[CapturePipeline] ENCODE_FAILED " + failure.detail);
    return failure;
  }

  std::ostringstream oss;
  oss << "[CapturePipeline] CAPTURED path=" << still.output_path
      << " buffer_bytes=" << captured.buffer.size() << " warnings=" << captured.warnings.size();
  Logger::Info(oss.str());

  return CaptureRunResult{true, PipelineError::kNone, "", capture::CaptureError::kNone,
                          still.output_path, std::move(captured.warnings)};
}

}  // namespace nestlapse::pipeline
