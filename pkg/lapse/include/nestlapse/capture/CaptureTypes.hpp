// Repository: nestlapse
// Component: Capture Session Types
// Purpose: States, errors, configuration and step results for a time-bounded
//          remote capture session.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_CAPTURE_CAPTURE_TYPES_HPP_
#define NESTLAPSE_CAPTURE_CAPTURE_TYPES_HPP_

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace nestlapse::capture {

enum class CaptureError {
  kNone = 0,

  // Address gathering did not complete within gather_timeout
  kNegotiationTimeout,

  // Offer could not be built, or the remote side refused / returned an empty
  // or unusable answer
  kNegotiationRejected,

  // Neither connected nor failed within connect_timeout
  kConnectionTimeout,

  // Session reached failed/closed before connecting, or dropped mid-record
  kConnectionFailed,

  // Session did not reach closed within close_timeout (advisory only)
  kCloseTimeout,

  // No buffer (or an empty one) delivered by the media consumer
  kNoMediaReceived,
};

const char* CaptureErrorToString(CaptureError error);

enum class CaptureState {
  kIdle = 0,
  kNegotiating,
  kConnected,
  kRecording,
  kClosing,
  kClosed,
  kFailed,
};

const char* CaptureStateToString(CaptureState state);

// Transport-level state as reported by the negotiator.
enum class ConnectionState {
  kNew = 0,
  kConnecting,
  kConnected,
  kDisconnected,
  kFailed,
  kClosed,
};

const char* ConnectionStateToString(ConnectionState state);

enum class MediaKind {
  kAudio = 0,
  kVideo,
};

struct SessionDescription {
  std::string type;  // "offer" or "answer"
  std::string sdp;
};

struct CaptureSessionConfig {
  std::chrono::milliseconds gather_timeout{20000};
  std::chrono::milliseconds connect_timeout{30000};
  std::chrono::milliseconds record_duration{5000};
  std::chrono::milliseconds close_timeout{30000};
  std::chrono::milliseconds collect_timeout{5000};

  // Upper bound between connection-state checks when the negotiator does not
  // push a change.
  std::chrono::milliseconds state_poll_interval{500};
};

// Outcome of one controller step.
struct StepResult {
  bool valid;
  CaptureError error;
  std::string detail;

  static StepResult Success() { return {true, CaptureError::kNone, ""}; }
  static StepResult Failure(CaptureError err, const std::string& detail) {
    return {false, err, detail};
  }
};

// Outcome of a full run. |warnings| carries advisories that did not override
// success (close timeout, early drop during the recording window).
struct CaptureResult {
  bool valid;
  CaptureError error;
  std::string detail;
  std::vector<uint8_t> buffer;  // Annex-B H.264 elementary stream
  std::vector<std::string> warnings;

  static CaptureResult Success(std::vector<uint8_t> buf) {
    return {true, CaptureError::kNone, "", std::move(buf), {}};
  }
  static CaptureResult Failure(CaptureError err, const std::string& detail) {
    return {false, err, detail, {}, {}};
  }
};

// Remote side of the offer/answer exchange.
struct AnswerResult {
  bool valid;
  std::string answer_sdp;
  std::string detail;

  static AnswerResult Success(std::string sdp) { return {true, std::move(sdp), ""}; }
  static AnswerResult Failure(const std::string& detail) { return {false, "", detail}; }
};

}  // namespace nestlapse::capture

#endif  // NESTLAPSE_CAPTURE_CAPTURE_TYPES_HPP_
