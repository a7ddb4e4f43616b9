// Repository: nestlapse
// Component: Capture Session Types
// Copyright (c) 2025 nestlapse

#include "nestlapse/capture/CaptureTypes.hpp"

namespace nestlapse::capture {

const char* CaptureErrorToString(CaptureError error) {
  switch (error) {
    case CaptureError::kNone:
      return "NONE";
    case CaptureError::kNegotiationTimeout:
      return "NEGOTIATION_TIMEOUT";
    case CaptureError::kNegotiationRejected:
      return "NEGOTIATION_REJECTED";
    case CaptureError::kConnectionTimeout:
      return "CONNECTION_TIMEOUT";
    case CaptureError::kConnectionFailed:
      return "CONNECTION_FAILED";
    case CaptureError::kCloseTimeout:
      return "CLOSE_TIMEOUT";
    case CaptureError::kNoMediaReceived:
      return "NO_MEDIA_RECEIVED";
  }
  return "UNKNOWN";
}

const char* CaptureStateToString(CaptureState state) {
  switch (state) {
    case CaptureState::kIdle:
      return "IDLE";
    case CaptureState::kNegotiating:
      return "NEGOTIATING";
    case CaptureState::kConnected:
      return "CONNECTED";
    case CaptureState::kRecording:
      return "RECORDING";
    case CaptureState::kClosing:
      return "CLOSING";
    case CaptureState::kClosed:
      return "CLOSED";
    case CaptureState::kFailed:
      return "FAILED";
  }
  return "UNKNOWN";
}

const char* ConnectionStateToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::kNew:
      return "NEW";
    case ConnectionState::kConnecting:
      return "CONNECTING";
    case ConnectionState::kConnected:
      return "CONNECTED";
    case ConnectionState::kDisconnected:
      return "DISCONNECTED";
    case ConnectionState::kFailed:
      return "FAILED";
    case ConnectionState::kClosed:
      return "CLOSED";
  }
  return "UNKNOWN";
}

}  // namespace nestlapse::capture
