// Repository: nestlapse
// Component: Negotiator Interface
// Purpose: Local side of a peer session: offer creation, address gathering,
//          remote answer, connection state and teardown.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_CAPTURE_INEGOTIATOR_HPP_
#define NESTLAPSE_CAPTURE_INEGOTIATOR_HPP_

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "nestlapse/capture/CaptureTypes.hpp"
#include "nestlapse/capture/IMediaTrack.hpp"

namespace nestlapse::capture {

// Implementations declare receive-only audio and video, plus a data channel
// the remote device expects before it will start streaming.
//
// Listeners may be invoked from any thread. Passing nullptr clears one.
class INegotiator {
 public:
  using StateListener = std::function<void(ConnectionState)>;
  using TrackListener = std::function<void(std::shared_ptr<IMediaTrack>)>;

  virtual ~INegotiator() = default;

  virtual void SetStateListener(StateListener listener) = 0;
  virtual void SetTrackListener(TrackListener listener) = 0;

  // Builds the local offer and starts address gathering.
  virtual bool CreateLocalOffer(std::string* error) = 0;

  // True once gathering completed; false if |timeout| elapsed first.
  virtual bool AwaitGatheringComplete(std::chrono::milliseconds timeout) = 0;

  // Local description including every gathered candidate.
  virtual SessionDescription LocalDescription() const = 0;

  virtual bool ApplyRemoteDescription(const SessionDescription& answer,
                                      std::string* error) = 0;

  virtual ConnectionState State() const = 0;

  // Starts teardown; State() eventually reports kClosed.
  virtual void Close() = 0;
};

}  // namespace nestlapse::capture

#endif  // NESTLAPSE_CAPTURE_INEGOTIATOR_HPP_
