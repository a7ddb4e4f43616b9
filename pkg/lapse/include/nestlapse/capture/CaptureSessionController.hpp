// Repository: nestlapse
// Component: Capture Session Controller
// Purpose: Drive one remote capture session through negotiation, connect,
//          a fixed recording window, teardown and buffer collection.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_CAPTURE_CAPTURE_SESSION_CONTROLLER_HPP_
#define NESTLAPSE_CAPTURE_CAPTURE_SESSION_CONTROLLER_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include "nestlapse/capture/CaptureTypes.hpp"
#include "nestlapse/capture/INegotiator.hpp"
#include "nestlapse/capture/MediaConsumer.hpp"

namespace nestlapse::capture {

// CaptureSessionController
//
//   Idle -> Negotiating -> Connected -> Recording -> Closing -> Closed
//
// Any stage failure moves to Failed. Steps run on the caller's thread and
// every wait is bounded. Negotiator callbacks (connection state, tracks)
// arrive on other threads; tracks go straight to the MediaConsumer.
//
// Close() is attempted at most once per session; a second call returns the
// first outcome. Run() always closes a session it opened, whatever failed.
//
// The negotiator must outlive the controller. The destructor clears the
// listeners this controller installed.
class CaptureSessionController {
 public:
  using AnswerExchanger = std::function<AnswerResult(const SessionDescription& offer)>;
  using Transition = std::pair<CaptureState, CaptureState>;

  explicit CaptureSessionController(INegotiator& negotiator,
                                    CaptureSessionConfig config = CaptureSessionConfig());
  ~CaptureSessionController();

  CaptureSessionController(const CaptureSessionController&) = delete;
  CaptureSessionController& operator=(const CaptureSessionController&) = delete;

  // Builds the offer, waits for gathering (gather_timeout), hands the offer
  // to |exchanger| and applies the returned answer.
  StepResult Negotiate(const AnswerExchanger& exchanger);

  StepResult AwaitConnected(std::chrono::milliseconds timeout);

  // Holds the session open for |duration|. Fails with kConnectionFailed if
  // the session drops first; the window ends at that point.
  StepResult Record(std::chrono::milliseconds duration);

  // kCloseTimeout is advisory: it is logged as a warning and Run() does not
  // let it override a successful capture.
  StepResult Close(std::chrono::milliseconds timeout);

  // Call after Close(). An empty buffer counts as kNoMediaReceived.
  StepResult CollectBuffer(std::chrono::milliseconds timeout,
                           std::vector<uint8_t>* buffer);

  // All steps with the configured bounds.
  CaptureResult Run(const AnswerExchanger& exchanger);

  CaptureState state() const;
  std::vector<Transition> transitions() const;
  const CaptureSessionConfig& config() const { return config_; }

 private:
  void TransitionTo(CaptureState to);
  StepResult Fail(CaptureError error, const std::string& detail);
  void OnConnectionState(ConnectionState state);

  // Sleeps until a pushed state change or |max_wait|, then samples the
  // negotiator.
  ConnectionState WaitForStateChange(std::chrono::milliseconds max_wait);

  INegotiator& negotiator_;
  const CaptureSessionConfig config_;
  MediaConsumer consumer_;

  mutable std::mutex state_mutex_;
  CaptureState state_ = CaptureState::kIdle;
  std::vector<Transition> transitions_;

  std::mutex conn_mutex_;
  std::condition_variable conn_cv_;
  bool conn_changed_ = false;  // Guarded by conn_mutex_

  bool session_opened_ = false;
  bool close_attempted_ = false;
  StepResult close_result_ = StepResult::Success();
};

}  // namespace nestlapse::capture

#endif  // NESTLAPSE_CAPTURE_CAPTURE_SESSION_CONTROLLER_HPP_
