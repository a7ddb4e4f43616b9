// Repository: nestlapse
// Component: Capture Session Controller Implementation
// Copyright (c) 2025 nestlapse

#include "nestlapse/capture/CaptureSessionController.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>

#include "nestlapse/util/Logger.hpp"

namespace nestlapse::capture {

using nestlapse::util::Logger;
using SteadyClock = std::chrono::steady_clock;

namespace {

std::chrono::milliseconds Remaining(SteadyClock::time_point deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - SteadyClock::now());
  return std::max(left, std::chrono::milliseconds(0));
}

std::chrono::milliseconds ElapsedSince(SteadyClock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);
}

bool IsDropped(ConnectionState s) {
  return s == ConnectionState::kDisconnected || s == ConnectionState::kFailed ||
         s == ConnectionState::kClosed;
}

}  // namespace

CaptureSessionController::CaptureSessionController(INegotiator& negotiator,
                                                   CaptureSessionConfig config)
    : negotiator_(negotiator), config_(config) {
  negotiator_.SetStateListener([this](ConnectionState s) { OnConnectionState(s); });
  negotiator_.SetTrackListener(
      [this](std::shared_ptr<IMediaTrack> track) { consumer_.OfferTrack(std::move(track)); });
}

CaptureSessionController::~CaptureSessionController() {
  negotiator_.SetStateListener(nullptr);
  negotiator_.SetTrackListener(nullptr);
}

CaptureState CaptureSessionController::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

std::vector<CaptureSessionController::Transition>
CaptureSessionController::transitions() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return transitions_;
}

void CaptureSessionController::TransitionTo(CaptureState to) {
  CaptureState from;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    from = state_;
    if (from == to) return;
    state_ = to;
    transitions_.emplace_back(from, to);
  }
  std::ostringstream oss;
  oss << "[CaptureSession] STATE from=" << CaptureStateToString(from)
      << " to=" << CaptureStateToString(to);
  Logger::Info(oss.str());
}

StepResult CaptureSessionController::Fail(CaptureError error, const std::string& detail) {
  TransitionTo(CaptureState::kFailed);
  Logger::Error(std::string("[CaptureSession] FAILED error=") +
                CaptureErrorToString(error) + " detail=" + detail);
  return StepResult::Failure(error, detail);
}

void CaptureSessionController::OnConnectionState(ConnectionState s) {
  {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    conn_changed_ = true;
  }
  conn_cv_.notify_all();
  Logger::Debug(std::string("[CaptureSession] CONNECTION_STATE state=") +
                ConnectionStateToString(s));
}

ConnectionState CaptureSessionController::WaitForStateChange(
    std::chrono::milliseconds max_wait) {
  {
    std::unique_lock<std::mutex> lock(conn_mutex_);
    conn_cv_.wait_for(lock, max_wait, [this] { return conn_changed_; });
    conn_changed_ = false;
  }
  // Sampled outside conn_mutex_: negotiators may hold their own lock while
  // invoking the state listener.
  return negotiator_.State();
}

StepResult CaptureSessionController::Negotiate(const AnswerExchanger& exchanger) {
  if (state() != CaptureState::kIdle) {
    return StepResult::Failure(
        CaptureError::kNegotiationRejected,
        std::string("negotiate: session already started (state=") +
            CaptureStateToString(state()) + ")");
  }

  TransitionTo(CaptureState::kNegotiating);
  session_opened_ = true;

  std::string error;
  if (!negotiator_.CreateLocalOffer(&error)) {
    return Fail(CaptureError::kNegotiationRejected, "negotiate: creating local offer: " + error);
  }

  if (!negotiator_.AwaitGatheringComplete(config_.gather_timeout)) {
    std::ostringstream detail;
    detail << "negotiate: address gathering did not complete within "
           << config_.gather_timeout.count() << "ms";
    return Fail(CaptureError::kNegotiationTimeout, detail.str());
  }

  const SessionDescription offer = negotiator_.LocalDescription();
  if (offer.sdp.empty()) {
    return Fail(CaptureError::kNegotiationRejected, "negotiate: local offer is empty");
  }

  Logger::Debug("[CaptureSession] OFFER bytes=" + std::to_string(offer.sdp.size()));
  const AnswerResult answer = exchanger(offer);
  if (!answer.valid) {
    return Fail(CaptureError::kNegotiationRejected,
                "negotiate: remote answer exchange failed: " + answer.detail);
  }
  if (answer.answer_sdp.empty()) {
    return Fail(CaptureError::kNegotiationRejected, "negotiate: remote answer is empty");
  }

  if (!negotiator_.ApplyRemoteDescription(SessionDescription{"answer", answer.answer_sdp},
                                          &error)) {
    return Fail(CaptureError::kNegotiationRejected,
                "negotiate: applying remote answer: " + error);
  }

  Logger::Info("[CaptureSession] NEGOTIATED answer_bytes=" +
               std::to_string(answer.answer_sdp.size()));
  return StepResult::Success();
}

StepResult CaptureSessionController::AwaitConnected(std::chrono::milliseconds timeout) {
  if (state() != CaptureState::kNegotiating) {
    return StepResult::Failure(
        CaptureError::kConnectionFailed,
        std::string("connect: not negotiating (state=") + CaptureStateToString(state()) + ")");
  }

  const auto start = SteadyClock::now();
  const auto deadline = start + timeout;
  ConnectionState current = negotiator_.State();
  while (true) {
    if (current == ConnectionState::kConnected) {
      TransitionTo(CaptureState::kConnected);
      Logger::Info("[CaptureSession] CONNECTED elapsed_ms=" +
                   std::to_string(ElapsedSince(start).count()));
      return StepResult::Success();
    }
    if (current == ConnectionState::kFailed || current == ConnectionState::kClosed) {
      return Fail(CaptureError::kConnectionFailed,
                  std::string("connect: connection reached ") +
                      ConnectionStateToString(current) + " before connecting");
    }
    const auto left = Remaining(deadline);
    if (left.count() == 0) {
      std::ostringstream detail;
      detail << "connect: not connected within " << timeout.count()
             << "ms (last state=" << ConnectionStateToString(current) << ")";
      return Fail(CaptureError::kConnectionTimeout, detail.str());
    }
    current = WaitForStateChange(std::min(left, config_.state_poll_interval));
  }
}

StepResult CaptureSessionController::Record(std::chrono::milliseconds duration) {
  if (state() != CaptureState::kConnected) {
    return StepResult::Failure(
        CaptureError::kConnectionFailed,
        std::string("record: not connected (state=") + CaptureStateToString(state()) + ")");
  }

  TransitionTo(CaptureState::kRecording);
  Logger::Info("[CaptureSession] RECORDING duration_ms=" + std::to_string(duration.count()));

  const auto start = SteadyClock::now();
  const auto deadline = start + duration;
  ConnectionState current = negotiator_.State();
  while (true) {
    if (IsDropped(current)) {
      std::ostringstream detail;
      detail << "record: session dropped (" << ConnectionStateToString(current) << ") after "
             << ElapsedSince(start).count() << "ms of " << duration.count()
             << "ms recording window";
      Logger::Warn("[CaptureSession] DROPPED " + detail.str());
      // State stays Recording; Close() proceeds from here.
      return StepResult::Failure(CaptureError::kConnectionFailed, detail.str());
    }
    const auto left = Remaining(deadline);
    if (left.count() == 0) break;
    current = WaitForStateChange(std::min(left, config_.state_poll_interval));
  }

  Logger::Info("[CaptureSession] RECORDED elapsed_ms=" +
               std::to_string(ElapsedSince(start).count()) +
               " track=" + (consumer_.HasTrack() ? consumer_.TrackId() : "none"));
  return StepResult::Success();
}

StepResult CaptureSessionController::Close(std::chrono::milliseconds timeout) {
  if (close_attempted_) {
    return close_result_;
  }
  close_attempted_ = true;

  if (!session_opened_) {
    close_result_ = StepResult::Success();
    return close_result_;
  }

  const CaptureState at_close = state();
  const bool live = at_close == CaptureState::kConnected || at_close == CaptureState::kRecording;
  if (live) {
    TransitionTo(CaptureState::kClosing);
  }

  Logger::Info(std::string("[CaptureSession] CLOSING from=") + CaptureStateToString(at_close));
  negotiator_.Close();

  const auto start = SteadyClock::now();
  const auto deadline = start + timeout;
  ConnectionState current = negotiator_.State();
  while (current != ConnectionState::kClosed) {
    const auto left = Remaining(deadline);
    if (left.count() == 0) break;
    current = WaitForStateChange(std::min(left, config_.state_poll_interval));
  }

  if (current == ConnectionState::kClosed) {
    if (live) {
      TransitionTo(CaptureState::kClosed);
    }
    Logger::Info("[CaptureSession] CLOSED elapsed_ms=" +
                 std::to_string(ElapsedSince(start).count()));
    close_result_ = StepResult::Success();
    return close_result_;
  }

  std::ostringstream detail;
  detail << "close: session not closed within " << timeout.count()
         << "ms (last state=" << ConnectionStateToString(current) << ")";
  if (live) {
    TransitionTo(CaptureState::kFailed);
  }
  Logger::Warn("[CaptureSession] CLOSE_TIMEOUT " + detail.str());
  close_result_ = StepResult::Failure(CaptureError::kCloseTimeout, detail.str());
  return close_result_;
}

StepResult CaptureSessionController::CollectBuffer(std::chrono::milliseconds timeout,
                                                   std::vector<uint8_t>* buffer) {
  consumer_.Finish();

  std::optional<std::vector<uint8_t>> delivered = consumer_.Await(timeout);
  if (!delivered) {
    std::ostringstream detail;
    detail << "collect: media consumer did not deliver a buffer within "
           << timeout.count() << "ms";
    Logger::Error("[CaptureSession] NO_MEDIA " + detail.str());
    return StepResult::Failure(CaptureError::kNoMediaReceived, detail.str());
  }
  if (delivered->empty()) {
    const std::string detail =
        consumer_.HasTrack()
            ? "collect: video track " + consumer_.TrackId() + " delivered no decodable H.264"
            : std::string("collect: remote device never opened a video/H264 track");
    Logger::Error("[CaptureSession] NO_MEDIA " + detail);
    return StepResult::Failure(CaptureError::kNoMediaReceived, detail);
  }

  Logger::Info("[CaptureSession] COLLECTED bytes=" + std::to_string(delivered->size()));
  if (buffer) {
    *buffer = std::move(*delivered);
  }
  return StepResult::Success();
}

CaptureResult CaptureSessionController::Run(const AnswerExchanger& exchanger) {
  std::vector<std::string> warnings;

  StepResult step = Negotiate(exchanger);
  if (step.valid) {
    step = AwaitConnected(config_.connect_timeout);
  }
  if (step.valid) {
    const StepResult recorded = Record(config_.record_duration);
    if (!recorded.valid) {
      warnings.push_back(recorded.detail);
    }
  }

  const StepResult closed = Close(config_.close_timeout);
  if (!closed.valid) {
    warnings.push_back(closed.detail);
  }

  if (!step.valid) {
    return CaptureResult::Failure(step.error, step.detail);
  }

  std::vector<uint8_t> buffer;
  const StepResult collected = CollectBuffer(config_.collect_timeout, &buffer);
  if (!collected.valid) {
    CaptureResult failure = CaptureResult::Failure(collected.error, collected.detail);
    failure.warnings = std::move(warnings);
    return failure;
  }

  CaptureResult result = CaptureResult::Success(std::move(buffer));
  result.warnings = std::move(warnings);
  return result;
}

}  // namespace nestlapse::capture
