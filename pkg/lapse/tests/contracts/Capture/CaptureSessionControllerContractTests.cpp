// Repository: nestlapse
// Component: Capture Session Controller Contract Tests
// Purpose: Step ordering, bounded waits, single teardown and media handoff.
// Copyright (c) 2025 nestlapse

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "nestlapse/capture/CaptureSessionController.hpp"
#include "nestlapse/util/Logger.hpp"

#include "../../fixtures/FakeMediaTrack.h"
#include "../../fixtures/FakeNegotiator.h"
#include "../../fixtures/H264Packets.h"

namespace nestlapse::capture {
namespace {

using namespace std::chrono_literals;
using tests::fixtures::FakeMediaTrack;
using tests::fixtures::FakeNegotiator;
using tests::fixtures::NegotiatorScript;

CaptureSessionConfig FastConfig() {
  CaptureSessionConfig config;
  config.gather_timeout = 20ms;
  config.connect_timeout = 200ms;
  config.record_duration = 30ms;
  config.close_timeout = 100ms;
  config.collect_timeout = 500ms;
  config.state_poll_interval = 5ms;
  return config;
}

CaptureSessionController::AnswerExchanger AnswerWith(const std::string& sdp) {
  return [sdp](const SessionDescription&) { return AnswerResult::Success(sdp); };
}

std::shared_ptr<FakeMediaTrack> H264TrackWithKeyframe() {
  using namespace tests::fixtures;
  auto track = std::make_shared<FakeMediaTrack>(MediaKind::kVideo, "video/H264", "video0");
  track->Push(RtpPacket(kSpsNal, 1));
  track->Push(RtpPacket(kPpsNal, 2));
  track->Push(RtpPacket(kIdrNal, 3));
  return track;
}

// Collects every line logged at one severity while installed.
class LogCapture {
 public:
  void Append(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(line);
  }

  bool Contains(const std::string& fragment) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& line : lines_) {
      if (line.find(fragment) != std::string::npos) return true;
    }
    return false;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
};

class CaptureSessionControllerContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    util::Logger::SetInfoSink([this](const std::string& line) { info_.Append(line); });
    util::Logger::SetWarnSink([this](const std::string& line) { warnings_.Append(line); });
    util::Logger::SetErrorSink([this](const std::string& line) { errors_.Append(line); });
  }

  void TearDown() override {
    util::Logger::SetInfoSink(nullptr);
    util::Logger::SetWarnSink(nullptr);
    util::Logger::SetErrorSink(nullptr);
  }

  LogCapture info_;
  LogCapture warnings_;
  LogCapture errors_;
};

TEST_F(CaptureSessionControllerContractTest, SuccessfulRunDeliversAnnexBBuffer) {
  NegotiatorScript script;
  script.tracks.push_back(H264TrackWithKeyframe());
  FakeNegotiator negotiator(script);
  CaptureSessionController controller(negotiator, FastConfig());

  std::string seen_offer;
  const CaptureResult result = controller.Run([&](const SessionDescription& offer) {
    seen_offer = offer.sdp;
    return AnswerResult::Success("v=0\r\no=- remote-answer\r\n");
  });

  ASSERT_TRUE(result.valid) << result.detail;
  EXPECT_TRUE(result.warnings.empty());
  ASSERT_GE(result.buffer.size(), 5u);
  EXPECT_EQ(result.buffer[0], 0x00);
  EXPECT_EQ(result.buffer[1], 0x00);
  EXPECT_EQ(result.buffer[2], 0x00);
  EXPECT_EQ(result.buffer[3], 0x01);
  EXPECT_EQ(result.buffer[4], 0x67);

  EXPECT_EQ(seen_offer, NegotiatorScript().local_sdp);
  EXPECT_EQ(negotiator.applied_answer(), "v=0\r\no=- remote-answer\r\n");
  EXPECT_EQ(negotiator.close_calls(), 1);
  EXPECT_EQ(controller.state(), CaptureState::kClosed);
}

TEST_F(CaptureSessionControllerContractTest, TransitionsFollowTheLifecycle) {
  NegotiatorScript script;
  script.tracks.push_back(H264TrackWithKeyframe());
  FakeNegotiator negotiator(script);
  CaptureSessionController controller(negotiator, FastConfig());

  ASSERT_TRUE(controller.Run(AnswerWith("answer")).valid);

  const std::vector<CaptureSessionController::Transition> expected = {
      {CaptureState::kIdle, CaptureState::kNegotiating},
      {CaptureState::kNegotiating, CaptureState::kConnected},
      {CaptureState::kConnected, CaptureState::kRecording},
      {CaptureState::kRecording, CaptureState::kClosing},
      {CaptureState::kClosing, CaptureState::kClosed},
  };
  EXPECT_EQ(controller.transitions(), expected);
  EXPECT_TRUE(info_.Contains("[CaptureSession] STATE from=IDLE to=NEGOTIATING"));
  EXPECT_TRUE(info_.Contains("[CaptureSession] STATE from=CLOSING to=CLOSED"));
}

TEST_F(CaptureSessionControllerContractTest, GatheringTimeoutIsNegotiationTimeout) {
  NegotiatorScript script;
  script.gathering_completes = false;
  FakeNegotiator negotiator(script);
  CaptureSessionController controller(negotiator, FastConfig());

  bool exchanged = false;
  const CaptureResult result = controller.Run([&](const SessionDescription&) {
    exchanged = true;
    return AnswerResult::Success("answer");
  });

  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, CaptureError::kNegotiationTimeout);
  EXPECT_FALSE(exchanged);
  EXPECT_EQ(controller.state(), CaptureState::kFailed);
  EXPECT_EQ(negotiator.close_calls(), 1);
}

TEST_F(CaptureSessionControllerContractTest, OfferFailureIsRejected) {
  NegotiatorScript script;
  script.offer_fails = true;
  FakeNegotiator negotiator(script);
  CaptureSessionController controller(negotiator, FastConfig());

  const CaptureResult result = controller.Run(AnswerWith("answer"));
  EXPECT_EQ(result.error, CaptureError::kNegotiationRejected);
  EXPECT_NE(result.detail.find("fake offer failure"), std::string::npos);
}

TEST_F(CaptureSessionControllerContractTest, RelayFailureIsRejected) {
  FakeNegotiator negotiator;
  CaptureSessionController controller(negotiator, FastConfig());

  const CaptureResult result = controller.Run([](const SessionDescription&) {
    return AnswerResult::Failure("device refused stream");
  });
  EXPECT_EQ(result.error, CaptureError::kNegotiationRejected);
  EXPECT_NE(result.detail.find("device refused stream"), std::string::npos);
  EXPECT_TRUE(negotiator.applied_answer().empty());
}

TEST_F(CaptureSessionControllerContractTest, EmptyAnswerIsRejected) {
  FakeNegotiator negotiator;
  CaptureSessionController controller(negotiator, FastConfig());

  const CaptureResult result = controller.Run(AnswerWith(""));
  EXPECT_EQ(result.error, CaptureError::kNegotiationRejected);
}

TEST_F(CaptureSessionControllerContractTest, ApplyFailureIsRejected) {
  NegotiatorScript script;
  script.apply_fails = true;
  FakeNegotiator negotiator(script);
  CaptureSessionController controller(negotiator, FastConfig());

  const CaptureResult result = controller.Run(AnswerWith("answer"));
  EXPECT_EQ(result.error, CaptureError::kNegotiationRejected);
  EXPECT_NE(result.detail.find("fake apply failure"), std::string::npos);
}

TEST_F(CaptureSessionControllerContractTest, FailedTransportIsConnectionFailed) {
  NegotiatorScript script;
  script.state_after_answer = ConnectionState::kFailed;
  FakeNegotiator negotiator(script);
  CaptureSessionController controller(negotiator, FastConfig());

  const CaptureResult result = controller.Run(AnswerWith("answer"));
  EXPECT_EQ(result.error, CaptureError::kConnectionFailed);
  EXPECT_EQ(negotiator.close_calls(), 1);
  EXPECT_TRUE(errors_.Contains("[CaptureSession] FAILED error=CONNECTION_FAILED"));
}

TEST_F(CaptureSessionControllerContractTest, NeverConnectingTimesOut) {
  NegotiatorScript script;
  script.state_after_answer = ConnectionState::kConnecting;
  FakeNegotiator negotiator(script);
  CaptureSessionController controller(negotiator, FastConfig());

  const auto start = std::chrono::steady_clock::now();
  const CaptureResult result = controller.Run(AnswerWith("answer"));
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_EQ(result.error, CaptureError::kConnectionTimeout);
  EXPECT_GE(elapsed, FastConfig().connect_timeout);
  EXPECT_LT(elapsed, 5s);
}

TEST_F(CaptureSessionControllerContractTest, EarlyDropStillClosesExactlyOnce) {
  NegotiatorScript script;
  script.tracks.push_back(H264TrackWithKeyframe());
  script.drop_after = 20ms;
  FakeNegotiator negotiator(script);
  CaptureSessionConfig config = FastConfig();
  config.record_duration = 2s;
  CaptureSessionController controller(negotiator, config);

  const auto start = std::chrono::steady_clock::now();
  const CaptureResult result = controller.Run(AnswerWith("answer"));
  const auto elapsed = std::chrono::steady_clock::now() - start;

  // The media received before the drop is still delivered.
  EXPECT_TRUE(result.valid) << result.detail;
  ASSERT_EQ(result.warnings.size(), 1u);
  EXPECT_NE(result.warnings[0].find("dropped"), std::string::npos);
  EXPECT_LT(elapsed, config.record_duration);
  EXPECT_EQ(negotiator.close_calls(), 1);

  // A second close reports the cached outcome without touching the transport.
  EXPECT_TRUE(controller.Close(config.close_timeout).valid);
  EXPECT_EQ(negotiator.close_calls(), 1);
}

TEST_F(CaptureSessionControllerContractTest, CloseTimeoutIsAdvisory) {
  NegotiatorScript script;
  script.tracks.push_back(H264TrackWithKeyframe());
  script.close_reaches_closed = false;
  FakeNegotiator negotiator(script);
  CaptureSessionController controller(negotiator, FastConfig());

  const CaptureResult result = controller.Run(AnswerWith("answer"));

  EXPECT_TRUE(result.valid) << result.detail;
  EXPECT_FALSE(result.buffer.empty());
  ASSERT_EQ(result.warnings.size(), 1u);
  EXPECT_NE(result.warnings[0].find("not closed"), std::string::npos);
  EXPECT_EQ(controller.state(), CaptureState::kFailed);
  EXPECT_TRUE(warnings_.Contains("[CaptureSession] CLOSE_TIMEOUT"));
}

TEST_F(CaptureSessionControllerContractTest, TrackThatNeverEndsHitsCollectTimeout) {
  auto stuck = std::make_shared<FakeMediaTrack>(MediaKind::kVideo, "video/H264", "video0");
  stuck->Push(tests::fixtures::RtpPacket(tests::fixtures::kSpsNal, 1));
  stuck->IgnoreEndStream();

  NegotiatorScript script;
  script.tracks.push_back(stuck);
  FakeNegotiator negotiator(script);
  CaptureSessionConfig config = FastConfig();
  config.collect_timeout = 100ms;

  std::chrono::steady_clock::duration collect_elapsed{};
  {
    CaptureSessionController controller(negotiator, config);
    ASSERT_TRUE(controller.Negotiate(AnswerWith("answer")).valid);
    ASSERT_TRUE(controller.AwaitConnected(config.connect_timeout).valid);
    ASSERT_TRUE(controller.Record(config.record_duration).valid);
    ASSERT_TRUE(controller.Close(config.close_timeout).valid);

    std::vector<uint8_t> buffer;
    const auto start = std::chrono::steady_clock::now();
    const StepResult collected = controller.CollectBuffer(config.collect_timeout, &buffer);
    collect_elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(collected.valid);
    EXPECT_EQ(collected.error, CaptureError::kNoMediaReceived);
    EXPECT_NE(collected.detail.find("did not deliver"), std::string::npos) << collected.detail;
    EXPECT_TRUE(buffer.empty());
  }

  EXPECT_GE(collect_elapsed, config.collect_timeout);
  EXPECT_LT(collect_elapsed, 2s);
  // The reader was still blocked when the session went away.
  EXPECT_TRUE(warnings_.Contains("[MediaConsumer] DETACH reason=track_still_open track=video0"));
  EXPECT_TRUE(errors_.Contains("[CaptureSession] NO_MEDIA"));

  // Release the detached reader.
  stuck->FailStream();
}

TEST_F(CaptureSessionControllerContractTest, RunWithNeverEndingTrackIsBounded) {
  auto stuck = std::make_shared<FakeMediaTrack>(MediaKind::kVideo, "video/H264", "video0");
  stuck->IgnoreEndStream();

  NegotiatorScript script;
  script.tracks.push_back(stuck);
  FakeNegotiator negotiator(script);
  CaptureSessionConfig config = FastConfig();
  config.collect_timeout = 100ms;

  const auto start = std::chrono::steady_clock::now();
  CaptureResult result;
  {
    CaptureSessionController controller(negotiator, config);
    result = controller.Run(AnswerWith("answer"));
  }
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, CaptureError::kNoMediaReceived);
  EXPECT_NE(result.detail.find("did not deliver"), std::string::npos) << result.detail;
  EXPECT_GE(elapsed, config.record_duration + config.collect_timeout);
  EXPECT_LT(elapsed, 2s);

  stuck->FailStream();
}

TEST_F(CaptureSessionControllerContractTest, NonQualifyingTracksAreIgnored) {
  NegotiatorScript script;
  auto audio = std::make_shared<FakeMediaTrack>(MediaKind::kAudio, "audio/opus", "audio0");
  auto vp8 = std::make_shared<FakeMediaTrack>(MediaKind::kVideo, "video/VP8", "video0");
  script.tracks = {audio, vp8};
  FakeNegotiator negotiator(script);
  CaptureSessionController controller(negotiator, FastConfig());

  const CaptureResult result = controller.Run(AnswerWith("answer"));

  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, CaptureError::kNoMediaReceived);
  EXPECT_NE(result.detail.find("never opened"), std::string::npos);
  EXPECT_EQ(audio->reads(), 0);
  EXPECT_EQ(vp8->reads(), 0);
}

TEST_F(CaptureSessionControllerContractTest, TrackWithoutKeyframeIsNoMedia) {
  NegotiatorScript script;
  auto track = std::make_shared<FakeMediaTrack>(MediaKind::kVideo, "video/h264", "video0");
  track->Push(tests::fixtures::RtpPacket(tests::fixtures::kSliceNal, 1));
  script.tracks.push_back(track);
  FakeNegotiator negotiator(script);
  CaptureSessionController controller(negotiator, FastConfig());

  const CaptureResult result = controller.Run(AnswerWith("answer"));

  EXPECT_EQ(result.error, CaptureError::kNoMediaReceived);
  EXPECT_NE(result.detail.find("video0"), std::string::npos);
}

TEST_F(CaptureSessionControllerContractTest, StepsOutOfOrderAreRefused) {
  FakeNegotiator negotiator;
  CaptureSessionController controller(negotiator, FastConfig());

  EXPECT_FALSE(controller.AwaitConnected(10ms).valid);
  EXPECT_FALSE(controller.Record(10ms).valid);
  EXPECT_EQ(controller.state(), CaptureState::kIdle);

  // Nothing was opened, so close leaves the transport alone.
  EXPECT_TRUE(controller.Close(10ms).valid);
  EXPECT_EQ(negotiator.close_calls(), 0);
}

}  // namespace
}  // namespace nestlapse::capture
