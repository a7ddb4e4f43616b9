// Repository: nestlapse
// Component: Frame Timeline Scheduler Contract Tests
// Purpose: Ordering, rate ceiling, final-frame sentinel and interval filter.
// Copyright (c) 2025 nestlapse

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "nestlapse/timeline/FrameTimelineScheduler.hpp"

#include "../../fixtures/FixedTimeSource.h"

namespace nestlapse::timeline {
namespace {

using std::chrono::milliseconds;
using std::chrono::seconds;
using tests::fixtures::LocalTime;

const timeexpr::Timestamp kT0 = LocalTime(2024, 3, 20, 8, 0, 0);

TimestampedArtifact At(const std::string& name, timeexpr::Timestamp::duration offset) {
  return TimestampedArtifact{name, kT0 + offset};
}

void ExpectScheduleInvariants(const Schedule& frames, double max_rate) {
  ASSERT_FALSE(frames.empty());
  for (size_t i = 1; i < frames.size(); ++i) {
    EXPECT_LT(frames[i - 1].artifact.captured_at, frames[i].artifact.captured_at)
        << "frame " << i << " not strictly after frame " << (i - 1);
  }
  for (size_t i = 0; i + 1 < frames.size(); ++i) {
    EXPECT_GE(frames[i].display_duration.count(), 1.0 / max_rate) << "frame " << i;
  }
  EXPECT_EQ(frames.back().display_duration.count(), 0.0);
}

// -----------------------------------------------------------------------------
// Four artifacts at T, T+30s, T+90s, T+100s, ratio 30, 60 fps ceiling
// -----------------------------------------------------------------------------
TEST(FrameTimelineSchedulerContract, EndToEndDurations) {
  const FrameTimelineScheduler scheduler;
  const std::vector<TimestampedArtifact> artifacts = {
      At("a.jpg", seconds(0)), At("b.jpg", seconds(30)), At("c.jpg", seconds(90)),
      At("d.jpg", seconds(100))};

  const ScheduleResult r = scheduler.Build(artifacts, 30.0, std::nullopt);
  ASSERT_TRUE(r.valid) << r.detail;
  ASSERT_EQ(r.frames.size(), 4u);
  EXPECT_EQ(r.frames[0].artifact.identifier, "a.jpg");
  EXPECT_EQ(r.frames[3].artifact.identifier, "d.jpg");
  EXPECT_NEAR(r.frames[0].display_duration.count(), 1.0, 1e-9);
  EXPECT_NEAR(r.frames[1].display_duration.count(), 2.0, 1e-9);
  EXPECT_NEAR(r.frames[2].display_duration.count(), 10.0 / 30.0, 1e-9);
  EXPECT_EQ(r.frames[3].display_duration.count(), 0.0);
  ExpectScheduleInvariants(r.frames, 60.0);
}

TEST(FrameTimelineSchedulerContract, OrdersByCaptureTimeNotInputOrder) {
  const FrameTimelineScheduler scheduler;
  const std::vector<TimestampedArtifact> artifacts = {
      At("c.jpg", seconds(20)), At("a.jpg", seconds(0)), At("b.jpg", seconds(10))};

  const ScheduleResult r = scheduler.Build(artifacts, 1.0, std::nullopt);
  ASSERT_TRUE(r.valid) << r.detail;
  ASSERT_EQ(r.frames.size(), 3u);
  EXPECT_EQ(r.frames[0].artifact.identifier, "a.jpg");
  EXPECT_EQ(r.frames[1].artifact.identifier, "b.jpg");
  EXPECT_EQ(r.frames[2].artifact.identifier, "c.jpg");
  ExpectScheduleInvariants(r.frames, 60.0);
}

TEST(FrameTimelineSchedulerContract, RateCeilingMergesCloseArtifacts) {
  const FrameTimelineScheduler scheduler(SchedulerConfig{60.0});
  const std::vector<TimestampedArtifact> artifacts = {At("a.jpg", milliseconds(0)),
                                                      At("b.jpg", milliseconds(10))};

  const ScheduleResult r = scheduler.Build(artifacts, 1.0, std::nullopt);
  ASSERT_TRUE(r.valid) << r.detail;
  ASSERT_EQ(r.frames.size(), 1u);
  EXPECT_EQ(r.frames[0].artifact.identifier, "a.jpg");
  EXPECT_EQ(r.frames[0].display_duration.count(), 0.0);
}

TEST(FrameTimelineSchedulerContract, MergedRunMeasuresFromPendingFrame) {
  // Ratio 3600: 30s real -> 8.3ms output. b folds into a; c is measured from
  // a, not from b, and clears 1/60 s.
  const FrameTimelineScheduler scheduler;
  const std::vector<TimestampedArtifact> artifacts = {
      At("a.jpg", seconds(0)), At("b.jpg", seconds(30)), At("c.jpg", seconds(61)),
      At("d.jpg", seconds(3600))};

  const ScheduleResult r = scheduler.Build(artifacts, 3600.0, std::nullopt);
  ASSERT_TRUE(r.valid) << r.detail;
  ASSERT_EQ(r.frames.size(), 3u);
  EXPECT_EQ(r.frames[0].artifact.identifier, "a.jpg");
  EXPECT_NEAR(r.frames[0].display_duration.count(), 61.0 / 3600.0, 1e-9);
  EXPECT_EQ(r.frames[1].artifact.identifier, "c.jpg");
  EXPECT_NEAR(r.frames[1].display_duration.count(), 3539.0 / 3600.0, 1e-9);
  EXPECT_EQ(r.frames[2].artifact.identifier, "d.jpg");
  ExpectScheduleInvariants(r.frames, 60.0);
}

TEST(FrameTimelineSchedulerContract, DuplicateTimestampsCollapse) {
  const FrameTimelineScheduler scheduler;
  const std::vector<TimestampedArtifact> artifacts = {
      At("a.jpg", seconds(0)), At("a2.jpg", seconds(0)), At("b.jpg", seconds(60))};

  const ScheduleResult r = scheduler.Build(artifacts, 1.0, std::nullopt);
  ASSERT_TRUE(r.valid) << r.detail;
  ASSERT_EQ(r.frames.size(), 2u);
  EXPECT_EQ(r.frames[0].artifact.identifier, "a.jpg");
  ExpectScheduleInvariants(r.frames, 60.0);
}

TEST(FrameTimelineSchedulerContract, SingleArtifactIsOnlySentinel) {
  const FrameTimelineScheduler scheduler;
  const ScheduleResult r = scheduler.Build({At("only.jpg", seconds(0))}, 30.0, std::nullopt);
  ASSERT_TRUE(r.valid) << r.detail;
  ASSERT_EQ(r.frames.size(), 1u);
  EXPECT_EQ(r.frames[0].display_duration.count(), 0.0);
}

TEST(FrameTimelineSchedulerContract, IntervalFilterExcludesOutsiders) {
  const FrameTimelineScheduler scheduler;
  const std::vector<TimestampedArtifact> artifacts = {
      At("before.jpg", seconds(-60)), At("first.jpg", seconds(0)), At("mid.jpg", seconds(60)),
      At("last.jpg", seconds(120)), At("after.jpg", seconds(121))};
  const auto interval = timeexpr::TimeInterval::Make(kT0, kT0 + seconds(120));
  ASSERT_TRUE(interval.has_value());

  const ScheduleResult r = scheduler.Build(artifacts, 1.0, interval);
  ASSERT_TRUE(r.valid) << r.detail;
  ASSERT_EQ(r.frames.size(), 3u);
  EXPECT_EQ(r.frames[0].artifact.identifier, "first.jpg");
  EXPECT_EQ(r.frames[1].artifact.identifier, "mid.jpg");
  EXPECT_EQ(r.frames[2].artifact.identifier, "last.jpg");
}

TEST(FrameTimelineSchedulerContract, IntervalExcludingEverythingIsNoArtifacts) {
  const FrameTimelineScheduler scheduler;
  const std::vector<TimestampedArtifact> artifacts = {At("a.jpg", seconds(0)),
                                                      At("b.jpg", seconds(60))};
  const auto interval = timeexpr::TimeInterval::Make(kT0 + seconds(3600), kT0 + seconds(7200));

  const ScheduleResult r = scheduler.Build(artifacts, 1.0, interval);
  EXPECT_FALSE(r.valid);
  EXPECT_EQ(r.error, ScheduleError::kNoArtifacts);
  EXPECT_TRUE(r.frames.empty());
  EXPECT_NE(r.detail.find("2 discovered"), std::string::npos) << r.detail;
}

TEST(FrameTimelineSchedulerContract, EmptyInputIsNoArtifacts) {
  const FrameTimelineScheduler scheduler;
  const ScheduleResult r = scheduler.Build({}, 1.0, std::nullopt);
  EXPECT_FALSE(r.valid);
  EXPECT_EQ(r.error, ScheduleError::kNoArtifacts);
}

TEST(FrameTimelineSchedulerContract, RejectsNonPositiveRatioAndRate) {
  const FrameTimelineScheduler scheduler;
  const std::vector<TimestampedArtifact> artifacts = {At("a.jpg", seconds(0))};
  EXPECT_EQ(scheduler.Build(artifacts, 0.0, std::nullopt).error, ScheduleError::kInvalidRatio);
  EXPECT_EQ(scheduler.Build(artifacts, -1.0, std::nullopt).error, ScheduleError::kInvalidRatio);

  const FrameTimelineScheduler zero_rate(SchedulerConfig{0.0});
  EXPECT_EQ(zero_rate.Build(artifacts, 1.0, std::nullopt).error,
            ScheduleError::kInvalidFrameRate);
}

TEST(FrameTimelineSchedulerContract, InvariantsHoldOnIrregularCaptures) {
  const FrameTimelineScheduler scheduler(SchedulerConfig{30.0});
  std::vector<TimestampedArtifact> artifacts;
  // Irregular spacing: bursts of 1s captures separated by 5 minute gaps.
  int64_t t = 0;
  for (int burst = 0; burst < 5; ++burst) {
    for (int i = 0; i < 7; ++i) {
      artifacts.push_back(At("f" + std::to_string(artifacts.size()) + ".jpg", seconds(t)));
      t += 1;
    }
    t += 300;
  }

  const ScheduleResult r = scheduler.Build(artifacts, 120.0, std::nullopt);
  ASSERT_TRUE(r.valid) << r.detail;
  EXPECT_LE(r.frames.size(), artifacts.size());
  ExpectScheduleInvariants(r.frames, 30.0);
}

}  // namespace
}  // namespace nestlapse::timeline
