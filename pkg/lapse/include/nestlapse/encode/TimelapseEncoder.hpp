// Repository: nestlapse
// Component: Timelapse Encoder
// Purpose: Schedule of still images -> variable-frame-timing H.264 video.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_ENCODE_TIMELAPSE_ENCODER_HPP_
#define NESTLAPSE_ENCODE_TIMELAPSE_ENCODER_HPP_

#include <cstdint>

#include "nestlapse/encode/EncodeTypes.hpp"

namespace nestlapse::encode {

// Every frame's presentation time is the sum of the display durations before
// it (millisecond time base). Frames are cropped per config, then scaled to
// the even dimensions of the first cropped frame in yuv420p and encoded with
// libx264 (crf/preset/tune). The container follows the output extension.
class TimelapseEncoder : public ITimelineEncoder {
 public:
  static constexpr int kTimeBaseDen = 1000;

  explicit TimelapseEncoder(TimelapseEncodeConfig config = TimelapseEncodeConfig());

  EncodeResult Encode(const timeline::Schedule& schedule) override;

  const TimelapseEncodeConfig& config() const { return config_; }

 private:
  TimelapseEncodeConfig config_;
};

// Presentation times in 1/kTimeBaseDen units, strictly increasing.
std::vector<int64_t> PresentationTimes(const timeline::Schedule& schedule, int time_base_den);

}  // namespace nestlapse::encode

#endif  // NESTLAPSE_ENCODE_TIMELAPSE_ENCODER_HPP_
