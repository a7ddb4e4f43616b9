// Repository: nestlapse
// Component: Still Image Encoder
// Purpose: First decodable picture of an H.264 buffer -> dated JPEG file.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_ENCODE_STILL_IMAGE_ENCODER_HPP_
#define NESTLAPSE_ENCODE_STILL_IMAGE_ENCODER_HPP_

#include <cstdint>
#include <vector>

#include "nestlapse/encode/EncodeTypes.hpp"
#include "nestlapse/timeline/ArtifactNaming.hpp"

namespace nestlapse::encode {

// Writes to naming.DatedPathFor(config.output_dir, captured_at), creating
// the dated directories. An existing file at that path is replaced.
class StillImageEncoder : public IStillEncoder {
 public:
  explicit StillImageEncoder(StillImageConfig config = StillImageConfig(),
                             timeline::ArtifactNaming naming = timeline::ArtifactNaming());

  EncodeResult EncodeStill(const std::vector<uint8_t>& annexb,
                           timeexpr::Timestamp captured_at) override;

 private:
  StillImageConfig config_;
  timeline::ArtifactNaming naming_;
};

}  // namespace nestlapse::encode

#endif  // NESTLAPSE_ENCODE_STILL_IMAGE_ENCODER_HPP_
