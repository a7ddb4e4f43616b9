// Repository: nestlapse
// Component: Encoder Types
// Purpose: Encoder errors, configuration, crop ranges and the still /
//          timeline encoder interfaces.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_ENCODE_ENCODE_TYPES_HPP_
#define NESTLAPSE_ENCODE_ENCODE_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nestlapse/timeexpr/TimeTypes.hpp"
#include "nestlapse/timeline/TimelineTypes.hpp"

namespace nestlapse::encode {

enum class EncodeError {
  kNone = 0,
  kEncoderUnavailable,  // codec not built into the linked FFmpeg
  kOutputExists,        // target present and overwrite not requested
  kIoError,
  kDecodeFailed,
  kEncodeFailed,
  kEmptyInput,
  kInvalidCrop,
};

const char* EncodeErrorToString(EncodeError error);

struct EncodeResult {
  bool valid;
  EncodeError error;
  std::string detail;
  std::string output_path;
  int64_t frames_written = 0;

  static EncodeResult Success(const std::string& path, int64_t frames) {
    return {true, EncodeError::kNone, "", path, frames};
  }
  static EncodeResult Failure(EncodeError err, const std::string& detail) {
    return {false, err, detail, "", 0};
  }
};

// Fractional range of an image axis, 0 <= start < end <= 1.
struct CropRange {
  double start = 0.0;
  double end = 1.0;
};

struct CropParseResult {
  bool valid;
  EncodeError error;
  std::string detail;
  std::optional<CropRange> range;  // nullopt for empty input
};

// "0.4-0.6". Empty text means no crop. |name| labels the error ("crop-x").
CropParseResult ParseCropRange(const std::string& text, const std::string& name);

// Pixel rectangle; offsets and extents even, extents at least 2.
struct CropRect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
};

CropRect ComputeCropRect(int width, int height,
                         const std::optional<CropRange>& crop_x,
                         const std::optional<CropRange>& crop_y);

struct TimelapseEncodeConfig {
  std::string output_path = "timelapse.mp4";
  bool overwrite = false;
  int crf = 18;
  std::string preset = "slow";
  std::string tune = "stillimage";
  std::optional<CropRange> crop_x;
  std::optional<CropRange> crop_y;
};

struct StillImageConfig {
  std::string output_dir = "_output";
  int jpeg_qscale = 2;  // 2 (best) .. 31
};

// Raw Annex-B H.264 buffer -> one still image.
class IStillEncoder {
 public:
  virtual ~IStillEncoder() = default;
  virtual EncodeResult EncodeStill(const std::vector<uint8_t>& annexb,
                                   timeexpr::Timestamp captured_at) = 0;
};

// Schedule -> one assembled video.
class ITimelineEncoder {
 public:
  virtual ~ITimelineEncoder() = default;
  virtual EncodeResult Encode(const timeline::Schedule& schedule) = 0;
};

}  // namespace nestlapse::encode

#endif  // NESTLAPSE_ENCODE_ENCODE_TYPES_HPP_
