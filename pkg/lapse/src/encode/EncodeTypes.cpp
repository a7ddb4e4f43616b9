// Repository: nestlapse
// Component: Encoder Types
// Copyright (c) 2025 nestlapse

#include "nestlapse/encode/EncodeTypes.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace nestlapse::encode {

const char* EncodeErrorToString(EncodeError error) {
  switch (error) {
    case EncodeError::kNone:
      return "NONE";
    case EncodeError::kEncoderUnavailable:
      return "ENCODER_UNAVAILABLE";
    case EncodeError::kOutputExists:
      return "OUTPUT_EXISTS";
    case EncodeError::kIoError:
      return "IO_ERROR";
    case EncodeError::kDecodeFailed:
      return "DECODE_FAILED";
    case EncodeError::kEncodeFailed:
      return "ENCODE_FAILED";
    case EncodeError::kEmptyInput:
      return "EMPTY_INPUT";
    case EncodeError::kInvalidCrop:
      return "INVALID_CROP";
  }
  return "UNKNOWN";
}

namespace {

bool ParseFraction(const std::string& text, double* out) {
  if (text.empty()) return false;
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (errno != 0 || end != text.c_str() + text.size()) return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

CropParseResult CropFailure(const std::string& name, const std::string& text,
                            const std::string& why) {
  return {false, EncodeError::kInvalidCrop,
          "invalid " + name + " range '" + text + "': " + why, std::nullopt};
}

// Even offset and extent inside [0, extent].
void AxisSpan(int extent, const std::optional<CropRange>& range, int* offset, int* length) {
  if (!range) {
    *offset = 0;
    *length = extent;
    return;
  }
  int off = static_cast<int>(std::floor(extent * range->start));
  int len = static_cast<int>(std::floor(extent * (range->end - range->start)));
  off &= ~1;
  len &= ~1;
  len = std::max(len, 2);
  if (off + len > extent) {
    off = std::max(0, (extent - len) & ~1);
    len = std::min(len, extent);
  }
  *offset = off;
  *length = len;
}

}  // namespace

CropParseResult ParseCropRange(const std::string& text, const std::string& name) {
  if (text.empty()) {
    return {true, EncodeError::kNone, "", std::nullopt};
  }

  const size_t dash = text.find('-');
  if (dash == std::string::npos || text.find('-', dash + 1) != std::string::npos) {
    return CropFailure(name, text, "expected <start>-<end>");
  }

  CropRange range;
  if (!ParseFraction(text.substr(0, dash), &range.start) ||
      !ParseFraction(text.substr(dash + 1), &range.end)) {
    return CropFailure(name, text, "bounds must be numbers");
  }
  if (range.start < 0.0 || range.start > 1.0 || range.end < 0.0 || range.end > 1.0) {
    return CropFailure(name, text, "bounds must be within [0, 1]");
  }
  if (!(range.start < range.end)) {
    return CropFailure(name, text, "start must be less than end");
  }
  return {true, EncodeError::kNone, "", range};
}

CropRect ComputeCropRect(int width, int height,
                         const std::optional<CropRange>& crop_x,
                         const std::optional<CropRange>& crop_y) {
  CropRect rect;
  AxisSpan(width, crop_x, &rect.x, &rect.width);
  AxisSpan(height, crop_y, &rect.y, &rect.height);
  return rect;
}

}  // namespace nestlapse::encode
