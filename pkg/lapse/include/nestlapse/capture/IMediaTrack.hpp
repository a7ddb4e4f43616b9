// Repository: nestlapse
// Component: Media Track Interface
// Purpose: One remote media stream delivering RTP packets.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_CAPTURE_IMEDIA_TRACK_HPP_
#define NESTLAPSE_CAPTURE_IMEDIA_TRACK_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "nestlapse/capture/CaptureTypes.hpp"

namespace nestlapse::capture {

enum class TrackReadStatus {
  kPacket = 0,
  kEndOfStream,
  kError,
};

class IMediaTrack {
 public:
  virtual ~IMediaTrack() = default;

  virtual MediaKind Kind() const = 0;

  // Codec MIME type as negotiated, e.g. "video/H264" or "audio/opus".
  virtual std::string CodecMimeType() const = 0;

  virtual std::string Id() const = 0;

  // Blocks until the next RTP packet, end of stream or a read error. Closing
  // the owning session must unblock a pending Read with kEndOfStream.
  virtual TrackReadStatus Read(std::vector<uint8_t>* packet) = 0;
};

}  // namespace nestlapse::capture

#endif  // NESTLAPSE_CAPTURE_IMEDIA_TRACK_HPP_
