// Repository: nestlapse
// Component: H.264 Annex-B Writer
// Purpose: Depacketize H.264 RTP (RFC 6184) into a start-code prefixed
//          elementary stream.
// Copyright (c) 2025 nestlapse

#ifndef NESTLAPSE_CAPTURE_H264_ANNEXB_WRITER_HPP_
#define NESTLAPSE_CAPTURE_H264_ANNEXB_WRITER_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace nestlapse::capture {

// Handles single NAL unit packets, STAP-A (24) and FU-A (28). Output begins
// at the first SPS so the stream is decodable from byte zero; NAL units
// before it are discarded. Malformed or unsupported packets are dropped and
// counted.
//
// Not thread-safe; owned by a single consumer.
class H264AnnexBWriter {
 public:
  static constexpr uint8_t kNalSps = 7;
  static constexpr uint8_t kNalStapA = 24;
  static constexpr uint8_t kNalFuA = 28;

  H264AnnexBWriter() = default;

  // |packet| is a full RTP packet (header included). Returns false if it was
  // dropped as malformed.
  bool WriteRtpPacket(const uint8_t* packet, size_t size);

  // Payload only, RTP header already stripped.
  bool WritePayload(const uint8_t* payload, size_t size);

  const std::vector<uint8_t>& buffer() const { return buffer_; }
  std::vector<uint8_t> TakeBuffer();

  bool started() const { return started_; }
  size_t dropped_packets() const { return dropped_packets_; }
  size_t nal_units_written() const { return nal_units_written_; }

 private:
  void EmitNal(const uint8_t* nal, size_t size);
  bool Drop();

  std::vector<uint8_t> buffer_;
  std::vector<uint8_t> fragment_;  // FU-A reassembly, NAL header first
  bool in_fragment_ = false;
  bool started_ = false;
  size_t dropped_packets_ = 0;
  size_t nal_units_written_ = 0;
};

}  // namespace nestlapse::capture

#endif  // NESTLAPSE_CAPTURE_H264_ANNEXB_WRITER_HPP_
