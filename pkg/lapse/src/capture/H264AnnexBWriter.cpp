// Repository: nestlapse
// Component: H.264 Annex-B Writer Implementation
// Copyright (c) 2025 nestlapse

#include "nestlapse/capture/H264AnnexBWriter.hpp"

#include <iterator>
#include <utility>

namespace nestlapse::capture {

namespace {

constexpr uint8_t kStartCode[] = {0x00, 0x00, 0x00, 0x01};
constexpr size_t kRtpHeaderSize = 12;
constexpr uint8_t kRtpVersion = 2;

}  // namespace

std::vector<uint8_t> H264AnnexBWriter::TakeBuffer() {
  std::vector<uint8_t> out;
  out.swap(buffer_);
  return out;
}

bool H264AnnexBWriter::Drop() {
  ++dropped_packets_;
  return false;
}

bool H264AnnexBWriter::WriteRtpPacket(const uint8_t* packet, size_t size) {
  if (packet == nullptr || size < kRtpHeaderSize) return Drop();
  if ((packet[0] >> 6) != kRtpVersion) return Drop();

  const bool padding = (packet[0] & 0x20) != 0;
  const bool extension = (packet[0] & 0x10) != 0;
  const size_t csrc_count = packet[0] & 0x0F;

  size_t offset = kRtpHeaderSize + 4 * csrc_count;
  if (extension) {
    if (offset + 4 > size) return Drop();
    const size_t ext_words =
        (static_cast<size_t>(packet[offset + 2]) << 8) | packet[offset + 3];
    offset += 4 + 4 * ext_words;
  }

  size_t end = size;
  if (padding) {
    const size_t pad = packet[size - 1];
    if (pad == 0 || pad > size) return Drop();
    end = size - pad;
  }
  if (offset >= end) return Drop();

  return WritePayload(packet + offset, end - offset);
}

bool H264AnnexBWriter::WritePayload(const uint8_t* payload, size_t size) {
  if (payload == nullptr || size == 0) return Drop();

  const uint8_t nal_type = payload[0] & 0x1F;

  if (nal_type >= 1 && nal_type <= 23) {
    // A single NAL unit abandons any unfinished fragment.
    in_fragment_ = false;
    EmitNal(payload, size);
    return true;
  }

  if (nal_type == kNalStapA) {
    // Validate every aggregated unit before emitting any of them.
    size_t pos = 1;
    if (pos >= size) return Drop();
    while (pos < size) {
      if (pos + 2 > size) return Drop();
      const size_t nal_size = (static_cast<size_t>(payload[pos]) << 8) | payload[pos + 1];
      pos += 2;
      if (nal_size == 0 || pos + nal_size > size) return Drop();
      pos += nal_size;
    }
    pos = 1;
    while (pos < size) {
      const size_t nal_size = (static_cast<size_t>(payload[pos]) << 8) | payload[pos + 1];
      pos += 2;
      EmitNal(payload + pos, nal_size);
      pos += nal_size;
    }
    in_fragment_ = false;
    return true;
  }

  if (nal_type == kNalFuA) {
    if (size < 3) return Drop();
    const uint8_t fu_indicator = payload[0];
    const uint8_t fu_header = payload[1];
    const bool start = (fu_header & 0x80) != 0;
    const bool end = (fu_header & 0x40) != 0;

    if (start) {
      fragment_.clear();
      fragment_.push_back(static_cast<uint8_t>((fu_indicator & 0xE0) | (fu_header & 0x1F)));
      in_fragment_ = true;
    } else if (!in_fragment_) {
      // Continuation whose start was lost.
      return Drop();
    }

    fragment_.insert(fragment_.end(), payload + 2, payload + size);
    if (end) {
      EmitNal(fragment_.data(), fragment_.size());
      fragment_.clear();
      in_fragment_ = false;
    }
    return true;
  }

  // STAP-B, MTAP, FU-B and reserved types.
  return Drop();
}

void H264AnnexBWriter::EmitNal(const uint8_t* nal, size_t size) {
  if (size == 0) return;
  const uint8_t nal_type = nal[0] & 0x1F;
  if (!started_) {
    if (nal_type != kNalSps) return;
    started_ = true;
  }
  buffer_.insert(buffer_.end(), std::begin(kStartCode), std::end(kStartCode));
  buffer_.insert(buffer_.end(), nal, nal + size);
  ++nal_units_written_;
}

}  // namespace nestlapse::capture
