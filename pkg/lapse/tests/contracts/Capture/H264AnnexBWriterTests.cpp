// Repository: nestlapse
// Component: H.264 Annex-B Writer Tests
// Purpose: RTP depacketization modes, keyframe gating and malformed input.
// Copyright (c) 2025 nestlapse

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "nestlapse/capture/H264AnnexBWriter.hpp"

#include "../../fixtures/H264Packets.h"

namespace nestlapse::capture {
namespace {

using namespace tests::fixtures;

bool Write(H264AnnexBWriter& writer, const std::vector<uint8_t>& payload) {
  const std::vector<uint8_t> packet = RtpPacket(payload);
  return writer.WriteRtpPacket(packet.data(), packet.size());
}

TEST(H264AnnexBWriter, SingleNalUnitsAfterSps) {
  H264AnnexBWriter writer;
  EXPECT_TRUE(Write(writer, kSpsNal));
  EXPECT_TRUE(Write(writer, kPpsNal));
  EXPECT_TRUE(Write(writer, kIdrNal));

  EXPECT_TRUE(writer.started());
  EXPECT_EQ(writer.buffer(), AnnexB({kSpsNal, kPpsNal, kIdrNal}));
  EXPECT_EQ(writer.nal_units_written(), 3u);
  EXPECT_EQ(writer.dropped_packets(), 0u);
}

TEST(H264AnnexBWriter, DiscardsEverythingBeforeFirstSps) {
  H264AnnexBWriter writer;
  EXPECT_TRUE(Write(writer, kSliceNal));
  EXPECT_TRUE(Write(writer, kPpsNal));
  EXPECT_FALSE(writer.started());
  EXPECT_TRUE(writer.buffer().empty());

  EXPECT_TRUE(Write(writer, kSpsNal));
  EXPECT_TRUE(Write(writer, kSliceNal));
  EXPECT_EQ(writer.buffer(), AnnexB({kSpsNal, kSliceNal}));
}

TEST(H264AnnexBWriter, StapAUnpacksAggregatedUnits) {
  H264AnnexBWriter writer;
  EXPECT_TRUE(Write(writer, StapA({kSpsNal, kPpsNal, kIdrNal})));
  EXPECT_EQ(writer.buffer(), AnnexB({kSpsNal, kPpsNal, kIdrNal}));
}

TEST(H264AnnexBWriter, FuAReassemblesFragments) {
  H264AnnexBWriter writer;
  ASSERT_TRUE(Write(writer, kSpsNal));

  std::vector<uint8_t> big_idr = {0x65};
  for (int i = 0; i < 50; ++i) big_idr.push_back(static_cast<uint8_t>(i));

  const auto fragments = FuA(big_idr, 16);
  ASSERT_GT(fragments.size(), 2u);
  for (const auto& f : fragments) {
    EXPECT_TRUE(Write(writer, f));
  }
  EXPECT_EQ(writer.buffer(), AnnexB({kSpsNal, big_idr}));
}

TEST(H264AnnexBWriter, FuAContinuationWithoutStartIsDropped) {
  H264AnnexBWriter writer;
  ASSERT_TRUE(Write(writer, kSpsNal));

  std::vector<uint8_t> idr = {0x65, 1, 2, 3, 4, 5, 6, 7, 8};
  const auto fragments = FuA(idr, 3);
  ASSERT_EQ(fragments.size(), 3u);
  // Lose the start fragment.
  EXPECT_FALSE(Write(writer, fragments[1]));
  EXPECT_FALSE(Write(writer, fragments[2]));

  EXPECT_EQ(writer.dropped_packets(), 2u);
  EXPECT_EQ(writer.buffer(), AnnexB({kSpsNal}));
}

TEST(H264AnnexBWriter, MalformedPacketsAreCountedNotFatal) {
  H264AnnexBWriter writer;
  const std::vector<uint8_t> too_short = {0x80, 96, 0, 1};
  EXPECT_FALSE(writer.WriteRtpPacket(too_short.data(), too_short.size()));

  std::vector<uint8_t> wrong_version = RtpPacket(kSpsNal);
  wrong_version[0] = 0x40;
  EXPECT_FALSE(writer.WriteRtpPacket(wrong_version.data(), wrong_version.size()));

  // STAP-A whose length prefix overruns the payload.
  EXPECT_FALSE(Write(writer, {0x78, 0x00, 0x20, 0x67}));
  // Reserved NAL type.
  EXPECT_FALSE(Write(writer, {0x1e, 0x00}));

  EXPECT_EQ(writer.dropped_packets(), 4u);
  EXPECT_TRUE(writer.buffer().empty());

  EXPECT_TRUE(Write(writer, kSpsNal));
  EXPECT_EQ(writer.buffer(), AnnexB({kSpsNal}));
}

TEST(H264AnnexBWriter, SkipsCsrcAndHeaderExtension) {
  H264AnnexBWriter writer;
  std::vector<uint8_t> packet = {
      0x91, 96, 0, 1,           // V=2, X=1, CC=1
      0, 0, 0, 0,               // timestamp
      1, 2, 3, 4,               // SSRC
      9, 9, 9, 9,               // CSRC
      0xbe, 0xde, 0x00, 0x01,   // extension header, one word
      0xaa, 0xbb, 0xcc, 0xdd};  // extension body
  packet.insert(packet.end(), kSpsNal.begin(), kSpsNal.end());

  EXPECT_TRUE(writer.WriteRtpPacket(packet.data(), packet.size()));
  EXPECT_EQ(writer.buffer(), AnnexB({kSpsNal}));
}

TEST(H264AnnexBWriter, TakeBufferEmptiesWriter) {
  H264AnnexBWriter writer;
  ASSERT_TRUE(Write(writer, kSpsNal));
  const std::vector<uint8_t> taken = writer.TakeBuffer();
  EXPECT_EQ(taken, AnnexB({kSpsNal}));
  EXPECT_TRUE(writer.buffer().empty());
}

}  // namespace
}  // namespace nestlapse::capture
