// Repository: nestlapse
// Component: Encoder Failure Contract Tests
// Purpose: Still and timelapse encoders refuse bad input before touching
//          the output.
// Copyright (c) 2025 nestlapse

#include <gtest/gtest.h>

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "nestlapse/encode/StillImageEncoder.hpp"
#include "nestlapse/encode/TimelapseEncoder.hpp"

#include "../../fixtures/FixedTimeSource.h"

namespace nestlapse::encode {
namespace {

namespace fs = std::filesystem;
using tests::fixtures::LocalTime;

class EncoderFailureContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() /
            ("nestlapse_encode_test_" + std::to_string(getpid()) + "_" +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(root_);
    fs::create_directories(root_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  timeline::Schedule OneFrame(const fs::path& image) const {
    timeline::ScheduledFrame frame;
    frame.artifact.identifier = image.string();
    frame.artifact.captured_at = LocalTime(2024, 3, 20, 10, 0);
    return {frame};
  }

  fs::path root_;
};

TEST_F(EncoderFailureContractTest, StillRejectsEmptyBuffer) {
  StillImageConfig config;
  config.output_dir = root_.string();
  StillImageEncoder encoder(config);

  const EncodeResult r = encoder.EncodeStill({}, LocalTime(2024, 3, 20, 10, 0));
  EXPECT_FALSE(r.valid);
  EXPECT_EQ(r.error, EncodeError::kEmptyInput);
}

TEST_F(EncoderFailureContractTest, StillRejectsBufferWithoutPicture) {
  StillImageConfig config;
  config.output_dir = root_.string();
  StillImageEncoder encoder(config);

  const std::vector<uint8_t> no_picture = {0x00, 0x00, 0x00, 0x01, 0x09, 0xf0,
                                           0x00, 0x00, 0x00, 0x01, 0x09, 0xf0};
  const EncodeResult r = encoder.EncodeStill(no_picture, LocalTime(2024, 3, 20, 10, 0));
  EXPECT_FALSE(r.valid);
  EXPECT_EQ(r.error, EncodeError::kDecodeFailed);
  EXPECT_TRUE(fs::is_empty(root_));
}

TEST_F(EncoderFailureContractTest, TimelapseRejectsEmptySchedule) {
  TimelapseEncodeConfig config;
  config.output_path = (root_ / "out.mp4").string();
  TimelapseEncoder encoder(config);

  const EncodeResult r = encoder.Encode(timeline::Schedule());
  EXPECT_EQ(r.error, EncodeError::kEmptyInput);
}

TEST_F(EncoderFailureContractTest, TimelapseRefusesExistingOutput) {
  const fs::path out = root_ / "out.mp4";
  std::ofstream(out) << "previous";

  TimelapseEncodeConfig config;
  config.output_path = out.string();
  TimelapseEncoder encoder(config);

  const EncodeResult r = encoder.Encode(OneFrame(root_ / "frame.jpg"));
  EXPECT_EQ(r.error, EncodeError::kOutputExists);

  std::ifstream in(out);
  std::string contents;
  in >> contents;
  EXPECT_EQ(contents, "previous");
}

TEST_F(EncoderFailureContractTest, TimelapseReportsUnreadableImage) {
  TimelapseEncodeConfig config;
  config.output_path = (root_ / "out.mp4").string();
  TimelapseEncoder encoder(config);

  const EncodeResult r = encoder.Encode(OneFrame(root_ / "missing.jpg"));
  EXPECT_EQ(r.error, EncodeError::kDecodeFailed);
  EXPECT_NE(r.detail.find("missing.jpg"), std::string::npos);
}

}  // namespace
}  // namespace nestlapse::encode
