#include <gtest/gtest.h>

#include <vector>

#include "diffbot_teleop/drive_frame.hpp"

using namespace diffbot_teleop;

TEST(DriveFrame, LayoutIsLittleEndianIdThenLeftThenRight)
{
  const FrameBytes bytes = encode_frame(RobotAddress(2), WheelCommand{1.0, -0.5});

  // int32 2
  EXPECT_EQ(bytes[0], 0x02);
  EXPECT_EQ(bytes[1], 0x00);
  EXPECT_EQ(bytes[2], 0x00);
  EXPECT_EQ(bytes[3], 0x00);
  // float 1.0f = 0x3F800000
  EXPECT_EQ(bytes[4], 0x00);
  EXPECT_EQ(bytes[5], 0x00);
  EXPECT_EQ(bytes[6], 0x80);
  EXPECT_EQ(bytes[7], 0x3F);
  // float -0.5f = 0xBF000000
  EXPECT_EQ(bytes[8], 0x00);
  EXPECT_EQ(bytes[9], 0x00);
  EXPECT_EQ(bytes[10], 0x00);
  EXPECT_EQ(bytes[11], 0xBF);
}

TEST(DriveFrame, StopFrameIsAllZeroApartFromId)
{
  const FrameBytes bytes = encode_frame(RobotAddress(3), WheelCommand{});
  EXPECT_EQ(bytes[0], 0x03);
  for (size_t i = 1; i < bytes.size(); ++i) {
    EXPECT_EQ(bytes[i], 0x00) << "byte " << i;
  }
}

TEST(DriveFrame, DecodeGivesBackWhatWasEncoded)
{
  const double values[] = {0.0, -1.0, 1.0, 0.25, -0.75, 1.5};
  for (int id = 0; id < ROBOT_COUNT; ++id) {
    for (double left : values) {
      for (double right : values) {
        const auto decoded = decode_frame(encode_frame(RobotAddress(id), WheelCommand{left, right}));
        ASSERT_TRUE(decoded.has_value());
        EXPECT_EQ(decoded->robot_id, id);
        EXPECT_FLOAT_EQ(decoded->left_velocity, static_cast<float>(left));
        EXPECT_FLOAT_EQ(decoded->right_velocity, static_cast<float>(right));
      }
    }
  }
}

TEST(DriveFrame, DecodeRejectsWrongLength)
{
  const FrameBytes bytes = encode_frame(RobotAddress(1), WheelCommand{0.5, 0.5});
  EXPECT_FALSE(decode_frame(bytes.data(), 11).has_value());

  std::vector<uint8_t> longer(bytes.begin(), bytes.end());
  longer.push_back(0);
  EXPECT_FALSE(decode_frame(longer.data(), longer.size()).has_value());

  EXPECT_FALSE(decode_frame(nullptr, DRIVE_FRAME_SIZE).has_value());
}

TEST(DriveFrame, EncodesStructFields)
{
  DriveFrame frame{1, 0.5f, -0.5f};
  const FrameBytes bytes = encode_frame(frame);

  const auto decoded = decode_frame(bytes);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->robot_id, 1);
  EXPECT_FLOAT_EQ(decoded->left_velocity, 0.5f);
  EXPECT_FLOAT_EQ(decoded->right_velocity, -0.5f);
}
