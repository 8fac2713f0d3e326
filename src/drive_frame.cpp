#include "diffbot_teleop/drive_frame.hpp"

#include <cstring>

namespace diffbot_teleop
{

namespace
{

void put_u32_le(uint8_t * out, uint32_t v)
{
  out[0] = static_cast<uint8_t>(v & 0xFF);
  out[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
  out[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
  out[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

uint32_t get_u32_le(const uint8_t * in)
{
  return static_cast<uint32_t>(in[0]) |
         (static_cast<uint32_t>(in[1]) << 8) |
         (static_cast<uint32_t>(in[2]) << 16) |
         (static_cast<uint32_t>(in[3]) << 24);
}

uint32_t float_bits(float f)
{
  uint32_t bits;
  std::memcpy(&bits, &f, sizeof(bits));
  return bits;
}

float bits_float(uint32_t bits)
{
  float f;
  std::memcpy(&f, &bits, sizeof(f));
  return f;
}

}  // namespace

FrameBytes encode_frame(const DriveFrame & frame)
{
  // Byte order is written out by hand so the host endianness does not matter
  FrameBytes out{};
  put_u32_le(&out[0], static_cast<uint32_t>(frame.robot_id));
  put_u32_le(&out[4], float_bits(frame.left_velocity));
  put_u32_le(&out[8], float_bits(frame.right_velocity));
  return out;
}

FrameBytes encode_frame(const RobotAddress & address, const WheelCommand & cmd)
{
  DriveFrame frame{};
  frame.robot_id       = address.id();
  frame.left_velocity  = static_cast<float>(cmd.left);
  frame.right_velocity = static_cast<float>(cmd.right);
  return encode_frame(frame);
}

std::optional<DriveFrame> decode_frame(const uint8_t * data, std::size_t size)
{
  if (data == nullptr || size != DRIVE_FRAME_SIZE) {
    return std::nullopt;
  }

  DriveFrame frame{};
  frame.robot_id       = static_cast<int32_t>(get_u32_le(&data[0]));
  frame.left_velocity  = bits_float(get_u32_le(&data[4]));
  frame.right_velocity = bits_float(get_u32_le(&data[8]));
  return frame;
}

}  // namespace diffbot_teleop
