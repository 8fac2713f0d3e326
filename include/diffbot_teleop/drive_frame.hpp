#ifndef DIFFBOT_TELEOP__DRIVE_FRAME_HPP_
#define DIFFBOT_TELEOP__DRIVE_FRAME_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "diffbot_teleop/control_state.hpp"

namespace diffbot_teleop
{

/// Layout of the packet on the UART, same as the firmware reads it.
/// Little endian, no start word, no checksum: the receiver reads 12 bytes per command.
/// All fields are 4 bytes so there is no padding to pack away.
struct DriveFrame
{
  int32_t robot_id;        // 0..3
  float   left_velocity;   // fraction of max speed
  float   right_velocity;  // fraction of max speed
};

static constexpr std::size_t DRIVE_FRAME_SIZE = 12;
static_assert(sizeof(DriveFrame) == DRIVE_FRAME_SIZE, "DriveFrame must be 12 bytes on the wire");

using FrameBytes = std::array<uint8_t, DRIVE_FRAME_SIZE>;

// The address is not range checked here, RobotAddress already guarantees it.
FrameBytes encode_frame(const RobotAddress & address, const WheelCommand & cmd);
FrameBytes encode_frame(const DriveFrame & frame);

// Returns nullopt unless exactly DRIVE_FRAME_SIZE bytes are given.
std::optional<DriveFrame> decode_frame(const uint8_t * data, std::size_t size);

inline std::optional<DriveFrame> decode_frame(const FrameBytes & bytes)
{
  return decode_frame(bytes.data(), bytes.size());
}

}  // namespace diffbot_teleop

#endif  // DIFFBOT_TELEOP__DRIVE_FRAME_HPP_
