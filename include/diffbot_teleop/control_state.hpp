#ifndef DIFFBOT_TELEOP__CONTROL_STATE_HPP_
#define DIFFBOT_TELEOP__CONTROL_STATE_HPP_

#include <cstdint>

namespace diffbot_teleop
{

// Number of robots sharing the radio link, addressed 0..3
static constexpr int32_t ROBOT_COUNT = 4;

/// Id of the robot the frames are addressed to. Always in [0, ROBOT_COUNT).
class RobotAddress
{
public:
  RobotAddress() = default;

  // Out of range ids are wrapped into range
  explicit RobotAddress(int32_t id)
  : id_(((id % ROBOT_COUNT) + ROBOT_COUNT) % ROBOT_COUNT)
  {
  }

  int32_t id() const {return id_;}

  RobotAddress next() const {return RobotAddress(id_ + 1);}

  bool operator==(const RobotAddress & other) const {return id_ == other.id_;}
  bool operator!=(const RobotAddress & other) const {return id_ != other.id_;}

private:
  int32_t id_{0};
};

/// Wheel speeds as a fraction of the rated maximum.
struct WheelCommand
{
  double left{0.0};
  double right{0.0};
};

/// What gets sent on a tick: who, and how fast.
struct ControlState
{
  RobotAddress address;
  WheelCommand command;
};

}  // namespace diffbot_teleop

#endif  // DIFFBOT_TELEOP__CONTROL_STATE_HPP_
