#include "diffbot_teleop/teleop_loop.hpp"

#include <rclcpp/rclcpp.hpp>

#include "diffbot_teleop/drive_frame.hpp"

namespace diffbot_teleop
{

TeleopLoop::TeleopLoop(
  InputSource & input, ByteChannel & channel, const MapperConfig & config,
  RobotAddress initial_address, rclcpp::Logger logger)
: input_(input), channel_(channel), config_(config), logger_(logger)
{
  state_.address = initial_address;
}

bool TeleopLoop::tick()
{
  if (!running_) {
    return false;
  }

  const PollResult polled = input_.poll();
  if (polled.quit) {
    RCLCPP_INFO(logger_, "Quit requested by %s", input_.name().c_str());
    running_ = false;
    return false;
  }

  const ControlState next = next_state(state_, polled.intent, config_);
  if (next.address != state_.address) {
    RCLCPP_INFO(logger_, "Robot ID changed to: %d", next.address.id());
  }
  state_ = next;

  send(state_);
  input_.show_status(state_);
  return true;
}

bool TeleopLoop::send(const ControlState & state)
{
  const FrameBytes frame = encode_frame(state.address, state.command);
  last_write_ = channel_.write(frame.data(), frame.size());

  if (!last_write_.ok()) {
    ++write_failures_;
    // First failure of a streak is a warning, the rest would flood the console at tick rate
    if (failure_streak_++ == 0) {
      RCLCPP_WARN(
        logger_, "Error sending data to %s: %s", channel_.description().c_str(),
        last_write_.message().c_str());
    } else {
      RCLCPP_DEBUG(logger_, "Error sending data: %s", last_write_.message().c_str());
    }
    return false;
  }

  if (failure_streak_ > 0) {
    RCLCPP_INFO(
      logger_, "Serial link recovered after %lu failed writes",
      static_cast<unsigned long>(failure_streak_));
    failure_streak_ = 0;
  }

  ++frames_sent_;
  RCLCPP_DEBUG(
    logger_, "Sent: ID=%d, VL=%.2f, VR=%.2f",
    state.address.id(), state.command.left, state.command.right);
  return true;
}

void TeleopLoop::shutdown(bool send_stop)
{
  if (shut_down_) {
    return;
  }
  shut_down_ = true;
  running_ = false;

  if (send_stop && channel_.is_open()) {
    ControlState stop = state_;
    stop.command = WheelCommand{};
    if (send(stop)) {
      state_ = stop;
      RCLCPP_INFO(logger_, "Sent stop frame to robot %d", stop.address.id());
    }
  }

  channel_.close();
  RCLCPP_INFO(
    logger_, "Shutting down: %lu frames sent, %lu failed writes",
    static_cast<unsigned long>(frames_sent_), static_cast<unsigned long>(write_failures_));
}

}  // namespace diffbot_teleop
