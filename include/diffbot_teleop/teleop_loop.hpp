#ifndef DIFFBOT_TELEOP__TELEOP_LOOP_HPP_
#define DIFFBOT_TELEOP__TELEOP_LOOP_HPP_

#include <rclcpp/logger.hpp>

#include <cstdint>

#include "diffbot_teleop/control_state.hpp"
#include "diffbot_teleop/input_mapper.hpp"
#include "diffbot_teleop/input_source.hpp"
#include "diffbot_teleop/serial_channel.hpp"

namespace diffbot_teleop
{

/// One control tick: poll input, derive the next state, encode, write.
/// Write failures are logged and the next tick simply tries again.
class TeleopLoop
{
public:
  TeleopLoop(
    InputSource & input, ByteChannel & channel, const MapperConfig & config,
    RobotAddress initial_address = RobotAddress(),
    rclcpp::Logger logger = rclcpp::get_logger("diffbot_teleop"));

  // Returns false once the operator asked to quit; the caller should then shut down.
  bool tick();

  // Optionally sends a zero-velocity frame, then closes the channel. Runs only once.
  void shutdown(bool send_stop);

  const ControlState & state() const {return state_;}
  bool running() const {return running_;}
  bool is_shut_down() const {return shut_down_;}

  uint64_t frames_sent() const {return frames_sent_;}
  uint64_t write_failures() const {return write_failures_;}
  const WriteResult & last_write() const {return last_write_;}

private:
  bool send(const ControlState & state);

  InputSource & input_;
  ByteChannel & channel_;
  MapperConfig config_;
  rclcpp::Logger logger_;

  ControlState state_;
  bool running_{true};
  bool shut_down_{false};

  uint64_t frames_sent_{0};
  uint64_t write_failures_{0};
  uint64_t failure_streak_{0};
  WriteResult last_write_;
};

}  // namespace diffbot_teleop

#endif  // DIFFBOT_TELEOP__TELEOP_LOOP_HPP_
