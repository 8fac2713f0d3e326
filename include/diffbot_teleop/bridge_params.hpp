#ifndef DIFFBOT_TELEOP__BRIDGE_PARAMS_HPP_
#define DIFFBOT_TELEOP__BRIDGE_PARAMS_HPP_

#include <string>

#include "diffbot_teleop/input_mapper.hpp"
#include "diffbot_teleop/port_resolver.hpp"
#include "diffbot_teleop/serial_channel.hpp"

namespace diffbot_teleop
{

enum class InputMode
{
  Keyboard,
  Joystick,
};

// "keyboard" / "joystick", throws std::invalid_argument otherwise
InputMode parse_input_mode(const std::string & text);

/// Everything the bridge node reads from its ROS parameters.
struct BridgeParams
{
  InputMode input_mode{InputMode::Keyboard};
  int joystick_index{0};

  // Empty = look the port up by USB id
  std::string device;
  std::string sysfs_tty_root{"/sys/class/tty"};
  std::string dev_root{"/dev"};
  UsbSignature usb;
  int resolve_attempts{3};
  int resolve_retry_delay_ms{1000};

  int baudrate{DEFAULT_BAUDRATE};
  int timeout_ms{DEFAULT_TIMEOUT_MS};

  int tick_period_ms{50};
  int status_period_ms{1000};
  MapperConfig mapper;
  int initial_robot_id{0};
  bool send_stop_on_exit{true};

  // Throws std::invalid_argument naming the first bad parameter, SerialError for the baud rate
  void validate() const;
};

}  // namespace diffbot_teleop

#endif  // DIFFBOT_TELEOP__BRIDGE_PARAMS_HPP_
