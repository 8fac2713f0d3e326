#include "diffbot_teleop/bridge_params.hpp"

#include <stdexcept>

namespace diffbot_teleop
{

InputMode parse_input_mode(const std::string & text)
{
  if (text == "keyboard") {return InputMode::Keyboard;}
  if (text == "joystick") {return InputMode::Joystick;}
  throw std::invalid_argument("input_mode must be 'keyboard' or 'joystick', got '" + text + "'");
}

void BridgeParams::validate() const
{
  auto fail = [](const std::string & what) {
      throw std::invalid_argument(what);
    };

  if (tick_period_ms <= 0) {fail("tick_period_ms must be > 0");}
  if (status_period_ms < 0) {fail("status_period_ms must be >= 0");}
  if (!(mapper.max_speed > 0.0)) {fail("max_speed must be > 0");}
  if (mapper.dead_zone < 0.0 || mapper.dead_zone >= 1.0) {fail("dead_zone must be in [0, 1)");}
  if (timeout_ms <= 0) {fail("timeout_ms must be > 0");}
  if (resolve_attempts < 1) {fail("resolve_attempts must be >= 1");}
  if (resolve_retry_delay_ms < 0) {fail("resolve_retry_delay_ms must be >= 0");}
  if (initial_robot_id < 0 || initial_robot_id >= ROBOT_COUNT) {
    fail("initial_robot_id must be in [0, " + std::to_string(ROBOT_COUNT) + ")");
  }
  if (joystick_index < 0) {fail("joystick_index must be >= 0");}

  // These throw with their own message
  normalize_usb_id(usb.vendor_id);
  normalize_usb_id(usb.product_id);
  baud_to_speed(baudrate);
}

}  // namespace diffbot_teleop
