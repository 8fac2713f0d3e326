#ifndef DIFFBOT_TELEOP__SDL_INPUT_HPP_
#define DIFFBOT_TELEOP__SDL_INPUT_HPP_

#include <SDL2/SDL.h>

#include <optional>
#include <string>
#include <vector>

#include "diffbot_teleop/input_source.hpp"

namespace diffbot_teleop
{

// Arrow keys and WASD drive, X cycles the robot, Escape quits.
std::optional<LogicalKey> map_keycode(SDL_Keycode key);

/// Small SDL window that grabs the keyboard. Keys only arrive while it has focus.
class SdlKeyboardBackend : public KeyEventBackend
{
public:
  SdlKeyboardBackend();
  ~SdlKeyboardBackend() override;

  SdlKeyboardBackend(const SdlKeyboardBackend &) = delete;
  SdlKeyboardBackend & operator=(const SdlKeyboardBackend &) = delete;

  std::vector<KeyEvent> drain(bool & quit) override;
  void set_status_text(const std::string & text) override;

private:
  SDL_Window * window_{nullptr};
  std::string last_title_;
};

// Layout used for joysticks SDL has no controller mapping for
static constexpr int RAW_TURN_AXIS = 0;
static constexpr int RAW_FORWARD_AXIS = 1;
static constexpr int RAW_CYCLE_BUTTON = 0;

enum class PadAccess
{
  GameController,  // mapped: left stick + A
  RawJoystick,     // unmapped: raw axes 0/1 + button 0
  Missing,
};

PadAccess choose_pad_access(int index, int joystick_count, bool has_mapping);

/// Game controller read through the SDL mapping database (left stick + A button),
/// or a plain joystick read by raw axis and button number when there is no mapping.
class SdlGamepadBackend : public AxisBackend
{
public:
  explicit SdlGamepadBackend(int index = 0);
  ~SdlGamepadBackend() override;

  SdlGamepadBackend(const SdlGamepadBackend &) = delete;
  SdlGamepadBackend & operator=(const SdlGamepadBackend &) = delete;

  AxisSample sample(bool & quit) override;
  std::string device_name() const override {return name_;}

private:
  bool attached() const;

  SDL_GameController * controller_{nullptr};
  SDL_Joystick * joystick_{nullptr};
  std::string name_;
  bool detached_warned_{false};
};

}  // namespace diffbot_teleop

#endif  // DIFFBOT_TELEOP__SDL_INPUT_HPP_
