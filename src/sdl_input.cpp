#include "diffbot_teleop/sdl_input.hpp"

#include <rclcpp/rclcpp.hpp>

namespace diffbot_teleop
{

namespace
{

rclcpp::Logger logger() {return rclcpp::get_logger("diffbot_teleop.sdl");}

void init_sdl(Uint32 flags)
{
  // SIGINT belongs to rclcpp, otherwise SDL turns it into an SDL_QUIT event
  SDL_SetHint(SDL_HINT_NO_SIGNAL_HANDLERS, "1");
  if (SDL_Init(flags) < 0) {
    throw InputError(std::string("SDL could not initialise: ") + SDL_GetError());
  }
}

}  // namespace

std::optional<LogicalKey> map_keycode(SDL_Keycode key)
{
  switch (key) {
    case SDLK_UP:
    case SDLK_w:
      return LogicalKey::Forward;
    case SDLK_DOWN:
    case SDLK_s:
      return LogicalKey::Backward;
    case SDLK_LEFT:
    case SDLK_a:
      return LogicalKey::Left;
    case SDLK_RIGHT:
    case SDLK_d:
      return LogicalKey::Right;
    case SDLK_x:
      return LogicalKey::CycleAddress;
    case SDLK_ESCAPE:
      return LogicalKey::Quit;
    default:
      return std::nullopt;
  }
}

// ---------------------------------------------------------------------------

SdlKeyboardBackend::SdlKeyboardBackend()
{
  init_sdl(SDL_INIT_VIDEO | SDL_INIT_EVENTS);

  window_ = SDL_CreateWindow(
    "Keyboard Control", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
    400, 250, SDL_WINDOW_SHOWN);
  if (!window_) {
    const std::string err = SDL_GetError();
    SDL_Quit();
    throw InputError("SDL could not open the keyboard window: " + err);
  }

  RCLCPP_INFO(logger(), "Use arrow keys or WASD to move the robot");
  RCLCPP_INFO(logger(), "W/Up: forward, S/Down: backward, A/Left: turn left, D/Right: turn right");
  RCLCPP_INFO(logger(), "Press X to change robot ID, ESC to exit");
}

SdlKeyboardBackend::~SdlKeyboardBackend()
{
  if (window_) {
    SDL_DestroyWindow(window_);
  }
  SDL_Quit();
}

std::vector<KeyEvent> SdlKeyboardBackend::drain(bool & quit)
{
  std::vector<KeyEvent> events;
  SDL_Event ev;
  while (SDL_PollEvent(&ev)) {
    if (ev.type == SDL_QUIT) {
      quit = true;
      continue;
    }
    if (ev.type != SDL_KEYDOWN && ev.type != SDL_KEYUP) {
      continue;
    }

    const auto key = map_keycode(ev.key.keysym.sym);
    if (!key) {
      continue;
    }
    events.push_back(
      KeyEvent{*key, ev.type == SDL_KEYDOWN, ev.key.repeat != 0,
        static_cast<int32_t>(ev.key.keysym.sym)});
  }
  return events;
}

void SdlKeyboardBackend::set_status_text(const std::string & text)
{
  if (text == last_title_) {
    return;
  }
  SDL_SetWindowTitle(window_, text.c_str());
  last_title_ = text;
}

// ---------------------------------------------------------------------------

PadAccess choose_pad_access(int index, int joystick_count, bool has_mapping)
{
  if (index < 0 || index >= joystick_count) {
    return PadAccess::Missing;
  }
  return has_mapping ? PadAccess::GameController : PadAccess::RawJoystick;
}

SdlGamepadBackend::SdlGamepadBackend(int index)
{
  init_sdl(SDL_INIT_GAMECONTROLLER);

  int n = SDL_NumJoysticks();
  RCLCPP_INFO(logger(), "SDL detected %d joysticks", n);
  for (int i = 0; i < n; ++i) {
    RCLCPP_INFO(logger(), "  %d: %s", i, SDL_JoystickNameForIndex(i));
  }

  const bool mapped = index >= 0 && index < n && SDL_IsGameController(index);
  switch (choose_pad_access(index, n, mapped)) {
    case PadAccess::Missing:
      SDL_Quit();
      throw InputError("No joystick connected at index " + std::to_string(index));

    case PadAccess::GameController: {
        controller_ = SDL_GameControllerOpen(index);
        if (!controller_) {
          const std::string err = SDL_GetError();
          SDL_Quit();
          throw InputError("Could not open game controller: " + err);
        }
        const char * name = SDL_GameControllerName(controller_);
        name_ = name ? name : "unknown";
        break;
      }

    case PadAccess::RawJoystick: {
        joystick_ = SDL_JoystickOpen(index);
        if (!joystick_) {
          const std::string err = SDL_GetError();
          SDL_Quit();
          throw InputError("Could not open joystick: " + err);
        }
        if (SDL_JoystickNumAxes(joystick_) <= RAW_FORWARD_AXIS ||
          SDL_JoystickNumButtons(joystick_) <= RAW_CYCLE_BUTTON)
        {
          SDL_JoystickClose(joystick_);
          SDL_Quit();
          throw InputError("Joystick needs at least 2 axes and 1 button");
        }
        const char * name = SDL_JoystickName(joystick_);
        name_ = name ? name : "unknown";
        RCLCPP_WARN(
          logger(), "No controller mapping for '%s', reading raw axes %d/%d and button %d",
          name_.c_str(), RAW_TURN_AXIS, RAW_FORWARD_AXIS, RAW_CYCLE_BUTTON);
        break;
      }
  }
}

SdlGamepadBackend::~SdlGamepadBackend()
{
  if (controller_) {
    SDL_GameControllerClose(controller_);
  }
  if (joystick_) {
    SDL_JoystickClose(joystick_);
  }
  SDL_Quit();
}

bool SdlGamepadBackend::attached() const
{
  if (controller_) {
    return SDL_GameControllerGetAttached(controller_);
  }
  return SDL_JoystickGetAttached(joystick_);
}

AxisSample SdlGamepadBackend::sample(bool & quit)
{
  SDL_Event ev;
  while (SDL_PollEvent(&ev)) {
    if (ev.type == SDL_QUIT) {
      quit = true;
    }
  }

  AxisSample s;
  if (!attached()) {
    // Unplugged: report a centred stick so the robot stops
    if (!detached_warned_) {
      RCLCPP_WARN(logger(), "Controller '%s' disconnected, sending zero velocity", name_.c_str());
      detached_warned_ = true;
    }
    return s;
  }
  detached_warned_ = false;

  if (controller_) {
    SDL_GameControllerUpdate();
    s.forward_axis = normalize_axis(SDL_GameControllerGetAxis(controller_, SDL_CONTROLLER_AXIS_LEFTY));
    s.turn_axis    = normalize_axis(SDL_GameControllerGetAxis(controller_, SDL_CONTROLLER_AXIS_LEFTX));
    // A in the SDL layout, the cross button on a PlayStation pad
    s.cycle_button = SDL_GameControllerGetButton(controller_, SDL_CONTROLLER_BUTTON_A) != 0;
  } else {
    SDL_JoystickUpdate();
    s.forward_axis = normalize_axis(SDL_JoystickGetAxis(joystick_, RAW_FORWARD_AXIS));
    s.turn_axis    = normalize_axis(SDL_JoystickGetAxis(joystick_, RAW_TURN_AXIS));
    s.cycle_button = SDL_JoystickGetButton(joystick_, RAW_CYCLE_BUTTON) != 0;
  }
  return s;
}

}  // namespace diffbot_teleop
