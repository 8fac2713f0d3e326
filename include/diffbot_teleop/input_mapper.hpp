#ifndef DIFFBOT_TELEOP__INPUT_MAPPER_HPP_
#define DIFFBOT_TELEOP__INPUT_MAPPER_HPP_

#include <cstdint>
#include <set>

#include "diffbot_teleop/control_state.hpp"

namespace diffbot_teleop
{

static constexpr double DEFAULT_MAX_SPEED = 1.0;
static constexpr double DEFAULT_DEAD_ZONE = 0.1;

struct MapperConfig
{
  double max_speed{DEFAULT_MAX_SPEED};
  double dead_zone{DEFAULT_DEAD_ZONE};
  // Saturate each wheel to [-max_speed, max_speed] after mixing
  bool clamp{true};
};

/// Input reduced to what the drive mix needs. Both input variants produce this.
struct NormalizedIntent
{
  double forward{0.0};   // +1 full ahead, -1 full reverse
  double turn{0.0};      // +1 spins right (left wheel forward)
  bool advance_address{false};  // already edge filtered
};

// left = (forward + turn) * max_speed, right = (forward - turn) * max_speed
WheelCommand derive_velocities(const NormalizedIntent & intent, const MapperConfig & config);

// Pure per-tick state transition
ControlState next_state(
  const ControlState & current, const NormalizedIntent & intent,
  const MapperConfig & config);

// ---------------------------------------------------------------------------
// Keyboard variant

enum class LogicalKey
{
  Forward,
  Backward,
  Left,
  Right,
  CycleAddress,
  Quit,
};

struct KeyEvent
{
  LogicalKey key;
  bool pressed;      // false = released
  bool repeat{false};  // auto repeat while held
  int32_t source{0};   // physical key (keycode), several can map to one LogicalKey
};

struct KeyIntents
{
  bool forward{false};
  bool backward{false};
  bool left{false};
  bool right{false};
};

/// Keeps the held direction flags between ticks and turns them into an intent.
class KeyboardMapper
{
public:
  // Applies one event. Returns false when the event asks to quit.
  bool handle(const KeyEvent & event);

  // Intent for this tick. The cycle request is consumed by the call.
  NormalizedIntent take_intent();

  const KeyIntents & intents() const {return intents_;}

  static NormalizedIntent to_intent(const KeyIntents & intents);

private:
  // A direction stays on while any of its physical keys is down
  bool track(std::set<int32_t> & held, const KeyEvent & event);

  KeyIntents intents_;
  std::set<int32_t> held_forward_;
  std::set<int32_t> held_backward_;
  std::set<int32_t> held_left_;
  std::set<int32_t> held_right_;
  bool cycle_pending_{false};
};

// ---------------------------------------------------------------------------
// Joystick variant

struct AxisSample
{
  double forward_axis{0.0};  // raw, push forward reads negative
  double turn_axis{0.0};     // raw, right is positive
  bool cycle_button{false};
};

class AxisMapper
{
public:
  explicit AxisMapper(double dead_zone = DEFAULT_DEAD_ZONE)
  : dead_zone_(dead_zone)
  {
  }

  // Only a false -> true transition of the button advances the address
  NormalizedIntent update(const AxisSample & sample);

  double apply_dead_zone(double value) const;

private:
  double dead_zone_;
  bool last_button_{false};
};

// Map SDL axis range [-32768, 32767] to [-1.0, 1.0]
double normalize_axis(int16_t raw);

}  // namespace diffbot_teleop

#endif  // DIFFBOT_TELEOP__INPUT_MAPPER_HPP_
