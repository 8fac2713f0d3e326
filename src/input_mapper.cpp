#include "diffbot_teleop/input_mapper.hpp"

#include <algorithm>
#include <cmath>

namespace diffbot_teleop
{

WheelCommand derive_velocities(const NormalizedIntent & intent, const MapperConfig & config)
{
  WheelCommand cmd;
  cmd.left  = (intent.forward + intent.turn) * config.max_speed;
  cmd.right = (intent.forward - intent.turn) * config.max_speed;

  if (config.clamp) {
    cmd.left  = std::clamp(cmd.left, -config.max_speed, config.max_speed);
    cmd.right = std::clamp(cmd.right, -config.max_speed, config.max_speed);
  }
  return cmd;
}

ControlState next_state(
  const ControlState & current, const NormalizedIntent & intent,
  const MapperConfig & config)
{
  ControlState next;
  next.address = intent.advance_address ? current.address.next() : current.address;
  next.command = derive_velocities(intent, config);
  return next;
}

bool KeyboardMapper::track(std::set<int32_t> & held, const KeyEvent & event)
{
  if (event.pressed) {
    held.insert(event.source);
  } else {
    held.erase(event.source);
  }
  return !held.empty();
}

bool KeyboardMapper::handle(const KeyEvent & event)
{
  switch (event.key) {
    case LogicalKey::Forward:
      intents_.forward = track(held_forward_, event);
      break;
    case LogicalKey::Backward:
      intents_.backward = track(held_backward_, event);
      break;
    case LogicalKey::Left:
      intents_.left = track(held_left_, event);
      break;
    case LogicalKey::Right:
      intents_.right = track(held_right_, event);
      break;
    case LogicalKey::CycleAddress:
      if (event.pressed && !event.repeat) {
        cycle_pending_ = true;
      }
      break;
    case LogicalKey::Quit:
      if (event.pressed) {
        return false;
      }
      break;
  }
  return true;
}

NormalizedIntent KeyboardMapper::take_intent()
{
  NormalizedIntent intent = to_intent(intents_);
  intent.advance_address = cycle_pending_;
  cycle_pending_ = false;
  return intent;
}

NormalizedIntent KeyboardMapper::to_intent(const KeyIntents & intents)
{
  // Turning keys drive each wheel at half speed in opposite directions
  NormalizedIntent intent;
  intent.forward = (intents.forward ? 1.0 : 0.0) - (intents.backward ? 1.0 : 0.0);
  intent.turn    = (intents.right ? 0.5 : 0.0) - (intents.left ? 0.5 : 0.0);
  return intent;
}

double AxisMapper::apply_dead_zone(double value) const
{
  if (std::abs(value) < dead_zone_) {return 0.0;}
  return value;
}

NormalizedIntent AxisMapper::update(const AxisSample & sample)
{
  NormalizedIntent intent;
  intent.forward = -apply_dead_zone(sample.forward_axis);
  intent.turn    = apply_dead_zone(sample.turn_axis);
  if (intent.forward == 0.0) {intent.forward = 0.0;}  // no -0.0 on the wire

  intent.advance_address = sample.cycle_button && !last_button_;
  last_button_ = sample.cycle_button;
  return intent;
}

double normalize_axis(int16_t raw)
{
  return std::clamp(static_cast<double>(raw) / 32767.0, -1.0, 1.0);
}

}  // namespace diffbot_teleop
