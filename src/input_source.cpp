#include "diffbot_teleop/input_source.hpp"

#include <cstdio>
#include <utility>

namespace diffbot_teleop
{

DiscreteKeyInput::DiscreteKeyInput(std::unique_ptr<KeyEventBackend> backend)
: backend_(std::move(backend))
{
  if (!backend_) {
    throw InputError("keyboard input needs a backend");
  }
}

PollResult DiscreteKeyInput::poll()
{
  PollResult result;
  bool quit = false;
  for (const auto & event : backend_->drain(quit)) {
    if (!mapper_.handle(event)) {
      quit = true;
    }
  }
  result.intent = mapper_.take_intent();
  result.quit = quit;
  return result;
}

void DiscreteKeyInput::show_status(const ControlState & state)
{
  char buf[96];
  std::snprintf(
    buf, sizeof(buf), "Robot ID: %d | VL: %.2f VR: %.2f",
    state.address.id(), state.command.left, state.command.right);

  std::string text(buf);
  const std::string keys = describe_keys(mapper_.intents());
  if (!keys.empty()) {
    text += " | " + keys;
  }
  backend_->set_status_text(text);
}

ContinuousAxisInput::ContinuousAxisInput(std::unique_ptr<AxisBackend> backend, double dead_zone)
: backend_(std::move(backend)), mapper_(dead_zone)
{
  if (!backend_) {
    throw InputError("joystick input needs a backend");
  }
}

PollResult ContinuousAxisInput::poll()
{
  PollResult result;
  bool quit = false;
  result.intent = mapper_.update(backend_->sample(quit));
  result.quit = quit;
  return result;
}

std::string ContinuousAxisInput::name() const
{
  return "joystick '" + backend_->device_name() + "'";
}

std::string describe_keys(const KeyIntents & intents)
{
  std::string out;
  auto add = [&out](const char * label) {
      if (!out.empty()) {out += ", ";}
      out += label;
    };
  if (intents.forward) {add("W/Up");}
  if (intents.backward) {add("S/Down");}
  if (intents.left) {add("A/Left");}
  if (intents.right) {add("D/Right");}
  return out;
}

}  // namespace diffbot_teleop
