#ifndef DIFFBOT_TELEOP__INPUT_SOURCE_HPP_
#define DIFFBOT_TELEOP__INPUT_SOURCE_HPP_

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "diffbot_teleop/control_state.hpp"
#include "diffbot_teleop/input_mapper.hpp"

namespace diffbot_teleop
{

/// Raised when the input device can not be brought up (no controller, SDL init failed).
class InputError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

struct PollResult
{
  NormalizedIntent intent;
  bool quit{false};
};

/// One tick worth of operator input.
class InputSource
{
public:
  virtual ~InputSource() = default;

  virtual PollResult poll() = 0;

  // Called with what was sent, for whatever the backend shows the operator.
  virtual void show_status(const ControlState & /*state*/) {}

  virtual std::string name() const = 0;
};

// ---------------------------------------------------------------------------
// Backends. The SDL implementations live in sdl_input.hpp.

class KeyEventBackend
{
public:
  virtual ~KeyEventBackend() = default;

  // Everything queued since the last call. Sets quit on a window close request.
  virtual std::vector<KeyEvent> drain(bool & quit) = 0;

  virtual void set_status_text(const std::string & /*text*/) {}
};

class AxisBackend
{
public:
  virtual ~AxisBackend() = default;

  // Current snapshot. Sets quit on a window close / quit request.
  virtual AxisSample sample(bool & quit) = 0;

  virtual std::string device_name() const = 0;
};

// ---------------------------------------------------------------------------

class DiscreteKeyInput : public InputSource
{
public:
  explicit DiscreteKeyInput(std::unique_ptr<KeyEventBackend> backend);

  PollResult poll() override;
  void show_status(const ControlState & state) override;
  std::string name() const override {return "keyboard";}

  const KeyIntents & intents() const {return mapper_.intents();}

private:
  std::unique_ptr<KeyEventBackend> backend_;
  KeyboardMapper mapper_;
};

class ContinuousAxisInput : public InputSource
{
public:
  ContinuousAxisInput(std::unique_ptr<AxisBackend> backend, double dead_zone);

  PollResult poll() override;
  std::string name() const override;

private:
  std::unique_ptr<AxisBackend> backend_;
  AxisMapper mapper_;
};

// "W/Up, A/Left" style list of what is held, empty when nothing is.
std::string describe_keys(const KeyIntents & intents);

}  // namespace diffbot_teleop

#endif  // DIFFBOT_TELEOP__INPUT_SOURCE_HPP_
