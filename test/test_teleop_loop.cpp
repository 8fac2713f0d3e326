#include <gtest/gtest.h>

#include <cerrno>
#include <deque>
#include <initializer_list>
#include <memory>
#include <vector>

#include "diffbot_teleop/drive_frame.hpp"
#include "diffbot_teleop/input_source.hpp"
#include "diffbot_teleop/teleop_loop.hpp"

using namespace diffbot_teleop;

namespace
{

class FakeChannel : public ByteChannel
{
public:
  WriteResult write(const uint8_t * data, std::size_t size) override
  {
    if (!open_) {
      return WriteResult::failure(WriteError::NotOpen);
    }
    if (!failures_.empty() && failures_.front()) {
      failures_.pop_front();
      return WriteResult::failure(WriteError::Disconnected, EIO);
    }
    if (!failures_.empty()) {failures_.pop_front();}

    const auto frame = decode_frame(data, size);
    EXPECT_TRUE(frame.has_value());
    if (frame) {frames.push_back(*frame);}
    return WriteResult::success(size);
  }

  bool is_open() const override {return open_;}

  void close() override
  {
    if (open_) {
      open_ = false;
      ++close_count;
    }
  }

  std::string description() const override {return "fake";}

  // true = that write fails
  void script_failures(std::initializer_list<bool> pattern) {failures_.assign(pattern);}

  std::vector<DriveFrame> frames;
  int close_count{0};

private:
  bool open_{true};
  std::deque<bool> failures_;
};

class ScriptedKeys : public KeyEventBackend
{
public:
  std::vector<KeyEvent> drain(bool & quit) override
  {
    if (ticks_.empty()) {return {};}
    auto tick = ticks_.front();
    ticks_.pop_front();
    if (tick.quit) {quit = true;}
    return tick.events;
  }

  void set_status_text(const std::string & text) override {status = text;}

  void add_tick(std::vector<KeyEvent> events, bool quit = false)
  {
    ticks_.push_back(Tick{std::move(events), quit});
  }

  std::string status;

private:
  struct Tick
  {
    std::vector<KeyEvent> events;
    bool quit;
  };
  std::deque<Tick> ticks_;
};

class ScriptedStick : public AxisBackend
{
public:
  AxisSample sample(bool & quit) override
  {
    quit = quit_after_ == 0;
    if (quit_after_ > 0) {--quit_after_;}
    return current;
  }

  std::string device_name() const override {return "fake pad";}

  AxisSample current;
  int quit_after_{-1};
};

KeyEvent press(LogicalKey key) {return KeyEvent{key, true, false};}
KeyEvent release(LogicalKey key) {return KeyEvent{key, false, false};}

}  // namespace

TEST(TeleopLoop, KeyboardTicksSendOneFramePerTick)
{
  auto keys = std::make_unique<ScriptedKeys>();
  auto * script = keys.get();
  script->add_tick({press(LogicalKey::Forward)});
  script->add_tick({press(LogicalKey::Left)});
  script->add_tick({release(LogicalKey::Forward), release(LogicalKey::Left)});

  DiscreteKeyInput input(std::move(keys));
  FakeChannel channel;
  TeleopLoop loop(input, channel, MapperConfig{});

  EXPECT_TRUE(loop.tick());
  EXPECT_TRUE(loop.tick());
  EXPECT_TRUE(loop.tick());
  ASSERT_EQ(channel.frames.size(), 3u);

  EXPECT_FLOAT_EQ(channel.frames[0].left_velocity, 1.0f);
  EXPECT_FLOAT_EQ(channel.frames[0].right_velocity, 1.0f);
  EXPECT_FLOAT_EQ(channel.frames[1].left_velocity, 0.5f);
  EXPECT_FLOAT_EQ(channel.frames[1].right_velocity, 1.0f);
  EXPECT_FLOAT_EQ(channel.frames[2].left_velocity, 0.0f);
  EXPECT_FLOAT_EQ(channel.frames[2].right_velocity, 0.0f);
  EXPECT_EQ(loop.frames_sent(), 3u);
}

TEST(TeleopLoop, CycleKeyReaddressesNextFrame)
{
  auto keys = std::make_unique<ScriptedKeys>();
  auto * script = keys.get();
  script->add_tick({press(LogicalKey::CycleAddress)});
  script->add_tick({release(LogicalKey::CycleAddress), press(LogicalKey::CycleAddress)});
  script->add_tick({});

  DiscreteKeyInput input(std::move(keys));
  FakeChannel channel;
  TeleopLoop loop(input, channel, MapperConfig{}, RobotAddress(3));

  loop.tick();
  loop.tick();
  loop.tick();
  ASSERT_EQ(channel.frames.size(), 3u);
  EXPECT_EQ(channel.frames[0].robot_id, 0);
  EXPECT_EQ(channel.frames[1].robot_id, 1);
  EXPECT_EQ(channel.frames[2].robot_id, 1);
  EXPECT_EQ(script->status.rfind("Robot ID: 1", 0), 0u);
}

TEST(TeleopLoop, WriteFailureDoesNotStopTheLoop)
{
  ContinuousAxisInput input(std::make_unique<ScriptedStick>(), 0.1);
  FakeChannel channel;
  channel.script_failures({false, true, true, false});
  TeleopLoop loop(input, channel, MapperConfig{});

  for (int i = 0; i < 4; ++i) {
    EXPECT_TRUE(loop.tick());
  }
  EXPECT_TRUE(loop.running());
  EXPECT_EQ(loop.write_failures(), 2u);
  EXPECT_EQ(loop.frames_sent(), 2u);
  EXPECT_EQ(channel.frames.size(), 2u);
  EXPECT_TRUE(loop.last_write().ok());
}

TEST(TeleopLoop, QuitKeyStopsWithoutSending)
{
  auto keys = std::make_unique<ScriptedKeys>();
  keys->add_tick({press(LogicalKey::Forward)});
  keys->add_tick({press(LogicalKey::Quit)});

  DiscreteKeyInput input(std::move(keys));
  FakeChannel channel;
  TeleopLoop loop(input, channel, MapperConfig{});

  EXPECT_TRUE(loop.tick());
  EXPECT_FALSE(loop.tick());
  EXPECT_FALSE(loop.running());
  EXPECT_FALSE(loop.tick());
  EXPECT_EQ(channel.frames.size(), 1u);
}

TEST(TeleopLoop, WindowCloseStops)
{
  auto keys = std::make_unique<ScriptedKeys>();
  keys->add_tick({}, true);
  DiscreteKeyInput input(std::move(keys));
  FakeChannel channel;
  TeleopLoop loop(input, channel, MapperConfig{});
  EXPECT_FALSE(loop.tick());
}

TEST(TeleopLoop, ShutdownSendsStopFrameAndClosesOnce)
{
  auto stick = std::make_unique<ScriptedStick>();
  stick->current.forward_axis = -1.0;
  ContinuousAxisInput input(std::move(stick), 0.1);
  FakeChannel channel;
  TeleopLoop loop(input, channel, MapperConfig{}, RobotAddress(2));

  ASSERT_TRUE(loop.tick());
  loop.shutdown(true);
  loop.shutdown(true);

  EXPECT_EQ(channel.close_count, 1);
  EXPECT_FALSE(channel.is_open());
  EXPECT_TRUE(loop.is_shut_down());

  ASSERT_EQ(channel.frames.size(), 2u);
  EXPECT_FLOAT_EQ(channel.frames[0].left_velocity, 1.0f);
  EXPECT_EQ(channel.frames[1].robot_id, 2);
  EXPECT_FLOAT_EQ(channel.frames[1].left_velocity, 0.0f);
  EXPECT_FLOAT_EQ(channel.frames[1].right_velocity, 0.0f);
}

TEST(TeleopLoop, ShutdownAfterQuitWithoutStopFrame)
{
  auto stick = std::make_unique<ScriptedStick>();
  stick->quit_after_ = 1;
  ContinuousAxisInput input(std::move(stick), 0.1);
  FakeChannel channel;
  TeleopLoop loop(input, channel, MapperConfig{});

  EXPECT_TRUE(loop.tick());
  EXPECT_FALSE(loop.tick());
  loop.shutdown(false);

  EXPECT_EQ(channel.frames.size(), 1u);
  EXPECT_EQ(channel.close_count, 1);
  EXPECT_FALSE(loop.tick());
}

TEST(TeleopLoop, HeldJoystickButtonAdvancesOnce)
{
  auto stick = std::make_unique<ScriptedStick>();
  auto * pad = stick.get();
  ContinuousAxisInput input(std::move(stick), 0.1);
  FakeChannel channel;
  TeleopLoop loop(input, channel, MapperConfig{});

  pad->current.cycle_button = true;
  for (int i = 0; i < 5; ++i) {
    loop.tick();
  }
  EXPECT_EQ(loop.state().address.id(), 1);
}
