// src/teleop_bridge_node.cpp

#include <rclcpp/rclcpp.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "diffbot_teleop/bridge_params.hpp"
#include "diffbot_teleop/input_source.hpp"
#include "diffbot_teleop/port_resolver.hpp"
#include "diffbot_teleop/sdl_input.hpp"
#include "diffbot_teleop/serial_channel.hpp"
#include "diffbot_teleop/teleop_loop.hpp"

using namespace diffbot_teleop;

class TeleopBridgeNode : public rclcpp::Node
{
public:
  TeleopBridgeNode()
  : Node("teleop_bridge")
  {
    declare_parameters();

    try {
      params_ = read_parameters();
      params_.validate();

      SerialConfig serial;
      serial.device     = find_device();
      serial.baudrate   = params_.baudrate;
      serial.timeout_ms = params_.timeout_ms;
      channel_ = std::make_unique<SerialChannel>(serial);
      RCLCPP_INFO(get_logger(), "Connected to STM32 on port %s", serial.device.c_str());

      input_ = make_input();
      RCLCPP_INFO(get_logger(), "Input: %s", input_->name().c_str());
    } catch (const std::exception & e) {
      RCLCPP_FATAL(get_logger(), "%s", e.what());
      channel_.reset();
      rclcpp::shutdown();
      return;
    }

    loop_ = std::make_unique<TeleopLoop>(
      *input_, *channel_, params_.mapper, RobotAddress(params_.initial_robot_id), get_logger());

    timer_ = create_wall_timer(
      std::chrono::milliseconds(params_.tick_period_ms),
      std::bind(&TeleopBridgeNode::on_tick, this));

    if (params_.status_period_ms > 0) {
      status_timer_ = create_wall_timer(
        std::chrono::milliseconds(params_.status_period_ms),
        std::bind(&TeleopBridgeNode::on_status, this));
    }

    RCLCPP_INFO(
      get_logger(), "Sending to robot %d every %d ms (max_speed %.2f, clamp %s)",
      params_.initial_robot_id, params_.tick_period_ms, params_.mapper.max_speed,
      params_.mapper.clamp ? "on" : "off");
  }

  ~TeleopBridgeNode() override
  {
    stop();
  }

  bool ready() const {return loop_ != nullptr;}

  // Stop frame, close the port, release SDL. Safe to call twice.
  void stop()
  {
    if (timer_) {timer_->cancel();}
    if (status_timer_) {status_timer_->cancel();}
    if (loop_) {
      loop_->shutdown(params_.send_stop_on_exit);
    }
    loop_.reset();
    input_.reset();
    channel_.reset();
  }

private:
  void declare_parameters()
  {
    const BridgeParams d;
    declare_parameter<std::string>("input_mode", "keyboard");
    declare_parameter<int>("joystick_index", d.joystick_index);
    declare_parameter<std::string>("device", d.device);
    declare_parameter<std::string>("sysfs_tty_root", d.sysfs_tty_root);
    declare_parameter<std::string>("dev_root", d.dev_root);
    declare_parameter<std::string>("usb_vendor_id", d.usb.vendor_id);
    declare_parameter<std::string>("usb_product_id", d.usb.product_id);
    declare_parameter<int>("resolve_attempts", d.resolve_attempts);
    declare_parameter<int>("resolve_retry_delay_ms", d.resolve_retry_delay_ms);
    declare_parameter<int>("baudrate", d.baudrate);
    declare_parameter<int>("timeout_ms", d.timeout_ms);
    declare_parameter<int>("tick_period_ms", d.tick_period_ms);
    declare_parameter<int>("status_period_ms", d.status_period_ms);
    declare_parameter<double>("max_speed", d.mapper.max_speed);
    declare_parameter<double>("dead_zone", d.mapper.dead_zone);
    declare_parameter<bool>("clamp_velocities", d.mapper.clamp);
    declare_parameter<int>("initial_robot_id", d.initial_robot_id);
    declare_parameter<bool>("send_stop_on_exit", d.send_stop_on_exit);
  }

  BridgeParams read_parameters()
  {
    BridgeParams p;
    p.input_mode = parse_input_mode(get_parameter("input_mode").as_string());
    get_parameter("joystick_index", p.joystick_index);
    get_parameter("device", p.device);
    get_parameter("sysfs_tty_root", p.sysfs_tty_root);
    get_parameter("dev_root", p.dev_root);
    get_parameter("usb_vendor_id", p.usb.vendor_id);
    get_parameter("usb_product_id", p.usb.product_id);
    get_parameter("resolve_attempts", p.resolve_attempts);
    get_parameter("resolve_retry_delay_ms", p.resolve_retry_delay_ms);
    get_parameter("baudrate", p.baudrate);
    get_parameter("timeout_ms", p.timeout_ms);
    get_parameter("tick_period_ms", p.tick_period_ms);
    get_parameter("status_period_ms", p.status_period_ms);
    get_parameter("max_speed", p.mapper.max_speed);
    get_parameter("dead_zone", p.mapper.dead_zone);
    get_parameter("clamp_velocities", p.mapper.clamp);
    get_parameter("initial_robot_id", p.initial_robot_id);
    get_parameter("send_stop_on_exit", p.send_stop_on_exit);
    return p;
  }

  std::string find_device()
  {
    if (!params_.device.empty()) {
      RCLCPP_INFO(get_logger(), "Using configured device %s", params_.device.c_str());
      return params_.device;
    }

    PortResolver resolver(params_.usb, params_.sysfs_tty_root, params_.dev_root);
    for (int attempt = 1; ; ++attempt) {
      try {
        return resolver.resolve();
      } catch (const DeviceNotFound & e) {
        if (attempt >= params_.resolve_attempts || !rclcpp::ok()) {
          throw;
        }
        RCLCPP_WARN(
          get_logger(), "%s, retrying in %d ms (%d/%d)", e.what(),
          params_.resolve_retry_delay_ms, attempt, params_.resolve_attempts);
        std::this_thread::sleep_for(std::chrono::milliseconds(params_.resolve_retry_delay_ms));
      }
    }
  }

  std::unique_ptr<InputSource> make_input()
  {
    if (params_.input_mode == InputMode::Joystick) {
      return std::make_unique<ContinuousAxisInput>(
        std::make_unique<SdlGamepadBackend>(params_.joystick_index), params_.mapper.dead_zone);
    }
    return std::make_unique<DiscreteKeyInput>(std::make_unique<SdlKeyboardBackend>());
  }

  void on_tick()
  {
    if (!loop_) {return;}
    if (!loop_->tick()) {
      stop();
      rclcpp::shutdown();
    }
  }

  void on_status()
  {
    if (!loop_) {return;}
    const auto & s = loop_->state();
    RCLCPP_INFO(
      get_logger(), "Robot ID: %d | VL: %.2f VR: %.2f | sent %lu, failed %lu",
      s.address.id(), s.command.left, s.command.right,
      static_cast<unsigned long>(loop_->frames_sent()),
      static_cast<unsigned long>(loop_->write_failures()));
  }

  BridgeParams params_;
  std::unique_ptr<SerialChannel> channel_;
  std::unique_ptr<InputSource> input_;
  std::unique_ptr<TeleopLoop> loop_;
  rclcpp::TimerBase::SharedPtr timer_;
  rclcpp::TimerBase::SharedPtr status_timer_;
};

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);

  int rc = 0;
  try {
    auto node = std::make_shared<TeleopBridgeNode>();
    if (node->ready()) {
      rclcpp::spin(node);
      RCLCPP_INFO(node->get_logger(), "Shutting down...");
      node->stop();
    } else {
      rc = 1;
    }
  } catch (const std::exception & e) {
    RCLCPP_FATAL(rclcpp::get_logger("teleop_bridge"), "%s", e.what());
    rc = 1;
  }

  if (rclcpp::ok()) {
    rclcpp::shutdown();
  }
  return rc;
}
