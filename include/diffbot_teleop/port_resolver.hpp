#ifndef DIFFBOT_TELEOP__PORT_RESOLVER_HPP_
#define DIFFBOT_TELEOP__PORT_RESOLVER_HPP_

#include <stdexcept>
#include <string>
#include <vector>

namespace diffbot_teleop
{

/// STM32 virtual COM port (CDC ACM) as enumerated by the board's USB stack.
static constexpr const char * STM32_VCP_VENDOR_ID  = "0483";
static constexpr const char * STM32_VCP_PRODUCT_ID = "5740";

class DeviceNotFound : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

struct UsbSignature
{
  std::string vendor_id{STM32_VCP_VENDOR_ID};    // 4 hex digits
  std::string product_id{STM32_VCP_PRODUCT_ID};  // 4 hex digits
};

struct SerialDeviceInfo
{
  std::string path;        // /dev/ttyACM0
  std::string vendor_id;   // lowercase hex
  std::string product_id;  // lowercase hex
};

// Lowercases and checks for exactly four hex digits. Throws std::invalid_argument.
std::string normalize_usb_id(const std::string & id);

// First device in the list carrying the signature. Throws DeviceNotFound.
std::string select_device(
  const std::vector<SerialDeviceInfo> & devices, const UsbSignature & signature);

/// Finds the serial device node of the robot radio by walking sysfs.
class PortResolver
{
public:
  explicit PortResolver(
    UsbSignature signature = UsbSignature(),
    std::string sysfs_tty_root = "/sys/class/tty",
    std::string dev_root = "/dev");

  // Throws DeviceNotFound when nothing matches
  std::string resolve() const;

  // USB backed tty devices sorted by name. Entries without USB ids are left out.
  std::vector<SerialDeviceInfo> list_devices() const;

  const UsbSignature & signature() const {return signature_;}

private:
  UsbSignature signature_;
  std::string sysfs_tty_root_;
  std::string dev_root_;
};

}  // namespace diffbot_teleop

#endif  // DIFFBOT_TELEOP__PORT_RESOLVER_HPP_
