#include "diffbot_teleop/port_resolver.hpp"

#include <rclcpp/rclcpp.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace diffbot_teleop
{

namespace
{

rclcpp::Logger logger() {return rclcpp::get_logger("diffbot_teleop.port_resolver");}

// Deepest the usb_device can be above the tty's device link (interface -> device)
constexpr int MAX_PARENT_HOPS = 4;

bool read_attribute(const fs::path & file, std::string & out)
{
  std::ifstream in(file);
  if (!in) {return false;}
  std::getline(in, out);
  while (!out.empty() && std::isspace(static_cast<unsigned char>(out.back()))) {
    out.pop_back();
  }
  return !out.empty();
}

bool find_usb_ids(const fs::path & device_link, std::string & vendor, std::string & product)
{
  std::error_code ec;
  fs::path dir = fs::canonical(device_link, ec);
  if (ec) {return false;}

  for (int hop = 0; hop <= MAX_PARENT_HOPS && !dir.empty(); ++hop) {
    if (read_attribute(dir / "idVendor", vendor) && read_attribute(dir / "idProduct", product)) {
      return true;
    }
    if (dir == dir.root_path()) {break;}
    dir = dir.parent_path();
  }
  return false;
}

}  // namespace

std::string normalize_usb_id(const std::string & id)
{
  std::string out = id;
  if (out.size() > 2 && out[0] == '0' && (out[1] == 'x' || out[1] == 'X')) {
    out = out.substr(2);
  }
  if (out.size() != 4) {
    throw std::invalid_argument("USB id must be 4 hex digits: '" + id + "'");
  }
  for (auto & c : out) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      throw std::invalid_argument("USB id must be 4 hex digits: '" + id + "'");
    }
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string select_device(
  const std::vector<SerialDeviceInfo> & devices, const UsbSignature & signature)
{
  const std::string vendor  = normalize_usb_id(signature.vendor_id);
  const std::string product = normalize_usb_id(signature.product_id);

  std::vector<std::string> matches;
  for (const auto & dev : devices) {
    if (dev.vendor_id == vendor && dev.product_id == product) {
      matches.push_back(dev.path);
    }
  }

  if (matches.empty()) {
    throw DeviceNotFound(
      "No serial device with USB id " + vendor + ":" + product + " found (" +
      std::to_string(devices.size()) + " USB serial devices present)");
  }

  if (matches.size() > 1) {
    for (size_t i = 1; i < matches.size(); ++i) {
      RCLCPP_WARN(
        logger(), "Multiple matching devices, using %s and ignoring %s",
        matches.front().c_str(), matches[i].c_str());
    }
  }
  return matches.front();
}

PortResolver::PortResolver(
  UsbSignature signature, std::string sysfs_tty_root, std::string dev_root)
: signature_(std::move(signature)),
  sysfs_tty_root_(std::move(sysfs_tty_root)),
  dev_root_(std::move(dev_root))
{
  // Fail early on a bad id rather than on every resolve
  signature_.vendor_id  = normalize_usb_id(signature_.vendor_id);
  signature_.product_id = normalize_usb_id(signature_.product_id);
}

std::vector<SerialDeviceInfo> PortResolver::list_devices() const
{
  std::vector<SerialDeviceInfo> devices;

  std::error_code ec;
  fs::directory_iterator it(sysfs_tty_root_, ec);
  if (ec) {
    RCLCPP_WARN(
      logger(), "Cannot list %s: %s", sysfs_tty_root_.c_str(), ec.message().c_str());
    return devices;
  }

  for (const auto & entry : it) {
    const fs::path device_link = entry.path() / "device";
    // Virtual terminals have no device link
    if (!fs::exists(device_link, ec)) {
      continue;
    }

    std::string vendor, product;
    if (!find_usb_ids(device_link, vendor, product)) {
      continue;
    }

    SerialDeviceInfo info;
    info.path = (fs::path(dev_root_) / entry.path().filename()).string();
    try {
      info.vendor_id  = normalize_usb_id(vendor);
      info.product_id = normalize_usb_id(product);
    } catch (const std::invalid_argument & e) {
      RCLCPP_DEBUG(logger(), "Skipping %s: %s", info.path.c_str(), e.what());
      continue;
    }
    RCLCPP_DEBUG(
      logger(), "Found %s (%s:%s)", info.path.c_str(),
      info.vendor_id.c_str(), info.product_id.c_str());
    devices.push_back(std::move(info));
  }

  std::sort(
    devices.begin(), devices.end(),
    [](const SerialDeviceInfo & a, const SerialDeviceInfo & b) {return a.path < b.path;});
  return devices;
}

std::string PortResolver::resolve() const
{
  return select_device(list_devices(), signature_);
}

}  // namespace diffbot_teleop
