#include "diffbot_teleop/serial_channel.hpp"

#include <rclcpp/rclcpp.hpp>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace diffbot_teleop
{

namespace
{

rclcpp::Logger logger() {return rclcpp::get_logger("diffbot_teleop.serial");}

std::string errno_text(int err)
{
  return std::string(std::strerror(err));
}

}  // namespace

const char * to_string(WriteError error)
{
  switch (error) {
    case WriteError::None: return "ok";
    case WriteError::NotOpen: return "port not open";
    case WriteError::Timeout: return "write timeout";
    case WriteError::Io: return "I/O error";
    case WriteError::Disconnected: return "device disconnected";
  }
  return "unknown";
}

std::string WriteResult::message() const
{
  std::string msg = to_string(error);
  if (errno_value != 0) {
    msg += ": " + errno_text(errno_value);
  }
  return msg;
}

speed_t baud_to_speed(int baudrate)
{
  switch (baudrate) {
    case 9600: return B9600;
    case 19200: return B19200;
    case 38400: return B38400;
    case 57600: return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
    case 460800: return B460800;
    case 921600: return B921600;
    default:
      throw SerialError("Unsupported baud rate: " + std::to_string(baudrate));
  }
}

SerialChannel::SerialChannel(const SerialConfig & config)
: config_(config)
{
  const speed_t speed = baud_to_speed(config_.baudrate);

  // Non blocking open so a missing carrier does not hang us, writes wait in poll()
  fd_ = ::open(config_.device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    throw SerialError("Cannot open serial port " + config_.device + ": " + errno_text(errno));
  }

  termios tty{};
  if (tcgetattr(fd_, &tty) != 0) {
    const int err = errno;
    close();
    throw SerialError("tcgetattr failed on " + config_.device + ": " + errno_text(err));
  }

  cfmakeraw(&tty);

  // 8N1, no flow control
  tty.c_cflag = (tty.c_cflag & ~CSIZE) | CS8;
  tty.c_cflag |= (CLOCAL | CREAD);
  tty.c_cflag &= ~(PARENB | CSTOPB | CRTSCTS);

  // Reads return after at most timeout_ms (VTIME is in tenths of a second)
  int vtime = config_.timeout_ms / 100;
  if (vtime > 255) {vtime = 255;}
  tty.c_cc[VMIN]  = 0;
  tty.c_cc[VTIME] = static_cast<cc_t>(vtime);

  cfsetispeed(&tty, speed);
  cfsetospeed(&tty, speed);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    const int err = errno;
    close();
    throw SerialError("tcsetattr failed on " + config_.device + ": " + errno_text(err));
  }
  tcflush(fd_, TCIOFLUSH);

  RCLCPP_INFO(logger(), "Opened serial port %s @ %d", config_.device.c_str(), config_.baudrate);
}

SerialChannel::~SerialChannel()
{
  close();
}

void SerialChannel::close()
{
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
    pending_.clear();
    RCLCPP_INFO(logger(), "Closed serial port %s", config_.device.c_str());
  }
}

std::string SerialChannel::description() const
{
  return config_.device + " @ " + std::to_string(config_.baudrate);
}

bool SerialChannel::wait_writable(int & revents)
{
  pollfd pfd{};
  pfd.fd = fd_;
  pfd.events = POLLOUT;

  int rc;
  do {
    rc = ::poll(&pfd, 1, config_.timeout_ms);
  } while (rc < 0 && errno == EINTR);

  revents = rc > 0 ? pfd.revents : 0;
  return rc > 0 && (pfd.revents & POLLOUT);
}

WriteResult SerialChannel::write_all(const uint8_t * data, std::size_t size)
{
  std::size_t written = 0;
  while (written < size) {
    const ssize_t n = ::write(fd_, data + written, size - written);
    if (n > 0) {
      written += static_cast<std::size_t>(n);
      continue;
    }

    if (n == 0) {
      return WriteResult::failure(WriteError::Io, 0, written);
    }

    const int err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err == EAGAIN || err == EWOULDBLOCK) {
      int revents = 0;
      if (wait_writable(revents)) {
        continue;
      }
      if (revents & (POLLHUP | POLLERR | POLLNVAL)) {
        return WriteResult::failure(WriteError::Disconnected, 0, written);
      }
      return WriteResult::failure(WriteError::Timeout, 0, written);
    }
    if (err == EIO || err == ENXIO || err == ENODEV) {
      return WriteResult::failure(WriteError::Disconnected, err, written);
    }
    return WriteResult::failure(WriteError::Io, err, written);
  }
  return WriteResult::success(written);
}

WriteResult SerialChannel::write(const uint8_t * data, std::size_t size)
{
  if (fd_ < 0) {
    return WriteResult::failure(WriteError::NotOpen);
  }

  // The receiver counts bytes, so the rest of a cut short frame has to go out first
  if (!pending_.empty()) {
    const WriteResult flushed = write_all(pending_.data(), pending_.size());
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(flushed.written));
    if (!flushed.ok()) {
      // Still stuck: this frame is dropped whole
      return WriteResult::failure(flushed.error, flushed.errno_value, 0);
    }
    RCLCPP_DEBUG(logger(), "Flushed %zu bytes left over from a partial write", flushed.written);
  }

  const WriteResult result = write_all(data, size);
  if (!result.ok() && result.written > 0) {
    pending_.assign(data + result.written, data + size);
  }
  return result;
}

}  // namespace diffbot_teleop
