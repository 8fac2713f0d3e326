#ifndef DIFFBOT_TELEOP__SERIAL_CHANNEL_HPP_
#define DIFFBOT_TELEOP__SERIAL_CHANNEL_HPP_

#include <termios.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace diffbot_teleop
{

static constexpr int DEFAULT_BAUDRATE = 115200;
static constexpr int DEFAULT_TIMEOUT_MS = 1000;

/// Raised when the port can not be opened or configured.
class SerialError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

enum class WriteError
{
  None,
  NotOpen,
  Timeout,     // port did not become writable in time
  Io,          // write() failed, errno is set
  Disconnected,  // device went away (POLLHUP / ENXIO / EIO)
};

const char * to_string(WriteError error);

/// Outcome of one frame write. Nothing is thrown on the send path.
struct WriteResult
{
  WriteError error{WriteError::None};
  int errno_value{0};
  std::size_t written{0};

  bool ok() const {return error == WriteError::None;}
  std::string message() const;

  static WriteResult success(std::size_t n) {return WriteResult{WriteError::None, 0, n};}
  static WriteResult failure(WriteError e, int err = 0, std::size_t n = 0)
  {
    return WriteResult{e, err, n};
  }
};

/// Where frames go. The serial port in production, a fake in tests.
class ByteChannel
{
public:
  virtual ~ByteChannel() = default;

  virtual WriteResult write(const uint8_t * data, std::size_t size) = 0;
  virtual bool is_open() const = 0;
  // Safe to call more than once, only the first call releases the handle
  virtual void close() = 0;
  virtual std::string description() const = 0;
};

struct SerialConfig
{
  std::string device;
  int baudrate{DEFAULT_BAUDRATE};
  int timeout_ms{DEFAULT_TIMEOUT_MS};
};

// Throws SerialError for rates termios does not know
speed_t baud_to_speed(int baudrate);

/// Raw 8N1 termios port. Owns the file descriptor and closes it on destruction.
/// Bytes on the wire always come in whole frames: a write the port only partly
/// accepts is finished before anything else is sent.
class SerialChannel : public ByteChannel
{
public:
  explicit SerialChannel(const SerialConfig & config);
  ~SerialChannel() override;

  SerialChannel(const SerialChannel &) = delete;
  SerialChannel & operator=(const SerialChannel &) = delete;

  WriteResult write(const uint8_t * data, std::size_t size) override;
  bool is_open() const override {return fd_ >= 0;}
  void close() override;
  std::string description() const override;

  const SerialConfig & config() const {return config_;}

  // Unsent tail of a frame the port only took part of. Sent before the next frame.
  std::size_t pending_bytes() const {return pending_.size();}

private:
  bool wait_writable(int & revents);
  WriteResult write_all(const uint8_t * data, std::size_t size);

  SerialConfig config_;
  int fd_{-1};
  std::vector<uint8_t> pending_;
};

}  // namespace diffbot_teleop

#endif  // DIFFBOT_TELEOP__SERIAL_CHANNEL_HPP_
