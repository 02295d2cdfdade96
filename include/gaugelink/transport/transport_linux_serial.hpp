#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux tty port (termios, non-blocking fd, poll-driven reads).
 *
 * Depends on: unistd.h, fcntl.h, termios.h, poll.h, sys/ioctl.h.
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "gaugelink/transport/transport_base.hpp"

#include <string>

namespace gaugelink::transport {

class LinuxSerialPort : public ISerialPort {
public:
  LinuxSerialPort() = default;
  ~LinuxSerialPort() override { close(); }

  LinuxSerialPort(const LinuxSerialPort&) = delete;
  LinuxSerialPort& operator=(const LinuxSerialPort&) = delete;

  bool        open(const PortConfig& cfg, std::string& err) override;
  void        close() override;
  bool        is_open() const override { return fd_ >= 0; }
  TxResult    write(const uint8_t* data, std::size_t len) override;
  RxResult    read(uint8_t* out, std::size_t cap, std::size_t& out_len,
                   std::chrono::milliseconds wait) override;
  void        discard_input() override;
  bool        set_rts(bool level) override;
  bool        set_dtr(bool level) override;
  const char* name() const override { return "linux-serial"; }

  const std::string& path() const { return path_; }

private:
  bool set_modem_bit(int bit, bool level);

  int fd_{-1};
  std::string path_;
  std::chrono::milliseconds write_timeout_{1000};
};

} // namespace gaugelink::transport
