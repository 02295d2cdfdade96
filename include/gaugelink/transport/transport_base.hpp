#pragma once
/**
 * @file transport_base.hpp
 * @brief Byte-level serial port interface the protocol transport is written against.
 *
 * @details
 * The link layer never touches a file descriptor. It talks to an ISerialPort,
 * which is either the termios-backed LinuxSerialPort or a scripted port in
 * the test suite.
 *
 * Contract:
 *  - open(cfg, err) configures framing and baud; on failure @p err says why.
 *  - write(buf,len) hands the whole buffer to the driver and waits for it to
 *    leave the UART (drain), bounded by the write timeout.
 *  - read(out,cap,got,wait) waits at most @p wait for the first byte, then
 *    returns whatever is ready. RxResult::None means nothing arrived in time.
 *  - discard_input() throws away stale input before a new request.
 *  - set_rts()/set_dtr() drive the modem control lines and return false
 *    when the adapter has none.
 *  - name() is a short identifier for logs.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "gaugelink/device_family.hpp"

namespace gaugelink::transport {

enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

struct PortConfig {
  std::string path;      // e.g. /dev/ttyUSB0, /dev/serial/by-id/usb-...
  SerialParams serial;
};

class ISerialPort {
public:
  virtual ~ISerialPort() = default;
  virtual bool        open(const PortConfig& cfg, std::string& err) = 0;
  virtual void        close() = 0;
  virtual bool        is_open() const = 0;
  virtual TxResult    write(const uint8_t* data, std::size_t len) = 0;
  virtual RxResult    read(uint8_t* out, std::size_t cap, std::size_t& out_len,
                           std::chrono::milliseconds wait) = 0;
  virtual void        discard_input() = 0;
  virtual bool        set_rts(bool level) = 0;
  virtual bool        set_dtr(bool level) = 0;
  virtual const char* name() const = 0;
};

} // namespace gaugelink::transport
