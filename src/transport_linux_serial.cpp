// ============================================================================
// transport_linux_serial.cpp - implementation for transport_linux_serial.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "gaugelink/transport/transport_linux_serial.hpp"

// POSIX / termios headers for low-level serial port handling
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, etc.)
#include <unistd.h>        // ::read, ::write, ::close
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for timeout-based read/write loops
#include <sys/ioctl.h>     // TIOCMBIS / TIOCMBIC for RTS and DTR
#include <cerrno>
#include <cstring>

namespace gaugelink::transport {

namespace {

bool baud_constant(int baud, speed_t& sp) {
    switch (baud) {
        case 1200:   sp = B1200;   return true;
        case 2400:   sp = B2400;   return true;
        case 4800:   sp = B4800;   return true;
        case 9600:   sp = B9600;   return true;
        case 19200:  sp = B19200;  return true;
        case 38400:  sp = B38400;  return true;
        case 57600:  sp = B57600;  return true;
        case 115200: sp = B115200; return true;
#ifdef B230400
        case 230400: sp = B230400; return true;
#endif
        default: return false;
    }
}

tcflag_t size_flag(int bits) {
    switch (bits) {
        case 5: return CS5;
        case 6: return CS6;
        case 7: return CS7;
        default: return CS8;
    }
}

// ---------------------------------------------------------------------------
// set_raw()
// ----------
// Raw mode at the requested framing. VMIN=0, VTIME=0 so reads never block;
// poll() decides how long we wait. Flushes both directions afterwards.
// ---------------------------------------------------------------------------
bool set_raw(int fd, speed_t baud, const SerialParams& sp) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);

    tio.c_cflag &= ~CSIZE;
    tio.c_cflag |= size_flag(sp.byte_size);

    tio.c_cflag &= ~(PARENB | PARODD);
    if (sp.parity == Parity::Even) tio.c_cflag |= PARENB;
    if (sp.parity == Parity::Odd)  tio.c_cflag |= (PARENB | PARODD);

    if (sp.stop_bits == 2) tio.c_cflag |= CSTOPB;
    else                   tio.c_cflag &= ~CSTOPB;

    tio.c_cflag |= (CLOCAL | CREAD);              // ignore modem ctrl, enable read
    tio.c_cflag &= ~CRTSCTS;                      // RTS is ours to drive
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}

int poll_ms(std::chrono::milliseconds wait) {
    auto n = wait.count();
    if (n < 0) return 0;
    if (n > 0x7fffffff) return 0x7fffffff;
    return static_cast<int>(n);
}

} // namespace

// ---------------------------------------------------------------------------
// open()
// ------
// O_NOCTTY so a gauge on ttyS0 never becomes our controlling terminal,
// O_NONBLOCK so write()/read() are driven by poll().
// ---------------------------------------------------------------------------
bool LinuxSerialPort::open(const PortConfig& cfg, std::string& err) {
    close();

    if (cfg.path.empty()) { err = "no device path"; return false; }

    speed_t sp = B9600;
    if (!baud_constant(cfg.serial.baud, sp)) {
        err = "unsupported baud rate " + std::to_string(cfg.serial.baud);
        return false;
    }

    int fd = ::open(cfg.path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        err = "cannot open " + cfg.path + ": " + std::strerror(errno);
        return false;
    }

    if (!set_raw(fd, sp, cfg.serial)) {
        err = "cannot configure " + cfg.path + ": " + std::strerror(errno);
        ::close(fd);
        return false;
    }

    fd_ = fd;
    path_ = cfg.path;
    write_timeout_ = cfg.serial.write_timeout;
    return true;
}

void LinuxSerialPort::close() {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

// ---------------------------------------------------------------------------
// write()
// -------
// Loop until the whole buffer is accepted, then tcdrain() so the caller can
// flip RTS knowing the last stop bit has left the wire. Busy = the driver
// stayed full past the write timeout.
// ---------------------------------------------------------------------------
TxResult LinuxSerialPort::write(const uint8_t* data, std::size_t len) {
    if (fd_ < 0 || !data) return TxResult::Error;

    std::size_t done = 0;
    while (done < len) {
        ssize_t w = ::write(fd_, data + done, len - done);
        if (w > 0) { done += static_cast<std::size_t>(w); continue; }
        if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) return TxResult::Error;

        pollfd pfd{fd_, POLLOUT, 0};
        int pr = ::poll(&pfd, 1, poll_ms(write_timeout_));
        if (pr == 0) return TxResult::Busy;
        if (pr < 0 && errno != EINTR) return TxResult::Error;
    }

    if (::tcdrain(fd_) != 0) return TxResult::Error;
    return TxResult::Ok;
}

RxResult LinuxSerialPort::read(uint8_t* out, std::size_t cap, std::size_t& out_len,
                               std::chrono::milliseconds wait) {
    out_len = 0;
    if (fd_ < 0 || cap == 0) return RxResult::Error;

    pollfd pfd{fd_, POLLIN, 0};
    int pr = ::poll(&pfd, 1, poll_ms(wait));
    if (pr == 0) return RxResult::None;
    if (pr < 0) return errno == EINTR ? RxResult::None : RxResult::Error;
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return RxResult::Error;

    ssize_t r = ::read(fd_, out, cap);
    if (r > 0) { out_len = static_cast<std::size_t>(r); return RxResult::Ok; }
    if (r == 0 || errno == EAGAIN || errno == EWOULDBLOCK) return RxResult::None;
    return RxResult::Error;
}

void LinuxSerialPort::discard_input() {
    if (fd_ >= 0) tcflush(fd_, TCIFLUSH);
}

bool LinuxSerialPort::set_modem_bit(int bit, bool level) {
    if (fd_ < 0) return false;
    return ::ioctl(fd_, level ? TIOCMBIS : TIOCMBIC, &bit) == 0;
}

bool LinuxSerialPort::set_rts(bool level) { return set_modem_bit(TIOCM_RTS, level); }
bool LinuxSerialPort::set_dtr(bool level) { return set_modem_bit(TIOCM_DTR, level); }

} // namespace gaugelink::transport
