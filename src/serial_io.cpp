// ============================================================================
// serial_io.cpp — TTY setup and SLIP frame I/O
// For API/overview see include/serial_io.hpp.
// ============================================================================

#include "serial_io.hpp"

#include <fcntl.h>         // ::open flags
#include <unistd.h>        // ::read, ::write, ::close, usleep
#include <termios.h>       // raw mode
#include <poll.h>          // deadline-bounded waits
#include <cerrno>
#include <chrono>

namespace viamesh {

namespace {

speed_t to_speed(int baud) {
    switch (baud) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 230400: return B230400;
        default:     return B115200;
    }
}

// ---------------------------------------------------------------------------
// set_raw() — 8N1, no echo, no flow control, VMIN=VTIME=0 (poll does timing).
// ---------------------------------------------------------------------------
bool set_raw(int fd, speed_t speed) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);

    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

} // namespace

int open_serial(const std::string& dev, int baud, int boot_delay_ms) {
    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) return -1;

    if (!set_raw(fd, to_speed(baud))) {
        ::close(fd);
        return -1;
    }

    if (boot_delay_ms > 0) usleep(static_cast<useconds_t>(boot_delay_ms) * 1000);
    tcflush(fd, TCIOFLUSH);                       // drop reset chatter
    return fd;
}

bool write_frame(int fd, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> wire;
    slip::encode(payload.data(), payload.size(), wire);
    return ::write(fd, wire.data(), wire.size()) == static_cast<ssize_t>(wire.size());
}

// ---------------------------------------------------------------------------
// read_frame()
// POLICY:
//   - One byte per read(); bytes after a frame boundary stay in the kernel
//     buffer for the next call.
//   - The deadline covers the whole call, not each byte.
//   - errno is 0 on a clean timeout.
// ---------------------------------------------------------------------------
bool read_frame(int fd, slip::decoder& dec, std::vector<uint8_t>& out, int timeout_ms) {
    const int64_t deadline = now_ms() + (timeout_ms > 0 ? timeout_ms : 0);
    pollfd pfd{fd, POLLIN, 0};
    uint8_t byte = 0;

    for (;;) {
        const int64_t left = deadline - now_ms();
        int pr = ::poll(&pfd, 1, left > 0 ? static_cast<int>(left) : 0);
        if (pr < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (pr == 0) { errno = 0; return false; }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) { errno = EIO; return false; }

        ssize_t n = ::read(fd, &byte, 1);
        if (n == 1) {
            if (dec.feed(byte, out)) return true;
            continue;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) return false;
        if (left <= 0) { errno = 0; return false; }
    }
}

void close_serial(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace viamesh
