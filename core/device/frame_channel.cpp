#include "frame_channel.hpp"

#include <errno.h>
#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <thread>

namespace routerlink {
namespace device {

namespace {
int64_t elapsed_ms_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
}
}  // namespace

void FrameChannel::set_handles(int write_fd, int read_fd) {
    write_fd_ = write_fd;
    read_fd_ = read_fd;
}

bool FrameChannel::write_frame(const uint8_t *data, size_t len, int timeout_ms, std::string &error) {
    if (len > kMaxFrameSize) {
        error = "Frame too large: " + std::to_string(len) + " bytes";
        return false;
    }

    uint32_t len32 = static_cast<uint32_t>(len);
    uint8_t len_buf[4];
    len_buf[0] = (len32 >> 0) & 0xFF;
    len_buf[1] = (len32 >> 8) & 0xFF;
    len_buf[2] = (len32 >> 16) & 0xFF;
    len_buf[3] = (len32 >> 24) & 0xFF;

    if (!write_exact(len_buf, 4, timeout_ms, error)) {
        return false;
    }
    if (len > 0 && !write_exact(data, len, timeout_ms, error)) {
        return false;
    }
    return true;
}

bool FrameChannel::read_frame(std::vector<uint8_t> &out, int timeout_ms, std::string &error) {
    uint8_t len_buf[4];
    if (!read_exact(len_buf, 4, timeout_ms, error)) {
        if (error.empty()) {
            error = "EOF reading frame length";
        }
        return false;
    }

    uint32_t len = (uint32_t(len_buf[0]) << 0) | (uint32_t(len_buf[1]) << 8) | (uint32_t(len_buf[2]) << 16) |
                   (uint32_t(len_buf[3]) << 24);

    if (len > kMaxFrameSize) {
        error = "Frame too large: " + std::to_string(len) + " bytes";
        return false;
    }

    out.resize(len);
    if (len > 0 && !read_exact(out.data(), len, timeout_ms, error)) {
        if (error.empty()) {
            error = "EOF reading frame payload";
        }
        return false;
    }
    return true;
}

bool FrameChannel::wait_for_data(int timeout_ms, std::string &error) {
    if (read_fd_ < 0) {
        error = "Invalid read pipe";
        return false;
    }

    struct pollfd pfd;
    pfd.fd = read_fd_;
    pfd.events = POLLIN;
    int result = poll(&pfd, 1, timeout_ms);
    if (result < 0) {
        if (errno == EINTR) {
            return false;
        }
        error = "poll failed: " + std::string(strerror(errno));
        return false;
    }
    if (result == 0) {
        return false;
    }
    if ((pfd.revents & POLLIN) != 0) {
        return true;
    }
    // HUP without POLLIN: let read() observe EOF
    if ((pfd.revents & POLLHUP) != 0) {
        return true;
    }
    error = "poll error on read pipe";
    return false;
}

bool FrameChannel::write_exact(const uint8_t *buf, size_t n, int timeout_ms, std::string &error) {
    if (write_fd_ < 0) {
        error = "Write pipe closed";
        return false;
    }

    size_t total = 0;
    auto start = std::chrono::steady_clock::now();

    while (total < n) {
        if (timeout_ms >= 0 && elapsed_ms_since(start) >= timeout_ms) {
            error = "Timeout writing frame";
            return false;
        }

        ssize_t w = ::write(write_fd_, buf + total, n - total);
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }
            if (errno == EPIPE) {
                error = "Broken pipe (adapter terminated)";
            } else {
                error = "Write failed: " + std::string(strerror(errno));
            }
            return false;
        }
        if (w == 0) {
            error = "Write returned 0 bytes";
            return false;
        }
        total += static_cast<size_t>(w);
    }
    return true;
}

bool FrameChannel::read_exact(uint8_t *buf, size_t n, int timeout_ms, std::string &error) {
    size_t total = 0;
    auto start = std::chrono::steady_clock::now();

    while (total < n) {
        if (timeout_ms >= 0) {
            int64_t elapsed = elapsed_ms_since(start);
            if (elapsed >= timeout_ms) {
                error = "Timeout reading frame";
                return false;
            }
            if (!wait_for_data(static_cast<int>(timeout_ms - elapsed), error)) {
                if (!error.empty()) {
                    return false;
                }
                continue;
            }
        }

        ssize_t r = ::read(read_fd_, buf + total, n - total);
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = "Read failed: " + std::string(strerror(errno));
            return false;
        }
        if (r == 0) {
            // EOF
            return false;
        }
        total += static_cast<size_t>(r);
    }
    return true;
}

}  // namespace device
}  // namespace routerlink
