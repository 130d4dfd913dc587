#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace routerlink {
namespace device {

// Maximum frame size: 1 MiB
constexpr uint32_t kMaxFrameSize = 1024u * 1024u;

// FrameChannel carries length-prefixed binary frames over a pipe pair.
// Frames are: uint32_le (length) + payload bytes.
//
// One thread may read while another writes; callers serialize writers.
// Errors are reported per call so the read and write sides never share state.
class FrameChannel {
public:
    FrameChannel() = default;
    ~FrameChannel() = default;

    FrameChannel(const FrameChannel &) = delete;
    FrameChannel &operator=(const FrameChannel &) = delete;

    // Pipe ends from the parent's perspective. Ownership stays with the caller.
    void set_handles(int write_fd, int read_fd);
    void set_write_fd(int fd) { write_fd_ = fd; }
    void set_read_fd(int fd) { read_fd_ = fd; }

    bool write_frame(const uint8_t *data, size_t len, int timeout_ms, std::string &error);

    // timeout_ms < 0 blocks until a frame, EOF or error
    bool read_frame(std::vector<uint8_t> &out, int timeout_ms, std::string &error);

    // Returns true if data is readable within timeout_ms
    bool wait_for_data(int timeout_ms, std::string &error);

    int write_fd() const { return write_fd_; }
    int read_fd() const { return read_fd_; }

private:
    int write_fd_ = -1;
    int read_fd_ = -1;

    bool read_exact(uint8_t *buf, size_t n, int timeout_ms, std::string &error);
    bool write_exact(const uint8_t *buf, size_t n, int timeout_ms, std::string &error);
};

}  // namespace device
}  // namespace routerlink
