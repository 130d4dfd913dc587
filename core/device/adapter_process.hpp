#pragma once

#include <sys/types.h>

#include <string>
#include <vector>

#include "frame_channel.hpp"

namespace routerlink {
namespace device {

// AdapterProcess owns one device adapter child process.
// Responsibilities:
// - Spawn with stdin/stdout redirected to pipes (stderr inherited)
// - Liveness check
// - Shutdown sequence: EOF -> bounded wait -> SIGKILL
class AdapterProcess {
public:
    AdapterProcess(const std::string &label, const std::string &executable_path,
                   const std::vector<std::string> &args = {}, int shutdown_timeout_ms = 2000);
    ~AdapterProcess();

    AdapterProcess(const AdapterProcess &) = delete;
    AdapterProcess &operator=(const AdapterProcess &) = delete;

    bool spawn();
    bool is_running() const;

    // Closes the adapter's stdin, waits, then kills. Safe to call repeatedly.
    void shutdown();

    // Closes the read pipe once nothing reads from it anymore
    void close_read_pipe();

    FrameChannel &channel() { return channel_; }
    const std::string &label() const { return label_; }
    const std::string &last_error() const { return error_; }

private:
    std::string label_;
    std::string executable_path_;
    std::vector<std::string> args_;
    int shutdown_timeout_ms_;
    std::string error_;

    FrameChannel channel_;

    pid_t pid_ = -1;
    int stdin_write_fd_ = -1;
    int stdout_read_fd_ = -1;

    void close_write_pipe();
    bool wait_for_exit(int timeout_ms);
    void force_terminate();
};

}  // namespace device
}  // namespace routerlink
