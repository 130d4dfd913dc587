#include "adapter_process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <filesystem>
#include <thread>

#include "logging/logger.hpp"

namespace routerlink {
namespace device {

AdapterProcess::AdapterProcess(const std::string &label, const std::string &executable_path,
                               const std::vector<std::string> &args, int shutdown_timeout_ms)
    : label_(label), executable_path_(executable_path), args_(args), shutdown_timeout_ms_(shutdown_timeout_ms) {}

AdapterProcess::~AdapterProcess() {
    shutdown();
    close_read_pipe();
}

bool AdapterProcess::spawn() {
    LOG_DEBUG("[Adapter] [" << label_ << "] Spawning: " << executable_path_);

    if (!std::filesystem::exists(executable_path_)) {
        error_ = "Adapter executable not found: " + executable_path_;
        LOG_ERROR("[Adapter] [" << label_ << "] " << error_);
        return false;
    }

    int stdin_pipe[2];
    int stdout_pipe[2];

    if (pipe2(stdin_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stdin pipe: " + std::string(strerror(errno));
        return false;
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stdout pipe: " + std::string(strerror(errno));
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        return false;
    }

    // Build argv before fork; the child only calls async-signal-safe functions
    std::string abs_path = std::filesystem::absolute(executable_path_).string();
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(abs_path.c_str()));
    for (const auto &arg : args_) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_ = fork();
    if (pid_ < 0) {
        error_ = "Fork failed: " + std::string(strerror(errno));
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return false;
    }

    if (pid_ == 0) {
        // dup2 clears FD_CLOEXEC on the duplicated descriptors
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        execv(abs_path.c_str(), argv.data());
        _exit(127);
    }

    close(stdin_pipe[0]);
    close(stdout_pipe[1]);

    stdin_write_fd_ = stdin_pipe[1];
    stdout_read_fd_ = stdout_pipe[0];
    channel_.set_handles(stdin_write_fd_, stdout_read_fd_);

    LOG_INFO("[Adapter] [" << label_ << "] Process spawned (PID=" << pid_ << ")");
    return true;
}

bool AdapterProcess::is_running() const {
    if (pid_ <= 0) {
        return false;
    }
    return kill(pid_, 0) == 0;
}

void AdapterProcess::shutdown() {
    if (pid_ <= 0) {
        close_write_pipe();
        return;
    }

    LOG_DEBUG("[Adapter] [" << label_ << "] Initiating shutdown");

    close_write_pipe();

    if (wait_for_exit(shutdown_timeout_ms_)) {
        LOG_DEBUG("[Adapter] [" << label_ << "] Clean shutdown");
        return;
    }

    LOG_WARN("[Adapter] [" << label_ << "] Timeout - forcing termination");
    force_terminate();
    wait_for_exit(500);
}

void AdapterProcess::close_write_pipe() {
    if (stdin_write_fd_ >= 0) {
        close(stdin_write_fd_);
        stdin_write_fd_ = -1;
        channel_.set_write_fd(-1);
    }
}

void AdapterProcess::close_read_pipe() {
    if (stdout_read_fd_ >= 0) {
        close(stdout_read_fd_);
        stdout_read_fd_ = -1;
        channel_.set_read_fd(-1);
    }
}

bool AdapterProcess::wait_for_exit(int timeout_ms) {
    if (pid_ <= 0) {
        return true;
    }

    auto start = std::chrono::steady_clock::now();
    while (true) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            pid_ = -1;
            return true;
        }
        if (result == -1) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == ECHILD) {
                pid_ = -1;
                return true;
            }
            return false;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void AdapterProcess::force_terminate() {
    if (pid_ > 0) {
        kill(pid_, SIGKILL);
    }
}

}  // namespace device
}  // namespace routerlink
