#pragma once

#include "core/error.h"
#include "process/command_runner.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <sys/types.h>

namespace kild {

struct PtyConfig {
    std::string command;
    std::string cwd;
    EnvList env;
    int rows = 24;
    int cols = 80;
};

using PtyOutputCallback = std::function<void(const std::string& data)>;
using PtyExitCallback = std::function<void(int exit_code)>;

// A child process attached to the slave side of a pseudo-terminal. A
// background thread reads the master side and reports output and exit
// through the callbacks, which run on that thread.
class PtyProcess {
public:
    PtyProcess();
    ~PtyProcess();

    PtyProcess(const PtyProcess&) = delete;
    PtyProcess& operator=(const PtyProcess&) = delete;

    // Set callbacks before start(). Fails when the command cannot be executed.
    Status start(const PtyConfig& config);

    // SIGTERM to the child's process group; SIGKILL once `grace` has passed.
    void stop(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    Status write_stdin(const std::string& data);
    Status resize(int rows, int cols);

    bool is_running() const { return running_.load(); }
    pid_t pid() const { return child_pid_; }

    void set_output_callback(PtyOutputCallback cb) { output_callback_ = std::move(cb); }
    void set_exit_callback(PtyExitCallback cb) { exit_callback_ = std::move(cb); }

private:
    void io_thread_func();
    void drain_output();
    int reap_after_stop();
    void close_pty();

    // Stable copy for reporting; pid_ is cleared once the child is reaped.
    pid_t child_pid_ = -1;
    std::atomic<pid_t> pid_{-1};
    int pty_fd_ = -1;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<int64_t> grace_ms_{2000};
    std::thread io_thread_;

    PtyOutputCallback output_callback_;
    PtyExitCallback exit_callback_;
};

}
