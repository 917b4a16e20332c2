#include "daemon/pty_process.h"

#include <unistd.h>
#include <signal.h>
#include <sys/wait.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <poll.h>
#include <cstring>
#include <cerrno>
#include <termios.h>
#include <vector>

#if defined(__APPLE__)
#include <util.h>
#elif defined(__linux__)
#include <pty.h>
#endif

namespace kild {

namespace {

constexpr size_t BUFFER_SIZE = 4096;
constexpr int POLL_INTERVAL_MS = 100;

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

winsize make_winsize(int rows, int cols) {
    winsize ws;
    ws.ws_row = static_cast<unsigned short>(rows);
    ws.ws_col = static_cast<unsigned short>(cols);
    ws.ws_xpixel = 0;
    ws.ws_ypixel = 0;
    return ws;
}

}

PtyProcess::PtyProcess() = default;

PtyProcess::~PtyProcess() {
    stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    close_pty();
}

Status PtyProcess::start(const PtyConfig& config) {
    if (running_.load() || io_thread_.joinable()) {
        return make_error(ErrorKind::AlreadyExists, "pty process already started");
    }

    std::vector<std::string> argv_strings = split_command_line(config.command);
    if (argv_strings.empty()) {
        return make_error(ErrorKind::InvalidInput, "empty command");
    }
    std::vector<char*> argv;
    for (const auto& arg : argv_strings) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // Closed by a successful exec; otherwise carries the child's errno.
    int exec_pipe[2];
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        return make_error(ErrorKind::IoFailure, std::string("pipe failed: ") + std::strerror(errno));
    }

    winsize ws = make_winsize(config.rows, config.cols);
    pid_t pid = forkpty(&pty_fd_, nullptr, nullptr, &ws);

    if (pid < 0) {
        int err = errno;
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        return make_error(ErrorKind::IoFailure, std::string("forkpty failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        close(exec_pipe[0]);

        if (!config.cwd.empty() && chdir(config.cwd.c_str()) != 0) {
            int err = errno;
            (void)!write(exec_pipe[1], &err, sizeof(err));
            _exit(127);
        }

        setenv("TERM", "xterm-256color", 1);
        setenv("COLORTERM", "truecolor", 1);
        for (const auto& [key, value] : config.env) {
            setenv(key.c_str(), value.c_str(), 1);
        }

        execvp(argv[0], argv.data());

        int err = errno;
        (void)!write(exec_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    close(exec_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n > 0) {
        int status;
        waitpid(pid, &status, 0);
        close_pty();
        return make_error(ErrorKind::IoFailure,
            "cannot execute '" + argv_strings.front() + "': " + std::strerror(child_errno));
    }

    fcntl(pty_fd_, F_SETFL, fcntl(pty_fd_, F_GETFL) | O_NONBLOCK);

    child_pid_ = pid;
    pid_.store(pid);
    running_.store(true);
    stop_requested_.store(false);

    io_thread_ = std::thread(&PtyProcess::io_thread_func, this);
    return Status::success();
}

void PtyProcess::stop(std::chrono::milliseconds grace) {
    if (!running_.load() || stop_requested_.exchange(true)) return;

    grace_ms_.store(now_ms() + grace.count());

    pid_t pid = pid_.load();
    if (pid > 0) {
        // forkpty made the child a session leader, so its pid is also its group id.
        ::kill(-pid, SIGTERM);
        ::kill(pid, SIGTERM);
    }
}

Status PtyProcess::write_stdin(const std::string& data) {
    if (!running_.load() || pty_fd_ < 0) {
        return make_error(ErrorKind::IoFailure, "pty process is not running");
    }

    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t written = write(pty_fd_, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                pollfd pfd{pty_fd_, POLLOUT, 0};
                poll(&pfd, 1, POLL_INTERVAL_MS);
                continue;
            }
            return make_error(ErrorKind::IoFailure, std::string("pty write failed: ") + std::strerror(errno));
        }
        offset += static_cast<size_t>(written);
    }
    return Status::success();
}

Status PtyProcess::resize(int rows, int cols) {
    if (pty_fd_ < 0) {
        return make_error(ErrorKind::IoFailure, "pty is closed");
    }

    winsize ws = make_winsize(rows, cols);
    if (ioctl(pty_fd_, TIOCSWINSZ, &ws) != 0) {
        return make_error(ErrorKind::IoFailure, std::string("resize failed: ") + std::strerror(errno));
    }
    return Status::success();
}

void PtyProcess::drain_output() {
    char buffer[BUFFER_SIZE];
    while (true) {
        ssize_t n = read(pty_fd_, buffer, BUFFER_SIZE);
        if (n > 0) {
            if (output_callback_) {
                output_callback_(std::string(buffer, static_cast<size_t>(n)));
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
}

void PtyProcess::io_thread_func() {
    char buffer[BUFFER_SIZE];

    struct pollfd fds[1];
    fds[0].fd = pty_fd_;
    fds[0].events = POLLIN;

    bool killed = false;
    int exit_code = -1;

    while (true) {
        int ret = poll(fds, 1, POLL_INTERVAL_MS);

        if (ret < 0 && errno != EINTR) {
            break;
        }

        if (ret > 0 && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            bool hangup = false;
            while (true) {
                ssize_t n = read(pty_fd_, buffer, BUFFER_SIZE);
                if (n > 0) {
                    if (output_callback_) {
                        output_callback_(std::string(buffer, static_cast<size_t>(n)));
                    }
                    continue;
                }
                if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                    break;
                }
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                hangup = true;
                break;
            }
            if (hangup) {
                // Slave side closed; keep polling as a timer until the child is reaped.
                fds[0].fd = -1;
            }
        }

        pid_t pid = pid_.load();
        int status;
        pid_t result = waitpid(pid, &status, WNOHANG);
        if (result == pid) {
            exit_code = decode_wait_status(status);
            pid_.store(-1);
            if (fds[0].fd >= 0) {
                drain_output();
            }
            break;
        }
        if (result < 0 && errno == ECHILD) {
            pid_.store(-1);
            break;
        }

        if (stop_requested_.load() && !killed && now_ms() >= grace_ms_.load()) {
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
            killed = true;
        }
    }

    if (pid_.load() > 0) {
        exit_code = reap_after_stop();
    }

    running_.store(false);
    if (exit_callback_) {
        exit_callback_(exit_code);
    }
}

int PtyProcess::reap_after_stop() {
    pid_t pid = pid_.load();
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);

    int status;
    int exit_code = -1;
    if (waitpid(pid, &status, 0) == pid) {
        exit_code = decode_wait_status(status);
    }
    pid_.store(-1);
    return exit_code;
}

void PtyProcess::close_pty() {
    if (pty_fd_ >= 0) {
        close(pty_fd_);
        pty_fd_ = -1;
    }
}

}
