#include "daemon/line_channel.h"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace kild {

namespace {

constexpr size_t READ_CHUNK = 4096;

Result<sockaddr_un> make_address(const std::filesystem::path& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    const std::string p = path.string();
    if (p.empty() || p.size() >= sizeof(addr.sun_path)) {
        return make_error(ErrorKind::InvalidInput, "socket path too long: " + p);
    }
    std::memcpy(addr.sun_path, p.c_str(), p.size() + 1);
    return addr;
}

}

LineChannel::LineChannel(int fd)
    : fd_(fd)
{
}

LineChannel::~LineChannel() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

bool LineChannel::take_buffered_line(std::string& line) {
    size_t nl = buffer_.find('\n');
    if (nl == std::string::npos) {
        return false;
    }
    line = buffer_.substr(0, nl);
    buffer_.erase(0, nl + 1);
    return true;
}

ReadOutcome LineChannel::read_line(std::string& line, std::chrono::milliseconds timeout) {
    if (take_buffered_line(line)) {
        return ReadOutcome::Line;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char chunk[READ_CHUNK];

    while (true) {
        int wait_ms = -1;
        if (timeout.count() >= 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                return ReadOutcome::Timeout;
            }
            wait_ms = static_cast<int>(left.count());
        }

        pollfd pfd{fd_, POLLIN, 0};
        int ret = poll(&pfd, 1, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return ReadOutcome::Closed;
        }
        if (ret == 0) {
            return ReadOutcome::Timeout;
        }

        ssize_t n = read(fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return ReadOutcome::Closed;
        }
        if (n == 0) {
            return ReadOutcome::Closed;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
        if (take_buffered_line(line)) {
            return ReadOutcome::Line;
        }
    }
}

Status LineChannel::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    std::string framed = line + "\n";
    size_t offset = 0;
    while (offset < framed.size()) {
        ssize_t n = send(fd_, framed.data() + offset, framed.size() - offset, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return make_error(ErrorKind::IoFailure, "write timed out");
            }
            return make_error(ErrorKind::IoFailure, std::string("write failed: ") + std::strerror(errno));
        }
        offset += static_cast<size_t>(n);
    }
    return Status::success();
}

void LineChannel::set_send_timeout(std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

void LineChannel::shutdown() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

Result<int> connect_unix_socket(const std::filesystem::path& path) {
    auto addr = make_address(path);
    if (!addr) {
        return addr.error();
    }

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return make_error(ErrorKind::IoFailure, std::string("socket failed: ") + std::strerror(errno));
    }
    if (connect(fd, reinterpret_cast<const sockaddr*>(&*addr), sizeof(sockaddr_un)) != 0) {
        int err = errno;
        close(fd);
        return make_error(ErrorKind::DaemonUnavailable,
            "cannot connect to daemon at " + path.string() + ": " + std::strerror(err));
    }
    return fd;
}

Result<int> listen_unix_socket(const std::filesystem::path& path) {
    auto addr = make_address(path);
    if (!addr) {
        return addr.error();
    }

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::filesystem::remove(path, ec);

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return make_error(ErrorKind::IoFailure, std::string("socket failed: ") + std::strerror(errno));
    }
    if (bind(fd, reinterpret_cast<const sockaddr*>(&*addr), sizeof(sockaddr_un)) != 0 ||
        listen(fd, 16) != 0) {
        int err = errno;
        close(fd);
        return make_error(ErrorKind::IoFailure,
            "cannot listen on " + path.string() + ": " + std::strerror(err));
    }
    return fd;
}

}
