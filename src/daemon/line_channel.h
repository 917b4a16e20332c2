#pragma once

#include "core/error.h"
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>

namespace kild {

enum class ReadOutcome {
    Line,
    Timeout,
    Closed
};

// Newline-delimited messages over a stream socket. Owns the descriptor.
// One thread may read while others write; writes are serialized.
class LineChannel {
public:
    explicit LineChannel(int fd);
    ~LineChannel();

    LineChannel(const LineChannel&) = delete;
    LineChannel& operator=(const LineChannel&) = delete;

    // A negative timeout blocks until a full line arrives or the peer closes.
    ReadOutcome read_line(std::string& line, std::chrono::milliseconds timeout);
    Status write_line(const std::string& line);

    void set_send_timeout(std::chrono::milliseconds timeout);

    // Wakes a blocked reader; the descriptor stays open until destruction.
    void shutdown();

    int fd() const { return fd_; }

private:
    bool take_buffered_line(std::string& line);

    int fd_;
    std::string buffer_;
    std::mutex write_mutex_;
};

// DaemonUnavailable when the socket is missing or refuses the connection.
Result<int> connect_unix_socket(const std::filesystem::path& path);

// Replaces a stale socket file left by a crashed daemon.
Result<int> listen_unix_socket(const std::filesystem::path& path);

}
