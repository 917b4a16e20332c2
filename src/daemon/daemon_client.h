#pragma once

#include "core/error.h"
#include "daemon/line_channel.h"
#include "daemon/protocol.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kild {

// Client side of the daemon socket. A failed connection is reported as
// DaemonUnavailable so callers can fall back to external terminals.
class DaemonClient {
public:
    explicit DaemonClient(std::filesystem::path socket_path,
                          std::chrono::milliseconds read_timeout = std::chrono::seconds(30),
                          std::chrono::milliseconds write_timeout = std::chrono::seconds(5));

    Status connect();
    bool connected() const { return channel_ != nullptr; }

    Status ping();
    Result<PtySessionInfo> create_session(const std::string& session_id,
                                          const std::string& command,
                                          const std::string& cwd,
                                          const EnvList& env,
                                          int rows, int cols);
    Status kill_session(const std::string& session_id);
    Result<PtySessionInfo> session_status(const std::string& session_id);
    Result<std::vector<PtySessionInfo>> list_sessions();
    Status shutdown_daemon();

    // Streams output of an attached session to `on_output` until the session
    // exits (returns its exit code), detach() is called (returns nullopt) or
    // the connection drops (DaemonUnavailable).
    Result<std::optional<int>> attach(const std::string& session_id,
                                      const std::function<void(const std::string&)>& on_output);

    // Safe to call from another thread while attach() runs.
    Status write_stdin(const std::string& session_id, const std::string& data);
    Status resize(const std::string& session_id, int rows, int cols);
    void detach(const std::string& session_id);

private:
    Result<DaemonMessage> request(ClientMessage msg);
    Status send(ClientMessage& msg);
    Result<DaemonMessage> read_response(const std::string& id);

    std::filesystem::path socket_path_;
    std::chrono::milliseconds read_timeout_;
    std::chrono::milliseconds write_timeout_;
    std::unique_ptr<LineChannel> channel_;
    std::atomic<uint64_t> next_id_{1};
    std::atomic<bool> detach_requested_{false};
};

// Maps a daemon error response onto the error taxonomy.
Error error_from_response(const DaemonMessage& msg);

}
