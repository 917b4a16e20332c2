#pragma once

#include "core/error.h"
#include "core/event_queue.h"
#include "daemon/daemon_events.h"
#include "daemon/line_channel.h"
#include "daemon/protocol.h"
#include "daemon/pty_registry.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <thread>

namespace kild {

class SessionStore;

struct ClientConnection {
    ClientConnection(uint64_t connection_id, int fd) : id(connection_id), channel(fd) {}

    uint64_t id;
    LineChannel channel;
    std::thread reader;
};

struct DaemonServerOptions {
    std::filesystem::path socket_path;
    std::chrono::milliseconds idle_after{2000};
    std::chrono::milliseconds kill_grace{2000};
    std::chrono::milliseconds exited_retention{60000};
    std::chrono::milliseconds send_timeout{5000};
};

// Owns the listening socket and the PTY registry. Connection readers and PTY
// io threads only push events; run() is the single consumer and the only
// place daemon state changes.
class DaemonServer {
public:
    // `store`, when given, has `process` cleared on a session's record once
    // its PTY child exits.
    explicit DaemonServer(DaemonServerOptions options, SessionStore* store = nullptr);
    ~DaemonServer();

    DaemonServer(const DaemonServer&) = delete;
    DaemonServer& operator=(const DaemonServer&) = delete;

    // Binds the socket and starts accepting. Clients may connect once this returns.
    Status start();

    // Processes events until a shutdown request or request_stop(), then kills
    // every PTY, disconnects clients and removes the socket.
    void run();

    // Safe to call from a signal handler.
    void request_stop() { stop_requested_.store(true); }

    const std::filesystem::path& socket_path() const { return options_.socket_path; }

private:
    void accept_loop();
    void reader_loop(ClientConnection* connection);

    void dispatch(DaemonEvent& event);
    void on_request(uint64_t connection_id, const std::string& line);
    DaemonMessage handle_request(uint64_t connection_id, const ClientMessage& msg);
    void on_pty_output(const PtyOutputEvent& event);
    void on_pty_exit(const PtyExitEvent& event);

    bool send(uint64_t connection_id, const DaemonMessage& msg);
    void drop_connection(uint64_t connection_id);
    void clear_session_process(const std::string& session_id, pid_t pid);
    void shutdown();

    DaemonServerOptions options_;
    SessionStore* store_;
    EventQueue<DaemonEvent> events_;
    std::unique_ptr<PtyRegistry> registry_;
    std::map<uint64_t, std::shared_ptr<ClientConnection>> connections_;

    int listen_fd_ = -1;
    std::thread accept_thread_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> accepting_{false};
    std::atomic<uint64_t> next_connection_id_{1};
};

}
