#include "daemon/daemon_server.h"
#include "core/paths.h"
#include "sessions/session_store.h"

#include <spdlog/spdlog.h>
#include <cerrno>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace kild {

namespace {

constexpr auto LOOP_TICK = std::chrono::milliseconds(100);
constexpr int ACCEPT_POLL_MS = 200;
constexpr auto EXIT_WAIT_SLACK = std::chrono::milliseconds(2000);

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

}

DaemonServer::DaemonServer(DaemonServerOptions options, SessionStore* store)
    : options_(std::move(options))
    , store_(store)
{
    registry_ = std::make_unique<PtyRegistry>(
        [this](const std::string& session_id, uint64_t generation, const std::string& data) {
            events_.push(PtyOutputEvent{session_id, generation, data});
        },
        [this](const std::string& session_id, uint64_t generation, pid_t pid, int exit_code) {
            events_.push(PtyExitEvent{session_id, generation, pid, exit_code});
        },
        options_.idle_after, options_.kill_grace, options_.exited_retention);
}

DaemonServer::~DaemonServer() {
    if (accepting_.load() || !connections_.empty()) {
        request_stop();
        shutdown();
    }
    registry_.reset();
    if (listen_fd_ >= 0) {
        close(listen_fd_);
        listen_fd_ = -1;
    }
}

Status DaemonServer::start() {
    auto fd = listen_unix_socket(options_.socket_path);
    if (!fd) {
        return fd.error();
    }
    listen_fd_ = *fd;
    accepting_.store(true);
    accept_thread_ = std::thread(&DaemonServer::accept_loop, this);

    spdlog::info("daemon.server.listening socket={}", options_.socket_path.string());
    return Status::success();
}

void DaemonServer::accept_loop() {
    while (!stop_requested_.load()) {
        pollfd pfd{listen_fd_, POLLIN, 0};
        int ret = poll(&pfd, 1, ACCEPT_POLL_MS);
        if (ret < 0) {
            if (errno == EINTR) continue;
            spdlog::error("daemon.server.accept_poll_failed errno={}", errno);
            break;
        }
        if (ret == 0) continue;

        int client_fd = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            spdlog::warn("daemon.server.accept_failed errno={}", errno);
            continue;
        }

        auto connection = std::make_shared<ClientConnection>(next_connection_id_++, client_fd);
        connection->channel.set_send_timeout(options_.send_timeout);
        if (!events_.push(ClientConnectedEvent{connection})) {
            break;
        }
        connection->reader = std::thread(&DaemonServer::reader_loop, this, connection.get());
    }
    accepting_.store(false);
}

void DaemonServer::reader_loop(ClientConnection* connection) {
    std::string line;
    while (connection->channel.read_line(line, std::chrono::milliseconds(-1)) == ReadOutcome::Line) {
        if (line.empty()) continue;
        if (!events_.push(ClientLineEvent{connection->id, line})) {
            return;
        }
    }
    events_.push(ClientGoneEvent{connection->id});
}

void DaemonServer::run() {
    while (!stop_requested_.load()) {
        auto event = events_.wait_pop_for(LOOP_TICK);
        if (event) {
            dispatch(*event);
        }
        registry_->refresh_activity(std::chrono::steady_clock::now());
    }
    shutdown();
}

void DaemonServer::dispatch(DaemonEvent& event) {
    std::visit(overloaded{
        [this](ClientConnectedEvent& e) {
            connections_[e.connection->id] = e.connection;
            spdlog::debug("daemon.client.connected connection={}", e.connection->id);
        },
        [this](ClientLineEvent& e) {
            on_request(e.connection_id, e.line);
        },
        [this](ClientGoneEvent& e) {
            drop_connection(e.connection_id);
        },
        [this](PtyOutputEvent& e) {
            on_pty_output(e);
        },
        [this](PtyExitEvent& e) {
            on_pty_exit(e);
        },
    }, event);
}

void DaemonServer::on_request(uint64_t connection_id, const std::string& line) {
    auto msg = decode_client_message(line);
    if (!msg) {
        spdlog::warn("daemon.request.invalid connection={} error={}", connection_id, msg.error().message);
        send(connection_id, DaemonMessage::error("", protocol_error::INVALID_REQUEST, msg.error().message));
        return;
    }

    spdlog::debug("daemon.request.received connection={} type={} session={}",
        connection_id, request_type_name(msg->type), msg->session_id);
    DaemonMessage response = handle_request(connection_id, *msg);
    send(connection_id, response);

    if (msg->type == RequestType::Shutdown) {
        spdlog::info("daemon.server.shutdown_requested connection={}", connection_id);
        request_stop();
    }
}

DaemonMessage DaemonServer::handle_request(uint64_t connection_id, const ClientMessage& msg) {
    const std::string& id = msg.id;

    switch (msg.type) {
        case RequestType::Ping:
        case RequestType::Shutdown:
            return DaemonMessage::ack(id);

        case RequestType::CreateSession: {
            PtyConfig config;
            config.command = msg.command;
            config.cwd = msg.cwd;
            config.env = msg.env;
            if (msg.rows > 0) config.rows = msg.rows;
            if (msg.cols > 0) config.cols = msg.cols;

            auto info = registry_->open(msg.session_id, config);
            if (!info) {
                const bool exists = info.error().kind == ErrorKind::AlreadyExists;
                if (!exists) {
                    spdlog::error("daemon.pty.spawn_failed session={} error={}", msg.session_id,
                        info.error().message);
                }
                return DaemonMessage::error(id,
                    exists ? protocol_error::SESSION_EXISTS : protocol_error::SPAWN_FAILED,
                    info.error().message);
            }
            DaemonMessage response;
            response.id = id;
            response.type = ResponseType::SessionInfo;
            response.session = *info;
            return response;
        }

        case RequestType::Attach:
            if (auto s = registry_->attach(msg.session_id, connection_id); !s) {
                return DaemonMessage::error(id, protocol_error::SESSION_NOT_FOUND, s.error().message);
            }
            return DaemonMessage::ack(id);

        case RequestType::Detach:
            if (auto s = registry_->detach(msg.session_id, connection_id); !s) {
                return DaemonMessage::error(id, protocol_error::SESSION_NOT_FOUND, s.error().message);
            }
            return DaemonMessage::ack(id);

        case RequestType::WriteStdin:
            if (auto s = registry_->write_input(msg.session_id, connection_id, msg.data); !s) {
                const char* code = protocol_error::INVALID_REQUEST;
                if (s.error().kind == ErrorKind::NotFound) code = protocol_error::SESSION_NOT_FOUND;
                if (s.error().kind == ErrorKind::InvalidInput) code = protocol_error::NOT_ATTACHED;
                return DaemonMessage::error(id, code, s.error().message);
            }
            return DaemonMessage::ack(id);

        case RequestType::ResizePty:
            if (auto s = registry_->resize(msg.session_id, msg.rows, msg.cols); !s) {
                const char* code = s.error().kind == ErrorKind::NotFound
                    ? protocol_error::SESSION_NOT_FOUND : protocol_error::INVALID_REQUEST;
                return DaemonMessage::error(id, code, s.error().message);
            }
            return DaemonMessage::ack(id);

        case RequestType::KillSession:
            if (auto s = registry_->kill(msg.session_id); !s) {
                return DaemonMessage::error(id, protocol_error::SESSION_NOT_FOUND, s.error().message);
            }
            return DaemonMessage::ack(id);

        case RequestType::SessionStatus: {
            auto info = registry_->take_status(msg.session_id);
            if (!info) {
                return DaemonMessage::error(id, protocol_error::SESSION_NOT_FOUND,
                    "no pty session '" + msg.session_id + "'");
            }
            DaemonMessage response;
            response.id = id;
            response.type = ResponseType::SessionInfo;
            response.session = *info;
            return response;
        }

        case RequestType::ListSessions: {
            DaemonMessage response;
            response.id = id;
            response.type = ResponseType::SessionList;
            response.sessions = registry_->list();
            return response;
        }
    }
    return DaemonMessage::error(id, protocol_error::INVALID_REQUEST, "unhandled request");
}

void DaemonServer::on_pty_output(const PtyOutputEvent& event) {
    if (!registry_->record_output(event.session_id, event.generation, std::chrono::steady_clock::now())) {
        return;
    }

    DaemonMessage msg;
    msg.type = ResponseType::PtyOutput;
    msg.session_id = event.session_id;
    msg.data = event.data;

    for (uint64_t connection_id : registry_->attached_to(event.session_id)) {
        send(connection_id, msg);
    }
}

void DaemonServer::on_pty_exit(const PtyExitEvent& event) {
    if (!registry_->mark_exited(event.session_id, event.generation, event.exit_code)) {
        return;
    }

    DaemonMessage msg;
    msg.type = ResponseType::SessionExited;
    msg.session_id = event.session_id;
    msg.exit_code = event.exit_code;

    for (uint64_t connection_id : registry_->attached_to(event.session_id)) {
        send(connection_id, msg);
    }
    clear_session_process(event.session_id, event.pid);
}

void DaemonServer::clear_session_process(const std::string& session_id, pid_t pid) {
    if (!store_) {
        return;
    }
    auto session = store_->load(session_id);
    if (!session || !session->process || session->process->pid != pid) {
        return;
    }

    session->process.reset();
    session->updated_at = current_timestamp();
    if (auto s = store_->save(*session); !s) {
        spdlog::warn("daemon.session.clear_process_failed session={} error={}", session_id, s.error().message);
        return;
    }
    spdlog::info("daemon.session.process_cleared session={} pid={}", session_id, pid);
}

bool DaemonServer::send(uint64_t connection_id, const DaemonMessage& msg) {
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return false;
    }
    if (auto s = it->second->channel.write_line(encode_daemon_message(msg)); !s) {
        spdlog::warn("daemon.client.send_failed connection={} error={}", connection_id, s.error().message);
        // The reader sees the shutdown and reports the connection gone.
        it->second->channel.shutdown();
        return false;
    }
    return true;
}

void DaemonServer::drop_connection(uint64_t connection_id) {
    registry_->detach_everywhere(connection_id);

    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return;
    }
    std::shared_ptr<ClientConnection> connection = it->second;
    connections_.erase(it);

    connection->channel.shutdown();
    if (connection->reader.joinable()) {
        connection->reader.join();
    }
    spdlog::debug("daemon.client.disconnected connection={}", connection_id);
}

void DaemonServer::shutdown() {
    spdlog::info("daemon.server.stopping live_sessions={}", registry_->live_count());

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    // Keep draining events so exits reach attached clients and the session store.
    registry_->stop_all();
    const auto deadline = std::chrono::steady_clock::now() + options_.kill_grace + EXIT_WAIT_SLACK;
    while (registry_->live_count() > 0 && std::chrono::steady_clock::now() < deadline) {
        if (auto event = events_.wait_pop_for(LOOP_TICK)) {
            dispatch(*event);
        }
    }

    // Connections accepted but not yet seen by the loop.
    while (auto event = events_.try_pop()) {
        if (auto* connected = std::get_if<ClientConnectedEvent>(&*event)) {
            connections_[connected->connection->id] = connected->connection;
        }
    }

    for (auto& [id, connection] : connections_) {
        connection->channel.shutdown();
    }
    for (auto& [id, connection] : connections_) {
        if (connection->reader.joinable()) {
            connection->reader.join();
        }
    }
    connections_.clear();
    events_.close();
    events_.clear();

    if (listen_fd_ >= 0) {
        close(listen_fd_);
        listen_fd_ = -1;
    }
    std::error_code ec;
    std::filesystem::remove(options_.socket_path, ec);

    spdlog::info("daemon.server.stopped");
}

}
