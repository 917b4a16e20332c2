#include "daemon/daemon_client.h"

#include <spdlog/spdlog.h>

namespace kild {

namespace {

constexpr auto ATTACH_POLL = std::chrono::milliseconds(250);

Error unexpected(const DaemonMessage& msg) {
    return make_error(ErrorKind::IoFailure,
        std::string("unexpected daemon response '") + response_type_name(msg.type) + "'");
}

}

Error error_from_response(const DaemonMessage& msg) {
    ErrorKind kind = ErrorKind::IoFailure;
    if (msg.code == protocol_error::SESSION_NOT_FOUND) kind = ErrorKind::NotFound;
    else if (msg.code == protocol_error::SESSION_EXISTS) kind = ErrorKind::AlreadyExists;
    else if (msg.code == protocol_error::NOT_ATTACHED) kind = ErrorKind::InvalidInput;
    else if (msg.code == protocol_error::INVALID_REQUEST) kind = ErrorKind::InvalidInput;
    return make_error(kind, "daemon: " + msg.message);
}

DaemonClient::DaemonClient(std::filesystem::path socket_path,
                           std::chrono::milliseconds read_timeout,
                           std::chrono::milliseconds write_timeout)
    : socket_path_(std::move(socket_path))
    , read_timeout_(read_timeout)
    , write_timeout_(write_timeout)
{
}

Status DaemonClient::connect() {
    if (channel_) {
        return Status::success();
    }
    auto fd = connect_unix_socket(socket_path_);
    if (!fd) {
        return fd.error();
    }
    channel_ = std::make_unique<LineChannel>(*fd);
    channel_->set_send_timeout(write_timeout_);
    return Status::success();
}

Status DaemonClient::send(ClientMessage& msg) {
    if (auto s = connect(); !s) {
        return s;
    }
    msg.id = std::to_string(next_id_++);
    if (auto s = channel_->write_line(encode_client_message(msg)); !s) {
        return make_error(ErrorKind::DaemonUnavailable, "cannot reach daemon: " + s.error().message);
    }
    return Status::success();
}

Result<DaemonMessage> DaemonClient::read_response(const std::string& id) {
    std::string line;
    while (true) {
        switch (channel_->read_line(line, read_timeout_)) {
            case ReadOutcome::Timeout:
                return make_error(ErrorKind::DaemonUnavailable, "daemon did not respond in time");
            case ReadOutcome::Closed:
                channel_.reset();
                return make_error(ErrorKind::DaemonUnavailable, "daemon closed the connection");
            case ReadOutcome::Line:
                break;
        }

        auto msg = decode_daemon_message(line);
        if (!msg) {
            return make_error(ErrorKind::IoFailure, "bad daemon response: " + msg.error().message);
        }
        // Stream messages for an earlier attach on this connection are skipped.
        if (msg->id == id) {
            return msg;
        }
        if (msg->id.empty() && msg->type == ResponseType::Error) {
            return error_from_response(*msg);
        }
    }
}

Result<DaemonMessage> DaemonClient::request(ClientMessage msg) {
    if (auto s = send(msg); !s) {
        return s.error();
    }
    auto response = read_response(msg.id);
    if (!response) {
        return response;
    }
    if (response->type == ResponseType::Error) {
        return error_from_response(*response);
    }
    return response;
}

Status DaemonClient::ping() {
    ClientMessage msg;
    msg.type = RequestType::Ping;
    return request(msg).status();
}

Result<PtySessionInfo> DaemonClient::create_session(const std::string& session_id,
                                                    const std::string& command,
                                                    const std::string& cwd,
                                                    const EnvList& env,
                                                    int rows, int cols) {
    ClientMessage msg;
    msg.type = RequestType::CreateSession;
    msg.session_id = session_id;
    msg.command = command;
    msg.cwd = cwd;
    msg.env = env;
    msg.rows = static_cast<uint16_t>(rows);
    msg.cols = static_cast<uint16_t>(cols);

    auto response = request(msg);
    if (!response) {
        return response.error();
    }
    if (response->type != ResponseType::SessionInfo || !response->session) {
        return unexpected(*response);
    }
    return *response->session;
}

Status DaemonClient::kill_session(const std::string& session_id) {
    ClientMessage msg;
    msg.type = RequestType::KillSession;
    msg.session_id = session_id;
    return request(msg).status();
}

Result<PtySessionInfo> DaemonClient::session_status(const std::string& session_id) {
    ClientMessage msg;
    msg.type = RequestType::SessionStatus;
    msg.session_id = session_id;

    auto response = request(msg);
    if (!response) {
        return response.error();
    }
    if (response->type != ResponseType::SessionInfo || !response->session) {
        return unexpected(*response);
    }
    return *response->session;
}

Result<std::vector<PtySessionInfo>> DaemonClient::list_sessions() {
    ClientMessage msg;
    msg.type = RequestType::ListSessions;

    auto response = request(msg);
    if (!response) {
        return response.error();
    }
    if (response->type != ResponseType::SessionList) {
        return unexpected(*response);
    }
    return response->sessions;
}

Status DaemonClient::shutdown_daemon() {
    ClientMessage msg;
    msg.type = RequestType::Shutdown;
    return request(msg).status();
}

Result<std::optional<int>> DaemonClient::attach(const std::string& session_id,
                                                const std::function<void(const std::string&)>& on_output) {
    ClientMessage msg;
    msg.type = RequestType::Attach;
    msg.session_id = session_id;
    if (auto s = request(msg).status(); !s) {
        return s.error();
    }

    detach_requested_.store(false);
    std::string line;
    while (true) {
        ReadOutcome outcome = channel_->read_line(line, ATTACH_POLL);
        if (outcome == ReadOutcome::Closed) {
            if (detach_requested_.load()) {
                return std::optional<int>();
            }
            return make_error(ErrorKind::DaemonUnavailable, "daemon closed the connection");
        }
        if (outcome == ReadOutcome::Timeout) {
            if (detach_requested_.load()) {
                return std::optional<int>();
            }
            continue;
        }

        auto event = decode_daemon_message(line);
        if (!event) {
            spdlog::debug("core.daemon.bad_stream_message error={}", event.error().message);
            continue;
        }
        switch (event->type) {
            case ResponseType::PtyOutput:
                if (event->session_id == session_id) {
                    on_output(event->data);
                }
                break;
            case ResponseType::SessionExited:
                if (event->session_id == session_id) {
                    return std::optional<int>(event->exit_code);
                }
                break;
            case ResponseType::Error:
                spdlog::debug("core.daemon.stream_error code={} message={}", event->code, event->message);
                break;
            default:
                break;
        }
    }
}

Status DaemonClient::write_stdin(const std::string& session_id, const std::string& data) {
    ClientMessage msg;
    msg.type = RequestType::WriteStdin;
    msg.session_id = session_id;
    msg.data = data;
    return send(msg);
}

Status DaemonClient::resize(const std::string& session_id, int rows, int cols) {
    ClientMessage msg;
    msg.type = RequestType::ResizePty;
    msg.session_id = session_id;
    msg.rows = static_cast<uint16_t>(rows);
    msg.cols = static_cast<uint16_t>(cols);
    return send(msg);
}

void DaemonClient::detach(const std::string& session_id) {
    detach_requested_.store(true);
    ClientMessage msg;
    msg.type = RequestType::Detach;
    msg.session_id = session_id;
    if (auto s = send(msg); !s) {
        spdlog::debug("core.daemon.detach_send_failed error={}", s.error().message);
    }
}

}
