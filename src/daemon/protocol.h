#pragma once

#include "core/error.h"
#include "process/command_runner.h"
#include <sys/types.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kild {

// Wire protocol between CLI clients and the PTY daemon: one JSON object per
// line over a Unix domain socket. Requests carry an "id" that the matching
// response echoes. pty_output and session_exited are pushed unsolicited to
// attached connections and carry no id.

enum class PtyState {
    Starting,
    Running,
    Idle,
    Busy,
    Exited
};

const char* pty_state_name(PtyState state);
std::optional<PtyState> parse_pty_state(const std::string& name);

enum class RequestType {
    Ping,
    CreateSession,
    Attach,
    Detach,
    WriteStdin,
    ResizePty,
    KillSession,
    SessionStatus,
    ListSessions,
    Shutdown
};

enum class ResponseType {
    Ack,
    Error,
    SessionInfo,
    SessionList,
    PtyOutput,
    SessionExited
};

const char* request_type_name(RequestType type);
const char* response_type_name(ResponseType type);

namespace protocol_error {
constexpr const char* SESSION_NOT_FOUND = "session_not_found";
constexpr const char* SESSION_EXISTS = "session_exists";
constexpr const char* NOT_ATTACHED = "not_attached";
constexpr const char* SPAWN_FAILED = "spawn_failed";
constexpr const char* INVALID_REQUEST = "invalid_request";
}

struct PtySessionInfo {
    std::string session_id;
    PtyState state = PtyState::Starting;
    pid_t pid = 0;
    std::optional<int> exit_code;
    size_t attached_clients = 0;
    std::string command;
    std::string cwd;
};

struct ClientMessage {
    std::string id;
    RequestType type = RequestType::Ping;
    std::string session_id;

    // create_session
    std::string command;
    std::string cwd;
    EnvList env;

    // create_session, resize_pty
    uint16_t rows = 0;
    uint16_t cols = 0;

    // write_stdin; raw bytes, base64 on the wire
    std::string data;
};

struct DaemonMessage {
    std::string id;
    ResponseType type = ResponseType::Ack;

    // error
    std::string code;
    std::string message;

    // session_info / session_list
    std::optional<PtySessionInfo> session;
    std::vector<PtySessionInfo> sessions;

    // pty_output / session_exited; data is raw bytes, base64 on the wire
    std::string session_id;
    std::string data;
    int exit_code = 0;

    static DaemonMessage ack(const std::string& id);
    static DaemonMessage error(const std::string& id, const std::string& code, const std::string& message);
};

// Single-line JSON without the trailing newline.
std::string encode_client_message(const ClientMessage& msg);
std::string encode_daemon_message(const DaemonMessage& msg);

// InvalidInput on malformed JSON, unknown types or missing fields.
Result<ClientMessage> decode_client_message(const std::string& line);
Result<DaemonMessage> decode_daemon_message(const std::string& line);

std::string base64_encode(const std::string& bytes);
Result<std::string> base64_decode(const std::string& text);

}
