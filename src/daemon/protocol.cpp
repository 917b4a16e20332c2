#include "daemon/protocol.h"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <vector>

namespace kild {

using json = nlohmann::json;

namespace {

struct RequestName {
    RequestType type;
    const char* name;
};

constexpr RequestName REQUEST_NAMES[] = {
    {RequestType::Ping,          "ping"},
    {RequestType::CreateSession, "create_session"},
    {RequestType::Attach,        "attach"},
    {RequestType::Detach,        "detach"},
    {RequestType::WriteStdin,    "write_stdin"},
    {RequestType::ResizePty,     "resize_pty"},
    {RequestType::KillSession,   "kill_session"},
    {RequestType::SessionStatus, "session_status"},
    {RequestType::ListSessions,  "list_sessions"},
    {RequestType::Shutdown,      "shutdown"},
};

struct ResponseName {
    ResponseType type;
    const char* name;
};

constexpr ResponseName RESPONSE_NAMES[] = {
    {ResponseType::Ack,           "ack"},
    {ResponseType::Error,         "error"},
    {ResponseType::SessionInfo,   "session_info"},
    {ResponseType::SessionList,   "session_list"},
    {ResponseType::PtyOutput,     "pty_output"},
    {ResponseType::SessionExited, "session_exited"},
};

std::optional<RequestType> parse_request_type(const std::string& name) {
    for (const auto& entry : REQUEST_NAMES) {
        if (name == entry.name) return entry.type;
    }
    return std::nullopt;
}

std::optional<ResponseType> parse_response_type(const std::string& name) {
    for (const auto& entry : RESPONSE_NAMES) {
        if (name == entry.name) return entry.type;
    }
    return std::nullopt;
}

Error invalid(const std::string& message) {
    return make_error(ErrorKind::InvalidInput, message);
}

std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return {};
}

json info_to_json(const PtySessionInfo& info) {
    json j = {
        {"session_id", info.session_id},
        {"state", pty_state_name(info.state)},
        {"pid", info.pid},
        {"attached_clients", info.attached_clients},
        {"command", info.command},
        {"cwd", info.cwd}
    };
    if (info.exit_code) {
        j["exit_code"] = *info.exit_code;
    }
    return j;
}

PtySessionInfo info_from_json(const json& j) {
    PtySessionInfo info;
    info.session_id = string_field(j, "session_id");
    if (auto state = parse_pty_state(string_field(j, "state"))) {
        info.state = *state;
    }
    info.pid = j.value("pid", 0);
    info.attached_clients = j.value("attached_clients", static_cast<size_t>(0));
    info.command = string_field(j, "command");
    info.cwd = string_field(j, "cwd");
    if (j.contains("exit_code") && j["exit_code"].is_number_integer()) {
        info.exit_code = j["exit_code"].get<int>();
    }
    return info;
}

bool needs_session_id(RequestType type) {
    switch (type) {
        case RequestType::Ping:
        case RequestType::ListSessions:
        case RequestType::Shutdown:
            return false;
        default:
            return true;
    }
}

}

const char* pty_state_name(PtyState state) {
    switch (state) {
        case PtyState::Starting: return "starting";
        case PtyState::Running:  return "running";
        case PtyState::Idle:     return "idle";
        case PtyState::Busy:     return "busy";
        case PtyState::Exited:   return "exited";
    }
    return "exited";
}

std::optional<PtyState> parse_pty_state(const std::string& name) {
    if (name == "starting") return PtyState::Starting;
    if (name == "running") return PtyState::Running;
    if (name == "idle") return PtyState::Idle;
    if (name == "busy") return PtyState::Busy;
    if (name == "exited") return PtyState::Exited;
    return std::nullopt;
}

const char* request_type_name(RequestType type) {
    for (const auto& entry : REQUEST_NAMES) {
        if (entry.type == type) return entry.name;
    }
    return "ping";
}

const char* response_type_name(ResponseType type) {
    for (const auto& entry : RESPONSE_NAMES) {
        if (entry.type == type) return entry.name;
    }
    return "error";
}

DaemonMessage DaemonMessage::ack(const std::string& id) {
    DaemonMessage msg;
    msg.id = id;
    msg.type = ResponseType::Ack;
    return msg;
}

DaemonMessage DaemonMessage::error(const std::string& id, const std::string& code, const std::string& message) {
    DaemonMessage msg;
    msg.id = id;
    msg.type = ResponseType::Error;
    msg.code = code;
    msg.message = message;
    return msg;
}

std::string encode_client_message(const ClientMessage& msg) {
    json j = {{"id", msg.id}, {"type", request_type_name(msg.type)}};
    if (!msg.session_id.empty()) {
        j["session_id"] = msg.session_id;
    }

    switch (msg.type) {
        case RequestType::CreateSession: {
            j["command"] = msg.command;
            j["cwd"] = msg.cwd;
            json env = json::object();
            for (const auto& [key, value] : msg.env) {
                env[key] = value;
            }
            j["env"] = env;
            j["rows"] = msg.rows;
            j["cols"] = msg.cols;
            break;
        }
        case RequestType::ResizePty:
            j["rows"] = msg.rows;
            j["cols"] = msg.cols;
            break;
        case RequestType::WriteStdin:
            j["data"] = base64_encode(msg.data);
            break;
        default:
            break;
    }
    return j.dump();
}

Result<ClientMessage> decode_client_message(const std::string& line) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::exception& e) {
        return invalid(std::string("malformed request: ") + e.what());
    }
    if (!j.is_object()) {
        return invalid("request is not a JSON object");
    }

    ClientMessage msg;
    msg.id = string_field(j, "id");
    auto type = parse_request_type(string_field(j, "type"));
    if (!type) {
        return invalid("unknown request type '" + string_field(j, "type") + "'");
    }
    msg.type = *type;
    msg.session_id = string_field(j, "session_id");
    if (needs_session_id(msg.type) && msg.session_id.empty()) {
        return invalid(std::string(request_type_name(msg.type)) + " requires session_id");
    }

    msg.rows = j.value("rows", static_cast<uint16_t>(0));
    msg.cols = j.value("cols", static_cast<uint16_t>(0));

    switch (msg.type) {
        case RequestType::CreateSession:
            msg.command = string_field(j, "command");
            msg.cwd = string_field(j, "cwd");
            if (msg.command.empty()) {
                return invalid("create_session requires command");
            }
            if (j.contains("env") && j["env"].is_object()) {
                for (auto& [key, value] : j["env"].items()) {
                    if (value.is_string()) {
                        msg.env.emplace_back(key, value.get<std::string>());
                    }
                }
            }
            break;
        case RequestType::ResizePty:
            if (msg.rows == 0 || msg.cols == 0) {
                return invalid("resize_pty requires non-zero rows and cols");
            }
            break;
        case RequestType::WriteStdin: {
            auto data = base64_decode(string_field(j, "data"));
            if (!data) {
                return data.error();
            }
            msg.data = std::move(*data);
            break;
        }
        default:
            break;
    }
    return msg;
}

std::string encode_daemon_message(const DaemonMessage& msg) {
    json j = {{"type", response_type_name(msg.type)}};
    if (!msg.id.empty()) {
        j["id"] = msg.id;
    }

    switch (msg.type) {
        case ResponseType::Error:
            j["code"] = msg.code;
            j["message"] = msg.message;
            break;
        case ResponseType::SessionInfo:
            if (msg.session) {
                j["session"] = info_to_json(*msg.session);
            }
            break;
        case ResponseType::SessionList: {
            json list = json::array();
            for (const auto& info : msg.sessions) {
                list.push_back(info_to_json(info));
            }
            j["sessions"] = list;
            break;
        }
        case ResponseType::PtyOutput:
            j["session_id"] = msg.session_id;
            j["data"] = base64_encode(msg.data);
            break;
        case ResponseType::SessionExited:
            j["session_id"] = msg.session_id;
            j["exit_code"] = msg.exit_code;
            break;
        case ResponseType::Ack:
            break;
    }
    return j.dump();
}

Result<DaemonMessage> decode_daemon_message(const std::string& line) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::exception& e) {
        return invalid(std::string("malformed daemon message: ") + e.what());
    }
    if (!j.is_object()) {
        return invalid("daemon message is not a JSON object");
    }

    DaemonMessage msg;
    msg.id = string_field(j, "id");
    auto type = parse_response_type(string_field(j, "type"));
    if (!type) {
        return invalid("unknown daemon message type '" + string_field(j, "type") + "'");
    }
    msg.type = *type;

    switch (msg.type) {
        case ResponseType::Error:
            msg.code = string_field(j, "code");
            msg.message = string_field(j, "message");
            break;
        case ResponseType::SessionInfo:
            if (j.contains("session") && j["session"].is_object()) {
                msg.session = info_from_json(j["session"]);
            }
            break;
        case ResponseType::SessionList:
            if (j.contains("sessions") && j["sessions"].is_array()) {
                for (const auto& item : j["sessions"]) {
                    msg.sessions.push_back(info_from_json(item));
                }
            }
            break;
        case ResponseType::PtyOutput: {
            msg.session_id = string_field(j, "session_id");
            auto data = base64_decode(string_field(j, "data"));
            if (!data) {
                return data.error();
            }
            msg.data = std::move(*data);
            break;
        }
        case ResponseType::SessionExited:
            msg.session_id = string_field(j, "session_id");
            msg.exit_code = j.value("exit_code", -1);
            break;
        case ResponseType::Ack:
            break;
    }
    return msg;
}

std::string base64_encode(const std::string& bytes) {
    if (bytes.empty()) {
        return {};
    }
    std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
    int n = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(bytes.data()),
                            static_cast<int>(bytes.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(n));
}

Result<std::string> base64_decode(const std::string& text) {
    if (text.empty()) {
        return std::string();
    }
    if (text.size() % 4 != 0) {
        return invalid("base64 payload has invalid length");
    }
    std::vector<unsigned char> out(3 * (text.size() / 4) + 1);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
    if (n < 0) {
        return invalid("base64 payload is malformed");
    }

    // EVP_DecodeBlock keeps the zero bytes that stand in for '=' padding.
    size_t length = static_cast<size_t>(n);
    if (text[text.size() - 1] == '=') --length;
    if (text[text.size() - 2] == '=') --length;
    return std::string(reinterpret_cast<const char*>(out.data()), length);
}

}
