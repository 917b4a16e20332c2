#include "core/types.h"

#include <nlohmann/json.hpp>

namespace kild {

const char* agent_kind_name(AgentKind kind) {
    switch (kind) {
        case AgentKind::Claude:   return "claude";
        case AgentKind::Codex:    return "codex";
        case AgentKind::Gemini:   return "gemini";
        case AgentKind::Kiro:     return "kiro";
        case AgentKind::Amp:      return "amp";
        case AgentKind::OpenCode: return "opencode";
        case AgentKind::Shell:    return "shell";
    }
    return "shell";
}

std::optional<AgentKind> parse_agent_kind(const std::string& name) {
    if (name == "claude") return AgentKind::Claude;
    if (name == "codex") return AgentKind::Codex;
    if (name == "gemini") return AgentKind::Gemini;
    if (name == "kiro") return AgentKind::Kiro;
    if (name == "amp") return AgentKind::Amp;
    if (name == "opencode") return AgentKind::OpenCode;
    if (name == "shell" || name == "none") return AgentKind::Shell;
    return std::nullopt;
}

const char* pty_mode_name(PtyMode mode) {
    switch (mode) {
        case PtyMode::Daemon:   return "daemon";
        case PtyMode::External: return "external";
    }
    return "external";
}

std::optional<PtyMode> parse_pty_mode(const std::string& name) {
    if (name == "daemon") return PtyMode::Daemon;
    if (name == "external") return PtyMode::External;
    return std::nullopt;
}

const char* session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::Active:  return "active";
        case SessionStatus::Stopped: return "stopped";
        case SessionStatus::Unknown: return "unknown";
    }
    return "unknown";
}

std::string make_session_id(const std::string& project_id, const std::string& branch) {
    return project_id + "/" + branch;
}

void to_json(nlohmann::json& j, const PortRange& range) {
    j = nlohmann::json{{"base", range.base}, {"count", range.count}};
}

void from_json(const nlohmann::json& j, PortRange& range) {
    if (j.contains("base") && j["base"].is_number_unsigned()) {
        range.base = j["base"].get<uint16_t>();
    }
    if (j.contains("count") && j["count"].is_number_unsigned()) {
        range.count = j["count"].get<uint16_t>();
    }
}

void to_json(nlohmann::json& j, const ProcessHandle& handle) {
    j = nlohmann::json{
        {"pid", handle.pid},
        {"process_name", handle.process_name},
        {"start_time", handle.start_time}
    };
}

void from_json(const nlohmann::json& j, ProcessHandle& handle) {
    if (j.contains("pid") && j["pid"].is_number_integer()) {
        handle.pid = j["pid"].get<pid_t>();
    }
    if (j.contains("process_name") && j["process_name"].is_string()) {
        handle.process_name = j["process_name"].get<std::string>();
    }
    if (j.contains("start_time") && j["start_time"].is_number_unsigned()) {
        handle.start_time = j["start_time"].get<uint64_t>();
    }
}

void to_json(nlohmann::json& j, const Session& session) {
    j = nlohmann::json::object();
    j["id"] = session.id;
    j["project_id"] = session.project_id;
    j["project_path"] = session.project_path;
    j["branch"] = session.branch;
    j["base_branch"] = session.base_branch;
    j["worktree_path"] = session.worktree_path;
    j["owns_branch"] = session.owns_branch;
    j["agent"] = agent_kind_name(session.agent);
    j["command"] = session.command;
    j["port_range"] = session.port_range;
    if (session.process) {
        j["process"] = *session.process;
    } else {
        j["process"] = nullptr;
    }
    j["pty_mode"] = pty_mode_name(session.pty_mode);
    j["note"] = session.note;
    j["created_at"] = session.created_at;
    j["updated_at"] = session.updated_at;
}

void from_json(const nlohmann::json& j, Session& session) {
    auto read_string = [&j](const char* key, std::string& out) {
        if (j.contains(key) && j[key].is_string()) {
            out = j[key].get<std::string>();
        }
    };
    read_string("id", session.id);
    read_string("project_id", session.project_id);
    read_string("project_path", session.project_path);
    read_string("branch", session.branch);
    read_string("base_branch", session.base_branch);
    read_string("worktree_path", session.worktree_path);
    read_string("command", session.command);
    read_string("note", session.note);

    if (j.contains("owns_branch") && j["owns_branch"].is_boolean()) {
        session.owns_branch = j["owns_branch"].get<bool>();
    }
    if (j.contains("agent") && j["agent"].is_string()) {
        session.agent = parse_agent_kind(j["agent"].get<std::string>()).value_or(AgentKind::Shell);
    }
    if (j.contains("port_range") && j["port_range"].is_object()) {
        session.port_range = j["port_range"].get<PortRange>();
    }
    if (j.contains("process") && j["process"].is_object()) {
        session.process = j["process"].get<ProcessHandle>();
    } else {
        session.process.reset();
    }
    if (j.contains("pty_mode") && j["pty_mode"].is_string()) {
        session.pty_mode = parse_pty_mode(j["pty_mode"].get<std::string>()).value_or(PtyMode::External);
    }
    if (j.contains("created_at") && j["created_at"].is_number_integer()) {
        session.created_at = j["created_at"].get<int64_t>();
    }
    if (j.contains("updated_at") && j["updated_at"].is_number_integer()) {
        session.updated_at = j["updated_at"].get<int64_t>();
    }
}

}
