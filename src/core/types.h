#pragma once

#include <nlohmann/json_fwd.hpp>
#include <sys/types.h>
#include <cstdint>
#include <optional>
#include <string>

namespace kild {

enum class AgentKind {
    Claude,
    Codex,
    Gemini,
    Kiro,
    Amp,
    OpenCode,
    Shell
};

enum class PtyMode {
    Daemon,
    External
};

// Derived at read time from process liveness, never stored.
enum class SessionStatus {
    Active,
    Stopped,
    Unknown
};

// Half-open range [base, base + count).
struct PortRange {
    uint16_t base = 0;
    uint16_t count = 0;

    uint32_t end() const { return static_cast<uint32_t>(base) + count; }
    uint16_t last() const { return static_cast<uint16_t>(end() - 1); }
    bool overlaps(const PortRange& other) const {
        return base < other.end() && other.base < end();
    }
    bool operator==(const PortRange& other) const {
        return base == other.base && count == other.count;
    }
};

// A PID is never trusted alone: name and start time are compared before acting on it.
struct ProcessHandle {
    pid_t pid = 0;
    std::string process_name;
    uint64_t start_time = 0;

    bool operator==(const ProcessHandle& other) const {
        return pid == other.pid && process_name == other.process_name &&
               start_time == other.start_time;
    }
};

struct Session {
    std::string id;
    std::string project_id;
    std::string project_path;
    std::string branch;
    std::string base_branch;
    std::string worktree_path;
    // False when the branch existed before the session; such a branch is never deleted.
    bool owns_branch = true;
    AgentKind agent = AgentKind::Claude;
    std::string command;
    PortRange port_range;
    std::optional<ProcessHandle> process;
    PtyMode pty_mode = PtyMode::External;
    std::string note;
    int64_t created_at = 0;
    int64_t updated_at = 0;
};

const char* agent_kind_name(AgentKind kind);
std::optional<AgentKind> parse_agent_kind(const std::string& name);
const char* pty_mode_name(PtyMode mode);
std::optional<PtyMode> parse_pty_mode(const std::string& name);
const char* session_status_name(SessionStatus status);

std::string make_session_id(const std::string& project_id, const std::string& branch);

void to_json(nlohmann::json& j, const PortRange& range);
void from_json(const nlohmann::json& j, PortRange& range);
void to_json(nlohmann::json& j, const ProcessHandle& handle);
void from_json(const nlohmann::json& j, ProcessHandle& handle);
void to_json(nlohmann::json& j, const Session& session);
void from_json(const nlohmann::json& j, Session& session);

}
