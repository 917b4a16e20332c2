#pragma once

#include "core/error.h"
#include "core/types.h"
#include <string>
#include <vector>

namespace kild {

struct KildConfig;

struct AgentBackend {
    AgentKind kind;
    const char* name;
    const char* display_name;
    const char* default_command;
    // Extra process-name patterns handed to the process tracker; the tracker
    // itself knows nothing about specific agents.
    std::vector<std::string> process_patterns;
};

class AgentRegistry {
public:
    static const AgentBackend& get(AgentKind kind);
    static const std::vector<AgentBackend>& all();
    static std::string supported_agents_string();

    // [agents.<name>] command from config, else the built-in default.
    static std::string launch_command(AgentKind kind, const KildConfig& config);

    // Whether the launch command's executable resolves to something runnable.
    static bool is_available(AgentKind kind, const KildConfig& config);
    // NotFound naming the missing executable when the agent is not installed.
    static Status check_available(AgentKind kind, const KildConfig& config);
};

// PATH plus common per-user install locations (~/.local/bin, cargo, nvm, volta).
std::vector<std::string> build_search_paths();

// Absolute path for a bare executable name, or the name unchanged if not found.
std::string resolve_executable_path(const std::string& executable);

}
