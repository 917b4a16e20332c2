#include "agents/agent_registry.h"
#include "config/kild_config.h"
#include "core/paths.h"
#include "process/command_runner.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace kild {

namespace {

void append_unique(std::vector<std::string>& items, const std::string& value) {
    if (value.empty()) {
        return;
    }
    if (std::find(items.begin(), items.end(), value) == items.end()) {
        items.push_back(value);
    }
}

void append_if_exists(std::vector<std::string>& items, const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec) && !ec) {
        append_unique(items, path.string());
    }
}

std::string read_nvm_default_version(const std::string& home_dir) {
    std::filesystem::path alias_file = std::filesystem::path(home_dir) / ".nvm/alias/default";
    std::ifstream f(alias_file);
    if (!f) return {};
    std::string line;
    std::getline(f, line);
    return trim_whitespace(line);
}

std::string find_nvm_version_bin(const std::string& home_dir, const std::string& alias) {
    if (alias.empty()) return {};
    std::filesystem::path versions_dir = std::filesystem::path(home_dir) / ".nvm/versions/node";
    std::error_code ec;
    if (!std::filesystem::exists(versions_dir, ec) || ec) return {};

    std::filesystem::path exact = versions_dir / alias;
    if (std::filesystem::exists(exact / "bin", ec) && !ec) {
        return (exact / "bin").string();
    }

    std::string version_prefix = alias;
    if (version_prefix[0] != 'v') {
        version_prefix = "v" + version_prefix;
    }

    std::string best_match;
    for (const auto& entry : std::filesystem::directory_iterator(versions_dir, ec)) {
        if (ec || !entry.is_directory()) continue;
        std::string name = entry.path().filename().string();
        if (name.rfind(version_prefix, 0) == 0) {
            std::filesystem::path bin = entry.path() / "bin";
            if (std::filesystem::exists(bin, ec) && !ec && (best_match.empty() || bin.string() > best_match)) {
                best_match = bin.string();
            }
        }
    }
    return best_match;
}

std::vector<std::string> split_path_list(const std::string& value) {
    std::vector<std::string> result;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ':')) {
        item = trim_whitespace(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

std::string user_shell() {
    const char* shell = std::getenv("SHELL");
    return (shell && *shell) ? shell : "/bin/bash";
}

std::vector<AgentBackend> make_backends() {
    return {
        {AgentKind::Claude,   "claude",   "Claude Code", "claude",   {"claude"}},
        {AgentKind::Codex,    "codex",    "Codex CLI",   "codex",    {"codex"}},
        {AgentKind::Gemini,   "gemini",   "Gemini CLI",  "gemini",   {"gemini"}},
        {AgentKind::Kiro,     "kiro",     "Kiro CLI",    "kiro-cli", {"kiro-cli", "kiro"}},
        {AgentKind::Amp,      "amp",      "Amp",         "amp",      {"amp"}},
        {AgentKind::OpenCode, "opencode", "OpenCode",    "opencode", {"opencode"}},
        {AgentKind::Shell,    "shell",    "Shell",       "",         {}},
    };
}

}

std::vector<std::string> build_search_paths() {
    std::vector<std::string> paths;

    const char* env_path = std::getenv("PATH");
    if (env_path && *env_path) {
        for (const auto& entry : split_path_list(env_path)) {
            append_unique(paths, entry);
        }
    }

    append_unique(paths, "/usr/local/bin");
    append_unique(paths, "/usr/bin");
    append_unique(paths, "/bin");

    const char* home = std::getenv("HOME");
    if (home && *home) {
        std::string home_dir = home;
        append_if_exists(paths, std::filesystem::path(home_dir) / ".local/bin");
        append_if_exists(paths, std::filesystem::path(home_dir) / ".cargo/bin");
        append_if_exists(paths, std::filesystem::path(home_dir) / ".npm-global/bin");
        append_if_exists(paths, std::filesystem::path(home_dir) / ".volta/bin");
        append_if_exists(paths, std::filesystem::path(home_dir) / ".bun/bin");

        std::string default_bin = find_nvm_version_bin(home_dir, read_nvm_default_version(home_dir));
        if (!default_bin.empty()) {
            append_unique(paths, default_bin);
        }
    }

    return paths;
}

std::string resolve_executable_path(const std::string& executable) {
    if (executable.empty() || executable.find('/') != std::string::npos) {
        return executable;
    }

    for (const auto& dir : build_search_paths()) {
        std::filesystem::path candidate = std::filesystem::path(dir) / executable;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && !ec) {
            return candidate.string();
        }
    }
    return executable;
}

const std::vector<AgentBackend>& AgentRegistry::all() {
    static const std::vector<AgentBackend> backends = make_backends();
    return backends;
}

const AgentBackend& AgentRegistry::get(AgentKind kind) {
    for (const auto& backend : all()) {
        if (backend.kind == kind) return backend;
    }
    return all().back();
}

std::string AgentRegistry::supported_agents_string() {
    std::string out;
    for (const auto& backend : all()) {
        if (!out.empty()) out += ", ";
        out += backend.name;
    }
    return out;
}

std::string AgentRegistry::launch_command(AgentKind kind, const KildConfig& config) {
    auto it = config.agent.commands.find(agent_kind_name(kind));
    if (it != config.agent.commands.end() && !trim_whitespace(it->second).empty()) {
        return it->second;
    }
    if (kind == AgentKind::Shell) {
        return user_shell();
    }

    // Resolve the executable so a CLI started from a minimal environment still finds it.
    auto argv = split_command_line(get(kind).default_command);
    std::string command = resolve_executable_path(argv.front());
    for (size_t i = 1; i < argv.size(); ++i) {
        command += " " + argv[i];
    }
    return command;
}

bool AgentRegistry::is_available(AgentKind kind, const KildConfig& config) {
    const bool overridden = config.agent.commands.count(agent_kind_name(kind)) > 0;
    if (kind == AgentKind::Shell && !overridden) {
        return true;
    }
    auto argv = split_command_line(launch_command(kind, config));
    if (argv.empty()) {
        return false;
    }
    std::string resolved = resolve_executable_path(argv.front());
    return resolved.find('/') != std::string::npos && access(resolved.c_str(), X_OK) == 0;
}

Status AgentRegistry::check_available(AgentKind kind, const KildConfig& config) {
    if (is_available(kind, config)) {
        return Status::success();
    }
    auto argv = split_command_line(launch_command(kind, config));
    const std::string executable = argv.empty() ? std::string() : argv.front();
    return make_error(ErrorKind::NotFound,
        std::string("agent '") + agent_kind_name(kind) + "' is not installed: '" + executable +
        "' was not found on PATH or in the user bin directories");
}

}
