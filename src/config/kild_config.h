#pragma once

#include "core/error.h"
#include "core/types.h"
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <toml++/toml.hpp>

namespace kild {

struct PortsConfig {
    uint16_t base = 3000;
    uint16_t count = 10;
};

struct GitConfig {
    std::string base_branch = "main";
    std::string remote = "origin";
    bool fetch_before_create = true;
};

struct AgentConfig {
    std::string default_agent = "claude";
    int startup_attempts = 5;
    int startup_delay_ms = 200;
    int kill_grace_ms = 2000;
    std::map<std::string, std::string> commands;
};

struct TerminalConfig {
    PtyMode mode = PtyMode::External;
    bool require_daemon = false;
    std::string command;
    int rows = 24;
    int cols = 80;
};

struct DaemonConfig {
    std::string socket_path;
    int idle_after_ms = 2000;
    // How long an exited PTY record stays queryable before it is discarded.
    int exited_retention_ms = 60000;
};

struct KildConfig {
    std::filesystem::path home;
    PortsConfig ports;
    GitConfig git;
    AgentConfig agent;
    TerminalConfig terminal;
    DaemonConfig daemon;
    int health_interval_secs = 5;
    std::string log_level = "info";

    std::filesystem::path socket_path() const;
    std::filesystem::path daemon_pid_path() const;
    std::filesystem::path daemon_log_path() const;
};

// Defaults, then $KILD_HOME/config.toml, then <project>/.kild/config.toml.
Result<KildConfig> load_config(const std::filesystem::path& project_path = {});

Status apply_config_file(KildConfig& config, const std::filesystem::path& file);
Status apply_config_string(KildConfig& config, const std::string& toml_text,
                           const std::string& source_name = "<string>");
Status apply_config_table(KildConfig& config, const toml::table& tbl, const std::string& source_name);

}
