#include "config/kild_config.h"
#include "core/paths.h"

#include <sstream>

namespace kild {

namespace fs = std::filesystem;

namespace {

Error invalid(const std::string& source, const std::string& message) {
    return make_error(ErrorKind::ConfigInvalid, source + ": " + message);
}

Status read_port(const toml::node_view<const toml::node>& node, const char* key,
                 const std::string& source, bool allow_zero, uint16_t& out) {
    auto v = node.value<int64_t>();
    if (!v) return Status::success();
    if (*v < (allow_zero ? 0 : 1) || *v > 65535) {
        return invalid(source, std::string("ports.") + key + " out of range: " + std::to_string(*v));
    }
    out = static_cast<uint16_t>(*v);
    return Status::success();
}

void read_positive(const toml::node_view<const toml::node>& node, int& out) {
    if (auto v = node.value<int64_t>()) {
        if (*v > 0) out = static_cast<int>(*v);
    }
}

}

fs::path KildConfig::socket_path() const {
    if (!daemon.socket_path.empty()) {
        return fs::path(daemon.socket_path);
    }
    return home / "daemon.sock";
}

fs::path KildConfig::daemon_pid_path() const {
    return home / "daemon.pid";
}

fs::path KildConfig::daemon_log_path() const {
    return home / "daemon.log";
}

Status apply_config_table(KildConfig& config, const toml::table& tbl, const std::string& source) {
    if (auto s = read_port(tbl["ports"]["base"], "base", source, false, config.ports.base); !s) return s;
    if (auto s = read_port(tbl["ports"]["count"], "count", source, true, config.ports.count); !s) return s;
    if (config.ports.count == 0) {
        return invalid(source, "ports.count must be greater than zero");
    }

    if (auto v = tbl["git"]["base_branch"].value<std::string>()) config.git.base_branch = *v;
    if (auto v = tbl["git"]["remote"].value<std::string>()) config.git.remote = *v;
    if (auto v = tbl["git"]["fetch_before_create"].value<bool>()) config.git.fetch_before_create = *v;

    if (auto v = tbl["agent"]["default"].value<std::string>()) {
        if (!parse_agent_kind(*v)) {
            return invalid(source, "unknown agent '" + *v + "'");
        }
        config.agent.default_agent = *v;
    }
    read_positive(tbl["agent"]["startup_attempts"], config.agent.startup_attempts);
    read_positive(tbl["agent"]["startup_delay_ms"], config.agent.startup_delay_ms);
    read_positive(tbl["agent"]["kill_grace_ms"], config.agent.kill_grace_ms);

    if (const auto* agents = tbl["agents"].as_table()) {
        for (auto&& [key, node] : *agents) {
            std::string name(key.str());
            if (!parse_agent_kind(name)) {
                return invalid(source, "unknown agent section [agents." + name + "]");
            }
            if (const auto* agent_tbl = node.as_table()) {
                if (auto cmd = (*agent_tbl)["command"].value<std::string>()) {
                    config.agent.commands[name] = *cmd;
                }
            }
        }
    }

    if (auto v = tbl["terminal"]["mode"].value<std::string>()) {
        auto mode = parse_pty_mode(*v);
        if (!mode) {
            return invalid(source, "terminal.mode must be \"daemon\" or \"external\", got \"" + *v + "\"");
        }
        config.terminal.mode = *mode;
    }
    if (auto v = tbl["terminal"]["require_daemon"].value<bool>()) config.terminal.require_daemon = *v;
    if (auto v = tbl["terminal"]["command"].value<std::string>()) config.terminal.command = *v;
    read_positive(tbl["terminal"]["rows"], config.terminal.rows);
    read_positive(tbl["terminal"]["cols"], config.terminal.cols);

    if (auto v = tbl["daemon"]["socket_path"].value<std::string>()) config.daemon.socket_path = *v;
    read_positive(tbl["daemon"]["idle_after_ms"], config.daemon.idle_after_ms);
    read_positive(tbl["daemon"]["exited_retention_ms"], config.daemon.exited_retention_ms);

    read_positive(tbl["health"]["interval_secs"], config.health_interval_secs);

    if (auto v = tbl["logging"]["level"].value<std::string>()) config.log_level = *v;

    return Status::success();
}

Status apply_config_string(KildConfig& config, const std::string& toml_text, const std::string& source) {
    try {
        toml::table tbl = toml::parse(toml_text, source);
        return apply_config_table(config, tbl, source);
    } catch (const toml::parse_error& e) {
        std::ostringstream msg;
        msg << e.description() << " (line " << e.source().begin.line << ")";
        return invalid(source, msg.str());
    }
}

Status apply_config_file(KildConfig& config, const fs::path& file) {
    std::error_code ec;
    if (!fs::exists(file, ec) || ec) {
        return Status::success();
    }
    try {
        toml::table tbl = toml::parse_file(file.string());
        return apply_config_table(config, tbl, file.string());
    } catch (const toml::parse_error& e) {
        std::ostringstream msg;
        msg << e.description() << " (line " << e.source().begin.line << ")";
        return invalid(file.string(), msg.str());
    }
}

Result<KildConfig> load_config(const fs::path& project_path) {
    KildConfig config;
    config.home = kild_home();

    if (auto s = apply_config_file(config, config.home / "config.toml"); !s) {
        return s.error();
    }
    if (!project_path.empty()) {
        if (auto s = apply_config_file(config, project_path / ".kild" / "config.toml"); !s) {
            return s.error();
        }
    }
    return config;
}

}
