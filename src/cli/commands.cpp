#include "cli/commands.h"
#include "agents/agent_registry.h"
#include "config/kild_config.h"
#include "core/paths.h"
#include "daemon/daemon_client.h"
#include "daemon/daemon_control.h"
#include "logging/logging.h"
#include "sessions/session_orchestrator.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <thread>
#include <unistd.h>

namespace kild {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr unsigned char DETACH_KEY = 0x1d;  // Ctrl-]

int fail(const Error& error) {
    fprintf(stderr, "error: %s\n", error.describe().c_str());
    return exit_code_for(error.kind);
}

void print_json(const json& j) {
    printf("%s\n", j.dump(2).c_str());
}

json view_to_json(const SessionView& view) {
    json j = view.session;
    j["status"] = session_status_name(view.status);
    return j;
}

void print_session_line(const SessionView& view) {
    const Session& s = view.session;
    printf("%-24s %-8s %-9s %-8s %5u-%-5u %s\n",
        s.branch.c_str(), agent_kind_name(s.agent), session_status_name(view.status),
        pty_mode_name(s.pty_mode), static_cast<unsigned>(s.port_range.base),
        static_cast<unsigned>(s.port_range.last()), s.worktree_path.c_str());
}

void print_warnings(const std::vector<std::string>& warnings) {
    for (const auto& w : warnings) {
        fprintf(stderr, "warning: %s\n", w.c_str());
    }
}

Result<std::optional<AgentKind>> agent_option(const CliArgs& args) {
    if (args.agent.empty()) {
        return std::optional<AgentKind>();
    }
    auto kind = parse_agent_kind(args.agent);
    if (!kind) {
        return make_error(ErrorKind::InvalidInput,
            "unknown agent '" + args.agent + "' (supported: " + AgentRegistry::supported_agents_string() + ")");
    }
    return std::optional<AgentKind>(*kind);
}

std::optional<PtyMode> mode_option(const CliArgs& args) {
    if (args.daemon) return PtyMode::Daemon;
    if (args.external) return PtyMode::External;
    return std::nullopt;
}

CleanupStrategy cleanup_strategy(const CliArgs& args) {
    if (args.orphans) return CleanupStrategy::Orphans;
    if (args.no_pid) return CleanupStrategy::NoPid;
    if (args.stopped) return CleanupStrategy::Stopped;
    return CleanupStrategy::All;
}

void print_health(const HealthReport& report, bool as_json) {
    if (as_json) {
        json sessions = json::array();
        for (const auto& h : report.sessions) {
            json j = {
                {"session_id", h.session_id},
                {"branch", h.branch},
                {"agent", agent_kind_name(h.agent)},
                {"status", session_status_name(h.status)},
                {"cpu_percent", h.cpu_percent},
                {"memory_kb", h.memory_kb},
                {"uptime_secs", h.uptime_secs},
                {"worktree_exists", h.worktree_exists}
            };
            j["pid"] = h.pid ? json(*h.pid) : json(nullptr);
            sessions.push_back(j);
        }
        print_json({
            {"sessions", sessions},
            {"active", report.active},
            {"stopped", report.stopped},
            {"unknown", report.unknown},
            {"total_cpu_percent", report.total_cpu_percent},
            {"total_memory_kb", report.total_memory_kb}
        });
        return;
    }

    for (const auto& h : report.sessions) {
        printf("%-24s %-8s %-9s pid=%-7s cpu=%5.1f%% mem=%7lluKB up=%llus%s\n",
            h.branch.c_str(), agent_kind_name(h.agent), session_status_name(h.status),
            h.pid ? std::to_string(*h.pid).c_str() : "-", h.cpu_percent,
            static_cast<unsigned long long>(h.memory_kb), static_cast<unsigned long long>(h.uptime_secs),
            h.worktree_exists ? "" : " (worktree missing)");
    }
    printf("%zu active, %zu stopped, %zu unknown, cpu %.1f%%, memory %lluKB\n",
        report.active, report.stopped, report.unknown, report.total_cpu_percent,
        static_cast<unsigned long long>(report.total_memory_kb));
}

// Raw terminal for attach; restored on scope exit.
class RawTerminal {
public:
    RawTerminal() {
        if (isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &saved_) == 0) {
            termios raw = saved_;
            cfmakeraw(&raw);
            active_ = tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0;
        }
    }
    ~RawTerminal() {
        if (active_) {
            tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
        }
    }

private:
    termios saved_{};
    bool active_ = false;
};

std::atomic<bool> g_winch{false};

void on_winch(int) {
    g_winch.store(true);
}

int cmd_attach(const KildConfig& config, const CliArgs& args) {
    SessionOrchestrator orchestrator(config);
    auto view = orchestrator.status(args.project, args.positional.front());
    if (!view) {
        return fail(view.error());
    }
    if (view->session.pty_mode != PtyMode::Daemon) {
        return fail(make_error(ErrorKind::InvalidInput,
            "session '" + view->session.branch + "' does not run in the daemon"));
    }
    const std::string session_id = view->session.id;

    DaemonClient client(config.socket_path());
    if (auto s = client.connect(); !s) {
        return fail(s.error());
    }

    signal(SIGPIPE, SIG_IGN);
    signal(SIGWINCH, on_winch);
    fprintf(stderr, "attached to %s (Ctrl-] to detach)\r\n", view->session.branch.c_str());

    RawTerminal raw;
    std::atomic<bool> done{false};

    auto send_size = [&]() {
        winsize ws{};
        if (ioctl(STDIN_FILENO, TIOCGWINSZ, &ws) != 0 || ws.ws_row == 0) {
            return;
        }
        if (auto s = client.resize(session_id, ws.ws_row, ws.ws_col); !s) {
            spdlog::debug("core.attach.resize_failed error={}", s.error().message);
        }
    };

    std::thread input([&]() {
        send_size();
        char buf[1024];
        while (!done.load()) {
            if (g_winch.exchange(false)) {
                send_size();
            }
            pollfd pfd{STDIN_FILENO, POLLIN, 0};
            if (poll(&pfd, 1, 200) <= 0) continue;
            ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
            if (n <= 0) {
                client.detach(session_id);
                return;
            }
            std::string data(buf, static_cast<size_t>(n));
            size_t key = data.find(static_cast<char>(DETACH_KEY));
            if (key != std::string::npos) {
                if (key > 0) {
                    if (auto s = client.write_stdin(session_id, data.substr(0, key)); !s) {
                        spdlog::debug("core.attach.write_failed error={}", s.error().message);
                    }
                }
                client.detach(session_id);
                return;
            }
            if (auto s = client.write_stdin(session_id, data); !s) {
                spdlog::debug("core.attach.write_failed error={}", s.error().message);
                return;
            }
        }
    });

    auto result = client.attach(session_id, [](const std::string& data) {
        fwrite(data.data(), 1, data.size(), stdout);
        fflush(stdout);
    });
    done.store(true);
    input.join();

    if (!result) {
        return fail(result.error());
    }
    if (result->has_value()) {
        fprintf(stderr, "\r\nsession exited with code %d\r\n", **result);
    } else {
        fprintf(stderr, "\r\ndetached\r\n");
    }
    return 0;
}

int cmd_daemon(const KildConfig& config, const CliArgs& args) {
    if (args.subcommand == "start") {
        Status s = args.foreground ? run_daemon(config, true) : start_daemon(config);
        if (!s) return fail(s.error());
        if (!args.foreground) printf("daemon running at %s\n", config.socket_path().c_str());
        return 0;
    }
    if (args.subcommand == "stop") {
        if (auto s = stop_daemon(config); !s) return fail(s.error());
        printf("daemon stopped\n");
        return 0;
    }

    DaemonStatus status = daemon_status(config);
    if (args.json) {
        json sessions = json::array();
        for (const auto& info : status.sessions) {
            sessions.push_back({
                {"session_id", info.session_id},
                {"state", pty_state_name(info.state)},
                {"pid", info.pid},
                {"attached_clients", info.attached_clients}
            });
        }
        print_json({
            {"running", status.running},
            {"socket", status.socket_path.string()},
            {"pid", status.process ? json(status.process->pid) : json(nullptr)},
            {"sessions", sessions}
        });
    } else if (status.running) {
        printf("daemon running at %s (%zu sessions)\n", status.socket_path.c_str(), status.sessions.size());
        for (const auto& info : status.sessions) {
            printf("  %-40s %-8s pid=%d attached=%zu\n", info.session_id.c_str(),
                pty_state_name(info.state), static_cast<int>(info.pid), info.attached_clients);
        }
    } else {
        printf("daemon not running\n");
    }
    return status.running ? 0 : exit_code_for(ErrorKind::DaemonUnavailable);
}

}

int run_command_line(const CliArgs& args) {
    if (args.command == "help") {
        printf("%s", cli_usage().c_str());
        return 0;
    }

    auto loaded = load_config(args.project.empty() ? fs::current_path() : fs::path(args.project));
    if (!loaded) {
        return fail(loaded.error());
    }
    KildConfig& config = *loaded;
    init_cli_logging(args.log_level.empty() ? config.log_level : args.log_level);

    if (args.command == "daemon") return cmd_daemon(config, args);
    if (args.command == "attach") return cmd_attach(config, args);

    auto agent = agent_option(args);
    if (!agent) {
        return fail(agent.error());
    }

    SessionOrchestrator orchestrator(config);
    const fs::path project = args.project;
    const std::string branch = args.positional.empty() ? std::string() : args.positional.front();

    if (args.command == "create") {
        AgentKind effective = agent->value_or(
            parse_agent_kind(config.agent.default_agent).value_or(AgentKind::Claude));
        if (auto s = AgentRegistry::check_available(effective, config); !s) {
            return fail(s.error());
        }

        CreateOptions opts;
        opts.branch = branch;
        opts.agent = *agent;
        opts.base_branch = args.base;
        if (args.no_fetch) opts.fetch = false;
        opts.note = args.note;
        opts.mode = mode_option(args);

        auto session = orchestrator.create(project, opts);
        if (!session) return fail(session.error());
        if (args.json) {
            print_json(view_to_json({*session, orchestrator.derive_status(*session)}));
        } else {
            printf("created %s at %s (ports %u-%u, %s)\n", session->branch.c_str(),
                session->worktree_path.c_str(), static_cast<unsigned>(session->port_range.base),
                static_cast<unsigned>(session->port_range.last()),
                pty_mode_name(session->pty_mode));
        }
        return 0;
    }

    if (args.command == "list") {
        auto views = orchestrator.list(project);
        if (!views) return fail(views.error());
        if (args.json) {
            json out = json::array();
            for (const auto& v : *views) out.push_back(view_to_json(v));
            print_json(out);
        } else if (views->empty()) {
            printf("no sessions\n");
        } else {
            for (const auto& v : *views) print_session_line(v);
        }
        return 0;
    }

    if (args.command == "status") {
        auto view = orchestrator.status(project, branch);
        if (!view) return fail(view.error());
        if (args.json) print_json(view_to_json(*view));
        else print_session_line(*view);
        return 0;
    }

    if (args.command == "open" || args.command == "restart") {
        // Without --agent the session's own agent is relaunched; an unknown
        // session is left for open/restart to report.
        std::optional<AgentKind> effective = *agent;
        if (!effective) {
            if (auto view = orchestrator.status(project, branch)) {
                effective = view->session.agent;
            }
        }
        if (effective) {
            if (auto s = AgentRegistry::check_available(*effective, config); !s) {
                return fail(s.error());
            }
        }

        OpenOptions opts;
        opts.agent = *agent;
        opts.mode = mode_option(args);
        auto session = args.command == "open"
            ? orchestrator.open(project, branch, opts)
            : orchestrator.restart(project, branch, opts);
        if (!session) return fail(session.error());
        printf("%s %s (%s)\n", args.command == "open" ? "opened" : "restarted",
            session->branch.c_str(), agent_kind_name(session->agent));
        return 0;
    }

    if (args.command == "stop") {
        auto session = orchestrator.stop(project, branch);
        if (!session) return fail(session.error());
        printf("stopped %s\n", session->branch.c_str());
        return 0;
    }

    if (args.command == "destroy") {
        auto report = orchestrator.destroy(project, branch, args.force);
        if (!report) return fail(report.error());
        print_warnings(report->warnings);
        printf("destroyed %s\n", report->branch.c_str());
        return 0;
    }

    if (args.command == "complete") {
        auto report = orchestrator.complete(project, branch, args.force);
        if (!report) return fail(report.error());
        print_warnings(report->destroy.warnings);
        printf("completed %s (pull request: %s%s)\n", report->destroy.branch.c_str(),
            pull_request_state_name(report->pull_request),
            report->remote_branch_deleted ? ", remote branch deleted" : "");
        return 0;
    }

    if (args.command == "health") {
        if (!args.watch) {
            auto report = orchestrator.health(project);
            if (!report) return fail(report.error());
            print_health(*report, args.json);
            return 0;
        }
        const int interval = args.interval_secs > 0 ? args.interval_secs : config.health_interval_secs;
        Status s = orchestrator.watch_health(project, std::chrono::seconds(interval), args.count,
            [&](const HealthReport& report) {
                print_health(report, args.json);
                fflush(stdout);
                return true;
            });
        return s ? 0 : fail(s.error());
    }

    if (args.command == "cleanup") {
        auto report = orchestrator.cleanup(project, cleanup_strategy(args), args.force);
        if (!report) return fail(report.error());
        if (args.json) {
            json removed = json::array();
            for (const auto& a : report->removed) {
                removed.push_back({{"kind", anomaly_kind_name(a.kind)}, {"branch", a.branch}, {"path", a.path.string()}});
            }
            json skipped = json::array();
            for (const auto& s : report->skipped) {
                skipped.push_back({{"kind", anomaly_kind_name(s.anomaly.kind)}, {"branch", s.anomaly.branch},
                                   {"path", s.anomaly.path.string()}, {"reason", s.reason}});
            }
            print_json({{"removed", removed}, {"skipped", skipped}});
        } else {
            for (const auto& a : report->removed) {
                printf("removed %-15s %s %s\n", anomaly_kind_name(a.kind), a.branch.c_str(), a.path.c_str());
            }
            for (const auto& s : report->skipped) {
                printf("skipped %-15s %s: %s\n", anomaly_kind_name(s.anomaly.kind),
                    s.anomaly.branch.c_str(), s.reason.c_str());
            }
            if (report->removed.empty() && report->skipped.empty()) {
                printf("nothing to clean up\n");
            }
        }
        return report->skipped.empty() ? 0 : exit_code_for(ErrorKind::SafetyCheckBlocked);
    }

    return fail(make_error(ErrorKind::InvalidInput, "unknown command '" + args.command + "'"));
}

}
