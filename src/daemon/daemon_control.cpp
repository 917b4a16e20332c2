#include "daemon/daemon_control.h"
#include "config/kild_config.h"
#include "core/paths.h"
#include "daemon/daemon_client.h"
#include "daemon/daemon_server.h"
#include "logging/logging.h"
#include "process/pid_file.h"
#include "process/process_tracker.h"
#include "sessions/session_store.h"

#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace kild {

namespace {

constexpr int STARTUP_PROBES = 50;
constexpr auto STARTUP_PROBE_INTERVAL = std::chrono::milliseconds(100);
constexpr auto SHUTDOWN_SLACK = std::chrono::seconds(3);

DaemonServer* g_running_server = nullptr;

void handle_stop_signal(int) {
    if (g_running_server) {
        g_running_server->request_stop();
    }
}

void install_signal_handlers(DaemonServer* server) {
    g_running_server = server;

    struct sigaction sa{};
    sa.sa_handler = handle_stop_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    signal(SIGPIPE, SIG_IGN);
}

void restore_signal_handlers() {
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    g_running_server = nullptr;
}

bool daemon_answers(const KildConfig& config) {
    DaemonClient client(config.socket_path(), std::chrono::seconds(2));
    return client.ping().ok();
}

void redirect_stdio_to_null() {
    int devnull = open("/dev/null", O_RDWR);
    if (devnull < 0) {
        return;
    }
    dup2(devnull, STDIN_FILENO);
    dup2(devnull, STDOUT_FILENO);
    dup2(devnull, STDERR_FILENO);
    if (devnull > STDERR_FILENO) {
        close(devnull);
    }
}

}

Status run_daemon(const KildConfig& config, bool foreground) {
    if (daemon_answers(config)) {
        return make_error(ErrorKind::AlreadyExists,
            "daemon already running at " + config.socket_path().string());
    }

    std::error_code ec;
    std::filesystem::create_directories(config.home, ec);
    if (ec) {
        return make_error(ErrorKind::IoFailure, "cannot create " + config.home.string() + ": " + ec.message());
    }

    init_daemon_logging(config.daemon_log_path(), config.log_level, foreground);

    SessionStore store(sessions_dir(config.home));

    DaemonServerOptions options;
    options.socket_path = config.socket_path();
    options.idle_after = std::chrono::milliseconds(config.daemon.idle_after_ms);
    options.kill_grace = std::chrono::milliseconds(config.agent.kill_grace_ms);
    options.exited_retention = std::chrono::milliseconds(config.daemon.exited_retention_ms);

    DaemonServer server(options, &store);
    if (auto s = server.start(); !s) {
        spdlog::error("daemon.server.start_failed error={}", s.error().message);
        return s;
    }

    ProcessTracker tracker;
    const auto pid_path = config.daemon_pid_path();
    if (auto self = tracker.snapshot(getpid())) {
        if (auto s = write_pid_file(pid_path, *self); !s) {
            spdlog::warn("daemon.pid_file.write_failed path={} error={}", pid_path.string(), s.error().message);
        }
    }

    spdlog::info("daemon.started pid={} socket={} foreground={}", getpid(), options.socket_path.string(), foreground);

    install_signal_handlers(&server);
    server.run();
    restore_signal_handlers();

    if (auto s = delete_pid_file(pid_path); !s) {
        spdlog::debug("daemon.pid_file.delete_failed path={} error={}", pid_path.string(), s.error().message);
    }
    spdlog::info("daemon.exited");
    return Status::success();
}

Status start_daemon(const KildConfig& config) {
    if (daemon_answers(config)) {
        spdlog::info("core.daemon.already_running socket={}", config.socket_path().string());
        return Status::success();
    }

    pid_t child = fork();
    if (child < 0) {
        return make_error(ErrorKind::IoFailure, std::string("fork failed: ") + std::strerror(errno));
    }

    if (child == 0) {
        setsid();
        pid_t grandchild = fork();
        if (grandchild != 0) {
            _exit(grandchild < 0 ? 1 : 0);
        }
        if (chdir("/") != 0) {
            _exit(1);
        }
        redirect_stdio_to_null();
        Status s = run_daemon(config, false);
        _exit(s.ok() ? 0 : 1);
    }

    int status = 0;
    waitpid(child, &status, 0);
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return make_error(ErrorKind::IoFailure, "failed to detach daemon process");
    }

    for (int attempt = 0; attempt < STARTUP_PROBES; ++attempt) {
        if (daemon_answers(config)) {
            spdlog::info("core.daemon.started socket={}", config.socket_path().string());
            return Status::success();
        }
        std::this_thread::sleep_for(STARTUP_PROBE_INTERVAL);
    }
    return make_error(ErrorKind::DaemonUnavailable,
        "daemon did not come up; see " + config.daemon_log_path().string());
}

Status stop_daemon(const KildConfig& config) {
    const auto socket = config.socket_path();
    const auto pid_path = config.daemon_pid_path();

    DaemonClient client(socket);
    Status requested = client.shutdown_daemon();
    if (requested.ok()) {
        const auto deadline = std::chrono::steady_clock::now() +
            std::chrono::milliseconds(config.agent.kill_grace_ms) + SHUTDOWN_SLACK;
        std::error_code ec;
        while (std::filesystem::exists(socket, ec) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(STARTUP_PROBE_INTERVAL);
        }
        spdlog::info("core.daemon.stopped socket={}", socket.string());
        return Status::success();
    }
    if (requested.error().kind != ErrorKind::DaemonUnavailable) {
        return requested;
    }

    auto handle = read_pid_file(pid_path);
    if (!handle) {
        return make_error(ErrorKind::NotFound, "daemon is not running");
    }

    ProcessTracker tracker;
    Status killed = tracker.kill(*handle, std::chrono::milliseconds(config.agent.kill_grace_ms));
    if (auto s = delete_pid_file(pid_path); !s) {
        spdlog::debug("core.daemon.pid_file_delete_failed error={}", s.error().message);
    }
    std::error_code ec;
    std::filesystem::remove(socket, ec);
    if (!killed) {
        return killed;
    }
    spdlog::info("core.daemon.stopped pid={} via=signal", handle->pid);
    return Status::success();
}

DaemonStatus daemon_status(const KildConfig& config) {
    DaemonStatus status;
    status.socket_path = config.socket_path();
    status.process = read_pid_file(config.daemon_pid_path());

    DaemonClient client(status.socket_path);
    auto sessions = client.list_sessions();
    if (sessions) {
        status.running = true;
        status.sessions = std::move(*sessions);
    }
    return status;
}

}
