#pragma once

#include "core/error.h"
#include "core/types.h"
#include "daemon/protocol.h"
#include <filesystem>
#include <optional>
#include <vector>

namespace kild {

struct KildConfig;

struct DaemonStatus {
    bool running = false;
    std::optional<ProcessHandle> process;
    std::filesystem::path socket_path;
    std::vector<PtySessionInfo> sessions;
};

// Serves the daemon socket in the calling process until a shutdown request,
// SIGINT or SIGTERM. Writes daemon.pid for the duration.
Status run_daemon(const KildConfig& config, bool foreground);

// Detaches a background daemon and waits until it answers ping.
// Succeeds without doing anything when a daemon already answers.
Status start_daemon(const KildConfig& config);

// Asks the daemon to shut down; falls back to signalling the PID recorded in
// daemon.pid when the socket does not answer.
Status stop_daemon(const KildConfig& config);

DaemonStatus daemon_status(const KildConfig& config);

}
