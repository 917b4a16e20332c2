#pragma once

#include <memory>
#include <string>
#include <variant>
#include <sys/types.h>

namespace kild {

struct ClientConnection;

struct ClientConnectedEvent {
    std::shared_ptr<ClientConnection> connection;
};

struct ClientLineEvent {
    uint64_t connection_id;
    std::string line;
};

struct ClientGoneEvent {
    uint64_t connection_id;
};

struct PtyOutputEvent {
    std::string session_id;
    uint64_t generation;
    std::string data;
};

struct PtyExitEvent {
    std::string session_id;
    uint64_t generation;
    pid_t pid;
    int exit_code;
};

// Everything the daemon loop reacts to. Producers (accept thread, connection
// readers, PTY io threads) only ever push these; the loop owns all state.
using DaemonEvent = std::variant<ClientConnectedEvent, ClientLineEvent, ClientGoneEvent,
                                 PtyOutputEvent, PtyExitEvent>;

}
