#include "daemon/pty_registry.h"

#include <spdlog/spdlog.h>

namespace kild {

PtySessionInfo PtyEntry::info() const {
    PtySessionInfo out;
    out.session_id = session_id;
    out.state = state;
    out.pid = pid;
    out.exit_code = exit_code;
    out.attached_clients = attached.size();
    out.command = command;
    out.cwd = cwd;
    return out;
}

PtyRegistry::PtyRegistry(OutputSink on_output, ExitSink on_exit,
                         std::chrono::milliseconds idle_after, std::chrono::milliseconds kill_grace,
                         std::chrono::milliseconds exited_retention)
    : on_output_(std::move(on_output))
    , on_exit_(std::move(on_exit))
    , idle_after_(idle_after)
    , kill_grace_(kill_grace)
    , exited_retention_(exited_retention)
{
}

PtyRegistry::~PtyRegistry() {
    stop_all();
    entries_.clear();
}

PtyEntry* PtyRegistry::find(const std::string& session_id) {
    auto it = entries_.find(session_id);
    return it == entries_.end() ? nullptr : &it->second;
}

const PtyEntry* PtyRegistry::find(const std::string& session_id) const {
    auto it = entries_.find(session_id);
    return it == entries_.end() ? nullptr : &it->second;
}

Result<PtySessionInfo> PtyRegistry::open(const std::string& session_id, const PtyConfig& config) {
    if (const PtyEntry* existing = find(session_id)) {
        if (existing->live()) {
            return make_error(ErrorKind::AlreadyExists, "pty session '" + session_id + "' already running");
        }
        entries_.erase(session_id);
    }

    const uint64_t generation = next_generation_++;

    PtyEntry entry;
    entry.session_id = session_id;
    entry.generation = generation;
    entry.command = config.command;
    entry.cwd = config.cwd;
    entry.state = PtyState::Starting;
    entry.process = std::make_unique<PtyProcess>();

    PtyProcess* process = entry.process.get();
    process->set_output_callback([this, session_id, generation](const std::string& data) {
        on_output_(session_id, generation, data);
    });
    process->set_exit_callback([this, session_id, generation, process](int exit_code) {
        on_exit_(session_id, generation, process->pid(), exit_code);
    });

    if (auto s = process->start(config); !s) {
        return s.error();
    }

    entry.pid = process->pid();
    entry.state = PtyState::Running;
    entry.started_at = std::chrono::steady_clock::now();

    PtySessionInfo info = entry.info();
    entries_.emplace(session_id, std::move(entry));

    spdlog::info("daemon.pty.opened session={} pid={} command={}", session_id, info.pid, config.command);
    return info;
}

Status PtyRegistry::attach(const std::string& session_id, uint64_t connection_id) {
    PtyEntry* entry = find(session_id);
    if (!entry || !entry->live()) {
        return make_error(ErrorKind::NotFound, "no running pty session '" + session_id + "'");
    }
    entry->attached.insert(connection_id);
    spdlog::debug("daemon.pty.attached session={} connection={}", session_id, connection_id);
    return Status::success();
}

Status PtyRegistry::detach(const std::string& session_id, uint64_t connection_id) {
    PtyEntry* entry = find(session_id);
    if (!entry) {
        return make_error(ErrorKind::NotFound, "no pty session '" + session_id + "'");
    }
    entry->attached.erase(connection_id);
    return Status::success();
}

void PtyRegistry::detach_everywhere(uint64_t connection_id) {
    for (auto& [id, entry] : entries_) {
        entry.attached.erase(connection_id);
    }
}

Status PtyRegistry::write_input(const std::string& session_id, uint64_t connection_id, const std::string& data) {
    PtyEntry* entry = find(session_id);
    if (!entry || !entry->live()) {
        return make_error(ErrorKind::NotFound, "no running pty session '" + session_id + "'");
    }
    if (entry->attached.count(connection_id) == 0) {
        return make_error(ErrorKind::InvalidInput, "connection is not attached to '" + session_id + "'");
    }
    return entry->process->write_stdin(data);
}

Status PtyRegistry::resize(const std::string& session_id, int rows, int cols) {
    PtyEntry* entry = find(session_id);
    if (!entry || !entry->live()) {
        return make_error(ErrorKind::NotFound, "no running pty session '" + session_id + "'");
    }
    return entry->process->resize(rows, cols);
}

Status PtyRegistry::kill(const std::string& session_id) {
    PtyEntry* entry = find(session_id);
    if (!entry) {
        return make_error(ErrorKind::NotFound, "no pty session '" + session_id + "'");
    }
    if (entry->live()) {
        spdlog::info("daemon.pty.kill_requested session={} pid={}", session_id, entry->pid);
        entry->process->stop(kill_grace_);
    }
    return Status::success();
}

bool PtyRegistry::record_output(const std::string& session_id, uint64_t generation,
                                std::chrono::steady_clock::time_point now) {
    PtyEntry* entry = find(session_id);
    if (!entry || entry->generation != generation) {
        return false;
    }
    entry->last_output = now;
    if (entry->live()) {
        entry->state = PtyState::Busy;
    }
    return true;
}

bool PtyRegistry::mark_exited(const std::string& session_id, uint64_t generation, int exit_code,
                              std::chrono::steady_clock::time_point now) {
    PtyEntry* entry = find(session_id);
    if (!entry || entry->generation != generation) {
        return false;
    }
    entry->state = PtyState::Exited;
    entry->exit_code = exit_code;
    entry->exited_at = now;
    // The exit callback is the io thread's last act, so this join is short.
    entry->process.reset();
    spdlog::info("daemon.pty.exited session={} pid={} exit_code={}", session_id, entry->pid, exit_code);
    return true;
}

std::vector<uint64_t> PtyRegistry::attached_to(const std::string& session_id) const {
    const PtyEntry* entry = find(session_id);
    if (!entry) {
        return {};
    }
    return std::vector<uint64_t>(entry->attached.begin(), entry->attached.end());
}

std::optional<PtySessionInfo> PtyRegistry::take_status(const std::string& session_id) {
    PtyEntry* entry = find(session_id);
    if (!entry) {
        return std::nullopt;
    }
    PtySessionInfo info = entry->info();
    if (!entry->live()) {
        entries_.erase(session_id);
    }
    return info;
}

std::vector<PtySessionInfo> PtyRegistry::list() const {
    std::vector<PtySessionInfo> out;
    out.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        out.push_back(entry.info());
    }
    return out;
}

void PtyRegistry::refresh_activity(std::chrono::steady_clock::time_point now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        const PtyEntry& entry = it->second;
        if (!entry.live() && entry.exited_at && now - *entry.exited_at >= exited_retention_) {
            spdlog::debug("daemon.pty.record_expired session={}", it->first);
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }

    for (auto& [id, entry] : entries_) {
        if (!entry.live() || entry.state == PtyState::Starting) {
            continue;
        }
        auto since = entry.last_output.value_or(entry.started_at);
        if (now - since >= idle_after_) {
            entry.state = PtyState::Idle;
        } else if (entry.last_output) {
            entry.state = PtyState::Busy;
        }
    }
}

void PtyRegistry::stop_all() {
    for (auto& [id, entry] : entries_) {
        if (entry.live() && entry.process) {
            entry.process->stop(kill_grace_);
        }
    }
}

size_t PtyRegistry::live_count() const {
    size_t n = 0;
    for (const auto& [id, entry] : entries_) {
        if (entry.live()) ++n;
    }
    return n;
}

}
