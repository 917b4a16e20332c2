#include "sessions/session_orchestrator.h"
#include "agents/agent_registry.h"
#include "core/paths.h"
#include "daemon/daemon_client.h"
#include "process/pid_file.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>
#include <thread>
#include <unistd.h>

namespace kild {

namespace fs = std::filesystem;

namespace {

bool path_exists(const std::string& path) {
    std::error_code ec;
    return !path.empty() && fs::exists(path, ec);
}

void append_missing(std::vector<std::string>& into, const std::vector<std::string>& from) {
    for (const auto& item : from) {
        if (std::find(into.begin(), into.end(), item) == into.end()) {
            into.push_back(item);
        }
    }
}

std::string executable_basename(const std::string& command) {
    auto argv = split_command_line(command);
    if (argv.empty()) {
        return {};
    }
    return fs::path(argv.front()).filename().string();
}

}

const char* anomaly_kind_name(AnomalyKind kind) {
    switch (kind) {
        case AnomalyKind::OrphanByWorktree: return "orphan_worktree";
        case AnomalyKind::OrphanBySession:  return "orphan_session";
        case AnomalyKind::NoPid:            return "no_pid";
        case AnomalyKind::Stopped:          return "stopped";
    }
    return "unknown";
}

SessionOrchestrator::SessionOrchestrator(const KildConfig& config,
                                         std::shared_ptr<const PullRequestProbe> probe,
                                         std::shared_ptr<const ProcessTable> table)
    : config_(config)
    , store_(sessions_dir(config.home))
    , ports_(store_, config.ports.base)
    , worktrees_(config, probe ? std::move(probe) : std::make_shared<GhCliProbe>())
    , tracker_(table ? std::move(table) : std::make_shared<ProcfsProcessTable>())
{
}

Result<ProjectInfo> SessionOrchestrator::resolve_project(const fs::path& project_path) const {
    return worktrees_.detect_project(project_path.empty() ? fs::current_path() : project_path);
}

Result<Session> SessionOrchestrator::load_session(const ProjectInfo& project, const std::string& branch) const {
    auto valid = validate_branch_name(branch);
    if (!valid) {
        return valid.error();
    }
    auto session = store_.load(make_session_id(project.id, *valid));
    if (!session) {
        return make_error(ErrorKind::NotFound,
            "no session for branch '" + *valid + "' in " + project.name);
    }
    return *session;
}

SessionStatus SessionOrchestrator::derive_status(const Session& session) const {
    if (!session.process) {
        return SessionStatus::Stopped;
    }
    switch (tracker_.liveness(*session.process)) {
        case Liveness::Running:    return SessionStatus::Active;
        case Liveness::NotRunning: return SessionStatus::Stopped;
        case Liveness::Unknown:    return SessionStatus::Unknown;
    }
    return SessionStatus::Unknown;
}

Result<Session> SessionOrchestrator::create(const fs::path& project_path, const CreateOptions& options) {
    auto branch = validate_branch_name(options.branch);
    if (!branch) {
        return branch.error();
    }
    auto project = resolve_project(project_path);
    if (!project) {
        return project.error();
    }

    Session session;
    session.id = make_session_id(project->id, *branch);
    session.project_id = project->id;
    session.project_path = project->root.string();
    session.branch = *branch;
    session.base_branch = options.base_branch.empty() ? config_.git.base_branch : options.base_branch;
    session.note = options.note;

    spdlog::info("core.session.create_started session_id={} branch={} project={}",
        session.id, session.branch, project->name);

    if (store_.load(session.id)) {
        return make_error(ErrorKind::AlreadyExists,
            "session for branch '" + session.branch + "' already exists");
    }

    if (options.agent) {
        session.agent = *options.agent;
    } else if (auto configured = parse_agent_kind(config_.agent.default_agent)) {
        session.agent = *configured;
    }
    session.command = AgentRegistry::launch_command(session.agent, config_);

    auto range = ports_.allocate(project->id, config_.ports.count);
    if (!range) {
        return range.error();
    }
    session.port_range = *range;

    const bool fetch = options.fetch.value_or(config_.git.fetch_before_create);
    auto worktree = worktrees_.create_worktree(*project, session.branch, session.base_branch, fetch);
    if (!worktree) {
        spdlog::error("core.session.create_failed session_id={} stage=worktree error={}",
            session.id, worktree.error().message);
        return worktree.error();
    }
    session.worktree_path = worktree->path.string();
    session.owns_branch = worktree->created_branch;

    auto rollback = [&](const Error& cause) -> Error {
        // A branch that was already there before this create is left alone.
        auto removed = worktrees_.remove_worktree(*project, worktree->path, session.branch, true,
            session.owns_branch ? BranchCleanup::Force : BranchCleanup::Keep);
        if (!removed) {
            // Left for cleanup to report as an orphan worktree.
            spdlog::error("core.session.rollback_failed session_id={} path={} error={}",
                session.id, session.worktree_path, removed.error().message);
        } else {
            spdlog::info("core.session.rolled_back session_id={} path={}", session.id, session.worktree_path);
        }
        return cause;
    };

    auto launched = launch(session, options.mode.value_or(config_.terminal.mode));
    if (!launched) {
        spdlog::error("core.session.create_failed session_id={} stage=launch error={}",
            session.id, launched.error().message);
        return rollback(launched.error());
    }
    session.process = launched->process;
    session.pty_mode = launched->mode;
    session.created_at = current_timestamp();
    session.updated_at = session.created_at;

    if (auto s = store_.save(session); !s) {
        if (session.process) {
            if (auto k = terminate(session); !k) {
                spdlog::warn("core.session.rollback_kill_failed session_id={} error={}",
                    session.id, k.error().message);
            }
        }
        return rollback(s.error());
    }

    if (session.process) {
        auto pid_path = pid_file_path(pids_dir(config_.home), session.id);
        if (auto s = write_pid_file(pid_path, *session.process); !s) {
            spdlog::debug("core.session.pid_file_write_failed session_id={} error={}", session.id, s.error().message);
        }
    }

    // Allocation is not reserved, so a concurrent create may have taken the same range.
    for (const auto& other : store_.list(project->id)) {
        if (other.id != session.id && other.port_range.overlaps(session.port_range)) {
            spdlog::warn("core.session.port_overlap session_id={} other={} range={}-{}",
                session.id, other.id, session.port_range.base, session.port_range.last());
        }
    }

    spdlog::info("core.session.create_completed session_id={} worktree={} ports={}-{} mode={}",
        session.id, session.worktree_path, session.port_range.base, session.port_range.last(),
        pty_mode_name(session.pty_mode));
    return session;
}

Result<SessionOrchestrator::LaunchResult> SessionOrchestrator::launch(const Session& session, PtyMode requested) {
    if (requested == PtyMode::Daemon) {
        auto result = launch_in_daemon(session);
        if (result || result.error().kind != ErrorKind::DaemonUnavailable) {
            return result;
        }
        if (config_.terminal.require_daemon) {
            return result.error();
        }
        spdlog::warn("core.session.daemon_fallback session_id={} reason={}", session.id, result.error().message);
    }
    return launch_external(session);
}

Result<SessionOrchestrator::LaunchResult> SessionOrchestrator::launch_in_daemon(const Session& session) {
    DaemonClient client(config_.socket_path());
    auto info = client.create_session(session.id, session.command, session.worktree_path,
                                      port_env_vars(session), config_.terminal.rows, config_.terminal.cols);
    if (!info) {
        return info.error();
    }

    LaunchResult result;
    result.mode = PtyMode::Daemon;
    result.process = tracker_.snapshot(info->pid);
    if (!result.process) {
        spdlog::warn("core.session.daemon_pty_gone session_id={} pid={}", session.id, info->pid);
    }
    return result;
}

Result<SessionOrchestrator::LaunchResult> SessionOrchestrator::launch_external(const Session& session) {
    LaunchResult result;
    result.mode = PtyMode::External;
    const auto env = port_env_vars(session);

    if (config_.terminal.command.empty()) {
        std::error_code ec;
        fs::create_directories(logs_dir(config_.home), ec);
        const fs::path log_file = logs_dir(config_.home) / (sanitize_for_path(session.id) + ".log");

        auto handle = tracker_.spawn_and_track(session.command, session.worktree_path, env, log_file);
        if (!handle) {
            return handle.error();
        }
        result.process = *handle;
        return result;
    }

    // The terminal forks the agent itself, so the process worth tracking has to be found by name.
    auto terminal = tracker_.spawn_and_track(config_.terminal.command + " " + session.command,
                                             session.worktree_path, env);
    if (!terminal) {
        return terminal.error();
    }

    // The agent is ours and started after the terminal that launched it.
    MatchFilter filter;
    filter.uid = geteuid();
    filter.started_at_or_after = terminal->start_time;

    const auto& backend = AgentRegistry::get(session.agent);
    auto found = tracker_.find_by_name_with_retry(executable_basename(session.command),
                                                  backend.process_patterns,
                                                  config_.agent.startup_attempts,
                                                  std::chrono::milliseconds(config_.agent.startup_delay_ms),
                                                  filter);
    if (found) {
        result.process = *found;
    } else {
        spdlog::warn("core.session.agent_not_found session_id={} agent={} error={}",
            session.id, backend.name, found.error().message);
    }
    return result;
}

Result<std::vector<SessionView>> SessionOrchestrator::list(const fs::path& project_path) const {
    auto project = resolve_project(project_path);
    if (!project) {
        return project.error();
    }
    std::vector<SessionView> views;
    for (auto& session : store_.list(project->id)) {
        SessionStatus status = derive_status(session);
        views.push_back(SessionView{std::move(session), status});
    }
    return views;
}

Result<SessionView> SessionOrchestrator::status(const fs::path& project_path, const std::string& branch) const {
    auto project = resolve_project(project_path);
    if (!project) {
        return project.error();
    }
    auto session = load_session(*project, branch);
    if (!session) {
        return session.error();
    }
    SessionStatus status = derive_status(*session);
    return SessionView{std::move(*session), status};
}

Result<Session> SessionOrchestrator::open(const fs::path& project_path, const std::string& branch,
                                          const OpenOptions& options) {
    auto project = resolve_project(project_path);
    if (!project) {
        return project.error();
    }
    auto session = load_session(*project, branch);
    if (!session) {
        return session.error();
    }

    if (derive_status(*session) == SessionStatus::Active) {
        return make_error(ErrorKind::AlreadyExists,
            "an agent is already running in session '" + session->branch + "'");
    }
    if (!path_exists(session->worktree_path)) {
        return make_error(ErrorKind::NotFound,
            "worktree for '" + session->branch + "' is missing: " + session->worktree_path);
    }

    if (options.agent) {
        session->agent = *options.agent;
        session->command = AgentRegistry::launch_command(session->agent, config_);
    }

    auto launched = launch(*session, options.mode.value_or(config_.terminal.mode));
    if (!launched) {
        return launched.error();
    }
    session->process = launched->process;
    session->pty_mode = launched->mode;
    session->updated_at = current_timestamp();

    if (auto s = store_.save(*session); !s) {
        return s.error();
    }
    if (session->process) {
        auto pid_path = pid_file_path(pids_dir(config_.home), session->id);
        if (auto s = write_pid_file(pid_path, *session->process); !s) {
            spdlog::debug("core.session.pid_file_write_failed session_id={} error={}",
                session->id, s.error().message);
        }
    }

    spdlog::info("core.session.opened session_id={} agent={} mode={}",
        session->id, agent_kind_name(session->agent), pty_mode_name(session->pty_mode));
    return session;
}

Status SessionOrchestrator::terminate(const Session& session) {
    std::optional<ProcessHandle> handle = session.process;
    if (!handle) {
        handle = read_pid_file(pid_file_path(pids_dir(config_.home), session.id));
    }

    if (session.pty_mode == PtyMode::Daemon) {
        DaemonClient client(config_.socket_path());
        Status killed = client.kill_session(session.id);
        if (!killed) {
            const ErrorKind kind = killed.error().kind;
            if (kind != ErrorKind::DaemonUnavailable && kind != ErrorKind::NotFound) {
                return killed;
            }
            spdlog::debug("core.session.daemon_kill_skipped session_id={} reason={}",
                session.id, killed.error().message);
        }
    }

    if (!handle) {
        return Status::success();
    }
    return tracker_.kill(*handle, std::chrono::milliseconds(config_.agent.kill_grace_ms));
}

void SessionOrchestrator::remove_pid_file(const Session& session) const {
    auto path = pid_file_path(pids_dir(config_.home), session.id);
    if (auto s = delete_pid_file(path); !s) {
        spdlog::debug("core.session.pid_file_delete_failed session_id={} error={}", session.id, s.error().message);
    }
}

Result<Session> SessionOrchestrator::stop(const fs::path& project_path, const std::string& branch) {
    auto project = resolve_project(project_path);
    if (!project) {
        return project.error();
    }
    auto session = load_session(*project, branch);
    if (!session) {
        return session.error();
    }

    Status killed = terminate(*session);
    if (!killed && killed.error().kind != ErrorKind::IdentityMismatch) {
        return killed.error();
    }

    // On identity mismatch the recorded process is gone either way; drop the
    // stale handle but still surface the mismatch.
    session->process.reset();
    session->updated_at = current_timestamp();
    if (auto s = store_.save(*session); !s) {
        return s.error();
    }
    remove_pid_file(*session);

    if (!killed) {
        return killed.error();
    }
    spdlog::info("core.session.stopped session_id={}", session->id);
    return session;
}

Result<Session> SessionOrchestrator::restart(const fs::path& project_path, const std::string& branch,
                                             const OpenOptions& options) {
    auto stopped = stop(project_path, branch);
    if (!stopped && stopped.error().kind != ErrorKind::IdentityMismatch) {
        return stopped.error();
    }
    return open(project_path, branch, options);
}

Result<DestroyReport> SessionOrchestrator::destroy(const fs::path& project_path, const std::string& branch,
                                                   bool force) {
    auto project = resolve_project(project_path);
    if (!project) {
        return project.error();
    }
    auto session = load_session(*project, branch);
    if (!session) {
        return session.error();
    }
    return destroy_session(*project, *session, force);
}

Result<DestroyReport> SessionOrchestrator::destroy_session(const ProjectInfo& project, const Session& session,
                                                           bool force) {
    DestroyReport report;
    report.session_id = session.id;
    report.branch = session.branch;
    report.forced = force;

    spdlog::info("core.session.destroy_started session_id={} force={}", session.id, force);

    const fs::path worktree = session.worktree_path;
    if (path_exists(session.worktree_path)) {
        SafetyReport safety = worktrees_.check_safety(project, worktree, session.branch);
        if (safety.blocks()) {
            if (!force) {
                spdlog::warn("core.session.destroy_blocked session_id={} reason={}",
                    session.id, safety.block_reason());
                return make_error(ErrorKind::SafetyCheckBlocked,
                    "'" + session.branch + "' has " + safety.block_reason() + "; use --force to destroy anyway");
            }
            spdlog::warn("core.session.safety_override session_id={} reason={}", session.id, safety.block_reason());
        }
        report.warnings = safety.warnings(session.branch);
    }

    if (Status killed = terminate(session); !killed) {
        if (killed.error().kind != ErrorKind::IdentityMismatch) {
            return killed.error();
        }
        report.warnings.push_back("process identity mismatch, not killed: " + killed.error().message);
    }

    auto removed = worktrees_.remove_worktree(project, worktree, session.branch, true,
        session.owns_branch ? BranchCleanup::Force : BranchCleanup::Keep);
    if (!removed) {
        spdlog::error("core.session.destroy_failed session_id={} stage=worktree error={}",
            session.id, removed.error().message);
        return removed.error();
    }
    append_missing(report.warnings, removed->warnings);
    if (!session.owns_branch) {
        report.warnings.push_back("branch '" + session.branch + "' existed before the session and was kept");
    }

    remove_pid_file(session);
    ports_.release(session.project_id, session.port_range);
    if (auto s = store_.remove(session.id); !s) {
        return s.error();
    }

    for (const auto& warning : report.warnings) {
        spdlog::warn("core.session.destroy_warning session_id={} warning={}", session.id, warning);
    }
    spdlog::info("core.session.destroy_completed session_id={}", session.id);
    return report;
}

Result<CompleteReport> SessionOrchestrator::complete(const fs::path& project_path, const std::string& branch,
                                                     bool force) {
    auto project = resolve_project(project_path);
    if (!project) {
        return project.error();
    }
    auto session = load_session(*project, branch);
    if (!session) {
        return session.error();
    }

    CompleteReport report;
    const fs::path probe_dir = path_exists(session->worktree_path) ? fs::path(session->worktree_path) : project->root;
    report.pull_request = worktrees_.pull_request_state(probe_dir, session->branch);

    auto destroyed = destroy_session(*project, *session, force);
    if (!destroyed) {
        return destroyed.error();
    }
    report.destroy = std::move(*destroyed);

    if (report.pull_request == PullRequestState::Merged) {
        if (auto s = worktrees_.delete_remote_branch(*project, session->branch); !s) {
            report.destroy.warnings.push_back(s.error().message);
        } else {
            report.remote_branch_deleted = true;
        }
    } else {
        spdlog::info("core.session.remote_branch_kept session_id={} pull_request={}",
            session->id, pull_request_state_name(report.pull_request));
    }
    return report;
}

Result<std::vector<Anomaly>> SessionOrchestrator::find_anomalies(const fs::path& project_path,
                                                                 CleanupStrategy strategy) const {
    auto project = resolve_project(project_path);
    if (!project) {
        return project.error();
    }

    const bool all = strategy == CleanupStrategy::All;
    const auto sessions = store_.list(project->id);
    std::vector<Anomaly> anomalies;

    for (const auto& session : sessions) {
        Anomaly anomaly{AnomalyKind::NoPid, session.id, session.branch, session.worktree_path};
        if (!path_exists(session.worktree_path)) {
            if (all || strategy == CleanupStrategy::Orphans) {
                anomaly.kind = AnomalyKind::OrphanBySession;
                anomalies.push_back(anomaly);
            }
            continue;
        }
        if (!session.process) {
            if (all || strategy == CleanupStrategy::NoPid) {
                anomalies.push_back(anomaly);
            }
            continue;
        }
        if ((all || strategy == CleanupStrategy::Stopped) &&
            tracker_.liveness(*session.process) == Liveness::NotRunning) {
            anomaly.kind = AnomalyKind::Stopped;
            anomalies.push_back(anomaly);
        }
    }

    if (all || strategy == CleanupStrategy::Orphans) {
        for (const auto& path : worktrees_.detect_untracked_worktrees(*project, sessions)) {
            anomalies.push_back(Anomaly{AnomalyKind::OrphanByWorktree, "", worktrees_.branch_of(path), path});
        }
    }
    return anomalies;
}

Status SessionOrchestrator::remove_anomaly(const ProjectInfo& project, const Anomaly& anomaly, bool force) {
    switch (anomaly.kind) {
        case AnomalyKind::OrphanByWorktree:
            return worktrees_.remove_worktree(project, anomaly.path, anomaly.branch, force,
                force ? BranchCleanup::Force : BranchCleanup::IfMerged).status();

        case AnomalyKind::OrphanBySession: {
            auto session = store_.load(anomaly.session_id);
            if (!session) {
                return Status::success();
            }
            if (auto s = terminate(*session); !s) {
                spdlog::warn("core.cleanup.kill_skipped session_id={} error={}", session->id, s.error().message);
            }
            // Prunes the stale git registration and the branch.
            BranchCleanup cleanup = BranchCleanup::Keep;
            if (session->owns_branch) {
                cleanup = force ? BranchCleanup::Force : BranchCleanup::IfMerged;
            }
            if (auto removed = worktrees_.remove_worktree(project, anomaly.path, anomaly.branch, force, cleanup);
                !removed) {
                return removed.status();
            }
            remove_pid_file(*session);
            return store_.remove(session->id);
        }

        case AnomalyKind::NoPid:
        case AnomalyKind::Stopped: {
            auto session = store_.load(anomaly.session_id);
            if (!session) {
                return Status::success();
            }
            return destroy_session(project, *session, force).status();
        }
    }
    return Status::success();
}

Result<CleanupReport> SessionOrchestrator::cleanup(const fs::path& project_path, CleanupStrategy strategy,
                                                   bool force) {
    auto project = resolve_project(project_path);
    if (!project) {
        return project.error();
    }
    auto anomalies = find_anomalies(project->root, strategy);
    if (!anomalies) {
        return anomalies.error();
    }

    CleanupReport report;
    for (const auto& anomaly : *anomalies) {
        Status s = remove_anomaly(*project, anomaly, force);
        if (s) {
            spdlog::info("core.cleanup.removed kind={} session_id={} path={}",
                anomaly_kind_name(anomaly.kind), anomaly.session_id, anomaly.path.string());
            report.removed.push_back(anomaly);
        } else {
            spdlog::warn("core.cleanup.skipped kind={} session_id={} reason={}",
                anomaly_kind_name(anomaly.kind), anomaly.session_id, s.error().message);
            report.skipped.push_back(SkippedAnomaly{anomaly, s.error().message});
        }
    }
    return report;
}

Result<HealthReport> SessionOrchestrator::health(const fs::path& project_path) const {
    auto project = resolve_project(project_path);
    if (!project) {
        return project.error();
    }

    HealthReport report;
    for (const auto& session : store_.list(project->id)) {
        SessionHealth h;
        h.session_id = session.id;
        h.branch = session.branch;
        h.agent = session.agent;
        h.status = derive_status(session);
        h.worktree_exists = path_exists(session.worktree_path);

        if (session.process) {
            h.pid = session.process->pid;
            if (h.status != SessionStatus::Stopped) {
                if (auto m = tracker_.metrics(*session.process)) {
                    h.cpu_percent = m->cpu_percent;
                    h.memory_kb = m->memory_kb;
                    h.uptime_secs = m->uptime_secs;
                }
            }
        }

        switch (h.status) {
            case SessionStatus::Active:  ++report.active; break;
            case SessionStatus::Stopped: ++report.stopped; break;
            case SessionStatus::Unknown: ++report.unknown; break;
        }
        report.total_cpu_percent += h.cpu_percent;
        report.total_memory_kb += h.memory_kb;
        report.sessions.push_back(std::move(h));
    }
    return report;
}

Status SessionOrchestrator::watch_health(const fs::path& project_path, std::chrono::seconds interval,
                                         int iterations,
                                         const std::function<bool(const HealthReport&)>& on_report) const {
    for (int i = 0; iterations <= 0 || i < iterations; ++i) {
        if (i > 0) {
            std::this_thread::sleep_for(interval);
        }
        auto report = health(project_path);
        if (!report) {
            return report.error();
        }
        if (!on_report(*report)) {
            break;
        }
    }
    return Status::success();
}

}
