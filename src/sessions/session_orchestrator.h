#pragma once

#include "config/kild_config.h"
#include "core/error.h"
#include "core/types.h"
#include "git/pull_request_probe.h"
#include "git/worktree_manager.h"
#include "process/process_table.h"
#include "process/process_tracker.h"
#include "sessions/port_allocator.h"
#include "sessions/session_store.h"
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kild {

struct CreateOptions {
    std::string branch;
    std::optional<AgentKind> agent;
    // Empty means [git] base_branch.
    std::string base_branch;
    std::optional<bool> fetch;
    std::string note;
    std::optional<PtyMode> mode;
};

struct OpenOptions {
    std::optional<AgentKind> agent;
    std::optional<PtyMode> mode;
};

struct SessionView {
    Session session;
    SessionStatus status = SessionStatus::Unknown;
};

struct DestroyReport {
    std::string session_id;
    std::string branch;
    std::vector<std::string> warnings;
    bool forced = false;
};

struct CompleteReport {
    DestroyReport destroy;
    PullRequestState pull_request = PullRequestState::Unknown;
    bool remote_branch_deleted = false;
};

enum class CleanupStrategy {
    All,
    Orphans,
    NoPid,
    Stopped
};

enum class AnomalyKind {
    // Worktree directory with no session record.
    OrphanByWorktree,
    // Session record whose worktree is gone.
    OrphanBySession,
    NoPid,
    Stopped
};

const char* anomaly_kind_name(AnomalyKind kind);

struct Anomaly {
    AnomalyKind kind = AnomalyKind::NoPid;
    std::string session_id;
    std::string branch;
    std::filesystem::path path;
};

struct SkippedAnomaly {
    Anomaly anomaly;
    std::string reason;
};

struct CleanupReport {
    std::vector<Anomaly> removed;
    std::vector<SkippedAnomaly> skipped;
};

struct SessionHealth {
    std::string session_id;
    std::string branch;
    AgentKind agent = AgentKind::Shell;
    SessionStatus status = SessionStatus::Unknown;
    std::optional<pid_t> pid;
    double cpu_percent = 0.0;
    uint64_t memory_kb = 0;
    uint64_t uptime_secs = 0;
    bool worktree_exists = false;
};

struct HealthReport {
    std::vector<SessionHealth> sessions;
    size_t active = 0;
    size_t stopped = 0;
    size_t unknown = 0;
    double total_cpu_percent = 0.0;
    uint64_t total_memory_kb = 0;
};

// User-level session workflows over the store, port allocator, worktree
// manager, process tracker and PTY daemon. Operations take the path of any
// directory inside the project (or one of its worktrees).
class SessionOrchestrator {
public:
    explicit SessionOrchestrator(const KildConfig& config,
                                 std::shared_ptr<const PullRequestProbe> probe = nullptr,
                                 std::shared_ptr<const ProcessTable> table = nullptr);

    // Allocates ports, creates the worktree, launches the agent and persists
    // the record. A failed launch removes the worktree again before returning.
    Result<Session> create(const std::filesystem::path& project_path, const CreateOptions& options);

    Result<std::vector<SessionView>> list(const std::filesystem::path& project_path) const;
    Result<SessionView> status(const std::filesystem::path& project_path, const std::string& branch) const;

    // Launches an agent in an existing session. AlreadyExists while one runs.
    Result<Session> open(const std::filesystem::path& project_path, const std::string& branch,
                         const OpenOptions& options = {});
    Result<Session> stop(const std::filesystem::path& project_path, const std::string& branch);
    Result<Session> restart(const std::filesystem::path& project_path, const std::string& branch,
                            const OpenOptions& options = {});

    // SafetyCheckBlocked before anything is touched unless `force`.
    Result<DestroyReport> destroy(const std::filesystem::path& project_path, const std::string& branch,
                                  bool force);

    // destroy, then delete the remote branch only when its pull request is merged.
    Result<CompleteReport> complete(const std::filesystem::path& project_path, const std::string& branch,
                                    bool force);

    Result<std::vector<Anomaly>> find_anomalies(const std::filesystem::path& project_path,
                                                CleanupStrategy strategy) const;
    Result<CleanupReport> cleanup(const std::filesystem::path& project_path, CleanupStrategy strategy,
                                  bool force);

    Result<HealthReport> health(const std::filesystem::path& project_path) const;

    // Calls `on_report` every `interval`; stops after `iterations` reports
    // (0 = unbounded) or when the callback returns false.
    Status watch_health(const std::filesystem::path& project_path, std::chrono::seconds interval,
                        int iterations, const std::function<bool(const HealthReport&)>& on_report) const;

    SessionStatus derive_status(const Session& session) const;

    const SessionStore& store() const { return store_; }

private:
    struct LaunchResult {
        std::optional<ProcessHandle> process;
        PtyMode mode = PtyMode::External;
    };

    Result<ProjectInfo> resolve_project(const std::filesystem::path& project_path) const;
    Result<Session> load_session(const ProjectInfo& project, const std::string& branch) const;

    Result<LaunchResult> launch(const Session& session, PtyMode requested);
    Result<LaunchResult> launch_in_daemon(const Session& session);
    Result<LaunchResult> launch_external(const Session& session);

    Result<DestroyReport> destroy_session(const ProjectInfo& project, const Session& session, bool force);

    // Kills whatever the session tracks. IdentityMismatch is returned as-is.
    Status terminate(const Session& session);
    void remove_pid_file(const Session& session) const;
    Status remove_anomaly(const ProjectInfo& project, const Anomaly& anomaly, bool force);

    const KildConfig& config_;
    SessionStore store_;
    PortAllocator ports_;
    WorktreeManager worktrees_;
    ProcessTracker tracker_;
};

}
