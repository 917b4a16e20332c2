#include <gtest/gtest.h>
#include "core/paths.h"
#include "daemon/daemon_server.h"
#include "process/pid_file.h"
#include "sessions/session_orchestrator.h"
#include "test_support.h"

#include <thread>

using namespace kild;

namespace fs = std::filesystem;

namespace {

class FixedProbe : public PullRequestProbe {
public:
    explicit FixedProbe(PullRequestState state) : state_(state) {}

    PullRequestState state(const fs::path&, const std::string&) const override {
        return state_;
    }

private:
    PullRequestState state_;
};

}

class SessionOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!test::git_available()) {
            GTEST_SKIP() << "git is not installed";
        }
        repo_ = repo_dir_.path() / "webapp";
        ASSERT_TRUE(test::init_git_repo(repo_));

        config_.home = home_.path();
        config_.agent.default_agent = "shell";
        config_.agent.commands["shell"] = "sleep 30";
        config_.agent.kill_grace_ms = 1000;
        config_.git.fetch_before_create = false;
        config_.terminal.mode = PtyMode::External;
        config_.terminal.command.clear();
        config_.daemon.socket_path = (home_.path() / "daemon.sock").string();

        orchestrator_ = std::make_unique<SessionOrchestrator>(
            config_, std::make_shared<FixedProbe>(PullRequestState::None));
    }

    void TearDown() override {
        if (!orchestrator_) {
            return;
        }
        // Leave no sleeping agents behind.
        for (const auto& session : orchestrator_->store().list_all()) {
            auto destroyed = orchestrator_->destroy(repo_, session.branch, true);
            if (!destroyed) {
                ADD_FAILURE() << "teardown destroy failed: " << destroyed.error().describe();
            }
        }
    }

    Result<Session> create(const std::string& branch) {
        CreateOptions options;
        options.branch = branch;
        return orchestrator_->create(repo_, options);
    }

    // A branch made outside kild, carrying one commit of its own.
    bool commit_on_branch(const std::string& branch, const std::string& file) {
        if (!test::run_git(repo_, {"checkout", "-q", "-b", branch})) return false;
        test::write_text(repo_ / file, branch + "\n");
        bool ok = test::run_git(repo_, {"add", file}) &&
                  test::run_git(repo_, {"commit", "-q", "-m", "work on " + branch});
        return test::run_git(repo_, {"checkout", "-q", "main"}) && ok;
    }

    // Commit id of a local branch, empty when it does not exist.
    std::string branch_head(const std::string& branch) {
        auto result = run_command({"git", "-C", repo_.string(), "rev-parse", "--verify", "--quiet",
                                   "refs/heads/" + branch});
        if (!result || !result->ok()) return {};
        return trim_whitespace(result->out);
    }

    // Writes a record straight to disk, bypassing the orchestrator.
    void overwrite(const Session& session) {
        SessionStore store(sessions_dir(home_.path()));
        ASSERT_TRUE(store.save(session).ok());
    }

    test::TempDir home_;
    test::TempDir repo_dir_;
    fs::path repo_;
    KildConfig config_;
    std::unique_ptr<SessionOrchestrator> orchestrator_;
};

TEST_F(SessionOrchestratorTest, CreateAllocatesDisjointPorts) {
    auto first = create("feature-a");
    ASSERT_TRUE(first.ok()) << first.error().describe();
    auto second = create("feature-b");
    ASSERT_TRUE(second.ok()) << second.error().describe();

    EXPECT_EQ(first->port_range, (PortRange{3000, 10}));
    EXPECT_EQ(second->port_range, (PortRange{3010, 10}));
    EXPECT_EQ(first->pty_mode, PtyMode::External);
    ASSERT_TRUE(first->process.has_value());
    EXPECT_EQ(first->process->process_name, "sleep");
    EXPECT_TRUE(fs::exists(first->worktree_path));

    auto views = orchestrator_->list(repo_);
    ASSERT_TRUE(views.ok());
    ASSERT_EQ(views->size(), 2u);
    EXPECT_EQ((*views)[0].status, SessionStatus::Active);
}

TEST_F(SessionOrchestratorTest, DestroyRemovesEverything) {
    auto session = create("feature-a");
    ASSERT_TRUE(session.ok()) << session.error().describe();
    ProcessTracker tracker;
    ASSERT_TRUE(tracker.is_running(*session->process));

    auto report = orchestrator_->destroy(repo_, "feature-a", false);
    ASSERT_TRUE(report.ok()) << report.error().describe();
    EXPECT_FALSE(report->forced);

    EXPECT_FALSE(fs::exists(session->worktree_path));
    EXPECT_FALSE(tracker.is_running(*session->process));
    EXPECT_TRUE(orchestrator_->store().list_all().empty());
    EXPECT_FALSE(fs::exists(pid_file_path(pids_dir(home_.path()), session->id)));

    // The freed range is handed out again.
    auto again = create("feature-b");
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again->port_range.base, 3000);
}

TEST_F(SessionOrchestratorTest, DuplicateBranchRejected) {
    ASSERT_TRUE(create("feature-a").ok());
    auto duplicate = create("feature-a");
    ASSERT_FALSE(duplicate.ok());
    EXPECT_EQ(duplicate.error().kind, ErrorKind::AlreadyExists);
}

TEST_F(SessionOrchestratorTest, InvalidBranchRejected) {
    auto result = create("../escape");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidInput);
}

TEST_F(SessionOrchestratorTest, UnknownBranchIsNotFound) {
    auto status = orchestrator_->status(repo_, "nope");
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, ErrorKind::NotFound);

    auto destroyed = orchestrator_->destroy(repo_, "nope", true);
    ASSERT_FALSE(destroyed.ok());
    EXPECT_EQ(destroyed.error().kind, ErrorKind::NotFound);
}

TEST_F(SessionOrchestratorTest, UncommittedWorkBlocksDestroy) {
    auto session = create("dirty");
    ASSERT_TRUE(session.ok()) << session.error().describe();
    test::write_text(fs::path(session->worktree_path) / "wip.txt", "unsaved\n");

    auto blocked = orchestrator_->destroy(repo_, "dirty", false);
    ASSERT_FALSE(blocked.ok());
    EXPECT_EQ(blocked.error().kind, ErrorKind::SafetyCheckBlocked);
    EXPECT_EQ(exit_code_for(blocked.error().kind), 2);

    // Nothing was touched.
    EXPECT_TRUE(fs::exists(fs::path(session->worktree_path) / "wip.txt"));
    EXPECT_TRUE(orchestrator_->store().load(session->id).has_value());
    ProcessTracker tracker;
    EXPECT_TRUE(tracker.is_running(*session->process));

    auto forced = orchestrator_->destroy(repo_, "dirty", true);
    ASSERT_TRUE(forced.ok()) << forced.error().describe();
    EXPECT_TRUE(forced->forced);
    EXPECT_FALSE(fs::exists(session->worktree_path));
}

TEST_F(SessionOrchestratorTest, StopAndOpen) {
    ASSERT_TRUE(create("feature-a").ok());

    auto stopped = orchestrator_->stop(repo_, "feature-a");
    ASSERT_TRUE(stopped.ok()) << stopped.error().describe();
    EXPECT_FALSE(stopped->process.has_value());

    auto view = orchestrator_->status(repo_, "feature-a");
    ASSERT_TRUE(view.ok());
    EXPECT_EQ(view->status, SessionStatus::Stopped);
    EXPECT_TRUE(fs::exists(view->session.worktree_path));

    auto opened = orchestrator_->open(repo_, "feature-a");
    ASSERT_TRUE(opened.ok()) << opened.error().describe();
    ASSERT_TRUE(opened->process.has_value());
    EXPECT_EQ(orchestrator_->derive_status(*opened), SessionStatus::Active);

    auto twice = orchestrator_->open(repo_, "feature-a");
    ASSERT_FALSE(twice.ok());
    EXPECT_EQ(twice.error().kind, ErrorKind::AlreadyExists);

    auto restarted = orchestrator_->restart(repo_, "feature-a");
    ASSERT_TRUE(restarted.ok()) << restarted.error().describe();
    ASSERT_TRUE(restarted->process.has_value());
    EXPECT_NE(restarted->process->pid, opened->process->pid);
}

TEST_F(SessionOrchestratorTest, StopRefusesReusedPid) {
    auto session = create("feature-a");
    ASSERT_TRUE(session.ok()) << session.error().describe();
    const ProcessHandle real = *session->process;

    Session stale = *session;
    stale.process->start_time += 1;
    overwrite(stale);
    ASSERT_TRUE(delete_pid_file(pid_file_path(pids_dir(home_.path()), session->id)).ok());

    auto stopped = orchestrator_->stop(repo_, "feature-a");
    ASSERT_FALSE(stopped.ok());
    EXPECT_EQ(stopped.error().kind, ErrorKind::IdentityMismatch);

    ProcessTracker tracker;
    EXPECT_TRUE(tracker.is_running(real));
    auto record = orchestrator_->store().load(session->id);
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->process.has_value());

    ASSERT_TRUE(tracker.kill(real, std::chrono::milliseconds(1000)).ok());
}

TEST_F(SessionOrchestratorTest, CleanupRemovesOrphansBothWays) {
    auto gone = create("gone");
    ASSERT_TRUE(gone.ok()) << gone.error().describe();
    fs::remove_all(gone->worktree_path);

    fs::path stray = home_.path() / "worktrees" / "webapp" / "stray";
    ASSERT_TRUE(test::run_git(repo_, {"worktree", "add", "-q", "-b", "stray", stray.string()}));

    auto kept = create("kept");
    ASSERT_TRUE(kept.ok());

    auto anomalies = orchestrator_->find_anomalies(repo_, CleanupStrategy::Orphans);
    ASSERT_TRUE(anomalies.ok());
    ASSERT_EQ(anomalies->size(), 2u);
    EXPECT_EQ((*anomalies)[0].kind, AnomalyKind::OrphanBySession);
    EXPECT_EQ((*anomalies)[0].session_id, gone->id);
    EXPECT_EQ((*anomalies)[1].kind, AnomalyKind::OrphanByWorktree);
    EXPECT_EQ((*anomalies)[1].branch, "stray");

    auto report = orchestrator_->cleanup(repo_, CleanupStrategy::Orphans, false);
    ASSERT_TRUE(report.ok()) << report.error().describe();
    EXPECT_EQ(report->removed.size(), 2u);
    EXPECT_TRUE(report->skipped.empty());

    EXPECT_FALSE(fs::exists(stray));
    EXPECT_FALSE(orchestrator_->store().load(gone->id).has_value());
    EXPECT_TRUE(orchestrator_->store().load(kept->id).has_value());

    ProcessTracker tracker;
    EXPECT_FALSE(tracker.is_running(*gone->process));
}

TEST_F(SessionOrchestratorTest, CleanupSkipsDirtyOrphanWorktree) {
    fs::path stray = home_.path() / "worktrees" / "webapp" / "stray";
    ASSERT_TRUE(test::run_git(repo_, {"worktree", "add", "-q", "-b", "stray", stray.string()}));
    test::write_text(stray / "wip.txt", "unsaved\n");

    auto report = orchestrator_->cleanup(repo_, CleanupStrategy::Orphans, false);
    ASSERT_TRUE(report.ok());
    EXPECT_TRUE(report->removed.empty());
    ASSERT_EQ(report->skipped.size(), 1u);
    EXPECT_TRUE(fs::exists(stray));

    auto forced = orchestrator_->cleanup(repo_, CleanupStrategy::Orphans, true);
    ASSERT_TRUE(forced.ok());
    EXPECT_EQ(forced->removed.size(), 1u);
    EXPECT_FALSE(fs::exists(stray));
}

TEST_F(SessionOrchestratorTest, NoPidAndStoppedAnomalies) {
    auto no_pid = create("no-pid");
    ASSERT_TRUE(no_pid.ok());
    auto stopped = create("stopped");
    ASSERT_TRUE(stopped.ok());
    auto healthy = create("healthy");
    ASSERT_TRUE(healthy.ok());

    ProcessTracker tracker;
    ASSERT_TRUE(tracker.kill(*no_pid->process, std::chrono::milliseconds(1000)).ok());
    Session without_pid = *no_pid;
    without_pid.process.reset();
    overwrite(without_pid);
    ASSERT_TRUE(tracker.kill(*stopped->process, std::chrono::milliseconds(1000)).ok());

    auto only_no_pid = orchestrator_->find_anomalies(repo_, CleanupStrategy::NoPid);
    ASSERT_TRUE(only_no_pid.ok());
    ASSERT_EQ(only_no_pid->size(), 1u);
    EXPECT_EQ((*only_no_pid)[0].session_id, no_pid->id);

    auto only_stopped = orchestrator_->find_anomalies(repo_, CleanupStrategy::Stopped);
    ASSERT_TRUE(only_stopped.ok());
    ASSERT_EQ(only_stopped->size(), 1u);
    EXPECT_EQ((*only_stopped)[0].session_id, stopped->id);

    auto report = orchestrator_->cleanup(repo_, CleanupStrategy::All, false);
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->removed.size(), 2u);

    auto remaining = orchestrator_->store().list_all();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].id, healthy->id);
}

TEST_F(SessionOrchestratorTest, RequiredDaemonMissingRollsBack) {
    config_.terminal.require_daemon = true;

    CreateOptions options;
    options.branch = "needs-daemon";
    options.mode = PtyMode::Daemon;
    auto result = orchestrator_->create(repo_, options);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::DaemonUnavailable);

    EXPECT_TRUE(orchestrator_->store().list_all().empty());
    EXPECT_FALSE(fs::exists(home_.path() / "worktrees" / "webapp" / "needs-daemon"));
    EXPECT_FALSE(test::run_git(repo_, {"rev-parse", "--verify", "--quiet", "refs/heads/needs-daemon"}));
}

TEST_F(SessionOrchestratorTest, MissingDaemonFallsBackToExternal) {
    CreateOptions options;
    options.branch = "fallback";
    options.mode = PtyMode::Daemon;
    auto result = orchestrator_->create(repo_, options);
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(result->pty_mode, PtyMode::External);
    EXPECT_TRUE(result->process.has_value());
}

TEST_F(SessionOrchestratorTest, LaunchFailureRollsBack) {
    config_.agent.commands["shell"] = "kild-definitely-not-a-program";
    auto result = create("broken");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::IoFailure);
    EXPECT_TRUE(orchestrator_->store().list_all().empty());
    EXPECT_FALSE(fs::exists(home_.path() / "worktrees" / "webapp" / "broken"));
}

TEST_F(SessionOrchestratorTest, LaunchFailureKeepsExistingBranch) {
    ASSERT_TRUE(commit_on_branch("feature-x", "local.txt"));
    const std::string head = branch_head("feature-x");
    ASSERT_FALSE(head.empty());

    config_.agent.commands["shell"] = "kild-definitely-not-a-program";
    auto result = create("feature-x");
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(orchestrator_->store().list_all().empty());
    EXPECT_FALSE(fs::exists(home_.path() / "worktrees" / "webapp" / "feature-x"));

    EXPECT_EQ(branch_head("feature-x"), head);
}

TEST_F(SessionOrchestratorTest, DestroyKeepsExistingBranch) {
    ASSERT_TRUE(commit_on_branch("feature-x", "local.txt"));
    const std::string head = branch_head("feature-x");

    auto session = create("feature-x");
    ASSERT_TRUE(session.ok()) << session.error().describe();
    EXPECT_FALSE(session->owns_branch);
    EXPECT_TRUE(fs::exists(fs::path(session->worktree_path) / "local.txt"));

    auto report = orchestrator_->destroy(repo_, "feature-x", false);
    ASSERT_TRUE(report.ok()) << report.error().describe();
    EXPECT_FALSE(fs::exists(session->worktree_path));
    EXPECT_EQ(branch_head("feature-x"), head);

    bool mentioned = false;
    for (const auto& warning : report->warnings) {
        if (warning.find("was kept") != std::string::npos) mentioned = true;
    }
    EXPECT_TRUE(mentioned);
}

TEST_F(SessionOrchestratorTest, CleanupKeepsUnmergedBranchWithoutForce) {
    auto gone = create("gone");
    ASSERT_TRUE(gone.ok()) << gone.error().describe();
    test::write_text(fs::path(gone->worktree_path) / "work.txt", "work\n");
    ASSERT_TRUE(test::run_git(gone->worktree_path, {"add", "work.txt"}));
    ASSERT_TRUE(test::run_git(gone->worktree_path, {"commit", "-q", "-m", "work"}));
    const std::string head = branch_head("gone");
    fs::remove_all(gone->worktree_path);

    auto report = orchestrator_->cleanup(repo_, CleanupStrategy::Orphans, false);
    ASSERT_TRUE(report.ok()) << report.error().describe();
    EXPECT_EQ(report->removed.size(), 1u);
    EXPECT_FALSE(orchestrator_->store().load(gone->id).has_value());
    EXPECT_EQ(branch_head("gone"), head);
}

TEST_F(SessionOrchestratorTest, DaemonBackedSession) {
    DaemonServerOptions options;
    options.socket_path = config_.socket_path();
    options.kill_grace = std::chrono::milliseconds(500);
    DaemonServer server(options);
    ASSERT_TRUE(server.start().ok());
    std::thread loop([&server]() { server.run(); });

    CreateOptions create_options;
    create_options.branch = "in-daemon";
    create_options.mode = PtyMode::Daemon;
    auto session = orchestrator_->create(repo_, create_options);
    ASSERT_TRUE(session.ok()) << session.error().describe();
    EXPECT_EQ(session->pty_mode, PtyMode::Daemon);
    ASSERT_TRUE(session->process.has_value());
    EXPECT_EQ(orchestrator_->derive_status(*session), SessionStatus::Active);

    auto destroyed = orchestrator_->destroy(repo_, "in-daemon", false);
    ASSERT_TRUE(destroyed.ok()) << destroyed.error().describe();
    EXPECT_TRUE(orchestrator_->store().list_all().empty());

    server.request_stop();
    loop.join();
}

TEST_F(SessionOrchestratorTest, CompleteKeepsRemoteWithoutMergedPullRequest) {
    ASSERT_TRUE(create("feature-a").ok());

    auto report = orchestrator_->complete(repo_, "feature-a", false);
    ASSERT_TRUE(report.ok()) << report.error().describe();
    EXPECT_EQ(report->pull_request, PullRequestState::None);
    EXPECT_FALSE(report->remote_branch_deleted);
    EXPECT_TRUE(orchestrator_->store().list_all().empty());
}

TEST_F(SessionOrchestratorTest, CompleteDeletesRemoteBranchWhenMerged) {
    fs::path bare = repo_dir_.path() / "origin.git";
    ASSERT_TRUE(test::run_git(repo_dir_.path(), {"init", "-q", "--bare", bare.string()}));
    ASSERT_TRUE(test::run_git(repo_, {"remote", "add", "origin", bare.string()}));
    ASSERT_TRUE(test::run_git(repo_, {"push", "-q", "origin", "main"}));

    orchestrator_ = std::make_unique<SessionOrchestrator>(
        config_, std::make_shared<FixedProbe>(PullRequestState::Merged));

    auto session = create("feature-m");
    ASSERT_TRUE(session.ok()) << session.error().describe();
    ASSERT_TRUE(test::run_git(session->worktree_path, {"push", "-q", "origin", "feature-m"}));
    ASSERT_TRUE(test::run_git(bare, {"rev-parse", "--verify", "--quiet", "refs/heads/feature-m"}));

    auto report = orchestrator_->complete(repo_, "feature-m", false);
    ASSERT_TRUE(report.ok()) << report.error().describe();
    EXPECT_EQ(report->pull_request, PullRequestState::Merged);
    EXPECT_TRUE(report->remote_branch_deleted);
    EXPECT_FALSE(test::run_git(bare, {"rev-parse", "--verify", "--quiet", "refs/heads/feature-m"}));
    EXPECT_TRUE(orchestrator_->store().list_all().empty());
}

TEST_F(SessionOrchestratorTest, HealthCountsSessions) {
    auto active = create("active");
    ASSERT_TRUE(active.ok());
    auto idle = create("idle");
    ASSERT_TRUE(idle.ok());
    ASSERT_TRUE(orchestrator_->stop(repo_, "idle").ok());

    auto report = orchestrator_->health(repo_);
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->sessions.size(), 2u);
    EXPECT_EQ(report->active, 1u);
    EXPECT_EQ(report->stopped, 1u);
    EXPECT_TRUE(report->sessions[0].worktree_exists);

    int reports = 0;
    auto watched = orchestrator_->watch_health(repo_, std::chrono::seconds(0), 3,
        [&reports](const HealthReport&) { return ++reports < 2; });
    ASSERT_TRUE(watched.ok());
    EXPECT_EQ(reports, 2);
}
