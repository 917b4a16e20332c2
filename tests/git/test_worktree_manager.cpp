#include <gtest/gtest.h>
#include "config/kild_config.h"
#include "git/worktree_manager.h"
#include "test_support.h"

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

fs::path canonical(const fs::path& p) {
    return fs::weakly_canonical(p);
}

}

class WorktreeManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!test::git_available()) {
            GTEST_SKIP() << "git is not installed";
        }
        config_.home = home_.path();
        repo_ = repo_dir_.path() / "myrepo";
        ASSERT_TRUE(test::init_git_repo(repo_));

        probe_ = std::make_shared<FixedProbe>(PullRequestState::None);
        manager_ = std::make_unique<WorktreeManager>(config_, probe_);

        auto project = manager_->detect_project(repo_);
        ASSERT_TRUE(project.ok()) << project.error().describe();
        project_ = *project;
    }

    void add_origin() {
        fs::path bare = repo_dir_.path() / "origin.git";
        ASSERT_TRUE(test::run_git(repo_dir_.path(), {"init", "-q", "--bare", bare.string()}));
        ASSERT_TRUE(test::run_git(repo_, {"remote", "add", "origin", bare.string()}));
        ASSERT_TRUE(test::run_git(repo_, {"push", "-q", "origin", "main"}));
    }

    test::TempDir home_;
    test::TempDir repo_dir_;
    fs::path repo_;
    KildConfig config_;
    std::shared_ptr<FixedProbe> probe_;
    std::unique_ptr<WorktreeManager> manager_;
    ProjectInfo project_;
};

TEST(BranchNameTest, Validation) {
    auto ok = validate_branch_name("  feature/login ");
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(*ok, "feature/login");

    for (const char* bad : {"", "   ", "a..b", "-rf", "two words"}) {
        auto result = validate_branch_name(bad);
        ASSERT_FALSE(result.ok()) << bad;
        EXPECT_EQ(result.error().kind, ErrorKind::InvalidInput);
    }
}

TEST_F(WorktreeManagerTest, DetectsProjectFromWorktree) {
    EXPECT_EQ(canonical(project_.root), canonical(repo_));
    EXPECT_EQ(project_.name, "myrepo");

    auto path = manager_->create_worktree(project_, "feature", "main", false);
    ASSERT_TRUE(path.ok()) << path.error().describe();

    auto from_worktree = manager_->detect_project(path->path);
    ASSERT_TRUE(from_worktree.ok());
    EXPECT_EQ(from_worktree->id, project_.id);
}

TEST_F(WorktreeManagerTest, DetectProjectOutsideRepo) {
    test::TempDir plain;
    auto project = manager_->detect_project(plain.path());
    ASSERT_FALSE(project.ok());
    EXPECT_EQ(project.error().kind, ErrorKind::NotFound);
}

TEST_F(WorktreeManagerTest, CreatesWorktreeOnNewBranch) {
    auto path = manager_->create_worktree(project_, "feature/auth", "main", false);
    ASSERT_TRUE(path.ok()) << path.error().describe();

    EXPECT_EQ(path->path, home_.path() / "worktrees" / "myrepo" / "feature-auth");
    EXPECT_TRUE(fs::exists(path->path / "README.md"));
    EXPECT_EQ(manager_->branch_of(path->path), "feature/auth");
    EXPECT_TRUE(manager_->branch_exists(project_, "feature/auth"));
    EXPECT_TRUE(path->created_branch);
}

TEST_F(WorktreeManagerTest, ChecksOutExistingBranch) {
    ASSERT_TRUE(test::run_git(repo_, {"branch", "existing"}));

    auto path = manager_->create_worktree(project_, "existing", "main", false);
    ASSERT_TRUE(path.ok()) << path.error().describe();
    EXPECT_FALSE(path->created_branch);
    EXPECT_EQ(manager_->branch_of(path->path), "existing");
}

TEST_F(WorktreeManagerTest, UnmergedBranchKeptWithoutForce) {
    auto path = manager_->create_worktree(project_, "local-work", "main", false);
    ASSERT_TRUE(path.ok());
    test::write_text(path->path / "work.txt", "work\n");
    ASSERT_TRUE(test::run_git(path->path, {"add", "work.txt"}));
    ASSERT_TRUE(test::run_git(path->path, {"commit", "-q", "-m", "work"}));

    auto removed = manager_->remove_worktree(project_, path->path, "local-work", false, BranchCleanup::IfMerged);
    ASSERT_TRUE(removed.ok()) << removed.error().describe();
    EXPECT_FALSE(fs::exists(path->path));
    EXPECT_TRUE(manager_->branch_exists(project_, "local-work"));
    ASSERT_EQ(removed->warnings.size(), 1u);
    EXPECT_NE(removed->warnings[0].find("unmerged"), std::string::npos);
}

TEST_F(WorktreeManagerTest, KeepLeavesBranchAlone) {
    auto path = manager_->create_worktree(project_, "keeper", "main", false);
    ASSERT_TRUE(path.ok());

    auto removed = manager_->remove_worktree(project_, path->path, "keeper", true, BranchCleanup::Keep);
    ASSERT_TRUE(removed.ok()) << removed.error().describe();
    EXPECT_FALSE(fs::exists(path->path));
    EXPECT_TRUE(manager_->branch_exists(project_, "keeper"));
}

TEST_F(WorktreeManagerTest, ExistingPathConflicts) {
    fs::create_directories(manager_->worktree_path_for(project_, "taken"));
    auto path = manager_->create_worktree(project_, "taken", "main", false);
    ASSERT_FALSE(path.ok());
    EXPECT_EQ(path.error().kind, ErrorKind::WorktreeConflict);
}

TEST_F(WorktreeManagerTest, BranchCheckedOutElsewhere) {
    auto path = manager_->create_worktree(project_, "main", "main", false);
    ASSERT_FALSE(path.ok());
    EXPECT_EQ(path.error().kind, ErrorKind::AlreadyExists);
}

TEST_F(WorktreeManagerTest, UncommittedChangesBlockRemoval) {
    auto path = manager_->create_worktree(project_, "dirty", "main", false);
    ASSERT_TRUE(path.ok());
    test::write_text(path->path / "README.md", "changed\n");
    test::write_text(path->path / "new.txt", "new\n");

    SafetyReport safety = manager_->check_safety(project_, path->path, "dirty");
    EXPECT_TRUE(safety.blocks());
    EXPECT_EQ(safety.uncommitted.modified_files, 1u);
    EXPECT_EQ(safety.uncommitted.untracked_files, 1u);

    auto blocked = manager_->remove_worktree(project_, path->path, "dirty", false, BranchCleanup::Force);
    ASSERT_FALSE(blocked.ok());
    EXPECT_EQ(blocked.error().kind, ErrorKind::SafetyCheckBlocked);
    EXPECT_TRUE(fs::exists(path->path));

    auto forced = manager_->remove_worktree(project_, path->path, "dirty", true, BranchCleanup::Force);
    ASSERT_TRUE(forced.ok()) << forced.error().describe();
    EXPECT_TRUE(forced->forced);
    EXPECT_FALSE(fs::exists(path->path));
    EXPECT_FALSE(manager_->branch_exists(project_, "dirty"));
}

TEST_F(WorktreeManagerTest, CleanRemovalWithoutRemoteHasNoWarnings) {
    auto path = manager_->create_worktree(project_, "clean", "main", false);
    ASSERT_TRUE(path.ok());

    auto removed = manager_->remove_worktree(project_, path->path, "clean", false, BranchCleanup::IfMerged);
    ASSERT_TRUE(removed.ok()) << removed.error().describe();
    EXPECT_TRUE(removed->warnings.empty());
    EXPECT_FALSE(fs::exists(path->path));
    EXPECT_FALSE(manager_->branch_exists(project_, "clean"));
}

TEST_F(WorktreeManagerTest, RemovingMissingWorktreeSucceeds) {
    auto removed = manager_->remove_worktree(project_, home_.path() / "nope", "", false, BranchCleanup::IfMerged);
    ASSERT_TRUE(removed.ok());
}

TEST_F(WorktreeManagerTest, WarnsAboutUnpushedWork) {
    add_origin();

    auto path = manager_->create_worktree(project_, "unpushed", "main", true);
    ASSERT_TRUE(path.ok()) << path.error().describe();

    SafetyReport never_pushed = manager_->check_safety(project_, path->path, "unpushed");
    EXPECT_FALSE(never_pushed.blocks());
    EXPECT_TRUE(never_pushed.has_remote);
    EXPECT_FALSE(never_pushed.has_remote_branch);
    auto warnings = never_pushed.warnings("unpushed");
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_NE(warnings[0].find("never pushed"), std::string::npos);
    EXPECT_NE(warnings[1].find("no pull request"), std::string::npos);

    ASSERT_TRUE(test::run_git(path->path, {"push", "-q", "origin", "unpushed"}));
    test::write_text(path->path / "work.txt", "work\n");
    ASSERT_TRUE(test::run_git(path->path, {"add", "work.txt"}));
    ASSERT_TRUE(test::run_git(path->path, {"commit", "-q", "-m", "work"}));

    SafetyReport ahead = manager_->check_safety(project_, path->path, "unpushed");
    EXPECT_TRUE(ahead.has_remote_branch);
    EXPECT_EQ(ahead.unpushed_commits, 1u);
    auto ahead_warnings = ahead.warnings("unpushed");
    ASSERT_FALSE(ahead_warnings.empty());
    EXPECT_NE(ahead_warnings[0].find("1 unpushed commit"), std::string::npos);

    EXPECT_TRUE(manager_->delete_remote_branch(project_, "unpushed").ok());
}

TEST_F(WorktreeManagerTest, FetchFailureOnlyWarns) {
    ASSERT_TRUE(test::run_git(repo_, {"remote", "add", "origin", (repo_dir_.path() / "missing.git").string()}));

    auto path = manager_->create_worktree(project_, "offline", "main", true);
    ASSERT_TRUE(path.ok()) << path.error().describe();
}

TEST_F(WorktreeManagerTest, DetectsUntrackedWorktrees) {
    auto owned = manager_->create_worktree(project_, "owned", "main", false);
    ASSERT_TRUE(owned.ok());
    auto stray = manager_->create_worktree(project_, "stray", "main", false);
    ASSERT_TRUE(stray.ok());

    Session session;
    session.worktree_path = owned->path.string();

    auto orphans = manager_->detect_untracked_worktrees(project_, {session});
    ASSERT_EQ(orphans.size(), 1u);
    EXPECT_EQ(orphans[0].filename(), "stray");
}
