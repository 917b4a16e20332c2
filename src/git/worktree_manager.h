#pragma once

#include "core/error.h"
#include "core/types.h"
#include "git/pull_request_probe.h"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace kild {

struct KildConfig;

struct ProjectInfo {
    std::string id;
    std::string name;
    std::filesystem::path root;
};

struct UncommittedDetails {
    size_t staged_files = 0;
    size_t modified_files = 0;
    size_t untracked_files = 0;

    size_t total() const { return staged_files + modified_files + untracked_files; }
};

// Result of the pre-removal checks. Uncommitted changes block; everything else warns.
struct SafetyReport {
    bool has_uncommitted_changes = false;
    UncommittedDetails uncommitted;
    // If git status could not be read the worktree is assumed dirty.
    bool status_check_failed = false;
    bool has_remote = false;
    bool has_remote_branch = false;
    size_t unpushed_commits = 0;
    PullRequestState pull_request = PullRequestState::Unknown;

    bool blocks() const { return has_uncommitted_changes; }
    std::string block_reason() const;
    std::vector<std::string> warnings(const std::string& branch) const;
};

struct CreatedWorktree {
    std::filesystem::path path;
    // False when an existing local branch was checked out instead.
    bool created_branch = false;
};

// What remove_worktree does with the local branch afterwards.
enum class BranchCleanup {
    Keep,
    // `git branch -d`: kept with a warning when it has unmerged commits.
    IfMerged,
    // `git branch -D`.
    Force,
};

struct RemovalReport {
    std::vector<std::string> warnings;
    bool forced = false;
};

class WorktreeManager {
public:
    WorktreeManager(const KildConfig& config, std::shared_ptr<const PullRequestProbe> probe);

    // Resolves the main repository for any path inside it or inside one of its worktrees.
    Result<ProjectInfo> detect_project(const std::filesystem::path& path) const;

    std::filesystem::path worktree_root(const ProjectInfo& project) const;
    std::filesystem::path worktree_path_for(const ProjectInfo& project, const std::string& branch) const;

    // Fetches `base_branch` unless `fetch` is false, then adds a worktree on
    // `branch` (created from the base when it does not exist yet).
    Result<CreatedWorktree> create_worktree(const ProjectInfo& project,
                                                  const std::string& branch,
                                                  const std::string& base_branch,
                                                  bool fetch);

    SafetyReport check_safety(const ProjectInfo& project,
                              const std::filesystem::path& worktree,
                              const std::string& branch) const;

    // Blocks with SafetyCheckBlocked on uncommitted changes unless `force`.
    // Removes the worktree directory and its git registration, then handles
    // the local branch according to `cleanup`.
    Result<RemovalReport> remove_worktree(const ProjectInfo& project,
                                          const std::filesystem::path& path,
                                          const std::string& branch,
                                          bool force,
                                          BranchCleanup cleanup);

    // Directories under the project's worktree root with no matching session.
    std::vector<std::filesystem::path> detect_untracked_worktrees(const ProjectInfo& project,
                                                                  const std::vector<Session>& sessions) const;

    std::string branch_of(const std::filesystem::path& worktree) const;
    bool branch_exists(const ProjectInfo& project, const std::string& branch) const;
    Status delete_remote_branch(const ProjectInfo& project, const std::string& branch);
    PullRequestState pull_request_state(const std::filesystem::path& dir, const std::string& branch) const;

private:
    bool has_remote(const ProjectInfo& project) const;
    std::string checked_out_at(const ProjectInfo& project, const std::string& branch) const;
    Status delete_local_branch(const ProjectInfo& project, const std::string& branch, bool force);

    const KildConfig& config_;
    std::shared_ptr<const PullRequestProbe> probe_;
};

// Empty, "..", whitespace or a leading '-' are rejected. Returns the trimmed name.
Result<std::string> validate_branch_name(const std::string& branch);

}
