#include "git/worktree_manager.h"
#include "config/kild_config.h"
#include "core/paths.h"
#include "process/command_runner.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace kild {

namespace fs = std::filesystem;

namespace {

Result<CommandResult> run_git(const fs::path& dir, std::vector<std::string> args) {
    std::vector<std::string> argv = {"git", "-C", dir.string()};
    argv.insert(argv.end(), args.begin(), args.end());
    return run_command(argv, {}, {{"GIT_TERMINAL_PROMPT", "0"}});
}

// stdout of a successful git call, trimmed; empty on any failure.
std::string git_output(const fs::path& dir, std::vector<std::string> args) {
    auto result = run_git(dir, std::move(args));
    if (!result || !result->ok()) return {};
    return trim_whitespace(result->out);
}

const char* branch_cleanup_name(BranchCleanup cleanup) {
    switch (cleanup) {
        case BranchCleanup::Keep:     return "keep";
        case BranchCleanup::IfMerged: return "if_merged";
        case BranchCleanup::Force:    return "force";
    }
    return "keep";
}

Error git_failure(const std::string& what, const Result<CommandResult>& result) {
    if (!result) {
        return make_error(ErrorKind::IoFailure, what + ": " + result.error().message);
    }
    return make_error(ErrorKind::IoFailure, what + ": " + trim_whitespace(result->err));
}

fs::path normalized(const fs::path& p) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(p, ec);
    return ec ? p.lexically_normal() : canonical;
}

std::string pluralize(size_t n, const char* noun) {
    return std::to_string(n) + " " + noun + (n == 1 ? "" : "s");
}

}

Result<std::string> validate_branch_name(const std::string& branch) {
    std::string trimmed = trim_whitespace(branch);
    if (trimmed.empty()) {
        return make_error(ErrorKind::InvalidInput, "branch name is empty");
    }
    bool has_space = std::any_of(trimmed.begin(), trimmed.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    if (trimmed.find("..") != std::string::npos || trimmed.front() == '-' || has_space) {
        return make_error(ErrorKind::InvalidInput, "invalid branch name '" + trimmed + "'");
    }
    return trimmed;
}

std::string SafetyReport::block_reason() const {
    if (status_check_failed) {
        return "could not read git status; assuming uncommitted changes";
    }
    std::ostringstream out;
    out << "uncommitted changes (" << uncommitted.staged_files << " staged, "
        << uncommitted.modified_files << " modified, " << uncommitted.untracked_files << " untracked)";
    return out.str();
}

std::vector<std::string> SafetyReport::warnings(const std::string& branch) const {
    std::vector<std::string> out;
    if (!has_remote) {
        return out;
    }
    if (!has_remote_branch) {
        out.push_back("branch '" + branch + "' was never pushed");
    } else if (unpushed_commits > 0) {
        out.push_back(pluralize(unpushed_commits, "unpushed commit") + " on '" + branch + "'");
    }
    if (pull_request == PullRequestState::None) {
        out.push_back("no pull request found for '" + branch + "'");
    }
    return out;
}

WorktreeManager::WorktreeManager(const KildConfig& config, std::shared_ptr<const PullRequestProbe> probe)
    : config_(config)
    , probe_(std::move(probe))
{
}

Result<ProjectInfo> WorktreeManager::detect_project(const fs::path& path) const {
    auto result = run_git(path, {"rev-parse", "--git-common-dir"});
    if (!result) {
        return result.error();
    }
    if (!result->ok()) {
        return make_error(ErrorKind::NotFound, "not a git repository: " + path.string());
    }

    fs::path common_dir = trim_whitespace(result->out);
    if (common_dir.is_relative()) {
        common_dir = path / common_dir;
    }
    common_dir = normalized(common_dir);

    ProjectInfo project;
    project.root = common_dir.filename() == ".git" ? common_dir.parent_path() : common_dir;
    project.id = project_id_for(project.root);
    project.name = project.root.filename().string();
    return project;
}

fs::path WorktreeManager::worktree_root(const ProjectInfo& project) const {
    return worktrees_dir(config_.home) / sanitize_for_path(project.name);
}

fs::path WorktreeManager::worktree_path_for(const ProjectInfo& project, const std::string& branch) const {
    return worktree_root(project) / branch_dir_name(branch);
}

bool WorktreeManager::has_remote(const ProjectInfo& project) const {
    std::istringstream remotes(git_output(project.root, {"remote"}));
    std::string line;
    while (std::getline(remotes, line)) {
        if (trim_whitespace(line) == config_.git.remote) return true;
    }
    return false;
}

bool WorktreeManager::branch_exists(const ProjectInfo& project, const std::string& branch) const {
    auto result = run_git(project.root, {"rev-parse", "--verify", "--quiet", "refs/heads/" + branch});
    return result && result->ok();
}

std::string WorktreeManager::checked_out_at(const ProjectInfo& project, const std::string& branch) const {
    std::istringstream porcelain(git_output(project.root, {"worktree", "list", "--porcelain"}));
    std::string line;
    std::string current_path;
    while (std::getline(porcelain, line)) {
        if (line.rfind("worktree ", 0) == 0) {
            current_path = line.substr(9);
        } else if (line == "branch refs/heads/" + branch) {
            return current_path;
        }
    }
    return {};
}

std::string WorktreeManager::branch_of(const fs::path& worktree) const {
    std::string head = git_output(worktree, {"rev-parse", "--abbrev-ref", "HEAD"});
    return head == "HEAD" ? std::string() : head;
}

Result<CreatedWorktree> WorktreeManager::create_worktree(const ProjectInfo& project,
                                                  const std::string& branch,
                                                  const std::string& base_branch,
                                                  bool fetch) {
    const fs::path path = worktree_path_for(project, branch);

    std::error_code ec;
    if (fs::exists(path, ec)) {
        return make_error(ErrorKind::WorktreeConflict, "worktree path already exists: " + path.string());
    }

    std::string existing = checked_out_at(project, branch);
    if (!existing.empty()) {
        return make_error(ErrorKind::AlreadyExists,
            "branch '" + branch + "' is already checked out at " + existing);
    }

    std::string start_point = base_branch;
    if (fetch && has_remote(project)) {
        auto fetched = run_git(project.root, {"fetch", config_.git.remote, base_branch});
        if (fetched && fetched->ok()) {
            start_point = config_.git.remote + "/" + base_branch;
        } else {
            spdlog::warn("core.git.fetch_failed remote={} base={} error={}", config_.git.remote, base_branch,
                fetched ? trim_whitespace(fetched->err) : fetched.error().message);
        }
    }

    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return make_error(ErrorKind::IoFailure, "cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    CreatedWorktree created;
    created.path = path;
    created.created_branch = !branch_exists(project, branch);

    Result<CommandResult> added = created.created_branch
        ? run_git(project.root, {"worktree", "add", "-b", branch, path.string(), start_point})
        : run_git(project.root, {"worktree", "add", path.string(), branch});
    if (!added || !added->ok()) {
        return git_failure("git worktree add failed", added);
    }

    spdlog::info("core.git.worktree_created project={} branch={} path={} base={} new_branch={}",
        project.name, branch, path.string(), start_point, created.created_branch);
    return created;
}

PullRequestState WorktreeManager::pull_request_state(const fs::path& dir, const std::string& branch) const {
    if (!probe_) return PullRequestState::Unknown;
    return probe_->state(dir, branch);
}

SafetyReport WorktreeManager::check_safety(const ProjectInfo& project,
                                           const fs::path& worktree,
                                           const std::string& branch) const {
    SafetyReport report;

    auto status = run_git(worktree, {"status", "--porcelain=v1"});
    if (!status || !status->ok()) {
        report.status_check_failed = true;
        report.has_uncommitted_changes = true;
        spdlog::warn("core.git.status_failed path={}", worktree.string());
    } else {
        std::istringstream lines(status->out);
        std::string line;
        while (std::getline(lines, line)) {
            if (line.size() < 2) continue;
            if (line[0] == '?' && line[1] == '?') {
                ++report.uncommitted.untracked_files;
                continue;
            }
            if (line[0] != ' ') ++report.uncommitted.staged_files;
            if (line[1] != ' ') ++report.uncommitted.modified_files;
        }
        report.has_uncommitted_changes = report.uncommitted.total() > 0;
    }

    report.has_remote = has_remote(project);
    if (!report.has_remote || branch.empty()) {
        return report;
    }

    const std::string remote_ref = "refs/remotes/" + config_.git.remote + "/" + branch;
    auto upstream = run_git(worktree, {"rev-parse", "--verify", "--quiet", remote_ref});
    report.has_remote_branch = upstream && upstream->ok();
    if (report.has_remote_branch) {
        std::string count = git_output(worktree, {"rev-list", "--count", remote_ref + ".." + branch});
        report.unpushed_commits = count.empty() ? 0 : std::stoul(count);
    }

    report.pull_request = pull_request_state(worktree, branch);
    return report;
}

Status WorktreeManager::delete_local_branch(const ProjectInfo& project, const std::string& branch, bool force) {
    if (branch.empty() || !branch_exists(project, branch)) {
        return Status::success();
    }
    auto result = run_git(project.root, {"branch", force ? "-D" : "-d", branch});
    if (!result || !result->ok()) {
        if (!force) {
            return make_error(ErrorKind::SafetyCheckBlocked,
                "branch '" + branch + "' kept: it has unmerged commits (use --force to delete it)");
        }
        return git_failure("cannot delete branch '" + branch + "'", result);
    }
    return Status::success();
}

Result<RemovalReport> WorktreeManager::remove_worktree(const ProjectInfo& project,
                                                       const fs::path& path,
                                                       const std::string& branch,
                                                       bool force,
                                                       BranchCleanup cleanup) {
    RemovalReport report;
    report.forced = force;

    std::error_code ec;
    const bool present = fs::exists(path, ec);

    if (present) {
        SafetyReport safety = check_safety(project, path, branch);
        if (safety.blocks()) {
            if (!force) {
                return make_error(ErrorKind::SafetyCheckBlocked,
                    "refusing to remove " + path.string() + ": " + safety.block_reason());
            }
            spdlog::warn("core.git.safety_override path={} reason={}", path.string(), safety.block_reason());
        }
        report.warnings = safety.warnings(branch);

        std::vector<std::string> args = {"worktree", "remove"};
        if (force) args.push_back("--force");
        args.push_back(path.string());
        auto removed = run_git(project.root, args);

        if ((!removed || !removed->ok()) && fs::exists(path, ec)) {
            if (!force) {
                return git_failure("git worktree remove failed", removed);
            }
            // Not a registered worktree (or a broken one): drop the directory itself.
            fs::remove_all(path, ec);
            if (ec) {
                return make_error(ErrorKind::IoFailure, "cannot remove " + path.string() + ": " + ec.message());
            }
        }
    }

    auto pruned = run_git(project.root, {"worktree", "prune"});
    if (!pruned || !pruned->ok()) {
        spdlog::debug("core.git.prune_failed project={}", project.name);
    }

    if (cleanup != BranchCleanup::Keep) {
        if (auto s = delete_local_branch(project, branch, cleanup == BranchCleanup::Force); !s) {
            spdlog::warn("core.git.branch_kept branch={} reason={}", branch, s.error().message);
            report.warnings.push_back(s.error().message);
        }
    }

    spdlog::info("core.git.worktree_removed path={} branch={} forced={} branch_cleanup={}",
        path.string(), branch, force, branch_cleanup_name(cleanup));
    return report;
}

std::vector<fs::path> WorktreeManager::detect_untracked_worktrees(const ProjectInfo& project,
                                                                  const std::vector<Session>& sessions) const {
    std::set<fs::path> owned;
    for (const auto& session : sessions) {
        owned.insert(normalized(session.worktree_path));
    }

    std::vector<fs::path> orphans;
    const fs::path root = worktree_root(project);
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return orphans;
    }

    for (const auto& entry : fs::directory_iterator(root, ec)) {
        if (ec) break;
        if (!entry.is_directory()) continue;
        if (owned.count(normalized(entry.path())) == 0) {
            orphans.push_back(entry.path());
        }
    }
    std::sort(orphans.begin(), orphans.end());
    return orphans;
}

Status WorktreeManager::delete_remote_branch(const ProjectInfo& project, const std::string& branch) {
    auto result = run_git(project.root, {"push", config_.git.remote, "--delete", branch});
    if (!result || !result->ok()) {
        return git_failure("cannot delete remote branch '" + branch + "'", result);
    }
    spdlog::info("core.git.remote_branch_deleted remote={} branch={}", config_.git.remote, branch);
    return Status::success();
}

}
