#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace kild {

// $KILD_HOME if set, otherwise ~/.kild (falls back to /tmp/.kild without HOME).
std::filesystem::path kild_home();

std::filesystem::path sessions_dir(const std::filesystem::path& home);
std::filesystem::path pids_dir(const std::filesystem::path& home);
std::filesystem::path worktrees_dir(const std::filesystem::path& home);
std::filesystem::path logs_dir(const std::filesystem::path& home);

// Replaces every character outside [A-Za-z0-9._-] with '_'.
std::string sanitize_for_path(const std::string& value);

// Branch names may contain '/', worktree directories may not.
std::string branch_dir_name(const std::string& branch);

// 64-bit FNV-1a over the canonical path, rendered as 16 hex digits.
std::string project_id_for(const std::filesystem::path& repo_root);

int64_t current_timestamp();

std::string trim_whitespace(std::string value);

}
