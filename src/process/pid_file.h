#pragma once

#include "core/error.h"
#include "core/types.h"
#include <filesystem>
#include <optional>
#include <string>

namespace kild {

// {pid, process_name, start_time} per tracked process, so a later CLI
// invocation can re-validate identity before signalling.
std::filesystem::path pid_file_path(const std::filesystem::path& pids_dir, const std::string& key);

Status write_pid_file(const std::filesystem::path& path, const ProcessHandle& handle);
std::optional<ProcessHandle> read_pid_file(const std::filesystem::path& path);
Status delete_pid_file(const std::filesystem::path& path);

}
