#pragma once

#include "core/error.h"
#include "core/types.h"
#include "process/command_runner.h"
#include "process/process_table.h"
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kild {

enum class Liveness {
    Running,
    NotRunning,
    // Process exists but the handle carries no start time to validate against.
    Unknown
};

// Narrows name-based discovery to processes that could be the one just launched.
struct MatchFilter {
    std::optional<uid_t> uid;
    // Candidates started before this (clock ticks since boot) are ignored.
    uint64_t started_at_or_after = 0;
};

class ProcessTracker {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    ProcessTracker();
    explicit ProcessTracker(std::shared_ptr<const ProcessTable> table, SleepFn sleep = nullptr);

    // Launches `command` detached in its own session. PID, name and start time
    // are read back before this returns. Output goes to `output_file` when set,
    // /dev/null otherwise.
    Result<ProcessHandle> spawn_and_track(const std::string& command,
                                          const std::filesystem::path& cwd,
                                          const EnvList& env = {},
                                          const std::filesystem::path& output_file = {});

    bool is_running(const ProcessHandle& handle) const;
    Liveness liveness(const ProcessHandle& handle) const;

    // SIGTERM, then SIGKILL after `grace`. Returns IdentityMismatch instead of
    // signalling when the PID now belongs to a different process.
    Status kill(const ProcessHandle& handle,
                std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    // Polls the process table for a process whose name matches `name_pattern`,
    // its dash-prefix (e.g. "kiro" for "kiro-cli") or any of `extra_patterns`.
    // Only processes passing `filter` are considered. The delay doubles after
    // every miss. NotFound once attempts run out.
    Result<ProcessHandle> find_by_name_with_retry(const std::string& name_pattern,
                                                  const std::vector<std::string>& extra_patterns,
                                                  int max_attempts,
                                                  std::chrono::milliseconds initial_delay,
                                                  const MatchFilter& filter = {}) const;

    std::optional<ProcessHandle> snapshot(pid_t pid) const;
    std::optional<ProcessMetrics> metrics(const ProcessHandle& handle) const;

private:
    std::optional<ProcessEntry> find_match(const std::vector<std::string>& patterns,
                                           const MatchFilter& filter) const;
    bool wait_for_exit(const ProcessHandle& handle, std::chrono::milliseconds timeout) const;

    std::shared_ptr<const ProcessTable> table_;
    SleepFn sleep_;
};

std::vector<std::string> build_match_patterns(const std::string& name_pattern,
                                              const std::vector<std::string>& extra_patterns);

// Case-insensitive substring match. Patterns shorter than four characters
// must match the whole name, so "sh" does not match "bash" or "ssh".
bool process_name_matches(const std::string& process_name, const std::string& pattern);

}
