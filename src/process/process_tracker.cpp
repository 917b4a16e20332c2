#include "process/process_tracker.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace kild {

namespace {

// The kernel truncates comm to 15 bytes.
constexpr size_t COMM_MAX = 15;
constexpr size_t MIN_SUBSTRING_PATTERN = 4;
constexpr auto EXIT_POLL_INTERVAL = std::chrono::milliseconds(25);
constexpr auto SIGKILL_WAIT = std::chrono::milliseconds(1000);

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

void append_unique(std::vector<std::string>& items, const std::string& value) {
    if (value.empty()) {
        return;
    }
    if (std::find(items.begin(), items.end(), value) == items.end()) {
        items.push_back(value);
    }
}

void default_sleep(std::chrono::milliseconds d) {
    std::this_thread::sleep_for(d);
}

void reap_if_child(pid_t pid) {
    int status;
    waitpid(pid, &status, WNOHANG);
}

}

std::vector<std::string> build_match_patterns(const std::string& name_pattern,
                                              const std::vector<std::string>& extra_patterns) {
    std::vector<std::string> patterns;

    std::string base = name_pattern;
    size_t slash = base.rfind('/');
    if (slash != std::string::npos) {
        base = base.substr(slash + 1);
    }
    append_unique(patterns, base);

    size_t dash = base.find('-');
    if (dash != std::string::npos && dash > 0) {
        append_unique(patterns, base.substr(0, dash));
    }

    for (const auto& extra : extra_patterns) {
        append_unique(patterns, extra);
    }
    return patterns;
}

bool process_name_matches(const std::string& process_name, const std::string& pattern) {
    if (pattern.empty() || process_name.empty()) {
        return false;
    }
    const std::string name = to_lower(process_name);
    const std::string pat = to_lower(pattern);
    if (pat.size() < MIN_SUBSTRING_PATTERN) {
        return name == pat;
    }
    if (name.find(pat) != std::string::npos) {
        return true;
    }
    return pat.size() > COMM_MAX && name == pat.substr(0, COMM_MAX);
}

ProcessTracker::ProcessTracker()
    : ProcessTracker(std::make_shared<ProcfsProcessTable>())
{
}

ProcessTracker::ProcessTracker(std::shared_ptr<const ProcessTable> table, SleepFn sleep)
    : table_(std::move(table))
    , sleep_(sleep ? std::move(sleep) : SleepFn(default_sleep))
{
}

Result<ProcessHandle> ProcessTracker::spawn_and_track(const std::string& command,
                                                      const std::filesystem::path& cwd,
                                                      const EnvList& env,
                                                      const std::filesystem::path& output_file) {
    std::vector<std::string> argv = split_command_line(command);
    if (argv.empty()) {
        return make_error(ErrorKind::InvalidInput, "empty command");
    }

    std::vector<char*> args;
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    int exec_pipe[2];
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        return make_error(ErrorKind::IoFailure, std::string("pipe failed: ") + std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        return make_error(ErrorKind::IoFailure, std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        close(exec_pipe[0]);
        setsid();

        int devnull = open("/dev/null", O_RDWR);
        int out_fd = devnull;
        if (!output_file.empty()) {
            int fd = open(output_file.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd >= 0) out_fd = fd;
        }
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        if (out_fd >= 0) {
            dup2(out_fd, STDOUT_FILENO);
            dup2(out_fd, STDERR_FILENO);
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            int err = errno;
            (void)!write(exec_pipe[1], &err, sizeof(err));
            _exit(127);
        }
        for (const auto& [key, value] : env) {
            setenv(key.c_str(), value.c_str(), 1);
        }

        execvp(args[0], args.data());
        int err = errno;
        (void)!write(exec_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    close(exec_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status;
        waitpid(pid, &status, 0);
        spdlog::error("core.process.spawn_failed command={} error={}", argv[0], std::strerror(child_errno));
        return make_error(ErrorKind::IoFailure,
            "cannot execute '" + argv[0] + "': " + std::strerror(child_errno));
    }

    // exec has completed here, so comm already names the new program. An
    // unreaped child keeps its /proc entry even if it exited immediately.
    auto entry = table_->lookup(pid);
    if (!entry) {
        return make_error(ErrorKind::IoFailure,
            "spawned process " + std::to_string(pid) + " is missing from the process table");
    }

    ProcessHandle handle;
    handle.pid = pid;
    handle.process_name = entry->name;
    handle.start_time = entry->start_time;

    spdlog::info("core.process.spawned pid={} name={} start_time={}", pid, handle.process_name, handle.start_time);
    return handle;
}

Liveness ProcessTracker::liveness(const ProcessHandle& handle) const {
    auto entry = table_->lookup(handle.pid);
    if (!entry || entry->is_zombie()) {
        return Liveness::NotRunning;
    }
    if (entry->name != handle.process_name) {
        return Liveness::NotRunning;
    }
    if (handle.start_time == 0) {
        return Liveness::Unknown;
    }
    return entry->start_time == handle.start_time ? Liveness::Running : Liveness::NotRunning;
}

bool ProcessTracker::is_running(const ProcessHandle& handle) const {
    return liveness(handle) == Liveness::Running;
}

bool ProcessTracker::wait_for_exit(const ProcessHandle& handle, std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        reap_if_child(handle.pid);
        if (!is_running(handle)) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(EXIT_POLL_INTERVAL);
    }
}

Status ProcessTracker::kill(const ProcessHandle& handle, std::chrono::milliseconds grace) {
    auto entry = table_->lookup(handle.pid);
    if (!entry || entry->is_zombie()) {
        reap_if_child(handle.pid);
        spdlog::debug("core.process.kill_already_exited pid={}", handle.pid);
        return Status::success();
    }

    if (entry->name != handle.process_name || handle.start_time == 0 ||
        entry->start_time != handle.start_time) {
        spdlog::warn("core.process.identity_mismatch pid={} expected_name={} actual_name={} "
                     "expected_start={} actual_start={}",
            handle.pid, handle.process_name, entry->name, handle.start_time, entry->start_time);
        return make_error(ErrorKind::IdentityMismatch,
            "pid " + std::to_string(handle.pid) + " now belongs to '" + entry->name +
            "' (started at " + std::to_string(entry->start_time) + "), not '" +
            handle.process_name + "' (started at " + std::to_string(handle.start_time) + ")");
    }

    // Processes launched by spawn_and_track lead their own group; take the children too.
    const bool group_leader = getpgid(handle.pid) == handle.pid;
    auto send = [&](int sig) {
        int rc = group_leader ? ::kill(-handle.pid, sig) : ::kill(handle.pid, sig);
        if (rc != 0 && group_leader) {
            rc = ::kill(handle.pid, sig);
        }
        return rc == 0 || errno == ESRCH;
    };

    if (!send(SIGTERM)) {
        return make_error(ErrorKind::IoFailure,
            "cannot signal pid " + std::to_string(handle.pid) + ": " + std::strerror(errno));
    }
    if (wait_for_exit(handle, grace)) {
        spdlog::info("core.process.terminated pid={} signal=SIGTERM", handle.pid);
        return Status::success();
    }

    spdlog::warn("core.process.escalating pid={} grace_ms={}", handle.pid, grace.count());
    send(SIGKILL);
    if (wait_for_exit(handle, SIGKILL_WAIT)) {
        spdlog::info("core.process.terminated pid={} signal=SIGKILL", handle.pid);
        return Status::success();
    }
    return make_error(ErrorKind::IoFailure, "pid " + std::to_string(handle.pid) + " survived SIGKILL");
}

std::optional<ProcessEntry> ProcessTracker::find_match(const std::vector<std::string>& patterns,
                                                       const MatchFilter& filter) const {
    const pid_t self = getpid();
    std::optional<ProcessEntry> best;
    for (const auto& entry : table_->list()) {
        if (entry.pid == self || entry.is_zombie()) continue;
        if (filter.uid && entry.uid != filter.uid) continue;
        if (entry.start_time < filter.started_at_or_after) continue;
        bool matched = std::any_of(patterns.begin(), patterns.end(), [&entry](const std::string& p) {
            return process_name_matches(entry.name, p);
        });
        // The most recently started candidate is the one just launched.
        if (matched && (!best || entry.start_time > best->start_time)) {
            best = entry;
        }
    }
    return best;
}

Result<ProcessHandle> ProcessTracker::find_by_name_with_retry(const std::string& name_pattern,
                                                              const std::vector<std::string>& extra_patterns,
                                                              int max_attempts,
                                                              std::chrono::milliseconds initial_delay,
                                                              const MatchFilter& filter) const {
    const auto patterns = build_match_patterns(name_pattern, extra_patterns);
    auto delay = initial_delay;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (auto entry = find_match(patterns, filter)) {
            spdlog::debug("core.process.found name={} pid={} attempt={}", entry->name, entry->pid, attempt);
            ProcessHandle handle;
            handle.pid = entry->pid;
            handle.process_name = entry->name;
            handle.start_time = entry->start_time;
            return handle;
        }
        if (attempt < max_attempts) {
            sleep_(delay);
            delay *= 2;
        }
    }

    spdlog::warn("core.process.not_found pattern={} attempts={}", name_pattern, max_attempts);
    return make_error(ErrorKind::NotFound,
        "no process matching '" + name_pattern + "' after " + std::to_string(max_attempts) + " attempts");
}

std::optional<ProcessHandle> ProcessTracker::snapshot(pid_t pid) const {
    auto entry = table_->lookup(pid);
    if (!entry || entry->is_zombie()) return std::nullopt;
    ProcessHandle handle;
    handle.pid = entry->pid;
    handle.process_name = entry->name;
    handle.start_time = entry->start_time;
    return handle;
}

std::optional<ProcessMetrics> ProcessTracker::metrics(const ProcessHandle& handle) const {
    if (!is_running(handle)) return std::nullopt;
    return table_->metrics(handle.pid);
}

}
