#pragma once

#include <sys/types.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kild {

struct ProcessEntry {
    pid_t pid = 0;
    pid_t ppid = 0;
    std::string name;
    // Clock ticks since boot; stable for the lifetime of the process.
    uint64_t start_time = 0;
    char state = '?';
    // Owner of /proc/<pid>; unset when it could not be read.
    std::optional<uid_t> uid;
    uint64_t cpu_ticks = 0;
    uint64_t rss_pages = 0;

    bool is_zombie() const { return state == 'Z' || state == 'X'; }
};

struct ProcessMetrics {
    double cpu_percent = 0.0;
    uint64_t memory_kb = 0;
    uint64_t uptime_secs = 0;
};

// Read-only view of the OS process table.
class ProcessTable {
public:
    virtual ~ProcessTable() = default;

    virtual std::optional<ProcessEntry> lookup(pid_t pid) const = 0;
    virtual std::vector<ProcessEntry> list() const = 0;
    virtual std::optional<ProcessMetrics> metrics(pid_t pid) const = 0;
};

class ProcfsProcessTable : public ProcessTable {
public:
    explicit ProcfsProcessTable(std::filesystem::path proc_root = "/proc");

    std::optional<ProcessEntry> lookup(pid_t pid) const override;
    std::vector<ProcessEntry> list() const override;
    std::optional<ProcessMetrics> metrics(pid_t pid) const override;

private:
    std::optional<double> system_uptime_secs() const;

    std::filesystem::path proc_root_;
};

// Parses the contents of /proc/<pid>/stat. The command name may itself contain
// spaces and parentheses, so fields are located from the last ')'.
std::optional<ProcessEntry> parse_proc_stat(const std::string& content);

}
