#include "process/process_table.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace kild {

namespace fs = std::filesystem;

namespace {

// Offsets into the fields that follow "(comm)", i.e. field 3 of proc(5) is index 0.
constexpr size_t FIELD_STATE = 0;
constexpr size_t FIELD_PPID = 1;
constexpr size_t FIELD_UTIME = 11;
constexpr size_t FIELD_STIME = 12;
constexpr size_t FIELD_STARTTIME = 19;
constexpr size_t FIELD_RSS = 21;

bool is_numeric(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string read_file(const fs::path& path) {
    std::ifstream f(path);
    if (!f) return {};
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

}

std::optional<ProcessEntry> parse_proc_stat(const std::string& content) {
    size_t open = content.find('(');
    size_t close = content.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }

    ProcessEntry entry;
    entry.pid = static_cast<pid_t>(std::strtol(content.substr(0, open).c_str(), nullptr, 10));
    entry.name = content.substr(open + 1, close - open - 1);

    std::vector<std::string> fields;
    std::istringstream rest(content.substr(close + 1));
    std::string field;
    while (rest >> field) {
        fields.push_back(field);
    }
    if (fields.size() <= FIELD_RSS) {
        return std::nullopt;
    }

    entry.state = fields[FIELD_STATE].empty() ? '?' : fields[FIELD_STATE][0];
    entry.ppid = static_cast<pid_t>(std::strtol(fields[FIELD_PPID].c_str(), nullptr, 10));
    entry.cpu_ticks = std::strtoull(fields[FIELD_UTIME].c_str(), nullptr, 10) +
                      std::strtoull(fields[FIELD_STIME].c_str(), nullptr, 10);
    entry.start_time = std::strtoull(fields[FIELD_STARTTIME].c_str(), nullptr, 10);
    entry.rss_pages = std::strtoull(fields[FIELD_RSS].c_str(), nullptr, 10);
    return entry;
}

ProcfsProcessTable::ProcfsProcessTable(fs::path proc_root)
    : proc_root_(std::move(proc_root))
{
}

std::optional<ProcessEntry> ProcfsProcessTable::lookup(pid_t pid) const {
    if (pid <= 0) return std::nullopt;
    const fs::path dir = proc_root_ / std::to_string(pid);
    std::string content = read_file(dir / "stat");
    if (content.empty()) return std::nullopt;
    auto entry = parse_proc_stat(content);
    struct stat st;
    if (entry && ::stat(dir.c_str(), &st) == 0) {
        entry->uid = st.st_uid;
    }
    return entry;
}

std::vector<ProcessEntry> ProcfsProcessTable::list() const {
    std::vector<ProcessEntry> result;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(proc_root_, ec)) {
        if (ec) break;
        const std::string name = entry.path().filename().string();
        if (!is_numeric(name)) continue;
        // Processes can vanish between readdir and open; that is not an error.
        if (auto proc = lookup(static_cast<pid_t>(std::strtol(name.c_str(), nullptr, 10)))) {
            result.push_back(std::move(*proc));
        }
    }
    return result;
}

std::optional<double> ProcfsProcessTable::system_uptime_secs() const {
    std::string content = read_file(proc_root_ / "uptime");
    if (content.empty()) return std::nullopt;
    return std::strtod(content.c_str(), nullptr);
}

std::optional<ProcessMetrics> ProcfsProcessTable::metrics(pid_t pid) const {
    auto entry = lookup(pid);
    if (!entry || entry->is_zombie()) return std::nullopt;

    const long ticks_per_sec = sysconf(_SC_CLK_TCK);
    const long page_size = sysconf(_SC_PAGESIZE);
    if (ticks_per_sec <= 0) return std::nullopt;

    ProcessMetrics metrics;
    metrics.memory_kb = entry->rss_pages * static_cast<uint64_t>(page_size > 0 ? page_size : 4096) / 1024;

    if (auto uptime = system_uptime_secs()) {
        double started = static_cast<double>(entry->start_time) / ticks_per_sec;
        double alive = *uptime - started;
        if (alive > 0.0) {
            metrics.uptime_secs = static_cast<uint64_t>(alive);
            double cpu_secs = static_cast<double>(entry->cpu_ticks) / ticks_per_sec;
            metrics.cpu_percent = cpu_secs / alive * 100.0;
        }
    }
    return metrics;
}

}
