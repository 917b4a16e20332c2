#include "core/paths.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>

namespace kild {

namespace fs = std::filesystem;

fs::path kild_home() {
    const char* override_home = std::getenv("KILD_HOME");
    if (override_home && *override_home) {
        return fs::path(override_home);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".kild";
    }
    return fs::path("/tmp") / ".kild";
}

fs::path sessions_dir(const fs::path& home) { return home / "sessions"; }
fs::path pids_dir(const fs::path& home) { return home / "pids"; }
fs::path worktrees_dir(const fs::path& home) { return home / "worktrees"; }
fs::path logs_dir(const fs::path& home) { return home / "logs"; }

std::string sanitize_for_path(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '.' || c == '_' || c == '-') {
            out.push_back(c);
        } else {
            out.push_back('_');
        }
    }
    return out;
}

std::string branch_dir_name(const std::string& branch) {
    std::string out = branch;
    for (auto& c : out) {
        if (c == '/') c = '-';
    }
    return sanitize_for_path(out);
}

std::string project_id_for(const fs::path& repo_root) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(repo_root, ec);
    const std::string key = ec ? repo_root.lexically_normal().string() : canonical.string();

    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : key) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }

    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return buf;
}

int64_t current_timestamp() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
}

std::string trim_whitespace(std::string value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.erase(value.begin());
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    return value;
}

}
