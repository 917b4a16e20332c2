#include "process/pid_file.h"
#include "core/paths.h"
#include "sessions/session_store.h"

#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <unistd.h>

namespace kild {

std::filesystem::path pid_file_path(const std::filesystem::path& pids_dir, const std::string& key) {
    return pids_dir / (sanitize_for_path(key) + ".pid");
}

Status write_pid_file(const std::filesystem::path& path, const ProcessHandle& handle) {
    nlohmann::json j = handle;
    return write_file_atomic(path, j.dump());
}

std::optional<ProcessHandle> read_pid_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) return std::nullopt;

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        ProcessHandle handle = j.get<ProcessHandle>();
        if (handle.pid <= 0) return std::nullopt;
        return handle;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

Status delete_pid_file(const std::filesystem::path& path) {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        int err = errno;
        return make_error(ErrorKind::IoFailure, "cannot delete " + path.string() + ": " + std::strerror(err));
    }
    return Status::success();
}

}
