#include "sessions/session_store.h"
#include "core/paths.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <unistd.h>

namespace kild {

namespace fs = std::filesystem;

namespace {

constexpr const char* RECORD_EXTENSION = ".json";

std::atomic<unsigned> g_temp_counter{0};

fs::path temp_path_for(const fs::path& target) {
    return target.parent_path() /
        (target.filename().string() + ".tmp." + std::to_string(::getpid()) + "." +
         std::to_string(g_temp_counter.fetch_add(1)));
}

}

Status write_file_atomic(const fs::path& target, const std::string& content) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return make_error(ErrorKind::IoFailure,
            "cannot create directory " + target.parent_path().string() + ": " + ec.message());
    }

    const fs::path temp_path = temp_path_for(target);
    std::ofstream file(temp_path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        return make_error(ErrorKind::IoFailure, "cannot open " + temp_path.string() + " for writing");
    }

    file << content;
    file.close();

    if (!file.good()) {
        std::remove(temp_path.c_str());
        return make_error(ErrorKind::IoFailure, "failed writing " + temp_path.string());
    }

    if (std::rename(temp_path.c_str(), target.c_str()) != 0) {
        int err = errno;
        std::remove(temp_path.c_str());
        return make_error(ErrorKind::IoFailure,
            "cannot rename " + temp_path.string() + " to " + target.string() + ": " + std::strerror(err));
    }

    return Status::success();
}

SessionStore::SessionStore(fs::path dir)
    : dir_(std::move(dir))
{
}

fs::path SessionStore::path_for(const std::string& id) const {
    return dir_ / (sanitize_for_path(id) + RECORD_EXTENSION);
}

Status SessionStore::save(const Session& session) {
    if (session.id.empty()) {
        return make_error(ErrorKind::InvalidInput, "session id is empty");
    }

    nlohmann::json j = session;
    auto status = write_file_atomic(path_for(session.id), j.dump(2));
    if (!status) {
        spdlog::error("core.store.save_failed session_id={} error={}", session.id, status.error().message);
        return status;
    }
    spdlog::debug("core.store.saved session_id={}", session.id);
    return status;
}

std::optional<Session> SessionStore::read_file(const fs::path& path) const {
    std::ifstream file(path);
    if (!file) return std::nullopt;

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            spdlog::warn("core.store.invalid_record path={}", path.string());
            return std::nullopt;
        }
        Session session = j.get<Session>();
        if (session.id.empty()) {
            spdlog::warn("core.store.record_missing_id path={}", path.string());
            return std::nullopt;
        }
        return session;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("core.store.parse_failed path={} error={}", path.string(), e.what());
        return std::nullopt;
    }
}

std::optional<Session> SessionStore::load(const std::string& id) const {
    auto session = read_file(path_for(id));
    if (session && session->id != id) {
        // Two ids can sanitize to the same file name.
        spdlog::warn("core.store.id_collision requested={} stored={}", id, session->id);
        return std::nullopt;
    }
    return session;
}

std::vector<Session> SessionStore::list_all() const {
    std::vector<Session> result;

    std::error_code ec;
    if (!fs::exists(dir_, ec) || ec) {
        return result;
    }

    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (ec) break;
        if (!entry.is_regular_file()) continue;
        const fs::path& path = entry.path();
        // Leftover temp files from an interrupted write are not records.
        if (path.extension() != RECORD_EXTENSION) continue;

        if (auto session = read_file(path)) {
            result.push_back(std::move(*session));
        }
    }

    std::sort(result.begin(), result.end(), [](const Session& a, const Session& b) {
        return a.created_at != b.created_at ? a.created_at < b.created_at : a.id < b.id;
    });
    return result;
}

std::vector<Session> SessionStore::list(const std::string& project_id) const {
    std::vector<Session> result;
    for (auto& session : list_all()) {
        if (session.project_id == project_id) {
            result.push_back(std::move(session));
        }
    }
    return result;
}

Status SessionStore::remove(const std::string& id) {
    const fs::path path = path_for(id);
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        int err = errno;
        return make_error(ErrorKind::IoFailure, "cannot delete " + path.string() + ": " + std::strerror(err));
    }
    spdlog::debug("core.store.removed session_id={}", id);
    return Status::success();
}

}
