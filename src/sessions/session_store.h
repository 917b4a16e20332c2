#pragma once

#include "core/error.h"
#include "core/types.h"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kild {

// One JSON record per session under a single directory. Writes go to a temp
// file in the same directory and are renamed over the target, so a reader sees
// either the previous record or the new one. Same-session writers race at the
// rename and the last one wins.
class SessionStore {
public:
    explicit SessionStore(std::filesystem::path dir);

    Status save(const Session& session);
    std::optional<Session> load(const std::string& id) const;
    std::vector<Session> list(const std::string& project_id) const;
    std::vector<Session> list_all() const;

    // Unlinks the record; a missing record is not an error.
    Status remove(const std::string& id);

    std::filesystem::path path_for(const std::string& id) const;
    const std::filesystem::path& dir() const { return dir_; }

private:
    std::optional<Session> read_file(const std::filesystem::path& path) const;

    std::filesystem::path dir_;
};

// Writes `content` to a sibling temp file then renames it over `target`.
Status write_file_atomic(const std::filesystem::path& target, const std::string& content);

}
