#pragma once

#include "process/command_runner.h"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <unistd.h>

namespace kild::test {

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "kild-test") {
        static int counter = 0;
        path_ = std::filesystem::temp_directory_path() /
            (prefix + "-" + std::to_string(getpid()) + "-" + std::to_string(++counter) + "-" +
             std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const std::string& value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            previous_ = old;
        }
        setenv(name, value.c_str(), 1);
    }

    ~ScopedEnv() {
        if (previous_) {
            setenv(name_.c_str(), previous_->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::optional<std::string> previous_;
};

inline void write_text(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline bool git_available() {
    auto result = run_command({"git", "--version"});
    return result.ok() && result->ok();
}

inline bool run_git(const std::filesystem::path& dir, std::vector<std::string> args) {
    std::vector<std::string> argv = {"git", "-C", dir.string()};
    argv.insert(argv.end(), args.begin(), args.end());
    auto result = run_command(argv);
    return result.ok() && result->ok();
}

// A repository on branch "main" with one commit and no remote.
inline bool init_git_repo(const std::filesystem::path& dir) {
    std::filesystem::create_directories(dir);
    if (!run_git(dir, {"init", "-q"})) return false;
    if (!run_git(dir, {"checkout", "-q", "-b", "main"})) return false;
    run_git(dir, {"config", "user.email", "kild@example.com"});
    run_git(dir, {"config", "user.name", "kild tests"});
    run_git(dir, {"config", "commit.gpgsign", "false"});
    write_text(dir / "README.md", "hello\n");
    if (!run_git(dir, {"add", "README.md"})) return false;
    return run_git(dir, {"commit", "-q", "-m", "initial"});
}

}
