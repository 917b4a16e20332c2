#pragma once

#include <filesystem>
#include <string>

namespace kild {

enum class PullRequestState {
    None,
    Open,
    Merged,
    Closed,
    Unknown
};

const char* pull_request_state_name(PullRequestState state);

// Forge lookup of the pull request associated with a branch.
class PullRequestProbe {
public:
    virtual ~PullRequestProbe() = default;
    virtual PullRequestState state(const std::filesystem::path& repo_dir, const std::string& branch) const = 0;
};

// Asks the GitHub CLI (`gh pr view`). Unknown when gh is missing or fails for
// any reason other than "no pull request".
class GhCliProbe : public PullRequestProbe {
public:
    PullRequestState state(const std::filesystem::path& repo_dir, const std::string& branch) const override;
};

}
