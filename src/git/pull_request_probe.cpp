#include "git/pull_request_probe.h"
#include "core/paths.h"
#include "process/command_runner.h"

#include <spdlog/spdlog.h>

namespace kild {

const char* pull_request_state_name(PullRequestState state) {
    switch (state) {
        case PullRequestState::None:    return "none";
        case PullRequestState::Open:    return "open";
        case PullRequestState::Merged:  return "merged";
        case PullRequestState::Closed:  return "closed";
        case PullRequestState::Unknown: return "unknown";
    }
    return "unknown";
}

PullRequestState GhCliProbe::state(const std::filesystem::path& repo_dir, const std::string& branch) const {
    auto result = run_command({"gh", "pr", "view", branch, "--json", "state", "--jq", ".state"}, repo_dir,
                              {{"GH_PROMPT_DISABLED", "1"}});
    if (!result) {
        spdlog::debug("core.forge.gh_unavailable error={}", result.error().message);
        return PullRequestState::Unknown;
    }
    if (!result->ok()) {
        if (result->err.find("no pull requests found") != std::string::npos) {
            return PullRequestState::None;
        }
        spdlog::debug("core.forge.gh_failed branch={} stderr={}", branch, trim_whitespace(result->err));
        return PullRequestState::Unknown;
    }

    const std::string state = trim_whitespace(result->out);
    if (state == "OPEN") return PullRequestState::Open;
    if (state == "MERGED") return PullRequestState::Merged;
    if (state == "CLOSED") return PullRequestState::Closed;
    return PullRequestState::Unknown;
}

}
