#pragma once

#include "core/error.h"
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace kild {

struct CommandResult {
    int exit_code = -1;
    std::string out;
    std::string err;

    bool ok() const { return exit_code == 0; }
};

using EnvList = std::vector<std::pair<std::string, std::string>>;

// Runs argv[0] (PATH lookup) to completion with stdin on /dev/null, capturing
// stdout and stderr. A non-zero exit is reported in the result, not as an error;
// only failing to start the program is an error.
Result<CommandResult> run_command(const std::vector<std::string>& argv,
                                  const std::filesystem::path& cwd = {},
                                  const EnvList& env = {});

// Splits a command line on whitespace, honoring single and double quotes.
std::vector<std::string> split_command_line(const std::string& command);

}
