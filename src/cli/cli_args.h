#pragma once

#include "core/error.h"
#include <string>
#include <vector>

namespace kild {

struct CliArgs {
    std::string command;
    // daemon start|stop|status
    std::string subcommand;
    std::vector<std::string> positional;

    bool json = false;
    bool force = false;
    bool no_fetch = false;
    bool daemon = false;
    bool external = false;
    bool foreground = false;
    bool watch = false;
    bool orphans = false;
    bool no_pid = false;
    bool stopped = false;
    bool all = false;

    std::string project;
    std::string agent;
    std::string base;
    std::string note;
    std::string log_level;
    int interval_secs = 0;
    int count = 0;
};

// argv without the program name. InvalidInput on unknown flags or a missing value.
Result<CliArgs> parse_cli_args(const std::vector<std::string>& args);

std::string cli_usage();

}
