#pragma once

#include "cli/cli_args.h"

namespace kild {

// Runs one parsed command and returns the process exit code.
int run_command_line(const CliArgs& args);

}
