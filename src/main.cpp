#include <string>
#include <vector>

#include "cli/cli_args.h"
#include "cli/commands.h"

#include <cstdio>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto parsed = kild::parse_cli_args(args);
    if (!parsed) {
        fprintf(stderr, "error: %s\n\n%s", parsed.error().message.c_str(), kild::cli_usage().c_str());
        return kild::exit_code_for(parsed.error().kind);
    }
    return kild::run_command_line(*parsed);
}
