#include "cli/cli_args.h"

#include <map>
#include <set>

namespace kild {

namespace {

const std::set<std::string> COMMANDS = {
    "create", "list", "status", "open", "stop", "restart", "destroy", "complete",
    "health", "cleanup", "attach", "daemon", "help"
};

bool parse_int(const std::string& text, int& out) {
    if (text.empty()) return false;
    size_t used = 0;
    try {
        out = std::stoi(text, &used);
    } catch (const std::exception&) {
        return false;
    }
    return used == text.size() && out >= 0;
}

}

std::string cli_usage() {
    return
        "usage: kild <command> [options]\n"
        "\n"
        "commands:\n"
        "  create <branch>      create a worktree and launch an agent\n"
        "  list                 list sessions of the project\n"
        "  status <branch>      show one session\n"
        "  open <branch>        launch an agent in an existing session\n"
        "  stop <branch>        stop the session's agent, keep the worktree\n"
        "  restart <branch>     stop, then open\n"
        "  destroy <branch>     stop the agent, remove worktree, branch and record\n"
        "  complete <branch>    destroy; also delete the remote branch if its PR merged\n"
        "  health               process liveness and resource usage\n"
        "  cleanup              remove orphaned and stale sessions\n"
        "  attach <branch>      attach to a daemon-owned terminal (Ctrl-] detaches)\n"
        "  daemon start|stop|status\n"
        "\n"
        "options:\n"
        "  --project <path>     project directory (default: current directory)\n"
        "  --agent <name>       claude, codex, gemini, kiro, amp, opencode, shell\n"
        "  --base <branch>      base branch for create\n"
        "  --no-fetch           do not fetch the base branch before create\n"
        "  --note <text>        free-form note stored with the session\n"
        "  --daemon|--external  terminal mode for create/open/restart\n"
        "  --force              override safety checks\n"
        "  --json               machine-readable output\n"
        "  --orphans --no-pid --stopped --all   cleanup strategy (default: all)\n"
        "  --watch [--interval <secs>] [--count <n>]   repeat health\n"
        "  --foreground         run the daemon in this terminal\n"
        "  --log-level <level>  trace, debug, info, warn, error, off\n";
}

Result<CliArgs> parse_cli_args(const std::vector<std::string>& args) {
    CliArgs out;
    if (args.empty()) {
        out.command = "help";
        return out;
    }

    const std::map<std::string, bool CliArgs::*> flags = {
        {"--json", &CliArgs::json},
        {"--force", &CliArgs::force},
        {"--no-fetch", &CliArgs::no_fetch},
        {"--daemon", &CliArgs::daemon},
        {"--external", &CliArgs::external},
        {"--foreground", &CliArgs::foreground},
        {"--watch", &CliArgs::watch},
        {"--orphans", &CliArgs::orphans},
        {"--no-pid", &CliArgs::no_pid},
        {"--stopped", &CliArgs::stopped},
        {"--all", &CliArgs::all},
    };
    const std::map<std::string, std::string CliArgs::*> options = {
        {"--project", &CliArgs::project},
        {"--agent", &CliArgs::agent},
        {"--base", &CliArgs::base},
        {"--note", &CliArgs::note},
        {"--log-level", &CliArgs::log_level},
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            out.command = "help";
            return out;
        }
        if (auto it = flags.find(arg); it != flags.end()) {
            out.*(it->second) = true;
            continue;
        }

        const bool takes_value = options.count(arg) > 0 || arg == "--interval" || arg == "--count";
        if (takes_value) {
            if (i + 1 >= args.size()) {
                return make_error(ErrorKind::InvalidInput, arg + " requires a value");
            }
            const std::string& value = args[++i];
            if (auto it = options.find(arg); it != options.end()) {
                out.*(it->second) = value;
            } else if (!parse_int(value, arg == "--interval" ? out.interval_secs : out.count)) {
                return make_error(ErrorKind::InvalidInput, arg + " expects a non-negative number");
            }
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-') {
            return make_error(ErrorKind::InvalidInput, "unknown option '" + arg + "'");
        }

        if (out.command.empty()) {
            if (COMMANDS.count(arg) == 0) {
                return make_error(ErrorKind::InvalidInput, "unknown command '" + arg + "'");
            }
            out.command = arg;
        } else if (out.command == "daemon" && out.subcommand.empty()) {
            out.subcommand = arg;
        } else {
            out.positional.push_back(arg);
        }
    }

    if (out.command.empty()) {
        return make_error(ErrorKind::InvalidInput, "missing command");
    }
    if (out.daemon && out.external) {
        return make_error(ErrorKind::InvalidInput, "--daemon and --external are mutually exclusive");
    }
    if (out.command == "daemon" &&
        out.subcommand != "start" && out.subcommand != "stop" && out.subcommand != "status") {
        return make_error(ErrorKind::InvalidInput, "daemon expects start, stop or status");
    }

    static const std::set<std::string> NEEDS_BRANCH = {
        "create", "status", "open", "stop", "restart", "destroy", "complete", "attach"
    };
    if (NEEDS_BRANCH.count(out.command) && out.positional.empty()) {
        return make_error(ErrorKind::InvalidInput, out.command + " requires a branch name");
    }
    return out;
}

}
