#include "process/command_runner.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kild {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

}

std::vector<std::string> split_command_line(const std::string& command) {
    std::vector<std::string> args;
    std::string current;
    bool in_token = false;
    char quote = '\0';

    for (size_t i = 0; i < command.size(); ++i) {
        char c = command[i];
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else if (c == '\\' && quote == '"' && i + 1 < command.size()) {
                current.push_back(command[++i]);
            } else {
                current.push_back(c);
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            in_token = true;
        } else if (c == ' ' || c == '\t' || c == '\n') {
            if (in_token) {
                args.push_back(current);
                current.clear();
                in_token = false;
            }
        } else if (c == '\\' && i + 1 < command.size()) {
            current.push_back(command[++i]);
            in_token = true;
        } else {
            current.push_back(c);
            in_token = true;
        }
    }
    if (in_token) {
        args.push_back(current);
    }
    return args;
}

Result<CommandResult> run_command(const std::vector<std::string>& argv,
                                  const std::filesystem::path& cwd,
                                  const EnvList& env) {
    if (argv.empty()) {
        return make_error(ErrorKind::InvalidInput, "empty command");
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        return make_error(ErrorKind::IoFailure, std::string("pipe failed: ") + std::strerror(err));
    }

    std::vector<char*> args;
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
        return make_error(ErrorKind::IoFailure, std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        close(exec_pipe[0]);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            int err = errno;
            (void)!write(exec_pipe[1], &err, sizeof(err));
            _exit(127);
        }
        for (const auto& [key, value] : env) {
            setenv(key.c_str(), value.c_str(), 1);
        }

        execvp(args[0], args.data());
        int err = errno;
        (void)!write(exec_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    CommandResult result;
    char buffer[4096];
    struct pollfd fds[2];
    fds[0].fd = out_pipe[0];
    fds[0].events = POLLIN;
    fds[1].fd = err_pipe[0];
    fds[1].events = POLLIN;
    int open_fds = 2;

    while (open_fds > 0) {
        int ret = poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t r = read(fds[i].fd, buffer, sizeof(buffer));
            if (r > 0) {
                (i == 0 ? result.out : result.err).append(buffer, static_cast<size_t>(r));
            } else if (r == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }
    for (auto& fd : fds) {
        if (fd.fd >= 0) close(fd.fd);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        return make_error(ErrorKind::IoFailure,
            "cannot execute '" + argv[0] + "': " + std::strerror(child_errno));
    }

    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

}
