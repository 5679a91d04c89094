/**
 * @file command_runner.cpp
 * @brief fork/exec runner with captured stdout and stderr.
 */
#include "vpcctl/net/command_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace vpcctl::net {

std::string join_argv(const std::vector<std::string>& argv) {
    std::string s;
    for (const auto& a : argv) {
        if (!s.empty()) s += ' ';
        s += a;
    }
    return s;
}

namespace {

/// Close-on-destruction pair of pipe fds.
struct Pipe {
    int fd[2]{-1, -1};
    ~Pipe() { close_read(); close_write(); }
    bool open() noexcept { return ::pipe2(fd, O_CLOEXEC) == 0; }
    void close_read() noexcept  { if (fd[0] >= 0) { ::close(fd[0]); fd[0] = -1; } }
    void close_write() noexcept { if (fd[1] >= 0) { ::close(fd[1]); fd[1] = -1; } }
};

std::string errno_text(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

/// Drain both pipes until EOF on each.
void drain(Pipe& out, Pipe& err, CommandResult& res) {
    pollfd fds[2] = {{out.fd[0], POLLIN, 0}, {err.fd[0], POLLIN, 0}};
    std::string* sinks[2] = {&res.out, &res.err};
    int open_fds = 2;
    char buf[4096];

    while (open_fds > 0) {
        if (::poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            return;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            const ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1; // EOF or hard error: stop polling this end
                --open_fds;
            }
        }
    }
}

} // namespace

Result<CommandResult> ProcessRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return fail(ErrorCode::PrimitiveExecutionFailure, "empty command");
    }

    Pipe out, err;
    if (!out.open() || !err.open()) {
        return fail(ErrorCode::PrimitiveExecutionFailure, errno_text("pipe"));
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        return fail(ErrorCode::PrimitiveExecutionFailure, errno_text("fork"));
    }
    if (pid == 0) {
        ::dup2(out.fd[1], STDOUT_FILENO);
        ::dup2(err.fd[1], STDERR_FILENO);
        ::execvp(cargv[0], cargv.data());
        const char msg[] = "exec failed\n";
        (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        _exit(127);
    }

    out.close_write();
    err.close_write();

    CommandResult res;
    drain(out, err, res);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return fail(ErrorCode::PrimitiveExecutionFailure, errno_text("waitpid"));
        }
    }
    res.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    if (res.exit_code == 127 && res.err.find("exec failed") != std::string::npos) {
        return fail(ErrorCode::PrimitiveExecutionFailure, "cannot execute '" + argv.front() + "'");
    }
    return res;
}

} // namespace vpcctl::net
