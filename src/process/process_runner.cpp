#include "process/process_runner.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

struct Spawned {
    pid_t pid = -1;
    std::string error;
};

// Redirections applied in the child before exec; -1 leaves the fd inherited
struct ChildFds {
    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
};

struct SignalGuard {
    struct sigaction old_int {};
    struct sigaction old_quit {};

    SignalGuard() {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        ignore.sa_flags = 0;
        sigaction(SIGINT, &ignore, &old_int);
        sigaction(SIGQUIT, &ignore, &old_quit);
    }

    ~SignalGuard() {
        sigaction(SIGINT, &old_int, nullptr);
        sigaction(SIGQUIT, &old_quit, nullptr);
    }
};

void write_errno_and_exit(int status_fd, int err) {
    ssize_t ignored = write(status_fd, &err, sizeof(err));
    (void)ignored;
    _exit(ProcessRunner::kSpawnFailure);
}

Spawned spawn(const std::vector<std::string>& args, const std::string& cwd,
              const ChildFds& fds, const SignalGuard* guard) {
    Spawned result;
    if (args.empty()) {
        result.error = "empty command";
        return result;
    }

    // The child reports chdir/exec failures through this pipe; a successful
    // exec closes it (O_CLOEXEC) and the parent reads EOF.
    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        close(status_pipe[0]);
        close(status_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        close(status_pipe[0]);
        if (guard) {
            sigaction(SIGINT, &guard->old_int, nullptr);
            sigaction(SIGQUIT, &guard->old_quit, nullptr);
        }
        if (fds.stdin_fd >= 0 && dup2(fds.stdin_fd, STDIN_FILENO) < 0) {
            write_errno_and_exit(status_pipe[1], errno);
        }
        if (fds.stdout_fd >= 0 && dup2(fds.stdout_fd, STDOUT_FILENO) < 0) {
            write_errno_and_exit(status_pipe[1], errno);
        }
        if (fds.stderr_fd >= 0 && dup2(fds.stderr_fd, STDERR_FILENO) < 0) {
            write_errno_and_exit(status_pipe[1], errno);
        }
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            write_errno_and_exit(status_pipe[1], errno);
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));

        // If execvp returns, it failed
        write_errno_and_exit(status_pipe[1], errno);
    }

    // Parent process
    close(status_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        std::string what = (!cwd.empty() && access(cwd.c_str(), X_OK) != 0)
            ? "cannot enter directory '" + cwd + "'"
            : "cannot execute '" + args[0] + "'";
        result.error = what + ": " + std::strerror(child_errno);
        return result;
    }

    result.pid = pid;
    return result;
}

int wait_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return status;
}

} // namespace

int ProcessRunner::decode_status(int status) {
    if (status < 0) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

RunResult ProcessRunner::run(const std::vector<std::string>& argv, const std::string& cwd) {
    RunResult result;
    SignalGuard guard;

    Spawned child = spawn(argv, cwd, ChildFds{}, &guard);
    if (child.pid < 0) {
        result.exit_code = kSpawnFailure;
        result.error = child.error;
        return result;
    }

    result.spawned = true;
    result.exit_code = decode_status(wait_child(child.pid));
    return result;
}

CaptureResult ProcessRunner::capture(const std::vector<std::string>& argv, const std::string& cwd) {
    CaptureResult result;

    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        result.exit_code = kSpawnFailure;
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.exit_code = kSpawnFailure;
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }
    int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);

    ChildFds fds;
    fds.stdin_fd = devnull;
    fds.stdout_fd = out_pipe[1];
    fds.stderr_fd = err_pipe[1];

    Spawned child = spawn(argv, cwd, fds, nullptr);
    close(out_pipe[1]);
    close(err_pipe[1]);
    if (devnull >= 0) close(devnull);

    if (child.pid < 0) {
        close(out_pipe[0]);
        close(err_pipe[0]);
        result.exit_code = kSpawnFailure;
        result.error = child.error;
        return result;
    }
    result.spawned = true;

    // Drain both pipes until EOF on each
    struct pollfd pfds[2];
    pfds[0] = {out_pipe[0], POLLIN, 0};
    pfds[1] = {err_pipe[0], POLLIN, 0};
    std::string* sinks[2] = {&result.out, &result.err};
    int open_count = 2;
    char buffer[4096];

    while (open_count > 0) {
        int ready = poll(pfds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (pfds[i].fd < 0 || pfds[i].revents == 0) continue;
            ssize_t n = read(pfds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(pfds[i].fd);
                pfds[i].fd = -1;
                --open_count;
            }
        }
    }
    for (auto& p : pfds) {
        if (p.fd >= 0) close(p.fd);
    }

    result.exit_code = decode_status(wait_child(child.pid));
    return result;
}

std::string ProcessRunner::format_command(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) line += ' ';
        bool plain = !arg.empty() &&
            arg.find_first_of(" \t\n'\"\\$`*?;&|<>()") == std::string::npos;
        if (plain) {
            line += arg;
            continue;
        }
        // Single-quote with embedded quote escaping
        line += '\'';
        for (char c : arg) {
            if (c == '\'') line += "'\\''";
            else line += c;
        }
        line += '\'';
    }
    return line;
}
