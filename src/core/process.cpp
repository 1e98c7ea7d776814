#include "core/process.hpp"
#include "core/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

/// Closes both ends of a pipe on scope exit unless released
struct Pipe {
    int fds[2] = {-1, -1};

    ~Pipe() {
        for (int& fd : fds) {
            if (fd >= 0) close(fd);
        }
    }

    void close_end(int i) {
        if (fds[i] >= 0) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
};

} // namespace

ProcessOutput run_process(const std::vector<std::string>& argv,
                          const std::map<std::string, std::string>& env) {
    if (argv.empty()) {
        throw UpdateError(ErrorKind::Io, "run_process: empty command line");
    }

    Pipe out_pipe;
    Pipe err_pipe;
    if (pipe(out_pipe.fds) != 0 || pipe(err_pipe.fds) != 0) {
        throw UpdateError(ErrorKind::Io, std::string("pipe() failed: ") + std::strerror(errno));
    }

    // Build argv before fork; only async-signal-safe calls in the child
    std::vector<const char*> c_argv;
    for (const auto& arg : argv) {
        c_argv.push_back(arg.c_str());
    }
    c_argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        throw UpdateError(ErrorKind::Io, std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child process
        dup2(out_pipe.fds[1], STDOUT_FILENO);
        dup2(err_pipe.fds[1], STDERR_FILENO);
        close(out_pipe.fds[0]);
        close(out_pipe.fds[1]);
        close(err_pipe.fds[0]);
        close(err_pipe.fds[1]);

        for (const auto& kv : env) {
            setenv(kv.first.c_str(), kv.second.c_str(), 1);
        }

        execvp(c_argv[0], const_cast<char* const*>(c_argv.data()));

        // If execvp returns, it failed
        _exit(127);
    }

    // Parent process
    out_pipe.close_end(1);
    err_pipe.close_end(1);

    ProcessOutput result;
    struct pollfd pfds[2] = {
        {out_pipe.fds[0], POLLIN, 0},
        {err_pipe.fds[0], POLLIN, 0},
    };
    std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
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
                pfds[i].fd = -1;  // EOF or error: stop polling this end
                --open_count;
            }
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw UpdateError(ErrorKind::Io, std::string("waitpid() failed: ") + std::strerror(errno));
        }
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}
