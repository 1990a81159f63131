#include "latbench/process.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>

#include <climits>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace latbench {

namespace {

using Clock = std::chrono::steady_clock;

class Pipe {
public:
    Pipe() = default;
    ~Pipe() { close_read(); close_write(); }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    bool open() {
        int fds[2];
        if (pipe(fds) != 0) {
            return false;
        }
        read_fd = fds[0];
        write_fd = fds[1];
        fcntl(read_fd, F_SETFD, FD_CLOEXEC);
        fcntl(write_fd, F_SETFD, FD_CLOEXEC);
        return true;
    }

    void close_read() {
        if (read_fd >= 0) {
            ::close(read_fd);
            read_fd = -1;
        }
    }

    void close_write() {
        if (write_fd >= 0) {
            ::close(write_fd);
            write_fd = -1;
        }
    }

    int read_fd = -1;
    int write_fd = -1;
};

// Read whatever is available; returns false at EOF or on error
bool drain(int fd, std::string& out) {
    char buffer[8192];
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        out.append(buffer, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

int poll_timeout_ms(std::chrono::milliseconds remaining) {
    if (remaining.count() < 0) {
        return 0;
    }
    if (remaining.count() >= INT_MAX) {
        return INT_MAX;
    }
    return static_cast<int>(remaining.count()) + 1;
}

ProcessResult SystemProcessRunner::run(const ProcessRequest& request) {
    ProcessResult result;

    if (request.argv.empty()) {
        result.error = "empty command line";
        return result;
    }

    // Build C-style arrays before forking
    std::vector<std::string> env_strings;
    for (const auto& [key, value] : request.env) {
        env_strings.push_back(key + "=" + value);
    }

    std::vector<char*> argv;
    for (const auto& s : request.argv) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& s : env_strings) {
        envp.push_back(const_cast<char*>(s.c_str()));
    }
    envp.push_back(nullptr);

    Pipe out_pipe, err_pipe, status_pipe;
    if (!out_pipe.open() || !err_pipe.open() || !status_pipe.open()) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child process: own process group so a timeout reaches grandchildren
        setpgid(0, 0);

        dup2(out_pipe.write_fd, STDOUT_FILENO);
        dup2(err_pipe.write_fd, STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }

        if (request.cwd && chdir(request.cwd->c_str()) != 0) {
            int err = errno;
            (void)!::write(status_pipe.write_fd, &err, sizeof(err));
            _exit(127);
        }

        environ = envp.data();
        execvp(argv[0], argv.data());

        // If execvp returns, it failed
        int err = errno;
        (void)!::write(status_pipe.write_fd, &err, sizeof(err));
        _exit(127);
    }

    // Parent process
    out_pipe.close_write();
    err_pipe.close_write();
    status_pipe.close_write();

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe.read_fd, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        result.error = "failed to start " + request.argv[0] + ": " + strerror(child_errno);
        return result;
    }

    std::optional<Clock::time_point> deadline;
    if (request.timeout_sec) {
        deadline = Clock::now() + std::chrono::seconds(*request.timeout_sec);
    }
    std::optional<Clock::time_point> kill_deadline;
    bool killed = false;

    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        int wait_ms = -1;
        auto now = Clock::now();

        if (deadline && !result.timed_out && now >= *deadline) {
            result.timed_out = true;
            ::kill(-pid, SIGTERM);
            kill_deadline = now + std::chrono::milliseconds(kill_grace_ms_);
        }
        if (kill_deadline && !killed && now >= *kill_deadline) {
            ::kill(-pid, SIGKILL);
            killed = true;
        }

        if (!result.timed_out && deadline) {
            wait_ms = poll_timeout_ms(
                std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now));
        } else if (kill_deadline && !killed) {
            wait_ms = poll_timeout_ms(
                std::chrono::duration_cast<std::chrono::milliseconds>(*kill_deadline - now));
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (out_open) fds[count++] = {out_pipe.read_fd, POLLIN, 0};
        if (err_open) fds[count++] = {err_pipe.read_fd, POLLIN, 0};

        int ready = poll(fds, count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.error = "poll failed: " + std::string(strerror(errno));
            ::kill(-pid, SIGKILL);
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            bool is_out = fds[i].fd == out_pipe.read_fd;
            std::string& target = is_out ? result.stdout_text : result.stderr_text;
            if (!drain(fds[i].fd, target)) {
                if (is_out) {
                    out_open = false;
                } else {
                    err_open = false;
                }
            }
        }
    }

    // Output closed; the process itself may still be running
    int status = 0;
    for (;;) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0) {
            if (errno == EINTR) continue;
            result.error = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }

        auto now = Clock::now();
        if (deadline && !result.timed_out && now >= *deadline) {
            result.timed_out = true;
            ::kill(-pid, SIGTERM);
            kill_deadline = now + std::chrono::milliseconds(kill_grace_ms_);
        }
        if (kill_deadline && !killed && now >= *kill_deadline) {
            ::kill(-pid, SIGKILL);
            killed = true;
        }
        usleep(20 * 1000);
    }

    if (!result.error.empty()) {
        return result;
    }

    result.exit_code = decode_status(status);
    result.ok = true;
    return result;
}

} // namespace latbench
