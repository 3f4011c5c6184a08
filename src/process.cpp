#include "process.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>

#include <array>
#include <cerrno>
#include <cstring>

namespace {

// Owns one end of a pipe
class FdGuard {
public:
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { reset(); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    void reset() {
        if (fd_ != -1) {
            close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
};

void pump_lines(int fd, InstallOutputMonitor& monitor) {
    std::array<char, 4096> buffer;
    std::string pending;

    while (true) {
        ssize_t n = read(fd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            throw PipwallException(string_format("error.read_output_failed", std::string(strerror(errno))));
        }
        if (n == 0) break;

        pending.append(buffer.data(), static_cast<size_t>(n));
        size_t start = 0;
        for (size_t nl = pending.find('\n', start); nl != std::string::npos; nl = pending.find('\n', start)) {
            std::string line = pending.substr(start, nl - start);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            monitor.observe(line);
            start = nl + 1;
        }
        pending.erase(0, start);
    }

    if (!pending.empty()) {
        monitor.observe(pending);
    }
}

int wait_for_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw PipwallException(string_format("error.wait_failed", std::string(strerror(errno))));
        }
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}

} // namespace

int run_monitored(const std::vector<std::string>& args, InstallOutputMonitor& monitor) {
    if (args.empty()) {
        throw PipwallException(get_string("error.empty_command"));
    }

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw PipwallException(string_format("error.pipe_failed", std::string(strerror(errno))));
    }
    FdGuard read_end(fds[0]);
    FdGuard write_end(fds[1]);

    // Status pipe: the child writes errno here if execvp fails
    int exec_fds[2];
    if (pipe2(exec_fds, O_CLOEXEC) != 0) {
        throw PipwallException(string_format("error.pipe_failed", std::string(strerror(errno))));
    }
    FdGuard exec_read(exec_fds[0]);
    FdGuard exec_write(exec_fds[1]);

    std::vector<char*> c_args;
    for (const auto& arg : args) c_args.push_back(const_cast<char*>(arg.c_str()));
    c_args.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        throw PipwallException(string_format("error.fork_failed", std::string(strerror(errno))));
    }
    if (pid == 0) {
        if (dup2(fds[1], STDOUT_FILENO) == -1 || dup2(fds[1], STDERR_FILENO) == -1) _exit(127);
        execvp(c_args[0], c_args.data());
        int err = errno;
        ssize_t ignored = write(exec_fds[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    write_end.reset();
    exec_write.reset();

    int exec_errno = 0;
    ssize_t got;
    do {
        got = read(exec_read.get(), &exec_errno, sizeof(exec_errno));
    } while (got == -1 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        wait_for_child(pid);
        throw PipwallException(string_format("error.exec_failed", args[0], std::string(strerror(exec_errno))));
    }

    try {
        pump_lines(read_end.get(), monitor);
    } catch (const PipwallException&) {
        read_end.reset();
        wait_for_child(pid);
        throw;
    }
    read_end.reset();
    return wait_for_child(pid);
}
