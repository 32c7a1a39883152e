#include "common/subprocess.hpp"
#include "common/logger.hpp"
#include <cerrno>
#include <csignal>
#include <stdexcept>
#include <cstring>
#include <system_error>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

Subprocess::Subprocess(std::vector<std::string> argv)
    : argv_(std::move(argv)) {
}

Subprocess::~Subprocess() {
    closePipes();
    if (pid_ > 0 && !reaped_) {
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
    }
}

void Subprocess::start() {
    if (argv_.empty()) {
        throw std::invalid_argument("Subprocess: empty command");
    }

    int outPipe[2];
    int errPipe[2];
    if (pipe2(outPipe, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe");
    }
    if (pipe2(errPipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close(outPipe[0]);
        close(outPipe[1]);
        throw std::system_error(saved, std::generic_category(), "pipe");
    }

    std::vector<char*> args;
    for (const auto& s : argv_) {
        args.push_back(const_cast<char*>(s.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(outPipe[0]);
        close(outPipe[1]);
        close(errPipe[0]);
        close(errPipe[1]);
        throw std::system_error(saved, std::generic_category(), "fork");
    }

    if (pid == 0) {
        // CHILD: only async-signal-safe calls until exec
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        struct sigaction dfl {};
        dfl.sa_handler = SIG_DFL;
        sigemptyset(&dfl.sa_mask);
        sigaction(SIGPIPE, &dfl, nullptr);

        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);

        execvp(args[0], args.data());

        static const char kExecFailed[] = "exec failed: ";
        (void)!write(STDERR_FILENO, kExecFailed, sizeof(kExecFailed) - 1);
        (void)!write(STDERR_FILENO, args[0], strlen(args[0]));
        (void)!write(STDERR_FILENO, "\n", 1);
        _exit(127);
    }

    // PARENT
    close(outPipe[1]);
    close(errPipe[1]);
    stdoutFd_ = outPipe[0];
    stderrFd_ = errPipe[0];
    pid_ = pid;
    reaped_ = false;
}

bool Subprocess::readOutput(const OutputHandler& handler, std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;
    const bool unlimited = timeout == std::chrono::milliseconds::zero();
    const auto deadline = Clock::now() + timeout;
    char buffer[64 * 1024];

    while (stdoutFd_ >= 0 || stderrFd_ >= 0) {
        pollfd fds[2];
        nfds_t count = 0;
        if (stdoutFd_ >= 0) {
            fds[count++] = {stdoutFd_, POLLIN, 0};
        }
        if (stderrFd_ >= 0) {
            fds[count++] = {stderrFd_, POLLIN, 0};
        }

        int waitMs = -1;
        if (!unlimited) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (remaining.count() <= 0) {
                return false;
            }
            waitMs = static_cast<int>(remaining.count());
        }

        int ready = poll(fds, count, waitMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "poll");
        }
        if (ready == 0) {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            int& fd = fds[i].fd == stdoutFd_ ? stdoutFd_ : stderrFd_;
            Stream stream = fds[i].fd == stdoutFd_ ? Stream::Stdout : Stream::Stderr;

            ssize_t n = read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                if (handler) {
                    handler(stream, buffer, static_cast<size_t>(n));
                }
            } else if (n == 0 || errno != EINTR) {
                closeFd(fd);
            }
        }
    }
    return true;
}

void Subprocess::waitForExit() {
    if (pid_ <= 0 || reaped_) {
        return;
    }
    siginfo_t info{};
    while (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitid");
        }
    }
}

int Subprocess::reap() {
    if (pid_ <= 0 || reaped_) {
        return -1;
    }
    closePipes();

    int status = 0;
    pid_t result;
    while ((result = waitpid(pid_, &status, 0)) < 0 && errno == EINTR) {
    }
    reaped_ = true;
    if (result < 0) {
        Logger::error("waitpid failed for pid " + std::to_string(pid_) + ": " + strerror(errno));
        return -1;
    }
    return decodeStatus(status);
}

bool Subprocess::signal(int sig) const {
    if (pid_ <= 0 || reaped_) {
        return false;
    }
    return ::kill(pid_, sig) == 0;
}

void Subprocess::closePipes() {
    closeFd(stdoutFd_);
    closeFd(stderrFd_);
}
