#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include <sys/types.h>

// A child process with its stdout and stderr connected to pipes.
// stdin is /dev/null. The child starts with an empty signal mask so it
// never inherits signals blocked by the parent.
class Subprocess {
public:
    enum class Stream {
        Stdout,
        Stderr
    };

    using OutputHandler = std::function<void(Stream stream, const char* data, size_t length)>;

    explicit Subprocess(std::vector<std::string> argv);
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    // Throws std::system_error if the pipes or the fork fail. A failed exec
    // shows up as exit code 127 with the reason on stderr.
    void start();

    // Pumps both pipes into handler until both reach EOF. A zero timeout
    // waits forever. Returns false if the timeout expired first.
    bool readOutput(const OutputHandler& handler,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

    // Blocks until the child has exited but leaves it unreaped, so its pid
    // cannot be recycled until reap() is called.
    void waitForExit();

    // Reaps the child. Returns its exit status, or 128 + signal number.
    int reap();

    bool signal(int sig) const;
    pid_t pid() const { return pid_; }
    const std::vector<std::string>& argv() const { return argv_; }

private:
    void closePipes();

    std::vector<std::string> argv_;
    pid_t pid_{-1};
    int stdoutFd_{-1};
    int stderrFd_{-1};
    bool reaped_{false};
};
