#pragma once

#include <string>
#include <vector>
#include <sys/types.h>

class ProcessTree {
public:
    explicit ProcessTree(std::string procRoot = "/proc");

    // Every live descendant of pid, deepest first. Read from one scan of
    // <procRoot>/<pid>/stat.
    std::vector<pid_t> descendantsOf(pid_t pid) const;

    // Parent pid from the contents of a /proc/<pid>/stat file, or -1.
    static pid_t parseParentPid(const std::string& statLine);

private:
    std::string procRoot_;
};
