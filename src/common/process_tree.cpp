#include "common/process_tree.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>

ProcessTree::ProcessTree(std::string procRoot)
    : procRoot_(std::move(procRoot)) {
}

pid_t ProcessTree::parseParentPid(const std::string& statLine) {
    // "pid (comm) state ppid ..." where comm may itself contain spaces and ')'
    size_t close = statLine.rfind(')');
    if (close == std::string::npos) {
        return -1;
    }
    std::istringstream fields(statLine.substr(close + 1));
    std::string state;
    long ppid = -1;
    if (!(fields >> state >> ppid)) {
        return -1;
    }
    return static_cast<pid_t>(ppid);
}

std::vector<pid_t> ProcessTree::descendantsOf(pid_t pid) const {
    std::multimap<pid_t, pid_t> children;

    std::error_code ec;
    for (std::filesystem::directory_iterator it(procRoot_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }

        // Processes can vanish between listing and reading
        std::ifstream stat(it->path() / "stat");
        std::string line;
        if (!stat.is_open() || !std::getline(stat, line)) {
            continue;
        }
        pid_t parent = parseParentPid(line);
        if (parent > 0) {
            children.emplace(parent, static_cast<pid_t>(std::stol(name)));
        }
    }
    if (ec) {
        Logger::warning("Failed to scan " + procRoot_ + ": " + ec.message());
    }

    std::vector<pid_t> result;
    std::function<void(pid_t)> collect = [&](pid_t parent) {
        auto range = children.equal_range(parent);
        for (auto it = range.first; it != range.second; ++it) {
            collect(it->second);
            result.push_back(it->second);
        }
    };
    collect(pid);
    return result;
}
