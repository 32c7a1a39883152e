#include "common/command_runner.hpp"
#include "common/subprocess.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <csignal>

CommandResult CommandRunner::run(const std::vector<std::string>& argv, std::chrono::seconds timeout) {
    Logger::debug("exec: " + utils::joinCommand(argv));
    return execute(argv, timeout);
}

CommandResult CommandRunner::runRedacted(const std::vector<std::string>& argv,
                                         const std::string& secret,
                                         std::chrono::seconds timeout) {
    std::vector<std::string> shown = argv;
    if (!secret.empty()) {
        for (auto& arg : shown) {
            size_t pos = 0;
            while ((pos = arg.find(secret, pos)) != std::string::npos) {
                arg.replace(pos, secret.size(), "***");
                pos += 3;
            }
        }
    }
    Logger::debug("exec: " + utils::joinCommand(shown));
    return execute(argv, timeout);
}

CommandResult CommandRunner::execute(const std::vector<std::string>& argv, std::chrono::seconds timeout) {
    CommandResult result;
    Subprocess process(argv);

    try {
        process.start();
        bool finished = process.readOutput(
            [&result](Subprocess::Stream stream, const char* data, size_t length) {
                if (stream == Subprocess::Stream::Stdout) {
                    result.output.append(data, length);
                } else {
                    result.errorOutput.append(data, length);
                }
            },
            std::chrono::duration_cast<std::chrono::milliseconds>(timeout));

        if (!finished) {
            result.timedOut = true;
            process.signal(SIGKILL);
            result.errorOutput += "timed out after " + std::to_string(timeout.count()) + "s";
        }
        result.exitCode = process.reap();
    } catch (const std::exception& e) {
        result.exitCode = -1;
        result.errorOutput = std::string("failed to run ") + (argv.empty() ? "<empty>" : argv.front()) + ": " + e.what();
    }

    return result;
}
