#include "backup/transfer_runner.hpp"
#include "backup/progress_parser.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/subprocess.hpp"
#include "common/utils.hpp"

namespace {

// The summary block sits at the very end of stdout; -v output before it can
// list millions of files, so only the tail is kept.
constexpr size_t kStdoutTail = 64 * 1024;
constexpr size_t kStderrTail = 16 * 1024;

// Keeps the last limit bytes, never starting inside a UTF-8 sequence
void appendBounded(std::string& buffer, const char* data, size_t length, size_t limit) {
    buffer.append(data, length);
    if (buffer.size() > limit) {
        size_t cut = buffer.size() - limit;
        while (cut < buffer.size() && (static_cast<unsigned char>(buffer[cut]) & 0xC0) == 0x80) {
            cut++;
        }
        buffer.erase(0, cut);
    }
}

std::string withTrailingSlash(const std::string& path) {
    if (!path.empty() && path.back() == '/') {
        return path;
    }
    return path + "/";
}

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

// Splits a stream on '\r' and '\n'. rsync redraws progress with '\r'.
class LineSplitter {
public:
    template <typename Callback>
    void feed(const char* data, size_t length, Callback&& onLine) {
        for (size_t i = 0; i < length; ++i) {
            char c = data[i];
            if (c == '\r' || c == '\n') {
                if (!pending_.empty()) {
                    onLine(pending_);
                    pending_.clear();
                }
            } else {
                pending_ += c;
            }
        }
    }

    template <typename Callback>
    void flush(Callback&& onLine) {
        if (!pending_.empty()) {
            onLine(pending_);
            pending_.clear();
        }
    }

private:
    std::string pending_;
};

} // namespace

RsyncTransferRunner::RsyncTransferRunner(const EngineSettings& settings,
                                         std::shared_ptr<CancellationController> cancellation,
                                         std::shared_ptr<EventBus> events)
    : settings_(settings)
    , cancellation_(std::move(cancellation))
    , events_(std::move(events)) {
}

std::vector<std::string> RsyncTransferRunner::buildCommand(const std::string& sourcePath,
                                                           const std::string& destPath) const {
    std::vector<std::string> argv = settings_.elevationCommand;
    // rsync only emits progress2 updates line by line when stdout is line buffered
    if (!settings_.stdbufPath.empty()) {
        argv.push_back(settings_.stdbufPath);
        argv.push_back("-oL");
    }
    argv.insert(argv.end(), {
        settings_.rsyncPath,
        "-av", "--delete", "--info=progress2", "--no-inc-recursive", "--stats",
        withTrailingSlash(sourcePath),
        withTrailingSlash(destPath)
    });
    return argv;
}

TransferStats RsyncTransferRunner::runTransfer(const std::string& sourcePath,
                                               const std::string& destPath,
                                               int sourceIndex,
                                               const std::string& sourceName,
                                               int sourcesCount) {
    Subprocess process(buildCommand(sourcePath, destPath));
    Logger::info("Mirroring " + sourcePath + " -> " + destPath);
    Logger::debug("exec: " + utils::joinCommand(process.argv()));

    try {
        process.start();
    } catch (const std::exception& e) {
        throw TransferError(std::string("Failed to start rsync: ") + e.what());
    }

    ProcessRegistration registration(*cancellation_, process.pid());

    std::string stdoutTail;
    std::string stderrTail;
    LineSplitter stdoutLines;
    LineSplitter stderrLines;

    auto publishProgress = [&](const std::string& line) {
        auto progress = parseProgressLine(line);
        if (!progress || !events_) {
            return;
        }
        ProgressSample sample;
        sample.sourceIndex = sourceIndex;
        sample.sourceName = sourceName;
        sample.sourcesCount = sourcesCount;
        sample.percent = progress->percent;
        sample.transferredBytes = progress->transferredBytes;
        sample.speed = progress->speed;
        events_->publish("progress", sample);
    };

    // rsync is not consistent about which stream carries progress, so both
    // are parsed
    process.readOutput([&](Subprocess::Stream stream, const char* data, size_t length) {
        if (stream == Subprocess::Stream::Stdout) {
            appendBounded(stdoutTail, data, length, kStdoutTail);
            stdoutLines.feed(data, length, publishProgress);
        } else {
            appendBounded(stderrTail, data, length, kStderrTail);
            stderrLines.feed(data, length, publishProgress);
        }
    });
    stdoutLines.flush(publishProgress);
    stderrLines.flush(publishProgress);

    process.waitForExit();
    registration.release();
    int exitCode = process.reap();

    if (cancellation_->isCancelled()) {
        Logger::info("Transfer of " + sourcePath + " cancelled (exit code " + std::to_string(exitCode) + ")");
        throw CancelledError();
    }

    if (exitCode != 0) {
        std::string detail = trim(stderrTail);
        Logger::error("rsync exited with code " + std::to_string(exitCode) + " for " + sourcePath +
                      (detail.empty() ? "" : ": " + detail));
        throw TransferError("rsync exited with code " + std::to_string(exitCode) + ": " + detail,
                            exitCode, detail);
    }

    TransferStats stats = parseTransferStats(stdoutTail);
    Logger::info("Mirrored " + sourcePath + ": " + std::to_string(stats.filesTransferred) + " file(s), " +
                 std::to_string(stats.transferredBytes) + " byte(s)");
    return stats;
}
