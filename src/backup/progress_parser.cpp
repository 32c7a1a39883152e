#include "backup/progress_parser.hpp"
#include <limits>
#include <regex>

namespace {

const std::regex& progressPattern() {
    static const std::regex pattern(R"(^\s*([\d.,]+)\s+(\d{1,3})%\s+([\d.,]+\s*[kKMGT]?B/s))");
    return pattern;
}

const std::regex& groupedPattern() {
    // Either plain digits, or 1-3 digits followed by groups of exactly three
    // digits that all use the same separator
    static const std::regex pattern(R"(^(\d+|\d{1,3}([.,])\d{3}(\2\d{3})*)$)");
    return pattern;
}

std::string removeWhitespace(const std::string& text) {
    std::string result;
    for (char c : text) {
        if (c != ' ' && c != '\t') {
            result += c;
        }
    }
    return result;
}

int64_t statValue(const std::string& output, const std::regex& pattern) {
    std::smatch match;
    if (!std::regex_search(output, match, pattern)) {
        return 0;
    }
    auto value = parseGroupedInteger(match[1].str());
    return value ? *value : 0;
}

} // namespace

std::optional<int64_t> parseGroupedInteger(const std::string& token) {
    if (token.empty() || !std::regex_match(token, groupedPattern())) {
        return std::nullopt;
    }

    int64_t value = 0;
    for (char c : token) {
        if (c == '.' || c == ',') {
            continue;
        }
        int digit = c - '0';
        if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

std::optional<ProgressLine> parseProgressLine(const std::string& line) {
    if (line.find('%') == std::string::npos) {
        return std::nullopt;
    }

    std::smatch match;
    if (!std::regex_search(line, match, progressPattern())) {
        return std::nullopt;
    }

    auto bytes = parseGroupedInteger(match[1].str());
    if (!bytes) {
        return std::nullopt;
    }

    int percent = std::stoi(match[2].str());
    if (percent > 100) {
        return std::nullopt;
    }

    ProgressLine progress;
    progress.transferredBytes = *bytes;
    progress.percent = percent;
    progress.speed = removeWhitespace(match[3].str());
    return progress;
}

TransferStats parseTransferStats(const std::string& output) {
    static const std::regex regularFiles(R"(Number of regular files transferred:\s*([\d.,]+))");
    static const std::regex anyFiles(R"(Number of files transferred:\s*([\d.,]+))");
    static const std::regex transferredSize(R"(Total transferred file size:\s*([\d.,]+))");

    TransferStats stats;
    std::smatch match;
    // rsync >= 3.1 prints the regular-file count; older versions only the total
    if (std::regex_search(output, match, regularFiles)) {
        auto value = parseGroupedInteger(match[1].str());
        stats.filesTransferred = value ? *value : 0;
    } else {
        stats.filesTransferred = statValue(output, anyFiles);
    }
    stats.transferredBytes = statValue(output, transferredSize);
    return stats;
}
