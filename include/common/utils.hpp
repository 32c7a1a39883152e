#pragma once

#include <chrono>
#include <ctime>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

namespace utils {

// ISO-8601 UTC with millisecond precision, e.g. 2026-10-18T09:30:00.123Z
inline std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << (ms % 1000) << 'Z';
    return ss.str();
}

inline std::string shellQuote(const std::string& arg) {
    if (!arg.empty() && arg.find_first_not_of(
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789_-./=,:@%+") == std::string::npos) {
        return arg;
    }
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

inline std::string joinCommand(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        line += shellQuote(arg);
    }
    return line;
}

// Last path component, ignoring trailing slashes. "/" maps to "root".
inline std::string baseName(const std::string& path) {
    std::string trimmed = path;
    while (trimmed.size() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    std::string name = std::filesystem::path(trimmed).filename().string();
    return name.empty() || name == "/" ? "root" : name;
}

inline std::string hostname() {
    char buffer[256] = {0};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return "unknown";
    }
    return buffer;
}

// Writes content next to the target and renames it into place.
inline void writeFileAtomically(const std::string& path, const std::string& content) {
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path());
    }

    std::string tmpPath = path + ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open " + tmpPath + " for writing");
        }
        file << content;
        file.flush();
        if (!file) {
            throw std::runtime_error("Failed to write " + tmpPath);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, target, ec);
    if (ec) {
        std::error_code removeEc;
        std::filesystem::remove(tmpPath, removeEc);
        throw std::runtime_error("Failed to replace " + path + ": " + ec.message());
    }
}

} // namespace utils
