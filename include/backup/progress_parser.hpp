#pragma once

#include "backup/backup_types.hpp"
#include <cstdint>
#include <optional>
#include <string>

// One rsync --info=progress2 line, e.g.
//   "     32,768 100%    2.08MB/s    0:00:00"
//   "  1.049.919.488   0% 1001,25MB/s    0:09:03"
struct ProgressLine {
    int64_t transferredBytes{0};
    int percent{0};
    std::string speed;
};

// Returns nothing for any line that is not a progress line.
std::optional<ProgressLine> parseProgressLine(const std::string& line);

// Parses a byte count written with no separator or with thousands grouped
// by one consistent ',' or '.'. "1.5" and "1,234.567" are rejected.
std::optional<int64_t> parseGroupedInteger(const std::string& token);

// Reads the --stats summary block printed when rsync finishes.
TransferStats parseTransferStats(const std::string& output);
