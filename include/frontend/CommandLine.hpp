// File: CommandLine.hpp
// Description: Declares command-line and environment parsing for the
//              comment_ratio executable.

#pragma once

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace frontend {

struct CommandLineOptions {
    std::string path;
    std::unordered_set<std::string> excludedExtensions;
    bool verbose{false};
    bool showHelp{false};
};

// Splits ".txt, .log" into {".txt", ".log"}; blank entries are dropped.
std::unordered_set<std::string> splitExcludeList(const std::string& value);

// Throws std::invalid_argument on unknown options, a missing option value,
// a missing path or a second positional argument.
CommandLineOptions parseCommandLine(const std::vector<std::string>& args);
CommandLineOptions parseCommandLine(int argc, char* argv[]);

std::string usage(const std::string& programName);

// Value of COMMENT_RATIO_LOG_FILE when set and non-empty.
std::optional<std::string> readLogFileFromEnvironment();

}  // namespace frontend
