// File: CommandLine.cpp
// Description: Implements argv and environment parsing for comment_ratio.

#include "frontend/CommandLine.hpp"

#include "backend/LineClassifier.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace frontend {

namespace {

constexpr const char* kLogFileVariable = "COMMENT_RATIO_LOG_FILE";

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

}  // namespace

std::unordered_set<std::string> splitExcludeList(const std::string& value) {
    std::unordered_set<std::string> extensions;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        const std::string extension(backend::trimWhitespace(item));
        if (!extension.empty()) {
            extensions.insert(extension);
        }
    }
    return extensions;
}

CommandLineOptions parseCommandLine(const std::vector<std::string>& args) {
    CommandLineOptions options;
    bool havePath = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
            return options;
        }
        if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
            continue;
        }
        if (arg == "-e" || arg == "--exclude") {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Option " + arg + " expects a value.");
            }
            options.excludedExtensions = splitExcludeList(args[++i]);
            continue;
        }
        if (startsWith(arg, "--exclude=")) {
            options.excludedExtensions = splitExcludeList(arg.substr(std::string("--exclude=").size()));
            continue;
        }
        if (startsWith(arg, "-e")) {
            // Attached short form: -e.txt,.log
            options.excludedExtensions = splitExcludeList(arg.substr(2));
            continue;
        }
        if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument("Unrecognized option: " + arg);
        }

        if (havePath) {
            throw std::invalid_argument("Unexpected extra argument: " + arg);
        }
        options.path = arg;
        havePath = true;
    }

    if (!havePath) {
        throw std::invalid_argument("Missing required argument: path");
    }
    return options;
}

CommandLineOptions parseCommandLine(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parseCommandLine(args);
}

std::string usage(const std::string& programName) {
    std::ostringstream oss;
    oss << "Usage: " << programName << " <path> [-e EXTS] [-v] [-h]\n"
        << "Calculates the ratio of comments to code lines in a project or file.\n\n"
        << "  path               File or directory to analyze.\n"
        << "  -e, --exclude EXTS Comma-separated list of file extensions to exclude"
           " (e.g., .txt,.log).\n"
        << "  -v, --verbose      Enable verbose output (debug logging).\n"
        << "  -h, --help         Show this message and exit.\n\n"
        << "Environment:\n"
        << "  " << kLogFileVariable << "  Also write log output to this file.\n";
    return oss.str();
}

std::optional<std::string> readLogFileFromEnvironment() {
    const char* value = std::getenv(kLogFileVariable);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace frontend
