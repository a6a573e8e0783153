// File: main.cpp
// Description: Parses the command line, sets up logging and runs the
//              comment-to-code ratio analysis on a file or directory.

#include "backend/CodeStats.hpp"
#include "backend/CodeStatsFacade.hpp"
#include "backend/Logger.hpp"
#include "frontend/CommandLine.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

constexpr int kUsageExitCode = 2;

std::string programName(int argc, char* argv[]) {
    if (argc > 0 && argv[0] != nullptr) {
        return std::filesystem::path(argv[0]).filename().string();
    }
    return "comment_ratio";
}

}  // namespace

int main(int argc, char* argv[]) {
    const std::string program = programName(argc, argv);

    frontend::CommandLineOptions options;
    try {
        options = frontend::parseCommandLine(argc, argv);
    } catch (const std::invalid_argument& ex) {
        std::cerr << program << ": " << ex.what() << "\n\n" << frontend::usage(program);
        return kUsageExitCode;
    }

    if (options.showHelp) {
        std::cout << frontend::usage(program);
        return 0;
    }

    backend::Logger logger(std::cerr,
                           options.verbose ? backend::LogLevel::Debug : backend::LogLevel::Info);

    try {
        if (const auto logFile = frontend::readLogFileFromEnvironment()) {
            logger.openFile(*logFile);
            logger.debug("Mirroring log output to " + logger.logFilePath() + ".");
        }

        backend::CodeStatsOptions statsOptions;
        statsOptions.excludedExtensions = options.excludedExtensions;
        for (const auto& extension : statsOptions.excludedExtensions) {
            logger.debug("Excluding extension " + extension + ".");
        }

        backend::CodeStatsFacade facade(logger);
        return facade.run(options.path, statsOptions, std::cout);
    } catch (const std::exception& ex) {
        logger.error(std::string("Analysis terminated: ") + ex.what());
        return 1;
    }
}
