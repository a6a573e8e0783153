// File: CodeStatsFacade.cpp
// Description: Implements the single-file and directory entry points used by
//              the command-line frontend.

#include "backend/CodeStatsFacade.hpp"

#include "backend/ReportPrinter.hpp"

#include <string>
#include <system_error>

namespace backend {

PathKind classifyPath(const std::filesystem::path& path) {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (ec) {
        return PathKind::Invalid;
    }
    if (std::filesystem::is_regular_file(status)) {
        return PathKind::RegularFile;
    }
    if (std::filesystem::is_directory(status)) {
        return PathKind::Directory;
    }
    return PathKind::Invalid;
}

CodeStatsFacade::CodeStatsFacade(Logger& logger) : m_logger(logger), m_analyzer(logger) {}

std::optional<ClassificationResult> CodeStatsFacade::analyzeFile(
    const std::filesystem::path& filePath) {
    ReadError error;
    auto result = classifyFile(filePath, error);
    if (!result) {
        m_logger.error(error.message);
    }
    return result;
}

AggregateResult CodeStatsFacade::analyzeDirectory(const std::filesystem::path& root,
                                                  const CodeStatsOptions& options) {
    return m_analyzer.analyze(root, options);
}

int CodeStatsFacade::run(const std::filesystem::path& path,
                         const CodeStatsOptions& options,
                         std::ostream& out) {
    switch (classifyPath(path)) {
        case PathKind::RegularFile: {
            const auto result = analyzeFile(path);
            if (!result) {
                return 1;
            }
            out << formatFileLine(path, *result) << "\n";
            return 0;
        }
        case PathKind::Directory: {
            m_logger.debug("Analyzing directory " + path.string());
            const AggregateResult aggregate = analyzeDirectory(path, options);
            if (!aggregate.directoryExists) {
                return 1;
            }
            if (aggregate.failedFileCount > 0) {
                m_logger.debug(std::to_string(aggregate.failedFileCount) +
                               " file(s) could not be analyzed.");
            }
            printSummary(out, aggregate);
            return 0;
        }
        case PathKind::Invalid:
            break;
    }

    m_logger.error("Invalid path: " + path.string());
    return 1;
}

}  // namespace backend
