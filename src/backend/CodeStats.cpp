// File: CodeStats.cpp
// Description: Implements the recursive comment/code line aggregation over a
//              directory tree.

#include "backend/CodeStats.hpp"

#include "backend/ReportPrinter.hpp"

#include <system_error>
#include <utility>
#include <vector>

namespace backend {

namespace {

bool isExtensionExcluded(const std::filesystem::path& path, const CodeStatsOptions& options) {
    if (options.excludedExtensions.empty()) {
        return false;
    }
    const std::string ext = path.extension().string();
    return options.excludedExtensions.find(ext) != options.excludedExtensions.end();
}

}  // namespace

CodeStatsAnalyzer::CodeStatsAnalyzer(Logger& logger) : m_logger(logger) {}

AggregateResult CodeStatsAnalyzer::analyze(const std::filesystem::path& root,
                                           const CodeStatsOptions& options) {
    AggregateResult result;

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        result.directoryExists = false;
        m_logger.error("Invalid directory path: " + root.string());
        return result;
    }

    // Symlinked directories are listed but not descended into.
    std::vector<std::filesystem::path> pending{root};
    while (!pending.empty()) {
        const std::filesystem::path directory = std::move(pending.back());
        pending.pop_back();

        std::filesystem::directory_iterator it(directory, ec);
        if (ec) {
            reportUnreadableDirectory(directory, ec);
            ec.clear();
            continue;
        }

        const std::filesystem::directory_iterator end;
        while (it != end) {
            const auto& entry = *it;
            std::error_code typeEc;
            if (entry.is_directory(typeEc)) {
                if (!entry.is_symlink(typeEc)) {
                    pending.push_back(entry.path());
                }
            } else {
                visitFile(entry, result, options);
            }

            it.increment(ec);
            if (ec) {
                // The rest of this directory is lost; siblings are still walked.
                reportUnreadableDirectory(directory, ec);
                ec.clear();
                break;
            }
        }
    }

    result.overallRatio = computeRatio(result.totalCommentLines, result.totalCodeLines);
    return result;
}

void CodeStatsAnalyzer::reportUnreadableDirectory(const std::filesystem::path& directory,
                                                  const std::error_code& ec) {
    if (ec == std::errc::permission_denied) {
        m_logger.debug("Skipping unreadable directory " + directory.string() + ": " +
                       ec.message());
        return;
    }
    m_logger.warning("Skipping directory " + directory.string() + ": " + ec.message());
}

void CodeStatsAnalyzer::visitFile(const std::filesystem::directory_entry& entry,
                                  AggregateResult& result,
                                  const CodeStatsOptions& options) {
    const std::filesystem::path& filePath = entry.path();

    if (isExtensionExcluded(filePath, options)) {
        m_logger.debug("Skipping file (excluded extension): " + filePath.string());
        result.skippedFileCount += 1;
        return;
    }

    std::error_code ec;
    if (!entry.is_regular_file(ec)) {
        m_logger.debug("Skipping non-file item: " + filePath.string());
        return;
    }

    ReadError error;
    const auto classification = classifyFile(filePath, error);
    if (!classification) {
        m_logger.warning("Skipping " + filePath.string() +
                         " due to error during analysis: " + error.message);
        result.failedFileCount += 1;
        return;
    }

    result.fileCount += 1;
    result.totalCommentLines += classification->commentLines;
    result.totalCodeLines += classification->codeLines;
    result.files.push_back(FileReport{filePath, *classification});
    m_logger.info(formatFileLine(filePath, *classification));
}

}  // namespace backend
