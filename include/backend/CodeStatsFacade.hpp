// File: CodeStatsFacade.hpp
// Description: Declares the façade that dispatches a path to single-file or
//              directory analysis and maps the outcome to an exit status.

#pragma once

#include "backend/CodeStats.hpp"
#include "backend/LineClassifier.hpp"
#include "backend/Logger.hpp"

#include <filesystem>
#include <optional>
#include <ostream>

namespace backend {

enum class PathKind { RegularFile, Directory, Invalid };

PathKind classifyPath(const std::filesystem::path& path);

class CodeStatsFacade {
public:
    explicit CodeStatsFacade(Logger& logger);

    // Logs the read error and returns an empty optional on failure.
    std::optional<ClassificationResult> analyzeFile(const std::filesystem::path& filePath);
    AggregateResult analyzeDirectory(const std::filesystem::path& root,
                                     const CodeStatsOptions& options = CodeStatsOptions{});

    // Returns 0 on success, 1 for an invalid path or an unreadable single file.
    // Exclusions only apply to directory walks.
    int run(const std::filesystem::path& path, const CodeStatsOptions& options, std::ostream& out);

private:
    Logger& m_logger;
    CodeStatsAnalyzer m_analyzer;
};

}  // namespace backend
