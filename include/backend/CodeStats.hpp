// File: CodeStats.hpp
// Description: Declares the directory-tree analyzer that classifies every
//              eligible file and accumulates comment/code line totals.

#pragma once

#include "backend/LineClassifier.hpp"
#include "backend/Logger.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <system_error>
#include <unordered_set>
#include <vector>

namespace backend {

struct FileReport {
    std::filesystem::path filePath;
    ClassificationResult result;
};

struct AggregateResult {
    std::size_t fileCount{0};
    std::size_t totalCommentLines{0};
    std::size_t totalCodeLines{0};
    double overallRatio{0.0};
    std::size_t skippedFileCount{0};
    std::size_t failedFileCount{0};
    bool directoryExists{true};
    std::vector<FileReport> files;
};

struct CodeStatsOptions {
    // Compared literally against path::extension(), leading dot included.
    std::unordered_set<std::string> excludedExtensions;
};

class CodeStatsAnalyzer {
public:
    explicit CodeStatsAnalyzer(Logger& logger);

    AggregateResult analyze(const std::filesystem::path& root,
                            const CodeStatsOptions& options = CodeStatsOptions{});

private:
    void reportUnreadableDirectory(const std::filesystem::path& directory,
                                   const std::error_code& ec);
    void visitFile(const std::filesystem::directory_entry& entry,
                   AggregateResult& result,
                   const CodeStatsOptions& options);

    Logger& m_logger;
};

}  // namespace backend
