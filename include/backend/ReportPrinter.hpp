// File: ReportPrinter.hpp
// Description: Declares the text formatting for per-file results and the
//              directory summary block.

#pragma once

#include "backend/CodeStats.hpp"
#include "backend/LineClassifier.hpp"

#include <filesystem>
#include <ostream>
#include <string>

namespace backend {

// Fixed notation, two decimals.
std::string formatRatio(double ratio);

std::string formatFileLine(const std::filesystem::path& filePath,
                           const ClassificationResult& result);

void printSummary(std::ostream& out, const AggregateResult& aggregate);

}  // namespace backend
