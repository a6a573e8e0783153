// File: ReportPrinter.cpp
// Description: Implements the report lines printed for single files and the
//              summary printed after a directory walk.

#include "backend/ReportPrinter.hpp"

#include <iomanip>
#include <sstream>

namespace backend {

std::string formatRatio(double ratio) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << ratio;
    return oss.str();
}

std::string formatFileLine(const std::filesystem::path& filePath,
                           const ClassificationResult& result) {
    std::ostringstream oss;
    oss << "File: " << filePath.string() << ", Comment Lines: " << result.commentLines
        << ", Code Lines: " << result.codeLines << ", Ratio: " << formatRatio(result.ratio);
    return oss.str();
}

void printSummary(std::ostream& out, const AggregateResult& aggregate) {
    out << "\n--- Summary ---\n";
    out << "Total Files Analyzed: " << aggregate.fileCount << "\n";
    out << "Total Comment Lines: " << aggregate.totalCommentLines << "\n";
    out << "Total Code Lines: " << aggregate.totalCodeLines << "\n";
    out << "Overall Comment-to-Code Ratio: " << formatRatio(aggregate.overallRatio) << "\n";
}

}  // namespace backend
