#include "backend/ReportPrinter.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace backend;

TEST(ReportPrinterTest, RatioHasTwoDecimals) {
    EXPECT_EQ(formatRatio(0.0), "0.00");
    EXPECT_EQ(formatRatio(1.0), "1.00");
    EXPECT_EQ(formatRatio(4.0 / 7.0), "0.57");
    EXPECT_EQ(formatRatio(2.0 / 3.0), "0.67");
    EXPECT_EQ(formatRatio(12.5), "12.50");
}

TEST(ReportPrinterTest, FileLine) {
    ClassificationResult result;
    result.commentLines = 3;
    result.codeLines = 5;
    result.ratio = 0.6;
    EXPECT_EQ(formatFileLine("src/a.py", result),
              "File: src/a.py, Comment Lines: 3, Code Lines: 5, Ratio: 0.60");
}

TEST(ReportPrinterTest, Summary) {
    AggregateResult aggregate;
    aggregate.fileCount = 2;
    aggregate.totalCommentLines = 4;
    aggregate.totalCodeLines = 7;
    aggregate.overallRatio = 4.0 / 7.0;

    std::ostringstream out;
    printSummary(out, aggregate);
    EXPECT_EQ(out.str(),
              "\n--- Summary ---\n"
              "Total Files Analyzed: 2\n"
              "Total Comment Lines: 4\n"
              "Total Code Lines: 7\n"
              "Overall Comment-to-Code Ratio: 0.57\n");
}

TEST(ReportPrinterTest, EmptySummary) {
    std::ostringstream out;
    printSummary(out, AggregateResult{});
    EXPECT_NE(out.str().find("Total Files Analyzed: 0\n"), std::string::npos);
    EXPECT_NE(out.str().find("Overall Comment-to-Code Ratio: 0.00\n"), std::string::npos);
}
