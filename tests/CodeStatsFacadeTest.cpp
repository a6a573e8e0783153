#include "backend/CodeStatsFacade.hpp"
#include "backend/Logger.hpp"

#include "TestFiles.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace backend;

class CodeStatsFacadeTest : public ::testing::Test {
protected:
    std::ostringstream logOutput_;
    std::ostringstream out_;
    Logger logger_{logOutput_, LogLevel::Info};
    CodeStatsFacade facade_{logger_};
    testing_support::ScratchDirectory scratch_;
};

TEST_F(CodeStatsFacadeTest, ClassifyPath) {
    auto file = scratch_.write("x.py", "x\n");
    EXPECT_EQ(classifyPath(file), PathKind::RegularFile);
    EXPECT_EQ(classifyPath(scratch_.root()), PathKind::Directory);
    EXPECT_EQ(classifyPath(scratch_.root() / "absent"), PathKind::Invalid);
}

TEST_F(CodeStatsFacadeTest, SingleFilePrintsOneLine) {
    auto file = scratch_.write("main.cpp", "// header\n#include <x>\nint main() {\n  return 0;\n}\n");

    EXPECT_EQ(facade_.run(file, CodeStatsOptions{}, out_), 0);
    EXPECT_EQ(out_.str(), "File: " + file.string() +
                              ", Comment Lines: 2, Code Lines: 3, Ratio: 0.67\n");
}

TEST_F(CodeStatsFacadeTest, SingleFileIgnoresExcludeList) {
    auto file = scratch_.write("notes.txt", "# a\nb\n");
    CodeStatsOptions options;
    options.excludedExtensions = {".txt"};

    EXPECT_EQ(facade_.run(file, options, out_), 0);
    EXPECT_NE(out_.str().find("Comment Lines: 1, Code Lines: 1, Ratio: 1.00"), std::string::npos);
}

TEST_F(CodeStatsFacadeTest, UnreadableSingleFileFails) {
    auto file = scratch_.write("bad.py", std::string("\xfe\xfe", 2));

    EXPECT_EQ(facade_.run(file, CodeStatsOptions{}, out_), 1);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_NE(logOutput_.str().find("| ERROR | Error reading file"), std::string::npos);
}

TEST_F(CodeStatsFacadeTest, DirectoryPrintsSummary) {
    scratch_.write("a.py", "# 1\n# 2\n# 3\nx\nx\nx\nx\nx\n");
    scratch_.write("sub/b.py", "# 1\nx\nx\n");

    EXPECT_EQ(facade_.run(scratch_.root(), CodeStatsOptions{}, out_), 0);
    EXPECT_EQ(out_.str(),
              "\n--- Summary ---\n"
              "Total Files Analyzed: 2\n"
              "Total Comment Lines: 4\n"
              "Total Code Lines: 7\n"
              "Overall Comment-to-Code Ratio: 0.57\n");
}

TEST_F(CodeStatsFacadeTest, DirectoryWithFailuresStillSucceeds) {
    scratch_.write("ok.py", "x\n");
    scratch_.write("bad.py", std::string("\xfe", 1));

    EXPECT_EQ(facade_.run(scratch_.root(), CodeStatsOptions{}, out_), 0);
    EXPECT_NE(out_.str().find("Total Files Analyzed: 1\n"), std::string::npos);
    EXPECT_NE(logOutput_.str().find("| WARNING |"), std::string::npos);
}

TEST_F(CodeStatsFacadeTest, InvalidPathFails) {
    EXPECT_EQ(facade_.run(scratch_.root() / "missing", CodeStatsOptions{}, out_), 1);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_NE(logOutput_.str().find("| ERROR | Invalid path: "), std::string::npos);
}

TEST_F(CodeStatsFacadeTest, AnalyzeFileReturnsNothingOnError) {
    auto result = facade_.analyzeFile(scratch_.root() / "missing.py");
    EXPECT_FALSE(result.has_value());
    EXPECT_NE(logOutput_.str().find("File not found: "), std::string::npos);
}
