// File: LineClassifier.hpp
// Description: Declares the heuristic line scanner that classifies source
//              lines as comment, code or blank, and the file reader feeding it.

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace backend {

enum class LineKind { Blank, Comment, Code };

struct ClassificationResult {
    std::size_t commentLines{0};
    std::size_t codeLines{0};
    std::size_t blankLines{0};
    double ratio{0.0};
};

// Per-file scanner state. Starts cleared for every file and is never shared.
struct ScanState {
    bool inMultilineComment{false};
};

enum class ReadErrorKind { NotFound, PermissionDenied, IoError };

struct ReadError {
    ReadErrorKind kind{ReadErrorKind::IoError};
    std::string message;
};

const char* toString(ReadErrorKind kind);

// Comment lines per code line; 0.0 when there is no code at all.
double computeRatio(std::size_t commentLines, std::size_t codeLines);

// Whitespace as Python's str.strip() sees it: ASCII blanks, the \x1c-\x1f
// separators, NEL, NBSP and the Unicode space and line/paragraph separators.
bool isUnicodeWhitespace(unsigned int codePoint);

// Strips leading and trailing whitespace code points from UTF-8 text. Bytes
// that do not decode are kept.
std::string_view trimWhitespace(std::string_view text);

// Classifies one line and advances state. Rules are applied in order:
//   1. empty after trimming                      -> Blank
//   2. starts with """ or '''                    -> Comment, toggles the flag
//   3. flag set                                  -> Comment
//   4. starts with # or //                       -> Comment
//   5. starts with /*                            -> Comment, sets the flag
//   6. ends with */ while the flag is set        -> Comment, clears the flag
//   7. anything else                             -> Code
// A same-line "/* ... */" leaves the flag set; only a triple-quote line clears
// it afterwards.
LineKind classifyLine(std::string_view line, ScanState& state);

ClassificationResult classifyLines(const std::vector<std::string>& lines);

// Reads filePath as UTF-8 text split on \n, \r\n or \r. Returns false and
// fills error when the file cannot be opened, read or decoded.
bool readSourceLines(const std::filesystem::path& filePath,
                     std::vector<std::string>& lines,
                     ReadError& error);

// Empty optional means the file could not be read; error says why.
std::optional<ClassificationResult> classifyFile(const std::filesystem::path& filePath,
                                                 ReadError& error);

}  // namespace backend
