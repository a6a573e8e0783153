// File: LineClassifier.cpp
// Description: Implements the comment/code line scanner and the UTF-8 source
//              reader used for every analyzed file.

#include "backend/LineClassifier.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace backend {

namespace {

bool startsWith(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isValidUtf8(const std::string& bytes) {
    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        std::size_t continuation = 0;
        unsigned int codePoint = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            continuation = 1;
            codePoint = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            continuation = 2;
            codePoint = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            continuation = 3;
            codePoint = lead & 0x07;
        } else {
            return false;
        }
        if (i + continuation >= bytes.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= continuation; ++k) {
            const auto next = static_cast<unsigned char>(bytes[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            codePoint = (codePoint << 6) | (next & 0x3F);
        }
        // Overlong forms, surrogates and values past U+10FFFF.
        if ((continuation == 1 && codePoint < 0x80) ||
            (continuation == 2 && codePoint < 0x800) ||
            (continuation == 3 && codePoint < 0x10000) ||
            (codePoint >= 0xD800 && codePoint <= 0xDFFF) || codePoint > 0x10FFFF) {
            return false;
        }
        i += continuation + 1;
    }
    return true;
}

// Decodes one code point starting at pos and ending at or before limit.
// Returns its byte length, or 0 for a malformed or truncated sequence.
std::size_t decodeUtf8At(std::string_view text, std::size_t pos, std::size_t limit,
                         unsigned int& codePoint) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t length = 0;
    if (lead < 0x80) {
        codePoint = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        codePoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        codePoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        codePoint = lead & 0x07;
    } else {
        return 0;
    }
    if (pos + length > limit) {
        return 0;
    }
    for (std::size_t k = 1; k < length; ++k) {
        const auto next = static_cast<unsigned char>(text[pos + k]);
        if ((next & 0xC0) != 0x80) {
            return 0;
        }
        codePoint = (codePoint << 6) | (next & 0x3F);
    }
    return length;
}

std::size_t whitespaceLengthAt(std::string_view text, std::size_t pos, std::size_t limit) {
    unsigned int codePoint = 0;
    const std::size_t length = decodeUtf8At(text, pos, limit, codePoint);
    return length != 0 && isUnicodeWhitespace(codePoint) ? length : 0;
}

std::size_t whitespaceLengthBefore(std::string_view text, std::size_t floor, std::size_t end) {
    std::size_t pos = end - 1;
    while (pos > floor && end - pos < 4 &&
           (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) {
        --pos;
    }
    unsigned int codePoint = 0;
    const std::size_t length = decodeUtf8At(text, pos, end, codePoint);
    if (length != end - pos || !isUnicodeWhitespace(codePoint)) {
        return 0;
    }
    return length;
}

std::vector<std::string> splitUniversalNewlines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (ch == '\n' || ch == '\r') {
            if (ch == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            lines.push_back(std::move(current));
            current.clear();
            continue;
        }
        current += ch;
    }
    if (!current.empty()) {
        lines.push_back(std::move(current));
    }
    return lines;
}

ReadError makeOpenError(const std::filesystem::path& filePath, int err) {
    ReadError error;
    if (err == ENOENT || err == ENOTDIR) {
        error.kind = ReadErrorKind::NotFound;
        error.message = "File not found: " + filePath.string();
    } else if (err == EACCES || err == EPERM) {
        error.kind = ReadErrorKind::PermissionDenied;
        error.message = "Permission denied: " + filePath.string();
    } else {
        error.kind = ReadErrorKind::IoError;
        error.message = "Error reading file " + filePath.string() + ": " +
                        (err != 0 ? std::strerror(err) : "unable to open");
    }
    return error;
}

}  // namespace

const char* toString(ReadErrorKind kind) {
    switch (kind) {
        case ReadErrorKind::NotFound:
            return "NotFound";
        case ReadErrorKind::PermissionDenied:
            return "PermissionDenied";
        case ReadErrorKind::IoError:
            return "IOError";
    }
    return "IOError";
}

double computeRatio(std::size_t commentLines, std::size_t codeLines) {
    if (codeLines == 0) {
        return 0.0;
    }
    return static_cast<double>(commentLines) / static_cast<double>(codeLines);
}

bool isUnicodeWhitespace(unsigned int codePoint) {
    switch (codePoint) {
        case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D:
        case 0x1C: case 0x1D: case 0x1E: case 0x1F: case 0x20:
        case 0x85: case 0xA0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return codePoint >= 0x2000 && codePoint <= 0x200A;
    }
}

std::string_view trimWhitespace(std::string_view text) {
    std::size_t start = 0;
    std::size_t end = text.size();
    while (start < end) {
        const std::size_t length = whitespaceLengthAt(text, start, end);
        if (length == 0) {
            break;
        }
        start += length;
    }
    while (end > start) {
        const std::size_t length = whitespaceLengthBefore(text, start, end);
        if (length == 0) {
            break;
        }
        end -= length;
    }
    return text.substr(start, end - start);
}

LineKind classifyLine(std::string_view line, ScanState& state) {
    const std::string_view trimmed = trimWhitespace(line);
    if (trimmed.empty()) {
        return LineKind::Blank;
    }

    if (startsWith(trimmed, "'''") || startsWith(trimmed, "\"\"\"")) {
        state.inMultilineComment = !state.inMultilineComment;
        return LineKind::Comment;
    }
    if (state.inMultilineComment) {
        return LineKind::Comment;
    }

    if (startsWith(trimmed, "#") || startsWith(trimmed, "//")) {
        return LineKind::Comment;
    }
    if (startsWith(trimmed, "/*")) {
        state.inMultilineComment = true;
        return LineKind::Comment;
    }
    if (endsWith(trimmed, "*/") && state.inMultilineComment) {
        state.inMultilineComment = false;
        return LineKind::Comment;
    }
    return LineKind::Code;
}

ClassificationResult classifyLines(const std::vector<std::string>& lines) {
    ClassificationResult result;
    ScanState state;
    for (const std::string& line : lines) {
        switch (classifyLine(line, state)) {
            case LineKind::Blank:
                result.blankLines += 1;
                break;
            case LineKind::Comment:
                result.commentLines += 1;
                break;
            case LineKind::Code:
                result.codeLines += 1;
                break;
        }
    }
    result.ratio = computeRatio(result.commentLines, result.codeLines);
    return result;
}

bool readSourceLines(const std::filesystem::path& filePath,
                     std::vector<std::string>& lines,
                     ReadError& error) {
    std::error_code ec;
    if (std::filesystem::is_directory(filePath, ec)) {
        error.kind = ReadErrorKind::IoError;
        error.message = "Error reading file " + filePath.string() + ": " +
                        std::strerror(EISDIR);
        return false;
    }

    errno = 0;
    std::ifstream stream(filePath, std::ios::in | std::ios::binary);
    if (!stream.is_open()) {
        int err = errno;
        if (err == 0 && !std::filesystem::exists(filePath, ec)) {
            err = ENOENT;
        }
        error = makeOpenError(filePath, err);
        return false;
    }

    const std::string contents{std::istreambuf_iterator<char>(stream),
                               std::istreambuf_iterator<char>()};
    if (stream.bad()) {
        error.kind = ReadErrorKind::IoError;
        error.message = "Error reading file " + filePath.string() + ": read failed";
        return false;
    }
    if (!isValidUtf8(contents)) {
        error.kind = ReadErrorKind::IoError;
        error.message = "Error reading file " + filePath.string() + ": invalid UTF-8";
        return false;
    }

    lines = splitUniversalNewlines(contents);
    return true;
}

std::optional<ClassificationResult> classifyFile(const std::filesystem::path& filePath,
                                                 ReadError& error) {
    std::vector<std::string> lines;
    if (!readSourceLines(filePath, lines, error)) {
        return std::nullopt;
    }
    return classifyLines(lines);
}

}  // namespace backend
