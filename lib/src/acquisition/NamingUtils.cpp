#include "NamingUtils.h"
#include <cstdio>
#include <regex>

namespace podsync {

static std::string Trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

static constexpr size_t kMaxFilenameChars = 100;

static bool IsContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Names are UTF-8; limits apply to characters, not bytes
static size_t CountCodePoints(const std::string& s) {
    size_t count = 0;
    for (char c : s) {
        if (!IsContinuationByte(c)) count++;
    }
    return count;
}

// Byte offset where code point `n` starts (s.size() if there are fewer)
static size_t CodePointOffset(const std::string& s, size_t n) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (!IsContinuationByte(s[i])) {
            if (seen == n) return i;
            seen++;
        }
    }
    return s.size();
}

std::pair<std::string, std::string> SplitArtistTitle(const std::string& display_title) {
    static const std::regex kPatterns[] = {
        std::regex(R"(^(.*?)\s*-\s*(.*?)$)"),
        std::regex(R"(^(.*?)\s*:\s*(.*?)$)"),
        std::regex(R"(^(.*?)\s*\|\s*(.*?)$)")
    };

    for (const auto& pattern : kPatterns) {
        std::smatch match;
        if (std::regex_match(display_title, match, pattern)) {
            return {Trim(match[1].str()), Trim(match[2].str())};
        }
    }
    return {"", Trim(display_title)};
}

std::string SanitizeFilename(const std::string& name) {
    std::string result = Trim(name);
    for (char& c : result) {
        switch (c) {
            case '<': case '>': case ':': case '"':
            case '/': case '\\': case '|': case '?': case '*':
                c = '_';
                break;
            default:
                break;
        }
    }

    if (CountCodePoints(result) > kMaxFilenameChars) {
        result = result.substr(0, CodePointOffset(result, kMaxFilenameChars - 3)) + "...";
    }
    return result;
}

bool IsCollectionReference(const std::string& reference) {
    return !ExtractCollectionId(reference).empty();
}

std::string ExtractCollectionId(const std::string& reference) {
    static const std::regex kListParam(R"(list=([a-zA-Z0-9_-]+))");
    std::smatch match;
    if (std::regex_search(reference, match, kListParam)) {
        return match[1].str();
    }
    return "";
}

std::string FormatOrdinal(int ordinal) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d", ordinal);
    return buffer;
}

} // namespace podsync
