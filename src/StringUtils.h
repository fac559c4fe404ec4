// ============================================================================
// StringUtils.h - String Utility Functions
// ============================================================================
// Helper functions for string operations and formatting.
// ============================================================================

#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdint>

namespace FSV {
namespace StringUtils {

// Convert string to lowercase for case-insensitive filtering.
inline std::string ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Case-insensitive substring match; an empty needle always matches.
inline bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

// Format byte count into human-readable string.
inline std::string FormatFileSize(uint64_t bytes) {
    char buffer[64];
    if (bytes >= 1000000000) {
        snprintf(buffer, sizeof(buffer), "%.2f GB", bytes / 1000000000.0);
    } else if (bytes >= 1000000) {
        snprintf(buffer, sizeof(buffer), "%.2f MB", bytes / 1000000.0);
    } else if (bytes >= 1000) {
        snprintf(buffer, sizeof(buffer), "%.2f KB", bytes / 1000.0);
    } else {
        snprintf(buffer, sizeof(buffer), "%llu bytes", static_cast<unsigned long long>(bytes));
    }
    return std::string(buffer);
}

// Append one Unicode code point as UTF-8.
inline void AppendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Convert UTF-16 code units (LFN storage) to UTF-8. Unpaired surrogates
// become U+FFFD.
inline std::string Utf16ToUtf8(const std::u16string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        uint32_t unit = in[i];
        if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < in.size() &&
            in[i + 1] >= 0xDC00 && in[i + 1] <= 0xDFFF) {
            uint32_t cp = 0x10000 + ((unit - 0xD800) << 10) + (in[i + 1] - 0xDC00);
            AppendUtf8(out, cp);
            ++i;
        } else if (unit >= 0xD800 && unit <= 0xDFFF) {
            AppendUtf8(out, 0xFFFD);
        } else {
            AppendUtf8(out, unit);
        }
    }
    return out;
}

// Replace characters that cannot appear in a host file name.
inline std::string SanitizeFileName(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || c == '?' || c == ':' || c == '*' ||
            c == '"' || c == '<' || c == '>' || c == '|' || uc < 0x20) {
            result += '_';
        } else {
            result += c;
        }
    }
    while (!result.empty() && result.front() == ' ') result.erase(result.begin());
    while (!result.empty() && result.back() == ' ') result.pop_back();
    if (result.empty() || result == "." || result == "..") {
        result = "_";
    }
    return result;
}

} // namespace StringUtils
} // namespace FSV
