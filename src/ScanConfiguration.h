// ============================================================================
// ScanConfiguration.h - Centralized User-Tunable Scan Settings
// ============================================================================
// Runtime configuration for sweep and recovery operations. Separates
// user-tunable settings from hard safety limits (see SafetyLimits.h).
// Passed explicitly to every component that needs it.
// ============================================================================

#pragma once

#include "Constants.h"

#include <cstdint>
#include <string>

namespace FSV {

struct ScanConfiguration {
    // ========================================================================
    // Deleted Directory Recovery
    // ========================================================================
    uint32_t recursionDepthLimit = 16;           // Nesting of deleted directories
    uint32_t deletedDirectoryClusters = 1;       // Span of a deleted directory whose size is 0
    bool recoverDeletedDirectories = true;

    // ========================================================================
    // Directory Sweep Limits
    // ========================================================================
    uint64_t maxDirectories = 100000;            // Active directories visited per sweep
    uint64_t directoryReadLimit = 4 * Constants::MEGABYTE;

    // ========================================================================
    // FAT Selection
    // ========================================================================
    uint32_t fatIndex = 0;                       // 0 = primary copy

    // ========================================================================
    // Filters (case-insensitive substrings, empty = everything)
    // ========================================================================
    std::string folderFilter;
    std::string filenameFilter;

    // ========================================================================
    // Streaming and Progress
    // ========================================================================
    uint64_t streamChunkSize = Constants::MEGABYTE;
    uint64_t progressDirectoryInterval = 10;

    // Apply one `key = value` setting.
    // Throws: std::invalid_argument on unknown key or malformed value
    void Set(const std::string& key, const std::string& value);

    // Read settings from a `key = value` file; '#' starts a comment.
    // A missing file yields the defaults.
    // Throws: std::invalid_argument, std::runtime_error on read failure
    static ScanConfiguration Load(const std::string& path);
    bool Save(const std::string& path) const;
};

} // namespace FSV
