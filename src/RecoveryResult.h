// ============================================================================
// RecoveryResult.h - Data Model for Deleted-File Recovery
// ============================================================================

#pragma once

#include "ClusterRun.h"
#include "DirectoryParser.h"
#include "ForensicsExceptions.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace FSV {

enum class RecoveryConfidence {
    Clean,          // Every cluster of the run is FREE in the FAT
    Overwritten     // At least one cluster has been reallocated since deletion
};

inline const char* RecoveryConfidenceName(RecoveryConfidence confidence) {
    return confidence == RecoveryConfidence::Clean ? "clean" : "overwritten";
}

struct RecoveredFile {
    DirectoryEntry entry;
    std::string path;                   // Path inside the volume, '/' separated

    std::vector<uint8_t> data;          // Truncated to the declared size
    ClusterRun run;                     // Empty for zero-length files
    RecoveryConfidence confidence = RecoveryConfidence::Clean;
    std::vector<uint32_t> overwrittenClusters;

    bool IsDirectory() const { return entry.IsDirectory(); }
    bool IsClean() const { return confidence == RecoveryConfidence::Clean; }
};

struct RecoveryOutcome {
    std::string path;
    bool success = false;
    std::optional<RecoveredFile> file;  // Set when success

    ErrorKind errorKind = ErrorKind::OutOfRange;
    std::string message;                // Set when !success

    static RecoveryOutcome Success(RecoveredFile file) {
        RecoveryOutcome outcome;
        outcome.path = file.path;
        outcome.success = true;
        outcome.file = std::move(file);
        return outcome;
    }

    static RecoveryOutcome Failure(const std::string& path, ErrorKind kind, const std::string& message) {
        RecoveryOutcome outcome;
        outcome.path = path;
        outcome.errorKind = kind;
        outcome.message = message;
        return outcome;
    }
};

// ============================================================================
// SweepReport - aggregate of a whole-volume recovery sweep
// ============================================================================

struct DirectoryFailure {
    std::string path;
    ErrorKind errorKind;
    std::string message;
};

struct SweepReport {
    std::vector<RecoveryOutcome> outcomes;
    std::vector<DirectoryFailure> directoryFailures;

    uint64_t directoriesScanned = 0;
    uint64_t candidatesFound = 0;
    uint64_t recovered = 0;         // Successful and clean
    uint64_t partial = 0;           // Successful but overwritten
    uint64_t failed = 0;
    std::map<ErrorKind, uint64_t> failuresByKind;
    bool directoryLimitReached = false;

    void Add(RecoveryOutcome outcome) {
        if (outcome.success) {
            if (outcome.file->IsClean()) {
                ++recovered;
            } else {
                ++partial;
            }
        } else {
            ++failed;
            ++failuresByKind[outcome.errorKind];
        }
        outcomes.push_back(std::move(outcome));
    }

    uint64_t FailureCount(ErrorKind kind) const {
        auto it = failuresByKind.find(kind);
        return it == failuresByKind.end() ? 0 : it->second;
    }
};

} // namespace FSV
