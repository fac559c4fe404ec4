// ============================================================================
// FatScanner.h - FAT16/FAT32 Volume Sweep
// ============================================================================
// Walks the active directory tree breadth-first from the root and hands
// every deleted entry that passes the filters to the RecoveryEngine.
// ============================================================================

#pragma once

#include "DirectoryParser.h"
#include "RecoveryEngine.h"
#include "RecoveryResult.h"
#include "ScanConfiguration.h"
#include "CancellationToken.h"

#include <deque>
#include <functional>
#include <string>
#include <unordered_set>

namespace FSV {

class FatScanner {
public:
    using ProgressCallback = std::function<void(const std::string&, float)>;
    using EntryCallback = std::function<void(const std::string& path, const DirectoryEntry& entry)>;

    // Throws: OutOfRangeError if config.fatIndex is not a FAT copy of the volume
    FatScanner(const VolumeGeometry& geometry,
               const ImageSource& image,
               const ScanConfiguration& config = ScanConfiguration());
    ~FatScanner();

    // Report every entry of every reachable active directory. The returned
    // report carries directory counts and failures only.
    // Throws: OperationCancelledError
    SweepReport WalkDirectories(const EntryCallback& onEntry,
                                const ProgressCallback& onProgress,
                                const CancellationToken* cancel = nullptr);

    // Recover every deleted entry that passes the folder and filename
    // filters.
    // Throws: OperationCancelledError
    SweepReport ScanVolume(const ProgressCallback& onProgress,
                           const CancellationToken* cancel = nullptr);

    // Case-insensitive substring filters on the directory path and the name
    bool MatchesFilters(const std::string& directoryPath, const DirectoryEntry& entry) const;

    const RecoveryEngine& Engine() const { return m_engine; }

private:
    struct DirectoryWorkItem {
        DirectoryLocation location;
        std::string path;
    };

    void Walk(SweepReport& report,
              const EntryCallback& onEntry,
              const ProgressCallback& onProgress,
              const CancellationToken* cancel);

    void ProcessDirectory(const DirectoryWorkItem& dirItem,
                          std::deque<DirectoryWorkItem>& subDirs,
                          const EntryCallback& onEntry,
                          const CancellationToken* cancel);

    VolumeGeometry m_geometry;
    const ImageSource& m_image;
    ScanConfiguration m_config;
    RecoveryEngine m_engine;
    std::unordered_set<uint32_t> m_visited;
};

} // namespace FSV
