// ============================================================================
// RecoveryEngine.h - Deleted-File Recovery Engine
// ============================================================================
// Reconstructs the data of deleted entries. Deletion frees the FAT chain, so
// the only surviving allocation facts are the start cluster and the size;
// the file is assumed to occupy one contiguous run from its start cluster.
// The current FAT is consulted for each cluster of that run to tell whether
// the run has been reused since deletion.
// ============================================================================

#pragma once

#include "RecoveryResult.h"
#include "DirectoryParser.h"
#include "FatTable.h"
#include "VolumeGeometry.h"
#include "ScanConfiguration.h"
#include "CancellationToken.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace FSV {

class RecoveryEngine {
public:
    using ChunkSink = std::function<void(const uint8_t* data, size_t length)>;

    // Throws: OutOfRangeError if config.fatIndex is not a FAT copy of the volume
    RecoveryEngine(const VolumeGeometry& geometry,
                   const ImageSource& image,
                   const ScanConfiguration& config = ScanConfiguration());
    ~RecoveryEngine();

    RecoveryEngine(const RecoveryEngine&) = delete;
    RecoveryEngine& operator=(const RecoveryEngine&) = delete;

    // Recover one deleted entry's run. A zero-length file yields an empty
    // result without consulting the FAT.
    // Throws: InvalidStartClusterError, OutOfRangeError, DiskReadError,
    //         OperationCancelledError
    RecoveredFile RecoverDeletedFile(const DirectoryEntry& entry,
                                     const std::string& path = std::string(),
                                     const CancellationToken* cancel = nullptr) const;

    // Recover an entry and, for a deleted directory, every deleted entry
    // nested beneath it. Failures are reported per entry; a branch deeper
    // than `depthLimit` fails with RecursionLimitExceeded while its siblings
    // are still processed.
    // Throws: OperationCancelledError
    std::vector<RecoveryOutcome> RecoverDeleted(const DirectoryEntry& entry,
                                                uint32_t depthLimit,
                                                const std::string& path = std::string(),
                                                const CancellationToken* cancel = nullptr) const;

    // Deliver the bytes RecoverDeletedFile would return in chunks of
    // `chunkSize` (0 = configured size). The returned file has no data.
    // Throws: as RecoverDeletedFile
    RecoveredFile StreamDeletedFile(const DirectoryEntry& entry,
                                    uint64_t chunkSize,
                                    const ChunkSink& sink,
                                    const std::string& path = std::string(),
                                    const CancellationToken* cancel = nullptr) const;

    // Run a deleted entry is assumed to occupy.
    // Throws: InvalidStartClusterError
    ClusterRun PlanRun(const DirectoryEntry& entry) const;

    uint64_t ClusterCountFor(const DirectoryEntry& entry) const;

    const VolumeGeometry& Geometry() const { return m_geometry; }
    const ScanConfiguration& Config() const { return m_config; }

private:
    struct WorkItem {
        DirectoryEntry entry;
        std::string path;
        uint32_t depth;
        std::vector<uint32_t> ancestors;    // Start clusters of enclosing deleted directories
    };

    RecoveredFile Recover(const DirectoryEntry& entry,
                          const std::string& path,
                          uint64_t chunkSize,
                          const ChunkSink& sink,
                          const CancellationToken* cancel) const;

    void InspectRun(const ClusterRun& run, RecoveredFile& result, const CancellationToken* cancel) const;

    void StreamRun(const ClusterRun& run, uint64_t byteCount, uint64_t chunkSize,
                   const ChunkSink& sink, const CancellationToken* cancel) const;

    VolumeGeometry m_geometry;
    const ImageSource& m_image;
    ScanConfiguration m_config;
    std::unique_ptr<FatTable> m_fat;
};

} // namespace FSV
