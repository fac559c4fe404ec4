// ============================================================================
// ClusterChain.h - Active Cluster Chain Tracer
// ============================================================================
// Follows FAT links from a start cluster to the end-of-chain marker and
// rejects cycles, out-of-range links and runaway chains.
// ============================================================================

#pragma once

#include "ClusterRun.h"
#include "FatTable.h"
#include "VolumeGeometry.h"
#include "CancellationToken.h"

#include <cstdint>
#include <vector>

namespace FSV {

struct ClusterChain {
    uint32_t startCluster = 0;
    std::vector<uint32_t> clusters;     // In chain order
    RunList runs;                       // Coalesced contiguous runs
    std::vector<ByteRange> byteRanges;  // Physical extents, one per run

    size_t Length() const { return clusters.size(); }
    bool IsEmpty() const { return clusters.empty(); }
    uint64_t TotalBytes() const { return runs.TotalBytes(); }
};

// Throws: CorruptChainError, OutOfRangeError, DiskReadError, OperationCancelledError
ClusterChain TraceActiveChain(const VolumeGeometry& geometry,
                              const FatTable& fat,
                              uint32_t startCluster,
                              const CancellationToken* cancel = nullptr);

// Opens FAT copy `fatIndex` of `image` and traces through it.
ClusterChain TraceActiveChain(const VolumeGeometry& geometry,
                              const ImageSource& image,
                              uint32_t startCluster,
                              uint32_t fatIndex = 0,
                              const CancellationToken* cancel = nullptr);

} // namespace FSV
