// ============================================================================
// ClusterChain.cpp - Active Cluster Chain Tracer Implementation
// ============================================================================

#include "ClusterChain.h"
#include "ForensicsExceptions.h"

#include <unordered_set>

namespace FSV {

ClusterChain TraceActiveChain(const VolumeGeometry& geometry,
                              const FatTable& fat,
                              uint32_t startCluster,
                              const CancellationToken* cancel)
{
    ClusterChain chain;
    chain.startCluster = startCluster;

    std::unordered_set<uint32_t> visited;
    uint64_t maxLength = geometry.totalClusters;
    uint32_t current = startCluster;

    while (true) {
        CheckCancelled(cancel);

        if (!geometry.IsValidCluster(current)) {
            throw CorruptChainError(startCluster, current, "cluster outside the data region");
        }
        if (!visited.insert(current).second) {
            throw CorruptChainError(startCluster, current, "cycle detected");
        }
        if (chain.clusters.size() >= maxLength) {
            throw CorruptChainError(startCluster, current, "chain longer than the volume");
        }

        chain.clusters.push_back(current);

        FatValue value = fat.ReadEntry(current);
        if (value.IsEndOfChain()) {
            break;
        }
        if (!value.IsNext()) {
            throw CorruptChainError(startCluster, current,
                                    std::string("link is ") + FatEntryKindName(value.kind) +
                                    " before end of chain");
        }
        current = value.next;
    }

    chain.runs = RunList(geometry.bytesPerCluster);
    chain.runs.BuildFromClusterList(chain.clusters);
    chain.byteRanges = chain.runs.ToByteRanges(geometry);
    return chain;
}

ClusterChain TraceActiveChain(const VolumeGeometry& geometry,
                              const ImageSource& image,
                              uint32_t startCluster,
                              uint32_t fatIndex,
                              const CancellationToken* cancel)
{
    auto fat = FatTable::Open(geometry, image, fatIndex);
    return TraceActiveChain(geometry, *fat, startCluster, cancel);
}

} // namespace FSV
