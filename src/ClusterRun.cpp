// ============================================================================
// ClusterRun.cpp - Contiguous Cluster Runs Implementation
// ============================================================================

#include "ClusterRun.h"
#include "VolumeGeometry.h"

namespace FSV {

// Add a new run at the end of the list, merging with the previous run when
// the clusters continue it
void RunList::AddRun(uint64_t startCluster, uint64_t clusterCount) {
    if (clusterCount == 0) return;

    if (!m_runs.empty() && m_runs.back().EndCluster() == startCluster) {
        m_runs.back().clusterCount += clusterCount;
        return;
    }

    uint64_t fileOffset = TotalClusters() * m_bytesPerCluster;
    m_runs.emplace_back(startCluster, clusterCount, fileOffset);
}

// Build from an ordered cluster list (coalesces consecutive clusters)
void RunList::BuildFromClusterList(const std::vector<uint32_t>& clusters) {
    m_runs.clear();
    for (uint32_t cluster : clusters) {
        AddRun(cluster, 1);
    }
}

std::vector<ByteRange> RunList::ToByteRanges(const VolumeGeometry& geometry) const {
    std::vector<ByteRange> ranges;
    ranges.reserve(m_runs.size());
    for (const auto& run : m_runs) {
        ranges.push_back({ geometry.ClusterToByteOffset(run.startCluster),
                           run.ByteSize(geometry.bytesPerCluster) });
    }
    return ranges;
}

uint64_t RunList::TotalClusters() const {
    uint64_t total = 0;
    for (const auto& run : m_runs) {
        total += run.clusterCount;
    }
    return total;
}

} // namespace FSV
