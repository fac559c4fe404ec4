// ============================================================================
// ClusterRun.h - Contiguous Cluster Runs
// ============================================================================
// Describes a file's allocation as an ordered list of contiguous runs of
// FAT cluster numbers, each mapped to a byte range of the image.
// ============================================================================

#pragma once

#include <vector>
#include <cstddef>
#include <cstdint>

namespace FSV {

struct VolumeGeometry;

// ============================================================================
// ClusterRun - Single contiguous run of clusters
// ============================================================================

struct ClusterRun {
    uint64_t startCluster;
    uint64_t clusterCount;
    uint64_t fileOffset;

    ClusterRun()
        : startCluster(0)
        , clusterCount(0)
        , fileOffset(0)
    {}

    ClusterRun(uint64_t start, uint64_t count, uint64_t offset = 0)
        : startCluster(start)
        , clusterCount(count)
        , fileOffset(offset)
    {}

    uint64_t EndCluster() const { return startCluster + clusterCount; }
    uint64_t LastCluster() const { return startCluster + clusterCount - 1; }
    uint64_t ByteSize(uint64_t bytesPerCluster) const {
        return clusterCount * bytesPerCluster;
    }
    bool IsValid() const { return clusterCount > 0; }
};

// ============================================================================
// ByteRange - Physical extent of a run inside the image
// ============================================================================

struct ByteRange {
    uint64_t offset;
    uint64_t length;
};

// ============================================================================
// RunList - Ordered runs forming one allocation
// ============================================================================

class RunList {
public:
    RunList()
        : m_bytesPerCluster(0)
    {}

    explicit RunList(uint64_t bytesPerCluster)
        : m_bytesPerCluster(bytesPerCluster)
    {}

    // Construction
    void AddRun(uint64_t startCluster, uint64_t clusterCount);
    void BuildFromClusterList(const std::vector<uint32_t>& clusters);

    // Translation
    std::vector<ByteRange> ToByteRanges(const VolumeGeometry& geometry) const;

    // Accessors
    const std::vector<ClusterRun>& GetRuns() const { return m_runs; }
    size_t RunCount() const { return m_runs.size(); }
    uint64_t TotalClusters() const;
    uint64_t TotalBytes() const { return TotalClusters() * m_bytesPerCluster; }
    uint64_t BytesPerCluster() const { return m_bytesPerCluster; }
    bool IsContiguous() const { return m_runs.size() <= 1; }
    bool IsEmpty() const { return m_runs.empty(); }
    void Clear() { m_runs.clear(); }

private:
    std::vector<ClusterRun> m_runs;
    uint64_t m_bytesPerCluster;
};

} // namespace FSV
