// ============================================================================
// VolumeReader.h - Volume I/O Abstraction
// ============================================================================
// High-level volume I/O with FAT cluster addressing (cluster 2 is the first
// data cluster) and access to the FAT16 fixed root region.
// ============================================================================

#pragma once

#include "ImageSource.h"
#include "VolumeGeometry.h"
#include "ClusterRun.h"
#include "ClusterChain.h"
#include "ForensicsExceptions.h"
#include <vector>

namespace FSV {

class VolumeReader {
public:
    VolumeReader(const ImageSource& image, const VolumeGeometry& geometry);
    ~VolumeReader();

    const VolumeGeometry& Geometry() const { return m_geometry; }
    const ImageSource& Image() const { return m_image; }

    // Throws: ClusterOutOfBoundsError, DiskReadError
    std::vector<uint8_t> ReadClusters(uint64_t firstCluster, uint64_t count) const;

    // Concatenated cluster contents of a traced chain. Reading stops once
    // `limitBytes` have been collected (0 = whole chain).
    std::vector<uint8_t> ReadChain(const ClusterChain& chain, uint64_t limitBytes = 0) const;

    // FAT16 fixed root directory region; empty on FAT32.
    std::vector<uint8_t> ReadRootRegion() const;

    bool ValidateClusterRange(uint64_t firstCluster, uint64_t count) const;

private:
    const ImageSource& m_image;
    VolumeGeometry m_geometry;
};

} // namespace FSV
