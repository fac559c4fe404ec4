// ============================================================================
// VolumeReader.cpp - Volume I/O Abstraction Implementation
// ============================================================================

#include "VolumeReader.h"
#include "SafetyLimits.h"

#include <climits>
#include <stdexcept>
#include <algorithm>

namespace FSV {

VolumeReader::VolumeReader(const ImageSource& image, const VolumeGeometry& geometry)
    : m_image(image)
    , m_geometry(geometry)
{
}

VolumeReader::~VolumeReader() = default;

std::vector<uint8_t> VolumeReader::ReadClusters(uint64_t firstCluster, uint64_t count) const {
    if (count == 0) {
        return {};
    }

    // Validate bounds
    if (!m_geometry.IsValidCluster(firstCluster)) {
        throw ClusterOutOfBoundsError(firstCluster, m_geometry.MaxCluster());
    }

    if (count > m_geometry.MaxCluster() || !m_geometry.IsValidCluster(firstCluster + count - 1)) {
        throw ClusterOutOfBoundsError(firstCluster + count - 1, m_geometry.MaxCluster());
    }

    // Overflow check
    if (count > UINT64_MAX / m_geometry.bytesPerCluster) {
        throw std::overflow_error("Cluster count too large");
    }
    uint64_t bytesToRead = count * m_geometry.bytesPerCluster;

    return m_image.ReadAt(m_geometry.ClusterToByteOffset(firstCluster), bytesToRead);
}

std::vector<uint8_t> VolumeReader::ReadChain(const ClusterChain& chain, uint64_t limitBytes) const {
    std::vector<uint8_t> buffer;

    for (const auto& run : chain.runs.GetRuns()) {
        uint64_t count = run.clusterCount;
        if (limitBytes > 0) {
            uint64_t remaining = limitBytes - buffer.size();
            uint64_t needed = (remaining + m_geometry.bytesPerCluster - 1) / m_geometry.bytesPerCluster;
            count = std::min(count, needed);
        }

        auto data = ReadClusters(run.startCluster, count);
        buffer.insert(buffer.end(), data.begin(), data.end());

        if (limitBytes > 0 && buffer.size() >= limitBytes) {
            buffer.resize(static_cast<size_t>(limitBytes));
            break;
        }
    }

    return buffer;
}

std::vector<uint8_t> VolumeReader::ReadRootRegion() const {
    if (!m_geometry.HasFixedRootRegion()) {
        return {};
    }
    return m_image.ReadAt(m_geometry.rootDirOffset, m_geometry.RootDirBytes());
}

bool VolumeReader::ValidateClusterRange(uint64_t firstCluster, uint64_t count) const {
    if (count == 0) {
        return true;
    }

    if (!m_geometry.IsValidCluster(firstCluster) ||
        !m_geometry.IsValidCluster(firstCluster + count - 1)) {
        return false;
    }

    uint64_t end = m_geometry.ClusterToByteOffset(firstCluster + count - 1) + m_geometry.bytesPerCluster;
    return end <= m_image.Size();
}

} // namespace FSV
