// ============================================================================
// VolumeGeometry.cpp - Boot Sector Parsing and Geometry Resolution
// ============================================================================

#include "VolumeGeometry.h"
#include "Constants.h"
#include "ForensicsExceptions.h"

#include <climits>
#include <cstring>
#include <string>

namespace FSV {

namespace {

bool IsPowerOfTwo(uint32_t value) {
    return value != 0 && (value & (value - 1)) == 0;
}

// FAT12 is identified by cluster count alone
constexpr uint64_t FAT12_CLUSTER_LIMIT = 4085;

} // namespace

const char* FilesystemTypeName(FilesystemType type) {
    switch (type) {
        case FilesystemType::FAT16: return "FAT16";
        case FilesystemType::FAT32: return "FAT32";
        default: return "Unknown";
    }
}

uint64_t VolumeGeometry::ClusterToByteOffset(uint64_t cluster) const {
    if (cluster < Constants::FIRST_DATA_CLUSTER) {
        throw ClusterOutOfBoundsError(cluster, MaxCluster());
    }
    return dataRegionOffset + (cluster - Constants::FIRST_DATA_CLUSTER) * bytesPerCluster;
}

VolumeGeometry ParseBootSector(const uint8_t* data, size_t size, uint64_t volumeStartOffset) {
    if (data == nullptr || size < sizeof(FATBootSector)) {
        throw MalformedBootSectorError("boot sector shorter than 512 bytes");
    }

    FATBootSector boot = {};
    std::memcpy(&boot, data, sizeof(FATBootSector));
    const FATBiosParameterBlock& bpb = boot.bpb;

    // ========================================================================
    // Signatures
    // ========================================================================

    bool shortJump = bpb.jumpBoot[0] == Constants::Boot::JUMP_SHORT &&
                     bpb.jumpBoot[2] == Constants::Boot::NOP;
    bool nearJump = bpb.jumpBoot[0] == Constants::Boot::JUMP_NEAR;
    if (!shortJump && !nearJump) {
        throw MalformedBootSectorError("missing jump boot instruction");
    }

    if (boot.signature != Constants::Boot::SIGNATURE) {
        throw MalformedBootSectorError("missing 0x55AA signature");
    }

    // ========================================================================
    // Plausibility of the BPB fields
    // ========================================================================

    switch (bpb.bytesPerSector) {
        case 512: case 1024: case 2048: case 4096:
            break;
        default:
            throw MalformedBootSectorError("bytes per sector " +
                                           std::to_string(bpb.bytesPerSector) +
                                           " is not 512, 1024, 2048 or 4096");
    }

    if (!IsPowerOfTwo(bpb.sectorsPerCluster)) {
        throw MalformedBootSectorError("sectors per cluster " +
                                       std::to_string(bpb.sectorsPerCluster) +
                                       " is not a power of two");
    }

    if (bpb.numberOfFATs < 1) {
        throw MalformedBootSectorError("FAT count is zero");
    }

    if (bpb.reservedSectors < 1) {
        throw MalformedBootSectorError("reserved sector count is zero");
    }

    VolumeGeometry geom;
    geom.bytesPerSector = bpb.bytesPerSector;
    geom.sectorsPerCluster = bpb.sectorsPerCluster;
    geom.reservedSectors = bpb.reservedSectors;
    geom.fatCount = bpb.numberOfFATs;
    geom.rootEntryCount = bpb.rootEntryCount;
    geom.mediaDescriptor = bpb.media;
    geom.totalSectors = bpb.totalSectors16 != 0 ? bpb.totalSectors16 : bpb.totalSectors32;
    geom.volumeStartOffset = volumeStartOffset;
    geom.bytesPerCluster = static_cast<uint64_t>(geom.bytesPerSector) * geom.sectorsPerCluster;

    if (bpb.rootEntryCount == 0 && bpb.fatSize16 == 0) {
        geom.fsType = FilesystemType::FAT32;
        geom.clusterWidth = 32;
        geom.fatSizeSectors = boot.ext.fat32.fatSize32;
        geom.rootCluster = boot.ext.fat32.rootCluster;
        geom.rootDirSectors = 0;
    } else {
        geom.fsType = FilesystemType::FAT16;
        geom.clusterWidth = 16;
        geom.fatSizeSectors = bpb.fatSize16;
        geom.rootCluster = 0;
        if (bpb.rootEntryCount == 0) {
            throw MalformedBootSectorError("FAT16 root entry count is zero");
        }
        uint64_t rootBytes = static_cast<uint64_t>(bpb.rootEntryCount) * Constants::Dir::ENTRY_SIZE;
        geom.rootDirSectors = static_cast<uint32_t>(
            (rootBytes + geom.bytesPerSector - 1) / geom.bytesPerSector);
    }

    if (geom.fatSizeSectors == 0) {
        throw MalformedBootSectorError("FAT size is zero");
    }

    if (geom.totalSectors == 0) {
        throw MalformedBootSectorError("total sector count is zero");
    }

    // ========================================================================
    // Region layout
    // ========================================================================

    uint64_t metadataSectors = static_cast<uint64_t>(geom.reservedSectors) +
                               static_cast<uint64_t>(geom.fatCount) * geom.fatSizeSectors +
                               geom.rootDirSectors;
    if (metadataSectors >= geom.totalSectors) {
        throw MalformedBootSectorError("data region starts beyond the end of the volume");
    }

    geom.totalClusters = (geom.totalSectors - metadataSectors) / geom.sectorsPerCluster;
    if (geom.totalClusters == 0) {
        throw MalformedBootSectorError("volume has no data clusters");
    }

    if (geom.fsType == FilesystemType::FAT16) {
        if (geom.totalClusters < FAT12_CLUSTER_LIMIT) {
            throw MalformedBootSectorError("FAT12 volumes are not supported");
        }
        // 16-bit entries cannot address more clusters than this
        if (geom.MaxCluster() >= Constants::FAT16::RESERVED_RANGE_START) {
            throw MalformedBootSectorError("cluster count exceeds FAT16 range");
        }
    } else if (geom.MaxCluster() >= Constants::FAT32::RESERVED_RANGE_START) {
        throw MalformedBootSectorError("cluster count exceeds FAT32 range");
    }

    uint64_t addressableEntries = geom.FatSizeBytes() / geom.EntryWidthBytes();
    if (addressableEntries < geom.MaxCluster() + 1) {
        throw MalformedBootSectorError("FAT is too small to map every data cluster");
    }

    if (geom.fsType == FilesystemType::FAT32 && !geom.IsValidCluster(geom.rootCluster)) {
        throw MalformedBootSectorError("root cluster " + std::to_string(geom.rootCluster) +
                                       " is outside the data region");
    }

    geom.fatStartOffset = volumeStartOffset +
                          static_cast<uint64_t>(geom.reservedSectors) * geom.bytesPerSector;
    geom.rootDirOffset = geom.fatStartOffset +
                         static_cast<uint64_t>(geom.fatCount) * geom.FatSizeBytes();
    geom.dataRegionOffset = geom.rootDirOffset + geom.RootDirBytes();

    return geom;
}

VolumeGeometry ResolveGeometry(const ImageSource& image, uint64_t volumeStartOffset) {
    std::vector<uint8_t> sector;
    try {
        sector = image.ReadAt(volumeStartOffset, Constants::Boot::SECTOR_SIZE);
    } catch (const DiskReadError& e) {
        throw MalformedBootSectorError(std::string("boot sector unreadable: ") + e.what());
    }
    return ParseBootSector(sector.data(), sector.size(), volumeStartOffset);
}

} // namespace FSV
