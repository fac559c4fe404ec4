// ============================================================================
// VolumeGeometry.h - FAT Volume Geometry and Addressing
// ============================================================================
// Encapsulates the BIOS Parameter Block layout and the geometry derived
// from it. Provides cluster to physical offset translation.
// ============================================================================

#pragma once

#include "ImageSource.h"

#include <cstdint>
#include <cstddef>
#include <string>

namespace FSV {

// ============================================================================
// FilesystemType - SINGLE DEFINITION (used project-wide)
// ============================================================================
enum class FilesystemType {
    FAT16,
    FAT32,
    Unknown
};

const char* FilesystemTypeName(FilesystemType type);

#pragma pack(push, 1)
struct FATBiosParameterBlock {
    uint8_t jumpBoot[3];
    char oemName[8];
    uint16_t bytesPerSector;
    uint8_t sectorsPerCluster;
    uint16_t reservedSectors;
    uint8_t numberOfFATs;
    uint16_t rootEntryCount;
    uint16_t totalSectors16;
    uint8_t media;
    uint16_t fatSize16;
    uint16_t sectorsPerTrack;
    uint16_t numberOfHeads;
    uint32_t hiddenSectors;
    uint32_t totalSectors32;
};

struct FAT16ExtendedBPB {
    uint8_t driveNumber;
    uint8_t reserved1;
    uint8_t bootSignature;
    uint32_t volumeID;
    char volumeLabel[11];
    char fsType[8];
};

struct FAT32ExtendedBPB {
    uint32_t fatSize32;
    uint16_t extFlags;
    uint16_t fsVersion;
    uint32_t rootCluster;
    uint16_t fsInfo;
    uint16_t backupBootSector;
    uint8_t reserved[12];
    uint8_t driveNumber;
    uint8_t reserved1;
    uint8_t bootSignature;
    uint32_t volumeID;
    char volumeLabel[11];
    char fsType[8];
};

struct FATBootSector {
    FATBiosParameterBlock bpb;
    union {
        FAT16ExtendedBPB fat16;
        FAT32ExtendedBPB fat32;
    } ext;
    uint8_t bootCode[420];
    uint16_t signature;
};
#pragma pack(pop)

static_assert(sizeof(FATBiosParameterBlock) == 36, "BPB layout");
static_assert(sizeof(FATBootSector) == 512, "Boot sector layout");

// ============================================================================
// VolumeGeometry - Immutable layout of one FAT volume
// ============================================================================
// All *Offset fields are absolute byte offsets into the image.
struct VolumeGeometry {
    FilesystemType fsType = FilesystemType::Unknown;
    uint32_t clusterWidth = 0;          // FAT entry width in bits (16 or 32)

    uint32_t bytesPerSector = 0;
    uint32_t sectorsPerCluster = 0;
    uint32_t reservedSectors = 0;
    uint32_t fatCount = 0;
    uint32_t fatSizeSectors = 0;
    uint32_t rootEntryCount = 0;        // FAT16 fixed root region entries
    uint32_t rootDirSectors = 0;        // 0 on FAT32
    uint32_t rootCluster = 0;           // FAT32 only
    uint64_t totalSectors = 0;
    uint8_t mediaDescriptor = 0;

    uint64_t volumeStartOffset = 0;
    uint64_t fatStartOffset = 0;
    uint64_t rootDirOffset = 0;
    uint64_t dataRegionOffset = 0;
    uint64_t bytesPerCluster = 0;
    uint64_t totalClusters = 0;         // Number of data clusters

    uint64_t FatSizeBytes() const {
        return static_cast<uint64_t>(fatSizeSectors) * bytesPerSector;
    }

    uint64_t RootDirBytes() const {
        return static_cast<uint64_t>(rootDirSectors) * bytesPerSector;
    }

    uint32_t EntryWidthBytes() const { return clusterWidth / 8; }

    // Highest cluster number that maps into the data region
    uint64_t MaxCluster() const { return totalClusters + 1; }

    bool IsValidCluster(uint64_t cluster) const {
        return cluster >= 2 && cluster <= MaxCluster();
    }

    bool HasFixedRootRegion() const { return fsType == FilesystemType::FAT16; }

    // Throws: ClusterOutOfBoundsError for clusters 0 and 1
    uint64_t ClusterToByteOffset(uint64_t cluster) const;

    // Absolute offset of `cluster`'s entry inside FAT copy `fatIndex`
    uint64_t FatEntryOffset(uint32_t fatIndex, uint64_t cluster) const {
        return fatStartOffset + static_cast<uint64_t>(fatIndex) * FatSizeBytes() +
               cluster * EntryWidthBytes();
    }
};

// Parse a boot sector image. `data` must hold at least 512 bytes.
// Throws: MalformedBootSectorError
VolumeGeometry ParseBootSector(const uint8_t* data, size_t size, uint64_t volumeStartOffset);

// Read and parse the boot sector of the volume starting at `volumeStartOffset`.
// Throws: MalformedBootSectorError, DiskReadError
VolumeGeometry ResolveGeometry(const ImageSource& image, uint64_t volumeStartOffset);

} // namespace FSV
