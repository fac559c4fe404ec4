// ============================================================================
// PartitionTable.cpp - MBR Partition Locator Implementation
// ============================================================================

#include "PartitionTable.h"
#include "VolumeGeometry.h"
#include "ForensicsExceptions.h"

#include <cstdio>
#include <cstring>

namespace FSV {

namespace MBR = Constants::MBR;

const char* PartitionTypeName(uint8_t typeId) {
    switch (typeId) {
        case PartitionType::EMPTY:        return "Empty";
        case PartitionType::FAT16_SMALL:  return "FAT16 (less than 32MB)";
        case PartitionType::EXTENDED:     return "Extended DOS Partition";
        case PartitionType::FAT16:        return "FAT16";
        case PartitionType::NTFS_EXFAT:   return "NTFS / exFAT / HPFS";
        case PartitionType::FAT32:        return "FAT32";
        case PartitionType::FAT32_LBA:    return "FAT32 LBA";
        case PartitionType::FAT16_LBA:    return "FAT16 LBA";
        case PartitionType::EXTENDED_LBA: return "Extended LBA Partition";
        default:                          return "Unknown";
    }
}

bool PartitionInfo::IsFat16() const {
    return typeId == PartitionType::FAT16_SMALL ||
           typeId == PartitionType::FAT16 ||
           typeId == PartitionType::FAT16_LBA;
}

bool PartitionInfo::IsFat32() const {
    return typeId == PartitionType::FAT32 || typeId == PartitionType::FAT32_LBA;
}

bool PartitionInfo::IsExtended() const {
    return typeId == PartitionType::EXTENDED || typeId == PartitionType::EXTENDED_LBA;
}

PartitionTable ParsePartitionTable(const uint8_t* data, size_t size) {
    if (data == nullptr || size < Constants::Boot::SECTOR_SIZE) {
        throw OutOfRangeError("Partition table requires a full 512-byte sector");
    }

    PartitionTable table;

    uint16_t signature;
    std::memcpy(&signature, data + Constants::Boot::SIGNATURE_OFFSET, sizeof(signature));
    table.signatureValid = signature == Constants::Boot::SIGNATURE;

    static const uint8_t emptySlot[MBR::PARTITION_ENTRY_SIZE] = {};

    for (uint32_t i = 0; i < MBR::PARTITION_COUNT; ++i) {
        const uint8_t* raw = data + MBR::PARTITION_TABLE_OFFSET + i * MBR::PARTITION_ENTRY_SIZE;
        if (std::memcmp(raw, emptySlot, MBR::PARTITION_ENTRY_SIZE) == 0) {
            continue;
        }

        MBRPartitionEntry entry;
        std::memcpy(&entry, raw, sizeof(entry));

        PartitionInfo info;
        info.index = static_cast<int>(i) + 1;
        info.bootable = entry.bootFlag == MBR::BOOTABLE_FLAG;
        info.typeId = entry.typeId;
        info.startLba = entry.startLba;
        info.sectorCount = entry.sectorCount;
        table.partitions.push_back(info);
    }

    return table;
}

VolumeLocation LocateFatVolume(const ImageSource& image, int partitionIndex) {
    auto sector = image.ReadAt(0, Constants::Boot::SECTOR_SIZE);

    if (partitionIndex == 0) {
        // A superfloppy image starts with the boot sector itself
        try {
            ParseBootSector(sector.data(), sector.size(), 0);
            return VolumeLocation();
        } catch (const MalformedBootSectorError&) {
            // Not a volume; try the partition table
        }
    }

    PartitionTable table = ParsePartitionTable(sector.data(), sector.size());
    if (!table.signatureValid) {
        throw MalformedBootSectorError("sector 0 is neither a FAT boot sector nor an MBR");
    }

    for (const auto& partition : table.partitions) {
        bool selected = partitionIndex == 0 ? partition.IsFat() : partition.index == partitionIndex;
        if (!selected) {
            continue;
        }

        VolumeLocation location;
        location.offset = partition.ByteOffset();
        location.partitionType = partition.typeId;
        location.partitionIndex = partition.index;
        return location;
    }

    if (partitionIndex != 0) {
        char buffer[64];
        snprintf(buffer, sizeof(buffer), "Partition %d is empty or missing", partitionIndex);
        throw OutOfRangeError(buffer);
    }
    throw MalformedBootSectorError("no FAT16 or FAT32 partition in the MBR");
}

} // namespace FSV
