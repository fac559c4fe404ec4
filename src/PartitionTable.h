// ============================================================================
// PartitionTable.h - MBR Partition Locator
// ============================================================================
// Parses the classic MBR partition table and locates the FAT volume inside
// a whole-disk image. The result is only a byte offset and a type; the
// volume itself is validated by the geometry resolver.
// ============================================================================

#pragma once

#include "ImageSource.h"
#include "Constants.h"

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace FSV {

#pragma pack(push, 1)
struct MBRPartitionEntry {
    uint8_t bootFlag;
    uint8_t chsStart[3];
    uint8_t typeId;
    uint8_t chsEnd[3];
    uint32_t startLba;
    uint32_t sectorCount;
};
#pragma pack(pop)

static_assert(sizeof(MBRPartitionEntry) == 16, "MBR partition entry layout");

namespace PartitionType {
    constexpr uint8_t EMPTY = 0x00;
    constexpr uint8_t FAT16_SMALL = 0x04;
    constexpr uint8_t EXTENDED = 0x05;
    constexpr uint8_t FAT16 = 0x06;
    constexpr uint8_t NTFS_EXFAT = 0x07;
    constexpr uint8_t FAT32 = 0x0B;
    constexpr uint8_t FAT32_LBA = 0x0C;
    constexpr uint8_t FAT16_LBA = 0x0E;
    constexpr uint8_t EXTENDED_LBA = 0x0F;
}

const char* PartitionTypeName(uint8_t typeId);

struct PartitionInfo {
    int index = 0;                  // 1-based slot in the table
    bool bootable = false;
    uint8_t typeId = 0;
    uint32_t startLba = 0;
    uint32_t sectorCount = 0;

    uint64_t ByteOffset() const { return static_cast<uint64_t>(startLba) * Constants::Boot::SECTOR_SIZE; }
    uint64_t ByteSize() const { return static_cast<uint64_t>(sectorCount) * Constants::Boot::SECTOR_SIZE; }

    bool IsFat16() const;
    bool IsFat32() const;
    bool IsFat() const { return IsFat16() || IsFat32(); }
    bool IsExtended() const;
    const char* TypeName() const { return PartitionTypeName(typeId); }
};

struct PartitionTable {
    bool signatureValid = false;
    std::vector<PartitionInfo> partitions;  // Non-empty slots only
};

// Throws: OutOfRangeError if fewer than 512 bytes are supplied
PartitionTable ParsePartitionTable(const uint8_t* data, size_t size);

struct VolumeLocation {
    uint64_t offset = 0;
    uint8_t partitionType = PartitionType::EMPTY;
    int partitionIndex = 0;         // 0 = unpartitioned image
};

// Locate a FAT volume. With partitionIndex 0 an unpartitioned image whose
// sector 0 is a FAT boot sector yields offset 0, otherwise the first FAT
// partition is used. A non-zero index selects that table slot.
// Throws: MalformedBootSectorError if nothing usable is found,
//         OutOfRangeError for an empty or missing slot, DiskReadError
VolumeLocation LocateFatVolume(const ImageSource& image, int partitionIndex = 0);

} // namespace FSV
