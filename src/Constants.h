// ============================================================================
// Constants.h - FAT On-Disk Format Constants
// ============================================================================
// Hierarchical constant definitions for FAT16/FAT32 structures.
// Separates on-disk format constants from tunable scan parameters
// (see ScanConfiguration.h) and hard safety limits (see SafetyLimits.h).
// ============================================================================

#pragma once

#include <cstdint>
#include <cstddef>

namespace FSV {
namespace Constants {

// ============================================================================
// Size Unit Multipliers
// ============================================================================
constexpr uint64_t KILOBYTE = 1024ULL;
constexpr uint64_t MEGABYTE = 1024ULL * 1024;
constexpr uint64_t GIGABYTE = 1024ULL * 1024 * 1024;

// ============================================================================
// Boot Sector
// ============================================================================
namespace Boot {
    constexpr size_t SECTOR_SIZE = 512;
    constexpr size_t SIGNATURE_OFFSET = 0x1FE;
    constexpr uint16_t SIGNATURE = 0xAA55;
    constexpr uint8_t JUMP_SHORT = 0xEB;
    constexpr uint8_t JUMP_NEAR = 0xE9;
    constexpr uint8_t NOP = 0x90;
}

// ============================================================================
// Master Boot Record
// ============================================================================
namespace MBR {
    constexpr size_t PARTITION_TABLE_OFFSET = 0x1BE;
    constexpr size_t PARTITION_ENTRY_SIZE = 16;
    constexpr size_t PARTITION_COUNT = 4;
    constexpr uint8_t BOOTABLE_FLAG = 0x80;
}

// ============================================================================
// File Allocation Table
// ============================================================================
namespace FAT16 {
    constexpr uint32_t ENTRY_SIZE = 2;
    constexpr uint32_t FREE = 0x0000;
    constexpr uint32_t RESERVED = 0x0001;
    constexpr uint32_t RESERVED_RANGE_START = 0xFFF0;
    constexpr uint32_t BAD = 0xFFF7;
    constexpr uint32_t END_OF_CHAIN = 0xFFF8;
    constexpr uint32_t VALUE_MASK = 0xFFFF;
}

namespace FAT32 {
    constexpr uint32_t ENTRY_SIZE = 4;
    constexpr uint32_t FREE = 0x00000000;
    constexpr uint32_t RESERVED = 0x00000001;
    constexpr uint32_t RESERVED_RANGE_START = 0x0FFFFFF0;
    constexpr uint32_t BAD = 0x0FFFFFF7;
    constexpr uint32_t END_OF_CHAIN = 0x0FFFFFF8;
    constexpr uint32_t VALUE_MASK = 0x0FFFFFFF;
}

constexpr uint32_t FIRST_DATA_CLUSTER = 2;
constexpr uint8_t MEDIA_FIXED_DISK = 0xF8;

// ============================================================================
// Directory Records
// ============================================================================
namespace Dir {
    constexpr size_t ENTRY_SIZE = 32;
    constexpr size_t NAME_LENGTH = 11;

    constexpr uint8_t END_MARKER = 0x00;
    constexpr uint8_t DELETED_MARKER = 0xE5;
    constexpr uint8_t KANJI_E5_ESCAPE = 0x05;

    constexpr uint8_t ATTR_READ_ONLY = 0x01;
    constexpr uint8_t ATTR_HIDDEN = 0x02;
    constexpr uint8_t ATTR_SYSTEM = 0x04;
    constexpr uint8_t ATTR_VOLUME_ID = 0x08;
    constexpr uint8_t ATTR_DIRECTORY = 0x10;
    constexpr uint8_t ATTR_ARCHIVE = 0x20;
    constexpr uint8_t ATTR_LONG_NAME = 0x0F;
    constexpr uint8_t ATTR_LONG_NAME_MASK = 0x3F;

    constexpr uint8_t LFN_LAST_ENTRY = 0x40;
    constexpr uint8_t LFN_SEQUENCE_MASK = 0x1F;
    constexpr size_t LFN_CHARS_PER_ENTRY = 13;
    constexpr size_t LFN_MAX_ENTRIES = 20;
}

} // namespace Constants
} // namespace FSV
