// ============================================================================
// FatTable.cpp - FAT16/FAT32 Entry Decoding
// ============================================================================

#include "FatTable.h"
#include "Constants.h"
#include "ForensicsExceptions.h"
#include "SafetyLimits.h"

#include <algorithm>
#include <climits>
#include <string>

namespace FSV {

const char* FatEntryKindName(FatEntryKind kind) {
    switch (kind) {
        case FatEntryKind::Free:       return "FREE";
        case FatEntryKind::Reserved:   return "RESERVED";
        case FatEntryKind::Bad:        return "BAD";
        case FatEntryKind::EndOfChain: return "EOC";
        case FatEntryKind::Next:       return "NEXT";
    }
    return "UNKNOWN";
}

// ============================================================================
// FatTable
// ============================================================================

FatTable::FatTable(const VolumeGeometry& geometry, const ImageSource& image, uint32_t fatIndex)
    : m_geometry(geometry)
    , m_image(image)
    , m_fatIndex(fatIndex)
{
}

std::unique_ptr<FatTable> FatTable::Open(const VolumeGeometry& geometry,
                                         const ImageSource& image,
                                         uint32_t fatIndex)
{
    if (fatIndex >= geometry.fatCount) {
        throw OutOfRangeError("FAT index " + std::to_string(fatIndex) +
                              " exceeds FAT count " + std::to_string(geometry.fatCount));
    }

    switch (geometry.fsType) {
        case FilesystemType::FAT16:
            return std::make_unique<Fat16Table>(geometry, image, fatIndex);
        case FilesystemType::FAT32:
            return std::make_unique<Fat32Table>(geometry, image, fatIndex);
        default:
            throw MalformedBootSectorError("unsupported cluster width " +
                                           std::to_string(geometry.clusterWidth));
    }
}

FatValue FatTable::ReadEntry(uint64_t cluster) const {
    if (cluster >= EntryCount()) {
        throw OutOfRangeError("FAT entry " + std::to_string(cluster) +
                              " beyond table of " + std::to_string(EntryCount()) + " entries");
    }

    uint32_t width = m_geometry.EntryWidthBytes();
    auto bytes = m_image.ReadAt(m_geometry.FatEntryOffset(m_fatIndex, cluster), width);
    return Classify(DecodeRaw(bytes.data()));
}

std::vector<FatValue> FatTable::ReadEntries(uint64_t firstCluster, uint64_t count) const {
    if (count == 0) {
        return {};
    }
    if (firstCluster >= EntryCount() || count > EntryCount() - firstCluster) {
        throw OutOfRangeError("FAT entries " + std::to_string(firstCluster) + "+" +
                              std::to_string(count) + " beyond table of " +
                              std::to_string(EntryCount()) + " entries");
    }

    uint32_t width = m_geometry.EntryWidthBytes();
    if (count > Limits::MAX_SINGLE_READ / width) {
        throw OutOfRangeError("FAT range read too large");
    }

    auto bytes = m_image.ReadAt(m_geometry.FatEntryOffset(m_fatIndex, firstCluster), count * width);

    std::vector<FatValue> values;
    values.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        values.push_back(Classify(DecodeRaw(bytes.data() + i * width)));
    }
    return values;
}

bool FatTable::MediaSignatureValid() const {
    FatValue entry0 = ReadEntry(0);
    uint32_t mask = ValueMask();
    uint32_t expected = (mask & ~0xFFu) | m_geometry.mediaDescriptor;
    return (entry0.raw & mask) == expected;
}

// ============================================================================
// Fat16Table
// ============================================================================

Fat16Table::Fat16Table(const VolumeGeometry& geometry, const ImageSource& image, uint32_t fatIndex)
    : FatTable(geometry, image, fatIndex)
{
}

uint32_t Fat16Table::DecodeRaw(const uint8_t* bytes) const {
    return static_cast<uint32_t>(bytes[0]) | (static_cast<uint32_t>(bytes[1]) << 8);
}

uint32_t Fat16Table::ValueMask() const {
    return Constants::FAT16::VALUE_MASK;
}

FatValue Fat16Table::Classify(uint32_t raw) const {
    using namespace Constants;

    FatValue value;
    value.raw = raw;
    uint32_t v = raw & FAT16::VALUE_MASK;

    if (v == FAT16::FREE) {
        value.kind = FatEntryKind::Free;
    } else if (v == FAT16::RESERVED) {
        value.kind = FatEntryKind::Reserved;
    } else if (v >= FAT16::END_OF_CHAIN) {
        value.kind = FatEntryKind::EndOfChain;
    } else if (v == FAT16::BAD) {
        value.kind = FatEntryKind::Bad;
    } else if (v >= FAT16::RESERVED_RANGE_START) {
        value.kind = FatEntryKind::Reserved;
    } else {
        value.kind = FatEntryKind::Next;
        value.next = v;
    }
    return value;
}

// ============================================================================
// Fat32Table
// ============================================================================

Fat32Table::Fat32Table(const VolumeGeometry& geometry, const ImageSource& image, uint32_t fatIndex)
    : FatTable(geometry, image, fatIndex)
{
}

uint32_t Fat32Table::DecodeRaw(const uint8_t* bytes) const {
    return static_cast<uint32_t>(bytes[0]) |
           (static_cast<uint32_t>(bytes[1]) << 8) |
           (static_cast<uint32_t>(bytes[2]) << 16) |
           (static_cast<uint32_t>(bytes[3]) << 24);
}

uint32_t Fat32Table::ValueMask() const {
    return Constants::FAT32::VALUE_MASK;
}

FatValue Fat32Table::Classify(uint32_t raw) const {
    using namespace Constants;

    FatValue value;
    value.raw = raw;
    // Top 4 bits are reserved and ignored
    uint32_t v = raw & FAT32::VALUE_MASK;

    if (v == FAT32::FREE) {
        value.kind = FatEntryKind::Free;
    } else if (v == FAT32::RESERVED) {
        value.kind = FatEntryKind::Reserved;
    } else if (v >= FAT32::END_OF_CHAIN) {
        value.kind = FatEntryKind::EndOfChain;
    } else if (v == FAT32::BAD) {
        value.kind = FatEntryKind::Bad;
    } else if (v >= FAT32::RESERVED_RANGE_START) {
        value.kind = FatEntryKind::Reserved;
    } else {
        value.kind = FatEntryKind::Next;
        value.next = v;
    }
    return value;
}

// ============================================================================
// Free functions
// ============================================================================

FatValue ReadFatEntry(const VolumeGeometry& geometry, const ImageSource& image,
                      uint32_t fatIndex, uint64_t cluster)
{
    auto table = FatTable::Open(geometry, image, fatIndex);
    return table->ReadEntry(cluster);
}

std::vector<FatDiscrepancy> CompareFatCopies(const FatTable& primary,
                                             const FatTable& backup,
                                             size_t limit)
{
    constexpr uint64_t ENTRIES_PER_BATCH = 65536;

    std::vector<FatDiscrepancy> result;
    uint64_t endCluster = std::min(primary.Geometry().MaxCluster() + 1,
                                   std::min(primary.EntryCount(), backup.EntryCount()));

    for (uint64_t first = Constants::FIRST_DATA_CLUSTER; first < endCluster; first += ENTRIES_PER_BATCH) {
        uint64_t count = std::min(ENTRIES_PER_BATCH, endCluster - first);
        auto a = primary.ReadEntries(first, count);
        auto b = backup.ReadEntries(first, count);

        for (uint64_t i = 0; i < count; ++i) {
            if (a[i].kind != b[i].kind || a[i].next != b[i].next) {
                result.push_back({ first + i, a[i], b[i] });
                if (limit > 0 && result.size() >= limit) {
                    return result;
                }
            }
        }
    }

    return result;
}

} // namespace FSV
