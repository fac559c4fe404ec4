// ============================================================================
// FatTable.h - File Allocation Table Reader
// ============================================================================
// Reads and classifies allocation-table entries. FAT16 and FAT32 differ only
// in entry width and masking, so both are variants of one interface and
// the tracer/recovery code never branches on the width.
// ============================================================================

#pragma once

#include "VolumeGeometry.h"
#include "ImageSource.h"

#include <cstdint>
#include <memory>
#include <vector>

namespace FSV {

enum class FatEntryKind {
    Free,
    Reserved,
    Bad,
    EndOfChain,
    Next
};

const char* FatEntryKindName(FatEntryKind kind);

struct FatValue {
    FatEntryKind kind = FatEntryKind::Free;
    uint32_t raw = 0;       // Value as stored (FAT32: including top 4 bits)
    uint32_t next = 0;      // Next cluster, valid only when kind == Next

    bool IsFree() const { return kind == FatEntryKind::Free; }
    bool IsEndOfChain() const { return kind == FatEntryKind::EndOfChain; }
    bool IsNext() const { return kind == FatEntryKind::Next; }
};

class FatTable {
public:
    virtual ~FatTable() = default;

    // Create the reader matching the geometry's cluster width.
    // Throws: OutOfRangeError if fatIndex >= geometry.fatCount
    static std::unique_ptr<FatTable> Open(const VolumeGeometry& geometry,
                                          const ImageSource& image,
                                          uint32_t fatIndex = 0);

    // Throws: OutOfRangeError, DiskReadError
    FatValue ReadEntry(uint64_t cluster) const;

    // Read `count` consecutive entries with a single positional read.
    // Throws: OutOfRangeError, DiskReadError
    std::vector<FatValue> ReadEntries(uint64_t firstCluster, uint64_t count) const;

    // Number of entries the table region can hold
    uint64_t EntryCount() const { return m_geometry.FatSizeBytes() / m_geometry.EntryWidthBytes(); }
    uint32_t FatIndex() const { return m_fatIndex; }
    const VolumeGeometry& Geometry() const { return m_geometry; }

    // Entry 0 holds the media descriptor in its low byte, the rest set
    bool MediaSignatureValid() const;

    virtual FatValue Classify(uint32_t raw) const = 0;

protected:
    FatTable(const VolumeGeometry& geometry, const ImageSource& image, uint32_t fatIndex);

    virtual uint32_t DecodeRaw(const uint8_t* bytes) const = 0;
    virtual uint32_t ValueMask() const = 0;

    VolumeGeometry m_geometry;
    const ImageSource& m_image;
    uint32_t m_fatIndex;
};

class Fat16Table : public FatTable {
public:
    Fat16Table(const VolumeGeometry& geometry, const ImageSource& image, uint32_t fatIndex);
    FatValue Classify(uint32_t raw) const override;

protected:
    uint32_t DecodeRaw(const uint8_t* bytes) const override;
    uint32_t ValueMask() const override;
};

class Fat32Table : public FatTable {
public:
    Fat32Table(const VolumeGeometry& geometry, const ImageSource& image, uint32_t fatIndex);
    FatValue Classify(uint32_t raw) const override;

protected:
    uint32_t DecodeRaw(const uint8_t* bytes) const override;
    uint32_t ValueMask() const override;
};

// Single-read convenience wrapper.
// Throws: OutOfRangeError, DiskReadError
FatValue ReadFatEntry(const VolumeGeometry& geometry, const ImageSource& image,
                      uint32_t fatIndex, uint64_t cluster);

// ============================================================================
// FAT copy comparison
// ============================================================================

struct FatDiscrepancy {
    uint64_t cluster;
    FatValue primary;
    FatValue backup;
};

// Compare data-cluster entries of two FAT copies. Stops after `limit`
// discrepancies (0 = no limit).
std::vector<FatDiscrepancy> CompareFatCopies(const FatTable& primary,
                                             const FatTable& backup,
                                             size_t limit = 0);

} // namespace FSV
