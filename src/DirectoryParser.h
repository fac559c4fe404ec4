// ============================================================================
// DirectoryParser.h - FAT Directory Record Decoding
// ============================================================================
// Decodes 32-byte directory records, reassembles Long File Names and
// classifies entries. Parsing is lazy (DirectoryCursor), deterministic and
// restartable over the same bytes.
// ============================================================================

#pragma once

#include "VolumeGeometry.h"
#include "ImageSource.h"
#include "CancellationToken.h"
#include "SafetyLimits.h"

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace FSV {

#pragma pack(push, 1)
struct FATDirEntry {
    uint8_t name[11];
    uint8_t attr;
    uint8_t lcase;
    uint8_t ctimeTenths;
    uint16_t ctime;
    uint16_t cdate;
    uint16_t adate;
    uint16_t clusterHigh;
    uint16_t mtime;
    uint16_t mdate;
    uint16_t clusterLow;
    uint32_t fileSize;
};

struct FATLFNEntry {
    uint8_t sequenceNo;
    uint16_t name1[5];
    uint8_t attr;
    uint8_t type;
    uint8_t checksum;
    uint16_t name2[6];
    uint16_t firstCluster;
    uint16_t name3[2];
};
#pragma pack(pop)

static_assert(sizeof(FATDirEntry) == 32, "Directory record layout");
static_assert(sizeof(FATLFNEntry) == 32, "LFN record layout");

// ============================================================================
// Decoded values
// ============================================================================

struct FatTimestamp {
    uint16_t year = 0;
    uint8_t month = 0;
    uint8_t day = 0;
    uint8_t hour = 0;
    uint8_t minute = 0;
    uint8_t second = 0;
    uint16_t millisecond = 0;

    bool IsValid() const;
    std::string ToString() const;

    static FatTimestamp Decode(uint16_t date, uint16_t time, uint8_t tenths = 0);
};

enum class EntryType {
    File,
    Directory,
    VolumeLabel
};

enum class LfnStatus {
    None,               // No LFN records preceded the entry
    Valid,              // Long name accepted
    ChecksumMismatch,   // Discarded, checksum disagrees with the short name
    Orphaned            // Discarded, broken or mixed sequence
};

const char* LfnStatusName(LfnStatus status);

struct DirectoryEntry {
    std::string name;           // Long name when valid, otherwise 8.3 name
    std::string shortName;      // 8.3 name, first char substituted if unknown
    std::string longName;       // Empty unless lfnStatus == Valid

    uint8_t rawName[11] = {};
    uint8_t attributes = 0;
    EntryType type = EntryType::File;
    bool isDeleted = false;
    bool firstCharUnknown = false;     // Deleted 8.3 name lost its first byte
    LfnStatus lfnStatus = LfnStatus::None;
    size_t lfnRecordCount = 0;

    uint32_t startCluster = 0;
    uint32_t fileSize = 0;

    // Raw timestamp fields, kept so entries round-trip unchanged
    uint8_t createTimeTenths = 0;
    uint16_t createTime = 0;
    uint16_t createDate = 0;
    uint16_t accessDate = 0;
    uint16_t writeTime = 0;
    uint16_t writeDate = 0;

    uint64_t recordOffset = 0;  // Offset of the 8.3 record in the parsed bytes

    bool IsDirectory() const { return type == EntryType::Directory; }
    bool IsVolumeLabel() const { return type == EntryType::VolumeLabel; }
    bool IsRecoveryCandidate() const { return isDeleted && type != EntryType::VolumeLabel; }

    FatTimestamp Created() const { return FatTimestamp::Decode(createDate, createTime, createTimeTenths); }
    FatTimestamp Modified() const { return FatTimestamp::Decode(writeDate, writeTime); }
    FatTimestamp Accessed() const { return FatTimestamp::Decode(accessDate, 0); }
};

// Microsoft checksum of an 11-byte short name, stored in every LFN record.
uint8_t ShortNameChecksum(const uint8_t* name);

// ============================================================================
// DirectoryCursor - lazy sequence of decoded entries
// ============================================================================

class DirectoryCursor {
public:
    // `data` must outlive the cursor.
    DirectoryCursor(const uint8_t* data, size_t size, FilesystemType fsType);
    DirectoryCursor(const std::vector<uint8_t>& data, FilesystemType fsType);

    // Decode the next entry. Returns false at the 0x00 terminator or at the
    // end of the data.
    bool Next(DirectoryEntry& entry);

    void Reset();

private:
    struct LfnRun {
        std::vector<std::u16string> fragments;  // Physical order
        std::vector<uint8_t> checksums;
        uint8_t lastSequence = 0;
        bool deleted = false;
        bool broken = false;

        bool IsEmpty() const { return fragments.empty(); }
        void Clear();
    };

    void AccumulateLfn(const uint8_t* raw);
    void DecodeShortEntry(const uint8_t* raw, DirectoryEntry& entry) const;
    void ApplyLongName(DirectoryEntry& entry) const;

    const uint8_t* m_data;
    size_t m_size;
    FilesystemType m_fsType;
    size_t m_position;
    bool m_finished;
    LfnRun m_lfn;
};

// Decode every entry in a directory buffer.
std::vector<DirectoryEntry> ParseDirectory(const std::vector<uint8_t>& data, FilesystemType fsType);

// ============================================================================
// Reading directories from a volume
// ============================================================================

struct DirectoryLocation {
    bool isRoot = true;
    uint32_t cluster = 0;

    static DirectoryLocation Root() { return DirectoryLocation(); }
    static DirectoryLocation Cluster(uint32_t cluster) {
        DirectoryLocation loc;
        loc.isRoot = false;
        loc.cluster = cluster;
        return loc;
    }
};

// Raw bytes of an active directory: the FAT16 root region, or the traced
// chain of a cluster-based directory (FAT32 root included).
// Throws: CorruptChainError, OutOfRangeError, DiskReadError, OperationCancelledError
std::vector<uint8_t> ReadDirectoryBytes(const VolumeGeometry& geometry,
                                        const ImageSource& image,
                                        const DirectoryLocation& location,
                                        uint32_t fatIndex = 0,
                                        uint64_t limitBytes = Limits::MAX_DIRECTORY_BYTES,
                                        const CancellationToken* cancel = nullptr);

std::vector<DirectoryEntry> ParseDirectory(const VolumeGeometry& geometry,
                                           const ImageSource& image,
                                           const DirectoryLocation& location,
                                           uint32_t fatIndex = 0,
                                           const CancellationToken* cancel = nullptr);

} // namespace FSV
