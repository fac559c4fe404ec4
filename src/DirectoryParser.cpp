// ============================================================================
// DirectoryParser.cpp - FAT Directory Record Decoding Implementation
// ============================================================================

#include "DirectoryParser.h"
#include "ClusterChain.h"
#include "Constants.h"
#include "StringUtils.h"
#include "VolumeReader.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <cstdio>
#include <string>

namespace FSV {

namespace Dir = Constants::Dir;

namespace {

bool IsLfnRecord(uint8_t attr) {
    return (attr & Dir::ATTR_LONG_NAME_MASK) == Dir::ATTR_LONG_NAME;
}

bool IsDotEntry(const uint8_t* name) {
    return std::memcmp(name, ".          ", Dir::NAME_LENGTH) == 0 ||
           std::memcmp(name, "..         ", Dir::NAME_LENGTH) == 0;
}

void AppendShortNameByte(std::string& out, uint8_t c) {
    StringUtils::AppendUtf8(out, c);
}

std::string FormatShortName(const uint8_t* name) {
    std::string base;
    std::string ext;

    int baseEnd = 8;
    while (baseEnd > 0 && name[baseEnd - 1] == ' ') --baseEnd;
    int extEnd = 11;
    while (extEnd > 8 && name[extEnd - 1] == ' ') --extEnd;

    for (int i = 0; i < baseEnd; ++i) AppendShortNameByte(base, name[i]);
    for (int i = 8; i < extEnd; ++i) AppendShortNameByte(ext, name[i]);

    return ext.empty() ? base : base + "." + ext;
}

std::u16string DecodeLfnFragment(const FATLFNEntry& lfn) {
    uint16_t units[Dir::LFN_CHARS_PER_ENTRY];
    std::memcpy(units, lfn.name1, sizeof(lfn.name1));
    std::memcpy(units + 5, lfn.name2, sizeof(lfn.name2));
    std::memcpy(units + 11, lfn.name3, sizeof(lfn.name3));

    std::u16string part;
    for (uint16_t unit : units) {
        if (unit == 0x0000) break;
        if (unit == 0xFFFF) continue;
        part += static_cast<char16_t>(unit);
    }
    return part;
}

} // namespace

// ============================================================================
// Checksums and timestamps
// ============================================================================

uint8_t ShortNameChecksum(const uint8_t* name) {
    uint8_t sum = 0;
    for (size_t i = 0; i < Dir::NAME_LENGTH; ++i) {
        sum = static_cast<uint8_t>(((sum & 1) ? 0x80 : 0) + (sum >> 1) + name[i]);
    }
    return sum;
}

FatTimestamp FatTimestamp::Decode(uint16_t date, uint16_t time, uint8_t tenths) {
    FatTimestamp ts;
    ts.year = static_cast<uint16_t>(1980 + (date >> 9));
    ts.month = static_cast<uint8_t>((date >> 5) & 0x0F);
    ts.day = static_cast<uint8_t>(date & 0x1F);
    ts.hour = static_cast<uint8_t>(time >> 11);
    ts.minute = static_cast<uint8_t>((time >> 5) & 0x3F);
    ts.second = static_cast<uint8_t>((time & 0x1F) * 2 + tenths / 100);
    ts.millisecond = static_cast<uint16_t>((tenths % 100) * 10);
    return ts;
}

bool FatTimestamp::IsValid() const {
    return month >= 1 && month <= 12 && day >= 1 && day <= 31 &&
           hour < 24 && minute < 60 && second < 60;
}

std::string FatTimestamp::ToString() const {
    if (!IsValid()) {
        return "-";
    }
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%04u-%02u-%02u %02u:%02u:%02u",
             year, month, day, hour, minute, second);
    return std::string(buffer);
}

const char* LfnStatusName(LfnStatus status) {
    switch (status) {
        case LfnStatus::None:             return "none";
        case LfnStatus::Valid:            return "valid";
        case LfnStatus::ChecksumMismatch: return "checksum-mismatch";
        case LfnStatus::Orphaned:         return "orphaned";
    }
    return "unknown";
}

// ============================================================================
// DirectoryCursor
// ============================================================================

void DirectoryCursor::LfnRun::Clear() {
    fragments.clear();
    checksums.clear();
    lastSequence = 0;
    deleted = false;
    broken = false;
}

DirectoryCursor::DirectoryCursor(const uint8_t* data, size_t size, FilesystemType fsType)
    : m_data(data)
    , m_size(size)
    , m_fsType(fsType)
    , m_position(0)
    , m_finished(false)
{
}

DirectoryCursor::DirectoryCursor(const std::vector<uint8_t>& data, FilesystemType fsType)
    : DirectoryCursor(data.data(), data.size(), fsType)
{
}

void DirectoryCursor::Reset() {
    m_position = 0;
    m_finished = false;
    m_lfn.Clear();
}

bool DirectoryCursor::Next(DirectoryEntry& entry) {
    while (!m_finished && m_position + Dir::ENTRY_SIZE <= m_size) {
        const uint8_t* raw = m_data + m_position;
        uint64_t recordOffset = m_position;
        m_position += Dir::ENTRY_SIZE;

        uint8_t marker = raw[0];
        uint8_t attr = raw[11];

        if (marker == Dir::END_MARKER) {
            m_finished = true;
            break;
        }

        // ====================================================================
        // Long File Name records precede their 8.3 record
        // ====================================================================
        if (IsLfnRecord(attr)) {
            AccumulateLfn(raw);
            continue;
        }

        if (IsDotEntry(raw)) {
            m_lfn.Clear();
            continue;
        }

        entry = DirectoryEntry();
        entry.recordOffset = recordOffset;
        DecodeShortEntry(raw, entry);
        ApplyLongName(entry);
        m_lfn.Clear();
        return true;
    }

    m_finished = true;
    return false;
}

void DirectoryCursor::AccumulateLfn(const uint8_t* raw) {
    FATLFNEntry lfn;
    std::memcpy(&lfn, raw, sizeof(lfn));

    bool deletedRecord = lfn.sequenceNo == Dir::DELETED_MARKER;

    if (deletedRecord) {
        // Order byte is gone; keep physical order
        if (!m_lfn.IsEmpty() && !m_lfn.deleted) {
            m_lfn.Clear();
        }
        m_lfn.deleted = true;
    } else {
        uint8_t sequence = lfn.sequenceNo & Dir::LFN_SEQUENCE_MASK;
        bool isLast = (lfn.sequenceNo & Dir::LFN_LAST_ENTRY) != 0;

        if (isLast) {
            m_lfn.Clear();
            if (sequence == 0 || sequence > Dir::LFN_MAX_ENTRIES) {
                m_lfn.broken = true;
            }
        } else if (m_lfn.IsEmpty() || m_lfn.deleted) {
            // Continuation without a starting record
            m_lfn.Clear();
            m_lfn.broken = true;
        } else if (sequence + 1 != m_lfn.lastSequence) {
            m_lfn.broken = true;
        }
        m_lfn.lastSequence = sequence;
    }

    if (m_lfn.fragments.size() >= Dir::LFN_MAX_ENTRIES) {
        m_lfn.broken = true;
        return;
    }

    m_lfn.fragments.push_back(DecodeLfnFragment(lfn));
    m_lfn.checksums.push_back(lfn.checksum);
}

void DirectoryCursor::DecodeShortEntry(const uint8_t* raw, DirectoryEntry& entry) const {
    FATDirEntry record;
    std::memcpy(&record, raw, sizeof(record));

    std::memcpy(entry.rawName, record.name, Dir::NAME_LENGTH);
    entry.attributes = record.attr;
    entry.isDeleted = record.name[0] == Dir::DELETED_MARKER;

    if ((record.attr & Dir::ATTR_VOLUME_ID) != 0) {
        entry.type = EntryType::VolumeLabel;
    } else if ((record.attr & Dir::ATTR_DIRECTORY) != 0) {
        entry.type = EntryType::Directory;
    } else {
        entry.type = EntryType::File;
    }

    uint8_t display[Dir::NAME_LENGTH];
    std::memcpy(display, record.name, Dir::NAME_LENGTH);
    if (entry.isDeleted) {
        // Resource-fork files ("._name") keep the underscore after the dot
        display[0] = (record.name[1] == '_') ? '.' : '_';
        entry.firstCharUnknown = true;
    } else if (display[0] == Dir::KANJI_E5_ESCAPE) {
        display[0] = Dir::DELETED_MARKER;
    }

    if (entry.type != EntryType::VolumeLabel) {
        entry.shortName = FormatShortName(display);
    } else {
        // Labels are 11 characters without a dot
        std::string label;
        int end = 11;
        while (end > 0 && display[end - 1] == ' ') --end;
        for (int i = 0; i < end; ++i) AppendShortNameByte(label, display[i]);
        entry.shortName = label;
    }

    if (m_fsType == FilesystemType::FAT32) {
        entry.startCluster = (static_cast<uint32_t>(record.clusterHigh) << 16) | record.clusterLow;
    } else {
        entry.startCluster = record.clusterLow;
    }
    entry.fileSize = record.fileSize;

    entry.createTimeTenths = record.ctimeTenths;
    entry.createTime = record.ctime;
    entry.createDate = record.cdate;
    entry.accessDate = record.adate;
    entry.writeTime = record.mtime;
    entry.writeDate = record.mdate;

    entry.name = entry.shortName;
}

void DirectoryCursor::ApplyLongName(DirectoryEntry& entry) const {
    if (m_lfn.IsEmpty()) {
        entry.lfnStatus = LfnStatus::None;
        return;
    }

    entry.lfnRecordCount = m_lfn.fragments.size();

    if (entry.IsVolumeLabel() || m_lfn.broken || m_lfn.deleted != entry.isDeleted) {
        entry.lfnStatus = LfnStatus::Orphaned;
        return;
    }

    // Physical order is last segment first
    std::u16string longName;
    for (auto it = m_lfn.fragments.rbegin(); it != m_lfn.fragments.rend(); ++it) {
        longName += *it;
    }
    if (longName.empty()) {
        entry.lfnStatus = LfnStatus::Orphaned;
        return;
    }

    uint8_t shortName[Dir::NAME_LENGTH];
    std::memcpy(shortName, entry.rawName, Dir::NAME_LENGTH);

    if (!m_lfn.deleted) {
        if (m_lfn.lastSequence != 1) {
            entry.lfnStatus = LfnStatus::Orphaned;
            return;
        }
    } else {
        // The short name's first byte was overwritten by 0xE5. The only
        // candidate is the uppercased first character of the long name,
        // and it is kept only when every checksum confirms it.
        char16_t first = longName[0];
        if (first >= 0x80) {
            entry.lfnStatus = LfnStatus::ChecksumMismatch;
            return;
        }
        shortName[0] = static_cast<uint8_t>(std::toupper(static_cast<unsigned char>(first)));
    }

    uint8_t expected = ShortNameChecksum(shortName);
    bool allMatch = std::all_of(m_lfn.checksums.begin(), m_lfn.checksums.end(),
                                [expected](uint8_t sum) { return sum == expected; });
    if (!allMatch) {
        entry.lfnStatus = LfnStatus::ChecksumMismatch;
        return;
    }

    if (m_lfn.deleted) {
        entry.shortName = FormatShortName(shortName);
        entry.firstCharUnknown = false;
    }

    entry.longName = StringUtils::Utf16ToUtf8(longName);
    entry.name = entry.longName;
    entry.lfnStatus = LfnStatus::Valid;
}

std::vector<DirectoryEntry> ParseDirectory(const std::vector<uint8_t>& data, FilesystemType fsType) {
    std::vector<DirectoryEntry> entries;
    DirectoryCursor cursor(data, fsType);
    DirectoryEntry entry;
    while (cursor.Next(entry)) {
        entries.push_back(entry);
    }
    return entries;
}

// ============================================================================
// Volume access
// ============================================================================

std::vector<uint8_t> ReadDirectoryBytes(const VolumeGeometry& geometry,
                                        const ImageSource& image,
                                        const DirectoryLocation& location,
                                        uint32_t fatIndex,
                                        uint64_t limitBytes,
                                        const CancellationToken* cancel)
{
    VolumeReader reader(image, geometry);

    if (location.isRoot && geometry.HasFixedRootRegion()) {
        CheckCancelled(cancel);
        return reader.ReadRootRegion();
    }

    uint32_t start = location.isRoot ? geometry.rootCluster : location.cluster;
    ClusterChain chain = TraceActiveChain(geometry, image, start, fatIndex, cancel);
    return reader.ReadChain(chain, limitBytes);
}

std::vector<DirectoryEntry> ParseDirectory(const VolumeGeometry& geometry,
                                           const ImageSource& image,
                                           const DirectoryLocation& location,
                                           uint32_t fatIndex,
                                           const CancellationToken* cancel)
{
    auto data = ReadDirectoryBytes(geometry, image, location, fatIndex,
                                   Limits::MAX_DIRECTORY_BYTES, cancel);
    return ParseDirectory(data, geometry.fsType);
}

} // namespace FSV
