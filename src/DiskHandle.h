// ============================================================================
// DiskHandle.h - Low-level disk I/O abstraction
// ============================================================================
// Provides read-only positional access to a disk image or block device.
// ============================================================================

#pragma once

#include "ImageSource.h"

#include <cstdint>
#include <string>
#include <vector>

namespace FSV {

class DiskHandle : public ImageSource {
public:
    explicit DiskHandle(const std::string& path);
    ~DiskHandle() override;

    DiskHandle(const DiskHandle&) = delete;
    DiskHandle& operator=(const DiskHandle&) = delete;

    bool Open();
    void Close();
    bool IsOpen() const { return m_fd >= 0; }
    const std::string& Path() const { return m_path; }

    std::vector<uint8_t> ReadAt(uint64_t offset, uint64_t length) const override;
    std::vector<uint8_t> ReadSectors(uint64_t startSector, uint64_t numSectors, uint64_t sectorSize) const;
    uint64_t Size() const override;

private:
    std::string m_path;
    int m_fd;
    uint64_t m_size;
};

} // namespace FSV
