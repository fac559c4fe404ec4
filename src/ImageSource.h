// ============================================================================
// ImageSource.h - Positional Read-Only Byte Source
// ============================================================================
// Abstracts the underlying image (file, block device, memory buffer).
// All reads are positional and stateless, so independent traversals may
// share one source concurrently.
// ============================================================================

#pragma once

#include "ForensicsExceptions.h"

#include <cstdint>
#include <cstring>
#include <vector>
#include <utility>

namespace FSV {

class ImageSource {
public:
    virtual ~ImageSource() = default;

    // Read exactly `length` bytes at `offset`.
    // Throws: DiskReadError on short read or I/O failure
    virtual std::vector<uint8_t> ReadAt(uint64_t offset, uint64_t length) const = 0;

    virtual uint64_t Size() const = 0;
};

// ============================================================================
// MemoryImageSource - image held in an owned buffer
// ============================================================================

class MemoryImageSource : public ImageSource {
public:
    MemoryImageSource() = default;

    explicit MemoryImageSource(std::vector<uint8_t> bytes)
        : m_bytes(std::move(bytes))
    {}

    std::vector<uint8_t> ReadAt(uint64_t offset, uint64_t length) const override {
        if (offset > m_bytes.size() || length > m_bytes.size() - offset) {
            throw DiskReadError(offset, length, 0);
        }
        auto first = m_bytes.begin() + static_cast<std::ptrdiff_t>(offset);
        return std::vector<uint8_t>(first, first + static_cast<std::ptrdiff_t>(length));
    }

    uint64_t Size() const override { return m_bytes.size(); }

    const std::vector<uint8_t>& Bytes() const { return m_bytes; }
    std::vector<uint8_t>& Bytes() { return m_bytes; }

private:
    std::vector<uint8_t> m_bytes;
};

} // namespace FSV
