// ============================================================================
// DiskHandle.cpp - POSIX Disk Image Access
// ============================================================================

#include "DiskHandle.h"
#include "SafetyLimits.h"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace FSV {

namespace {
constexpr uint64_t MAX_READ_CHUNK = 16ULL * 1024 * 1024;
}

DiskHandle::DiskHandle(const std::string& path)
    : m_path(path)
    , m_fd(-1)
    , m_size(0)
{
}

DiskHandle::~DiskHandle() {
    Close();
}

bool DiskHandle::Open() {
    if (m_fd >= 0) {
        return true;
    }

    m_fd = ::open(m_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (m_fd < 0) {
        return false;
    }

    struct stat st = {};
    if (::fstat(m_fd, &st) == 0 && S_ISREG(st.st_mode)) {
        m_size = static_cast<uint64_t>(st.st_size);
    } else {
        // Block devices report their length through lseek
        off_t end = ::lseek(m_fd, 0, SEEK_END);
        m_size = end > 0 ? static_cast<uint64_t>(end) : 0;
    }

    return true;
}

void DiskHandle::Close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
    m_size = 0;
}

std::vector<uint8_t> DiskHandle::ReadAt(uint64_t offset, uint64_t length) const {
    if (m_fd < 0) {
        throw DiskReadError(offset, length, EBADF);
    }
    if (length == 0) {
        return {};
    }
    if (length > Limits::MAX_SINGLE_READ) {
        throw DiskReadError(offset, length, EFBIG);
    }
    if (offset > m_size || length > m_size - offset) {
        throw DiskReadError(offset, length, ERANGE);
    }

    std::vector<uint8_t> buffer(static_cast<size_t>(length));
    uint64_t bufferOffset = 0;

    while (bufferOffset < length) {
        uint64_t chunkSize = std::min(length - bufferOffset, MAX_READ_CHUNK);
        ssize_t bytesRead = ::pread(m_fd,
                                    buffer.data() + bufferOffset,
                                    static_cast<size_t>(chunkSize),
                                    static_cast<off_t>(offset + bufferOffset));
        if (bytesRead < 0) {
            if (errno == EINTR) continue;
            throw DiskReadError(offset, length, errno);
        }
        if (bytesRead == 0) {
            throw DiskReadError(offset, length, EIO);
        }
        bufferOffset += static_cast<uint64_t>(bytesRead);
    }

    return buffer;
}

std::vector<uint8_t> DiskHandle::ReadSectors(uint64_t startSector, uint64_t numSectors, uint64_t sectorSize) const {
    if (numSectors == 0 || sectorSize == 0) {
        return {};
    }
    if (numSectors > (UINT64_MAX / sectorSize) || startSector > (UINT64_MAX / sectorSize)) {
        throw DiskReadError(startSector, numSectors, EOVERFLOW);
    }
    return ReadAt(startSector * sectorSize, numSectors * sectorSize);
}

uint64_t DiskHandle::Size() const {
    return m_size;
}

} // namespace FSV
