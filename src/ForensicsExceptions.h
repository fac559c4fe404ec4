// ============================================================================
// ForensicsExceptions.h - Exception Types for FAT Forensic Operations
// ============================================================================
// Defines the exception classes raised while analysing a FAT volume.
// Every exception carries an ErrorKind so sweeps can aggregate failures
// per category instead of terminating on the first error.
// ============================================================================

#pragma once

#include <climits>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace FSV {

// ============================================================================
// Error Categories
// ============================================================================

enum class ErrorKind {
    MalformedBootSector,    // Fatal for the volume
    OutOfRange,             // Fatal for a single read
    CorruptChain,           // Fatal for one active file
    InvalidStartCluster,    // Deleted entry skipped
    RecursionLimitExceeded, // Deleted directory branch skipped
    ChecksumMismatch,       // LFN discarded, never thrown
    OperationCancelled
};

inline const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedBootSector:    return "MalformedBootSector";
        case ErrorKind::OutOfRange:             return "OutOfRange";
        case ErrorKind::CorruptChain:           return "CorruptChain";
        case ErrorKind::InvalidStartCluster:    return "InvalidStartCluster";
        case ErrorKind::RecursionLimitExceeded: return "RecursionLimitExceeded";
        case ErrorKind::ChecksumMismatch:       return "ChecksumMismatch";
        case ErrorKind::OperationCancelled:     return "OperationCancelled";
    }
    return "Unknown";
}

// ============================================================================
// Base Exception Class
// ============================================================================

class ForensicsException : public std::runtime_error {
public:
    ForensicsException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , m_kind(kind)
    {}

    ErrorKind Kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

// ============================================================================
// Boot Sector / Geometry Errors
// ============================================================================

class MalformedBootSectorError : public ForensicsException {
public:
    explicit MalformedBootSectorError(const std::string& reason)
        : ForensicsException(ErrorKind::MalformedBootSector, "Malformed boot sector: " + reason)
    {}
};

// ============================================================================
// Range Errors
// ============================================================================

class OutOfRangeError : public ForensicsException {
public:
    explicit OutOfRangeError(const std::string& message)
        : ForensicsException(ErrorKind::OutOfRange, message)
    {}
};

class DiskReadError : public OutOfRangeError {
public:
    DiskReadError(uint64_t offset, uint64_t length, int errorCode)
        : OutOfRangeError(BuildMessage(offset, length, errorCode))
        , m_offset(offset)
        , m_length(length)
        , m_errorCode(errorCode)
    {}

    uint64_t Offset() const { return m_offset; }
    uint64_t Length() const { return m_length; }
    int ErrorCode() const { return m_errorCode; }

private:
    static std::string BuildMessage(uint64_t offset, uint64_t length, int errorCode) {
        char buffer[256];
        snprintf(buffer, sizeof(buffer),
                "Failed to read %llu bytes at offset %llu (error code: %d)",
                static_cast<unsigned long long>(length),
                static_cast<unsigned long long>(offset),
                errorCode);
        return std::string(buffer);
    }

    uint64_t m_offset;
    uint64_t m_length;
    int m_errorCode;
};

class ClusterOutOfBoundsError : public OutOfRangeError {
public:
    ClusterOutOfBoundsError(uint64_t cluster, uint64_t maxCluster)
        : OutOfRangeError(BuildMessage(cluster, maxCluster))
        , m_cluster(cluster)
        , m_maxCluster(maxCluster)
    {}

    uint64_t Cluster() const { return m_cluster; }
    uint64_t MaxCluster() const { return m_maxCluster; }

private:
    static std::string BuildMessage(uint64_t cluster, uint64_t maxCluster) {
        char buffer[256];
        snprintf(buffer, sizeof(buffer),
                "Cluster %llu is out of bounds (valid: 2..%llu)",
                static_cast<unsigned long long>(cluster),
                static_cast<unsigned long long>(maxCluster));
        return std::string(buffer);
    }

    uint64_t m_cluster;
    uint64_t m_maxCluster;
};

// ============================================================================
// Cluster Chain Errors
// ============================================================================

class CorruptChainError : public ForensicsException {
public:
    CorruptChainError(uint32_t startCluster, uint32_t cluster, const std::string& reason)
        : ForensicsException(ErrorKind::CorruptChain, BuildMessage(startCluster, cluster, reason))
        , m_startCluster(startCluster)
        , m_cluster(cluster)
    {}

    uint32_t StartCluster() const { return m_startCluster; }
    uint32_t Cluster() const { return m_cluster; }

private:
    static std::string BuildMessage(uint32_t startCluster, uint32_t cluster, const std::string& reason) {
        char buffer[512];
        snprintf(buffer, sizeof(buffer),
                "Corrupt cluster chain starting at %u (cluster %u): %s",
                startCluster, cluster, reason.c_str());
        return std::string(buffer);
    }

    uint32_t m_startCluster;
    uint32_t m_cluster;
};

// ============================================================================
// Recovery Errors
// ============================================================================

class InvalidStartClusterError : public ForensicsException {
public:
    InvalidStartClusterError(uint32_t startCluster, uint64_t clusterCount, uint64_t maxCluster)
        : ForensicsException(ErrorKind::InvalidStartCluster,
                             BuildMessage(startCluster, clusterCount, maxCluster))
        , m_startCluster(startCluster)
    {}

    uint32_t StartCluster() const { return m_startCluster; }

private:
    static std::string BuildMessage(uint32_t startCluster, uint64_t clusterCount, uint64_t maxCluster) {
        char buffer[256];
        snprintf(buffer, sizeof(buffer),
                "Invalid start cluster %u for a run of %llu clusters (valid: 2..%llu)",
                startCluster,
                static_cast<unsigned long long>(clusterCount),
                static_cast<unsigned long long>(maxCluster));
        return std::string(buffer);
    }

    uint32_t m_startCluster;
};

class RecursionLimitExceededError : public ForensicsException {
public:
    RecursionLimitExceededError(const std::string& path, uint32_t depthLimit)
        : ForensicsException(ErrorKind::RecursionLimitExceeded,
                             "Recursion limit " + std::to_string(depthLimit) +
                             " exceeded at '" + path + "'")
        , m_depthLimit(depthLimit)
    {}

    uint32_t DepthLimit() const { return m_depthLimit; }

private:
    uint32_t m_depthLimit;
};

class OperationCancelledError : public ForensicsException {
public:
    OperationCancelledError()
        : ForensicsException(ErrorKind::OperationCancelled, "Operation cancelled")
    {}
};

// ============================================================================
// Output Errors (host side, outside the volume)
// ============================================================================

class OutputError : public std::runtime_error {
public:
    explicit OutputError(const std::string& message)
        : std::runtime_error(message)
    {}
};

class DiskWriteError : public OutputError {
public:
    DiskWriteError(const std::string& path, int errorCode)
        : OutputError(BuildMessage(path, errorCode))
        , m_path(path)
        , m_errorCode(errorCode)
    {}

    const std::string& Path() const { return m_path; }
    int ErrorCode() const { return m_errorCode; }

private:
    static std::string BuildMessage(const std::string& path, int errorCode) {
        char buffer[512];
        snprintf(buffer, sizeof(buffer),
                "Failed to write to file '%s' (error code: %d)",
                path.c_str(), errorCode);
        return std::string(buffer);
    }

    std::string m_path;
    int m_errorCode;
};

class DestinationInvalidError : public OutputError {
public:
    explicit DestinationInvalidError(const std::string& reason)
        : OutputError("Invalid recovery destination: " + reason)
    {}
};

} // namespace FSV
