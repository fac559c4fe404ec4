// ============================================================================
// ScanConfiguration.cpp - Scan Settings Persistence
// ============================================================================

#include "ScanConfiguration.h"
#include "StringUtils.h"
#include "SafetyLimits.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

namespace FSV {

namespace {

std::string Trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

uint64_t ParseUnsigned(const std::string& key, const std::string& value) {
    if (value.empty() || value[0] == '-') {
        throw std::invalid_argument("Invalid value for '" + key + "': " + value);
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(value.c_str(), &end, 0);
    if (errno != 0 || end == value.c_str() || *end != '\0') {
        throw std::invalid_argument("Invalid value for '" + key + "': " + value);
    }
    return static_cast<uint64_t>(parsed);
}

uint32_t ParseUnsigned32(const std::string& key, const std::string& value) {
    uint64_t parsed = ParseUnsigned(key, value);
    if (parsed > UINT32_MAX) {
        throw std::invalid_argument("Value out of range for '" + key + "': " + value);
    }
    return static_cast<uint32_t>(parsed);
}

bool ParseBool(const std::string& key, const std::string& value) {
    std::string lower = StringUtils::ToLower(value);
    if (lower == "true" || lower == "yes" || lower == "1") return true;
    if (lower == "false" || lower == "no" || lower == "0") return false;
    throw std::invalid_argument("Invalid boolean for '" + key + "': " + value);
}

} // namespace

void ScanConfiguration::Set(const std::string& key, const std::string& value) {
    if (key == "recursion_depth_limit") {
        uint32_t depth = ParseUnsigned32(key, value);
        if (depth > Limits::MAX_RECURSION_DEPTH) {
            throw std::invalid_argument("recursion_depth_limit must not exceed " +
                                        std::to_string(Limits::MAX_RECURSION_DEPTH));
        }
        recursionDepthLimit = depth;
    } else if (key == "deleted_directory_clusters") {
        deletedDirectoryClusters = ParseUnsigned32(key, value);
        if (deletedDirectoryClusters == 0) {
            throw std::invalid_argument("deleted_directory_clusters must be at least 1");
        }
    } else if (key == "recover_deleted_directories") {
        recoverDeletedDirectories = ParseBool(key, value);
    } else if (key == "max_directories") {
        maxDirectories = ParseUnsigned(key, value);
    } else if (key == "directory_read_limit") {
        directoryReadLimit = ParseUnsigned(key, value);
    } else if (key == "fat_index") {
        fatIndex = ParseUnsigned32(key, value);
    } else if (key == "folder_filter") {
        folderFilter = value;
    } else if (key == "filename_filter") {
        filenameFilter = value;
    } else if (key == "stream_chunk_size") {
        streamChunkSize = ParseUnsigned(key, value);
        if (streamChunkSize == 0) {
            throw std::invalid_argument("stream_chunk_size must be non-zero");
        }
    } else if (key == "progress_directory_interval") {
        progressDirectoryInterval = ParseUnsigned(key, value);
    } else {
        throw std::invalid_argument("Unknown configuration key: " + key);
    }
}

ScanConfiguration ScanConfiguration::Load(const std::string& path) {
    ScanConfiguration config;

    std::ifstream in(path);
    if (!in.is_open()) {
        return config;
    }

    std::string line;
    size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;

        size_t comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        line = Trim(line);
        if (line.empty()) continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument(path + ":" + std::to_string(lineNumber) +
                                        ": expected 'key = value'");
        }

        std::string key = StringUtils::ToLower(Trim(line.substr(0, eq)));
        std::string value = Trim(line.substr(eq + 1));
        try {
            config.Set(key, value);
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument(path + ":" + std::to_string(lineNumber) + ": " + e.what());
        }
    }

    if (in.bad()) {
        throw std::runtime_error("Failed to read configuration file: " + path);
    }
    return config;
}

bool ScanConfiguration::Save(const std::string& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }

    out << "# fatsalvage scan configuration\n";
    out << "recursion_depth_limit = " << recursionDepthLimit << "\n";
    out << "deleted_directory_clusters = " << deletedDirectoryClusters << "\n";
    out << "recover_deleted_directories = " << (recoverDeletedDirectories ? "true" : "false") << "\n";
    out << "max_directories = " << maxDirectories << "\n";
    out << "directory_read_limit = " << directoryReadLimit << "\n";
    out << "fat_index = " << fatIndex << "\n";
    out << "folder_filter = " << folderFilter << "\n";
    out << "filename_filter = " << filenameFilter << "\n";
    out << "stream_chunk_size = " << streamChunkSize << "\n";
    out << "progress_directory_interval = " << progressDirectoryInterval << "\n";

    out.flush();
    return out.good();
}

} // namespace FSV
