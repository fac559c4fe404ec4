// ============================================================================
// RecoveryWriter.cpp - Recovered File Output Implementation
// ============================================================================

#include "RecoveryWriter.h"
#include "StringUtils.h"

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace FSV {

namespace fs = std::filesystem;

namespace {

bool SameFile(const fs::path& a, const fs::path& b) {
    std::error_code ec;
    if (!fs::exists(a, ec) || !fs::exists(b, ec)) {
        return false;
    }
    return fs::equivalent(a, b, ec);
}

std::string WithSuffix(const std::string& name, uint64_t cluster) {
    std::string suffix = "_" + std::to_string(cluster);
    size_t dotPos = name.rfind('.');
    if (dotPos == std::string::npos || dotPos == 0) {
        return name + suffix;
    }
    return name.substr(0, dotPos) + suffix + name.substr(dotPos);
}

} // namespace

RecoveryWriter::RecoveryWriter(const std::string& imagePath, const std::string& destinationFolder)
    : m_imagePath(imagePath)
    , m_destinationFolder(destinationFolder)
{
    if (!ValidateDestination(imagePath, destinationFolder)) {
        throw DestinationInvalidError(destinationFolder);
    }

    std::error_code ec;
    fs::create_directories(destinationFolder, ec);
    if (ec) {
        throw DestinationInvalidError("cannot create '" + destinationFolder + "': " + ec.message());
    }
}

RecoveryWriter::~RecoveryWriter() = default;

// ============================================================================
// Destination Validation
// ============================================================================

bool RecoveryWriter::ValidateDestination(const std::string& imagePath, const std::string& destinationFolder) {
    if (destinationFolder.empty()) {
        return false;
    }

    std::error_code ec;
    fs::path dest = fs::weakly_canonical(fs::path(destinationFolder), ec);
    if (ec) {
        return false;
    }

    if (SameFile(dest, fs::path(imagePath))) {
        return false;
    }

    if (fs::exists(dest, ec) && !fs::is_directory(dest, ec)) {
        return false;
    }

    return true;
}

// ============================================================================
// Output Paths
// ============================================================================

std::string RecoveryWriter::OutputPathFor(const RecoveredFile& file) {
    fs::path out(m_destinationFolder);

    // Volume paths are '/' separated
    std::string volumePath = file.path.empty() ? file.entry.name : file.path;
    size_t start = 0;
    while (start <= volumePath.size()) {
        size_t slash = volumePath.find('/', start);
        std::string component = volumePath.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        if (slash == std::string::npos) {
            out /= StringUtils::SanitizeFileName(component);
            break;
        }
        if (!component.empty()) {
            out /= StringUtils::SanitizeFileName(component);
        }
        start = slash + 1;
    }

    std::string candidate = out.string();
    if (m_usedPaths.count(candidate) != 0) {
        out.replace_filename(WithSuffix(out.filename().string(), file.run.startCluster));
        candidate = out.string();
    }
    m_usedPaths.insert(candidate);
    return candidate;
}

// ============================================================================
// Writing
// ============================================================================

std::string RecoveryWriter::WriteRecoveredFile(const RecoveredFile& file) {
    std::string outputPath = OutputPathFor(file);
    fs::path target(outputPath);

    if (SameFile(target, fs::path(m_imagePath))) {
        throw DestinationInvalidError("output would overwrite the source image");
    }

    std::error_code ec;
    if (file.IsDirectory()) {
        fs::create_directories(target, ec);
        if (ec) {
            throw DiskWriteError(outputPath, ec.value());
        }
        return outputPath;
    }

    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw DiskWriteError(outputPath, ec.value());
    }

    std::ofstream outFile(outputPath, std::ios::binary | std::ios::trunc);
    if (!outFile.is_open()) {
        throw DiskWriteError(outputPath, errno);
    }

    outFile.write(reinterpret_cast<const char*>(file.data.data()),
                  static_cast<std::streamsize>(file.data.size()));
    outFile.flush();
    outFile.close();

    if (!outFile.good()) {
        throw DiskWriteError(outputPath, errno);
    }
    return outputPath;
}

size_t RecoveryWriter::WriteOutcomes(const std::vector<RecoveryOutcome>& outcomes,
                                     const ProgressCallback& onProgress)
{
    size_t written = 0;
    size_t total = outcomes.size();

    for (size_t i = 0; i < total; ++i) {
        const RecoveryOutcome& outcome = outcomes[i];

        if (!outcome.success) {
            if (onProgress) {
                onProgress("Skipped " + outcome.path + ": " + outcome.message, -1.0f);
            }
            continue;
        }

        if (onProgress) {
            char progressMsg[512];
            snprintf(progressMsg, sizeof(progressMsg), "Recovering %s (%zu/%zu)",
                     outcome.path.c_str(), i + 1, total);
            onProgress(progressMsg, static_cast<float>(i) / static_cast<float>(total));
        }

        try {
            WriteRecoveredFile(*outcome.file);
            ++written;
        } catch (const OutputError& e) {
            if (onProgress) {
                onProgress(std::string("Failed to write ") + outcome.path + ": " + e.what(), -1.0f);
            }
        }
    }

    if (onProgress) {
        char completeMsg[256];
        snprintf(completeMsg, sizeof(completeMsg), "Recovery complete: %zu/%zu entries written",
                 written, total);
        onProgress(completeMsg, 1.0f);
    }

    return written;
}

} // namespace FSV
