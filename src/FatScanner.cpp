// ============================================================================
// FatScanner.cpp - FAT16/FAT32 Volume Sweep Implementation
// ============================================================================

#include "FatScanner.h"
#include "Constants.h"
#include "StringUtils.h"

#include <cstdio>
#include <deque>
#include <string>
#include <utility>

namespace FSV {

namespace {

std::string JoinPath(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "/" + name;
}

} // namespace

FatScanner::FatScanner(const VolumeGeometry& geometry,
                       const ImageSource& image,
                       const ScanConfiguration& config)
    : m_geometry(geometry)
    , m_image(image)
    , m_config(config)
    , m_engine(geometry, image, config)
{
}

FatScanner::~FatScanner() = default;

bool FatScanner::MatchesFilters(const std::string& directoryPath, const DirectoryEntry& entry) const {
    return StringUtils::ContainsIgnoreCase(directoryPath, m_config.folderFilter) &&
           StringUtils::ContainsIgnoreCase(entry.name, m_config.filenameFilter);
}

SweepReport FatScanner::WalkDirectories(const EntryCallback& onEntry,
                                        const ProgressCallback& onProgress,
                                        const CancellationToken* cancel)
{
    SweepReport report;
    Walk(report, onEntry, onProgress, cancel);
    return report;
}

SweepReport FatScanner::ScanVolume(const ProgressCallback& onProgress,
                                   const CancellationToken* cancel)
{
    SweepReport report;

    Walk(report, [&](const std::string& directoryPath, const DirectoryEntry& entry) {
        if (!entry.IsRecoveryCandidate() || !MatchesFilters(directoryPath, entry)) {
            return;
        }

        report.candidatesFound++;
        auto outcomes = m_engine.RecoverDeleted(entry, m_config.recursionDepthLimit,
                                                JoinPath(directoryPath, entry.name), cancel);
        for (auto& outcome : outcomes) {
            report.Add(std::move(outcome));
        }
    }, onProgress, cancel);

    if (onProgress) {
        char summary[256];
        snprintf(summary, sizeof(summary),
                 "Recovered %llu clean, %llu overwritten, %llu failed",
                 static_cast<unsigned long long>(report.recovered),
                 static_cast<unsigned long long>(report.partial),
                 static_cast<unsigned long long>(report.failed));
        onProgress(summary, -1.0f);
    }

    return report;
}

void FatScanner::Walk(SweepReport& report,
                      const EntryCallback& onEntry,
                      const ProgressCallback& onProgress,
                      const CancellationToken* cancel)
{
    const char* fsName = FilesystemTypeName(m_geometry.fsType);

    m_visited.clear();
    if (!m_geometry.HasFixedRootRegion()) {
        m_visited.insert(m_geometry.rootCluster);
    }

    std::deque<DirectoryWorkItem> dirQueue;
    dirQueue.push_back({ DirectoryLocation::Root(), "" });

    if (onProgress) {
        onProgress(std::string("Starting ") + fsName + " structure scan...", 0.0f);
    }

    while (!dirQueue.empty()) {
        CheckCancelled(cancel);

        if (report.directoriesScanned >= m_config.maxDirectories) {
            report.directoryLimitReached = true;
            if (onProgress) {
                onProgress("Directory limit reached", 0.9f);
            }
            break;
        }

        DirectoryWorkItem current = dirQueue.front();
        dirQueue.pop_front();

        try {
            ProcessDirectory(current, dirQueue, onEntry, cancel);
        } catch (const OperationCancelledError&) {
            throw;
        } catch (const ForensicsException& e) {
            std::string path = current.path.empty() ? "/" : current.path;
            report.directoryFailures.push_back({ path, e.Kind(), e.what() });
            if (onProgress) {
                onProgress("Failed to read directory " + path + ": " + e.what(), -1.0f);
            }
        }
        report.directoriesScanned++;

        if (onProgress && m_config.progressDirectoryInterval > 0 &&
            (report.directoriesScanned % m_config.progressDirectoryInterval) == 0) {
            char statusMsg[256];
            snprintf(statusMsg, sizeof(statusMsg), "%s Scan: %llu directories, %llu deleted entries found",
                     fsName,
                     static_cast<unsigned long long>(report.directoriesScanned),
                     static_cast<unsigned long long>(report.candidatesFound));
            onProgress(statusMsg, 0.5f);
        }
    }

    if (onProgress) {
        char completeMsg[256];
        snprintf(completeMsg, sizeof(completeMsg), "%s scan complete: %llu directories scanned",
                 fsName, static_cast<unsigned long long>(report.directoriesScanned));
        onProgress(completeMsg, 1.0f);
    }
}

void FatScanner::ProcessDirectory(const DirectoryWorkItem& dirItem,
                                  std::deque<DirectoryWorkItem>& subDirs,
                                  const EntryCallback& onEntry,
                                  const CancellationToken* cancel)
{
    auto data = ReadDirectoryBytes(m_geometry, m_image, dirItem.location,
                                   m_config.fatIndex, m_config.directoryReadLimit, cancel);

    DirectoryCursor cursor(data, m_geometry.fsType);
    DirectoryEntry entry;

    while (cursor.Next(entry)) {
        // ====================================================================
        // Queue active subdirectories, each cluster once
        // ====================================================================
        if (entry.IsDirectory() && !entry.isDeleted &&
            entry.startCluster >= Constants::FIRST_DATA_CLUSTER &&
            m_visited.insert(entry.startCluster).second) {
            subDirs.push_back({ DirectoryLocation::Cluster(entry.startCluster),
                                JoinPath(dirItem.path, entry.name) });
        }

        if (onEntry) {
            onEntry(dirItem.path, entry);
        }
    }
}

} // namespace FSV
