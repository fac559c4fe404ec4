// ============================================================================
// RecoveryEngine.cpp - Deleted-File Recovery Engine Implementation
// ============================================================================

#include "RecoveryEngine.h"
#include "SafetyLimits.h"

#include <algorithm>
#include <utility>

namespace FSV {

namespace {

// FAT entries inspected per positional read
constexpr uint64_t FAT_INSPECT_BATCH = 65536;

std::string JoinPath(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "/" + name;
}

} // namespace

RecoveryEngine::RecoveryEngine(const VolumeGeometry& geometry,
                               const ImageSource& image,
                               const ScanConfiguration& config)
    : m_geometry(geometry)
    , m_image(image)
    , m_config(config)
    , m_fat(FatTable::Open(geometry, image, config.fatIndex))
{
}

RecoveryEngine::~RecoveryEngine() = default;

// ============================================================================
// Run Planning
// ============================================================================

uint64_t RecoveryEngine::ClusterCountFor(const DirectoryEntry& entry) const {
    uint64_t bytesPerCluster = m_geometry.bytesPerCluster;
    uint64_t count = (static_cast<uint64_t>(entry.fileSize) + bytesPerCluster - 1) / bytesPerCluster;

    if (entry.IsDirectory()) {
        // Directory entries normally record size 0
        count = std::max<uint64_t>(count, std::max<uint32_t>(m_config.deletedDirectoryClusters, 1));
    }
    return count;
}

ClusterRun RecoveryEngine::PlanRun(const DirectoryEntry& entry) const {
    uint64_t count = ClusterCountFor(entry);
    if (count == 0) {
        return ClusterRun();
    }

    uint64_t start = entry.startCluster;
    uint64_t maxCluster = m_geometry.MaxCluster();
    if (start < Constants::FIRST_DATA_CLUSTER || start > maxCluster || count > maxCluster - start + 1) {
        throw InvalidStartClusterError(entry.startCluster, count, maxCluster);
    }

    return ClusterRun(start, count, 0);
}

// ============================================================================
// FAT Inspection
// ============================================================================

void RecoveryEngine::InspectRun(const ClusterRun& run, RecoveredFile& result,
                                const CancellationToken* cancel) const
{
    uint64_t cluster = run.startCluster;
    uint64_t remaining = run.clusterCount;

    while (remaining > 0) {
        CheckCancelled(cancel);

        uint64_t batch = std::min(remaining, FAT_INSPECT_BATCH);
        auto values = m_fat->ReadEntries(cluster, batch);

        for (uint64_t i = 0; i < values.size(); ++i) {
            if (!values[i].IsFree()) {
                result.overwrittenClusters.push_back(static_cast<uint32_t>(cluster + i));
            }
        }

        cluster += batch;
        remaining -= batch;
    }

    result.confidence = result.overwrittenClusters.empty()
        ? RecoveryConfidence::Clean
        : RecoveryConfidence::Overwritten;
}

// ============================================================================
// Data Transfer
// ============================================================================

void RecoveryEngine::StreamRun(const ClusterRun& run, uint64_t byteCount, uint64_t chunkSize,
                               const ChunkSink& sink, const CancellationToken* cancel) const
{
    if (chunkSize == 0) {
        chunkSize = m_config.streamChunkSize;
    }
    chunkSize = std::min<uint64_t>(chunkSize, Limits::MAX_SINGLE_READ);

    uint64_t base = m_geometry.ClusterToByteOffset(run.startCluster);
    uint64_t position = 0;

    while (position < byteCount) {
        CheckCancelled(cancel);

        uint64_t length = std::min(chunkSize, byteCount - position);
        auto chunk = m_image.ReadAt(base + position, length);
        if (sink) {
            sink(chunk.data(), chunk.size());
        }
        position += length;
    }
}

RecoveredFile RecoveryEngine::Recover(const DirectoryEntry& entry,
                                      const std::string& path,
                                      uint64_t chunkSize,
                                      const ChunkSink& sink,
                                      const CancellationToken* cancel) const
{
    RecoveredFile result;
    result.entry = entry;
    result.path = path.empty() ? entry.name : path;

    // Validated before any read
    ClusterRun run = PlanRun(entry);
    result.run = run;
    if (!run.IsValid()) {
        return result;
    }

    CheckCancelled(cancel);
    InspectRun(run, result, cancel);

    // Files end at their declared size, directories span the whole run
    uint64_t byteCount = entry.IsDirectory()
        ? run.ByteSize(m_geometry.bytesPerCluster)
        : static_cast<uint64_t>(entry.fileSize);

    StreamRun(run, byteCount, chunkSize, sink, cancel);
    return result;
}

// ============================================================================
// Public Recovery Operations
// ============================================================================

RecoveredFile RecoveryEngine::RecoverDeletedFile(const DirectoryEntry& entry,
                                                 const std::string& path,
                                                 const CancellationToken* cancel) const
{
    std::vector<uint8_t> data;
    RecoveredFile result = Recover(entry, path, m_config.streamChunkSize,
        [&data](const uint8_t* chunk, size_t length) {
            data.insert(data.end(), chunk, chunk + length);
        },
        cancel);

    result.data = std::move(data);
    return result;
}

RecoveredFile RecoveryEngine::StreamDeletedFile(const DirectoryEntry& entry,
                                                uint64_t chunkSize,
                                                const ChunkSink& sink,
                                                const std::string& path,
                                                const CancellationToken* cancel) const
{
    return Recover(entry, path, chunkSize, sink, cancel);
}

std::vector<RecoveryOutcome> RecoveryEngine::RecoverDeleted(const DirectoryEntry& entry,
                                                            uint32_t depthLimit,
                                                            const std::string& path,
                                                            const CancellationToken* cancel) const
{
    std::vector<RecoveryOutcome> outcomes;

    // Explicit work stack, processed depth-first in directory order
    std::vector<WorkItem> stack;
    stack.push_back({ entry, path.empty() ? entry.name : path, 0, {} });

    while (!stack.empty()) {
        CheckCancelled(cancel);

        WorkItem item = std::move(stack.back());
        stack.pop_back();

        if (item.entry.IsDirectory() && item.depth > depthLimit) {
            RecursionLimitExceededError error(item.path, depthLimit);
            outcomes.push_back(RecoveryOutcome::Failure(item.path, error.Kind(), error.what()));
            continue;
        }

        try {
            if (item.entry.IsDirectory() &&
                std::find(item.ancestors.begin(), item.ancestors.end(), item.entry.startCluster) !=
                    item.ancestors.end()) {
                throw CorruptChainError(item.entry.startCluster, item.entry.startCluster,
                                        "deleted directory refers back to an ancestor");
            }

            RecoveredFile file = RecoverDeletedFile(item.entry, item.path, cancel);

            if (item.entry.IsDirectory() && m_config.recoverDeletedDirectories) {
                std::vector<uint32_t> lineage = item.ancestors;
                lineage.push_back(item.entry.startCluster);

                std::vector<WorkItem> children;
                DirectoryCursor cursor(file.data, m_geometry.fsType);
                DirectoryEntry child;
                while (cursor.Next(child)) {
                    if (child.IsRecoveryCandidate()) {
                        children.push_back({ child, JoinPath(item.path, child.name), item.depth + 1, lineage });
                    }
                }
                for (auto it = children.rbegin(); it != children.rend(); ++it) {
                    stack.push_back(std::move(*it));
                }
            }

            outcomes.push_back(RecoveryOutcome::Success(std::move(file)));
        } catch (const OperationCancelledError&) {
            throw;
        } catch (const ForensicsException& e) {
            outcomes.push_back(RecoveryOutcome::Failure(item.path, e.Kind(), e.what()));
        }
    }

    return outcomes;
}

} // namespace FSV
