// ============================================================================
// RecoveryWriter.h - Writes Recovered Files to a Host Folder
// ============================================================================
// Mirrors the volume path of each recovered entry below a destination
// folder. The source image is never opened for writing and may not be the
// destination.
// ============================================================================

#pragma once

#include "RecoveryResult.h"

#include <functional>
#include <set>
#include <string>
#include <vector>

namespace FSV {

class RecoveryWriter {
public:
    using ProgressCallback = std::function<void(const std::string&, float)>;

    // Throws: DestinationInvalidError
    RecoveryWriter(const std::string& imagePath, const std::string& destinationFolder);
    ~RecoveryWriter();

    // Returns false if the destination is the image itself or an existing
    // non-directory.
    static bool ValidateDestination(const std::string& imagePath, const std::string& destinationFolder);

    // Host path for a volume path; each component is sanitized and a
    // duplicate gets the start cluster appended.
    std::string OutputPathFor(const RecoveredFile& file);

    // Throws: DiskWriteError, DestinationInvalidError
    std::string WriteRecoveredFile(const RecoveredFile& file);

    // Write every successful outcome; failures are reported through
    // onProgress with a negative progress value. Returns the number written.
    size_t WriteOutcomes(const std::vector<RecoveryOutcome>& outcomes, const ProgressCallback& onProgress);

    const std::string& DestinationFolder() const { return m_destinationFolder; }

private:
    std::string m_imagePath;
    std::string m_destinationFolder;
    std::set<std::string> m_usedPaths;
};

} // namespace FSV
