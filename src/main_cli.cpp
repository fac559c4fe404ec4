// ============================================================================
// main_cli.cpp - Command-Line Interface Implementation
// ============================================================================

#include "main_cli.h"
#include "DiskHandle.h"
#include "PartitionTable.h"
#include "VolumeGeometry.h"
#include "FatTable.h"
#include "ClusterChain.h"
#include "FatScanner.h"
#include "RecoveryWriter.h"
#include "ScanConfiguration.h"
#include "StringUtils.h"
#include "SafetyLimits.h"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

namespace FSV {

namespace {

// CLI configuration parsed from command-line arguments
struct CLIConfig {
    std::string imagePath;
    std::string outputFolder;
    std::string csvPath;
    std::string configPath;
    std::string folderFilter;
    std::string filenameFilter;

    bool hasOffset;
    uint64_t offset;
    int partitionIndex;

    bool hasDepth;
    uint32_t depth;
    bool hasFatIndex;
    uint32_t fatIndex;

    bool enableList;
    bool enableTrace;
    bool enableRecovery;
    bool enableVerifyFat;
    bool showHelp;

    CLIConfig()
        : hasOffset(false)
        , offset(0)
        , partitionIndex(0)
        , hasDepth(false)
        , depth(0)
        , hasFatIndex(false)
        , fatIndex(0)
        , enableList(false)
        , enableTrace(false)
        , enableRecovery(false)
        , enableVerifyFat(false)
        , showHelp(false)
    {}
};

// Set from the SIGINT handler
CancellationToken g_cancel;

void OnInterrupt(int) {
    g_cancel.Cancel();
}

void PrintHelp() {
    printf("\n");
    printf("fatsalvage - FAT16/FAT32 deleted file recovery\n");
    printf("==============================================\n\n");
    printf("USAGE:\n");
    printf("  fatsalvage --image <PATH> [OPTIONS] <ACTION>...\n\n");
    printf("REQUIRED:\n");
    printf("  --image <PATH>       Disk image or block device (opened read-only)\n\n");
    printf("VOLUME:\n");
    printf("  --offset <BYTES>     Byte offset of the FAT volume\n");
    printf("  --partition <N>      Use MBR partition slot N (1-4)\n");
    printf("                       Default: sector 0 boot sector or first FAT partition\n\n");
    printf("ACTIONS (at least one required):\n");
    printf("  --list               List directory entries, deleted ones marked DEL\n");
    printf("  --trace              Print cluster chains of active entries\n");
    printf("  --verify-fat         Check the media signature and compare FAT copies\n");
    printf("  --recover            Recover deleted files (requires --output)\n");
    printf("  --csv <FILE>         Recover in memory and export results to CSV\n\n");
    printf("OPTIONS:\n");
    printf("  --output <DIR>       Destination folder for --recover\n");
    printf("  --depth <N>          Nesting limit for deleted directories\n");
    printf("  --fat <N>            FAT copy to consult (0 = primary)\n");
    printf("  --folder <TEXT>      Filter by folder path (case-insensitive)\n");
    printf("  --filename <TEXT>    Filter by file name (case-insensitive)\n");
    printf("  --config <FILE>      Load settings from a key = value file\n\n");
    printf("EXIT CODES:\n");
    printf("  0 = Success\n");
    printf("  1 = Nothing found\n");
    printf("  2 = Invalid arguments\n");
    printf("  3 = Image or volume error\n");
    printf("  4 = Recovery or write failure\n\n");
}

bool ParseNumber(const char* text, uint64_t& value) {
    if (text == nullptr || *text == '\0' || *text == '-') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(text, &end, 0);
    if (errno != 0 || *end != '\0') {
        return false;
    }
    value = static_cast<uint64_t>(parsed);
    return true;
}

bool ParseArguments(int argc, char** argv, CLIConfig& config) {
    for (int i = 1; i < argc; i++) {
        std::string arg = StringUtils::ToLower(argv[i]);
        bool hasValue = i + 1 < argc;
        uint64_t number = 0;

        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            return true;
        }
        else if (arg == "--image" && hasValue) {
            config.imagePath = argv[++i];
        }
        else if (arg == "--offset" && hasValue) {
            if (!ParseNumber(argv[++i], config.offset)) {
                fprintf(stderr, "[ERROR] Invalid offset: %s\n", argv[i]);
                return false;
            }
            config.hasOffset = true;
        }
        else if (arg == "--partition" && hasValue) {
            if (!ParseNumber(argv[++i], number) || number < 1 || number > Constants::MBR::PARTITION_COUNT) {
                fprintf(stderr, "[ERROR] Invalid partition number: %s\n", argv[i]);
                return false;
            }
            config.partitionIndex = static_cast<int>(number);
        }
        else if (arg == "--list") {
            config.enableList = true;
        }
        else if (arg == "--trace") {
            config.enableTrace = true;
        }
        else if (arg == "--verify-fat") {
            config.enableVerifyFat = true;
        }
        else if (arg == "--recover") {
            config.enableRecovery = true;
        }
        else if (arg == "--output" && hasValue) {
            config.outputFolder = argv[++i];
        }
        else if (arg == "--csv" && hasValue) {
            config.csvPath = argv[++i];
        }
        else if (arg == "--depth" && hasValue) {
            if (!ParseNumber(argv[++i], number) || number > Limits::MAX_RECURSION_DEPTH) {
                fprintf(stderr, "[ERROR] Invalid depth: %s\n", argv[i]);
                return false;
            }
            config.depth = static_cast<uint32_t>(number);
            config.hasDepth = true;
        }
        else if (arg == "--fat" && hasValue) {
            if (!ParseNumber(argv[++i], number) || number > UINT32_MAX) {
                fprintf(stderr, "[ERROR] Invalid FAT index: %s\n", argv[i]);
                return false;
            }
            config.fatIndex = static_cast<uint32_t>(number);
            config.hasFatIndex = true;
        }
        else if (arg == "--folder" && hasValue) {
            config.folderFilter = argv[++i];
        }
        else if (arg == "--filename" && hasValue) {
            config.filenameFilter = argv[++i];
        }
        else if (arg == "--config" && hasValue) {
            config.configPath = argv[++i];
        }
        else {
            fprintf(stderr, "[ERROR] Unknown argument: %s\n", argv[i]);
            return false;
        }
    }

    if (config.imagePath.empty()) {
        fprintf(stderr, "[ERROR] Missing required argument: --image\n");
        return false;
    }

    if (config.hasOffset && config.partitionIndex != 0) {
        fprintf(stderr, "[ERROR] --offset and --partition are mutually exclusive\n");
        return false;
    }

    if (!config.enableList && !config.enableTrace && !config.enableVerifyFat &&
        !config.enableRecovery && config.csvPath.empty()) {
        fprintf(stderr, "[ERROR] At least one action required (--list, --trace, --verify-fat, --recover, --csv)\n");
        return false;
    }

    if (config.enableRecovery && config.outputFolder.empty()) {
        fprintf(stderr, "[ERROR] --output required when using --recover\n");
        return false;
    }

    return true;
}

// Progress callback for console output
void OnProgress(const std::string& message, float progress) {
    if (progress >= 0.0f && progress <= 1.0f) {
        int percent = static_cast<int>(progress * 100);
        printf("[PROGRESS] %s [%d%%]\n", message.c_str(), percent);
    } else {
        printf("[INFO] %s\n", message.c_str());
    }
}

const char* EntryTypeTag(const DirectoryEntry& entry) {
    switch (entry.type) {
        case EntryType::Directory:   return "DIR";
        case EntryType::VolumeLabel: return "VOL";
        default:                     return "FILE";
    }
}

std::string JoinPath(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "/" + name;
}

std::string CsvField(const std::string& text) {
    if (text.find_first_of(",\"\n") == std::string::npos) {
        return text;
    }
    std::string quoted = "\"";
    for (char c : text) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    return quoted + "\"";
}

void PrintGeometry(const VolumeGeometry& geometry) {
    printf("[INFO] Filesystem:       %s\n", FilesystemTypeName(geometry.fsType));
    printf("[INFO] Volume offset:    %llu\n", static_cast<unsigned long long>(geometry.volumeStartOffset));
    printf("[INFO] Bytes/sector:     %u\n", geometry.bytesPerSector);
    printf("[INFO] Cluster size:     %llu bytes\n", static_cast<unsigned long long>(geometry.bytesPerCluster));
    printf("[INFO] FAT copies:       %u\n", geometry.fatCount);
    printf("[INFO] Data clusters:    %llu\n", static_cast<unsigned long long>(geometry.totalClusters));
    if (geometry.HasFixedRootRegion()) {
        printf("[INFO] Root entries:     %u\n", geometry.rootEntryCount);
    } else {
        printf("[INFO] Root cluster:     %u\n", geometry.rootCluster);
    }
    printf("\n");
}

// ============================================================================
// Actions
// ============================================================================

int ListEntries(FatScanner& scanner) {
    uint64_t deletedCount = 0;

    printf("%-4s %-4s %12s %10s  %-19s  %s\n", "", "TYPE", "SIZE", "CLUSTER", "MODIFIED", "PATH");

    SweepReport report = scanner.WalkDirectories(
        [&](const std::string& directoryPath, const DirectoryEntry& entry) {
            if (!scanner.MatchesFilters(directoryPath, entry)) {
                return;
            }
            if (entry.isDeleted) {
                deletedCount++;
            }

            std::string note;
            if (entry.lfnStatus == LfnStatus::ChecksumMismatch || entry.lfnStatus == LfnStatus::Orphaned) {
                note = std::string("  [LFN ") + LfnStatusName(entry.lfnStatus) + "]";
            }

            printf("%-4s %-4s %12lu %10u  %-19s  %s%s\n",
                   entry.isDeleted ? "DEL" : "",
                   EntryTypeTag(entry),
                   static_cast<unsigned long>(entry.fileSize),
                   entry.startCluster,
                   entry.Modified().ToString().c_str(),
                   JoinPath(directoryPath, entry.name).c_str(),
                   note.c_str());
        },
        nullptr, &g_cancel);

    for (const auto& failure : report.directoryFailures) {
        fprintf(stderr, "[WARNING] %s: %s\n", failure.path.c_str(), failure.message.c_str());
    }

    printf("\n[INFO] %llu directories, %llu deleted entries\n",
           static_cast<unsigned long long>(report.directoriesScanned),
           static_cast<unsigned long long>(deletedCount));

    return deletedCount == 0 ? EXIT_NOTHING_FOUND : EXIT_OK;
}

int TraceChains(FatScanner& scanner, const VolumeGeometry& geometry,
                const ImageSource& image, const ScanConfiguration& config)
{
    auto fat = FatTable::Open(geometry, image, config.fatIndex);
    uint64_t traced = 0;
    uint64_t corrupt = 0;

    scanner.WalkDirectories(
        [&](const std::string& directoryPath, const DirectoryEntry& entry) {
            if (entry.isDeleted || entry.IsVolumeLabel() ||
                entry.startCluster < Constants::FIRST_DATA_CLUSTER ||
                !scanner.MatchesFilters(directoryPath, entry)) {
                return;
            }

            std::string path = JoinPath(directoryPath, entry.name);
            try {
                ClusterChain chain = TraceActiveChain(geometry, *fat, entry.startCluster, &g_cancel);
                printf("%s: %zu clusters in %zu run(s)", path.c_str(), chain.Length(), chain.runs.RunCount());
                for (const auto& run : chain.runs.GetRuns()) {
                    printf(" [%llu-%llu]",
                           static_cast<unsigned long long>(run.startCluster),
                           static_cast<unsigned long long>(run.LastCluster()));
                }
                printf("\n");
                traced++;
            } catch (const CorruptChainError& e) {
                fprintf(stderr, "[WARNING] %s: %s\n", path.c_str(), e.what());
                corrupt++;
            }
        },
        nullptr, &g_cancel);

    printf("\n[INFO] %llu chains traced, %llu corrupt\n",
           static_cast<unsigned long long>(traced),
           static_cast<unsigned long long>(corrupt));

    return traced + corrupt == 0 ? EXIT_NOTHING_FOUND : EXIT_OK;
}

int VerifyFat(const VolumeGeometry& geometry, const ImageSource& image) {
    auto primary = FatTable::Open(geometry, image, 0);

    if (primary->MediaSignatureValid()) {
        printf("[INFO] FAT media signature: valid (0x%02X)\n", geometry.mediaDescriptor);
    } else {
        printf("[WARNING] FAT media signature does not match media descriptor 0x%02X\n",
               geometry.mediaDescriptor);
    }

    for (uint32_t index = 1; index < geometry.fatCount; ++index) {
        auto backup = FatTable::Open(geometry, image, index);
        auto differences = CompareFatCopies(*primary, *backup, 100);

        if (differences.empty()) {
            printf("[INFO] FAT copy %u matches the primary\n", index);
            continue;
        }

        printf("[WARNING] FAT copy %u differs from the primary in %zu%s entries\n",
               index, differences.size(), differences.size() >= 100 ? "+" : "");
        for (const auto& diff : differences) {
            printf("  cluster %llu: %s 0x%08X vs %s 0x%08X\n",
                   static_cast<unsigned long long>(diff.cluster),
                   FatEntryKindName(diff.primary.kind), diff.primary.raw,
                   FatEntryKindName(diff.backup.kind), diff.backup.raw);
        }
    }

    return EXIT_OK;
}

bool ExportToCSV(const std::string& csvPath, const SweepReport& report) {
    std::ofstream csv(csvPath, std::ios::trunc);
    if (!csv.is_open()) {
        fprintf(stderr, "[ERROR] Failed to create CSV file: %s\n", csvPath.c_str());
        return false;
    }

    csv << "Path,Short_Name,Type,Size,Start_Cluster,Modified,Status,Confidence,Overwritten_Clusters,Error\n";

    for (const auto& outcome : report.outcomes) {
        csv << CsvField(outcome.path) << ",";
        if (outcome.success) {
            const RecoveredFile& file = *outcome.file;
            csv << CsvField(file.entry.shortName) << ","
                << EntryTypeTag(file.entry) << ","
                << file.entry.fileSize << ","
                << file.entry.startCluster << ","
                << file.entry.Modified().ToString() << ","
                << "recovered,"
                << RecoveryConfidenceName(file.confidence) << ","
                << file.overwrittenClusters.size() << ",";
        } else {
            csv << ",,,,,failed,,," << ErrorKindName(outcome.errorKind);
        }
        csv << "\n";
    }

    csv.close();
    if (!csv.good()) {
        fprintf(stderr, "[ERROR] Failed to write CSV file: %s\n", csvPath.c_str());
        return false;
    }

    printf("[INFO] Exported %zu entries to CSV: %s\n", report.outcomes.size(), csvPath.c_str());
    return true;
}

int RecoverFiles(const CLIConfig& cli, FatScanner& scanner) {
    auto startTime = std::chrono::steady_clock::now();
    SweepReport report = scanner.ScanVolume(OnProgress, &g_cancel);
    auto endTime = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::seconds>(endTime - startTime);

    printf("\n");
    printf("=== SCAN COMPLETE ===\n");
    printf("Directories:   %llu\n", static_cast<unsigned long long>(report.directoriesScanned));
    printf("Candidates:    %llu\n", static_cast<unsigned long long>(report.candidatesFound));
    printf("Clean:         %llu\n", static_cast<unsigned long long>(report.recovered));
    printf("Overwritten:   %llu\n", static_cast<unsigned long long>(report.partial));
    printf("Failed:        %llu\n", static_cast<unsigned long long>(report.failed));
    for (const auto& kv : report.failuresByKind) {
        printf("  %-24s %llu\n", ErrorKindName(kv.first), static_cast<unsigned long long>(kv.second));
    }
    printf("Scan time:     %lld seconds\n", static_cast<long long>(duration.count()));
    printf("\n");

    if (!report.directoryFailures.empty() || report.directoryLimitReached) {
        printf("[WARNING] Scan completed with errors\n");
    }

    int result = report.candidatesFound == 0 ? EXIT_NOTHING_FOUND : EXIT_OK;

    if (!cli.csvPath.empty() && !ExportToCSV(cli.csvPath, report)) {
        result = EXIT_RECOVERY_FAILED;
    }

    if (cli.enableRecovery && report.candidatesFound > 0) {
        printf("[INFO] Writing recovered entries to: %s\n", cli.outputFolder.c_str());

        RecoveryWriter writer(cli.imagePath, cli.outputFolder);
        size_t written = writer.WriteOutcomes(report.outcomes, [](const std::string& msg, float progress) {
            if (progress >= 0.0f && progress <= 1.0f) {
                printf("[RECOVERY] %s [%d%%]\n", msg.c_str(), static_cast<int>(progress * 100));
            } else {
                printf("[RECOVERY] %s\n", msg.c_str());
            }
        });

        if (written < report.recovered + report.partial) {
            fprintf(stderr, "[ERROR] %llu recovered entries could not be written\n",
                    static_cast<unsigned long long>(report.recovered + report.partial - written));
            result = EXIT_RECOVERY_FAILED;
        }
    }

    return result;
}

} // namespace

// Main CLI execution
int RunCLI(int argc, char** argv) {
    CLIConfig cli;

    if (!ParseArguments(argc, argv, cli)) {
        fprintf(stderr, "[ERROR] Invalid arguments. Use --help for usage information.\n");
        return EXIT_BAD_ARGUMENTS;
    }

    if (cli.showHelp) {
        PrintHelp();
        return EXIT_OK;
    }

    // ========================================================================
    // Configuration: file first, flags override
    // ========================================================================
    ScanConfiguration config;
    if (!cli.configPath.empty()) {
        try {
            config = ScanConfiguration::Load(cli.configPath);
        } catch (const std::exception& e) {
            fprintf(stderr, "[ERROR] %s\n", e.what());
            return EXIT_BAD_ARGUMENTS;
        }
    }
    if (cli.hasDepth) config.recursionDepthLimit = cli.depth;
    if (cli.hasFatIndex) config.fatIndex = cli.fatIndex;
    if (!cli.folderFilter.empty()) config.folderFilter = cli.folderFilter;
    if (!cli.filenameFilter.empty()) config.filenameFilter = cli.filenameFilter;

    if (cli.enableRecovery && !RecoveryWriter::ValidateDestination(cli.imagePath, cli.outputFolder)) {
        fprintf(stderr, "[ERROR] Cannot recover into the source image - choose a different destination\n");
        return EXIT_RECOVERY_FAILED;
    }

    std::signal(SIGINT, OnInterrupt);

    // ========================================================================
    // Open image and resolve the volume
    // ========================================================================
    DiskHandle disk(cli.imagePath);
    if (!disk.Open()) {
        fprintf(stderr, "[ERROR] Failed to open image '%s': %s\n", cli.imagePath.c_str(), std::strerror(errno));
        return EXIT_VOLUME_ERROR;
    }

    VolumeGeometry geometry;
    try {
        uint64_t offset = cli.offset;
        if (!cli.hasOffset) {
            VolumeLocation location = LocateFatVolume(disk, cli.partitionIndex);
            offset = location.offset;
            if (location.partitionIndex != 0) {
                printf("[INFO] Partition %d: %s (0x%02X)\n", location.partitionIndex,
                       PartitionTypeName(location.partitionType), location.partitionType);
            }
        }
        geometry = ResolveGeometry(disk, offset);
    } catch (const ForensicsException& e) {
        fprintf(stderr, "[ERROR] %s\n", e.what());
        return EXIT_VOLUME_ERROR;
    }

    printf("\n=== fatsalvage ===\n");
    printf("[INFO] Image:            %s\n", cli.imagePath.c_str());
    PrintGeometry(geometry);

    int result = EXIT_OK;
    try {
        FatScanner scanner(geometry, disk, config);

        if (cli.enableVerifyFat) {
            result = std::max(result, VerifyFat(geometry, disk));
        }
        if (cli.enableList) {
            result = std::max(result, ListEntries(scanner));
        }
        if (cli.enableTrace) {
            result = std::max(result, TraceChains(scanner, geometry, disk, config));
        }
        if (cli.enableRecovery || !cli.csvPath.empty()) {
            result = std::max(result, RecoverFiles(cli, scanner));
        }
    } catch (const OperationCancelledError&) {
        fprintf(stderr, "[WARNING] Operation cancelled\n");
        return EXIT_RECOVERY_FAILED;
    } catch (const OutputError& e) {
        fprintf(stderr, "[ERROR] %s\n", e.what());
        return EXIT_RECOVERY_FAILED;
    } catch (const ForensicsException& e) {
        fprintf(stderr, "[ERROR] %s\n", e.what());
        return EXIT_VOLUME_ERROR;
    }

    fflush(stdout);
    return result;
}

} // namespace FSV
