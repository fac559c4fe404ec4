// ============================================================================
// RecoveryEngineTests.cpp - Deleted File and Directory Reconstruction
// ============================================================================

#include "FatImageBuilder.h"
#include "RecoveryEngine.h"
#include "DirectoryParser.h"
#include "ForensicsExceptions.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

using namespace FSV;
using namespace FSV::Testing;

namespace {

DirectoryEntry DecodeOne(const Record& record, FilesystemType fsType = FilesystemType::FAT16) {
    auto entries = ParseDirectory(Flatten({ record }), fsType);
    if (entries.size() != 1) {
        throw std::runtime_error("expected exactly one entry");
    }
    return entries[0];
}

DirectoryEntry DeletedFile(const std::string& name11, uint32_t cluster, uint32_t size,
                           FilesystemType fsType = FilesystemType::FAT16) {
    Record r = FileEntry(name11, cluster, size);
    MarkDeleted(r);
    return DecodeOne(r, fsType);
}

DirectoryEntry DeletedDirectory(const std::string& name11, uint32_t cluster) {
    Record r = DirEntry(name11, cluster);
    MarkDeleted(r);
    return DecodeOne(r);
}

Record DeletedRecord(Record r) {
    MarkDeleted(r);
    return r;
}

const RecoveryOutcome* FindOutcome(const std::vector<RecoveryOutcome>& outcomes, const std::string& path) {
    for (const auto& outcome : outcomes) {
        if (outcome.path == path) {
            return &outcome;
        }
    }
    return nullptr;
}

} // namespace

// ============================================================================
// Single files
// ============================================================================

TEST(RecoveryEngineTests, RecoversFileFromFreedRun) {
    auto builder = FatImageBuilder::Fat16();
    auto content = Pattern(1300, 0x40);
    builder.WriteData(5, content);

    // Allocated, then deleted: the chain is released but the data remains
    builder.SetChain({ 5, 6, 7 });
    builder.FreeChain({ 5, 6, 7 });

    MemoryImageSource image = builder.Image();
    RecoveryEngine engine(builder.Geometry(), image);

    DirectoryEntry entry = DeletedFile(Name83("REPORT", "TXT"), 5, 1300);
    RecoveredFile file = engine.RecoverDeletedFile(entry);

    EXPECT_EQ(file.data, content);
    EXPECT_EQ(file.confidence, RecoveryConfidence::Clean);
    EXPECT_TRUE(file.overwrittenClusters.empty());
    EXPECT_EQ(file.run.startCluster, 5u);
    EXPECT_EQ(file.run.clusterCount, 3u);
    EXPECT_EQ(file.path, "_EPORT.TXT");
}

TEST(RecoveryEngineTests, ExactClusterMultipleHasNoExtraCluster) {
    auto builder = FatImageBuilder::Fat16();
    auto content = Pattern(1024, 0x10);
    builder.WriteData(20, content);
    builder.WriteData(22, Pattern(512, 0x99));

    MemoryImageSource image = builder.Image();
    RecoveryEngine engine(builder.Geometry(), image);

    RecoveredFile file = engine.RecoverDeletedFile(DeletedFile(Name83("A", "BIN"), 20, 1024));

    EXPECT_EQ(file.run.clusterCount, 2u);
    EXPECT_EQ(file.data, content);
}

TEST(RecoveryEngineTests, ZeroLengthFileNeedsNoCluster) {
    auto builder = FatImageBuilder::Fat16();
    MemoryImageSource image = builder.Image();
    RecoveryEngine engine(builder.Geometry(), image);

    RecoveredFile file = engine.RecoverDeletedFile(DeletedFile(Name83("EMPTY", ""), 0, 0));

    EXPECT_TRUE(file.data.empty());
    EXPECT_FALSE(file.run.IsValid());
    EXPECT_TRUE(file.IsClean());
}

TEST(RecoveryEngineTests, RejectsReservedStartClusters) {
    auto builder = FatImageBuilder::Fat16();
    MemoryImageSource image = builder.Image();
    RecoveryEngine engine(builder.Geometry(), image);

    EXPECT_THROW(engine.RecoverDeletedFile(DeletedFile(Name83("A", "BIN"), 0, 10)), InvalidStartClusterError);
    EXPECT_THROW(engine.RecoverDeletedFile(DeletedFile(Name83("A", "BIN"), 1, 10)), InvalidStartClusterError);
}

TEST(RecoveryEngineTests, RejectsRunPastLastCluster) {
    auto builder = FatImageBuilder::Fat16();
    MemoryImageSource image = builder.Image();
    RecoveryEngine engine(builder.Geometry(), image);

    uint32_t maxCluster = static_cast<uint32_t>(builder.Geometry().MaxCluster());

    EXPECT_NO_THROW(engine.PlanRun(DeletedFile(Name83("A", "BIN"), maxCluster, 512)));
    EXPECT_THROW(engine.PlanRun(DeletedFile(Name83("A", "BIN"), maxCluster, 513)), InvalidStartClusterError);
    EXPECT_THROW(engine.PlanRun(DeletedFile(Name83("A", "BIN"), maxCluster + 1, 1)), InvalidStartClusterError);

    try {
        engine.RecoverDeletedFile(DeletedFile(Name83("A", "BIN"), maxCluster - 1, 4096));
        FAIL() << "expected InvalidStartClusterError";
    } catch (const ForensicsException& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::InvalidStartCluster);
    }
}

TEST(RecoveryEngineTests, ReallocatedClusterDowngradesConfidence) {
    auto builder = FatImageBuilder::Fat16();
    auto content = Pattern(1300, 0x55);
    builder.WriteData(5, content);
    builder.SetChain({ 6 });

    MemoryImageSource image = builder.Image();
    RecoveryEngine engine(builder.Geometry(), image);

    RecoveredFile file = engine.RecoverDeletedFile(DeletedFile(Name83("A", "BIN"), 5, 1300));

    EXPECT_EQ(file.confidence, RecoveryConfidence::Overwritten);
    EXPECT_EQ(file.overwrittenClusters, (std::vector<uint32_t>{ 6 }));
    EXPECT_EQ(file.data.size(), 1300u);
}

TEST(RecoveryEngineTests, BadClusterCountsAsOverwritten) {
    auto builder = FatImageBuilder::Fat16();
    builder.SetFat(9, 0xFFF7);

    MemoryImageSource image = builder.Image();
    RecoveryEngine engine(builder.Geometry(), image);

    RecoveredFile file = engine.RecoverDeletedFile(DeletedFile(Name83("A", "BIN"), 8, 1024));
    EXPECT_FALSE(file.IsClean());
    EXPECT_EQ(file.overwrittenClusters, (std::vector<uint32_t>{ 9 }));
}

TEST(RecoveryEngineTests, InspectsSelectedFatCopy) {
    auto builder = FatImageBuilder::Fat16();
    builder.SetFatInCopy(0, 6, 0xFFFF);

    MemoryImageSource image = builder.Image();
    ScanConfiguration config;
    config.fatIndex = 1;
    RecoveryEngine engine(builder.Geometry(), image, config);

    RecoveredFile file = engine.RecoverDeletedFile(DeletedFile(Name83("A", "BIN"), 5, 1300));
    EXPECT_TRUE(file.IsClean());
}

TEST(RecoveryEngineTests, RecoversFat32FileWithHighClusterBits) {
    auto builder = FatImageBuilder::Fat32(70000, 1);
    auto content = Pattern(700, 0x21);
    builder.WriteData(0x10005, content);

    MemoryImageSource image = builder.Image();
    RecoveryEngine engine(builder.Geometry(), image);

    DirectoryEntry entry = DeletedFile(Name83("DEEP", "BIN"), 0x10005, 700, FilesystemType::FAT32);
    ASSERT_EQ(entry.startCluster, 0x10005u);

    RecoveredFile file = engine.RecoverDeletedFile(entry);
    EXPECT_EQ(file.data, content);
    EXPECT_EQ(file.run.clusterCount, 2u);
    EXPECT_TRUE(file.IsClean());
}

TEST(RecoveryEngineTests, StreamsInChunksOfRequestedSize) {
    auto builder = FatImageBuilder::Fat16();
    auto content = Pattern(1300, 0x33);
    builder.WriteData(5, content);

    MemoryImageSource image = builder.Image();
    RecoveryEngine engine(builder.Geometry(), image);

    std::vector<size_t> chunkSizes;
    std::vector<uint8_t> streamed;
    RecoveredFile file = engine.StreamDeletedFile(
        DeletedFile(Name83("A", "BIN"), 5, 1300), 500,
        [&](const uint8_t* data, size_t length) {
            chunkSizes.push_back(length);
            streamed.insert(streamed.end(), data, data + length);
        });

    EXPECT_EQ(chunkSizes, (std::vector<size_t>{ 500, 500, 300 }));
    EXPECT_EQ(streamed, content);
    EXPECT_TRUE(file.data.empty());
    EXPECT_EQ(file.run.clusterCount, 3u);
}

TEST(RecoveryEngineTests, CancelledTokenStopsRecovery) {
    auto builder = FatImageBuilder::Fat16();
    MemoryImageSource image = builder.Image();
    RecoveryEngine engine(builder.Geometry(), image);

    CancellationToken token;
    token.Cancel();

    EXPECT_THROW(engine.RecoverDeletedFile(DeletedFile(Name83("A", "BIN"), 5, 1300), "", &token),
                 OperationCancelledError);
    EXPECT_THROW(engine.RecoverDeleted(DeletedFile(Name83("A", "BIN"), 5, 1300), 4, "", &token),
                 OperationCancelledError);
}

// ============================================================================
// Deleted directories
// ============================================================================

TEST(RecoveryEngineTests, RecoversDeletedDirectoryAndNestedFiles) {
    auto builder = FatImageBuilder::Fat16();
    auto report = Pattern(100, 0x70);
    auto notes = Pattern(600, 0x71);

    builder.WriteDirectory(10, {
        DotEntry(false, 10),
        DotEntry(true, 0),
        DeletedRecord(FileEntry(Name83("REPORT", "TXT"), 11, 100)),
        DeletedRecord(FileEntry(Name83("NOTES", "TXT"), 12, 600)),
        FileEntry(Name83("LIVE", "TXT"), 30, 5),
    });
    builder.WriteData(11, report);
    builder.WriteData(12, notes);

    MemoryImageSource image = builder.Image();
    RecoveryEngine engine(builder.Geometry(), image);

    auto outcomes = engine.RecoverDeleted(DeletedDirectory(Name83("DOCS", ""), 10), 4);

    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_EQ(outcomes[0].path, "_OCS");
    ASSERT_TRUE(outcomes[0].success);
    EXPECT_TRUE(outcomes[0].file->IsDirectory());
    EXPECT_EQ(outcomes[0].file->data.size(), 512u);

    const RecoveryOutcome* reportOutcome = FindOutcome(outcomes, "_OCS/_EPORT.TXT");
    ASSERT_NE(reportOutcome, nullptr);
    ASSERT_TRUE(reportOutcome->success);
    EXPECT_EQ(reportOutcome->file->data, report);

    const RecoveryOutcome* notesOutcome = FindOutcome(outcomes, "_OCS/_OTES.TXT");
    ASSERT_NE(notesOutcome, nullptr);
    ASSERT_TRUE(notesOutcome->success);
    EXPECT_EQ(notesOutcome->file->data, notes);

    EXPECT_EQ(FindOutcome(outcomes, "_OCS/LIVE.TXT"), nullptr);
}

TEST(RecoveryEngineTests, DirectorySpanFollowsConfiguration) {
    auto builder = FatImageBuilder::Fat16();
    builder.WriteDirectory(10, {
        DotEntry(false, 10),
        DotEntry(true, 0),
    });

    // 16 records fill cluster 10; the next one lands in cluster 11
    std::vector<Record> records;
    for (int i = 0; i < 14; ++i) {
        records.push_back(FileEntry(Name83("KEEP" + std::to_string(i), "TXT"), 40, 1));
    }
    records.push_back(DeletedRecord(FileEntry(Name83("SPILL", "TXT"), 20, 10)));
    builder.WriteAt(builder.ClusterOffset(10) + 64, Flatten(records));

    MemoryImageSource image = builder.Image();
    DirectoryEntry dir = DeletedDirectory(Name83("DOCS", ""), 10);

    RecoveryEngine single(builder.Geometry(), image);
    EXPECT_EQ(single.RecoverDeleted(dir, 4).size(), 1u);

    ScanConfiguration config;
    config.deletedDirectoryClusters = 2;
    RecoveryEngine wide(builder.Geometry(), image, config);
    auto outcomes = wide.RecoverDeleted(dir, 4);

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].file->data.size(), 1024u);
    EXPECT_EQ(outcomes[1].path, "_OCS/_PILL.TXT");
}

TEST(RecoveryEngineTests, DirectoryRecursionCanBeDisabled) {
    auto builder = FatImageBuilder::Fat16();
    builder.WriteDirectory(10, { DeletedRecord(FileEntry(Name83("REPORT", "TXT"), 11, 100)) });

    MemoryImageSource image = builder.Image();
    ScanConfiguration config;
    config.recoverDeletedDirectories = false;
    RecoveryEngine engine(builder.Geometry(), image, config);

    auto outcomes = engine.RecoverDeleted(DeletedDirectory(Name83("DOCS", ""), 10), 4);
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_TRUE(outcomes[0].success);
}

TEST(RecoveryEngineTests, DepthLimitFailsOnlyTheDeepBranch) {
    auto builder = FatImageBuilder::Fat16();

    // _OCS (10) holds deleted directory _NNER (11) and deleted file _IBLING.TXT (13)
    builder.WriteDirectory(10, {
        DeletedRecord(DirEntry(Name83("INNER", ""), 11)),
        DeletedRecord(FileEntry(Name83("SIBLING", "TXT"), 13, 50)),
    });
    builder.WriteDirectory(11, {
        DeletedRecord(FileEntry(Name83("DEEP", "TXT"), 12, 50)),
    });
    auto sibling = Pattern(50, 0x05);
    builder.WriteData(13, sibling);

    MemoryImageSource image = builder.Image();
    RecoveryEngine engine(builder.Geometry(), image);
    DirectoryEntry top = DeletedDirectory(Name83("DOCS", ""), 10);

    auto limited = engine.RecoverDeleted(top, 0);
    ASSERT_EQ(limited.size(), 3u);

    const RecoveryOutcome* inner = FindOutcome(limited, "_OCS/_NNER");
    ASSERT_NE(inner, nullptr);
    EXPECT_FALSE(inner->success);
    EXPECT_EQ(inner->errorKind, ErrorKind::RecursionLimitExceeded);

    const RecoveryOutcome* siblingOutcome = FindOutcome(limited, "_OCS/_IBLING.TXT");
    ASSERT_NE(siblingOutcome, nullptr);
    ASSERT_TRUE(siblingOutcome->success);
    EXPECT_EQ(siblingOutcome->file->data, sibling);

    EXPECT_EQ(FindOutcome(limited, "_OCS/_NNER/_EEP.TXT"), nullptr);

    auto full = engine.RecoverDeleted(top, 1);
    ASSERT_EQ(full.size(), 4u);
    const RecoveryOutcome* deep = FindOutcome(full, "_OCS/_NNER/_EEP.TXT");
    ASSERT_NE(deep, nullptr);
    EXPECT_TRUE(deep->success);
}

TEST(RecoveryEngineTests, DirectoryReferringToItselfTerminates) {
    auto builder = FatImageBuilder::Fat16();
    builder.WriteDirectory(10, {
        DeletedRecord(DirEntry(Name83("LOOP", ""), 10)),
    });

    MemoryImageSource image = builder.Image();
    RecoveryEngine engine(builder.Geometry(), image);

    auto outcomes = engine.RecoverDeleted(DeletedDirectory(Name83("DOCS", ""), 10), 16);

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_TRUE(outcomes[0].success);
    EXPECT_FALSE(outcomes[1].success);
    EXPECT_EQ(outcomes[1].errorKind, ErrorKind::CorruptChain);
}

TEST(RecoveryEngineTests, SiblingDirectoriesMayShareStartCluster) {
    auto builder = FatImageBuilder::Fat16();
    builder.WriteDirectory(10, {
        DeletedRecord(DirEntry(Name83("ALPHA", ""), 20)),
        DeletedRecord(DirEntry(Name83("BETA", ""), 20)),
    });
    builder.WriteDirectory(20, {
        DeletedRecord(FileEntry(Name83("NOTE", "TXT"), 21, 50)),
    });
    auto note = Pattern(50, 0x5A);
    builder.WriteData(21, note);

    MemoryImageSource image = builder.Image();
    RecoveryEngine engine(builder.Geometry(), image);

    auto outcomes = engine.RecoverDeleted(DeletedDirectory(Name83("DOCS", ""), 10), 16);

    ASSERT_EQ(outcomes.size(), 5u);
    for (const auto& outcome : outcomes) {
        EXPECT_TRUE(outcome.success) << outcome.path << ": " << outcome.message;
    }

    const RecoveryOutcome* second = FindOutcome(outcomes, "_OCS/_ETA/_OTE.TXT");
    ASSERT_NE(second, nullptr);
    ASSERT_TRUE(second->success);
    EXPECT_EQ(second->file->data, note);
}

TEST(RecoveryEngineTests, InvalidChildDoesNotStopSiblings) {
    auto builder = FatImageBuilder::Fat16();
    builder.WriteDirectory(10, {
        DeletedRecord(FileEntry(Name83("BROKEN", "BIN"), 1, 100)),
        DeletedRecord(FileEntry(Name83("GOOD", "BIN"), 11, 100)),
    });

    MemoryImageSource image = builder.Image();
    RecoveryEngine engine(builder.Geometry(), image);

    auto outcomes = engine.RecoverDeleted(DeletedDirectory(Name83("DOCS", ""), 10), 4);
    ASSERT_EQ(outcomes.size(), 3u);

    auto failures = std::count_if(outcomes.begin(), outcomes.end(),
                                  [](const RecoveryOutcome& o) { return !o.success; });
    EXPECT_EQ(failures, 1);

    const RecoveryOutcome* broken = FindOutcome(outcomes, "_OCS/_ROKEN.BIN");
    ASSERT_NE(broken, nullptr);
    EXPECT_EQ(broken->errorKind, ErrorKind::InvalidStartCluster);
}
