// ============================================================================
// FatTableTests.cpp - FAT Entry Classification and Copy Comparison
// ============================================================================

#include "FatImageBuilder.h"
#include "FatTable.h"
#include "ForensicsExceptions.h"

#include <gtest/gtest.h>

using namespace FSV;
using namespace FSV::Testing;

TEST(FatTableTests, ClassifiesFat16Values) {
    auto builder = FatImageBuilder::Fat16();
    builder.SetFat(4, 0x0001);
    builder.SetFat(5, 0xFFF0);
    builder.SetFat(6, 0xFFF7);
    builder.SetFat(7, 0xFFF8);
    builder.SetFat(8, 0xFFFF);
    builder.SetFat(9, 0x0010);

    MemoryImageSource image = builder.Image();
    auto fat = FatTable::Open(builder.Geometry(), image);

    EXPECT_EQ(fat->ReadEntry(3).kind, FatEntryKind::Free);
    EXPECT_EQ(fat->ReadEntry(4).kind, FatEntryKind::Reserved);
    EXPECT_EQ(fat->ReadEntry(5).kind, FatEntryKind::Reserved);
    EXPECT_EQ(fat->ReadEntry(6).kind, FatEntryKind::Bad);
    EXPECT_EQ(fat->ReadEntry(7).kind, FatEntryKind::EndOfChain);
    EXPECT_EQ(fat->ReadEntry(8).kind, FatEntryKind::EndOfChain);

    FatValue link = fat->ReadEntry(9);
    EXPECT_EQ(link.kind, FatEntryKind::Next);
    EXPECT_EQ(link.next, 0x10u);
}

TEST(FatTableTests, Fat32IgnoresTopFourBits) {
    auto builder = FatImageBuilder::Fat32();
    builder.SetFat(3, 0xF0000000);
    builder.SetFat(4, 0x1FFFFFFF);
    builder.SetFat(5, 0x0FFFFFF7);
    builder.SetFat(6, 0x10000005);

    MemoryImageSource image = builder.Image();
    auto fat = FatTable::Open(builder.Geometry(), image);

    EXPECT_EQ(fat->ReadEntry(3).kind, FatEntryKind::Free);
    EXPECT_EQ(fat->ReadEntry(4).kind, FatEntryKind::EndOfChain);
    EXPECT_EQ(fat->ReadEntry(5).kind, FatEntryKind::Bad);

    FatValue link = fat->ReadEntry(6);
    EXPECT_EQ(link.kind, FatEntryKind::Next);
    EXPECT_EQ(link.next, 5u);
    EXPECT_EQ(link.raw, 0x10000005u);
}

TEST(FatTableTests, ReadEntriesMatchesSingleReads) {
    auto builder = FatImageBuilder::Fat16();
    builder.SetChain({ 10, 11, 12 });

    MemoryImageSource image = builder.Image();
    auto fat = FatTable::Open(builder.Geometry(), image);
    auto values = fat->ReadEntries(9, 5);

    ASSERT_EQ(values.size(), 5u);
    EXPECT_TRUE(values[0].IsFree());
    EXPECT_EQ(values[1].next, 11u);
    EXPECT_EQ(values[2].next, 12u);
    EXPECT_TRUE(values[3].IsEndOfChain());
    EXPECT_TRUE(values[4].IsFree());
}

TEST(FatTableTests, EntryBeyondTableIsOutOfRange) {
    auto builder = FatImageBuilder::Fat16();
    MemoryImageSource image = builder.Image();
    auto fat = FatTable::Open(builder.Geometry(), image);

    try {
        fat->ReadEntry(fat->EntryCount());
        FAIL() << "expected OutOfRangeError";
    } catch (const OutOfRangeError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::OutOfRange);
    }
    EXPECT_THROW(fat->ReadEntries(fat->EntryCount() - 2, 4), OutOfRangeError);
}

TEST(FatTableTests, OpenRejectsMissingCopy) {
    auto builder = FatImageBuilder::Fat16();
    MemoryImageSource image = builder.Image();
    EXPECT_THROW(FatTable::Open(builder.Geometry(), image, 2), OutOfRangeError);
}

TEST(FatTableTests, ReadsSelectedCopy) {
    auto builder = FatImageBuilder::Fat16();
    builder.SetFatInCopy(1, 20, 0xFFFF);

    MemoryImageSource image = builder.Image();
    VolumeGeometry geom = builder.Geometry();

    EXPECT_TRUE(ReadFatEntry(geom, image, 0, 20).IsFree());
    EXPECT_TRUE(ReadFatEntry(geom, image, 1, 20).IsEndOfChain());
}

TEST(FatTableTests, MediaSignature) {
    auto builder = FatImageBuilder::Fat32();
    {
        MemoryImageSource image = builder.Image();
        EXPECT_TRUE(FatTable::Open(builder.Geometry(), image)->MediaSignatureValid());
    }

    builder.SetFat(0, 0x0FFFFF00);
    MemoryImageSource image = builder.Image();
    EXPECT_FALSE(FatTable::Open(builder.Geometry(), image)->MediaSignatureValid());
}

TEST(FatTableTests, CompareFatCopiesReportsDivergentEntries) {
    auto builder = FatImageBuilder::Fat16();
    builder.SetChain({ 30, 31 });
    builder.SetFatInCopy(1, 31, 0x0000);
    builder.SetFatInCopy(1, 40, 0xFFF7);

    MemoryImageSource image = builder.Image();
    VolumeGeometry geom = builder.Geometry();
    auto primary = FatTable::Open(geom, image, 0);
    auto backup = FatTable::Open(geom, image, 1);

    auto diffs = CompareFatCopies(*primary, *backup);
    ASSERT_EQ(diffs.size(), 2u);
    EXPECT_EQ(diffs[0].cluster, 31u);
    EXPECT_EQ(diffs[0].primary.kind, FatEntryKind::EndOfChain);
    EXPECT_EQ(diffs[0].backup.kind, FatEntryKind::Free);
    EXPECT_EQ(diffs[1].cluster, 40u);
    EXPECT_EQ(diffs[1].backup.kind, FatEntryKind::Bad);

    EXPECT_EQ(CompareFatCopies(*primary, *backup, 1).size(), 1u);
}
