// ============================================================================
// PartitionTableTests.cpp - MBR Parsing and Volume Location
// ============================================================================

#include "FatImageBuilder.h"
#include "PartitionTable.h"
#include "RecoveryEngine.h"
#include "DirectoryParser.h"
#include "ForensicsExceptions.h"

#include <gtest/gtest.h>

using namespace FSV;
using namespace FSV::Testing;

namespace {

std::vector<uint8_t> MbrSector() {
    std::vector<uint8_t> sector(512, 0);

    uint8_t* first = sector.data() + 0x1BE;
    first[0] = 0x80;
    first[4] = PartitionType::FAT16;
    Put32(first + 8, 63);
    Put32(first + 12, 20000);

    uint8_t* third = sector.data() + 0x1BE + 2 * 16;
    third[4] = PartitionType::FAT32_LBA;
    Put32(third + 8, 2048);
    Put32(third + 12, 409600);

    sector[510] = 0x55;
    sector[511] = 0xAA;
    return sector;
}

} // namespace

TEST(PartitionTableTests, ParsesNonEmptySlots) {
    auto sector = MbrSector();
    PartitionTable table = ParsePartitionTable(sector.data(), sector.size());

    EXPECT_TRUE(table.signatureValid);
    ASSERT_EQ(table.partitions.size(), 2u);

    const PartitionInfo& first = table.partitions[0];
    EXPECT_EQ(first.index, 1);
    EXPECT_TRUE(first.bootable);
    EXPECT_TRUE(first.IsFat16());
    EXPECT_EQ(first.startLba, 63u);
    EXPECT_EQ(first.ByteOffset(), 63u * 512);
    EXPECT_EQ(first.ByteSize(), 20000u * 512);
    EXPECT_STREQ(first.TypeName(), "FAT16");

    const PartitionInfo& third = table.partitions[1];
    EXPECT_EQ(third.index, 3);
    EXPECT_FALSE(third.bootable);
    EXPECT_TRUE(third.IsFat32());
    EXPECT_FALSE(third.IsExtended());
    EXPECT_STREQ(third.TypeName(), "FAT32 LBA");
}

TEST(PartitionTableTests, ReportsMissingSignature) {
    auto sector = MbrSector();
    sector[510] = 0;

    PartitionTable table = ParsePartitionTable(sector.data(), sector.size());
    EXPECT_FALSE(table.signatureValid);
}

TEST(PartitionTableTests, RejectsShortSector) {
    std::vector<uint8_t> sector(100, 0);
    EXPECT_THROW(ParsePartitionTable(sector.data(), sector.size()), OutOfRangeError);
}

TEST(PartitionTableTests, UnpartitionedImageStartsAtZero) {
    MemoryImageSource image = FatImageBuilder::Fat16().Image();

    VolumeLocation location = LocateFatVolume(image);
    EXPECT_EQ(location.offset, 0u);
    EXPECT_EQ(location.partitionIndex, 0);
}

TEST(PartitionTableTests, FindsFirstFatPartition) {
    auto builder = FatImageBuilder::Fat16();
    MemoryImageSource image(builder.WithMbr(PartitionType::FAT16_LBA, 8, 2));

    VolumeLocation location = LocateFatVolume(image);
    EXPECT_EQ(location.offset, 8u * 512);
    EXPECT_EQ(location.partitionIndex, 2);
    EXPECT_EQ(location.partitionType, PartitionType::FAT16_LBA);
}

TEST(PartitionTableTests, SelectsPartitionByIndex) {
    auto builder = FatImageBuilder::Fat32();
    MemoryImageSource image(builder.WithMbr(PartitionType::FAT32_LBA, 16));

    EXPECT_EQ(LocateFatVolume(image, 1).offset, 16u * 512);
    EXPECT_THROW(LocateFatVolume(image, 2), OutOfRangeError);
}

TEST(PartitionTableTests, NoFatPartitionIsMalformed) {
    auto builder = FatImageBuilder::Fat16();
    MemoryImageSource image(builder.WithMbr(PartitionType::NTFS_EXFAT, 8));

    EXPECT_THROW(LocateFatVolume(image), MalformedBootSectorError);
}

TEST(PartitionTableTests, BlankImageIsMalformed) {
    MemoryImageSource image(std::vector<uint8_t>(4096, 0));
    EXPECT_THROW(LocateFatVolume(image), MalformedBootSectorError);
}

TEST(PartitionTableTests, RecoversFileInsidePartition) {
    auto builder = FatImageBuilder::Fat16();
    auto content = Pattern(900, 0x61);
    builder.WriteData(7, content);
    builder.WriteRoot({ [] {
        Record r = FileEntry(Name83("PHOTO", "JPG"), 7, 900);
        MarkDeleted(r);
        return r;
    }() });

    MemoryImageSource image(builder.WithMbr(PartitionType::FAT16, 63));

    VolumeLocation location = LocateFatVolume(image);
    VolumeGeometry geom = ResolveGeometry(image, location.offset);
    EXPECT_EQ(geom.dataRegionOffset, 63u * 512 + builder.DataOffset());

    auto root = ParseDirectory(geom, image, DirectoryLocation::Root());
    ASSERT_EQ(root.size(), 1u);

    RecoveryEngine engine(geom, image);
    RecoveredFile file = engine.RecoverDeletedFile(root[0]);
    EXPECT_EQ(file.data, content);
    EXPECT_TRUE(file.IsClean());
}
