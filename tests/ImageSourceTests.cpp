// ============================================================================
// ImageSourceTests.cpp - Positional Reads from Files and Memory
// ============================================================================

#include "FatImageBuilder.h"
#include "DiskHandle.h"
#include "VolumeReader.h"
#include "FatScanner.h"
#include "ForensicsExceptions.h"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace FSV;
using namespace FSV::Testing;

namespace fs = std::filesystem;

namespace {

class DiskHandleTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = (fs::temp_directory_path() / ("fatsalvage_image_" + std::to_string(stamp) + ".img")).string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(m_path, ec);
    }

    void WriteImage(const std::vector<uint8_t>& bytes) {
        std::ofstream out(m_path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    std::string m_path;
};

} // namespace

TEST(ImageSourceTests, MemorySourceRejectsReadPastEnd) {
    MemoryImageSource image(std::vector<uint8_t>(1024, 0xAB));

    EXPECT_EQ(image.ReadAt(1000, 24).size(), 24u);
    EXPECT_THROW(image.ReadAt(1000, 25), DiskReadError);
    EXPECT_THROW(image.ReadAt(2048, 1), DiskReadError);
}

TEST(ImageSourceTests, DiskReadErrorIsOutOfRangeKind) {
    MemoryImageSource image(std::vector<uint8_t>(16, 0));
    try {
        image.ReadAt(8, 16);
        FAIL() << "expected DiskReadError";
    } catch (const ForensicsException& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::OutOfRange);
    }
}

TEST(ImageSourceTests, VolumeReaderValidatesClusterRange) {
    auto builder = FatImageBuilder::Fat16();
    MemoryImageSource image = builder.Image();
    VolumeReader reader(image, builder.Geometry());

    EXPECT_EQ(reader.ReadClusters(2, 3).size(), 3u * 512);
    EXPECT_THROW(reader.ReadClusters(1, 1), ClusterOutOfBoundsError);
    EXPECT_THROW(reader.ReadClusters(4100, 3), ClusterOutOfBoundsError);
    EXPECT_TRUE(reader.ValidateClusterRange(4100, 2));
    EXPECT_FALSE(reader.ValidateClusterRange(4100, 3));
}

TEST(ImageSourceTests, VolumeReaderReadsFat16RootRegion) {
    auto builder = FatImageBuilder::Fat16();
    builder.WriteRoot({ LabelEntry("EVIDENCE   ") });
    MemoryImageSource image = builder.Image();
    VolumeReader reader(image, builder.Geometry());

    auto root = reader.ReadRootRegion();
    ASSERT_EQ(root.size(), 512u * 32);
    EXPECT_EQ(root[0], 'E');
    EXPECT_EQ(root[11], ATTR_VOLUME_ID);
}

TEST_F(DiskHandleTest, ReadsImageFile) {
    auto builder = FatImageBuilder::Fat16();
    auto content = Pattern(2000, 0x17);
    builder.WriteData(9, content);
    WriteImage(builder.Bytes());

    DiskHandle disk(m_path);
    ASSERT_TRUE(disk.Open());
    EXPECT_EQ(disk.Size(), builder.Bytes().size());

    auto bytes = disk.ReadAt(builder.ClusterOffset(9), content.size());
    EXPECT_EQ(bytes, content);

    auto sector = disk.ReadSectors(0, 1, 512);
    EXPECT_EQ(sector[510], 0x55);
    EXPECT_EQ(sector[511], 0xAA);

    EXPECT_THROW(disk.ReadAt(disk.Size() - 10, 11), DiskReadError);
}

TEST_F(DiskHandleTest, ClosedHandleCannotRead) {
    WriteImage(std::vector<uint8_t>(512, 0));

    DiskHandle disk(m_path);
    EXPECT_FALSE(disk.IsOpen());
    EXPECT_THROW(disk.ReadAt(0, 16), DiskReadError);

    ASSERT_TRUE(disk.Open());
    disk.Close();
    EXPECT_THROW(disk.ReadAt(0, 16), DiskReadError);
}

TEST_F(DiskHandleTest, MissingFileFailsToOpen) {
    DiskHandle disk(m_path + ".missing");
    EXPECT_FALSE(disk.Open());
}

TEST_F(DiskHandleTest, SweepRunsAgainstFileImage) {
    auto builder = FatImageBuilder::Fat16();
    Record deleted = FileEntry(Name83("SCAN", "PDF"), 12, 700);
    MarkDeleted(deleted);
    builder.WriteRoot({ deleted });
    auto content = Pattern(700, 0x44);
    builder.WriteData(12, content);
    WriteImage(builder.Bytes());

    DiskHandle disk(m_path);
    ASSERT_TRUE(disk.Open());

    FatScanner scanner(ResolveGeometry(disk, 0), disk);
    SweepReport report = scanner.ScanVolume(nullptr);

    ASSERT_EQ(report.recovered, 1u);
    EXPECT_EQ(report.outcomes[0].path, "_CAN.PDF");
    EXPECT_EQ(report.outcomes[0].file->data, content);
}
