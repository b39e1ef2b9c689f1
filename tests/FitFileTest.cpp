#include "FitFile.h"
#include "TestUtil.h"

#include <gtest/gtest.h>

namespace EdgeSync {

TEST(FitFileTest, Crc16MatchesTheStandardCheckValue)
{
    const char *check = "123456789";
    EXPECT_EQ(0xBB3D, Crc16(reinterpret_cast<const unsigned char*>(check), 9));
}

TEST(FitFileTest, Crc16CanBeComputedIncrementally)
{
    Buffer data = EdgeSync::Test::MakeFitData(1000, 3);
    uint16_t crc = Crc16(&data[0], 300);
    crc = Crc16(crc, &data[300], 700);
    EXPECT_EQ(Crc16(&data[0], 1000), crc);
}

TEST(FitFileTest, ReadFitHeaderDecodesTheFileSize)
{
    Buffer data = EdgeSync::Test::MakeFitData(512 * 1024);
    FitHeader h;
    ASSERT_TRUE(ReadFitHeader(&data[0], data.size(), h));
    EXPECT_EQ(14u, h.HeaderSize);
    EXPECT_EQ(0x20u, h.ProtocolVersion);
    EXPECT_EQ(2132u, h.ProfileVersion);
    EXPECT_EQ(data.size(), h.FileSize());
}

TEST(FitFileTest, ReadFitHeaderRejectsOtherData)
{
    const unsigned char text[] = "<?xml version=\"1.0\"?>";
    FitHeader h;
    EXPECT_FALSE(ReadFitHeader(text, sizeof(text), h));
    EXPECT_FALSE(ReadFitHeader(text, 4, h));
}

TEST(FitFileTest, CheckFitFileAcceptsAValidFile)
{
    EXPECT_NO_THROW(CheckFitFile(EdgeSync::Test::MakeFitData(4096, 7)));
    EXPECT_NO_THROW(CheckFitFile(EdgeSync::Test::MakeFileIdFit()));
}

TEST(FitFileTest, CheckFitFileRejectsDamagedFiles)
{
    Buffer data = EdgeSync::Test::MakeFitData(4096, 7);

    Buffer corrupt = data;
    corrupt[2000] ^= 0x01;
    EXPECT_THROW(CheckFitFile(corrupt), BadFitFile);

    Buffer bad_header = data;
    bad_header[5] ^= 0x01;
    EXPECT_THROW(CheckFitFile(bad_header), BadFitFile);

    Buffer truncated(data.begin(), data.begin() + 4000);
    EXPECT_THROW(CheckFitFile(truncated), BadFitFile);

    EXPECT_THROW(CheckFitFile(Buffer()), BadFitFile);
}

TEST(FitFileTest, ReadFitFileIdDecodesTheFileIdMessage)
{
    FitFileId fid = ReadFitFileId(EdgeSync::Test::MakeFileIdFit());
    EXPECT_EQ(FIT_FILE_ACTIVITY, fid.Type);
    EXPECT_EQ(1, fid.Manufacturer);
    EXPECT_EQ(3122, fid.Product);
    EXPECT_EQ(0u, fid.SerialNumber);
    EXPECT_EQ(static_cast<std::time_t>(1000000000) + FitEpoch, fid.TimeCreated);
}

TEST(FitFileTest, ReadFitFileIdFailsWithoutAFileIdMessage)
{
    EXPECT_THROW(ReadFitFileId(EdgeSync::Test::MakeFitData(16)), BadFitFile);
}

};                                      // end namespace EdgeSync
