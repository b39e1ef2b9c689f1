#include "Storage.h"
#include "FitFile.h"
#include "LinuxUtil.h"
#include "TestUtil.h"

#include <ctime>

#include <gtest/gtest.h>

namespace EdgeSync {

namespace {

class StorageTest : public ::testing::Test
{
protected:
    StorageTest()
        : m_Device(TRANSPORT_BLUETOOTH, "C4:7C:8D:6A:00:12", "Edge 530")
    {
        SetBaseStoragePath(m_Dir.Path());
    }

    FileEntry Entry(const std::string &path, uint64_t size)
    {
        FileEntry e;
        e.Path = path;
        e.Size = size;
        e.Modified = 1500000000;
        return e;
    }

    EdgeSync::Test::TempDir m_Dir;
    Device m_Device;
};

};                                      // end anonymous namespace

TEST_F(StorageTest, DeviceDirectoriesAreCreatedUnderTheBase)
{
    EXPECT_EQ(m_Dir.Path(), GetBaseStoragePath());

    std::string device_dir = GetDeviceStoragePath(m_Device);
    EXPECT_EQ(m_Dir.Path() + "/C4-7C-8D-6A-00-12", device_dir);
    EXPECT_TRUE(IsDirectory(device_dir));

    std::string activities = GetActivityStoragePath(m_Device);
    EXPECT_EQ(device_dir + "/Activities", activities);
    EXPECT_TRUE(IsDirectory(activities));
}

TEST_F(StorageTest, HaveFileComparesNameAndSize)
{
    FileEntry e = Entry("Activity/ride_001.fit", 3000);
    EXPECT_FALSE(HaveFile(m_Device, e));

    WriteData(JoinPath(GetActivityStoragePath(m_Device), "ride_001.fit"),
              EdgeSync::Test::MakeFitData(3000));
    EXPECT_TRUE(HaveFile(m_Device, e));

    e.Size = 3500;                      // the device has a longer version
    EXPECT_FALSE(HaveFile(m_Device, e));
}

TEST_F(StorageTest, WriteFileListSummarizesTheCatalog)
{
    std::vector<FileEntry> entries;
    entries.push_back(Entry("Activity/ride_002.fit", 2048));
    entries.push_back(Entry("Activity/ride_001.fit", 1000));
    entries[0].HasChecksum = true;
    entries[0].Checksum = 0xabcd;

    std::string summary = WriteFileList(m_Device, entries);
    EXPECT_EQ("Total of 3k used by 2 activities", summary);

    Buffer data;
    ReadData(JoinPath(GetDeviceStoragePath(m_Device), "file_list.txt"), data);
    std::string text(data.begin(), data.end());
    EXPECT_NE(std::string::npos, text.find("Activity/ride_002.fit"));
    EXPECT_NE(std::string::npos, text.find("abcd"));
    EXPECT_NE(std::string::npos, text.find(summary));
}

TEST_F(StorageTest, LastSyncIsRememberedOnDisk)
{
    EXPECT_EQ(0, GetLastSuccessfulSync(m_Device));

    std::time_t before = time(nullptr);
    MarkSuccessfulSync(m_Device);
    std::time_t t = GetLastSuccessfulSync(m_Device);
    EXPECT_GE(t, before);
    EXPECT_LE(t, time(nullptr));
    EXPECT_TRUE(FileExists(JoinPath(GetDeviceStoragePath(m_Device), "last_sync")));

    Device other(TRANSPORT_USB, "3345678901", "Edge 530");
    EXPECT_EQ(0, GetLastSuccessfulSync(other));
}

TEST_F(StorageTest, DownloadedFilesAreCheckedAndDescribed)
{
    std::string dir = GetActivityStoragePath(m_Device);
    std::string ride = JoinPath(dir, "ride_001.fit");
    WriteData(ride, EdgeSync::Test::MakeFileIdFit());
    std::string what = CheckDownloadedFile(ride);
    EXPECT_EQ(0u, what.find("activity file, product 3122, created "));
    EXPECT_TRUE(FileExists(ride));

    std::string plain = JoinPath(dir, "ride_002.fit");
    WriteData(plain, EdgeSync::Test::MakeFitData(3000, 4));
    EXPECT_EQ("FIT file without file_id, 3k", CheckDownloadedFile(plain));
}

TEST_F(StorageTest, DamagedDownloadsAreRemoved)
{
    std::string ride = JoinPath(GetActivityStoragePath(m_Device), "ride_001.fit");
    Buffer data = EdgeSync::Test::MakeFitData(3000, 5);
    data[100] ^= 0xff;
    WriteData(ride, data);

    FileEntry e = Entry("Activity/ride_001.fit", 3000);
    EXPECT_TRUE(HaveFile(m_Device, e));
    EXPECT_THROW(CheckDownloadedFile(ride), BadFitFile);
    EXPECT_FALSE(FileExists(ride));
    EXPECT_FALSE(HaveFile(m_Device, e));
}

};                                      // end namespace EdgeSync
