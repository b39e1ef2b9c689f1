#include "Tools.h"
#include "LinuxUtil.h"
#include "TestUtil.h"

#include <sstream>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace EdgeSync {

TEST(ToolsTest, LittleEndianFields)
{
    Buffer b;
    PutU16(b, 0xbeef);
    PutU32(b, 0xdeadc0de);
    ASSERT_EQ(6u, b.size());
    EXPECT_EQ(0xef, b[0]);
    EXPECT_EQ(0xbeefu, GetU16(&b[0]));
    EXPECT_EQ(0xdeadc0deu, GetU32(&b[2]));
}

TEST(ToolsTest, FormatKbRoundsUp)
{
    EXPECT_EQ("0k", FormatKb(0));
    EXPECT_EQ("1k", FormatKb(1));
    EXPECT_EQ("1k", FormatKb(1024));
    EXPECT_EQ("500k", FormatKb(500 * 1024));
    EXPECT_EQ("501k", FormatKb(500 * 1024 + 1));
}

TEST(ToolsTest, DumpDataShowsOffsetsBytesAndText)
{
    std::string text = "Edge 530 ride_001.fit";
    Buffer data(text.begin(), text.end());
    data.push_back(0x00);
    data.push_back(0xff);

    std::ostringstream o;
    o << 255;
    DumpData(data, o);
    std::string dump = o.str();

    EXPECT_EQ(0u, dump.find("2550000  45 64 67 65 "));
    EXPECT_NE(std::string::npos, dump.find("Edge 530 ride_00"));
    EXPECT_NE(std::string::npos, dump.find("\n0010  31 2e 66 69 74 00 ff "));
    EXPECT_NE(std::string::npos, dump.find("1.fit.."));

    // The stream formatting is left as it was
    o.str("");
    o << 255;
    EXPECT_EQ("255", o.str());
}

TEST(ToolsTest, DumpDataLimitsLongBuffers)
{
    std::ostringstream o;
    DumpData(Buffer(100, 0x41), o, 32);
    EXPECT_NE(std::string::npos, o.str().find("... 68 more bytes"));
    EXPECT_EQ(std::string::npos, o.str().find("\n0020"));
}

TEST(ToolsTest, LogLineWritesTimestampedLines)
{
    std::ostringstream o;
    LogLine(o) << "job " << 12 << " complete\n";
    std::string text = o.str();
    // "YYYY-MM-DD hh:mm:ss.mmm " comes first
    ASSERT_GT(text.size(), 24u);
    EXPECT_EQ('-', text[4]);
    EXPECT_EQ(' ', text[23]);
    EXPECT_EQ("job 12 complete\n", text.substr(24));
}

TEST(ToolsTest, LogLinesFromManyThreadsDoNotMix)
{
    std::ostringstream o;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.push_back(std::thread([&o, t]() {
            for (int i = 0; i < 200; i++) {
                LogLine line(o);
                line << "thread " << t << " line " << i << "\n";
                line << "    continued " << t << "\n";
            }
        }));
    }
    for (auto i = threads.begin(); i != threads.end(); ++i)
        i->join();

    std::istringstream in(o.str());
    std::string first, second;
    int count = 0;
    while (std::getline(in, first)) {
        ASSERT_TRUE(std::getline(in, second));
        size_t pos = first.find("thread ");
        ASSERT_NE(std::string::npos, pos);
        std::string t = first.substr(pos + 7, 1);
        EXPECT_EQ("    continued " + t, second);
        count++;
    }
    EXPECT_EQ(800, count);
}

TEST(LinuxUtilTest, PartialFileIsRenamedOnCommit)
{
    EdgeSync::Test::TempDir dir;
    std::string name = JoinPath(dir.Path(), "ride.fit");
    Buffer data = EdgeSync::Test::MakeFitData(100);
    {
        PartialFile f(name);
        f.Write(&data[0], data.size());
        EXPECT_EQ(name + ".part", f.PartName());
        EXPECT_TRUE(FileExists(f.PartName()));
        EXPECT_FALSE(FileExists(name));
        f.Commit();
    }
    EXPECT_TRUE(FileExists(name));
    EXPECT_FALSE(FileExists(name + ".part"));
}

TEST(LinuxUtilTest, PartialFileIsRemovedWithoutCommit)
{
    EdgeSync::Test::TempDir dir;
    std::string name = JoinPath(dir.Path(), "ride.fit");
    {
        PartialFile f(name);
        unsigned char b = 1;
        f.Write(&b, 1);
    }
    EXPECT_FALSE(FileExists(name));
    EXPECT_FALSE(FileExists(name + ".part"));
}

TEST(LinuxUtilTest, ListDirectoryTreeReturnsRelativePaths)
{
    EdgeSync::Test::TempDir dir;
    dir.WriteFile("a.fit", Buffer(10, 1));
    dir.WriteFile("sub/b.fit", Buffer(20, 2));
    dir.WriteFile("sub/deeper/c.fit", Buffer(30, 3));

    std::vector<FileInfo> files = ListDirectoryTree(dir.Path());
    ASSERT_EQ(3u, files.size());
    EXPECT_EQ("a.fit", files[0].Path);     // breadth first
    EXPECT_EQ(10u, files[0].Size);
    EXPECT_EQ("sub/b.fit", files[1].Path);
    EXPECT_EQ("sub/deeper/c.fit", files[2].Path);
}

TEST(LinuxUtilTest, PathHelpers)
{
    EXPECT_EQ("a/b", JoinPath("a", "b"));
    EXPECT_EQ("a/b", JoinPath("a/", "b"));
    EXPECT_EQ("b", JoinPath("", "b"));
    EXPECT_EQ("ride.fit", BaseName("GARMIN/Activity/ride.fit"));
    EXPECT_EQ("GARMIN/Activity", DirName("GARMIN/Activity/ride.fit"));
    EXPECT_EQ(".", DirName("ride.fit"));
    EXPECT_EQ("/", DirName("/ride.fit"));
}

};                                      // end namespace EdgeSync
