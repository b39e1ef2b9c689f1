#include "MassStorage.h"
#include "UsbTransport.h"
#include "LinuxUtil.h"
#include "FitFile.h"
#include "TestUtil.h"

#include <algorithm>
#include <iostream>
#include <sstream>

#include <sys/stat.h>
#include <unistd.h>

#include <gtest/gtest.h>

namespace EdgeSync {

namespace {

const char *g_DeviceXml =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"no\" ?>\n"
    "<Device xmlns=\"http://www.garmin.com/xmlschemas/GarminDevice/v2\">\n"
    "  <Model>\n"
    "    <PartNumber>006-B3122-00</PartNumber>\n"
    "    <SoftwareVersion>950</SoftwareVersion>\n"
    "    <Description>Edge 530</Description>\n"
    "  </Model>\n"
    "  <Id>3345678901</Id>\n"
    "  <MassStorageMode>\n"
    "    <DataType>\n"
    "      <Name>FIT_TYPE_4</Name>\n"
    "      <File>\n"
    "        <Location><Path>Garmin/Activity</Path></Location>\n"
    "      </File>\n"
    "    </DataType>\n"
    "  </MassStorageMode>\n"
    "</Device>\n";

Buffer ToBuffer(const std::string &s)
{
    return Buffer(s.begin(), s.end());
}

/** A directory laid out like the volume of an Edge in mass storage
 * mode. */
class GarminVolume
{
public:
    GarminVolume()
    {
        m_Dir.WriteFile(GarminDeviceXml, ToBuffer(g_DeviceXml));
        Ride1 = EdgeSync::Test::MakeFitData(3000, 1);
        Ride2 = EdgeSync::Test::MakeFitData(70000, 2);
        m_Dir.WriteFile("GARMIN/Activity/ride_001.fit", Ride1);
        m_Dir.WriteFile("GARMIN/Activity/ride_002.fit", Ride2);
        Buffer broken = EdgeSync::Test::MakeFitData(500, 3);
        broken.resize(400);             // still being written by the device
        m_Dir.WriteFile("GARMIN/Activity/ride_003.fit", broken);
        m_Dir.WriteFile("GARMIN/Settings/notes.txt", ToBuffer("hello"));
    }

    const std::string& Path() const { return m_Dir.Path(); }
    EdgeSync::Test::TempDir& Dir() { return m_Dir; }

    Buffer Ride1;
    Buffer Ride2;

private:
    EdgeSync::Test::TempDir m_Dir;
};

const RawEntry* FindEntry(const std::vector<RawEntry> &entries, const std::string &path)
{
    auto i = std::find_if(entries.begin(), entries.end(),
                          [&path](const RawEntry &e) { return e.Path == path; });
    return i == entries.end() ? nullptr : &*i;
}

};                                      // end anonymous namespace

TEST(MassStorageTest, XmlElementText)
{
    std::string xml = "<a><b>one</b><c><b>two</b></c></a>";
    EXPECT_EQ("one", XmlElementText(xml, "b"));
    EXPECT_EQ("two", XmlElementText(xml, "b", xml.find("<c>")));
    EXPECT_EQ("", XmlElementText(xml, "b", xml.find("<c>"), xml.find("<b>two")));
    EXPECT_EQ("", XmlElementText(xml, "d"));
}

TEST(MassStorageTest, MissingMountPointIsRejected)
{
    EXPECT_THROW(MassStorageVolume("/nonexistent/edge-sync"), UnixException);
}

TEST(MassStorageTest, ReadsTheDeviceIdentity)
{
    GarminVolume v;
    MassStorageVolume volume(v.Path());
    EXPECT_TRUE(volume.IsGarminVolume());

    DeviceIdentity id = volume.ReadIdentity();
    EXPECT_EQ("Edge 530", id.Model);
    EXPECT_EQ("9.50", id.Firmware);
    EXPECT_EQ("3345678901", id.UnitId);
}

TEST(MassStorageTest, ListsAllFilesWithChecksumsOfCompleteFitFiles)
{
    GarminVolume v;
    MassStorageVolume volume(v.Path());
    std::vector<RawEntry> entries = volume.List();
    EXPECT_EQ(5u, entries.size());

    const RawEntry *ride1 = FindEntry(entries, "GARMIN/Activity/ride_001.fit");
    ASSERT_NE(nullptr, ride1);
    EXPECT_EQ(3000u, ride1->Size);
    EXPECT_GT(ride1->Modified, 0);
    EXPECT_TRUE(ride1->HasChecksum);
    EXPECT_EQ(Crc16(&v.Ride1[0], v.Ride1.size() - 2), ride1->Checksum);

    const RawEntry *partial = FindEntry(entries, "GARMIN/Activity/ride_003.fit");
    ASSERT_NE(nullptr, partial);
    EXPECT_FALSE(partial->HasChecksum);

    const RawEntry *notes = FindEntry(entries, "GARMIN/Settings/notes.txt");
    ASSERT_NE(nullptr, notes);
    EXPECT_FALSE(notes->HasChecksum);
    EXPECT_NE(nullptr, FindEntry(entries, "GARMIN/GarminDevice.xml"));
}

TEST(MassStorageTest, ReadsAtAnyOffset)
{
    GarminVolume v;
    MassStorageVolume volume(v.Path());
    Buffer data;

    volume.Read("GARMIN/Activity/ride_002.fit", 1000, 500, data);
    EXPECT_EQ(Buffer(v.Ride2.begin() + 1000, v.Ride2.begin() + 1500), data);

    volume.Read("GARMIN/Activity/ride_002.fit", 69900, 500, data);
    EXPECT_EQ(100u, data.size());

    volume.Read("GARMIN/Activity/ride_002.fit", 70000, 500, data);
    EXPECT_TRUE(data.empty());

    volume.Read("GARMIN/Activity/ride_001.fit", 0, 10, data);
    EXPECT_EQ(Buffer(v.Ride1.begin(), v.Ride1.begin() + 10), data);
}

TEST(MassStorageTest, OnlyFilesInsideTheVolumeCanBeRead)
{
    GarminVolume v;
    MassStorageVolume volume(v.Path());
    Buffer data;
    EXPECT_THROW(volume.Read("/etc/passwd", 0, 10, data), UnixException);
    EXPECT_THROW(volume.Read("GARMIN/../../etc/passwd", 0, 10, data), UnixException);
    EXPECT_THROW(volume.Read("GARMIN/missing.fit", 0, 10, data), UnixException);
}

TEST(MassStorageTest, FileNamesMayContainDoubleDots)
{
    GarminVolume v;
    EdgeSync::Test::TempDir &dir = v.Dir();
    Buffer ride = EdgeSync::Test::MakeFitData(200, 7);
    dir.WriteFile("GARMIN/Activity/ride..fit", ride);
    dir.WriteFile("GARMIN/..hidden/a.fit", ride);
    MassStorageVolume volume(v.Path());
    Buffer data;
    volume.Read("GARMIN/Activity/ride..fit", 0, 1000, data);
    EXPECT_EQ(ride, data);
    volume.Read("GARMIN/..hidden/a.fit", 0, 1000, data);
    EXPECT_EQ(ride, data);
    EXPECT_THROW(volume.Read("GARMIN/Activity/..", 0, 10, data), UnixException);
    EXPECT_THROW(volume.Read("../GARMIN/Activity/ride_001.fit", 0, 10, data), UnixException);
}

TEST(MassStorageTest, UnreadableFilesDoNotStopTheListing)
{
    GarminVolume v;
    EdgeSync::Test::TempDir &dir = v.Dir();
    std::string locked = dir.WriteFile("GARMIN/Activity/locked.fit", EdgeSync::Test::MakeFitData(300, 8));
    std::string settings = dir.WriteFile("GARMIN/Settings/settings.dat", Buffer(100, 0));
    ASSERT_EQ(0, chmod(locked.c_str(), 0));
    ASSERT_EQ(0, chmod(settings.c_str(), 0));

    std::ostringstream log;
    MassStorageVolume volume(v.Path(), &log);
    std::vector<RawEntry> entries;
    ASSERT_NO_THROW(entries = volume.List());
    EXPECT_EQ(7u, entries.size());

    const RawEntry *e = FindEntry(entries, "GARMIN/Activity/locked.fit");
    ASSERT_NE(nullptr, e);
    EXPECT_EQ(300u, e->Size);
    if (geteuid() != 0) {               // root can open the file anyway
        EXPECT_FALSE(e->HasChecksum);
        EXPECT_NE(std::string::npos, log.str().find("no checksum for GARMIN/Activity/locked.fit"));
    }
    // Only FIT files are opened
    EXPECT_EQ(std::string::npos, log.str().find("settings.dat"));
    EXPECT_TRUE(FindEntry(entries, "GARMIN/Activity/ride_001.fit")->HasChecksum);
}

TEST(UsbTransportTest, UsesTheVolumeAtTheDeviceLocation)
{
    GarminVolume v;
    UsbTransport t(Device(TRANSPORT_USB, "3345678901", "Edge 530", v.Path()), &std::cerr);
    IoContext ctx(1000, CancelToken());

    t.Connect(ctx);
    EXPECT_EQ("Edge 530", t.Identify(ctx).Model);
    EXPECT_EQ(5u, t.List(ctx).size());

    Buffer data;
    t.ReadChunk("GARMIN/Activity/ride_001.fit", 0, 3000, data, ctx);
    EXPECT_EQ(v.Ride1, data);
    EXPECT_GE(t.MaxChunkSize(), 4096u);

    t.Disconnect();
    t.Disconnect();
    EXPECT_THROW(t.List(ctx), TransportError);
}

TEST(UsbTransportTest, VolumeWithoutGarminDirectoryIsRejected)
{
    EdgeSync::Test::TempDir dir;
    UsbTransport t(Device(TRANSPORT_USB, "1", "stick", dir.Path()), &std::cerr);
    EXPECT_THROW(t.Connect(IoContext(1000, CancelToken())), TransportError);
}

TEST(UsbTransportTest, VolumeWithoutDeviceXmlIsUnsupported)
{
    EdgeSync::Test::TempDir dir;
    dir.WriteFile("GARMIN/Activity/ride.fit", EdgeSync::Test::MakeFitData(100));
    UsbTransport t(Device(TRANSPORT_USB, "1", "card", dir.Path()), &std::cerr);
    IoContext ctx(1000, CancelToken());
    t.Connect(ctx);
    EXPECT_THROW(t.Identify(ctx), UnsupportedDeviceError);
}

TEST(UsbTransportTest, MissingFileIsATransportError)
{
    GarminVolume v;
    UsbTransport t(Device(TRANSPORT_USB, "1", "Edge", v.Path()), &std::cerr);
    IoContext ctx(1000, CancelToken());
    t.Connect(ctx);
    Buffer data;
    EXPECT_THROW(t.ReadChunk("GARMIN/Activity/missing.fit", 0, 10, data, ctx), TransportError);
}

TEST(UsbTransportTest, CancelledOperationsDoNotTouchTheVolume)
{
    GarminVolume v;
    UsbTransport t(Device(TRANSPORT_USB, "1", "Edge", v.Path()), &std::cerr);
    CancelToken cancel;
    IoContext ctx(1000, cancel);
    t.Connect(ctx);
    cancel.Cancel();
    EXPECT_THROW(t.List(ctx), CancelledError);
}

};                                      // end namespace EdgeSync
