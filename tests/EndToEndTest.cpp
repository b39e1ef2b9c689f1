#include "Session.h"
#include "FileCatalog.h"
#include "Extractor.h"
#include "FitFile.h"
#include "MassStorage.h"
#include "LinuxUtil.h"
#include "TestUtil.h"

#include <iostream>
#include <memory>

#include <gtest/gtest.h>

namespace EdgeSync {

namespace {

/** Return true if 'wanted' appears in 'types' in this order, possibly with
 * other events in between. */
bool IsSubsequence(const std::vector<EventType> &wanted, const std::vector<EventType> &types)
{
    auto w = wanted.begin();
    for (auto t = types.begin(); t != types.end() && w != wanted.end(); ++t) {
        if (*t == *w)
            ++w;
    }
    return w == wanted.end();
}

};                                      // end anonymous namespace

TEST(EndToEndTest, ConnectListAndExtractOverBluetooth)
{
    const size_t kb = 1024;
    Buffer ride2 = EdgeSync::Test::MakeFitData(1024 * kb, 2);
    Buffer ride3 = EdgeSync::Test::MakeFitData(500 * kb, 3);

    EdgeSync::Test::TempDir dir;
    EventBus bus;
    EdgeSync::Test::EventRecorder recorder(bus);

    EdgeSync::Test::FakeTransport *fake = new EdgeSync::Test::FakeTransport;
    fake->AddFile("Activity/ride_002.fit", ride2, 1600000000);
    fake->AddFile("Activity/ride_003.fit", ride3, 1600090000);
    Session session(Device(TRANSPORT_BLUETOOTH, "D1", "Edge 530"),
                    std::unique_ptr<Transport>(fake), bus, &std::cerr);

    session.Connect(5000).get();
    ASSERT_EQ(SS_READY, session.State());

    FileCatalog catalog(session);
    std::vector<FileEntry> entries = catalog.ListFiles(5000);
    ASSERT_EQ(2u, entries.size());
    EXPECT_EQ("Activity/ride_003.fit", entries[0].Path);
    EXPECT_EQ(500 * kb, entries[0].Size);
    EXPECT_EQ("Activity/ride_002.fit", entries[1].Path);
    EXPECT_EQ(1024 * kb, entries[1].Size);

    Extractor extractor(session);
    std::string out = JoinPath(dir.Path(), "out/");
    std::shared_ptr<TransferJob> job = extractor.Extract(entries[0], out);
    job->Get();

    Buffer local;
    ReadData(JoinPath(dir.Path(), "out/ride_003.fit"), local);
    EXPECT_EQ(500 * kb, local.size());
    EXPECT_EQ(ride3, local);
    EXPECT_NO_THROW(CheckFitFile(local));
    EXPECT_EQ(entries[0].Checksum, Crc16(&local[0], local.size() - 2));

    session.Close();
    std::vector<Event> events = recorder.Events();
    std::vector<EventType> types;
    std::vector<SessionState> states;
    for (auto i = events.begin(); i != events.end(); ++i) {
        EXPECT_EQ(session.Id(), i->SessionId);
        types.push_back(i->Type);
        if (i->Type == EV_STATE_CHANGED)
            states.push_back(i->State);
    }

    std::vector<SessionState> expected_states = {
        SS_CONNECTING, SS_CONNECTED, SS_AUTHENTICATING, SS_READY, SS_CLOSING, SS_DISCONNECTED
    };
    EXPECT_EQ(expected_states, states);

    std::vector<EventType> expected_types = {
        EV_STATE_CHANGED, EV_STATE_CHANGED, EV_LISTING_COMPLETE, EV_TRANSFER_QUEUED,
        EV_TRANSFER_PROGRESS, EV_TRANSFER_COMPLETE
    };
    EXPECT_TRUE(IsSubsequence(expected_types, types));

    // Progress only moves forward and ends at the file size
    uint64_t last = 0;
    unsigned progress = 0;
    for (auto i = events.begin(); i != events.end(); ++i) {
        if (i->Type != EV_TRANSFER_PROGRESS)
            continue;
        EXPECT_GT(i->BytesTransferred, last);
        last = i->BytesTransferred;
        progress++;
    }
    EXPECT_EQ(500 * kb, last);
    EXPECT_EQ(125u, progress);          // 4096 byte chunks
    EXPECT_EQ(1u, recorder.Count(EV_TRANSFER_COMPLETE));
    EXPECT_EQ(0u, recorder.Count(EV_TRANSFER_FAILED));
}

TEST(EndToEndTest, SyncFromAMountedUsbVolume)
{
    EdgeSync::Test::TempDir volume;
    std::string xml =
        "<Device><Model><SoftwareVersion>320</SoftwareVersion>"
        "<Description>Edge 1030</Description></Model><Id>3999999999</Id></Device>";
    volume.WriteFile(GarminDeviceXml, Buffer(xml.begin(), xml.end()));
    Buffer ride = EdgeSync::Test::MakeFitData(100000, 5);
    std::string remote = volume.WriteFile("GARMIN/Activity/2024-05-01-07-30-00.fit", ride);
    SetFileTime(remote, 1714548600);
    volume.WriteFile("GARMIN/Activity/readme.txt", Buffer(10, 'x'));

    EdgeSync::Test::TempDir out;
    EventBus bus;
    EdgeSync::Test::EventRecorder recorder(bus);
    Device d(TRANSPORT_USB, "3999999999", "Edge 1030", volume.Path());
    Session session(d, MakeTransport(d, &std::cerr), bus, &std::cerr);

    session.Connect(5000).get();
    EXPECT_EQ("Edge 1030", session.GetDevice().Model);
    EXPECT_EQ("3.20", session.GetDevice().Firmware);

    FileCatalog catalog(session);
    std::vector<FileEntry> entries = catalog.ListFiles(5000);
    ASSERT_EQ(1u, entries.size());
    EXPECT_EQ("GARMIN/Activity/2024-05-01-07-30-00.fit", entries[0].Path);
    EXPECT_EQ(1714548600, entries[0].Modified);
    EXPECT_TRUE(entries[0].HasChecksum);

    Extractor extractor(session);
    std::shared_ptr<TransferJob> job = extractor.Extract(entries[0], out.Path());
    job->Get();

    Buffer local;
    ReadData(job->Destination(), local);
    EXPECT_EQ(ride, local);
    EXPECT_EQ(JoinPath(out.Path(), "2024-05-01-07-30-00.fit"), job->Destination());

    session.Close();
    EXPECT_EQ(SS_DISCONNECTED, session.State());
}

};                                      // end namespace EdgeSync
