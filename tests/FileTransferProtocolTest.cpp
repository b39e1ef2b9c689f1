#include "FileTransferProtocol.h"
#include "BluetoothTransport.h"
#include "FitFile.h"
#include "Errors.h"

#include <sstream>

#include <gtest/gtest.h>

namespace EdgeSync {

TEST(FileTransferProtocolTest, ReadRequestLayout)
{
    Buffer b = MakeReadRequest("ride.fit", 0x01020304, 503);
    ASSERT_EQ(17u, b.size());
    EXPECT_EQ(FS_HEADER, b[0]);
    EXPECT_EQ(FS_READ_REQUEST, b[1]);
    EXPECT_EQ(0x01020304u, GetU32(&b[2]));
    EXPECT_EQ(503u, GetU16(&b[6]));
    EXPECT_EQ(8, b[8]);
    EXPECT_EQ("ride.fit", std::string(b.begin() + 9, b.end()));

    EXPECT_THROW(MakeReadRequest(std::string(300, 'a'), 0, 10), std::invalid_argument);
}

TEST(FileTransferProtocolTest, ListResponseDecodesReadableEntries)
{
    std::vector<RawEntry> entries(2);
    entries[0].Path = "Activity/ride_001.fit";
    entries[0].Size = 1024 * 1024;
    entries[0].Modified = 1700000000;
    entries[0].HasChecksum = true;
    entries[0].Checksum = 0xbeef;
    entries[1].Path = "Settings.fit";
    entries[1].Size = 42;

    Buffer frame = MakeListResponse(FSS_OK, 1, 3, entries);
    ListPage page = ParseListResponse(frame);
    EXPECT_EQ(FSS_OK, page.Status);
    EXPECT_EQ(1u, page.Page);
    EXPECT_EQ(3u, page.PageCount);
    ASSERT_EQ(2u, page.Entries.size());
    EXPECT_EQ("Activity/ride_001.fit", page.Entries[0].Path);
    EXPECT_EQ(1024u * 1024u, page.Entries[0].Size);
    EXPECT_EQ(1700000000, page.Entries[0].Modified);
    EXPECT_TRUE(page.Entries[0].HasChecksum);
    EXPECT_EQ(0xbeef, page.Entries[0].Checksum);
    EXPECT_FALSE(page.Entries[1].HasChecksum);
    EXPECT_EQ(0, page.Entries[1].Modified);     // no timestamp on the device
}

TEST(FileTransferProtocolTest, ListResponseSkipsUnreadableEntries)
{
    std::vector<RawEntry> entries(1);
    entries[0].Path = "locked.fit";
    entries[0].Size = 10;
    Buffer frame = MakeListResponse(FSS_OK, 0, 1, entries);
    frame[8 + 8] = 0;                   // clear the record flags
    EXPECT_TRUE(ParseListResponse(frame).Entries.empty());
}

TEST(FileTransferProtocolTest, ListResponseReportsDeviceStatus)
{
    ListPage page = ParseListResponse(MakeListResponse(FSS_BUSY, 0, 0, std::vector<RawEntry>()));
    EXPECT_EQ(FSS_BUSY, page.Status);
    EXPECT_TRUE(page.Entries.empty());
}

TEST(FileTransferProtocolTest, MalformedListResponsesAreTransportErrors)
{
    std::vector<RawEntry> entries(1);
    entries[0].Path = "ride.fit";
    Buffer frame = MakeListResponse(FSS_OK, 0, 1, entries);

    Buffer truncated(frame.begin(), frame.end() - 3);
    EXPECT_THROW(ParseListResponse(truncated), TransportError);

    Buffer wrong = frame;
    wrong[1] = FS_READ_RESPONSE;
    EXPECT_THROW(ParseListResponse(wrong), TransportError);

    EXPECT_THROW(ParseListResponse(Buffer(3, FS_HEADER)), TransportError);
}

TEST(FileTransferProtocolTest, ReadResponseChecksOffsetAndLength)
{
    const unsigned char payload[] = { 1, 2, 3, 4, 5 };
    Buffer data;

    Buffer frame = MakeReadResponse(FSS_OK, 4096, payload, sizeof(payload));
    ParseReadResponse(frame, 4096, data);
    EXPECT_EQ(Buffer(payload, payload + sizeof(payload)), data);

    EXPECT_THROW(ParseReadResponse(frame, 0, data), TransportError);

    Buffer short_frame(frame.begin(), frame.end() - 1);
    EXPECT_THROW(ParseReadResponse(short_frame, 4096, data), TransportError);

    Buffer not_found = MakeReadResponse(FSS_NOT_FOUND, 4096, nullptr, 0);
    try {
        ParseReadResponse(not_found, 4096, data);
        FAIL() << "TransportError expected";
    }
    catch (const TransportError &e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("not found"));
    }
}

TEST(FileTransferProtocolTest, EmptyReadResponseMarksEndOfFile)
{
    Buffer data(10, 0xff);
    ParseReadResponse(MakeReadResponse(FSS_OK, 100, nullptr, 0), 100, data);
    EXPECT_TRUE(data.empty());
}

TEST(BluetoothTransportTest, PairingAnUnknownDeviceFails)
{
    // Without BlueZ, or with BlueZ not knowing the address, pairing fails
    // with an error instead of pretending to succeed.
    std::ostringstream log;
    Device d(TRANSPORT_BLUETOOTH, "00:00:00:00:00:00", "nothing");
    EXPECT_THROW(PairBluetoothDevice(d, 500, &log), EdgeSyncError);
    EXPECT_EQ(std::string::npos, log.str().find("Pairing with"));
}

};                                      // end namespace EdgeSync
