#pragma once

/** Frames of the file service Edge devices expose over Bluetooth LE.  The
 * host writes a request frame to the request characteristic and reads the
 * reply from the response characteristic.  All values are little endian.
 *
 *   list request    45 01 page:u16
 *   list response   45 81 status count:u8 page:u16 pages:u16 record*
 *     record        size:u32 fit_time:u32 flags:u8 crc:u16 path_len:u8 path
 *   read request    45 02 offset:u32 length:u16 path_len:u8 path
 *   read response   45 82 status offset:u32 length:u16 data
 */

#include "Tools.h"
#include "Transport.h"

#include <string>
#include <vector>

namespace EdgeSync {

    enum FileServiceCommands {
        FS_HEADER = 0x45,

        FS_LIST_REQUEST = 0x01,
        FS_READ_REQUEST = 0x02,

        FS_LIST_RESPONSE = 0x81,
        FS_READ_RESPONSE = 0x82
    };

    enum FileServiceStatus {
        FSS_OK = 0,
        FSS_NOT_FOUND = 1,
        FSS_NOT_READABLE = 2,
        FSS_BUSY = 3,
        FSS_INVALID_REQUEST = 4
    };

    enum FileServiceFlags {
        FSF_READ = 0x80,
        FSF_HAS_CRC = 0x01
    };

    /** Largest frame the device will send, the limit of a GATT attribute
     * value. */
    const unsigned FileServiceMaxFrame = 512;

    /** Size of the fixed part of a read response. */
    const unsigned FileServiceReadHeader = 9;

    /** Largest data payload of a read response. */
    const unsigned FileServiceMaxRead = FileServiceMaxFrame - FileServiceReadHeader;

    const char* ToString(FileServiceStatus s);

    Buffer MakeListRequest(unsigned page);
    Buffer MakeReadRequest(const std::string &path, uint32_t offset, unsigned length);

    /** One decoded page of a directory listing. */
    struct ListPage
    {
        ListPage() : Status(FSS_OK), Page(0), PageCount(0) {}

        FileServiceStatus Status;
        unsigned Page;
        unsigned PageCount;
        std::vector<RawEntry> Entries;
    };

    /** Decode a list response.  Throws TransportError if the frame is
     * malformed.  A non-OK status is returned in the page, with no
     * entries. */
    ListPage ParseListResponse(const Buffer &frame);

    /** Decode a read response into 'data'.  Throws TransportError if the
     * frame is malformed, the status is not OK or the frame is for a
     * different offset than 'expected_offset'. */
    void ParseReadResponse(const Buffer &frame, uint32_t expected_offset, Buffer &data);

    /** Encode a list response, used by the device simulator in the
     * tests. */
    Buffer MakeListResponse(FileServiceStatus status, unsigned page, unsigned pages,
                            const std::vector<RawEntry> &entries);

    /** Encode a read response, used by the device simulator in the
     * tests. */
    Buffer MakeReadResponse(FileServiceStatus status, uint32_t offset,
                            const unsigned char *data, unsigned length);

};                                      // end namespace EdgeSync

/*
    Local Variables:
    mode: c++
    End:
*/
