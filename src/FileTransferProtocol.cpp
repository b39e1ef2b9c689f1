#include "FileTransferProtocol.h"
#include "FitFile.h"
#include "Errors.h"

#include <sstream>
#include <stdexcept>

namespace {

    using namespace EdgeSync;

    const unsigned g_ListHeader = 8;
    const unsigned g_RecordHeader = 12;

    void CheckFrame (const Buffer &frame, unsigned char command, unsigned min_size,
                     const char *who)
    {
        if (frame.size() < min_size) {
            std::ostringstream msg;
            msg << "short frame, " << frame.size() << " bytes";
            throw TransportError(who, msg.str());
        }
        if (frame[0] != FS_HEADER || frame[1] != command) {
            std::ostringstream msg;
            msg << "unexpected frame " << std::hex
                << (int)frame[0] << " " << (int)frame[1];
            throw TransportError(who, msg.str());
        }
    }

    std::time_t FromFitTime(uint32_t t)
    {
        return t == 0 ? 0 : static_cast<std::time_t>(t) + FitEpoch;
    }

    uint32_t ToFitTime(std::time_t t)
    {
        return t < static_cast<std::time_t>(FitEpoch) ? 0 : static_cast<uint32_t>(t - FitEpoch);
    }

};                                      // end anonymous namespace

namespace EdgeSync {

    const char* ToString(FileServiceStatus s)
    {
        switch (s) {
        case FSS_OK: return "ok";
        case FSS_NOT_FOUND: return "not found";
        case FSS_NOT_READABLE: return "not readable";
        case FSS_BUSY: return "device busy";
        case FSS_INVALID_REQUEST: return "invalid request";
        default: return "unknown status";
        }
    }

    Buffer MakeListRequest(unsigned page)
    {
        Buffer b;
        b.push_back (FS_HEADER);
        b.push_back (FS_LIST_REQUEST);
        PutU16 (b, page);
        return b;
    }

    Buffer MakeReadRequest(const std::string &path, uint32_t offset, unsigned length)
    {
        if (path.size() > 255)
            throw std::invalid_argument("MakeReadRequest -- path too long");
        if (length > 0xFFFF)
            throw std::invalid_argument("MakeReadRequest -- length too big");
        Buffer b;
        b.push_back (FS_HEADER);
        b.push_back (FS_READ_REQUEST);
        PutU32 (b, offset);
        PutU16 (b, length);
        b.push_back (static_cast<unsigned char>(path.size()));
        b.insert (b.end(), path.begin(), path.end());
        return b;
    }

    ListPage ParseListResponse(const Buffer &frame)
    {
        const char *who = "ParseListResponse";
        CheckFrame (frame, FS_LIST_RESPONSE, g_ListHeader, who);

        ListPage page;
        page.Status = static_cast<FileServiceStatus>(frame[2]);
        unsigned count = frame[3];
        page.Page = GetU16(&frame[4]);
        page.PageCount = GetU16(&frame[6]);
        if (page.Status != FSS_OK)
            return page;

        size_t pos = g_ListHeader;
        for (unsigned i = 0; i < count; i++) {
            if (pos + g_RecordHeader > frame.size())
                throw TransportError(who, "truncated file record");
            RawEntry e;
            e.Size = GetU32(&frame[pos]);
            e.Modified = FromFitTime(GetU32(&frame[pos + 4]));
            unsigned flags = frame[pos + 8];
            e.HasChecksum = (flags & FSF_HAS_CRC) != 0;
            e.Checksum = GetU16(&frame[pos + 9]);
            unsigned path_len = frame[pos + 11];
            pos += g_RecordHeader;
            if (pos + path_len > frame.size())
                throw TransportError(who, "truncated file name");
            e.Path.assign(frame.begin() + pos, frame.begin() + pos + path_len);
            pos += path_len;
            // Files the device won't let us read are of no use to anyone
            if (flags & FSF_READ)
                page.Entries.push_back(e);
        }
        return page;
    }

    void ParseReadResponse(const Buffer &frame, uint32_t expected_offset, Buffer &data)
    {
        const char *who = "ParseReadResponse";
        CheckFrame (frame, FS_READ_RESPONSE, FileServiceReadHeader, who);

        FileServiceStatus status = static_cast<FileServiceStatus>(frame[2]);
        if (status != FSS_OK)
            throw TransportError(who, ToString(status));

        uint32_t offset = GetU32(&frame[3]);
        unsigned length = GetU16(&frame[7]);
        if (offset != expected_offset) {
            std::ostringstream msg;
            msg << "offset mismatch, expected " << expected_offset << ", got " << offset;
            throw TransportError(who, msg.str());
        }
        if (FileServiceReadHeader + length != frame.size()) {
            std::ostringstream msg;
            msg << "length mismatch, header says " << length << ", frame has "
                << frame.size() - FileServiceReadHeader;
            throw TransportError(who, msg.str());
        }
        data.assign(frame.begin() + FileServiceReadHeader, frame.end());
    }

    Buffer MakeListResponse(FileServiceStatus status, unsigned page, unsigned pages,
                            const std::vector<RawEntry> &entries)
    {
        if (entries.size() > 255)
            throw std::invalid_argument("MakeListResponse -- too many entries");
        Buffer b;
        b.push_back (FS_HEADER);
        b.push_back (FS_LIST_RESPONSE);
        b.push_back (static_cast<unsigned char>(status));
        b.push_back (static_cast<unsigned char>(entries.size()));
        PutU16 (b, page);
        PutU16 (b, pages);
        for (auto i = entries.begin(); i != entries.end(); ++i) {
            if (i->Path.size() > 255)
                throw std::invalid_argument("MakeListResponse -- path too long");
            PutU32 (b, static_cast<unsigned>(i->Size));
            PutU32 (b, ToFitTime(i->Modified));
            b.push_back (FSF_READ | (i->HasChecksum ? FSF_HAS_CRC : 0));
            PutU16 (b, i->Checksum);
            b.push_back (static_cast<unsigned char>(i->Path.size()));
            b.insert (b.end(), i->Path.begin(), i->Path.end());
        }
        return b;
    }

    Buffer MakeReadResponse(FileServiceStatus status, uint32_t offset,
                            const unsigned char *data, unsigned length)
    {
        Buffer b;
        b.push_back (FS_HEADER);
        b.push_back (FS_READ_RESPONSE);
        b.push_back (static_cast<unsigned char>(status));
        PutU32 (b, offset);
        PutU16 (b, length);
        if (length > 0)
            b.insert (b.end(), data, data + length);
        return b;
    }

};                                      // end namespace EdgeSync
