#include "FitFile.h"

#include <iostream>
#include <sstream>
#include <map>
#include <vector>

namespace {

using namespace EdgeSync;

const unsigned FILE_ID_MESSAGE = 0;

struct FieldDef {
    unsigned Number;
    unsigned Size;
};

struct MessageDef {
    unsigned GlobalNumber;
    bool BigEndian;
    std::vector<FieldDef> Fields;
    unsigned DevFieldsSize;
};

uint32_t ReadField(const unsigned char *p, unsigned size, bool big_endian)
{
    uint32_t v = 0;
    for (unsigned i = 0; i < size && i < 4; ++i) {
        unsigned shift = big_endian ? (size - 1 - i) * 8 : i * 8;
        v |= static_cast<uint32_t>(p[i]) << shift;
    }
    return v;
}

/** Walks the records of a FIT data section, keeping track of the
 * definition messages, until it finds the file_id message. */
class FileIdReader
{
public:
    FileIdReader(const unsigned char *data, size_t size)
        : m_Data(data), m_Size(size), m_Pos(0)
    {
    }

    bool Read(FitFileId &fid)
    {
        while (m_Pos < m_Size) {
            unsigned char h = Next();
            if (h & 0x80) {
                // Compressed timestamp header, always a data message
                if (ReadData((h >> 5) & 0x03, fid))
                    return true;
            }
            else if (h & 0x40) {
                ReadDefinition(h & 0x0f, (h & 0x20) != 0);
            }
            else {
                if (ReadData(h & 0x0f, fid))
                    return true;
            }
        }
        return false;
    }

private:

    unsigned char Next()
    {
        Need(1);
        return m_Data[m_Pos++];
    }

    void Need(size_t n)
    {
        if (m_Pos + n > m_Size)
            throw BadFitFile("ReadFitFileId", "truncated record");
    }

    void ReadDefinition(unsigned local, bool has_dev_fields)
    {
        Need(5);
        MessageDef def;
        def.BigEndian = m_Data[m_Pos + 1] == 1;
        def.GlobalNumber = ReadField(&m_Data[m_Pos + 2], 2, def.BigEndian);
        unsigned nfields = m_Data[m_Pos + 4];
        m_Pos += 5;
        Need(nfields * 3);
        for (unsigned i = 0; i < nfields; ++i) {
            FieldDef f;
            f.Number = m_Data[m_Pos];
            f.Size = m_Data[m_Pos + 1];
            def.Fields.push_back(f);
            m_Pos += 3;
        }
        def.DevFieldsSize = 0;
        if (has_dev_fields) {
            unsigned ndev = Next();
            Need(ndev * 3);
            for (unsigned i = 0; i < ndev; ++i) {
                def.DevFieldsSize += m_Data[m_Pos + 1];
                m_Pos += 3;
            }
        }
        m_Defs[local] = def;
    }

    bool ReadData(unsigned local, FitFileId &fid)
    {
        auto i = m_Defs.find(local);
        if (i == m_Defs.end())
            throw BadFitFile("ReadFitFileId", "data message without definition");
        const MessageDef &def = i->second;

        bool is_file_id = def.GlobalNumber == FILE_ID_MESSAGE;
        for (auto f = def.Fields.begin(); f != def.Fields.end(); ++f) {
            Need(f->Size);
            if (is_file_id) {
                uint32_t v = ReadField(&m_Data[m_Pos], f->Size, def.BigEndian);
                switch (f->Number) {
                case 0:
                    if (v != 0xff) fid.Type = v;
                    break;
                case 1:
                    if (v != 0xffff) fid.Manufacturer = v;
                    break;
                case 2:
                    if (v != 0xffff) fid.Product = v;
                    break;
                case 3:
                    fid.SerialNumber = v;
                    break;
                case 4:
                    if (v != 0xffffffff) fid.TimeCreated = v + FitEpoch;
                    break;
                default:
                    break;
                }
            }
            m_Pos += f->Size;
        }
        Need(def.DevFieldsSize);
        m_Pos += def.DevFieldsSize;
        return is_file_id;
    }

    const unsigned char *m_Data;
    size_t m_Size;
    size_t m_Pos;
    std::map<unsigned, MessageDef> m_Defs;
};

};                                      // end anonymous namespace

namespace EdgeSync {


// ......................................................... BadFitFile ....

BadFitFile::BadFitFile (const std::string &who, const char *reason)
    : m_Who (who),
      m_Reason (reason),
      m_MessageDone (false)
{
    // empty
}

const char* BadFitFile::what() const noexcept(true)
{
    if (! m_MessageDone) {
        std::ostringstream msg;
        msg << m_Who << ": " << m_Reason;
        m_Message = msg.str();
        m_MessageDone = true;
    }
    return m_Message.c_str();
}


// ............................................................... CRC ....

uint16_t Crc16(uint16_t crc, const unsigned char *data, size_t len)
{
    static const uint16_t crc_table[16] = {
        0x0000, 0xCC01, 0xD801, 0x1400, 0xF001, 0x3C00, 0x2800, 0xE401,
        0xA001, 0x6C00, 0x7800, 0xB401, 0x5000, 0x9C01, 0x8801, 0x4400
    };

    while (len--) {
        unsigned char byte = *data++;
        // compute checksum of lower four bits of byte
        uint16_t tmp = crc_table[crc & 0xF];
        crc = (crc >> 4) & 0x0FFF;
        crc = crc ^ tmp ^ crc_table[byte & 0xF];
        // now compute checksum of upper four bits of byte
        tmp = crc_table[crc & 0xF];
        crc = (crc >> 4) & 0x0FFF;
        crc = crc ^ tmp ^ crc_table[(byte >> 4) & 0xF];
    }
    return crc;
}


// ........................................................... headers ....

bool ReadFitHeader(const unsigned char *data, size_t size, FitHeader &header)
{
    if (data == nullptr || size < 12)
        return false;
    unsigned hlen = data[0];            // first byte is the header length
    if (hlen != 12 && hlen != 14)       // which must be 12 or 14 (with CRC)
        return false;
    if (size < hlen)
        return false;
    if (data[8] != '.' || data[9] != 'F' || data[10] != 'I' || data[11] != 'T')
        return false;
    header.HeaderSize = hlen;
    header.ProtocolVersion = data[1];
    header.ProfileVersion = GetU16(&data[2]);
    header.DataSize = GetU32(&data[4]);
    return true;
}

void CheckFitFile(const Buffer &data)
{
    FitHeader h;
    if (data.empty() || ! ReadFitHeader(&data[0], data.size(), h))
        throw BadFitFile("CheckFitFile", "bad header");
    if (h.HeaderSize == 14 && (data[12] || data[13])) {
        // Header has a non-zero CRC, check it
        if (Crc16 (&data[0], h.HeaderSize) != 0)
            throw BadFitFile("CheckFitFile", "bad header checksum");
    }
    if (data.size() < h.FileSize())
        throw BadFitFile("CheckFitFile", "short payload");
    if (Crc16 (&data[0], h.FileSize()) != 0)
        throw BadFitFile("CheckFitFile", "bad payload checksum");
}


// .......................................................... FitFileId ....

FitFileId::FitFileId()
    : Type(-1),
      Manufacturer(-1),
      Product(-1),
      SerialNumber(0),
      TimeCreated(0)
{
}

std::ostream& operator<<(std::ostream &o, const FitFileId &m)
{
    o << "#<FileId Type: ";
    if (m.Type < 0) o << "NA"; else o << m.Type;
    o << " Manufacturer: ";
    if (m.Manufacturer < 0) o << "NA"; else o << m.Manufacturer;
    o << " Product: ";
    if (m.Product < 0) o << "NA"; else o << m.Product;
    o << " SerialNumber: ";
    if (m.SerialNumber == 0) o << "NA"; else o << m.SerialNumber;
    o << " Created: ";
    if (m.TimeCreated == 0) o << "NA"; else o << m.TimeCreated;
    o << " >";
    return o;
}

FitFileId ReadFitFileId(const Buffer &data)
{
    FitHeader h;
    if (data.empty() || ! ReadFitHeader(&data[0], data.size(), h))
        throw BadFitFile("ReadFitFileId", "bad header");
    if (data.size() < h.HeaderSize + h.DataSize)
        throw BadFitFile("ReadFitFileId", "short payload");

    FitFileId fid;
    FileIdReader reader(&data[h.HeaderSize], h.DataSize);
    if (! reader.Read(fid))
        throw BadFitFile("ReadFitFileId", "no file_id message");
    return fid;
}

};                                      // end namespace EdgeSync
