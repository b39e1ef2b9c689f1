#pragma once

#include "Tools.h"

#include <stdint.h>
#include <ctime>
#include <iosfwd>
#include <stdexcept>

namespace EdgeSync {

/** Seconds between the unix epoch and the FIT epoch (31 dec, 1989). */
const uint32_t FitEpoch = 631065600;

/** Exception thrown when a buffer does not contain a valid FIT file. */
class BadFitFile : public std::exception
{
public:
    BadFitFile (const std::string &who, const char *reason);

    const char* what() const noexcept(true) override;

private:
    std::string m_Who;
    std::string m_Reason;
    mutable std::string m_Message;
    mutable bool m_MessageDone;
};

/** Compute the FIT CRC-16 of 'data', continuing from 'crc'.  Passing 0 for
 * 'crc' starts a new checksum. */
uint16_t Crc16(uint16_t crc, const unsigned char *data, size_t len);

inline uint16_t Crc16(const unsigned char *data, size_t len)
{
    return Crc16(0, data, len);
}

/** Header fields of a FIT file. */
struct FitHeader
{
    unsigned HeaderSize;
    unsigned ProtocolVersion;
    unsigned ProfileVersion;
    uint32_t DataSize;

    /** Total file size implied by the header: header, data and the 2 byte
     * CRC trailer. */
    uint64_t FileSize() const { return HeaderSize + DataSize + 2; }
};

/** Decode the FIT header at the start of 'data'.  Return false if 'data'
 * does not start with a FIT header. */
bool ReadFitHeader(const unsigned char *data, size_t size, FitHeader &header);

/** Check that 'data' holds a complete FIT file: valid header, header CRC
 * (if present) and data CRC.  Throws BadFitFile if it is not. */
void CheckFitFile(const Buffer &data);

/** The FIT file type values we care about. */
enum FitFileType {
    FIT_FILE_DEVICE = 1,
    FIT_FILE_SETTINGS = 2,
    FIT_FILE_SPORT = 3,
    FIT_FILE_ACTIVITY = 4,
    FIT_FILE_WORKOUT = 5,
    FIT_FILE_COURSE = 6
};

/** Contents of the FIT "file_id" message.  Fields not present in the file
 * keep their "not available" values. */
struct FitFileId
{
    FitFileId();

    int Type;                           // -1 if not available
    int Manufacturer;                   // -1 if not available
    int Product;                        // -1 if not available
    uint32_t SerialNumber;              // 0 if not available
    std::time_t TimeCreated;            // 0 if not available, unix time
};

std::ostream& operator<<(std::ostream &o, const FitFileId &m);

/** Read the first "file_id" message from the FIT file in 'data'.  Throws
 * BadFitFile if the file is malformed or has no such message. */
FitFileId ReadFitFileId(const Buffer &data);

};                                      // end namespace EdgeSync

/*
    Local Variables:
    mode: c++
    End:
*/
