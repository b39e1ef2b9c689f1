#pragma once

#include <vector>
#include <iosfwd>
#include <sstream>
#include <string>
#include <stdint.h>
#include <stddef.h>

namespace EdgeSync {

typedef std::vector<unsigned char> Buffer;

/** Print a hex dump of 'data' to the stream 'o', 16 bytes per line, each
 * line with the offset, the hex bytes and their printable characters. */
void DumpData (const unsigned char *data, int size, std::ostream &o);

/** Dump at most 'limit' bytes of 'data', noting how many were left out. */
void DumpData (const Buffer &data, std::ostream &o, size_t limit = 512);

/** Put the current time on the output stream o, return 'o' so the log
 * message can follow. */
std::ostream& PutTimestamp(std::ostream &o);

/** One log message.  The text is collected in the LogLine and written to
 * the log stream, after a timestamp, when the LogLine is destroyed.  All
 * LogLine writes share one lock, so sessions, the event bus and the main
 * program can log to the same stream from their own threads:
 *
 *   LogLine(*m_LogStream) << "Session " << m_Id << ": closing\n";
 */
class LogLine
{
public:
    explicit LogLine(std::ostream &o) : m_Out(o) {}
    ~LogLine();

    template <typename T>
    LogLine& operator<<(const T &v)
    {
        m_Text << v;
        return *this;
    }

    /** Stream for functions which write to an ostream, like DumpData. */
    std::ostream& Stream() { return m_Text; }

private:
    LogLine(const LogLine&);
    LogLine& operator=(const LogLine&);

    std::ostream &m_Out;
    std::ostringstream m_Text;
};

// Little endian field access, as used by the device protocols.
inline unsigned GetU16(const unsigned char *p) { return p[0] | (p[1] << 8); }
inline unsigned GetU32(const unsigned char *p)
{
    return p[0] | (p[1] << 8) | (p[2] << 16) | (static_cast<unsigned>(p[3]) << 24);
}

inline void PutU16(Buffer &b, unsigned v)
{
    b.push_back (v & 0xff);
    b.push_back ((v >> 8) & 0xff);
}

inline void PutU32(Buffer &b, unsigned v)
{
    b.push_back (v & 0xff);
    b.push_back ((v >> 8) & 0xff);
    b.push_back ((v >> 16) & 0xff);
    b.push_back ((v >> 24) & 0xff);
}

/** Format a byte count as kilobytes, rounding up, e.g. "512k". */
std::string FormatKb(uint64_t bytes);

};                                      // end namespace EdgeSync

/*
    Local Variables:
    mode: c++
    End:
*/
