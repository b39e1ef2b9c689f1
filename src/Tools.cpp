#include "Tools.h"

#include <algorithm>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <locale>
#include <mutex>
#include <time.h>
#include <stdio.h>

namespace EdgeSync {

namespace {

/** Character shown for 'c' in a hex dump, '.' if it is not printable. */
char Printable(unsigned char c, const std::locale &loc)
{
    char ch = static_cast<char>(c);
    if (ch == ' ' || (std::isprint(ch, loc) && ! std::isspace(ch, loc)))
        return ch;
    return '.';
}

};                                      // end anonymous namespace

void DumpData (const unsigned char *data, int size, std::ostream &o)
{
    const int ncols = 16;
    std::ios::fmtflags saved_flags = o.flags();
    char saved_fill = o.fill('0');
    std::locale loc = o.getloc();

    for (int row = 0; row < size; row += ncols) {
        int n = std::min(ncols, size - row);
        o << std::hex << std::setw(4) << row << "  ";
        for (int col = 0; col < ncols; ++col) {
            if (col < n)
                o << std::setw(2) << static_cast<unsigned>(data[row + col]) << ' ';
            else
                o << "   ";
        }
        o << ' ';
        for (int col = 0; col < n; ++col)
            o << Printable(data[row + col], loc);
        o << '\n';
    }

    o.fill(saved_fill);
    o.flags(saved_flags);
}

void DumpData (const Buffer &data, std::ostream &o, size_t limit)
{
    size_t n = std::min(data.size(), limit);
    if (n > 0)
        DumpData(&data[0], static_cast<int>(n), o);
    if (n < data.size())
        o << "... " << data.size() - n << " more bytes\n";
}

std::ostream& PutTimestamp(std::ostream &o)
{
    struct timespec tsp;
    if (clock_gettime(CLOCK_REALTIME, &tsp) < 0) {
        perror("clock_gettime");
        return o;
    }
    struct tm tm;
    localtime_r(&tsp.tv_sec, &tm);

    unsigned msec = tsp.tv_nsec / 1000000;

    char fill = o.fill('0');
    o
      << std::setw(4) << tm.tm_year + 1900
      << '-' << std::setw(2) << tm.tm_mon + 1
      << '-' << std::setw(2) << tm.tm_mday
      << ' ' << std::setw(2) << tm.tm_hour
      << ':' << std::setw(2) << tm.tm_min
      << ':' << std::setw(2) << tm.tm_sec
      << '.' << std::setw(3) << msec << ' ';
    o.fill(fill);
    return o;
}

LogLine::~LogLine()
{
    static std::mutex log_mutex;
    std::unique_lock<std::mutex> lock(log_mutex);
    PutTimestamp(m_Out) << m_Text.str();
    m_Out.flush();
}

std::string FormatKb(uint64_t bytes)
{
    uint64_t kb = bytes / 1024;
    if ((bytes % 1024) != 0) kb++;
    std::ostringstream o;
    o << kb << "k";
    return o.str();
}


};                                      // end namespace EdgeSync

