#include "MassStorage.h"
#include "LinuxUtil.h"
#include "FitFile.h"
#include "Tools.h"

#include <iostream>
#include <sstream>
#include <stdexcept>

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <dirent.h>
#include <limits.h>
#include <stdlib.h>
#include <mntent.h>
#include <strings.h>

namespace {

using namespace EdgeSync;

const char *g_ByIdDir = "/dev/disk/by-id";
const char *g_MountsFile = "/proc/mounts";

/** Return the canonical name of 'path' (following symlinks), or an empty
 * string if it cannot be resolved. */
std::string RealPath(const std::string &path)
{
    char buf[PATH_MAX];
    if (realpath(path.c_str(), buf) == nullptr)
        return std::string();
    return std::string(buf);
}

bool HasFitExtension(const std::string &path)
{
    return path.size() >= 4
        && strcasecmp(path.c_str() + path.size() - 4, ".fit") == 0;
}

/** Read exactly 'size' bytes at 'offset', return false on a short read. */
bool ReadAt(int fd, unsigned char *data, size_t size, off_t offset)
{
    while (size > 0) {
        ssize_t n = ::pread(fd, data, size, offset);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            throw UnixException("pread", errno);
        }
        if (n == 0)
            return false;
        data += n;
        size -= n;
        offset += n;
    }
    return true;
}

/** Format a Garmin software version number (e.g. 950) as "9.50" */
std::string FormatSoftwareVersion(const std::string &v)
{
    char *end = nullptr;
    long n = strtol(v.c_str(), &end, 10);
    if (v.empty() || *end != '\0' || n < 0)
        return v;
    std::ostringstream o;
    o << n / 100 << '.' << (n % 100 < 10 ? "0" : "") << n % 100;
    return o.str();
}

};                                      // end anonymous namespace

namespace EdgeSync {

const char *GarminDirectory = "GARMIN";
const char *GarminDeviceXml = "GARMIN/GarminDevice.xml";


// ................................................. MassStorageVolume ....

MassStorageVolume::MassStorageVolume(const std::string &mount_point,
                                     std::ostream *log_stream)
    : m_MountPoint(mount_point),
      m_LogStream(log_stream ? log_stream : &std::cerr),
      m_OpenFd(-1)
{
    if (! IsDirectory(m_MountPoint))
        throw UnixException("MassStorageVolume: " + m_MountPoint, ENOENT);
}

MassStorageVolume::~MassStorageVolume()
{
    Close();
}

bool MassStorageVolume::IsGarminVolume() const
{
    return IsDirectory(JoinPath(m_MountPoint, GarminDirectory));
}

DeviceIdentity MassStorageVolume::ReadIdentity() const
{
    Buffer data;
    ReadData(JoinPath(m_MountPoint, GarminDeviceXml), data);
    std::string xml(data.begin(), data.end());

    DeviceIdentity id;
    // The <Id> element of the device is the first one in the document,
    // other Ids belong to data types and extensions.
    size_t model_begin = xml.find("<Model>");
    size_t model_end = xml.find("</Model>");
    if (model_begin != std::string::npos && model_end != std::string::npos) {
        id.Model = XmlElementText(xml, "Description", model_begin, model_end);
        id.Firmware = FormatSoftwareVersion(
            XmlElementText(xml, "SoftwareVersion", model_begin, model_end));
    }
    id.UnitId = XmlElementText(xml, "Id");
    return id;
}

std::vector<RawEntry> MassStorageVolume::List()
{
    std::vector<RawEntry> result;
    std::string root = JoinPath(m_MountPoint, GarminDirectory);
    std::vector<FileInfo> files = ListDirectoryTree(root);
    for (auto i = files.begin(); i != files.end(); ++i) {
        RawEntry e;
        e.Path = JoinPath(GarminDirectory, i->Path);
        e.Size = i->Size;
        e.Modified = i->Modified;
        ReadTrailerChecksum(JoinPath(root, i->Path), e);
        result.push_back(e);
    }
    return result;
}

void MassStorageVolume::ReadTrailerChecksum(const std::string &full_path, RawEntry &e) const
{
    if (e.Size < 14 || ! HasFitExtension(e.Path))
        return;

    int fd = ::open(full_path.c_str(), O_RDONLY);
    if (fd == -1) {
        UnixException ex("open", errno);
        LogLine(*m_LogStream) << "MassStorageVolume: no checksum for " << e.Path << ": "
                              << ex.what() << "\n";
        return;
    }

    try {
        unsigned char header[14];
        unsigned char trailer[2];
        FitHeader h;
        if (ReadAt(fd, header, sizeof(header), 0)
            && ReadFitHeader(header, sizeof(header), h)
            && h.FileSize() == e.Size
            && ReadAt(fd, trailer, sizeof(trailer), e.Size - 2))
        {
            e.HasChecksum = true;
            e.Checksum = GetU16(trailer);
        }
    }
    catch (const UnixException &ex) {
        LogLine(*m_LogStream) << "MassStorageVolume: no checksum for " << e.Path << ": "
                              << ex.what() << "\n";
    }
    ::close(fd);
}

std::string MassStorageVolume::ResolvePath(const std::string &path) const
{
    // Only files inside the volume can be read
    if (path.empty() || path[0] == '/')
        throw UnixException("MassStorageVolume: bad path " + path, EINVAL);
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos)
            end = path.size();
        if (path.compare(start, end - start, "..") == 0)
            throw UnixException("MassStorageVolume: bad path " + path, EINVAL);
        start = end + 1;
    }
    return JoinPath(m_MountPoint, path);
}

void MassStorageVolume::Read(const std::string &path, uint64_t offset,
                             unsigned length, Buffer &data)
{
    data.clear();
    if (m_OpenFd == -1 || path != m_OpenPath) {
        Close();
        std::string full_path = ResolvePath(path);
        m_OpenFd = ::open(full_path.c_str(), O_RDONLY);
        if (m_OpenFd == -1)
            throw UnixException("open " + full_path, errno);
        m_OpenPath = path;
    }

    data.resize(length);
    size_t got = 0;
    while (got < length) {
        ssize_t n = ::pread(m_OpenFd, &data[got], length - got, offset + got);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            int e = errno;
            data.clear();
            Close();
            throw UnixException("pread " + path, e);
        }
        if (n == 0)                     // end of file
            break;
        got += n;
    }
    data.resize(got);
}

void MassStorageVolume::Close()
{
    if (m_OpenFd != -1) {
        ::close(m_OpenFd);
        m_OpenFd = -1;
    }
    m_OpenPath.clear();
}


// ........................................................... helpers ....

std::string XmlElementText(const std::string &xml, const std::string &element,
                           size_t from, size_t to)
{
    std::string open_tag = "<" + element + ">";
    std::string close_tag = "</" + element + ">";
    size_t b = xml.find(open_tag, from);
    if (b == std::string::npos || (to != std::string::npos && b >= to))
        return std::string();
    b += open_tag.size();
    size_t e = xml.find(close_tag, b);
    if (e == std::string::npos || (to != std::string::npos && e > to))
        return std::string();
    std::string text = xml.substr(b, e - b);
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return std::string();
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string FindMountPointForSerial(const std::string &serial)
{
    if (serial.empty())
        return std::string();

    // Device nodes for the USB device: by-id links are named like
    // usb-Garmin_Edge_530_0000abcd1234-0:0-part1
    std::vector<std::string> nodes;
    DIR *d = opendir(g_ByIdDir);
    if (! d)
        return std::string();           // no udev, nothing to find
    while (struct dirent *e = readdir(d)) {
        std::string name = e->d_name;
        if (name.compare(0, 4, "usb-") == 0 && name.find(serial) != std::string::npos) {
            std::string node = RealPath(JoinPath(g_ByIdDir, name));
            if (! node.empty())
                nodes.push_back(node);
        }
    }
    closedir(d);
    if (nodes.empty())
        return std::string();

    FILE *mounts = setmntent(g_MountsFile, "r");
    if (! mounts)
        throw UnixException("setmntent", errno);
    std::string mount_point;
    struct mntent ent;
    char buf[4096];
    while (mount_point.empty() && getmntent_r(mounts, &ent, buf, sizeof(buf))) {
        std::string fsname = RealPath(ent.mnt_fsname);
        for (auto i = nodes.begin(); i != nodes.end(); ++i) {
            if (! fsname.empty() && fsname == *i) {
                mount_point = ent.mnt_dir;
                break;
            }
        }
    }
    endmntent(mounts);
    return mount_point;
}

std::vector<std::string> FindGarminVolumes()
{
    std::vector<std::string> result;
    FILE *mounts = setmntent(g_MountsFile, "r");
    if (! mounts)
        throw UnixException("setmntent", errno);
    struct mntent ent;
    char buf[4096];
    while (getmntent_r(mounts, &ent, buf, sizeof(buf))) {
        std::string dir = ent.mnt_dir;
        if (FileExists(JoinPath(dir, GarminDeviceXml)))
            result.push_back(dir);
    }
    endmntent(mounts);
    return result;
}

};                                      // end namespace EdgeSync
