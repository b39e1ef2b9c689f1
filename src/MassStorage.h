#pragma once

#include "Transport.h"

#include <iosfwd>
#include <string>
#include <vector>

namespace EdgeSync {

/** Directory, relative to the volume root, holding the device files. */
extern const char *GarminDirectory;

/** Device description file, relative to the volume root. */
extern const char *GarminDeviceXml;


// ................................................. MassStorageVolume ....

/** The file system a Garmin device exposes when connected in USB mass
 * storage mode.  The volume must already be mounted.  Errors are reported
 * as UnixException, the USB transport translates them.
 */
class MassStorageVolume
{
public:
    explicit MassStorageVolume(const std::string &mount_point,
                               std::ostream *log_stream = nullptr);
    ~MassStorageVolume();

    const std::string& MountPoint() const { return m_MountPoint; }

    /** Return true if the volume has the GARMIN directory. */
    bool IsGarminVolume() const;

    /** Read model, firmware and unit id from GarminDevice.xml */
    DeviceIdentity ReadIdentity() const;

    /** Return all files under the GARMIN directory.  Paths are relative to
     * the mount point.  FIT files which look complete advertise their
     * stored CRC as the checksum.  A FIT file which cannot be opened is
     * still listed, without a checksum. */
    std::vector<RawEntry> List();

    /** Read up to 'length' bytes from 'path' at 'offset'.  The file is kept
     * open between calls, as the engine reads one file sequentially. */
    void Read(const std::string &path, uint64_t offset, unsigned length, Buffer &data);

    /** Close any file kept open by Read() */
    void Close();

private:
    MassStorageVolume(const MassStorageVolume&);
    MassStorageVolume& operator=(const MassStorageVolume&);

    std::string ResolvePath(const std::string &path) const;
    void ReadTrailerChecksum(const std::string &full_path, RawEntry &e) const;

    std::string m_MountPoint;
    std::ostream *m_LogStream;
    std::string m_OpenPath;
    int m_OpenFd;
};

/** Return the text of the first <element> found in 'xml' between 'from' and
 * 'to' (exclusive), or an empty string.  Only handles the simple documents
 * Garmin devices write: no attributes on the searched element, no CDATA. */
std::string XmlElementText(const std::string &xml, const std::string &element,
                           size_t from = 0, size_t to = std::string::npos);

/** Find where the volume of the USB device with serial number 'serial' is
 * mounted, using /dev/disk/by-id and /proc/mounts.  Returns an empty string
 * if it is not mounted. */
std::string FindMountPointForSerial(const std::string &serial);

/** Return the mount points of all mounted volumes which have a
 * GARMIN/GarminDevice.xml file. */
std::vector<std::string> FindGarminVolumes();

};                                      // end namespace EdgeSync

/*
    Local Variables:
    mode: c++
    End:
*/
