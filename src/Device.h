#pragma once

#include <string>
#include <iosfwd>
#include <ctime>
#include <stdint.h>

namespace EdgeSync {

enum TransportKind {
    TRANSPORT_BLUETOOTH,
    TRANSPORT_USB
};

enum SessionState {
    SS_DISCONNECTED,
    SS_CONNECTING,
    SS_CONNECTED,
    SS_AUTHENTICATING,
    SS_READY,
    SS_ERROR,
    SS_CLOSING
};

const char* ToString(TransportKind k);
const char* ToString(SessionState s);

/** Garmin's USB vendor id. */
const int GarminUsbVendorId = 0x091E;

/** What the device reports about itself during the handshake. */
struct DeviceIdentity
{
    std::string Model;                  // e.g. "Edge 530"
    std::string Firmware;
    std::string UnitId;
};

/** A device we know about, either from discovery or supplied by the user.
 * The transport kind decides which Transport implementation is used to
 * talk to it.
 */
struct Device
{
    Device();
    Device(TransportKind kind, const std::string &id, const std::string &name,
           const std::string &location = std::string());

    TransportKind Kind;
    std::string Id;                     // MAC address or USB serial number
    std::string Name;
    std::string Model;                  // filled in by the handshake
    std::string Firmware;               // filled in by the handshake

    /** Where to find the device: the BlueZ object path for Bluetooth, the
     * mount point of the device's volume for USB.  Can be empty, in which
     * case the transport will look it up when connecting. */
    std::string Location;

    SessionState State;
};

std::ostream& operator<<(std::ostream &o, const Device &d);

/** A file in the device catalog.  Entries are not modified once listed, a
 * new listing produces new entries. */
struct FileEntry
{
    FileEntry() : Size(0), Modified(0), HasChecksum(false), Checksum(0) {}

    std::string Path;                   // on the device, '/' separated
    uint64_t Size;
    std::time_t Modified;
    bool HasChecksum;
    uint16_t Checksum;                  // FIT CRC-16 of the file, if known
};

std::ostream& operator<<(std::ostream &o, const FileEntry &e);

/** Return true if 'model' names a Garmin Edge cycling computer. */
bool IsSupportedModel(const std::string &model);

/** Return a version of the device id which can be used as a directory
 * name. */
std::string DeviceStorageName(const Device &d);

};                                      // end namespace EdgeSync

/*
    Local Variables:
    mode: c++
    End:
*/
