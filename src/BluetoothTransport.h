#pragma once

#include "Transport.h"

#include <iosfwd>
#include <string>
#include <vector>

struct sd_bus;

namespace EdgeSync {

/** UUIDs of the GATT file service and its two characteristics. */
extern const char *FileServiceUuid;
extern const char *FileRequestCharUuid;
extern const char *FileResponseCharUuid;

/** Device Information Service characteristics read by Identify() */
extern const char *ModelNumberCharUuid;
extern const char *FirmwareRevisionCharUuid;

/** Run a BlueZ discovery for 'seconds' and return the devices whose name
 * mentions Garmin or Edge.  Devices BlueZ already knows about (e.g. paired
 * ones) are returned too.  The device id is the Bluetooth address, the
 * location the BlueZ object path.  Throws TransportError if BlueZ cannot be
 * reached. */
std::vector<Device> DiscoverBluetoothDevices(unsigned seconds, std::ostream *log_stream);

/** Pair with 'device' through BlueZ, unless it is paired already.  The
 * device is found by its location (BlueZ object path) or its address.
 * Return true if a pairing was done.  Throws TransportError if the device
 * is unknown or pairing failed, TimeoutError if it took longer than
 * 'timeout_ms'. */
bool PairBluetoothDevice(const Device &device, unsigned timeout_ms, std::ostream *log_stream);

/** Talk to an Edge device over Bluetooth LE, using BlueZ on the system
 * D-Bus.  Connect() pairs with the device first if BlueZ has not paired
 * it yet.
 */
class BluetoothTransport : public Transport
{
public:
    BluetoothTransport(const Device &device, std::ostream *log_stream);
    ~BluetoothTransport();

    void Connect(const IoContext &ctx) override;
    DeviceIdentity Identify(const IoContext &ctx) override;
    std::vector<RawEntry> List(const IoContext &ctx) override;
    void ReadChunk(const std::string &path, uint64_t offset,
                   unsigned length, Buffer &data,
                   const IoContext &ctx) override;
    void Disconnect() override;
    unsigned MaxChunkSize() const override;

private:
    BluetoothTransport(const BluetoothTransport&);
    BluetoothTransport& operator=(const BluetoothTransport&);

    void FindCharacteristics();
    void WaitForServices(const IoContext &ctx);

    /** Send 'request' to the file service and return the device's
     * reply. */
    Buffer Transact(const Buffer &request, const IoContext &ctx);

    Device m_Device;
    std::ostream *m_LogStream;
    sd_bus *m_Bus;
    std::string m_DevicePath;
    std::string m_ModelChar;
    std::string m_FirmwareChar;
    std::string m_RequestChar;
    std::string m_ResponseChar;
};

};                                      // end namespace EdgeSync

/*
    Local Variables:
    mode: c++
    End:
*/
