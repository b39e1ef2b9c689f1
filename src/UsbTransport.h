#pragma once

#include "Transport.h"
#include "MassStorage.h"

#include <libusb.h>

#include <exception>
#include <memory>
#include <iosfwd>
#include <string>

namespace EdgeSync {

/** A failed libusb call, the message has the libusb name of the error
 * code. */
class LibusbException : public std::exception
{
public:
    LibusbException(const std::string &who, int error_code);
    const char* what() const noexcept(true) override;
    int error_code() const { return m_ErrorCode; }

private:
    std::string m_Who;
    int m_ErrorCode;
    mutable std::string m_Message;
    mutable bool m_MessageDone;
};

/** Find all Garmin devices attached to the USB bus.  The device id is the
 * USB serial number, the name is the product string.  Devices which cannot
 * be opened (e.g. because of permissions) are still returned, using the
 * bus and port numbers as their id.  Throws LibusbException if the bus
 * cannot be enumerated. */
std::vector<Device> FindGarminUsbDevices();

/** Talk to a Garmin device in USB mass storage mode.  libusb is used to
 * find the device, the files are read from the volume the OS mounted for
 * it.  The Location of the device, if set, is used as the mount point.
 */
class UsbTransport : public Transport
{
public:
    UsbTransport(const Device &device, std::ostream *log_stream);
    ~UsbTransport();

    void Connect(const IoContext &ctx) override;
    DeviceIdentity Identify(const IoContext &ctx) override;
    std::vector<RawEntry> List(const IoContext &ctx) override;
    void ReadChunk(const std::string &path, uint64_t offset,
                   unsigned length, Buffer &data,
                   const IoContext &ctx) override;
    void Disconnect() override;
    unsigned MaxChunkSize() const override;

private:
    bool IsAttached() const;
    std::string LocateVolume() const;
    MassStorageVolume& Volume(const char *who);

    Device m_Device;
    std::ostream *m_LogStream;
    std::unique_ptr<MassStorageVolume> m_Volume;
};

};                                      // end namespace EdgeSync

/*
    Local Variables:
    mode: c++
    End:
*/
