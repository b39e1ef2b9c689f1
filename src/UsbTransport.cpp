#include "UsbTransport.h"
#include "LinuxUtil.h"
#include "Errors.h"

#include <iostream>
#include <sstream>

#include <errno.h>

namespace {

using namespace EdgeSync;

const unsigned g_MaxChunkSize = 64 * 1024;

/** Owns a libusb context for the duration of a scope. */
class LibusbContext
{
public:
    LibusbContext() : m_Context(nullptr)
    {
        int r = libusb_init(&m_Context);
        if (r < 0)
            throw LibusbException("libusb_init", r);
    }
    ~LibusbContext() { libusb_exit(m_Context); }

    libusb_context* Get() { return m_Context; }

private:
    LibusbContext(const LibusbContext&);
    LibusbContext& operator=(const LibusbContext&);

    libusb_context *m_Context;
};

/** Owns a device list obtained from libusb_get_device_list. */
class DeviceList
{
public:
    explicit DeviceList(libusb_context *ctx) : m_Devices(nullptr), m_Count(0)
    {
        ssize_t r = libusb_get_device_list(ctx, &m_Devices);
        if (r < 0)
            throw LibusbException("libusb_get_device_list", r);
        m_Count = r;
    }
    ~DeviceList() { libusb_free_device_list(m_Devices, 1); }

    ssize_t Count() const { return m_Count; }
    libusb_device* operator[](ssize_t i) const { return m_Devices[i]; }

private:
    DeviceList(const DeviceList&);
    DeviceList& operator=(const DeviceList&);

    libusb_device **m_Devices;
    ssize_t m_Count;
};

std::string GetStringDescriptor(libusb_device_handle *h, uint8_t index)
{
    if (index == 0)
        return std::string();
    unsigned char buf[256];
    int r = libusb_get_string_descriptor_ascii(h, index, buf, sizeof(buf));
    if (r < 0)
        throw LibusbException("libusb_get_string_descriptor_ascii", r);
    return std::string(reinterpret_cast<char*>(buf), r);
}

std::string BusLocation(libusb_device *dev)
{
    std::ostringstream o;
    o << "usb-" << static_cast<int>(libusb_get_bus_number(dev))
      << "-" << static_cast<int>(libusb_get_port_number(dev));
    return o.str();
}

Device DescribeUsbDevice(libusb_device *dev, const libusb_device_descriptor &desc)
{
    Device d(TRANSPORT_USB, BusLocation(dev), "Garmin USB device");
    libusb_device_handle *h = nullptr;
    int r = libusb_open(dev, &h);
    if (r < 0)
        return d;                       // no access, keep the bus location
    try {
        std::string product = GetStringDescriptor(h, desc.iProduct);
        std::string serial = GetStringDescriptor(h, desc.iSerialNumber);
        if (! product.empty())
            d.Name = product;
        if (! serial.empty())
            d.Id = serial;
    }
    catch (...) {
        libusb_close(h);
        throw;
    }
    libusb_close(h);
    return d;
}

};                                      // end anonymous namespace

namespace EdgeSync {

std::vector<Device> FindGarminUsbDevices()
{
    LibusbContext ctx;
    DeviceList devs(ctx.Get());
    std::vector<Device> result;
    for (ssize_t i = 0; i < devs.Count(); i++) {
        struct libusb_device_descriptor desc;
        int r = libusb_get_device_descriptor(devs[i], &desc);
        if (r < 0)
            throw LibusbException("libusb_get_device_descriptor", r);
        if (desc.idVendor != GarminUsbVendorId)
            continue;
        result.push_back(DescribeUsbDevice(devs[i], desc));
    }
    return result;
}


// .................................................... LibusbException ....

LibusbException::LibusbException(const std::string &who, int error_code)
    : m_Who(who),
      m_ErrorCode(error_code),
      m_MessageDone(false)
{
}

const char* LibusbException::what() const noexcept(true)
{
    if (! m_MessageDone) {
        std::ostringstream msg;
        msg << m_Who << ": " << libusb_error_name(m_ErrorCode)
            << " (" << m_ErrorCode << ")";
        m_Message = msg.str();
        m_MessageDone = true;
    }
    return m_Message.c_str();
}


// ....................................................... UsbTransport ....

UsbTransport::UsbTransport(const Device &device, std::ostream *log_stream)
    : m_Device(device),
      m_LogStream(log_stream ? log_stream : &std::cerr)
{
}

UsbTransport::~UsbTransport()
{
    Disconnect();
}

bool UsbTransport::IsAttached() const
{
    std::vector<Device> devices = FindGarminUsbDevices();
    for (auto i = devices.begin(); i != devices.end(); ++i) {
        if (i->Id == m_Device.Id)
            return true;
    }
    return false;
}

std::string UsbTransport::LocateVolume() const
{
    if (! m_Device.Location.empty())
        return m_Device.Location;

    std::string mp = FindMountPointForSerial(m_Device.Id);
    if (! mp.empty())
        return mp;

    // Without udev links, fall back to the only mounted Garmin volume
    std::vector<std::string> volumes = FindGarminVolumes();
    if (volumes.size() == 1)
        return volumes.front();
    if (volumes.size() > 1)
        throw TransportError("UsbTransport::Connect",
                             "several Garmin volumes mounted, specify the mount point");
    throw TransportError("UsbTransport::Connect",
                         "volume for " + m_Device.Id + " is not mounted");
}

void UsbTransport::Connect(const IoContext &ctx)
{
    ctx.Check("UsbTransport::Connect");
    Disconnect();
    try {
        // A device given only by its mount point does not need to be on
        // the bus (e.g. a card reader or a test volume).
        if (m_Device.Location.empty() && ! IsAttached())
            throw TransportError("UsbTransport::Connect",
                                 "device " + m_Device.Id + " not found on the USB bus");
        ctx.Check("UsbTransport::Connect");
        std::string mp = LocateVolume();
        std::unique_ptr<MassStorageVolume> v(new MassStorageVolume(mp, m_LogStream));
        if (! v->IsGarminVolume())
            throw TransportError("UsbTransport::Connect", mp + " has no GARMIN directory");
        m_Volume = std::move(v);
        LogLine(*m_LogStream) << "UsbTransport: using volume " << mp << "\n";
    }
    catch (const UnixException &e) {
        throw TransportError("UsbTransport::Connect", e.what());
    }
    catch (const LibusbException &e) {
        throw TransportError("UsbTransport::Connect", e.what());
    }
}

MassStorageVolume& UsbTransport::Volume(const char *who)
{
    if (! m_Volume)
        throw TransportError(who, "not connected");
    return *m_Volume;
}

DeviceIdentity UsbTransport::Identify(const IoContext &ctx)
{
    ctx.Check("UsbTransport::Identify");
    DeviceIdentity id;
    try {
        id = Volume("UsbTransport::Identify").ReadIdentity();
    }
    catch (const UnixException &e) {
        if (e.error_code() == ENOENT)
            throw UnsupportedDeviceError("UsbTransport::Identify", "no GarminDevice.xml on volume");
        throw TransportError("UsbTransport::Identify", e.what());
    }
    if (id.UnitId.empty())
        id.UnitId = m_Device.Id;
    return id;
}

std::vector<RawEntry> UsbTransport::List(const IoContext &ctx)
{
    ctx.Check("UsbTransport::List");
    try {
        return Volume("UsbTransport::List").List();
    }
    catch (const UnixException &e) {
        throw TransportError("UsbTransport::List", e.what());
    }
}

void UsbTransport::ReadChunk(const std::string &path, uint64_t offset,
                             unsigned length, Buffer &data,
                             const IoContext &ctx)
{
    ctx.Check("UsbTransport::ReadChunk");
    try {
        Volume("UsbTransport::ReadChunk").Read(path, offset, length, data);
    }
    catch (const UnixException &e) {
        throw TransportError("UsbTransport::ReadChunk", e.what());
    }
}

void UsbTransport::Disconnect()
{
    m_Volume.reset();
}

unsigned UsbTransport::MaxChunkSize() const
{
    return g_MaxChunkSize;
}

};                                      // end namespace EdgeSync
