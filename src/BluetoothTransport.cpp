#include "BluetoothTransport.h"
#include "FileTransferProtocol.h"
#include "Errors.h"

#include <systemd/sd-bus.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <thread>

#include <errno.h>
#include <string.h>

namespace {

using namespace EdgeSync;

const char *g_BluezService = "org.bluez";
const char *g_ObjectManager = "org.freedesktop.DBus.ObjectManager";
const char *g_Properties = "org.freedesktop.DBus.Properties";
const char *g_Adapter1 = "org.bluez.Adapter1";
const char *g_Device1 = "org.bluez.Device1";
const char *g_GattChar1 = "org.bluez.GattCharacteristic1";

// How long to wait for BlueZ to resolve the GATT services after connecting,
// when the caller did not set a deadline.
const unsigned g_ServicesTimeoutMs = 30000;
const unsigned g_PollIntervalMs = 200;

std::string ToLower(const std::string &s)
{
    std::string r(s);
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return r;
}

/** Throw the error matching a failed sd-bus call: a D-Bus timeout becomes
 * TimeoutError, anything else a TransportError. */
void ThrowBusError(const std::string &who, int r, const sd_bus_error *error)
{
    std::ostringstream msg;
    if (error && sd_bus_error_is_set(error))
        msg << error->name << ": " << (error->message ? error->message : "");
    else
        msg << strerror(-r);
    if (r == -ETIMEDOUT
        || (error && sd_bus_error_has_name(error, SD_BUS_ERROR_NO_REPLY)))
        throw TimeoutError(who, msg.str());
    throw TransportError(who, msg.str());
}

void CheckBus(int r, const std::string &who)
{
    if (r < 0)
        ThrowBusError(who, r, nullptr);
}

/** Owns a reference to a sd_bus_message. */
class BusMessage
{
public:
    BusMessage() : m_Message(nullptr) {}
    ~BusMessage() { sd_bus_message_unref(m_Message); }

    sd_bus_message* Get() const { return m_Message; }
    sd_bus_message** Out() { return &m_Message; }

private:
    BusMessage(const BusMessage&);
    BusMessage& operator=(const BusMessage&);

    sd_bus_message *m_Message;
};

/** Owns a sd_bus_error, freeing it at the end of the scope. */
class BusError
{
public:
    BusError() { m_Error = SD_BUS_ERROR_NULL; }
    ~BusError() { sd_bus_error_free(&m_Error); }

    sd_bus_error* Get() { return &m_Error; }

private:
    BusError(const BusError&);
    BusError& operator=(const BusError&);

    sd_bus_error m_Error;
};

sd_bus* OpenSystemBus()
{
    sd_bus *bus = nullptr;
    int r = sd_bus_open_system(&bus);
    if (r < 0)
        ThrowBusError("sd_bus_open_system", r, nullptr);
    return bus;
}

/** Owns a system bus connection for the duration of a scope. */
class ScopedBus
{
public:
    ScopedBus() : m_Bus(OpenSystemBus()) {}
    ~ScopedBus() { sd_bus_flush_close_unref(m_Bus); }
    sd_bus* Get() const { return m_Bus; }
private:
    ScopedBus(const ScopedBus&);
    ScopedBus& operator=(const ScopedBus&);
    sd_bus *m_Bus;
};

/** Convert a remaining time in milliseconds into a sd_bus_call() timeout,
 * where 0 selects the library default. */
uint64_t BusTimeout(const IoContext &ctx)
{
    return ctx.HasDeadline() ? static_cast<uint64_t>(ctx.RemainingMs()) * 1000 : 0;
}

/** Send method call 'm' and wait for the reply, bounded by the deadline of
 * 'ctx'. */
void Call(sd_bus *bus, sd_bus_message *m, const IoContext &ctx,
          const std::string &who, BusMessage &reply)
{
    ctx.Check(who);
    BusError error;
    int r = sd_bus_call(bus, m, BusTimeout(ctx), error.Get(), reply.Out());
    if (r < 0)
        ThrowBusError(who, r, error.Get());
}

void NewMethodCall(sd_bus *bus, const std::string &path, const char *iface,
                   const char *member, BusMessage &m)
{
    int r = sd_bus_message_new_method_call(
        bus, m.Out(), g_BluezService, path.c_str(), iface, member);
    CheckBus(r, std::string("new method call ") + member);
}

/** Call a method which takes and returns no arguments. */
void CallVoid(sd_bus *bus, const std::string &path, const char *iface,
              const char *member, const IoContext &ctx)
{
    BusMessage m, reply;
    NewMethodCall(bus, path, iface, member, m);
    Call(bus, m.Get(), ctx, std::string(iface) + "." + member, reply);
}

bool GetBoolProperty(sd_bus *bus, const std::string &path, const char *iface,
                     const char *name, const IoContext &ctx)
{
    BusMessage m, reply;
    NewMethodCall(bus, path, g_Properties, "Get", m);
    CheckBus(sd_bus_message_append(m.Get(), "ss", iface, name), "append Get");
    Call(bus, m.Get(), ctx, std::string("Get ") + name, reply);
    int value = 0;
    CheckBus(sd_bus_message_enter_container(reply.Get(), 'v', "b"), "enter v(b)");
    CheckBus(sd_bus_message_read_basic(reply.Get(), 'b', &value), "read bool");
    CheckBus(sd_bus_message_exit_container(reply.Get()), "exit v(b)");
    return value != 0;
}

/** The interesting parts of one interface of one BlueZ object. */
struct BusObject
{
    std::string Path;
    std::string Interface;
    std::string Name;
    std::string Address;
    std::string Uuid;                   // lower case
};

/** Read the string properties we care about from an a{sv} dictionary and
 * skip the rest. */
void ReadObjectProperties(sd_bus_message *reply, BusObject &obj)
{
    int r;
    CheckBus(sd_bus_message_enter_container(reply, 'a', "{sv}"), "enter a{sv}");
    while ((r = sd_bus_message_enter_container(reply, 'e', "sv")) > 0) {
        const char *prop = nullptr;
        CheckBus(sd_bus_message_read_basic(reply, 's', &prop), "read property name");

        char type;
        const char *contents = nullptr;
        CheckBus(sd_bus_message_peek_type(reply, &type, &contents), "peek variant");
        if (contents && strcmp(contents, "s") == 0) {
            const char *value = nullptr;
            CheckBus(sd_bus_message_enter_container(reply, 'v', "s"), "enter v(s)");
            CheckBus(sd_bus_message_read_basic(reply, 's', &value), "read v(s)");
            CheckBus(sd_bus_message_exit_container(reply), "exit v(s)");
            std::string v = value ? value : "";
            if (strcmp(prop, "Name") == 0)
                obj.Name = v;
            else if (strcmp(prop, "Address") == 0)
                obj.Address = v;
            else if (strcmp(prop, "UUID") == 0)
                obj.Uuid = ToLower(v);
        }
        else {
            CheckBus(sd_bus_message_skip(reply, "v"), "skip variant");
        }
        CheckBus(sd_bus_message_exit_container(reply), "exit {sv}");
    }
    CheckBus(r, "iterate properties");
    CheckBus(sd_bus_message_exit_container(reply), "exit a{sv}");
}

/** Return one BusObject for each interface of each object BlueZ manages. */
std::vector<BusObject> GetManagedObjects(sd_bus *bus, const IoContext &ctx)
{
    BusMessage m, reply;
    int r = sd_bus_message_new_method_call(
        bus, m.Out(), g_BluezService, "/", g_ObjectManager, "GetManagedObjects");
    CheckBus(r, "new method call GetManagedObjects");
    Call(bus, m.Get(), ctx, "GetManagedObjects", reply);

    std::vector<BusObject> result;
    sd_bus_message *msg = reply.Get();
    CheckBus(sd_bus_message_enter_container(msg, 'a', "{oa{sa{sv}}}"), "enter objects");
    while ((r = sd_bus_message_enter_container(msg, 'e', "oa{sa{sv}}")) > 0) {
        const char *path = nullptr;
        CheckBus(sd_bus_message_read_basic(msg, 'o', &path), "read object path");
        CheckBus(sd_bus_message_enter_container(msg, 'a', "{sa{sv}}"), "enter interfaces");
        while ((r = sd_bus_message_enter_container(msg, 'e', "sa{sv}")) > 0) {
            const char *iface = nullptr;
            CheckBus(sd_bus_message_read_basic(msg, 's', &iface), "read interface name");
            BusObject obj;
            obj.Path = path ? path : "";
            obj.Interface = iface ? iface : "";
            ReadObjectProperties(msg, obj);
            result.push_back(obj);
            CheckBus(sd_bus_message_exit_container(msg), "exit {sa{sv}}");
        }
        CheckBus(r, "iterate interfaces");
        CheckBus(sd_bus_message_exit_container(msg), "exit interfaces");
        CheckBus(sd_bus_message_exit_container(msg), "exit {oa{sa{sv}}}");
    }
    CheckBus(r, "iterate objects");
    CheckBus(sd_bus_message_exit_container(msg), "exit objects");
    return result;
}

bool IsGarminName(const std::string &name)
{
    std::string n = ToLower(name);
    return n.find("garmin") != std::string::npos || n.find("edge") != std::string::npos;
}

Buffer ReadValue(sd_bus *bus, const std::string &char_path, const IoContext &ctx)
{
    BusMessage m, reply;
    NewMethodCall(bus, char_path, g_GattChar1, "ReadValue", m);
    CheckBus(sd_bus_message_append(m.Get(), "a{sv}", 0), "append ReadValue options");
    Call(bus, m.Get(), ctx, "ReadValue " + char_path, reply);
    const void *data = nullptr;
    size_t size = 0;
    CheckBus(sd_bus_message_read_array(reply.Get(), 'y', &data, &size), "read ay");
    const unsigned char *p = static_cast<const unsigned char*>(data);
    return size > 0 ? Buffer(p, p + size) : Buffer();
}

void WriteValue(sd_bus *bus, const std::string &char_path, const Buffer &value,
                const IoContext &ctx)
{
    BusMessage m, reply;
    NewMethodCall(bus, char_path, g_GattChar1, "WriteValue", m);
    CheckBus(sd_bus_message_append_array(m.Get(), 'y', value.data(), value.size()),
             "append WriteValue value");
    CheckBus(sd_bus_message_append(m.Get(), "a{sv}", 0), "append WriteValue options");
    Call(bus, m.Get(), ctx, "WriteValue " + char_path, reply);
}

std::string ValueToString(const Buffer &b)
{
    std::string s(b.begin(), b.end());
    // GATT strings are sometimes NUL terminated
    size_t p = s.find('\0');
    if (p != std::string::npos)
        s.erase(p);
    return s;
}

/** Return the BlueZ object path of 'device': its location if it has one,
 * otherwise the Device1 object with the device's address. */
std::string FindDevicePath(sd_bus *bus, const Device &device, const IoContext &ctx)
{
    if (! device.Location.empty())
        return device.Location;
    std::vector<BusObject> objects = GetManagedObjects(bus, ctx);
    for (auto i = objects.begin(); i != objects.end(); ++i) {
        if (i->Interface == g_Device1 && ToLower(i->Address) == ToLower(device.Id))
            return i->Path;
    }
    throw TransportError("BluetoothTransport::Connect",
                         "BlueZ does not know about " + device.Id);
}

/** Pair with the device at 'path', unless BlueZ has it paired already.
 * Return true if a pairing was done. */
bool PairIfNeeded(sd_bus *bus, const std::string &path, const IoContext &ctx,
                  std::ostream &log)
{
    if (GetBoolProperty(bus, path, g_Device1, "Paired", ctx))
        return false;
    LogLine(log) << "Pairing with " << path << "\n";
    CallVoid(bus, path, g_Device1, "Pair", ctx);
    return true;
}

};                                      // end anonymous namespace

namespace EdgeSync {

const char *FileServiceUuid = "e7a10001-5a3f-4c8e-9d2b-6f1e0a4c7b21";
const char *FileRequestCharUuid = "e7a10002-5a3f-4c8e-9d2b-6f1e0a4c7b21";
const char *FileResponseCharUuid = "e7a10003-5a3f-4c8e-9d2b-6f1e0a4c7b21";
const char *ModelNumberCharUuid = "00002a24-0000-1000-8000-00805f9b34fb";
const char *FirmwareRevisionCharUuid = "00002a26-0000-1000-8000-00805f9b34fb";

std::vector<Device> DiscoverBluetoothDevices(unsigned seconds, std::ostream *log_stream)
{
    std::ostream &log = log_stream ? *log_stream : std::cerr;
    CancelToken never;
    ScopedBus bus;

    std::string adapter;
    {
        IoContext ctx(10000, never);
        std::vector<BusObject> objects = GetManagedObjects(bus.Get(), ctx);
        for (auto i = objects.begin(); i != objects.end(); ++i) {
            if (i->Interface == g_Adapter1) {
                adapter = i->Path;
                break;
            }
        }
    }
    if (adapter.empty())
        throw TransportError("DiscoverBluetoothDevices", "no Bluetooth adapter");

    if (seconds > 0) {
        LogLine(log) << "Scanning on " << adapter << " for " << seconds << " seconds\n";
        IoContext ctx(10000, never);
        CallVoid(bus.Get(), adapter, g_Adapter1, "StartDiscovery", ctx);
        std::this_thread::sleep_for(std::chrono::seconds(seconds));
        try {
            IoContext stop_ctx(10000, never);
            CallVoid(bus.Get(), adapter, g_Adapter1, "StopDiscovery", stop_ctx);
        }
        catch (const EdgeSyncError &e) {
            // Discovery stops anyway when our bus connection is closed
            LogLine(log) << e.what() << "\n";
        }
    }

    std::vector<Device> result;
    IoContext ctx(10000, never);
    std::vector<BusObject> objects = GetManagedObjects(bus.Get(), ctx);
    for (auto i = objects.begin(); i != objects.end(); ++i) {
        if (i->Interface == g_Device1 && IsGarminName(i->Name)) {
            Device d(TRANSPORT_BLUETOOTH, i->Address, i->Name, i->Path);
            LogLine(log) << "Found " << d << "\n";
            result.push_back(d);
        }
    }
    return result;
}


bool PairBluetoothDevice(const Device &device, unsigned timeout_ms, std::ostream *log_stream)
{
    std::ostream &log = log_stream ? *log_stream : std::cerr;
    ScopedBus bus;
    IoContext ctx(timeout_ms, CancelToken());
    std::string path = FindDevicePath(bus.Get(), device, ctx);
    return PairIfNeeded(bus.Get(), path, ctx, log);
}


// ................................................. BluetoothTransport ....

BluetoothTransport::BluetoothTransport(const Device &device, std::ostream *log_stream)
    : m_Device(device),
      m_LogStream(log_stream ? log_stream : &std::cerr),
      m_Bus(nullptr)
{
}

BluetoothTransport::~BluetoothTransport()
{
    Disconnect();
}

void BluetoothTransport::Connect(const IoContext &ctx)
{
    Disconnect();
    m_Bus = OpenSystemBus();

    m_DevicePath = FindDevicePath(m_Bus, m_Device, ctx);
    PairIfNeeded(m_Bus, m_DevicePath, ctx, *m_LogStream);

    LogLine(*m_LogStream) << "Connecting to " << m_DevicePath << "\n";
    if (! GetBoolProperty(m_Bus, m_DevicePath, g_Device1, "Connected", ctx))
        CallVoid(m_Bus, m_DevicePath, g_Device1, "Connect", ctx);
    WaitForServices(ctx);
    FindCharacteristics();
}

void BluetoothTransport::WaitForServices(const IoContext &ctx)
{
    const char *who = "BluetoothTransport::WaitForServices";
    unsigned waited = 0;
    while (! GetBoolProperty(m_Bus, m_DevicePath, g_Device1, "ServicesResolved", ctx)) {
        if (! ctx.HasDeadline() && waited >= g_ServicesTimeoutMs)
            throw TimeoutError(who, "GATT services not resolved");
        ctx.Sleep(g_PollIntervalMs, who);
        ctx.Check(who);
        waited += g_PollIntervalMs;
    }
}

void BluetoothTransport::FindCharacteristics()
{
    CancelToken never;
    IoContext ctx(10000, never);
    std::vector<BusObject> objects = GetManagedObjects(m_Bus, ctx);
    std::string prefix = m_DevicePath + "/";
    for (auto i = objects.begin(); i != objects.end(); ++i) {
        if (i->Interface != g_GattChar1 || i->Path.compare(0, prefix.size(), prefix) != 0)
            continue;
        if (i->Uuid == ModelNumberCharUuid)
            m_ModelChar = i->Path;
        else if (i->Uuid == FirmwareRevisionCharUuid)
            m_FirmwareChar = i->Path;
        else if (i->Uuid == FileRequestCharUuid)
            m_RequestChar = i->Path;
        else if (i->Uuid == FileResponseCharUuid)
            m_ResponseChar = i->Path;
    }
}

DeviceIdentity BluetoothTransport::Identify(const IoContext &ctx)
{
    const char *who = "BluetoothTransport::Identify";
    if (! m_Bus)
        throw TransportError(who, "not connected");
    if (m_ModelChar.empty())
        throw UnsupportedDeviceError(who, "no model number characteristic");
    if (m_RequestChar.empty() || m_ResponseChar.empty())
        throw UnsupportedDeviceError(who, "device has no file service");

    DeviceIdentity id;
    id.Model = ValueToString(ReadValue(m_Bus, m_ModelChar, ctx));
    if (! m_FirmwareChar.empty())
        id.Firmware = ValueToString(ReadValue(m_Bus, m_FirmwareChar, ctx));
    id.UnitId = m_Device.Id;
    return id;
}

Buffer BluetoothTransport::Transact(const Buffer &request, const IoContext &ctx)
{
    if (! m_Bus)
        throw TransportError("BluetoothTransport::Transact", "not connected");
    WriteValue(m_Bus, m_RequestChar, request, ctx);
    return ReadValue(m_Bus, m_ResponseChar, ctx);
}

std::vector<RawEntry> BluetoothTransport::List(const IoContext &ctx)
{
    std::vector<RawEntry> result;
    unsigned page = 0;
    for (;;) {
        Buffer frame = Transact(MakeListRequest(page), ctx);
        ListPage p;
        try {
            p = ParseListResponse(frame);
        }
        catch (const TransportError &) {
            LogLine line(*m_LogStream);
            line << "Bad list response:\n";
            DumpData(frame, line.Stream());
            throw;
        }
        if (p.Status != FSS_OK)
            throw TransportError("BluetoothTransport::List", ToString(p.Status));
        if (p.Page != page) {
            std::ostringstream msg;
            msg << "asked for page " << page << ", got " << p.Page;
            throw TransportError("BluetoothTransport::List", msg.str());
        }
        result.insert(result.end(), p.Entries.begin(), p.Entries.end());
        page++;
        if (page >= p.PageCount)
            break;
    }
    return result;
}

void BluetoothTransport::ReadChunk(const std::string &path, uint64_t offset,
                                   unsigned length, Buffer &data,
                                   const IoContext &ctx)
{
    if (offset > 0xFFFFFFFFu)
        throw TransportError("BluetoothTransport::ReadChunk", "offset out of range");
    length = std::min(length, FileServiceMaxRead);
    uint32_t off = static_cast<uint32_t>(offset);
    Buffer frame = Transact(MakeReadRequest(path, off, length), ctx);
    try {
        ParseReadResponse(frame, off, data);
    }
    catch (const TransportError &) {
        LogLine line(*m_LogStream);
        line << "Bad read response:\n";
        DumpData(frame, line.Stream(), 64);
        throw;
    }
    if (data.size() > length)
        throw TransportError("BluetoothTransport::ReadChunk", "device sent more data than requested");
}

void BluetoothTransport::Disconnect()
{
    if (! m_Bus)
        return;
    if (! m_DevicePath.empty()) {
        try {
            CancelToken never;
            IoContext ctx(5000, never);
            CallVoid(m_Bus, m_DevicePath, g_Device1, "Disconnect", ctx);
        }
        catch (const EdgeSyncError &e) {
            // The link is going away regardless, note it and carry on
            LogLine(*m_LogStream) << e.what() << "\n";
        }
    }
    sd_bus_flush_close_unref(m_Bus);
    m_Bus = nullptr;
    m_DevicePath.clear();
    m_ModelChar.clear();
    m_FirmwareChar.clear();
    m_RequestChar.clear();
    m_ResponseChar.clear();
}

unsigned BluetoothTransport::MaxChunkSize() const
{
    return FileServiceMaxRead;
}

};                                      // end namespace EdgeSync
