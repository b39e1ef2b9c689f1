#include "Device.h"

#include <iostream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace {

    // Model descriptions are matched against these prefixes, after an
    // optional "Garmin " prefix is removed.
    const char *g_SupportedModels[] = {
        "edge"
    };

    const int g_NumSupportedModels =
        sizeof(g_SupportedModels) / sizeof(g_SupportedModels[0]);

    std::string ToLower(const std::string &s)
    {
        std::string r(s);
        std::transform(r.begin(), r.end(), r.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return r;
    }

    bool StartsWith(const std::string &s, const std::string &prefix)
    {
        return s.compare(0, prefix.size(), prefix) == 0;
    }

};                                      // end anonymous namespace

namespace EdgeSync {

const char* ToString(TransportKind k)
{
    switch (k) {
    case TRANSPORT_BLUETOOTH: return "Bluetooth";
    case TRANSPORT_USB: return "USB";
    default: return "unknown";
    }
}

const char* ToString(SessionState s)
{
    switch (s) {
    case SS_DISCONNECTED: return "Disconnected";
    case SS_CONNECTING: return "Connecting";
    case SS_CONNECTED: return "Connected";
    case SS_AUTHENTICATING: return "Authenticating";
    case SS_READY: return "Ready";
    case SS_ERROR: return "Error";
    case SS_CLOSING: return "Closing";
    default: return "unknown";
    }
}

Device::Device()
    : Kind(TRANSPORT_USB),
      State(SS_DISCONNECTED)
{
}

Device::Device(TransportKind kind, const std::string &id, const std::string &name,
               const std::string &location)
    : Kind(kind),
      Id(id),
      Name(name),
      Location(location),
      State(SS_DISCONNECTED)
{
}

std::ostream& operator<<(std::ostream &o, const Device &d)
{
    o << d.Name << " (" << ToString(d.Kind) << " " << d.Id << ")";
    if (! d.Model.empty())
        o << ", " << d.Model;
    if (! d.Firmware.empty())
        o << " firmware " << d.Firmware;
    return o;
}

std::ostream& operator<<(std::ostream &o, const FileEntry &e)
{
    o << e.Path << " (" << e.Size << " bytes";
    if (e.HasChecksum)
        o << ", crc " << std::hex << std::setw(4) << std::setfill('0')
          << e.Checksum << std::dec << std::setfill(' ');
    o << ")";
    return o;
}

bool IsSupportedModel(const std::string &model)
{
    std::string m = ToLower(model);
    // Trim leading blanks, some devices pad their model strings
    m.erase(0, m.find_first_not_of(" \t"));
    if (StartsWith(m, "garmin "))
        m = m.substr(7);

    for (int i = 0; i < g_NumSupportedModels; i++) {
        if (StartsWith(m, g_SupportedModels[i]))
            return true;
    }
    return false;
}

std::string DeviceStorageName(const Device &d)
{
    std::string name = d.Id.empty() ? std::string("unknown") : d.Id;
    for (auto i = name.begin(); i != name.end(); ++i) {
        if (*i == ':' || *i == '/' || *i == ' ')
            *i = '-';
    }
    return name;
}

};                                      // end namespace EdgeSync
