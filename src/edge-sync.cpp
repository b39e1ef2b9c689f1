#include "Tools.h"
#include "LinuxUtil.h"
#include "Errors.h"
#include "Storage.h"
#include "FitFile.h"
#include "Session.h"
#include "FileCatalog.h"
#include "Extractor.h"
#include "UsbTransport.h"
#include "BluetoothTransport.h"

#include <sys/types.h>
#include <errno.h>
#include <unistd.h>
#include <stdlib.h>
#include <syslog.h>

#include <iostream>
#include <fstream>
#include <sstream>

using namespace EdgeSync;

/** NOTE: for this to work, the directory has to exist and be writable by
    the user running the tool, e.g. in /etc/rc.local
    mkdir /run/edge-sync
    chown pi /run/edge-sync
 */
const char *g_PidFile = "/run/edge-sync/edge-sync.pid";

namespace {

struct SyncOptions
{
    SyncOptions()
        : DaemonMode(false), TimeoutMs(30000), ScanSeconds(10),
          UseUsb(true), UseBluetooth(true), ListOnly(false), AllFiles(false)
    {
    }

    bool DaemonMode;
    unsigned TimeoutMs;
    unsigned ScanSeconds;
    bool UseUsb;
    bool UseBluetooth;
    std::string MountPoint;
    bool ListOnly;
    bool AllFiles;                      // download files we already have
    std::string PairAddress;            // pair with this device and exit
};

void Usage(const char *name)
{
    std::cerr << "Usage: " << name << " [-d] [-p PID_FILE] [-o DIR] [-t MS] [-s SECONDS]\n"
              << "       [-u | -b] [-m MOUNT_POINT] [-l] [-a] [-P ADDRESS]\n"
              << "  -d  run as a daemon, log to syslog and DIR/edge-sync.log\n"
              << "  -p  PID lock file (default " << g_PidFile << ")\n"
              << "  -o  storage directory (default $HOME/EdgeSync)\n"
              << "  -t  timeout for connecting and listing, in milliseconds\n"
              << "  -s  Bluetooth scan duration, in seconds\n"
              << "  -u  only look for USB devices\n"
              << "  -b  only look for Bluetooth devices\n"
              << "  -m  mount point of the device's USB volume\n"
              << "  -l  list the files on the devices, don't download\n"
              << "  -a  download all files, even if we have them, and ignore the\n"
              << "      time since the last sync\n"
              << "  -P  pair with the Bluetooth device at ADDRESS and exit\n";
}

bool ParseUnsigned(const char *s, unsigned &value)
{
    char *end = nullptr;
    errno = 0;
    unsigned long v = strtoul(s, &end, 10);
    if (errno != 0 || end == s || *end != '\0')
        return false;
    value = static_cast<unsigned>(v);
    return true;
}

std::vector<Device> FindDevices(const SyncOptions &opts, std::ostream &log)
{
    std::vector<Device> devices;
    if (opts.UseUsb) {
        if (! opts.MountPoint.empty()) {
            devices.push_back(Device(TRANSPORT_USB, "usb-" + BaseName(opts.MountPoint),
                                     "Garmin USB volume", opts.MountPoint));
        }
        else {
            try {
                std::vector<Device> usb = FindGarminUsbDevices();
                devices.insert(devices.end(), usb.begin(), usb.end());
            }
            catch (const LibusbException &e) {
                LogLine(log) << e.what() << "\n";
            }
        }
    }
    if (opts.UseBluetooth) {
        try {
            std::vector<Device> bt = DiscoverBluetoothDevices(opts.ScanSeconds, &log);
            devices.insert(devices.end(), bt.begin(), bt.end());
        }
        catch (const EdgeSyncError &e) {
            LogLine(log) << e.what() << "\n";
        }
    }
    return devices;
}

/** Log the interesting events, progress is only shown per file. */
void LogEvent(std::ostream &log, const Event &e)
{
    if (e.Type == EV_TRANSFER_PROGRESS || e.Type == EV_LISTING_COMPLETE)
        return;
    LogLine(log) << e << "\n";
}

/** Sync one device, return true if everything was downloaded. */
bool SyncDevice(const Device &device, EventBus &bus, const SyncOptions &opts,
                std::ostream &log)
{
    if (! opts.AllFiles && ! opts.ListOnly) {
        time_t last_sync = GetLastSuccessfulSync(device);
        int seconds_since_sync = time(nullptr) - last_sync;
        if (last_sync > 0 && seconds_since_sync < MinSyncIntervalSeconds) {
            LogLine(log) << device << ": recently synced ("
                         << seconds_since_sync << " seconds ago)\n";
            return true;
        }
    }

    Session session(device, MakeTransport(device, &log), bus, &log);
    session.Connect(opts.TimeoutMs).get();

    FileCatalog catalog(session);
    std::vector<FileEntry> entries = catalog.ListFiles(opts.TimeoutMs);
    Device d = session.GetDevice();
    std::string summary = WriteFileList(d, entries);
    {
        LogLine line(log);
        line << "Device " << d << " has " << summary << "\n";
        if (opts.ListOnly) {
            for (auto i = entries.begin(); i != entries.end(); ++i)
                line << "    " << *i << "\n";
        }
    }

    if (opts.ListOnly) {
        session.Close();
        return true;
    }

    Extractor extractor(session);
    std::string dest = GetActivityStoragePath(d) + "/";
    std::vector<std::shared_ptr<TransferJob> > jobs;
    uint64_t total_download = 0;
    for (auto i = entries.begin(); i != entries.end(); ++i) {
        if (opts.AllFiles || ! HaveFile(d, *i)) {
            jobs.push_back(extractor.Extract(*i, dest));
            total_download += i->Size;
        }
    }

    if (jobs.empty()) {
        LogLine(log) << "Nothing to download from " << d << "\n";
    }
    else {
        LogLine(log) << "Downloading " << jobs.size() << " files, total of "
                     << FormatKb(total_download) << ", from " << d << "\n";
    }

    int failed = 0;
    for (auto j = jobs.begin(); j != jobs.end(); ++j) {
        (*j)->Wait();
        if ((*j)->Status() == TS_FAILED) {
            failed++;
            continue;
        }
        try {
            std::string what = CheckDownloadedFile((*j)->Destination());
            LogLine(log) << (*j)->Entry().Path << " went into "
                         << (*j)->Destination() << ", " << what << "\n";
            if (opts.DaemonMode)
                syslog(LOG_INFO, "%s went into %s", (*j)->Entry().Path.c_str(),
                       (*j)->Destination().c_str());
        }
        catch (const BadFitFile &e) {
            LogLine(log) << (*j)->Entry().Path << ": " << e.what() << "\n";
            failed++;
        }
    }

    session.Close();
    if (failed > 0) {
        LogLine(log) << failed << " of " << jobs.size() << " downloads from "
                     << d << " failed\n";
        return false;
    }
    MarkSuccessfulSync(d);
    return true;
}

int SyncAll(const SyncOptions &opts, std::ostream &log)
{
    std::vector<Device> devices = FindDevices(opts, log);
    if (devices.empty()) {
        LogLine(log) << "No Garmin devices found\n";
        return 0;
    }

    EventBus bus(&log);
    bus.Subscribe([&log](const Event &e) { LogEvent(log, e); });

    int status = 0;
    for (auto i = devices.begin(); i != devices.end(); ++i) {
        try {
            if (! SyncDevice(*i, bus, opts, log))
                status = 1;
        }
        catch (const std::exception &e) {
            LogLine(log) << *i << ": " << e.what() << "\n";
            if (opts.DaemonMode)
                syslog(LOG_ERR, "%s", e.what());
            status = 1;
        }
        bus.WaitIdle();
    }
    return status;
}

};                                      // end anonymous namespace

int main(int argc, char **argv)
{
    SyncOptions opts;

    int opt = 0;
    while ((opt = getopt(argc, argv, "dp:o:t:s:ubm:laP:h")) != -1) {
        switch (opt) {
        case 'd':
            opts.DaemonMode = ! opts.DaemonMode;
            break;
        case 'p':
            g_PidFile = optarg;
            break;
        case 'o':
            SetBaseStoragePath(optarg);
            break;
        case 't':
            if (! ParseUnsigned(optarg, opts.TimeoutMs)) {
                std::cerr << "Bad timeout: " << optarg << "\n";
                return 1;
            }
            break;
        case 's':
            if (! ParseUnsigned(optarg, opts.ScanSeconds)) {
                std::cerr << "Bad scan duration: " << optarg << "\n";
                return 1;
            }
            break;
        case 'u':
            opts.UseBluetooth = false;
            break;
        case 'b':
            opts.UseUsb = false;
            break;
        case 'm':
            opts.MountPoint = optarg;
            break;
        case 'l':
            opts.ListOnly = true;
            break;
        case 'a':
            opts.AllFiles = true;
            break;
        case 'P':
            opts.PairAddress = optarg;
            break;
        case 'h':
            Usage(argv[0]);
            return 1;
        default:
            std::cerr << "Bad option: " << (char)opt << "\n";
            return 1;
        }
    }

    if (! opts.UseUsb && ! opts.UseBluetooth) {
        std::cerr << "-u and -b cannot be used together\n";
        return 1;
    }

    if (! opts.PairAddress.empty()) {
        Device d(TRANSPORT_BLUETOOTH, opts.PairAddress, opts.PairAddress);
        try {
            if (PairBluetoothDevice(d, opts.TimeoutMs, &std::cout))
                std::cout << "Paired with " << opts.PairAddress << "\n";
            else
                std::cout << opts.PairAddress << " is already paired\n";
            return 0;
        }
        catch (const EdgeSyncError &e) {
            std::cerr << e.what() << "\n";
            return 1;
        }
    }

    if (opts.DaemonMode) {
        if (daemon(0, 0) != 0) {
            std::cerr << UnixException("daemon", errno).what() << std::endl;
            return 1;
        }
        openlog("edge-sync", 0, LOG_USER);
    }

    int status = 0;
    bool have_lock = false;
    try {
        have_lock = AquirePidLock(g_PidFile);
        if (! have_lock)
            return 1;
        if (opts.DaemonMode) {
            std::string log_file = JoinPath(GetBaseStoragePath(), "edge-sync.log");
            std::ofstream log(log_file.c_str(), std::ios::app);
            if (! log) {
                syslog(LOG_ERR, "cannot open log file %s", log_file.c_str());
                status = 1;
            }
            else {
                syslog(LOG_NOTICE, "started up, will use %s as the log file", log_file.c_str());
                status = SyncAll(opts, log);
                syslog(LOG_NOTICE, "sync complete");
            }
        }
        else {
            status = SyncAll(opts, std::cout);
        }
    }
    catch (const std::exception &e) {
        if (opts.DaemonMode)
            syslog(LOG_ERR, "%s", e.what());
        std::cerr << e.what() << std::endl;
        status = 1;
    }

    if (have_lock)
        ReleasePidLock(g_PidFile);
    if (opts.DaemonMode)
        closelog();
    return status;
}
