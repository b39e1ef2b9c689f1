#include "Storage.h"
#include "LinuxUtil.h"
#include "FitFile.h"

#include <fstream>
#include <iomanip>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>

#include <sys/stat.h>

using namespace EdgeSync;

namespace {

    std::mutex g_Mutex;
    std::string g_BaseDirectory;

    const char *g_AppName = "EdgeSync";
    const char *g_ActivityDir = "Activities";
    const char *g_FileListName = "file_list.txt";
    const char *g_LastSyncName = "last_sync";

    // Also kept in memory, in case the storage is not writable
    std::map<std::string, std::time_t> g_LastSuccessfulSync;

    std::string BaseDirectory()
    {
        std::unique_lock<std::mutex> lock(g_Mutex);
        if (g_BaseDirectory.empty())
            g_BaseDirectory = JoinPath(GetUserDataDir(), g_AppName);
        MakeDirectoryPath(g_BaseDirectory);
        return g_BaseDirectory;
    }

    std::string GetLastSyncFile(const Device &d)
    {
        return JoinPath(GetDeviceStoragePath(d), g_LastSyncName);
    }

    std::string FormatTime(std::time_t t)
    {
        struct tm tm;
        localtime_r(&t, &tm);
        char buf[64];
        strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        return buf;
    }

    const char* FitFileTypeName(int type)
    {
        switch (type) {
        case FIT_FILE_DEVICE: return "device";
        case FIT_FILE_SETTINGS: return "settings";
        case FIT_FILE_SPORT: return "sport";
        case FIT_FILE_ACTIVITY: return "activity";
        case FIT_FILE_WORKOUT: return "workout";
        case FIT_FILE_COURSE: return "course";
        default: return "FIT";
        }
    }

};                                      // end anonymous namespace

namespace EdgeSync
{

    void SetBaseStoragePath(const std::string &path)
    {
        std::unique_lock<std::mutex> lock(g_Mutex);
        g_BaseDirectory = path;
    }

    std::string GetBaseStoragePath()
    {
        return BaseDirectory();
    }

    std::string GetDeviceStoragePath(const Device &d)
    {
        std::string path = JoinPath(BaseDirectory(), DeviceStorageName(d));
        MakeDirectoryPath(path);
        return path;
    }

    std::string GetActivityStoragePath(const Device &d)
    {
        std::string path = JoinPath(GetDeviceStoragePath(d), g_ActivityDir);
        MakeDirectoryPath(path);
        return path;
    }

    bool HaveFile(const Device &d, const FileEntry &e)
    {
        std::string p = JoinPath(GetActivityStoragePath(d), BaseName(e.Path));
        struct stat buf;
        return ::stat(p.c_str(), &buf) == 0
            && S_ISREG(buf.st_mode)
            && static_cast<uint64_t>(buf.st_size) == e.Size;
    }

    std::string WriteFileList(const Device &d, const std::vector<FileEntry> &entries)
    {
        std::string path = JoinPath(GetDeviceStoragePath(d), g_FileListName);
        std::ofstream out(path.c_str(), std::ios::trunc);
        if (! out)
            throw std::runtime_error("WriteFileList: cannot open " + path);

        out << "File list for " << d << "\n"
            << "Size\tTimestamp\t\tCRC\tPath\n";
        uint64_t total_size = 0;
        for (auto i = entries.begin(); i != entries.end(); ++i) {
            total_size += i->Size;
            out << i->Size << "\t" << FormatTime(i->Modified) << "\t";
            if (i->HasChecksum)
                out << std::hex << std::setw(4) << std::setfill('0') << i->Checksum
                    << std::dec << std::setfill(' ');
            else
                out << "-";
            out << "\t" << i->Path << "\n";
        }

        std::ostringstream summary;
        summary << "Total of " << FormatKb(total_size) << " used by "
                << entries.size() << " activities";
        out << summary.str() << "\n";
        out.close();
        if (! out)
            throw std::runtime_error("WriteFileList: failed writing " + path);
        return summary.str();
    }

    void MarkSuccessfulSync(const Device &d)
    {
        std::time_t t = time(nullptr);
        std::string file = GetLastSyncFile(d);
        {
            std::unique_lock<std::mutex> lock(g_Mutex);
            g_LastSuccessfulSync[file] = t;
        }
        std::ostringstream s;
        s << t << "\n";
        std::string data = s.str();
        WriteData(file, Buffer(data.begin(), data.end()));
    }

    std::time_t GetLastSuccessfulSync(const Device &d)
    {
        std::string file = GetLastSyncFile(d);
        {
            std::unique_lock<std::mutex> lock(g_Mutex);
            auto i = g_LastSuccessfulSync.find(file);
            if (i != g_LastSuccessfulSync.end())
                return i->second;
        }

        if (! FileExists(file))
            return 0;
        Buffer data;
        ReadData(file, data);
        std::istringstream in(std::string(data.begin(), data.end()));
        long long t = 0;
        if (! (in >> t))
            return 0;
        return static_cast<std::time_t>(t);
    }

    std::string CheckDownloadedFile(const std::string &path)
    {
        Buffer data;
        ReadData(path, data);
        try {
            CheckFitFile(data);
        }
        catch (const BadFitFile &) {
            RemoveFile(path);
            throw;
        }

        std::ostringstream s;
        try {
            FitFileId fid = ReadFitFileId(data);
            s << FitFileTypeName(fid.Type) << " file";
            if (fid.Product >= 0)
                s << ", product " << fid.Product;
            if (fid.TimeCreated != 0)
                s << ", created " << FormatTime(fid.TimeCreated);
        }
        catch (const BadFitFile &) {
            s << "FIT file without file_id";
        }
        s << ", " << FormatKb(data.size());
        return s.str();
    }

}; // end namespace EdgeSync
