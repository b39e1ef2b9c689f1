#pragma once

#include "Device.h"

#include <ctime>
#include <string>
#include <vector>

namespace EdgeSync
{
    /** Devices synced more recently than this are skipped. */
    const int MinSyncIntervalSeconds = 30 * 60;

    /** Use 'path' instead of $HOME/EdgeSync as the storage base. */
    void SetBaseStoragePath(const std::string &path);

    std::string GetBaseStoragePath();
    std::string GetDeviceStoragePath(const Device &d);
    std::string GetActivityStoragePath(const Device &d);

    /** Return true if 'e' is already stored for device 'd', with the same
     * size. */
    bool HaveFile(const Device &d, const FileEntry &e);

    /** Write the device catalog to "file_list.txt" in the device storage
     * directory and return the usage summary line. */
    std::string WriteFileList(const Device &d, const std::vector<FileEntry> &entries);

    /** Check the downloaded FIT file at 'path' and return a description of
     * it for the log (file type, product, creation time).  A file which is
     * not a valid FIT file is removed, so the next sync downloads it
     * again, and BadFitFile is thrown. */
    std::string CheckDownloadedFile(const std::string &path);

    void MarkSuccessfulSync(const Device &d);

    /** Return the time of the last successful sync, 0 if the device was
     * never synced. */
    std::time_t GetLastSuccessfulSync(const Device &d);

}; // end namespace EdgeSync

/*
    Local Variables:
    mode: c++
    End:
*/
