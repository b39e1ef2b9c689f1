#pragma once

#include "Session.h"

#include <ctime>
#include <memory>
#include <mutex>
#include <vector>

namespace EdgeSync {

/** Turn a raw device listing into the catalog: keep only FIT files
 * (case-insensitive ".fit" extension), keep one entry per path (the most
 * recently modified one) and sort newest first, by path for equal
 * times. */
std::vector<FileEntry> ResolveEntries(const std::vector<RawEntry> &raw);

/** The list of activity files on a session's device.  A queued listing
 * shares the catalog's cache, so the FileCatalog can be destroyed before
 * the listing runs. */
class FileCatalog
{
public:
    explicit FileCatalog(Session &session);

    /** Retrieve the listing from the device.  Throws SessionStateError if
     * the session is not Ready, CatalogError if the device could not be
     * listed, TimeoutError if it took longer than 'timeout_ms'.  Once the
     * listing is queued, ListingComplete or ListingFailed is published
     * for it. */
    std::vector<FileEntry> ListFiles(unsigned timeout_ms);
    std::vector<FileEntry> ListFiles(unsigned timeout_ms, const CancelToken &cancel);

    /** Start a listing and return without waiting for it. */
    std::future<std::vector<FileEntry> > ListFilesAsync(unsigned timeout_ms,
                                                        const CancelToken &cancel);

    /** Return the result of the last successful listing. */
    std::vector<FileEntry> Cached() const;
    bool HasCache() const;
    std::time_t CacheTime() const;

    /** Look up 'path' in the cached listing, return false if it is not
     * there. */
    bool FindCached(const std::string &path, FileEntry &entry) const;

private:
    FileCatalog(const FileCatalog&);
    FileCatalog& operator=(const FileCatalog&);

    struct CatalogState
    {
        CatalogState() : HasCache(false), CacheTime(0) {}

        mutable std::mutex Mutex;
        std::vector<FileEntry> Cache;
        bool HasCache;
        std::time_t CacheTime;
    };

    static std::vector<FileEntry> RunListing(Session &session, CatalogState &state,
                                             Transport &t, const IoContext &ctx);
    static void PublishFailure(Session &session, std::exception_ptr e);

    Session &m_Session;
    std::shared_ptr<CatalogState> m_State;
};

};                                      // end namespace EdgeSync

/*
    Local Variables:
    mode: c++
    End:
*/
