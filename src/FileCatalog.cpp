#include "FileCatalog.h"

#include <algorithm>
#include <iostream>
#include <map>

#include <strings.h>

namespace {

using namespace EdgeSync;

bool IsFitFile(const std::string &path)
{
    if (path.size() < 4)
        return false;
    return strcasecmp(path.c_str() + path.size() - 4, ".fit") == 0;
}

bool NewestFirst(const FileEntry &a, const FileEntry &b)
{
    if (a.Modified != b.Modified)
        return a.Modified > b.Modified;
    return a.Path < b.Path;
}

};                                      // end anonymous namespace

namespace EdgeSync {

std::vector<FileEntry> ResolveEntries(const std::vector<RawEntry> &raw)
{
    std::map<std::string, FileEntry> by_path;
    for (auto i = raw.begin(); i != raw.end(); ++i) {
        if (! IsFitFile(i->Path))
            continue;
        auto existing = by_path.find(i->Path);
        if (existing != by_path.end() && existing->second.Modified >= i->Modified)
            continue;
        FileEntry e;
        e.Path = i->Path;
        e.Size = i->Size;
        e.Modified = i->Modified;
        e.HasChecksum = i->HasChecksum;
        e.Checksum = i->Checksum;
        by_path[i->Path] = e;
    }

    std::vector<FileEntry> result;
    result.reserve(by_path.size());
    for (auto i = by_path.begin(); i != by_path.end(); ++i)
        result.push_back(i->second);
    std::sort(result.begin(), result.end(), NewestFirst);
    return result;
}


// ........................................................ FileCatalog ....

FileCatalog::FileCatalog(Session &session)
    : m_Session(session),
      m_State(std::make_shared<CatalogState>())
{
}

std::vector<FileEntry> FileCatalog::ListFiles(unsigned timeout_ms)
{
    return ListFiles(timeout_ms, CancelToken());
}

std::vector<FileEntry> FileCatalog::ListFiles(unsigned timeout_ms, const CancelToken &cancel)
{
    return ListFilesAsync(timeout_ms, cancel).get();
}

std::future<std::vector<FileEntry> > FileCatalog::ListFilesAsync(
    unsigned timeout_ms, const CancelToken &cancel)
{
    // The session outlives its queued operations, the catalog might not
    Session &session = m_Session;
    std::shared_ptr<CatalogState> state = m_State;
    std::function<std::vector<FileEntry>(Transport&, const IoContext&)> fn =
        [&session, state](Transport &t, const IoContext &ctx) {
            return RunListing(session, *state, t, ctx);
        };
    return m_Session.Submit(
        "FileCatalog::ListFiles", timeout_ms, cancel, fn,
        [&session](std::exception_ptr e) { PublishFailure(session, e); });
}

std::vector<FileEntry> FileCatalog::RunListing(Session &session, CatalogState &state,
                                               Transport &t, const IoContext &ctx)
{
    const char *who = "FileCatalog::ListFiles";
    std::vector<FileEntry> entries;
    try {
        std::vector<RawEntry> raw;
        try {
            raw = t.List(ctx);
        }
        catch (const TransportError &e) {
            throw CatalogError(who, e.what());
        }
        ctx.Check(who);
        entries = ResolveEntries(raw);
        LogLine(session.Log()) << "Session " << session.Id() << ": "
                               << raw.size() << " files on device, "
                               << entries.size() << " FIT files\n";
    }
    catch (const std::exception &e) {
        LogLine(session.Log()) << "Session " << session.Id() << ": "
                               << e.what() << "\n";
        PublishFailure(session, std::current_exception());
        throw;
    }

    {
        std::unique_lock<std::mutex> lock(state.Mutex);
        state.Cache = entries;
        state.HasCache = true;
        state.CacheTime = time(nullptr);
    }

    Event ev(EV_LISTING_COMPLETE, session.Id(), session.DeviceId());
    ev.Entries = entries;
    session.Bus().Publish(ev);
    return entries;
}

void FileCatalog::PublishFailure(Session &session, std::exception_ptr e)
{
    Event ev(EV_LISTING_FAILED, session.Id(), session.DeviceId());
    ev.Error = e;
    ev.Message = DescribeException(e);
    session.Bus().Publish(ev);
}

std::vector<FileEntry> FileCatalog::Cached() const
{
    std::unique_lock<std::mutex> lock(m_State->Mutex);
    return m_State->Cache;
}

bool FileCatalog::HasCache() const
{
    std::unique_lock<std::mutex> lock(m_State->Mutex);
    return m_State->HasCache;
}

std::time_t FileCatalog::CacheTime() const
{
    std::unique_lock<std::mutex> lock(m_State->Mutex);
    return m_State->CacheTime;
}

bool FileCatalog::FindCached(const std::string &path, FileEntry &entry) const
{
    std::unique_lock<std::mutex> lock(m_State->Mutex);
    for (auto i = m_State->Cache.begin(); i != m_State->Cache.end(); ++i) {
        if (i->Path == path) {
            entry = *i;
            return true;
        }
    }
    return false;
}

};                                      // end namespace EdgeSync
