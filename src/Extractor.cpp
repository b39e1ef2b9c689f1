#include "Extractor.h"
#include "LinuxUtil.h"
#include "FitFile.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>
#include <errno.h>

namespace EdgeSync {

const char* ToString(TransferStatus s)
{
    switch (s) {
    case TS_PENDING: return "Pending";
    case TS_IN_PROGRESS: return "InProgress";
    case TS_VERIFYING: return "Verifying";
    case TS_COMPLETE: return "Complete";
    case TS_FAILED: return "Failed";
    default: return "unknown";
    }
}

std::string ResolveDestination(const std::string &remote_path, const std::string &destination)
{
    if (destination.empty())
        return BaseName(remote_path);
    if (destination[destination.size() - 1] == '/' || IsDirectory(destination))
        return JoinPath(destination, BaseName(remote_path));
    return destination;
}

uint16_t FileCrc16(const std::string &file_name, uint64_t length)
{
    int fd = ::open(file_name.c_str(), O_RDONLY);
    if (fd == -1)
        throw UnixException("FileCrc16: open " + file_name, errno);

    unsigned char buf[64 * 1024];
    uint16_t crc = 0;
    while (length > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(length, sizeof(buf)));
        ssize_t n = ::read(fd, buf, want);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            int e = errno;
            ::close(fd);
            throw UnixException("FileCrc16: read " + file_name, e);
        }
        if (n == 0) {
            ::close(fd);
            throw IntegrityError("FileCrc16", file_name + " is shorter than expected");
        }
        crc = Crc16(crc, buf, n);
        length -= n;
    }
    ::close(fd);
    return crc;
}


// ........................................................ TransferJob ....

TransferJob::TransferJob(unsigned id, const FileEntry &entry,
                         const std::string &destination, Session &session)
    : m_Id(id),
      m_Entry(entry),
      m_Destination(destination),
      m_SessionId(session.Id()),
      m_DeviceId(session.DeviceId()),
      m_Bus(session.Bus()),
      m_Status(TS_PENDING),
      m_BytesTransferred(0),
      m_RetryCount(0)
{
}

TransferStatus TransferJob::Status() const
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    return m_Status;
}

uint64_t TransferJob::BytesTransferred() const
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    return m_BytesTransferred;
}

unsigned TransferJob::RetryCount() const
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    return m_RetryCount;
}

std::string TransferJob::ErrorMessage() const
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    return DescribeException(m_Error);
}

std::exception_ptr TransferJob::Error() const
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    return m_Error;
}

bool TransferJob::IsDone() const
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    return m_Status == TS_COMPLETE || m_Status == TS_FAILED;
}

void TransferJob::Cancel()
{
    m_Cancel.Cancel();
    bool pending = false;
    {
        std::unique_lock<std::mutex> lock(m_Mutex);
        pending = (m_Status == TS_PENDING);
    }
    // A running job notices the cancellation at its next read and fails
    // itself, a pending one will never run.
    if (pending)
        Fail(std::make_exception_ptr(CancelledError("TransferJob::Cancel", m_Entry.Path)));
}

void TransferJob::Wait() const
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    m_DoneCond.wait(lock, [this]() {
            return m_Status == TS_COMPLETE || m_Status == TS_FAILED;
        });
}

bool TransferJob::WaitFor(unsigned timeout_ms) const
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    return m_DoneCond.wait_for(
        lock, std::chrono::milliseconds(timeout_ms), [this]() {
            return m_Status == TS_COMPLETE || m_Status == TS_FAILED;
        });
}

void TransferJob::Get() const
{
    Wait();
    std::exception_ptr e = Error();
    if (e)
        std::rethrow_exception(e);
}

Event TransferJob::MakeEvent(EventType t) const
{
    Event e(t, m_SessionId, m_DeviceId);
    e.JobId = m_Id;
    e.Path = m_Entry.Path;
    e.Destination = m_Destination;
    e.BytesTransferred = m_BytesTransferred;
    e.TotalBytes = m_Entry.Size;
    return e;
}

void TransferJob::Publish(EventType t)
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    m_Bus.Publish(MakeEvent(t));
}

bool TransferJob::Start()
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    if (m_Status != TS_PENDING)
        return false;
    m_Status = TS_IN_PROGRESS;
    return true;
}

void TransferJob::SetBytesTransferred(uint64_t n)
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    m_BytesTransferred = n;
    m_Bus.Publish(MakeEvent(EV_TRANSFER_PROGRESS));
}

void TransferJob::SetStatus(TransferStatus s)
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    m_Status = s;
}

void TransferJob::AddRetry()
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    m_RetryCount++;
}

void TransferJob::Complete()
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    m_Status = TS_COMPLETE;
    m_Bus.Publish(MakeEvent(EV_TRANSFER_COMPLETE));
    m_DoneCond.notify_all();
}

void TransferJob::Fail(std::exception_ptr e)
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    if (m_Status == TS_COMPLETE || m_Status == TS_FAILED)
        return;
    m_Status = TS_FAILED;
    m_Error = e;
    Event ev = MakeEvent(EV_TRANSFER_FAILED);
    ev.Error = e;
    ev.Message = DescribeException(e);
    m_Bus.Publish(ev);
    m_DoneCond.notify_all();
}


// .......................................................... Extractor ....

Extractor::Extractor(Session &session, const ExtractOptions &options)
    : m_Session(session),
      m_Options(options)
{
}

std::shared_ptr<TransferJob> Extractor::Extract(const FileEntry &entry,
                                                const std::string &destination)
{
    static std::atomic<unsigned> next_id(1);
    const char *who = "Extractor::Extract";

    SessionState state = m_Session.State();
    if (state != SS_READY)
        throw SessionStateError(who, std::string("session is ") + ToString(state));

    std::shared_ptr<TransferJob> job(
        new TransferJob(next_id++, entry, ResolveDestination(entry.Path, destination),
                        m_Session));
    job->Publish(EV_TRANSFER_QUEUED);

    ExtractOptions options = m_Options;
    Session *session = &m_Session;
    std::function<void(Transport&, const IoContext&)> fn =
        [job, options, session](Transport &t, const IoContext &ctx) {
            RunJob(*job, t, ctx, options, *session);
        };
    try {
        m_Session.Submit(std::string(who) + " " + entry.Path, 0, job->m_Cancel, fn,
                         [job](std::exception_ptr e) { job->Fail(e); });
    }
    catch (const SessionStateError &) {
        // The session stopped being Ready since we checked
        job->Fail(std::current_exception());
        throw;
    }
    return job;
}

void Extractor::RunJob(TransferJob &job, Transport &t, const IoContext &ctx,
                       const ExtractOptions &options, Session &session)
{
    if (! job.Start())
        throw CancelledError("Extractor::Extract", job.Entry().Path);
    try {
        LogLine(session.Log()) << "Session " << session.Id() << ": job " << job.Id()
                               << ", " << job.Entry() << " -> " << job.Destination() << "\n";
        Transfer(job, t, ctx, options, session);
        job.Complete();
        LogLine(session.Log()) << "Session " << session.Id() << ": job " << job.Id()
                               << " complete, " << FormatKb(job.Entry().Size) << "\n";
    }
    catch (const std::exception &e) {
        LogLine(session.Log()) << "Session " << session.Id() << ": job " << job.Id()
                               << " failed: " << e.what() << "\n";
        job.Fail(std::current_exception());
        throw;
    }
}

void Extractor::Transfer(TransferJob &job, Transport &t, const IoContext &ctx,
                         const ExtractOptions &options, Session &session)
{
    const char *who = "Extractor::Extract";
    const FileEntry &entry = job.Entry();
    unsigned chunk = std::min(options.ChunkSize, session.MaxChunkSize());
    if (chunk == 0)
        chunk = 1;

    std::string dir = DirName(job.Destination());
    if (! IsDirectory(dir))
        MakeDirectoryPath(dir);

    // The partial file is removed when we leave with an exception
    PartialFile out(job.Destination());
    uint64_t offset = 0;
    Buffer data;
    while (offset < entry.Size) {
        ctx.Check(who);
        unsigned want = static_cast<unsigned>(std::min<uint64_t>(chunk, entry.Size - offset));
        IoContext chunk_ctx(options.ChunkTimeoutMs, ctx.Cancel());
        try {
            t.ReadChunk(entry.Path, offset, want, data, chunk_ctx);
        }
        catch (const TransportError &e) {
            if (job.RetryCount() >= options.MaxRetries)
                throw;
            job.AddRetry();
            LogLine(session.Log()) << "Session " << session.Id() << ": job " << job.Id()
                                   << ", read at " << offset << " failed, retry "
                                   << job.RetryCount() << " of " << options.MaxRetries
                                   << ": " << e.what() << "\n";
            ctx.Sleep(options.RetryDelayMs, who);
            continue;
        }

        if (data.size() > want) {
            std::ostringstream msg;
            msg << "asked for " << want << " bytes at " << offset << ", got " << data.size();
            throw IntegrityError(who, msg.str());
        }
        if (data.empty()) {
            std::ostringstream msg;
            msg << entry.Path << " ends at " << offset << ", expected " << entry.Size << " bytes";
            throw IntegrityError(who, msg.str());
        }
        out.Write(&data[0], data.size());
        offset += data.size();
        job.SetBytesTransferred(offset);
    }

    job.SetStatus(TS_VERIFYING);
    out.Close();
    if (out.BytesWritten() != entry.Size) {
        std::ostringstream msg;
        msg << "wrote " << out.BytesWritten() << " bytes, expected " << entry.Size;
        throw IntegrityError(who, msg.str());
    }
    if (entry.HasChecksum) {
        if (entry.Size < 2)
            throw IntegrityError(who, "file too small to carry a checksum");
        uint16_t crc = FileCrc16(out.PartName(), entry.Size - 2);
        if (crc != entry.Checksum) {
            std::ostringstream msg;
            msg << std::hex << std::setfill('0') << "checksum mismatch, expected "
                << std::setw(4) << entry.Checksum << ", got " << std::setw(4) << crc;
            throw IntegrityError(who, msg.str());
        }
    }
    out.Commit();

    // Set the file times to those on the device, to make them easier to
    // identify.
    if (entry.Modified > 0) {
        try {
            SetFileTime(job.Destination(), entry.Modified);
        }
        catch (const UnixException &e) {
            // The data is safely stored, a wrong timestamp is not a failure
            LogLine(session.Log()) << "Session " << session.Id() << ": "
                                   << e.what() << "\n";
        }
    }
}

};                                      // end namespace EdgeSync
