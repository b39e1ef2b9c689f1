#pragma once

#include "Session.h"

#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <string>

namespace EdgeSync {

enum TransferStatus {
    TS_PENDING,
    TS_IN_PROGRESS,
    TS_VERIFYING,
    TS_COMPLETE,
    TS_FAILED
};

const char* ToString(TransferStatus s);

struct ExtractOptions
{
    ExtractOptions()
        : ChunkSize(4096),
          MaxRetries(3),
          ChunkTimeoutMs(10000),
          RetryDelayMs(500)
    {
    }

    /** Bytes requested per read, capped by what the transport supports. */
    unsigned ChunkSize;

    /** Number of times a failed read is retried over the whole job. */
    unsigned MaxRetries;

    /** Time limit of each read, 0 for none. */
    unsigned ChunkTimeoutMs;

    unsigned RetryDelayMs;
};

class Extractor;

/** The download of one file.  Jobs are created by Extractor::Extract() and
 * shared with the caller, which can observe and cancel them. */
class TransferJob
{
public:
    unsigned Id() const { return m_Id; }
    const FileEntry& Entry() const { return m_Entry; }
    const std::string& Destination() const { return m_Destination; }

    TransferStatus Status() const;
    uint64_t BytesTransferred() const;
    unsigned RetryCount() const;
    std::string ErrorMessage() const;
    std::exception_ptr Error() const;

    /** Return true if the job is Complete or Failed. */
    bool IsDone() const;

    /** Stop the job.  A Pending or InProgress job fails with
     * CancelledError, its partial file is removed.  Does nothing once the
     * job is done. */
    void Cancel();

    /** Wait until the job is done. */
    void Wait() const;

    /** Wait until the job is done, at most 'timeout_ms'.  Return true if
     * it is done. */
    bool WaitFor(unsigned timeout_ms) const;

    /** Wait until the job is done, throw its error if it failed. */
    void Get() const;

private:
    friend class Extractor;

    TransferJob(unsigned id, const FileEntry &entry, const std::string &destination,
                Session &session);
    TransferJob(const TransferJob&);
    TransferJob& operator=(const TransferJob&);

    Event MakeEvent(EventType t) const;
    void Publish(EventType t);

    /** Start the transfer, return false if the job is already done. */
    bool Start();
    void SetBytesTransferred(uint64_t n);
    void SetStatus(TransferStatus s);
    void AddRetry();
    void Complete();

    /** Fail the job with 'e' and publish TransferFailed, unless it is
     * already done. */
    void Fail(std::exception_ptr e);

    const unsigned m_Id;
    const FileEntry m_Entry;
    const std::string m_Destination;
    const unsigned m_SessionId;
    const std::string m_DeviceId;
    EventBus &m_Bus;
    CancelToken m_Cancel;

    mutable std::mutex m_Mutex;
    mutable std::condition_variable m_DoneCond;
    TransferStatus m_Status;
    uint64_t m_BytesTransferred;
    unsigned m_RetryCount;
    std::exception_ptr m_Error;
};

/** Download files from a session's device.  Jobs run on the session's
 * worker thread, so the jobs of one session run one at a time, in the
 * order Extract() was called.  Queued jobs keep a copy of the options, the
 * Extractor can be destroyed before they finish.
 */
class Extractor
{
public:
    explicit Extractor(Session &session, const ExtractOptions &options = ExtractOptions());

    const ExtractOptions& Options() const { return m_Options; }

    /** Queue the download of 'entry' to 'destination'.  If 'destination'
     * ends in '/' or names an existing directory, the file is stored there
     * under its base name.  Throws SessionStateError if the session is not
     * Ready; otherwise TransferQueued is published and the job will end
     * with TransferComplete or TransferFailed. */
    std::shared_ptr<TransferJob> Extract(const FileEntry &entry, const std::string &destination);

private:
    Extractor(const Extractor&);
    Extractor& operator=(const Extractor&);

    static void RunJob(TransferJob &job, Transport &t, const IoContext &ctx,
                       const ExtractOptions &options, Session &session);
    static void Transfer(TransferJob &job, Transport &t, const IoContext &ctx,
                         const ExtractOptions &options, Session &session);

    Session &m_Session;
    ExtractOptions m_Options;
};

/** Resolve the local file name for downloading 'remote_path' to
 * 'destination', see Extractor::Extract(). */
std::string ResolveDestination(const std::string &remote_path, const std::string &destination);

/** Compute the FIT CRC of the first 'length' bytes of 'file_name'. */
uint16_t FileCrc16(const std::string &file_name, uint64_t length);

};                                      // end namespace EdgeSync

/*
    Local Variables:
    mode: c++
    End:
*/
