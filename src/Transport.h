#pragma once

#include "Tools.h"
#include "Device.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <memory>
#include <string>
#include <vector>
#include <stdint.h>

namespace EdgeSync {


// ........................................................ CancelToken ....

/** A cancellation flag shared between the party which requests an operation
 * and the code performing it.  Copies refer to the same flag. */
class CancelToken
{
public:
    CancelToken() : m_Flag(std::make_shared<std::atomic<bool> >(false)) {}

    void Cancel() { m_Flag->store(true); }
    bool IsCancelled() const { return m_Flag->load(); }

private:
    std::shared_ptr<std::atomic<bool> > m_Flag;
};


// .......................................................... IoContext ....

/** Time limit and cancellation state for one transport operation.
 * Transports call Check() between blocking steps and bound each blocking
 * call by RemainingMs().
 */
class IoContext
{
public:
    /** A timeout of 0 means there is no deadline. */
    IoContext(unsigned timeout_ms, const CancelToken &cancel);

    /** Throw CancelledError if the operation was cancelled, TimeoutError if
     * its deadline has passed. */
    void Check(const std::string &who) const;

    bool HasDeadline() const { return m_HasDeadline; }

    /** Milliseconds until the deadline, at least 1.  Returns 0 when there
     * is no deadline. */
    unsigned RemainingMs() const;

    /** Sleep for 'ms' milliseconds, or less if the deadline comes first.
     * Wakes up early and throws if the operation is cancelled. */
    void Sleep(unsigned ms, const std::string &who) const;

    const CancelToken& Cancel() const { return m_Cancel; }

private:
    bool m_HasDeadline;
    std::chrono::steady_clock::time_point m_Deadline;
    CancelToken m_Cancel;
};


// ........................................................... RawEntry ....

/** A file as reported by the device, before any filtering. */
struct RawEntry
{
    RawEntry() : Size(0), Modified(0), HasChecksum(false), Checksum(0) {}

    std::string Path;
    uint64_t Size;
    std::time_t Modified;
    bool HasChecksum;
    uint16_t Checksum;                  // FIT CRC-16, if HasChecksum
};


// .......................................................... Transport ....

/** The capabilities every device link provides.  Implementations are not
 * thread safe: a Session makes sure only one thread uses a transport at a
 * time.  All methods except Disconnect() report failures by throwing
 * TransportError, TimeoutError or CancelledError.
 */
class Transport
{
public:
    virtual ~Transport();

    /** Establish the link to the device. */
    virtual void Connect(const IoContext &ctx) = 0;

    /** Ask the device who it is.  Throws UnsupportedDeviceError if the
     * device cannot serve files. */
    virtual DeviceIdentity Identify(const IoContext &ctx) = 0;

    /** Return all files the device offers. */
    virtual std::vector<RawEntry> List(const IoContext &ctx) = 0;

    /** Read up to 'length' bytes of 'path' starting at 'offset' into
     * 'data'.  Fewer bytes are returned only at the end of the file. */
    virtual void ReadChunk(const std::string &path, uint64_t offset,
                           unsigned length, Buffer &data,
                           const IoContext &ctx) = 0;

    /** Release the link and all OS handles.  Safe to call more than
     * once. */
    virtual void Disconnect() = 0;

    /** Largest 'length' ReadChunk() can serve in one call. */
    virtual unsigned MaxChunkSize() const = 0;
};

/** Create the transport for device 'd', based on its transport kind. */
std::unique_ptr<Transport> MakeTransport(const Device &d, std::ostream *log_stream);

};                                      // end namespace EdgeSync

/*
    Local Variables:
    mode: c++
    End:
*/
