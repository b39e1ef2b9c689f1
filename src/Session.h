#pragma once

#include "Device.h"
#include "Transport.h"
#include "EventBus.h"
#include "Errors.h"

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace EdgeSync {

/** A connection to one device.  The session owns the device's transport
 * and runs every transport operation on its own worker thread, one at a
 * time, in the order they were submitted.
 *
 * State machine:
 *
 *   Disconnected -> Connecting -> Connected -> Authenticating -> Ready
 *   Connecting, Connected, Authenticating -> Error (on failure)
 *   Error -> Connecting (an explicit Connect() retry)
 *   Ready, Error -> Closing -> Disconnected (Close())
 *
 * All state changes are published on the event bus.
 */
class Session
{
public:
    Session(const Device &device, std::unique_ptr<Transport> transport,
            EventBus &bus, std::ostream *log_stream = nullptr);

    /** Close the session and stop the worker thread. */
    ~Session();

    unsigned Id() const { return m_Id; }
    const std::string& DeviceId() const { return m_DeviceId; }

    /** Return a copy of the device, with the model and firmware filled in
     * once the handshake has completed. */
    Device GetDevice() const;

    SessionState State() const;

    EventBus& Bus() { return m_Bus; }
    std::ostream& Log() { return *m_LogStream; }

    /** Largest chunk the transport can read in one call. */
    unsigned MaxChunkSize() const { return m_MaxChunkSize; }

    /** Start connecting to the device.  The state moves to Connecting
     * before this returns, the rest of the handshake runs on the worker
     * thread.  The returned future becomes ready when the session is Ready,
     * or holds the exception which moved it into Error.
     *
     * Throws AlreadyConnectingError if a connect is in progress, or if
     * another session on the same event bus is connecting or connected to
     * this device.  Throws SessionStateError if the session is Ready or
     * Closing.  The device stays claimed until the session is Disconnected
     * or in Error. */
    std::future<void> Connect(unsigned timeout_ms);

    /** Cancel all queued and running operations, wait for them to finish
     * and release the transport.  Does nothing if the session is already
     * Disconnected.  Must not be called from a function running on the
     * session's worker thread. */
    void Close();

    /** Called with the failure of a submitted operation which never got to
     * run. */
    typedef std::function<void(std::exception_ptr)> RejectHandler;

    /** Queue 'fn' to run on the worker thread with the session's transport.
     * 'fn' receives an IoContext with a deadline of 'timeout_ms' (counted
     * from when it starts to run, 0 for no deadline) and 'cancel'.
     *
     * Throws SessionStateError if the session is not Ready.  If the session
     * is no longer Ready, or 'cancel' was triggered, by the time the
     * operation reaches the front of the queue, it does not run: the future
     * receives SessionStateError or CancelledError and 'on_rejected' is
     * called with the same error. */
    template <typename R>
    std::future<R> Submit(const std::string &what, unsigned timeout_ms,
                          const CancelToken &cancel,
                          const std::function<R(Transport&, const IoContext&)> &fn,
                          const RejectHandler &on_rejected = RejectHandler());

private:
    Session(const Session&);
    Session& operator=(const Session&);

    struct Task
    {
        std::function<void()> Run;
        CancelToken Cancel;
    };

    void Enqueue(const std::string &what, bool requires_ready,
                 const CancelToken &cancel, const std::function<void()> &run);
    std::exception_ptr CheckRunnable(const std::string &what, const CancelToken &cancel);
    void WorkerLoop();
    void RunConnect(unsigned timeout_ms, const CancelToken &cancel);

    /** Change state and publish the change, must be called with m_Mutex
     * held. */
    void SetStateLocked(SessionState s, std::exception_ptr error = std::exception_ptr());

    /** Change state from the worker thread, unless Close() has started.
     * Return false if the session is closing. */
    bool AdvanceState(SessionState s, std::exception_ptr error = std::exception_ptr());

    static unsigned NextId();

    const unsigned m_Id;
    const std::string m_DeviceId;
    std::unique_ptr<Transport> m_Transport;
    EventBus &m_Bus;
    std::ostream *m_LogStream;
    unsigned m_MaxChunkSize;

    mutable std::mutex m_Mutex;
    std::condition_variable m_QueueCond;
    std::condition_variable m_StateCond;
    Device m_Device;
    SessionState m_State;
    std::deque<Task> m_Queue;
    CancelToken m_Running;              // token of the operation running now
    bool m_HasRunning;
    bool m_StopWorker;

    std::thread m_Worker;
};

template <typename R>
std::future<R> Session::Submit(const std::string &what, unsigned timeout_ms,
                               const CancelToken &cancel,
                               const std::function<R(Transport&, const IoContext&)> &fn,
                               const RejectHandler &on_rejected)
{
    auto task = std::make_shared<std::packaged_task<R()> >(
        [this, what, timeout_ms, cancel, fn, on_rejected]() -> R {
            std::exception_ptr e = CheckRunnable(what, cancel);
            if (e) {
                if (on_rejected)
                    on_rejected(e);
                std::rethrow_exception(e);
            }
            IoContext ctx(timeout_ms, cancel);
            return fn(*m_Transport, ctx);
        });
    std::future<R> result = task->get_future();
    Enqueue(what, true, cancel, [task]() { (*task)(); });
    return result;
}

};                                      // end namespace EdgeSync

/*
    Local Variables:
    mode: c++
    End:
*/
