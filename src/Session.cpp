#include "Session.h"

#include <atomic>
#include <iostream>
#include <stdexcept>

namespace EdgeSync {

unsigned Session::NextId()
{
    static std::atomic<unsigned> next(1);
    return next++;
}

Session::Session(const Device &device, std::unique_ptr<Transport> transport,
                 EventBus &bus, std::ostream *log_stream)
    : m_Id(NextId()),
      m_DeviceId(device.Id),
      m_Transport(std::move(transport)),
      m_Bus(bus),
      m_LogStream(log_stream ? log_stream : &std::cerr),
      m_MaxChunkSize(0),
      m_Device(device),
      m_State(SS_DISCONNECTED),
      m_HasRunning(false),
      m_StopWorker(false)
{
    if (! m_Transport)
        throw std::invalid_argument("Session -- no transport");
    m_MaxChunkSize = m_Transport->MaxChunkSize();
    m_Device.State = SS_DISCONNECTED;
    m_Worker = std::thread([this]() { WorkerLoop(); });
}

Session::~Session()
{
    try {
        Close();
    }
    catch (const std::exception &e) {
        LogLine(*m_LogStream) << "Session " << m_Id << ": close failed: "
                              << e.what() << "\n";
    }
    {
        std::unique_lock<std::mutex> lock(m_Mutex);
        m_StopWorker = true;
    }
    m_QueueCond.notify_all();
    m_Worker.join();
}

Device Session::GetDevice() const
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    return m_Device;
}

SessionState Session::State() const
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    return m_State;
}

void Session::SetStateLocked(SessionState s, std::exception_ptr error)
{
    m_State = s;
    m_Device.State = s;
    if (s == SS_ERROR || s == SS_DISCONNECTED)
        m_Bus.ReleaseDevice(m_DeviceId, m_Id);
    Event e(EV_STATE_CHANGED, m_Id, m_DeviceId);
    e.State = s;
    if (error) {
        e.Error = error;
        e.Message = DescribeException(error);
    }
    // Published with the lock held, so events leave in the order the
    // state changed.
    m_Bus.Publish(e);
    m_StateCond.notify_all();
}

bool Session::AdvanceState(SessionState s, std::exception_ptr error)
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    if (m_State == SS_CLOSING)
        return false;
    SetStateLocked(s, error);
    return true;
}

std::future<void> Session::Connect(unsigned timeout_ms)
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    switch (m_State) {
    case SS_CONNECTING:
    case SS_CONNECTED:
    case SS_AUTHENTICATING:
        throw AlreadyConnectingError("Session::Connect", m_DeviceId);
    case SS_READY:
    case SS_CLOSING:
        throw SessionStateError("Session::Connect",
                                std::string("session is ") + ToString(m_State));
    default:
        break;
    }
    if (! m_Bus.ClaimDevice(m_DeviceId, m_Id))
        throw AlreadyConnectingError("Session::Connect",
                                     m_DeviceId + " is in use by another session");

    SetStateLocked(SS_CONNECTING);
    CancelToken cancel;
    auto task = std::make_shared<std::packaged_task<void()> >(
        [this, timeout_ms, cancel]() { RunConnect(timeout_ms, cancel); });
    std::future<void> result = task->get_future();
    Task t;
    t.Run = [task]() { (*task)(); };
    t.Cancel = cancel;
    m_Queue.push_back(t);
    lock.unlock();
    m_QueueCond.notify_all();
    return result;
}

void Session::RunConnect(unsigned timeout_ms, const CancelToken &cancel)
{
    const char *who = "Session::Connect";
    IoContext ctx(timeout_ms, cancel);
    try {
        ctx.Check(who);
        LogLine(*m_LogStream) << "Session " << m_Id << ": connecting to "
                              << GetDevice() << "\n";
        m_Transport->Connect(ctx);
        if (! AdvanceState(SS_CONNECTED) || ! AdvanceState(SS_AUTHENTICATING))
            throw CancelledError(who, "session closed");

        DeviceIdentity id = m_Transport->Identify(ctx);
        if (! IsSupportedModel(id.Model))
            throw UnsupportedDeviceError(who, "'" + id.Model + "' is not a Garmin Edge");
        {
            std::unique_lock<std::mutex> lock(m_Mutex);
            m_Device.Model = id.Model;
            m_Device.Firmware = id.Firmware;
        }
        if (! AdvanceState(SS_READY))
            throw CancelledError(who, "session closed");
        LogLine(*m_LogStream) << "Session " << m_Id << ": ready, "
                              << GetDevice() << "\n";
    }
    catch (const std::exception &e) {
        LogLine(*m_LogStream) << "Session " << m_Id << ": " << e.what() << "\n";
        m_Transport->Disconnect();
        AdvanceState(SS_ERROR, std::current_exception());
        throw;
    }
}

void Session::Close()
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    if (m_State == SS_DISCONNECTED)
        return;
    if (m_State == SS_CLOSING) {
        // Someone else is closing, wait for them
        m_StateCond.wait(lock, [this]() { return m_State == SS_DISCONNECTED; });
        return;
    }

    LogLine(*m_LogStream) << "Session " << m_Id << ": closing\n";
    SetStateLocked(SS_CLOSING);
    for (auto i = m_Queue.begin(); i != m_Queue.end(); ++i)
        i->Cancel.Cancel();
    if (m_HasRunning)
        m_Running.Cancel();

    // Releasing the transport is queued behind the cancelled operations,
    // so it runs after they finished.
    auto task = std::make_shared<std::packaged_task<void()> >(
        [this]() {
            m_Transport->Disconnect();
            std::unique_lock<std::mutex> l(m_Mutex);
            SetStateLocked(SS_DISCONNECTED);
        });
    std::future<void> done = task->get_future();
    Task t;
    t.Run = [task]() { (*task)(); };
    m_Queue.push_back(t);
    lock.unlock();
    m_QueueCond.notify_all();
    done.get();
}

void Session::Enqueue(const std::string &what, bool requires_ready,
                      const CancelToken &cancel, const std::function<void()> &run)
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    if (requires_ready && m_State != SS_READY)
        throw SessionStateError(what, std::string("session is ") + ToString(m_State));
    Task t;
    t.Run = run;
    t.Cancel = cancel;
    m_Queue.push_back(t);
    lock.unlock();
    m_QueueCond.notify_all();
}

std::exception_ptr Session::CheckRunnable(const std::string &what, const CancelToken &cancel)
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    if (cancel.IsCancelled())
        return std::make_exception_ptr(CancelledError(what, "cancelled before it started"));
    if (m_State != SS_READY)
        return std::make_exception_ptr(
            SessionStateError(what, std::string("session is ") + ToString(m_State)));
    return std::exception_ptr();
}

void Session::WorkerLoop()
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    for (;;) {
        m_QueueCond.wait(lock, [this]() { return m_StopWorker || ! m_Queue.empty(); });
        if (m_Queue.empty())
            break;                      // stopping, and nothing left to do
        Task t = m_Queue.front();
        m_Queue.pop_front();
        m_Running = t.Cancel;
        m_HasRunning = true;
        lock.unlock();
        // Tasks are packaged, their exceptions go into their futures
        t.Run();
        lock.lock();
        m_HasRunning = false;
    }
}

};                                      // end namespace EdgeSync
