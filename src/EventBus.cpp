#include "EventBus.h"
#include "Tools.h"

#include <iostream>

namespace EdgeSync {

const char* ToString(EventType t)
{
    switch (t) {
    case EV_STATE_CHANGED: return "StateChanged";
    case EV_LISTING_COMPLETE: return "ListingComplete";
    case EV_LISTING_FAILED: return "ListingFailed";
    case EV_TRANSFER_QUEUED: return "TransferQueued";
    case EV_TRANSFER_PROGRESS: return "TransferProgress";
    case EV_TRANSFER_COMPLETE: return "TransferComplete";
    case EV_TRANSFER_FAILED: return "TransferFailed";
    default: return "unknown";
    }
}

Event::Event()
    : Type(EV_STATE_CHANGED),
      SessionId(0),
      State(SS_DISCONNECTED),
      JobId(0),
      BytesTransferred(0),
      TotalBytes(0)
{
}

Event::Event(EventType type, unsigned session_id, const std::string &device_id)
    : Type(type),
      SessionId(session_id),
      DeviceId(device_id),
      State(SS_DISCONNECTED),
      JobId(0),
      BytesTransferred(0),
      TotalBytes(0)
{
}

std::ostream& operator<<(std::ostream &o, const Event &e)
{
    o << ToString(e.Type) << " session " << e.SessionId << " (" << e.DeviceId << ")";
    switch (e.Type) {
    case EV_STATE_CHANGED:
        o << ": " << ToString(e.State);
        break;
    case EV_LISTING_COMPLETE:
        o << ": " << e.Entries.size() << " files";
        break;
    case EV_TRANSFER_QUEUED:
    case EV_TRANSFER_COMPLETE:
        o << ": job " << e.JobId << ", " << e.Path << " -> " << e.Destination;
        break;
    case EV_TRANSFER_PROGRESS:
        o << ": job " << e.JobId << ", " << e.BytesTransferred << " of " << e.TotalBytes;
        break;
    case EV_LISTING_FAILED:
    case EV_TRANSFER_FAILED:
        if (e.JobId)
            o << ": job " << e.JobId;
        break;
    }
    if (! e.Message.empty())
        o << ", " << e.Message;
    return o;
}


// ........................................................... EventBus ....

EventBus::EventBus(std::ostream *log_stream)
    : m_LogStream(log_stream ? log_stream : &std::cerr),
      m_NextHandlerId(1),
      m_NextSequence(0),
      m_Busy(false),
      m_Stop(false)
{
    m_Thread = std::thread([this]() { Run(); });
}

EventBus::~EventBus()
{
    {
        std::unique_lock<std::mutex> lock(m_Mutex);
        m_Stop = true;
    }
    m_QueueCond.notify_all();
    m_Thread.join();
}

unsigned EventBus::Subscribe(const EventHandler &handler)
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    unsigned id = m_NextHandlerId++;
    m_Handlers[id] = std::make_pair(handler, m_NextSequence);
    return id;
}

void EventBus::Unsubscribe(unsigned id)
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    m_Handlers.erase(id);
}

void EventBus::Publish(const Event &e)
{
    {
        std::unique_lock<std::mutex> lock(m_Mutex);
        m_Queue.push_back(std::make_pair(e, m_NextSequence++));
    }
    m_QueueCond.notify_one();
}

void EventBus::WaitIdle()
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    m_IdleCond.wait(lock, [this]() { return m_Queue.empty() && ! m_Busy; });
}

bool EventBus::ClaimDevice(const std::string &device_id, unsigned session_id)
{
    std::unique_lock<std::mutex> lock(m_ClaimMutex);
    auto i = m_Claims.find(device_id);
    if (i != m_Claims.end())
        return i->second == session_id;
    m_Claims[device_id] = session_id;
    return true;
}

void EventBus::ReleaseDevice(const std::string &device_id, unsigned session_id)
{
    std::unique_lock<std::mutex> lock(m_ClaimMutex);
    auto i = m_Claims.find(device_id);
    if (i != m_Claims.end() && i->second == session_id)
        m_Claims.erase(i);
}

void EventBus::Run()
{
    std::unique_lock<std::mutex> lock(m_Mutex);
    for (;;) {
        m_QueueCond.wait(lock, [this]() { return m_Stop || ! m_Queue.empty(); });
        if (m_Queue.empty()) {
            if (m_Stop)
                break;
            continue;
        }

        std::pair<Event, uint64_t> item = m_Queue.front();
        m_Queue.pop_front();
        m_Busy = true;

        // Handlers are called without holding the lock, so they can
        // publish, subscribe and unsubscribe.  The ids are collected first
        // and each one is looked up again before it is called.
        std::vector<unsigned> ids;
        for (auto i = m_Handlers.begin(); i != m_Handlers.end(); ++i) {
            if (i->second.second <= item.second)
                ids.push_back(i->first);
        }

        for (auto id = ids.begin(); id != ids.end(); ++id) {
            auto h = m_Handlers.find(*id);
            if (h == m_Handlers.end())
                continue;
            EventHandler handler = h->second.first;
            lock.unlock();
            try {
                handler(item.first);
            }
            catch (const std::exception &ex) {
                LogLine(*m_LogStream) << "EventBus: handler " << *id
                                      << " failed on " << item.first
                                      << ": " << ex.what() << "\n";
            }
            catch (...) {
                LogLine(*m_LogStream) << "EventBus: handler " << *id
                                      << " failed on " << item.first
                                      << ": unknown exception\n";
            }
            lock.lock();
        }

        m_Busy = false;
        if (m_Queue.empty())
            m_IdleCond.notify_all();
    }
}

};                                      // end namespace EdgeSync
