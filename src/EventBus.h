#pragma once

#include "Device.h"

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <iosfwd>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <stdint.h>

namespace EdgeSync {

enum EventType {
    EV_STATE_CHANGED,
    EV_LISTING_COMPLETE,
    EV_LISTING_FAILED,
    EV_TRANSFER_QUEUED,
    EV_TRANSFER_PROGRESS,
    EV_TRANSFER_COMPLETE,
    EV_TRANSFER_FAILED
};

const char* ToString(EventType t);

/** Something that happened in a session.  Only the fields relevant to the
 * event type are filled in. */
struct Event
{
    Event();
    Event(EventType type, unsigned session_id, const std::string &device_id);

    EventType Type;
    unsigned SessionId;
    std::string DeviceId;

    SessionState State;                 // EV_STATE_CHANGED
    std::vector<FileEntry> Entries;     // EV_LISTING_COMPLETE

    unsigned JobId;                     // EV_TRANSFER_*
    std::string Path;                   // remote path for transfers
    std::string Destination;
    uint64_t BytesTransferred;
    uint64_t TotalBytes;

    /** The failure, for EV_LISTING_FAILED, EV_TRANSFER_FAILED and
     * EV_STATE_CHANGED into SS_ERROR. */
    std::exception_ptr Error;
    std::string Message;
};

std::ostream& operator<<(std::ostream &o, const Event &e);

typedef std::function<void(const Event&)> EventHandler;

/** Deliver events to subscribers on a dispatcher thread.  Events are
 * delivered one at a time, in the order they were published, so the
 * events of one session arrive in the order the session produced them.
 */
class EventBus
{
public:
    explicit EventBus(std::ostream *log_stream = nullptr);

    /** Deliver the events still queued, then stop the dispatcher. */
    ~EventBus();

    /** Add a handler, return an id for Unsubscribe().  The handler only
     * sees events published after this call. */
    unsigned Subscribe(const EventHandler &handler);

    /** Remove a handler.  Can be called from inside a handler.  After it
     * returns the handler is not called again, unless it is the handler
     * currently running on the dispatcher thread. */
    void Unsubscribe(unsigned id);

    void Publish(const Event &e);

    /** Block until all events published so far have been delivered.  Must
     * not be called from a handler. */
    void WaitIdle();

    /** Record that session 'session_id' is connecting to, or connected
     * to, device 'device_id'.  Return false if another session already
     * holds the device.  Sessions publishing on the same bus use this so
     * that only one of them talks to a device at a time. */
    bool ClaimDevice(const std::string &device_id, unsigned session_id);

    /** Drop the claim of 'session_id' on 'device_id', if it holds one. */
    void ReleaseDevice(const std::string &device_id, unsigned session_id);

private:
    EventBus(const EventBus&);
    EventBus& operator=(const EventBus&);

    void Run();

    std::ostream *m_LogStream;

    std::mutex m_Mutex;
    std::condition_variable m_QueueCond;
    std::condition_variable m_IdleCond;
    std::deque<std::pair<Event, uint64_t> > m_Queue;  // event, sequence
    std::map<unsigned, std::pair<EventHandler, uint64_t> > m_Handlers;
    unsigned m_NextHandlerId;
    uint64_t m_NextSequence;
    bool m_Busy;
    bool m_Stop;

    std::mutex m_ClaimMutex;
    std::map<std::string, unsigned> m_Claims;   // device id -> session id

    std::thread m_Thread;
};

};                                      // end namespace EdgeSync

/*
    Local Variables:
    mode: c++
    End:
*/
