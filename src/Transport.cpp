#include "Transport.h"
#include "Errors.h"
#include "UsbTransport.h"
#include "BluetoothTransport.h"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace EdgeSync {


// .......................................................... IoContext ....

IoContext::IoContext(unsigned timeout_ms, const CancelToken &cancel)
    : m_HasDeadline(timeout_ms > 0),
      m_Deadline(std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms)),
      m_Cancel(cancel)
{
}

void IoContext::Check(const std::string &who) const
{
    if (m_Cancel.IsCancelled())
        throw CancelledError(who, "operation cancelled");
    if (m_HasDeadline && std::chrono::steady_clock::now() >= m_Deadline)
        throw TimeoutError(who, "deadline exceeded");
}

unsigned IoContext::RemainingMs() const
{
    if (! m_HasDeadline)
        return 0;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        m_Deadline - std::chrono::steady_clock::now()).count();
    return left < 1 ? 1 : static_cast<unsigned>(left);
}

void IoContext::Sleep(unsigned ms, const std::string &who) const
{
    // Sleep in small steps, so a cancellation is noticed quickly
    const unsigned step = 20;
    auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    if (m_HasDeadline && m_Deadline < until)
        until = m_Deadline;
    for (;;) {
        Check(who);
        auto now = std::chrono::steady_clock::now();
        if (now >= until)
            break;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - now);
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(step)));
    }
}


// .......................................................... Transport ....

Transport::~Transport()
{
    // empty
}

std::unique_ptr<Transport> MakeTransport(const Device &d, std::ostream *log_stream)
{
    switch (d.Kind) {
    case TRANSPORT_USB:
        return std::unique_ptr<Transport>(new UsbTransport(d, log_stream));
    case TRANSPORT_BLUETOOTH:
        return std::unique_ptr<Transport>(new BluetoothTransport(d, log_stream));
    }
    throw std::logic_error("MakeTransport -- bad transport kind");
}

};                                      // end namespace EdgeSync
