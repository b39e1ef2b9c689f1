#include "Errors.h"

#include <sstream>

namespace EdgeSync {

EdgeSyncError::EdgeSyncError(const std::string &who, const std::string &message)
    : m_Who(who),
      m_Message(message),
      m_WhatDone(false)
{
    // empty
}

EdgeSyncError::~EdgeSyncError()
{
    // empty
}

const char* EdgeSyncError::what() const noexcept(true)
{
    if (! m_WhatDone) {
        std::ostringstream msg;
        msg << m_Who << ": " << Kind();
        if (! m_Message.empty())
            msg << ", " << m_Message;
        m_What = msg.str();
        m_WhatDone = true;
    }
    return m_What.c_str();
}

TransportError::TransportError(const std::string &who, const std::string &message)
    : EdgeSyncError(who, message)
{
}

UnsupportedDeviceError::UnsupportedDeviceError(const std::string &who, const std::string &message)
    : EdgeSyncError(who, message)
{
}

AlreadyConnectingError::AlreadyConnectingError(const std::string &who, const std::string &message)
    : EdgeSyncError(who, message)
{
}

SessionStateError::SessionStateError(const std::string &who, const std::string &message)
    : EdgeSyncError(who, message)
{
}

CatalogError::CatalogError(const std::string &who, const std::string &message)
    : EdgeSyncError(who, message)
{
}

IntegrityError::IntegrityError(const std::string &who, const std::string &message)
    : EdgeSyncError(who, message)
{
}

TimeoutError::TimeoutError(const std::string &who, const std::string &message)
    : EdgeSyncError(who, message)
{
}

CancelledError::CancelledError(const std::string &who, const std::string &message)
    : EdgeSyncError(who, message)
{
}

std::string DescribeException(std::exception_ptr e)
{
    if (! e)
        return std::string();
    try {
        std::rethrow_exception(e);
    }
    catch (const std::exception &ex) {
        return ex.what();
    }
    catch (...) {
        return "unknown exception";
    }
}

};                                      // end namespace EdgeSync
