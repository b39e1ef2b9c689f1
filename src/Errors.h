#pragma once

#include <exception>
#include <string>

namespace EdgeSync {

/** Base class for errors reported by the device connection core.  The
 * message is built from a "who" part (the operation which failed) and a
 * description, the same way UnixException formats its messages. */
class EdgeSyncError : public std::exception
{
public:
    EdgeSyncError(const std::string &who, const std::string &message);
    virtual ~EdgeSyncError();

    const char* what() const noexcept(true) override;

    const std::string& Who() const { return m_Who; }
    const std::string& Message() const { return m_Message; }

protected:
    /** Short name of the error kind, e.g. "transport error" */
    virtual const char* Kind() const = 0;

private:
    std::string m_Who;
    std::string m_Message;
    mutable std::string m_What;
    mutable bool m_WhatDone;
};

/** Connection or read failure on the device link.  These are transient and
 * can be retried. */
class TransportError : public EdgeSyncError
{
public:
    TransportError(const std::string &who, const std::string &message);
protected:
    const char* Kind() const override { return "transport error"; }
};

/** The device did not identify as a supported Garmin Edge model. */
class UnsupportedDeviceError : public EdgeSyncError
{
public:
    UnsupportedDeviceError(const std::string &who, const std::string &message);
protected:
    const char* Kind() const override { return "unsupported device"; }
};

/** Connect() was called while a connect on the same session is still in
 * progress, or while another session is connecting or connected to the
 * same device. */
class AlreadyConnectingError : public EdgeSyncError
{
public:
    AlreadyConnectingError(const std::string &who, const std::string &message);
protected:
    const char* Kind() const override { return "already connecting"; }
};

/** An operation was requested in a session state which does not allow
 * it. */
class SessionStateError : public EdgeSyncError
{
public:
    SessionStateError(const std::string &who, const std::string &message);
protected:
    const char* Kind() const override { return "bad session state"; }
};

/** The directory listing could not be retrieved from the device. */
class CatalogError : public EdgeSyncError
{
public:
    CatalogError(const std::string &who, const std::string &message);
protected:
    const char* Kind() const override { return "catalog error"; }
};

/** Downloaded data does not match what the device advertised. */
class IntegrityError : public EdgeSyncError
{
public:
    IntegrityError(const std::string &who, const std::string &message);
protected:
    const char* Kind() const override { return "integrity error"; }
};

/** An operation did not complete within its time limit. */
class TimeoutError : public EdgeSyncError
{
public:
    TimeoutError(const std::string &who, const std::string &message);
protected:
    const char* Kind() const override { return "timeout"; }
};

/** An operation was cancelled by the caller, or by closing its session. */
class CancelledError : public EdgeSyncError
{
public:
    CancelledError(const std::string &who, const std::string &message);
protected:
    const char* Kind() const override { return "cancelled"; }
};

/** Return the message of the exception held in 'e', for logging and event
 * reporting. */
std::string DescribeException(std::exception_ptr e);

};                                      // end namespace EdgeSync

/*
    Local Variables:
    mode: c++
    End:
*/
