#ifndef __RESTED_HTTP_ERROR_H__
#define __RESTED_HTTP_ERROR_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>

#include "http.h"

namespace Rested {
namespace HTTP {

class ServerRequest;

/// Base of all the errors that map to an HTTP status
///
/// Operations throw these (with RESTED_THROW_EXCEPTION); EndpointServlet
/// translates them into a response with respondError().
struct StatusException : virtual Exception
{
public:
    StatusException(Status status, const std::string &message = std::string())
        : m_status(status),
          m_message(message)
    {}
    ~StatusException() throw() {}

    Status status() const { return m_status; }
    /// @return The message, or the reason phrase if none was given
    const char *what() const throw();

    /// Add any headers specific to this error to a freshly reset response
    virtual void headers(Response &response) const {}

private:
    Status m_status;
    std::string m_message;
};

struct BadRequestException : public StatusException
{
    BadRequestException(const std::string &message = std::string())
        : StatusException(BAD_REQUEST, message)
    {}
};

struct NotFoundException : public StatusException
{
    NotFoundException(const std::string &message = std::string())
        : StatusException(NOT_FOUND, message)
    {}
};

struct MethodNotAllowedException : public StatusException
{
public:
    MethodNotAllowedException(const std::string &method,
        const std::vector<std::string> &allowed);
    ~MethodNotAllowedException() throw() {}

    const std::vector<std::string> &allowed() const { return m_allowed; }
    void headers(Response &response) const;

private:
    std::vector<std::string> m_allowed;
};

struct NotAcceptableException : public StatusException
{
    NotAcceptableException(const std::string &message = std::string())
        : StatusException(NOT_ACCEPTABLE, message)
    {}
};

struct ConflictException : public StatusException
{
    ConflictException(const std::string &message = std::string())
        : StatusException(CONFLICT, message)
    {}
};

struct PreconditionFailedException : public StatusException
{
    PreconditionFailedException(const std::string &message = std::string())
        : StatusException(PRECONDITION_FAILED, message)
    {}
};

struct UnsupportedMediaTypeException : public StatusException
{
public:
    /// @param supported The media types that would have been accepted
    UnsupportedMediaTypeException(const std::vector<std::string> &supported);
    ~UnsupportedMediaTypeException() throw() {}

    const std::vector<std::string> &supported() const { return m_supported; }

private:
    std::vector<std::string> m_supported;
};

struct RangeNotSatisfiableException : public StatusException
{
public:
    RangeNotSatisfiableException(const std::string &unit,
        unsigned long long count);
    ~RangeNotSatisfiableException() throw() {}

    const std::string &unit() const { return m_unit; }
    unsigned long long count() const { return m_count; }
    /// Content-Range: <unit> */<count>
    void headers(Response &response) const;

private:
    std::string m_unit;
    unsigned long long m_count;
};

/// Respond to request according to a StatusException
void respondError(boost::shared_ptr<ServerRequest> request,
    const StatusException &exception);

}}

#endif
