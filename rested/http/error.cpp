// Copyright (c) 2009 - Mozy, Inc.

#include "error.h"

#include <sstream>

#include "rested/assert.h"
#include "server.h"

namespace Rested {
namespace HTTP {

const char *
StatusException::what() const throw()
{
    if (m_message.empty())
        return reason(m_status);
    return m_message.c_str();
}

MethodNotAllowedException::MethodNotAllowedException(const std::string &method,
    const std::vector<std::string> &allowed)
    : StatusException(METHOD_NOT_ALLOWED, "Method " + method +
        " not allowed; allowed: " + Rested::join(allowed, ", ")),
      m_allowed(allowed)
{}

void
MethodNotAllowedException::headers(Response &response) const
{
    response.entity.allow = m_allowed;
}

UnsupportedMediaTypeException::UnsupportedMediaTypeException(
    const std::vector<std::string> &supported)
    : StatusException(UNSUPPORTED_MEDIA_TYPE,
        "Unsupported media type; supported: " +
        Rested::join(supported, ", ")),
      m_supported(supported)
{}

static std::string
unsatisfiableMessage(const std::string &unit, unsigned long long count)
{
    std::ostringstream os;
    os << "Requested range not satisfiable; " << count << " " << unit
        << " available";
    return os.str();
}

RangeNotSatisfiableException::RangeNotSatisfiableException(
    const std::string &unit, unsigned long long count)
    : StatusException(REQUESTED_RANGE_NOT_SATISFIABLE,
        unsatisfiableMessage(unit, count)),
      m_unit(unit),
      m_count(count)
{}

void
RangeNotSatisfiableException::headers(Response &response) const
{
    response.entity.contentRange = ContentRange(m_unit, ~0ull, ~0ull,
        m_count);
}

void
respondError(ServerRequest::ptr request, const StatusException &exception)
{
    Response &response = request->response();
    Version ver = response.status.ver;
    response = Response();
    response.status.ver = ver;
    exception.headers(response);
    respondError(request, exception.status(), exception.what(), false);
}

}}
