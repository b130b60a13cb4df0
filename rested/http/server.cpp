// Copyright (c) 2009 - Mozy, Inc.

#include "server.h"

#include <sstream>

#include "rested/assert.h"
#include "rested/streams/stream.h"

namespace Rested {
namespace HTTP {

static Logger::ptr g_log = Log::lookup("rested:http:server");

std::string
RouteVars::get(const std::string &key) const
{
    for (const_iterator it = m_vars.begin(); it != m_vars.end(); ++it) {
        if (it->first == key)
            return it->second;
    }
    return std::string();
}

bool
RouteVars::has(const std::string &key) const
{
    for (const_iterator it = m_vars.begin(); it != m_vars.end(); ++it) {
        if (it->first == key)
            return true;
    }
    return false;
}

ServerRequest::ServerRequest(const Request &request, Stream::ptr stream,
    const RouteVars &routeVars, Stream::ptr requestStream)
    : m_request(request),
      m_routeVars(routeVars),
      m_state(PENDING),
      m_stream(stream),
      m_requestStream(requestStream)
{
    RESTED_ASSERT(m_stream);
    RESTED_ASSERT(m_stream->supportsWrite());
    m_response.status.ver = m_request.requestLine.ver;
}

Stream::ptr
ServerRequest::requestStream()
{
    RESTED_ASSERT(hasRequestBody());
    return m_requestStream;
}

bool
ServerRequest::hasResponseBody() const
{
    if (stricmp(m_request.requestLine.method.c_str(), HEAD.c_str()) == 0)
        return false;
    Status status = m_response.status.status;
    return status >= 200 && status != NO_CONTENT && status != NOT_MODIFIED;
}

Stream::ptr
ServerRequest::responseStream()
{
    RESTED_ASSERT(hasResponseBody());
    RESTED_ASSERT(!complete());
    if (!committed())
        commit();
    return m_stream;
}

void
ServerRequest::finish()
{
    RESTED_ASSERT(!complete());
    if (!committed())
        commit();
    m_state = COMPLETE;
    m_stream->flush();
    RESTED_LOG_INFO(g_log) << this << " " << m_request.requestLine << " "
        << m_response.status.status;
}

void
ServerRequest::commit()
{
    RESTED_ASSERT(!committed());
    std::ostringstream os;
    os << m_response;
    std::string str = os.str();
    RESTED_LOG_DEBUG(g_log) << this << " " << str;
    writeAll(*m_stream, str);
    m_state = HEADERS;
}

void
respond(ServerRequest::ptr request, const std::string &body)
{
    RESTED_ASSERT(!request->committed());
    Response &response = request->response();
    Status status = response.status.status;
    if (status < 200 || status == NO_CONTENT || status == NOT_MODIFIED) {
        RESTED_ASSERT(body.empty());
        response.entity.contentLength = ~0ull;
    } else {
        response.entity.contentLength = body.size();
    }
    if (!body.empty() && request->hasResponseBody())
        writeAll(*request->responseStream(), body);
    request->finish();
}

void
respondError(ServerRequest::ptr request, Status status,
    const std::string &message, bool clearHeaders)
{
    RESTED_ASSERT(!request->committed());
    Response &response = request->response();
    if (clearHeaders) {
        Version ver = response.status.ver;
        response = Response();
        response.status.ver = ver;
    }
    response.status.status = status;
    response.status.reason.clear();
    response.entity.contentEncoding.clear();
    if (!message.empty())
        response.entity.contentType = "text/plain";
    else
        response.entity.contentType.clear();
    RESTED_LOG_INFO(g_log) << request.get() << " " << status << " "
        << reason(status) << ": " << message;
    respond(request, message);
}

}}
