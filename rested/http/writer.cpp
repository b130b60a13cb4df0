// Copyright (c) 2009 - Mozy, Inc.

#include "writer.h"

#include <algorithm>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/pointer_cast.hpp>

#include "rested/assert.h"
#include "conditions.h"
#include "server.h"

namespace Rested {
namespace HTTP {

static Logger::ptr g_log = Log::lookup("rested:http:writer");

static void
addVary(std::vector<std::string> &vary, const std::string &header,
    bool front = false)
{
    if (std::find(vary.begin(), vary.end(), header) != vary.end())
        return;
    if (front)
        vary.insert(vary.begin(), header);
    else
        vary.push_back(header);
}

void
writeResource(ServerRequest::ptr request, Resource::ptr resource,
    Marshaler::ptr marshaler, Compressor::ptr compressor)
{
    RESTED_ASSERT(resource);
    RESTED_ASSERT(marshaler);
    const Request &requestHeaders = request->request();
    Response &response = request->response();

    if (notModified(*resource, requestHeaders)) {
        RESTED_LOG_DEBUG(g_log) << request.get() << " not modified";
        response.status.status = NOT_MODIFIED;
        response.entity.contentRange = ContentRange();
        response.entity.contentType.clear();
        respond(request, std::string());
        return;
    }

    addVary(response.response.vary, "Accept", true);
    boost::posix_time::ptime lastModified = resource->lastModified();
    if (!lastModified.is_special())
        response.entity.lastModified = lastModified;
    response.response.eTag = resource->eTag();
    response.entity.expires =
        boost::posix_time::second_clock::universal_time() + resource->ttl();

    DirectWriter::ptr directWriter =
        boost::dynamic_pointer_cast<DirectWriter>(resource);
    if (directWriter) {
        RESTED_LOG_DEBUG(g_log) << request.get() << " handing off to "
            << directWriter.get();
        directWriter->write(request);
        if (!request->complete())
            request->finish();
        return;
    }

    std::string contentType;
    std::string body = marshaler->marshal(resource,
        requestHeaders.request.accept, contentType);
    response.entity.contentType = contentType;

    // Content-Range is in terms of the identity encoding
    if (compressor && !body.empty() &&
        !response.entity.contentRange.isDefined()) {
        std::string encoding = compressor->encoding(body,
            requestHeaders.request.acceptEncoding);
        if (!encoding.empty()) {
            body = compressor->encode(body, encoding);
            response.entity.contentEncoding.push_back(encoding);
            addVary(response.response.vary, "Accept-Encoding");
        }
    }

    if (stricmp(requestHeaders.requestLine.method.c_str(), POST.c_str()) == 0)
        response.status.status = CREATED;
    else if (body.empty())
        response.status.status = NO_CONTENT;
    else if (response.entity.contentRange.isDefined())
        response.status.status = PARTIAL_CONTENT;
    else
        response.status.status = OK;
    if (response.status.status == NO_CONTENT)
        response.entity.contentType.clear();
    RESTED_LOG_DEBUG(g_log) << request.get() << " " << response.status.status
        << " " << body.size() << " bytes of " << contentType;
    respond(request, body);
}

}}
