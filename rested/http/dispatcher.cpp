// Copyright (c) 2009 - Mozy, Inc.

#include "dispatcher.h"

#include <boost/bind.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/pointer_cast.hpp>

#include "rested/assert.h"
#include "rested/config.h"
#include "conditions.h"
#include "error.h"
#include "range.h"
#include "server.h"
#include "writer.h"

namespace Rested {
namespace HTTP {

static ConfigVar<std::string>::ptr g_alternatives =
    Config::lookup<std::string>("http.alternatives",
    std::string("application/json;text/xml;application/xml"),
    "Representations advertised in the Content-Type of OPTIONS responses; "
    "separated by ;");

static Logger::ptr g_log = Log::lookup("rested:http:dispatcher");

static void
get(Getter::ptr getter, Marshaler::ptr marshaler, Compressor::ptr compressor,
    ServerRequest::ptr request)
{
    Resource::ptr resource = getter->get(request->routeVars(), request);
    if (!resource) {
        request->response().status.status = NO_CONTENT;
        respond(request, std::string());
        return;
    }
    Ranger::ptr ranger = boost::dynamic_pointer_cast<Ranger>(resource);
    if (ranger) {
        // 304 wins over any range processing
        if (notModified(*resource, request->request()))
            request->response().response.acceptRanges = ranger->units();
        else
            resource = negotiateRange(request, ranger);
    }
    writeResource(request, resource, marshaler, compressor);
}

static void
patch(Patcher::ptr patcher, Marshaler::ptr marshaler,
    Compressor::ptr compressor, ServerRequest::ptr request)
{
    Resource::ptr resource = patcher->patch(request->routeVars(), request);
    if (!resource) {
        request->response().status.status = OK;
        respond(request, std::string());
        return;
    }
    writeResource(request, resource, marshaler, compressor);
}

static void
put(Putter::ptr putter, Marshaler::ptr marshaler, Compressor::ptr compressor,
    ServerRequest::ptr request)
{
    Resource::ptr resource = putter->put(request->routeVars(), request);
    if (!resource) {
        request->response().status.status = OK;
        respond(request, std::string());
        return;
    }
    writeResource(request, resource, marshaler, compressor);
}

static void
post(Poster::ptr poster, Marshaler::ptr marshaler, Compressor::ptr compressor,
    ServerRequest::ptr request)
{
    std::string location;
    Resource::ptr resource = poster->post(request->routeVars(), request,
        location);
    if (!location.empty())
        request->response().response.location = location;
    if (!resource) {
        request->response().status.status = CREATED;
        respond(request, std::string());
        return;
    }
    writeResource(request, resource, marshaler, compressor);
}

static void
del(Deleter::ptr deleter, ServerRequest::ptr request)
{
    deleter->del(request->routeVars(), request);
    request->response().status.status = NO_CONTENT;
    respond(request, std::string());
}

DispatchTable
dispatchTable(Endpoint::ptr endpoint, Marshaler::ptr marshaler,
    Compressor::ptr compressor)
{
    DispatchTable table;
    Getter::ptr getter = boost::dynamic_pointer_cast<Getter>(endpoint);
    if (getter) {
        boost::function<void (ServerRequest::ptr)> handler =
            boost::bind(&get, getter, marshaler, compressor, _1);
        table.push_back(MethodHandler(HEAD, handler));
        table.push_back(MethodHandler(GET, handler));
    }
    Patcher::ptr patcher = boost::dynamic_pointer_cast<Patcher>(endpoint);
    if (patcher)
        table.push_back(MethodHandler(PATCH,
            boost::bind(&patch, patcher, marshaler, compressor, _1)));
    Putter::ptr putter = boost::dynamic_pointer_cast<Putter>(endpoint);
    if (putter)
        table.push_back(MethodHandler(PUT,
            boost::bind(&put, putter, marshaler, compressor, _1)));
    Poster::ptr poster = boost::dynamic_pointer_cast<Poster>(endpoint);
    if (poster)
        table.push_back(MethodHandler(POST,
            boost::bind(&post, poster, marshaler, compressor, _1)));
    Deleter::ptr deleter = boost::dynamic_pointer_cast<Deleter>(endpoint);
    if (deleter)
        table.push_back(MethodHandler(DELETE,
            boost::bind(&del, deleter, _1)));
    return table;
}

static std::vector<std::string>
methods(const DispatchTable &table)
{
    std::vector<std::string> result;
    for (DispatchTable::const_iterator it(table.begin());
        it != table.end();
        ++it)
        result.push_back(it->method);
    return result;
}

std::vector<std::string>
allowedMethods(Endpoint::ptr endpoint)
{
    return methods(dispatchTable(endpoint, Marshaler::ptr(),
        Compressor::ptr()));
}

EndpointServlet::EndpointServlet(Endpoint::ptr endpoint,
    Marshaler::ptr marshaler, Compressor::ptr compressor)
    : m_endpoint(endpoint),
      m_marshaler(marshaler),
      m_compressor(compressor)
{
    RESTED_ASSERT(m_endpoint);
    RESTED_ASSERT(m_marshaler);
}

void
EndpointServlet::request(ServerRequest::ptr request)
{
    try {
        dispatch(request);
    } catch (StatusException &ex) {
        if (request->committed()) {
            RESTED_LOG_ERROR(g_log) << request.get()
                << " error after response was committed: "
                << boost::diagnostic_information(ex);
            throw;
        }
        respondError(request, ex);
    } catch (std::exception &ex) {
        RESTED_LOG_ERROR(g_log) << request.get() << " "
            << request->request().requestLine << ": "
            << boost::diagnostic_information(ex);
        if (request->committed())
            throw;
        respondError(request, INTERNAL_SERVER_ERROR,
            reason(INTERNAL_SERVER_ERROR));
    }
}

void
EndpointServlet::dispatch(ServerRequest::ptr request)
{
    const std::string &method = request->request().requestLine.method;
    DispatchTable table = dispatchTable(m_endpoint, m_marshaler,
        m_compressor);
    if (stricmp(method.c_str(), OPTIONS.c_str()) == 0) {
        options(request, table);
        return;
    }
    for (DispatchTable::const_iterator it(table.begin());
        it != table.end();
        ++it) {
        if (stricmp(it->method.c_str(), method.c_str()) == 0) {
            RESTED_LOG_DEBUG(g_log) << request.get() << " dispatching "
                << it->method << " " << request->request().requestLine.uri;
            it->handler(request);
            return;
        }
    }
    if (table.empty()) {
        RESTED_LOG_DEBUG(g_log) << request.get() << " endpoint implements no "
            << "methods";
        RESTED_THROW_EXCEPTION(NotFoundException());
    }
    RESTED_LOG_DEBUG(g_log) << request.get() << " " << method
        << " not implemented";
    RESTED_THROW_EXCEPTION(MethodNotAllowedException(method, methods(table)));
}

void
EndpointServlet::options(ServerRequest::ptr request,
    const DispatchTable &table)
{
    Response &response = request->response();
    response.status.status = NO_CONTENT;
    response.entity.allow = methods(table);
    std::vector<std::string> alternatives = split(g_alternatives->val(), ';');
    for (std::vector<std::string>::iterator it(alternatives.begin());
        it != alternatives.end();
        ++it)
        *it = trim(*it);
    response.entity.contentType = join(alternatives, ";");
    RESTED_LOG_DEBUG(g_log) << request.get() << " OPTIONS " << join(
        response.entity.allow, ", ");
    respond(request, std::string());
}

}}
