#ifndef __RESTED_HTTP_DISPATCHER_H__
#define __RESTED_HTTP_DISPATCHER_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>
#include <vector>

#include <boost/function.hpp>
#include <boost/shared_ptr.hpp>

#include "compression.h"
#include "endpoint.h"
#include "negotiate.h"
#include "servlet.h"

namespace Rested {
namespace HTTP {

class ServerRequest;

struct MethodHandler
{
    MethodHandler(const std::string &method_,
        boost::function<void (boost::shared_ptr<ServerRequest>)> handler_)
        : method(method_),
          handler(handler_)
    {}

    std::string method;
    boost::function<void (boost::shared_ptr<ServerRequest>)> handler;
};

/// The operations endpoint implements, in the canonical order HEAD, GET,
/// PATCH, PUT, POST, DELETE
typedef std::vector<MethodHandler> DispatchTable;

/// Binds each capability endpoint has to the method(s) it serves
///
/// HEAD and GET both bind Getter::get.  marshaler and compressor are used to
/// write the resources the operations return.
DispatchTable dispatchTable(Endpoint::ptr endpoint, Marshaler::ptr marshaler,
    Compressor::ptr compressor);

/// @return The methods endpoint implements, in canonical order (OPTIONS is
/// implicit, and not included)
std::vector<std::string> allowedMethods(Endpoint::ptr endpoint);

/// Serves every request for a single Endpoint
///
/// OPTIONS is answered without calling any operation.  Methods the endpoint
/// doesn't implement get 405 (or 404 if it implements none at all).  Errors
/// thrown by operations are translated with respondError(); anything other
/// than a StatusException is a 500.
class EndpointServlet : public Servlet
{
public:
    typedef boost::shared_ptr<EndpointServlet> ptr;

public:
    EndpointServlet(Endpoint::ptr endpoint,
        Marshaler::ptr marshaler = Marshaler::ptr(new DefaultMarshaler()),
        Compressor::ptr compressor = Compressor::ptr(new ZlibCompressor()));

    void request(boost::shared_ptr<ServerRequest> request);

    Endpoint::ptr endpoint() const { return m_endpoint; }

private:
    void dispatch(boost::shared_ptr<ServerRequest> request);
    void options(boost::shared_ptr<ServerRequest> request,
        const DispatchTable &table);

private:
    Endpoint::ptr m_endpoint;
    Marshaler::ptr m_marshaler;
    Compressor::ptr m_compressor;
};

}}

#endif
