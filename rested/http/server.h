#ifndef __RESTED_HTTP_SERVER_H__
#define __RESTED_HTTP_SERVER_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <utility>

#include <boost/enable_shared_from_this.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include "http.h"

namespace Rested {

class Stream;

namespace HTTP {

/// Variables extracted from the request URI by the router, in the order the
/// router produced them
class RouteVars
{
public:
    typedef std::vector<std::pair<std::string, std::string> > list_type;
    typedef list_type::const_iterator const_iterator;

public:
    void add(const std::string &key, const std::string &value)
    { m_vars.push_back(std::make_pair(key, value)); }

    /// @return The first value for key, or an empty string
    std::string get(const std::string &key) const;
    bool has(const std::string &key) const;

    const_iterator begin() const { return m_vars.begin(); }
    const_iterator end() const { return m_vars.end(); }
    bool empty() const { return m_vars.empty(); }
    size_t size() const { return m_vars.size(); }

private:
    list_type m_vars;
};

/// A single request/response exchange
///
/// The hosting server (or a test) constructs a ServerRequest from an already
/// parsed Request, the stream the response will be written to, and the
/// RouteVars its router extracted.  The response is staged in response()
/// until it is committed; after that, changes to response() do nothing.
class ServerRequest : public boost::enable_shared_from_this<ServerRequest>, boost::noncopyable
{
public:
    typedef boost::shared_ptr<ServerRequest> ptr;
    typedef boost::shared_ptr<const ServerRequest> const_ptr;

    enum State {
        PENDING,
        HEADERS,
        COMPLETE
    };

public:
    /// @param stream Where the serialized response is written
    /// @param requestStream The request body, if any
    ServerRequest(const Request &request, boost::shared_ptr<Stream> stream,
        const RouteVars &routeVars = RouteVars(),
        boost::shared_ptr<Stream> requestStream = boost::shared_ptr<Stream>());

    const Request &request() const { return m_request; }
    const RouteVars &routeVars() const { return m_routeVars; }

    bool hasRequestBody() const { return m_requestStream.get() != NULL; }
    /// @pre hasRequestBody()
    boost::shared_ptr<Stream> requestStream();

    /// Response Headers
    ///
    /// Changes to the headers will not do anything if the response has already
    /// been committed().
    Response &response() { return m_response; }
    const Response &response() const { return m_response; }
    /// @return false for HEAD requests, and for statuses that never carry a
    /// body (1xx, 204, 304)
    bool hasResponseBody() const;

    /// A stream representing the response body
    ///
    /// The response headers will be automatically committed if they have not
    /// been committed already.
    /// @pre hasResponseBody()
    boost::shared_ptr<Stream> responseStream();

    bool committed() const { return m_state >= HEADERS; }
    bool complete() const { return m_state == COMPLETE; }

    /// Commits the headers (if necessary), and marks the response complete
    void finish();

private:
    void commit();

private:
    Request m_request;
    Response m_response;
    RouteVars m_routeVars;
    State m_state;
    boost::shared_ptr<Stream> m_stream, m_requestStream;
};

// Helper functions
/// Respond with a complete body
///
/// Content-Length is set to the size of body (unless the status forbids a
/// body), and the body is written unless !hasResponseBody().
void respond(ServerRequest::ptr request, const std::string &body);

/// Respond with a status code
///
/// This will discard any headers already staged (unless clearHeaders is
/// false), except for the HTTP version.
/// @param message The message to be used as the body of the response
///                (Content-Type will be set to text/plain)
void respondError(ServerRequest::ptr request, Status status,
    const std::string &message = std::string(), bool clearHeaders = true);

}}

#endif
