#ifndef __RESTED_HTTP_ENDPOINT_H__
#define __RESTED_HTTP_ENDPOINT_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>

#include <boost/shared_ptr.hpp>

#include "resource.h"

namespace Rested {
namespace HTTP {

class RouteVars;
class ServerRequest;

/// An access point exposing a resource; the operations it allows are the
/// capability interfaces below that it also derives from
class Endpoint
{
public:
    typedef boost::shared_ptr<Endpoint> ptr;

public:
    virtual ~Endpoint() {}
};

/// Allows GET and HEAD
class Getter : public virtual Endpoint
{
public:
    typedef boost::shared_ptr<Getter> ptr;

public:
    /// @return The resource, or NULL to respond 204 No Content
    virtual Resource::ptr get(const RouteVars &vars,
        boost::shared_ptr<ServerRequest> request) = 0;
};

/// Allows PATCH
class Patcher : public virtual Endpoint
{
public:
    typedef boost::shared_ptr<Patcher> ptr;

public:
    /// @return The patched resource, or NULL to respond 200 with no body
    virtual Resource::ptr patch(const RouteVars &vars,
        boost::shared_ptr<ServerRequest> request) = 0;
};

/// Allows PUT
class Putter : public virtual Endpoint
{
public:
    typedef boost::shared_ptr<Putter> ptr;

public:
    /// @return The modified resource, or NULL to respond 200 with no body
    virtual Resource::ptr put(const RouteVars &vars,
        boost::shared_ptr<ServerRequest> request) = 0;
};

/// Allows POST
class Poster : public virtual Endpoint
{
public:
    typedef boost::shared_ptr<Poster> ptr;

public:
    /// @param location Set to the URI of the created resource, if any
    /// @return The newly created resource, or NULL to respond 201 with no
    /// body
    virtual Resource::ptr post(const RouteVars &vars,
        boost::shared_ptr<ServerRequest> request, std::string &location) = 0;
};

/// Allows DELETE
class Deleter : public virtual Endpoint
{
public:
    typedef boost::shared_ptr<Deleter> ptr;

public:
    virtual void del(const RouteVars &vars,
        boost::shared_ptr<ServerRequest> request) = 0;
};

}}

#endif
