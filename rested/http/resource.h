#ifndef __RESTED_HTTP_RESOURCE_H__
#define __RESTED_HTTP_RESOURCE_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>
#include <vector>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/shared_ptr.hpp>

#include "http.h"

namespace Rested {
namespace HTTP {

class ServerRequest;
struct Range;

/// A resource exposed by an Endpoint
///
/// Optional capabilities are expressed by also deriving from Ranger,
/// DirectWriter or Renderable; they are discovered per request with
/// boost::dynamic_pointer_cast.
class Resource
{
public:
    typedef boost::shared_ptr<Resource> ptr;

public:
    virtual ~Resource() {}

    /// Opaque validator, unique per version of the content; compared by
    /// exact match
    virtual std::string eTag() const = 0;
    virtual boost::posix_time::ptime lastModified() const = 0;
    /// Caching duration; zero means no explicit freshness
    virtual boost::posix_time::time_duration ttl() const = 0;
};

/// Implemented by resources that support partial responses
///
/// range() is only called for a request with a valid, satisfiable Range
/// header; otherwise the request is processed as a normal Get.
class Ranger : public virtual Resource
{
public:
    typedef boost::shared_ptr<Ranger> ptr;

public:
    /// Supported range units, in order; advertised in Accept-Ranges
    virtual std::vector<std::string> units() const = 0;
    /// Total number of units available
    virtual unsigned long long count() const = 0;
    /// @param range Concrete, in-bounds span (first and last both set)
    /// @param contentRange Filled in with the span actually returned
    /// @return The part of the resource indicated by range
    virtual Resource::ptr range(const Range &range,
        ContentRange &contentRange) const = 0;
};

/// Implemented by resources that write the response on their own (streaming,
/// custom headers).  Validators and Vary have already been staged when
/// write() is called; the resource is responsible for committing and
/// finishing the request.
class DirectWriter : public virtual Resource
{
public:
    typedef boost::shared_ptr<DirectWriter> ptr;

public:
    virtual void write(boost::shared_ptr<ServerRequest> request) = 0;
};

/// Implemented by resources that can produce their own representations;
/// used by DefaultMarshaler
class Renderable : public virtual Resource
{
public:
    typedef boost::shared_ptr<Renderable> ptr;

public:
    /// Media types this resource can be rendered as, most preferred first
    virtual std::vector<std::string> mediaTypes() const = 0;
    virtual std::string render(const std::string &mediaType) const = 0;
};

}}

#endif
