#ifndef __RESTED_HTTP_NEGOTIATE_H__
#define __RESTED_HTTP_NEGOTIATE_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>

#include "resource.h"

namespace Rested {
namespace HTTP {

/// Produces the representation of a resource
class Marshaler
{
public:
    typedef boost::shared_ptr<Marshaler> ptr;

public:
    virtual ~Marshaler() {}

    /// @param accept The request's Accept header (possibly empty)
    /// @param contentType Set to the media type of the result
    /// @return The encoded representation
    /// @throws NotAcceptableException If there is no acceptable
    /// representation
    virtual std::string marshal(Resource::ptr resource,
        const std::string &accept, std::string &contentType) = 0;
};

/// Negotiates among the media types of a Renderable resource; resources that
/// are not Renderable are not acceptable
class DefaultMarshaler : public Marshaler
{
public:
    std::string marshal(Resource::ptr resource, const std::string &accept,
        std::string &contentType);
};

/// Selects the media type from available that accept prefers
///
/// q-values are honored; more specific media ranges take precedence over
/// "type/*", which takes precedence over "*/*".  Ties go to the earlier
/// entry in available.  An empty Accept accepts anything.
/// @return The selected media type, or an empty string if none is acceptable
std::string preferredMediaType(const std::string &accept,
    const std::vector<std::string> &available);

}}

#endif
