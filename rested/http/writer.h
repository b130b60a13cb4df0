#ifndef __RESTED_HTTP_WRITER_H__
#define __RESTED_HTTP_WRITER_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <boost/shared_ptr.hpp>

#include "compression.h"
#include "negotiate.h"
#include "resource.h"

namespace Rested {
namespace HTTP {

class ServerRequest;

/// Writes the representation of resource as the response to request
///
/// In order:
///  * 304 (and nothing else) if notModified()
///  * Vary: Accept, Last-Modified, ETag and Expires (now + ttl())
///  * DirectWriter resources take over from here
///  * the body comes from marshaler, and is compressed if compressor (which
///    may be NULL) chooses an encoding
///  * 201 for POST, 204 for an empty body, 206 if a Content-Range has been
///    staged, otherwise 200
/// The body is not written for HEAD, but every header is the same as for GET.
/// @throws NotAcceptableException from marshaler
void writeResource(boost::shared_ptr<ServerRequest> request,
    Resource::ptr resource, Marshaler::ptr marshaler,
    Compressor::ptr compressor = Compressor::ptr());

}}

#endif
