#ifndef __RESTED_HTTP_CONDITIONS_H__
#define __RESTED_HTTP_CONDITIONS_H__
// Copyright (c) 2009 - Mozy, Inc.

namespace Rested {
namespace HTTP {

class Resource;
struct Request;

/// Detects a write conflict from If-Unmodified-Since and If-Match
///
/// Not invoked automatically; Patcher and Putter implementations call it
/// before applying a mutation:
/// @code
/// if (writeConflict(*resource, request->request()))
///     RESTED_THROW_EXCEPTION(PreconditionFailedException());
/// @endcode
/// @return true if If-Unmodified-Since is a valid date strictly earlier than
/// the resource's last modification, or if If-Match is set and differs from
/// the resource's ETag
bool writeConflict(const Resource &resource, const Request &request);

/// Cache revalidation (If-Modified-Since and If-None-Match)
/// @return true if the client's copy is current and 304 should be sent
bool notModified(const Resource &resource, const Request &request);

/// @return true if there is no If-Range, or if it names the resource's
/// current ETag or exactly its last modification date
bool ifRangeSatisfied(const Resource &resource, const Request &request);

}}

#endif
