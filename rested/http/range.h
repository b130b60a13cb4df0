#ifndef __RESTED_HTTP_RANGE_H__
#define __RESTED_HTTP_RANGE_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>

#include <boost/shared_ptr.hpp>

#include "resource.h"

namespace Rested {
namespace HTTP {

class ServerRequest;

/// A single range from a Range header ("bytes=0-499", "bytes=500-",
/// "bytes=-500")
///
/// first == ~0ull means a suffix range: the last @c last units.
/// last == ~0ull means everything from first to the end.
struct Range
{
    Range(const std::string &unit_ = "bytes",
        unsigned long long first_ = ~0ull,
        unsigned long long last_ = ~0ull)
        : unit(unit_),
          first(first_),
          last(last_)
    {}

    std::string unit;
    unsigned long long first;
    unsigned long long last;

    bool operator==(const Range &rhs) const
    {
        return unit == rhs.unit && first == rhs.first && last == rhs.last;
    }
    bool operator!=(const Range &rhs) const
    {
        return !(*this == rhs);
    }
};

/// Parses a single range; lists of ranges are not supported
/// @return false if str is not a valid single range
bool parseRange(const std::string &str, Range &range);

/// Matches range.unit case-insensitively against ranger's units(), and
/// replaces it with the ranger's own spelling
/// @return false if the unit is not one of ranger's units(), or the span is
/// out of order
bool validate(Range &range, const Ranger &ranger);

/// Resolves suffix and open ended forms against ranger.count(), and clamps
/// last to the final unit
/// @throws RangeNotSatisfiableException if no part of range exists
void adjust(Range &range, const Ranger &ranger);

/// Applies the request's Range and If-Range headers to ranger
///
/// Always sets Accept-Ranges.  When a Range header is present, Vary: Range
/// is added, and malformed ranges or a failed If-Range fall back to the full
/// resource.  Content-Range is set only if the result is a strict subset.
/// @return The partial resource, or ranger itself for a full response
/// @throws RangeNotSatisfiableException from adjust()
/// @throws std::logic_error if ranger->range() returns NULL
Resource::ptr negotiateRange(boost::shared_ptr<ServerRequest> request,
    Ranger::ptr ranger);

std::ostream& operator<<(std::ostream& os, const Range &r);

}}

#endif
