// Copyright (c) 2009 - Mozy, Inc.

#include "conditions.h"

#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>

#include "rested/log.h"
#include "rested/string.h"
#include "http.h"
#include "resource.h"

namespace Rested {
namespace HTTP {

static Logger::ptr g_log = Log::lookup("rested:http:conditions");

// HTTP dates only carry seconds
static boost::posix_time::ptime
lastModified(const Resource &resource)
{
    boost::posix_time::ptime result = resource.lastModified();
    if (result.is_special())
        return result;
    boost::posix_time::time_duration time = result.time_of_day();
    return boost::posix_time::ptime(result.date(),
        boost::posix_time::time_duration(time.hours(), time.minutes(),
            time.seconds()));
}

bool
writeConflict(const Resource &resource, const Request &request)
{
    const RequestHeaders &headers = request.request;
    boost::posix_time::ptime modified = lastModified(resource);
    boost::posix_time::ptime ifUnmodifiedSince =
        parseHttpDate(headers.ifUnmodifiedSince);
    if (!ifUnmodifiedSince.is_special() && !modified.is_special() &&
        ifUnmodifiedSince < modified) {
        RESTED_LOG_VERBOSE(g_log) << "If-Unmodified-Since "
            << headers.ifUnmodifiedSince << " precedes " << modified;
        return true;
    }
    if (!headers.ifMatch.empty() && headers.ifMatch != resource.eTag()) {
        RESTED_LOG_VERBOSE(g_log) << "If-Match " << headers.ifMatch
            << " != " << resource.eTag();
        return true;
    }
    return false;
}

bool
notModified(const Resource &resource, const Request &request)
{
    const RequestHeaders &headers = request.request;
    boost::posix_time::ptime modified = lastModified(resource);
    boost::posix_time::ptime ifModifiedSince =
        parseHttpDate(headers.ifModifiedSince);
    if (!ifModifiedSince.is_special() && !modified.is_special() &&
        ifModifiedSince >= modified)
        return true;

    std::string eTag = resource.eTag();
    std::vector<std::string> entries = split(headers.ifNoneMatch, ';');
    for (std::vector<std::string>::const_iterator it(entries.begin());
        it != entries.end();
        ++it) {
        std::string entry = trim(*it);
        if (!entry.empty() && entry == eTag)
            return true;
    }
    return false;
}

bool
ifRangeSatisfied(const Resource &resource, const Request &request)
{
    const std::string &ifRange = request.request.ifRange;
    if (ifRange.empty())
        return true;
    if (ifRange == resource.eTag())
        return true;
    boost::posix_time::ptime date = parseHttpDate(ifRange);
    boost::posix_time::ptime modified = lastModified(resource);
    return !date.is_special() && !modified.is_special() && date == modified;
}

}}
