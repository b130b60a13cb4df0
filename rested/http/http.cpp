// Copyright (c) 2009 - Mozy, Inc.

#include "http.h"

#include <stdio.h>
#include <string.h>

#include <algorithm>
#include <iostream>
#include <sstream>

#include <boost/bind.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include "rested/assert.h"

namespace Rested {
namespace HTTP {

static boost::posix_time::time_facet rfc1123Facet_out("%a, %d %b %Y %H:%M:%S GMT",
        boost::posix_time::time_facet::period_formatter_type(),
        boost::posix_time::time_facet::special_values_formatter_type(),
        boost::posix_time::time_facet::date_gen_formatter_type(),
        1 /* starting refcount, so this never gets deleted */);

static const char *weekdays[] =
    { "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat" };
static const char *months[] =
    { "Jan", "Feb", "Mar", "Apr", "May", "Jun",
      "Jul", "Aug", "Sep", "Oct", "Nov", "Dec" };

static std::ostream& operator<<(std::ostream& os, const std::vector<std::string>& list)
{
    for (std::vector<std::string>::const_iterator it(list.begin());
        it != list.end();
        ++it) {
        if (it != list.begin())
            os << ", ";
        os << *it;
    }
    return os;
}

const std::string GET("GET");
const std::string HEAD("HEAD");
const std::string PATCH("PATCH");
const std::string PUT("PUT");
const std::string POST("POST");
const std::string DELETE("DELETE");
const std::string OPTIONS("OPTIONS");

const char *reason(Status s)
{
    switch (s) {
        case CONTINUE:
            return "Continue";

        case OK:
            return "OK";
        case CREATED:
            return "Created";
        case ACCEPTED:
            return "Accepted";
        case NO_CONTENT:
            return "No Content";
        case PARTIAL_CONTENT:
            return "Partial Content";

        case MOVED_PERMANENTLY:
            return "Moved Permanently";
        case FOUND:
            return "Found";
        case SEE_OTHER:
            return "See Other";
        case NOT_MODIFIED:
            return "Not Modified";
        case TEMPORARY_REDIRECT:
            return "Temporary Redirect";

        case BAD_REQUEST:
            return "Bad Request";
        case UNAUTHORIZED:
            return "Unauthorized";
        case FORBIDDEN:
            return "Forbidden";
        case NOT_FOUND:
            return "Not Found";
        case METHOD_NOT_ALLOWED:
            return "Method Not Allowed";
        case NOT_ACCEPTABLE:
            return "Not Acceptable";
        case CONFLICT:
            return "Conflict";
        case GONE:
            return "Gone";
        case PRECONDITION_FAILED:
            return "Precondition Failed";
        case UNSUPPORTED_MEDIA_TYPE:
            return "Unsupported Media Type";
        case REQUESTED_RANGE_NOT_SATISFIABLE:
            return "Requested range not satisfiable";

        case INTERNAL_SERVER_ERROR:
            return "Internal Server Error";
        case NOT_IMPLEMENTED:
            return "Not Implemented";
        case SERVICE_UNAVAILABLE:
            return "Service Unavailable";

        default:
            return "<INVALID>";
    }
}

boost::posix_time::ptime
parseHttpDate(const std::string &str)
{
    // Sun, 06 Nov 1994 08:49:37 GMT
    if (str.size() != 29u)
        return boost::posix_time::ptime();
    char weekday[4], month[4], zone[4];
    int day, year, hours, minutes, seconds, consumed = 0;
    if (sscanf(str.c_str(), "%3c, %2d %3c %4d %2d:%2d:%2d %3c%n",
        weekday, &day, month, &year, &hours, &minutes, &seconds, zone,
        &consumed) != 8 || consumed != 29)
        return boost::posix_time::ptime();
    weekday[3] = month[3] = zone[3] = '\0';
    if (strcmp(zone, "GMT") != 0 || str[3] != ',' || str[4] != ' ' ||
        str[7] != ' ' || str[11] != ' ' || str[16] != ' ')
        return boost::posix_time::ptime();
    const char **weekdaysEnd = weekdays + 7;
    if (std::find_if(weekdays, weekdaysEnd,
        boost::bind(&strcmp, _1, weekday) == 0) == weekdaysEnd)
        return boost::posix_time::ptime();
    const char **monthsEnd = months + 12;
    const char **monthIt = std::find_if(months, monthsEnd,
        boost::bind(&strcmp, _1, month) == 0);
    if (monthIt == monthsEnd)
        return boost::posix_time::ptime();
    if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59 ||
        seconds < 0 || seconds > 59 || day < 1 || day > 31 || year < 1400)
        return boost::posix_time::ptime();
    try {
        boost::gregorian::date date(year, (monthIt - months) + 1, day);
        return boost::posix_time::ptime(date,
            boost::posix_time::hours(hours) +
            boost::posix_time::minutes(minutes) +
            boost::posix_time::seconds(seconds));
    } catch (std::out_of_range &) {
        // i.e. Feb 30
        return boost::posix_time::ptime();
    }
}

std::string
formatHttpDate(const boost::posix_time::ptime &date)
{
    RESTED_ASSERT(!date.is_special());
    std::ostringstream os;
    os.imbue(std::locale(os.getloc(), &rfc1123Facet_out));
    os << date;
    return os.str();
}

static unsigned int
parseQvalue(const std::string &str)
{
    // qvalue = ( "0" [ "." 0*3DIGIT ] ) | ( "1" [ "." 0*3("0") ] )
    if (str.empty() || (str[0] != '0' && str[0] != '1'))
        return 0;
    unsigned int result = (str[0] - '0') * 1000;
    if (str.size() == 1)
        return result;
    if (str[1] != '.' || str.size() > 5)
        return 0;
    unsigned int place = 100;
    for (size_t i = 2; i < str.size(); ++i, place /= 10) {
        if (str[i] < '0' || str[i] > '9')
            return 0;
        result += (str[i] - '0') * place;
    }
    return std::min(result, 1000u);
}

AcceptList
parseAcceptList(const std::string &str)
{
    AcceptList result;
    std::vector<std::string> elements = split(str, ',');
    for (std::vector<std::string>::const_iterator it(elements.begin());
        it != elements.end();
        ++it) {
        std::vector<std::string> parameters = split(*it, ';');
        if (parameters.empty())
            continue;
        AcceptValue value(trim(parameters.front()));
        if (value.value.empty())
            continue;
        for (size_t i = 1; i < parameters.size(); ++i) {
            std::string parameter = trim(parameters[i]);
            if (parameter.size() >= 2 && (parameter[0] == 'q' ||
                parameter[0] == 'Q') && parameter[1] == '=')
                value.qvalue = parseQvalue(trim(parameter.substr(2)));
        }
        result.push_back(value);
    }
    return result;
}

bool
AcceptValue::operator ==(const AcceptValue &rhs) const
{
    return stricmp(value.c_str(), rhs.value.c_str()) == 0;
}

static unsigned int
effectiveQvalue(const AcceptList &list, const AcceptValue &value)
{
    const AcceptValue *wildcard = NULL;
    for (AcceptList::const_iterator it(list.begin());
        it != list.end();
        ++it) {
        if (*it == value)
            return it->qvalue == ~0u ? 1000 : it->qvalue;
        if (it->value == "*")
            wildcard = &*it;
    }
    if (wildcard)
        return wildcard->qvalue == ~0u ? 1000 : wildcard->qvalue;
    return ~0u;
}

bool
isAcceptable(const AcceptList &list, const AcceptValue &value,
    bool defaultMissing)
{
    unsigned int qvalue = effectiveQvalue(list, value);
    if (qvalue == ~0u)
        return defaultMissing;
    return qvalue > 0;
}

static bool
isPreferred(const AcceptList &list, const AcceptValue &lhs,
    const AcceptValue &rhs)
{
    RESTED_ASSERT(lhs != rhs);
    unsigned int lQvalue = effectiveQvalue(list, lhs);
    unsigned int rQvalue = effectiveQvalue(list, rhs);
    if (lQvalue == ~0u)
        lQvalue = 0;
    if (rQvalue == ~0u)
        rQvalue = 0;
    return lQvalue > rQvalue;
}

const AcceptValue *
preferred(const AcceptList &accept, const AcceptList &available)
{
    RESTED_ASSERT(!available.empty());
#ifndef NDEBUG
    // Assert that the available list is ordered
    for (AcceptList::const_iterator it(available.begin());
        it != available.end();
        ++it) {
        RESTED_ASSERT(it->qvalue <= 1000);
        AcceptList::const_iterator next(it);
        ++next;
        if (next != available.end())
            RESTED_ASSERT(it->qvalue >= next->qvalue);
    }
#endif
    AcceptList::const_iterator availableIt(available.begin());
    while (availableIt != available.end()) {
        AcceptList::const_iterator nextIt(availableIt);
        ++nextIt;
        while (nextIt != available.end() && nextIt->qvalue == availableIt->qvalue)
            ++nextIt;
        AcceptList preferred;
        for (;
            availableIt != nextIt;
            ++availableIt) {
            if (isAcceptable(accept, *availableIt))
                preferred.push_back(*availableIt);
        }
        if (!preferred.empty()) {
            std::stable_sort(preferred.begin(), preferred.end(), boost::bind(
                &isPreferred, boost::cref(accept), _1, _2));
            return &*std::find(available.begin(), nextIt, preferred.front());
        }
    }
    return NULL;
}

std::ostream& operator<<(std::ostream& os, Status s)
{
    return os << (int)s;
}

std::ostream& operator<<(std::ostream& os, Version v)
{
    if (v.major == (unsigned char)~0 || v.minor == (unsigned char)~0)
        return os << "HTTP/0.0";
    return os << "HTTP/" << (int)v.major << "." << (int)v.minor;
}

std::ostream& operator<<(std::ostream& os, const ContentRange &cr)
{
    os << cr.unit << ' ';
    if (cr.first == ~0ull) {
        os << '*';
    } else {
        os << cr.first << '-';
        if (cr.last != ~0ull)
            os << cr.last;
    }
    os << '/';
    if (cr.instance == ~0ull)
        os << '*';
    else
        os << cr.instance;
    return os;
}

std::ostream& operator<<(std::ostream& os, const AcceptValue &v)
{
    if (v.value.empty())
        os << '*';
    else
        os << v.value;
    if (v.qvalue != ~0u) {
        RESTED_ASSERT(v.qvalue <= 1000);
        unsigned int qvalue = v.qvalue;
        unsigned int curPlace = 100;
        if (qvalue == 1000) {
            os << ";q=1";
        } else {
            os << ";q=0";
            while (curPlace > 0 && qvalue > 0) {
                if (curPlace == 100)
                    os << '.';
                unsigned int cur = qvalue / curPlace;
                RESTED_ASSERT(cur < 10);
                os << cur;
                qvalue -= cur * curPlace;
                curPlace /= 10;
            }
        }
    }

    return os;
}

std::ostream& operator<<(std::ostream& os, const AcceptList &l)
{
    RESTED_ASSERT(!l.empty());
    for (AcceptList::const_iterator it(l.begin());
        it != l.end();
        ++it) {
        if (it != l.begin())
            os << ", ";
        os << *it;
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const RequestLine &r)
{
    RESTED_ASSERT(!r.method.empty());
    if (r.uri.empty())
        return os << r.method << " * " << r.ver;
    return os << r.method << " " << r.uri << " " << r.ver;
}

std::ostream& operator<<(std::ostream& os, const StatusLine &s)
{
    return os << s.ver << " " << s.status << " "
        << (s.reason.empty() ? reason(s.status) : s.reason.c_str());
}

std::ostream& operator<<(std::ostream& os, const RequestHeaders &r)
{
    if (!r.accept.empty())
        os << "Accept: " << r.accept << "\r\n";
    if (!r.acceptEncoding.empty())
        os << "Accept-Encoding: " << r.acceptEncoding << "\r\n";
    if (!r.host.empty())
        os << "Host: " << r.host << "\r\n";
    if (!r.ifMatch.empty())
        os << "If-Match: " << r.ifMatch << "\r\n";
    if (!r.ifModifiedSince.empty())
        os << "If-Modified-Since: " << r.ifModifiedSince << "\r\n";
    if (!r.ifNoneMatch.empty())
        os << "If-None-Match: " << r.ifNoneMatch << "\r\n";
    if (!r.ifRange.empty())
        os << "If-Range: " << r.ifRange << "\r\n";
    if (!r.ifUnmodifiedSince.empty())
        os << "If-Unmodified-Since: " << r.ifUnmodifiedSince << "\r\n";
    if (!r.range.empty())
        os << "Range: " << r.range << "\r\n";
    return os;
}

std::ostream& operator<<(std::ostream& os, const ResponseHeaders &r)
{
    if (!r.acceptRanges.empty())
        os << "Accept-Ranges: " << r.acceptRanges << "\r\n";
    if (!r.eTag.empty())
        os << "ETag: " << r.eTag << "\r\n";
    if (!r.location.empty())
        os << "Location: " << r.location << "\r\n";
    if (!r.vary.empty())
        os << "Vary: " << r.vary << "\r\n";
    return os;
}

std::ostream& operator<<(std::ostream& os, const EntityHeaders &e)
{
    os.imbue(std::locale(os.getloc(), &rfc1123Facet_out));
    if (!e.allow.empty())
        os << "Allow: " << e.allow << "\r\n";
    if (!e.contentEncoding.empty())
        os << "Content-Encoding: " << e.contentEncoding << "\r\n";
    if (e.contentLength != ~0ull)
        os << "Content-Length: " << e.contentLength << "\r\n";
    if (e.contentRange.isDefined())
        os << "Content-Range: " << e.contentRange << "\r\n";
    if (!e.contentType.empty())
        os << "Content-Type: " << e.contentType << "\r\n";
    if (!e.expires.is_not_a_date_time())
        os << "Expires: " << e.expires << "\r\n";
    if (!e.lastModified.is_not_a_date_time())
        os << "Last-Modified: " << e.lastModified << "\r\n";
    for (StringMap::const_iterator it(e.extension.begin());
        it != e.extension.end();
        ++it) {
        os << it->first << ": " << it->second << "\r\n";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const Request &r)
{
    return os << r.requestLine << "\r\n"
        << r.request
        << r.entity << "\r\n";
}

std::ostream& operator<<(std::ostream& os, const Response &r)
{
    return os << r.status << "\r\n"
        << r.response
        << r.entity << "\r\n";
}

}}
