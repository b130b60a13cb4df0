#ifndef __RESTED_HTTP_H__
#define __RESTED_HTTP_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <map>
#include <stdexcept>
#include <vector>

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include "rested/exception.h"
#include "rested/predef.h"
#include "rested/string.h"
#include "rested/version.h"

namespace Rested {
namespace HTTP {

struct Exception : virtual Rested::Exception {};

extern const std::string GET;
extern const std::string HEAD;
extern const std::string PATCH;
extern const std::string PUT;
extern const std::string POST;
extern const std::string DELETE;
extern const std::string OPTIONS;

enum Status
{
    INVALID                          = 0,

    CONTINUE                         = 100,

    OK                               = 200,
    CREATED                          = 201,
    ACCEPTED                         = 202,
    NO_CONTENT                       = 204,
    PARTIAL_CONTENT                  = 206,

    MOVED_PERMANENTLY                = 301,
    FOUND                            = 302,
    SEE_OTHER                        = 303,
    NOT_MODIFIED                     = 304,
    TEMPORARY_REDIRECT               = 307,

    BAD_REQUEST                      = 400,
    UNAUTHORIZED                     = 401,
    FORBIDDEN                        = 403,
    NOT_FOUND                        = 404,
    METHOD_NOT_ALLOWED               = 405,
    NOT_ACCEPTABLE                   = 406,
    CONFLICT                         = 409,
    GONE                             = 410,
    PRECONDITION_FAILED              = 412,
    UNSUPPORTED_MEDIA_TYPE           = 415,
    REQUESTED_RANGE_NOT_SATISFIABLE  = 416,

    INTERNAL_SERVER_ERROR            = 500,
    NOT_IMPLEMENTED                  = 501,
    SERVICE_UNAVAILABLE              = 503
};
const char *reason(Status s);

/// Parses an RFC 1123 date ("Sun, 06 Nov 1994 08:49:37 GMT")
/// @return not_a_date_time if str is not a valid date
boost::posix_time::ptime parseHttpDate(const std::string &str);
/// Formats a date as RFC 1123, in GMT
std::string formatHttpDate(const boost::posix_time::ptime &date);

struct Version
{
    Version() : major(~0), minor(~0) {}
    Version(unsigned char m, unsigned char n) : major(m), minor(n) {}

    unsigned char major;
    unsigned char minor;

    bool operator==(const Version& rhs) const
    {
        return major == rhs.major && minor == rhs.minor;
    }
    bool operator!=(const Version& rhs) const
    {
        return !(*this == rhs);
    }
};

typedef std::map<std::string, std::string, caseinsensitiveless> StringMap;

struct ContentRange
{
    ContentRange(const std::string &unit_ = "bytes",
        unsigned long long first_ = ~0ull,
        unsigned long long last_ = ~0ull,
        unsigned long long instance_ = ~0ull)
        : unit(unit_),
          first(first_),
          last(last_),
          instance(instance_)
    {}

    std::string unit;
    unsigned long long first;
    /// @note If first == ~0ull, then last is ignored for comparison, and only
    /// useful for forcing a serialization of "<unit> */<instance>"
    unsigned long long last;
    /// Total number of units; ~0ull if unknown
    unsigned long long instance;

    bool isDefined() const
    {
        return first != ~0ull || last != ~0ull || instance != ~0ull;
    }

    bool operator==(const ContentRange &rhs) const
    {
        return unit == rhs.unit && first == rhs.first &&
            (first == ~0ull || last == rhs.last) && instance == rhs.instance;
    }
    bool operator!=(const ContentRange &rhs) const
    {
        return !(*this == rhs);
    }
};

struct AcceptValue
{
    AcceptValue() : qvalue(~0u) {}
    AcceptValue(const char *v, unsigned int q = ~0u)
        : value(v), qvalue(q)
    {}
    AcceptValue(const std::string &v, unsigned int q = ~0u)
        : value(v), qvalue(q)
    {}

    std::string value;
    /// Thousandths; ~0u if not specified (equivalent to 1000)
    unsigned int qvalue;

    bool operator== (const AcceptValue &rhs) const;
    bool operator!= (const AcceptValue &rhs) const { return !(*this == rhs); }
};

typedef std::vector<AcceptValue> AcceptList;

/// Parses a comma separated list of values with optional q parameters, as
/// found in Accept and Accept-Encoding.  Parameters other than q are
/// discarded, and unparseable q values are treated as 0
AcceptList parseAcceptList(const std::string &str);

// First line of a HTTP Request, e.g. "GET /events/1196798 HTTP/1.1"
struct RequestLine
{
    RequestLine() : method(GET), uri("/"), ver(1, 1) {}

    std::string method;
    std::string uri;
    Version ver;
};

// First line of an HTTP Response, e.g. "HTTP/1.1 200 OK"
struct StatusLine
{
    StatusLine() : status(OK), ver(1, 1) {}

    Status status;
    /// If empty, reason(status) is used when serializing
    std::string reason;
    Version ver;
};

// Request headers are kept in their raw form; malformed values are not an
// error, they simply don't apply (see conditions.h and range.h)
struct RequestHeaders
{
    std::string accept;            // "Accept"
    std::string acceptEncoding;    // "Accept-Encoding"
    std::string host;              // "Host"
    std::string ifMatch;           // "If-Match"
    std::string ifModifiedSince;   // "If-Modified-Since"
    std::string ifNoneMatch;       // "If-None-Match"
    std::string ifRange;           // "If-Range"
    std::string ifUnmodifiedSince; // "If-Unmodified-Since"
    std::string range;             // "Range"
};

struct ResponseHeaders
{
    std::vector<std::string> acceptRanges; // "Accept-Ranges"
    std::string eTag;                      // "ETag"
    std::string location;                  // "Location"
    std::vector<std::string> vary;         // "Vary"
};

struct EntityHeaders
{
    EntityHeaders() : contentLength(~0ull) {}

    std::vector<std::string> allow;           // "Allow"
    std::vector<std::string> contentEncoding; // "Content-Encoding"
    unsigned long long contentLength;         // "Content-Length"
    ContentRange contentRange;                // "Content-Range"
    std::string contentType;                  // "Content-Type"
    boost::posix_time::ptime expires;         // "Expires"
    boost::posix_time::ptime lastModified;    // "Last-Modified"

    // All non-standard headers are stored in this map.
    StringMap extension;
};

struct Request
{
    RequestLine requestLine;
    RequestHeaders request;
    EntityHeaders entity;
};

struct Response
{
    StatusLine status;
    ResponseHeaders response;
    EntityHeaders entity;
};

bool isAcceptable(const AcceptList &list, const AcceptValue &value, bool defaultMissing = false);
// @note the available MUST be sorted in descending order before sending to this function
const AcceptValue *preferred(const AcceptList &accept, const AcceptList &available);

std::ostream& operator<<(std::ostream& os, Status s);
std::ostream& operator<<(std::ostream& os, Version v);
std::ostream& operator<<(std::ostream& os, const ContentRange &cr);
std::ostream& operator<<(std::ostream& os, const AcceptValue &v);
std::ostream& operator<<(std::ostream& os, const AcceptList &l);
std::ostream& operator<<(std::ostream& os, const RequestLine &r);
std::ostream& operator<<(std::ostream& os, const StatusLine &s);
std::ostream& operator<<(std::ostream& os, const RequestHeaders &r);
std::ostream& operator<<(std::ostream& os, const ResponseHeaders &r);
std::ostream& operator<<(std::ostream& os, const EntityHeaders &e);

// These operators are used to convert the Request and Response
// structures into the real HTTP string format that is sent "over the wire"
std::ostream& operator<<(std::ostream& os, const Request &r);
std::ostream& operator<<(std::ostream& os, const Response &r);

}}

#endif
