// Copyright (c) 2009 - Mozy, Inc.

#include "range.h"

#include <algorithm>
#include <stdexcept>

#include "rested/assert.h"
#include "rested/string.h"
#include "conditions.h"
#include "error.h"
#include "server.h"

namespace Rested {
namespace HTTP {

static Logger::ptr g_log = Log::lookup("rested:http:range");

static bool
parseUnits(const std::string &str, unsigned long long &value)
{
    if (str.empty())
        return false;
    unsigned long long result = 0;
    for (std::string::const_iterator it(str.begin());
        it != str.end();
        ++it) {
        if (*it < '0' || *it > '9')
            return false;
        unsigned long long digit = *it - '0';
        // ~0ull is reserved for "not specified"
        if (result > (~0ull - 1 - digit) / 10)
            return false;
        result = result * 10 + digit;
    }
    value = result;
    return true;
}

bool
parseRange(const std::string &str, Range &range)
{
    size_t equals = str.find('=');
    if (equals == std::string::npos)
        return false;
    std::string unit = trim(str.substr(0, equals));
    if (unit.empty() ||
        unit.find_first_of(" \t,;\"") != std::string::npos)
        return false;
    std::string byteRange = trim(str.substr(equals + 1));
    // multipart/byteranges responses are not supported
    if (byteRange.find(',') != std::string::npos)
        return false;
    size_t dash = byteRange.find('-');
    if (dash == std::string::npos)
        return false;
    std::string first = trim(byteRange.substr(0, dash));
    std::string last = trim(byteRange.substr(dash + 1));
    if (first.empty() && last.empty())
        return false;

    Range result(unit);
    if (!first.empty() && !parseUnits(first, result.first))
        return false;
    if (!last.empty() && !parseUnits(last, result.last))
        return false;
    range = result;
    return true;
}

bool
validate(Range &range, const Ranger &ranger)
{
    std::vector<std::string> units = ranger.units();
    bool found = false;
    for (std::vector<std::string>::const_iterator it(units.begin());
        it != units.end();
        ++it) {
        if (stricmp(it->c_str(), range.unit.c_str()) == 0) {
            range.unit = *it;
            found = true;
            break;
        }
    }
    if (!found)
        return false;
    if (range.first != ~0ull && range.last != ~0ull &&
        range.first > range.last)
        return false;
    return true;
}

void
adjust(Range &range, const Ranger &ranger)
{
    unsigned long long count = ranger.count();
    if (range.first == ~0ull) {
        RESTED_ASSERT(range.last != ~0ull);
        // Zero length suffix, or nothing to take a suffix of
        if (range.last == 0 || count == 0)
            RESTED_THROW_EXCEPTION(RangeNotSatisfiableException(range.unit,
                count));
        range.first = range.last >= count ? 0 : count - range.last;
        range.last = count - 1;
    } else {
        if (range.first >= count)
            RESTED_THROW_EXCEPTION(RangeNotSatisfiableException(range.unit,
                count));
        if (range.last == ~0ull || range.last >= count)
            range.last = count - 1;
    }
}

Resource::ptr
negotiateRange(ServerRequest::ptr request, Ranger::ptr ranger)
{
    Response &response = request->response();
    response.response.acceptRanges = ranger->units();
    const std::string &header = request->request().request.range;
    if (header.empty())
        return ranger;

    std::vector<std::string> &vary = response.response.vary;
    if (std::find(vary.begin(), vary.end(), "Range") == vary.end())
        vary.push_back("Range");

    Range range;
    if (!parseRange(header, range)) {
        RESTED_LOG_VERBOSE(g_log) << request.get() << " ignoring malformed Range "
            << header;
        return ranger;
    }
    if (!validate(range, *ranger)) {
        RESTED_LOG_VERBOSE(g_log) << request.get() << " ignoring invalid Range "
            << range;
        return ranger;
    }
    if (!ifRangeSatisfied(*ranger, request->request())) {
        RESTED_LOG_VERBOSE(g_log) << request.get() << " If-Range "
            << request->request().request.ifRange
            << " failed; sending full entity";
        return ranger;
    }
    adjust(range, *ranger);

    ContentRange contentRange(range.unit);
    Resource::ptr partial = ranger->range(range, contentRange);
    if (!partial)
        RESTED_THROW_EXCEPTION(std::logic_error(
            "Ranger returned no resource for " + contentRange.unit + " range"));
    RESTED_LOG_DEBUG(g_log) << request.get() << " serving " << contentRange;
    if (contentRange.first != 0 || contentRange.instance == ~0ull ||
        contentRange.last != contentRange.instance - 1)
        response.entity.contentRange = contentRange;
    return partial;
}

std::ostream& operator<<(std::ostream& os, const Range &r)
{
    os << r.unit << '=';
    if (r.first != ~0ull)
        os << r.first;
    os << '-';
    if (r.last != ~0ull)
        os << r.last;
    return os;
}

}}
