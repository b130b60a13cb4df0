// Copyright (c) 2009 - Mozy, Inc.

#include <sstream>

#include <boost/date_time/posix_time/posix_time.hpp>

#include "rested/http/http.h"
#include "rested/test/test.h"

using namespace Rested;
using namespace Rested::HTTP;
using namespace boost::posix_time;
using namespace boost::gregorian;

RESTED_UNITTEST(HTTP, parseDate)
{
    ptime expected(date(1994, Nov, 6),
        hours(8) + minutes(49) + seconds(37));
    RESTED_TEST_ASSERT_EQUAL(parseHttpDate("Sun, 06 Nov 1994 08:49:37 GMT"),
        expected);
    RESTED_TEST_ASSERT_EQUAL(parseHttpDate("Mon, 01 Jan 2024 00:00:00 GMT"),
        ptime(date(2024, Jan, 1)));
}

RESTED_UNITTEST(HTTP, parseBadDate)
{
    RESTED_TEST_ASSERT(parseHttpDate("").is_not_a_date_time());
    RESTED_TEST_ASSERT(parseHttpDate("garbage").is_not_a_date_time());
    // RFC 850 and asctime forms are not accepted
    RESTED_TEST_ASSERT(parseHttpDate("Sunday, 06-Nov-94 08:49:37 GMT")
        .is_not_a_date_time());
    RESTED_TEST_ASSERT(parseHttpDate("Sun Nov  6 08:49:37 1994")
        .is_not_a_date_time());
    RESTED_TEST_ASSERT(parseHttpDate("Sun, 06 Nov 1994 08:49:37 PST")
        .is_not_a_date_time());
    RESTED_TEST_ASSERT(parseHttpDate("Xyz, 06 Nov 1994 08:49:37 GMT")
        .is_not_a_date_time());
    RESTED_TEST_ASSERT(parseHttpDate("Sun, 06 Foo 1994 08:49:37 GMT")
        .is_not_a_date_time());
    RESTED_TEST_ASSERT(parseHttpDate("Sun, 30 Feb 1994 08:49:37 GMT")
        .is_not_a_date_time());
    RESTED_TEST_ASSERT(parseHttpDate("Sun, 06 Nov 1994 25:49:37 GMT")
        .is_not_a_date_time());
}

RESTED_UNITTEST(HTTP, formatDate)
{
    ptime when(date(1994, Nov, 6), hours(8) + minutes(49) + seconds(37));
    RESTED_TEST_ASSERT_EQUAL(formatHttpDate(when),
        "Sun, 06 Nov 1994 08:49:37 GMT");
    RESTED_TEST_ASSERT_EQUAL(parseHttpDate(formatHttpDate(when)), when);
}

RESTED_UNITTEST(HTTP, acceptList)
{
    AcceptList list = parseAcceptList("gzip;q=0.5, deflate ,identity; q=0");
    RESTED_TEST_ASSERT_EQUAL(list.size(), 3u);
    RESTED_TEST_ASSERT_EQUAL(list[0].value, "gzip");
    RESTED_TEST_ASSERT_EQUAL(list[0].qvalue, 500u);
    RESTED_TEST_ASSERT_EQUAL(list[1].value, "deflate");
    RESTED_TEST_ASSERT_EQUAL(list[1].qvalue, ~0u);
    RESTED_TEST_ASSERT_EQUAL(list[2].value, "identity");
    RESTED_TEST_ASSERT_EQUAL(list[2].qvalue, 0u);

    RESTED_TEST_ASSERT(isAcceptable(list, "GZIP"));
    RESTED_TEST_ASSERT(isAcceptable(list, "deflate"));
    RESTED_TEST_ASSERT(!isAcceptable(list, "identity"));
    RESTED_TEST_ASSERT(!isAcceptable(list, "br"));
    RESTED_TEST_ASSERT(isAcceptable(list, "br", true));

    list = parseAcceptList("text/html;level=1;q=0.25, ,*;q=1");
    RESTED_TEST_ASSERT_EQUAL(list.size(), 2u);
    RESTED_TEST_ASSERT_EQUAL(list[0].value, "text/html");
    RESTED_TEST_ASSERT_EQUAL(list[0].qvalue, 250u);
    RESTED_TEST_ASSERT(isAcceptable(list, "br"));

    // Invalid qvalues are not acceptable
    list = parseAcceptList("gzip;q=2");
    RESTED_TEST_ASSERT_EQUAL(list.size(), 1u);
    RESTED_TEST_ASSERT_EQUAL(list[0].qvalue, 0u);
}

RESTED_UNITTEST(HTTP, preferred)
{
    AcceptList available;
    available.push_back(AcceptValue("gzip", 1000));
    available.push_back(AcceptValue("deflate", 500));

    const AcceptValue *result = preferred(parseAcceptList("deflate, gzip"),
        available);
    RESTED_TEST_ASSERT(result);
    RESTED_TEST_ASSERT_EQUAL(result->value, "gzip");
    result = preferred(parseAcceptList("gzip;q=0, deflate"), available);
    RESTED_TEST_ASSERT(result);
    RESTED_TEST_ASSERT_EQUAL(result->value, "deflate");
    result = preferred(parseAcceptList("identity"), available);
    RESTED_TEST_ASSERT(!result);
}

RESTED_UNITTEST(HTTP, contentRange)
{
    std::ostringstream os;
    os << ContentRange("bytes", 0, 4, 10);
    RESTED_TEST_ASSERT_EQUAL(os.str(), "bytes 0-4/10");
    os.str("");
    os << ContentRange("bytes", ~0ull, ~0ull, 10);
    RESTED_TEST_ASSERT_EQUAL(os.str(), "bytes */10");
    os.str("");
    os << ContentRange("items", 5, 9);
    RESTED_TEST_ASSERT_EQUAL(os.str(), "items 5-9/*");

    RESTED_TEST_ASSERT(!ContentRange().isDefined());
    RESTED_TEST_ASSERT(ContentRange("bytes", ~0ull, ~0ull, 0).isDefined());
    RESTED_TEST_ASSERT_EQUAL(ContentRange("bytes", ~0ull, 3, 10),
        ContentRange("bytes", ~0ull, 7, 10));
    RESTED_TEST_ASSERT_NOT_EQUAL(ContentRange("bytes", 0, 3, 10),
        ContentRange("bytes", 0, 7, 10));
}

RESTED_UNITTEST(HTTP, serializeResponse)
{
    Response response;
    response.status.status = PARTIAL_CONTENT;
    response.response.acceptRanges.push_back("bytes");
    response.response.eTag = "\"v1\"";
    response.response.vary.push_back("Accept");
    response.response.vary.push_back("Range");
    response.entity.contentLength = 5;
    response.entity.contentRange = ContentRange("bytes", 0, 4, 10);
    response.entity.contentType = "text/plain";
    response.entity.lastModified = ptime(date(2024, Jan, 1));
    response.entity.extension["X-Custom"] = "yes";

    std::ostringstream os;
    os << response;
    RESTED_TEST_ASSERT_EQUAL(os.str(),
        "HTTP/1.1 206 Partial Content\r\n"
        "Accept-Ranges: bytes\r\n"
        "ETag: \"v1\"\r\n"
        "Vary: Accept, Range\r\n"
        "Content-Length: 5\r\n"
        "Content-Range: bytes 0-4/10\r\n"
        "Content-Type: text/plain\r\n"
        "Last-Modified: Mon, 01 Jan 2024 00:00:00 GMT\r\n"
        "X-Custom: yes\r\n"
        "\r\n");
}

RESTED_UNITTEST(HTTP, serializeAllow)
{
    Response response;
    response.status.status = METHOD_NOT_ALLOWED;
    response.status.reason = "Nope";
    response.entity.allow.push_back(HEAD);
    response.entity.allow.push_back(GET);
    std::ostringstream os;
    os << response;
    RESTED_TEST_ASSERT_EQUAL(os.str(),
        "HTTP/1.1 405 Nope\r\n"
        "Allow: HEAD, GET\r\n"
        "\r\n");
}

RESTED_UNITTEST(HTTP, serializeRequest)
{
    Request request;
    request.requestLine.method = GET;
    request.requestLine.uri = "/docs/1";
    request.request.ifNoneMatch = "\"v1\"";
    request.request.range = "bytes=0-4";
    std::ostringstream os;
    os << request;
    RESTED_TEST_ASSERT_EQUAL(os.str(),
        "GET /docs/1 HTTP/1.1\r\n"
        "If-None-Match: \"v1\"\r\n"
        "Range: bytes=0-4\r\n"
        "\r\n");
}
