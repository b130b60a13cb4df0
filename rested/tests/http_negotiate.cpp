// Copyright (c) 2009 - Mozy, Inc.

#include "rested/http/error.h"
#include "rested/http/negotiate.h"
#include "rested/test/test.h"

using namespace Rested;
using namespace Rested::HTTP;

namespace {
class Plain : public Resource
{
public:
    std::string eTag() const { return "\"p\""; }
    boost::posix_time::ptime lastModified() const
    { return boost::posix_time::ptime(); }
    boost::posix_time::time_duration ttl() const
    { return boost::posix_time::seconds(0); }
};

class Document : public Renderable
{
public:
    std::string eTag() const { return "\"d\""; }
    boost::posix_time::ptime lastModified() const
    { return boost::posix_time::ptime(); }
    boost::posix_time::time_duration ttl() const
    { return boost::posix_time::seconds(0); }

    std::vector<std::string> mediaTypes() const
    {
        std::vector<std::string> result;
        result.push_back("application/json");
        result.push_back("text/xml");
        return result;
    }
    std::string render(const std::string &mediaType) const
    {
        if (mediaType == "application/json")
            return "{\"id\":1}";
        return "<doc id=\"1\"/>";
    }
};
}

static std::vector<std::string>
jsonAndXml()
{
    std::vector<std::string> result;
    result.push_back("application/json");
    result.push_back("application/xml");
    return result;
}

RESTED_UNITTEST(Negotiate, emptyAccept)
{
    RESTED_TEST_ASSERT_EQUAL(preferredMediaType("", jsonAndXml()),
        "application/json");
    RESTED_TEST_ASSERT_EQUAL(preferredMediaType(" , ", jsonAndXml()),
        "application/json");
    RESTED_TEST_ASSERT_EQUAL(preferredMediaType("application/json",
        std::vector<std::string>()), "");
}

RESTED_UNITTEST(Negotiate, exact)
{
    RESTED_TEST_ASSERT_EQUAL(preferredMediaType("application/xml",
        jsonAndXml()), "application/xml");
    RESTED_TEST_ASSERT_EQUAL(preferredMediaType("Application/XML",
        jsonAndXml()), "application/xml");
    RESTED_TEST_ASSERT_EQUAL(preferredMediaType(
        "application/json; charset=utf-8", jsonAndXml()), "application/json");
    RESTED_TEST_ASSERT_EQUAL(preferredMediaType("image/png", jsonAndXml()),
        "");
}

RESTED_UNITTEST(Negotiate, qvalues)
{
    RESTED_TEST_ASSERT_EQUAL(preferredMediaType(
        "application/json;q=0.5, application/xml", jsonAndXml()),
        "application/xml");
    RESTED_TEST_ASSERT_EQUAL(preferredMediaType(
        "application/json;q=0, application/xml;q=0", jsonAndXml()), "");
    // Ties go to the server's order
    RESTED_TEST_ASSERT_EQUAL(preferredMediaType(
        "application/xml;q=0.5, application/json;q=0.5", jsonAndXml()),
        "application/json");
}

RESTED_UNITTEST(Negotiate, wildcards)
{
    RESTED_TEST_ASSERT_EQUAL(preferredMediaType("*/*", jsonAndXml()),
        "application/json");
    RESTED_TEST_ASSERT_EQUAL(preferredMediaType("application/*",
        jsonAndXml()), "application/json");
    std::vector<std::string> available;
    available.push_back("application/json");
    available.push_back("text/plain");
    RESTED_TEST_ASSERT_EQUAL(preferredMediaType("text/*", available),
        "text/plain");
    // More specific ranges override less specific ones
    RESTED_TEST_ASSERT_EQUAL(preferredMediaType(
        "*/*;q=0.1, application/json;q=0", jsonAndXml()), "application/xml");
    RESTED_TEST_ASSERT_EQUAL(preferredMediaType(
        "application/*;q=0, */*", available), "text/plain");
}

RESTED_UNITTEST(Negotiate, defaultMarshaler)
{
    DefaultMarshaler marshaler;
    std::string contentType;
    Resource::ptr document(new Document());
    RESTED_TEST_ASSERT_EQUAL(marshaler.marshal(document, "", contentType),
        "{\"id\":1}");
    RESTED_TEST_ASSERT_EQUAL(contentType, "application/json");
    RESTED_TEST_ASSERT_EQUAL(marshaler.marshal(document, "text/*",
        contentType), "<doc id=\"1\"/>");
    RESTED_TEST_ASSERT_EQUAL(contentType, "text/xml");
}

RESTED_UNITTEST(Negotiate, notAcceptable)
{
    DefaultMarshaler marshaler;
    std::string contentType;
    RESTED_TEST_ASSERT_EXCEPTION(marshaler.marshal(Resource::ptr(
        new Document()), "image/png", contentType), NotAcceptableException);
    RESTED_TEST_ASSERT_EXCEPTION(marshaler.marshal(Resource::ptr(
        new Plain()), "", contentType), NotAcceptableException);
    RESTED_TEST_ASSERT(contentType.empty());
}
