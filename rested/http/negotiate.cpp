// Copyright (c) 2009 - Mozy, Inc.

#include "negotiate.h"

#include <boost/pointer_cast.hpp>

#include "rested/assert.h"
#include "rested/string.h"
#include "error.h"
#include "http.h"

namespace Rested {
namespace HTTP {

static Logger::ptr g_log = Log::lookup("rested:http:negotiate");

static std::string
mediaRange(const std::string &mediaType)
{
    return trim(mediaType.substr(0, mediaType.find(';')));
}

// @return The qvalue (in thousandths) accept assigns to mediaType, or 0
static unsigned int
qvalue(const AcceptList &accept, const std::string &mediaType)
{
    std::string type = mediaRange(mediaType);
    std::string wildcard = type.substr(0, type.find('/')) + "/*";
    int bestSpecificity = 0;
    unsigned int result = 0;
    for (AcceptList::const_iterator it(accept.begin());
        it != accept.end();
        ++it) {
        int specificity;
        if (stricmp(it->value.c_str(), type.c_str()) == 0)
            specificity = 3;
        else if (stricmp(it->value.c_str(), wildcard.c_str()) == 0)
            specificity = 2;
        else if (it->value == "*/*" || it->value == "*")
            specificity = 1;
        else
            continue;
        if (specificity > bestSpecificity) {
            bestSpecificity = specificity;
            result = it->qvalue == ~0u ? 1000 : it->qvalue;
        }
    }
    return result;
}

std::string
preferredMediaType(const std::string &accept,
    const std::vector<std::string> &available)
{
    if (available.empty())
        return std::string();
    AcceptList list = parseAcceptList(accept);
    if (list.empty())
        return available.front();
    unsigned int best = 0;
    std::vector<std::string>::const_iterator result = available.end();
    for (std::vector<std::string>::const_iterator it(available.begin());
        it != available.end();
        ++it) {
        unsigned int q = qvalue(list, *it);
        if (q > best) {
            best = q;
            result = it;
        }
    }
    if (result == available.end())
        return std::string();
    return *result;
}

std::string
DefaultMarshaler::marshal(Resource::ptr resource, const std::string &accept,
    std::string &contentType)
{
    Renderable::ptr renderable =
        boost::dynamic_pointer_cast<Renderable>(resource);
    if (!renderable)
        RESTED_THROW_EXCEPTION(NotAcceptableException(
            "Resource has no representations"));
    std::vector<std::string> available = renderable->mediaTypes();
    std::string mediaType = preferredMediaType(accept, available);
    if (mediaType.empty()) {
        RESTED_LOG_VERBOSE(g_log) << "nothing in " << join(available, ", ")
            << " satisfies Accept: " << accept;
        RESTED_THROW_EXCEPTION(NotAcceptableException(
            "Available representations: " + join(available, ", ")));
    }
    contentType = mediaType;
    return renderable->render(mediaType);
}

}}
