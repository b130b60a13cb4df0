// Copyright (c) 2009 - Mozy, Inc.

#include "compression.h"

#include <string.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "rested/assert.h"
#include "rested/config.h"
#include "http.h"

namespace Rested {
namespace HTTP {

static ConfigVar<unsigned long long>::ptr g_minSize =
    Config::lookup<unsigned long long>("http.compression.minsize", 1024ull,
    "Smallest response body (in bytes) that will be compressed");

static Logger::ptr g_log = Log::lookup("rested:http:compression");

ZlibCompressor::ZlibCompressor(int level, size_t maxChunk)
    : m_level(level),
      m_maxChunk(std::min<size_t>(maxChunk, 0xffffffffu))
{
    RESTED_ASSERT(m_maxChunk > 0);
}

std::string
ZlibCompressor::encoding(const std::string &body,
    const std::string &acceptEncoding)
{
    if (body.size() < g_minSize->val() || acceptEncoding.empty())
        return std::string();
    AcceptList accept = parseAcceptList(acceptEncoding);
    if (accept.empty())
        return std::string();
    AcceptList available;
    available.push_back(AcceptValue("gzip", 1000));
    available.push_back(AcceptValue("deflate", 500));
    const AcceptValue *preferredEncoding = preferred(accept, available);
    if (!preferredEncoding)
        return std::string();
    return preferredEncoding->value;
}

std::string
ZlibCompressor::encode(const std::string &body, const std::string &encoding)
{
    int windowBits;
    if (encoding == "gzip")
        windowBits = 15 + 16;
    else if (encoding == "deflate")
        windowBits = 15;
    else
        RESTED_THROW_EXCEPTION(std::invalid_argument(encoding));

    z_stream strm;
    memset(&strm, 0, sizeof(z_stream));
    int rc = deflateInit2(&strm, m_level, Z_DEFLATED, windowBits, 8,
        Z_DEFAULT_STRATEGY);
    switch (rc) {
        case Z_OK:
            break;
        case Z_MEM_ERROR:
            throw std::bad_alloc();
        case Z_STREAM_ERROR:
        {
            std::string message(strm.msg ? strm.msg : "");
            deflateEnd(&strm);
            throw std::runtime_error(message);
        }
        default:
            RESTED_NOTREACHED();
    }

    std::string result;
    std::vector<char> buffer(65536);
    const char *next = body.data();
    size_t remaining = body.size();
    int flush;
    do {
        size_t chunk = std::min(remaining, m_maxChunk);
        strm.next_in = (Bytef *)next;
        strm.avail_in = (uInt)chunk;
        next += chunk;
        remaining -= chunk;
        flush = remaining == 0 ? Z_FINISH : Z_NO_FLUSH;
        do {
            strm.next_out = (Bytef *)&buffer[0];
            strm.avail_out = (uInt)buffer.size();
            rc = deflate(&strm, flush);
            if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
                deflateEnd(&strm);
                RESTED_THROW_EXCEPTION(ZlibException(rc));
            }
            result.append(&buffer[0], buffer.size() - strm.avail_out);
        } while (strm.avail_out == 0);
        RESTED_ASSERT(strm.avail_in == 0);
    } while (flush != Z_FINISH);
    RESTED_ASSERT(rc == Z_STREAM_END);
    deflateEnd(&strm);
    RESTED_LOG_DEBUG(g_log) << encoding << " " << body.size() << " -> "
        << result.size();
    return result;
}

}}
