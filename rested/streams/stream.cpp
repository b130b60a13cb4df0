// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

#include <string.h>

namespace Rested {

static Logger::ptr g_log = Log::lookup("rested:streams:stream");

size_t
Stream::write(const char *string)
{
    return write(string, strlen(string));
}

void
writeAll(Stream &stream, const std::string &data)
{
    RESTED_ASSERT(stream.supportsWrite());
    size_t offset = 0;
    while (offset < data.size()) {
        size_t written = stream.write(data.c_str() + offset,
            data.size() - offset);
        RESTED_ASSERT(written > 0);
        offset += written;
    }
    RESTED_LOG_TRACE(g_log) << &stream << " wrote " << data.size();
}

std::string
readAll(Stream &stream)
{
    RESTED_ASSERT(stream.supportsRead());
    std::string result;
    char buffer[4096];
    while (true) {
        size_t read = stream.read(buffer, sizeof(buffer));
        if (read == 0u)
            break;
        result.append(buffer, read);
    }
    RESTED_LOG_TRACE(g_log) << &stream << " read " << result.size();
    return result;
}

}
