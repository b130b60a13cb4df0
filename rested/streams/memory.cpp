// Copyright (c) 2009 - Mozy, Inc.

#include "memory.h"

#include <string.h>

#include <algorithm>
#include <stdexcept>

namespace Rested {

MemoryStream::MemoryStream()
: m_offset(0),
  m_closed(NONE)
{}

MemoryStream::MemoryStream(const std::string &data)
: m_data(data),
  m_offset(0),
  m_closed(NONE)
{}

void
MemoryStream::close(CloseType type)
{
    m_closed = (CloseType)(m_closed | type);
}

size_t
MemoryStream::read(void *buffer, size_t length)
{
    if (m_closed & READ)
        RESTED_THROW_EXCEPTION(StreamClosedException());
    if (m_offset >= m_data.size())
        return 0;
    size_t todo = std::min(length, m_data.size() - m_offset);
    memcpy(buffer, m_data.c_str() + m_offset, todo);
    m_offset += todo;
    return todo;
}

size_t
MemoryStream::write(const void *buffer, size_t length)
{
    if (m_closed & WRITE)
        RESTED_THROW_EXCEPTION(StreamClosedException());
    // extend the stream, then write
    if (m_offset > m_data.size())
        m_data.resize(m_offset, '\0');
    size_t overwrite = std::min(length, m_data.size() - m_offset);
    m_data.replace(m_offset, overwrite, (const char *)buffer, length);
    m_offset += length;
    return length;
}

long long
MemoryStream::seek(long long offset, Anchor anchor)
{
    switch (anchor) {
        case BEGIN:
            break;
        case CURRENT:
            offset += (long long)m_offset;
            break;
        case END:
            offset += (long long)m_data.size();
            break;
        default:
            RESTED_NOTREACHED();
    }
    if (offset < 0)
        RESTED_THROW_EXCEPTION(std::invalid_argument("resulting offset is negative"));
    m_offset = (size_t)offset;
    return offset;
}

long long
MemoryStream::size()
{
    return (long long)m_data.size();
}

std::string
MemoryStream::readBuffer() const
{
    if (m_offset >= m_data.size())
        return std::string();
    return m_data.substr(m_offset);
}

}
