#ifndef __RESTED_MEMORY_STREAM_H__
#define __RESTED_MEMORY_STREAM_H__
// Copyright (c) 2009 - Decho Corporation

#include "stream.h"

namespace Rested {

class MemoryStream : public Stream
{
public:
    typedef boost::shared_ptr<MemoryStream> ptr;
public:
    MemoryStream();
    MemoryStream(const std::string &data);

    bool supportsRead() { return true; }
    bool supportsWrite() { return true; }
    bool supportsSeek() { return true; }
    bool supportsSize() { return true; }

    void close(CloseType type = BOTH);
    size_t read(void *buffer, size_t length);
    size_t write(const void *buffer, size_t length);
    long long seek(long long offset, Anchor anchor = BEGIN);
    long long size();

    // Direct access to memory
    const std::string &buffer() const { return m_data; }
    /// Everything from the current position to the end
    std::string readBuffer() const;

private:
    std::string m_data;
    size_t m_offset;
    CloseType m_closed;
};

}

#endif
