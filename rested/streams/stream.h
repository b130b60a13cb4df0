#ifndef __RESTED_STREAM_H__
#define __RESTED_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include "rested/assert.h"
#include "rested/predef.h"

namespace Rested {

/// @brief Byte-oriented stream
/// @details
/// Stream is the interface a ServerRequest writes its response to (and a
/// request body is read from).  By default, a Stream advertises that it
/// cannot support any operations, and calling any of them will result in an
/// assertion.  close() and flush() are always safe to call.
class Stream : boost::noncopyable
{
public:
    typedef boost::shared_ptr<Stream> ptr;

    /// Flags for which end of a Stream to close
    enum CloseType {
        /// Neither (should not be passed to close(); only useful for keeping
        /// track of the current state of a Stream)
        NONE  = 0x00,
        /// Further reads from this Stream should fail
        READ  = 0x01,
        /// Further writes to this Stream should fail
        WRITE = 0x02,
        /// The default; closes both the read and write directions
        BOTH  = 0x03
    };

    /// Flags for where to seek from
    enum Anchor {
        /// Relative to the beginning of the stream
        BEGIN,
        /// Relative to the current position in the stream
        CURRENT,
        /// Relative to the end of the stream
        END
    };

public:
    /// Cleans up the underlying implementation, possibly by ungracefully
    /// closing it.
    virtual ~Stream() {}

    /// @return If it is valid to call read()
    virtual bool supportsRead() { return false; }
    /// @return If it is valid to call write()
    virtual bool supportsWrite() { return false; }
    /// @return If it is valid to call seek() with any parameters
    virtual bool supportsSeek() { return false; }
    /// @return If it is valid to call size()
    virtual bool supportsSize() { return false; }

    /// @brief Gracefully close the Stream
    /// @details
    /// It is valid to call close() multiple times without error.
    virtual void close(CloseType type = BOTH) {}

    /// @brief Read data from the Stream
    /// @details
    /// read() is allowed to return less than length, even if there is more data
    /// available. A return value of 0 is the @b only reliable method of
    /// detecting EOF.
    /// @return The amount actually read
    /// @pre supportsRead()
    virtual size_t read(void *buffer, size_t length) { RESTED_NOTREACHED(); }

    /// @brief Write data to the Stream
    /// @details
    /// write() is allowed to return less than length. If is @b not allowed to
    /// return 0.
    /// @return The amount actually written
    /// @pre supportsWrite()
    virtual size_t write(const void *buffer, size_t length) { RESTED_NOTREACHED(); }
    /// Convenience function to call write() with a null-terminated string
    size_t write(const char *string);

    /// @brief Change the current stream pointer
    /// @exception std::invalid_argument The resulting position would be negative
    /// @return The new stream pointer position
    /// @pre supportsSeek()
    virtual long long seek(long long offset, Anchor anchor = BEGIN) { RESTED_NOTREACHED(); }
    /// @return The current stream pointer position
    long long tell() { return seek(0, CURRENT); }

    /// @pre supportsSize()
    virtual long long size() { RESTED_NOTREACHED(); }

    /// flush() ensures that nothing is left in internal buffers.  It is safe
    /// to call flush() on any Stream.
    virtual void flush() {}
};

/// Write all of data to stream, looping over short writes
void writeAll(Stream &stream, const std::string &data);
/// Read stream until EOF
std::string readAll(Stream &stream);

}

#endif
