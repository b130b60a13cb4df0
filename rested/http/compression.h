#ifndef __RESTED_HTTP_COMPRESSION_H__
#define __RESTED_HTTP_COMPRESSION_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>

#include <zlib.h>

#include <boost/shared_ptr.hpp>

#include "rested/exception.h"

namespace Rested {

struct ZlibException : virtual Exception
{
public:
    ZlibException() : m_rc(0) {}
    ZlibException(int rc) :
      m_rc(rc)
    {}

    int rc() const { return m_rc; }

private:
    int m_rc;
};

namespace HTTP {

/// Chooses and applies a Content-Encoding
class Compressor
{
public:
    typedef boost::shared_ptr<Compressor> ptr;

public:
    virtual ~Compressor() {}

    /// @param acceptEncoding The request's Accept-Encoding header
    /// @return The encoding to apply to body, or an empty string to send it
    /// as is
    virtual std::string encoding(const std::string &body,
        const std::string &acceptEncoding) = 0;
    /// @pre encoding is a value previously returned by encoding()
    virtual std::string encode(const std::string &body,
        const std::string &encoding) = 0;
};

/// Offers gzip (preferred) and deflate for bodies of at least
/// http.compression.minsize bytes
class ZlibCompressor : public Compressor
{
public:
    /// @param maxChunk Largest piece of the body handed to deflate() at once;
    /// never more than a uInt can describe
    ZlibCompressor(int level = Z_DEFAULT_COMPRESSION,
        size_t maxChunk = 0xffffffffu);

    std::string encoding(const std::string &body,
        const std::string &acceptEncoding);
    std::string encode(const std::string &body, const std::string &encoding);

private:
    int m_level;
    size_t m_maxChunk;
};

}}

#endif
