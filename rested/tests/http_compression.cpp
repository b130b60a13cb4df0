// Copyright (c) 2009 - Mozy, Inc.

#include <string.h>

#include <zlib.h>

#include "rested/config.h"
#include "rested/http/compression.h"
#include "rested/test/test.h"

using namespace Rested;
using namespace Rested::HTTP;

static std::string
decompress(const std::string &compressed, int windowBits)
{
    z_stream strm;
    memset(&strm, 0, sizeof(z_stream));
    RESTED_TEST_ASSERT_EQUAL(inflateInit2(&strm, windowBits), Z_OK);
    std::string result;
    char buffer[4096];
    strm.next_in = (Bytef *)compressed.data();
    strm.avail_in = compressed.size();
    int rc;
    do {
        strm.next_out = (Bytef *)buffer;
        strm.avail_out = sizeof(buffer);
        rc = ::inflate(&strm, Z_NO_FLUSH);
        RESTED_TEST_ASSERT(rc == Z_OK || rc == Z_STREAM_END);
        result.append(buffer, sizeof(buffer) - strm.avail_out);
    } while (rc != Z_STREAM_END);
    inflateEnd(&strm);
    return result;
}

RESTED_UNITTEST(Compression, minimumSize)
{
    ZlibCompressor compressor;
    std::string small(1023, 'a');
    std::string large(1024, 'a');
    RESTED_TEST_ASSERT_EQUAL(compressor.encoding(small, "gzip"), "");
    RESTED_TEST_ASSERT_EQUAL(compressor.encoding(large, "gzip"), "gzip");

    HijackConfigVar minSize("http.compression.minsize", "10");
    RESTED_TEST_ASSERT_EQUAL(compressor.encoding("aaaaaaaaa", "gzip"), "");
    RESTED_TEST_ASSERT_EQUAL(compressor.encoding("aaaaaaaaaa", "gzip"),
        "gzip");
}

RESTED_UNITTEST(Compression, chooseEncoding)
{
    HijackConfigVar minSize("http.compression.minsize", "0");
    ZlibCompressor compressor;
    std::string body("hello");
    RESTED_TEST_ASSERT_EQUAL(compressor.encoding(body, ""), "");
    RESTED_TEST_ASSERT_EQUAL(compressor.encoding(body, "identity"), "");
    RESTED_TEST_ASSERT_EQUAL(compressor.encoding(body, "br"), "");
    RESTED_TEST_ASSERT_EQUAL(compressor.encoding(body, "deflate, gzip"),
        "gzip");
    RESTED_TEST_ASSERT_EQUAL(compressor.encoding(body, "deflate"),
        "deflate");
    RESTED_TEST_ASSERT_EQUAL(compressor.encoding(body, "gzip;q=0, deflate"),
        "deflate");
    RESTED_TEST_ASSERT_EQUAL(compressor.encoding(body, "*"), "gzip");
    RESTED_TEST_ASSERT_EQUAL(compressor.encoding(body, "*;q=0"), "");
}

RESTED_UNITTEST(Compression, gzip)
{
    ZlibCompressor compressor;
    std::string body;
    for (int i = 0; i < 1000; ++i)
        body.append("The quick brown fox jumps over the lazy dog. ");
    std::string compressed = compressor.encode(body, "gzip");
    RESTED_TEST_ASSERT_LESS_THAN(compressed.size(), body.size());
    RESTED_TEST_ASSERT_GREATER_THAN(compressed.size(), 2u);
    RESTED_TEST_ASSERT_EQUAL((unsigned char)compressed[0], 0x1f);
    RESTED_TEST_ASSERT_EQUAL((unsigned char)compressed[1], 0x8b);
    RESTED_TEST_ASSERT(decompress(compressed, 15 + 16) == body);
}

RESTED_UNITTEST(Compression, deflate)
{
    ZlibCompressor compressor(Z_BEST_COMPRESSION);
    std::string body(100000, 'x');
    std::string compressed = compressor.encode(body, "deflate");
    RESTED_TEST_ASSERT_LESS_THAN(compressed.size(), 1000u);
    RESTED_TEST_ASSERT(decompress(compressed, 15) == body);
}

RESTED_UNITTEST(Compression, incompressible)
{
    // Output larger than the input must still round trip
    ZlibCompressor compressor;
    std::string body;
    unsigned int seed = 12345;
    for (int i = 0; i < 65536; ++i) {
        seed = seed * 1103515245 + 12345;
        body.push_back((char)(seed >> 16));
    }
    RESTED_TEST_ASSERT(decompress(compressor.encode(body, "gzip"), 31) == body);
}

RESTED_UNITTEST(Compression, chunkedInput)
{
    // The body reaches deflate() in many small pieces
    ZlibCompressor compressor(Z_DEFAULT_COMPRESSION, 7);
    std::string body;
    for (int i = 0; i < 500; ++i)
        body.append("Lorem ipsum dolor sit amet. ");
    RESTED_TEST_ASSERT(decompress(compressor.encode(body, "gzip"), 31) == body);
    RESTED_TEST_ASSERT(decompress(compressor.encode(body, "deflate"), 15) ==
        body);
    RESTED_TEST_ASSERT(decompress(compressor.encode(std::string(), "gzip"),
        31).empty());
}

RESTED_UNITTEST(Compression, unknownEncoding)
{
    ZlibCompressor compressor;
    RESTED_TEST_ASSERT_EXCEPTION(compressor.encode("abc", "br"),
        std::invalid_argument);
}
