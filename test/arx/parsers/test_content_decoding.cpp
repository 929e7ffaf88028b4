/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "arx/parsers/ArxContentDecoder.h"
#include "arx/parsers/ArxMozLz4.h"
#include "arx/utilities/ArxException.h"

#include "Poco/DeflatingStream.h"

#include "zstd.h"

#include <sstream>

#include "catch.hpp"

namespace {
  std::string deflate(const std::string& plain, Poco::DeflatingStreamBuf::StreamType type) {
    std::ostringstream out;
    Poco::DeflatingOutputStream deflater(out, type);
    deflater << plain;
    deflater.close();
    return out.str();
  }

  std::string raw_deflate(const std::string& plain) {
    std::ostringstream out;
    Poco::DeflatingOutputStream deflater(out, -15, 6);
    deflater << plain;
    deflater.close();
    return out.str();
  }

  const std::string BODY = "<html><body>" + std::string(2000, 'x') + "</body></html>";
}

TEST_CASE("identity encodings", "[decoding]") {
  CHECK(ArxContentDecoder::isIdentity(""));
  CHECK(ArxContentDecoder::isIdentity(" Identity "));
  CHECK_FALSE(ArxContentDecoder::isIdentity("gzip"));
  CHECK(ArxContentDecoder::decode("identity", "plain") == "plain");
}

TEST_CASE("gzip and deflate bodies", "[decoding]") {
  std::string gz = deflate(BODY, Poco::DeflatingStreamBuf::STREAM_GZIP);
  std::string zlib = deflate(BODY, Poco::DeflatingStreamBuf::STREAM_ZLIB);
  REQUIRE(gz != BODY);

  CHECK(ArxContentDecoder::decode("gzip", gz) == BODY);
  CHECK(ArxContentDecoder::decode("X-GZIP", gz) == BODY);
  CHECK(ArxContentDecoder::decode("deflate", zlib) == BODY);

  // Codings are undone in reverse order of application.
  std::string twice = deflate(gz, Poco::DeflatingStreamBuf::STREAM_ZLIB);
  CHECK(ArxContentDecoder::decode("gzip, deflate", twice) == BODY);

  CHECK_THROWS_AS(ArxContentDecoder::decode("gzip", gz.substr(0, gz.size() / 2)), ArxParseException);
  CHECK_THROWS_AS(ArxContentDecoder::decode("gzip", raw_deflate(BODY)), ArxParseException);
  CHECK_THROWS_AS(ArxContentDecoder::decode("gzip", "not compressed"), ArxParseException);
}

TEST_CASE("raw deflate bodies", "[decoding]") {
  std::string raw = raw_deflate(BODY);
  REQUIRE(raw != deflate(BODY, Poco::DeflatingStreamBuf::STREAM_ZLIB));

  CHECK(ArxContentDecoder::decode("deflate", raw) == BODY);
  CHECK(ArxContentDecoder::inflate(raw, false) == BODY);
  CHECK_THROWS_AS(ArxContentDecoder::decode("deflate", "\xff\xff not deflate"), ArxParseException);
}

TEST_CASE("zstd bodies", "[decoding]") {
  std::string packed(ZSTD_compressBound(BODY.size()), '\0');
  size_t n = ZSTD_compress(&packed[0], packed.size(), BODY.data(), BODY.size(), 3);
  REQUIRE_FALSE(ZSTD_isError(n));
  packed.resize(n);

  CHECK(ArxContentDecoder::decode("zstd", packed) == BODY);
  CHECK(ArxContentDecoder::decode("ZSTD", packed) == BODY);
  CHECK_THROWS_AS(ArxContentDecoder::zstdDecode(packed.substr(0, packed.size() - 4)), ArxParseException);
  CHECK_THROWS_AS(ArxContentDecoder::zstdDecode("abc"), ArxParseException);
  CHECK_THROWS_AS(ArxContentDecoder::zstdDecode(""), ArxParseException);
}

TEST_CASE("brotli bodies", "[decoding]") {
  // Smallest valid stream: an empty last meta-block.
  CHECK(ArxContentDecoder::decode("br", std::string("\x06", 1)) == "");
  CHECK_THROWS_AS(ArxContentDecoder::brotliDecode(std::string("\xff\xff\xff\xff", 4)), ArxParseException);
  CHECK_THROWS_AS(ArxContentDecoder::brotliDecode(""), ArxParseException);
}

TEST_CASE("unsupported encodings", "[decoding]") {
  CHECK_THROWS_AS(ArxContentDecoder::decode("compress", "abc"), ArxParseException);
  CHECK_THROWS_AS(ArxContentDecoder::decode("gzip, sdch", "abc"), ArxParseException);
}

TEST_CASE("mozLz4 containers", "[decoding]") {
  std::string json = "{\"children\":[" + std::string(500, ' ') + "]}";
  std::string packed = ArxMozLz4::compress(json);
  CHECK(ArxMozLz4::hasMagic(packed));
  CHECK(packed.compare(0, 8, std::string(ArxMozLz4::MAGIC, 8)) == 0);
  CHECK(packed.size() < json.size());
  CHECK(ArxMozLz4::decompress(packed) == json);

  std::string bad_magic = packed;
  bad_magic[0] = 'x';
  CHECK_FALSE(ArxMozLz4::hasMagic(bad_magic));
  CHECK_THROWS_AS(ArxMozLz4::decompress(bad_magic), ArxParseException);

  std::string truncated = packed.substr(0, ArxMozLz4::HEADER_SIZE + 3);
  CHECK_THROWS_AS(ArxMozLz4::decompress(truncated), ArxParseException);
  CHECK_THROWS_AS(ArxMozLz4::decompress("mozL"), ArxParseException);
}
