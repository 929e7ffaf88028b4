/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "arx/parsers/ArxCache2Parser.h"
#include "arx/utilities/ArxUtilities.h"

#include "Poco/DeflatingStream.h"
#include "Poco/File.h"

#include "zstd.h"

#include <sstream>

#include "catch.hpp"
#include "runner.h"
#include "arx/fixtures.h"

namespace {
  const char * HEAD_PLAIN = "HTTP/1.1 200 OK\r\nContent-Type: text/html; charset=utf-8\r\n";
  const char * HEAD_GZIP = "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Encoding: gzip\r\n";
  const char * HEAD_ZSTD = "HTTP/2 404 Not Found\r\nContent-Type: text/plain\r\nContent-Encoding: zstd\r\n";

  ArxParseInput cache_input(const runner::tempdir& run, const std::string& rel, const std::string& data) {
    runner::write_file(run.path / rel, data);
    ArxParseInput input;
    input.runDir = run.str();
    input.entry.destRelPath = rel;
    input.entry.destFilename = ArxUtilities::baseName(rel);
    input.entry.sizeBytes = (int64_t)data.size();
    input.entry.role = "primary";
    input.entry.source.partitionIndex = 1;
    input.entry.source.logicalPath = "/home/alice/.cache/mozilla/firefox/abc.default/cache2/entries/0A1B2C";
    input.entry.source.browser = "firefox";
    input.entry.source.profile = "abc.default";
    input.artifactType = "firefox_cache2";
    input.discoveredBy = "firefox_cache";
    return input;
  }

  std::string gzip(const std::string& plain) {
    std::ostringstream out;
    Poco::DeflatingOutputStream deflater(out, Poco::DeflatingStreamBuf::STREAM_GZIP);
    deflater << plain;
    deflater.close();
    return out.str();
  }

  std::string zstd(const std::string& plain) {
    std::string packed(ZSTD_compressBound(plain.size()), '\0');
    size_t n = ZSTD_compress(&packed[0], packed.size(), plain.data(), plain.size(), 3);
    REQUIRE_FALSE(ZSTD_isError(n));
    packed.resize(n);
    return packed;
  }

  const char * HEAD_PNG = "HTTP/1.1 200 OK\r\nContent-Type: image/png\r\n";
}

TEST_CASE("cache2 container layout", "[parsers][cache2]") {
  std::string data = fixtures::cache2_entry("https://example.com/page", "hello body", HEAD_PLAIN);
  ArxResult<ArxCache2Entry> parsed = ArxCache2Parser::parseContainer(data);
  REQUIRE(parsed.ok());
  const ArxCache2Entry& entry = parsed.value();
  CHECK(entry.version == 3);
  CHECK(entry.fetchCount == 2);
  CHECK(entry.lastFetched == 1700000000);
  CHECK(entry.key == "a,:https://example.com/page");
  CHECK(entry.body == "hello body");
  CHECK(entry.element("request-method") == "GET");
  CHECK(entry.element("missing") == "");

  SECTION("flipped metadata byte fails the checksum") {
    std::string corrupt = data;
    corrupt[data.size() - 10] ^= 0x40;
    ArxResult<ArxCache2Entry> bad = ArxCache2Parser::parseContainer(corrupt);
    REQUIRE_FALSE(bad.ok());
    CHECK(bad.error().warningType == "corrupt_container");
    CHECK(runner::contains(bad.error().message, "checksum"));
  }

  SECTION("truncated file") {
    CHECK_FALSE(ArxCache2Parser::parseContainer(data.substr(0, 20)).ok());
    CHECK_FALSE(ArxCache2Parser::parseContainer(data.substr(0, data.size() - 1)).ok());
  }
}

TEST_CASE("cache2 entry with plain body", "[parsers][cache2]") {
  runner::tempdir run("arx_cache2");
  ArxParseInput input = cache_input(run, "extracted/p1_00000000_0A1B2C",
      fixtures::cache2_entry("https://example.com/page", "<p>hi</p>", HEAD_PLAIN));

  ArxParseResult result = ArxCache2Parser().parse(input);
  REQUIRE(result.records.size() == 1);
  CHECK(result.warnings.empty());

  const ArxCacheEntryRecord& record = std::get<ArxCacheEntryRecord>(result.records[0]);
  CHECK(record.url == "https://example.com/page");
  CHECK(record.cacheKey == "a,:https://example.com/page");
  CHECK(record.cacheFilename == "0A1B2C");
  CHECK(record.httpStatus == 200);
  CHECK(record.contentType == "text/html");
  CHECK(record.contentEncoding == "");
  CHECK(record.fetchCount == 2);
  CHECK(record.lastFetched.toIso() == "2023-11-14T22:13:20.000000Z");
  CHECK_FALSE(record.expiration.isKnown());
  CHECK(record.bodySize == 9);
  CHECK(record.body == "<p>hi</p>");
  CHECK(record.bodyDecoded);
  CHECK(record.bodySha256 == ArxUtilities::sha256Hex("<p>hi</p>"));
  CHECK(record.source.discoveredBy == "firefox_cache");
  CHECK(record.source.partitionIndex == 1);
}

TEST_CASE("cache2 entry with encoded bodies", "[parsers][cache2]") {
  runner::tempdir run("arx_cache2");
  const std::string json = "{\"items\":[1,2,3]}";

  SECTION("gzip is decoded") {
    std::string packed = gzip(json);
    ArxParseInput input = cache_input(run, "extracted/gz", fixtures::cache2_entry("https://api.example.com/v1", packed, HEAD_GZIP));
    ArxParseResult result = ArxCache2Parser().parse(input);
    REQUIRE(result.records.size() == 1);
    const ArxCacheEntryRecord& record = std::get<ArxCacheEntryRecord>(result.records[0]);
    CHECK(record.contentEncoding == "gzip");
    CHECK(record.body == json);
    CHECK(record.bodyDecoded);
    CHECK(record.bodySize == (int64_t)packed.size());
    CHECK(record.bodySha256 == ArxUtilities::sha256Hex(packed));
  }

  SECTION("zstd is decoded") {
    std::string packed = zstd(json);
    ArxParseInput input = cache_input(run, "extracted/zstd", fixtures::cache2_entry("https://example.com/x", packed, HEAD_ZSTD));
    ArxParseResult result = ArxCache2Parser().parse(input);
    REQUIRE(result.records.size() == 1);
    const ArxCacheEntryRecord& record = std::get<ArxCacheEntryRecord>(result.records[0]);
    CHECK(record.httpStatus == 404);
    CHECK(record.contentEncoding == "zstd");
    CHECK(record.body == json);
    CHECK(record.bodyDecoded);
    CHECK(result.warnings.empty());
  }

  SECTION("undecodable body is kept raw") {
    ArxParseInput input = cache_input(run, "extracted/zstd", fixtures::cache2_entry("https://example.com/x", "raw-bytes", HEAD_ZSTD));
    ArxParseResult result = ArxCache2Parser().parse(input);
    REQUIRE(result.records.size() == 1);
    const ArxCacheEntryRecord& record = std::get<ArxCacheEntryRecord>(result.records[0]);
    CHECK(record.body == "raw-bytes");
    CHECK_FALSE(record.bodyDecoded);
    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings[0].warningType == "compression_error");
    CHECK(result.warnings[0].severity == ArxExtractionWarning::WARNING);
    CHECK(runner::contains(result.warnings[0].contextJson, "zstd"));
  }
}

TEST_CASE("cached images", "[parsers][cache2]") {
  runner::tempdir run("arx_cache2");
  std::string png = fixtures::png_bytes("cached cat");
  std::string sha = ArxUtilities::sha256Hex(png);

  ArxParseInput input = cache_input(run, "extracted/img",
      fixtures::cache2_entry("https://img.example.com/pics/cat.png?size=2", png, HEAD_PNG));
  ArxParseResult result = ArxCache2Parser().parse(input);
  REQUIRE(result.records.size() == 2);
  CHECK(result.warnings.empty());
  CHECK(std::holds_alternative<ArxCacheEntryRecord>(result.records[0]));

  const ArxImageRecord& image = std::get<ArxImageRecord>(result.records[1]);
  CHECK(image.format == "png");
  CHECK(image.sha256 == sha);
  CHECK(image.sizeBytes == (int64_t)png.size());
  CHECK(image.filename == "cat.png");
  CHECK(image.relPath == std::string("cache_images/") + sha + ".png");
  CHECK(image.cacheUrl == "https://img.example.com/pics/cat.png?size=2");
  CHECK(image.cacheKey == "a,:https://img.example.com/pics/cat.png?size=2");
  CHECK(image.cacheFilename == "0A1B2C");
  CHECK(image.fsPath == input.entry.source.logicalPath);
  CHECK(image.carvedOffsetBytes == -1);
  CHECK(image.source.discoveredBy == "firefox_cache");
  CHECK(runner::file_contents(run.path / image.relPath) == png);

  SECTION("parsing again leaves the written image alone") {
    ArxParseResult again = ArxCache2Parser().parse(input);
    REQUIRE(again.records.size() == 2);
    CHECK(std::get<ArxImageRecord>(again.records[1]).relPath == image.relPath);
    CHECK(runner::file_contents(run.path / image.relPath) == png);
  }

  SECTION("gzip encoded images are decoded first") {
    ArxParseInput packed = cache_input(run, "extracted/img_gz", fixtures::cache2_entry("https://img.example.com/z",
        gzip(png), "HTTP/1.1 200 OK\r\nContent-Type: image/png\r\nContent-Encoding: gzip\r\n"));
    ArxParseResult decoded = ArxCache2Parser().parse(packed);
    REQUIRE(decoded.records.size() == 2);
    const ArxImageRecord& unpacked = std::get<ArxImageRecord>(decoded.records[1]);
    CHECK(unpacked.sha256 == sha);
    CHECK(unpacked.filename == "z");
  }
}

TEST_CASE("cache bodies that are not images", "[parsers][cache2]") {
  runner::tempdir run("arx_cache2");
  ArxParseInput text = cache_input(run, "extracted/txt", fixtures::cache2_entry("https://example.com/", "<html>", HEAD_PLAIN));
  CHECK(ArxCache2Parser().parse(text).records.size() == 1);
  CHECK_FALSE(Poco::File((run.path / ArxCache2Parser::CACHE_IMAGE_DIR).string()).exists());
}

TEST_CASE("corrupt cache2 entry", "[parsers][cache2]") {
  runner::tempdir run("arx_cache2");
  std::string data = fixtures::cache2_entry("https://example.com/page", "body", HEAD_PLAIN);
  data[data.size() - 12] ^= 0x01;

  ArxParseResult result = ArxCache2Parser().parse(cache_input(run, "extracted/bad", data));
  CHECK(result.records.empty());
  CHECK(result.failedRecords == 1);
  REQUIRE(result.warnings.size() == 1);
  CHECK(result.warnings[0].warningType == "corrupt_container");
  CHECK(result.warnings[0].severity == ArxExtractionWarning::ERROR);
  CHECK(result.warnings[0].artifactType == "firefox_cache2");
}

TEST_CASE("cache2 keys", "[parsers][cache2]") {
  CHECK(ArxCache2Parser::urlFromKey("a,:https://host/path?q=1") == "https://host/path?q=1");
  CHECK(ArxCache2Parser::urlFromKey(":http://plain.example/") == "http://plain.example/");
  CHECK(ArxCache2Parser::urlFromKey("O^partitionKey=%28https%2Cexample.com%29,a,:https://cdn.example/x.js")
      == "https://cdn.example/x.js");
  CHECK(ArxCache2Parser::urlFromKey("predictor-origin,:") == "");
}
