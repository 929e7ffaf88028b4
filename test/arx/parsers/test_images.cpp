/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "arx/parsers/ArxImageParser.h"
#include "arx/utilities/ArxUtilities.h"

#include "catch.hpp"
#include "runner.h"
#include "arx/fixtures.h"

namespace {
  ArxParseInput image_input(const runner::tempdir& run, const std::string& rel, const std::string& data) {
    runner::write_file(run.path / rel, data);
    ArxParseInput input;
    input.runDir = run.str();
    input.entry.destRelPath = rel;
    input.entry.destFilename = ArxUtilities::baseName(rel);
    input.entry.sizeBytes = (int64_t)data.size();
    input.entry.sha256 = ArxUtilities::sha256Hex(data);
    input.entry.source.partitionIndex = 0;
    input.entry.source.logicalPath = "/Users/bob/Pictures/cat.png";
    input.entry.source.inode = 4242;
    input.entry.source.mtime = ArxTimestamps::unixSecondsToUtc(1600000000);
    input.entry.role = "primary";
    input.artifactType = "filesystem_images";
    input.discoveredBy = "filesystem_images";
    return input;
  }
}

TEST_CASE("image format sniffing", "[parsers][images]") {
  CHECK(ArxImageParser::sniffFormat(fixtures::png_bytes("x")) == "png");
  CHECK(ArxImageParser::sniffFormat(std::string("\xFF\xD8\xFF\xE0", 4)) == "jpeg");
  CHECK(ArxImageParser::sniffFormat("GIF89a....") == "gif");
  CHECK(ArxImageParser::sniffFormat(std::string("RIFF\x10\0\0\0WEBPVP8 ", 16)) == "webp");
  CHECK(ArxImageParser::sniffFormat(std::string("II*\0", 4)) == "tiff");
  CHECK(ArxImageParser::sniffFormat(std::string("\0\0\1\0\1\0", 6)) == "ico");
  CHECK(ArxImageParser::sniffFormat(std::string("BM") + std::string(14, '\0')) == "bmp");
  CHECK(ArxImageParser::sniffFormat("BM") == "");
  CHECK(ArxImageParser::sniffFormat("%PDF-1.7") == "");
}

TEST_CASE("staged image record", "[parsers][images]") {
  runner::tempdir run("arx_images");
  std::string data = fixtures::png_bytes("kitten");
  ArxParseInput input = image_input(run, "extracted/p0_12345678_cat.png", data);

  ArxParseResult result = ArxImageParser().parse(input);
  REQUIRE(result.records.size() == 1);
  CHECK(result.warnings.empty());

  const ArxImageRecord& image = std::get<ArxImageRecord>(result.records[0]);
  CHECK(image.format == "png");
  CHECK(image.sha256 == ArxUtilities::sha256Hex(data));
  CHECK(image.md5.size() == 32);
  CHECK(image.sizeBytes == (int64_t)data.size());
  CHECK(image.filename == "cat.png");
  CHECK(image.relPath == "extracted/p0_12345678_cat.png");
  CHECK(image.fsPath == "/Users/bob/Pictures/cat.png");
  CHECK(image.fsInode == 4242);
  CHECK(image.fsMtime.toIso() == "2020-09-13T12:26:40.000000Z");
  CHECK(image.carvedOffsetBytes == -1);
}

TEST_CASE("carved image record", "[parsers][images]") {
  runner::tempdir run("arx_images");
  ArxParseInput input = image_input(run, "carved/p0_unalloc/png-0-0/00000001.png", fixtures::png_bytes("carved"));
  input.entry.role = "carved";
  input.entry.sourceOffsetBytes = 8192;

  ArxParseResult result = ArxImageParser().parse(input);
  REQUIRE(result.records.size() == 1);
  const ArxImageRecord& image = std::get<ArxImageRecord>(result.records[0]);
  CHECK(image.filename == "00000001.png");
  CHECK(image.carvedOffsetBytes == 8192);
}

TEST_CASE("image files that cannot be used", "[parsers][images]") {
  runner::tempdir run("arx_images");

  SECTION("changed after extraction") {
    ArxParseInput input = image_input(run, "extracted/p0_12345678_cat.png", fixtures::png_bytes("kitten"));
    runner::write_file(run.path / "extracted/p0_12345678_cat.png", fixtures::png_bytes("tampered"));
    ArxParseResult result = ArxImageParser().parse(input);
    CHECK(result.records.empty());
    CHECK(result.failedRecords == 1);
    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings[0].warningType == "hash_mismatch");
  }

  SECTION("not an image") {
    ArxParseResult result = ArxImageParser().parse(image_input(run, "extracted/p0_0_notes.png", "just some text here"));
    CHECK(result.records.empty());
    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings[0].warningType == "unrecognized_format");
  }

  SECTION("missing staged file") {
    ArxParseInput input = image_input(run, "extracted/gone.png", fixtures::png_bytes("x"));
    std::filesystem::remove(run.path / "extracted/gone.png");
    ArxParseResult result = ArxImageParser().parse(input);
    CHECK(result.records.empty());
    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings[0].warningType == "file_corrupt");
  }
}
