/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "arx/utilities/ArxUtilities.h"
#include "arx/utilities/ArxHashCalculator.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxResult.h"

#include "catch.hpp"
#include "runner.h"

TEST_CASE("logical paths", "[utilities]") {
  CHECK(ArxUtilities::normalizeLogicalPath("") == "/");
  CHECK(ArxUtilities::normalizeLogicalPath("Users\\bob\\.\\NTUSER.DAT") == "/Users/bob/NTUSER.DAT");
  CHECK(ArxUtilities::normalizeLogicalPath("//home//alice/") == "/home/alice");
  CHECK(ArxUtilities::splitLogicalPath("/a/b/c").size() == 3);
  CHECK(ArxUtilities::joinLogicalPath("/", "etc") == "/etc");
  CHECK(ArxUtilities::joinLogicalPath("/etc", "passwd") == "/etc/passwd");
  CHECK(ArxUtilities::joinLogicalPath("/etc/", "passwd") == "/etc/passwd");
  CHECK(ArxUtilities::baseName("/home/alice/places.sqlite") == "places.sqlite");
  CHECK(ArxUtilities::baseName("/") == "");
}

TEST_CASE("ascii case folding", "[utilities]") {
  CHECK(ArxUtilities::toLowerAscii("ChRoMe") == "chrome");
  CHECK(ArxUtilities::toUpperAscii("scalpel_dir") == "SCALPEL_DIR");
  CHECK(ArxUtilities::stripQuotes("\"quoted\"") == "quoted");
  CHECK(ArxUtilities::stripQuotes("\"") == "\"");
}

TEST_CASE("byte helpers", "[utilities]") {
  const unsigned char bytes[] = {0x12, 0x34, 0x56, 0x78};
  CHECK(ArxUtilities::hexEncode(bytes, 4) == "12345678");
  CHECK(ArxUtilities::readBigEndian32(bytes) == 0x12345678u);
  CHECK(ArxUtilities::readLittleEndian32(bytes) == 0x78563412u);
  CHECK(ArxUtilities::sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("hashFile computes md5 and sha256", "[utilities]") {
  runner::tempdir dir("arx_hash");
  runner::write_file(dir.path / "abc.txt", "abc");
  ArxFileDigest digest = ArxHashCalculator::hashFile((dir.path / "abc.txt").string());
  CHECK(digest.bytes == 3);
  CHECK(digest.md5 == "900150983cd24fb0d6963f7d28e17f72");
  CHECK(digest.sha256 == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  CHECK_THROWS_AS(ArxHashCalculator::hashFile((dir.path / "missing").string()), ArxCandidateReadException);
}

TEST_CASE("exception names", "[utilities]") {
  ArxChecksumMismatchException ex("bad hash");
  CHECK(ex.message() == "bad hash");
  CHECK(std::string(ex.what()).find("bad hash") != std::string::npos);
  try {
    throw ex;
  } catch (ArxParseException& caught) {
    CHECK(caught.message() == "bad hash");
  }
}

TEST_CASE("result holds a value or an error", "[utilities]") {
  ArxResult<int> good(7);
  REQUIRE(good.ok());
  CHECK(good.value() == 7);
  CHECK_THROWS_AS(good.error(), ArxException);

  ArxResult<int> bad = ArxResult<int>::failure("truncated_record", "binary", "short read");
  REQUIRE_FALSE(bad.ok());
  CHECK(bad.error().warningType == "truncated_record");
  CHECK(bad.error().category == "binary");
  CHECK_THROWS_AS(bad.value(), ArxException);
}
