/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "arx/parsers/ArxFirefoxBookmarkBackupParser.h"
#include "arx/parsers/ArxMozLz4.h"

#include "catch.hpp"
#include "runner.h"
#include "arx/fixtures.h"

namespace {
  ArxParseInput backup_input(const runner::tempdir& run, const std::string& data) {
    const std::string rel = "extracted/p1_00c0ffee_bookmarks-2024-01-01.jsonlz4";
    runner::write_file(run.path / rel, data);
    ArxParseInput input;
    input.runDir = run.str();
    input.entry.destRelPath = rel;
    input.entry.destFilename = "p1_00c0ffee_bookmarks-2024-01-01.jsonlz4";
    input.entry.source.partitionIndex = 1;
    input.entry.source.logicalPath = "/home/alice/.mozilla/firefox/abc.default/bookmarkbackups/bookmarks-2024-01-01.jsonlz4";
    input.entry.source.browser = "firefox";
    input.entry.source.profile = "abc.default";
    input.artifactType = "firefox_bookmark_backup";
    input.discoveredBy = "firefox_bookmarks";
    return input;
  }
}

TEST_CASE("firefox bookmark backup", "[parsers][bookmarks]") {
  runner::tempdir run("arx_bookmarks");
  ArxParseInput input = backup_input(run, fixtures::bookmark_backup({"https://one.example/", "https://two.example/"}));

  ArxParseResult result = ArxFirefoxBookmarkBackupParser().parse(input);
  REQUIRE(result.records.size() == 2);
  CHECK(result.warnings.empty());

  const ArxBookmarkRecord& first = std::get<ArxBookmarkRecord>(result.records[0]);
  CHECK(first.url == "https://one.example/");
  CHECK(first.title == "Bookmark 0");
  CHECK(first.guid == "bookmark0");
  CHECK(first.folderPath == "Bookmarks Toolbar");
  CHECK(first.dateAdded.toIso() == "2023-11-14T22:13:20.123456Z");
  CHECK(first.lastModified.toIso() == "2023-11-14T22:13:21.000000Z");
  CHECK(first.source.profile == "abc.default");
  CHECK(first.source.discoveredBy == "firefox_bookmarks");
  CHECK(std::get<ArxBookmarkRecord>(result.records[1]).url == "https://two.example/");
}

TEST_CASE("bookmark json with nested folders and unknown keys", "[parsers][bookmarks]") {
  runner::tempdir run("arx_bookmarks");
  ArxParseInput input = backup_input(run, "");

  const std::string json =
    "{\"guid\":\"root________\",\"type\":\"text/x-moz-place-container\",\"root\":\"placesRoot\",\"children\":["
    "{\"guid\":\"menu________\",\"title\":\"menu\",\"type\":\"text/x-moz-place-container\",\"root\":\"bookmarksMenuFolder\","
    "\"children\":[{\"title\":\"Work\",\"type\":\"text/x-moz-place-container\",\"children\":["
    "{\"title\":\"Wiki\",\"type\":\"text/x-moz-place\",\"uri\":\"https://wiki.example/\",\"keyword\":\"w\","
    "\"tags\":\"work,docs\",\"sparkle\":1},"
    "{\"type\":\"text/x-moz-place-separator\"},"
    "{\"title\":\"Odd\",\"type\":\"text/x-moz-place-livemark\"},"
    "{\"title\":\"No uri\",\"type\":\"text/x-moz-place\"}]}]}]}";

  ArxParseResult result = ArxFirefoxBookmarkBackupParser().parseJson(input, json);
  REQUIRE(result.records.size() == 1);
  const ArxBookmarkRecord& wiki = std::get<ArxBookmarkRecord>(result.records[0]);
  CHECK(wiki.folderPath == "Bookmarks Menu/Work");
  CHECK(wiki.keyword == "w");
  CHECK(wiki.tags == "work,docs");
  CHECK_FALSE(wiki.dateAdded.isKnown());

  REQUIRE(result.warnings.size() == 2);
  CHECK(result.warnings[0].warningType == "json_unknown_key");
  CHECK(result.warnings[0].itemName == "sparkle");
  CHECK(result.warnings[1].warningType == "unknown_enum_value");
  CHECK(result.warnings[1].itemName == "text/x-moz-place-livemark");
}

TEST_CASE("unreadable bookmark backups", "[parsers][bookmarks]") {
  runner::tempdir run("arx_bookmarks");

  SECTION("corrupt lz4 block") {
    std::string data = fixtures::bookmark_backup({"https://one.example/"});
    data.resize(ArxMozLz4::HEADER_SIZE + 4);
    ArxParseResult result = ArxFirefoxBookmarkBackupParser().parse(backup_input(run, data));
    CHECK(result.records.empty());
    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings[0].warningType == "compression_error");
  }

  SECTION("invalid json") {
    ArxParseResult result = ArxFirefoxBookmarkBackupParser().parse(backup_input(run, ArxMozLz4::compress("{\"children\": [")));
    CHECK(result.records.empty());
    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings[0].warningType == "json_parse_error");
    CHECK(result.warnings[0].severity == ArxExtractionWarning::ERROR);
  }
}
