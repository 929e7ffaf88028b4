/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "arx/discovery/ArxBodyfileImporter.h"
#include "arx/utilities/ArxException.h"

#include <sstream>

#include "catch.hpp"
#include "runner.h"
#include "arx/fixtures.h"

namespace {
  const char * BODYFILE =
    "0|C:/Users/bob/AppData/Local/Google/Chrome/User Data/Default/History|1234-128-4|r/rrwxrwxrwx|0|0|163840|1600000000|1600000100|1600000200|1599999000\n"
    "0|C:/Users/bob/AppData/Local/Google/Chrome/User Data/Default/History ($FILE_NAME)|1234-48-2|r/rrwxrwxrwx|0|0|163840|1600000000|1600000100|1600000200|1599999000\n"
    "0|C:/Users/bob|88-144-1|d/drwxrwxrwx|0|0|4096|1600000000|1600000100|1600000200|1599999000\n"
    "d41d8cd98f00b204e9800998ECF8427E|C:/Users/bob/old|weird.png (deleted)|99|r/rrwxrwxrwx|0|0|42|0|1600000100|0|0\n"
    "this line is not a bodyfile line\n"
    "\n";
}

TEST_CASE("bodyfile import", "[bodyfile]") {
  runner::tempdir dir("arx_bodyfile");
  auto db = fixtures::open_db(dir.path / "arx.db");
  ArxBodyfileImporter importer(*db);

  std::istringstream input(BODYFILE);
  ArxBodyfileImporter::Stats stats = importer.import(input, "test.body", 5, 2);
  CHECK(stats.imported == 2);
  CHECK(stats.skipped == 2);
  CHECK(stats.malformed == 1);

  std::vector<ArxFileListRow> rows = db->queryFileList(5, 2, "%");
  REQUIRE(rows.size() == 2);

  const ArxFileListRow& history = rows[0];
  CHECK(history.entry.logicalPath == "/Users/bob/AppData/Local/Google/Chrome/User Data/Default/History");
  CHECK(history.entry.name == "History");
  CHECK(history.entry.inode == 1234);
  CHECK(history.entry.size == 163840);
  CHECK(history.entry.mtime.toIso() == "2020-09-13T12:28:20.000000Z");
  CHECK_FALSE(history.entry.deleted);
  CHECK(history.md5 == "");
  CHECK(history.importSource == ArxBodyfileImporter::importSourceFor(2));

  const ArxFileListRow& deleted = rows[1];
  CHECK(deleted.entry.logicalPath == "/Users/bob/old|weird.png");
  CHECK(deleted.entry.deleted);
  CHECK(deleted.extension == "png");
  CHECK(deleted.md5 == "d41d8cd98f00b204e9800998ecf8427e");
  CHECK_FALSE(deleted.entry.atime.isKnown());
}

TEST_CASE("bodyfile reimport replaces one partition only", "[bodyfile]") {
  runner::tempdir dir("arx_bodyfile");
  auto db = fixtures::open_db(dir.path / "arx.db");
  ArxBodyfileImporter importer(*db);

  std::istringstream first(BODYFILE);
  importer.import(first, "p0.body", 5, 0);
  std::istringstream second(BODYFILE);
  importer.import(second, "p1.body", 5, 1);
  CHECK(db->countFileList(5) == 4);

  std::istringstream again(BODYFILE);
  importer.import(again, "p1.body", 5, 1);
  CHECK(db->countFileList(5) == 4);

  CHECK_THROWS_AS(importer.importFile((dir.path / "missing.body").string(), 5, 0), ArxSourceUnavailableException);
}
