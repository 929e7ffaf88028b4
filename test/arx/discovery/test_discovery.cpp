/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "arx/discovery/ArxDiscovery.h"
#include "arx/discovery/ArxBodyfileImporter.h"
#include "arx/discovery/ArxFileIndexBuilder.h"
#include "arx/fs/ArxEvidenceFSDirectory.h"
#include "arx/utilities/ArxException.h"

#include <sstream>

#include "catch.hpp"
#include "runner.h"
#include "arx/fixtures.h"

namespace {
  const int64_t EVIDENCE_ID = 3;

  // Two partitions: a Windows style volume and a Linux home volume.
  void make_evidence(const std::filesystem::path& root) {
    runner::write_file(root / "p0/Users/bob/AppData/Local/Google/Chrome/User Data/Default/History", "h");
    runner::write_file(root / "p0/Users/bob/AppData/Local/Google/Chrome/User Data/Profile 1/History", "h");
    runner::write_file(root / "p0/Users/bob/AppData/Local/Google/Chrome/User Data/Profile 1/History-wal", "w");
    runner::write_file(root / "p0/Users/bob/Pictures/cat.PNG", fixtures::png_bytes("cat"));
    runner::write_file(root / "p0/Windows/System32/icon.png", fixtures::png_bytes("icon"));
    runner::write_file(root / "p1/home/alice/.mozilla/firefox/abcd.default/places.sqlite", "p");
    runner::write_file(root / "p1/home/alice/pics/dog.jpg", "\xFF\xD8\xFF\xE0");
    runner::write_file(root / "p1/home/alice/notes.txt", "n");
  }

  std::vector<std::string> paths_of(const std::vector<ArxCandidateArtifact>& candidates) {
    std::vector<std::string> paths;
    for (const auto& c : candidates) {
      std::ostringstream p;
      p << c.partitionIndex << ":" << c.logicalPath;
      paths.push_back(p.str());
    }
    return paths;
  }
}

TEST_CASE("walk discovery", "[discovery]") {
  runner::tempdir dir("arx_discovery");
  make_evidence(dir.path);
  std::vector<std::string> roots = {(dir.path / "p0").string(), (dir.path / "p1").string()};
  ArxEvidenceFSDirectory fs(roots);
  ArxPatternSet patterns = fixtures::test_patterns();
  ArxConfig config = fixtures::make_config(dir.path / "out");

  ArxDiscovery discovery(fs, patterns, NULL, config);
  CHECK(discovery.resolveMode(EVIDENCE_ID) == ArxDiscovery::MODE_WALK);

  std::vector<ArxCandidateArtifact> history = discovery.discover(EVIDENCE_ID, "chromium_history", {});
  REQUIRE(history.size() == 2);
  CHECK(history[0].logicalPath == "/Users/bob/AppData/Local/Google/Chrome/User Data/Default/History");
  CHECK(history[0].profile == "Default");
  CHECK(history[0].browser == "chrome");
  CHECK(history[0].artifactType == "chromium_history");
  CHECK(history[0].evidenceId == EVIDENCE_ID);
  CHECK(history[0].size == 1);
  CHECK(history[1].profile == "Profile 1");

  std::vector<ArxCandidateArtifact> images = discovery.discover(EVIDENCE_ID, "filesystem_images", {});
  std::vector<std::string> expected = {
    "0:/Users/bob/Pictures/cat.PNG",
    "0:/Windows/System32/icon.png",
    "1:/home/alice/pics/dog.jpg"
  };
  CHECK(paths_of(images) == expected);

  std::vector<ArxCandidateArtifact> only_p1 = discovery.discover(EVIDENCE_ID, "filesystem_images", {1});
  REQUIRE(only_p1.size() == 1);
  CHECK(only_p1[0].partitionIndex == 1);

  CHECK_THROWS_AS(discovery.discover(EVIDENCE_ID, "safari_history", {}), ArxConfigurationException);
  CHECK_THROWS_AS(discovery.discover(EVIDENCE_ID, "filesystem_images", {5}), ArxSourceUnavailableException);
  CHECK_THROWS_AS(discovery.discover(EVIDENCE_ID, "filesystem_images", {}, ArxDiscovery::MODE_INDEX),
    ArxConfigurationException);
}

TEST_CASE("index and walk discovery agree", "[discovery]") {
  runner::tempdir dir("arx_discovery");
  make_evidence(dir.path);
  std::vector<std::string> roots = {(dir.path / "p0").string(), (dir.path / "p1").string()};
  ArxEvidenceFSDirectory fs(roots);
  ArxPatternSet patterns = fixtures::test_patterns();
  ArxConfig config = fixtures::make_config(dir.path / "out");
  config.useFileIndex = true;
  auto db = fixtures::open_db(dir.path / "out" / "arx.db");

  ArxFileIndexBuilder builder(fs, *db);
  int64_t rows = builder.build(EVIDENCE_ID, "");
  CHECK(rows == db->countFileList(EVIDENCE_ID));
  CHECK(rows > 8);

  ArxDiscovery discovery(fs, patterns, db.get(), config);
  CHECK(discovery.resolveMode(EVIDENCE_ID) == ArxDiscovery::MODE_INDEX);
  CHECK(discovery.resolveMode(EVIDENCE_ID + 1) == ArxDiscovery::MODE_WALK);

  for (const std::string& type : patterns.artifactTypeNames()) {
    std::vector<ArxCandidateArtifact> walked = discovery.discover(EVIDENCE_ID, type, {}, ArxDiscovery::MODE_WALK);
    std::vector<ArxCandidateArtifact> indexed = discovery.discover(EVIDENCE_ID, type, {}, ArxDiscovery::MODE_INDEX);
    INFO("artifact type " << type);
    CHECK(paths_of(walked) == paths_of(indexed));
    for (size_t i = 0; i < walked.size() && i < indexed.size(); i++) {
      CHECK(walked[i].profile == indexed[i].profile);
      CHECK(walked[i].browser == indexed[i].browser);
      CHECK(walked[i].size == indexed[i].size);
    }
  }

  // Rebuilding replaces rows instead of adding to them.
  CHECK(builder.build(EVIDENCE_ID, "") == rows);
  CHECK(db->countFileList(EVIDENCE_ID) == rows);
}

TEST_CASE("partitions without index rows are walked", "[discovery]") {
  runner::tempdir dir("arx_discovery");
  make_evidence(dir.path);
  std::vector<std::string> roots = {(dir.path / "p0").string(), (dir.path / "p1").string()};
  ArxEvidenceFSDirectory fs(roots);
  ArxPatternSet patterns = fixtures::test_patterns();
  ArxConfig config = fixtures::make_config(dir.path / "out");
  config.useFileIndex = true;
  auto db = fixtures::open_db(dir.path / "out" / "arx.db");

  // The bodyfile of partition 0 predates icon.png; partition 1 has none.
  std::istringstream body(
    "0|C:/Users/bob/Pictures/cat.PNG|77-128-1|r/rrwxrwxrwx|0|0|19|1600000000|1600000100|1600000200|1599999000\n");
  ArxBodyfileImporter importer(*db);
  REQUIRE(importer.import(body, "p0.body", EVIDENCE_ID, 0).imported == 1);

  ArxDiscovery discovery(fs, patterns, db.get(), config);
  CHECK(discovery.resolveMode(EVIDENCE_ID) == ArxDiscovery::MODE_INDEX);
  CHECK(discovery.resolveMode(EVIDENCE_ID, 0) == ArxDiscovery::MODE_INDEX);
  CHECK(discovery.resolveMode(EVIDENCE_ID, 1) == ArxDiscovery::MODE_WALK);

  std::vector<std::string> expected = {
    "0:/Users/bob/Pictures/cat.PNG",
    "1:/home/alice/pics/dog.jpg"
  };
  CHECK(paths_of(discovery.discover(EVIDENCE_ID, "filesystem_images", {})) == expected);

  std::vector<ArxCandidateArtifact> places = discovery.discover(EVIDENCE_ID, "firefox_history", {});
  REQUIRE(places.size() == 1);
  CHECK(places[0].partitionIndex == 1);
}

TEST_CASE("file extensions", "[discovery]") {
  CHECK(ArxFileIndexBuilder::extensionOf("cat.PNG") == "png");
  CHECK(ArxFileIndexBuilder::extensionOf("archive.tar.gz") == "gz");
  CHECK(ArxFileIndexBuilder::extensionOf("History") == "");
  CHECK(ArxFileIndexBuilder::extensionOf(".bashrc") == "");
}
