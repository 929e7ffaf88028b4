/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "arx/extraction/ArxStagingEngine.h"
#include "arx/discovery/ArxDiscovery.h"
#include "arx/utilities/ArxUtilities.h"

#include <iomanip>
#include <sstream>

#include "catch.hpp"
#include "runner.h"
#include "arx/fixtures.h"

namespace {
  const int64_t EVIDENCE_ID = 11;

  ArxStagingRequest make_request(const std::string& run_id, const std::string& artifact_type,
      ArxArtifactType::CompanionPolicy companions) {
    ArxStagingRequest request;
    request.evidenceId = EVIDENCE_ID;
    request.runId = run_id;
    request.extractorName = artifact_type;
    request.extractorVersion = "1.0.0";
    request.artifactType = artifact_type;
    request.companions = companions;
    return request;
  }

  // count PNG files below root/docs.
  void make_images(const std::filesystem::path& root, int count) {
    for (int i = 0; i < count; i++) {
      std::ostringstream name;
      name << "docs/file" << std::setw(3) << std::setfill('0') << i << ".bin";
      runner::write_file(root / name.str(), fixtures::png_bytes(name.str() + std::string(5000, 'x')));
    }
  }

  size_t count_files(const std::filesystem::path& dir) {
    size_t n = 0;
    if (!std::filesystem::exists(dir)) {
      return 0;
    }
    for (const auto& item : std::filesystem::directory_iterator(dir)) {
      if (item.is_regular_file()) {
        n++;
      }
    }
    return n;
  }
}

TEST_CASE("destination names", "[staging]") {
  ArxCandidateArtifact c;
  c.partitionIndex = 2;
  c.logicalPath = "/Users/bob/History";
  std::string name = ArxStagingEngine::destinationName(c);
  CHECK(name == "p2_" + ArxUtilities::sha256Hex("/Users/bob/History").substr(0, 8) + "_History");
  CHECK(ArxStagingEngine::runDirectory("/out", 3, "chromium_history", "r1") == "/out/evidence_3/chromium_history/r1/");
}

TEST_CASE("run status", "[staging]") {
  ArxStagingResult r;
  CHECK(ArxStagingEngine::runStatus(r) == "ok");
  r.primariesOk = 2;
  r.entriesOk = 2;
  r.entriesFailed = 1;
  CHECK(ArxStagingEngine::runStatus(r) == "degraded");
  r.primariesOk = 0;
  r.primariesFailed = 1;
  CHECK(ArxStagingEngine::runStatus(r) == "failed");
  r.cancelled = true;
  CHECK(ArxStagingEngine::runStatus(r) == "cancelled");
}

TEST_CASE("sqlite companions travel with their primary", "[staging]") {
  runner::tempdir dir("arx_staging");
  std::filesystem::path evidence = dir.path / "evidence";
  std::string profile = "Users/bob/AppData/Local/Google/Chrome/User Data/Default/";
  runner::write_file(evidence / (profile + "History"), "main database");
  runner::write_file(evidence / (profile + "History-wal"), "wal frames");
  runner::write_file(evidence / (profile + "History-journal"), "journal");

  ArxEvidenceFSDirectory fs(evidence.string());
  ArxPatternSet patterns = fixtures::test_patterns();
  ArxConfig config = fixtures::make_config(dir.path / "out", 4);
  auto db = fixtures::open_db(dir.path / "out" / "arx.db");

  ArxDiscovery discovery(fs, patterns, NULL, config);
  std::vector<ArxCandidateArtifact> candidates = discovery.discover(EVIDENCE_ID, "chromium_history", {});
  REQUIRE(candidates.size() == 1);

  ArxCancellationToken cancel;
  ArxStagingEngine engine(fs, config, db.get());
  ArxStagingResult result = engine.extract(candidates,
    make_request("run-c", "chromium_history", ArxArtifactType::COMPANIONS_SQLITE), cancel);

  CHECK(result.manifest.status == "ok");
  CHECK(result.primariesOk == 1);
  CHECK(result.entriesOk == 3);
  REQUIRE(result.manifest.files.size() == 3);

  std::vector<ArxManifestEntry> primaries = result.manifest.primaryEntries();
  REQUIRE(primaries.size() == 1);
  std::vector<ArxManifestEntry> companions = result.manifest.companionsOf(primaries[0]);
  REQUIRE(companions.size() == 2);
  CHECK(companions[0].role == "journal");
  CHECK(companions[1].role == "wal");
  CHECK(companions[1].destRelPath == primaries[0].destRelPath + "-wal");
  CHECK(companions[1].sha256 == ArxUtilities::sha256Hex("wal frames"));
  CHECK(runner::file_contents(std::filesystem::path(result.runDir) / companions[1].destRelPath) == "wal frames");

  CHECK(std::filesystem::exists(result.manifestPath));
  CHECK(db->getExtractedFiles("run-c").size() == 3);
}

TEST_CASE("one unreadable file degrades the run", "[staging]") {
  runner::tempdir dir("arx_staging");
  std::filesystem::path evidence = dir.path / "evidence";
  make_images(evidence, 9);
  runner::write_file(evidence / "docs/broken.bin", fixtures::png_bytes("broken"));

  fixtures::FaultyEvidenceFS fs(evidence.string(), "broken");
  ArxPatternSet patterns = fixtures::test_patterns();
  ArxConfig config = fixtures::make_config(dir.path / "out", 4);
  auto db = fixtures::open_db(dir.path / "out" / "arx.db");

  std::vector<ArxCandidateArtifact> candidates =
    ArxDiscovery(fs, patterns, NULL, config).discover(EVIDENCE_ID, "documents", {});
  REQUIRE(candidates.size() == 10);

  ArxCancellationToken cancel;
  ArxStagingResult result = ArxStagingEngine(fs, config, db.get()).extract(candidates,
    make_request("run-d", "documents", ArxArtifactType::COMPANIONS_NONE), cancel);

  CHECK(result.manifest.status == "degraded");
  CHECK(result.entriesOk == 9);
  CHECK(result.entriesFailed == 1);
  REQUIRE(result.manifest.files.size() == 10);

  size_t failed = 0;
  for (const ArxManifestEntry& e : result.manifest.files) {
    if (e.status == ArxManifestEntry::STATUS_FAILED) {
      failed++;
      CHECK(runner::contains(e.source.logicalPath, "broken"));
      CHECK(runner::contains(e.errorMessage, "injected read failure"));
      CHECK(e.sha256.empty());
    } else {
      CHECK(e.sha256.size() == 64);
      CHECK(e.md5.size() == 32);
    }
  }
  CHECK(failed == 1);
  CHECK(count_files(std::filesystem::path(result.runDir) / "extracted") == 9);
  CHECK(db->getExtractedFiles("run-d").size() == 10);
}

TEST_CASE("cancellation stops between files and leaves no partial copies", "[staging]") {
  runner::tempdir dir("arx_staging");
  std::filesystem::path evidence = dir.path / "evidence";
  make_images(evidence, 100);

  ArxCancellationToken cancel;
  // The token is cancelled while the 40th file is being opened.
  fixtures::FaultyEvidenceFS fs(evidence.string(), "", &cancel, 40);
  ArxPatternSet patterns = fixtures::test_patterns();
  ArxConfig config = fixtures::make_config(dir.path / "out", 8);
  auto db = fixtures::open_db(dir.path / "out" / "arx.db");

  std::vector<ArxCandidateArtifact> candidates =
    ArxDiscovery(fs, patterns, NULL, config).discover(EVIDENCE_ID, "documents", {});
  REQUIRE(candidates.size() == 100);

  ArxStagingResult result = ArxStagingEngine(fs, config, db.get()).extract(candidates,
    make_request("run-x", "documents", ArxArtifactType::COMPANIONS_NONE), cancel);

  CHECK(result.cancelled);
  CHECK(result.manifest.status == "cancelled");
  CHECK(fs.opens() == 40);
  REQUIRE(result.manifest.files.size() == 39);
  for (const ArxManifestEntry& e : result.manifest.files) {
    CHECK(e.status == ArxManifestEntry::STATUS_OK);
  }
  CHECK(count_files(std::filesystem::path(result.runDir) / "extracted") == 39);

  ArxManifest saved = ArxManifest::load(result.manifestPath);
  CHECK(saved.status == "cancelled");
  CHECK(saved.files.size() == 39);
}

TEST_CASE("staging never modifies the evidence", "[staging]") {
  runner::tempdir dir("arx_staging");
  std::filesystem::path evidence = dir.path / "evidence";
  make_images(evidence, 5);
  std::string profile = "Users/bob/AppData/Local/Google/Chrome/User Data/Default/";
  runner::write_file(evidence / (profile + "History"), "db");
  runner::write_file(evidence / (profile + "History-wal"), "wal");
  auto before = fixtures::snapshot(evidence);

  ArxEvidenceFSDirectory fs(evidence.string());
  ArxPatternSet patterns = fixtures::test_patterns();
  ArxConfig config = fixtures::make_config(dir.path / "out", 2);
  auto db = fixtures::open_db(dir.path / "out" / "arx.db");
  ArxCancellationToken cancel;
  ArxDiscovery discovery(fs, patterns, NULL, config);
  ArxStagingEngine engine(fs, config, db.get());

  engine.extract(discovery.discover(EVIDENCE_ID, "documents", {}),
    make_request("run-1", "documents", ArxArtifactType::COMPANIONS_NONE), cancel);
  engine.extract(discovery.discover(EVIDENCE_ID, "chromium_history", {}),
    make_request("run-2", "chromium_history", ArxArtifactType::COMPANIONS_SQLITE), cancel);

  CHECK(fixtures::snapshot(evidence) == before);
}
