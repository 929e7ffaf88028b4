/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "arx/framework.h"

#include <algorithm>
#include <sstream>

#include "catch.hpp"
#include "runner.h"
#include "arx/fixtures.h"

namespace {
  const int64_t EVIDENCE = 21;
  const char * CHROME_PROFILE = "p0/Users/bob/AppData/Local/Google/Chrome/User Data/Default";
  const char * FIREFOX_PROFILE = "p1/home/alice/.mozilla/firefox/abc.default";
  const char * FIREFOX_CACHE = "p1/home/alice/.cache/mozilla/firefox/abc.default/cache2/entries";

  /* Windows partition with Chrome, Linux partition with Firefox, and the
   * same picture on both and in the Firefox cache. */
  void make_evidence(const std::filesystem::path& root) {
    fixtures::make_chromium_history(root / CHROME_PROFILE / "History", {
      {"https://news.example/", "News", 13300000000000000LL, 1},
      {"https://mail.example/", "Mail", 13300000001000000LL, 0},
      {"https://shared.example/", "Shared", 13300000002000000LL, 0},
    }, 1);
    fixtures::make_firefox_places(root / FIREFOX_PROFILE / "places.sqlite", {
      {"https://shared.example/", "Shared", 1700000000000000LL, 1},
      {"https://docs.example/", "Docs", 1700000001000000LL, 2},
    });
    runner::write_file(root / FIREFOX_PROFILE / "bookmarkbackups/bookmarks-2024-01-01.jsonlz4",
        fixtures::bookmark_backup({"https://shared.example/", "https://bank.example/"}));

    runner::write_file(root / FIREFOX_CACHE / "0A1B2C3D",
        fixtures::cache2_entry("https://cdn.example/app.js", "console.log(1)",
            "HTTP/1.1 200 OK\r\nContent-Type: application/javascript\r\n"));
    std::string corrupt = fixtures::cache2_entry("https://cdn.example/broken.css", "body{}",
        "HTTP/1.1 200 OK\r\nContent-Type: text/css\r\n");
    corrupt[corrupt.size() - 9] ^= 0x20;
    runner::write_file(root / FIREFOX_CACHE / "DEADBEEF", corrupt);
    runner::write_file(root / FIREFOX_CACHE / "CAFE0001",
        fixtures::cache2_entry("https://cdn.example/img/cat.png", fixtures::png_bytes("cat"),
            "HTTP/1.1 200 OK\r\nContent-Type: image/png\r\n"));

    runner::write_file(root / "p0/Users/bob/Pictures/cat.png", fixtures::png_bytes("cat"));
    runner::write_file(root / "p1/home/alice/pics/cat-copy.png", fixtures::png_bytes("cat"));
    runner::write_file(root / "p1/home/alice/pics/dog.png", fixtures::png_bytes("dog"));
  }

  struct pipeline_env {
    pipeline_env()
      : evidence("arx_pipeline_evidence"), out("arx_pipeline_out"),
        config(fixtures::make_config(out.path, 2)), patterns(fixtures::test_patterns()) {
      make_evidence(evidence.path);
      db = fixtures::open_db(out.path / "arx.db");
      std::vector<std::string> roots = {(evidence.path / "p0").string(), (evidence.path / "p1").string()};
      fs.reset(new ArxEvidenceFSDirectory(roots));
    }

    runner::tempdir evidence;
    runner::tempdir out;
    ArxConfig config;
    ArxPatternSet patterns;
    ArxParserRegistry parsers;
    std::unique_ptr<ArxImgDBSqlite> db;
    std::unique_ptr<ArxEvidenceFSDirectory> fs;
  };

  const ArxRunOutcome& outcome_of(const std::vector<ArxRunOutcome>& outcomes, const std::string& name) {
    for (size_t i = 0; i < outcomes.size(); i++) {
      if (outcomes[i].extractorName == name) {
        return outcomes[i];
      }
    }
    throw std::runtime_error("no outcome for " + name);
  }

  std::string sha256_of(const std::string& data) {
    ArxHashCalculator hash;
    hash.update(data.data(), data.size());
    hash.finish();
    return hash.sha256();
  }

  /* Stored content without row ids or run ids, sorted. */
  std::vector<std::string> stored_content(const ArxImgDB& db) {
    std::vector<std::string> rows;
    for (const auto& row : db.getHistory(EVIDENCE)) {
      const ArxHistoryVisitRecord& h = row.record;
      std::stringstream line;
      line << "history|" << h.source.discoveredBy << "|" << h.source.sourcePath << "|" << h.url << "|" << h.title
           << "|" << h.visitTime.toIso() << "|" << h.visitCount << "|" << h.typedCount << "|" << h.transition;
      rows.push_back(line.str());
    }
    for (const auto& row : db.getBookmarks(EVIDENCE)) {
      const ArxBookmarkRecord& b = row.record;
      rows.push_back("bookmark|" + b.source.discoveredBy + "|" + b.url + "|" + b.title + "|" + b.folderPath
          + "|" + b.dateAdded.toIso());
    }
    for (const auto& row : db.getCacheEntries(EVIDENCE)) {
      const ArxCacheEntryRecord& c = row.record;
      std::stringstream line;
      line << "cache|" << c.source.discoveredBy << "|" << c.url << "|" << c.cacheKey << "|" << c.fetchCount
           << "|" << c.bodySha256;
      rows.push_back(line.str());
    }
    for (const auto& row : db.getImageDiscoveries(EVIDENCE)) {
      const ArxImageRecord& i = row.record;
      rows.push_back("image|" + i.source.discoveredBy + "|" + i.sha256 + "|" + i.fsPath + "|" + i.cacheUrl);
    }
    for (const ArxUrlRow& url : db.getUrls(EVIDENCE)) {
      std::stringstream line;
      line << "url|" << url.url << "|" << url.occurrenceCount << "|" << url.sources;
      rows.push_back(line.str());
    }
    std::sort(rows.begin(), rows.end());
    return rows;
  }

  std::vector<std::string> history_urls(const ArxImgDB& db, const std::string& discovered_by) {
    std::vector<std::string> urls;
    for (const auto& row : db.getHistory(EVIDENCE)) {
      if (row.record.source.discoveredBy == discovered_by) {
        urls.push_back(row.record.url);
      }
    }
    std::sort(urls.begin(), urls.end());
    return urls;
  }

  bool has_warning(const ArxWarningList& warnings, const std::string& type) {
    for (size_t i = 0; i < warnings.size(); i++) {
      if (warnings[i].warningType == type) {
        return true;
      }
    }
    return false;
  }
}

TEST_CASE("pipeline configuration", "[pipeline]") {
  pipeline_env env;
  ArxPipeline pipeline(env.config, env.patterns, env.parsers, *env.db);

  pipeline.initialize(fixtures::TEST_PIPELINE_XML);
  REQUIRE(pipeline.extractors().size() == 5);
  CHECK(pipeline.extractors()[0].name == "chromium_history");
  CHECK(pipeline.extractor("firefox_cache").parser == "firefox_cache2");
  CHECK_FALSE(pipeline.extractor("filesystem_images").carve);
  CHECK_THROWS_AS(pipeline.extractor("nope"), ArxConfigurationException);

  SECTION("invalid documents") {
    const char * bad[] = {
      "",
      "<PIPELINE><EXTRACTOR order=\"2\" name=\"a\" version=\"1\" artifactType=\"chromium_history\" parser=\"chromium_history\"/>"
        "<EXTRACTOR order=\"1\" name=\"b\" version=\"1\" artifactType=\"chromium_history\" parser=\"chromium_history\"/></PIPELINE>",
      "<PIPELINE><EXTRACTOR order=\"1\" name=\"a\" version=\"1\" artifactType=\"chromium_history\" parser=\"chromium_history\"/>"
        "<EXTRACTOR order=\"2\" name=\"a\" version=\"1\" artifactType=\"chromium_history\" parser=\"chromium_history\"/></PIPELINE>",
      "<PIPELINE><EXTRACTOR order=\"x\" name=\"a\" version=\"1\" artifactType=\"chromium_history\" parser=\"chromium_history\"/></PIPELINE>",
      "<PIPELINE><EXTRACTOR order=\"1\" name=\"a\" version=\"1\" artifactType=\"edge_history\" parser=\"chromium_history\"/></PIPELINE>",
      "<PIPELINE><EXTRACTOR order=\"1\" name=\"a\" version=\"1\" artifactType=\"chromium_history\" parser=\"safari\"/></PIPELINE>",
      "<PIPELINE><EXTRACTOR order=\"1\" name=\"a\" version=\"1\" artifactType=\"chromium_history\" parser=\"firefox_cache2\"/></PIPELINE>",
      "<PIPELINE><EXTRACTOR order=\"1\"",
    };
    for (const char * doc : bad) {
      INFO(doc);
      CHECK_THROWS_AS(pipeline.initialize(doc), ArxConfigurationException);
    }
    // A rejected document leaves the previous extractors in place.
    CHECK(pipeline.extractors().size() == 5);
  }
}

TEST_CASE("pipeline end to end", "[pipeline]") {
  pipeline_env env;
  std::vector<std::pair<std::string, std::string> > before = fixtures::snapshot(env.evidence.path);

  ArxPipeline pipeline(env.config, env.patterns, env.parsers, *env.db);
  pipeline.initialize(fixtures::TEST_PIPELINE_XML);

  ArxCancellationToken cancel;
  std::vector<ArxRunOutcome> outcomes = pipeline.run(*env.fs, EVIDENCE, std::vector<int>(), cancel);
  REQUIRE(outcomes.size() == 5);
  for (const ArxRunOutcome& outcome : outcomes) {
    INFO(outcome.extractorName << ": " << outcome.error);
    CHECK(outcome.state == "ingested");
    CHECK(outcome.extractionStatus == "ok");
    CHECK(env.db->getRun(outcome.runId)->state == "ingested");
  }

  // Chromium rows include the visits that only exist in the WAL.
  CHECK(outcome_of(outcomes, "chromium_history").recordsParsed == 3);
  CHECK(outcome_of(outcomes, "firefox_history").recordsParsed == 2);
  CHECK(outcome_of(outcomes, "firefox_bookmarks").recordsParsed == 2);
  CHECK(env.db->getHistory(EVIDENCE).size() == 5);
  CHECK(env.db->getBookmarks(EVIDENCE).size() == 2);

  // The corrupt cache entry is a warning, not a failed run.
  const ArxRunOutcome& cache = outcome_of(outcomes, "firefox_cache");
  CHECK(cache.candidates == 3);
  CHECK(cache.recordsParsed == 3);
  CHECK(cache.ingestion.failed == 1);
  std::vector<ArxStoredRow<ArxCacheEntryRecord> > entries = env.db->getCacheEntries(EVIDENCE);
  REQUIRE(entries.size() == 2);
  CHECK(entries[0].record.url != entries[1].record.url);
  for (const auto& entry : entries) {
    CHECK((entry.record.url == "https://cdn.example/app.js" || entry.record.url == "https://cdn.example/img/cat.png"));
  }
  CHECK(has_warning(env.db->getExtractionWarnings(EVIDENCE, cache.runId), "corrupt_container"));

  // The cached picture and the copies on disk share one canonical row.
  std::vector<ArxImageRow> images = env.db->getImages(EVIDENCE);
  REQUIRE(images.size() == 2);
  int64_t discoveries = 0;
  for (const ArxImageRow& image : images) {
    discoveries += image.discoveryCount;
  }
  CHECK(discoveries == 4);
  std::string cat_sha = sha256_of(fixtures::png_bytes("cat"));
  std::optional<ArxImageRow> cat = env.db->findImage(EVIDENCE, cat_sha);
  REQUIRE(cat);
  CHECK(cat->discoveryCount == 3);
  int from_cache = 0;
  int from_disk = 0;
  for (const auto& discovery : env.db->getImageDiscoveries(EVIDENCE)) {
    if (discovery.record.sha256 != cat_sha) {
      continue;
    }
    if (discovery.record.cacheUrl.empty()) {
      from_disk++;
      CHECK(discovery.record.source.discoveredBy == "filesystem_images");
    } else {
      from_cache++;
      CHECK(discovery.record.cacheUrl == "https://cdn.example/img/cat.png");
      CHECK(discovery.record.source.discoveredBy == "firefox_cache");
      CHECK(discovery.runId == cache.runId);
    }
  }
  CHECK(from_cache == 1);
  CHECK(from_disk == 2);

  std::vector<ArxUrlRow> urls = env.db->getUrls(EVIDENCE);
  bool found_shared = false;
  for (const ArxUrlRow& url : urls) {
    if (url.url == "https://shared.example/") {
      found_shared = true;
      CHECK(url.occurrenceCount == 3);
      CHECK(url.sources == "chromium_history,firefox_bookmarks,firefox_history");
    }
  }
  CHECK(found_shared);

  // Every run left an audit trail and a manifest.
  const ArxRunOutcome& chromium = outcome_of(outcomes, "chromium_history");
  std::vector<ArxProcessLogRecord> log = env.db->getProcessLog(EVIDENCE, chromium.runId);
  REQUIRE_FALSE(log.empty());
  CHECK(log.back().task == "state:ingesting->ingested");
  ArxManifest manifest = ArxManifest::load(env.db->getRun(chromium.runId)->manifestPath);
  CHECK(manifest.primaryEntries().size() == 1);
  CHECK(manifest.files.size() == 2);

  CHECK(fixtures::snapshot(env.evidence.path) == before);

  std::vector<std::string> stored = stored_content(*env.db);
  CHECK(stored.size() == 5 + 2 + 2 + 4 + urls.size());

  SECTION("rerunning an extractor does not duplicate rows") {
    ArxRunOutcome again = pipeline.runExtractor(*env.fs, EVIDENCE, "chromium_history", std::vector<int>(), cancel);
    CHECK(again.state == "ingested");
    CHECK(again.runId != chromium.runId);
    CHECK(env.db->getRuns(EVIDENCE, "chromium_history").size() == 2);
    CHECK(stored_content(*env.db) == stored);
    for (const auto& row : env.db->getHistory(EVIDENCE)) {
      if (row.record.source.discoveredBy == "chromium_history") {
        CHECK(row.runId == again.runId);
      }
    }
  }

  SECTION("rerunning the cache keeps one canonical image") {
    ArxRunOutcome again = pipeline.runExtractor(*env.fs, EVIDENCE, "firefox_cache", std::vector<int>(), cancel);
    CHECK(again.state == "ingested");
    CHECK(stored_content(*env.db) == stored);
    CHECK(env.db->findImage(EVIDENCE, cat_sha)->discoveryCount == 3);
  }

  SECTION("ingestion-only retry reuses the staged files") {
    std::filesystem::remove_all(env.evidence.path);
    ArxRunOutcome retry = pipeline.ingestOnly(chromium.runId, cancel);
    CHECK(retry.state == "ingested");
    CHECK(retry.recordsParsed == 3);
    CHECK(env.db->getRun(retry.runId)->sourceRunId == chromium.runId);
    CHECK(stored_content(*env.db) == stored);

    ArxRunOutcome cache_retry = pipeline.ingestOnly(cache.runId, cancel);
    CHECK(cache_retry.state == "ingested");
    CHECK(cache_retry.recordsParsed == 3);
    CHECK(stored_content(*env.db) == stored);
  }

  SECTION("rerun after sources are removed and added") {
    std::filesystem::path user_data = env.evidence.path / "p0/Users/bob/AppData/Local/Google/Chrome/User Data";
    fixtures::make_chromium_history(user_data / "Profile 1" / "History", {
      {"https://one.example/", "One", 13300000003000000LL, 1},
    }, 1);
    ArxRunOutcome added = pipeline.runExtractor(*env.fs, EVIDENCE, "chromium_history", std::vector<int>(), cancel);
    CHECK(added.state == "ingested");
    CHECK(history_urls(*env.db, "chromium_history") == std::vector<std::string>{
      "https://mail.example/", "https://news.example/", "https://one.example/", "https://shared.example/"});

    std::filesystem::remove_all(user_data / "Default");
    fixtures::make_chromium_history(user_data / "Profile 2" / "History", {
      {"https://two.example/", "Two", 13300000004000000LL, 1},
      {"https://shared.example/", "Shared", 13300000005000000LL, 0},
    }, 2);
    ArxRunOutcome changed = pipeline.runExtractor(*env.fs, EVIDENCE, "chromium_history", std::vector<int>(), cancel);
    CHECK(changed.state == "ingested");
    CHECK(changed.candidates == 2);
    CHECK(history_urls(*env.db, "chromium_history") == std::vector<std::string>{
      "https://one.example/", "https://shared.example/", "https://two.example/"});
    for (const auto& row : env.db->getHistory(EVIDENCE)) {
      if (row.record.source.discoveredBy == "chromium_history") {
        CHECK(row.runId == changed.runId);
        CHECK(row.record.source.sourcePath.find("/Default/") == std::string::npos);
      }
    }
    // Other extractors' rows are untouched.
    CHECK(history_urls(*env.db, "firefox_history") == std::vector<std::string>{
      "https://docs.example/", "https://shared.example/"});
    for (const ArxUrlRow& url : env.db->getUrls(EVIDENCE)) {
      CHECK(url.url != "https://news.example/");
      CHECK(url.url != "https://mail.example/");
    }
  }
}

TEST_CASE("pipeline on one partition", "[pipeline]") {
  pipeline_env env;
  ArxPipeline pipeline(env.config, env.patterns, env.parsers, *env.db);
  pipeline.initialize(fixtures::TEST_PIPELINE_XML);

  ArxCancellationToken cancel;
  ArxRunOutcome images = pipeline.runExtractor(*env.fs, EVIDENCE, "filesystem_images", {1}, cancel);
  CHECK(images.state == "ingested");
  CHECK(images.candidates == 2);
  CHECK(env.db->getImages(EVIDENCE).size() == 2);
}

TEST_CASE("cancelled pipeline", "[pipeline]") {
  pipeline_env env;
  ArxPipeline pipeline(env.config, env.patterns, env.parsers, *env.db);
  pipeline.initialize(fixtures::TEST_PIPELINE_XML);

  ArxCancellationToken cancel;
  cancel.cancel();
  CHECK(pipeline.run(*env.fs, EVIDENCE, std::vector<int>(), cancel).empty());

  ArxRunOutcome outcome = pipeline.runExtractor(*env.fs, EVIDENCE, "firefox_history", std::vector<int>(), cancel);
  CHECK(outcome.state == "failed");
  CHECK(outcome.extractionStatus == "cancelled");
  CHECK(env.db->getHistory(EVIDENCE).empty());
  CHECK(env.db->getRun(outcome.runId)->state == "failed");
}
