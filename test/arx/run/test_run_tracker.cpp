/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "arx/run/ArxRunTracker.h"
#include "arx/run/ArxToolRunner.h"
#include "arx/utilities/ArxException.h"

#include "catch.hpp"
#include "runner.h"
#include "arx/fixtures.h"

namespace {
  std::vector<std::string> tasks(const ArxImgDB& db, int64_t evidence, const std::string& run_id) {
    std::vector<std::string> names;
    std::vector<ArxProcessLogRecord> log = db.getProcessLog(evidence, run_id);
    for (size_t i = 0; i < log.size(); i++) {
      names.push_back(log[i].task);
    }
    return names;
  }
}

TEST_CASE("run ids", "[run]") {
  std::string id = ArxRunTracker::newRunId();
  REQUIRE(id.size() == 24);
  CHECK(id[8] == 'T');
  CHECK(id[15] == '_');
  CHECK(id != ArxRunTracker::newRunId());
}

TEST_CASE("run state machine", "[run]") {
  CHECK(ArxRunTracker::isLegalTransition("created", "extracting", false));
  CHECK(ArxRunTracker::isLegalTransition("extracting", "extracted", false));
  CHECK(ArxRunTracker::isLegalTransition("extracted", "ingesting", false));
  CHECK(ArxRunTracker::isLegalTransition("ingesting", "ingested", false));
  CHECK(ArxRunTracker::isLegalTransition("extracting", "failed", false));

  CHECK_FALSE(ArxRunTracker::isLegalTransition("created", "extracted", false));
  CHECK(ArxRunTracker::isLegalTransition("created", "extracted", true));
  CHECK_FALSE(ArxRunTracker::isLegalTransition("created", "extracting", true));
  CHECK_FALSE(ArxRunTracker::isLegalTransition("extracted", "extracting", false));
  CHECK_FALSE(ArxRunTracker::isLegalTransition("ingested", "failed", false));
  CHECK_FALSE(ArxRunTracker::isLegalTransition("failed", "extracting", false));
  CHECK(ArxRunTracker::isTerminal("ingested"));
  CHECK_FALSE(ArxRunTracker::isTerminal("extracted"));
}

TEST_CASE("run lifecycle is audited", "[run]") {
  runner::tempdir out("arx_runs");
  std::unique_ptr<ArxImgDBSqlite> db = fixtures::open_db(out.path / "arx.db");
  ArxRunTracker tracker(*db);

  ArxRunRecord run = tracker.startRun(3, "chromium_history", "1.0.0", "chromium_history");
  CHECK(run.state == "created");
  CHECK(tracker.getRun(run.runId).extractorVersion == "1.0.0");

  tracker.transition(run.runId, ArxRunTracker::STATE_EXTRACTING);
  tracker.transition(run.runId, ArxRunTracker::STATE_EXTRACTED, "degraded");
  tracker.setManifest(run.runId, "/cases/out/runs/x/", "/cases/out/runs/x/manifest.json");
  tracker.transition(run.runId, ArxRunTracker::STATE_INGESTING);
  tracker.recordIngestionSummary(run.runId, 10, 9, "{\"invalid_record\":1}");
  tracker.transition(run.runId, ArxRunTracker::STATE_INGESTED);

  ArxRunRecord done = tracker.getRun(run.runId);
  CHECK(done.state == "ingested");
  CHECK(done.extractionStatus == "degraded");
  CHECK_FALSE(done.finishedAt.empty());
  CHECK(done.manifestPath == "/cases/out/runs/x/manifest.json");

  std::vector<std::string> expected = {
    "run_created", "state:created->extracting", "state:extracting->extracted",
    "state:extracted->ingesting", "ingestion_summary", "state:ingesting->ingested"
  };
  CHECK(tasks(*db, 3, run.runId) == expected);

  std::vector<ArxProcessLogRecord> log = db->getProcessLog(3, run.runId);
  CHECK(log[4].recordsExtracted == 10);
  CHECK(log[4].recordsIngested == 9);

  // Terminal runs do not move.
  CHECK_THROWS_AS(tracker.transition(run.runId, ArxRunTracker::STATE_FAILED), ArxException);
  tracker.fail(run.runId, "late failure");
  CHECK(tracker.getRun(run.runId).state == "ingested");
  CHECK_THROWS_AS(tracker.getRun("no-such-run"), ArxException);
}

TEST_CASE("failed runs", "[run]") {
  runner::tempdir out("arx_runs");
  std::unique_ptr<ArxImgDBSqlite> db = fixtures::open_db(out.path / "arx.db");
  ArxRunTracker tracker(*db);

  ArxRunRecord run = tracker.startRun(3, "firefox_cache", "1.0.0", "firefox_cache2");
  tracker.transition(run.runId, ArxRunTracker::STATE_EXTRACTING);
  CHECK_THROWS_AS(tracker.transition(run.runId, ArxRunTracker::STATE_INGESTING), ArxException);
  tracker.fail(run.runId, "disk full");

  ArxRunRecord failed = tracker.getRun(run.runId);
  CHECK(failed.state == "failed");
  CHECK_FALSE(failed.finishedAt.empty());
  std::vector<ArxProcessLogRecord> log = db->getProcessLog(3, run.runId);
  CHECK(log.back().task == "state:extracting->failed");
  CHECK(log.back().command == "disk full");

  // Unknown runs are logged, not thrown.
  tracker.fail("no-such-run", "ignored");
}

TEST_CASE("retry runs reuse a manifest", "[run]") {
  runner::tempdir out("arx_runs");
  std::unique_ptr<ArxImgDBSqlite> db = fixtures::open_db(out.path / "arx.db");
  ArxRunTracker tracker(*db);

  ArxRunRecord source = tracker.startRun(3, "firefox_history", "1.0.0", "firefox_history");
  CHECK_THROWS_AS(tracker.startRetry(source.runId), ArxException);

  tracker.transition(source.runId, ArxRunTracker::STATE_EXTRACTING);
  tracker.setManifest(source.runId, "/out/runs/s/", "/out/runs/s/manifest.json");
  tracker.transition(source.runId, ArxRunTracker::STATE_EXTRACTED, "ok");
  tracker.fail(source.runId, "ingestion crashed");

  ArxRunRecord retry = tracker.startRetry(source.runId);
  CHECK(retry.runId != source.runId);
  CHECK(retry.sourceRunId == source.runId);
  CHECK(retry.state == "extracted");
  CHECK(retry.extractionStatus == "ok");
  CHECK(retry.runDir == "/out/runs/s/");
  CHECK(retry.manifestPath == "/out/runs/s/manifest.json");

  tracker.transition(retry.runId, ArxRunTracker::STATE_INGESTING);
  tracker.transition(retry.runId, ArxRunTracker::STATE_INGESTED);
  CHECK(tracker.getRun(source.runId).state == "failed");
  CHECK(db->getRuns(3, "firefox_history").size() == 2);
}

TEST_CASE("external tools", "[run]") {
  runner::tempdir out("arx_runs");
  std::unique_ptr<ArxImgDBSqlite> db = fixtures::open_db(out.path / "arx.db");
  ArxRunTracker tracker(*db);
  ArxRunRecord run = tracker.startRun(3, "carve_unalloc", "1.0.0", "filesystem_images");
  ArxToolRunner tools(&tracker, run.runId);
  ArxCancellationToken cancel;

  ArxToolInvocation invocation;
  invocation.task = "carve";
  invocation.executable = "/bin/sh";
  invocation.stdoutPath = (out.path / "logs/tool.out").string();
  invocation.stderrPath = (out.path / "logs/tool.err").string();

  SECTION("exit code and output are captured") {
    invocation.args = {"-c", "echo carved; echo oops >&2; exit 3"};
    ArxToolResult result = tools.run(invocation, cancel);
    CHECK(result.exitCode == 3);
    CHECK_FALSE(result.succeeded());
    CHECK(runner::file_contains(out.path / "logs/tool.out", "carved"));
    CHECK(runner::file_contains(out.path / "logs/tool.err", "oops"));

    std::vector<ArxProcessLogRecord> log = db->getProcessLog(3, run.runId);
    REQUIRE(log.back().id == result.auditId);
    CHECK(log.back().task == "carve");
    CHECK(log.back().exitCode == 3);
    CHECK(log.back().command == "/bin/sh -c echo carved; echo oops >&2; exit 3");
    CHECK(log.back().extractorName == "carve_unalloc");
  }

  SECTION("timeout") {
    invocation.args = {"-c", "sleep 10"};
    invocation.timeoutSeconds = 1;
    ArxToolResult result = tools.run(invocation, cancel);
    CHECK(result.timedOut);
    CHECK_FALSE(result.succeeded());
  }

  SECTION("cancellation") {
    invocation.args = {"-c", "sleep 10"};
    cancel.cancel();
    ArxToolResult result = tools.run(invocation, cancel);
    CHECK(result.cancelled);
  }

  SECTION("missing executable") {
    invocation.executable = (out.path / "no-such-tool").string();
    size_t before = db->getProcessLog(3, run.runId).size();
    CHECK_THROWS_AS(tools.run(invocation, cancel), ArxException);

    std::vector<ArxProcessLogRecord> log = db->getProcessLog(3, run.runId);
    REQUIRE(log.size() == before + 1);
    CHECK(log.back().task == "carve");
    CHECK(log.back().command == invocation.executable);
    CHECK_FALSE(log.back().hasExitCode);
    CHECK(runner::contains(log.back().warningsJson, "does not exist"));
    CHECK_FALSE(log.back().finishedAt.empty());
  }
}
