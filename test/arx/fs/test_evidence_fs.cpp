/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "arx/fs/ArxEvidenceFSDirectory.h"
#include "arx/utilities/ArxException.h"

#include <algorithm>

#include "catch.hpp"
#include "runner.h"

namespace {
  std::string read_all(ArxEvidenceFile& file) {
    std::string data;
    char buf[7];
    size_t n;
    while ((n = file.read(buf, sizeof(buf))) > 0) {
      data.append(buf, n);
    }
    return data;
  }

  std::vector<std::string> names(const std::vector<ArxFsEntry>& entries) {
    std::vector<std::string> result;
    for (const auto& e: entries) {
      result.push_back(e.name);
    }
    std::sort(result.begin(), result.end());
    return result;
  }
}

TEST_CASE("directory evidence listing and reading", "[fs]") {
  runner::tempdir root("arx_evidence_fs");
  runner::write_file(root.path / "Users/bob/notes.txt", "hello evidence");
  runner::write_file(root.path / "Users/bob/empty.bin", "");
  runner::write_file(root.path / "Users/alice/x", "x");

  ArxEvidenceFSDirectory fs(root.str());
  CHECK(fs.isThreadSafe());

  std::vector<ArxPartitionInfo> parts = fs.partitions();
  REQUIRE(parts.size() == 1);
  CHECK(parts[0].index == 0);
  CHECK(parts[0].fsType == "host");

  std::vector<ArxFsEntry> top = fs.list(0, "/Users");
  CHECK(names(top) == std::vector<std::string>{"alice", "bob"});
  for (const auto& e: top) {
    CHECK(e.isDirectory);
    CHECK(e.logicalPath == "/Users/" + e.name);
  }

  ArxFsEntry notes = fs.stat(0, "/Users/bob/notes.txt");
  CHECK(notes.isRegular);
  CHECK_FALSE(notes.isDirectory);
  CHECK(notes.size == 14);
  CHECK(notes.name == "notes.txt");
  CHECK(notes.inode != 0);
  CHECK(notes.forensicPath == fs.hostPath(0, "/Users/bob/notes.txt"));
  CHECK(notes.mtime.isKnown());

  std::unique_ptr<ArxEvidenceFile> file = fs.open(0, "/Users/bob/notes.txt");
  CHECK(file->size() == 14);
  CHECK(read_all(*file) == "hello evidence");
  CHECK(file->read(nullptr, 0) == 0);

  std::unique_ptr<ArxEvidenceFile> empty = fs.open(0, "/Users/bob/empty.bin");
  CHECK(empty->size() == 0);
  CHECK(read_all(*empty).empty());

  SECTION("missing paths") {
    CHECK(fs.exists(0, "/Users/bob/notes.txt"));
    CHECK_FALSE(fs.exists(0, "/Users/bob/missing.txt"));
    CHECK_THROWS_AS(fs.stat(0, "/Users/bob/missing.txt"), ArxCandidateReadException);
    CHECK_THROWS_AS(fs.open(0, "/Users/bob/missing.txt"), ArxCandidateReadException);
    CHECK_THROWS_AS(fs.list(0, "/Nope"), ArxCandidateReadException);
  }

  SECTION("directories cannot be opened") {
    CHECK_THROWS_AS(fs.open(0, "/Users/bob"), ArxCandidateReadException);
  }

  SECTION("paths stay below the root") {
    CHECK_THROWS_AS(fs.stat(0, "/Users/../../etc/passwd"), ArxCandidateReadException);
    CHECK_FALSE(fs.exists(0, "/../etc"));
  }

  SECTION("unknown partitions") {
    CHECK_THROWS_AS(fs.stat(1, "/Users"), ArxCandidateReadException);
    CHECK_THROWS_AS(fs.partition(3), ArxSourceUnavailableException);
    CHECK(fs.partition(0).description == parts[0].description);
  }
}

TEST_CASE("directory evidence with several roots", "[fs]") {
  runner::tempdir a("arx_evidence_a");
  runner::tempdir b("arx_evidence_b");
  runner::write_file(a.path / "one.txt", "1");
  runner::write_file(b.path / "two.txt", "22");

  ArxEvidenceFSDirectory fs(std::vector<std::string>{a.str(), b.str()});
  REQUIRE(fs.partitions().size() == 2);
  CHECK(fs.partitions()[1].index == 1);
  CHECK(fs.exists(0, "/one.txt"));
  CHECK_FALSE(fs.exists(1, "/one.txt"));
  CHECK(fs.stat(1, "two.txt").size == 2);
  CHECK(names(fs.list(1, "/")) == std::vector<std::string>{"two.txt"});
}

TEST_CASE("unavailable evidence roots", "[fs]") {
  runner::tempdir root("arx_evidence_bad");
  runner::write_file(root.path / "file.txt", "x");

  CHECK_THROWS_AS(ArxEvidenceFSDirectory((root.path / "absent").string()), ArxSourceUnavailableException);
  CHECK_THROWS_AS(ArxEvidenceFSDirectory((root.path / "file.txt").string()), ArxSourceUnavailableException);
  CHECK_THROWS_AS(ArxEvidenceFSDirectory(std::vector<std::string>()), ArxSourceUnavailableException);
}
