/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "fixtures.h"
#include "runner.h"

#include "arx/parsers/ArxCache2Parser.h"
#include "arx/parsers/ArxMozLz4.h"
#include "arx/utilities/ArxException.h"

#include "sqlite3.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace fixtures {

    const char * TEST_PATTERNS_XML =
        "<ARTIFACT_PATTERNS>"
        "  <ARTIFACT_TYPE name=\"chromium_history\" family=\"history\" companions=\"sqlite\">"
        "    <PATTERN browser=\"chrome\" profileSegment=\"-2\">Users/*/AppData/Local/Google/Chrome/User Data/*/History</PATTERN>"
        "  </ARTIFACT_TYPE>"
        "  <ARTIFACT_TYPE name=\"firefox_history\" family=\"history\" companions=\"sqlite\">"
        "    <PATTERN browser=\"firefox\" profileSegment=\"-2\">home/*/.mozilla/firefox/*/places.sqlite</PATTERN>"
        "  </ARTIFACT_TYPE>"
        "  <ARTIFACT_TYPE name=\"firefox_bookmark_backup\" family=\"bookmarks\">"
        "    <PATTERN browser=\"firefox\" profileSegment=\"-3\">home/*/.mozilla/firefox/*/bookmarkbackups/*.jsonlz4</PATTERN>"
        "  </ARTIFACT_TYPE>"
        "  <ARTIFACT_TYPE name=\"firefox_cache2\" family=\"cache\">"
        "    <PATTERN browser=\"firefox\" profileSegment=\"-4\">home/*/.cache/mozilla/firefox/*/cache2/entries/*</PATTERN>"
        "  </ARTIFACT_TYPE>"
        "  <ARTIFACT_TYPE name=\"filesystem_images\" family=\"images\">"
        "    <PATTERN>**/*.png</PATTERN>"
        "    <PATTERN>**/*.jpg</PATTERN>"
        "  </ARTIFACT_TYPE>"
        "  <ARTIFACT_TYPE name=\"documents\" family=\"images\">"
        "    <PATTERN>docs/*.bin</PATTERN>"
        "  </ARTIFACT_TYPE>"
        "</ARTIFACT_PATTERNS>";

    const char * TEST_PIPELINE_XML =
        "<PIPELINE>"
        "  <EXTRACTOR order=\"1\" name=\"chromium_history\" version=\"1.0.0\" artifactType=\"chromium_history\" parser=\"chromium_history\"/>"
        "  <EXTRACTOR order=\"2\" name=\"firefox_history\" version=\"1.0.0\" artifactType=\"firefox_history\" parser=\"firefox_history\"/>"
        "  <EXTRACTOR order=\"3\" name=\"firefox_bookmarks\" version=\"1.0.0\" artifactType=\"firefox_bookmark_backup\" parser=\"firefox_bookmark_backup\"/>"
        "  <EXTRACTOR order=\"4\" name=\"firefox_cache\" version=\"1.0.0\" artifactType=\"firefox_cache2\" parser=\"firefox_cache2\"/>"
        "  <EXTRACTOR order=\"5\" name=\"filesystem_images\" version=\"1.0.0\" artifactType=\"filesystem_images\" parser=\"filesystem_images\"/>"
        "</PIPELINE>";

    ArxConfig make_config(const std::filesystem::path& out_dir, unsigned int workers) {
        ArxConfig config;
        config.outDir = out_dir.string();
        config.databasePath = (out_dir / "arx.db").string();
        config.extractionWorkers = workers;
        config.copyBufferSize = 4096;
        config.useFileIndex = false;
        return config;
    }

    std::unique_ptr<ArxImgDBSqlite> open_db(const std::filesystem::path& path) {
        std::filesystem::create_directories(path.parent_path());
        std::unique_ptr<ArxImgDBSqlite> db(new ArxImgDBSqlite(path.string()));
        if (db->initialize() != 0) {
            throw std::runtime_error("cannot initialize " + path.string());
        }
        return db;
    }

    ArxPatternSet test_patterns() {
        std::istringstream in(TEST_PATTERNS_XML);
        return ArxPatternSet::load(in);
    }

    namespace {
        void exec(sqlite3 * db, const std::string& sql) {
            char * errmsg = NULL;
            if (sqlite3_exec(db, sql.c_str(), NULL, NULL, &errmsg) != SQLITE_OK) {
                std::string msg = std::string("fixture sql failed: ") + (errmsg ? errmsg : "") + " in " + sql;
                sqlite3_free(errmsg);
                throw std::runtime_error(msg);
            }
        }

        std::string quote(const std::string& text) {
            std::string quoted = "'";
            for (char c : text) {
                quoted += c;
                if (c == '\'') {
                    quoted += '\'';
                }
            }
            return quoted + "'";
        }

        void insert_chromium_visit(sqlite3 * db, size_t id, const history_visit& visit) {
            std::stringstream sql;
            sql << "INSERT INTO urls (id, url, title, visit_count, typed_count, last_visit_time, hidden) VALUES ("
                << id << ", " << quote(visit.url) << ", " << quote(visit.title) << ", 1, 0, " << visit.visit_time << ", 0);"
                << "INSERT INTO visits (id, url, visit_time, from_visit, transition, segment_id, visit_duration) VALUES ("
                << id << ", " << id << ", " << visit.visit_time << ", 0, " << visit.transition << ", 0, 1500000);";
            exec(db, sql.str());
        }
    }

    void make_chromium_history(const std::filesystem::path& path, const std::vector<history_visit>& visits,
        size_t committed_rows) {
        std::filesystem::create_directories(path.parent_path());
        runner::tempdir build("arx_history_build");
        std::filesystem::path build_db = build.path / "History";

        sqlite3 * db = NULL;
        if (sqlite3_open(build_db.string().c_str(), &db) != SQLITE_OK) {
            sqlite3_close(db);
            throw std::runtime_error("cannot create fixture database");
        }
        exec(db, "PRAGMA journal_mode=WAL; PRAGMA wal_autocheckpoint=0;");
        exec(db, "CREATE TABLE meta (key LONGVARCHAR NOT NULL UNIQUE PRIMARY KEY, value LONGVARCHAR);"
                 "CREATE TABLE urls (id INTEGER PRIMARY KEY AUTOINCREMENT, url LONGVARCHAR, title LONGVARCHAR, "
                 "visit_count INTEGER DEFAULT 0 NOT NULL, typed_count INTEGER DEFAULT 0 NOT NULL, "
                 "last_visit_time INTEGER NOT NULL, hidden INTEGER DEFAULT 0 NOT NULL);"
                 "CREATE TABLE visits (id INTEGER PRIMARY KEY, url INTEGER NOT NULL, visit_time INTEGER NOT NULL, "
                 "from_visit INTEGER, transition INTEGER DEFAULT 0 NOT NULL, segment_id INTEGER, "
                 "visit_duration INTEGER DEFAULT 0 NOT NULL);");

        size_t i = 0;
        for (; i < visits.size() && i < committed_rows; i++) {
            insert_chromium_visit(db, i + 1, visits[i]);
        }
        exec(db, "PRAGMA wal_checkpoint(TRUNCATE);");
        for (; i < visits.size(); i++) {
            insert_chromium_visit(db, i + 1, visits[i]);
        }

        // Copy while the connection is open so the frames stay in the WAL.
        std::filesystem::copy_file(build_db, path, std::filesystem::copy_options::overwrite_existing);
        std::filesystem::path build_wal = build_db.string() + "-wal";
        if (std::filesystem::exists(build_wal) && std::filesystem::file_size(build_wal) > 0) {
            std::filesystem::copy_file(build_wal, path.string() + "-wal",
                std::filesystem::copy_options::overwrite_existing);
        }
        sqlite3_close(db);
    }

    void make_firefox_places(const std::filesystem::path& path, const std::vector<history_visit>& visits) {
        std::filesystem::create_directories(path.parent_path());
        sqlite3 * db = NULL;
        if (sqlite3_open(path.string().c_str(), &db) != SQLITE_OK) {
            sqlite3_close(db);
            throw std::runtime_error("cannot create fixture database");
        }
        exec(db, "CREATE TABLE moz_places (id INTEGER PRIMARY KEY, url LONGVARCHAR, title LONGVARCHAR, "
                 "rev_host LONGVARCHAR, visit_count INTEGER DEFAULT 0, hidden INTEGER DEFAULT 0 NOT NULL, "
                 "typed INTEGER DEFAULT 0 NOT NULL, frecency INTEGER DEFAULT -1 NOT NULL, last_visit_date INTEGER, "
                 "guid TEXT);"
                 "CREATE TABLE moz_historyvisits (id INTEGER PRIMARY KEY, from_visit INTEGER, place_id INTEGER, "
                 "visit_date INTEGER, visit_type INTEGER, session INTEGER);");
        for (size_t i = 0; i < visits.size(); i++) {
            std::stringstream sql;
            sql << "INSERT INTO moz_places (id, url, title, visit_count, typed, last_visit_date) VALUES ("
                << i + 1 << ", " << quote(visits[i].url) << ", " << quote(visits[i].title) << ", 1, 0, "
                << visits[i].visit_time << ");"
                << "INSERT INTO moz_historyvisits (id, from_visit, place_id, visit_date, visit_type, session) VALUES ("
                << i + 1 << ", 0, " << i + 1 << ", " << visits[i].visit_time << ", " << visits[i].transition << ", 0);";
            exec(db, sql.str());
        }
        sqlite3_close(db);
    }

    std::string png_bytes(const std::string& payload) {
        return std::string("\x89PNG\r\n\x1A\n", 8) + std::string("\0\0\0\rIHDR", 8) + payload;
    }

    std::string cache2_entry(const std::string& url, const std::string& body, const std::string& response_head) {
        ArxCache2Entry entry;
        entry.version = 3;
        entry.fetchCount = 2;
        entry.lastFetched = 1700000000;
        entry.lastModified = 1699990000;
        entry.frecency = 0;
        entry.expiration = 0xFFFFFFFF;
        entry.key = "a,:" + url;
        entry.elements.push_back(std::make_pair(std::string("request-method"), std::string("GET")));
        entry.elements.push_back(std::make_pair(std::string("response-head"), response_head));
        entry.body = body;
        return ArxCache2Parser::buildContainer(entry);
    }

    std::string bookmark_backup(const std::vector<std::string>& urls) {
        std::stringstream json;
        json << "{\"guid\":\"root________\",\"title\":\"\",\"index\":0,\"dateAdded\":1700000000000000,"
             << "\"lastModified\":1700000000000000,\"id\":1,\"typeCode\":2,\"type\":\"text/x-moz-place-container\","
             << "\"root\":\"placesRoot\",\"children\":[{\"guid\":\"toolbar_____\",\"title\":\"toolbar\",\"index\":1,"
             << "\"id\":3,\"typeCode\":2,\"type\":\"text/x-moz-place-container\",\"root\":\"toolbarFolder\","
             << "\"children\":[";
        for (size_t i = 0; i < urls.size(); i++) {
            if (i > 0) {
                json << ",";
            }
            json << "{\"guid\":\"bookmark" << i << "\",\"title\":\"Bookmark " << i << "\",\"index\":" << i
                 << ",\"dateAdded\":1700000000123456,\"lastModified\":1700000001000000,\"id\":" << 10 + i
                 << ",\"typeCode\":1,\"type\":\"text/x-moz-place\",\"uri\":\"" << urls[i] << "\"}";
        }
        json << "]}]}";
        return ArxMozLz4::compress(json.str());
    }

    std::vector<std::pair<std::string, std::string> > snapshot(const std::filesystem::path& root) {
        std::vector<std::pair<std::string, std::string> > files;
        for (const auto& item : std::filesystem::recursive_directory_iterator(root)) {
            if (item.is_regular_file()) {
                files.push_back(std::make_pair(std::filesystem::relative(item.path(), root).generic_string(),
                    runner::file_contents(item.path())));
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    FaultyEvidenceFS::FaultyEvidenceFS(const std::string& root, const std::string& fail_marker,
        ArxCancellationToken * cancel, size_t cancel_after_opens)
        : ArxEvidenceFSDirectory(root), m_failMarker(fail_marker), m_cancel(cancel),
          m_cancelAfter(cancel_after_opens), m_opens(0) {
    }

    std::unique_ptr<ArxEvidenceFile> FaultyEvidenceFS::open(int a_partition, const std::string& a_path) const {
        size_t count = ++m_opens;
        if (m_cancel != NULL && count == m_cancelAfter) {
            m_cancel->cancel();
        }
        if (!m_failMarker.empty() && a_path.find(m_failMarker) != std::string::npos) {
            throw ArxCandidateReadException("injected read failure for " + a_path);
        }
        return ArxEvidenceFSDirectory::open(a_partition, a_path);
    }
}
