/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file ArxImgDBSqlite.cpp
 * A SQLite based implementation of the storage ports.
 */

#include "ArxImgDBSqlite.h"
#include "ArxServices.h"
#include "arx/utilities/ArxException.h"

#include "Poco/Thread.h"

#include <sstream>

#define IMGDB_CHUNK_SIZE 1024*1024*1 // what size chunks should the database use when growing and shrinking
#define IMGDB_MAX_RETRY_COUNT 50    // how many times will we retry a SQL statement
#define IMGDB_RETRY_WAIT 100   // how long (in milliseconds) are we willing to wait between retries

namespace
{
    /**
     * Finalizes a prepared statement when it goes out of scope.
     */
    class ScopedStatement
    {
    public:
        ScopedStatement() : m_stmt(NULL) {}
        ~ScopedStatement() { sqlite3_finalize(m_stmt); }

        sqlite3_stmt *& ref() { return m_stmt; }
        operator sqlite3_stmt *() const { return m_stmt; }

    private:
        ScopedStatement(const ScopedStatement&);
        ScopedStatement& operator=(const ScopedStatement&);

        sqlite3_stmt * m_stmt;
    };

    void bindText(sqlite3_stmt * stmt, int idx, const std::string& value)
    {
        sqlite3_bind_text(stmt, idx, value.c_str(), (int)value.size(), SQLITE_TRANSIENT);
    }

    void bindTextOrNull(sqlite3_stmt * stmt, int idx, const std::string& value)
    {
        if (value.empty())
            sqlite3_bind_null(stmt, idx);
        else
            bindText(stmt, idx, value);
    }

    void bindTimestamp(sqlite3_stmt * stmt, int idx, const ArxTimestamp& ts)
    {
        if (ts.isKnown())
            bindText(stmt, idx, ts.toIso());
        else
            sqlite3_bind_null(stmt, idx);
    }

    void bindInt64OrNull(sqlite3_stmt * stmt, int idx, int64_t value, int64_t nullValue)
    {
        if (value == nullValue)
            sqlite3_bind_null(stmt, idx);
        else
            sqlite3_bind_int64(stmt, idx, value);
    }

    std::string columnText(sqlite3_stmt * stmt, int idx)
    {
        const unsigned char * text = sqlite3_column_text(stmt, idx);
        if (text == NULL)
            return "";
        return std::string((const char *)text, sqlite3_column_bytes(stmt, idx));
    }

    std::string columnBlob(sqlite3_stmt * stmt, int idx)
    {
        const void * blob = sqlite3_column_blob(stmt, idx);
        if (blob == NULL)
            return "";
        return std::string((const char *)blob, sqlite3_column_bytes(stmt, idx));
    }

    ArxTimestamp columnTimestamp(sqlite3_stmt * stmt, int idx)
    {
        if (sqlite3_column_type(stmt, idx) == SQLITE_NULL)
            return ArxTimestamp::unknown();
        return ArxTimestamp::fromIso(columnText(stmt, idx));
    }

    int64_t columnInt64OrDefault(sqlite3_stmt * stmt, int idx, int64_t defaultValue)
    {
        if (sqlite3_column_type(stmt, idx) == SQLITE_NULL)
            return defaultValue;
        return sqlite3_column_int64(stmt, idx);
    }

    /// Binds the common provenance columns. Returns the next free index.
    int bindSource(sqlite3_stmt * stmt, int idx, const ArxRecordSource& source)
    {
        bindText(stmt, idx++, source.discoveredBy);
        bindText(stmt, idx++, source.sourcePath);
        bindInt64OrNull(stmt, idx++, source.partitionIndex, -1);
        bindText(stmt, idx++, source.browser);
        bindText(stmt, idx++, source.profile);
        bindText(stmt, idx++, source.manifestRelPath);
        return idx;
    }

    /// Reads the columns written by bindSource. Returns the next column.
    int readSource(sqlite3_stmt * stmt, int idx, ArxRecordSource& source)
    {
        source.discoveredBy = columnText(stmt, idx++);
        source.sourcePath = columnText(stmt, idx++);
        source.partitionIndex = (int)columnInt64OrDefault(stmt, idx++, -1);
        source.browser = columnText(stmt, idx++);
        source.profile = columnText(stmt, idx++);
        source.manifestRelPath = columnText(stmt, idx++);
        return idx;
    }

    const char * SOURCE_COLUMNS = "discovered_by, source_path, partition_index, browser, profile, manifest_rel_path";

    std::string scopeClause(const ArxRecordScope& a_scope)
    {
        std::stringstream clause;
        clause << "evidence_id = ?";
        if (a_scope.runIds.empty())
        {
            clause << " AND discovered_by = ?";
        }
        else
        {
            clause << " AND run_id IN (";
            for (size_t i = 0; i < a_scope.runIds.size(); i++)
                clause << (i == 0 ? "?" : ", ?");
            clause << ")";
        }
        return clause.str();
    }

    /// Binds the parameters of scopeClause. Returns the next free index.
    int bindScope(sqlite3_stmt * stmt, int idx, const ArxRecordScope& a_scope)
    {
        sqlite3_bind_int64(stmt, idx++, a_scope.evidenceId);
        if (a_scope.runIds.empty())
        {
            bindText(stmt, idx++, a_scope.discoveredBy);
        }
        else
        {
            for (size_t i = 0; i < a_scope.runIds.size(); i++)
                bindText(stmt, idx++, a_scope.runIds[i]);
        }
        return idx;
    }

    const char * RUN_COLUMNS = "run_id, evidence_id, extractor_name, extractor_version, artifact_type, state, "
        "extraction_status, started_at_utc, finished_at_utc, source_run_id, run_dir, manifest_path";

    ArxRunRecord readRun(sqlite3_stmt * stmt)
    {
        ArxRunRecord run;
        run.runId = columnText(stmt, 0);
        run.evidenceId = sqlite3_column_int64(stmt, 1);
        run.extractorName = columnText(stmt, 2);
        run.extractorVersion = columnText(stmt, 3);
        run.artifactType = columnText(stmt, 4);
        run.state = columnText(stmt, 5);
        run.extractionStatus = columnText(stmt, 6);
        run.startedAt = columnText(stmt, 7);
        run.finishedAt = columnText(stmt, 8);
        run.sourceRunId = columnText(stmt, 9);
        run.runDir = columnText(stmt, 10);
        run.manifestPath = columnText(stmt, 11);
        return run;
    }

    const char * HISTORY_COLUMNS = "id, evidence_id, run_id, discovered_by, source_path, partition_index, browser, profile, "
        "manifest_rel_path, url, title, visit_time_utc, visit_count, typed_count, hidden, transition_type, "
        "visit_duration_ms, source_visit_id, from_visit_id";

    ArxStoredRow<ArxHistoryVisitRecord> readHistory(sqlite3_stmt * stmt)
    {
        ArxStoredRow<ArxHistoryVisitRecord> row;
        row.id = sqlite3_column_int64(stmt, 0);
        row.evidenceId = sqlite3_column_int64(stmt, 1);
        row.runId = columnText(stmt, 2);
        int idx = readSource(stmt, 3, row.record.source);
        row.record.url = columnText(stmt, idx++);
        row.record.title = columnText(stmt, idx++);
        row.record.visitTime = columnTimestamp(stmt, idx++);
        row.record.visitCount = sqlite3_column_int64(stmt, idx++);
        row.record.typedCount = sqlite3_column_int64(stmt, idx++);
        row.record.hidden = sqlite3_column_int(stmt, idx++) != 0;
        row.record.transition = columnText(stmt, idx++);
        row.record.visitDurationMs = columnInt64OrDefault(stmt, idx++, -1);
        row.record.sourceVisitId = sqlite3_column_int64(stmt, idx++);
        row.record.fromVisitId = sqlite3_column_int64(stmt, idx++);
        return row;
    }

    /// Binds the non-source history columns starting at idx.
    int bindHistoryFields(sqlite3_stmt * stmt, int idx, const ArxHistoryVisitRecord& r)
    {
        bindText(stmt, idx++, r.url);
        bindText(stmt, idx++, r.title);
        bindTimestamp(stmt, idx++, r.visitTime);
        sqlite3_bind_int64(stmt, idx++, r.visitCount);
        sqlite3_bind_int64(stmt, idx++, r.typedCount);
        sqlite3_bind_int(stmt, idx++, r.hidden ? 1 : 0);
        bindText(stmt, idx++, r.transition);
        bindInt64OrNull(stmt, idx++, r.visitDurationMs, -1);
        sqlite3_bind_int64(stmt, idx++, r.sourceVisitId);
        sqlite3_bind_int64(stmt, idx++, r.fromVisitId);
        return idx;
    }

    const char * BOOKMARK_COLUMNS = "id, evidence_id, run_id, discovered_by, source_path, partition_index, browser, profile, "
        "manifest_rel_path, url, title, folder_path, guid, date_added_utc, last_modified_utc, keyword, tags";

    ArxStoredRow<ArxBookmarkRecord> readBookmark(sqlite3_stmt * stmt)
    {
        ArxStoredRow<ArxBookmarkRecord> row;
        row.id = sqlite3_column_int64(stmt, 0);
        row.evidenceId = sqlite3_column_int64(stmt, 1);
        row.runId = columnText(stmt, 2);
        int idx = readSource(stmt, 3, row.record.source);
        row.record.url = columnText(stmt, idx++);
        row.record.title = columnText(stmt, idx++);
        row.record.folderPath = columnText(stmt, idx++);
        row.record.guid = columnText(stmt, idx++);
        row.record.dateAdded = columnTimestamp(stmt, idx++);
        row.record.lastModified = columnTimestamp(stmt, idx++);
        row.record.keyword = columnText(stmt, idx++);
        row.record.tags = columnText(stmt, idx++);
        return row;
    }

    int bindBookmarkFields(sqlite3_stmt * stmt, int idx, const ArxBookmarkRecord& r)
    {
        bindText(stmt, idx++, r.url);
        bindText(stmt, idx++, r.title);
        bindText(stmt, idx++, r.folderPath);
        bindText(stmt, idx++, r.guid);
        bindTimestamp(stmt, idx++, r.dateAdded);
        bindTimestamp(stmt, idx++, r.lastModified);
        bindText(stmt, idx++, r.keyword);
        bindText(stmt, idx++, r.tags);
        return idx;
    }

    const char * CACHE_COLUMNS = "id, evidence_id, run_id, discovered_by, source_path, partition_index, browser, profile, "
        "manifest_rel_path, url, cache_key, cache_filename, http_status, content_type, content_encoding, response_head, "
        "last_fetched_utc, last_modified_utc, expiration_utc, fetch_count, body_size, body_sha256, body, body_decoded";

    ArxStoredRow<ArxCacheEntryRecord> readCacheEntry(sqlite3_stmt * stmt)
    {
        ArxStoredRow<ArxCacheEntryRecord> row;
        row.id = sqlite3_column_int64(stmt, 0);
        row.evidenceId = sqlite3_column_int64(stmt, 1);
        row.runId = columnText(stmt, 2);
        int idx = readSource(stmt, 3, row.record.source);
        row.record.url = columnText(stmt, idx++);
        row.record.cacheKey = columnText(stmt, idx++);
        row.record.cacheFilename = columnText(stmt, idx++);
        row.record.httpStatus = sqlite3_column_int(stmt, idx++);
        row.record.contentType = columnText(stmt, idx++);
        row.record.contentEncoding = columnText(stmt, idx++);
        row.record.responseHead = columnText(stmt, idx++);
        row.record.lastFetched = columnTimestamp(stmt, idx++);
        row.record.lastModified = columnTimestamp(stmt, idx++);
        row.record.expiration = columnTimestamp(stmt, idx++);
        row.record.fetchCount = sqlite3_column_int64(stmt, idx++);
        row.record.bodySize = sqlite3_column_int64(stmt, idx++);
        row.record.bodySha256 = columnText(stmt, idx++);
        row.record.body = columnBlob(stmt, idx++);
        row.record.bodyDecoded = sqlite3_column_int(stmt, idx++) != 0;
        return row;
    }

    int bindCacheFields(sqlite3_stmt * stmt, int idx, const ArxCacheEntryRecord& r)
    {
        bindText(stmt, idx++, r.url);
        bindText(stmt, idx++, r.cacheKey);
        bindText(stmt, idx++, r.cacheFilename);
        sqlite3_bind_int(stmt, idx++, r.httpStatus);
        bindText(stmt, idx++, r.contentType);
        bindText(stmt, idx++, r.contentEncoding);
        bindText(stmt, idx++, r.responseHead);
        bindTimestamp(stmt, idx++, r.lastFetched);
        bindTimestamp(stmt, idx++, r.lastModified);
        bindTimestamp(stmt, idx++, r.expiration);
        sqlite3_bind_int64(stmt, idx++, r.fetchCount);
        sqlite3_bind_int64(stmt, idx++, r.bodySize);
        bindText(stmt, idx++, r.bodySha256);
        sqlite3_bind_blob(stmt, idx++, r.body.data(), (int)r.body.size(), SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, idx++, r.bodyDecoded ? 1 : 0);
        return idx;
    }

    const char * IMAGE_COLUMNS = "id, evidence_id, rel_path, filename, format, md5, sha256, size_bytes, "
        "first_discovered_by, first_discovered_at, discovery_count";

    ArxImageRow readImage(sqlite3_stmt * stmt)
    {
        ArxImageRow row;
        row.id = sqlite3_column_int64(stmt, 0);
        row.evidenceId = sqlite3_column_int64(stmt, 1);
        row.relPath = columnText(stmt, 2);
        row.filename = columnText(stmt, 3);
        row.format = columnText(stmt, 4);
        row.md5 = columnText(stmt, 5);
        row.sha256 = columnText(stmt, 6);
        row.sizeBytes = sqlite3_column_int64(stmt, 7);
        row.firstDiscoveredBy = columnText(stmt, 8);
        row.firstDiscoveredAt = columnText(stmt, 9);
        row.discoveryCount = sqlite3_column_int64(stmt, 10);
        return row;
    }

    const char * MANIFEST_COLUMNS = "evidence_id, partition_index, logical_path, forensic_path, fs_type, source_size, "
        "source_inode, deleted, source_mtime_utc, source_atime_utc, source_ctime_utc, source_crtime_utc, artifact_type, "
        "browser, profile, dest_rel_path, dest_filename, size_bytes, md5, sha256, status, error_message, "
        "extracted_at_utc, logical_group, role, source_offset_bytes";

    const char * FILE_LIST_COLUMNS = "evidence_id, partition_index, file_path, file_name, extension, size_bytes, "
        "created_ts, modified_ts, accessed_ts, changed_ts, md5, deleted, inode, is_directory, forensic_path, fs_type, "
        "run_id, import_source, import_timestamp";
}

/**
 * Set the database location.  Must call
 * initialize() before the object can be used.
 */
ArxImgDBSqlite::ArxImgDBSqlite(const std::string& a_dbFilePath)
: m_dbFilePath(a_dbFilePath), m_db(NULL)
{
}

ArxImgDBSqlite::~ArxImgDBSqlite()
{
    (void) close();
}

int ArxImgDBSqlite::close()
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    if (m_db) {
        if (sqlite3_close(m_db) == SQLITE_OK)
            m_db = NULL;
        else
            return 1;
    }
    return 0;
}

/*
 * If the database file exists this method will open it otherwise
 * it will create a new database.
 * This method also configures the chunk size and the busy handler
 * for the newly opened database.
 */
int ArxImgDBSqlite::open()
{
    std::stringstream infoMessage;

    if (sqlite3_open(m_dbFilePath.c_str(), &m_db))
    {
        infoMessage << "ArxImgDBSqlite::open - Can't create new database: " << sqlite3_errmsg(m_db);
        LOGERROR(infoMessage.str());

        sqlite3_close(m_db);
        m_db = NULL;
        return 1;
    }

    // The chunk size setting defines by how much the database will grow
    // or shrink.
    int chunkSize = IMGDB_CHUNK_SIZE;

    if (sqlite3_file_control(m_db, NULL, SQLITE_FCNTL_CHUNK_SIZE, &chunkSize) != SQLITE_OK)
    {
        infoMessage << "ArxImgDBSqlite::open - Failed to set chunk size: " << sqlite3_errmsg(m_db);
        LOGERROR(infoMessage.str());

        sqlite3_close(m_db);
        m_db = NULL;
        return 1;
    }

    // Register a busy handler that will retry statements in situations
    // where the database is locked by another process.
    if (sqlite3_busy_handler(m_db, ArxImgDBSqlite::busyHandler, m_db) != SQLITE_OK)
    {
        infoMessage << "ArxImgDBSqlite::open - Failed to set busy handler: " << sqlite3_errmsg(m_db);
        LOGERROR(infoMessage.str());

        sqlite3_close(m_db);
        m_db = NULL;
        return 1;
    }

    LOGINFO("ImgDB Opened: " + m_dbFilePath);

    return 0;
}

int ArxImgDBSqlite::initialize()
{
    Poco::Mutex::ScopedLock lock(m_mutex);

    if (m_db == NULL && open() != 0)
    {
        // Error message will have been logged by open()
        return 1;
    }

    return createTables();
}

int ArxImgDBSqlite::createTables()
{
    // Tables are created only when missing; one database holds every
    // run of every evidence item of a case.
    const char * statements[] = {
        "PRAGMA page_size = 4096",
        "PRAGMA synchronous = 1",

        "CREATE TABLE IF NOT EXISTS runs (run_id TEXT PRIMARY KEY, evidence_id INTEGER NOT NULL, "
        "extractor_name TEXT NOT NULL, extractor_version TEXT, artifact_type TEXT, state TEXT NOT NULL, "
        "extraction_status TEXT, started_at_utc TEXT, finished_at_utc TEXT, source_run_id TEXT, "
        "run_dir TEXT, manifest_path TEXT)",

        "CREATE TABLE IF NOT EXISTS process_log (id INTEGER PRIMARY KEY AUTOINCREMENT, evidence_id INTEGER, "
        "run_id TEXT, task TEXT NOT NULL, command TEXT, started_at_utc TEXT, finished_at_utc TEXT, "
        "exit_code INTEGER, stdout TEXT, stderr TEXT, extractor_name TEXT, extractor_version TEXT, "
        "records_extracted INTEGER, records_ingested INTEGER, warnings_json TEXT, log_file_path TEXT)",

        "CREATE TRIGGER IF NOT EXISTS process_log_no_update BEFORE UPDATE ON process_log "
        "BEGIN SELECT RAISE(ABORT, 'process_log is append-only'); END",
        "CREATE TRIGGER IF NOT EXISTS process_log_no_delete BEFORE DELETE ON process_log "
        "BEGIN SELECT RAISE(ABORT, 'process_log is append-only'); END",

        "CREATE TABLE IF NOT EXISTS extracted_files (id INTEGER PRIMARY KEY AUTOINCREMENT, run_id TEXT NOT NULL, "
        "extractor_name TEXT, evidence_id INTEGER, partition_index INTEGER, logical_path TEXT, forensic_path TEXT, "
        "fs_type TEXT, source_size INTEGER, source_inode INTEGER, deleted INTEGER, source_mtime_utc TEXT, "
        "source_atime_utc TEXT, source_ctime_utc TEXT, source_crtime_utc TEXT, artifact_type TEXT, browser TEXT, "
        "profile TEXT, dest_rel_path TEXT NOT NULL, dest_filename TEXT, size_bytes INTEGER, md5 TEXT, sha256 TEXT, "
        "status TEXT NOT NULL, error_message TEXT, extracted_at_utc TEXT, logical_group TEXT, role TEXT, "
        "source_offset_bytes INTEGER, UNIQUE(run_id, dest_rel_path))",

        "CREATE TABLE IF NOT EXISTS extraction_warnings (id INTEGER PRIMARY KEY AUTOINCREMENT, evidence_id INTEGER, "
        "run_id TEXT, extractor_name TEXT, warning_type TEXT NOT NULL, severity TEXT NOT NULL, category TEXT, "
        "item_name TEXT, item_value TEXT, context_json TEXT, artifact_type TEXT, source_file TEXT, created_at_utc TEXT)",

        "CREATE TRIGGER IF NOT EXISTS extraction_warnings_no_update BEFORE UPDATE ON extraction_warnings "
        "BEGIN SELECT RAISE(ABORT, 'extraction_warnings is append-only'); END",
        "CREATE TRIGGER IF NOT EXISTS extraction_warnings_no_delete BEFORE DELETE ON extraction_warnings "
        "BEGIN SELECT RAISE(ABORT, 'extraction_warnings is append-only'); END",

        "CREATE TABLE IF NOT EXISTS file_list (id INTEGER PRIMARY KEY AUTOINCREMENT, evidence_id INTEGER NOT NULL, "
        "partition_index INTEGER NOT NULL, file_path TEXT NOT NULL, file_name TEXT, extension TEXT, size_bytes INTEGER, "
        "created_ts TEXT, modified_ts TEXT, accessed_ts TEXT, changed_ts TEXT, md5 TEXT, deleted INTEGER, inode INTEGER, "
        "is_directory INTEGER, forensic_path TEXT, fs_type TEXT, run_id TEXT, import_source TEXT, import_timestamp TEXT)",
        "CREATE INDEX IF NOT EXISTS file_list_evidence ON file_list (evidence_id, partition_index)",

        "CREATE TABLE IF NOT EXISTS browser_history (id INTEGER PRIMARY KEY AUTOINCREMENT, evidence_id INTEGER NOT NULL, "
        "run_id TEXT NOT NULL, discovered_by TEXT NOT NULL, source_path TEXT, partition_index INTEGER, browser TEXT, "
        "profile TEXT, manifest_rel_path TEXT, url TEXT NOT NULL, title TEXT, visit_time_utc TEXT, visit_count INTEGER, "
        "typed_count INTEGER, hidden INTEGER, transition_type TEXT, visit_duration_ms INTEGER, source_visit_id INTEGER, "
        "from_visit_id INTEGER)",
        "CREATE INDEX IF NOT EXISTS browser_history_key ON browser_history (evidence_id, url, visit_time_utc)",

        "CREATE TABLE IF NOT EXISTS bookmarks (id INTEGER PRIMARY KEY AUTOINCREMENT, evidence_id INTEGER NOT NULL, "
        "run_id TEXT NOT NULL, discovered_by TEXT NOT NULL, source_path TEXT, partition_index INTEGER, browser TEXT, "
        "profile TEXT, manifest_rel_path TEXT, url TEXT, title TEXT, folder_path TEXT, guid TEXT, date_added_utc TEXT, "
        "last_modified_utc TEXT, keyword TEXT, tags TEXT)",
        "CREATE INDEX IF NOT EXISTS bookmarks_key ON bookmarks (evidence_id, url, guid)",

        "CREATE TABLE IF NOT EXISTS browser_cache_entries (id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "evidence_id INTEGER NOT NULL, run_id TEXT NOT NULL, discovered_by TEXT NOT NULL, source_path TEXT, "
        "partition_index INTEGER, browser TEXT, profile TEXT, manifest_rel_path TEXT, url TEXT, cache_key TEXT NOT NULL, "
        "cache_filename TEXT, http_status INTEGER, content_type TEXT, content_encoding TEXT, response_head TEXT, "
        "last_fetched_utc TEXT, last_modified_utc TEXT, expiration_utc TEXT, fetch_count INTEGER, body_size INTEGER, "
        "body_sha256 TEXT, body BLOB, body_decoded INTEGER)",
        "CREATE INDEX IF NOT EXISTS browser_cache_entries_key ON browser_cache_entries (evidence_id, cache_key)",

        "CREATE TABLE IF NOT EXISTS urls (id INTEGER PRIMARY KEY AUTOINCREMENT, evidence_id INTEGER NOT NULL, "
        "url TEXT NOT NULL, scheme TEXT, domain TEXT, occurrence_count INTEGER NOT NULL DEFAULT 0, "
        "first_seen_utc TEXT, last_seen_utc TEXT, source_count INTEGER NOT NULL DEFAULT 0, sources TEXT, "
        "UNIQUE(evidence_id, url))",

        "CREATE TABLE IF NOT EXISTS url_sources (id INTEGER PRIMARY KEY AUTOINCREMENT, evidence_id INTEGER NOT NULL, "
        "url TEXT NOT NULL, discovered_by TEXT NOT NULL, run_id TEXT NOT NULL, family TEXT, "
        "occurrence_count INTEGER NOT NULL, first_seen_utc TEXT, last_seen_utc TEXT)",
        "CREATE INDEX IF NOT EXISTS url_sources_url ON url_sources (evidence_id, url)",

        "CREATE TABLE IF NOT EXISTS images (id INTEGER PRIMARY KEY AUTOINCREMENT, evidence_id INTEGER NOT NULL, "
        "rel_path TEXT, filename TEXT, format TEXT, md5 TEXT, sha256 TEXT NOT NULL, size_bytes INTEGER, "
        "first_discovered_by TEXT, first_discovered_at TEXT, discovery_count INTEGER NOT NULL DEFAULT 0, "
        "UNIQUE(evidence_id, sha256))",

        "CREATE TABLE IF NOT EXISTS image_discoveries (id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "image_id INTEGER NOT NULL REFERENCES images(id), evidence_id INTEGER NOT NULL, run_id TEXT NOT NULL, "
        "discovered_by TEXT NOT NULL, source_path TEXT, partition_index INTEGER, browser TEXT, profile TEXT, "
        "manifest_rel_path TEXT, rel_path TEXT, fs_path TEXT, fs_mtime_utc TEXT, fs_atime_utc TEXT, fs_ctime_utc TEXT, "
        "fs_crtime_utc TEXT, fs_inode INTEGER, carved_offset_bytes INTEGER, cache_url TEXT, cache_key TEXT, "
        "cache_filename TEXT)",
        "CREATE INDEX IF NOT EXISTS image_discoveries_image ON image_discoveries (image_id)"
    };

    char * errmsg = NULL;
    for (size_t i = 0; i < sizeof(statements) / sizeof(statements[0]); i++)
    {
        if (sqlite3_exec(m_db, statements[i], NULL, NULL, &errmsg) != SQLITE_OK)
        {
            std::stringstream infoMessage;
            infoMessage << "ArxImgDBSqlite::initialize - Error executing " << statements[i] << ": "
                << (errmsg ? errmsg : "");
            LOGERROR(infoMessage.str());

            sqlite3_free(errmsg);
            return 1;
        }
    }

    return 0;
}

/**
 * This callback mechanism is registered with SQLite and is
 * called whenever an operation would result in SQLITE_BUSY.
 * Each time this method is called we will back off IMGDB_RETRY_WAIT
 * x count milliseconds. A non zero return value tells SQLite to
 * retry the statement and a zero return value tells SQLite to
 * stop retrying, in which case it will return SQLITE_BUSY or
 * SQLITE_IOERR_BLOCKED to the caller.
 */
int ArxImgDBSqlite::busyHandler(void * /*pDB*/, int count)
{
    if (count < IMGDB_MAX_RETRY_COUNT)
    {
        Poco::Thread::sleep(IMGDB_RETRY_WAIT * count);
        return 1;
    }

    return 0;
}

void ArxImgDBSqlite::requireOpen(const std::string& caller) const
{
    if (!m_db)
        throw ArxStorageUnavailableException(caller + " : database is not open");
}

void ArxImgDBSqlite::executeStatement(const std::string &stmtToExecute, sqlite3_stmt *&statement, const std::string &caller) const
{
    requireOpen(caller);
    if (sqlite3_prepare_v2(m_db, stmtToExecute.c_str(), -1, &statement, 0) != SQLITE_OK)
    {
        sqlite3_finalize(statement);
        statement = NULL;
        std::ostringstream msg;
        msg << caller << " : error executing " << stmtToExecute << " : " << sqlite3_errmsg(m_db);
        throw ArxStorageUnavailableException(msg.str());
    }
}

void ArxImgDBSqlite::executeNoResult(const std::string &stmtToExecute, const std::string &caller)
{
    ScopedStatement statement;
    executeStatement(stmtToExecute, statement.ref(), caller);
    stepDone(statement, caller);
}

void ArxImgDBSqlite::stepDone(sqlite3_stmt * statement, const std::string &caller) const
{
    int rc = sqlite3_step(statement);
    if (rc != SQLITE_DONE)
    {
        std::ostringstream msg;
        msg << caller << " : error executing " << sqlite3_sql(statement) << " : " << sqlite3_errmsg(m_db);
        throw ArxStorageUnavailableException(msg.str());
    }
}

void ArxImgDBSqlite::begin()
{
    m_mutex.lock();
    try
    {
        executeNoResult("BEGIN", "ArxImgDBSqlite::begin");
    }
    catch (ArxException&)
    {
        m_mutex.unlock();
        throw;
    }
}

void ArxImgDBSqlite::commit()
{
    try
    {
        executeNoResult("COMMIT", "ArxImgDBSqlite::commit");
    }
    catch (ArxException&)
    {
        m_mutex.unlock();
        throw;
    }
    m_mutex.unlock();
}

void ArxImgDBSqlite::rollback()
{
    if (m_db && !sqlite3_get_autocommit(m_db))
    {
        char * errmsg = NULL;
        if (sqlite3_exec(m_db, "ROLLBACK", NULL, NULL, &errmsg) != SQLITE_OK)
        {
            std::stringstream msg;
            msg << "ArxImgDBSqlite::rollback - Error rolling back: " << (errmsg ? errmsg : "");
            LOGERROR(msg.str());
            sqlite3_free(errmsg);
        }
    }
    m_mutex.unlock();
}

// ---- runs

void ArxImgDBSqlite::addRun(const ArxRunRecord& a_run)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("INSERT INTO runs (") + RUN_COLUMNS + ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        statement.ref(), "ArxImgDBSqlite::addRun");

    bindText(statement, 1, a_run.runId);
    sqlite3_bind_int64(statement, 2, a_run.evidenceId);
    bindText(statement, 3, a_run.extractorName);
    bindText(statement, 4, a_run.extractorVersion);
    bindText(statement, 5, a_run.artifactType);
    bindText(statement, 6, a_run.state);
    bindTextOrNull(statement, 7, a_run.extractionStatus);
    bindTextOrNull(statement, 8, a_run.startedAt);
    bindTextOrNull(statement, 9, a_run.finishedAt);
    bindTextOrNull(statement, 10, a_run.sourceRunId);
    bindTextOrNull(statement, 11, a_run.runDir);
    bindTextOrNull(statement, 12, a_run.manifestPath);
    stepDone(statement, "ArxImgDBSqlite::addRun");
}

void ArxImgDBSqlite::updateRunState(const std::string& a_runId, const std::string& a_state,
    const std::string& a_extractionStatus, const std::string& a_finishedAt)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("UPDATE runs SET state = ?, extraction_status = COALESCE(?, extraction_status), "
        "finished_at_utc = COALESCE(?, finished_at_utc) WHERE run_id = ?",
        statement.ref(), "ArxImgDBSqlite::updateRunState");

    bindText(statement, 1, a_state);
    bindTextOrNull(statement, 2, a_extractionStatus);
    bindTextOrNull(statement, 3, a_finishedAt);
    bindText(statement, 4, a_runId);
    stepDone(statement, "ArxImgDBSqlite::updateRunState");

    if (sqlite3_changes(m_db) != 1)
        throw ArxStorageUnavailableException("ArxImgDBSqlite::updateRunState - no run " + a_runId);
}

void ArxImgDBSqlite::setRunManifest(const std::string& a_runId, const std::string& a_runDir,
    const std::string& a_manifestPath)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("UPDATE runs SET run_dir = ?, manifest_path = ? WHERE run_id = ?",
        statement.ref(), "ArxImgDBSqlite::setRunManifest");

    bindText(statement, 1, a_runDir);
    bindText(statement, 2, a_manifestPath);
    bindText(statement, 3, a_runId);
    stepDone(statement, "ArxImgDBSqlite::setRunManifest");
}

std::optional<ArxRunRecord> ArxImgDBSqlite::getRun(const std::string& a_runId) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("SELECT ") + RUN_COLUMNS + " FROM runs WHERE run_id = ?",
        statement.ref(), "ArxImgDBSqlite::getRun");
    bindText(statement, 1, a_runId);

    if (sqlite3_step(statement) == SQLITE_ROW)
        return readRun(statement);
    return std::nullopt;
}

std::vector<ArxRunRecord> ArxImgDBSqlite::getRuns(int64_t a_evidenceId, const std::string& a_extractorName) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("SELECT ") + RUN_COLUMNS +
        " FROM runs WHERE evidence_id = ? AND (? = '' OR extractor_name = ?) ORDER BY started_at_utc, run_id",
        statement.ref(), "ArxImgDBSqlite::getRuns");
    sqlite3_bind_int64(statement, 1, a_evidenceId);
    bindText(statement, 2, a_extractorName);
    bindText(statement, 3, a_extractorName);

    std::vector<ArxRunRecord> runs;
    while (sqlite3_step(statement) == SQLITE_ROW)
        runs.push_back(readRun(statement));
    return runs;
}

// ---- process log

int64_t ArxImgDBSqlite::addProcessLog(const ArxProcessLogRecord& a_record)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("INSERT INTO process_log (evidence_id, run_id, task, command, started_at_utc, finished_at_utc, "
        "exit_code, stdout, stderr, extractor_name, extractor_version, records_extracted, records_ingested, "
        "warnings_json, log_file_path) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        statement.ref(), "ArxImgDBSqlite::addProcessLog");

    sqlite3_bind_int64(statement, 1, a_record.evidenceId);
    bindTextOrNull(statement, 2, a_record.runId);
    bindText(statement, 3, a_record.task);
    bindTextOrNull(statement, 4, a_record.command);
    bindTextOrNull(statement, 5, a_record.startedAt);
    bindTextOrNull(statement, 6, a_record.finishedAt);
    if (a_record.hasExitCode)
        sqlite3_bind_int(statement, 7, a_record.exitCode);
    else
        sqlite3_bind_null(statement, 7);
    bindTextOrNull(statement, 8, a_record.stdoutRef);
    bindTextOrNull(statement, 9, a_record.stderrRef);
    bindTextOrNull(statement, 10, a_record.extractorName);
    bindTextOrNull(statement, 11, a_record.extractorVersion);
    bindInt64OrNull(statement, 12, a_record.recordsExtracted, -1);
    bindInt64OrNull(statement, 13, a_record.recordsIngested, -1);
    bindTextOrNull(statement, 14, a_record.warningsJson);
    bindTextOrNull(statement, 15, a_record.logFilePath);
    stepDone(statement, "ArxImgDBSqlite::addProcessLog");

    return sqlite3_last_insert_rowid(m_db);
}

std::vector<ArxProcessLogRecord> ArxImgDBSqlite::getProcessLog(int64_t a_evidenceId, const std::string& a_runId) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("SELECT id, evidence_id, run_id, task, command, started_at_utc, finished_at_utc, exit_code, "
        "stdout, stderr, extractor_name, extractor_version, records_extracted, records_ingested, warnings_json, "
        "log_file_path FROM process_log WHERE evidence_id = ? AND (? = '' OR run_id = ?) ORDER BY id",
        statement.ref(), "ArxImgDBSqlite::getProcessLog");
    sqlite3_bind_int64(statement, 1, a_evidenceId);
    bindText(statement, 2, a_runId);
    bindText(statement, 3, a_runId);

    std::vector<ArxProcessLogRecord> rows;
    while (sqlite3_step(statement) == SQLITE_ROW)
    {
        ArxProcessLogRecord row;
        row.id = sqlite3_column_int64(statement, 0);
        row.evidenceId = sqlite3_column_int64(statement, 1);
        row.runId = columnText(statement, 2);
        row.task = columnText(statement, 3);
        row.command = columnText(statement, 4);
        row.startedAt = columnText(statement, 5);
        row.finishedAt = columnText(statement, 6);
        row.hasExitCode = sqlite3_column_type(statement, 7) != SQLITE_NULL;
        row.exitCode = sqlite3_column_int(statement, 7);
        row.stdoutRef = columnText(statement, 8);
        row.stderrRef = columnText(statement, 9);
        row.extractorName = columnText(statement, 10);
        row.extractorVersion = columnText(statement, 11);
        row.recordsExtracted = columnInt64OrDefault(statement, 12, -1);
        row.recordsIngested = columnInt64OrDefault(statement, 13, -1);
        row.warningsJson = columnText(statement, 14);
        row.logFilePath = columnText(statement, 15);
        rows.push_back(row);
    }
    return rows;
}

// ---- extracted files

void ArxImgDBSqlite::addExtractedFile(const std::string& a_runId, const std::string& a_extractorName,
    const ArxManifestEntry& a_entry)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("INSERT INTO extracted_files (run_id, extractor_name, ") + MANIFEST_COLUMNS +
        ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        statement.ref(), "ArxImgDBSqlite::addExtractedFile");

    const ArxCandidateArtifact& src = a_entry.source;
    int idx = 1;
    bindText(statement, idx++, a_runId);
    bindText(statement, idx++, a_extractorName);
    sqlite3_bind_int64(statement, idx++, src.evidenceId);
    sqlite3_bind_int(statement, idx++, src.partitionIndex);
    bindText(statement, idx++, src.logicalPath);
    bindText(statement, idx++, src.forensicPath);
    bindText(statement, idx++, src.fsType);
    sqlite3_bind_int64(statement, idx++, (int64_t)src.size);
    sqlite3_bind_int64(statement, idx++, (int64_t)src.inode);
    sqlite3_bind_int(statement, idx++, src.deleted ? 1 : 0);
    bindTimestamp(statement, idx++, src.mtime);
    bindTimestamp(statement, idx++, src.atime);
    bindTimestamp(statement, idx++, src.ctime);
    bindTimestamp(statement, idx++, src.crtime);
    bindText(statement, idx++, src.artifactType);
    bindText(statement, idx++, src.browser);
    bindText(statement, idx++, src.profile);
    bindText(statement, idx++, a_entry.destRelPath);
    bindText(statement, idx++, a_entry.destFilename);
    sqlite3_bind_int64(statement, idx++, a_entry.sizeBytes);
    bindTextOrNull(statement, idx++, a_entry.md5);
    bindTextOrNull(statement, idx++, a_entry.sha256);
    bindText(statement, idx++, ArxManifestEntry::statusName(a_entry.status));
    bindTextOrNull(statement, idx++, a_entry.errorMessage);
    bindTextOrNull(statement, idx++, a_entry.extractedAt);
    bindText(statement, idx++, a_entry.logicalGroup);
    bindText(statement, idx++, a_entry.role);
    bindInt64OrNull(statement, idx++, a_entry.sourceOffsetBytes, -1);
    stepDone(statement, "ArxImgDBSqlite::addExtractedFile");
}

std::vector<ArxManifestEntry> ArxImgDBSqlite::getExtractedFiles(const std::string& a_runId) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("SELECT ") + MANIFEST_COLUMNS +
        " FROM extracted_files WHERE run_id = ? ORDER BY dest_rel_path",
        statement.ref(), "ArxImgDBSqlite::getExtractedFiles");
    bindText(statement, 1, a_runId);

    std::vector<ArxManifestEntry> entries;
    while (sqlite3_step(statement) == SQLITE_ROW)
    {
        ArxManifestEntry entry;
        ArxCandidateArtifact& src = entry.source;
        int idx = 0;
        src.evidenceId = sqlite3_column_int64(statement, idx++);
        src.partitionIndex = sqlite3_column_int(statement, idx++);
        src.logicalPath = columnText(statement, idx++);
        src.forensicPath = columnText(statement, idx++);
        src.fsType = columnText(statement, idx++);
        src.size = (uint64_t)sqlite3_column_int64(statement, idx++);
        src.inode = (uint64_t)sqlite3_column_int64(statement, idx++);
        src.deleted = sqlite3_column_int(statement, idx++) != 0;
        src.mtime = columnTimestamp(statement, idx++);
        src.atime = columnTimestamp(statement, idx++);
        src.ctime = columnTimestamp(statement, idx++);
        src.crtime = columnTimestamp(statement, idx++);
        src.artifactType = columnText(statement, idx++);
        src.browser = columnText(statement, idx++);
        src.profile = columnText(statement, idx++);
        entry.destRelPath = columnText(statement, idx++);
        entry.destFilename = columnText(statement, idx++);
        entry.sizeBytes = sqlite3_column_int64(statement, idx++);
        entry.md5 = columnText(statement, idx++);
        entry.sha256 = columnText(statement, idx++);
        entry.status = ArxManifestEntry::statusFromName(columnText(statement, idx++));
        entry.errorMessage = columnText(statement, idx++);
        entry.extractedAt = columnText(statement, idx++);
        entry.logicalGroup = columnText(statement, idx++);
        entry.role = columnText(statement, idx++);
        entry.sourceOffsetBytes = columnInt64OrDefault(statement, idx++, -1);
        entries.push_back(entry);
    }
    return entries;
}

// ---- extraction warnings

void ArxImgDBSqlite::addExtractionWarnings(int64_t a_evidenceId, const std::string& a_runId,
    const std::string& a_extractorName, const ArxWarningList& a_warnings)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    for (ArxWarningList::const_iterator it = a_warnings.begin(); it != a_warnings.end(); ++it)
    {
        ScopedStatement statement;
        executeStatement("INSERT INTO extraction_warnings (evidence_id, run_id, extractor_name, warning_type, severity, "
            "category, item_name, item_value, context_json, artifact_type, source_file, created_at_utc) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, strftime('%Y-%m-%dT%H:%M:%fZ', 'now'))",
            statement.ref(), "ArxImgDBSqlite::addExtractionWarnings");

        sqlite3_bind_int64(statement, 1, a_evidenceId);
        bindText(statement, 2, a_runId);
        bindText(statement, 3, a_extractorName);
        bindText(statement, 4, it->warningType);
        bindText(statement, 5, ArxExtractionWarning::severityName(it->severity));
        bindText(statement, 6, it->category);
        bindText(statement, 7, it->itemName);
        bindText(statement, 8, it->itemValue);
        bindTextOrNull(statement, 9, it->contextJson);
        bindText(statement, 10, it->artifactType);
        bindText(statement, 11, it->sourceFile);
        stepDone(statement, "ArxImgDBSqlite::addExtractionWarnings");
    }
}

ArxWarningList ArxImgDBSqlite::getExtractionWarnings(int64_t a_evidenceId, const std::string& a_runId) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("SELECT warning_type, severity, category, item_name, item_value, context_json, artifact_type, "
        "source_file FROM extraction_warnings WHERE evidence_id = ? AND (? = '' OR run_id = ?) ORDER BY id",
        statement.ref(), "ArxImgDBSqlite::getExtractionWarnings");
    sqlite3_bind_int64(statement, 1, a_evidenceId);
    bindText(statement, 2, a_runId);
    bindText(statement, 3, a_runId);

    ArxWarningList warnings;
    while (sqlite3_step(statement) == SQLITE_ROW)
    {
        ArxExtractionWarning warning;
        warning.warningType = columnText(statement, 0);
        std::string severity = columnText(statement, 1);
        warning.severity = severity == "info" ? ArxExtractionWarning::INFO
            : (severity == "error" ? ArxExtractionWarning::ERROR : ArxExtractionWarning::WARNING);
        warning.category = columnText(statement, 2);
        warning.itemName = columnText(statement, 3);
        warning.itemValue = columnText(statement, 4);
        warning.contextJson = columnText(statement, 5);
        warning.artifactType = columnText(statement, 6);
        warning.sourceFile = columnText(statement, 7);
        warnings.push_back(warning);
    }
    return warnings;
}

// ---- file index

int64_t ArxImgDBSqlite::deleteFileList(int64_t a_evidenceId, const std::string& a_importSource)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("DELETE FROM file_list WHERE evidence_id = ? AND (? = '' OR import_source = ?)",
        statement.ref(), "ArxImgDBSqlite::deleteFileList");
    sqlite3_bind_int64(statement, 1, a_evidenceId);
    bindText(statement, 2, a_importSource);
    bindText(statement, 3, a_importSource);
    stepDone(statement, "ArxImgDBSqlite::deleteFileList");
    return sqlite3_changes(m_db);
}

void ArxImgDBSqlite::addFileListRow(const ArxFileListRow& a_row)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("INSERT INTO file_list (") + FILE_LIST_COLUMNS +
        ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        statement.ref(), "ArxImgDBSqlite::addFileListRow");

    const ArxFsEntry& e = a_row.entry;
    int idx = 1;
    sqlite3_bind_int64(statement, idx++, a_row.evidenceId);
    sqlite3_bind_int(statement, idx++, a_row.partitionIndex);
    bindText(statement, idx++, e.logicalPath);
    bindText(statement, idx++, e.name);
    bindText(statement, idx++, a_row.extension);
    sqlite3_bind_int64(statement, idx++, (int64_t)e.size);
    bindTimestamp(statement, idx++, e.crtime);
    bindTimestamp(statement, idx++, e.mtime);
    bindTimestamp(statement, idx++, e.atime);
    bindTimestamp(statement, idx++, e.ctime);
    bindTextOrNull(statement, idx++, a_row.md5);
    sqlite3_bind_int(statement, idx++, e.deleted ? 1 : 0);
    sqlite3_bind_int64(statement, idx++, (int64_t)e.inode);
    sqlite3_bind_int(statement, idx++, e.isDirectory ? 1 : 0);
    bindText(statement, idx++, e.forensicPath);
    bindText(statement, idx++, e.fsType);
    bindTextOrNull(statement, idx++, a_row.runId);
    bindText(statement, idx++, a_row.importSource);
    bindText(statement, idx++, a_row.importTimestamp);
    stepDone(statement, "ArxImgDBSqlite::addFileListRow");
}

int64_t ArxImgDBSqlite::countFileList(int64_t a_evidenceId, int a_partition) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("SELECT COUNT(*) FROM file_list WHERE evidence_id = ? AND (? < 0 OR partition_index = ?)",
        statement.ref(), "ArxImgDBSqlite::countFileList");
    sqlite3_bind_int64(statement, 1, a_evidenceId);
    sqlite3_bind_int(statement, 2, a_partition);
    sqlite3_bind_int(statement, 3, a_partition);

    if (sqlite3_step(statement) == SQLITE_ROW)
        return sqlite3_column_int64(statement, 0);
    return 0;
}

std::vector<ArxFileListRow> ArxImgDBSqlite::queryFileList(int64_t a_evidenceId, int a_partition,
    const std::string& a_likePattern) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("SELECT ") + FILE_LIST_COLUMNS +
        " FROM file_list WHERE evidence_id = ? AND (? < 0 OR partition_index = ?) "
        "AND UPPER(file_path) LIKE UPPER(?) ESCAPE '#' ORDER BY partition_index, file_path",
        statement.ref(), "ArxImgDBSqlite::queryFileList");
    sqlite3_bind_int64(statement, 1, a_evidenceId);
    sqlite3_bind_int(statement, 2, a_partition);
    sqlite3_bind_int(statement, 3, a_partition);
    bindText(statement, 4, a_likePattern);

    std::vector<ArxFileListRow> rows;
    while (sqlite3_step(statement) == SQLITE_ROW)
    {
        ArxFileListRow row;
        ArxFsEntry& e = row.entry;
        int idx = 0;
        row.evidenceId = sqlite3_column_int64(statement, idx++);
        row.partitionIndex = sqlite3_column_int(statement, idx++);
        e.logicalPath = columnText(statement, idx++);
        e.name = columnText(statement, idx++);
        row.extension = columnText(statement, idx++);
        e.size = (uint64_t)sqlite3_column_int64(statement, idx++);
        e.crtime = columnTimestamp(statement, idx++);
        e.mtime = columnTimestamp(statement, idx++);
        e.atime = columnTimestamp(statement, idx++);
        e.ctime = columnTimestamp(statement, idx++);
        row.md5 = columnText(statement, idx++);
        e.deleted = sqlite3_column_int(statement, idx++) != 0;
        e.inode = (uint64_t)sqlite3_column_int64(statement, idx++);
        e.isDirectory = sqlite3_column_int(statement, idx++) != 0;
        e.isRegular = !e.isDirectory;
        e.forensicPath = columnText(statement, idx++);
        e.fsType = columnText(statement, idx++);
        row.runId = columnText(statement, idx++);
        row.importSource = columnText(statement, idx++);
        row.importTimestamp = columnText(statement, idx++);
        rows.push_back(row);
    }
    return rows;
}

// ---- family helpers

int64_t ArxImgDBSqlite::deleteInScope(const std::string& table, const ArxRecordScope& a_scope, const std::string& caller)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("DELETE FROM " + table + " WHERE " + scopeClause(a_scope), statement.ref(), caller);
    bindScope(statement, 1, a_scope);
    stepDone(statement, caller);
    return sqlite3_changes(m_db);
}

// ---- browser history

int64_t ArxImgDBSqlite::deleteHistory(const ArxRecordScope& a_scope)
{
    return deleteInScope("browser_history", a_scope, "ArxImgDBSqlite::deleteHistory");
}

std::optional<ArxStoredRow<ArxHistoryVisitRecord> > ArxImgDBSqlite::findHistory(int64_t a_evidenceId,
    const ArxHistoryVisitRecord& a_key) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("SELECT ") + HISTORY_COLUMNS + " FROM browser_history WHERE evidence_id = ? "
        "AND url = ? AND visit_time_utc IS ? AND browser = ? AND profile = ? AND discovered_by = ?",
        statement.ref(), "ArxImgDBSqlite::findHistory");
    sqlite3_bind_int64(statement, 1, a_evidenceId);
    bindText(statement, 2, a_key.url);
    bindTimestamp(statement, 3, a_key.visitTime);
    bindText(statement, 4, a_key.source.browser);
    bindText(statement, 5, a_key.source.profile);
    bindText(statement, 6, a_key.source.discoveredBy);

    if (sqlite3_step(statement) == SQLITE_ROW)
        return readHistory(statement);
    return std::nullopt;
}

int64_t ArxImgDBSqlite::insertHistory(int64_t a_evidenceId, const std::string& a_runId,
    const ArxHistoryVisitRecord& a_record)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("INSERT INTO browser_history (evidence_id, run_id, ") + SOURCE_COLUMNS +
        ", url, title, visit_time_utc, visit_count, typed_count, hidden, transition_type, visit_duration_ms, "
        "source_visit_id, from_visit_id) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        statement.ref(), "ArxImgDBSqlite::insertHistory");
    sqlite3_bind_int64(statement, 1, a_evidenceId);
    bindText(statement, 2, a_runId);
    int idx = bindSource(statement, 3, a_record.source);
    bindHistoryFields(statement, idx, a_record);
    stepDone(statement, "ArxImgDBSqlite::insertHistory");
    return sqlite3_last_insert_rowid(m_db);
}

void ArxImgDBSqlite::updateHistory(int64_t a_id, const std::string& a_runId, const ArxHistoryVisitRecord& a_record)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("UPDATE browser_history SET run_id = ?, discovered_by = ?, source_path = ?, partition_index = ?, "
        "browser = ?, profile = ?, manifest_rel_path = ?, url = ?, title = ?, visit_time_utc = ?, visit_count = ?, "
        "typed_count = ?, hidden = ?, transition_type = ?, visit_duration_ms = ?, source_visit_id = ?, "
        "from_visit_id = ? WHERE id = ?",
        statement.ref(), "ArxImgDBSqlite::updateHistory");
    bindText(statement, 1, a_runId);
    int idx = bindSource(statement, 2, a_record.source);
    idx = bindHistoryFields(statement, idx, a_record);
    sqlite3_bind_int64(statement, idx, a_id);
    stepDone(statement, "ArxImgDBSqlite::updateHistory");
}

std::vector<ArxStoredRow<ArxHistoryVisitRecord> > ArxImgDBSqlite::getHistory(int64_t a_evidenceId) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("SELECT ") + HISTORY_COLUMNS +
        " FROM browser_history WHERE evidence_id = ? ORDER BY url, visit_time_utc, browser, profile, discovered_by",
        statement.ref(), "ArxImgDBSqlite::getHistory");
    sqlite3_bind_int64(statement, 1, a_evidenceId);

    std::vector<ArxStoredRow<ArxHistoryVisitRecord> > rows;
    while (sqlite3_step(statement) == SQLITE_ROW)
        rows.push_back(readHistory(statement));
    return rows;
}

// ---- bookmarks

int64_t ArxImgDBSqlite::deleteBookmarks(const ArxRecordScope& a_scope)
{
    return deleteInScope("bookmarks", a_scope, "ArxImgDBSqlite::deleteBookmarks");
}

std::optional<ArxStoredRow<ArxBookmarkRecord> > ArxImgDBSqlite::findBookmark(int64_t a_evidenceId,
    const ArxBookmarkRecord& a_key) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("SELECT ") + BOOKMARK_COLUMNS + " FROM bookmarks WHERE evidence_id = ? "
        "AND browser = ? AND profile = ? AND url = ? AND folder_path = ? AND guid = ? AND date_added_utc IS ? "
        "AND discovered_by = ?",
        statement.ref(), "ArxImgDBSqlite::findBookmark");
    sqlite3_bind_int64(statement, 1, a_evidenceId);
    bindText(statement, 2, a_key.source.browser);
    bindText(statement, 3, a_key.source.profile);
    bindText(statement, 4, a_key.url);
    bindText(statement, 5, a_key.folderPath);
    bindText(statement, 6, a_key.guid);
    bindTimestamp(statement, 7, a_key.dateAdded);
    bindText(statement, 8, a_key.source.discoveredBy);

    if (sqlite3_step(statement) == SQLITE_ROW)
        return readBookmark(statement);
    return std::nullopt;
}

int64_t ArxImgDBSqlite::insertBookmark(int64_t a_evidenceId, const std::string& a_runId,
    const ArxBookmarkRecord& a_record)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("INSERT INTO bookmarks (evidence_id, run_id, ") + SOURCE_COLUMNS +
        ", url, title, folder_path, guid, date_added_utc, last_modified_utc, keyword, tags) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        statement.ref(), "ArxImgDBSqlite::insertBookmark");
    sqlite3_bind_int64(statement, 1, a_evidenceId);
    bindText(statement, 2, a_runId);
    int idx = bindSource(statement, 3, a_record.source);
    bindBookmarkFields(statement, idx, a_record);
    stepDone(statement, "ArxImgDBSqlite::insertBookmark");
    return sqlite3_last_insert_rowid(m_db);
}

void ArxImgDBSqlite::updateBookmark(int64_t a_id, const std::string& a_runId, const ArxBookmarkRecord& a_record)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("UPDATE bookmarks SET run_id = ?, discovered_by = ?, source_path = ?, partition_index = ?, "
        "browser = ?, profile = ?, manifest_rel_path = ?, url = ?, title = ?, folder_path = ?, guid = ?, "
        "date_added_utc = ?, last_modified_utc = ?, keyword = ?, tags = ? WHERE id = ?",
        statement.ref(), "ArxImgDBSqlite::updateBookmark");
    bindText(statement, 1, a_runId);
    int idx = bindSource(statement, 2, a_record.source);
    idx = bindBookmarkFields(statement, idx, a_record);
    sqlite3_bind_int64(statement, idx, a_id);
    stepDone(statement, "ArxImgDBSqlite::updateBookmark");
}

std::vector<ArxStoredRow<ArxBookmarkRecord> > ArxImgDBSqlite::getBookmarks(int64_t a_evidenceId) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("SELECT ") + BOOKMARK_COLUMNS +
        " FROM bookmarks WHERE evidence_id = ? ORDER BY folder_path, url, guid, discovered_by",
        statement.ref(), "ArxImgDBSqlite::getBookmarks");
    sqlite3_bind_int64(statement, 1, a_evidenceId);

    std::vector<ArxStoredRow<ArxBookmarkRecord> > rows;
    while (sqlite3_step(statement) == SQLITE_ROW)
        rows.push_back(readBookmark(statement));
    return rows;
}

// ---- browser cache entries

int64_t ArxImgDBSqlite::deleteCacheEntries(const ArxRecordScope& a_scope)
{
    return deleteInScope("browser_cache_entries", a_scope, "ArxImgDBSqlite::deleteCacheEntries");
}

std::optional<ArxStoredRow<ArxCacheEntryRecord> > ArxImgDBSqlite::findCacheEntry(int64_t a_evidenceId,
    const ArxCacheEntryRecord& a_key) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("SELECT ") + CACHE_COLUMNS + " FROM browser_cache_entries WHERE evidence_id = ? "
        "AND browser = ? AND profile = ? AND cache_key = ? AND discovered_by = ?",
        statement.ref(), "ArxImgDBSqlite::findCacheEntry");
    sqlite3_bind_int64(statement, 1, a_evidenceId);
    bindText(statement, 2, a_key.source.browser);
    bindText(statement, 3, a_key.source.profile);
    bindText(statement, 4, a_key.cacheKey);
    bindText(statement, 5, a_key.source.discoveredBy);

    if (sqlite3_step(statement) == SQLITE_ROW)
        return readCacheEntry(statement);
    return std::nullopt;
}

int64_t ArxImgDBSqlite::insertCacheEntry(int64_t a_evidenceId, const std::string& a_runId,
    const ArxCacheEntryRecord& a_record)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("INSERT INTO browser_cache_entries (evidence_id, run_id, ") + SOURCE_COLUMNS +
        ", url, cache_key, cache_filename, http_status, content_type, content_encoding, response_head, "
        "last_fetched_utc, last_modified_utc, expiration_utc, fetch_count, body_size, body_sha256, body, body_decoded) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        statement.ref(), "ArxImgDBSqlite::insertCacheEntry");
    sqlite3_bind_int64(statement, 1, a_evidenceId);
    bindText(statement, 2, a_runId);
    int idx = bindSource(statement, 3, a_record.source);
    bindCacheFields(statement, idx, a_record);
    stepDone(statement, "ArxImgDBSqlite::insertCacheEntry");
    return sqlite3_last_insert_rowid(m_db);
}

void ArxImgDBSqlite::updateCacheEntry(int64_t a_id, const std::string& a_runId, const ArxCacheEntryRecord& a_record)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("UPDATE browser_cache_entries SET run_id = ?, discovered_by = ?, source_path = ?, "
        "partition_index = ?, browser = ?, profile = ?, manifest_rel_path = ?, url = ?, cache_key = ?, "
        "cache_filename = ?, http_status = ?, content_type = ?, content_encoding = ?, response_head = ?, "
        "last_fetched_utc = ?, last_modified_utc = ?, expiration_utc = ?, fetch_count = ?, body_size = ?, "
        "body_sha256 = ?, body = ?, body_decoded = ? WHERE id = ?",
        statement.ref(), "ArxImgDBSqlite::updateCacheEntry");
    bindText(statement, 1, a_runId);
    int idx = bindSource(statement, 2, a_record.source);
    idx = bindCacheFields(statement, idx, a_record);
    sqlite3_bind_int64(statement, idx, a_id);
    stepDone(statement, "ArxImgDBSqlite::updateCacheEntry");
}

std::vector<ArxStoredRow<ArxCacheEntryRecord> > ArxImgDBSqlite::getCacheEntries(int64_t a_evidenceId) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("SELECT ") + CACHE_COLUMNS +
        " FROM browser_cache_entries WHERE evidence_id = ? ORDER BY cache_key, browser, profile, discovered_by",
        statement.ref(), "ArxImgDBSqlite::getCacheEntries");
    sqlite3_bind_int64(statement, 1, a_evidenceId);

    std::vector<ArxStoredRow<ArxCacheEntryRecord> > rows;
    while (sqlite3_step(statement) == SQLITE_ROW)
        rows.push_back(readCacheEntry(statement));
    return rows;
}

// ---- URL registry

std::vector<std::string> ArxImgDBSqlite::getUrlSourceUrls(const ArxRecordScope& a_scope) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("SELECT DISTINCT url FROM url_sources WHERE " + scopeClause(a_scope) + " ORDER BY url",
        statement.ref(), "ArxImgDBSqlite::getUrlSourceUrls");
    bindScope(statement, 1, a_scope);

    std::vector<std::string> urls;
    while (sqlite3_step(statement) == SQLITE_ROW)
        urls.push_back(columnText(statement, 0));
    return urls;
}

int64_t ArxImgDBSqlite::deleteUrlSources(const ArxRecordScope& a_scope)
{
    return deleteInScope("url_sources", a_scope, "ArxImgDBSqlite::deleteUrlSources");
}

void ArxImgDBSqlite::addUrlSource(const ArxUrlSourceRow& a_row)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("INSERT INTO url_sources (evidence_id, url, discovered_by, run_id, family, occurrence_count, "
        "first_seen_utc, last_seen_utc) VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
        statement.ref(), "ArxImgDBSqlite::addUrlSource");
    sqlite3_bind_int64(statement, 1, a_row.evidenceId);
    bindText(statement, 2, a_row.url);
    bindText(statement, 3, a_row.discoveredBy);
    bindText(statement, 4, a_row.runId);
    bindText(statement, 5, a_row.family);
    sqlite3_bind_int64(statement, 6, a_row.occurrenceCount);
    bindTimestamp(statement, 7, a_row.firstSeen);
    bindTimestamp(statement, 8, a_row.lastSeen);
    stepDone(statement, "ArxImgDBSqlite::addUrlSource");
}

std::vector<ArxUrlSourceRow> ArxImgDBSqlite::getUrlSources(int64_t a_evidenceId, const std::string& a_url) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("SELECT evidence_id, url, discovered_by, run_id, family, occurrence_count, first_seen_utc, "
        "last_seen_utc FROM url_sources WHERE evidence_id = ? AND url = ? ORDER BY discovered_by, run_id, family",
        statement.ref(), "ArxImgDBSqlite::getUrlSources");
    sqlite3_bind_int64(statement, 1, a_evidenceId);
    bindText(statement, 2, a_url);

    std::vector<ArxUrlSourceRow> rows;
    while (sqlite3_step(statement) == SQLITE_ROW)
    {
        ArxUrlSourceRow row;
        row.evidenceId = sqlite3_column_int64(statement, 0);
        row.url = columnText(statement, 1);
        row.discoveredBy = columnText(statement, 2);
        row.runId = columnText(statement, 3);
        row.family = columnText(statement, 4);
        row.occurrenceCount = sqlite3_column_int64(statement, 5);
        row.firstSeen = columnTimestamp(statement, 6);
        row.lastSeen = columnTimestamp(statement, 7);
        rows.push_back(row);
    }
    return rows;
}

void ArxImgDBSqlite::putUrl(const ArxUrlRow& a_row)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("INSERT INTO urls (evidence_id, url, scheme, domain, occurrence_count, first_seen_utc, "
        "last_seen_utc, source_count, sources) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(evidence_id, url) DO UPDATE SET scheme = excluded.scheme, domain = excluded.domain, "
        "occurrence_count = excluded.occurrence_count, first_seen_utc = excluded.first_seen_utc, "
        "last_seen_utc = excluded.last_seen_utc, source_count = excluded.source_count, sources = excluded.sources",
        statement.ref(), "ArxImgDBSqlite::putUrl");
    sqlite3_bind_int64(statement, 1, a_row.evidenceId);
    bindText(statement, 2, a_row.url);
    bindText(statement, 3, a_row.scheme);
    bindText(statement, 4, a_row.domain);
    sqlite3_bind_int64(statement, 5, a_row.occurrenceCount);
    bindTimestamp(statement, 6, a_row.firstSeen);
    bindTimestamp(statement, 7, a_row.lastSeen);
    sqlite3_bind_int64(statement, 8, a_row.sourceCount);
    bindText(statement, 9, a_row.sources);
    stepDone(statement, "ArxImgDBSqlite::putUrl");
}

void ArxImgDBSqlite::deleteUrl(int64_t a_evidenceId, const std::string& a_url)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("DELETE FROM urls WHERE evidence_id = ? AND url = ?",
        statement.ref(), "ArxImgDBSqlite::deleteUrl");
    sqlite3_bind_int64(statement, 1, a_evidenceId);
    bindText(statement, 2, a_url);
    stepDone(statement, "ArxImgDBSqlite::deleteUrl");
}

std::vector<ArxUrlRow> ArxImgDBSqlite::getUrls(int64_t a_evidenceId) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("SELECT evidence_id, url, scheme, domain, occurrence_count, first_seen_utc, last_seen_utc, "
        "source_count, sources FROM urls WHERE evidence_id = ? ORDER BY url",
        statement.ref(), "ArxImgDBSqlite::getUrls");
    sqlite3_bind_int64(statement, 1, a_evidenceId);

    std::vector<ArxUrlRow> rows;
    while (sqlite3_step(statement) == SQLITE_ROW)
    {
        ArxUrlRow row;
        row.evidenceId = sqlite3_column_int64(statement, 0);
        row.url = columnText(statement, 1);
        row.scheme = columnText(statement, 2);
        row.domain = columnText(statement, 3);
        row.occurrenceCount = sqlite3_column_int64(statement, 4);
        row.firstSeen = columnTimestamp(statement, 5);
        row.lastSeen = columnTimestamp(statement, 6);
        row.sourceCount = sqlite3_column_int64(statement, 7);
        row.sources = columnText(statement, 8);
        rows.push_back(row);
    }
    return rows;
}

// ---- images

std::optional<ArxImageRow> ArxImgDBSqlite::findImage(int64_t a_evidenceId, const std::string& a_sha256) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("SELECT ") + IMAGE_COLUMNS + " FROM images WHERE evidence_id = ? AND sha256 = ?",
        statement.ref(), "ArxImgDBSqlite::findImage");
    sqlite3_bind_int64(statement, 1, a_evidenceId);
    bindText(statement, 2, a_sha256);

    if (sqlite3_step(statement) == SQLITE_ROW)
        return readImage(statement);
    return std::nullopt;
}

int64_t ArxImgDBSqlite::insertImage(const ArxImageRow& a_row)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("INSERT INTO images (evidence_id, rel_path, filename, format, md5, sha256, size_bytes, "
        "first_discovered_by, first_discovered_at, discovery_count) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        statement.ref(), "ArxImgDBSqlite::insertImage");
    sqlite3_bind_int64(statement, 1, a_row.evidenceId);
    bindText(statement, 2, a_row.relPath);
    bindText(statement, 3, a_row.filename);
    bindText(statement, 4, a_row.format);
    bindTextOrNull(statement, 5, a_row.md5);
    bindText(statement, 6, a_row.sha256);
    sqlite3_bind_int64(statement, 7, a_row.sizeBytes);
    bindText(statement, 8, a_row.firstDiscoveredBy);
    bindText(statement, 9, a_row.firstDiscoveredAt);
    sqlite3_bind_int64(statement, 10, a_row.discoveryCount);
    stepDone(statement, "ArxImgDBSqlite::insertImage");
    return sqlite3_last_insert_rowid(m_db);
}

void ArxImgDBSqlite::setImageDiscoveryCount(int64_t a_imageId, int64_t a_count)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("UPDATE images SET discovery_count = ? WHERE id = ?",
        statement.ref(), "ArxImgDBSqlite::setImageDiscoveryCount");
    sqlite3_bind_int64(statement, 1, a_count);
    sqlite3_bind_int64(statement, 2, a_imageId);
    stepDone(statement, "ArxImgDBSqlite::setImageDiscoveryCount");
}

std::vector<int64_t> ArxImgDBSqlite::getImageIdsForDiscoveries(const ArxRecordScope& a_scope) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("SELECT DISTINCT image_id FROM image_discoveries WHERE " + scopeClause(a_scope) +
        " ORDER BY image_id", statement.ref(), "ArxImgDBSqlite::getImageIdsForDiscoveries");
    bindScope(statement, 1, a_scope);

    std::vector<int64_t> ids;
    while (sqlite3_step(statement) == SQLITE_ROW)
        ids.push_back(sqlite3_column_int64(statement, 0));
    return ids;
}

int64_t ArxImgDBSqlite::deleteImageDiscoveries(const ArxRecordScope& a_scope)
{
    return deleteInScope("image_discoveries", a_scope, "ArxImgDBSqlite::deleteImageDiscoveries");
}

int64_t ArxImgDBSqlite::insertImageDiscovery(int64_t a_imageId, int64_t a_evidenceId, const std::string& a_runId,
    const ArxImageRecord& a_record)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("INSERT INTO image_discoveries (image_id, evidence_id, run_id, ") + SOURCE_COLUMNS +
        ", rel_path, fs_path, fs_mtime_utc, fs_atime_utc, fs_ctime_utc, fs_crtime_utc, fs_inode, carved_offset_bytes, "
        "cache_url, cache_key, cache_filename) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        statement.ref(), "ArxImgDBSqlite::insertImageDiscovery");
    sqlite3_bind_int64(statement, 1, a_imageId);
    sqlite3_bind_int64(statement, 2, a_evidenceId);
    bindText(statement, 3, a_runId);
    int idx = bindSource(statement, 4, a_record.source);
    bindText(statement, idx++, a_record.relPath);
    bindText(statement, idx++, a_record.fsPath);
    bindTimestamp(statement, idx++, a_record.fsMtime);
    bindTimestamp(statement, idx++, a_record.fsAtime);
    bindTimestamp(statement, idx++, a_record.fsCtime);
    bindTimestamp(statement, idx++, a_record.fsCrtime);
    sqlite3_bind_int64(statement, idx++, (int64_t)a_record.fsInode);
    bindInt64OrNull(statement, idx++, a_record.carvedOffsetBytes, -1);
    bindText(statement, idx++, a_record.cacheUrl);
    bindText(statement, idx++, a_record.cacheKey);
    bindText(statement, idx++, a_record.cacheFilename);
    stepDone(statement, "ArxImgDBSqlite::insertImageDiscovery");
    return sqlite3_last_insert_rowid(m_db);
}

int64_t ArxImgDBSqlite::countImageDiscoveries(int64_t a_imageId) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement("SELECT COUNT(*) FROM image_discoveries WHERE image_id = ?",
        statement.ref(), "ArxImgDBSqlite::countImageDiscoveries");
    sqlite3_bind_int64(statement, 1, a_imageId);

    if (sqlite3_step(statement) == SQLITE_ROW)
        return sqlite3_column_int64(statement, 0);
    return 0;
}

std::vector<ArxImageRow> ArxImgDBSqlite::getImages(int64_t a_evidenceId) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("SELECT ") + IMAGE_COLUMNS + " FROM images WHERE evidence_id = ? ORDER BY sha256",
        statement.ref(), "ArxImgDBSqlite::getImages");
    sqlite3_bind_int64(statement, 1, a_evidenceId);

    std::vector<ArxImageRow> rows;
    while (sqlite3_step(statement) == SQLITE_ROW)
        rows.push_back(readImage(statement));
    return rows;
}

std::vector<ArxStoredRow<ArxImageRecord> > ArxImgDBSqlite::getImageDiscoveries(int64_t a_evidenceId) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    ScopedStatement statement;
    executeStatement(std::string("SELECT d.id, d.evidence_id, d.run_id, d.discovered_by, d.source_path, "
        "d.partition_index, d.browser, d.profile, d.manifest_rel_path, i.sha256, i.md5, i.size_bytes, i.filename, "
        "d.rel_path, i.format, d.fs_path, d.fs_mtime_utc, d.fs_atime_utc, d.fs_ctime_utc, d.fs_crtime_utc, d.fs_inode, "
        "d.carved_offset_bytes, d.cache_url, d.cache_key, d.cache_filename "
        "FROM image_discoveries d JOIN images i ON i.id = d.image_id WHERE d.evidence_id = ? "
        "ORDER BY i.sha256, d.fs_path, d.cache_key, d.carved_offset_bytes, d.discovered_by"),
        statement.ref(), "ArxImgDBSqlite::getImageDiscoveries");
    sqlite3_bind_int64(statement, 1, a_evidenceId);

    std::vector<ArxStoredRow<ArxImageRecord> > rows;
    while (sqlite3_step(statement) == SQLITE_ROW)
    {
        ArxStoredRow<ArxImageRecord> row;
        row.id = sqlite3_column_int64(statement, 0);
        row.evidenceId = sqlite3_column_int64(statement, 1);
        row.runId = columnText(statement, 2);
        int idx = readSource(statement, 3, row.record.source);
        row.record.sha256 = columnText(statement, idx++);
        row.record.md5 = columnText(statement, idx++);
        row.record.sizeBytes = sqlite3_column_int64(statement, idx++);
        row.record.filename = columnText(statement, idx++);
        row.record.relPath = columnText(statement, idx++);
        row.record.format = columnText(statement, idx++);
        row.record.fsPath = columnText(statement, idx++);
        row.record.fsMtime = columnTimestamp(statement, idx++);
        row.record.fsAtime = columnTimestamp(statement, idx++);
        row.record.fsCtime = columnTimestamp(statement, idx++);
        row.record.fsCrtime = columnTimestamp(statement, idx++);
        row.record.fsInode = (uint64_t)sqlite3_column_int64(statement, idx++);
        row.record.carvedOffsetBytes = columnInt64OrDefault(statement, idx++, -1);
        row.record.cacheUrl = columnText(statement, idx++);
        row.record.cacheKey = columnText(statement, idx++);
        row.record.cacheFilename = columnText(statement, idx++);
        rows.push_back(row);
    }
    return rows;
}
