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
 * \file ArxImgDBSqlite.h
 * A SQLite based implementation of the storage ports.
 */

#ifndef _ARX_IMGDBSQLITE_H
#define _ARX_IMGDBSQLITE_H

#include "ArxImgDB.h"
#include "sqlite3.h"
#include "Poco/Mutex.h"

/**
 * Implementation of ArxImgDB that stores everything in one SQLite file.
 *
 * Statements are serialized on the single connection. begin() takes the
 * connection lock and holds it until commit() or rollback() is called on
 * the same thread, so a transaction never interleaves with statements
 * issued by other threads.
 */
class ARX_FRAMEWORK_API ArxImgDBSqlite : public ArxImgDB
{
public:
    /**
     * Set the database location. Must call initialize() before the
     * object can be used.
     * @param a_dbFilePath Path of the database file. Its directory must exist.
     */
    explicit ArxImgDBSqlite(const std::string& a_dbFilePath);
    virtual ~ArxImgDBSqlite();

    virtual int initialize();
    virtual int close();

    virtual void begin();
    virtual void commit();
    virtual void rollback();

    virtual void addRun(const ArxRunRecord& a_run);
    virtual void updateRunState(const std::string& a_runId, const std::string& a_state,
        const std::string& a_extractionStatus, const std::string& a_finishedAt);
    virtual void setRunManifest(const std::string& a_runId, const std::string& a_runDir,
        const std::string& a_manifestPath);
    virtual std::optional<ArxRunRecord> getRun(const std::string& a_runId) const;
    virtual std::vector<ArxRunRecord> getRuns(int64_t a_evidenceId, const std::string& a_extractorName) const;

    virtual int64_t addProcessLog(const ArxProcessLogRecord& a_record);
    virtual std::vector<ArxProcessLogRecord> getProcessLog(int64_t a_evidenceId, const std::string& a_runId) const;

    virtual void addExtractedFile(const std::string& a_runId, const std::string& a_extractorName,
        const ArxManifestEntry& a_entry);
    virtual std::vector<ArxManifestEntry> getExtractedFiles(const std::string& a_runId) const;

    virtual void addExtractionWarnings(int64_t a_evidenceId, const std::string& a_runId,
        const std::string& a_extractorName, const ArxWarningList& a_warnings);
    virtual ArxWarningList getExtractionWarnings(int64_t a_evidenceId, const std::string& a_runId) const;

    virtual int64_t deleteFileList(int64_t a_evidenceId, const std::string& a_importSource);
    virtual void addFileListRow(const ArxFileListRow& a_row);
    virtual int64_t countFileList(int64_t a_evidenceId, int a_partition = -1) const;
    virtual std::vector<ArxFileListRow> queryFileList(int64_t a_evidenceId, int a_partition,
        const std::string& a_likePattern) const;

    virtual int64_t deleteHistory(const ArxRecordScope& a_scope);
    virtual std::optional<ArxStoredRow<ArxHistoryVisitRecord> > findHistory(int64_t a_evidenceId,
        const ArxHistoryVisitRecord& a_key) const;
    virtual int64_t insertHistory(int64_t a_evidenceId, const std::string& a_runId,
        const ArxHistoryVisitRecord& a_record);
    virtual void updateHistory(int64_t a_id, const std::string& a_runId, const ArxHistoryVisitRecord& a_record);
    virtual std::vector<ArxStoredRow<ArxHistoryVisitRecord> > getHistory(int64_t a_evidenceId) const;

    virtual int64_t deleteBookmarks(const ArxRecordScope& a_scope);
    virtual std::optional<ArxStoredRow<ArxBookmarkRecord> > findBookmark(int64_t a_evidenceId,
        const ArxBookmarkRecord& a_key) const;
    virtual int64_t insertBookmark(int64_t a_evidenceId, const std::string& a_runId,
        const ArxBookmarkRecord& a_record);
    virtual void updateBookmark(int64_t a_id, const std::string& a_runId, const ArxBookmarkRecord& a_record);
    virtual std::vector<ArxStoredRow<ArxBookmarkRecord> > getBookmarks(int64_t a_evidenceId) const;

    virtual int64_t deleteCacheEntries(const ArxRecordScope& a_scope);
    virtual std::optional<ArxStoredRow<ArxCacheEntryRecord> > findCacheEntry(int64_t a_evidenceId,
        const ArxCacheEntryRecord& a_key) const;
    virtual int64_t insertCacheEntry(int64_t a_evidenceId, const std::string& a_runId,
        const ArxCacheEntryRecord& a_record);
    virtual void updateCacheEntry(int64_t a_id, const std::string& a_runId, const ArxCacheEntryRecord& a_record);
    virtual std::vector<ArxStoredRow<ArxCacheEntryRecord> > getCacheEntries(int64_t a_evidenceId) const;

    virtual std::vector<std::string> getUrlSourceUrls(const ArxRecordScope& a_scope) const;
    virtual int64_t deleteUrlSources(const ArxRecordScope& a_scope);
    virtual void addUrlSource(const ArxUrlSourceRow& a_row);
    virtual std::vector<ArxUrlSourceRow> getUrlSources(int64_t a_evidenceId, const std::string& a_url) const;
    virtual void putUrl(const ArxUrlRow& a_row);
    virtual void deleteUrl(int64_t a_evidenceId, const std::string& a_url);
    virtual std::vector<ArxUrlRow> getUrls(int64_t a_evidenceId) const;

    virtual std::optional<ArxImageRow> findImage(int64_t a_evidenceId, const std::string& a_sha256) const;
    virtual int64_t insertImage(const ArxImageRow& a_row);
    virtual void setImageDiscoveryCount(int64_t a_imageId, int64_t a_count);
    virtual std::vector<int64_t> getImageIdsForDiscoveries(const ArxRecordScope& a_scope) const;
    virtual int64_t deleteImageDiscoveries(const ArxRecordScope& a_scope);
    virtual int64_t insertImageDiscovery(int64_t a_imageId, int64_t a_evidenceId, const std::string& a_runId,
        const ArxImageRecord& a_record);
    virtual int64_t countImageDiscoveries(int64_t a_imageId) const;
    virtual std::vector<ArxImageRow> getImages(int64_t a_evidenceId) const;
    virtual std::vector<ArxStoredRow<ArxImageRecord> > getImageDiscoveries(int64_t a_evidenceId) const;

private:
    int open();
    int createTables();
    static int busyHandler(void * pDB, int count);

    void executeStatement(const std::string &stmtToExecute, sqlite3_stmt *&statement, const std::string &caller) const;
    void executeNoResult(const std::string &stmtToExecute, const std::string &caller);
    void stepDone(sqlite3_stmt * statement, const std::string &caller) const;
    int64_t deleteInScope(const std::string& table, const ArxRecordScope& a_scope, const std::string& caller);
    void requireOpen(const std::string& caller) const;

    std::string m_dbFilePath;
    sqlite3 * m_db;
    mutable Poco::Mutex m_mutex;
};

#endif
