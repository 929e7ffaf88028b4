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
 * \file ArxImgDB.h
 * Contains the interface of the storage ports used by the engine.
 */

#ifndef _ARX_IMGDB_H
#define _ARX_IMGDB_H

#include <optional>
#include <string>
#include <vector>

#include "arx/framework_i.h"
#include "arx/fs/ArxEvidenceFS.h"
#include "arx/extraction/ArxManifestEntry.h"
#include "arx/records/ArxRecords.h"

/**
 * One row of the runs table.
 */
struct ArxRunRecord
{
    ArxRunRecord() : evidenceId(0) {}

    std::string runId;
    int64_t evidenceId;
    std::string extractorName;
    std::string extractorVersion;
    std::string artifactType;
    std::string state;
    /// ok, degraded, cancelled or failed once extraction has finished.
    std::string extractionStatus;
    std::string startedAt;
    std::string finishedAt;
    std::string sourceRunId;
    std::string runDir;
    std::string manifestPath;
};

/**
 * One row of the append-only process_log table. A row is written for
 * every run state transition and every external tool invocation.
 */
struct ArxProcessLogRecord
{
    ArxProcessLogRecord() : id(0), evidenceId(0), exitCode(0), hasExitCode(false),
        recordsExtracted(-1), recordsIngested(-1) {}

    int64_t id;
    int64_t evidenceId;
    std::string runId;
    std::string task;
    std::string command;
    std::string startedAt;
    std::string finishedAt;
    int exitCode;
    bool hasExitCode;
    std::string stdoutRef;
    std::string stderrRef;
    std::string extractorName;
    std::string extractorVersion;
    int64_t recordsExtracted;
    int64_t recordsIngested;
    std::string warningsJson;
    std::string logFilePath;
};

/**
 * A file_list row: one file system entry known for an evidence item.
 */
struct ArxFileListRow
{
    ArxFileListRow() : evidenceId(0), partitionIndex(0) {}

    int64_t evidenceId;
    int partitionIndex;
    ArxFsEntry entry;
    std::string extension;
    std::string md5;
    std::string runId;
    std::string importSource;
    std::string importTimestamp;
};

/**
 * Which rows a replace (delete before insert) affects. When runIds is
 * empty every row of (evidenceId, discoveredBy) is affected, otherwise
 * only rows of those runs.
 */
struct ArxRecordScope
{
    ArxRecordScope() : evidenceId(0) {}

    int64_t evidenceId;
    std::string discoveredBy;
    std::vector<std::string> runIds;
};

/**
 * A stored family row together with its storage identity.
 */
template <typename T>
struct ArxStoredRow
{
    ArxStoredRow() : id(0), evidenceId(0) {}

    int64_t id;
    int64_t evidenceId;
    std::string runId;
    T record;
};

struct ArxUrlRow
{
    ArxUrlRow() : evidenceId(0), occurrenceCount(0), sourceCount(0) {}

    int64_t evidenceId;
    std::string url;
    std::string scheme;
    std::string domain;
    int64_t occurrenceCount;
    ArxTimestamp firstSeen;
    ArxTimestamp lastSeen;
    int64_t sourceCount;
    /// Comma separated, sorted discovered_by values.
    std::string sources;
};

/**
 * A url_sources row: the contribution of one extractor run to the URL
 * registry.
 */
struct ArxUrlSourceRow
{
    ArxUrlSourceRow() : evidenceId(0), occurrenceCount(0) {}

    int64_t evidenceId;
    std::string url;
    std::string discoveredBy;
    std::string runId;
    std::string family;
    int64_t occurrenceCount;
    ArxTimestamp firstSeen;
    ArxTimestamp lastSeen;
};

/**
 * A canonical images row.
 */
struct ArxImageRow
{
    ArxImageRow() : id(0), evidenceId(0), sizeBytes(0), discoveryCount(0) {}

    int64_t id;
    int64_t evidenceId;
    std::string relPath;
    std::string filename;
    std::string format;
    std::string md5;
    std::string sha256;
    int64_t sizeBytes;
    std::string firstDiscoveredBy;
    std::string firstDiscoveredAt;
    int64_t discoveryCount;
};

/**
 * Interface for the storage ports. Every method that is not documented
 * otherwise throws ArxStorageUnavailableException when the store cannot
 * be read or written. The engine never issues queries outside of these
 * ports.
 */
class ARX_FRAMEWORK_API ArxImgDB
{
public:
    virtual ~ArxImgDB() {}

    /**
     * Opens the store and creates any missing tables.
     * @returns 0 on success, 1 on error (the error is logged).
     */
    virtual int initialize() = 0;
    virtual int close() = 0;

    virtual void begin() = 0;
    virtual void commit() = 0;
    /// Never throws; failures are logged.
    virtual void rollback() = 0;

    // ---- runs
    virtual void addRun(const ArxRunRecord& a_run) = 0;
    /// Updates state, extraction status and finish time. Nothing else of a run changes.
    virtual void updateRunState(const std::string& a_runId, const std::string& a_state,
        const std::string& a_extractionStatus, const std::string& a_finishedAt) = 0;
    virtual void setRunManifest(const std::string& a_runId, const std::string& a_runDir,
        const std::string& a_manifestPath) = 0;
    virtual std::optional<ArxRunRecord> getRun(const std::string& a_runId) const = 0;
    virtual std::vector<ArxRunRecord> getRuns(int64_t a_evidenceId, const std::string& a_extractorName) const = 0;

    // ---- process log (insert and query only)
    virtual int64_t addProcessLog(const ArxProcessLogRecord& a_record) = 0;
    virtual std::vector<ArxProcessLogRecord> getProcessLog(int64_t a_evidenceId, const std::string& a_runId) const = 0;

    // ---- extracted files
    virtual void addExtractedFile(const std::string& a_runId, const std::string& a_extractorName,
        const ArxManifestEntry& a_entry) = 0;
    virtual std::vector<ArxManifestEntry> getExtractedFiles(const std::string& a_runId) const = 0;

    // ---- extraction warnings (insert and query only)
    virtual void addExtractionWarnings(int64_t a_evidenceId, const std::string& a_runId,
        const std::string& a_extractorName, const ArxWarningList& a_warnings) = 0;
    virtual ArxWarningList getExtractionWarnings(int64_t a_evidenceId, const std::string& a_runId) const = 0;

    // ---- file index
    /// Removes index rows of an evidence item; all import sources when a_importSource is empty.
    virtual int64_t deleteFileList(int64_t a_evidenceId, const std::string& a_importSource) = 0;
    virtual void addFileListRow(const ArxFileListRow& a_row) = 0;
    /// Index rows of an evidence item, in one partition or in all (-1).
    virtual int64_t countFileList(int64_t a_evidenceId, int a_partition = -1) const = 0;
    /**
     * Index rows whose file_path matches a SQL LIKE pattern (case
     * insensitive, '#' is the escape character).
     * @param a_partition Partition to search, or -1 for all.
     */
    virtual std::vector<ArxFileListRow> queryFileList(int64_t a_evidenceId, int a_partition,
        const std::string& a_likePattern) const = 0;

    // ---- browser history
    virtual int64_t deleteHistory(const ArxRecordScope& a_scope) = 0;
    /// Row with the same dedup key and discovered_by, if any.
    virtual std::optional<ArxStoredRow<ArxHistoryVisitRecord> > findHistory(int64_t a_evidenceId,
        const ArxHistoryVisitRecord& a_key) const = 0;
    virtual int64_t insertHistory(int64_t a_evidenceId, const std::string& a_runId,
        const ArxHistoryVisitRecord& a_record) = 0;
    virtual void updateHistory(int64_t a_id, const std::string& a_runId, const ArxHistoryVisitRecord& a_record) = 0;
    virtual std::vector<ArxStoredRow<ArxHistoryVisitRecord> > getHistory(int64_t a_evidenceId) const = 0;

    // ---- bookmarks
    virtual int64_t deleteBookmarks(const ArxRecordScope& a_scope) = 0;
    virtual std::optional<ArxStoredRow<ArxBookmarkRecord> > findBookmark(int64_t a_evidenceId,
        const ArxBookmarkRecord& a_key) const = 0;
    virtual int64_t insertBookmark(int64_t a_evidenceId, const std::string& a_runId,
        const ArxBookmarkRecord& a_record) = 0;
    virtual void updateBookmark(int64_t a_id, const std::string& a_runId, const ArxBookmarkRecord& a_record) = 0;
    virtual std::vector<ArxStoredRow<ArxBookmarkRecord> > getBookmarks(int64_t a_evidenceId) const = 0;

    // ---- browser cache entries
    virtual int64_t deleteCacheEntries(const ArxRecordScope& a_scope) = 0;
    virtual std::optional<ArxStoredRow<ArxCacheEntryRecord> > findCacheEntry(int64_t a_evidenceId,
        const ArxCacheEntryRecord& a_key) const = 0;
    virtual int64_t insertCacheEntry(int64_t a_evidenceId, const std::string& a_runId,
        const ArxCacheEntryRecord& a_record) = 0;
    virtual void updateCacheEntry(int64_t a_id, const std::string& a_runId, const ArxCacheEntryRecord& a_record) = 0;
    virtual std::vector<ArxStoredRow<ArxCacheEntryRecord> > getCacheEntries(int64_t a_evidenceId) const = 0;

    // ---- URL registry
    /// Distinct URLs that have sources in the scope.
    virtual std::vector<std::string> getUrlSourceUrls(const ArxRecordScope& a_scope) const = 0;
    virtual int64_t deleteUrlSources(const ArxRecordScope& a_scope) = 0;
    virtual void addUrlSource(const ArxUrlSourceRow& a_row) = 0;
    virtual std::vector<ArxUrlSourceRow> getUrlSources(int64_t a_evidenceId, const std::string& a_url) const = 0;
    /// Inserts or replaces the registry row of (evidence, url).
    virtual void putUrl(const ArxUrlRow& a_row) = 0;
    virtual void deleteUrl(int64_t a_evidenceId, const std::string& a_url) = 0;
    virtual std::vector<ArxUrlRow> getUrls(int64_t a_evidenceId) const = 0;

    // ---- images (content addressed) and their discoveries
    virtual std::optional<ArxImageRow> findImage(int64_t a_evidenceId, const std::string& a_sha256) const = 0;
    virtual int64_t insertImage(const ArxImageRow& a_row) = 0;
    virtual void setImageDiscoveryCount(int64_t a_imageId, int64_t a_count) = 0;
    /// Image ids referenced by discovery rows in the scope.
    virtual std::vector<int64_t> getImageIdsForDiscoveries(const ArxRecordScope& a_scope) const = 0;
    virtual int64_t deleteImageDiscoveries(const ArxRecordScope& a_scope) = 0;
    virtual int64_t insertImageDiscovery(int64_t a_imageId, int64_t a_evidenceId, const std::string& a_runId,
        const ArxImageRecord& a_record) = 0;
    virtual int64_t countImageDiscoveries(int64_t a_imageId) const = 0;
    virtual std::vector<ArxImageRow> getImages(int64_t a_evidenceId) const = 0;
    virtual std::vector<ArxStoredRow<ArxImageRecord> > getImageDiscoveries(int64_t a_evidenceId) const = 0;
};

#endif
