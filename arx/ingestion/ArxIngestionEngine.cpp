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
 * \file ArxIngestionEngine.cpp
 */

#include "ArxIngestionEngine.h"
#include "ArxUrl.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxUtilities.h"

// Poco includes
#include "Poco/Mutex.h"

#include <algorithm>
#include <map>
#include <memory>
#include <set>
#include <sstream>

namespace
{
    /// One mutex per (evidence, family) scope, created on first use.
    Poco::FastMutex scopeMapMutex;
    std::map<std::string, std::shared_ptr<Poco::Mutex> > scopeMutexes;

    std::shared_ptr<Poco::Mutex> scopeMutex(const std::string& key)
    {
        Poco::FastMutex::ScopedLock lock(scopeMapMutex);
        std::shared_ptr<Poco::Mutex>& mutex = scopeMutexes[key];
        if (!mutex)
            mutex.reset(new Poco::Mutex());
        return mutex;
    }

    /**
     * Holds the scope mutexes of every family a batch touches. They are
     * taken in key order so that two batches never wait on each other in
     * opposite order.
     */
    class ScopeLocks
    {
    public:
        ScopeLocks(int64_t evidenceId, const std::set<ArxArtifactFamily>& families)
        {
            std::set<std::string> keys;
            for (std::set<ArxArtifactFamily>::const_iterator it = families.begin(); it != families.end(); ++it)
            {
                std::stringstream key;
                key << evidenceId << ":" << arxFamilyName(*it);
                keys.insert(key.str());
            }
            for (std::set<std::string>::const_iterator it = keys.begin(); it != keys.end(); ++it)
            {
                std::shared_ptr<Poco::Mutex> mutex = scopeMutex(*it);
                mutex->lock();
                m_locked.push_back(mutex);
            }
        }

        ~ScopeLocks()
        {
            for (size_t i = m_locked.size(); i > 0; i--)
                m_locked[i - 1]->unlock();
        }

    private:
        ScopeLocks(const ScopeLocks&);
        ScopeLocks& operator=(const ScopeLocks&);

        std::vector<std::shared_ptr<Poco::Mutex> > m_locked;
    };

    std::string joinKey(const std::vector<std::string>& parts)
    {
        std::string key;
        for (size_t i = 0; i < parts.size(); i++)
        {
            if (i > 0)
                key += '\x1f';
            key += parts[i];
        }
        return key;
    }

    /// Records in first-seen order, merged by key.
    template <typename T>
    class MergedRecords
    {
    public:
        /// Returns the record stored under the key, or NULL if this is its first occurrence.
        T * find(const std::string& key)
        {
            typename std::map<std::string, size_t>::const_iterator it = m_index.find(key);
            return it == m_index.end() ? NULL : &m_records[it->second];
        }

        void add(const std::string& key, const T& record)
        {
            m_index[key] = m_records.size();
            m_records.push_back(record);
        }

        const std::vector<T>& records() const { return m_records; }

    private:
        std::map<std::string, size_t> m_index;
        std::vector<T> m_records;
    };

    /// Contribution of the batch to one URL registry entry.
    struct UrlContribution
    {
        UrlContribution() : occurrences(0) {}

        std::string url;
        std::string family;
        int64_t occurrences;
        ArxTimestamp firstSeen;
        ArxTimestamp lastSeen;
    };

    void contribute(std::map<std::string, UrlContribution>& contributions, const std::string& url,
        ArxArtifactFamily family, const ArxTimestamp& first, const ArxTimestamp& last)
    {
        std::string normalized = ArxUrl::normalize(url);
        if (normalized.empty())
            return;

        std::vector<std::string> parts;
        parts.push_back(normalized);
        parts.push_back(arxFamilyName(family));
        UrlContribution& contribution = contributions[joinKey(parts)];
        contribution.url = normalized;
        contribution.family = arxFamilyName(family);
        contribution.occurrences++;
        contribution.firstSeen = ArxTimestamp::earliest(contribution.firstSeen, ArxTimestamp::earliest(first, last));
        contribution.lastSeen = ArxTimestamp::latest(contribution.lastSeen, ArxTimestamp::latest(first, last));
    }

    bool isSha256Hex(const std::string& value)
    {
        if (value.size() != 64)
            return false;
        for (size_t i = 0; i < value.size(); i++)
        {
            char c = value[i];
            bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
            if (!hex)
                return false;
        }
        return true;
    }

    const char * warningCategory(ArxArtifactFamily family)
    {
        switch (family)
        {
        case ARX_FAMILY_BOOKMARK:
            return "json";
        case ARX_FAMILY_HISTORY:
            return "database";
        default:
            return "binary";
        }
    }

    const ArxRecordSource& sourceOf(const ArxParsedRecord& record)
    {
        if (const ArxHistoryVisitRecord * history = std::get_if<ArxHistoryVisitRecord>(&record))
            return history->source;
        if (const ArxBookmarkRecord * bookmark = std::get_if<ArxBookmarkRecord>(&record))
            return bookmark->source;
        if (const ArxCacheEntryRecord * cache = std::get_if<ArxCacheEntryRecord>(&record))
            return cache->source;
        return std::get<ArxImageRecord>(record).source;
    }
}

ArxIngestionEngine::ArxIngestionEngine(ArxImgDB& a_db, ArxConfig::ReplaceScope a_scope)
    : m_db(a_db), m_scope(a_scope)
{
}

std::string ArxIngestionEngine::dedupKey(const ArxHistoryVisitRecord& a_record)
{
    std::vector<std::string> parts;
    parts.push_back(a_record.url);
    parts.push_back(a_record.visitTime.toIso());
    parts.push_back(a_record.source.browser);
    parts.push_back(a_record.source.profile);
    return joinKey(parts);
}

std::string ArxIngestionEngine::dedupKey(const ArxBookmarkRecord& a_record)
{
    std::vector<std::string> parts;
    parts.push_back(a_record.source.browser);
    parts.push_back(a_record.source.profile);
    parts.push_back(a_record.url);
    parts.push_back(a_record.folderPath);
    parts.push_back(a_record.guid);
    parts.push_back(a_record.dateAdded.toIso());
    return joinKey(parts);
}

std::string ArxIngestionEngine::dedupKey(const ArxCacheEntryRecord& a_record)
{
    std::vector<std::string> parts;
    parts.push_back(a_record.source.browser);
    parts.push_back(a_record.source.profile);
    parts.push_back(a_record.cacheKey);
    return joinKey(parts);
}

std::string ArxIngestionEngine::dedupKey(const ArxImageRecord& a_record)
{
    return ArxUtilities::toLowerAscii(a_record.sha256);
}

std::string ArxIngestionEngine::validate(const ArxParsedRecord& a_record)
{
    if (const ArxHistoryVisitRecord * history = std::get_if<ArxHistoryVisitRecord>(&a_record))
    {
        if (history->url.empty())
            return "empty url";
        if (history->visitCount < 0 || history->typedCount < 0)
            return "negative counter";
    }
    else if (const ArxBookmarkRecord * bookmark = std::get_if<ArxBookmarkRecord>(&a_record))
    {
        if (bookmark->url.empty())
            return "empty url";
    }
    else if (const ArxCacheEntryRecord * cache = std::get_if<ArxCacheEntryRecord>(&a_record))
    {
        if (cache->cacheKey.empty())
            return "empty cache key";
        if (cache->fetchCount < 0 || cache->bodySize < 0)
            return "negative counter";
    }
    else
    {
        const ArxImageRecord& image = std::get<ArxImageRecord>(a_record);
        if (!isSha256Hex(image.sha256))
            return "sha256 is not 64 hex characters";
        if (image.sizeBytes < 0)
            return "negative size";
    }
    return "";
}

ArxIngestionStats ArxIngestionEngine::ingest(const ArxIngestionBatch& a_batch, const ArxCancellationToken * a_cancel)
{
    ArxIngestionStats stats;

    std::set<ArxArtifactFamily> families(a_batch.families.begin(), a_batch.families.end());
    for (size_t i = 0; i < a_batch.records.size(); i++)
        families.insert(arxFamilyOf(a_batch.records[i]));

    ScopeLocks locks(a_batch.evidenceId, families);

    // Validate and merge in memory before touching the store.
    ArxWarningList warnings = a_batch.warnings;
    MergedRecords<ArxHistoryVisitRecord> history;
    MergedRecords<ArxBookmarkRecord> bookmarks;
    MergedRecords<ArxCacheEntryRecord> cacheEntries;
    MergedRecords<ArxImageRecord> images;
    MergedRecords<ArxImageRecord> imageDiscoveries;
    std::map<std::string, UrlContribution> urlContributions;

    for (size_t i = 0; i < a_batch.records.size(); i++)
    {
        ArxParsedRecord record = a_batch.records[i];
        ArxArtifactFamily family = arxFamilyOf(record);

        std::string invalid = validate(record);
        if (!invalid.empty())
        {
            ArxExtractionWarning warning;
            warning.warningType = "invalid_record";
            warning.severity = ArxExtractionWarning::WARNING;
            warning.category = warningCategory(family);
            warning.itemName = arxFamilyName(family);
            warning.itemValue = invalid;
            warning.artifactType = a_batch.artifactType;
            warning.sourceFile = sourceOf(record).sourcePath;
            warnings.push_back(warning);
            stats.failed++;
            continue;
        }

        // Rows belong to the extractor that ingests them.
        if (ArxHistoryVisitRecord * visit = std::get_if<ArxHistoryVisitRecord>(&record))
        {
            visit->source.discoveredBy = a_batch.extractorName;
            contribute(urlContributions, visit->url, family, visit->visitTime, visit->visitTime);

            std::string key = dedupKey(*visit);
            ArxHistoryVisitRecord * merged = history.find(key);
            if (merged == NULL)
            {
                history.add(key, *visit);
                continue;
            }
            int64_t visitCount = merged->visitCount + visit->visitCount;
            int64_t typedCount = merged->typedCount + visit->typedCount;
            *merged = *visit;
            merged->visitCount = visitCount;
            merged->typedCount = typedCount;
            stats.skippedDuplicate++;
        }
        else if (ArxBookmarkRecord * bookmark = std::get_if<ArxBookmarkRecord>(&record))
        {
            bookmark->source.discoveredBy = a_batch.extractorName;
            contribute(urlContributions, bookmark->url, family, bookmark->dateAdded, bookmark->lastModified);

            std::string key = dedupKey(*bookmark);
            ArxBookmarkRecord * merged = bookmarks.find(key);
            if (merged == NULL)
            {
                bookmarks.add(key, *bookmark);
                continue;
            }
            ArxTimestamp lastModified = ArxTimestamp::latest(merged->lastModified, bookmark->lastModified);
            *merged = *bookmark;
            merged->lastModified = lastModified;
            stats.skippedDuplicate++;
        }
        else if (ArxCacheEntryRecord * cache = std::get_if<ArxCacheEntryRecord>(&record))
        {
            cache->source.discoveredBy = a_batch.extractorName;
            if (!cache->url.empty())
                contribute(urlContributions, cache->url, family, cache->lastFetched, cache->lastFetched);

            std::string key = dedupKey(*cache);
            ArxCacheEntryRecord * merged = cacheEntries.find(key);
            if (merged == NULL)
            {
                cacheEntries.add(key, *cache);
                continue;
            }
            int64_t fetchCount = merged->fetchCount + cache->fetchCount;
            ArxTimestamp lastFetched = ArxTimestamp::latest(merged->lastFetched, cache->lastFetched);
            ArxTimestamp lastModified = ArxTimestamp::latest(merged->lastModified, cache->lastModified);
            *merged = *cache;
            merged->fetchCount = fetchCount;
            merged->lastFetched = lastFetched;
            merged->lastModified = lastModified;
            stats.skippedDuplicate++;
        }
        else
        {
            ArxImageRecord& image = std::get<ArxImageRecord>(record);
            image.source.discoveredBy = a_batch.extractorName;
            image.sha256 = ArxUtilities::toLowerAscii(image.sha256);

            std::string key = dedupKey(image);
            if (images.find(key) == NULL)
                images.add(key, image);

            // Every distinct place the content was found is a discovery.
            std::vector<std::string> parts;
            parts.push_back(key);
            parts.push_back(image.relPath);
            parts.push_back(image.fsPath);
            std::stringstream offset;
            offset << image.carvedOffsetBytes;
            parts.push_back(offset.str());
            std::string discoveryKey = joinKey(parts);
            if (imageDiscoveries.find(discoveryKey) == NULL)
                imageDiscoveries.add(discoveryKey, image);
            else
                stats.skippedDuplicate++;
        }
    }

    ArxRecordScope scope;
    scope.evidenceId = a_batch.evidenceId;
    scope.discoveredBy = a_batch.extractorName;
    if (m_scope == ArxConfig::REPLACE_BY_RUN)
        scope.runIds.push_back(a_batch.runId);

    m_db.begin();
    try
    {
        // Replace the prior rows in scope.
        if (families.count(ARX_FAMILY_HISTORY))
            m_db.deleteHistory(scope);
        if (families.count(ARX_FAMILY_BOOKMARK))
            m_db.deleteBookmarks(scope);
        if (families.count(ARX_FAMILY_CACHE))
            m_db.deleteCacheEntries(scope);

        std::set<std::string> affectedUrls;
        std::vector<std::string> priorUrls = m_db.getUrlSourceUrls(scope);
        affectedUrls.insert(priorUrls.begin(), priorUrls.end());
        m_db.deleteUrlSources(scope);

        // Canonical image rows are never deleted, only the discoveries in scope.
        std::set<int64_t> affectedImages;
        if (families.count(ARX_FAMILY_IMAGE))
        {
            std::vector<int64_t> priorImages = m_db.getImageIdsForDiscoveries(scope);
            affectedImages.insert(priorImages.begin(), priorImages.end());
            m_db.deleteImageDiscoveries(scope);
        }

        const std::vector<ArxHistoryVisitRecord>& visits = history.records();
        for (size_t i = 0; i < visits.size(); i++)
        {
            if (a_cancel && a_cancel->isCancelled())
                break;
            std::optional<ArxStoredRow<ArxHistoryVisitRecord> > stored = m_db.findHistory(a_batch.evidenceId, visits[i]);
            if (stored)
            {
                m_db.updateHistory(stored->id, a_batch.runId, visits[i]);
                stats.skippedDuplicate++;
            }
            else
            {
                m_db.insertHistory(a_batch.evidenceId, a_batch.runId, visits[i]);
                stats.inserted++;
            }
        }

        const std::vector<ArxBookmarkRecord>& marks = bookmarks.records();
        for (size_t i = 0; i < marks.size(); i++)
        {
            if (a_cancel && a_cancel->isCancelled())
                break;
            std::optional<ArxStoredRow<ArxBookmarkRecord> > stored = m_db.findBookmark(a_batch.evidenceId, marks[i]);
            if (stored)
            {
                m_db.updateBookmark(stored->id, a_batch.runId, marks[i]);
                stats.skippedDuplicate++;
            }
            else
            {
                m_db.insertBookmark(a_batch.evidenceId, a_batch.runId, marks[i]);
                stats.inserted++;
            }
        }

        const std::vector<ArxCacheEntryRecord>& entries = cacheEntries.records();
        for (size_t i = 0; i < entries.size(); i++)
        {
            if (a_cancel && a_cancel->isCancelled())
                break;
            std::optional<ArxStoredRow<ArxCacheEntryRecord> > stored = m_db.findCacheEntry(a_batch.evidenceId, entries[i]);
            if (stored)
            {
                m_db.updateCacheEntry(stored->id, a_batch.runId, entries[i]);
                stats.skippedDuplicate++;
            }
            else
            {
                m_db.insertCacheEntry(a_batch.evidenceId, a_batch.runId, entries[i]);
                stats.inserted++;
            }
        }

        std::map<std::string, int64_t> imageIds;
        const std::vector<ArxImageRecord>& contents = images.records();
        for (size_t i = 0; i < contents.size(); i++)
        {
            std::optional<ArxImageRow> stored = m_db.findImage(a_batch.evidenceId, contents[i].sha256);
            if (stored)
            {
                imageIds[contents[i].sha256] = stored->id;
                continue;
            }

            ArxImageRow row;
            row.evidenceId = a_batch.evidenceId;
            row.relPath = contents[i].relPath;
            row.filename = contents[i].filename;
            row.format = contents[i].format;
            row.md5 = contents[i].md5;
            row.sha256 = contents[i].sha256;
            row.sizeBytes = contents[i].sizeBytes;
            row.firstDiscoveredBy = a_batch.extractorName;
            row.firstDiscoveredAt = ArxUtilities::utcNowIso();
            imageIds[contents[i].sha256] = m_db.insertImage(row);
        }

        const std::vector<ArxImageRecord>& discoveries = imageDiscoveries.records();
        for (size_t i = 0; i < discoveries.size(); i++)
        {
            if (a_cancel && a_cancel->isCancelled())
                break;
            int64_t imageId = imageIds[discoveries[i].sha256];
            m_db.insertImageDiscovery(imageId, a_batch.evidenceId, a_batch.runId, discoveries[i]);
            affectedImages.insert(imageId);
            stats.inserted++;
        }

        if (a_cancel && a_cancel->isCancelled())
        {
            m_db.rollback();
            stats.cancelled = true;

            std::stringstream msg;
            msg << "ArxIngestionEngine::ingest - run " << a_batch.runId << " cancelled, batch rolled back";
            LOGWARN(msg.str());
            return stats;
        }

        for (std::set<int64_t>::const_iterator it = affectedImages.begin(); it != affectedImages.end(); ++it)
            m_db.setImageDiscoveryCount(*it, m_db.countImageDiscoveries(*it));

        // URL registry: store this extractor's contributions, then re-derive
        // every affected registry row from all of its sources.
        for (std::map<std::string, UrlContribution>::const_iterator it = urlContributions.begin();
            it != urlContributions.end(); ++it)
        {
            ArxUrlSourceRow row;
            row.evidenceId = a_batch.evidenceId;
            row.url = it->second.url;
            row.discoveredBy = a_batch.extractorName;
            row.runId = a_batch.runId;
            row.family = it->second.family;
            row.occurrenceCount = it->second.occurrences;
            row.firstSeen = it->second.firstSeen;
            row.lastSeen = it->second.lastSeen;
            m_db.addUrlSource(row);
            affectedUrls.insert(row.url);
        }

        for (std::set<std::string>::const_iterator url = affectedUrls.begin(); url != affectedUrls.end(); ++url)
        {
            std::vector<ArxUrlSourceRow> sources = m_db.getUrlSources(a_batch.evidenceId, *url);
            if (sources.empty())
            {
                m_db.deleteUrl(a_batch.evidenceId, *url);
                continue;
            }

            ArxUrlRow row;
            row.evidenceId = a_batch.evidenceId;
            row.url = *url;
            row.scheme = ArxUrl::scheme(*url);
            row.domain = ArxUrl::domain(*url);
            std::set<std::string> discoveredBy;
            for (size_t i = 0; i < sources.size(); i++)
            {
                row.occurrenceCount += sources[i].occurrenceCount;
                row.firstSeen = ArxTimestamp::earliest(row.firstSeen, sources[i].firstSeen);
                row.lastSeen = ArxTimestamp::latest(row.lastSeen, sources[i].lastSeen);
                discoveredBy.insert(sources[i].discoveredBy);
            }
            row.sourceCount = (int64_t)discoveredBy.size();
            for (std::set<std::string>::const_iterator it = discoveredBy.begin(); it != discoveredBy.end(); ++it)
            {
                if (!row.sources.empty())
                    row.sources += ",";
                row.sources += *it;
            }
            m_db.putUrl(row);
        }

        m_db.addExtractionWarnings(a_batch.evidenceId, a_batch.runId, a_batch.extractorName, warnings);
        m_db.commit();
    }
    catch (ArxException& ex)
    {
        m_db.rollback();
        std::stringstream msg;
        msg << "ArxIngestionEngine::ingest - run " << a_batch.runId << " rolled back: " << ex.message();
        LOGERROR(msg.str());
        if (dynamic_cast<ArxStorageUnavailableException *>(&ex) != NULL)
            throw;
        throw ArxStorageUnavailableException(msg.str());
    }
    catch (std::exception& ex)
    {
        m_db.rollback();
        std::stringstream msg;
        msg << "ArxIngestionEngine::ingest - run " << a_batch.runId << " rolled back: " << ex.what();
        LOGERROR(msg.str());
        throw ArxStorageUnavailableException(msg.str());
    }

    stats.warnings = warnings.size();

    std::stringstream msg;
    msg << "ArxIngestionEngine::ingest - run " << a_batch.runId << " (" << a_batch.extractorName << "): "
        << stats.inserted << " inserted, " << stats.skippedDuplicate << " duplicates, "
        << stats.failed << " failed, " << stats.warnings << " warnings";
    LOGINFO(msg.str());
    return stats;
}
