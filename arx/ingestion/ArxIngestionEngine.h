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
 * \file ArxIngestionEngine.h
 * Writes parsed records to the storage ports.
 */

#ifndef _ARX_INGESTIONENGINE_H
#define _ARX_INGESTIONENGINE_H

#include <string>
#include <vector>

#include "arx/framework_i.h"
#include "arx/records/ArxRecords.h"
#include "arx/services/ArxConfig.h"
#include "arx/services/ArxImgDB.h"
#include "arx/utilities/ArxCancellationToken.h"

/**
 * Everything parsed for one run and extractor.
 */
struct ArxIngestionBatch
{
    ArxIngestionBatch() : evidenceId(0) {}

    std::string runId;
    int64_t evidenceId;
    /// Extractor name; scopes the replace step.
    std::string extractorName;
    std::string artifactType;
    /// Families the extractor produces. Their prior rows are replaced even
    /// when the batch holds no records of a family.
    std::vector<ArxArtifactFamily> families;
    std::vector<ArxParsedRecord> records;
    /// Parser warnings, stored with the validation warnings of the batch.
    ArxWarningList warnings;
};

struct ArxIngestionStats
{
    ArxIngestionStats() : inserted(0), skippedDuplicate(0), failed(0), warnings(0), cancelled(false) {}

    size_t inserted;
    /// Records merged into another record of the batch or into a stored row.
    size_t skippedDuplicate;
    /// Records that failed validation.
    size_t failed;
    size_t warnings;
    /// The batch was rolled back because of a cancellation request.
    bool cancelled;
};

/**
 * Idempotent replace of the rows of one extractor. Inside a single
 * transaction the engine
 *  - deletes prior rows in scope (evidence and extractor, or evidence and
 *    run),
 *  - merges records with the same dedup key (counters summed, first and
 *    last times widened),
 *  - stores history, bookmark and cache rows, URL registry contributions
 *    and image discoveries,
 *  - re-derives urls and images.discovery_count from their association
 *    rows.
 * Invalid records are counted and turned into warnings. Only a storage
 * failure aborts the batch, with a rollback and an
 * ArxStorageUnavailableException.
 */
class ARX_FRAMEWORK_API ArxIngestionEngine
{
public:
    ArxIngestionEngine(ArxImgDB& a_db, ArxConfig::ReplaceScope a_scope);

    /**
     * Ingest a batch. Cancellation is checked between records; a cancelled
     * batch is rolled back and leaves the store as it was.
     * @throws ArxStorageUnavailableException
     */
    ArxIngestionStats ingest(const ArxIngestionBatch& a_batch, const ArxCancellationToken * a_cancel = NULL);

    /// Dedup keys, declared per family.
    static std::string dedupKey(const ArxHistoryVisitRecord& a_record);
    static std::string dedupKey(const ArxBookmarkRecord& a_record);
    static std::string dedupKey(const ArxCacheEntryRecord& a_record);
    static std::string dedupKey(const ArxImageRecord& a_record);

    /// Empty if the record is valid, otherwise the reason.
    static std::string validate(const ArxParsedRecord& a_record);

private:
    ArxIngestionEngine(const ArxIngestionEngine&);
    ArxIngestionEngine& operator=(const ArxIngestionEngine&);

    ArxImgDB& m_db;
    ArxConfig::ReplaceScope m_scope;
};

#endif
