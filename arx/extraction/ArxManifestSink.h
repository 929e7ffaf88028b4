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
 * \file ArxManifestSink.h
 */

#ifndef _ARX_MANIFESTSINK_H
#define _ARX_MANIFESTSINK_H

#include <string>
#include <vector>

#include "arx/framework_i.h"
#include "arx/extraction/ArxManifestEntry.h"
#include "arx/services/ArxImgDB.h"
#include "Poco/Mutex.h"

/**
 * Collects the manifest entries of one run. Staging workers append
 * concurrently; every entry is also written to extracted_files right
 * away so a crashed run still leaves a record of what was copied.
 */
class ARX_FRAMEWORK_API ArxManifestSink
{
public:
    /**
     * @param a_db Store for extracted_files rows, may be NULL.
     */
    ArxManifestSink(ArxImgDB * a_db, const std::string& a_runId, const std::string& a_extractorName);

    /**
     * Add an entry. A storage failure is logged and remembered, never
     * thrown, so a worker thread can always finish its file.
     */
    void append(const ArxManifestEntry& a_entry);

    /// All entries, sorted by dest_rel_path.
    std::vector<ArxManifestEntry> entries() const;

    size_t size() const;

    /// First storage error, or "" if every entry was persisted.
    std::string storageError() const;

private:
    ArxImgDB * m_db;
    std::string m_runId;
    std::string m_extractorName;
    std::vector<ArxManifestEntry> m_entries;
    std::string m_storageError;
    mutable Poco::FastMutex m_mutex;
};

#endif
