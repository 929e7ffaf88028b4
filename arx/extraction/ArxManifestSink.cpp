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
 * \file ArxManifestSink.cpp
 */

#include "ArxManifestSink.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"

#include <algorithm>

namespace
{
    bool compareDestRelPath(const ArxManifestEntry& a, const ArxManifestEntry& b)
    {
        return a.destRelPath < b.destRelPath;
    }
}

ArxManifestSink::ArxManifestSink(ArxImgDB * a_db, const std::string& a_runId, const std::string& a_extractorName)
: m_db(a_db), m_runId(a_runId), m_extractorName(a_extractorName)
{
}

void ArxManifestSink::append(const ArxManifestEntry& a_entry)
{
    Poco::FastMutex::ScopedLock lock(m_mutex);
    m_entries.push_back(a_entry);

    if (m_db == NULL)
        return;

    try
    {
        m_db->addExtractedFile(m_runId, m_extractorName, a_entry);
    }
    catch (ArxStorageUnavailableException& ex)
    {
        LOGERROR("ArxManifestSink::append - " + ex.message());
        if (m_storageError.empty())
            m_storageError = ex.message();
    }
}

std::vector<ArxManifestEntry> ArxManifestSink::entries() const
{
    Poco::FastMutex::ScopedLock lock(m_mutex);
    std::vector<ArxManifestEntry> sorted(m_entries);
    std::sort(sorted.begin(), sorted.end(), compareDestRelPath);
    return sorted;
}

size_t ArxManifestSink::size() const
{
    Poco::FastMutex::ScopedLock lock(m_mutex);
    return m_entries.size();
}

std::string ArxManifestSink::storageError() const
{
    Poco::FastMutex::ScopedLock lock(m_mutex);
    return m_storageError;
}
