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
 * \file ArxFileIndexBuilder.cpp
 */

#include "ArxFileIndexBuilder.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxUtilities.h"

#include <sstream>

const char * ArxFileIndexBuilder::IMPORT_SOURCE = "filesystem_walk";

ArxFileIndexBuilder::ArxFileIndexBuilder(const ArxEvidenceFS& a_fs, ArxImgDB& a_db)
: m_fs(a_fs), m_db(a_db)
{
}

std::string ArxFileIndexBuilder::extensionOf(const std::string& a_name)
{
    std::string::size_type dot = a_name.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == a_name.size())
        return "";
    return ArxUtilities::toLowerAscii(a_name.substr(dot + 1));
}

int64_t ArxFileIndexBuilder::build(int64_t a_evidenceId, const std::string& a_runId)
{
    std::vector<ArxPartitionInfo> partitions = m_fs.partitions();
    std::string importTimestamp = ArxUtilities::utcNowIso();
    int64_t rows = 0;

    m_db.begin();
    try
    {
        m_db.deleteFileList(a_evidenceId, "");
        for (size_t i = 0; i < partitions.size(); i++)
        {
            try
            {
                m_fs.list(partitions[i].index, "/");
            }
            catch (ArxCandidateReadException& ex)
            {
                std::ostringstream msg;
                msg << "ArxFileIndexBuilder::build - cannot open root of partition " << partitions[i].index
                    << ": " << ex.message();
                throw ArxSourceUnavailableException(msg.str());
            }
            rows += indexDirectory(a_evidenceId, a_runId, partitions[i].index, "/", importTimestamp);
        }
        m_db.commit();
    }
    catch (ArxException&)
    {
        m_db.rollback();
        throw;
    }

    std::ostringstream msg;
    msg << "ArxFileIndexBuilder::build - indexed " << rows << " entries of evidence " << a_evidenceId;
    LOGINFO(msg.str());

    return rows;
}

int64_t ArxFileIndexBuilder::indexDirectory(int64_t a_evidenceId, const std::string& a_runId, int a_partition,
    const std::string& a_dir, const std::string& a_importTimestamp)
{
    std::vector<ArxFsEntry> entries;
    try
    {
        entries = m_fs.list(a_partition, a_dir);
    }
    catch (ArxCandidateReadException& ex)
    {
        std::ostringstream msg;
        msg << "ArxFileIndexBuilder::indexDirectory - skipping unreadable directory " << a_dir
            << " in partition " << a_partition << ": " << ex.message();
        LOGWARN(msg.str());
        return 0;
    }

    int64_t rows = 0;
    for (size_t i = 0; i < entries.size(); i++)
    {
        const ArxFsEntry& entry = entries[i];

        // Links, devices and other special entries are never candidates.
        if (!entry.isDirectory && !entry.isRegular)
            continue;

        ArxFileListRow row;
        row.evidenceId = a_evidenceId;
        row.partitionIndex = a_partition;
        row.entry = entry;
        row.extension = entry.isDirectory ? "" : extensionOf(entry.name);
        row.runId = a_runId;
        row.importSource = IMPORT_SOURCE;
        row.importTimestamp = a_importTimestamp;
        m_db.addFileListRow(row);
        rows++;

        if (entry.isDirectory)
            rows += indexDirectory(a_evidenceId, a_runId, a_partition, entry.logicalPath, a_importTimestamp);
    }
    return rows;
}
