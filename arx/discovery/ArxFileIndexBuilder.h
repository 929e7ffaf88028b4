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
 * \file ArxFileIndexBuilder.h
 * Builds the file_list index of an evidence item.
 */

#ifndef _ARX_FILEINDEXBUILDER_H
#define _ARX_FILEINDEXBUILDER_H

#include <string>

#include "arx/framework_i.h"
#include "arx/fs/ArxEvidenceFS.h"
#include "arx/services/ArxImgDB.h"

/**
 * Walks every partition of an evidence item and stores one file_list row
 * per directory and regular file. Prior index rows of the evidence are
 * replaced in the same transaction.
 */
class ARX_FRAMEWORK_API ArxFileIndexBuilder
{
public:
    static const char * IMPORT_SOURCE;

    ArxFileIndexBuilder(const ArxEvidenceFS& a_fs, ArxImgDB& a_db);

    /**
     * @param a_runId Run that produced the index, may be empty.
     * @returns number of rows written.
     * @throws ArxSourceUnavailableException if a partition root cannot be listed.
     * @throws ArxStorageUnavailableException if the index cannot be written.
     */
    int64_t build(int64_t a_evidenceId, const std::string& a_runId);

    /// Lower case extension of a file name without the dot, "" if none.
    static std::string extensionOf(const std::string& a_name);

private:
    int64_t indexDirectory(int64_t a_evidenceId, const std::string& a_runId, int a_partition,
        const std::string& a_dir, const std::string& a_importTimestamp);

    const ArxEvidenceFS& m_fs;
    ArxImgDB& m_db;
};

#endif
