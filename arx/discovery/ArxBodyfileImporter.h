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
 * \file ArxBodyfileImporter.h
 * Loads Sleuth Kit bodyfiles into the file index.
 */

#ifndef _ARX_BODYFILEIMPORTER_H
#define _ARX_BODYFILEIMPORTER_H

#include <istream>
#include <string>

#include "arx/framework_i.h"
#include "arx/services/ArxImgDB.h"

/**
 * Imports a bodyfile as written by "fls -r -m" (one line per entry:
 * MD5|name|inode|mode|UID|GID|size|atime|mtime|ctime|crtime) as the
 * file_list rows of one partition. Rows previously imported for the same
 * partition are replaced.
 *
 * Directories and NTFS "($FILE_NAME)" duplicates are skipped, a
 * "(deleted)" suffix sets the deleted flag and a leading drive letter is
 * dropped from names.
 */
class ARX_FRAMEWORK_API ArxBodyfileImporter
{
public:
    struct Stats
    {
        Stats() : imported(0), skipped(0), malformed(0) {}

        int64_t imported;
        int64_t skipped;
        int64_t malformed;
    };

    explicit ArxBodyfileImporter(ArxImgDB& a_db);

    /**
     * @throws ArxSourceUnavailableException if the file cannot be opened.
     * @throws ArxStorageUnavailableException if the index cannot be written.
     */
    Stats importFile(const std::string& a_path, int64_t a_evidenceId, int a_partition);

    Stats import(std::istream& a_input, const std::string& a_sourceName, int64_t a_evidenceId, int a_partition);

    /// The import_source value used for rows of a partition.
    static std::string importSourceFor(int a_partition);

private:
    bool parseLine(const std::string& a_line, ArxFsEntry& a_entry, std::string& a_md5, bool& a_skip) const;

    ArxImgDB& m_db;
};

#endif
