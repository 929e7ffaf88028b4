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
 * \file ArxEvidenceFS.h
 * Read-only access to the file systems of an evidence item.
 */

#ifndef _ARX_EVIDENCEFS_H
#define _ARX_EVIDENCEFS_H

#include <memory>
#include <string>
#include <vector>

#include "arx/framework_i.h"
#include "arx/utilities/ArxTimestamps.h"

/**
 * Metadata of one file system entry.
 */
struct ARX_FRAMEWORK_API ArxFsEntry
{
    ArxFsEntry() : isDirectory(false), isRegular(false), size(0), inode(0), deleted(false) {}

    std::string name;
    std::string logicalPath;
    /// Physical locator: a host path, or image:offset:inode for images.
    std::string forensicPath;
    std::string fsType;
    bool isDirectory;
    bool isRegular;
    uint64_t size;
    uint64_t inode;
    bool deleted;
    ArxTimestamp mtime;
    ArxTimestamp atime;
    ArxTimestamp ctime;
    ArxTimestamp crtime;
};

/**
 * One file system of the evidence item.
 */
struct ARX_FRAMEWORK_API ArxPartitionInfo
{
    ArxPartitionInfo() : index(0), byteOffset(0) {}

    int index;
    std::string fsType;
    std::string description;
    uint64_t byteOffset;
};

/**
 * An open, read-only evidence file.
 */
class ARX_FRAMEWORK_API ArxEvidenceFile
{
public:
    virtual ~ArxEvidenceFile() {}

    /**
     * Read up to a_len bytes at the current position.
     * @returns number of bytes read, 0 at the end of the file.
     * @throws ArxCandidateReadException on a read error.
     */
    virtual size_t read(char * a_buffer, size_t a_len) = 0;

    /// Size of the file content in bytes.
    virtual uint64_t size() const = 0;
};

/**
 * Interface to the file systems of an evidence item. Implementations
 * expose no operation that writes to the evidence.
 *
 * Logical paths are absolute, '/' separated and case preserving.
 * Partition numbers are the index values from partitions().
 */
class ARX_FRAMEWORK_API ArxEvidenceFS
{
public:
    virtual ~ArxEvidenceFS() {}

    /// File systems found in the evidence, in index order.
    virtual std::vector<ArxPartitionInfo> partitions() const = 0;

    /**
     * List the entries of a directory ("." and ".." are omitted).
     * @throws ArxCandidateReadException if the directory cannot be read.
     */
    virtual std::vector<ArxFsEntry> list(int a_partition, const std::string& a_dir) const = 0;

    /**
     * Metadata of one path.
     * @throws ArxCandidateReadException if the path does not exist.
     */
    virtual ArxFsEntry stat(int a_partition, const std::string& a_path) const = 0;

    /**
     * Open a regular file for reading.
     * @throws ArxCandidateReadException if it cannot be opened.
     */
    virtual std::unique_ptr<ArxEvidenceFile> open(int a_partition, const std::string& a_path) const = 0;

    /// True if list/stat/open/read may be called from several threads at once.
    virtual bool isThreadSafe() const = 0;

    /// Returns false instead of throwing when the path is missing.
    virtual bool exists(int a_partition, const std::string& a_path) const;

    /// Partition info for an index, or throws ArxSourceUnavailableException.
    ArxPartitionInfo partition(int a_partition) const;
};

#endif
