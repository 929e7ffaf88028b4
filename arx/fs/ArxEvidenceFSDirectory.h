/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _ARX_EVIDENCEFSDIRECTORY_H
#define _ARX_EVIDENCEFSDIRECTORY_H

#include "ArxEvidenceFS.h"

/**
 * Evidence that is already mounted on the host. Each root directory is
 * exposed as one partition, numbered by its position in the list.
 * Symbolic links are reported but never followed.
 */
class ARX_FRAMEWORK_API ArxEvidenceFSDirectory : public ArxEvidenceFS
{
public:
    /**
     * @throws ArxSourceUnavailableException if a root is not a readable directory.
     */
    explicit ArxEvidenceFSDirectory(const std::string& a_root);
    explicit ArxEvidenceFSDirectory(const std::vector<std::string>& a_roots);

    virtual std::vector<ArxPartitionInfo> partitions() const;
    virtual std::vector<ArxFsEntry> list(int a_partition, const std::string& a_dir) const;
    virtual ArxFsEntry stat(int a_partition, const std::string& a_path) const;
    virtual std::unique_ptr<ArxEvidenceFile> open(int a_partition, const std::string& a_path) const;
    virtual bool isThreadSafe() const { return true; }

    /// Host path of a logical path.
    std::string hostPath(int a_partition, const std::string& a_path) const;

private:
    void addRoot(const std::string& a_root);
    ArxFsEntry statHost(const std::string& a_hostPath, const std::string& a_logicalPath) const;

    std::vector<std::string> m_roots;
};

#endif
