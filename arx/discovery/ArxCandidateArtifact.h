/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _ARX_CANDIDATEARTIFACT_H
#define _ARX_CANDIDATEARTIFACT_H

#include <string>

#include "arx/framework_i.h"
#include "arx/utilities/ArxTimestamps.h"

/**
 * A file discovered in the evidence that matches an artifact pattern,
 * prior to being copied.
 */
struct ArxCandidateArtifact
{
    ArxCandidateArtifact() : evidenceId(0), partitionIndex(0), size(0), inode(0), deleted(false) {}

    int64_t evidenceId;
    int partitionIndex;
    std::string logicalPath;
    std::string forensicPath;
    std::string fsType;
    uint64_t size;
    uint64_t inode;
    bool deleted;
    ArxTimestamp mtime;
    ArxTimestamp atime;
    ArxTimestamp ctime;
    ArxTimestamp crtime;

    std::string artifactType;
    std::string browser;
    std::string profile;

    /// Candidates are ordered and deduplicated by (partition, logical path).
    bool operator<(const ArxCandidateArtifact& other) const
    {
        if (partitionIndex != other.partitionIndex)
            return partitionIndex < other.partitionIndex;
        return logicalPath < other.logicalPath;
    }
};

#endif
