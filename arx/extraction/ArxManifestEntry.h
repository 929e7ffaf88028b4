/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _ARX_MANIFESTENTRY_H
#define _ARX_MANIFESTENTRY_H

#include <string>

#include "arx/discovery/ArxCandidateArtifact.h"

/**
 * One file physically copied (or attempted) during a run.
 */
struct ArxManifestEntry
{
    enum Status { STATUS_OK, STATUS_FAILED, STATUS_SKIPPED };

    ArxManifestEntry() : sizeBytes(0), status(STATUS_OK), sourceOffsetBytes(-1) {}

    static const char * statusName(Status a_status);
    /// Throws ArxParseException for an unknown name.
    static Status statusFromName(const std::string& a_name);

    ArxCandidateArtifact source;
    /// Relative to the run directory, '/' separated, e.g. extracted/p0_1a2b3c4d_History.
    std::string destRelPath;
    std::string destFilename;
    int64_t sizeBytes;
    std::string md5;
    std::string sha256;
    Status status;
    std::string errorMessage;
    std::string extractedAt;
    /// dest_rel_path of the primary file of a multi-file group.
    std::string logicalGroup;
    /// primary, wal, journal, shm or carved.
    std::string role;
    /// Offset inside the source for carved files, -1 otherwise.
    int64_t sourceOffsetBytes;
};

#endif
