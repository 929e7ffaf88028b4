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
 * \file ArxManifest.h
 * The per-run manifest document.
 */

#ifndef _ARX_MANIFEST_H
#define _ARX_MANIFEST_H

#include <istream>
#include <string>
#include <vector>

#include "arx/framework_i.h"
#include "arx/extraction/ArxManifestEntry.h"

/**
 * The durable record of all files copied during one run, stored as
 * manifest.json in the run directory. Together with the staged files it
 * is sufficient to re-run ingestion without the evidence.
 *
 * Version 2 is written. Version 1 documents (no manifest_version key,
 * files carrying extracted_path, copy_status and companion_files) are
 * converted on load.
 */
class ARX_FRAMEWORK_API ArxManifest
{
public:
    static const int CURRENT_VERSION = 2;
    static const char * FILE_NAME;

    ArxManifest() : manifestVersion(CURRENT_VERSION), evidenceId(0) {}

    int manifestVersion;
    std::string runId;
    int64_t evidenceId;
    std::string extractor;
    std::string extractorVersion;
    std::string artifactType;
    /// ok, degraded, cancelled or failed.
    std::string status;
    std::string createdAt;
    std::vector<ArxManifestEntry> files;

    /// Orders files by dest_rel_path.
    void sortFiles();

    /// Entries whose role is "primary" or "carved", the ones parsers are given.
    std::vector<ArxManifestEntry> primaryEntries() const;

    /// Entries of the group led by a primary, excluding the primary.
    std::vector<ArxManifestEntry> companionsOf(const ArxManifestEntry& a_primary) const;

    /// The document as indented JSON with files sorted.
    std::string toJson() const;

    /**
     * Writes the document to a_path through a temporary file that is
     * renamed into place.
     * @throws ArxStorageUnavailableException on a write failure.
     */
    void save(const std::string& a_path) const;

    /**
     * @throws ArxParseException if the file is missing, is not JSON or
     * lacks required keys.
     */
    static ArxManifest load(const std::string& a_path);

    /**
     * @param a_runDir Directory the manifest belongs to; version 1 paths
     * are made relative to it.
     */
    static ArxManifest parse(std::istream& a_input, const std::string& a_runDir);
};

#endif
