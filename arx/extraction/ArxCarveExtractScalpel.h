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
 * \file ArxCarveExtractScalpel.h
 * Contains the interface of the ArxCarveExtractScalpel class.
 */

#ifndef _ARX_CARVEEXTRACTSCALPEL_H
#define _ARX_CARVEEXTRACTSCALPEL_H

#include <istream>
#include <string>
#include <vector>

#include "arx/framework_i.h"
#include "arx/extraction/ArxStagingEngine.h"
#include "arx/services/ArxConfig.h"
#include "arx/services/ArxImgDB.h"
#include "arx/utilities/ArxCancellationToken.h"

class ArxRunTracker;

/**
 * The ArxCarveExtractScalpel class carves files out of a staged input with
 * Scalpel and turns the carving results into manifest entries (role
 * "carved", with the byte offset of each file inside the input) that the
 * image parser can ingest like any other staged file.
 */
class ARX_FRAMEWORK_API ArxCarveExtractScalpel
{
public:
    /**
     * Bundles information concerning a carved file produced by Scalpel.
     */
    struct CarvedFile
    {
        CarvedFile() : offset(0), length(0) {}

        std::string name;
        uint64_t offset;
        uint64_t length;
    };

    ArxCarveExtractScalpel(const ArxConfig& a_config, ArxRunTracker * a_tracker, ArxImgDB * a_db);

    /**
     * Carves a_inputPath into the run directory of a_request.
     *
     * @param a_inputPath Host path of the file to carve.
     * @param a_source Evidence provenance of the input.
     * @param a_label Subfolder of carved/ for this input, so several inputs
     * can be carved within one run. Empty to write to carved/ directly.
     * @returns The staging result; files carved before a cancellation or
     * timeout stay in the manifest.
     * @throws ArxConfigurationException if Scalpel or its configuration
     * file is not available.
     */
    ArxStagingResult carve(const std::string& a_inputPath, const ArxCandidateArtifact& a_source,
        const ArxStagingRequest& a_request, const ArxCancellationToken& a_cancel, const std::string& a_label = "");

    /**
     * Parses a Scalpel audit file. Lines after the "Extracted From" header
     * with five fields are carved files.
     */
    static std::vector<CarvedFile> parseCarvingResults(std::istream& a_results);

    /// Path of the Scalpel executable under the configured SCALPEL directory.
    std::string scalpelExecutable() const;

private:
    const ArxConfig& m_config;
    ArxRunTracker * m_tracker;
    ArxImgDB * m_db;
};

#endif
