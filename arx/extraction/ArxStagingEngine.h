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
 * \file ArxStagingEngine.h
 * Copies candidate artifacts into the run directory.
 */

#ifndef _ARX_STAGINGENGINE_H
#define _ARX_STAGINGENGINE_H

#include <string>
#include <vector>

#include "arx/framework_i.h"
#include "arx/discovery/ArxCandidateArtifact.h"
#include "arx/discovery/ArxPatternSet.h"
#include "arx/extraction/ArxManifest.h"
#include "arx/extraction/ArxManifestSink.h"
#include "arx/fs/ArxEvidenceFS.h"
#include "arx/services/ArxConfig.h"
#include "arx/services/ArxImgDB.h"
#include "arx/utilities/ArxCancellationToken.h"

/**
 * What a staging call is for.
 */
struct ARX_FRAMEWORK_API ArxStagingRequest
{
    ArxStagingRequest() : evidenceId(0), companions(ArxArtifactType::COMPANIONS_NONE) {}

    int64_t evidenceId;
    std::string runId;
    std::string extractorName;
    std::string extractorVersion;
    std::string artifactType;
    ArxArtifactType::CompanionPolicy companions;
};

struct ARX_FRAMEWORK_API ArxStagingResult
{
    ArxStagingResult() : primariesOk(0), primariesFailed(0), entriesOk(0), entriesFailed(0), cancelled(false) {}

    ArxManifest manifest;
    std::string runDir;
    std::string manifestPath;
    size_t primariesOk;
    size_t primariesFailed;
    size_t entriesOk;
    size_t entriesFailed;
    bool cancelled;
};

/**
 * Stream-copies candidates out of the evidence into
 * <outDir>/evidence_<id>/<extractor>/<run_id>/extracted/, hashing each
 * file (MD5 and SHA-256) in the same pass, and writes manifest.json.
 *
 * Destination names are planned in sorted candidate order before any
 * copy starts. Independent candidates are copied by a bounded pool of
 * workers when the evidence file system is thread-safe. A failed copy is
 * recorded and the batch continues. Cancellation is checked between files
 * and between chunks; an interrupted file is removed and gets no entry.
 */
class ARX_FRAMEWORK_API ArxStagingEngine
{
public:
    ArxStagingEngine(const ArxEvidenceFS& a_fs, const ArxConfig& a_config, ArxImgDB * a_db);

    /**
     * @throws ArxStorageUnavailableException if the run directory or the
     * manifest cannot be written, or extracted_files rows could not be
     * stored (the manifest is saved first).
     */
    ArxStagingResult extract(const std::vector<ArxCandidateArtifact>& a_candidates,
        const ArxStagingRequest& a_request, const ArxCancellationToken& a_cancel);

    /// <outDir>/evidence_<id>/<extractor>/<runId>
    static std::string runDirectory(const std::string& a_outDir, int64_t a_evidenceId,
        const std::string& a_extractorName, const std::string& a_runId);

    /// p<partition>_<first 8 hex of sha256(logical path)>_<file name>
    static std::string destinationName(const ArxCandidateArtifact& a_candidate);

    /// Suffixes of SQLite companion files.
    static const std::vector<std::string>& sqliteCompanionSuffixes();

    /// Overall status: ok, degraded, cancelled or failed.
    static std::string runStatus(const ArxStagingResult& a_result);

    struct CopyJob
    {
        ArxCandidateArtifact primary;
        std::string destName;
        /// Companion candidates already discovered, by suffix.
        std::vector<std::pair<std::string, ArxCandidateArtifact> > knownCompanions;
    };

private:
    friend class StagingWorker;

    std::vector<CopyJob> planJobs(const std::vector<ArxCandidateArtifact>& a_candidates,
        ArxArtifactType::CompanionPolicy a_companions) const;

    void runJob(const CopyJob& a_job, const ArxStagingRequest& a_request, const std::string& a_runDir,
        ArxManifestSink& a_sink, const ArxCancellationToken& a_cancel) const;

    /**
     * Copies one file. Returns false without adding an entry if the copy
     * was interrupted by cancellation.
     */
    bool copyOne(const ArxCandidateArtifact& a_source, const std::string& a_destRelPath,
        const std::string& a_runDir, const std::string& a_role, const std::string& a_logicalGroup,
        ArxManifestSink& a_sink, const ArxCancellationToken& a_cancel, ArxManifestEntry::Status& a_status) const;

    const ArxEvidenceFS& m_fs;
    const ArxConfig& m_config;
    ArxImgDB * m_db;
};

#endif
