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
 * \file ArxPipeline.h
 * Contains the interface for the ArxPipeline class.
 */

#ifndef _ARX_PIPELINE_H
#define _ARX_PIPELINE_H

#include <string>
#include <vector>

#include "arx/framework_i.h"
#include "arx/discovery/ArxPatternSet.h"
#include "arx/fs/ArxEvidenceFS.h"
#include "arx/ingestion/ArxIngestionEngine.h"
#include "arx/extraction/ArxManifest.h"
#include "arx/extraction/ArxStagingEngine.h"
#include "arx/parsers/ArxParserRegistry.h"
#include "arx/run/ArxRunTracker.h"
#include "arx/services/ArxConfig.h"
#include "arx/services/ArxImgDB.h"
#include "arx/utilities/ArxCancellationToken.h"

/**
 * One EXTRACTOR element of the pipeline configuration.
 */
struct ARX_FRAMEWORK_API ArxExtractorSpec
{
    ArxExtractorSpec() : order(0), carve(false) {}

    int order;
    std::string name;
    std::string version;
    std::string artifactType;
    std::string parser;
    /// Staged files are run through Scalpel and only carved files are parsed.
    bool carve;
};

/**
 * What happened to one run.
 */
struct ARX_FRAMEWORK_API ArxRunOutcome
{
    ArxRunOutcome() : candidates(0), recordsParsed(0) {}

    std::string runId;
    std::string extractorName;
    /// Final run state, ingested or failed.
    std::string state;
    /// ok, degraded, cancelled or failed.
    std::string extractionStatus;
    size_t candidates;
    size_t recordsParsed;
    ArxIngestionStats ingestion;
    /// Reason of a failed run.
    std::string error;
};

/**
 * The ArxPipeline class runs the configured extractors over one evidence
 * item. Each extractor is a run: discovery, staging, parsing and
 * ingestion, tracked through the run state machine. It is configured
 * with an XML document such as:
 * \verbatim
   <PIPELINE>
     <EXTRACTOR order="1" name="chromium_history" version="1.0.0"
                artifactType="chromium_history" parser="chromium_history"/>
   </PIPELINE>
   \endverbatim
 */
class ARX_FRAMEWORK_API ArxPipeline
{
public:
    static const std::string EXTRACTOR_ELEMENT;
    static const std::string ORDER_ATTR;
    static const std::string NAME_ATTR;
    static const std::string VERSION_ATTR;
    static const std::string ARTIFACT_TYPE_ATTR;
    static const std::string PARSER_ATTR;
    static const std::string CARVE_ATTR;

    ArxPipeline(const ArxConfig& a_config, const ArxPatternSet& a_patterns,
        const ArxParserRegistry& a_parsers, ArxImgDB& a_db);

    /**
     * Reads the extractors from an XML document.
     * @throws ArxConfigurationException if the order does not increase,
     * a name repeats, or a parser or artifact type does not resolve.
     */
    void initialize(const std::string& a_pipelineConfig);

    /// Reads the extractors from a file, see initialize().
    void initializeFromFile(const std::string& a_path);

    const std::vector<ArxExtractorSpec>& extractors() const { return m_extractors; }

    /// @throws ArxConfigurationException for an unknown extractor.
    const ArxExtractorSpec& extractor(const std::string& a_name) const;

    /**
     * Runs every extractor in order.
     * @throws ArxStorageUnavailableException if the store becomes unusable.
     */
    std::vector<ArxRunOutcome> run(const ArxEvidenceFS& a_fs, int64_t a_evidenceId,
        const std::vector<int>& a_partitions, const ArxCancellationToken& a_cancel);

    /// Runs one extractor end to end.
    ArxRunOutcome runExtractor(const ArxEvidenceFS& a_fs, int64_t a_evidenceId, const std::string& a_name,
        const std::vector<int>& a_partitions, const ArxCancellationToken& a_cancel);

    /**
     * Ingestion-only retry: a new run adopts the manifest of a_sourceRunId
     * and ingests its staged files without touching the evidence.
     */
    ArxRunOutcome ingestOnly(const std::string& a_sourceRunId, const ArxCancellationToken& a_cancel);

    /// Parses every staged file of a manifest with the extractor's parser.
    ArxParseResult parseManifest(const ArxExtractorSpec& a_extractor, const ArxManifest& a_manifest,
        const std::string& a_runDir, const ArxCancellationToken& a_cancel) const;

private:
    ArxPipeline(const ArxPipeline&);
    ArxPipeline& operator=(const ArxPipeline&);

    void ingestRun(const ArxExtractorSpec& a_extractor, const ArxRunRecord& a_run, const ArxManifest& a_manifest,
        const ArxCancellationToken& a_cancel, ArxRunOutcome& a_outcome);

    void carveStaged(const ArxExtractorSpec& a_extractor, const ArxStagingRequest& a_request,
        ArxStagingResult& a_staged, const ArxCancellationToken& a_cancel);

    const ArxConfig& m_config;
    const ArxPatternSet& m_patterns;
    const ArxParserRegistry& m_parsers;
    ArxImgDB& m_db;
    ArxRunTracker m_tracker;
    std::vector<ArxExtractorSpec> m_extractors;
};

#endif
