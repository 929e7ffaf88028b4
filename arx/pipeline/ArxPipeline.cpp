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
 * \file ArxPipeline.cpp
 * Contains the implementation for the ArxPipeline class.
 */

#include "ArxPipeline.h"
#include "arx/discovery/ArxDiscovery.h"
#include "arx/extraction/ArxCarveExtractScalpel.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"
#include "arx/ArxVersionInfo.h"

// Poco includes
#include "Poco/AutoPtr.h"
#include "Poco/FileStream.h"
#include "Poco/NumberParser.h"
#include "Poco/StreamCopier.h"
#include "Poco/Stopwatch.h"
#include "Poco/DOM/DOMParser.h"
#include "Poco/DOM/Document.h"
#include "Poco/DOM/Element.h"
#include "Poco/DOM/NodeList.h"
#include "Poco/JSON/Object.h"

#include <algorithm>
#include <map>
#include <set>
#include <sstream>

const std::string ArxPipeline::EXTRACTOR_ELEMENT = "EXTRACTOR";
const std::string ArxPipeline::ORDER_ATTR = "order";
const std::string ArxPipeline::NAME_ATTR = "name";
const std::string ArxPipeline::VERSION_ATTR = "version";
const std::string ArxPipeline::ARTIFACT_TYPE_ATTR = "artifactType";
const std::string ArxPipeline::PARSER_ATTR = "parser";
const std::string ArxPipeline::CARVE_ATTR = "carve";

namespace
{
    /// Warning counts by type, stored with the ingestion summary.
    std::string warningsSummary(const ArxWarningList& warnings)
    {
        std::map<std::string, int> counts;
        for (size_t i = 0; i < warnings.size(); i++)
            counts[warnings[i].warningType]++;

        Poco::JSON::Object summary;
        for (std::map<std::string, int>::const_iterator it = counts.begin(); it != counts.end(); ++it)
            summary.set(it->first, it->second);
        std::ostringstream json;
        summary.stringify(json);
        return json.str();
    }
}

ArxPipeline::ArxPipeline(const ArxConfig& a_config, const ArxPatternSet& a_patterns,
    const ArxParserRegistry& a_parsers, ArxImgDB& a_db)
    : m_config(a_config), m_patterns(a_patterns), m_parsers(a_parsers), m_db(a_db), m_tracker(a_db)
{
}

void ArxPipeline::initializeFromFile(const std::string& a_path)
{
    std::string pipelineConfig;
    try
    {
        Poco::FileInputStream in(a_path);
        Poco::StreamCopier::copyToString(in, pipelineConfig);
    }
    catch (Poco::Exception& ex)
    {
        std::stringstream msg;
        msg << "ArxPipeline::initializeFromFile - cannot read " << a_path << ": " << ex.displayText();
        throw ArxConfigurationException(msg.str());
    }
    initialize(pipelineConfig);
}

void ArxPipeline::initialize(const std::string& a_pipelineConfig)
{
    if (a_pipelineConfig.empty())
    {
        throw ArxConfigurationException("ArxPipeline::initialize: Pipeline configuration string is empty.");
    }

    std::vector<ArxExtractorSpec> extractors;
    try
    {
        Poco::XML::DOMParser parser;
        Poco::AutoPtr<Poco::XML::Document> xmlDoc = parser.parseString(a_pipelineConfig);

        Poco::AutoPtr<Poco::XML::NodeList> elements = xmlDoc->getElementsByTagName(EXTRACTOR_ELEMENT);
        if (elements->length() == 0)
        {
            LOGWARN("ArxPipeline::initialize - No extractors found in config file.");
        }

        // Orders must increase; gaps are allowed so entries can be commented out.
        int prevOrder = -1;
        std::set<std::string> names;
        for (unsigned long i = 0; i < elements->length(); i++)
        {
            Poco::XML::Element * pElem = dynamic_cast<Poco::XML::Element *>(elements->item(i));
            if (!pElem)
                continue;

            ArxExtractorSpec spec;
            std::string orderStr = pElem->getAttribute(ORDER_ATTR);
            if (orderStr.empty())
                throw ArxConfigurationException("ArxPipeline::initialize: Extractor order missing.");
            try
            {
                spec.order = Poco::NumberParser::parse(orderStr);
            }
            catch (Poco::SyntaxException&)
            {
                std::stringstream msg;
                msg << "ArxPipeline::initialize - Extractor order must be a decimal number. Got " << orderStr;
                throw ArxConfigurationException(msg.str());
            }
            if (spec.order <= prevOrder)
            {
                std::stringstream msg;
                msg << "ArxPipeline::initialize - Expecting order bigger than " << prevOrder << ", got " << spec.order;
                throw ArxConfigurationException(msg.str());
            }
            prevOrder = spec.order;

            spec.name = pElem->getAttribute(NAME_ATTR);
            spec.version = pElem->getAttribute(VERSION_ATTR);
            spec.artifactType = pElem->getAttribute(ARTIFACT_TYPE_ATTR);
            spec.parser = pElem->getAttribute(PARSER_ATTR);
            spec.carve = pElem->getAttribute(CARVE_ATTR) == "scalpel";

            if (spec.name.empty())
                throw ArxConfigurationException("ArxPipeline::initialize - Extractor name missing.");
            if (!names.insert(spec.name).second)
            {
                std::stringstream msg;
                msg << "ArxPipeline::initialize - " << spec.name << " is a duplicate extractor.";
                throw ArxConfigurationException(msg.str());
            }
            if (!m_patterns.hasArtifactType(spec.artifactType))
            {
                std::stringstream msg;
                msg << "ArxPipeline::initialize - " << spec.name << ": unknown artifact type '" << spec.artifactType << "'";
                throw ArxConfigurationException(msg.str());
            }

            // Throws for an unknown parser.
            std::unique_ptr<ArxParser> parserInstance = m_parsers.create(spec.parser);
            std::vector<ArxArtifactFamily> families = parserInstance->families();
            ArxArtifactFamily family = m_patterns.artifactType(spec.artifactType).family;
            if (std::find(families.begin(), families.end(), family) == families.end())
            {
                std::stringstream msg;
                msg << "ArxPipeline::initialize - " << spec.name << ": parser " << spec.parser
                    << " does not produce " << arxFamilyName(family) << " records";
                throw ArxConfigurationException(msg.str());
            }

            extractors.push_back(spec);
        }
    }
    // rethrow this, otherwise it is caught by std::exception and we lose the detail.
    catch (ArxException&)
    {
        throw;
    }
    catch (std::exception& ex)
    {
        std::stringstream errorMsg;
        errorMsg << "ArxPipeline::initialize - Pipeline initialization failed: " << ex.what();
        throw ArxConfigurationException(errorMsg.str());
    }

    m_extractors = extractors;

    std::stringstream msg;
    msg << "ArxPipeline::initialize - arx " << ARX_FRAMEWORK_VERSION_STR << ", "
        << m_extractors.size() << " extractors configured.";
    LOGINFO(msg.str());
}

const ArxExtractorSpec& ArxPipeline::extractor(const std::string& a_name) const
{
    for (size_t i = 0; i < m_extractors.size(); i++)
    {
        if (m_extractors[i].name == a_name)
            return m_extractors[i];
    }
    throw ArxConfigurationException("ArxPipeline::extractor - unknown extractor " + a_name);
}

std::vector<ArxRunOutcome> ArxPipeline::run(const ArxEvidenceFS& a_fs, int64_t a_evidenceId,
    const std::vector<int>& a_partitions, const ArxCancellationToken& a_cancel)
{
    std::vector<ArxRunOutcome> outcomes;
    for (size_t i = 0; i < m_extractors.size(); i++)
    {
        if (a_cancel.isCancelled())
        {
            LOGWARN("ArxPipeline::run - cancelled before " + m_extractors[i].name);
            break;
        }
        outcomes.push_back(runExtractor(a_fs, a_evidenceId, m_extractors[i].name, a_partitions, a_cancel));
    }
    return outcomes;
}

ArxRunOutcome ArxPipeline::runExtractor(const ArxEvidenceFS& a_fs, int64_t a_evidenceId, const std::string& a_name,
    const std::vector<int>& a_partitions, const ArxCancellationToken& a_cancel)
{
    const ArxExtractorSpec& spec = extractor(a_name);
    const ArxArtifactType& artifactType = m_patterns.artifactType(spec.artifactType);

    ArxRunRecord run = m_tracker.startRun(a_evidenceId, spec.name, spec.version, spec.artifactType);

    ArxRunOutcome outcome;
    outcome.runId = run.runId;
    outcome.extractorName = spec.name;

    Poco::Stopwatch timer;
    timer.start();
    try
    {
        m_tracker.transition(run.runId, ArxRunTracker::STATE_EXTRACTING);

        ArxDiscovery discovery(a_fs, m_patterns, &m_db, m_config);
        std::vector<ArxCandidateArtifact> candidates =
            discovery.discover(a_evidenceId, spec.artifactType, a_partitions);
        outcome.candidates = candidates.size();

        ArxStagingRequest request;
        request.evidenceId = a_evidenceId;
        request.runId = run.runId;
        request.extractorName = spec.name;
        request.extractorVersion = spec.version;
        request.artifactType = spec.artifactType;
        request.companions = artifactType.companions;

        ArxStagingEngine staging(a_fs, m_config, &m_db);
        ArxStagingResult staged = staging.extract(candidates, request, a_cancel);
        if (spec.carve && !staged.cancelled)
            carveStaged(spec, request, staged, a_cancel);

        m_tracker.setManifest(run.runId, staged.runDir, staged.manifestPath);
        outcome.extractionStatus = staged.manifest.status;

        if (staged.manifest.status == "cancelled" || staged.manifest.status == "failed")
        {
            // Nothing usable was staged; the run never reaches ingestion.
            std::string reason = "extraction " + staged.manifest.status;
            m_tracker.transition(run.runId, ArxRunTracker::STATE_FAILED, staged.manifest.status, reason);
            outcome.state = ArxRunTracker::STATE_FAILED;
            outcome.error = reason;
            return outcome;
        }

        m_tracker.transition(run.runId, ArxRunTracker::STATE_EXTRACTED, staged.manifest.status);
        ingestRun(spec, m_tracker.getRun(run.runId), staged.manifest, a_cancel, outcome);
    }
    catch (ArxStorageUnavailableException& ex)
    {
        m_tracker.fail(run.runId, ex.message());
        throw;
    }
    catch (ArxException& ex)
    {
        std::stringstream msg;
        msg << "ArxPipeline::runExtractor - " << spec.name << " run " << run.runId << " failed: " << ex.message();
        LOGERROR(msg.str());
        m_tracker.fail(run.runId, ex.message());
        outcome.state = ArxRunTracker::STATE_FAILED;
        outcome.error = ex.message();
    }

    timer.stop();
    std::stringstream msg;
    msg << "ArxPipeline::runExtractor : " << spec.name << " run " << run.runId << " finished in "
        << timer.elapsed() / 1000 << " ms, state " << outcome.state;
    LOGINFO(msg.str());
    return outcome;
}

ArxRunOutcome ArxPipeline::ingestOnly(const std::string& a_sourceRunId, const ArxCancellationToken& a_cancel)
{
    ArxRunRecord source = m_tracker.getRun(a_sourceRunId);
    const ArxExtractorSpec& spec = extractor(source.extractorName);

    // Throws when the source run has no usable manifest.
    ArxRunRecord run = m_tracker.startRetry(a_sourceRunId);

    ArxRunOutcome outcome;
    outcome.runId = run.runId;
    outcome.extractorName = run.extractorName;
    outcome.extractionStatus = run.extractionStatus;

    try
    {
        ArxManifest manifest = ArxManifest::load(run.manifestPath);
        ingestRun(spec, run, manifest, a_cancel, outcome);
    }
    catch (ArxStorageUnavailableException& ex)
    {
        m_tracker.fail(run.runId, ex.message());
        throw;
    }
    catch (ArxException& ex)
    {
        std::stringstream msg;
        msg << "ArxPipeline::ingestOnly - retry " << run.runId << " of " << a_sourceRunId << " failed: " << ex.message();
        LOGERROR(msg.str());
        m_tracker.fail(run.runId, ex.message());
        outcome.state = ArxRunTracker::STATE_FAILED;
        outcome.error = ex.message();
    }
    return outcome;
}

ArxParseResult ArxPipeline::parseManifest(const ArxExtractorSpec& a_extractor, const ArxManifest& a_manifest,
    const std::string& a_runDir, const ArxCancellationToken& a_cancel) const
{
    std::unique_ptr<ArxParser> parser = m_parsers.create(a_extractor.parser);

    ArxParseResult combined;
    std::vector<ArxManifestEntry> primaries = a_manifest.primaryEntries();
    for (size_t i = 0; i < primaries.size(); i++)
    {
        if (a_cancel.isCancelled())
            break;
        if (primaries[i].status != ArxManifestEntry::STATUS_OK)
            continue;
        // Inputs of a carving extractor are not themselves artifacts.
        if (a_extractor.carve && primaries[i].role != "carved")
            continue;

        ArxParseInput input;
        input.entry = primaries[i];
        input.companions = a_manifest.companionsOf(primaries[i]);
        input.runDir = a_runDir;
        input.artifactType = a_extractor.artifactType;
        input.discoveredBy = a_extractor.name;

        ArxParseResult result = parser->parse(input);
        combined.records.insert(combined.records.end(), result.records.begin(), result.records.end());
        combined.warnings.insert(combined.warnings.end(), result.warnings.begin(), result.warnings.end());
        combined.failedRecords += result.failedRecords;
    }
    return combined;
}

void ArxPipeline::ingestRun(const ArxExtractorSpec& a_extractor, const ArxRunRecord& a_run,
    const ArxManifest& a_manifest, const ArxCancellationToken& a_cancel, ArxRunOutcome& a_outcome)
{
    m_tracker.transition(a_run.runId, ArxRunTracker::STATE_INGESTING);

    ArxParseResult parsed = parseManifest(a_extractor, a_manifest, a_run.runDir, a_cancel);
    a_outcome.recordsParsed = parsed.records.size();

    ArxIngestionBatch batch;
    batch.runId = a_run.runId;
    batch.evidenceId = a_run.evidenceId;
    batch.extractorName = a_extractor.name;
    batch.artifactType = a_extractor.artifactType;
    // Every family the parser can emit is replaced, even when this run found none.
    batch.families = m_parsers.create(a_extractor.parser)->families();
    batch.records.swap(parsed.records);
    batch.warnings.swap(parsed.warnings);

    ArxIngestionEngine engine(m_db, m_config.replaceScope);
    a_outcome.ingestion = engine.ingest(batch, &a_cancel);
    a_outcome.ingestion.failed += parsed.failedRecords;

    if (a_outcome.ingestion.cancelled || a_cancel.isCancelled())
    {
        m_tracker.transition(a_run.runId, ArxRunTracker::STATE_FAILED, "", "ingestion cancelled");
        a_outcome.state = ArxRunTracker::STATE_FAILED;
        a_outcome.error = "ingestion cancelled";
        return;
    }

    m_tracker.recordIngestionSummary(a_run.runId, (int64_t)a_outcome.recordsParsed,
        (int64_t)a_outcome.ingestion.inserted, warningsSummary(batch.warnings));
    m_tracker.transition(a_run.runId, ArxRunTracker::STATE_INGESTED);
    a_outcome.state = ArxRunTracker::STATE_INGESTED;
}

void ArxPipeline::carveStaged(const ArxExtractorSpec& a_extractor, const ArxStagingRequest& a_request,
    ArxStagingResult& a_staged, const ArxCancellationToken& a_cancel)
{
    ArxCarveExtractScalpel carver(m_config, &m_tracker, &m_db);

    std::vector<ArxManifestEntry> inputs = a_staged.manifest.primaryEntries();
    bool toolFailed = false;
    size_t carvedOk = 0;
    for (size_t i = 0; i < inputs.size(); i++)
    {
        if (inputs[i].status != ArxManifestEntry::STATUS_OK)
            continue;
        if (a_cancel.isCancelled())
        {
            a_staged.cancelled = true;
            break;
        }

        ArxParseInput input;
        input.entry = inputs[i];
        input.runDir = a_staged.runDir;

        std::stringstream label;
        label << "input_" << i;
        ArxStagingResult carved = carver.carve(input.stagedPath(), inputs[i].source, a_request, a_cancel, label.str());

        a_staged.manifest.files.insert(a_staged.manifest.files.end(),
            carved.manifest.files.begin(), carved.manifest.files.end());
        a_staged.entriesOk += carved.entriesOk;
        a_staged.entriesFailed += carved.entriesFailed;
        carvedOk += carved.entriesOk;
        if (carved.cancelled)
        {
            a_staged.cancelled = true;
            break;
        }
        if (carved.manifest.status == "failed" || carved.manifest.status == "degraded")
            toolFailed = true;
    }

    std::string status = ArxStagingEngine::runStatus(a_staged);
    if (status == "ok" && toolFailed)
        status = carvedOk > 0 ? "degraded" : "failed";
    a_staged.manifest.status = status;
    a_staged.manifest.sortFiles();

    // carve() leaves a manifest of its own input; the run manifest holds everything.
    a_staged.manifest.save(a_staged.manifestPath);

    std::stringstream msg;
    msg << "ArxPipeline::carveStaged - " << a_extractor.name << ": " << carvedOk << " carved files, status " << status;
    LOGINFO(msg.str());
}
