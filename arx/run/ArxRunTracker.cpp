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
 * \file ArxRunTracker.cpp
 */

#include "ArxRunTracker.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxUtilities.h"

// Poco includes
#include "Poco/DateTimeFormatter.h"
#include "Poco/String.h"
#include "Poco/Timestamp.h"
#include "Poco/UUIDGenerator.h"

#include <sstream>

const char * ArxRunTracker::STATE_CREATED = "created";
const char * ArxRunTracker::STATE_EXTRACTING = "extracting";
const char * ArxRunTracker::STATE_EXTRACTED = "extracted";
const char * ArxRunTracker::STATE_INGESTING = "ingesting";
const char * ArxRunTracker::STATE_INGESTED = "ingested";
const char * ArxRunTracker::STATE_FAILED = "failed";

ArxRunTracker::ArxRunTracker(ArxImgDB& a_db) : m_db(a_db)
{
}

std::string ArxRunTracker::newRunId()
{
    std::string uuid = Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
    Poco::removeInPlace(uuid, '-');

    return Poco::DateTimeFormatter::format(Poco::Timestamp(), "%Y%m%dT%H%M%S") + "_" + uuid.substr(0, 8);
}

bool ArxRunTracker::isTerminal(const std::string& a_state)
{
    return a_state == STATE_INGESTED || a_state == STATE_FAILED;
}

bool ArxRunTracker::isLegalTransition(const std::string& a_from, const std::string& a_to, bool a_isRetry)
{
    if (isTerminal(a_from))
        return false;
    if (a_to == STATE_FAILED)
        return true;

    if (a_from == STATE_CREATED)
        return a_isRetry ? a_to == STATE_EXTRACTED : a_to == STATE_EXTRACTING;
    if (a_from == STATE_EXTRACTING)
        return a_to == STATE_EXTRACTED;
    if (a_from == STATE_EXTRACTED)
        return a_to == STATE_INGESTING;
    if (a_from == STATE_INGESTING)
        return a_to == STATE_INGESTED;
    return false;
}

ArxRunRecord ArxRunTracker::startRun(int64_t a_evidenceId, const std::string& a_extractorName,
    const std::string& a_extractorVersion, const std::string& a_artifactType)
{
    ArxRunRecord run;
    run.runId = newRunId();
    run.evidenceId = a_evidenceId;
    run.extractorName = a_extractorName;
    run.extractorVersion = a_extractorVersion;
    run.artifactType = a_artifactType;
    run.state = STATE_CREATED;
    run.startedAt = ArxUtilities::utcNowIso();

    m_db.addRun(run);
    appendAudit(run, "run_created", "");

    std::ostringstream msg;
    msg << "ArxRunTracker::startRun - run " << run.runId << " of " << a_extractorName
        << " on evidence " << a_evidenceId;
    LOGINFO(msg.str());
    return run;
}

ArxRunRecord ArxRunTracker::startRetry(const std::string& a_sourceRunId)
{
    ArxRunRecord source = getRun(a_sourceRunId);
    if (source.manifestPath.empty() ||
        source.extractionStatus.empty() || source.extractionStatus == "failed" || source.extractionStatus == "cancelled")
    {
        throw ArxException("ArxRunTracker::startRetry - run " + a_sourceRunId + " has no usable manifest");
    }

    ArxRunRecord run;
    run.runId = newRunId();
    run.evidenceId = source.evidenceId;
    run.extractorName = source.extractorName;
    run.extractorVersion = source.extractorVersion;
    run.artifactType = source.artifactType;
    run.state = STATE_CREATED;
    run.startedAt = ArxUtilities::utcNowIso();
    run.sourceRunId = a_sourceRunId;
    run.runDir = source.runDir;
    run.manifestPath = source.manifestPath;

    m_db.addRun(run);
    appendAudit(run, "run_created", "retry of " + a_sourceRunId);
    transition(run.runId, STATE_EXTRACTED, source.extractionStatus, "manifest adopted from " + a_sourceRunId);

    return getRun(run.runId);
}

void ArxRunTracker::transition(const std::string& a_runId, const std::string& a_state,
    const std::string& a_extractionStatus, const std::string& a_detail)
{
    ArxRunRecord run = getRun(a_runId);
    if (!isLegalTransition(run.state, a_state, !run.sourceRunId.empty()))
    {
        std::ostringstream msg;
        msg << "ArxRunTracker::transition - illegal transition " << run.state << " -> " << a_state
            << " for run " << a_runId;
        LOGERROR(msg.str());
        throw ArxException(msg.str());
    }

    std::string finishedAt;
    if (isTerminal(a_state))
        finishedAt = ArxUtilities::utcNowIso();

    m_db.updateRunState(a_runId, a_state, a_extractionStatus, finishedAt);
    appendAudit(run, "state:" + run.state + "->" + a_state, a_detail);
}

void ArxRunTracker::fail(const std::string& a_runId, const std::string& a_reason)
{
    try
    {
        ArxRunRecord run = getRun(a_runId);
        if (isTerminal(run.state))
            return;
        transition(a_runId, STATE_FAILED, "", a_reason);
    }
    catch (ArxException& ex)
    {
        LOGERROR("ArxRunTracker::fail - cannot mark run " + a_runId + " failed: " + ex.message());
    }
}

void ArxRunTracker::setManifest(const std::string& a_runId, const std::string& a_runDir,
    const std::string& a_manifestPath)
{
    m_db.setRunManifest(a_runId, a_runDir, a_manifestPath);
}

int64_t ArxRunTracker::recordToolInvocation(const std::string& a_runId, ArxProcessLogRecord a_record)
{
    ArxRunRecord run = getRun(a_runId);
    a_record.runId = run.runId;
    a_record.evidenceId = run.evidenceId;
    a_record.extractorName = run.extractorName;
    a_record.extractorVersion = run.extractorVersion;
    return m_db.addProcessLog(a_record);
}

void ArxRunTracker::recordIngestionSummary(const std::string& a_runId, int64_t a_recordsExtracted,
    int64_t a_recordsIngested, const std::string& a_warningsJson)
{
    ArxRunRecord run = getRun(a_runId);

    ArxProcessLogRecord record;
    record.evidenceId = run.evidenceId;
    record.runId = run.runId;
    record.task = "ingestion_summary";
    record.startedAt = ArxUtilities::utcNowIso();
    record.finishedAt = record.startedAt;
    record.extractorName = run.extractorName;
    record.extractorVersion = run.extractorVersion;
    record.recordsExtracted = a_recordsExtracted;
    record.recordsIngested = a_recordsIngested;
    record.warningsJson = a_warningsJson;
    m_db.addProcessLog(record);
}

ArxRunRecord ArxRunTracker::getRun(const std::string& a_runId) const
{
    std::optional<ArxRunRecord> run = m_db.getRun(a_runId);
    if (!run)
        throw ArxException("ArxRunTracker::getRun - unknown run " + a_runId);
    return *run;
}

void ArxRunTracker::appendAudit(const ArxRunRecord& a_run, const std::string& a_task, const std::string& a_command)
{
    ArxProcessLogRecord record;
    record.evidenceId = a_run.evidenceId;
    record.runId = a_run.runId;
    record.task = a_task;
    record.command = a_command;
    record.startedAt = ArxUtilities::utcNowIso();
    record.finishedAt = record.startedAt;
    record.extractorName = a_run.extractorName;
    record.extractorVersion = a_run.extractorVersion;
    record.logFilePath = a_run.runDir;
    m_db.addProcessLog(record);
}
