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
 * \file ArxRunTracker.h
 * Run identifiers, the run state machine and the process audit log.
 */

#ifndef _ARX_RUNTRACKER_H
#define _ARX_RUNTRACKER_H

#include <string>

#include "arx/framework_i.h"
#include "arx/services/ArxImgDB.h"

/**
 * Tracks runs through
 *
 * \verbatim
 created -> extracting -> extracted -> ingesting -> ingested
     \            \             \            \
      +------------+-------------+------------+--> failed
 \endverbatim
 *
 * A retry run, one that adopts the manifest of an earlier run, goes from
 * created straight to extracted. Every transition is appended to
 * process_log; rows there are never updated or deleted.
 */
class ARX_FRAMEWORK_API ArxRunTracker
{
public:
    static const char * STATE_CREATED;
    static const char * STATE_EXTRACTING;
    static const char * STATE_EXTRACTED;
    static const char * STATE_INGESTING;
    static const char * STATE_INGESTED;
    static const char * STATE_FAILED;

    explicit ArxRunTracker(ArxImgDB& a_db);

    /// UTC YYYYMMDDTHHMMSS followed by '_' and 8 random hex digits.
    static std::string newRunId();

    /// True if a_from -> a_to is a legal transition for an ordinary run.
    static bool isLegalTransition(const std::string& a_from, const std::string& a_to, bool a_isRetry);

    static bool isTerminal(const std::string& a_state);

    /// Creates a run in state created.
    ArxRunRecord startRun(int64_t a_evidenceId, const std::string& a_extractorName,
        const std::string& a_extractorVersion, const std::string& a_artifactType);

    /**
     * Creates an ingestion-only run that reuses the staged files and the
     * manifest of a_sourceRunId, and moves it to extracted.
     * @throws ArxException if the source run never produced a usable
     * manifest.
     */
    ArxRunRecord startRetry(const std::string& a_sourceRunId);

    /**
     * Moves a run to a new state.
     * @param a_extractionStatus Set when leaving extraction, empty otherwise.
     * @param a_detail Free text stored in the audit row.
     * @throws ArxException on an illegal transition or an unknown run.
     */
    void transition(const std::string& a_runId, const std::string& a_state,
        const std::string& a_extractionStatus = "", const std::string& a_detail = "");

    /// Marks a run failed from whatever non-terminal state it is in. Never throws.
    void fail(const std::string& a_runId, const std::string& a_reason);

    void setManifest(const std::string& a_runId, const std::string& a_runDir, const std::string& a_manifestPath);

    /// Appends an external tool invocation to the audit log.
    int64_t recordToolInvocation(const std::string& a_runId, ArxProcessLogRecord a_record);

    /// Appends the record and warning totals of an ingestion to the audit log.
    void recordIngestionSummary(const std::string& a_runId, int64_t a_recordsExtracted,
        int64_t a_recordsIngested, const std::string& a_warningsJson);

    ArxRunRecord getRun(const std::string& a_runId) const;

private:
    void appendAudit(const ArxRunRecord& a_run, const std::string& a_task, const std::string& a_command);

    ArxImgDB& m_db;
};

#endif
