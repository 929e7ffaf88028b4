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
 * \file ArxToolRunner.h
 * Launches external tools with audited, cancellable execution.
 */

#ifndef _ARX_TOOLRUNNER_H
#define _ARX_TOOLRUNNER_H

#include <string>
#include <vector>

#include "arx/framework_i.h"
#include "arx/utilities/ArxCancellationToken.h"

class ArxRunTracker;

struct ARX_FRAMEWORK_API ArxToolInvocation
{
    ArxToolInvocation() : timeoutSeconds(0) {}

    /// Audit task name, e.g. "carve".
    std::string task;
    std::string executable;
    std::vector<std::string> args;
    std::string stdoutPath;
    std::string stderrPath;
    /// Zero disables the timeout.
    unsigned int timeoutSeconds;

    /// Executable and arguments joined by spaces.
    std::string commandLine() const;
};

struct ARX_FRAMEWORK_API ArxToolResult
{
    ArxToolResult() : exitCode(-1), timedOut(false), cancelled(false), auditId(0) {}

    int exitCode;
    bool timedOut;
    bool cancelled;
    std::string startedAt;
    std::string finishedAt;
    /// process_log id of the invocation, 0 when no tracker was given.
    int64_t auditId;

    /// Ran to completion with exit code 0.
    bool succeeded() const { return !timedOut && !cancelled && exitCode == 0; }
};

/**
 * Runs an external program, copying its stdout and stderr into files,
 * and records the invocation in process_log. The process is killed when
 * the cancellation token fires or the timeout expires; output written so
 * far is kept.
 */
class ARX_FRAMEWORK_API ArxToolRunner
{
public:
    /**
     * @param a_tracker Audit sink, may be NULL.
     * @param a_runId Run the invocations belong to.
     */
    ArxToolRunner(ArxRunTracker * a_tracker, const std::string& a_runId);

    /**
     * @throws ArxException if the executable does not exist or cannot be
     * launched.
     */
    ArxToolResult run(const ArxToolInvocation& a_invocation, const ArxCancellationToken& a_cancel);

private:
    static const long POLL_INTERVAL_MS;

    /// Appends the process_log row; a launch failure has no exit code.
    void audit(const ArxToolInvocation& a_invocation, ArxToolResult& a_result,
        bool a_finished, const std::string& a_error);

    ArxRunTracker * m_tracker;
    std::string m_runId;
};

#endif
