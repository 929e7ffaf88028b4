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
 * \file ArxToolRunner.cpp
 */

#include "ArxToolRunner.h"
#include "ArxRunTracker.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxUtilities.h"

// Poco includes
#include "Poco/File.h"
#include "Poco/FileStream.h"
#include "Poco/Path.h"
#include "Poco/Pipe.h"
#include "Poco/PipeStream.h"
#include "Poco/Process.h"
#include "Poco/Runnable.h"
#include "Poco/StreamCopier.h"
#include "Poco/Thread.h"
#include "Poco/Timespan.h"
#include "Poco/Timestamp.h"
#include "Poco/JSON/Object.h"

#include <sstream>

const long ArxToolRunner::POLL_INTERVAL_MS = 50;

namespace
{
    /**
     * Drains one pipe of the child into a file until the child closes it.
     */
    class PipeDrain : public Poco::Runnable
    {
    public:
        PipeDrain(Poco::Pipe& pipe, const std::string& path) : m_pipe(pipe), m_path(path) {}

        virtual void run()
        {
            try
            {
                Poco::PipeInputStream input(m_pipe);
                Poco::FileOutputStream output(m_path, std::ios::out | std::ios::trunc);
                Poco::StreamCopier::copyStream(input, output);
                output.flush();
            }
            catch (Poco::Exception& ex)
            {
                m_error = ex.displayText();
            }
        }

        const std::string& error() const { return m_error; }

    private:
        Poco::Pipe& m_pipe;
        std::string m_path;
        std::string m_error;
    };
}

std::string ArxToolInvocation::commandLine() const
{
    std::ostringstream command;
    command << executable;
    for (size_t i = 0; i < args.size(); i++)
        command << " " << args[i];
    return command.str();
}

ArxToolRunner::ArxToolRunner(ArxRunTracker * a_tracker, const std::string& a_runId)
: m_tracker(a_tracker), m_runId(a_runId)
{
}

ArxToolResult ArxToolRunner::run(const ArxToolInvocation& a_invocation, const ArxCancellationToken& a_cancel)
{
    ArxToolResult result;
    result.startedAt = ArxUtilities::utcNowIso();

    if (!Poco::File(a_invocation.executable).exists())
    {
        std::string error = "ArxToolRunner::run - executable '" + a_invocation.executable + "' does not exist";
        LOGERROR(error);
        result.finishedAt = ArxUtilities::utcNowIso();
        audit(a_invocation, result, false, error);
        throw ArxException(error);
    }

    try
    {
        Poco::File(Poco::Path(a_invocation.stdoutPath).parent()).createDirectories();
        Poco::File(Poco::Path(a_invocation.stderrPath).parent()).createDirectories();

        Poco::Timestamp started;

        Poco::Pipe outPipe;
        Poco::Pipe errPipe;
        Poco::ProcessHandle handle = Poco::Process::launch(a_invocation.executable, a_invocation.args,
            NULL, &outPipe, &errPipe);

        // The child may block until its output is consumed, so both pipes
        // are drained on their own threads while this one watches the clock.
        PipeDrain outDrain(outPipe, a_invocation.stdoutPath);
        PipeDrain errDrain(errPipe, a_invocation.stderrPath);
        Poco::Thread outThread;
        Poco::Thread errThread;
        outThread.start(outDrain);
        errThread.start(errDrain);

        const Poco::Timespan timeout((long)a_invocation.timeoutSeconds, 0);
        while (Poco::Process::isRunning(handle))
        {
            if (a_cancel.isCancelled())
            {
                result.cancelled = true;
                Poco::Process::kill(handle);
                break;
            }
            if (a_invocation.timeoutSeconds > 0 && started.isElapsed(timeout.totalMicroseconds()))
            {
                result.timedOut = true;
                Poco::Process::kill(handle);
                break;
            }
            Poco::Thread::sleep(POLL_INTERVAL_MS);
        }

        result.exitCode = handle.wait();
        outThread.join();
        errThread.join();
        result.finishedAt = ArxUtilities::utcNowIso();

        if (!outDrain.error().empty() || !errDrain.error().empty())
        {
            LOGWARN("ArxToolRunner::run - output capture of " + a_invocation.executable + " incomplete: "
                + outDrain.error() + errDrain.error());
        }
    }
    catch (Poco::Exception& ex)
    {
        std::ostringstream msg;
        msg << "ArxToolRunner::run - Error launching " << a_invocation.executable << ": " << ex.displayText();
        LOGERROR(msg.str());
        result.finishedAt = ArxUtilities::utcNowIso();
        audit(a_invocation, result, false, msg.str());
        throw ArxException(msg.str());
    }

    std::ostringstream msg;
    msg << "ArxToolRunner::run - " << a_invocation.commandLine() << " finished with exit code " << result.exitCode;
    if (result.cancelled)
        msg << " (cancelled)";
    if (result.timedOut)
        msg << " (timed out after " << a_invocation.timeoutSeconds << "s)";
    if (result.succeeded())
        LOGINFO(msg.str());
    else
        LOGWARN(msg.str());

    audit(a_invocation, result, true, "");
    return result;
}

void ArxToolRunner::audit(const ArxToolInvocation& a_invocation, ArxToolResult& a_result,
    bool a_finished, const std::string& a_error)
{
    if (m_tracker == NULL)
        return;

    ArxProcessLogRecord record;
    record.task = a_invocation.task;
    record.command = a_invocation.commandLine();
    record.startedAt = a_result.startedAt;
    record.finishedAt = a_result.finishedAt;
    record.exitCode = a_result.exitCode;
    record.hasExitCode = a_finished;
    record.stdoutRef = a_invocation.stdoutPath;
    record.stderrRef = a_invocation.stderrPath;
    if (!a_error.empty())
    {
        Poco::JSON::Object error;
        error.set("error", a_error);
        std::ostringstream json;
        error.stringify(json);
        record.warningsJson = json.str();
    }
    a_result.auditId = m_tracker->recordToolInvocation(m_runId, record);
}
