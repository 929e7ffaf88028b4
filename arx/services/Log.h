/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _ARX_LOG_H
#define _ARX_LOG_H

#include "arx/framework_i.h"
#include <string>
#include <iostream>
#include <fstream>

#include "Poco/Mutex.h"

/**
 * \file Log.h
 * Interface and default logging infrastructure that enables applications and framework
 * to log to a single place.
 */

/**
 * Macro that gets the log service and writes an error message in a
 * single statement.
 * @param msg Message to log
 * @returns void
 */
#define LOGERROR(msg) ArxServices::Instance().getLog().log(Log::Error, msg)

/**
 * Macro that gets the log service and writes a warning message in a
 * single statement.
 * @param msg Message to log
 * @returns void
 */
#define LOGWARN(msg) ArxServices::Instance().getLog().log(Log::Warn, msg)

/**
 * Macro that gets the log service and writes an info message in a
 * single statement.
 * @param msg Message to log
 * @returns void
 */
#define LOGINFO(msg) ArxServices::Instance().getLog().log(Log::Info, msg)

/**
 * Logging class to enable the framework, applications that use it and the
 * extractors to log error and warning messages.  The default implementation
 * writes the log messages to a file if open() was called or prints the
 * messages to stderr if open() was never called. The class can be extended
 * if you want logs to be saved in another way.
 * Can be registered with and retrieved from ArxServices.
 *
 * Staging workers log from several threads, so every write is serialized.
 */
class ARX_FRAMEWORK_API Log
{
public:
    /**
     * Defined logging levels.
     */
    enum Channel {
        Error, ///< Critical error that stops processing
        Warn,  ///< Unexpected results that could be recovered from
        Info   ///< General debugging information
    };

    Log();
    virtual ~Log();

    /**
     * Generate a log message with a given level (narrow string).
     * @param a_channel Level of log to make
     * @param a_msg Message to record.
     */
    virtual void log(Channel a_channel, const std::string &a_msg);

    /**
     * Generate a log message with a given level (printf-style arguments).
     * @param a_channel Level of log to make
     * @param format Message to record.
     */
    virtual void logf(Channel a_channel, char const *format, ...);

    void logError(const std::string &msg) { log(Log::Error, msg); };
    void logWarn(const std::string &msg)  { log(Log::Warn,  msg); };
    void logInfo(const std::string &msg)  { log(Log::Info,  msg); };

    int open(const char * a_logFileFullPath);
    int open();
    int close();
    const char * getLogPath() const { return m_filePath.c_str(); }

protected:
    /// Writes one formatted line. Caller holds m_mutex.
    virtual void logMessage(const std::string& level, const std::string& msg);

    std::string m_filePath;
    std::ofstream m_outStream;

private:
    static const int REPEAT_THRESHOLD;

    Poco::FastMutex m_mutex;
    std::string m_previousMessage;
    int m_messageRepeatCount;
};
#endif
