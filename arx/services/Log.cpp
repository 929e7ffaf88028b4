/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include <string>
#include <sstream>
#include <stdarg.h>
#include "Log.h"
#include "Poco/LineEndingConverter.h"
#include "Poco/LocalDateTime.h"
#include "Poco/DateTimeFormatter.h"

// The threshold at which we will write a message to the log
// file for messages that repeat.
const int Log::REPEAT_THRESHOLD = 500;

Log::Log()
: m_filePath(""), m_outStream(), m_previousMessage(""), m_messageRepeatCount(0)
{
}

/**
 * Opens a single log file with a default name, based on the time
 * that the log was opened.
 * @returns 1 on error and 0 on success.
 */
int Log::open()
{
    Poco::LocalDateTime now;
    std::string filename = Poco::DateTimeFormatter::format(now, "log_%Y-%m-%d-%H-%M-%S.txt");
    return open(filename.c_str());
}

/**
 * Open the single log file at the path specified. All messages
 * will be printed to the log.
 * @param a_logFileFullPath Path to logfile to open.
 * @returns 1 on error and 0 on success.
 */
int Log::open(const char * a_logFileFullPath)
{
    close(); // if needed

    Poco::FastMutex::ScopedLock lock(m_mutex);
    m_outStream.clear();
    m_outStream.open(a_logFileFullPath, std::ios::app);
    if (!m_outStream.is_open()) {
        fprintf(stderr, "The file '%s' cannot be opened.\n", a_logFileFullPath);
        return 1;
    }

    m_filePath.assign(a_logFileFullPath);

    return 0;
}

/**
 * Close the opened log file.
 * @returns 0 on success
 */
int Log::close()
{
    Poco::FastMutex::ScopedLock lock(m_mutex);
    if (!m_outStream.is_open())
        return 0;

    m_outStream.close();
    if (m_outStream.bad()) {
        fprintf(stderr, "The file '%s' was not closed.\n", m_filePath.c_str());
        return 1;
    }
    m_filePath.clear();
    return 0;
}

Log::~Log()
{
    close();
}

void Log::logf(Channel a_channel, char const *format, ...)
{
    va_list args;
    va_start(args, format);

    char buf[2048];
    buf[2047] = '\0';
    vsnprintf(buf, 2047, format, args);
    va_end(args);

    log(a_channel, std::string(buf));
}

void Log::log(Channel a_channel, const std::string &a_msg)
{
    std::string level;
    switch (a_channel) {
    case Error:
        level.assign("[ERROR]");
        break;
    case Warn:
        level.assign("[WARN]");
        break;
    case Info:
        level.assign("[INFO]");
        break;
    }

    Poco::FastMutex::ScopedLock lock(m_mutex);

    if (a_msg == m_previousMessage && m_messageRepeatCount < Log::REPEAT_THRESHOLD)
        m_messageRepeatCount++;
    else
    {
        if (m_messageRepeatCount > 0)
        {
            std::stringstream repeatMessage;
            repeatMessage << "The previous message was repeated "
                << m_messageRepeatCount << " times.";
            logMessage("[INFO]", repeatMessage.str());
        }
        m_previousMessage = a_msg;
        m_messageRepeatCount = 0;
        logMessage(level, a_msg);
    }
}

void Log::logMessage(const std::string& level, const std::string& msg)
{
    Poco::LocalDateTime now;

    std::ostream& outStream = m_outStream.good() && m_outStream.is_open() ? m_outStream : std::cerr;

    outStream << Poco::DateTimeFormatter::format(now, "%m/%d/%y %H:%M:%S")
        << " " << level << " " << msg << Poco::LineEnding::NEWLINE_DEFAULT;
    outStream.flush();
}
