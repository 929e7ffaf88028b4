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
 * \file ArxServices.h
 * Contains the interface for the ArxServices class.
 */

#ifndef _ARX_SERVICES_H
#define _ARX_SERVICES_H

#include "Log.h"

/**
 * Provides singleton access to the process log. Configuration, storage
 * and evidence handles are not registered here; they are passed
 * explicitly to the components that use them.
 */
class ARX_FRAMEWORK_API ArxServices
{
public:
    static ArxServices &Instance();

    /**
     * Return the system log service. The default log writes to stderr
     * until setLog() is called or the default log is opened.
     */
    Log& getLog();

    /**
     * Register a log implementation. The caller keeps ownership and must
     * keep it alive until another log is registered or resetLog() is called.
     */
    void setLog(Log &log);

    /// Return to the built-in default log.
    void resetLog();

private:
    // Private constructor, copy constructor and assignment operator
    // to prevent creation of multiple instances.
    ArxServices();
    ArxServices(ArxServices const&);
    ArxServices& operator=(ArxServices const&);

    ~ArxServices() {};

    // Default log instance that is used until ArxServices::setLog() is called.
    Log m_defaultLog;
    Log *m_log;
};

#endif
