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
 * \file ArxServices.cpp
 * Contains the implementation for the ArxServices class.
 */

#include "ArxServices.h"

ArxServices::ArxServices()
: m_defaultLog(), m_log(&m_defaultLog)
{
}

ArxServices &ArxServices::Instance()
{
    static ArxServices instance;
    return instance;
}

Log& ArxServices::getLog()
{
    return *m_log;
}

void ArxServices::setLog(Log &log)
{
    m_log = &log;
}

void ArxServices::resetLog()
{
    m_log = &m_defaultLog;
}
