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
 * \file ArxParserRegistry.cpp
 */

#include "ArxParserRegistry.h"
#include "ArxCache2Parser.h"
#include "ArxChromiumHistoryParser.h"
#include "ArxFirefoxBookmarkBackupParser.h"
#include "ArxFirefoxHistoryParser.h"
#include "ArxImageParser.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"

#include <sstream>

ArxParserRegistry::ArxParserRegistry()
{
    add<ArxChromiumHistoryParser>(ArxChromiumHistoryParser::ID);
    add<ArxFirefoxHistoryParser>(ArxFirefoxHistoryParser::ID);
    add<ArxCache2Parser>(ArxCache2Parser::ID);
    add<ArxFirefoxBookmarkBackupParser>(ArxFirefoxBookmarkBackupParser::ID);
    add<ArxImageParser>(ArxImageParser::ID);
}

bool ArxParserRegistry::has(const std::string& a_id) const
{
    return m_factory.isClass(a_id);
}

std::unique_ptr<ArxParser> ArxParserRegistry::create(const std::string& a_id) const
{
    if (!m_factory.isClass(a_id))
    {
        std::ostringstream msg;
        msg << "ArxParserRegistry::create - no parser named " << a_id;
        LOGERROR(msg.str());
        throw ArxConfigurationException(msg.str());
    }
    return std::unique_ptr<ArxParser>(m_factory.createInstance(a_id));
}

void ArxParserRegistry::throwDuplicate(const std::string& a_id)
{
    std::ostringstream msg;
    msg << "ArxParserRegistry::add - parser " << a_id << " is already registered";
    LOGERROR(msg.str());
    throw ArxConfigurationException(msg.str());
}
