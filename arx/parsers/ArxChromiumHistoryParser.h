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
 * \file ArxChromiumHistoryParser.h
 */

#ifndef _ARX_CHROMIUMHISTORYPARSER_H
#define _ARX_CHROMIUMHISTORYPARSER_H

#include "arx/parsers/ArxParser.h"

/**
 * Per-visit records from a Chromium History database (Chrome, Edge,
 * Brave, Opera share the schema). Visit times are WebKit timestamps and
 * are converted with ArxTimestamps::webkitToUtc.
 */
class ARX_FRAMEWORK_API ArxChromiumHistoryParser : public ArxParser
{
public:
    static const char * ID;

    virtual std::string id() const;
    virtual std::vector<ArxArtifactFamily> families() const;
    virtual ArxParseResult parse(const ArxParseInput& a_input) const;

    /// Name of the core transition type (low byte), or empty if unknown.
    static std::string transitionName(int64_t a_transition);
};

#endif
