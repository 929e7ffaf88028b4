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
 * \file ArxFirefoxHistoryParser.h
 */

#ifndef _ARX_FIREFOXHISTORYPARSER_H
#define _ARX_FIREFOXHISTORYPARSER_H

#include "arx/parsers/ArxParser.h"

/**
 * Per-visit records from Firefox places.sqlite (moz_historyvisits joined
 * with moz_places). Visit dates are PRTime and are converted with
 * ArxTimestamps::prtimeToUtc.
 */
class ARX_FRAMEWORK_API ArxFirefoxHistoryParser : public ArxParser
{
public:
    static const char * ID;

    virtual std::string id() const;
    virtual std::vector<ArxArtifactFamily> families() const;
    virtual ArxParseResult parse(const ArxParseInput& a_input) const;

    /// LINK, TYPED, ... for a visit_type, or empty if unknown.
    static std::string visitTypeName(int64_t a_visitType);
};

#endif
