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
 * \file ArxImageParser.h
 */

#ifndef _ARX_IMAGEPARSER_H
#define _ARX_IMAGEPARSER_H

#include "arx/parsers/ArxParser.h"

/**
 * Turns staged picture files (from the file system or carved) into
 * content-addressed image records. The format is taken from the file
 * signature, never from the extension.
 */
class ARX_FRAMEWORK_API ArxImageParser : public ArxParser
{
public:
    static const char * ID;

    virtual std::string id() const;
    virtual std::vector<ArxArtifactFamily> families() const;
    virtual ArxParseResult parse(const ArxParseInput& a_input) const;

    /// jpeg, png, gif, bmp, webp, ico, tiff or empty if unrecognized.
    static std::string sniffFormat(const std::string& a_header);
};

#endif
