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
 * \file ArxFirefoxBookmarkBackupParser.h
 */

#ifndef _ARX_FIREFOXBOOKMARKBACKUPPARSER_H
#define _ARX_FIREFOXBOOKMARKBACKUPPARSER_H

#include "arx/parsers/ArxParser.h"

#include "Poco/JSON/Object.h"

/**
 * Bookmarks from Firefox bookmarkbackups/*.jsonlz4 files: a mozLz4
 * container around the JSON bookmark tree. dateAdded and lastModified
 * are PRTime values (ArxTimestamps::prtimeToUtc).
 */
class ARX_FRAMEWORK_API ArxFirefoxBookmarkBackupParser : public ArxParser
{
public:
    static const char * ID;

    virtual std::string id() const;
    virtual std::vector<ArxArtifactFamily> families() const;
    virtual ArxParseResult parse(const ArxParseInput& a_input) const;

    /// Parses the decompressed JSON document.
    ArxParseResult parseJson(const ArxParseInput& a_input, const std::string& a_json) const;

private:
    void walk(const ArxParseInput& a_input, const Poco::JSON::Object::Ptr& a_node, const std::string& a_parentPath,
        size_t a_depth, ArxParseResult& a_result, std::set<std::string>& a_unknownKeys,
        std::set<std::string>& a_unknownTypes) const;
};

#endif
