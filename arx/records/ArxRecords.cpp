/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "ArxRecords.h"
#include "arx/utilities/ArxException.h"

const char * arxFamilyName(ArxArtifactFamily a_family)
{
    switch (a_family) {
    case ARX_FAMILY_HISTORY:
        return "history";
    case ARX_FAMILY_BOOKMARK:
        return "bookmarks";
    case ARX_FAMILY_CACHE:
        return "cache";
    case ARX_FAMILY_IMAGE:
        return "images";
    }
    return "unknown";
}

ArxArtifactFamily arxFamilyFromName(const std::string& a_name)
{
    if (a_name == "history")
        return ARX_FAMILY_HISTORY;
    if (a_name == "bookmarks")
        return ARX_FAMILY_BOOKMARK;
    if (a_name == "cache")
        return ARX_FAMILY_CACHE;
    if (a_name == "images")
        return ARX_FAMILY_IMAGE;
    throw ArxConfigurationException("Unknown artifact family: " + a_name);
}

ArxArtifactFamily arxFamilyOf(const ArxParsedRecord& a_record)
{
    switch (a_record.index()) {
    case 0:
        return ARX_FAMILY_HISTORY;
    case 1:
        return ARX_FAMILY_BOOKMARK;
    case 2:
        return ARX_FAMILY_CACHE;
    default:
        return ARX_FAMILY_IMAGE;
    }
}

const char * ArxExtractionWarning::severityName(Severity a_severity)
{
    switch (a_severity) {
    case INFO:
        return "info";
    case WARNING:
        return "warning";
    case ERROR:
        return "error";
    }
    return "warning";
}
