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
 * \file ArxParser.cpp
 */

#include "ArxParser.h"

// Poco includes
#include "Poco/Path.h"
#include "Poco/JSON/Object.h"

#include <sstream>

namespace
{
    std::string hostPath(const std::string& runDir, const std::string& relPath)
    {
        Poco::Path path(Poco::Path::forDirectory(runDir), Poco::Path(relPath, Poco::Path::PATH_UNIX));
        return path.toString();
    }
}

std::string ArxParseInput::stagedPath() const
{
    return hostPath(runDir, entry.destRelPath);
}

std::string ArxParseInput::companionPath(const std::string& a_role) const
{
    for (size_t i = 0; i < companions.size(); i++)
    {
        if (companions[i].role == a_role && companions[i].status == ArxManifestEntry::STATUS_OK)
            return hostPath(runDir, companions[i].destRelPath);
    }
    return "";
}

ArxRecordSource ArxParseInput::recordSource() const
{
    ArxRecordSource source;
    source.discoveredBy = discoveredBy;
    source.sourcePath = entry.source.logicalPath;
    source.partitionIndex = entry.source.partitionIndex;
    source.browser = entry.source.browser;
    source.profile = entry.source.profile;
    source.manifestRelPath = entry.destRelPath;
    return source;
}

ArxExtractionWarning ArxParser::makeWarning(const ArxParseInput& a_input, const std::string& a_warningType,
    ArxExtractionWarning::Severity a_severity, const std::string& a_category,
    const std::string& a_itemName, const std::string& a_itemValue, const std::string& a_contextJson)
{
    ArxExtractionWarning warning;
    warning.warningType = a_warningType;
    warning.severity = a_severity;
    warning.category = a_category;
    warning.itemName = a_itemName;
    warning.itemValue = a_itemValue;
    warning.contextJson = a_contextJson;
    warning.artifactType = a_input.artifactType;
    warning.sourceFile = a_input.entry.source.logicalPath;
    return warning;
}

ArxExtractionWarning ArxParser::errorWarning(const ArxParseInput& a_input, const ArxParseError& a_error)
{
    Poco::JSON::Object context;
    context.set("staged_path", a_input.entry.destRelPath);
    std::ostringstream json;
    context.stringify(json);

    return makeWarning(a_input, a_error.warningType, ArxExtractionWarning::ERROR, a_error.category,
        a_input.entry.destFilename, a_error.message, json.str());
}

void ArxParser::reportUnknownNames(const ArxParseInput& a_input, ArxParseResult& a_result,
    const std::set<std::string>& a_actual, const std::set<std::string>& a_known,
    const std::string& a_warningType, const std::string& a_category, const std::string& a_container)
{
    for (std::set<std::string>::const_iterator name = a_actual.begin(); name != a_actual.end(); ++name)
    {
        if (a_known.count(*name))
            continue;

        Poco::JSON::Object context;
        context.set("container", a_container);
        std::ostringstream json;
        context.stringify(json);

        a_result.warnings.push_back(makeWarning(a_input, a_warningType, ArxExtractionWarning::INFO,
            a_category, *name, "", json.str()));
    }
}
