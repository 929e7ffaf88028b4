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
 * \file ArxParser.h
 * Contains the interface every format parser implements.
 */

#ifndef _ARX_PARSER_H
#define _ARX_PARSER_H

#include <set>
#include <string>
#include <vector>

#include "arx/framework_i.h"
#include "arx/extraction/ArxManifestEntry.h"
#include "arx/records/ArxRecords.h"
#include "arx/utilities/ArxResult.h"

/**
 * One staged file handed to a parser, with the companions staged in the
 * same group.
 */
struct ARX_FRAMEWORK_API ArxParseInput
{
    ArxManifestEntry entry;
    std::vector<ArxManifestEntry> companions;
    /// Run directory the manifest paths are relative to.
    std::string runDir;
    std::string artifactType;
    /// Extractor name recorded as discovered_by on every record.
    std::string discoveredBy;

    /// Host path of the staged primary file.
    std::string stagedPath() const;

    /// Host path of the companion with the given role, or empty.
    std::string companionPath(const std::string& a_role) const;

    ArxRecordSource recordSource() const;
};

/**
 * Records and warnings produced from one staged file.
 */
struct ARX_FRAMEWORK_API ArxParseResult
{
    ArxParseResult() : failedRecords(0) {}

    std::vector<ArxParsedRecord> records;
    ArxWarningList warnings;
    /// Records that were recognized but could not be decoded.
    size_t failedRecords;
};

/**
 * Interface for format parsers. A parser is a pure function of the bytes
 * of the staged file and its declared companions: it never writes next to
 * them, and it reports malformed input as warnings instead of throwing.
 */
class ARX_FRAMEWORK_API ArxParser
{
public:
    virtual ~ArxParser() {}

    /// Identifier used in pipeline_config.xml.
    virtual std::string id() const = 0;

    /// Families of the records this parser produces.
    virtual std::vector<ArxArtifactFamily> families() const = 0;

    virtual ArxParseResult parse(const ArxParseInput& a_input) const = 0;

protected:
    static ArxExtractionWarning makeWarning(const ArxParseInput& a_input, const std::string& a_warningType,
        ArxExtractionWarning::Severity a_severity, const std::string& a_category,
        const std::string& a_itemName, const std::string& a_itemValue, const std::string& a_contextJson = "");

    /// Turns an expected parse failure into an error severity warning.
    static ArxExtractionWarning errorWarning(const ArxParseInput& a_input, const ArxParseError& a_error);

    /**
     * Adds an info warning for every name in a_actual that is not in
     * a_known (unknown tables, columns or keys).
     * @param a_container Table or object the names belong to, stored in
     * the warning context.
     */
    static void reportUnknownNames(const ArxParseInput& a_input, ArxParseResult& a_result,
        const std::set<std::string>& a_actual, const std::set<std::string>& a_known,
        const std::string& a_warningType, const std::string& a_category, const std::string& a_container);
};

#endif
