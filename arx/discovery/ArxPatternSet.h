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
 * \file ArxPatternSet.h
 * Contains the declarative artifact type to path glob tables.
 */

#ifndef _ARX_PATTERNSET_H
#define _ARX_PATTERNSET_H

#include <istream>
#include <map>
#include <string>
#include <vector>

#include "arx/framework_i.h"
#include "arx/discovery/ArxPathMatcher.h"
#include "arx/records/ArxRecords.h"

/**
 * One glob of an artifact type.
 */
struct ARX_FRAMEWORK_API ArxArtifactPattern
{
    ArxArtifactPattern(const std::string& a_glob, const std::string& a_browser, int a_profileSegment)
        : matcher(a_glob), browser(a_browser), profileSegment(a_profileSegment) {}

    ArxPathMatcher matcher;
    std::string browser;
    /**
     * Path segment holding the profile name, counted from the end of the
     * path (-1 is the file name). 0 means the pattern has no profile.
     */
    int profileSegment;

    /// The profile segment of a matching path, or "" if there is none.
    std::string profileOf(const std::string& a_logicalPath) const;
};

/**
 * An artifact type and its patterns, as declared in artifact_patterns.xml.
 */
struct ARX_FRAMEWORK_API ArxArtifactType
{
    /// Companion files the staging engine copies alongside each primary.
    enum CompanionPolicy {
        COMPANIONS_NONE,
        COMPANIONS_SQLITE    ///< -wal, -journal and -shm
    };

    ArxArtifactType() : family(ARX_FAMILY_HISTORY), companions(COMPANIONS_NONE) {}

    std::string name;
    ArxArtifactFamily family;
    CompanionPolicy companions;
    std::vector<ArxArtifactPattern> patterns;
};

/**
 * The set of known artifact types. Loaded once from the pattern file and
 * shared read-only afterwards.
 *
 * File layout:
 * \verbatim
   <ARTIFACT_PATTERNS>
     <ARTIFACT_TYPE name="chromium_history" family="history" companions="sqlite">
       <PATTERN browser="chrome" profileSegment="-2">Users/ * /AppData/Local/Google/Chrome/User Data/ * /History</PATTERN>
     </ARTIFACT_TYPE>
   </ARTIFACT_PATTERNS>
   \endverbatim
 */
class ARX_FRAMEWORK_API ArxPatternSet
{
public:
    /// @throws ArxConfigurationException on a missing or malformed file.
    static ArxPatternSet loadFile(const std::string& a_path);
    /// @throws ArxConfigurationException on malformed content.
    static ArxPatternSet load(std::istream& a_input);

    /// @throws ArxConfigurationException if the type is unknown.
    const ArxArtifactType& artifactType(const std::string& a_name) const;
    bool hasArtifactType(const std::string& a_name) const;
    std::vector<std::string> artifactTypeNames() const;

    /// Adds or replaces a type. Throws ArxConfigurationException if it has no patterns.
    void addArtifactType(const ArxArtifactType& a_type);

    static ArxArtifactType::CompanionPolicy companionPolicyFromName(const std::string& a_name);

private:
    std::map<std::string, ArxArtifactType> m_types;
};

#endif
