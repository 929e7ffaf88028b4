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
 * \file ArxPatternSet.cpp
 * Loads artifact_patterns.xml.
 */

#include "ArxPatternSet.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxUtilities.h"

// Poco includes
#include "Poco/AutoPtr.h"
#include "Poco/File.h"
#include "Poco/NumberParser.h"
#include "Poco/DOM/DOMParser.h"
#include "Poco/DOM/Document.h"
#include "Poco/DOM/Element.h"
#include "Poco/DOM/NodeList.h"
#include "Poco/DOM/NamedNodeMap.h"
#include "Poco/SAX/InputSource.h"
#include "Poco/SAX/SAXException.h"

#include <fstream>
#include <sstream>

namespace
{
    const std::string ARTIFACT_TYPE_ELEMENT_TAG = "ARTIFACT_TYPE";
    const std::string PATTERN_ELEMENT_TAG = "PATTERN";
    const std::string NAME_ATTRIBUTE = "name";
    const std::string FAMILY_ATTRIBUTE = "family";
    const std::string COMPANIONS_ATTRIBUTE = "companions";
    const std::string BROWSER_ATTRIBUTE = "browser";
    const std::string PROFILE_SEGMENT_ATTRIBUTE = "profileSegment";
    const int DEFAULT_PROFILE_SEGMENT = -2;

    const std::string MSG_PREFIX = "ArxPatternSet::load : ";

    ArxArtifactPattern compilePattern(const Poco::XML::Element * patternDefinition)
    {
        std::string glob = ArxUtilities::stripQuotes(Poco::XML::fromXMLString(patternDefinition->innerText()));
        std::string::size_type first = glob.find_first_not_of(" \t\r\n");
        std::string::size_type last = glob.find_last_not_of(" \t\r\n");
        glob = (first == std::string::npos) ? "" : glob.substr(first, last - first + 1);

        std::string browser = Poco::XML::fromXMLString(patternDefinition->getAttribute(BROWSER_ATTRIBUTE));

        int profileSegment = DEFAULT_PROFILE_SEGMENT;
        const std::string& profileValue = Poco::XML::fromXMLString(patternDefinition->getAttribute(PROFILE_SEGMENT_ATTRIBUTE));
        if (!profileValue.empty() && (!Poco::NumberParser::tryParse(profileValue, profileSegment) || profileSegment > 0))
        {
            std::ostringstream msg;
            msg << MSG_PREFIX << PATTERN_ELEMENT_TAG << " '" << glob << "' has invalid "
                << PROFILE_SEGMENT_ATTRIBUTE << " '" << profileValue << "'";
            throw ArxConfigurationException(msg.str());
        }

        return ArxArtifactPattern(glob, browser, profileSegment);
    }

    ArxArtifactType compileArtifactType(const Poco::XML::Element * typeDefinition)
    {
        ArxArtifactType type;
        type.name = Poco::XML::fromXMLString(typeDefinition->getAttribute(NAME_ATTRIBUTE));
        if (type.name.empty())
            throw ArxConfigurationException(MSG_PREFIX + ARTIFACT_TYPE_ELEMENT_TAG + " element without a name");

        type.family = arxFamilyFromName(Poco::XML::fromXMLString(typeDefinition->getAttribute(FAMILY_ATTRIBUTE)));
        type.companions = ArxPatternSet::companionPolicyFromName(
            Poco::XML::fromXMLString(typeDefinition->getAttribute(COMPANIONS_ATTRIBUTE)));

        Poco::AutoPtr<Poco::XML::NodeList> children = typeDefinition->childNodes();
        for (unsigned long i = 0; i < children->length(); ++i)
        {
            Poco::XML::Node * child = children->item(i);
            if (child->nodeType() != Poco::XML::Node::ELEMENT_NODE)
                continue;

            const std::string& childName = Poco::XML::fromXMLString(child->nodeName());
            if (childName != PATTERN_ELEMENT_TAG)
            {
                std::ostringstream msg;
                msg << MSG_PREFIX << "unrecognized " << ARTIFACT_TYPE_ELEMENT_TAG << " child element '" << childName << "'";
                throw ArxConfigurationException(msg.str());
            }
            type.patterns.push_back(compilePattern(static_cast<Poco::XML::Element *>(child)));
        }

        return type;
    }
}

std::string ArxArtifactPattern::profileOf(const std::string& a_logicalPath) const
{
    if (profileSegment == 0)
        return "";

    std::vector<std::string> segments = ArxUtilities::splitLogicalPath(ArxUtilities::normalizeLogicalPath(a_logicalPath));
    size_t fromEnd = (size_t)(-profileSegment);
    if (fromEnd > segments.size())
        return "";
    return segments[segments.size() - fromEnd];
}

ArxArtifactType::CompanionPolicy ArxPatternSet::companionPolicyFromName(const std::string& a_name)
{
    if (a_name.empty() || a_name == "none")
        return ArxArtifactType::COMPANIONS_NONE;
    if (a_name == "sqlite")
        return ArxArtifactType::COMPANIONS_SQLITE;

    throw ArxConfigurationException("ArxPatternSet - unknown companion policy '" + a_name + "'");
}

ArxPatternSet ArxPatternSet::loadFile(const std::string& a_path)
{
    Poco::File patternFile(a_path);
    if (!patternFile.exists())
        throw ArxConfigurationException(MSG_PREFIX + "pattern file '" + a_path + "' does not exist");

    std::ifstream patternStream(a_path.c_str());
    if (!patternStream)
        throw ArxConfigurationException(MSG_PREFIX + "failed to open pattern file '" + a_path + "'");

    ArxPatternSet patterns = load(patternStream);

    std::ostringstream msg;
    msg << MSG_PREFIX << "loaded " << patterns.m_types.size() << " artifact types from '" << a_path << "'";
    LOGINFO(msg.str());

    return patterns;
}

ArxPatternSet ArxPatternSet::load(std::istream& a_input)
{
    ArxPatternSet patterns;
    try
    {
        Poco::XML::InputSource inputSource(a_input);
        Poco::AutoPtr<Poco::XML::Document> patternDoc = Poco::XML::DOMParser().parse(&inputSource);

        if (patternDoc->documentElement() == NULL)
            throw ArxConfigurationException(MSG_PREFIX + "root element of pattern file is NULL");

        Poco::AutoPtr<Poco::XML::NodeList> typeDefinitions = patternDoc->getElementsByTagName(ARTIFACT_TYPE_ELEMENT_TAG);
        for (unsigned long i = 0; i < typeDefinitions->length(); ++i)
        {
            ArxArtifactType type = compileArtifactType(static_cast<Poco::XML::Element *>(typeDefinitions->item(i)));
            if (patterns.hasArtifactType(type.name))
                throw ArxConfigurationException(MSG_PREFIX + "duplicate artifact type '" + type.name + "'");
            patterns.addArtifactType(type);
        }
    }
    catch (Poco::Exception& ex)
    {
        throw ArxConfigurationException(MSG_PREFIX + "Poco::Exception: " + ex.displayText());
    }

    return patterns;
}

void ArxPatternSet::addArtifactType(const ArxArtifactType& a_type)
{
    if (a_type.patterns.empty())
        throw ArxConfigurationException("ArxPatternSet - artifact type '" + a_type.name + "' has no patterns");

    m_types.erase(a_type.name);
    m_types.insert(std::make_pair(a_type.name, a_type));
}

const ArxArtifactType& ArxPatternSet::artifactType(const std::string& a_name) const
{
    std::map<std::string, ArxArtifactType>::const_iterator it = m_types.find(a_name);
    if (it == m_types.end())
        throw ArxConfigurationException("ArxPatternSet - unknown artifact type '" + a_name + "'");
    return it->second;
}

bool ArxPatternSet::hasArtifactType(const std::string& a_name) const
{
    return m_types.find(a_name) != m_types.end();
}

std::vector<std::string> ArxPatternSet::artifactTypeNames() const
{
    std::vector<std::string> names;
    for (std::map<std::string, ArxArtifactType>::const_iterator it = m_types.begin(); it != m_types.end(); ++it)
        names.push_back(it->first);
    return names;
}
