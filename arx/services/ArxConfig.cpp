/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "ArxConfig.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxUtilities.h"

#include "Poco/Util/XMLConfiguration.h"
#include "Poco/Util/MapConfiguration.h"
#include "Poco/Path.h"
#include "Poco/File.h"
#include "Poco/NumberParser.h"
#include "Poco/Exception.h"

#include <sstream>

const char * ArxConfigLoader::OUT_DIR = "OUT_DIR";
const char * ArxConfigLoader::CONFIG_DIR = "CONFIG_DIR";
const char * ArxConfigLoader::PATTERN_FILE = "PATTERN_FILE";
const char * ArxConfigLoader::PIPELINE_FILE = "PIPELINE_FILE";
const char * ArxConfigLoader::DB_PATH = "DB_PATH";
const char * ArxConfigLoader::LOG_FILE = "LOG_FILE";
const char * ArxConfigLoader::EXTRACTION_WORKERS = "EXTRACTION_WORKERS";
const char * ArxConfigLoader::COPY_BUFFER_SIZE = "COPY_BUFFER_SIZE";
const char * ArxConfigLoader::USE_FILE_INDEX = "USE_FILE_INDEX";
const char * ArxConfigLoader::REPLACE_SCOPE = "REPLACE_SCOPE";
const char * ArxConfigLoader::TOOL_TIMEOUT_SECONDS = "TOOL_TIMEOUT_SECONDS";
const char * ArxConfigLoader::SCALPEL_CONFIG_FILE = "SCALPEL_CONFIG_FILE";
const char * ArxConfigLoader::TOOLS = "TOOLS";

const size_t ArxConfigLoader::MAX_RECURSION_DEPTH = 10;

namespace
{
    const std::string sep(1, Poco::Path::separator());

    // Defaults are written in terms of other properties.
    std::string defaultValue(const std::string& name)
    {
        if (name == ArxConfigLoader::PATTERN_FILE)
            return "#CONFIG_DIR#" + sep + "artifact_patterns.xml";
        if (name == ArxConfigLoader::PIPELINE_FILE)
            return "#CONFIG_DIR#" + sep + "pipeline_config.xml";
        if (name == ArxConfigLoader::DB_PATH)
            return "#OUT_DIR#" + sep + "arx.db";
        if (name == ArxConfigLoader::LOG_FILE)
            return "#OUT_DIR#" + sep + "logs" + sep + "arx.log";
        if (name == ArxConfigLoader::EXTRACTION_WORKERS)
            return "4";
        if (name == ArxConfigLoader::COPY_BUFFER_SIZE)
            return "65536";
        if (name == ArxConfigLoader::USE_FILE_INDEX)
            return "true";
        if (name == ArxConfigLoader::REPLACE_SCOPE)
            return "extractor";
        if (name == ArxConfigLoader::TOOL_TIMEOUT_SECONDS)
            return "0";
        if (name == ArxConfigLoader::SCALPEL_CONFIG_FILE)
            return "#SCALPEL_DIR#" + sep + "scalpel.conf";
        return "";
    }

    bool isMacroName(const std::string& token)
    {
        if (token.empty())
            return false;
        for (size_t i = 0; i < token.size(); ++i)
        {
            char c = token[i];
            if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_'))
                return false;
        }
        return true;
    }
}

ArxConfig::ArxConfig()
: extractionWorkers(4), copyBufferSize(65536), useFileIndex(true),
  replaceScope(REPLACE_BY_EXTRACTOR), toolTimeoutSeconds(0)
{
}

std::string ArxConfig::toolDir(const std::string& tool) const
{
    std::map<std::string, std::string>::const_iterator it = toolDirs.find(ArxUtilities::toLowerAscii(tool));
    return it == toolDirs.end() ? std::string() : it->second;
}

ArxConfigLoader::ArxConfigLoader()
: m_config(new Poco::Util::MapConfiguration())
{
}

void ArxConfigLoader::loadFile(const std::string& configFile)
{
    if (!Poco::File(configFile).exists())
        throw ArxConfigurationException("Configuration file not found : " + configFile);

    Poco::AutoPtr<Poco::Util::XMLConfiguration> xmlConfig;
    try
    {
        xmlConfig = new Poco::Util::XMLConfiguration(configFile);
    }
    catch (Poco::Exception& ex)
    {
        throw ArxConfigurationException("Error loading configuration file " + configFile + ": " + ex.displayText());
    }

    // Properties that were set programmatically win over the file.
    Poco::Util::AbstractConfiguration::Keys keys;
    m_config->keys(keys);
    for (Poco::Util::AbstractConfiguration::Keys::const_iterator it = keys.begin(); it != keys.end(); ++it)
    {
        if (m_config->hasProperty(*it))
            xmlConfig->setString(*it, m_config->getRawString(*it));
    }
    Poco::Util::AbstractConfiguration::Keys toolKeys;
    m_config->keys(TOOLS, toolKeys);
    for (Poco::Util::AbstractConfiguration::Keys::const_iterator it = toolKeys.begin(); it != toolKeys.end(); ++it)
    {
        std::string key = std::string(TOOLS) + "." + *it;
        xmlConfig->setString(key, m_config->getRawString(key));
    }

    m_config = xmlConfig;
    m_fileDir = Poco::Path(configFile).makeAbsolute().parent().toString();
    if (!m_fileDir.empty() && m_fileDir[m_fileDir.size() - 1] == Poco::Path::separator())
        m_fileDir.erase(m_fileDir.size() - 1);
}

void ArxConfigLoader::set(const std::string& name, const std::string& value)
{
    m_config->setString(name, value);
}

std::string ArxConfigLoader::getRaw(const std::string& name) const
{
    try
    {
        if (m_config->hasProperty(name))
            return m_config->getRawString(name);

        std::string toolKey = std::string(TOOLS) + "." + name;
        if (m_config->hasProperty(toolKey))
            return m_config->getRawString(toolKey);
    }
    catch (Poco::Exception& ex)
    {
        throw ArxConfigurationException("Cannot read property " + name + ": " + ex.displayText());
    }

    if (name == CONFIG_DIR && !m_fileDir.empty())
        return m_fileDir;

    return defaultValue(name);
}

std::string ArxConfigLoader::get(const std::string& name) const
{
    return expandMacros(getRaw(name));
}

std::string ArxConfigLoader::expandMacros(const std::string& input) const
{
    std::string output;
    expandMacros(input, output, 1);
    return output;
}

void ArxConfigLoader::expandMacros(const std::string& input, std::string& output, size_t depth) const
{
    if (depth > MAX_RECURSION_DEPTH)
    {
        std::stringstream msg;
        msg << "ArxConfigLoader::expandMacros : reached maximum depth (" << MAX_RECURSION_DEPTH
            << ") of recursion, cannot complete expansion of " << input;
        throw ArxConfigurationException(msg.str());
    }

    size_t pos = 0;
    while (pos < input.size())
    {
        size_t open = input.find('#', pos);
        if (open == std::string::npos)
        {
            output.append(input, pos, std::string::npos);
            return;
        }
        size_t close = input.find('#', open + 1);
        if (close == std::string::npos)
        {
            output.append(input, pos, std::string::npos);
            return;
        }

        std::string token = input.substr(open + 1, close - open - 1);
        output.append(input, pos, open - pos);
        if (isMacroName(token))
        {
            expandMacros(getRaw(token), output, depth + 1);
            pos = close + 1;
        }
        else
        {
            // Not a macro; keep the first '#' and rescan from the second one.
            output.push_back('#');
            pos = open + 1;
        }
    }
}

unsigned int ArxConfigLoader::getUnsigned(const std::string& name, unsigned int minValue, unsigned int maxValue) const
{
    std::string text = get(name);
    unsigned int value = 0;
    if (!Poco::NumberParser::tryParseUnsigned(text, value) || value < minValue || value > maxValue)
    {
        std::stringstream msg;
        msg << "Invalid value '" << text << "' for " << name << ", expected an integer in ["
            << minValue << ", " << maxValue << "]";
        throw ArxConfigurationException(msg.str());
    }
    return value;
}

ArxConfig ArxConfigLoader::build() const
{
    ArxConfig config;

    config.outDir = get(OUT_DIR);
    if (config.outDir.empty())
        throw ArxConfigurationException("Required property OUT_DIR is not set");

    config.configDir = get(CONFIG_DIR);
    config.patternFile = get(PATTERN_FILE);
    config.pipelineFile = get(PIPELINE_FILE);
    config.databasePath = get(DB_PATH);
    config.logFile = get(LOG_FILE);

    config.extractionWorkers = getUnsigned(EXTRACTION_WORKERS, 1, 64);
    config.copyBufferSize = getUnsigned(COPY_BUFFER_SIZE, 4096, 64 * 1024 * 1024);
    config.toolTimeoutSeconds = getUnsigned(TOOL_TIMEOUT_SECONDS, 0, 7 * 24 * 3600);

    bool useIndex = true;
    if (!Poco::NumberParser::tryParseBool(get(USE_FILE_INDEX), useIndex))
        throw ArxConfigurationException("Invalid boolean value for USE_FILE_INDEX: " + get(USE_FILE_INDEX));
    config.useFileIndex = useIndex;

    std::string scope = ArxUtilities::toLowerAscii(get(REPLACE_SCOPE));
    if (scope == "extractor")
        config.replaceScope = ArxConfig::REPLACE_BY_EXTRACTOR;
    else if (scope == "run")
        config.replaceScope = ArxConfig::REPLACE_BY_RUN;
    else
        throw ArxConfigurationException("Invalid REPLACE_SCOPE '" + scope + "', expected 'extractor' or 'run'");

    Poco::Util::AbstractConfiguration::Keys toolKeys;
    m_config->keys(TOOLS, toolKeys);
    for (Poco::Util::AbstractConfiguration::Keys::const_iterator it = toolKeys.begin(); it != toolKeys.end(); ++it)
    {
        const std::string& key = *it;
        const std::string suffix = "_DIR";
        if (key.size() <= suffix.size() || key.compare(key.size() - suffix.size(), suffix.size(), suffix) != 0)
            throw ArxConfigurationException("Tool properties must be named <TOOL>_DIR: " + key);

        std::string tool = ArxUtilities::toLowerAscii(key.substr(0, key.size() - suffix.size()));
        config.toolDirs[tool] = get(key);
    }

    if (!config.toolDir("scalpel").empty())
        config.scalpelConfigFile = get(SCALPEL_CONFIG_FILE);

    return config;
}
