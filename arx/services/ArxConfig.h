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
 * \file ArxConfig.h
 * Run configuration and the loader that builds it from an XML file.
 */

#ifndef _ARX_CONFIG_H
#define _ARX_CONFIG_H

#include <map>
#include <string>

#include "arx/framework_i.h"
#include "Poco/AutoPtr.h"
#include "Poco/Util/AbstractConfiguration.h"

/**
 * Settings for one engine instance. Built once by ArxConfigLoader (or by
 * hand in tests) and passed by reference to discovery, staging, parsing,
 * ingestion and the pipeline. Nothing reads settings from global state.
 */
struct ARX_FRAMEWORK_API ArxConfig
{
    /// Which prior rows an ingestion replaces.
    enum ReplaceScope {
        REPLACE_BY_EXTRACTOR, ///< every row of (evidence, extractor)
        REPLACE_BY_RUN        ///< only rows of (evidence, run)
    };

    ArxConfig();

    std::string outDir;
    std::string configDir;
    std::string patternFile;
    std::string pipelineFile;
    std::string databasePath;
    std::string logFile;

    unsigned int extractionWorkers;
    size_t copyBufferSize;
    bool useFileIndex;
    ReplaceScope replaceScope;

    /// Lower case tool name ("scalpel") to its install directory.
    std::map<std::string, std::string> toolDirs;
    std::string scalpelConfigFile;

    /// Zero disables the timeout.
    unsigned int toolTimeoutSeconds;

    /// Directory of a tool, or empty if it is not configured.
    std::string toolDir(const std::string& tool) const;
};

/**
 * Reads ARX_CONFIG XML documents through Poco::Util::XMLConfiguration:
 *
 * \verbatim
 <ARX_CONFIG>
     <OUT_DIR>/cases/42/output</OUT_DIR>
     <DB_PATH>#OUT_DIR#/arx.db</DB_PATH>
     <EXTRACTION_WORKERS>4</EXTRACTION_WORKERS>
     <TOOLS>
         <SCALPEL_DIR>/opt/scalpel</SCALPEL_DIR>
     </TOOLS>
 </ARX_CONFIG>
 \endverbatim
 *
 * Values may reference other properties as #NAME#. Unset properties fall
 * back to defaults that are themselves written in terms of OUT_DIR and
 * CONFIG_DIR.
 */
class ARX_FRAMEWORK_API ArxConfigLoader
{
public:
    /// Property names understood by the loader.
    static const char * OUT_DIR;
    static const char * CONFIG_DIR;
    static const char * PATTERN_FILE;
    static const char * PIPELINE_FILE;
    static const char * DB_PATH;
    static const char * LOG_FILE;
    static const char * EXTRACTION_WORKERS;
    static const char * COPY_BUFFER_SIZE;
    static const char * USE_FILE_INDEX;
    static const char * REPLACE_SCOPE;
    static const char * TOOL_TIMEOUT_SECONDS;
    static const char * SCALPEL_CONFIG_FILE;
    static const char * TOOLS;

    /// Starts from an empty in-memory configuration.
    ArxConfigLoader();

    /**
     * Load properties from an XML file. CONFIG_DIR defaults to the
     * directory containing the file.
     * @throws ArxConfigurationException if the file is missing or malformed.
     */
    void loadFile(const std::string& configFile);

    /// Set (or override) a property.
    void set(const std::string& name, const std::string& value);

    /// Returns the macro expanded value, the default, or an empty string.
    std::string get(const std::string& name) const;

    /// Expand #NAME# references in the input string.
    std::string expandMacros(const std::string& input) const;

    /**
     * Validate and convert the properties.
     * @throws ArxConfigurationException on a missing OUT_DIR or an
     * invalid value.
     */
    ArxConfig build() const;

private:
    static const size_t MAX_RECURSION_DEPTH;

    std::string getRaw(const std::string& name) const;
    void expandMacros(const std::string& input, std::string& output, size_t depth) const;
    unsigned int getUnsigned(const std::string& name, unsigned int minValue, unsigned int maxValue) const;

    Poco::AutoPtr<Poco::Util::AbstractConfiguration> m_config;
    std::string m_fileDir;
};

#endif
