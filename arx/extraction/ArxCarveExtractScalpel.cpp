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
 * \file ArxCarveExtractScalpel.cpp
 */

#include "ArxCarveExtractScalpel.h"
#include "arx/run/ArxToolRunner.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxHashCalculator.h"
#include "arx/utilities/ArxUtilities.h"

// Poco includes
#include "Poco/File.h"
#include "Poco/Path.h"
#include "Poco/StringTokenizer.h"
#include "Poco/NumberParser.h"
#include "Poco/Exception.h"

#include <fstream>
#include <sstream>

namespace
{
#ifdef _WIN32
    const std::string SCALPEL_EXE_FILE_NAME = "scalpel.exe";
#else
    const std::string SCALPEL_EXE_FILE_NAME = "scalpel";
#endif
    const std::string CARVED_FILES_FOLDER = "carved";
    const std::string SCALPEL_RESULTS_FILE_NAME = "audit.txt";
    const std::string STD_OUT_DUMP_FILE_NAME = "scalpel_stdout";
    const std::string STD_ERR_DUMP_FILE_NAME = "scalpel_stderr";
}

ArxCarveExtractScalpel::ArxCarveExtractScalpel(const ArxConfig& a_config, ArxRunTracker * a_tracker, ArxImgDB * a_db)
: m_config(a_config), m_tracker(a_tracker), m_db(a_db)
{
}

std::string ArxCarveExtractScalpel::scalpelExecutable() const
{
    std::string scalpelDirPath = m_config.toolDir("scalpel");
    if (scalpelDirPath.empty())
        throw ArxConfigurationException("ArxCarveExtractScalpel::scalpelExecutable : Scalpel directory not set");

    Poco::Path exePath = Poco::Path::forDirectory(scalpelDirPath);
    exePath.setFileName(SCALPEL_EXE_FILE_NAME);
    if (!Poco::File(exePath).exists())
    {
        std::stringstream msg;
        msg << "ArxCarveExtractScalpel::scalpelExecutable : Scalpel executable '" << exePath.toString() << "' does not exist";
        throw ArxConfigurationException(msg.str());
    }
    return exePath.toString();
}

std::vector<ArxCarveExtractScalpel::CarvedFile> ArxCarveExtractScalpel::parseCarvingResults(std::istream& a_results)
{
    std::vector<CarvedFile> carvedFiles;

    // Discard all of the file up to and including the header for the carved files list.
    std::string line;
    while (std::getline(a_results, line) && line.find("Extracted From") == std::string::npos);

    const std::size_t numberOfFileFields = 5;
    while (std::getline(a_results, line))
    {
        Poco::StringTokenizer tokenizer(line, "\t ", Poco::StringTokenizer::TOK_IGNORE_EMPTY | Poco::StringTokenizer::TOK_TRIM);
        if (tokenizer.count() != numberOfFileFields)
        {
            // No more files in the files list.
            break;
        }

        CarvedFile file;
        file.name = tokenizer[0];
        Poco::UInt64 offset = 0;
        Poco::UInt64 length = 0;
        if (!Poco::NumberParser::tryParseUnsigned64(tokenizer[1], offset) ||
            !Poco::NumberParser::tryParseUnsigned64(tokenizer[3], length))
        {
            LOGWARN("ArxCarveExtractScalpel::parseCarvingResults : malformed results line '" + line + "'");
            continue;
        }
        file.offset = offset;
        file.length = length;
        carvedFiles.push_back(file);
    }

    return carvedFiles;
}

ArxStagingResult ArxCarveExtractScalpel::carve(const std::string& a_inputPath, const ArxCandidateArtifact& a_source,
    const ArxStagingRequest& a_request, const ArxCancellationToken& a_cancel, const std::string& a_label)
{
    if (!Poco::File(m_config.scalpelConfigFile).exists())
    {
        std::stringstream msg;
        msg << "ArxCarveExtractScalpel::carve : Scalpel config file '" << m_config.scalpelConfigFile << "' does not exist";
        throw ArxConfigurationException(msg.str());
    }

    ArxStagingResult result;
    result.runDir = ArxStagingEngine::runDirectory(m_config.outDir, a_request.evidenceId,
        a_request.extractorName, a_request.runId);

    Poco::Path runPath = Poco::Path::forDirectory(result.runDir);
    Poco::Path outputFolder(runPath);
    outputFolder.pushDirectory(CARVED_FILES_FOLDER);
    std::string carvedRelDir = CARVED_FILES_FOLDER;
    std::string logSuffix;
    if (!a_label.empty())
    {
        outputFolder.pushDirectory(a_label);
        carvedRelDir += "/" + a_label;
        logSuffix = "_" + a_label;
        try
        {
            Poco::File(outputFolder.parent()).createDirectories();
        }
        catch (Poco::Exception& ex)
        {
            throw ArxStorageUnavailableException("ArxCarveExtractScalpel::carve : " + ex.displayText());
        }
    }
    Poco::Path logFolder(runPath);
    logFolder.pushDirectory("logs");

    ArxToolInvocation invocation;
    invocation.task = "carve";
    invocation.executable = scalpelExecutable();
    invocation.stdoutPath = Poco::Path(logFolder, STD_OUT_DUMP_FILE_NAME + logSuffix + ".txt").toString();
    invocation.stderrPath = Poco::Path(logFolder, STD_ERR_DUMP_FILE_NAME + logSuffix + ".txt").toString();
    invocation.timeoutSeconds = m_config.toolTimeoutSeconds;

    // Config file, nested headers and footers, no per-type subfolders.
    invocation.args.push_back("-c");
    invocation.args.push_back(m_config.scalpelConfigFile);
    invocation.args.push_back("-e");
    invocation.args.push_back("-o");
    invocation.args.push_back(outputFolder.toString());
    invocation.args.push_back("-O");
    invocation.args.push_back(a_inputPath);

    ArxToolRunner runner(m_tracker, a_request.runId);
    ArxToolResult toolResult = runner.run(invocation, a_cancel);

    std::vector<CarvedFile> carvedFiles;
    Poco::Path resultsPath(outputFolder, SCALPEL_RESULTS_FILE_NAME);
    std::ifstream resultsStream(resultsPath.toString().c_str());
    if (resultsStream)
    {
        carvedFiles = parseCarvingResults(resultsStream);
    }
    else
    {
        LOGWARN("ArxCarveExtractScalpel::carve : no carving results file at " + resultsPath.toString());
    }

    ArxManifestSink sink(m_db, a_request.runId, a_request.extractorName);
    for (std::vector<CarvedFile>::const_iterator file = carvedFiles.begin(); file != carvedFiles.end(); ++file)
    {
        ArxManifestEntry entry;
        entry.source = a_source;
        entry.destRelPath = carvedRelDir + "/" + file->name;
        entry.destFilename = ArxUtilities::baseName(file->name);
        entry.logicalGroup = entry.destRelPath;
        entry.role = "carved";
        entry.sourceOffsetBytes = (int64_t)file->offset;
        entry.extractedAt = ArxUtilities::utcNowIso();

        // A file named in the audit may not exist if Scalpel was killed
        // while writing it.
        Poco::Path carvedPath(outputFolder, Poco::Path(file->name, Poco::Path::PATH_UNIX));
        try
        {
            ArxFileDigest digest = ArxHashCalculator::hashFile(carvedPath.toString());
            if (digest.bytes != file->length)
            {
                entry.status = ArxManifestEntry::STATUS_FAILED;
                std::ostringstream msg;
                msg << "carved length " << digest.bytes << " differs from reported length " << file->length;
                entry.errorMessage = msg.str();
            }
            else
            {
                entry.status = ArxManifestEntry::STATUS_OK;
            }
            entry.md5 = digest.md5;
            entry.sha256 = digest.sha256;
            entry.sizeBytes = (int64_t)digest.bytes;
        }
        catch (ArxCandidateReadException& ex)
        {
            entry.status = ArxManifestEntry::STATUS_FAILED;
            entry.errorMessage = ex.message();
        }

        sink.append(entry);
    }

    std::vector<ArxManifestEntry> entries = sink.entries();
    for (size_t i = 0; i < entries.size(); i++)
    {
        if (entries[i].status == ArxManifestEntry::STATUS_OK)
            result.entriesOk++;
        else
            result.entriesFailed++;
    }
    result.primariesOk = result.entriesOk;
    result.primariesFailed = result.entriesFailed;
    result.cancelled = toolResult.cancelled;

    std::string status = ArxStagingEngine::runStatus(result);
    if (!toolResult.succeeded() && !toolResult.cancelled)
        status = result.entriesOk > 0 ? "degraded" : "failed";

    result.manifest.runId = a_request.runId;
    result.manifest.evidenceId = a_request.evidenceId;
    result.manifest.extractor = a_request.extractorName;
    result.manifest.extractorVersion = a_request.extractorVersion;
    result.manifest.artifactType = a_request.artifactType;
    result.manifest.createdAt = ArxUtilities::utcNowIso();
    result.manifest.status = status;
    result.manifest.files = entries;

    try
    {
        Poco::File(runPath).createDirectories();
    }
    catch (Poco::Exception& ex)
    {
        throw ArxStorageUnavailableException("ArxCarveExtractScalpel::carve : " + ex.displayText());
    }
    result.manifestPath = Poco::Path(runPath, ArxManifest::FILE_NAME).toString();
    result.manifest.save(result.manifestPath);

    std::stringstream msg;
    msg << "ArxCarveExtractScalpel::carve : " << result.entriesOk << " files carved from " << a_inputPath
        << ", status " << status;
    LOGINFO(msg.str());

    if (!sink.storageError().empty())
        throw ArxStorageUnavailableException("ArxCarveExtractScalpel::carve : extracted_files not recorded: " + sink.storageError());

    return result;
}
