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
 * \file ArxStagingEngine.cpp
 */

#include "ArxStagingEngine.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxHashCalculator.h"
#include "arx/utilities/ArxUtilities.h"

// Poco includes
#include "Poco/File.h"
#include "Poco/FileStream.h"
#include "Poco/Path.h"
#include "Poco/Runnable.h"
#include "Poco/ThreadPool.h"
#include "Poco/Mutex.h"

#include <algorithm>
#include <map>
#include <memory>
#include <set>
#include <sstream>

namespace
{
    const std::string EXTRACTED_DIR = "extracted";
    const std::string ROLE_PRIMARY = "primary";

    std::string roleForSuffix(const std::string& suffix)
    {
        // "-wal" -> "wal"
        return suffix.substr(1);
    }

    std::string candidateKey(int partition, const std::string& logicalPath)
    {
        std::ostringstream key;
        key << partition << ":" << logicalPath;
        return key.str();
    }
}

/**
 * Pulls jobs off the shared list until it is empty or the run is cancelled.
 */
class StagingWorker : public Poco::Runnable
{
public:
    StagingWorker(const ArxStagingEngine& engine, const std::vector<ArxStagingEngine::CopyJob>& jobs,
        size_t& nextJob, Poco::FastMutex& jobMutex, const ArxStagingRequest& request,
        const std::string& runDir, ArxManifestSink& sink, const ArxCancellationToken& cancel)
        : m_engine(engine), m_jobs(jobs), m_nextJob(nextJob), m_jobMutex(jobMutex), m_request(request),
          m_runDir(runDir), m_sink(sink), m_cancel(cancel) {}

    virtual void run()
    {
        while (!m_cancel.isCancelled())
        {
            size_t job;
            {
                Poco::FastMutex::ScopedLock lock(m_jobMutex);
                if (m_nextJob >= m_jobs.size())
                    return;
                job = m_nextJob++;
            }
            m_engine.runJob(m_jobs[job], m_request, m_runDir, m_sink, m_cancel);
        }
    }

private:
    const ArxStagingEngine& m_engine;
    const std::vector<ArxStagingEngine::CopyJob>& m_jobs;
    size_t& m_nextJob;
    Poco::FastMutex& m_jobMutex;
    const ArxStagingRequest& m_request;
    std::string m_runDir;
    ArxManifestSink& m_sink;
    const ArxCancellationToken& m_cancel;
};

ArxStagingEngine::ArxStagingEngine(const ArxEvidenceFS& a_fs, const ArxConfig& a_config, ArxImgDB * a_db)
: m_fs(a_fs), m_config(a_config), m_db(a_db)
{
}

const std::vector<std::string>& ArxStagingEngine::sqliteCompanionSuffixes()
{
    static const std::vector<std::string> suffixes = { "-wal", "-journal", "-shm" };
    return suffixes;
}

std::string ArxStagingEngine::runDirectory(const std::string& a_outDir, int64_t a_evidenceId,
    const std::string& a_extractorName, const std::string& a_runId)
{
    std::ostringstream evidenceDir;
    evidenceDir << "evidence_" << a_evidenceId;

    Poco::Path runPath = Poco::Path::forDirectory(a_outDir);
    runPath.pushDirectory(evidenceDir.str());
    runPath.pushDirectory(a_extractorName);
    runPath.pushDirectory(a_runId);
    return runPath.toString();
}

std::string ArxStagingEngine::destinationName(const ArxCandidateArtifact& a_candidate)
{
    std::ostringstream name;
    name << "p" << a_candidate.partitionIndex << "_"
         << ArxUtilities::sha256Hex(a_candidate.logicalPath).substr(0, 8) << "_"
         << ArxUtilities::baseName(a_candidate.logicalPath);
    return name.str();
}

std::string ArxStagingEngine::runStatus(const ArxStagingResult& a_result)
{
    if (a_result.cancelled)
        return "cancelled";
    if (a_result.primariesFailed > 0 && a_result.primariesOk == 0)
        return "failed";
    if (a_result.entriesFailed > 0)
        return "degraded";
    return "ok";
}

std::vector<ArxStagingEngine::CopyJob> ArxStagingEngine::planJobs(const std::vector<ArxCandidateArtifact>& a_candidates,
    ArxArtifactType::CompanionPolicy a_companions) const
{
    std::vector<ArxCandidateArtifact> sorted(a_candidates);
    std::sort(sorted.begin(), sorted.end());

    std::map<std::string, const ArxCandidateArtifact *> byKey;
    for (size_t i = 0; i < sorted.size(); i++)
        byKey[candidateKey(sorted[i].partitionIndex, sorted[i].logicalPath)] = &sorted[i];

    // Candidates that are companions of another candidate travel with it.
    std::set<std::string> folded;
    if (a_companions == ArxArtifactType::COMPANIONS_SQLITE)
    {
        const std::vector<std::string>& suffixes = sqliteCompanionSuffixes();
        for (size_t i = 0; i < sorted.size(); i++)
        {
            for (size_t s = 0; s < suffixes.size(); s++)
            {
                const std::string& path = sorted[i].logicalPath;
                if (path.size() <= suffixes[s].size() ||
                    path.compare(path.size() - suffixes[s].size(), suffixes[s].size(), suffixes[s]) != 0)
                    continue;

                std::string primaryPath = path.substr(0, path.size() - suffixes[s].size());
                if (byKey.count(candidateKey(sorted[i].partitionIndex, primaryPath)))
                    folded.insert(candidateKey(sorted[i].partitionIndex, path));
            }
        }
    }

    std::set<std::string> usedNames;
    std::vector<CopyJob> jobs;
    for (size_t i = 0; i < sorted.size(); i++)
    {
        const ArxCandidateArtifact& candidate = sorted[i];
        if (folded.count(candidateKey(candidate.partitionIndex, candidate.logicalPath)))
            continue;

        CopyJob job;
        job.primary = candidate;

        std::vector<std::string> reservedSuffixes(1, "");
        if (a_companions == ArxArtifactType::COMPANIONS_SQLITE)
        {
            const std::vector<std::string>& suffixes = sqliteCompanionSuffixes();
            reservedSuffixes.insert(reservedSuffixes.end(), suffixes.begin(), suffixes.end());
            for (size_t s = 0; s < suffixes.size(); s++)
            {
                std::map<std::string, const ArxCandidateArtifact *>::const_iterator it =
                    byKey.find(candidateKey(candidate.partitionIndex, candidate.logicalPath + suffixes[s]));
                if (it != byKey.end())
                    job.knownCompanions.push_back(std::make_pair(suffixes[s], *it->second));
            }
        }

        // Names are compared case-insensitively so staging onto a case
        // folding host file system never overwrites.
        std::string base = destinationName(candidate);
        std::string name = base;
        for (int attempt = 1; ; attempt++)
        {
            bool taken = false;
            for (size_t s = 0; s < reservedSuffixes.size() && !taken; s++)
                taken = usedNames.count(ArxUtilities::toLowerAscii(name + reservedSuffixes[s])) != 0;
            if (!taken)
                break;

            std::ostringstream next;
            if (attempt == 1)
            {
                std::ostringstream discriminator;
                discriminator << candidate.partitionIndex << ":" << candidate.logicalPath << ":" << candidate.inode;
                next << base << "_" << ArxUtilities::sha256Hex(discriminator.str()).substr(0, 16);
            }
            else
            {
                next << base << "_" << attempt;
            }
            name = next.str();
        }

        for (size_t s = 0; s < reservedSuffixes.size(); s++)
            usedNames.insert(ArxUtilities::toLowerAscii(name + reservedSuffixes[s]));

        job.destName = name;
        jobs.push_back(job);
    }
    return jobs;
}

ArxStagingResult ArxStagingEngine::extract(const std::vector<ArxCandidateArtifact>& a_candidates,
    const ArxStagingRequest& a_request, const ArxCancellationToken& a_cancel)
{
    ArxStagingResult result;
    result.runDir = runDirectory(m_config.outDir, a_request.evidenceId, a_request.extractorName, a_request.runId);

    try
    {
        Poco::Path extractedPath = Poco::Path::forDirectory(result.runDir);
        extractedPath.pushDirectory(EXTRACTED_DIR);
        Poco::File(extractedPath).createDirectories();
    }
    catch (Poco::Exception& ex)
    {
        throw ArxStorageUnavailableException("ArxStagingEngine::extract - cannot create run directory "
            + result.runDir + ": " + ex.displayText());
    }

    std::vector<CopyJob> jobs = planJobs(a_candidates, a_request.companions);
    ArxManifestSink sink(m_db, a_request.runId, a_request.extractorName);

    unsigned int workers = m_config.extractionWorkers;
    if (!m_fs.isThreadSafe() || workers < 1)
        workers = 1;
    if (workers > jobs.size())
        workers = jobs.empty() ? 1 : (unsigned int)jobs.size();

    std::ostringstream startMsg;
    startMsg << "ArxStagingEngine::extract - staging " << jobs.size() << " files for run " << a_request.runId
        << " with " << workers << " worker(s)";
    LOGINFO(startMsg.str());

    size_t nextJob = 0;
    Poco::FastMutex jobMutex;
    if (workers == 1)
    {
        StagingWorker worker(*this, jobs, nextJob, jobMutex, a_request, result.runDir, sink, a_cancel);
        worker.run();
    }
    else
    {
        Poco::ThreadPool pool(1, workers);
        std::vector<std::unique_ptr<StagingWorker> > runners;
        for (unsigned int i = 0; i < workers; i++)
        {
            runners.push_back(std::unique_ptr<StagingWorker>(
                new StagingWorker(*this, jobs, nextJob, jobMutex, a_request, result.runDir, sink, a_cancel)));
            pool.start(*runners.back());
        }
        pool.joinAll();
    }

    std::vector<ArxManifestEntry> entries = sink.entries();
    for (size_t i = 0; i < entries.size(); i++)
    {
        bool ok = entries[i].status == ArxManifestEntry::STATUS_OK;
        if (ok)
            result.entriesOk++;
        else
            result.entriesFailed++;

        if (entries[i].role == ROLE_PRIMARY)
        {
            if (ok)
                result.primariesOk++;
            else
                result.primariesFailed++;
        }
    }
    result.cancelled = a_cancel.isCancelled();

    result.manifest.runId = a_request.runId;
    result.manifest.evidenceId = a_request.evidenceId;
    result.manifest.extractor = a_request.extractorName;
    result.manifest.extractorVersion = a_request.extractorVersion;
    result.manifest.artifactType = a_request.artifactType;
    result.manifest.createdAt = ArxUtilities::utcNowIso();
    result.manifest.files = entries;
    result.manifest.status = runStatus(result);

    result.manifestPath = Poco::Path(Poco::Path::forDirectory(result.runDir), ArxManifest::FILE_NAME).toString();
    result.manifest.save(result.manifestPath);

    std::ostringstream doneMsg;
    doneMsg << "ArxStagingEngine::extract - run " << a_request.runId << " staged " << result.entriesOk
        << " files, " << result.entriesFailed << " failed, status " << result.manifest.status;
    LOGINFO(doneMsg.str());

    std::string storageError = sink.storageError();
    if (!storageError.empty())
        throw ArxStorageUnavailableException("ArxStagingEngine::extract - extracted_files not recorded: " + storageError);

    return result;
}

void ArxStagingEngine::runJob(const CopyJob& a_job, const ArxStagingRequest& a_request, const std::string& a_runDir,
    ArxManifestSink& a_sink, const ArxCancellationToken& a_cancel) const
{
    std::string destRelPath = EXTRACTED_DIR + "/" + a_job.destName;

    ArxManifestEntry::Status status;
    if (!copyOne(a_job.primary, destRelPath, a_runDir, ROLE_PRIMARY, destRelPath, a_sink, a_cancel, status))
        return;
    if (status != ArxManifestEntry::STATUS_OK || a_request.companions != ArxArtifactType::COMPANIONS_SQLITE)
        return;

    const std::vector<std::string>& suffixes = sqliteCompanionSuffixes();
    for (size_t s = 0; s < suffixes.size(); s++)
    {
        if (a_cancel.isCancelled())
            return;

        ArxCandidateArtifact companion;
        bool found = false;
        for (size_t k = 0; k < a_job.knownCompanions.size(); k++)
        {
            if (a_job.knownCompanions[k].first == suffixes[s])
            {
                companion = a_job.knownCompanions[k].second;
                found = true;
            }
        }

        if (!found)
        {
            std::string companionPath = a_job.primary.logicalPath + suffixes[s];
            if (!m_fs.exists(a_job.primary.partitionIndex, companionPath))
                continue;

            ArxFsEntry entry;
            try
            {
                entry = m_fs.stat(a_job.primary.partitionIndex, companionPath);
            }
            catch (ArxCandidateReadException& ex)
            {
                LOGWARN("ArxStagingEngine::runJob - cannot stat companion " + companionPath + ": " + ex.message());
                continue;
            }
            if (!entry.isRegular)
                continue;

            companion = a_job.primary;
            companion.logicalPath = entry.logicalPath;
            companion.forensicPath = entry.forensicPath;
            companion.fsType = entry.fsType;
            companion.size = entry.size;
            companion.inode = entry.inode;
            companion.deleted = entry.deleted;
            companion.mtime = entry.mtime;
            companion.atime = entry.atime;
            companion.ctime = entry.ctime;
            companion.crtime = entry.crtime;
        }

        ArxManifestEntry::Status companionStatus;
        if (!copyOne(companion, destRelPath + suffixes[s], a_runDir, roleForSuffix(suffixes[s]), destRelPath,
                a_sink, a_cancel, companionStatus))
            return;
    }
}

bool ArxStagingEngine::copyOne(const ArxCandidateArtifact& a_source, const std::string& a_destRelPath,
    const std::string& a_runDir, const std::string& a_role, const std::string& a_logicalGroup,
    ArxManifestSink& a_sink, const ArxCancellationToken& a_cancel, ArxManifestEntry::Status& a_status) const
{
    if (a_cancel.isCancelled())
        return false;

    ArxManifestEntry entry;
    entry.source = a_source;
    entry.destRelPath = a_destRelPath;
    entry.destFilename = ArxUtilities::baseName(a_destRelPath);
    entry.logicalGroup = a_logicalGroup;
    entry.role = a_role;

    Poco::Path destPath(Poco::Path::forDirectory(a_runDir), Poco::Path(a_destRelPath, Poco::Path::PATH_UNIX));
    std::string dest = destPath.toString();
    bool interrupted = false;

    try
    {
        std::unique_ptr<ArxEvidenceFile> source = m_fs.open(a_source.partitionIndex, a_source.logicalPath);
        ArxHashCalculator hasher;
        std::vector<char> buffer(m_config.copyBufferSize);

        Poco::FileOutputStream out(dest, std::ios::out | std::ios::binary | std::ios::trunc);
        for (;;)
        {
            if (a_cancel.isCancelled())
            {
                interrupted = true;
                break;
            }

            size_t bytesRead = source->read(&buffer[0], buffer.size());
            if (bytesRead == 0)
                break;

            hasher.update(&buffer[0], bytesRead);
            out.write(&buffer[0], bytesRead);
            if (!out.good())
                throw ArxCandidateReadException("write to " + dest + " failed");
        }
        out.close();

        if (!interrupted)
        {
            hasher.finish();
            entry.md5 = hasher.md5();
            entry.sha256 = hasher.sha256();
            entry.sizeBytes = (int64_t)hasher.bytes();
            entry.status = ArxManifestEntry::STATUS_OK;
        }
    }
    catch (ArxCandidateReadException& ex)
    {
        entry.status = ArxManifestEntry::STATUS_FAILED;
        entry.errorMessage = ex.message();
    }
    catch (Poco::Exception& ex)
    {
        entry.status = ArxManifestEntry::STATUS_FAILED;
        entry.errorMessage = ex.displayText();
    }

    if (interrupted || entry.status != ArxManifestEntry::STATUS_OK)
    {
        // Never leave a partial copy behind.
        try
        {
            Poco::File partial(dest);
            if (partial.exists())
                partial.remove();
        }
        catch (Poco::Exception& ex)
        {
            LOGERROR("ArxStagingEngine::copyOne - cannot remove partial file " + dest + ": " + ex.displayText());
        }
    }

    if (interrupted)
    {
        LOGINFO("ArxStagingEngine::copyOne - cancelled while copying " + a_source.logicalPath);
        return false;
    }

    if (entry.status != ArxManifestEntry::STATUS_OK)
    {
        std::ostringstream msg;
        msg << "ArxStagingEngine::copyOne - failed to copy p" << a_source.partitionIndex << ":"
            << a_source.logicalPath << ": " << entry.errorMessage;
        LOGWARN(msg.str());
    }

    entry.extractedAt = ArxUtilities::utcNowIso();
    a_status = entry.status;
    a_sink.append(entry);
    return true;
}
