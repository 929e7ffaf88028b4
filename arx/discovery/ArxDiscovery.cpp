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
 * \file ArxDiscovery.cpp
 */

#include "ArxDiscovery.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"

#include <algorithm>
#include <sstream>

ArxDiscovery::ArxDiscovery(const ArxEvidenceFS& a_fs, const ArxPatternSet& a_patterns,
    const ArxImgDB * a_index, const ArxConfig& a_config)
: m_fs(a_fs), m_patterns(a_patterns), m_index(a_index), m_config(a_config)
{
}

ArxDiscovery::Mode ArxDiscovery::resolveMode(int64_t a_evidenceId, int a_partition) const
{
    if (m_config.useFileIndex && m_index != NULL && m_index->countFileList(a_evidenceId, a_partition) > 0)
        return MODE_INDEX;
    return MODE_WALK;
}

std::vector<int> ArxDiscovery::selectPartitions(const std::vector<int>& a_partitions) const
{
    std::vector<int> selected;
    if (a_partitions.empty())
    {
        std::vector<ArxPartitionInfo> all = m_fs.partitions();
        for (size_t i = 0; i < all.size(); i++)
            selected.push_back(all[i].index);
    }
    else
    {
        for (size_t i = 0; i < a_partitions.size(); i++)
        {
            // Throws ArxSourceUnavailableException for an unknown partition.
            selected.push_back(m_fs.partition(a_partitions[i]).index);
        }
    }

    std::sort(selected.begin(), selected.end());
    selected.erase(std::unique(selected.begin(), selected.end()), selected.end());
    return selected;
}

std::vector<ArxCandidateArtifact> ArxDiscovery::discover(int64_t a_evidenceId, const std::string& a_artifactType,
    const std::vector<int>& a_partitions, Mode a_mode) const
{
    const ArxArtifactType& type = m_patterns.artifactType(a_artifactType);
    std::vector<int> partitions = selectPartitions(a_partitions);

    if (a_mode == MODE_INDEX && m_index == NULL)
        throw ArxConfigurationException("ArxDiscovery::discover - index discovery requested without a file index");

    // Auto mode decides per partition, since bodyfiles are imported one partition at a time.
    std::vector<int> indexed;
    std::vector<int> walked;
    for (size_t i = 0; i < partitions.size(); i++)
    {
        Mode mode = (a_mode == MODE_AUTO) ? resolveMode(a_evidenceId, partitions[i]) : a_mode;
        if (mode == MODE_INDEX)
            indexed.push_back(partitions[i]);
        else
            walked.push_back(partitions[i]);
    }

    CandidateMap found;
    if (!indexed.empty())
        queryIndex(a_evidenceId, type, indexed, found);
    for (size_t i = 0; i < walked.size(); i++)
        walk(a_evidenceId, type, walked[i], "/", found);

    std::vector<ArxCandidateArtifact> candidates;
    candidates.reserve(found.size());
    for (CandidateMap::const_iterator it = found.begin(); it != found.end(); ++it)
        candidates.push_back(it->second);

    std::ostringstream msg;
    msg << "ArxDiscovery::discover - " << candidates.size() << " " << a_artifactType << " candidates in evidence "
        << a_evidenceId << " (" << indexed.size() << " partitions by index, " << walked.size() << " walked)";
    LOGINFO(msg.str());

    return candidates;
}

void ArxDiscovery::consider(int64_t a_evidenceId, const ArxArtifactType& a_type, size_t a_firstPattern,
    size_t a_endPattern, int a_partition, const ArxFsEntry& a_entry, CandidateMap& a_found)
{
    std::pair<int, std::string> key(a_partition, a_entry.logicalPath);
    if (a_found.find(key) != a_found.end())
        return;

    for (size_t i = a_firstPattern; i < a_endPattern; i++)
    {
        const ArxArtifactPattern& pattern = a_type.patterns[i];
        if (!pattern.matcher.matches(a_entry.logicalPath))
            continue;

        ArxCandidateArtifact candidate;
        candidate.evidenceId = a_evidenceId;
        candidate.partitionIndex = a_partition;
        candidate.logicalPath = a_entry.logicalPath;
        candidate.forensicPath = a_entry.forensicPath;
        candidate.fsType = a_entry.fsType;
        candidate.size = a_entry.size;
        candidate.inode = a_entry.inode;
        candidate.deleted = a_entry.deleted;
        candidate.mtime = a_entry.mtime;
        candidate.atime = a_entry.atime;
        candidate.ctime = a_entry.ctime;
        candidate.crtime = a_entry.crtime;
        candidate.artifactType = a_type.name;
        candidate.browser = pattern.browser;
        candidate.profile = pattern.profileOf(a_entry.logicalPath);

        a_found.insert(std::make_pair(key, candidate));
        return;
    }
}

void ArxDiscovery::walk(int64_t a_evidenceId, const ArxArtifactType& a_type, int a_partition,
    const std::string& a_dir, CandidateMap& a_found) const
{
    std::vector<ArxFsEntry> entries;
    try
    {
        entries = m_fs.list(a_partition, a_dir);
    }
    catch (ArxCandidateReadException& ex)
    {
        // The partition root must be readable; anything below is best effort.
        if (a_dir == "/")
        {
            std::ostringstream msg;
            msg << "ArxDiscovery::walk - cannot open root of partition " << a_partition << ": " << ex.message();
            throw ArxSourceUnavailableException(msg.str());
        }

        std::ostringstream msg;
        msg << "ArxDiscovery::walk - skipping unreadable directory " << a_dir << " in partition "
            << a_partition << ": " << ex.message();
        LOGWARN(msg.str());
        return;
    }

    for (size_t i = 0; i < entries.size(); i++)
    {
        const ArxFsEntry& entry = entries[i];
        if (entry.isDirectory)
        {
            bool descend = false;
            for (size_t p = 0; p < a_type.patterns.size() && !descend; p++)
                descend = a_type.patterns[p].matcher.mayMatchBelow(entry.logicalPath);

            if (descend)
                walk(a_evidenceId, a_type, a_partition, entry.logicalPath, a_found);
        }
        else if (entry.isRegular)
        {
            consider(a_evidenceId, a_type, 0, a_type.patterns.size(), a_partition, entry, a_found);
        }
    }
}

void ArxDiscovery::queryIndex(int64_t a_evidenceId, const ArxArtifactType& a_type,
    const std::vector<int>& a_partitions, CandidateMap& a_found) const
{
    for (size_t p = 0; p < a_type.patterns.size(); p++)
    {
        std::vector<ArxFileListRow> rows =
            m_index->queryFileList(a_evidenceId, -1, a_type.patterns[p].matcher.toLikePattern());

        for (size_t r = 0; r < rows.size(); r++)
        {
            const ArxFileListRow& row = rows[r];
            if (row.entry.isDirectory)
                continue;
            if (!std::binary_search(a_partitions.begin(), a_partitions.end(), row.partitionIndex))
                continue;

            // Patterns are visited in order, so the first matching pattern
            // still decides browser and profile.
            consider(a_evidenceId, a_type, p, p + 1, row.partitionIndex, row.entry, a_found);
        }
    }
}
