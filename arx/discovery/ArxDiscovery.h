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
 * \file ArxDiscovery.h
 * Finds candidate artifact files in an evidence item.
 */

#ifndef _ARX_DISCOVERY_H
#define _ARX_DISCOVERY_H

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "arx/framework_i.h"
#include "arx/discovery/ArxCandidateArtifact.h"
#include "arx/discovery/ArxPatternSet.h"
#include "arx/fs/ArxEvidenceFS.h"
#include "arx/services/ArxConfig.h"
#include "arx/services/ArxImgDB.h"

/**
 * Resolves the globs of an artifact type against the file systems of an
 * evidence item, either by walking the directories or by querying the
 * file index. Both modes confirm paths with the same ArxPathMatcher and
 * so return the same candidates for the same evidence state.
 *
 * Results are deduplicated by (partition, logical path) and returned in
 * that order. When several patterns match one file, browser and profile
 * come from the first pattern in declaration order.
 */
class ARX_FRAMEWORK_API ArxDiscovery
{
public:
    enum Mode {
        MODE_AUTO,   ///< per partition: index when it holds rows for it, walk otherwise
        MODE_WALK,
        MODE_INDEX
    };

    /**
     * @param a_index File index to use, may be NULL (walk only).
     */
    ArxDiscovery(const ArxEvidenceFS& a_fs, const ArxPatternSet& a_patterns,
        const ArxImgDB * a_index, const ArxConfig& a_config);

    /**
     * @param a_partitions Partitions to search, all when empty.
     * @throws ArxConfigurationException for an unknown artifact type.
     * @throws ArxSourceUnavailableException if a partition root cannot be listed.
     * @throws ArxStorageUnavailableException if the file index cannot be read.
     */
    std::vector<ArxCandidateArtifact> discover(int64_t a_evidenceId, const std::string& a_artifactType,
        const std::vector<int>& a_partitions, Mode a_mode = MODE_AUTO) const;

    /// The mode MODE_AUTO resolves to for one partition, or for any partition (-1).
    Mode resolveMode(int64_t a_evidenceId, int a_partition = -1) const;

private:
    typedef std::map<std::pair<int, std::string>, ArxCandidateArtifact> CandidateMap;

    std::vector<int> selectPartitions(const std::vector<int>& a_partitions) const;

    void walk(int64_t a_evidenceId, const ArxArtifactType& a_type, int a_partition,
        const std::string& a_dir, CandidateMap& a_found) const;
    void queryIndex(int64_t a_evidenceId, const ArxArtifactType& a_type,
        const std::vector<int>& a_partitions, CandidateMap& a_found) const;

    /// Adds the entry if a pattern in [first, end) matches and the path is not yet known.
    static void consider(int64_t a_evidenceId, const ArxArtifactType& a_type, size_t a_firstPattern,
        size_t a_endPattern, int a_partition, const ArxFsEntry& a_entry, CandidateMap& a_found);

    const ArxEvidenceFS& m_fs;
    const ArxPatternSet& m_patterns;
    const ArxImgDB * m_index;
    const ArxConfig& m_config;
};

#endif
