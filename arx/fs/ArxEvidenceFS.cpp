/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "ArxEvidenceFS.h"
#include "arx/utilities/ArxException.h"

#include <sstream>

bool ArxEvidenceFS::exists(int a_partition, const std::string& a_path) const
{
    try
    {
        stat(a_partition, a_path);
        return true;
    }
    catch (ArxCandidateReadException&)
    {
        return false;
    }
}

ArxPartitionInfo ArxEvidenceFS::partition(int a_partition) const
{
    std::vector<ArxPartitionInfo> parts = partitions();
    for (size_t i = 0; i < parts.size(); i++)
    {
        if (parts[i].index == a_partition)
            return parts[i];
    }

    std::stringstream msg;
    msg << "ArxEvidenceFS::partition - no partition with index " << a_partition;
    throw ArxSourceUnavailableException(msg.str());
}
