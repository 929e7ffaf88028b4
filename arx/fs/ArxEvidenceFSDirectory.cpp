/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "ArxEvidenceFSDirectory.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxUtilities.h"

#include "Poco/File.h"
#include "Poco/Path.h"
#include "Poco/DirectoryIterator.h"
#include "Poco/FileStream.h"
#include "Poco/Exception.h"

#include <sys/stat.h>
#include <errno.h>
#include <string.h>
#include <sstream>

namespace
{
    ArxTimestamp fromTimespec(const struct timespec& ts)
    {
        if (ts.tv_sec == 0 && ts.tv_nsec == 0)
            return ArxTimestamp::unknown();
        return ArxTimestamps::unixMicrosToUtc((int64_t)ts.tv_sec * 1000000LL + ts.tv_nsec / 1000);
    }

    /**
     * Host file opened through a Poco stream in read-only mode.
     */
    class HostEvidenceFile : public ArxEvidenceFile
    {
    public:
        HostEvidenceFile(const std::string& path, uint64_t size)
        : m_path(path), m_size(size), m_stream(path, std::ios::in | std::ios::binary)
        {
        }

        virtual size_t read(char * a_buffer, size_t a_len)
        {
            if (m_stream.eof())
                return 0;

            m_stream.read(a_buffer, (std::streamsize)a_len);
            if (m_stream.bad())
                throw ArxCandidateReadException("Read error on " + m_path);
            return (size_t)m_stream.gcount();
        }

        virtual uint64_t size() const { return m_size; }

    private:
        std::string m_path;
        uint64_t m_size;
        Poco::FileInputStream m_stream;
    };
}

ArxEvidenceFSDirectory::ArxEvidenceFSDirectory(const std::string& a_root)
{
    addRoot(a_root);
}

ArxEvidenceFSDirectory::ArxEvidenceFSDirectory(const std::vector<std::string>& a_roots)
{
    if (a_roots.empty())
        throw ArxSourceUnavailableException("ArxEvidenceFSDirectory - no evidence roots given");

    for (size_t i = 0; i < a_roots.size(); i++)
        addRoot(a_roots[i]);
}

void ArxEvidenceFSDirectory::addRoot(const std::string& a_root)
{
    try
    {
        Poco::File root(a_root);
        if (!root.exists() || !root.isDirectory() || !root.canRead())
            throw ArxSourceUnavailableException("Evidence root is not a readable directory: " + a_root);
    }
    catch (Poco::Exception& ex)
    {
        throw ArxSourceUnavailableException("Cannot open evidence root " + a_root + ": " + ex.displayText());
    }

    std::string root = Poco::Path(a_root).makeAbsolute().toString(Poco::Path::PATH_UNIX);
    while (root.size() > 1 && root[root.size() - 1] == '/')
        root.erase(root.size() - 1);
    m_roots.push_back(root);
}

std::vector<ArxPartitionInfo> ArxEvidenceFSDirectory::partitions() const
{
    std::vector<ArxPartitionInfo> parts;
    for (size_t i = 0; i < m_roots.size(); i++)
    {
        ArxPartitionInfo info;
        info.index = (int)i;
        info.fsType = "host";
        info.description = m_roots[i];
        parts.push_back(info);
    }
    return parts;
}

std::string ArxEvidenceFSDirectory::hostPath(int a_partition, const std::string& a_path) const
{
    if (a_partition < 0 || (size_t)a_partition >= m_roots.size())
    {
        std::stringstream msg;
        msg << "ArxEvidenceFSDirectory - no partition with index " << a_partition;
        throw ArxCandidateReadException(msg.str());
    }

    std::vector<std::string> segments = ArxUtilities::splitLogicalPath(a_path);
    std::string result = m_roots[a_partition];
    for (size_t i = 0; i < segments.size(); i++)
    {
        if (segments[i] == "..")
            throw ArxCandidateReadException("Logical path leaves the evidence root: " + a_path);
        result += "/" + segments[i];
    }
    return result;
}

ArxFsEntry ArxEvidenceFSDirectory::statHost(const std::string& a_hostPath, const std::string& a_logicalPath) const
{
    struct stat st;
    if (::lstat(a_hostPath.c_str(), &st) != 0)
    {
        std::stringstream msg;
        msg << "Cannot stat " << a_logicalPath << ": " << strerror(errno);
        throw ArxCandidateReadException(msg.str());
    }

    ArxFsEntry entry;
    entry.logicalPath = ArxUtilities::normalizeLogicalPath(a_logicalPath);
    entry.name = ArxUtilities::baseName(entry.logicalPath);
    entry.forensicPath = a_hostPath;
    entry.fsType = "host";
    entry.isDirectory = S_ISDIR(st.st_mode);
    entry.isRegular = S_ISREG(st.st_mode);
    entry.size = entry.isRegular ? (uint64_t)st.st_size : 0;
    entry.inode = (uint64_t)st.st_ino;
    entry.mtime = fromTimespec(st.st_mtim);
    entry.atime = fromTimespec(st.st_atim);
    entry.ctime = fromTimespec(st.st_ctim);
    return entry;
}

std::vector<ArxFsEntry> ArxEvidenceFSDirectory::list(int a_partition, const std::string& a_dir) const
{
    std::string dirPath = hostPath(a_partition, a_dir);
    std::string logicalDir = ArxUtilities::normalizeLogicalPath(a_dir);

    std::vector<std::string> names;
    try
    {
        Poco::DirectoryIterator end;
        for (Poco::DirectoryIterator it(dirPath); it != end; ++it)
            names.push_back(it.name());
    }
    catch (Poco::Exception& ex)
    {
        throw ArxCandidateReadException("Cannot list " + logicalDir + ": " + ex.displayText());
    }

    std::vector<ArxFsEntry> entries;
    for (size_t i = 0; i < names.size(); i++)
    {
        std::string logical = ArxUtilities::joinLogicalPath(logicalDir, names[i]);
        entries.push_back(statHost(dirPath + "/" + names[i], logical));
    }
    return entries;
}

ArxFsEntry ArxEvidenceFSDirectory::stat(int a_partition, const std::string& a_path) const
{
    return statHost(hostPath(a_partition, a_path), a_path);
}

std::unique_ptr<ArxEvidenceFile> ArxEvidenceFSDirectory::open(int a_partition, const std::string& a_path) const
{
    ArxFsEntry entry = stat(a_partition, a_path);
    if (!entry.isRegular)
        throw ArxCandidateReadException("Not a regular file: " + a_path);

    try
    {
        return std::unique_ptr<ArxEvidenceFile>(new HostEvidenceFile(entry.forensicPath, entry.size));
    }
    catch (Poco::Exception& ex)
    {
        throw ArxCandidateReadException("Cannot open " + a_path + ": " + ex.displayText());
    }
}
