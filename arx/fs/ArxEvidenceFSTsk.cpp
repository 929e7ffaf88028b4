/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "ArxEvidenceFSTsk.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxUtilities.h"

#include <sstream>

namespace
{
    ArxTimestamp fromTsk(time_t a_seconds, uint32_t a_nano)
    {
        if (a_seconds == 0 && a_nano == 0)
            return ArxTimestamp::unknown();
        return ArxTimestamps::unixMicrosToUtc((int64_t)a_seconds * 1000000LL + a_nano / 1000);
    }

    /**
     * File content read through tsk_fs_file_read. Holds its own file
     * handle; the file system stays owned by ArxEvidenceFSTsk.
     */
    class TskEvidenceFile : public ArxEvidenceFile
    {
    public:
        TskEvidenceFile(TSK_FS_FILE * a_file, const std::string& a_path)
        : m_file(a_file), m_path(a_path), m_offset(0)
        {
        }

        virtual ~TskEvidenceFile()
        {
            tsk_fs_file_close(m_file);
        }

        virtual size_t read(char * a_buffer, size_t a_len)
        {
            if ((TSK_OFF_T)m_offset >= (TSK_OFF_T)size())
                return 0;

            ssize_t bytesRead = tsk_fs_file_read(m_file, (TSK_OFF_T)m_offset, a_buffer, a_len, TSK_FS_FILE_READ_FLAG_NONE);
            if (bytesRead == -1)
            {
                std::stringstream msg;
                msg << "TskEvidenceFile::read - Error reading " << m_path << " at offset " << m_offset
                    << " (" << tsk_error_get() << ")";
                tsk_error_reset();
                throw ArxCandidateReadException(msg.str());
            }
            m_offset += (uint64_t)bytesRead;
            return (size_t)bytesRead;
        }

        virtual uint64_t size() const
        {
            return (m_file->meta != NULL && m_file->meta->size > 0) ? (uint64_t)m_file->meta->size : 0;
        }

    private:
        TSK_FS_FILE * m_file;
        std::string m_path;
        uint64_t m_offset;
    };
}

ArxEvidenceFSTsk::ArxEvidenceFSTsk(const std::vector<std::string>& a_images)
: m_images(a_images), m_imgInfo(NULL), m_vsInfo(NULL)
{
    if (m_images.empty())
        throw ArxSourceUnavailableException("ArxEvidenceFSTsk - no image files given");

    std::vector<const char *> imagePtrs;
    for (size_t i = 0; i < m_images.size(); i++)
        imagePtrs.push_back(m_images[i].c_str());

    m_imgInfo = tsk_img_open_utf8((int)imagePtrs.size(), &imagePtrs[0], TSK_IMG_TYPE_DETECT, 0);
    if (m_imgInfo == NULL)
    {
        std::stringstream msg;
        msg << "ArxEvidenceFSTsk - Error with tsk_img_open: " << tsk_error_get();
        tsk_error_reset();
        throw ArxSourceUnavailableException(msg.str());
    }

    m_vsInfo = tsk_vs_open(m_imgInfo, 0, TSK_VS_TYPE_DETECT);
    if (m_vsInfo != NULL)
    {
        if (tsk_vs_part_walk(m_vsInfo, 0, m_vsInfo->part_count - 1, TSK_VS_PART_FLAG_ALLOC,
                partWalkCallback, this) != 0)
        {
            std::stringstream msg;
            msg << "ArxEvidenceFSTsk - Error walking partitions: " << tsk_error_get();
            LOGWARN(msg.str());
            tsk_error_reset();
        }
    }
    else
    {
        // It's possible that this is an image with no volume system.
        tsk_error_reset();
        TSK_FS_INFO * fs = tsk_fs_open_img(m_imgInfo, 0, TSK_FS_TYPE_DETECT);
        if (fs != NULL)
            addFileSystem(fs, "file system at offset 0");
        else
            tsk_error_reset();
    }

    if (m_fileSystems.empty())
    {
        close();
        throw ArxSourceUnavailableException("ArxEvidenceFSTsk - no readable file system in " + m_images[0]);
    }
}

ArxEvidenceFSTsk::~ArxEvidenceFSTsk()
{
    close();
}

void ArxEvidenceFSTsk::close()
{
    for (size_t i = 0; i < m_fileSystems.size(); i++)
        tsk_fs_close(m_fileSystems[i]);
    m_fileSystems.clear();
    m_partitions.clear();

    if (m_vsInfo) {
        tsk_vs_close(m_vsInfo);
        m_vsInfo = NULL;
    }
    if (m_imgInfo) {
        tsk_img_close(m_imgInfo);
        m_imgInfo = NULL;
    }
}

TSK_WALK_RET_ENUM ArxEvidenceFSTsk::partWalkCallback(TSK_VS_INFO * /*a_vsInfo*/, const TSK_VS_PART_INFO * a_part, void * a_ptr)
{
    ArxEvidenceFSTsk * self = static_cast<ArxEvidenceFSTsk *>(a_ptr);

    TSK_FS_INFO * fs = tsk_fs_open_vol(a_part, TSK_FS_TYPE_DETECT);
    if (fs == NULL)
    {
        // Unallocated space and unknown file systems are not evidence partitions.
        std::stringstream msg;
        msg << "ArxEvidenceFSTsk - no file system in volume " << a_part->addr
            << " (" << (a_part->desc ? a_part->desc : "") << ")";
        LOGINFO(msg.str());
        tsk_error_reset();
        return TSK_WALK_CONT;
    }

    self->addFileSystem(fs, a_part->desc ? a_part->desc : "");
    return TSK_WALK_CONT;
}

void ArxEvidenceFSTsk::addFileSystem(TSK_FS_INFO * a_fsInfo, const std::string& a_description)
{
    ArxPartitionInfo info;
    info.index = (int)m_fileSystems.size();
    info.byteOffset = (uint64_t)a_fsInfo->offset;
    info.fsType = tsk_fs_type_toname(a_fsInfo->ftype);
    info.description = a_description;

    m_fileSystems.push_back(a_fsInfo);
    m_partitions.push_back(info);
}

std::vector<ArxPartitionInfo> ArxEvidenceFSTsk::partitions() const
{
    return m_partitions;
}

TSK_FS_INFO * ArxEvidenceFSTsk::fsInfo(int a_partition) const
{
    if (a_partition < 0 || (size_t)a_partition >= m_fileSystems.size())
    {
        std::stringstream msg;
        msg << "ArxEvidenceFSTsk - no partition with index " << a_partition;
        throw ArxCandidateReadException(msg.str());
    }
    return m_fileSystems[a_partition];
}

ArxFsEntry ArxEvidenceFSTsk::toEntry(TSK_FS_INFO * a_fsInfo, const TSK_FS_FILE * a_file, const std::string& a_logicalPath) const
{
    ArxFsEntry entry;
    entry.logicalPath = ArxUtilities::normalizeLogicalPath(a_logicalPath);
    entry.name = ArxUtilities::baseName(entry.logicalPath);
    entry.fsType = tsk_fs_type_toname(a_fsInfo->ftype);

    if (a_file->name != NULL)
    {
        entry.isDirectory = a_file->name->type == TSK_FS_NAME_TYPE_DIR;
        entry.isRegular = a_file->name->type == TSK_FS_NAME_TYPE_REG;
        entry.deleted = (a_file->name->flags & TSK_FS_NAME_FLAG_UNALLOC) != 0;
        entry.inode = (uint64_t)a_file->name->meta_addr;
    }

    if (a_file->meta != NULL)
    {
        const TSK_FS_META * meta = a_file->meta;
        if (a_file->name == NULL)
        {
            entry.isDirectory = meta->type == TSK_FS_META_TYPE_DIR;
            entry.isRegular = meta->type == TSK_FS_META_TYPE_REG;
            entry.deleted = (meta->flags & TSK_FS_META_FLAG_UNALLOC) != 0;
        }
        entry.inode = (uint64_t)meta->addr;
        entry.size = meta->size > 0 ? (uint64_t)meta->size : 0;
        entry.mtime = fromTsk(meta->mtime, meta->mtime_nano);
        entry.atime = fromTsk(meta->atime, meta->atime_nano);
        entry.ctime = fromTsk(meta->ctime, meta->ctime_nano);
        entry.crtime = fromTsk(meta->crtime, meta->crtime_nano);
    }

    std::stringstream forensic;
    forensic << m_images[0] << ":" << a_fsInfo->offset << ":" << entry.inode;
    entry.forensicPath = forensic.str();
    return entry;
}

std::vector<ArxFsEntry> ArxEvidenceFSTsk::list(int a_partition, const std::string& a_dir) const
{
    TSK_FS_INFO * fs = fsInfo(a_partition);
    std::string logicalDir = ArxUtilities::normalizeLogicalPath(a_dir);

    TSK_FS_DIR * dir = tsk_fs_dir_open(fs, logicalDir.c_str());
    if (dir == NULL)
    {
        std::stringstream msg;
        msg << "ArxEvidenceFSTsk::list - Error opening directory " << logicalDir << " (" << tsk_error_get() << ")";
        tsk_error_reset();
        throw ArxCandidateReadException(msg.str());
    }

    std::vector<ArxFsEntry> entries;
    size_t count = tsk_fs_dir_getsize(dir);
    for (size_t i = 0; i < count; i++)
    {
        TSK_FS_FILE * file = tsk_fs_dir_get(dir, i);
        if (file == NULL)
        {
            tsk_error_reset();
            continue;
        }

        if (file->name != NULL && file->name->name != NULL && !TSK_FS_ISDOT(file->name->name))
        {
            std::string name = ArxUtilities::cleanUTF8(file->name->name);
            entries.push_back(toEntry(fs, file, ArxUtilities::joinLogicalPath(logicalDir, name)));
        }
        tsk_fs_file_close(file);
    }
    tsk_fs_dir_close(dir);

    return entries;
}

ArxFsEntry ArxEvidenceFSTsk::stat(int a_partition, const std::string& a_path) const
{
    TSK_FS_INFO * fs = fsInfo(a_partition);
    std::string logical = ArxUtilities::normalizeLogicalPath(a_path);

    TSK_FS_FILE * file = tsk_fs_file_open(fs, NULL, logical.c_str());
    if (file == NULL)
    {
        std::stringstream msg;
        msg << "ArxEvidenceFSTsk::stat - Error opening " << logical << " (" << tsk_error_get() << ")";
        tsk_error_reset();
        throw ArxCandidateReadException(msg.str());
    }

    ArxFsEntry entry = toEntry(fs, file, logical);
    tsk_fs_file_close(file);
    return entry;
}

std::unique_ptr<ArxEvidenceFile> ArxEvidenceFSTsk::open(int a_partition, const std::string& a_path) const
{
    TSK_FS_INFO * fs = fsInfo(a_partition);
    std::string logical = ArxUtilities::normalizeLogicalPath(a_path);

    TSK_FS_FILE * file = tsk_fs_file_open(fs, NULL, logical.c_str());
    if (file == NULL)
    {
        std::stringstream msg;
        msg << "ArxEvidenceFSTsk::open - Error opening " << logical << " (" << tsk_error_get() << ")";
        tsk_error_reset();
        throw ArxCandidateReadException(msg.str());
    }

    if (file->meta == NULL || file->meta->type != TSK_FS_META_TYPE_REG)
    {
        tsk_fs_file_close(file);
        throw ArxCandidateReadException("ArxEvidenceFSTsk::open - not a regular file: " + logical);
    }

    return std::unique_ptr<ArxEvidenceFile>(new TskEvidenceFile(file, logical));
}
