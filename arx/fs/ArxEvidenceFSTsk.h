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
 * \file ArxEvidenceFSTsk.h
 * Disk image backed evidence, read through The Sleuth Kit library.
 */

#ifndef _ARX_EVIDENCEFSTSK_H
#define _ARX_EVIDENCEFSTSK_H

#include "ArxEvidenceFS.h"
#include "tsk/libtsk.h"

/**
 * Evidence stored in a disk image (raw, split raw, or any format libtsk
 * was built with). Every file system found in the volume system becomes a
 * partition; an image without a volume system is scanned for a file
 * system at offset 0.
 *
 * libtsk handles are shared by all open files, so the class declares
 * itself not thread-safe and staging uses a single worker with it.
 * Files returned by open() must not outlive this object.
 */
class ARX_FRAMEWORK_API ArxEvidenceFSTsk : public ArxEvidenceFS
{
public:
    /**
     * @param a_images Image segment paths, in order.
     * @throws ArxSourceUnavailableException if the image cannot be opened
     * or holds no readable file system.
     */
    explicit ArxEvidenceFSTsk(const std::vector<std::string>& a_images);
    virtual ~ArxEvidenceFSTsk();

    virtual std::vector<ArxPartitionInfo> partitions() const;
    virtual std::vector<ArxFsEntry> list(int a_partition, const std::string& a_dir) const;
    virtual ArxFsEntry stat(int a_partition, const std::string& a_path) const;
    virtual std::unique_ptr<ArxEvidenceFile> open(int a_partition, const std::string& a_path) const;
    virtual bool isThreadSafe() const { return false; }

private:
    ArxEvidenceFSTsk(const ArxEvidenceFSTsk&);
    ArxEvidenceFSTsk& operator=(const ArxEvidenceFSTsk&);

    static TSK_WALK_RET_ENUM partWalkCallback(TSK_VS_INFO * a_vsInfo, const TSK_VS_PART_INFO * a_part, void * a_ptr);

    void addFileSystem(TSK_FS_INFO * a_fsInfo, const std::string& a_description);
    TSK_FS_INFO * fsInfo(int a_partition) const;
    ArxFsEntry toEntry(TSK_FS_INFO * a_fsInfo, const TSK_FS_FILE * a_file, const std::string& a_logicalPath) const;
    void close();

    std::vector<std::string> m_images;
    TSK_IMG_INFO * m_imgInfo;
    TSK_VS_INFO * m_vsInfo;
    std::vector<TSK_FS_INFO *> m_fileSystems;
    std::vector<ArxPartitionInfo> m_partitions;
};

#endif
