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
 * \file ArxHashCalculator.h
 * Single pass MD5 and SHA-256 computation.
 */

#ifndef _ARX_HASHCALCULATOR_H
#define _ARX_HASHCALCULATOR_H

#include <string>

#include "arx/framework_i.h"
#include "tsk/libtsk.h"
#include "Poco/SHA2Engine.h"

/// Digests of a whole file.
struct ArxFileDigest
{
    std::string md5;
    std::string sha256;
    uint64_t bytes;
};

/**
 * Feeds the same bytes to an MD5 and a SHA-256 context so that staged
 * content is hashed while it is copied, without a second read.
 */
class ARX_FRAMEWORK_API ArxHashCalculator
{
public:
    ArxHashCalculator();

    void update(const void * buffer, size_t length);

    /// Finalizes both digests. update() must not be called afterwards.
    void finish();

    const std::string& md5() const { return m_md5; }
    const std::string& sha256() const { return m_sha256; }
    uint64_t bytes() const { return m_bytes; }

    /**
     * Hash a host file.
     * @throws ArxCandidateReadException if the file cannot be read.
     */
    static ArxFileDigest hashFile(const std::string& path);

private:
    ArxHashCalculator(const ArxHashCalculator&);
    ArxHashCalculator& operator=(const ArxHashCalculator&);

    TSK_MD5_CTX m_md5Ctx;
    Poco::SHA2Engine m_sha256Engine;
    std::string m_md5;
    std::string m_sha256;
    uint64_t m_bytes;
    bool m_finished;
};

#endif
