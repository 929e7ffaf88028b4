/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "ArxHashCalculator.h"
#include "ArxUtilities.h"
#include "ArxException.h"

#include "Poco/FileStream.h"
#include "Poco/Exception.h"

ArxHashCalculator::ArxHashCalculator()
: m_sha256Engine(Poco::SHA2Engine::SHA_256), m_bytes(0), m_finished(false)
{
    TSK_MD5_Init(&m_md5Ctx);
}

void ArxHashCalculator::update(const void * buffer, size_t length)
{
    if (m_finished)
        throw ArxException("ArxHashCalculator::update called after finish");
    if (length == 0)
        return;

    TSK_MD5_Update(&m_md5Ctx, (unsigned char *) buffer, (unsigned int) length);
    m_sha256Engine.update(buffer, (std::size_t) length);
    m_bytes += length;
}

void ArxHashCalculator::finish()
{
    if (m_finished)
        return;

    unsigned char md5Hash[16];
    TSK_MD5_Final(md5Hash, &m_md5Ctx);
    m_md5 = ArxUtilities::hexEncode(md5Hash, sizeof(md5Hash));

    m_sha256 = Poco::DigestEngine::digestToHex(m_sha256Engine.digest());
    m_finished = true;
}

ArxFileDigest ArxHashCalculator::hashFile(const std::string& path)
{
    ArxHashCalculator calc;
    try
    {
        Poco::FileInputStream in(path, std::ios::in | std::ios::binary);

        static const uint32_t FILE_BUFFER_SIZE = 32768;
        char buffer[FILE_BUFFER_SIZE];
        while (in.good())
        {
            in.read(buffer, FILE_BUFFER_SIZE);
            std::streamsize got = in.gcount();
            if (got > 0)
                calc.update(buffer, (size_t) got);
        }
        if (in.bad())
            throw ArxCandidateReadException("Read error on " + path);
    }
    catch (Poco::Exception& ex)
    {
        throw ArxCandidateReadException("Cannot hash " + path + ": " + ex.displayText());
    }
    calc.finish();

    ArxFileDigest digest;
    digest.md5 = calc.md5();
    digest.sha256 = calc.sha256();
    digest.bytes = calc.bytes();
    return digest;
}
