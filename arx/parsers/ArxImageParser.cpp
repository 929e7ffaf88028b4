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
 * \file ArxImageParser.cpp
 */

#include "ArxImageParser.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxHashCalculator.h"
#include "arx/utilities/ArxUtilities.h"

// Poco includes
#include "Poco/FileStream.h"
#include "Poco/Exception.h"

#include <sstream>

const char * ArxImageParser::ID = "filesystem_images";

namespace
{
    const size_t SNIFF_SIZE = 16;

    bool startsWith(const std::string& data, const char * magic, size_t length, size_t offset = 0)
    {
        return data.size() >= offset + length && data.compare(offset, length, magic, length) == 0;
    }
}

std::string ArxImageParser::id() const
{
    return ID;
}

std::vector<ArxArtifactFamily> ArxImageParser::families() const
{
    return std::vector<ArxArtifactFamily>(1, ARX_FAMILY_IMAGE);
}

std::string ArxImageParser::sniffFormat(const std::string& a_header)
{
    if (startsWith(a_header, "\xFF\xD8\xFF", 3))
        return "jpeg";
    if (startsWith(a_header, "\x89PNG\r\n\x1A\n", 8))
        return "png";
    if (startsWith(a_header, "GIF87a", 6) || startsWith(a_header, "GIF89a", 6))
        return "gif";
    if (startsWith(a_header, "RIFF", 4) && startsWith(a_header, "WEBP", 4, 8))
        return "webp";
    if (startsWith(a_header, "II*\0", 4) || startsWith(a_header, "MM\0*", 4))
        return "tiff";
    if (startsWith(a_header, "\0\0\1\0", 4))
        return "ico";
    if (startsWith(a_header, "BM", 2) && a_header.size() >= 14)
        return "bmp";
    return "";
}

ArxParseResult ArxImageParser::parse(const ArxParseInput& a_input) const
{
    ArxParseResult result;
    std::string path = a_input.stagedPath();

    std::string header(SNIFF_SIZE, '\0');
    try
    {
        Poco::FileInputStream input(path, std::ios::in | std::ios::binary);
        input.read(&header[0], (std::streamsize)header.size());
        header.resize((size_t)input.gcount());
    }
    catch (Poco::Exception& ex)
    {
        ArxParseError error = { "file_corrupt", "binary", "cannot read image: " + ex.displayText() };
        result.warnings.push_back(errorWarning(a_input, error));
        return result;
    }

    std::string format = sniffFormat(header);
    if (format.empty())
    {
        result.warnings.push_back(makeWarning(a_input, "unrecognized_format", ArxExtractionWarning::WARNING,
            "binary", a_input.entry.destFilename, ArxUtilities::hexEncode((const unsigned char *)header.data(), header.size())));
        return result;
    }

    ArxFileDigest digest;
    try
    {
        digest = ArxHashCalculator::hashFile(path);
    }
    catch (ArxCandidateReadException& ex)
    {
        ArxParseError error = { "file_corrupt", "binary", ex.message() };
        result.warnings.push_back(errorWarning(a_input, error));
        return result;
    }

    if (!a_input.entry.sha256.empty() && digest.sha256 != a_input.entry.sha256)
    {
        std::ostringstream msg;
        msg << "ArxImageParser::parse - staged file " << a_input.entry.destRelPath
            << " no longer matches its manifest hash";
        LOGWARN(msg.str());
        ArxParseError error = { "hash_mismatch", "binary", "staged file changed after extraction" };
        result.warnings.push_back(errorWarning(a_input, error));
        result.failedRecords++;
        return result;
    }

    const ArxCandidateArtifact& source = a_input.entry.source;

    ArxImageRecord image;
    image.source = a_input.recordSource();
    image.sha256 = digest.sha256;
    image.md5 = digest.md5;
    image.sizeBytes = (int64_t)digest.bytes;
    image.filename = ArxUtilities::baseName(source.logicalPath);
    image.relPath = a_input.entry.destRelPath;
    image.format = format;
    image.fsPath = source.logicalPath;
    image.fsMtime = source.mtime;
    image.fsAtime = source.atime;
    image.fsCtime = source.ctime;
    image.fsCrtime = source.crtime;
    image.fsInode = source.inode;
    image.carvedOffsetBytes = a_input.entry.sourceOffsetBytes;
    if (a_input.entry.role == "carved")
        image.filename = a_input.entry.destFilename;

    result.records.push_back(image);
    return result;
}
