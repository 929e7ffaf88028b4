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
 * \file ArxCache2Parser.cpp
 */

#include "ArxCache2Parser.h"
#include "ArxContentDecoder.h"
#include "ArxImageParser.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxHashCalculator.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxTimestamps.h"
#include "arx/utilities/ArxUtilities.h"

// Poco includes
#include "Poco/File.h"
#include "Poco/FileStream.h"
#include "Poco/Path.h"
#include "Poco/URI.h"
#include "Poco/NumberParser.h"
#include "Poco/StreamCopier.h"
#include "Poco/String.h"
#include "Poco/Exception.h"
#include "Poco/JSON/Object.h"

#include <algorithm>
#include <optional>
#include <set>
#include <sstream>

const char * ArxCache2Parser::ID = "firefox_cache2";
const uint32_t ArxCache2Parser::CHUNK_SIZE = 256 * 1024;
const char * ArxCache2Parser::CACHE_IMAGE_DIR = "cache_images";

namespace
{
    const size_t TRAILER_SIZE = 4;
    const size_t CHECKSUM_SIZE = 4;
    const size_t HEADER_SIZE_V1 = 28;
    const size_t HEADER_SIZE = 32;
    /// Entry files larger than this are not loaded.
    const Poco::UInt64 MAX_ENTRY_SIZE = 512 * 1024 * 1024;
    const uint32_t NO_EXPIRATION = 0xFFFFFFFF;

    const std::set<std::string> KNOWN_ELEMENTS = {
        "request-method", "response-head", "original-response-headers", "security-info",
        "alt-data", "alt-data-info", "net-response-time-onstart", "net-response-time-onstop",
        "ctid", "eTag", "necko:classified", "necko:cookie-banner-handling", "cookie-banner-handling"
    };

    inline void mix(uint32_t& a, uint32_t& b, uint32_t& c)
    {
        a -= b; a -= c; a ^= (c >> 13);
        b -= c; b -= a; b ^= (a << 8);
        c -= a; c -= b; c ^= (b >> 13);
        a -= b; a -= c; a ^= (c >> 12);
        b -= c; b -= a; b ^= (a << 16);
        c -= a; c -= b; c ^= (b >> 5);
        a -= b; a -= c; a ^= (c >> 3);
        b -= c; b -= a; b ^= (a << 10);
        c -= a; c -= b; c ^= (b >> 15);
    }

    void appendBigEndian32(std::string& out, uint32_t value)
    {
        out += (char)((value >> 24) & 0xFF);
        out += (char)((value >> 16) & 0xFF);
        out += (char)((value >> 8) & 0xFF);
        out += (char)(value & 0xFF);
    }

    std::string toHex32(uint32_t value)
    {
        std::ostringstream text;
        text << std::hex << value;
        return text.str();
    }

    std::optional<int64_t> secondsOrNull(uint32_t value)
    {
        if (value == 0 || value == NO_EXPIRATION)
            return std::nullopt;
        return (int64_t)value;
    }

    /// Status code, MIME type and encoding from a raw response head.
    void readResponseHead(const std::string& head, ArxCacheEntryRecord& record)
    {
        std::istringstream lines(head);
        std::string line;
        bool first = true;
        while (std::getline(lines, line))
        {
            if (!line.empty() && line[line.size() - 1] == '\r')
                line.erase(line.size() - 1);

            if (first)
            {
                first = false;
                // HTTP/1.1 200 OK
                size_t space = line.find(' ');
                if (space != std::string::npos)
                {
                    int status = 0;
                    if (Poco::NumberParser::tryParse(line.substr(space + 1, 3), status))
                        record.httpStatus = status;
                }
                continue;
            }

            size_t colon = line.find(':');
            if (colon == std::string::npos)
                continue;
            std::string name = ArxUtilities::toLowerAscii(Poco::trim(line.substr(0, colon)));
            std::string value = Poco::trim(line.substr(colon + 1));

            if (name == "content-type")
                record.contentType = Poco::trim(value.substr(0, value.find(';')));
            else if (name == "content-encoding")
                record.contentEncoding = value;
        }
    }
}

std::string ArxCache2Entry::element(const std::string& a_name) const
{
    for (size_t i = 0; i < elements.size(); i++)
    {
        if (elements[i].first == a_name)
            return elements[i].second;
    }
    return "";
}

std::string ArxCache2Parser::id() const
{
    return ID;
}

std::vector<ArxArtifactFamily> ArxCache2Parser::families() const
{
    std::vector<ArxArtifactFamily> families;
    families.push_back(ARX_FAMILY_CACHE);
    families.push_back(ARX_FAMILY_IMAGE);
    return families;
}

uint32_t ArxCache2Parser::lookup2Hash(const unsigned char * a_data, size_t a_length, uint32_t a_initval)
{
    const unsigned char * k = a_data;
    uint32_t a = 0x9e3779b9;
    uint32_t b = 0x9e3779b9;
    uint32_t c = a_initval;
    size_t len = a_length;

    while (len >= 12)
    {
        a += k[0] + ((uint32_t)k[1] << 8) + ((uint32_t)k[2] << 16) + ((uint32_t)k[3] << 24);
        b += k[4] + ((uint32_t)k[5] << 8) + ((uint32_t)k[6] << 16) + ((uint32_t)k[7] << 24);
        c += k[8] + ((uint32_t)k[9] << 8) + ((uint32_t)k[10] << 16) + ((uint32_t)k[11] << 24);
        mix(a, b, c);
        k += 12;
        len -= 12;
    }

    c += (uint32_t)a_length;
    // The low byte of c is reserved for the length.
    switch (len)
    {
    case 11: c += ((uint32_t)k[10] << 24); // fall through
    case 10: c += ((uint32_t)k[9] << 16);  // fall through
    case 9:  c += ((uint32_t)k[8] << 8);   // fall through
    case 8:  b += ((uint32_t)k[7] << 24);  // fall through
    case 7:  b += ((uint32_t)k[6] << 16);  // fall through
    case 6:  b += ((uint32_t)k[5] << 8);   // fall through
    case 5:  b += k[4];                    // fall through
    case 4:  a += ((uint32_t)k[3] << 24);  // fall through
    case 3:  a += ((uint32_t)k[2] << 16);  // fall through
    case 2:  a += ((uint32_t)k[1] << 8);   // fall through
    case 1:  a += k[0];
    default: break;
    }
    mix(a, b, c);
    return c;
}

ArxResult<ArxCache2Entry> ArxCache2Parser::parseContainer(const std::string& a_data)
{
    const unsigned char * data = (const unsigned char *)a_data.data();
    const size_t size = a_data.size();

    if (size < TRAILER_SIZE + CHECKSUM_SIZE + HEADER_SIZE_V1)
        return ArxResult<ArxCache2Entry>::failure("corrupt_container", "binary", "file too small for a cache2 entry");

    const size_t metaEnd = size - TRAILER_SIZE;
    const size_t metaOffset = ArxUtilities::readBigEndian32(data + metaEnd);
    if (metaOffset > metaEnd)
    {
        std::ostringstream msg;
        msg << "metadata offset " << metaOffset << " outside file of " << size << " bytes";
        return ArxResult<ArxCache2Entry>::failure("corrupt_container", "binary", msg.str());
    }

    const size_t hashCount = (metaOffset + CHUNK_SIZE - 1) / CHUNK_SIZE;
    const size_t hashesOffset = metaOffset + CHECKSUM_SIZE;
    const size_t headerOffset = hashesOffset + hashCount * 2;
    if (headerOffset + HEADER_SIZE_V1 > metaEnd)
        return ArxResult<ArxCache2Entry>::failure("corrupt_container", "binary", "metadata header outside file");

    // Nothing after the offset trailer is trusted until the checksum holds.
    uint32_t stored = ArxUtilities::readBigEndian32(data + metaOffset);
    uint32_t computed = lookup2Hash(data + hashesOffset, metaEnd - hashesOffset);
    if (stored != computed)
    {
        return ArxResult<ArxCache2Entry>::failure("corrupt_container", "binary",
            "metadata checksum mismatch: stored " + toHex32(stored) + ", computed " + toHex32(computed));
    }

    ArxCache2Entry entry;
    const unsigned char * header = data + headerOffset;
    entry.version = ArxUtilities::readBigEndian32(header);
    entry.fetchCount = ArxUtilities::readBigEndian32(header + 4);
    entry.lastFetched = ArxUtilities::readBigEndian32(header + 8);
    entry.lastModified = ArxUtilities::readBigEndian32(header + 12);
    entry.frecency = ArxUtilities::readBigEndian32(header + 16);
    entry.expiration = ArxUtilities::readBigEndian32(header + 20);
    const size_t keySize = ArxUtilities::readBigEndian32(header + 24);

    size_t headerSize = HEADER_SIZE_V1;
    if (entry.version >= 2)
    {
        headerSize = HEADER_SIZE;
        if (headerOffset + headerSize > metaEnd)
            return ArxResult<ArxCache2Entry>::failure("corrupt_container", "binary", "metadata header outside file");
        entry.flags = ArxUtilities::readBigEndian32(header + 28);
    }

    const size_t keyOffset = headerOffset + headerSize;
    if (keySize == 0 || keySize + 1 > metaEnd - keyOffset)
        return ArxResult<ArxCache2Entry>::failure("corrupt_container", "binary", "key size outside metadata");
    entry.key = ArxUtilities::cleanUTF8(a_data.substr(keyOffset, keySize));

    size_t pos = keyOffset + keySize + 1;
    while (pos < metaEnd)
    {
        size_t nameEnd = a_data.find('\0', pos);
        if (nameEnd == std::string::npos || nameEnd >= metaEnd || nameEnd == pos)
            break;
        size_t valueEnd = a_data.find('\0', nameEnd + 1);
        if (valueEnd == std::string::npos || valueEnd > metaEnd)
            valueEnd = metaEnd;

        entry.elements.push_back(std::make_pair(a_data.substr(pos, nameEnd - pos),
            a_data.substr(nameEnd + 1, valueEnd - nameEnd - 1)));
        pos = valueEnd + 1;
    }

    entry.body = a_data.substr(0, metaOffset);
    return entry;
}

std::string ArxCache2Parser::buildContainer(const ArxCache2Entry& a_entry)
{
    std::string meta;
    size_t hashCount = (a_entry.body.size() + CHUNK_SIZE - 1) / CHUNK_SIZE;
    for (size_t i = 0; i < hashCount; i++)
    {
        uint32_t chunkEnd = (uint32_t)std::min(a_entry.body.size(), (i + 1) * (size_t)CHUNK_SIZE);
        uint32_t hash = lookup2Hash((const unsigned char *)a_entry.body.data() + i * CHUNK_SIZE,
            chunkEnd - i * CHUNK_SIZE);
        meta += (char)((hash >> 8) & 0xFF);
        meta += (char)(hash & 0xFF);
    }

    appendBigEndian32(meta, 3);
    appendBigEndian32(meta, a_entry.fetchCount);
    appendBigEndian32(meta, a_entry.lastFetched);
    appendBigEndian32(meta, a_entry.lastModified);
    appendBigEndian32(meta, a_entry.frecency);
    appendBigEndian32(meta, a_entry.expiration);
    appendBigEndian32(meta, (uint32_t)a_entry.key.size());
    appendBigEndian32(meta, a_entry.flags);
    meta += a_entry.key;
    meta += '\0';
    for (size_t i = 0; i < a_entry.elements.size(); i++)
    {
        meta += a_entry.elements[i].first;
        meta += '\0';
        meta += a_entry.elements[i].second;
        meta += '\0';
    }

    std::string data = a_entry.body;
    appendBigEndian32(data, lookup2Hash((const unsigned char *)meta.data(), meta.size()));
    data += meta;
    appendBigEndian32(data, (uint32_t)a_entry.body.size());
    return data;
}

std::string ArxCache2Parser::urlFromKey(const std::string& a_key)
{
    // Origin attributes come before ":" and the URL; take the last match.
    size_t marker = a_key.rfind(",:http");
    size_t start = std::string::npos;
    if (marker != std::string::npos)
        start = marker + 2;
    else if (a_key.compare(0, 5, ":http") == 0)
        start = 1;
    else
    {
        size_t https = a_key.find("https://");
        size_t http = a_key.find("http://");
        start = std::min(https, http);
    }

    if (start == std::string::npos)
        return "";

    size_t end = a_key.find_first_of(" \t\r\n", start);
    return a_key.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

ArxParseResult ArxCache2Parser::parse(const ArxParseInput& a_input) const
{
    ArxParseResult result;

    std::string data;
    try
    {
        Poco::FileInputStream input(a_input.stagedPath(), std::ios::in | std::ios::binary);
        if (a_input.entry.sizeBytes > 0 && (Poco::UInt64)a_input.entry.sizeBytes > MAX_ENTRY_SIZE)
        {
            ArxParseError error = { "file_corrupt", "binary", "cache entry exceeds the size limit" };
            result.warnings.push_back(errorWarning(a_input, error));
            return result;
        }
        Poco::StreamCopier::copyToString(input, data);
    }
    catch (Poco::Exception& ex)
    {
        ArxParseError error = { "file_corrupt", "binary", "cannot read staged cache entry: " + ex.displayText() };
        result.warnings.push_back(errorWarning(a_input, error));
        return result;
    }

    ArxResult<ArxCache2Entry> container = parseContainer(data);
    if (!container.ok())
    {
        result.warnings.push_back(errorWarning(a_input, container.error()));
        result.failedRecords++;
        return result;
    }
    const ArxCache2Entry& entry = container.value();

    ArxCacheEntryRecord record;
    record.source = a_input.recordSource();
    record.cacheKey = entry.key;
    record.url = urlFromKey(entry.key);
    record.cacheFilename = a_input.entry.source.logicalPath.empty() ? a_input.entry.destFilename
        : ArxUtilities::baseName(a_input.entry.source.logicalPath);
    record.responseHead = ArxUtilities::cleanUTF8(entry.element("response-head"));
    record.lastFetched = ArxTimestamps::unixSecondsToUtc(secondsOrNull(entry.lastFetched));
    record.lastModified = ArxTimestamps::unixSecondsToUtc(secondsOrNull(entry.lastModified));
    record.expiration = ArxTimestamps::unixSecondsToUtc(secondsOrNull(entry.expiration));
    record.fetchCount = entry.fetchCount;
    record.bodySize = (int64_t)entry.body.size();
    record.bodySha256 = ArxUtilities::sha256Hex(entry.body);
    readResponseHead(record.responseHead, record);

    std::set<std::string> elementNames;
    for (size_t i = 0; i < entry.elements.size(); i++)
    {
        // predictor::<uri> elements are per-resource and open ended.
        if (entry.elements[i].first.compare(0, 11, "predictor::") != 0)
            elementNames.insert(entry.elements[i].first);
    }
    reportUnknownNames(a_input, result, elementNames, KNOWN_ELEMENTS, "unknown_enum_value", "binary", "cache2 elements");

    if (ArxContentDecoder::isIdentity(record.contentEncoding))
    {
        record.body = entry.body;
        record.bodyDecoded = true;
    }
    else
    {
        try
        {
            record.body = ArxContentDecoder::decode(record.contentEncoding, entry.body);
            record.bodyDecoded = true;
        }
        catch (ArxParseException& ex)
        {
            // Keep the raw body rather than losing the record.
            record.body = entry.body;
            record.bodyDecoded = false;

            Poco::JSON::Object context;
            context.set("url", record.url);
            context.set("content_encoding", record.contentEncoding);
            std::ostringstream json;
            context.stringify(json);
            result.warnings.push_back(makeWarning(a_input, "compression_error", ArxExtractionWarning::WARNING,
                "binary", "content-encoding", ex.message(), json.str()));
        }
    }

    result.records.push_back(record);

    if (record.bodyDecoded)
    {
        std::optional<ArxImageRecord> image = cachedImage(a_input, record, result);
        if (image)
            result.records.push_back(*image);
    }
    return result;
}

std::optional<ArxImageRecord> ArxCache2Parser::cachedImage(const ArxParseInput& a_input,
    const ArxCacheEntryRecord& a_record, ArxParseResult& a_result)
{
    std::string format = ArxImageParser::sniffFormat(a_record.body.substr(0, 16));
    if (format.empty())
        return std::nullopt;

    ArxHashCalculator hash;
    hash.update(a_record.body.data(), a_record.body.size());
    hash.finish();

    // Decoded bodies are written once per content below the run directory.
    std::string relPath = std::string(CACHE_IMAGE_DIR) + "/" + hash.sha256() + "." + format;
    Poco::Path imagePath(Poco::Path::forDirectory(a_input.runDir));
    imagePath.append(Poco::Path(relPath, Poco::Path::PATH_UNIX));
    try
    {
        Poco::File imageFile(imagePath);
        if (!imageFile.exists() || imageFile.getSize() != a_record.body.size())
        {
            Poco::File(imagePath.parent()).createDirectories();
            Poco::FileOutputStream out(imagePath.toString(), std::ios::out | std::ios::binary | std::ios::trunc);
            out.write(a_record.body.data(), (std::streamsize)a_record.body.size());
            out.close();
            if (!out.good())
                throw Poco::WriteFileException(imagePath.toString());
        }
    }
    catch (Poco::Exception& ex)
    {
        std::stringstream msg;
        msg << "ArxCache2Parser::cachedImage - cannot write " << relPath << ": " << ex.displayText();
        LOGERROR(msg.str());
        a_result.warnings.push_back(makeWarning(a_input, "cache_image_error", ArxExtractionWarning::ERROR,
            "binary", a_record.url, ex.displayText()));
        return std::nullopt;
    }

    const ArxCandidateArtifact& source = a_input.entry.source;

    ArxImageRecord image;
    image.source = a_input.recordSource();
    image.sha256 = hash.sha256();
    image.md5 = hash.md5();
    image.sizeBytes = (int64_t)hash.bytes();
    image.relPath = relPath;
    image.format = format;
    image.fsPath = source.logicalPath;
    image.fsMtime = source.mtime;
    image.fsAtime = source.atime;
    image.fsCtime = source.ctime;
    image.fsCrtime = source.crtime;
    image.fsInode = source.inode;
    image.cacheUrl = a_record.url;
    image.cacheKey = a_record.cacheKey;
    image.cacheFilename = a_record.cacheFilename;

    try
    {
        image.filename = ArxUtilities::baseName(Poco::URI(a_record.url).getPath());
    }
    catch (Poco::SyntaxException&)
    {
        image.filename.clear();
    }
    if (image.filename.empty())
        image.filename = hash.sha256() + "." + format;
    return image;
}
