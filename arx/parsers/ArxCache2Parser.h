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
 * \file ArxCache2Parser.h
 * Firefox cache2 entry files.
 */

#ifndef _ARX_CACHE2PARSER_H
#define _ARX_CACHE2PARSER_H

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "arx/parsers/ArxParser.h"

/**
 * Decoded container of one cache2 entry file. All integers in the file
 * are big endian:
 *
 * \verbatim
 body                          offset 0, metaOffset bytes
 checksum (uint32)             lookup2 hash of everything up to the trailer
 chunk hashes (uint16 each)    one per started 256 KiB of body
 header                        version, fetchCount, lastFetched, lastModified,
                               frecency, expirationTime, keySize[, flags]
 key + NUL
 elements                      name NUL value NUL ...
 metaOffset (uint32)           last four bytes of the file
 \endverbatim
 */
struct ARX_FRAMEWORK_API ArxCache2Entry
{
    ArxCache2Entry() : version(0), fetchCount(0), lastFetched(0), lastModified(0),
        frecency(0), expiration(0), flags(0) {}

    uint32_t version;
    uint32_t fetchCount;
    uint32_t lastFetched;
    uint32_t lastModified;
    uint32_t frecency;
    uint32_t expiration;
    uint32_t flags;
    std::string key;
    std::vector<std::pair<std::string, std::string> > elements;
    std::string body;

    /// Value of an element, or empty.
    std::string element(const std::string& a_name) const;
};

/**
 * Cache entries (with decoded bodies) from Firefox cache2 entry files.
 * A decoded body that is an image is also written to CACHE_IMAGE_DIR in
 * the run directory and reported as an image found at the cache URL.
 * The metadata checksum is verified before any header field is used;
 * bad checksums and out of range offsets become corrupt_container
 * warnings. Times are Unix seconds (ArxTimestamps::unixSecondsToUtc).
 */
class ARX_FRAMEWORK_API ArxCache2Parser : public ArxParser
{
public:
    static const char * ID;
    static const uint32_t CHUNK_SIZE;
    static const char * CACHE_IMAGE_DIR;

    virtual std::string id() const;
    virtual std::vector<ArxArtifactFamily> families() const;
    virtual ArxParseResult parse(const ArxParseInput& a_input) const;

    /// Validates and splits a whole entry file.
    static ArxResult<ArxCache2Entry> parseContainer(const std::string& a_data);

    /// Bob Jenkins' lookup2 hash as Firefox's CacheHash::Hash computes it.
    static uint32_t lookup2Hash(const unsigned char * a_data, size_t a_length, uint32_t a_initval = 0);

    /// URL part of a cache key such as "a,:https://host/path" or "O^partitionKey=...,:http://...".
    static std::string urlFromKey(const std::string& a_key);

    /// Serializes an entry in the on-disk layout (version 3 header). Used to write fixtures.
    static std::string buildContainer(const ArxCache2Entry& a_entry);

private:
    static std::optional<ArxImageRecord> cachedImage(const ArxParseInput& a_input,
        const ArxCacheEntryRecord& a_record, ArxParseResult& a_result);
};

#endif
