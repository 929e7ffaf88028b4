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
 * \file ArxRecords.h
 * Closed set of parsed record shapes handed from parsers to ingestion.
 */

#ifndef _ARX_RECORDS_H
#define _ARX_RECORDS_H

#include <string>
#include <variant>
#include <vector>

#include "arx/framework_i.h"
#include "arx/utilities/ArxTimestamps.h"

/**
 * Artifact families known to the ingestion engine.
 */
enum ArxArtifactFamily {
    ARX_FAMILY_HISTORY,
    ARX_FAMILY_BOOKMARK,
    ARX_FAMILY_CACHE,
    ARX_FAMILY_IMAGE
};

/// "history", "bookmarks", "cache" or "images".
ARX_FRAMEWORK_API const char * arxFamilyName(ArxArtifactFamily a_family);

/// Inverse of arxFamilyName. Throws ArxConfigurationException for unknown names.
ARX_FRAMEWORK_API ArxArtifactFamily arxFamilyFromName(const std::string& a_name);

/**
 * Where a record came from. Filled by the parser from the manifest entry
 * it was given.
 */
struct ArxRecordSource
{
    ArxRecordSource() : partitionIndex(-1) {}

    /// Extractor that staged the file.
    std::string discoveredBy;
    /// Logical path of the source file inside the evidence.
    std::string sourcePath;
    int partitionIndex;
    std::string browser;
    std::string profile;
    /// dest_rel_path of the manifest entry that was parsed.
    std::string manifestRelPath;
};

struct ArxHistoryVisitRecord
{
    ArxHistoryVisitRecord() : visitCount(0), typedCount(0), hidden(false),
        visitDurationMs(-1), sourceVisitId(0), fromVisitId(0) {}

    ArxRecordSource source;
    std::string url;
    std::string title;
    ArxTimestamp visitTime;
    int64_t visitCount;
    int64_t typedCount;
    bool hidden;
    /// Symbolic transition (LINK, TYPED, ...) or UNKNOWN_<n>.
    std::string transition;
    /// -1 when not recorded.
    int64_t visitDurationMs;
    int64_t sourceVisitId;
    int64_t fromVisitId;
};

struct ArxBookmarkRecord
{
    ArxRecordSource source;
    std::string url;
    std::string title;
    /// Folder names from the root, joined with '/'.
    std::string folderPath;
    std::string guid;
    ArxTimestamp dateAdded;
    ArxTimestamp lastModified;
    std::string keyword;
    std::string tags;
};

struct ArxCacheEntryRecord
{
    ArxCacheEntryRecord() : httpStatus(0), fetchCount(0), bodySize(0), bodyDecoded(false) {}

    ArxRecordSource source;
    std::string url;
    std::string cacheKey;
    std::string cacheFilename;
    int httpStatus;
    std::string contentType;
    std::string contentEncoding;
    std::string responseHead;
    ArxTimestamp lastFetched;
    ArxTimestamp lastModified;
    ArxTimestamp expiration;
    int64_t fetchCount;
    /// Body as stored in the container.
    int64_t bodySize;
    std::string bodySha256;
    /// Decoded body, or the raw body when decoding was not possible.
    std::string body;
    bool bodyDecoded;
};

struct ArxImageRecord
{
    ArxImageRecord() : sizeBytes(0), fsInode(0), carvedOffsetBytes(-1) {}

    ArxRecordSource source;
    std::string sha256;
    std::string md5;
    int64_t sizeBytes;
    std::string filename;
    /// Staged location relative to the run directory.
    std::string relPath;
    /// jpeg, png, gif, bmp, webp, ico or tiff.
    std::string format;
    std::string fsPath;
    ArxTimestamp fsMtime;
    ArxTimestamp fsAtime;
    ArxTimestamp fsCtime;
    ArxTimestamp fsCrtime;
    uint64_t fsInode;
    /// -1 unless the image was carved.
    int64_t carvedOffsetBytes;
    std::string cacheUrl;
    std::string cacheKey;
    std::string cacheFilename;
};

/// A parsed record of any family.
typedef std::variant<ArxHistoryVisitRecord, ArxBookmarkRecord, ArxCacheEntryRecord, ArxImageRecord> ArxParsedRecord;

ARX_FRAMEWORK_API ArxArtifactFamily arxFamilyOf(const ArxParsedRecord& a_record);

/**
 * A non-fatal signal that something unknown or unparsable was found.
 * Stored append-only in extraction_warnings.
 */
struct ArxExtractionWarning
{
    enum Severity { INFO, WARNING, ERROR };

    ArxExtractionWarning() : severity(WARNING) {}

    static const char * severityName(Severity a_severity);

    std::string warningType;
    Severity severity;
    /// database, json or binary.
    std::string category;
    std::string itemName;
    std::string itemValue;
    /// JSON object with additional context.
    std::string contextJson;
    std::string artifactType;
    std::string sourceFile;
};

typedef std::vector<ArxExtractionWarning> ArxWarningList;

#endif
