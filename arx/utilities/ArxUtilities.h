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
 * \file ArxUtilities.h
 * Contains common utility methods.
 */

#ifndef _ARX_UTILITIES_H
#define _ARX_UTILITIES_H

#include <string>
#include <vector>

#include "arx/framework_i.h"

/**
 * Contains commonly needed utility methods.  Refer to the poco library
 * for other commonly needed methods.
 */
class ARX_FRAMEWORK_API ArxUtilities
{
public:
    /// Replaces invalid UTF-8 sequences read from evidence with '^'.
    static std::string cleanUTF8(const std::string& str);

    static std::string stripQuotes(const std::string& str);
    static std::string toLowerAscii(const std::string& str);
    static std::string toUpperAscii(const std::string& str);

    /**
     * Normalize an evidence path: backslashes become '/', duplicate
     * separators and "." segments are removed, the result starts with '/'
     * and has no trailing separator.
     */
    static std::string normalizeLogicalPath(const std::string& path);

    /// Splits a normalized logical path into its non-empty segments.
    static std::vector<std::string> splitLogicalPath(const std::string& path);

    /// Joins a directory logical path and a child name.
    static std::string joinLogicalPath(const std::string& dir, const std::string& name);

    /// Returns the last segment of a logical path.
    static std::string baseName(const std::string& path);

    static std::string hexEncode(const unsigned char* data, size_t len);
    static std::string sha256Hex(const std::string& data);

    /// Current UTC time in the framework's ISO-8601 form.
    static std::string utcNowIso();

    static uint32_t readBigEndian32(const unsigned char* p);
    static uint32_t readLittleEndian32(const unsigned char* p);
};

#endif
