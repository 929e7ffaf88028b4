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
 * \file ArxTimestamps.h
 * Named conversions from the epochs used by browser and operating system
 * artifacts to UTC.
 */

#ifndef _ARX_TIMESTAMPS_H
#define _ARX_TIMESTAMPS_H

#include <string>
#include <optional>

#include "arx/framework_i.h"

/**
 * A UTC point in time with microsecond precision, or an explicit
 * "unknown". Unknown timestamps are stored as NULL and never replaced
 * by the current time.
 */
class ARX_FRAMEWORK_API ArxTimestamp
{
public:
    /// Creates an unknown timestamp.
    ArxTimestamp() : m_known(false), m_micros(0) {}

    static ArxTimestamp unknown() { return ArxTimestamp(); }
    static ArxTimestamp fromUnixMicros(int64_t micros);

    /// Parses the form produced by toIso(). Returns unknown on failure.
    static ArxTimestamp fromIso(const std::string& iso);

    bool isKnown() const { return m_known; }
    int64_t unixMicros() const { return m_micros; }

    /**
     * Fixed width ISO-8601 rendering, YYYY-MM-DDTHH:MM:SS.ffffffZ, so that
     * string order equals time order. Empty for unknown timestamps.
     */
    std::string toIso() const;

    /// Earlier of two timestamps, ignoring unknown ones.
    static ArxTimestamp earliest(const ArxTimestamp& a, const ArxTimestamp& b);

    /// Later of two timestamps, ignoring unknown ones.
    static ArxTimestamp latest(const ArxTimestamp& a, const ArxTimestamp& b);

    bool operator==(const ArxTimestamp& other) const
    {
        return m_known == other.m_known && (!m_known || m_micros == other.m_micros);
    }
    bool operator!=(const ArxTimestamp& other) const { return !(*this == other); }

private:
    bool m_known;
    int64_t m_micros;
};

/**
 * Epoch conversion functions. Every artifact timestamp goes through
 * exactly one of these. NULL and zero inputs, and results outside
 * 1601-01-01 .. 9999-12-31, produce ArxTimestamp::unknown().
 */
class ARX_FRAMEWORK_API ArxTimestamps
{
public:
    /// Chromium/WebKit: microseconds since 1601-01-01.
    static ArxTimestamp webkitToUtc(std::optional<int64_t> value);

    /// Mozilla PRTime: microseconds since 1970-01-01.
    static ArxTimestamp prtimeToUtc(std::optional<int64_t> value);

    /// Unix time in seconds since 1970-01-01.
    static ArxTimestamp unixSecondsToUtc(std::optional<int64_t> value);

    /// Unix time in milliseconds since 1970-01-01.
    static ArxTimestamp unixMillisToUtc(std::optional<int64_t> value);

    /// Windows FILETIME: 100 nanosecond intervals since 1601-01-01.
    static ArxTimestamp filetimeToUtc(std::optional<int64_t> value);

    /// Cocoa/Mac absolute time: seconds (fractional) since 2001-01-01.
    static ArxTimestamp cocoaToUtc(std::optional<double> value);

    /// Unix time in microseconds. Used for clocks, not for artifact data.
    static ArxTimestamp unixMicrosToUtc(int64_t micros);

    /// Seconds between 1601-01-01 and 1970-01-01.
    static const int64_t WEBKIT_EPOCH_OFFSET_SECONDS;

    /// Seconds between 1970-01-01 and 2001-01-01.
    static const int64_t COCOA_EPOCH_OFFSET_SECONDS;
};

#endif
