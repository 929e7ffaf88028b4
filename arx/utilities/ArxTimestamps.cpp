/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "ArxTimestamps.h"

#include "Poco/Timestamp.h"
#include "Poco/DateTime.h"

#include <cmath>
#include <stdio.h>

const int64_t ArxTimestamps::WEBKIT_EPOCH_OFFSET_SECONDS = 11644473600LL;
const int64_t ArxTimestamps::COCOA_EPOCH_OFFSET_SECONDS = 978307200LL;

namespace
{
    const int64_t MICROS_PER_SECOND = 1000000LL;

    // 1601-01-01T00:00:00Z and 9999-12-31T23:59:59.999999Z in Unix microseconds.
    const int64_t MIN_UNIX_MICROS = -11644473600LL * MICROS_PER_SECOND;
    const int64_t MAX_UNIX_MICROS = 253402300799999999LL;

    ArxTimestamp checked(int64_t unixMicros)
    {
        if (unixMicros < MIN_UNIX_MICROS || unixMicros > MAX_UNIX_MICROS)
            return ArxTimestamp::unknown();
        return ArxTimestamp::fromUnixMicros(unixMicros);
    }
}

ArxTimestamp ArxTimestamp::fromUnixMicros(int64_t micros)
{
    ArxTimestamp ts;
    ts.m_known = true;
    ts.m_micros = micros;
    return ts;
}

std::string ArxTimestamp::toIso() const
{
    if (!m_known)
        return "";

    Poco::DateTime dt((Poco::Timestamp(m_micros)));
    int fraction = dt.millisecond() * 1000 + dt.microsecond();

    char buf[40];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06dZ",
        dt.year(), dt.month(), dt.day(), dt.hour(), dt.minute(), dt.second(), fraction);
    return std::string(buf);
}

ArxTimestamp ArxTimestamp::fromIso(const std::string& iso)
{
    int year, month, day, hour, minute, second, fraction;
    if (iso.size() != 27 || sscanf(iso.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%6dZ",
            &year, &month, &day, &hour, &minute, &second, &fraction) != 7)
    {
        return ArxTimestamp::unknown();
    }

    if (!Poco::DateTime::isValid(year, month, day, hour, minute, second, fraction / 1000, fraction % 1000))
        return ArxTimestamp::unknown();

    Poco::DateTime dt(year, month, day, hour, minute, second, fraction / 1000, fraction % 1000);
    return ArxTimestamp::fromUnixMicros(dt.timestamp().epochMicroseconds());
}

ArxTimestamp ArxTimestamp::earliest(const ArxTimestamp& a, const ArxTimestamp& b)
{
    if (!a.isKnown())
        return b;
    if (!b.isKnown())
        return a;
    return a.m_micros <= b.m_micros ? a : b;
}

ArxTimestamp ArxTimestamp::latest(const ArxTimestamp& a, const ArxTimestamp& b)
{
    if (!a.isKnown())
        return b;
    if (!b.isKnown())
        return a;
    return a.m_micros >= b.m_micros ? a : b;
}

ArxTimestamp ArxTimestamps::webkitToUtc(std::optional<int64_t> value)
{
    if (!value || *value <= 0)
        return ArxTimestamp::unknown();
    return checked(*value - WEBKIT_EPOCH_OFFSET_SECONDS * MICROS_PER_SECOND);
}

ArxTimestamp ArxTimestamps::prtimeToUtc(std::optional<int64_t> value)
{
    if (!value || *value == 0)
        return ArxTimestamp::unknown();
    return checked(*value);
}

ArxTimestamp ArxTimestamps::unixSecondsToUtc(std::optional<int64_t> value)
{
    if (!value || *value == 0)
        return ArxTimestamp::unknown();
    if (*value > MAX_UNIX_MICROS / MICROS_PER_SECOND || *value < MIN_UNIX_MICROS / MICROS_PER_SECOND)
        return ArxTimestamp::unknown();
    return checked(*value * MICROS_PER_SECOND);
}

ArxTimestamp ArxTimestamps::unixMillisToUtc(std::optional<int64_t> value)
{
    if (!value || *value == 0)
        return ArxTimestamp::unknown();
    if (*value > MAX_UNIX_MICROS / 1000 || *value < MIN_UNIX_MICROS / 1000)
        return ArxTimestamp::unknown();
    return checked(*value * 1000);
}

ArxTimestamp ArxTimestamps::filetimeToUtc(std::optional<int64_t> value)
{
    if (!value || *value <= 0)
        return ArxTimestamp::unknown();
    return checked(*value / 10 - WEBKIT_EPOCH_OFFSET_SECONDS * MICROS_PER_SECOND);
}

ArxTimestamp ArxTimestamps::cocoaToUtc(std::optional<double> value)
{
    if (!value || *value == 0.0 || std::isnan(*value) || std::isinf(*value))
        return ArxTimestamp::unknown();

    double micros = std::floor((*value + (double)COCOA_EPOCH_OFFSET_SECONDS) * (double)MICROS_PER_SECOND + 0.5);
    if (micros < (double)MIN_UNIX_MICROS || micros > (double)MAX_UNIX_MICROS)
        return ArxTimestamp::unknown();
    return ArxTimestamp::fromUnixMicros((int64_t)micros);
}

ArxTimestamp ArxTimestamps::unixMicrosToUtc(int64_t micros)
{
    return checked(micros);
}
