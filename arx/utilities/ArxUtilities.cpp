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
 * \file ArxUtilities.cpp
 * Contains common utility methods.
 */

#include "ArxUtilities.h"
#include "ArxTimestamps.h"

// Poco Includes
#include "Poco/SHA2Engine.h"
#include "Poco/DigestEngine.h"
#include "Poco/Timestamp.h"

#include <tsk/libtsk.h>

// C/C++ library includes
#include <vector>

std::string ArxUtilities::cleanUTF8(const std::string &str)
{
    std::vector<char> buf(str.begin(), str.end());
    buf.push_back('\0');
    tsk_cleanupUTF8(&buf[0], '^');
    return std::string(&buf[0], str.size());
}

/**
 * Strip quotes from the beginning and end of the given string.
 * @param str The string to strip quotes from.
 * @returns The string without surrounding quotes.
 */
std::string ArxUtilities::stripQuotes(const std::string& str)
{
    std::string result = str;
    if (result.size() >= 2 && result[0] == '"' && result[result.size() - 1] == '"')
    {
        result = result.substr(1, result.size() - 2);
    }
    return result;
}

std::string ArxUtilities::toLowerAscii(const std::string& str)
{
    std::string result(str);
    for (size_t i = 0; i < result.size(); i++)
    {
        if (result[i] >= 'A' && result[i] <= 'Z')
            result[i] = result[i] - 'A' + 'a';
    }
    return result;
}

std::string ArxUtilities::toUpperAscii(const std::string& str)
{
    std::string result(str);
    for (size_t i = 0; i < result.size(); i++)
    {
        if (result[i] >= 'a' && result[i] <= 'z')
            result[i] = result[i] - 'a' + 'A';
    }
    return result;
}

std::vector<std::string> ArxUtilities::splitLogicalPath(const std::string& path)
{
    std::vector<std::string> segments;
    std::string segment;
    for (size_t i = 0; i < path.size(); i++)
    {
        char c = path[i];
        if (c == '/' || c == '\\')
        {
            if (!segment.empty() && segment != ".")
                segments.push_back(segment);
            segment.clear();
        }
        else
        {
            segment += c;
        }
    }
    if (!segment.empty() && segment != ".")
        segments.push_back(segment);
    return segments;
}

std::string ArxUtilities::normalizeLogicalPath(const std::string& path)
{
    std::vector<std::string> segments = splitLogicalPath(path);
    if (segments.empty())
        return "/";

    std::string result;
    for (size_t i = 0; i < segments.size(); i++)
    {
        result += '/';
        result += segments[i];
    }
    return result;
}

std::string ArxUtilities::joinLogicalPath(const std::string& dir, const std::string& name)
{
    if (dir.empty() || dir == "/")
        return "/" + name;
    if (dir[dir.size() - 1] == '/')
        return dir + name;
    return dir + "/" + name;
}

std::string ArxUtilities::baseName(const std::string& path)
{
    std::vector<std::string> segments = splitLogicalPath(path);
    return segments.empty() ? std::string() : segments.back();
}

std::string ArxUtilities::hexEncode(const unsigned char* data, size_t len)
{
    static const char hexMap[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; i++)
    {
        result += hexMap[(data[i] >> 4) & 0xf];
        result += hexMap[data[i] & 0xf];
    }
    return result;
}

std::string ArxUtilities::sha256Hex(const std::string& data)
{
    Poco::SHA2Engine engine(Poco::SHA2Engine::SHA_256);
    engine.update(data);
    return Poco::DigestEngine::digestToHex(engine.digest());
}

std::string ArxUtilities::utcNowIso()
{
    Poco::Timestamp now;
    return ArxTimestamps::unixMicrosToUtc(now.epochMicroseconds()).toIso();
}

uint32_t ArxUtilities::readBigEndian32(const unsigned char* p)
{
    return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) | ((uint32_t)p[2] << 8) | (uint32_t)p[3];
}

uint32_t ArxUtilities::readLittleEndian32(const unsigned char* p)
{
    return ((uint32_t)p[3] << 24) | ((uint32_t)p[2] << 16) | ((uint32_t)p[1] << 8) | (uint32_t)p[0];
}
