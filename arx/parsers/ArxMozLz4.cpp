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
 * \file ArxMozLz4.cpp
 */

#include "ArxMozLz4.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxUtilities.h"

#include "lz4.h"

#include <cstring>
#include <sstream>
#include <vector>

const char ArxMozLz4::MAGIC[8] = { 'm', 'o', 'z', 'L', 'z', '4', '0', '\0' };
const size_t ArxMozLz4::HEADER_SIZE = 12;
const uint32_t ArxMozLz4::MAX_DECOMPRESSED_SIZE = 512 * 1024 * 1024;

bool ArxMozLz4::hasMagic(const std::string& a_data)
{
    return a_data.size() >= sizeof(MAGIC) && std::memcmp(a_data.data(), MAGIC, sizeof(MAGIC)) == 0;
}

std::string ArxMozLz4::decompress(const std::string& a_data)
{
    if (!hasMagic(a_data))
        throw ArxParseException("ArxMozLz4::decompress - missing mozLz40 magic");
    if (a_data.size() < HEADER_SIZE)
        throw ArxParseException("ArxMozLz4::decompress - truncated header");

    uint32_t size = ArxUtilities::readLittleEndian32((const unsigned char *)a_data.data() + sizeof(MAGIC));
    if (size > MAX_DECOMPRESSED_SIZE || size > (uint32_t)LZ4_MAX_INPUT_SIZE)
    {
        std::ostringstream msg;
        msg << "ArxMozLz4::decompress - implausible decompressed size " << size;
        throw ArxParseException(msg.str());
    }
    if (size == 0)
        return "";

    std::vector<char> output(size);
    int written = LZ4_decompress_safe(a_data.data() + HEADER_SIZE, &output[0],
        (int)(a_data.size() - HEADER_SIZE), (int)size);
    if (written < 0 || (uint32_t)written != size)
        throw ArxParseException("ArxMozLz4::decompress - corrupt LZ4 block");

    return std::string(&output[0], (size_t)written);
}

std::string ArxMozLz4::compress(const std::string& a_plain)
{
    if (a_plain.size() > (size_t)LZ4_MAX_INPUT_SIZE)
        throw ArxParseException("ArxMozLz4::compress - input too large");

    std::vector<char> block(LZ4_compressBound((int)a_plain.size()));
    int compressed = LZ4_compress_default(a_plain.data(), block.empty() ? NULL : &block[0],
        (int)a_plain.size(), (int)block.size());
    if (compressed <= 0 && !a_plain.empty())
        throw ArxParseException("ArxMozLz4::compress - LZ4 compression failed");

    std::string data(MAGIC, sizeof(MAGIC));
    uint32_t size = (uint32_t)a_plain.size();
    for (int i = 0; i < 4; i++)
        data += (char)((size >> (8 * i)) & 0xFF);
    if (compressed > 0)
        data.append(&block[0], (size_t)compressed);
    return data;
}
