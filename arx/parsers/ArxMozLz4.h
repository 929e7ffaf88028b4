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
 * \file ArxMozLz4.h
 * Mozilla's mozLz4 container: the magic "mozLz40\0", the decompressed
 * size as a little endian uint32, then one LZ4 block.
 */

#ifndef _ARX_MOZLZ4_H
#define _ARX_MOZLZ4_H

#include <string>

#include "arx/framework_i.h"

class ARX_FRAMEWORK_API ArxMozLz4
{
public:
    static const char MAGIC[8];
    static const size_t HEADER_SIZE;
    /// Largest decompressed size accepted from the header.
    static const uint32_t MAX_DECOMPRESSED_SIZE;

    static bool hasMagic(const std::string& a_data);

    /**
     * @throws ArxParseException on a bad magic, an implausible size or a
     * corrupt LZ4 block.
     */
    static std::string decompress(const std::string& a_data);

    /// Wraps a_plain in a mozLz4 container. Used to write fixtures.
    static std::string compress(const std::string& a_plain);
};

#endif
