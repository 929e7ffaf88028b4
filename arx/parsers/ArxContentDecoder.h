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
 * \file ArxContentDecoder.h
 * HTTP Content-Encoding decoding of cached bodies.
 */

#ifndef _ARX_CONTENTDECODER_H
#define _ARX_CONTENTDECODER_H

#include <string>

#include "arx/framework_i.h"

class ARX_FRAMEWORK_API ArxContentDecoder
{
public:
    /// Upper bound on a decoded body.
    static const size_t MAX_DECODED_SIZE;

    /// True for an empty or "identity" encoding.
    static bool isIdentity(const std::string& a_encoding);

    /**
     * Undo a Content-Encoding header value. Codings listed as "gzip, br"
     * are removed last first. Supported: gzip, x-gzip, deflate (zlib or
     * raw), br, zstd.
     * @throws ArxParseException for corrupt input, an unsupported coding
     * or output above MAX_DECODED_SIZE.
     */
    static std::string decode(const std::string& a_encoding, const std::string& a_body);

    static std::string inflate(const std::string& a_body, bool a_gzip);
    static std::string brotliDecode(const std::string& a_body);
    static std::string zstdDecode(const std::string& a_body);
};

#endif
