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
 * \file ArxContentDecoder.cpp
 */

#include "ArxContentDecoder.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxUtilities.h"

// Poco includes
#include "Poco/InflatingStream.h"
#include "Poco/String.h"
#include "Poco/StringTokenizer.h"
#include "Poco/Exception.h"

#include "brotli/decode.h"
#include "zstd.h"

#include <sstream>
#include <vector>

const size_t ArxContentDecoder::MAX_DECODED_SIZE = 256 * 1024 * 1024;

namespace
{
    std::string inflateWith(Poco::InflatingInputStream& inflater)
    {
        std::string decoded;
        char buffer[16384];
        while (inflater)
        {
            inflater.read(buffer, sizeof(buffer));
            decoded.append(buffer, (size_t)inflater.gcount());
            if (decoded.size() > ArxContentDecoder::MAX_DECODED_SIZE)
                throw ArxParseException("ArxContentDecoder - decoded body too large");
        }
        if (!inflater.eof())
            throw ArxParseException("ArxContentDecoder - truncated compressed body");
        return decoded;
    }
}

bool ArxContentDecoder::isIdentity(const std::string& a_encoding)
{
    std::string encoding = ArxUtilities::toLowerAscii(Poco::trim(a_encoding));
    return encoding.empty() || encoding == "identity";
}

std::string ArxContentDecoder::inflate(const std::string& a_body, bool a_gzip)
{
    std::string zlibError;
    try
    {
        std::istringstream input(a_body);
        Poco::InflatingInputStream inflater(input, a_gzip ? Poco::InflatingStreamBuf::STREAM_GZIP
                                                          : Poco::InflatingStreamBuf::STREAM_ZLIB);
        return inflateWith(inflater);
    }
    catch (Poco::Exception& ex)
    {
        zlibError = ex.displayText();
    }
    // A bad header surfaces as a stream error, not as a Poco exception.
    catch (ArxParseException& ex)
    {
        zlibError = ex.message();
    }

    if (a_gzip)
        throw ArxParseException("ArxContentDecoder::inflate - " + zlibError);

    // Servers send raw deflate streams under "deflate" as often as zlib ones.
    try
    {
        std::istringstream input(a_body);
        Poco::InflatingInputStream inflater(input, -15);
        return inflateWith(inflater);
    }
    catch (Poco::Exception& ex)
    {
        throw ArxParseException("ArxContentDecoder::inflate - " + ex.displayText());
    }
}

std::string ArxContentDecoder::brotliDecode(const std::string& a_body)
{
    BrotliDecoderState * state = BrotliDecoderCreateInstance(NULL, NULL, NULL);
    if (state == NULL)
        throw ArxParseException("ArxContentDecoder::brotliDecode - cannot create decoder");

    std::string decoded;
    std::vector<uint8_t> buffer(65536);
    size_t availableIn = a_body.size();
    const uint8_t * nextIn = (const uint8_t *)a_body.data();
    BrotliDecoderResult status = BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT;

    while (status == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT)
    {
        size_t availableOut = buffer.size();
        uint8_t * nextOut = &buffer[0];
        status = BrotliDecoderDecompressStream(state, &availableIn, &nextIn, &availableOut, &nextOut, NULL);
        decoded.append((const char *)&buffer[0], buffer.size() - availableOut);

        if (decoded.size() > MAX_DECODED_SIZE)
        {
            BrotliDecoderDestroyInstance(state);
            throw ArxParseException("ArxContentDecoder::brotliDecode - decoded body too large");
        }
    }

    std::string error;
    if (status == BROTLI_DECODER_RESULT_ERROR)
        error = BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state));
    else if (status == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT)
        error = "truncated stream";
    BrotliDecoderDestroyInstance(state);

    if (!error.empty())
        throw ArxParseException("ArxContentDecoder::brotliDecode - " + error);
    return decoded;
}

std::string ArxContentDecoder::zstdDecode(const std::string& a_body)
{
    ZSTD_DCtx * dctx = ZSTD_createDCtx();
    if (dctx == NULL)
        throw ArxParseException("ArxContentDecoder::zstdDecode - cannot create decoder");

    std::string decoded;
    std::vector<char> buffer(ZSTD_DStreamOutSize());
    ZSTD_inBuffer input = { a_body.data(), a_body.size(), 0 };
    size_t lastRet = 1;
    bool outputFull = true;
    std::string error;

    // A full output buffer may leave decoded bytes inside the decoder.
    while (input.pos < input.size || (outputFull && lastRet != 0))
    {
        ZSTD_outBuffer output = { &buffer[0], buffer.size(), 0 };
        size_t ret = ZSTD_decompressStream(dctx, &output, &input);
        if (ZSTD_isError(ret))
        {
            error = ZSTD_getErrorName(ret);
            break;
        }
        decoded.append(&buffer[0], output.pos);
        lastRet = ret;
        outputFull = output.pos == output.size;

        if (decoded.size() > MAX_DECODED_SIZE)
        {
            error = "decoded body too large";
            break;
        }
    }
    ZSTD_freeDCtx(dctx);

    if (error.empty() && lastRet != 0)
        error = "truncated stream";
    if (!error.empty())
        throw ArxParseException("ArxContentDecoder::zstdDecode - " + error);
    return decoded;
}

std::string ArxContentDecoder::decode(const std::string& a_encoding, const std::string& a_body)
{
    Poco::StringTokenizer codings(ArxUtilities::toLowerAscii(a_encoding), ",",
        Poco::StringTokenizer::TOK_IGNORE_EMPTY | Poco::StringTokenizer::TOK_TRIM);

    std::string body = a_body;
    for (size_t i = codings.count(); i > 0; i--)
    {
        const std::string& coding = codings[i - 1];
        if (coding == "identity")
            continue;
        else if (coding == "gzip" || coding == "x-gzip")
            body = inflate(body, true);
        else if (coding == "deflate")
            body = inflate(body, false);
        else if (coding == "br")
            body = brotliDecode(body);
        else if (coding == "zstd")
            body = zstdDecode(body);
        else
            throw ArxParseException("ArxContentDecoder::decode - unsupported content encoding '" + coding + "'");
    }
    return body;
}
