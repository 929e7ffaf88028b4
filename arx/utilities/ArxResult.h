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
 * \file ArxResult.h
 * Value-or-error return type for expected parse failures.
 */

#ifndef _ARX_RESULT_H
#define _ARX_RESULT_H

#include <string>
#include <utility>
#include <variant>

#include "ArxException.h"

/**
 * Describes why a container or record could not be decoded. It maps one
 * to one onto an extraction warning.
 */
struct ArxParseError
{
    std::string warningType;
    std::string category;
    std::string message;
};

/**
 * Holds either a value of type T or an ArxParseError. Accessing the wrong
 * alternative throws ArxException, so a caller cannot silently ignore the
 * failure path.
 */
template <typename T>
class ArxResult
{
public:
    ArxResult(const T& value) : m_data(value) {}
    ArxResult(T&& value) : m_data(std::move(value)) {}
    ArxResult(const ArxParseError& error) : m_data(error) {}

    static ArxResult failure(const std::string& warningType, const std::string& category,
        const std::string& message)
    {
        ArxParseError error;
        error.warningType = warningType;
        error.category = category;
        error.message = message;
        return ArxResult(error);
    }

    bool ok() const { return m_data.index() == 0; }

    const T& value() const
    {
        if (!ok())
            throw ArxException("ArxResult::value on error: " + std::get<1>(m_data).message);
        return std::get<0>(m_data);
    }

    T& value()
    {
        if (!ok())
            throw ArxException("ArxResult::value on error: " + std::get<1>(m_data).message);
        return std::get<0>(m_data);
    }

    const ArxParseError& error() const
    {
        if (ok())
            throw ArxException("ArxResult::error on success");
        return std::get<1>(m_data);
    }

private:
    std::variant<T, ArxParseError> m_data;
};

#endif
