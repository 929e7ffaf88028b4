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
 * \file ArxException.cpp
 * Contains definition of framework exception classes.
 * Based on techniques used in the Poco Exception class.
 */

#include "ArxException.h"
#include <typeinfo>

ArxException::ArxException(int code) : m_code(code)
{
}

ArxException::ArxException(const std::string &msg, int code) : m_msg(msg), m_code(code)
{
}

ArxException::ArxException(const ArxException &e) : std::exception(e), m_msg(e.m_msg), m_code(e.m_code)
{
}

ArxException::~ArxException() throw()
{
}

ArxException& ArxException::operator =(const ArxException &e)
{
    if (&e != this)
    {
        m_msg = e.m_msg;
        m_code = e.m_code;
        m_what.clear();
    }

    return *this;
}

const char * ArxException::name() const throw()
{
    return "ArxException";
}

const char * ArxException::className() const throw()
{
    return typeid(*this).name();
}

const char * ArxException::what() const throw()
{
    if (m_msg.empty())
        return name();

    if (m_what.empty())
    {
        m_what.assign(name());
        m_what.append(": ");
        m_what.append(m_msg);
    }
    return m_what.c_str();
}

ARX_IMPLEMENT_EXCEPTION(ArxConfigurationException, ArxException, "Configuration error")
ARX_IMPLEMENT_EXCEPTION(ArxSourceUnavailableException, ArxException, "Evidence source unavailable")
ARX_IMPLEMENT_EXCEPTION(ArxCandidateReadException, ArxException, "Candidate read error")
ARX_IMPLEMENT_EXCEPTION(ArxParseException, ArxException, "Parse error")
ARX_IMPLEMENT_EXCEPTION(ArxChecksumMismatchException, ArxParseException, "Checksum mismatch")
ARX_IMPLEMENT_EXCEPTION(ArxStorageUnavailableException, ArxException, "Storage unavailable")
