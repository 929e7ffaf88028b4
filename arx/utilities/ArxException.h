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
 * \file ArxException.h
 * Contains definition of framework exception classes.
 * Based on techniques used in the Poco Exception class.
 */

#ifndef _ARX_EXCEPTION_H
#define _ARX_EXCEPTION_H

#include <stdexcept>
#include <string>

#include "arx/framework_i.h"

/**
 * Framework exception class
 */
class ARX_FRAMEWORK_API ArxException : public std::exception
{
public:
    /// Create an exception using the supplied message.
    ArxException(const std::string& msg, int code = 0);

    /// Copy Constructor
    ArxException(const ArxException& e);

    /// Destructor
    ~ArxException() throw ();

    /// Assignment operator
    ArxException& operator= (const ArxException& e);

    /// Returns a static string describing the exception.
    virtual const char * name() const throw();

    /// Returns the name of the exception class.
    virtual const char * className() const throw();

    /// Returns the message text, prefixed with name().
    virtual const char * what() const throw();

    /// Returns the message text.
    const std::string& message() const;

    /// Returns the exception code.
    int code() const;

protected:
    /// Default constructor.
    ArxException(int code = 0);

    /// Sets the message for the exception.
    void message(const std::string& msg);

private:
    std::string m_msg;
    int m_code;
    mutable std::string m_what;
};

inline const std::string& ArxException::message() const
{
    return m_msg;
}

inline void ArxException::message(const std::string &msg)
{
    m_msg = msg;
}

inline int ArxException::code() const
{
    return m_code;
}

//
// Macros for quickly declaring and implementing exception classes.
// Unfortunately, we cannot use a template here because character
// pointers (which we need for specifying the exception name)
// are not allowed as template arguments.
//
#define ARX_DECLARE_EXCEPTION(CLS, BASE) \
    class ARX_FRAMEWORK_API CLS: public BASE                                        \
    {                                                                               \
    public:                                                                         \
        CLS(int code = 0);                                                          \
        CLS(const std::string& msg, int code = 0);                                  \
        CLS(const CLS& exc);                                                        \
        ~CLS() throw();                                                             \
        CLS& operator = (const CLS& exc);                                           \
        const char* name() const throw();                                           \
        const char* className() const throw();                                      \
    };


#define ARX_IMPLEMENT_EXCEPTION(CLS, BASE, NAME)                                    \
    CLS::CLS(int code): BASE(code)                                                  \
    {                                                                               \
    }                                                                               \
    CLS::CLS(const std::string& msg, int code): BASE(msg, code)                     \
    {                                                                               \
    }                                                                               \
    CLS::CLS(const CLS& exc): BASE(exc)                                             \
    {                                                                               \
    }                                                                               \
    CLS::~CLS() throw()                                                             \
    {                                                                               \
    }                                                                               \
    CLS& CLS::operator = (const CLS& exc)                                           \
    {                                                                               \
        BASE::operator = (exc);                                                     \
        return *this;                                                               \
    }                                                                               \
    const char* CLS::name() const throw()                                           \
    {                                                                               \
        return NAME;                                                                \
    }                                                                               \
    const char* CLS::className() const throw()                                      \
    {                                                                               \
        return typeid(*this).name();                                                \
    }                                                                               \

//
// Error taxonomy of the extraction engine.
//

/// Unknown artifact type, missing pattern set, invalid configuration value.
ARX_DECLARE_EXCEPTION(ArxConfigurationException, ArxException)

/// The evidence root (or a partition of it) cannot be opened at all.
ARX_DECLARE_EXCEPTION(ArxSourceUnavailableException, ArxException)

/// A single evidence file or directory could not be read.
ARX_DECLARE_EXCEPTION(ArxCandidateReadException, ArxException)

/// Malformed bytes inside an otherwise valid container.
ARX_DECLARE_EXCEPTION(ArxParseException, ArxException)

/// Structural validation (checksum, digest) failed. Handled as a parse error.
ARX_DECLARE_EXCEPTION(ArxChecksumMismatchException, ArxParseException)

/// The storage layer cannot be reached or refused a write.
ARX_DECLARE_EXCEPTION(ArxStorageUnavailableException, ArxException)

#endif
