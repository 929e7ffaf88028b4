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
 * \file ArxUrl.cpp
 */

#include "ArxUrl.h"

// Poco includes
#include "Poco/URI.h"
#include "Poco/String.h"
#include "Poco/Exception.h"

std::string ArxUrl::normalize(const std::string& a_url)
{
    std::string trimmed = Poco::trim(a_url);
    if (trimmed.empty())
        return trimmed;

    try
    {
        Poco::URI uri(trimmed);
        if (uri.getScheme().empty() || uri.isRelative())
            return trimmed;

        // Poco::URI already lower-cases the scheme; the host keeps its case.
        uri.setHost(Poco::toLower(uri.getHost()));
        uri.setFragment("");
        if (uri.getPort() == uri.getWellKnownPort())
            uri.setPort(0);
        return uri.toString();
    }
    catch (Poco::SyntaxException&)
    {
        return trimmed;
    }
}

std::string ArxUrl::scheme(const std::string& a_url)
{
    try
    {
        return Poco::toLower(Poco::URI(Poco::trim(a_url)).getScheme());
    }
    catch (Poco::SyntaxException&)
    {
        return "";
    }
}

std::string ArxUrl::domain(const std::string& a_url)
{
    try
    {
        return Poco::toLower(Poco::URI(Poco::trim(a_url)).getHost());
    }
    catch (Poco::SyntaxException&)
    {
        return "";
    }
}
