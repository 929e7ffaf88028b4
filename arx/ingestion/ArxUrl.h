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
 * \file ArxUrl.h
 * URL normalization for the URL registry.
 */

#ifndef _ARX_URL_H
#define _ARX_URL_H

#include <string>

#include "arx/framework_i.h"

class ARX_FRAMEWORK_API ArxUrl
{
public:
    /**
     * Lower-cases scheme and host, drops the default port of the scheme
     * and the fragment. URLs that cannot be parsed are returned trimmed.
     */
    static std::string normalize(const std::string& a_url);

    /// Lower-case scheme, or empty.
    static std::string scheme(const std::string& a_url);

    /// Lower-case host, or empty.
    static std::string domain(const std::string& a_url);
};

#endif
