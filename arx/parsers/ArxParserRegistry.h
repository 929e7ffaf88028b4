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
 * \file ArxParserRegistry.h
 * Maps the parser ids used in pipeline_config.xml to parser classes.
 */

#ifndef _ARX_PARSERREGISTRY_H
#define _ARX_PARSERREGISTRY_H

#include <memory>
#include <string>
#include <vector>

#include "arx/framework_i.h"
#include "arx/parsers/ArxParser.h"

#include "Poco/DynamicFactory.h"

/**
 * The set of parsers is closed: every built-in parser is registered when
 * the registry is constructed and additional ones (test doubles) must be
 * added explicitly with add().
 */
class ARX_FRAMEWORK_API ArxParserRegistry
{
public:
    ArxParserRegistry();

    /**
     * Register a parser class under its id.
     * @throws ArxConfigurationException if the id is already taken.
     */
    template <class C>
    void add(const std::string& a_id)
    {
        if (m_factory.isClass(a_id))
            throwDuplicate(a_id);
        m_factory.registerClass<C>(a_id);
        m_ids.push_back(a_id);
    }

    bool has(const std::string& a_id) const;

    /**
     * Create a parser.
     * @throws ArxConfigurationException for an unknown id.
     */
    std::unique_ptr<ArxParser> create(const std::string& a_id) const;

    /// Registered ids in registration order.
    const std::vector<std::string>& ids() const { return m_ids; }

private:
    static void throwDuplicate(const std::string& a_id);

    Poco::DynamicFactory<ArxParser> m_factory;
    std::vector<std::string> m_ids;
};

#endif
