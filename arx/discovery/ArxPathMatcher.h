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
 * \file ArxPathMatcher.h
 * Glob matching of logical evidence paths.
 */

#ifndef _ARX_PATHMATCHER_H
#define _ARX_PATHMATCHER_H

#include <string>
#include <vector>

#include "arx/framework_i.h"

/**
 * A compiled path glob. Globs are relative to a partition root and use
 * '*' (any characters within one segment), '?' (one character) and
 * '**' (any number of whole segments). Matching is ASCII case
 * insensitive and accepts '\\' as well as '/' separators.
 *
 * Matching runs the segment list as a small NFA, so the same matcher can
 * both confirm a file and tell a directory walk whether anything below
 * a directory can still match.
 */
class ARX_FRAMEWORK_API ArxPathMatcher
{
public:
    /**
     * @throws ArxConfigurationException if the glob is empty or has
     * empty, "." or ".." segments.
     */
    explicit ArxPathMatcher(const std::string& a_glob);

    /// True if the logical path of a file matches the glob.
    bool matches(const std::string& a_logicalPath) const;

    /// True if some path below the directory could match.
    bool mayMatchBelow(const std::string& a_dirPath) const;

    /**
     * SQL LIKE pattern (escape character '#') that every matching path
     * also matches. Used to prefilter file index rows before matches()
     * confirms them.
     */
    std::string toLikePattern() const;

    const std::string& glob() const { return m_glob; }

private:
    typedef std::vector<bool> StateSet;

    StateSet initialStates() const;
    StateSet advance(const StateSet& a_states, const std::string& a_segment) const;
    void closure(StateSet& a_states) const;
    StateSet run(const std::string& a_path) const;

    static bool segmentMatches(const std::string& a_pattern, const std::string& a_segment);

    std::string m_glob;
    /// Upper case pattern segments.
    std::vector<std::string> m_segments;
};

#endif
