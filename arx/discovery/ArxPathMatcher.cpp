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
 * \file ArxPathMatcher.cpp
 */

#include "ArxPathMatcher.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxUtilities.h"

namespace
{
    const std::string ANY_SEGMENTS = "**";
}

ArxPathMatcher::ArxPathMatcher(const std::string& a_glob)
: m_glob(a_glob)
{
    std::string glob = a_glob;
    for (size_t i = 0; i < glob.size(); i++)
    {
        if (glob[i] == '\\')
            glob[i] = '/';
    }

    // A leading separator is allowed; globs are always relative to the partition root.
    size_t start = 0;
    while (start < glob.size() && glob[start] == '/')
        start++;

    if (start == glob.size())
        throw ArxConfigurationException("ArxPathMatcher - empty glob '" + a_glob + "'");

    std::string::size_type pos = start;
    while (pos <= glob.size())
    {
        std::string::size_type next = glob.find('/', pos);
        if (next == std::string::npos)
            next = glob.size();

        std::string segment = glob.substr(pos, next - pos);
        if (segment.empty() || segment == "." || segment == "..")
            throw ArxConfigurationException("ArxPathMatcher - malformed glob '" + a_glob + "'");
        if (segment != ANY_SEGMENTS && segment.find(ANY_SEGMENTS) != std::string::npos)
            throw ArxConfigurationException("ArxPathMatcher - '**' must be a whole segment in '" + a_glob + "'");

        // Consecutive '**' segments are equivalent to one.
        if (!(segment == ANY_SEGMENTS && !m_segments.empty() && m_segments.back() == ANY_SEGMENTS))
            m_segments.push_back(ArxUtilities::toUpperAscii(segment));

        pos = next + 1;
    }
}

bool ArxPathMatcher::segmentMatches(const std::string& a_pattern, const std::string& a_segment)
{
    // Iterative wildcard match with single-star backtracking.
    size_t p = 0, s = 0;
    size_t starP = std::string::npos, starS = 0;

    while (s < a_segment.size())
    {
        if (p < a_pattern.size() && (a_pattern[p] == '?' || a_pattern[p] == a_segment[s]))
        {
            p++;
            s++;
        }
        else if (p < a_pattern.size() && a_pattern[p] == '*')
        {
            starP = p++;
            starS = s;
        }
        else if (starP != std::string::npos)
        {
            p = starP + 1;
            s = ++starS;
        }
        else
        {
            return false;
        }
    }

    while (p < a_pattern.size() && a_pattern[p] == '*')
        p++;

    return p == a_pattern.size();
}

void ArxPathMatcher::closure(StateSet& a_states) const
{
    // A '**' state may also be left without consuming a segment.
    for (size_t i = 0; i < m_segments.size(); i++)
    {
        if (a_states[i] && m_segments[i] == ANY_SEGMENTS)
            a_states[i + 1] = true;
    }
}

ArxPathMatcher::StateSet ArxPathMatcher::initialStates() const
{
    StateSet states(m_segments.size() + 1, false);
    states[0] = true;
    closure(states);
    return states;
}

ArxPathMatcher::StateSet ArxPathMatcher::advance(const StateSet& a_states, const std::string& a_segment) const
{
    StateSet next(m_segments.size() + 1, false);
    for (size_t i = 0; i < m_segments.size(); i++)
    {
        if (!a_states[i])
            continue;

        if (m_segments[i] == ANY_SEGMENTS)
            next[i] = true;
        else if (segmentMatches(m_segments[i], a_segment))
            next[i + 1] = true;
    }
    closure(next);
    return next;
}

ArxPathMatcher::StateSet ArxPathMatcher::run(const std::string& a_path) const
{
    std::vector<std::string> segments =
        ArxUtilities::splitLogicalPath(ArxUtilities::normalizeLogicalPath(a_path));

    StateSet states = initialStates();
    for (size_t i = 0; i < segments.size(); i++)
    {
        states = advance(states, ArxUtilities::toUpperAscii(segments[i]));
    }
    return states;
}

bool ArxPathMatcher::matches(const std::string& a_logicalPath) const
{
    return run(a_logicalPath)[m_segments.size()];
}

bool ArxPathMatcher::mayMatchBelow(const std::string& a_dirPath) const
{
    StateSet states = run(a_dirPath);
    for (size_t i = 0; i < m_segments.size(); i++)
    {
        if (states[i])
            return true;
    }
    return false;
}

std::string ArxPathMatcher::toLikePattern() const
{
    std::string like = "/";
    for (size_t i = 0; i < m_segments.size(); i++)
    {
        const std::string& segment = m_segments[i];
        if (segment == ANY_SEGMENTS)
        {
            // Zero segments must also match, so the separator after '**' is absorbed.
            like += '%';
            continue;
        }

        for (size_t c = 0; c < segment.size(); c++)
        {
            char ch = segment[c];
            if (ch == '*')
                like += '%';
            else if (ch == '?')
                like += '_';
            else if (ch == '%' || ch == '_' || ch == '#')
            {
                like += '#';
                like += ch;
            }
            else
                like += ch;
        }

        if (i + 1 < m_segments.size())
            like += '/';
    }
    return like;
}
