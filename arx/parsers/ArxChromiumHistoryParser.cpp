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
 * \file ArxChromiumHistoryParser.cpp
 */

#include "ArxChromiumHistoryParser.h"
#include "ArxSqliteSource.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxTimestamps.h"

#include <memory>
#include <sstream>

const char * ArxChromiumHistoryParser::ID = "chromium_history";

namespace
{
    const std::set<std::string> KNOWN_TABLES = {
        "urls", "visits", "visit_source", "keyword_search_terms", "segments", "segment_usage",
        "downloads", "downloads_url_chains", "downloads_slices", "meta", "typed_url_sync_metadata",
        "history_sync_metadata", "content_annotations", "context_annotations", "clusters",
        "clusters_and_visits", "cluster_keywords", "cluster_visit_duplicates", "visited_links",
        "sqlite_sequence", "sqlite_stat1"
    };

    const std::set<std::string> KNOWN_URLS_COLUMNS = {
        "id", "url", "title", "visit_count", "typed_count", "last_visit_time", "hidden", "favicon_id"
    };

    const std::set<std::string> KNOWN_VISITS_COLUMNS = {
        "id", "url", "visit_time", "from_visit", "transition", "segment_id", "visit_duration",
        "incremented_omnibox_typed_score", "opener_visit", "originator_cache_guid", "originator_visit_id",
        "originator_from_visit", "originator_opener_visit", "is_known_to_sync",
        "consider_for_ntp_most_visited", "external_referrer_url", "visited_link_id", "app_id",
        "is_indexed", "publicly_routable"
    };

    const char * TRANSITION_NAMES[] = {
        "LINK", "TYPED", "AUTO_BOOKMARK", "AUTO_SUBFRAME", "MANUAL_SUBFRAME", "GENERATED",
        "AUTO_TOPLEVEL", "FORM_SUBMIT", "RELOAD", "KEYWORD", "KEYWORD_GENERATED"
    };

    std::string columnOrNull(const std::set<std::string>& columns, const std::string& alias, const std::string& column)
    {
        if (columns.count(column))
            return alias + "." + column;
        return "NULL";
    }
}

std::string ArxChromiumHistoryParser::id() const
{
    return ID;
}

std::vector<ArxArtifactFamily> ArxChromiumHistoryParser::families() const
{
    return std::vector<ArxArtifactFamily>(1, ARX_FAMILY_HISTORY);
}

std::string ArxChromiumHistoryParser::transitionName(int64_t a_transition)
{
    int64_t core = a_transition & 0xFF;
    if (core >= 0 && core < (int64_t)(sizeof(TRANSITION_NAMES) / sizeof(TRANSITION_NAMES[0])))
        return TRANSITION_NAMES[core];
    return "";
}

ArxParseResult ArxChromiumHistoryParser::parse(const ArxParseInput& a_input) const
{
    ArxParseResult result;

    std::unique_ptr<ArxSqliteSource> source;
    try
    {
        source.reset(new ArxSqliteSource(a_input.stagedPath(), a_input.companionPath("wal"),
            a_input.companionPath("journal")));
    }
    catch (ArxParseException& ex)
    {
        ArxParseError error = { "file_corrupt", "database", ex.message() };
        result.warnings.push_back(errorWarning(a_input, error));
        return result;
    }

    std::set<std::string> tables = source->tableNames();
    reportUnknownNames(a_input, result, tables, KNOWN_TABLES, "unknown_table", "database", "History");

    if (!tables.count("urls") || !tables.count("visits"))
    {
        ArxParseError error = { "file_corrupt", "database", "History database lacks the urls or visits table" };
        result.warnings.push_back(errorWarning(a_input, error));
        return result;
    }

    std::set<std::string> urlColumns = source->columnNames("urls");
    std::set<std::string> visitColumns = source->columnNames("visits");
    reportUnknownNames(a_input, result, urlColumns, KNOWN_URLS_COLUMNS, "unknown_column", "database", "urls");
    reportUnknownNames(a_input, result, visitColumns, KNOWN_VISITS_COLUMNS, "unknown_column", "database", "visits");

    std::ostringstream sql;
    sql << "SELECT u.url, u.title, " << columnOrNull(urlColumns, "u", "visit_count") << ", "
        << columnOrNull(urlColumns, "u", "typed_count") << ", " << columnOrNull(urlColumns, "u", "hidden") << ", "
        << "v.id, v.visit_time, " << columnOrNull(visitColumns, "v", "from_visit") << ", "
        << columnOrNull(visitColumns, "v", "transition") << ", " << columnOrNull(visitColumns, "v", "visit_duration")
        << " FROM visits v JOIN urls u ON v.url = u.id ORDER BY v.id";

    sqlite3_stmt * statement = NULL;
    if (sqlite3_prepare_v2(source->handle(), sql.str().c_str(), -1, &statement, 0) != SQLITE_OK)
    {
        ArxParseError error = { "file_corrupt", "database",
            std::string("cannot query visits: ") + sqlite3_errmsg(source->handle()) };
        result.warnings.push_back(errorWarning(a_input, error));
        sqlite3_finalize(statement);
        return result;
    }

    ArxRecordSource recordSource = a_input.recordSource();
    std::set<int64_t> unknownTransitions;
    int stepResult;
    while ((stepResult = sqlite3_step(statement)) == SQLITE_ROW)
    {
        ArxHistoryVisitRecord visit;
        visit.source = recordSource;
        visit.url = ArxSqliteSource::columnText(statement, 0);
        visit.title = ArxSqliteSource::columnText(statement, 1);
        visit.visitCount = ArxSqliteSource::columnInt64(statement, 2).value_or(0);
        visit.typedCount = ArxSqliteSource::columnInt64(statement, 3).value_or(0);
        visit.hidden = ArxSqliteSource::columnInt64(statement, 4).value_or(0) != 0;
        visit.sourceVisitId = ArxSqliteSource::columnInt64(statement, 5).value_or(0);
        visit.visitTime = ArxTimestamps::webkitToUtc(ArxSqliteSource::columnInt64(statement, 6));
        visit.fromVisitId = ArxSqliteSource::columnInt64(statement, 7).value_or(0);

        std::optional<int64_t> transition = ArxSqliteSource::columnInt64(statement, 8);
        if (transition)
        {
            visit.transition = transitionName(*transition);
            if (visit.transition.empty())
            {
                std::ostringstream name;
                name << "UNKNOWN_" << (*transition & 0xFF);
                visit.transition = name.str();
                unknownTransitions.insert(*transition & 0xFF);
            }
        }

        // Stored in microseconds.
        std::optional<int64_t> duration = ArxSqliteSource::columnInt64(statement, 9);
        if (duration && *duration >= 0)
            visit.visitDurationMs = *duration / 1000;

        result.records.push_back(visit);
    }

    if (stepResult != SQLITE_DONE)
    {
        ArxParseError error = { "file_corrupt", "database",
            std::string("visit query stopped early: ") + sqlite3_errmsg(source->handle()) };
        result.warnings.push_back(errorWarning(a_input, error));
    }
    sqlite3_finalize(statement);

    for (std::set<int64_t>::const_iterator value = unknownTransitions.begin(); value != unknownTransitions.end(); ++value)
    {
        std::ostringstream text;
        text << *value;
        result.warnings.push_back(makeWarning(a_input, "unknown_enum_value", ArxExtractionWarning::INFO,
            "database", "visits.transition", text.str()));
    }

    std::ostringstream msg;
    msg << "ArxChromiumHistoryParser::parse - " << result.records.size() << " visits from "
        << a_input.entry.source.logicalPath;
    LOGINFO(msg.str());
    return result;
}
