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
 * \file ArxFirefoxHistoryParser.cpp
 */

#include "ArxFirefoxHistoryParser.h"
#include "ArxSqliteSource.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxTimestamps.h"

#include <memory>
#include <sstream>

const char * ArxFirefoxHistoryParser::ID = "firefox_history";

namespace
{
    const std::set<std::string> KNOWN_TABLES = {
        "moz_places", "moz_historyvisits", "moz_inputhistory", "moz_bookmarks", "moz_bookmarks_deleted",
        "moz_keywords", "moz_annos", "moz_anno_attributes", "moz_items_annos", "moz_hosts", "moz_origins",
        "moz_frecency_scores", "moz_places_metadata", "moz_places_metadata_search_queries",
        "moz_places_metadata_snapshots", "moz_places_metadata_snapshots_extra",
        "moz_places_metadata_snapshots_groups", "moz_places_metadata_groups_to_snapshots",
        "moz_session_metadata", "moz_session_to_places", "moz_previews_tombstones", "moz_meta",
        "sqlite_sequence", "sqlite_stat1"
    };

    const std::set<std::string> KNOWN_PLACES_COLUMNS = {
        "id", "url", "url_hash", "title", "rev_host", "visit_count", "hidden", "typed", "frecency",
        "last_visit_date", "guid", "foreign_count", "preview_image_url", "description", "site_name",
        "origin_id", "recalc_frecency", "alt_frecency", "recalc_alt_frecency", "favicon_id"
    };

    const std::set<std::string> KNOWN_VISITS_COLUMNS = {
        "id", "from_visit", "place_id", "visit_date", "visit_type", "session", "source", "triggeringPlaceId"
    };

    // nsINavHistoryService TRANSITION_* values, starting at 1.
    const char * VISIT_TYPE_NAMES[] = {
        "LINK", "TYPED", "BOOKMARK", "EMBED", "REDIRECT_PERMANENT", "REDIRECT_TEMPORARY",
        "DOWNLOAD", "FRAMED_LINK", "RELOAD"
    };
}

std::string ArxFirefoxHistoryParser::id() const
{
    return ID;
}

std::vector<ArxArtifactFamily> ArxFirefoxHistoryParser::families() const
{
    return std::vector<ArxArtifactFamily>(1, ARX_FAMILY_HISTORY);
}

std::string ArxFirefoxHistoryParser::visitTypeName(int64_t a_visitType)
{
    if (a_visitType >= 1 && a_visitType <= (int64_t)(sizeof(VISIT_TYPE_NAMES) / sizeof(VISIT_TYPE_NAMES[0])))
        return VISIT_TYPE_NAMES[a_visitType - 1];
    return "";
}

ArxParseResult ArxFirefoxHistoryParser::parse(const ArxParseInput& a_input) const
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
    reportUnknownNames(a_input, result, tables, KNOWN_TABLES, "unknown_table", "database", "places.sqlite");

    if (!tables.count("moz_places") || !tables.count("moz_historyvisits"))
    {
        ArxParseError error = { "file_corrupt", "database", "places database lacks moz_places or moz_historyvisits" };
        result.warnings.push_back(errorWarning(a_input, error));
        return result;
    }

    std::set<std::string> placeColumns = source->columnNames("moz_places");
    std::set<std::string> visitColumns = source->columnNames("moz_historyvisits");
    reportUnknownNames(a_input, result, placeColumns, KNOWN_PLACES_COLUMNS, "unknown_column", "database", "moz_places");
    reportUnknownNames(a_input, result, visitColumns, KNOWN_VISITS_COLUMNS, "unknown_column", "database", "moz_historyvisits");

    const char * sql =
        "SELECT p.url, p.title, p.visit_count, p.typed, p.hidden, v.id, v.visit_date, v.from_visit, v.visit_type "
        "FROM moz_historyvisits v JOIN moz_places p ON v.place_id = p.id ORDER BY v.id";

    sqlite3_stmt * statement = NULL;
    if (sqlite3_prepare_v2(source->handle(), sql, -1, &statement, 0) != SQLITE_OK)
    {
        ArxParseError error = { "file_corrupt", "database",
            std::string("cannot query moz_historyvisits: ") + sqlite3_errmsg(source->handle()) };
        result.warnings.push_back(errorWarning(a_input, error));
        sqlite3_finalize(statement);
        return result;
    }

    ArxRecordSource recordSource = a_input.recordSource();
    std::set<int64_t> unknownTypes;
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
        visit.visitTime = ArxTimestamps::prtimeToUtc(ArxSqliteSource::columnInt64(statement, 6));
        visit.fromVisitId = ArxSqliteSource::columnInt64(statement, 7).value_or(0);

        std::optional<int64_t> visitType = ArxSqliteSource::columnInt64(statement, 8);
        if (visitType)
        {
            visit.transition = visitTypeName(*visitType);
            if (visit.transition.empty())
            {
                std::ostringstream name;
                name << "UNKNOWN_" << *visitType;
                visit.transition = name.str();
                unknownTypes.insert(*visitType);
            }
        }

        result.records.push_back(visit);
    }

    if (stepResult != SQLITE_DONE)
    {
        ArxParseError error = { "file_corrupt", "database",
            std::string("visit query stopped early: ") + sqlite3_errmsg(source->handle()) };
        result.warnings.push_back(errorWarning(a_input, error));
    }
    sqlite3_finalize(statement);

    for (std::set<int64_t>::const_iterator value = unknownTypes.begin(); value != unknownTypes.end(); ++value)
    {
        std::ostringstream text;
        text << *value;
        result.warnings.push_back(makeWarning(a_input, "unknown_enum_value", ArxExtractionWarning::INFO,
            "database", "moz_historyvisits.visit_type", text.str()));
    }

    std::ostringstream msg;
    msg << "ArxFirefoxHistoryParser::parse - " << result.records.size() << " visits from "
        << a_input.entry.source.logicalPath;
    LOGINFO(msg.str());
    return result;
}
