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
 * \file ArxSqliteSource.cpp
 */

#include "ArxSqliteSource.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"

// Poco includes
#include "Poco/File.h"
#include "Poco/Path.h"
#include "Poco/Exception.h"

#include <cstring>
#include <fstream>
#include <sstream>

namespace
{
    const char SQLITE_HEADER[] = "SQLite format 3";
    const std::string WORK_FILE_NAME = "database.sqlite";

    std::string quoteIdentifier(const std::string& name)
    {
        std::string quoted = "\"";
        for (size_t i = 0; i < name.size(); i++)
        {
            if (name[i] == '"')
                quoted += '"';
            quoted += name[i];
        }
        return quoted + "\"";
    }
}

bool ArxSqliteSource::hasSqliteHeader(const std::string& a_path)
{
    std::ifstream file(a_path.c_str(), std::ios::in | std::ios::binary);
    char header[16];
    if (!file.read(header, sizeof(header)))
        return false;
    return std::memcmp(header, SQLITE_HEADER, sizeof(header)) == 0;
}

ArxSqliteSource::ArxSqliteSource(const std::string& a_mainPath, const std::string& a_walPath,
    const std::string& a_journalPath)
: m_db(NULL)
{
    if (!hasSqliteHeader(a_mainPath))
        throw ArxParseException("ArxSqliteSource - not a SQLite database: " + a_mainPath);

    std::string workPath;
    try
    {
        m_workDir.createDirectories();
        Poco::Path work(Poco::Path::forDirectory(m_workDir.path()), WORK_FILE_NAME);
        workPath = work.toString();

        Poco::File(a_mainPath).copyTo(workPath);
        if (!a_walPath.empty())
            Poco::File(a_walPath).copyTo(workPath + "-wal");
        if (!a_journalPath.empty())
            Poco::File(a_journalPath).copyTo(workPath + "-journal");
    }
    catch (Poco::Exception& ex)
    {
        throw ArxParseException("ArxSqliteSource - cannot prepare working copy of " + a_mainPath + ": " + ex.displayText());
    }

    // Read-write so SQLite can build the -shm index it needs to replay the WAL.
    if (sqlite3_open_v2(workPath.c_str(), &m_db, SQLITE_OPEN_READWRITE, NULL) != SQLITE_OK)
    {
        std::ostringstream msg;
        msg << "ArxSqliteSource - cannot open " << a_mainPath << ": " << sqlite3_errmsg(m_db);
        sqlite3_close(m_db);
        m_db = NULL;
        throw ArxParseException(msg.str());
    }

    // Opening is lazy; force the schema to be read so corruption shows here.
    if (sqlite3_exec(m_db, "SELECT count(*) FROM sqlite_master", NULL, NULL, NULL) != SQLITE_OK)
    {
        std::ostringstream msg;
        msg << "ArxSqliteSource - cannot read schema of " << a_mainPath << ": " << sqlite3_errmsg(m_db);
        sqlite3_close(m_db);
        m_db = NULL;
        throw ArxParseException(msg.str());
    }
}

ArxSqliteSource::~ArxSqliteSource()
{
    if (m_db != NULL)
        sqlite3_close(m_db);
}

std::set<std::string> ArxSqliteSource::tableNames() const
{
    std::set<std::string> tables;
    sqlite3_stmt * statement = NULL;
    if (sqlite3_prepare_v2(m_db, "SELECT name FROM sqlite_master WHERE type = 'table'", -1, &statement, 0) == SQLITE_OK)
    {
        while (sqlite3_step(statement) == SQLITE_ROW)
            tables.insert(columnText(statement, 0));
    }
    else
    {
        LOGERROR(std::string("ArxSqliteSource::tableNames - ") + sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(statement);
    return tables;
}

std::set<std::string> ArxSqliteSource::columnNames(const std::string& a_table) const
{
    std::set<std::string> columns;
    sqlite3_stmt * statement = NULL;
    std::string sql = "PRAGMA table_info(" + quoteIdentifier(a_table) + ")";
    if (sqlite3_prepare_v2(m_db, sql.c_str(), -1, &statement, 0) == SQLITE_OK)
    {
        // cid, name, type, notnull, dflt_value, pk
        while (sqlite3_step(statement) == SQLITE_ROW)
            columns.insert(columnText(statement, 1));
    }
    else
    {
        LOGERROR(std::string("ArxSqliteSource::columnNames - ") + sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(statement);
    return columns;
}

bool ArxSqliteSource::hasTable(const std::string& a_table) const
{
    return tableNames().count(a_table) != 0;
}

std::optional<int64_t> ArxSqliteSource::columnInt64(sqlite3_stmt * a_statement, int a_column)
{
    if (sqlite3_column_type(a_statement, a_column) == SQLITE_NULL)
        return std::nullopt;
    return (int64_t)sqlite3_column_int64(a_statement, a_column);
}

std::string ArxSqliteSource::columnText(sqlite3_stmt * a_statement, int a_column)
{
    const unsigned char * text = sqlite3_column_text(a_statement, a_column);
    if (text == NULL)
        return "";
    return std::string((const char *)text, sqlite3_column_bytes(a_statement, a_column));
}
