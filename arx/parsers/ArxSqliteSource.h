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
 * \file ArxSqliteSource.h
 * Opens a staged SQLite database through a private working copy.
 */

#ifndef _ARX_SQLITESOURCE_H
#define _ARX_SQLITESOURCE_H

#include <optional>
#include <set>
#include <string>

#include "sqlite3.h"

#include "arx/framework_i.h"
#include "Poco/TemporaryFile.h"

/**
 * Copies a staged database and its -wal and -journal companions into a
 * temporary directory and opens the copy. SQLite replays the WAL (or
 * rolls back a hot journal) on the copy, so uncheckpointed rows become
 * visible while the staged bytes stay untouched. The copy is deleted when
 * the object is destroyed.
 */
class ARX_FRAMEWORK_API ArxSqliteSource
{
public:
    /**
     * @param a_walPath Staged -wal companion, or empty.
     * @param a_journalPath Staged -journal companion, or empty.
     * @throws ArxParseException if the file is not a SQLite database or
     * cannot be opened.
     */
    ArxSqliteSource(const std::string& a_mainPath, const std::string& a_walPath, const std::string& a_journalPath);
    ~ArxSqliteSource();

    sqlite3 * handle() const { return m_db; }

    std::set<std::string> tableNames() const;
    std::set<std::string> columnNames(const std::string& a_table) const;
    bool hasTable(const std::string& a_table) const;

    /// True if the first 16 bytes of the file are the SQLite header.
    static bool hasSqliteHeader(const std::string& a_path);

    static std::optional<int64_t> columnInt64(sqlite3_stmt * a_statement, int a_column);
    static std::string columnText(sqlite3_stmt * a_statement, int a_column);

private:
    ArxSqliteSource(const ArxSqliteSource&);
    ArxSqliteSource& operator=(const ArxSqliteSource&);

    Poco::TemporaryFile m_workDir;
    sqlite3 * m_db;
};

#endif
