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
 * \file ArxBodyfileImporter.cpp
 */

#include "ArxBodyfileImporter.h"
#include "ArxFileIndexBuilder.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxTimestamps.h"
#include "arx/utilities/ArxUtilities.h"

#include "Poco/NumberParser.h"
#include "Poco/StringTokenizer.h"

#include <cctype>
#include <fstream>
#include <sstream>

namespace
{
    const size_t BODYFILE_FIELD_COUNT = 11;
    const std::string FILE_NAME_ATTR_SUFFIX = " ($FILE_NAME)";
    const std::string DELETED_SUFFIX = " (deleted)";
    const std::string DELETED_REALLOC_SUFFIX = " (deleted-realloc)";

    bool endsWith(const std::string& str, const std::string& suffix)
    {
        return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    ArxTimestamp parseTime(const std::string& value)
    {
        Poco::Int64 seconds = 0;
        if (!Poco::NumberParser::tryParse64(value, seconds))
            return ArxTimestamp::unknown();
        return ArxTimestamps::unixSecondsToUtc(seconds);
    }
}

ArxBodyfileImporter::ArxBodyfileImporter(ArxImgDB& a_db)
: m_db(a_db)
{
}

std::string ArxBodyfileImporter::importSourceFor(int a_partition)
{
    std::ostringstream source;
    source << "bodyfile:p" << a_partition;
    return source.str();
}

bool ArxBodyfileImporter::parseLine(const std::string& a_line, ArxFsEntry& a_entry, std::string& a_md5, bool& a_skip) const
{
    a_skip = false;

    Poco::StringTokenizer tokens(a_line, "|");
    if (tokens.count() < BODYFILE_FIELD_COUNT)
        return false;

    // Names may themselves contain '|'; the nine trailing fields are fixed.
    size_t nameEnd = tokens.count() - 9;
    std::string name = tokens[1];
    for (size_t i = 2; i < nameEnd; i++)
        name += "|" + tokens[i];

    const std::string& inodeField = tokens[nameEnd];
    const std::string& mode = tokens[nameEnd + 1];
    const std::string& size = tokens[nameEnd + 4];

    if (endsWith(name, FILE_NAME_ATTR_SUFFIX))
    {
        a_skip = true;
        return true;
    }

    // "d/drwxr-xr-x": directory by name type or by meta type.
    std::string::size_type slash = mode.find('/');
    if ((!mode.empty() && mode[0] == 'd') || (slash != std::string::npos && slash + 1 < mode.size() && mode[slash + 1] == 'd'))
    {
        a_skip = true;
        return true;
    }

    a_entry.deleted = false;
    if (endsWith(name, DELETED_SUFFIX))
    {
        a_entry.deleted = true;
        name.erase(name.size() - DELETED_SUFFIX.size());
    }
    else if (endsWith(name, DELETED_REALLOC_SUFFIX))
    {
        a_entry.deleted = true;
        name.erase(name.size() - DELETED_REALLOC_SUFFIX.size());
    }

    if (name.size() >= 2 && name[1] == ':' && isalpha((unsigned char)name[0]))
        name.erase(0, 2);

    a_entry.logicalPath = ArxUtilities::normalizeLogicalPath(ArxUtilities::cleanUTF8(name));
    a_entry.name = ArxUtilities::baseName(a_entry.logicalPath);
    if (a_entry.name.empty() || a_entry.name == "." || a_entry.name == "..")
    {
        a_skip = true;
        return true;
    }

    // "128-16-2" on NTFS: the metadata address comes first.
    Poco::UInt64 inode = 0;
    std::string::size_type dash = inodeField.find('-');
    if (!Poco::NumberParser::tryParseUnsigned64(inodeField.substr(0, dash), inode))
        return false;

    Poco::UInt64 sizeBytes = 0;
    if (!Poco::NumberParser::tryParseUnsigned64(size, sizeBytes))
        return false;

    a_entry.inode = inode;
    a_entry.size = sizeBytes;
    a_entry.isDirectory = false;
    a_entry.isRegular = true;
    a_entry.atime = parseTime(tokens[nameEnd + 5]);
    a_entry.mtime = parseTime(tokens[nameEnd + 6]);
    a_entry.ctime = parseTime(tokens[nameEnd + 7]);
    a_entry.crtime = parseTime(tokens[nameEnd + 8]);
    a_entry.fsType = "bodyfile";
    a_entry.forensicPath = a_entry.logicalPath;

    a_md5 = (tokens[0] == "0") ? "" : ArxUtilities::toLowerAscii(tokens[0]);
    return true;
}

ArxBodyfileImporter::Stats ArxBodyfileImporter::importFile(const std::string& a_path, int64_t a_evidenceId, int a_partition)
{
    std::ifstream input(a_path.c_str());
    if (!input)
        throw ArxSourceUnavailableException("ArxBodyfileImporter::importFile - cannot open " + a_path);

    return import(input, a_path, a_evidenceId, a_partition);
}

ArxBodyfileImporter::Stats ArxBodyfileImporter::import(std::istream& a_input, const std::string& a_sourceName,
    int64_t a_evidenceId, int a_partition)
{
    Stats stats;
    std::string importSource = importSourceFor(a_partition);
    std::string importTimestamp = ArxUtilities::utcNowIso();

    m_db.begin();
    try
    {
        m_db.deleteFileList(a_evidenceId, importSource);

        std::string line;
        int64_t lineNumber = 0;
        while (std::getline(a_input, line))
        {
            lineNumber++;
            if (!line.empty() && line[line.size() - 1] == '\r')
                line.erase(line.size() - 1);
            if (line.empty())
                continue;

            ArxFileListRow row;
            bool skip = false;
            if (!parseLine(line, row.entry, row.md5, skip))
            {
                std::ostringstream msg;
                msg << "ArxBodyfileImporter::import - malformed line " << lineNumber << " in " << a_sourceName;
                LOGWARN(msg.str());
                stats.malformed++;
                continue;
            }
            if (skip)
            {
                stats.skipped++;
                continue;
            }

            row.evidenceId = a_evidenceId;
            row.partitionIndex = a_partition;
            row.extension = ArxFileIndexBuilder::extensionOf(row.entry.name);
            row.importSource = importSource;
            row.importTimestamp = importTimestamp;
            m_db.addFileListRow(row);
            stats.imported++;
        }
        m_db.commit();
    }
    catch (ArxException&)
    {
        m_db.rollback();
        throw;
    }

    std::ostringstream msg;
    msg << "ArxBodyfileImporter::import - imported " << stats.imported << " entries from " << a_sourceName
        << " (" << stats.skipped << " skipped, " << stats.malformed << " malformed)";
    LOGINFO(msg.str());

    return stats;
}
