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
 * \file ArxFirefoxBookmarkBackupParser.cpp
 */

#include "ArxFirefoxBookmarkBackupParser.h"
#include "ArxMozLz4.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxTimestamps.h"

// Poco includes
#include "Poco/FileStream.h"
#include "Poco/StreamCopier.h"
#include "Poco/Exception.h"
#include "Poco/JSON/Array.h"
#include "Poco/JSON/JSONException.h"
#include "Poco/JSON/Parser.h"

#include <sstream>

const char * ArxFirefoxBookmarkBackupParser::ID = "firefox_bookmark_backup";

namespace
{
    const std::string TYPE_PLACE = "text/x-moz-place";
    const std::string TYPE_CONTAINER = "text/x-moz-place-container";
    const std::string TYPE_SEPARATOR = "text/x-moz-place-separator";

    const size_t MAX_DEPTH = 256;

    const std::set<std::string> KNOWN_KEYS = {
        "guid", "title", "index", "dateAdded", "lastModified", "id", "typeCode", "type", "root",
        "children", "uri", "iconUri", "iconuri", "keyword", "tags", "charset", "postData", "annos"
    };

    std::string stringValue(const Poco::JSON::Object::Ptr& node, const std::string& key)
    {
        if (!node->has(key) || node->isNull(key))
            return "";
        return node->getValue<std::string>(key);
    }

    std::optional<int64_t> intValue(const Poco::JSON::Object::Ptr& node, const std::string& key)
    {
        if (!node->has(key) || node->isNull(key))
            return std::nullopt;
        Poco::Dynamic::Var value = node->get(key);
        if (!value.isNumeric())
            return std::nullopt;
        return value.convert<Poco::Int64>();
    }

    /// Display name of the built-in root folders.
    std::string folderTitle(const std::string& title, const std::string& root)
    {
        if (root == "bookmarksMenuFolder" || title == "menu")
            return "Bookmarks Menu";
        if (root == "toolbarFolder" || title == "toolbar")
            return "Bookmarks Toolbar";
        if (root == "unfiledBookmarksFolder" || title == "unfiled")
            return "Other Bookmarks";
        if (root == "mobileFolder" || title == "mobile")
            return "Mobile Bookmarks";
        return title;
    }
}

std::string ArxFirefoxBookmarkBackupParser::id() const
{
    return ID;
}

std::vector<ArxArtifactFamily> ArxFirefoxBookmarkBackupParser::families() const
{
    return std::vector<ArxArtifactFamily>(1, ARX_FAMILY_BOOKMARK);
}

ArxParseResult ArxFirefoxBookmarkBackupParser::parse(const ArxParseInput& a_input) const
{
    std::string data;
    try
    {
        Poco::FileInputStream input(a_input.stagedPath(), std::ios::in | std::ios::binary);
        Poco::StreamCopier::copyToString(input, data);
    }
    catch (Poco::Exception& ex)
    {
        ArxParseResult result;
        ArxParseError error = { "file_corrupt", "binary", "cannot read bookmark backup: " + ex.displayText() };
        result.warnings.push_back(errorWarning(a_input, error));
        return result;
    }

    std::string json;
    try
    {
        // Plain .json backups exist too.
        json = ArxMozLz4::hasMagic(data) ? ArxMozLz4::decompress(data) : data;
    }
    catch (ArxParseException& ex)
    {
        ArxParseResult result;
        ArxParseError error = { "compression_error", "binary", ex.message() };
        result.warnings.push_back(errorWarning(a_input, error));
        return result;
    }

    return parseJson(a_input, json);
}

ArxParseResult ArxFirefoxBookmarkBackupParser::parseJson(const ArxParseInput& a_input, const std::string& a_json) const
{
    ArxParseResult result;

    Poco::JSON::Object::Ptr root;
    try
    {
        Poco::JSON::Parser parser;
        Poco::Dynamic::Var document = parser.parse(a_json);
        root = document.extract<Poco::JSON::Object::Ptr>();
    }
    catch (Poco::Exception& ex)
    {
        ArxParseError error = { "json_parse_error", "json", ex.displayText() };
        result.warnings.push_back(errorWarning(a_input, error));
        return result;
    }

    std::set<std::string> unknownKeys;
    std::set<std::string> unknownTypes;
    try
    {
        walk(a_input, root, "", 0, result, unknownKeys, unknownTypes);
    }
    catch (Poco::Exception& ex)
    {
        // A node of the wrong shape; what was read so far is kept.
        ArxParseError error = { "json_parse_error", "json", "malformed bookmark node: " + ex.displayText() };
        result.warnings.push_back(errorWarning(a_input, error));
        result.failedRecords++;
    }

    std::set<std::string> noKnownTypes;
    reportUnknownNames(a_input, result, unknownKeys, KNOWN_KEYS, "json_unknown_key", "json", "bookmark node");
    reportUnknownNames(a_input, result, unknownTypes, noKnownTypes, "unknown_enum_value", "json", "bookmark node type");

    std::ostringstream msg;
    msg << "ArxFirefoxBookmarkBackupParser::parse - " << result.records.size() << " bookmarks from "
        << a_input.entry.source.logicalPath;
    LOGINFO(msg.str());
    return result;
}

void ArxFirefoxBookmarkBackupParser::walk(const ArxParseInput& a_input, const Poco::JSON::Object::Ptr& a_node,
    const std::string& a_parentPath, size_t a_depth, ArxParseResult& a_result,
    std::set<std::string>& a_unknownKeys, std::set<std::string>& a_unknownTypes) const
{
    if (a_node.isNull())
        return;
    if (a_depth > MAX_DEPTH)
    {
        ArxParseError error = { "json_parse_error", "json", "bookmark tree nested too deeply" };
        a_result.warnings.push_back(errorWarning(a_input, error));
        return;
    }

    std::vector<std::string> names;
    a_node->getNames(names);
    for (size_t i = 0; i < names.size(); i++)
    {
        if (!KNOWN_KEYS.count(names[i]))
            a_unknownKeys.insert(names[i]);
    }

    std::string type = stringValue(a_node, "type");
    std::string title = stringValue(a_node, "title");
    std::string path = a_parentPath;

    if (type == TYPE_CONTAINER)
    {
        std::string display = folderTitle(title, stringValue(a_node, "root"));
        if (!display.empty())
            path = a_parentPath.empty() ? display : a_parentPath + "/" + display;
    }
    else if (type == TYPE_PLACE)
    {
        std::string uri = stringValue(a_node, "uri");
        if (!uri.empty())
        {
            ArxBookmarkRecord bookmark;
            bookmark.source = a_input.recordSource();
            bookmark.url = uri;
            bookmark.title = title;
            bookmark.folderPath = a_parentPath;
            bookmark.guid = stringValue(a_node, "guid");
            bookmark.dateAdded = ArxTimestamps::prtimeToUtc(intValue(a_node, "dateAdded"));
            bookmark.lastModified = ArxTimestamps::prtimeToUtc(intValue(a_node, "lastModified"));
            bookmark.keyword = stringValue(a_node, "keyword");
            bookmark.tags = stringValue(a_node, "tags");
            a_result.records.push_back(bookmark);
        }
    }
    else if (type != TYPE_SEPARATOR && !type.empty())
    {
        a_unknownTypes.insert(type);
    }

    if (!a_node->has("children"))
        return;

    Poco::JSON::Array::Ptr children = a_node->getArray("children");
    if (children.isNull())
        return;
    for (size_t i = 0; i < children->size(); i++)
    {
        walk(a_input, children->getObject((unsigned int)i), path, a_depth + 1, a_result, a_unknownKeys, a_unknownTypes);
    }
}
