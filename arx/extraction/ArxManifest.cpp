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
 * \file ArxManifest.cpp
 * JSON reading and writing of run manifests.
 */

#include "ArxManifest.h"
#include "arx/services/ArxServices.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxUtilities.h"

// Poco includes
#include "Poco/File.h"
#include "Poco/FileStream.h"
#include "Poco/Path.h"
#include "Poco/JSON/Array.h"
#include "Poco/JSON/Object.h"
#include "Poco/JSON/Parser.h"
#include "Poco/Dynamic/Var.h"

#include <algorithm>
#include <sstream>

const int ArxManifest::CURRENT_VERSION;
const char * ArxManifest::FILE_NAME = "manifest.json";

const char * ArxManifestEntry::statusName(Status a_status)
{
    switch (a_status)
    {
    case STATUS_OK:
        return "ok";
    case STATUS_FAILED:
        return "failed";
    case STATUS_SKIPPED:
        return "skipped";
    }
    return "failed";
}

ArxManifestEntry::Status ArxManifestEntry::statusFromName(const std::string& a_name)
{
    if (a_name == "ok")
        return STATUS_OK;
    if (a_name == "failed")
        return STATUS_FAILED;
    if (a_name == "skipped")
        return STATUS_SKIPPED;
    throw ArxParseException("Unknown manifest entry status: " + a_name);
}

namespace
{
    const std::string MSG_PREFIX = "ArxManifest : ";

    bool compareDestRelPath(const ArxManifestEntry& a, const ArxManifestEntry& b)
    {
        return a.destRelPath < b.destRelPath;
    }

    Poco::Dynamic::Var timestampValue(const ArxTimestamp& ts)
    {
        if (!ts.isKnown())
            return Poco::Dynamic::Var();
        return ts.toIso();
    }

    std::string getString(const Poco::JSON::Object::Ptr& obj, const std::string& key)
    {
        if (!obj->has(key) || obj->isNull(key))
            return "";
        return obj->get(key).convert<std::string>();
    }

    int64_t getInt(const Poco::JSON::Object::Ptr& obj, const std::string& key, int64_t defaultValue)
    {
        if (!obj->has(key) || obj->isNull(key))
            return defaultValue;
        return obj->get(key).convert<Poco::Int64>();
    }

    bool getBool(const Poco::JSON::Object::Ptr& obj, const std::string& key)
    {
        if (!obj->has(key) || obj->isNull(key))
            return false;
        return obj->get(key).convert<bool>();
    }

    ArxTimestamp getTimestamp(const Poco::JSON::Object::Ptr& obj, const std::string& key)
    {
        std::string iso = getString(obj, key);
        return iso.empty() ? ArxTimestamp::unknown() : ArxTimestamp::fromIso(iso);
    }

    Poco::JSON::Object::Ptr requireObject(const Poco::JSON::Object::Ptr& obj, const std::string& key)
    {
        Poco::JSON::Object::Ptr child = obj->getObject(key);
        if (child.isNull())
            throw ArxParseException(MSG_PREFIX + "missing object '" + key + "'");
        return child;
    }

    Poco::JSON::Object::Ptr entryToJson(const ArxManifestEntry& entry)
    {
        const ArxCandidateArtifact& src = entry.source;
        Poco::JSON::Object::Ptr source = new Poco::JSON::Object();
        source->set("evidence_id", src.evidenceId);
        source->set("partition_index", src.partitionIndex);
        source->set("logical_path", src.logicalPath);
        source->set("forensic_path", src.forensicPath);
        source->set("fs_type", src.fsType);
        source->set("size", src.size);
        source->set("inode", src.inode);
        source->set("deleted", src.deleted);
        source->set("mtime_utc", timestampValue(src.mtime));
        source->set("atime_utc", timestampValue(src.atime));
        source->set("ctime_utc", timestampValue(src.ctime));
        source->set("crtime_utc", timestampValue(src.crtime));
        source->set("artifact_type", src.artifactType);
        source->set("browser", src.browser);
        source->set("profile", src.profile);

        Poco::JSON::Object::Ptr file = new Poco::JSON::Object();
        file->set("source", source);
        file->set("dest_rel_path", entry.destRelPath);
        file->set("dest_filename", entry.destFilename);
        file->set("size_bytes", entry.sizeBytes);
        file->set("md5", entry.md5);
        file->set("sha256", entry.sha256);
        file->set("status", std::string(ArxManifestEntry::statusName(entry.status)));
        file->set("error_message", entry.errorMessage);
        file->set("extracted_at_utc", entry.extractedAt);
        file->set("logical_group", entry.logicalGroup);
        file->set("role", entry.role);
        if (entry.sourceOffsetBytes >= 0)
            file->set("source_offset_bytes", entry.sourceOffsetBytes);
        else
            file->set("source_offset_bytes", Poco::Dynamic::Var());
        return file;
    }

    ArxManifestEntry entryFromJson(const Poco::JSON::Object::Ptr& file)
    {
        ArxManifestEntry entry;
        Poco::JSON::Object::Ptr source = requireObject(file, "source");
        ArxCandidateArtifact& src = entry.source;
        src.evidenceId = getInt(source, "evidence_id", 0);
        src.partitionIndex = (int)getInt(source, "partition_index", 0);
        src.logicalPath = getString(source, "logical_path");
        src.forensicPath = getString(source, "forensic_path");
        src.fsType = getString(source, "fs_type");
        src.size = (uint64_t)getInt(source, "size", 0);
        src.inode = (uint64_t)getInt(source, "inode", 0);
        src.deleted = getBool(source, "deleted");
        src.mtime = getTimestamp(source, "mtime_utc");
        src.atime = getTimestamp(source, "atime_utc");
        src.ctime = getTimestamp(source, "ctime_utc");
        src.crtime = getTimestamp(source, "crtime_utc");
        src.artifactType = getString(source, "artifact_type");
        src.browser = getString(source, "browser");
        src.profile = getString(source, "profile");

        entry.destRelPath = getString(file, "dest_rel_path");
        if (entry.destRelPath.empty())
            throw ArxParseException(MSG_PREFIX + "file entry without dest_rel_path");
        entry.destFilename = getString(file, "dest_filename");
        entry.sizeBytes = getInt(file, "size_bytes", 0);
        entry.md5 = getString(file, "md5");
        entry.sha256 = getString(file, "sha256");
        entry.status = ArxManifestEntry::statusFromName(getString(file, "status"));
        entry.errorMessage = getString(file, "error_message");
        entry.extractedAt = getString(file, "extracted_at_utc");
        entry.logicalGroup = getString(file, "logical_group");
        entry.role = getString(file, "role");
        entry.sourceOffsetBytes = getInt(file, "source_offset_bytes", -1);
        return entry;
    }

    /// Path of a version 1 extracted_path relative to the run directory.
    std::string relativeToRunDir(const std::string& extractedPath, const std::string& runDir)
    {
        std::string path = extractedPath;
        std::replace(path.begin(), path.end(), '\\', '/');
        std::string dir = runDir;
        std::replace(dir.begin(), dir.end(), '\\', '/');
        if (!dir.empty() && dir[dir.size() - 1] != '/')
            dir += '/';

        if (!dir.empty() && path.compare(0, dir.size(), dir) == 0)
            return path.substr(dir.size());

        Poco::Path parsed(path, Poco::Path::PATH_UNIX);
        if (parsed.isAbsolute())
            return parsed.getFileName();
        return path;
    }

    /// Converts one version 1 file object into its primary and companion entries.
    void appendVersion1Entries(const Poco::JSON::Object::Ptr& file, const ArxManifest& manifest,
        const std::string& runDir, std::vector<ArxManifestEntry>& entries)
    {
        ArxManifestEntry primary;
        ArxCandidateArtifact& src = primary.source;
        src.evidenceId = manifest.evidenceId;
        src.partitionIndex = (int)getInt(file, "partition_index", 0);
        src.logicalPath = getString(file, "logical_path");
        src.forensicPath = getString(file, "forensic_path");
        src.artifactType = getString(file, "artifact_type");
        if (src.artifactType.empty())
            src.artifactType = manifest.artifactType;
        src.browser = getString(file, "browser");
        src.profile = getString(file, "profile");
        src.size = (uint64_t)getInt(file, "file_size_bytes", getInt(file, "size_bytes", 0));

        std::string extractedPath = getString(file, "extracted_path");
        std::string copyStatus = getString(file, "copy_status");
        primary.status = (copyStatus == "ok") ? ArxManifestEntry::STATUS_OK : ArxManifestEntry::STATUS_FAILED;
        if (primary.status == ArxManifestEntry::STATUS_FAILED)
            primary.errorMessage = getString(file, "error_message");

        if (extractedPath.empty())
        {
            // Failed copies of version 1 have no destination; key them by source.
            std::ostringstream rel;
            rel << "failed/p" << src.partitionIndex << src.logicalPath;
            primary.destRelPath = rel.str();
        }
        else
        {
            primary.destRelPath = relativeToRunDir(extractedPath, runDir);
        }
        primary.destFilename = ArxUtilities::baseName(primary.destRelPath);
        primary.sizeBytes = getInt(file, "size_bytes", 0);
        primary.md5 = getString(file, "md5");
        primary.sha256 = getString(file, "sha256");
        primary.extractedAt = manifest.createdAt;
        primary.logicalGroup = primary.destRelPath;
        primary.role = "primary";
        entries.push_back(primary);

        Poco::JSON::Array::Ptr companions = file->getArray("companion_files");
        if (companions.isNull())
            return;

        for (unsigned int i = 0; i < companions->size(); i++)
        {
            Poco::JSON::Object::Ptr companion = companions->getObject(i);
            if (companion.isNull())
                continue;

            std::string suffix = getString(companion, "suffix");
            ArxManifestEntry entry = primary;
            entry.source.logicalPath = src.logicalPath + suffix;
            entry.source.size = (uint64_t)getInt(companion, "size_bytes", 0);
            entry.destRelPath = primary.destRelPath + suffix;
            entry.destFilename = primary.destFilename + suffix;
            entry.sizeBytes = getInt(companion, "size_bytes", 0);
            entry.md5.clear();
            entry.sha256.clear();
            entry.role = suffix.empty() ? "companion" : suffix.substr(1);
            entries.push_back(entry);
        }
    }
}

void ArxManifest::sortFiles()
{
    std::sort(files.begin(), files.end(), compareDestRelPath);
}

std::vector<ArxManifestEntry> ArxManifest::primaryEntries() const
{
    std::vector<ArxManifestEntry> primaries;
    for (size_t i = 0; i < files.size(); i++)
    {
        if (files[i].role == "primary" || files[i].role == "carved")
            primaries.push_back(files[i]);
    }
    std::sort(primaries.begin(), primaries.end(), compareDestRelPath);
    return primaries;
}

std::vector<ArxManifestEntry> ArxManifest::companionsOf(const ArxManifestEntry& a_primary) const
{
    std::vector<ArxManifestEntry> companions;
    for (size_t i = 0; i < files.size(); i++)
    {
        if (files[i].logicalGroup == a_primary.destRelPath && files[i].destRelPath != a_primary.destRelPath)
            companions.push_back(files[i]);
    }
    std::sort(companions.begin(), companions.end(), compareDestRelPath);
    return companions;
}

std::string ArxManifest::toJson() const
{
    std::vector<ArxManifestEntry> sorted(files);
    std::sort(sorted.begin(), sorted.end(), compareDestRelPath);

    Poco::JSON::Object::Ptr doc = new Poco::JSON::Object();
    doc->set("manifest_version", CURRENT_VERSION);
    doc->set("run_id", runId);
    doc->set("evidence_id", evidenceId);
    doc->set("extractor", extractor);
    doc->set("extractor_version", extractorVersion);
    doc->set("artifact_type", artifactType);
    doc->set("status", status);
    doc->set("created_at_utc", createdAt);

    Poco::JSON::Array::Ptr fileArray = new Poco::JSON::Array();
    for (size_t i = 0; i < sorted.size(); i++)
        fileArray->add(entryToJson(sorted[i]));
    doc->set("files", fileArray);

    std::ostringstream out;
    doc->stringify(out, 2);
    return out.str();
}

void ArxManifest::save(const std::string& a_path) const
{
    std::string tempPath = a_path + ".tmp";
    try
    {
        {
            Poco::FileOutputStream out(tempPath);
            out << toJson() << std::endl;
            out.close();
            if (!out.good())
                throw ArxStorageUnavailableException(MSG_PREFIX + "error writing " + tempPath);
        }
        Poco::File(tempPath).renameTo(a_path);
    }
    catch (Poco::Exception& ex)
    {
        throw ArxStorageUnavailableException(MSG_PREFIX + "error saving " + a_path + ": " + ex.displayText());
    }
}

ArxManifest ArxManifest::load(const std::string& a_path)
{
    Poco::File manifestFile(a_path);
    if (!manifestFile.exists())
        throw ArxParseException(MSG_PREFIX + "manifest '" + a_path + "' does not exist");

    try
    {
        Poco::FileInputStream in(a_path);
        return parse(in, Poco::Path(a_path).parent().toString());
    }
    catch (Poco::Exception& ex)
    {
        throw ArxParseException(MSG_PREFIX + "error reading " + a_path + ": " + ex.displayText());
    }
}

ArxManifest ArxManifest::parse(std::istream& a_input, const std::string& a_runDir)
{
    ArxManifest manifest;
    try
    {
        Poco::JSON::Parser parser;
        Poco::Dynamic::Var result = parser.parse(a_input);
        Poco::JSON::Object::Ptr doc = result.extract<Poco::JSON::Object::Ptr>();

        manifest.runId = getString(doc, "run_id");
        manifest.evidenceId = getInt(doc, "evidence_id", 0);
        manifest.extractor = getString(doc, "extractor");
        manifest.status = getString(doc, "status");

        if (manifest.runId.empty())
            throw ArxParseException(MSG_PREFIX + "manifest without run_id");

        Poco::JSON::Array::Ptr fileArray = doc->getArray("files");
        if (fileArray.isNull())
            throw ArxParseException(MSG_PREFIX + "manifest without files");

        if (doc->has("manifest_version"))
        {
            manifest.manifestVersion = (int)getInt(doc, "manifest_version", CURRENT_VERSION);
            if (manifest.manifestVersion > CURRENT_VERSION)
            {
                std::ostringstream msg;
                msg << MSG_PREFIX << "unsupported manifest_version " << manifest.manifestVersion;
                throw ArxParseException(msg.str());
            }
            manifest.extractorVersion = getString(doc, "extractor_version");
            manifest.artifactType = getString(doc, "artifact_type");
            manifest.createdAt = getString(doc, "created_at_utc");

            for (unsigned int i = 0; i < fileArray->size(); i++)
            {
                Poco::JSON::Object::Ptr file = fileArray->getObject(i);
                if (file.isNull())
                    throw ArxParseException(MSG_PREFIX + "file entry is not an object");
                manifest.files.push_back(entryFromJson(file));
            }
        }
        else
        {
            manifest.manifestVersion = 1;
            manifest.extractorVersion = getString(doc, "version");
            manifest.artifactType = getString(doc, "artifact_type");
            manifest.createdAt = getString(doc, "extraction_timestamp_utc");
            if (manifest.status == "success")
                manifest.status = "ok";

            for (unsigned int i = 0; i < fileArray->size(); i++)
            {
                Poco::JSON::Object::Ptr file = fileArray->getObject(i);
                if (file.isNull())
                    throw ArxParseException(MSG_PREFIX + "file entry is not an object");
                appendVersion1Entries(file, manifest, a_runDir, manifest.files);
            }

            std::ostringstream msg;
            msg << MSG_PREFIX << "converted version 1 manifest of run " << manifest.runId
                << " (" << manifest.files.size() << " entries)";
            LOGINFO(msg.str());
        }
    }
    catch (Poco::Exception& ex)
    {
        throw ArxParseException(MSG_PREFIX + "invalid manifest: " + ex.displayText());
    }

    manifest.sortFiles();
    return manifest;
}
