/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/* Fixture builders shared by the arx tests. Everything is generated at
 * test time in temporary directories. */

#ifndef ARX_TEST_FIXTURES_H
#define ARX_TEST_FIXTURES_H

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "arx/fs/ArxEvidenceFSDirectory.h"
#include "arx/discovery/ArxPatternSet.h"
#include "arx/services/ArxConfig.h"
#include "arx/services/ArxImgDBSqlite.h"
#include "arx/utilities/ArxCancellationToken.h"

namespace fixtures {
    /* Engine configuration writing below out_dir. */
    ArxConfig make_config(const std::filesystem::path& out_dir, unsigned int workers = 1);

    /* An initialized store at path. */
    std::unique_ptr<ArxImgDBSqlite> open_db(const std::filesystem::path& path);

    /* Artifact patterns used by the tests. */
    ArxPatternSet test_patterns();
    extern const char * TEST_PATTERNS_XML;
    extern const char * TEST_PIPELINE_XML;

    struct history_visit {
        std::string url;
        std::string title;
        int64_t visit_time;   // WebKit or PRTime microseconds
        int transition;
    };

    /* Writes a Chromium History database to path. The first
     * committed_rows visits are checkpointed into the main file; the rest
     * stay as frames in path-wal, as a live browser leaves them. */
    void make_chromium_history(const std::filesystem::path& path, const std::vector<history_visit>& visits,
        size_t committed_rows);

    /* Writes a Firefox places.sqlite with every visit in the main file. */
    void make_firefox_places(const std::filesystem::path& path, const std::vector<history_visit>& visits);

    /* Minimal PNG header followed by payload, so distinct payloads give
     * distinct content hashes. */
    std::string png_bytes(const std::string& payload);

    /* A cache2 entry for url with the given body and response head. */
    std::string cache2_entry(const std::string& url, const std::string& body, const std::string& response_head);

    /* mozLz4 bookmark backup with one toolbar bookmark per url. */
    std::string bookmark_backup(const std::vector<std::string>& urls);

    /* Recursive listing of a directory: relative path -> content. */
    std::vector<std::pair<std::string, std::string> > snapshot(const std::filesystem::path& root);

    /**
     * Directory backed evidence that injects failures: opening a path that
     * contains fail_marker throws, and after cancel_after_opens opens the
     * token is cancelled.
     */
    class FaultyEvidenceFS : public ArxEvidenceFSDirectory {
    public:
        FaultyEvidenceFS(const std::string& root, const std::string& fail_marker,
            ArxCancellationToken * cancel = NULL, size_t cancel_after_opens = 0);

        virtual std::unique_ptr<ArxEvidenceFile> open(int a_partition, const std::string& a_path) const;
        virtual bool isThreadSafe() const { return false; }

        size_t opens() const { return m_opens.load(); }

    private:
        std::string m_failMarker;
        ArxCancellationToken * m_cancel;
        size_t m_cancelAfter;
        mutable std::atomic<size_t> m_opens;
    };
}

#endif
