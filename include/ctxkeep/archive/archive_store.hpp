/*
 * ctxkeep C++ - SQLite Archive Store
 *
 * Default ArchivalSink. Every write becomes one row in 'archives' plus one
 * row per item in 'archived_items'. Rows are write-once: triggers abort any
 * UPDATE or DELETE, and each item carries a SHA-256 checksum of its content
 * so verify() can prove an entry was stored losslessly.
 */
#ifndef ctxkeep_ARCHIVE_ARCHIVE_STORE_HPP
#define ctxkeep_ARCHIVE_ARCHIVE_STORE_HPP

#include <ctxkeep/archive/sink.hpp>
#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace ctxkeep {

// Header row of one archive entry
struct ArchiveEntryInfo {
    std::string reference;
    std::string consumer_id;
    std::string reason;
    int64_t archived_at;        // unix ms
    int item_count;
    int64_t total_tokens;

    ArchiveEntryInfo() : archived_at(0), item_count(0), total_tokens(0) {}
};

// A full archive entry, items in the order they were written
struct ArchiveEntry {
    ArchiveEntryInfo info;
    std::vector<ContextItem> items;
};

class ArchiveStore : public ArchivalSink {
public:
    ArchiveStore();
    ~ArchiveStore();

    // Database lifecycle. `busy_timeout_ms` bounds how long a write waits
    // for a locked database before failing.
    bool open(const std::string& db_path, int busy_timeout_ms = 5000);
    void close();
    bool is_open() const;

    // ArchivalSink
    const char* name() const override { return "sqlite"; }
    ArchiveResult write(const std::string& consumer_id,
                        const std::vector<ContextItem>& items,
                        ArchiveReason reason) override;

    // Read back (outside the engine; used by tooling and tests)
    bool load(const std::string& reference, ArchiveEntry& out);
    std::vector<ArchiveEntryInfo> list(const std::string& consumer_id = "", int limit = 100);
    int count(const std::string& consumer_id = "");

    // Recompute every item checksum of an entry
    bool verify(const std::string& reference);

    std::string last_error() const;

private:
    sqlite3* db_;
    std::string path_;
    mutable std::mutex mutex_;
    std::string last_error_;
    uint64_t write_counter_;

    bool ensure_schema();
    bool exec(const std::string& sql);
    void set_error(const std::string& error);
    void set_error_from_db();
    std::string make_reference(const std::string& consumer_id, int64_t now);
};

} // namespace ctxkeep

#endif // ctxkeep_ARCHIVE_ARCHIVE_STORE_HPP
