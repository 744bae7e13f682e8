/*
 * ctxkeep C++ - SQLite Archive Store Implementation
 */
#include <ctxkeep/archive/archive_store.hpp>
#include <ctxkeep/core/config.hpp>
#include <ctxkeep/core/logger.hpp>
#include <ctxkeep/core/utils.hpp>

#include <cstdio>
#include <sstream>

namespace ctxkeep {

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

// Content may hold embedded NULs; read it by byte count
std::string column_bytes(sqlite3_stmt* stmt, int col) {
    const char* data = reinterpret_cast<const char*>(sqlite3_column_blob(stmt, col));
    int size = sqlite3_column_bytes(stmt, col);
    return data && size > 0 ? std::string(data, static_cast<size_t>(size)) : std::string();
}

std::string metadata_to_json(const ItemMetadata& metadata) {
    Json obj = Json::object();
    for (ItemMetadata::Entries::const_iterator it = metadata.entries().begin();
         it != metadata.entries().end(); ++it) {
        obj[meta_key_to_string(it->first)] = it->second;
    }
    return obj.dump();
}

ItemMetadata metadata_from_json(const std::string& text) {
    ItemMetadata metadata;
    if (text.empty()) return metadata;

    Json obj = Json::parse(text, nullptr, false);
    if (obj.is_discarded() || !obj.is_object()) {
        LOG_WARN("[ArchiveStore] Unreadable metadata column: %s", text.c_str());
        return metadata;
    }
    for (Json::const_iterator it = obj.begin(); it != obj.end(); ++it) {
        MetaKey key;
        if (it.value().is_string() && meta_key_from_string(it.key(), key)) {
            metadata.set(key, it.value().get<std::string>());
        }
    }
    return metadata;
}

} // anonymous namespace

// ============================================================================
// Lifecycle
// ============================================================================

ArchiveStore::ArchiveStore() : db_(nullptr), write_counter_(0) {}

ArchiveStore::~ArchiveStore() {
    close();
}

bool ArchiveStore::open(const std::string& db_path, int busy_timeout_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    if (db_path != ":memory:" && !create_parent_directory(db_path)) {
        set_error("failed to create parent directory for '" + db_path + "'");
        LOG_ERROR("[ArchiveStore] %s", last_error_.c_str());
        return false;
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        set_error_from_db();
        LOG_ERROR("[ArchiveStore] Failed to open database '%s': %s",
                  db_path.c_str(), last_error_.c_str());
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");
    sqlite3_busy_timeout(db_, busy_timeout_ms > 0 ? busy_timeout_ms : 0);

    if (!ensure_schema()) {
        LOG_ERROR("[ArchiveStore] Failed to initialize tables: %s", last_error_.c_str());
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    path_ = db_path;
    LOG_INFO("[ArchiveStore] Database opened: %s (busy timeout %d ms)", db_path.c_str(), busy_timeout_ms);
    return true;
}

void ArchiveStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool ArchiveStore::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

std::string ArchiveStore::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

void ArchiveStore::set_error(const std::string& error) {
    last_error_ = error;
}

void ArchiveStore::set_error_from_db() {
    last_error_ = db_ ? sqlite3_errmsg(db_) : "database not open";
}

bool ArchiveStore::exec(const std::string& sql) {
    if (!db_) return false;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        set_error(err_msg ? err_msg : "unknown");
        LOG_ERROR("[ArchiveStore] SQL error: %s\n  Query: %s", last_error_.c_str(), sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool ArchiveStore::ensure_schema() {
    bool ok = exec(
        "CREATE TABLE IF NOT EXISTS archives ("
        "  reference TEXT PRIMARY KEY,"
        "  consumer_id TEXT NOT NULL,"
        "  reason TEXT NOT NULL,"
        "  archived_at INTEGER NOT NULL,"
        "  item_count INTEGER NOT NULL,"
        "  total_tokens INTEGER NOT NULL"
        ")"
    );
    if (!ok) return false;

    ok = exec(
        "CREATE TABLE IF NOT EXISTS archived_items ("
        "  reference TEXT NOT NULL REFERENCES archives(reference),"
        "  position INTEGER NOT NULL,"
        "  item_id TEXT NOT NULL,"
        "  content TEXT NOT NULL,"
        "  kind TEXT NOT NULL,"
        "  priority INTEGER NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  sequence INTEGER NOT NULL,"
        "  token_count INTEGER NOT NULL,"
        "  summarized INTEGER NOT NULL DEFAULT 0,"
        "  archive_ref TEXT DEFAULT '',"
        "  metadata TEXT DEFAULT '{}',"
        "  checksum TEXT NOT NULL,"
        "  PRIMARY KEY (reference, position)"
        ")"
    );
    if (!ok) return false;

    // Archive entries are immutable once written
    const char* guards[] = {
        "CREATE TRIGGER IF NOT EXISTS archives_no_update BEFORE UPDATE ON archives BEGIN "
        "  SELECT RAISE(ABORT, 'archive entries are write-once');"
        "END",
        "CREATE TRIGGER IF NOT EXISTS archives_no_delete BEFORE DELETE ON archives BEGIN "
        "  SELECT RAISE(ABORT, 'archive entries are write-once');"
        "END",
        "CREATE TRIGGER IF NOT EXISTS archived_items_no_update BEFORE UPDATE ON archived_items BEGIN "
        "  SELECT RAISE(ABORT, 'archive entries are write-once');"
        "END",
        "CREATE TRIGGER IF NOT EXISTS archived_items_no_delete BEFORE DELETE ON archived_items BEGIN "
        "  SELECT RAISE(ABORT, 'archive entries are write-once');"
        "END",
    };
    for (size_t i = 0; i < sizeof(guards) / sizeof(guards[0]); ++i) {
        if (!exec(guards[i])) return false;
    }

    exec("CREATE INDEX IF NOT EXISTS idx_archives_consumer ON archives(consumer_id, archived_at)");

    LOG_DEBUG("[ArchiveStore] Tables initialized");
    return true;
}

std::string ArchiveStore::make_reference(const std::string& consumer_id, int64_t now) {
    std::ostringstream seed;
    seed << consumer_id << ":" << now << ":" << ++write_counter_ << ":" << path_;
    return "arc-" + format_file_stamp(now) + "-" + sha256_hex(seed.str()).substr(0, 12);
}

// ============================================================================
// Write
// ============================================================================

ArchiveResult ArchiveStore::write(const std::string& consumer_id,
                                  const std::vector<ContextItem>& items,
                                  ArchiveReason reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("archive database not open");
        return ArchiveResult::fail(last_error_);
    }

    int64_t now = current_timestamp_ms();
    std::string reference = make_reference(consumer_id, now);

    int64_t total_tokens = 0;
    for (size_t i = 0; i < items.size(); ++i) {
        total_tokens += static_cast<int64_t>(items[i].token_count);
    }

    if (!exec("BEGIN IMMEDIATE")) {
        return ArchiveResult::fail(last_error_);
    }

    const char* header_sql =
        "INSERT INTO archives (reference, consumer_id, reason, archived_at, item_count, total_tokens) "
        "VALUES (?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, header_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        set_error_from_db();
        exec("ROLLBACK");
        return ArchiveResult::fail(last_error_);
    }

    sqlite3_bind_text(stmt, 1, reference.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, consumer_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, archive_reason_to_string(reason), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 4, now);
    sqlite3_bind_int(stmt, 5, static_cast<int>(items.size()));
    sqlite3_bind_int64(stmt, 6, total_tokens);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        exec("ROLLBACK");
        return ArchiveResult::fail(last_error_);
    }

    const char* item_sql =
        "INSERT INTO archived_items "
        "(reference, position, item_id, content, kind, priority, created_at, sequence, "
        " token_count, summarized, archive_ref, metadata, checksum) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    rc = sqlite3_prepare_v2(db_, item_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        set_error_from_db();
        exec("ROLLBACK");
        return ArchiveResult::fail(last_error_);
    }

    for (size_t i = 0; i < items.size(); ++i) {
        const ContextItem& item = items[i];
        std::string metadata = metadata_to_json(item.metadata);
        std::string checksum = sha256_hex(item.content);

        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        sqlite3_bind_text(stmt, 1, reference.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 2, static_cast<int>(i));
        sqlite3_bind_text(stmt, 3, item.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, item.content.c_str(), static_cast<int>(item.content.size()), SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, item_kind_to_string(item.kind), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 6, static_cast<int>(item.priority));
        sqlite3_bind_int64(stmt, 7, item.created_at);
        sqlite3_bind_int64(stmt, 8, static_cast<sqlite3_int64>(item.sequence));
        sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(item.token_count));
        sqlite3_bind_int(stmt, 10, item.summarized ? 1 : 0);
        sqlite3_bind_text(stmt, 11, item.archive_ref.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 12, metadata.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 13, checksum.c_str(), -1, SQLITE_TRANSIENT);

        rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            set_error_from_db();
            sqlite3_finalize(stmt);
            exec("ROLLBACK");
            LOG_ERROR("[ArchiveStore] Failed to archive item %s: %s", item.id.c_str(), last_error_.c_str());
            return ArchiveResult::fail(last_error_);
        }
    }
    sqlite3_finalize(stmt);

    if (!exec("COMMIT")) {
        std::string error = last_error_;
        exec("ROLLBACK");
        set_error(error);
        return ArchiveResult::fail(error);
    }

    LOG_DEBUG("[ArchiveStore] Archived %zu items for %s (%s, reason=%s)",
              items.size(), consumer_id.c_str(), reference.c_str(), archive_reason_to_string(reason));
    return ArchiveResult::ok(reference);
}

// ============================================================================
// Read back
// ============================================================================

bool ArchiveStore::load(const std::string& reference, ArchiveEntry& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || reference.empty()) return false;

    const char* header_sql =
        "SELECT reference, consumer_id, reason, archived_at, item_count, total_tokens "
        "FROM archives WHERE reference = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, header_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    sqlite3_bind_text(stmt, 1, reference.c_str(), -1, SQLITE_TRANSIENT);

    bool found = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        out.info.reference = column_text(stmt, 0);
        out.info.consumer_id = column_text(stmt, 1);
        out.info.reason = column_text(stmt, 2);
        out.info.archived_at = sqlite3_column_int64(stmt, 3);
        out.info.item_count = sqlite3_column_int(stmt, 4);
        out.info.total_tokens = sqlite3_column_int64(stmt, 5);
        found = true;
    }
    sqlite3_finalize(stmt);

    if (!found) {
        set_error("no archive entry '" + reference + "'");
        return false;
    }

    const char* item_sql =
        "SELECT item_id, content, kind, priority, created_at, sequence, token_count, "
        "       summarized, archive_ref, metadata "
        "FROM archived_items WHERE reference = ? ORDER BY position";

    if (sqlite3_prepare_v2(db_, item_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    sqlite3_bind_text(stmt, 1, reference.c_str(), -1, SQLITE_TRANSIENT);

    out.items.clear();
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ContextItem item;
        item.id = column_text(stmt, 0);
        item.content = column_bytes(stmt, 1);

        ItemKind kind;
        if (item_kind_from_string(column_text(stmt, 2), kind)) item.kind = kind;
        int priority = sqlite3_column_int(stmt, 3);
        if (priority >= 1 && priority <= 5) item.priority = static_cast<Priority>(priority);

        item.created_at = sqlite3_column_int64(stmt, 4);
        item.sequence = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
        item.token_count = static_cast<size_t>(sqlite3_column_int64(stmt, 6));
        item.summarized = sqlite3_column_int(stmt, 7) != 0;
        item.archive_ref = column_text(stmt, 8);
        item.metadata = metadata_from_json(column_text(stmt, 9));
        out.items.push_back(item);
    }
    sqlite3_finalize(stmt);
    return true;
}

std::vector<ArchiveEntryInfo> ArchiveStore::list(const std::string& consumer_id, int limit) {
    std::vector<ArchiveEntryInfo> results;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return results;

    std::string sql =
        "SELECT reference, consumer_id, reason, archived_at, item_count, total_tokens FROM archives ";
    if (!consumer_id.empty()) {
        sql += "WHERE consumer_id = ? ";
    }
    sql += "ORDER BY archived_at DESC, rowid DESC LIMIT ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return results;
    }

    int idx = 1;
    if (!consumer_id.empty()) {
        sqlite3_bind_text(stmt, idx++, consumer_id.c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int(stmt, idx, limit);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ArchiveEntryInfo info;
        info.reference = column_text(stmt, 0);
        info.consumer_id = column_text(stmt, 1);
        info.reason = column_text(stmt, 2);
        info.archived_at = sqlite3_column_int64(stmt, 3);
        info.item_count = sqlite3_column_int(stmt, 4);
        info.total_tokens = sqlite3_column_int64(stmt, 5);
        results.push_back(info);
    }
    sqlite3_finalize(stmt);
    return results;
}

int ArchiveStore::count(const std::string& consumer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return 0;

    std::string sql = "SELECT COUNT(*) FROM archives";
    if (!consumer_id.empty()) {
        sql += " WHERE consumer_id = ?";
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return 0;
    }
    if (!consumer_id.empty()) {
        sqlite3_bind_text(stmt, 1, consumer_id.c_str(), -1, SQLITE_TRANSIENT);
    }

    int n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        n = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return n;
}

bool ArchiveStore::verify(const std::string& reference) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    const char* sql =
        "SELECT position, content, checksum FROM archived_items WHERE reference = ? ORDER BY position";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    sqlite3_bind_text(stmt, 1, reference.c_str(), -1, SQLITE_TRANSIENT);

    int rows = 0;
    bool intact = true;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ++rows;
        std::string content = column_bytes(stmt, 1);
        if (sha256_hex(content) != column_text(stmt, 2)) {
            intact = false;
            LOG_WARN("[ArchiveStore] Checksum mismatch in %s at position %d",
                     reference.c_str(), sqlite3_column_int(stmt, 0));
        }
    }
    sqlite3_finalize(stmt);

    if (rows == 0) {
        set_error("no archived items for '" + reference + "'");
        return false;
    }
    return intact;
}

} // namespace ctxkeep
