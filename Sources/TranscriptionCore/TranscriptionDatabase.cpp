#include "TranscriptionDatabase.hpp"

#include "Logger.hpp"

#include <filesystem>
#include <string>
#include <system_error>

#include <sqlite3.h>

namespace vnt {

namespace {

// ---------------------------------------------------------------------------
// RAII helper for SQLite transactions
// ---------------------------------------------------------------------------

class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
    }
    bool commit() {
        if (!committed_) {
            committed_ = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) == SQLITE_OK;
        }
        return committed_;
    }
    ~Transaction() {
        if (!committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

private:
    sqlite3* db_;
    bool committed_ = false;
};

// ---------------------------------------------------------------------------
// RAII helper for SQLite prepared statements
// ---------------------------------------------------------------------------

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) {
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            Logger::error(std::string("[TranscriptionDatabase] Prepare failed: ")
                          + sqlite3_errmsg(db));
            stmt_ = nullptr;
        }
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    operator sqlite3_stmt*() const { return stmt_; }
    bool ok() const { return stmt_ != nullptr; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

// ---------------------------------------------------------------------------
// Column helpers
// ---------------------------------------------------------------------------

const char* kStatsColumns =
    "id, entity_id, status, start_time_ms, end_time_ms, duration_ms, "
    "audio_path, audio_size_bytes, audio_duration_s, transcription_text, "
    "transcription_length, detected_language, engine_id, speed_ratio, error_message";

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_optional(sqlite3_stmt* stmt, int index, const std::optional<int64_t>& value) {
    if (value) sqlite3_bind_int64(stmt, index, *value);
    else       sqlite3_bind_null(stmt, index);
}

void bind_optional(sqlite3_stmt* stmt, int index, const std::optional<int32_t>& value) {
    if (value) sqlite3_bind_int(stmt, index, *value);
    else       sqlite3_bind_null(stmt, index);
}

void bind_optional(sqlite3_stmt* stmt, int index, const std::optional<float>& value) {
    if (value) sqlite3_bind_double(stmt, index, static_cast<double>(*value));
    else       sqlite3_bind_null(stmt, index);
}

void bind_optional(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value) bind_text(stmt, index, *value);
    else       sqlite3_bind_null(stmt, index);
}

bool is_null(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* t = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return t ? t : "";
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int col) {
    if (is_null(stmt, col)) return std::nullopt;
    return column_text(stmt, col);
}

std::optional<int64_t> column_optional_int64(sqlite3_stmt* stmt, int col) {
    if (is_null(stmt, col)) return std::nullopt;
    return sqlite3_column_int64(stmt, col);
}

std::optional<float> column_optional_float(sqlite3_stmt* stmt, int col) {
    if (is_null(stmt, col)) return std::nullopt;
    return static_cast<float>(sqlite3_column_double(stmt, col));
}

/// Bind parameters 1..14 in kStatsColumns order, skipping `id`.
void bind_stats_fields(sqlite3_stmt* stmt, const TranscriptionStats& s) {
    sqlite3_bind_int64(stmt, 1, s.entity_id);
    sqlite3_bind_text(stmt, 2, status_to_string(s.status), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, s.start_time_ms);
    bind_optional(stmt, 4, s.end_time_ms);
    bind_optional(stmt, 5, s.duration_ms);
    bind_text(stmt, 6, s.audio_file_path);
    sqlite3_bind_int64(stmt, 7, s.audio_file_size_bytes);
    bind_optional(stmt, 8, s.audio_duration_seconds);
    bind_optional(stmt, 9, s.transcription_text);
    bind_optional(stmt, 10, s.transcription_length);
    bind_optional(stmt, 11, s.detected_language);
    bind_optional(stmt, 12, s.engine_id);
    bind_optional(stmt, 13, s.processing_speed_ratio);
    bind_optional(stmt, 14, s.error_message);
}

TranscriptionStats read_stats_row(sqlite3_stmt* stmt) {
    TranscriptionStats s;
    s.id                     = sqlite3_column_int64(stmt, 0);
    s.entity_id              = sqlite3_column_int64(stmt, 1);
    s.status                 = status_from_string(column_text(stmt, 2));
    s.start_time_ms          = sqlite3_column_int64(stmt, 3);
    s.end_time_ms            = column_optional_int64(stmt, 4);
    s.duration_ms            = column_optional_int64(stmt, 5);
    s.audio_file_path        = column_text(stmt, 6);
    s.audio_file_size_bytes  = sqlite3_column_int64(stmt, 7);
    s.audio_duration_seconds = column_optional_float(stmt, 8);
    s.transcription_text     = column_optional_text(stmt, 9);
    if (!is_null(stmt, 10)) {
        s.transcription_length = sqlite3_column_int(stmt, 10);
    }
    s.detected_language      = column_optional_text(stmt, 11);
    s.engine_id              = column_optional_text(stmt, 12);
    s.processing_speed_ratio = column_optional_float(stmt, 13);
    s.error_message          = column_optional_text(stmt, 14);
    return s;
}

std::optional<TranscriptionStats> first_or_none(std::vector<TranscriptionStats> rows) {
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

TranscriptionDatabase::TranscriptionDatabase(const std::string& db_path)
    : db_path_(db_path) {}

TranscriptionDatabase::~TranscriptionDatabase() {
    close();
}

// ---------------------------------------------------------------------------
// open / close / is_open
// ---------------------------------------------------------------------------

bool TranscriptionDatabase::open() {
    std::lock_guard<std::mutex> lock(mu_);

    if (db_) return true;   // already open

    if (db_path_.empty()) return false;

    // Ensure parent directory exists.
    if (db_path_ != ":memory:") {
        auto parent = std::filesystem::path(db_path_).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                Logger::error("[TranscriptionDatabase] Cannot create " + parent.string()
                              + ": " + ec.message());
                return false;
            }
        }
    }

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        Logger::error("[TranscriptionDatabase] Cannot open " + db_path_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }

    // Enable WAL mode for crash safety and concurrent reads.
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 5000);

    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    return true;
}

void TranscriptionDatabase::close() {
    std::lock_guard<std::mutex> lock(mu_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool TranscriptionDatabase::is_open() const {
    std::lock_guard<std::mutex> lock(mu_);
    return db_ != nullptr;
}

// ---------------------------------------------------------------------------
// create_tables
// ---------------------------------------------------------------------------

bool TranscriptionDatabase::create_tables() {
    const char* sql = R"SQL(
        CREATE TABLE IF NOT EXISTS entities (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            label TEXT NOT NULL,
            transcript TEXT,
            transcript_language TEXT
        );
        CREATE TABLE IF NOT EXISTS transcription_stats (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            entity_id INTEGER NOT NULL,
            status TEXT NOT NULL DEFAULT 'pending',
            start_time_ms INTEGER NOT NULL,
            end_time_ms INTEGER,
            duration_ms INTEGER,
            audio_path TEXT NOT NULL,
            audio_size_bytes INTEGER NOT NULL DEFAULT 0,
            audio_duration_s REAL,
            transcription_text TEXT,
            transcription_length INTEGER,
            detected_language TEXT,
            engine_id TEXT,
            speed_ratio REAL,
            error_message TEXT
        );
        CREATE INDEX IF NOT EXISTS idx_stats_entity
            ON transcription_stats(entity_id);
        CREATE INDEX IF NOT EXISTS idx_stats_status
            ON transcription_stats(status);
        CREATE UNIQUE INDEX IF NOT EXISTS idx_stats_pending_pair
            ON transcription_stats(entity_id, audio_path)
            WHERE status = 'pending';
    )SQL";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        Logger::error(std::string("[TranscriptionDatabase] Schema creation failed: ")
                      + (err ? err : "unknown error"));
        if (err) sqlite3_free(err);
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Entity operations
// ---------------------------------------------------------------------------

std::optional<int64_t> TranscriptionDatabase::add_entity(const std::string& label) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return std::nullopt;

    Transaction txn(db_);

    Statement stmt(db_, "INSERT INTO entities (label) VALUES (?)");
    if (!stmt.ok()) return std::nullopt;
    bind_text(stmt, 1, label);

    if (sqlite3_step(stmt) != SQLITE_DONE) return std::nullopt;
    const int64_t id = sqlite3_last_insert_rowid(db_);

    if (!txn.commit()) return std::nullopt;
    return id;
}

std::optional<Entity> TranscriptionDatabase::get_entity(int64_t entity_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return std::nullopt;

    Statement stmt(db_,
        "SELECT id, label, transcript, transcript_language FROM entities WHERE id = ?");
    if (!stmt.ok()) return std::nullopt;
    sqlite3_bind_int64(stmt, 1, entity_id);

    if (sqlite3_step(stmt) != SQLITE_ROW) return std::nullopt;

    Entity e;
    e.id                  = sqlite3_column_int64(stmt, 0);
    e.label               = column_text(stmt, 1);
    e.transcript          = column_optional_text(stmt, 2);
    e.transcript_language = column_optional_text(stmt, 3);
    return e;
}

bool TranscriptionDatabase::entity_exists(int64_t entity_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return false;

    Statement stmt(db_, "SELECT 1 FROM entities WHERE id = ?");
    if (!stmt.ok()) return false;
    sqlite3_bind_int64(stmt, 1, entity_id);
    return sqlite3_step(stmt) == SQLITE_ROW;
}

bool TranscriptionDatabase::update_transcript(int64_t entity_id,
                                              const std::string& text,
                                              const std::string& language_code) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return false;

    Transaction txn(db_);

    Statement stmt(db_,
        "UPDATE entities SET transcript = ?, transcript_language = ? WHERE id = ?");
    if (!stmt.ok()) return false;
    bind_text(stmt, 1, text);
    bind_text(stmt, 2, language_code);
    sqlite3_bind_int64(stmt, 3, entity_id);

    if (sqlite3_step(stmt) != SQLITE_DONE) return false;
    if (sqlite3_changes(db_) == 0) return false;

    return txn.commit();
}

// ---------------------------------------------------------------------------
// Stats: writes
// ---------------------------------------------------------------------------

std::optional<int64_t> TranscriptionDatabase::insert(const TranscriptionStats& stats) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return std::nullopt;

    Transaction txn(db_);

    const std::string sql =
        "INSERT INTO transcription_stats ("
        "entity_id, status, start_time_ms, end_time_ms, duration_ms, "
        "audio_path, audio_size_bytes, audio_duration_s, transcription_text, "
        "transcription_length, detected_language, engine_id, speed_ratio, error_message"
        ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    Statement stmt(db_, sql);
    if (!stmt.ok()) return std::nullopt;
    bind_stats_fields(stmt, stats);

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
            Logger::debug("[TranscriptionDatabase] Pending record already exists for entity "
                          + std::to_string(stats.entity_id));
        } else {
            Logger::error(std::string("[TranscriptionDatabase] Insert failed: ")
                          + sqlite3_errmsg(db_));
        }
        return std::nullopt;
    }
    const int64_t id = sqlite3_last_insert_rowid(db_);

    if (!txn.commit()) return std::nullopt;
    return id;
}

bool TranscriptionDatabase::update_by_id(const TranscriptionStats& stats) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return false;

    Transaction txn(db_);

    const std::string sql =
        "UPDATE transcription_stats SET "
        "entity_id = ?, status = ?, start_time_ms = ?, end_time_ms = ?, duration_ms = ?, "
        "audio_path = ?, audio_size_bytes = ?, audio_duration_s = ?, transcription_text = ?, "
        "transcription_length = ?, detected_language = ?, engine_id = ?, speed_ratio = ?, "
        "error_message = ? WHERE id = ?";
    Statement stmt(db_, sql);
    if (!stmt.ok()) return false;
    bind_stats_fields(stmt, stats);
    sqlite3_bind_int64(stmt, 15, stats.id);

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        Logger::error(std::string("[TranscriptionDatabase] Update failed: ")
                      + sqlite3_errmsg(db_));
        return false;
    }
    if (sqlite3_changes(db_) == 0) return false;

    return txn.commit();
}

bool TranscriptionDatabase::delete_all() {
    std::lock_guard<std::mutex> lock(mu_);
    return execute_locked("DELETE FROM transcription_stats", nullptr);
}

bool TranscriptionDatabase::delete_for_entity(int64_t entity_id) {
    std::lock_guard<std::mutex> lock(mu_);
    return execute_locked("DELETE FROM transcription_stats WHERE entity_id = ?",
                          [entity_id](sqlite3_stmt* stmt) {
                              sqlite3_bind_int64(stmt, 1, entity_id);
                          });
}

// ---------------------------------------------------------------------------
// Stats: queries
// ---------------------------------------------------------------------------

std::optional<TranscriptionStats> TranscriptionDatabase::find_pending_for(
    int64_t entity_id, const std::string& audio_path) const {
    std::lock_guard<std::mutex> lock(mu_);
    return first_or_none(query_stats_locked(
        "WHERE entity_id = ? AND audio_path = ? AND status = 'pending' LIMIT 1",
        [&](sqlite3_stmt* stmt) {
            sqlite3_bind_int64(stmt, 1, entity_id);
            bind_text(stmt, 2, audio_path);
        }));
}

std::optional<TranscriptionStats> TranscriptionDatabase::get_by_id(int64_t id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return first_or_none(query_stats_locked(
        "WHERE id = ?",
        [id](sqlite3_stmt* stmt) { sqlite3_bind_int64(stmt, 1, id); }));
}

std::vector<TranscriptionStats> TranscriptionDatabase::get_all() const {
    std::lock_guard<std::mutex> lock(mu_);
    return query_stats_locked("ORDER BY start_time_ms DESC, id DESC", nullptr);
}

std::vector<TranscriptionStats> TranscriptionDatabase::get_by_status(
    TranscriptionStatus status) const {
    std::lock_guard<std::mutex> lock(mu_);
    return query_stats_locked(
        "WHERE status = ? ORDER BY start_time_ms DESC, id DESC",
        [status](sqlite3_stmt* stmt) {
            sqlite3_bind_text(stmt, 1, status_to_string(status), -1, SQLITE_STATIC);
        });
}

std::vector<TranscriptionStats> TranscriptionDatabase::get_for_entity(int64_t entity_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return query_stats_locked(
        "WHERE entity_id = ? ORDER BY start_time_ms DESC, id DESC",
        [entity_id](sqlite3_stmt* stmt) { sqlite3_bind_int64(stmt, 1, entity_id); });
}

std::vector<TranscriptionStats> TranscriptionDatabase::get_pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return query_stats_locked("WHERE status = 'pending' ORDER BY start_time_ms ASC, id ASC",
                              nullptr);
}

int TranscriptionDatabase::count_by_status(TranscriptionStatus status) const {
    std::lock_guard<std::mutex> lock(mu_);
    const std::string where = std::string("WHERE status = '") + status_to_string(status) + "'";
    return query_count_locked(where.c_str());
}

StatsSummary TranscriptionDatabase::summary() const {
    std::lock_guard<std::mutex> lock(mu_);
    StatsSummary s;
    if (!db_) return s;

    s.success_count = query_count_locked("WHERE status = 'success'");
    s.failed_count  = query_count_locked("WHERE status = 'failed'");
    s.pending_count = query_count_locked("WHERE status = 'pending'");
    s.total_count   = query_count_locked("");

    s.average_duration_ms          = query_average_locked("duration_ms");
    s.average_transcription_length = query_average_locked("transcription_length");
    s.average_speed_ratio          = query_average_locked("speed_ratio");

    s.fastest = first_or_none(query_stats_locked(
        "WHERE status = 'success' AND duration_ms IS NOT NULL "
        "ORDER BY duration_ms ASC LIMIT 1", nullptr));
    s.slowest = first_or_none(query_stats_locked(
        "WHERE status = 'success' AND duration_ms IS NOT NULL "
        "ORDER BY duration_ms DESC LIMIT 1", nullptr));
    s.longest = first_or_none(query_stats_locked(
        "WHERE status = 'success' AND transcription_length IS NOT NULL "
        "ORDER BY transcription_length DESC LIMIT 1", nullptr));
    return s;
}

// ---------------------------------------------------------------------------
// Locked helpers
// ---------------------------------------------------------------------------

std::vector<TranscriptionStats> TranscriptionDatabase::query_stats_locked(
    const char* where_order_limit, const Binder& bind) const {
    std::vector<TranscriptionStats> results;
    if (!db_) return results;

    const std::string sql = std::string("SELECT ") + kStatsColumns
                          + " FROM transcription_stats " + where_order_limit;
    Statement stmt(db_, sql);
    if (!stmt.ok()) return results;
    if (bind) bind(stmt);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(read_stats_row(stmt));
    }
    return results;
}

std::optional<double> TranscriptionDatabase::query_average_locked(const char* column) const {
    if (!db_) return std::nullopt;

    const std::string sql = std::string("SELECT AVG(") + column
                          + ") FROM transcription_stats WHERE status = 'success' AND "
                          + column + " IS NOT NULL";
    Statement stmt(db_, sql);
    if (!stmt.ok()) return std::nullopt;

    if (sqlite3_step(stmt) != SQLITE_ROW || is_null(stmt, 0)) return std::nullopt;
    return sqlite3_column_double(stmt, 0);
}

int TranscriptionDatabase::query_count_locked(const char* where) const {
    if (!db_) return 0;

    const std::string sql = std::string("SELECT COUNT(*) FROM transcription_stats ") + where;
    Statement stmt(db_, sql);
    if (!stmt.ok()) return 0;

    if (sqlite3_step(stmt) != SQLITE_ROW) return 0;
    return sqlite3_column_int(stmt, 0);
}

bool TranscriptionDatabase::execute_locked(const char* sql, const Binder& bind) {
    if (!db_) return false;

    Transaction txn(db_);

    Statement stmt(db_, sql);
    if (!stmt.ok()) return false;
    if (bind) bind(stmt);

    if (sqlite3_step(stmt) != SQLITE_DONE) return false;

    return txn.commit();
}

} // namespace vnt
