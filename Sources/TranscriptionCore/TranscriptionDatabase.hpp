#pragma once

#include "EntityStore.hpp"
#include "StatsStore.hpp"
#include "Types.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward-declare sqlite3 so we don't leak its header into consumers.
struct sqlite3;
struct sqlite3_stmt;

namespace vnt {

/// A record a voice note belongs to, as stored by TranscriptionDatabase.
struct Entity {
    int64_t                    id = 0;
    std::string                label;
    std::optional<std::string> transcript;
    std::optional<std::string> transcript_language;
};

/// SQLite-backed StatsStore and EntityStore.
///
/// Tables:
///   entities            (id, label, transcript, transcript_language)
///   transcription_stats (one row per transcription attempt)
///
/// A partial unique index on (entity_id, audio_path) WHERE status='pending'
/// makes a second pending record for the same clip impossible.
///
/// Uses SQLite WAL mode for crash-safe writes.  All mutating operations are
/// wrapped in explicit transactions.  Pass ":memory:" for a private
/// in-memory database.
class TranscriptionDatabase : public StatsStore, public EntityStore {
public:
    explicit TranscriptionDatabase(const std::string& db_path);
    ~TranscriptionDatabase() override;

    // Non-copyable.
    TranscriptionDatabase(const TranscriptionDatabase&) = delete;
    TranscriptionDatabase& operator=(const TranscriptionDatabase&) = delete;

    /// Open (or create) the database.  Returns false on failure.
    /// Automatically creates tables and indexes.
    bool open();

    /// Explicitly close the database.
    void close();

    /// Whether the database is open.
    bool is_open() const;

    // ---- Entities ----

    /// Create an entity.  Returns its id, or nullopt on failure.
    std::optional<int64_t> add_entity(const std::string& label);

    std::optional<Entity> get_entity(int64_t entity_id) const;

    bool entity_exists(int64_t entity_id) const override;

    bool update_transcript(int64_t entity_id,
                           const std::string& text,
                           const std::string& language_code) override;

    // ---- Stats ----

    std::optional<TranscriptionStats> find_pending_for(
        int64_t entity_id, const std::string& audio_path) const override;

    std::optional<int64_t> insert(const TranscriptionStats& stats) override;
    bool update_by_id(const TranscriptionStats& stats) override;

    std::optional<TranscriptionStats> get_by_id(int64_t id) const override;
    std::vector<TranscriptionStats> get_all() const override;
    std::vector<TranscriptionStats> get_by_status(TranscriptionStatus status) const override;
    std::vector<TranscriptionStats> get_for_entity(int64_t entity_id) const override;
    std::vector<TranscriptionStats> get_pending() const override;

    int count_by_status(TranscriptionStatus status) const override;
    StatsSummary summary() const override;

    bool delete_all() override;
    bool delete_for_entity(int64_t entity_id) override;

private:
    using Binder = std::function<void(sqlite3_stmt*)>;

    /// Run the schema migration (CREATE TABLE IF NOT EXISTS ...).
    bool create_tables();

    // The *_locked helpers expect mu_ to be held.
    std::vector<TranscriptionStats> query_stats_locked(const char* where_order_limit,
                                                       const Binder& bind) const;
    std::optional<double> query_average_locked(const char* column) const;
    int query_count_locked(const char* where) const;
    bool execute_locked(const char* sql, const Binder& bind);

    std::string        db_path_;
    sqlite3*           db_ = nullptr;
    mutable std::mutex mu_;
};

} // namespace vnt
