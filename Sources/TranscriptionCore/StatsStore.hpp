#pragma once

#include "Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vnt {

/// Aggregate view over all stats records.
struct StatsSummary {
    int success_count = 0;
    int failed_count  = 0;
    int pending_count = 0;
    int total_count   = 0;

    std::optional<double> average_duration_ms;
    std::optional<double> average_transcription_length;
    std::optional<double> average_speed_ratio;

    std::optional<TranscriptionStats> fastest;
    std::optional<TranscriptionStats> slowest;
    std::optional<TranscriptionStats> longest;
};

/// Durable home of TranscriptionStats records.
///
/// Implementations must keep at most one pending record per
/// (entity_id, audio_file_path): insert() of a second one returns nullopt.
class StatsStore {
public:
    virtual ~StatsStore() = default;

    /// The pending record for this pair, if any.
    virtual std::optional<TranscriptionStats> find_pending_for(
        int64_t entity_id, const std::string& audio_path) const = 0;

    /// Insert `stats` (its id is ignored).  Returns the new id, or nullopt if
    /// the write was rejected.
    virtual std::optional<int64_t> insert(const TranscriptionStats& stats) = 0;

    /// Overwrite the record with `stats.id`.  False if no such record.
    virtual bool update_by_id(const TranscriptionStats& stats) = 0;

    virtual std::optional<TranscriptionStats> get_by_id(int64_t id) const = 0;

    /// Newest first.
    virtual std::vector<TranscriptionStats> get_all() const = 0;
    virtual std::vector<TranscriptionStats> get_by_status(TranscriptionStatus status) const = 0;
    virtual std::vector<TranscriptionStats> get_for_entity(int64_t entity_id) const = 0;

    /// Oldest first; used to resume work after a restart.
    virtual std::vector<TranscriptionStats> get_pending() const = 0;

    virtual int count_by_status(TranscriptionStatus status) const = 0;
    virtual StatsSummary summary() const = 0;

    virtual bool delete_all() = 0;
    virtual bool delete_for_entity(int64_t entity_id) = 0;
};

} // namespace vnt
