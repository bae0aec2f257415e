#pragma once

#include "AudioCodec.hpp"
#include "CancellationToken.hpp"
#include "EngineSelector.hpp"
#include "EntityStore.hpp"
#include "ModelArtifactManager.hpp"
#include "StatsStore.hpp"
#include "Types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace vnt {

/// Progress of one job run, in order.
enum class JobState {
    started,
    stats_reconciled,
    engine_resolved,
    model_ready,
    audio_decoded,
    transcribed,
    finalized
};

const char* to_string(JobState state);

struct JobOutcome {
    enum class Kind { succeeded, failed, cancelled };

    Kind                              kind = Kind::failed;
    std::optional<TranscriptionError> error;
    std::optional<int64_t>            stats_id;
    JobState                          last_state = JobState::started;
    std::string                       text;
    std::string                       language_code;
    std::string                       engine_id;
    std::string                       message;

    bool succeeded() const { return kind == Kind::succeeded; }
};

/// Runs one transcription for one (entity, clip) pair:
///
///   started -> stats_reconciled -> engine_resolved -> model_ready
///           -> audio_decoded -> transcribed -> finalized
///
/// Any failure jumps straight to finalized(failed) with the error kind written
/// into the stats record.  run() never throws.  A cancelled run releases the
/// engine and leaves the record pending so a later run resumes it.
///
/// The job has no retry loop of its own; retries belong to the task runner.
class TranscriptionJob {
public:
    /// All collaborators must outlive the job.
    TranscriptionJob(StatsStore& stats,
                     EntityStore& entities,
                     const EngineSelector& selector,
                     ModelArtifactManager& models,
                     const AudioCodec& codec);

    JobOutcome run(const TranscriptionRequest& request,
                   const DeviceInfo& device,
                   const CancellationToken& cancel) const;

    /// Whether a request for this pair would pass validation: non-empty
    /// path and an entity that exists.
    bool can_accept(int64_t entity_id, const std::string& audio_path) const;

    /// Find the pending record for the pair or create one (size and probed
    /// duration captured now).  Returns nullopt if the store rejected both.
    std::optional<TranscriptionStats> reconcile_pending(int64_t entity_id,
                                                        const std::string& audio_path) const;

private:
    StatsStore&           stats_;
    EntityStore&          entities_;
    const EngineSelector& selector_;
    ModelArtifactManager& models_;
    const AudioCodec&     codec_;
};

/// Current wall-clock time in Unix epoch milliseconds.
int64_t now_epoch_ms();

} // namespace vnt
