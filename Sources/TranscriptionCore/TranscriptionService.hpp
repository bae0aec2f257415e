#pragma once

#include "ArtifactFetcher.hpp"
#include "AudioCodec.hpp"
#include "ConstrainedWorkQueue.hpp"
#include "EngineSelector.hpp"
#include "JobScheduler.hpp"
#include "LanguageIdentifier.hpp"
#include "ModelArtifactManager.hpp"
#include "PipelineConfig.hpp"
#include "TranscriptionDatabase.hpp"
#include "TranscriptionJob.hpp"
#include "Types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace vnt {

/// High-level orchestrator that wires the transcription pipeline together:
///
///   schedule()  -->  pending record + queued task  -->  [charging, battery ok]
///                                                              |
///                                                     TranscriptionJob::run
///                                                              |
///                                               entity transcript + final stats
///
/// On initialization, performs restart recovery: every stats record still
/// 'pending' is queued again and resumes from that record.
class TranscriptionService {
public:
    /// @param fetcher  Transport for the model download; defaults to
    ///                 HttpArtifactFetcher.
    explicit TranscriptionService(PipelineConfig config,
                                  std::shared_ptr<ArtifactFetcher> fetcher = nullptr);
    ~TranscriptionService();

    // Non-copyable.
    TranscriptionService(const TranscriptionService&) = delete;
    TranscriptionService& operator=(const TranscriptionService&) = delete;

    /// Open the database, start the workers and recover pending work.
    /// @return false if the database cannot be opened.
    bool init();

    /// Stop the workers.  Queued tasks are dropped; their records stay pending.
    void shutdown();

    // ---- Scheduling ----

    bool schedule(int64_t entity_id, const std::string& audio_path, bool consent_granted);
    bool cancel(int64_t entity_id, const std::string& audio_path);

    /// Publish the device snapshot used to gate queued work.
    void update_device_state(const DeviceInfo& device);

    /// Run one job on the calling thread.  Blocks.
    JobOutcome run_now(const TranscriptionRequest& request, const DeviceInfo& device);

    /// Queue every pending record again.  Returns how many were queued.
    /// Called automatically during init().
    int recover_pending();

    // ---- Data access ----

    std::vector<TranscriptionStats> stats() const;
    StatsSummary stats_summary() const;
    std::vector<std::string> available_engines(const DeviceInfo& device) const;

    /// Delete the downloaded model.
    bool delete_models();

    const PipelineConfig& config() const { return config_; }
    TranscriptionDatabase& database() { return db_; }
    ModelArtifactManager& models() { return models_; }
    ConstrainedWorkQueue& work_queue() { return queue_; }

    static ModelArtifact artifact_from(const PipelineConfig& config);
    static DownloadPolicy policy_from(const PipelineConfig& config);

private:
    PipelineConfig                            config_;
    TranscriptionDatabase                     db_;
    AudioCodec                                codec_;
    std::shared_ptr<const LanguageIdentifier> language_;
    ModelArtifactManager                      models_;
    EngineSelector                            selector_;
    TranscriptionJob                          job_;
    ConstrainedWorkQueue                      queue_;
    JobScheduler                              scheduler_;
};

} // namespace vnt
