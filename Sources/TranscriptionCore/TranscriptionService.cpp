#include "TranscriptionService.hpp"

#include "Logger.hpp"

#include <chrono>
#include <utility>

namespace vnt {

namespace {

TaskConstraints constraints_from(const PipelineConfig& config) {
    TaskConstraints c;
    c.requires_charging        = true;
    c.requires_battery_not_low = true;
    c.initial_delay            = std::chrono::seconds(config.initial_delay_seconds);
    return c;
}

} // namespace

ModelArtifact TranscriptionService::artifact_from(const PipelineConfig& config) {
    ModelArtifact a;
    a.engine_id      = "whisper-tiny";
    a.url            = config.model_url;
    a.file_name      = config.model_file_name;
    a.expected_bytes = config.model_expected_bytes;
    return a;
}

DownloadPolicy TranscriptionService::policy_from(const PipelineConfig& config) {
    DownloadPolicy p;
    p.max_attempts           = config.max_download_attempts;
    p.attempt_timeout        = std::chrono::seconds(config.download_timeout_seconds);
    p.backoff_base           = std::chrono::milliseconds(config.backoff_base_ms);
    p.min_free_storage_bytes = config.min_free_storage_mb * kBytesPerMegabyte;
    return p;
}

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

TranscriptionService::TranscriptionService(PipelineConfig config,
                                           std::shared_ptr<ArtifactFetcher> fetcher)
    : config_(std::move(config)),
      db_(config_.database_path),
      language_(std::make_shared<ScriptLanguageIdentifier>()),
      models_(artifact_from(config_), config_.model_dir, policy_from(config_),
              fetcher ? std::move(fetcher)
                      : std::shared_ptr<ArtifactFetcher>(std::make_shared<HttpArtifactFetcher>())),
      selector_(EngineSelector::with_default_engines(config_, models_, language_)),
      job_(db_, db_, selector_, models_, codec_),
      queue_(static_cast<size_t>(config_.worker_threads > 0 ? config_.worker_threads : 1)),
      scheduler_(job_, queue_, constraints_from(config_)) {}

TranscriptionService::~TranscriptionService() {
    shutdown();
}

// ---------------------------------------------------------------------------
// init / shutdown
// ---------------------------------------------------------------------------

bool TranscriptionService::init() {
    Logger::set_level(log_level_from_string(config_.log_level));

    if (!db_.open()) {
        Logger::error("[TranscriptionService] Cannot open database " + config_.database_path);
        return false;
    }

    if (!config_.remote_api_key.empty()) {
        Logger::warn("[TranscriptionService] remote_api_key is set: the remote engine takes "
                     "priority while online but cannot transcribe yet (EngineUnavailable)");
    }

    queue_.start();

    const int recovered = recover_pending();
    if (recovered > 0) {
        Logger::info("[TranscriptionService] Recovered " + std::to_string(recovered)
                     + " pending transcription(s)");
    }
    return true;
}

void TranscriptionService::shutdown() {
    queue_.stop();
}

// ---------------------------------------------------------------------------
// Scheduling
// ---------------------------------------------------------------------------

bool TranscriptionService::schedule(int64_t entity_id,
                                    const std::string& audio_path,
                                    bool consent_granted) {
    return scheduler_.schedule(entity_id, audio_path, consent_granted);
}

bool TranscriptionService::cancel(int64_t entity_id, const std::string& audio_path) {
    return scheduler_.cancel(entity_id, audio_path);
}

void TranscriptionService::update_device_state(const DeviceInfo& device) {
    queue_.update_device_state(device);
}

JobOutcome TranscriptionService::run_now(const TranscriptionRequest& request,
                                         const DeviceInfo& device) {
    CancellationToken token;
    return scheduler_.run_serialised(request, device, token);
}

int TranscriptionService::recover_pending() {
    int queued = 0;
    // A pending record only exists if consent was given when it was created.
    for (const auto& record : db_.get_pending()) {
        if (scheduler_.schedule(record.entity_id, record.audio_file_path, true)) {
            ++queued;
        }
    }
    return queued;
}

// ---------------------------------------------------------------------------
// Data access
// ---------------------------------------------------------------------------

std::vector<TranscriptionStats> TranscriptionService::stats() const {
    return db_.get_all();
}

StatsSummary TranscriptionService::stats_summary() const {
    return db_.summary();
}

std::vector<std::string> TranscriptionService::available_engines(const DeviceInfo& device) const {
    return selector_.available_engine_ids(device);
}

bool TranscriptionService::delete_models() {
    return models_.delete_models();
}

} // namespace vnt
