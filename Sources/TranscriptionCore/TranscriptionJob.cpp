#include "TranscriptionJob.hpp"

#include "LanguageIdentifier.hpp"
#include "Logger.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <system_error>

namespace vnt {

namespace {

constexpr const char* kTag = "[TranscriptionJob] ";

int64_t file_size_or_zero(const std::string& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<int64_t>(size);
}

/// Calls cleanup() on whatever engine the job ended up with.
class EngineReleaser {
public:
    explicit EngineReleaser(std::unique_ptr<SpeechEngine>& engine) : engine_(engine) {}
    ~EngineReleaser() {
        if (engine_) {
            engine_->cleanup();
        }
    }

private:
    std::unique_ptr<SpeechEngine>& engine_;
};

} // namespace

const char* to_string(JobState state) {
    switch (state) {
        case JobState::started:          return "Started";
        case JobState::stats_reconciled: return "StatsReconciled";
        case JobState::engine_resolved:  return "EngineResolved";
        case JobState::model_ready:      return "ModelReady";
        case JobState::audio_decoded:    return "AudioDecoded";
        case JobState::transcribed:      return "Transcribed";
        case JobState::finalized:        return "Finalized";
    }
    return "Started";
}

int64_t now_epoch_ms() {
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
}

TranscriptionJob::TranscriptionJob(StatsStore& stats,
                                   EntityStore& entities,
                                   const EngineSelector& selector,
                                   ModelArtifactManager& models,
                                   const AudioCodec& codec)
    : stats_(stats),
      entities_(entities),
      selector_(selector),
      models_(models),
      codec_(codec) {}

bool TranscriptionJob::can_accept(int64_t entity_id, const std::string& audio_path) const {
    return !audio_path.empty() && entities_.entity_exists(entity_id);
}

// ---------------------------------------------------------------------------
// reconcile_pending
// ---------------------------------------------------------------------------

std::optional<TranscriptionStats> TranscriptionJob::reconcile_pending(
    int64_t entity_id, const std::string& audio_path) const {
    if (auto existing = stats_.find_pending_for(entity_id, audio_path)) {
        Logger::debug(std::string(kTag) + "Found existing stats entry "
                      + std::to_string(existing->id) + " for entity " + std::to_string(entity_id));
        return existing;
    }

    TranscriptionStats pending;
    pending.entity_id              = entity_id;
    pending.status                 = TranscriptionStatus::pending;
    pending.start_time_ms          = now_epoch_ms();
    pending.audio_file_path        = audio_path;
    pending.audio_file_size_bytes  = file_size_or_zero(audio_path);
    pending.audio_duration_seconds = codec_.probe_duration_seconds(audio_path);

    if (auto id = stats_.insert(pending)) {
        pending.id = *id;
        Logger::debug(std::string(kTag) + "Created stats entry " + std::to_string(*id)
                      + " for entity " + std::to_string(entity_id));
        return pending;
    }

    // Lost a race with another writer; theirs is the pending record now.
    return stats_.find_pending_for(entity_id, audio_path);
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------

JobOutcome TranscriptionJob::run(const TranscriptionRequest& request,
                                 const DeviceInfo& device,
                                 const CancellationToken& cancel) const {
    const int64_t start_ms = now_epoch_ms();

    JobOutcome outcome;
    std::optional<TranscriptionStats> record;
    std::unique_ptr<SpeechEngine> engine;
    EngineReleaser releaser(engine);

    auto cancelled = [&]() {
        Logger::info(std::string(kTag) + "Cancelled in state " + to_string(outcome.last_state)
                     + ", record left pending");
        outcome.kind = JobOutcome::Kind::cancelled;
        outcome.error.reset();
        return outcome;
    };

    auto fail = [&](TranscriptionError error, const std::string& detail) {
        outcome.kind    = JobOutcome::Kind::failed;
        outcome.error   = error;
        outcome.message = detail;

        Logger::warn(std::string(kTag) + "Failed in state " + to_string(outcome.last_state)
                     + ": " + to_string(error) + (detail.empty() ? "" : " (" + detail + ")"));

        if (record) {
            const int64_t end_ms = now_epoch_ms();
            record->status        = TranscriptionStatus::failed;
            record->start_time_ms = start_ms;
            record->end_time_ms   = end_ms;
            record->duration_ms   = end_ms - start_ms;
            record->error_message = std::string(to_string(error))
                                  + (detail.empty() ? "" : ": " + detail);
            if (engine) record->engine_id = engine->engine_id();
            if (!stats_.update_by_id(*record)) {
                Logger::error(std::string(kTag) + "Error recording failure stats for "
                              + std::to_string(record->id));
            }
        }
        outcome.last_state = JobState::finalized;
        return outcome;
    };

    try {
        // 1. Validate.
        if (request.audio_path.empty()) {
            return fail(TranscriptionError::audio_file_invalid, "Empty audio path");
        }
        if (!entities_.entity_exists(request.entity_id)) {
            return fail(TranscriptionError::unknown,
                        "Entity " + std::to_string(request.entity_id) + " not found");
        }

        Logger::debug(std::string(kTag) + "Starting transcription for entity "
                      + std::to_string(request.entity_id));

        // 2. Reconcile the stats record.
        record = reconcile_pending(request.entity_id, request.audio_path);
        if (!record) {
            return fail(TranscriptionError::unknown, "Could not create stats record");
        }
        outcome.stats_id   = record->id;
        outcome.last_state = JobState::stats_reconciled;
        if (cancel.is_cancelled()) return cancelled();

        // 3. Resolve the engine.
        engine = selector_.select(device);
        outcome.engine_id  = engine->engine_id();
        outcome.last_state = JobState::engine_resolved;
        if (cancel.is_cancelled()) return cancelled();

        // 4. Model + engine initialization.
        if (engine->requires_model_artifact() && !models_.are_models_present()) {
            if (!request.consent_granted) {
                return fail(TranscriptionError::model_not_downloaded,
                            "Model absent and download consent not granted");
            }
            DownloadResult dl = models_.download(device);
            if (cancel.is_cancelled()) return cancelled();
            if (!dl.ok) {
                return fail(TranscriptionError::model_not_downloaded, dl.reason);
            }
        }

        Outcome<Unit> init = engine->initialize();
        if (!init.ok()) {
            return fail(init.error(), "Engine initialization failed");
        }
        outcome.last_state = JobState::model_ready;
        if (cancel.is_cancelled()) return cancelled();

        // 5. Decode.
        PcmBuffer pcm;
        try {
            pcm = codec_.decode(request.audio_path);
        } catch (const AudioDecodeError& e) {
            return fail(TranscriptionError::audio_file_invalid, e.what());
        }
        outcome.last_state = JobState::audio_decoded;
        if (cancel.is_cancelled()) return cancelled();

        // 6. Transcribe.
        Outcome<TranscriptionResult> transcribed = engine->transcribe(pcm);
        if (cancel.is_cancelled()) return cancelled();
        if (!transcribed.ok()) {
            return fail(transcribed.error(), "Transcription failed");
        }
        const TranscriptionResult& result = transcribed.value();
        outcome.last_state = JobState::transcribed;

        // 7. Write back and finalize.
        if (!entities_.update_transcript(request.entity_id, result.text, result.language_code)) {
            return fail(TranscriptionError::unknown, "Entity update failed");
        }

        const int64_t end_ms = now_epoch_ms();
        const int64_t duration_ms = end_ms - start_ms;
        if (!record->audio_duration_seconds || *record->audio_duration_seconds <= 0.0f) {
            record->audio_duration_seconds = pcm.duration_seconds();
        }
        const float audio_seconds = *record->audio_duration_seconds;

        record->status               = TranscriptionStatus::success;
        record->start_time_ms        = start_ms;
        record->end_time_ms          = end_ms;
        record->duration_ms          = duration_ms;
        record->transcription_text   = result.text;
        record->transcription_length = static_cast<int32_t>(utf8_length(result.text));
        record->detected_language    = result.language_code;
        record->engine_id            = engine->engine_id();
        record->error_message.reset();
        if (audio_seconds > 0.0f) {
            record->processing_speed_ratio =
                (static_cast<float>(duration_ms) / 1000.0f) / audio_seconds;
        }
        if (!stats_.update_by_id(*record)) {
            Logger::error(std::string(kTag) + "Error recording success stats for "
                          + std::to_string(record->id));
        }

        outcome.kind          = JobOutcome::Kind::succeeded;
        outcome.text          = result.text;
        outcome.language_code = result.language_code;
        outcome.last_state    = JobState::finalized;

        Logger::info(std::string(kTag) + "Transcribed entity " + std::to_string(request.entity_id)
                     + ": " + std::to_string(utf8_length(result.text)) + " chars in "
                     + std::to_string(duration_ms) + "ms");
        return outcome;
    } catch (const std::exception& e) {
        if (cancel.is_cancelled()) return cancelled();
        return fail(TranscriptionError::unknown, e.what());
    } catch (...) {
        if (cancel.is_cancelled()) return cancelled();
        return fail(TranscriptionError::unknown, "Non-standard exception");
    }
}

} // namespace vnt
