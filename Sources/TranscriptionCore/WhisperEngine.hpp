#pragma once

#include "LanguageIdentifier.hpp"
#include "ModelArtifactManager.hpp"
#include "PipelineConfig.hpp"
#include "SpeechEngine.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vnt {

/// Thin wrapper around whisper.cpp's C API running the ggml tiny model.
/// Loads the model once per instance, then transcribes PCM buffers on demand.
///
/// Needs at least `min_memory_mb` of device RAM, and a model that is either
/// already on disk or downloadable right now.
class WhisperEngine : public SpeechEngine {
public:
    static constexpr const char* kEngineId = "whisper-tiny";

    /// @param models    Owner of the ggml file; must outlive the engine.
    /// @param language  Text identifier consulted when whisper's own language
    ///                  ID is missing or unsupported (may be null).
    /// @param device    Snapshot used if initialize() has to download.
    WhisperEngine(const PipelineConfig& config,
                  ModelArtifactManager& models,
                  std::shared_ptr<const LanguageIdentifier> language,
                  DeviceInfo device);
    ~WhisperEngine() override;

    // Non-copyable.
    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    std::string engine_id() const override { return kEngineId; }
    std::string engine_name() const override { return "Whisper Tiny (Offline)"; }

    bool is_available(const DeviceInfo& device) const override;

    /// Ensure the model is resident, then load it.
    /// @throws std::logic_error if a context is already loaded.
    Outcome<Unit> initialize() override;

    Outcome<TranscriptionResult> transcribe(const PcmBuffer& audio) override;
    void cleanup() override;

    /// Conservative: twice the clip length.
    int estimate_processing_seconds(int audio_duration_seconds) const override {
        return audio_duration_seconds * 2;
    }

    bool requires_model_artifact() const override { return true; }

    /// Whether a model has been successfully loaded.
    bool is_loaded() const;

private:
    std::string                               fallback_language_;
    std::vector<std::string>                  supported_languages_;
    int64_t                                   min_memory_bytes_;
    int                                       n_threads_;
    ModelArtifactManager&                     models_;
    std::shared_ptr<const LanguageIdentifier> language_;
    DeviceInfo                                device_;

    struct whisper_context* ctx_ = nullptr;   // opaque whisper.h handle
    mutable std::mutex      mu_;
};

} // namespace vnt
