#include "WhisperEngine.hpp"

#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "whisper.h"

namespace vnt {

namespace {

std::string trim(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(s.begin(), s.end(), not_space);
    auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

WhisperEngine::WhisperEngine(const PipelineConfig& config,
                             ModelArtifactManager& models,
                             std::shared_ptr<const LanguageIdentifier> language,
                             DeviceInfo device)
    : fallback_language_(config.fallback_language),
      supported_languages_(config.supported_languages),
      min_memory_bytes_(config.min_memory_mb * kBytesPerMegabyte),
      n_threads_(std::max(1, config.whisper_threads)),
      models_(models),
      language_(std::move(language)),
      device_(device) {}

WhisperEngine::~WhisperEngine() {
    cleanup();
}

// ---------------------------------------------------------------------------
// is_available
// ---------------------------------------------------------------------------

bool WhisperEngine::is_available(const DeviceInfo& device) const {
    if (device.total_memory_bytes < min_memory_bytes_) {
        Logger::debug("[WhisperEngine] Insufficient RAM: "
                      + std::to_string(device.total_memory_bytes / kBytesPerMegabyte)
                      + "MB (need " + std::to_string(min_memory_bytes_ / kBytesPerMegabyte)
                      + "MB)");
        return false;
    }

    if (models_.are_models_present()) {
        return true;
    }

    const Readiness readiness = models_.can_download(device);
    if (readiness != Readiness::ready) {
        Logger::debug(std::string("[WhisperEngine] Model absent and not downloadable: ")
                      + to_string(readiness));
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// initialize
// ---------------------------------------------------------------------------

Outcome<Unit> WhisperEngine::initialize() {
    std::lock_guard<std::mutex> lock(mu_);

    if (ctx_) {
        throw std::logic_error("WhisperEngine::initialize called with a live context");
    }

    if (!models_.are_models_present()) {
        Logger::info("[WhisperEngine] Model not present, downloading...");
        DownloadResult dl = models_.download(device_);
        if (!dl.ok) {
            Logger::error("[WhisperEngine] Failed to download model: " + dl.reason);
            return Outcome<Unit>::failure(TranscriptionError::model_not_downloaded);
        }
    }

    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;

    const std::string model_path = models_.model_file();
    ctx_ = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx_) {
        Logger::error("[WhisperEngine] Failed to load model from " + model_path);
        return Outcome<Unit>::failure(TranscriptionError::initialization_failed);
    }

    Logger::info("[WhisperEngine] Model loaded: " + model_path);
    return Outcome<Unit>::success(Unit{});
}

// ---------------------------------------------------------------------------
// is_loaded
// ---------------------------------------------------------------------------

bool WhisperEngine::is_loaded() const {
    std::lock_guard<std::mutex> lock(mu_);
    return ctx_ != nullptr;
}

// ---------------------------------------------------------------------------
// transcribe
// ---------------------------------------------------------------------------

Outcome<TranscriptionResult> WhisperEngine::transcribe(const PcmBuffer& audio) {
    std::string text;
    std::string decoder_language;
    {
        std::lock_guard<std::mutex> lock(mu_);

        if (!ctx_) {
            Logger::error("[WhisperEngine] Transcribe called before initialize");
            return Outcome<TranscriptionResult>::failure(
                TranscriptionError::initialization_failed);
        }

        if (audio.samples.empty() || audio.sample_rate != WHISPER_SAMPLE_RATE) {
            Logger::error("[WhisperEngine] Expected non-empty 16 kHz PCM");
            return Outcome<TranscriptionResult>::failure(
                TranscriptionError::audio_file_invalid);
        }

        whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.print_progress   = false;
        params.print_realtime   = false;
        params.print_special    = false;
        params.print_timestamps = false;
        params.single_segment   = false;
        params.translate        = false;
        params.language         = "auto";
        params.n_threads        = n_threads_;

        int ret = whisper_full(ctx_, params, audio.samples.data(),
                               static_cast<int>(audio.samples.size()));
        if (ret != 0) {
            Logger::error("[WhisperEngine] whisper_full failed with code " + std::to_string(ret));
            return Outcome<TranscriptionResult>::failure(TranscriptionError::unknown);
        }

        // Collect segments
        int n_segments = whisper_full_n_segments(ctx_);
        for (int i = 0; i < n_segments; ++i) {
            const char* segment = whisper_full_get_segment_text(ctx_, i);
            if (segment) {
                text += segment;
            }
        }

        // Language whisper settled on while decoding with language = "auto".
        const int lang_id = whisper_full_lang_id(ctx_);
        if (lang_id >= 0) {
            const char* lang_str = whisper_lang_str(lang_id);
            if (lang_str) {
                decoder_language = lang_str;
            }
        }
    }

    TranscriptionResult result;
    result.text          = trim(text);
    result.language_code = resolve_language(decoder_language, language_.get(), result.text,
                                            fallback_language_, supported_languages_);
    result.confidence    = 1.0f;
    result.engine_id     = kEngineId;

    Logger::info("[WhisperEngine] Transcription complete: "
                 + std::to_string(utf8_length(result.text))
                 + " chars, language " + result.language_code);
    return Outcome<TranscriptionResult>::success(std::move(result));
}

// ---------------------------------------------------------------------------
// cleanup
// ---------------------------------------------------------------------------

void WhisperEngine::cleanup() {
    std::lock_guard<std::mutex> lock(mu_);
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

} // namespace vnt
