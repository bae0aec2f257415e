#include "EngineSelector.hpp"

#include "Logger.hpp"
#include "NoOpEngine.hpp"
#include "RemoteSpeechEngine.hpp"
#include "WhisperEngine.hpp"

#include <utility>

namespace vnt {

EngineSelector::EngineSelector(std::vector<Candidate> candidates)
    : candidates_(std::move(candidates)) {}

EngineSelector EngineSelector::with_default_engines(
    const PipelineConfig& config,
    ModelArtifactManager& models,
    std::shared_ptr<const LanguageIdentifier> language) {
    std::vector<Candidate> candidates;

    if (!config.remote_api_key.empty()) {
        const std::string key = config.remote_api_key;
        candidates.push_back({RemoteSpeechEngine::kEngineId,
                              [key](const DeviceInfo& device) {
                                  return std::make_unique<RemoteSpeechEngine>(key, device);
                              }});
    }

    candidates.push_back({WhisperEngine::kEngineId,
                          [config, &models, language](const DeviceInfo& device) {
                              return std::make_unique<WhisperEngine>(config, models,
                                                                     language, device);
                          }});

    return EngineSelector(std::move(candidates));
}

std::unique_ptr<SpeechEngine> EngineSelector::select(const DeviceInfo& device) const {
    for (const auto& candidate : candidates_) {
        std::unique_ptr<SpeechEngine> engine = candidate.factory(device);
        if (!engine) continue;
        if (engine->is_available(device)) {
            Logger::info("[EngineSelector] Selected engine: " + engine->engine_name());
            return engine;
        }
        Logger::debug("[EngineSelector] Engine not available: " + candidate.engine_id);
    }

    Logger::warn("[EngineSelector] No transcription engine available, using NoOpEngine");
    return std::make_unique<NoOpEngine>();
}

std::unique_ptr<SpeechEngine> EngineSelector::create_by_id(const std::string& engine_id,
                                                           const DeviceInfo& device) const {
    if (engine_id == NoOpEngine::kEngineId) {
        return std::make_unique<NoOpEngine>();
    }
    for (const auto& candidate : candidates_) {
        if (candidate.engine_id == engine_id) {
            return candidate.factory(device);
        }
    }
    Logger::warn("[EngineSelector] Unknown engine ID: " + engine_id);
    return nullptr;
}

std::vector<std::string> EngineSelector::available_engine_ids(const DeviceInfo& device) const {
    std::vector<std::string> ids;
    for (const auto& candidate : candidates_) {
        std::unique_ptr<SpeechEngine> engine = candidate.factory(device);
        if (engine && engine->is_available(device)) {
            ids.push_back(candidate.engine_id);
        }
    }
    ids.push_back(NoOpEngine::kEngineId);
    return ids;
}

} // namespace vnt
