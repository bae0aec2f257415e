#include "RemoteSpeechEngine.hpp"

#include "Logger.hpp"

#include <utility>

namespace vnt {

RemoteSpeechEngine::RemoteSpeechEngine(std::string api_key, DeviceInfo device)
    : api_key_(std::move(api_key)), device_(device) {}

bool RemoteSpeechEngine::is_available(const DeviceInfo& device) const {
    return !api_key_.empty() && device.network != NetworkClass::none;
}

Outcome<Unit> RemoteSpeechEngine::initialize() {
    if (api_key_.empty()) {
        Logger::warn("[RemoteSpeechEngine] No API key configured");
        return Outcome<Unit>::failure(TranscriptionError::api_key_missing);
    }
    return Outcome<Unit>::success(Unit{});
}

Outcome<TranscriptionResult> RemoteSpeechEngine::transcribe(const PcmBuffer& /*audio*/) {
    if (device_.network == NetworkClass::none) {
        return Outcome<TranscriptionResult>::failure(TranscriptionError::network_unavailable);
    }
    Logger::warn("[RemoteSpeechEngine] Remote transcription is not implemented");
    return Outcome<TranscriptionResult>::failure(TranscriptionError::engine_unavailable);
}

} // namespace vnt
