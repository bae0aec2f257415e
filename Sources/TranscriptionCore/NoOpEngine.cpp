#include "NoOpEngine.hpp"

#include "Logger.hpp"

namespace vnt {

bool NoOpEngine::is_available(const DeviceInfo& /*device*/) const {
    return true;
}

Outcome<Unit> NoOpEngine::initialize() {
    Logger::debug("[NoOpEngine] Initialized, transcription disabled");
    return Outcome<Unit>::success(Unit{});
}

Outcome<TranscriptionResult> NoOpEngine::transcribe(const PcmBuffer& /*audio*/) {
    Logger::debug("[NoOpEngine] Transcription requested but no engine available");
    return Outcome<TranscriptionResult>::failure(TranscriptionError::engine_unavailable);
}

} // namespace vnt
