#pragma once

#include "SpeechEngine.hpp"

namespace vnt {

/// Fallback engine used when nothing else can run on the device.
/// Initialization always succeeds; every transcription fails with
/// TranscriptionError::engine_unavailable.
class NoOpEngine : public SpeechEngine {
public:
    static constexpr const char* kEngineId = "noop";

    std::string engine_id() const override { return kEngineId; }
    std::string engine_name() const override { return "No Transcription"; }

    bool is_available(const DeviceInfo& device) const override;
    Outcome<Unit> initialize() override;
    Outcome<TranscriptionResult> transcribe(const PcmBuffer& audio) override;
    void cleanup() override {}

    int estimate_processing_seconds(int) const override { return 0; }
};

} // namespace vnt
