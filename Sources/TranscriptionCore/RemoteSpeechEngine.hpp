#pragma once

#include "SpeechEngine.hpp"

#include <string>

namespace vnt {

/// Placeholder for a cloud transcription backend.  It takes part in engine
/// selection (available only with a credential and a network connection)
/// but has no wire protocol; transcribe() always fails.  With a key set it
/// therefore shadows whisper on every online device.
class RemoteSpeechEngine : public SpeechEngine {
public:
    static constexpr const char* kEngineId = "remote-cloud";

    RemoteSpeechEngine(std::string api_key, DeviceInfo device);

    std::string engine_id() const override { return kEngineId; }
    std::string engine_name() const override { return "Remote Cloud"; }

    bool is_available(const DeviceInfo& device) const override;
    Outcome<Unit> initialize() override;
    Outcome<TranscriptionResult> transcribe(const PcmBuffer& audio) override;
    void cleanup() override {}

private:
    std::string api_key_;
    DeviceInfo  device_;
};

} // namespace vnt
