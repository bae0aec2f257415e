#pragma once

#include "Types.hpp"

#include <string>

namespace vnt {

/// A pluggable speech-to-text backend.
///
/// An instance is created per job by EngineSelector and torn down by the job:
///
///   is_available() -> initialize() -> transcribe() ... -> cleanup()
///
/// Implementations must not throw from transcribe(); failures are reported
/// through the Outcome.
class SpeechEngine {
public:
    virtual ~SpeechEngine() = default;

    /// Stable identifier, e.g. "whisper-tiny".  Stored in the stats record.
    virtual std::string engine_id() const = 0;

    /// Human-readable name.
    virtual std::string engine_name() const = 0;

    /// Whether this engine can run on `device` right now.
    virtual bool is_available(const DeviceInfo& device) const = 0;

    /// Acquire whatever the engine needs (model context, credentials).
    virtual Outcome<Unit> initialize() = 0;

    /// Transcribe 16 kHz mono PCM.  The engine detects the language itself.
    virtual Outcome<TranscriptionResult> transcribe(const PcmBuffer& audio) = 0;

    /// Release resources.  Safe to call more than once.
    virtual void cleanup() = 0;

    /// Rough wall-clock estimate for a clip of the given length.
    virtual int estimate_processing_seconds(int audio_duration_seconds) const {
        return audio_duration_seconds;
    }

    /// True if the engine needs a downloaded model file before initialize().
    virtual bool requires_model_artifact() const { return false; }
};

} // namespace vnt
