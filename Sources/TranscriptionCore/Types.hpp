#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace vnt {

// ---------------------------------------------------------------------------
// Constants
// ---------------------------------------------------------------------------

/// Sample rate every PcmBuffer is delivered at (whisper's native rate).
constexpr int kTargetSampleRate = 16000;

constexpr int64_t kBytesPerMegabyte = 1024 * 1024;

// ---------------------------------------------------------------------------
// Enums
// ---------------------------------------------------------------------------

enum class TranscriptionStatus {
    pending,
    success,
    failed
};

/// Convert status enum to the string stored in SQLite.
inline const char* status_to_string(TranscriptionStatus s) {
    switch (s) {
        case TranscriptionStatus::pending: return "pending";
        case TranscriptionStatus::success: return "success";
        case TranscriptionStatus::failed:  return "failed";
    }
    return "unknown";
}

/// Parse status string from SQLite back to enum.
inline TranscriptionStatus status_from_string(const std::string& s) {
    if (s == "pending") return TranscriptionStatus::pending;
    if (s == "success") return TranscriptionStatus::success;
    return TranscriptionStatus::failed;
}

enum class TranscriptionError {
    audio_file_invalid,
    model_not_downloaded,
    network_unavailable,
    device_incompatible,
    initialization_failed,
    engine_unavailable,
    api_key_missing,
    quota_exceeded,
    unknown
};

inline const char* to_string(TranscriptionError e) {
    switch (e) {
        case TranscriptionError::audio_file_invalid:    return "AudioFileInvalid";
        case TranscriptionError::model_not_downloaded:  return "ModelNotDownloaded";
        case TranscriptionError::network_unavailable:   return "NetworkUnavailable";
        case TranscriptionError::device_incompatible:   return "DeviceIncompatible";
        case TranscriptionError::initialization_failed: return "InitializationFailed";
        case TranscriptionError::engine_unavailable:    return "EngineUnavailable";
        case TranscriptionError::api_key_missing:       return "ApiKeyMissing";
        case TranscriptionError::quota_exceeded:        return "QuotaExceeded";
        case TranscriptionError::unknown:               return "Unknown";
    }
    return "Unknown";
}

enum class NetworkClass {
    none,
    metered,
    unmetered
};

inline const char* to_string(NetworkClass n) {
    switch (n) {
        case NetworkClass::none:      return "none";
        case NetworkClass::metered:   return "metered";
        case NetworkClass::unmetered: return "unmetered";
    }
    return "none";
}

/// Hint for AudioCodec::decode.  `automatic` resolves from the file extension.
enum class ContainerFormat {
    automatic,
    compressed,     // M4A / MP4 / AAC, decoded through FFmpeg
    wave            // RIFF/WAVE linear PCM
};

// ---------------------------------------------------------------------------
// Structs
// ---------------------------------------------------------------------------

/// Device capability snapshot.  Supplied by the host at call time; the core
/// never polls the platform for these values.
struct DeviceInfo {
    int64_t      total_memory_bytes      = 0;
    int64_t      available_storage_bytes = 0;
    NetworkClass network                 = NetworkClass::none;
    bool         charging                = false;
    bool         battery_low             = false;
};

/// Mono float32 audio at kTargetSampleRate, amplitude in [-1, 1].
struct PcmBuffer {
    std::vector<float> samples;
    int                sample_rate = kTargetSampleRate;

    float duration_seconds() const {
        return sample_rate > 0
            ? static_cast<float>(samples.size()) / static_cast<float>(sample_rate)
            : 0.0f;
    }
};

struct TranscriptionRequest {
    int64_t     entity_id = 0;
    std::string audio_path;
    bool        consent_granted = false;
};

struct TranscriptionResult {
    std::string text;
    std::string language_code;
    float       confidence = 1.0f;
    std::string engine_id;
};

/// Durable record of one transcription attempt for one (entity, audio) pair.
struct TranscriptionStats {
    int64_t                    id = 0;
    int64_t                    entity_id = 0;
    TranscriptionStatus        status = TranscriptionStatus::pending;
    int64_t                    start_time_ms = 0;     // Unix epoch millis
    std::optional<int64_t>     end_time_ms;
    std::optional<int64_t>     duration_ms;
    std::string                audio_file_path;
    int64_t                    audio_file_size_bytes = 0;
    std::optional<float>       audio_duration_seconds;
    std::optional<std::string> transcription_text;
    std::optional<int32_t>     transcription_length;
    std::optional<std::string> detected_language;
    std::optional<std::string> engine_id;
    std::optional<float>       processing_speed_ratio; // duration / audio length
    std::optional<std::string> error_message;
};

// ---------------------------------------------------------------------------
// Outcome
// ---------------------------------------------------------------------------

/// Empty success payload.
struct Unit {};

/// Either a value or a TranscriptionError.
template <typename T>
class Outcome {
public:
    static Outcome success(T value) { return Outcome(std::move(value)); }
    static Outcome failure(TranscriptionError error) { return Outcome(error); }

    bool ok() const { return std::holds_alternative<T>(value_); }

    const T& value() const { return std::get<T>(value_); }
    T&       value()       { return std::get<T>(value_); }

    TranscriptionError error() const {
        return ok() ? TranscriptionError::unknown
                    : std::get<TranscriptionError>(value_);
    }

private:
    explicit Outcome(T value) : value_(std::move(value)) {}
    explicit Outcome(TranscriptionError error) : value_(error) {}

    std::variant<T, TranscriptionError> value_;
};

// ---------------------------------------------------------------------------
// Callback types
// ---------------------------------------------------------------------------

/// Fired during model download with progress 0-100.
using ProgressCallback = std::function<void(int)>;

} // namespace vnt
