#pragma once

#include "Types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace vnt {

/// Thrown when an audio file is missing, empty, or cannot be parsed.
/// TranscriptionJob maps it to TranscriptionError::audio_file_invalid.
class AudioDecodeError : public std::runtime_error {
public:
    explicit AudioDecodeError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Decodes recorded clips into the fixed-shape buffer whisper consumes:
/// mono float32 at 16 kHz, amplitude in [-1, 1].
///
/// Compressed containers (M4A/AAC) go through FFmpeg's libavformat /
/// libavcodec; RIFF/WAVE linear PCM is parsed directly.  Channel downmix and
/// rate conversion are done here for both paths, so identical input bytes
/// always produce identical output.
///
/// Resampling is plain linear interpolation with no anti-aliasing filter.
/// That is adequate for short speech clips and is the documented behaviour.
///
/// Stateless; safe to share between threads.
class AudioCodec {
public:
    AudioCodec();
    ~AudioCodec();

    // Non-copyable.
    AudioCodec(const AudioCodec&) = delete;
    AudioCodec& operator=(const AudioCodec&) = delete;

    /// Decode `path` to a 16 kHz mono PcmBuffer.
    /// @throws AudioDecodeError on any failure.
    PcmBuffer decode(const std::string& path,
                     ContainerFormat hint = ContainerFormat::automatic) const;

    /// Read the clip duration from container metadata without decoding.
    /// Returns std::nullopt if it cannot be determined.
    std::optional<float> probe_duration_seconds(
        const std::string& path,
        ContainerFormat hint = ContainerFormat::automatic) const;

    /// Resolve `automatic` from the file extension and, failing that, the
    /// leading magic bytes.
    static ContainerFormat resolve_container(const std::string& path,
                                             ContainerFormat hint);

    /// Average interleaved frames sample-wise into one channel.
    static std::vector<float> downmix_to_mono(const std::vector<float>& interleaved,
                                              int channels);

    /// Linear-interpolation resampler.
    static std::vector<float> resample_linear(const std::vector<float>& input,
                                              int input_rate,
                                              int output_rate);

private:
    /// Interleaved float samples at the source rate, before downmix.
    struct RawAudio {
        std::vector<float> interleaved;
        int                channels    = 0;
        int                sample_rate = 0;
    };

    RawAudio decode_compressed(const std::string& path) const;
    RawAudio decode_wave(const std::string& path) const;

    std::optional<float> probe_compressed(const std::string& path) const;
    std::optional<float> probe_wave(const std::string& path) const;
};

} // namespace vnt
