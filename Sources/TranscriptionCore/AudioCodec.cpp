#include "AudioCodec.hpp"

#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
}

namespace vnt {

namespace {

// ---------------------------------------------------------------------------
// RAII holders for FFmpeg handles
// ---------------------------------------------------------------------------

class FormatInput {
public:
    FormatInput() = default;
    ~FormatInput() { if (ctx_) avformat_close_input(&ctx_); }
    FormatInput(const FormatInput&) = delete;
    FormatInput& operator=(const FormatInput&) = delete;

    AVFormatContext** addr() { return &ctx_; }
    AVFormatContext* get() const { return ctx_; }

private:
    AVFormatContext* ctx_ = nullptr;
};

class DecoderContext {
public:
    explicit DecoderContext(const AVCodec* codec) : ctx_(avcodec_alloc_context3(codec)) {}
    ~DecoderContext() { if (ctx_) avcodec_free_context(&ctx_); }
    DecoderContext(const DecoderContext&) = delete;
    DecoderContext& operator=(const DecoderContext&) = delete;

    AVCodecContext* get() const { return ctx_; }

private:
    AVCodecContext* ctx_ = nullptr;
};

class Resampler {
public:
    Resampler() = default;
    ~Resampler() { if (swr_) swr_free(&swr_); }
    Resampler(const Resampler&) = delete;
    Resampler& operator=(const Resampler&) = delete;

    SwrContext** addr() { return &swr_; }
    SwrContext* get() const { return swr_; }

private:
    SwrContext* swr_ = nullptr;
};

class PacketFrame {
public:
    PacketFrame() : pkt_(av_packet_alloc()), frame_(av_frame_alloc()) {}
    ~PacketFrame() {
        av_frame_free(&frame_);
        av_packet_free(&pkt_);
    }
    PacketFrame(const PacketFrame&) = delete;
    PacketFrame& operator=(const PacketFrame&) = delete;

    AVPacket* packet() const { return pkt_; }
    AVFrame* frame() const { return frame_; }

private:
    AVPacket* pkt_   = nullptr;
    AVFrame*  frame_ = nullptr;
};

std::string av_error_string(int code) {
    char errbuf[256];
    av_strerror(code, errbuf, sizeof(errbuf));
    return errbuf;
}

// ---------------------------------------------------------------------------
// RIFF/WAVE helpers
// ---------------------------------------------------------------------------

constexpr uint16_t kWaveFormatPcm        = 0x0001;
constexpr uint16_t kWaveFormatIeeeFloat  = 0x0003;
constexpr uint16_t kWaveFormatExtensible = 0xFFFE;

struct WaveLayout {
    uint16_t format        = 0;
    uint16_t channels      = 0;
    uint32_t sample_rate   = 0;
    uint16_t block_align   = 0;
    uint16_t bits          = 0;
    size_t   data_offset   = 0;
    size_t   data_size     = 0;
};

uint16_t read_u16(const std::vector<uint8_t>& b, size_t off) {
    return static_cast<uint16_t>(b[off] | (b[off + 1] << 8));
}

uint32_t read_u32(const std::vector<uint8_t>& b, size_t off) {
    return static_cast<uint32_t>(b[off])
         | (static_cast<uint32_t>(b[off + 1]) << 8)
         | (static_cast<uint32_t>(b[off + 2]) << 16)
         | (static_cast<uint32_t>(b[off + 3]) << 24);
}

std::vector<uint8_t> read_file_bytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw AudioDecodeError("Failed to open audio file '" + path + "'");
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                                std::istreambuf_iterator<char>());
}

/// Walk the RIFF chunk list and locate "fmt " and "data".
WaveLayout parse_wave_layout(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < 12
        || std::memcmp(bytes.data(), "RIFF", 4) != 0
        || std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        throw AudioDecodeError("Not a RIFF/WAVE file");
    }

    WaveLayout layout;
    bool have_fmt = false;
    bool have_data = false;
    size_t pos = 12;

    while (pos + 8 <= bytes.size()) {
        const uint8_t* id = bytes.data() + pos;
        const size_t chunk_size = read_u32(bytes, pos + 4);
        const size_t body = pos + 8;

        if (std::memcmp(id, "fmt ", 4) == 0) {
            if (chunk_size < 16 || body + 16 > bytes.size()) {
                throw AudioDecodeError("Truncated WAVE fmt chunk");
            }
            layout.format      = read_u16(bytes, body);
            layout.channels    = read_u16(bytes, body + 2);
            layout.sample_rate = read_u32(bytes, body + 4);
            layout.block_align = read_u16(bytes, body + 12);
            layout.bits        = read_u16(bytes, body + 14);
            if (layout.format == kWaveFormatExtensible) {
                if (chunk_size < 26 || body + 26 > bytes.size()) {
                    throw AudioDecodeError("Truncated WAVE_FORMAT_EXTENSIBLE chunk");
                }
                // First two bytes of the sub-format GUID carry the real tag.
                layout.format = read_u16(bytes, body + 24);
            }
            have_fmt = true;
        } else if (std::memcmp(id, "data", 4) == 0) {
            layout.data_offset = body;
            // Recorders that crash mid-write leave a bogus size; clamp it.
            layout.data_size = std::min(chunk_size, bytes.size() - body);
            have_data = true;
        }

        if (have_fmt && have_data) break;
        // Chunks are word aligned.
        pos = body + chunk_size + (chunk_size & 1);
    }

    if (!have_fmt || !have_data) {
        throw AudioDecodeError("WAVE file is missing fmt or data chunk");
    }
    if (layout.channels == 0 || layout.sample_rate == 0 || layout.block_align == 0) {
        throw AudioDecodeError("WAVE fmt chunk has zero channels or rate");
    }
    if (layout.format != kWaveFormatPcm && layout.format != kWaveFormatIeeeFloat) {
        throw AudioDecodeError("Unsupported WAVE sample format " +
                               std::to_string(layout.format));
    }
    return layout;
}

float decode_wave_sample(const uint8_t* p, uint16_t format, uint16_t bits) {
    if (format == kWaveFormatIeeeFloat) {
        if (bits != 32) {
            throw AudioDecodeError("Unsupported float WAVE bit depth " + std::to_string(bits));
        }
        float f;
        std::memcpy(&f, p, sizeof(f));
        return f;
    }
    switch (bits) {
        case 8:
            return (static_cast<float>(p[0]) - 128.0f) / 128.0f;
        case 16: {
            int16_t s = static_cast<int16_t>(p[0] | (p[1] << 8));
            return static_cast<float>(s) / 32768.0f;
        }
        case 24: {
            int32_t s = p[0] | (p[1] << 8) | (p[2] << 16);
            if (s & 0x800000) s |= ~0xFFFFFF;   // sign extend
            return static_cast<float>(s) / 8388608.0f;
        }
        case 32: {
            int32_t s = static_cast<int32_t>(
                static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8)
                | (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24));
            return static_cast<float>(static_cast<double>(s) / 2147483648.0);
        }
        default:
            throw AudioDecodeError("Unsupported PCM WAVE bit depth " + std::to_string(bits));
    }
}

std::string lowercase_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

void check_readable(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw AudioDecodeError("Audio file does not exist: " + path);
    }
    if (std::filesystem::file_size(path, ec) == 0 || ec) {
        throw AudioDecodeError("Audio file is empty: " + path);
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

AudioCodec::AudioCodec() = default;
AudioCodec::~AudioCodec() = default;

// ---------------------------------------------------------------------------
// decode
// ---------------------------------------------------------------------------

PcmBuffer AudioCodec::decode(const std::string& path, ContainerFormat hint) const {
    check_readable(path);

    ContainerFormat format = resolve_container(path, hint);
    RawAudio raw = format == ContainerFormat::wave
        ? decode_wave(path)
        : decode_compressed(path);

    if (raw.interleaved.empty() || raw.channels <= 0 || raw.sample_rate <= 0) {
        throw AudioDecodeError("Audio file decoded to zero samples: " + path);
    }

    std::vector<float> mono = downmix_to_mono(raw.interleaved, raw.channels);

    PcmBuffer out;
    out.sample_rate = kTargetSampleRate;
    out.samples = raw.sample_rate == kTargetSampleRate
        ? std::move(mono)
        : resample_linear(mono, raw.sample_rate, kTargetSampleRate);

    for (float& s : out.samples) {
        if (std::isnan(s)) s = 0.0f;
        s = std::clamp(s, -1.0f, 1.0f);
    }

    Logger::debug("[AudioCodec] Decoded " + path + ": "
                  + std::to_string(raw.channels) + " ch @ "
                  + std::to_string(raw.sample_rate) + " Hz -> "
                  + std::to_string(out.samples.size()) + " samples");
    return out;
}

// ---------------------------------------------------------------------------
// probe_duration_seconds
// ---------------------------------------------------------------------------

std::optional<float> AudioCodec::probe_duration_seconds(const std::string& path,
                                                        ContainerFormat hint) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    try {
        return resolve_container(path, hint) == ContainerFormat::wave
            ? probe_wave(path)
            : probe_compressed(path);
    } catch (const AudioDecodeError& e) {
        Logger::warn(std::string("[AudioCodec] Failed to get audio duration: ") + e.what());
        return std::nullopt;
    }
}

// ---------------------------------------------------------------------------
// resolve_container  (static)
// ---------------------------------------------------------------------------

ContainerFormat AudioCodec::resolve_container(const std::string& path,
                                              ContainerFormat hint) {
    if (hint != ContainerFormat::automatic) {
        return hint;
    }

    const std::string ext = lowercase_extension(path);
    if (ext == "wav" || ext == "wave") return ContainerFormat::wave;
    if (ext == "m4a" || ext == "mp4" || ext == "aac" || ext == "3gp") {
        return ContainerFormat::compressed;
    }

    // Unknown extension: sniff the header.
    std::ifstream in(path, std::ios::binary);
    char magic[12] = {};
    if (in.read(magic, sizeof(magic))
        && std::memcmp(magic, "RIFF", 4) == 0
        && std::memcmp(magic + 8, "WAVE", 4) == 0) {
        return ContainerFormat::wave;
    }
    return ContainerFormat::compressed;
}

// ---------------------------------------------------------------------------
// downmix_to_mono  (static)
// ---------------------------------------------------------------------------

std::vector<float> AudioCodec::downmix_to_mono(const std::vector<float>& interleaved,
                                               int channels) {
    if (channels <= 1) {
        return interleaved;
    }

    const size_t frames = interleaved.size() / static_cast<size_t>(channels);
    std::vector<float> mono(frames);
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (int ch = 0; ch < channels; ++ch) {
            sum += interleaved[i * channels + ch];
        }
        mono[i] = sum / static_cast<float>(channels);
    }
    return mono;
}

// ---------------------------------------------------------------------------
// resample_linear  (static; simple linear interpolation, good enough for speech)
// ---------------------------------------------------------------------------

std::vector<float> AudioCodec::resample_linear(const std::vector<float>& input,
                                               int input_rate,
                                               int output_rate) {
    if (input.empty() || input_rate <= 0 || output_rate <= 0) {
        return {};
    }

    if (input_rate == output_rate) {
        return input;   // no-op
    }

    const double ratio = static_cast<double>(output_rate) / static_cast<double>(input_rate);
    const size_t out_len = static_cast<size_t>(
        std::ceil(static_cast<double>(input.size()) * ratio));

    std::vector<float> output(out_len);

    for (size_t i = 0; i < out_len; ++i) {
        double src_idx = static_cast<double>(i) / ratio;
        size_t idx0 = std::min(static_cast<size_t>(src_idx), input.size() - 1);
        size_t idx1 = std::min(idx0 + 1, input.size() - 1);
        double frac = src_idx - static_cast<double>(idx0);
        output[i] = static_cast<float>(
            input[idx0] * (1.0 - frac) + input[idx1] * frac);
    }

    return output;
}

// ---------------------------------------------------------------------------
// decode_compressed
// ---------------------------------------------------------------------------

AudioCodec::RawAudio AudioCodec::decode_compressed(const std::string& path) const {
    // 1. Open input file
    FormatInput input;
    int ret = avformat_open_input(input.addr(), path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        throw AudioDecodeError("Failed to open audio file '" + path + "': " + av_error_string(ret));
    }

    ret = avformat_find_stream_info(input.get(), nullptr);
    if (ret < 0) {
        throw AudioDecodeError("Failed to find stream info in audio file");
    }

    // 2. Find the audio stream
    int audio_idx = av_find_best_stream(input.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audio_idx < 0) {
        throw AudioDecodeError("No audio stream found in file");
    }
    AVStream* stream = input.get()->streams[audio_idx];

    // 3. Open decoder
    const AVCodec* decoder = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!decoder) {
        throw AudioDecodeError("No decoder found for audio codec");
    }
    DecoderContext dec(decoder);
    if (!dec.get()) {
        throw AudioDecodeError("Failed to allocate decoder context");
    }
    avcodec_parameters_to_context(dec.get(), stream->codecpar);
    ret = avcodec_open2(dec.get(), decoder, nullptr);
    if (ret < 0) {
        throw AudioDecodeError("Failed to open audio decoder: " + av_error_string(ret));
    }

    const int channels = dec.get()->ch_layout.nb_channels;
    const int rate = dec.get()->sample_rate;
    if (channels <= 0 || rate <= 0) {
        throw AudioDecodeError("Decoder reported no channels or sample rate");
    }

    // 4. Sample-format conversion only: keep source rate and channel layout.
    //    Downmix and rate conversion happen in decode().
    Resampler swr;
    ret = swr_alloc_set_opts2(swr.addr(),
        &dec.get()->ch_layout, AV_SAMPLE_FMT_FLT, rate,
        &dec.get()->ch_layout, dec.get()->sample_fmt, rate,
        0, nullptr);
    if (ret < 0 || swr_init(swr.get()) < 0) {
        throw AudioDecodeError("Failed to initialize sample format converter");
    }

    RawAudio raw;
    raw.channels = channels;
    raw.sample_rate = rate;

    auto drain_frames = [&](AVFrame* frame) {
        while (avcodec_receive_frame(dec.get(), frame) == 0) {
            const int out_samples = swr_get_out_samples(swr.get(), frame->nb_samples);
            if (out_samples <= 0) continue;
            std::vector<float> buf(static_cast<size_t>(out_samples) * channels);
            uint8_t* out_buf = reinterpret_cast<uint8_t*>(buf.data());
            int converted = swr_convert(swr.get(), &out_buf, out_samples,
                                        const_cast<const uint8_t**>(frame->extended_data),
                                        frame->nb_samples);
            if (converted > 0) {
                raw.interleaved.insert(raw.interleaved.end(), buf.begin(),
                                       buf.begin() + static_cast<size_t>(converted) * channels);
            }
        }
    };

    // 5. Read packets, decode frames
    PacketFrame pf;
    while (av_read_frame(input.get(), pf.packet()) >= 0) {
        if (pf.packet()->stream_index == audio_idx) {
            ret = avcodec_send_packet(dec.get(), pf.packet());
            if (ret < 0 && ret != AVERROR(EAGAIN)) {
                av_packet_unref(pf.packet());
                throw AudioDecodeError("Corrupt audio packet: " + av_error_string(ret));
            }
            drain_frames(pf.frame());
        }
        av_packet_unref(pf.packet());
    }

    // 6. Flush decoder
    avcodec_send_packet(dec.get(), nullptr);
    drain_frames(pf.frame());

    return raw;
}

// ---------------------------------------------------------------------------
// decode_wave
// ---------------------------------------------------------------------------

AudioCodec::RawAudio AudioCodec::decode_wave(const std::string& path) const {
    const std::vector<uint8_t> bytes = read_file_bytes(path);
    const WaveLayout layout = parse_wave_layout(bytes);

    const size_t bytes_per_sample = layout.bits / 8;
    if (bytes_per_sample == 0
        || layout.block_align < bytes_per_sample * layout.channels) {
        throw AudioDecodeError("Inconsistent WAVE block alignment");
    }

    const size_t frames = layout.data_size / layout.block_align;

    RawAudio raw;
    raw.channels = layout.channels;
    raw.sample_rate = static_cast<int>(layout.sample_rate);
    raw.interleaved.reserve(frames * layout.channels);

    for (size_t f = 0; f < frames; ++f) {
        const uint8_t* frame = bytes.data() + layout.data_offset + f * layout.block_align;
        for (uint16_t ch = 0; ch < layout.channels; ++ch) {
            raw.interleaved.push_back(
                decode_wave_sample(frame + ch * bytes_per_sample, layout.format, layout.bits));
        }
    }
    return raw;
}

// ---------------------------------------------------------------------------
// probes
// ---------------------------------------------------------------------------

std::optional<float> AudioCodec::probe_wave(const std::string& path) const {
    const std::vector<uint8_t> bytes = read_file_bytes(path);
    const WaveLayout layout = parse_wave_layout(bytes);
    const double frames = static_cast<double>(layout.data_size / layout.block_align);
    return static_cast<float>(frames / static_cast<double>(layout.sample_rate));
}

std::optional<float> AudioCodec::probe_compressed(const std::string& path) const {
    FormatInput input;
    int ret = avformat_open_input(input.addr(), path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        throw AudioDecodeError("Failed to open audio file '" + path + "': " + av_error_string(ret));
    }
    if (avformat_find_stream_info(input.get(), nullptr) < 0) {
        throw AudioDecodeError("Failed to find stream info in audio file");
    }

    if (input.get()->duration != AV_NOPTS_VALUE && input.get()->duration > 0) {
        return static_cast<float>(static_cast<double>(input.get()->duration) / AV_TIME_BASE);
    }

    int audio_idx = av_find_best_stream(input.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audio_idx < 0) {
        return std::nullopt;
    }
    AVStream* stream = input.get()->streams[audio_idx];
    if (stream->duration == AV_NOPTS_VALUE || stream->duration <= 0) {
        return std::nullopt;
    }
    return static_cast<float>(stream->duration * av_q2d(stream->time_base));
}

} // namespace vnt
