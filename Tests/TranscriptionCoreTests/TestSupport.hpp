#pragma once

#include "ArtifactFetcher.hpp"
#include "SpeechEngine.hpp"
#include "TaskRunner.hpp"
#include "Types.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace vnt {
namespace test {

// ---------------------------------------------------------------------------
// Temporary directory, removed on destruction
// ---------------------------------------------------------------------------

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        const auto base = std::filesystem::temp_directory_path();
        do {
            path_ = base / ("vnt-test-" + std::to_string(rd()));
        } while (std::filesystem::exists(path_));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return (path_ / name).string(); }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// ---------------------------------------------------------------------------
// WAV synthesis
// ---------------------------------------------------------------------------

inline void put_u16(std::ofstream& out, uint16_t v) {
    const char b[2] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF)};
    out.write(b, 2);
}

inline void put_u32(std::ofstream& out, uint32_t v) {
    const char b[4] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF),
                       static_cast<char>((v >> 16) & 0xFF), static_cast<char>((v >> 24) & 0xFF)};
    out.write(b, 4);
}

/// Write a 16-bit PCM sine tone.  Every channel carries the same signal.
inline void write_sine_wav(const std::string& path,
                           float seconds,
                           int sample_rate = 16000,
                           int channels = 1,
                           float frequency = 440.0f,
                           float amplitude = 0.5f) {
    const uint32_t frames = static_cast<uint32_t>(seconds * static_cast<float>(sample_rate));
    const uint32_t data_size = frames * static_cast<uint32_t>(channels) * 2u;

    std::ofstream out(path, std::ios::binary);
    out.write("RIFF", 4);
    put_u32(out, 36 + data_size);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    put_u32(out, 16);
    put_u16(out, 1);    // PCM
    put_u16(out, static_cast<uint16_t>(channels));
    put_u32(out, static_cast<uint32_t>(sample_rate));
    put_u32(out, static_cast<uint32_t>(sample_rate * channels * 2));
    put_u16(out, static_cast<uint16_t>(channels * 2));
    put_u16(out, 16);
    out.write("data", 4);
    put_u32(out, data_size);

    const double two_pi = 6.283185307179586;
    for (uint32_t i = 0; i < frames; ++i) {
        const double v = amplitude * std::sin(two_pi * frequency * i / sample_rate);
        const auto s = static_cast<int16_t>(std::lround(v * 32767.0));
        for (int c = 0; c < channels; ++c) {
            put_u16(out, static_cast<uint16_t>(s));
        }
    }
}

/// Write arbitrary bytes to a file.
inline void write_bytes(const std::string& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

// ---------------------------------------------------------------------------
// Device snapshots
// ---------------------------------------------------------------------------

inline DeviceInfo capable_device() {
    DeviceInfo d;
    d.total_memory_bytes      = 3000 * kBytesPerMegabyte;
    d.available_storage_bytes = 500 * kBytesPerMegabyte;
    d.network                 = NetworkClass::unmetered;
    d.charging                = true;
    d.battery_low             = false;
    return d;
}

// ---------------------------------------------------------------------------
// FakeEngine
// ---------------------------------------------------------------------------

/// Shared script and counters for every FakeEngine built from it.
struct FakeEngineScript {
    std::string engine_id      = "whisper-tiny";
    bool        available      = true;
    bool        requires_model = false;
    std::optional<TranscriptionError> init_error;
    std::optional<TranscriptionError> transcribe_error;
    std::string text           = "take two tablets after dinner";
    std::string language       = "en";
    bool        throw_on_transcribe = false;
    std::function<void()> on_transcribe;

    std::atomic<int> created{0};
    std::atomic<int> initialized{0};
    std::atomic<int> transcribed{0};
    std::atomic<int> cleaned_up{0};
    std::atomic<size_t> last_sample_count{0};
};

class FakeEngine : public SpeechEngine {
public:
    explicit FakeEngine(std::shared_ptr<FakeEngineScript> script)
        : script_(std::move(script)) {
        ++script_->created;
    }

    std::string engine_id() const override { return script_->engine_id; }
    std::string engine_name() const override { return "Fake " + script_->engine_id; }
    bool is_available(const DeviceInfo&) const override { return script_->available; }

    Outcome<Unit> initialize() override {
        ++script_->initialized;
        if (script_->init_error) return Outcome<Unit>::failure(*script_->init_error);
        return Outcome<Unit>::success(Unit{});
    }

    Outcome<TranscriptionResult> transcribe(const PcmBuffer& audio) override {
        ++script_->transcribed;
        script_->last_sample_count = audio.samples.size();
        if (script_->on_transcribe) script_->on_transcribe();
        if (script_->throw_on_transcribe) throw std::runtime_error("engine crashed");
        if (script_->transcribe_error) {
            return Outcome<TranscriptionResult>::failure(*script_->transcribe_error);
        }
        TranscriptionResult r;
        r.text          = script_->text;
        r.language_code = script_->language;
        r.engine_id     = script_->engine_id;
        return Outcome<TranscriptionResult>::success(r);
    }

    void cleanup() override { ++script_->cleaned_up; }

    bool requires_model_artifact() const override { return script_->requires_model; }

private:
    std::shared_ptr<FakeEngineScript> script_;
};

// ---------------------------------------------------------------------------
// FakeFetcher
// ---------------------------------------------------------------------------

/// Scripted ArtifactFetcher.  Each call consumes the next scripted result;
/// the last one repeats.  `ok` results write `body_bytes` bytes.
class FakeFetcher : public ArtifactFetcher {
public:
    struct Step {
        FetchStatus status     = FetchStatus::ok;
        int64_t     body_bytes = 0;
    };

    explicit FakeFetcher(std::vector<Step> steps) : steps_(std::move(steps)) {}

    FetchResult fetch(const std::string& url,
                      const std::string& dest_path,
                      const ProgressCallback& progress,
                      std::chrono::steady_clock::time_point /*deadline*/) override {
        Step step;
        {
            std::lock_guard<std::mutex> lock(mu_);
            const size_t index = std::min(static_cast<size_t>(calls_), steps_.size() - 1);
            step = steps_[index];
            ++calls_;
            last_url_ = url;
        }

        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }

        FetchResult result;
        result.status = step.status;
        if (step.status != FetchStatus::ok) {
            result.message = "scripted failure";
            return result;
        }

        std::ofstream out(dest_path, std::ios::binary | std::ios::trunc);
        const std::string chunk(static_cast<size_t>(step.body_bytes), 'm');
        out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        result.bytes_written  = step.body_bytes;
        result.content_length = step.body_bytes;
        result.http_status    = 200;
        if (progress) progress(100);
        return result;
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mu_);
        return calls_;
    }

    std::string last_url() const {
        std::lock_guard<std::mutex> lock(mu_);
        return last_url_;
    }

    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

private:
    mutable std::mutex        mu_;
    std::vector<Step>         steps_;
    int                       calls_ = 0;
    std::string               last_url_;
    std::chrono::milliseconds delay_{0};
};

// ---------------------------------------------------------------------------
// InlineTaskRunner
// ---------------------------------------------------------------------------

/// Holds submitted tasks until run_all() executes them on the calling thread.
class InlineTaskRunner : public TaskRunner {
public:
    bool submit_unique(const std::string& name,
                       const TaskConstraints& constraints,
                       DeferredTask task) override {
        if (tasks_.count(name)) return false;
        tasks_[name] = Submitted{constraints, std::move(task)};
        ++submissions_;
        return true;
    }

    bool cancel(const std::string& name) override {
        return tasks_.erase(name) > 0;
    }

    bool is_scheduled(const std::string& name) const override {
        return tasks_.count(name) > 0;
    }

    /// Run every task whose constraints `device` satisfies.  Tasks that
    /// return retry stay queued.  Returns how many ran.
    int run_all(const DeviceInfo& device) {
        int ran = 0;
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            if (!constraints_satisfied(it->second.constraints, device)) {
                ++it;
                continue;
            }
            CancellationToken token;
            const TaskStatus status = it->second.task(device, token);
            ++ran;
            if (status == TaskStatus::done) it = tasks_.erase(it);
            else ++it;
        }
        return ran;
    }

    size_t size() const { return tasks_.size(); }
    int submissions() const { return submissions_; }

    const TaskConstraints& constraints_of(const std::string& name) const {
        return tasks_.at(name).constraints;
    }

private:
    struct Submitted {
        TaskConstraints constraints;
        DeferredTask    task;
    };

    std::map<std::string, Submitted> tasks_;
    int submissions_ = 0;
};

} // namespace test
} // namespace vnt
