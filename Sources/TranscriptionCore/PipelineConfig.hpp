#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace vnt {

/// Runtime policy for the transcription pipeline.  Defaults match the
/// shipping policy; every value can be overridden from the JSON config file.
struct PipelineConfig {
    // ---- Storage ----
    std::string database_path = "transcription.db";
    std::string model_dir     = "models";

    // ---- Model artifact (whisper-tiny) ----
    std::string model_url =
        "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-tiny.bin";
    std::string model_file_name      = "whisper-tiny.bin";
    int64_t     model_expected_bytes = 77691713;   // 0 = trust Content-Length

    // ---- Device gates ----
    int64_t min_memory_mb       = 1900;
    int64_t min_free_storage_mb = 100;

    // ---- Download retry ----
    int     max_download_attempts    = 3;
    int     download_timeout_seconds = 300;
    int64_t backoff_base_ms          = 1000;   // waits base*2^attempt

    // ---- Language identification ----
    std::string              fallback_language   = "en";
    std::vector<std::string> supported_languages = {"en", "hi", "gu", "mr"};

    // ---- Engines ----
    // Non-empty puts the remote engine ahead of whisper whenever a network is
    // up.  It has no client yet and fails every transcription with
    // EngineUnavailable, so leave this empty for on-device transcription.
    std::string remote_api_key;
    int         whisper_threads = 4;

    // ---- Scheduling ----
    int worker_threads        = 1;
    int initial_delay_seconds = 5;

    std::string log_level = "info";
};

} // namespace vnt
