#include "ConfigLoader.hpp"

#include "Logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace vnt {

using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

PipelineConfig from_json(const json& j) {
    PipelineConfig c;
    read_key(j, "database_path",            c.database_path);
    read_key(j, "model_dir",                c.model_dir);
    read_key(j, "model_url",                c.model_url);
    read_key(j, "model_file_name",          c.model_file_name);
    read_key(j, "model_expected_bytes",     c.model_expected_bytes);
    read_key(j, "min_memory_mb",            c.min_memory_mb);
    read_key(j, "min_free_storage_mb",      c.min_free_storage_mb);
    read_key(j, "max_download_attempts",    c.max_download_attempts);
    read_key(j, "download_timeout_seconds", c.download_timeout_seconds);
    read_key(j, "backoff_base_ms",          c.backoff_base_ms);
    read_key(j, "fallback_language",        c.fallback_language);
    read_key(j, "supported_languages",      c.supported_languages);
    read_key(j, "remote_api_key",           c.remote_api_key);
    read_key(j, "whisper_threads",          c.whisper_threads);
    read_key(j, "worker_threads",           c.worker_threads);
    read_key(j, "initial_delay_seconds",    c.initial_delay_seconds);
    read_key(j, "log_level",                c.log_level);
    return c;
}

json to_json(const PipelineConfig& c) {
    return json{
        {"database_path",            c.database_path},
        {"model_dir",                c.model_dir},
        {"model_url",                c.model_url},
        {"model_file_name",          c.model_file_name},
        {"model_expected_bytes",     c.model_expected_bytes},
        {"min_memory_mb",            c.min_memory_mb},
        {"min_free_storage_mb",      c.min_free_storage_mb},
        {"max_download_attempts",    c.max_download_attempts},
        {"download_timeout_seconds", c.download_timeout_seconds},
        {"backoff_base_ms",          c.backoff_base_ms},
        {"fallback_language",        c.fallback_language},
        {"supported_languages",      c.supported_languages},
        {"remote_api_key",           c.remote_api_key},
        {"whisper_threads",          c.whisper_threads},
        {"worker_threads",           c.worker_threads},
        {"initial_delay_seconds",    c.initial_delay_seconds},
        {"log_level",                c.log_level}
    };
}

} // namespace

PipelineConfig ConfigLoader::load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::info("[ConfigLoader] " + path + " not found, using defaults");
        return PipelineConfig{};
    }

    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return parse(ss.str());
}

PipelineConfig ConfigLoader::parse(const std::string& json_text) {
    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            Logger::error("[ConfigLoader] Config root is not an object, using defaults");
            return PipelineConfig{};
        }
        return from_json(j);
    } catch (const json::exception& e) {
        Logger::error(std::string("[ConfigLoader] Error reading config: ") + e.what());
    }
    return PipelineConfig{};
}

bool ConfigLoader::save(const std::string& path, const PipelineConfig& config) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream f(path);
    if (!f.is_open()) {
        Logger::error("[ConfigLoader] Cannot write " + path);
        return false;
    }
    f << to_json(config).dump(4);
    return static_cast<bool>(f);
}

} // namespace vnt
