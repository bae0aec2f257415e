#include "ModelArtifactManager.hpp"

#include "Logger.hpp"

#include <filesystem>
#include <system_error>
#include <thread>

namespace vnt {

namespace {

constexpr const char* kTag = "[ModelArtifactManager] ";

DownloadError map_fetch_status(FetchStatus s) {
    switch (s) {
        case FetchStatus::ok:            return DownloadError::none;
        case FetchStatus::timeout:       return DownloadError::timeout;
        case FetchStatus::network_error: return DownloadError::network;
        case FetchStatus::http_error:    return DownloadError::http_status;
        case FetchStatus::io_error:      return DownloadError::io;
    }
    return DownloadError::network;
}

int64_t file_size_or_zero(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return 0;
    auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<int64_t>(size);
}

void remove_quietly(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        Logger::warn(std::string(kTag) + "Could not remove " + path + ": " + ec.message());
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

ModelArtifactManager::ModelArtifactManager(ModelArtifact artifact,
                                           std::string model_dir,
                                           DownloadPolicy policy,
                                           std::shared_ptr<ArtifactFetcher> fetcher,
                                           Sleeper sleeper)
    : artifact_(std::move(artifact)),
      model_dir_(std::move(model_dir)),
      policy_(policy),
      fetcher_(std::move(fetcher)),
      sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
    if (policy_.max_attempts < 1) {
        policy_.max_attempts = 1;
    }
}

ModelArtifactManager::~ModelArtifactManager() = default;

// ---------------------------------------------------------------------------
// Presence / readiness
// ---------------------------------------------------------------------------

std::string ModelArtifactManager::model_file() const {
    return (std::filesystem::path(model_dir_) / artifact_.file_name).string();
}

std::string ModelArtifactManager::partial_file() const {
    return model_file() + ".part";
}

bool ModelArtifactManager::are_models_present() const {
    const int64_t size = file_size_or_zero(model_file());
    if (size <= 0) return false;
    return artifact_.expected_bytes <= 0 || size == artifact_.expected_bytes;
}

Readiness ModelArtifactManager::can_download(const DeviceInfo& device) const {
    if (are_models_present()) {
        return Readiness::already_present;
    }
    // Never spend cellular data on a 75 MB model.
    if (device.network != NetworkClass::unmetered) {
        return Readiness::no_wifi;
    }
    if (device.available_storage_bytes < policy_.min_free_storage_bytes) {
        return Readiness::insufficient_storage;
    }
    return Readiness::ready;
}

int64_t ModelArtifactManager::model_size_bytes() const {
    return file_size_or_zero(model_file());
}

bool ModelArtifactManager::delete_models() {
    std::lock_guard<std::mutex> lock(mu_);
    if (in_flight_.valid()) {
        Logger::warn(std::string(kTag) + "Refusing to delete model while a download is in flight");
        return false;
    }

    std::error_code ec;
    std::filesystem::remove(partial_file(), ec);
    ec.clear();
    std::filesystem::remove(model_file(), ec);
    if (ec) {
        Logger::error(std::string(kTag) + "Error deleting model: " + ec.message());
        return false;
    }
    Logger::info(std::string(kTag) + "Model deleted: " + model_file());
    return true;
}

bool ModelArtifactManager::is_download_in_flight() const {
    std::lock_guard<std::mutex> lock(mu_);
    return in_flight_.valid();
}

void ModelArtifactManager::clear_in_flight() {
    std::lock_guard<std::mutex> lock(mu_);
    in_flight_ = std::shared_future<DownloadResult>();
}

// ---------------------------------------------------------------------------
// download  (single-flight)
// ---------------------------------------------------------------------------

DownloadResult ModelArtifactManager::download(const DeviceInfo& device,
                                              ProgressCallback progress) {
    std::promise<DownloadResult> promise;
    std::shared_future<DownloadResult> shared;
    bool leader = false;

    {
        std::lock_guard<std::mutex> lock(mu_);
        if (in_flight_.valid()) {
            shared = in_flight_;
        } else {
            shared = promise.get_future().share();
            in_flight_ = shared;
            leader = true;
        }
    }

    if (!leader) {
        Logger::info(std::string(kTag) + "Download of " + artifact_.engine_id
                     + " already in progress, waiting for it");
        return shared.get();
    }

    // Clears the in-flight marker on every exit path.
    struct InFlightReset {
        ModelArtifactManager* self;
        ~InFlightReset() { self->clear_in_flight(); }
    } reset{this};

    DownloadResult result;
    try {
        result = run_download(device, progress);
    } catch (const std::exception& e) {
        remove_quietly(partial_file());
        result = DownloadResult::failed(DownloadError::io, e.what());
    }
    promise.set_value(result);
    return result;
}

// ---------------------------------------------------------------------------
// run_download
// ---------------------------------------------------------------------------

DownloadResult ModelArtifactManager::run_download(const DeviceInfo& device,
                                                  const ProgressCallback& progress) {
    if (are_models_present()) {
        Logger::debug(std::string(kTag) + "Model already present: " + model_file());
        return DownloadResult::success(0);
    }

    // A file with the wrong size is corrupt; discard before redownloading.
    if (file_size_or_zero(model_file()) > 0) {
        Logger::warn(std::string(kTag) + "Discarding corrupt model file " + model_file());
        remove_quietly(model_file());
    }

    Logger::info(std::string(kTag) + "Starting " + artifact_.engine_id + " model download...");

    DownloadResult last;
    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        Logger::debug(std::string(kTag) + "Download attempt " + std::to_string(attempt)
                      + " of " + std::to_string(policy_.max_attempts));

        // Check readiness before each attempt.
        const Readiness readiness = can_download(device);
        if (readiness == Readiness::already_present) {
            return DownloadResult::success(attempt - 1);
        }
        if (readiness != Readiness::ready) {
            Logger::warn(std::string(kTag) + "Cannot download: " + to_string(readiness));
            return DownloadResult::failed(
                readiness == Readiness::no_wifi ? DownloadError::no_wifi
                                                : DownloadError::insufficient_storage,
                to_string(readiness), attempt - 1);
        }

        if (progress) progress(0);
        last = attempt_once(progress);
        last.attempts = attempt;

        if (last.ok) {
            if (progress) progress(100);
            Logger::info(std::string(kTag) + "Model downloaded successfully: " + model_file());
            return last;
        }

        Logger::error(std::string(kTag) + "Download attempt " + std::to_string(attempt)
                      + " failed: " + last.reason);

        if (attempt < policy_.max_attempts) {
            const auto delay = policy_.backoff_base * (1LL << attempt);
            Logger::debug(std::string(kTag) + "Retrying in " + std::to_string(delay.count()) + "ms...");
            sleeper_(delay);
        }
    }

    Logger::error(std::string(kTag) + "Model download failed after "
                  + std::to_string(policy_.max_attempts) + " attempts");
    last.ok = false;
    last.attempts = policy_.max_attempts;
    return last;
}

// ---------------------------------------------------------------------------
// attempt_once
// ---------------------------------------------------------------------------

DownloadResult ModelArtifactManager::attempt_once(const ProgressCallback& progress) {
    if (!fetcher_) {
        return DownloadResult::failed(DownloadError::network, "No fetcher configured");
    }

    std::error_code ec;
    std::filesystem::create_directories(model_dir_, ec);
    if (ec) {
        return DownloadResult::failed(DownloadError::io,
                                      "Cannot create " + model_dir_ + ": " + ec.message());
    }

    const std::string part = partial_file();
    remove_quietly(part);

    const auto deadline = std::chrono::steady_clock::now() + policy_.attempt_timeout;
    FetchResult fr = fetcher_->fetch(artifact_.url, part, progress, deadline);

    if (fr.status == FetchStatus::ok && std::chrono::steady_clock::now() > deadline) {
        fr.status = FetchStatus::timeout;
        fr.message = "Download exceeded its deadline";
    }

    if (fr.status != FetchStatus::ok) {
        remove_quietly(part);
        return DownloadResult::failed(map_fetch_status(fr.status),
                                      fr.message.empty() ? "Model file download failed"
                                                         : fr.message);
    }

    // Integrity: the byte count must match before the file counts as present.
    const int64_t expected = artifact_.expected_bytes > 0 ? artifact_.expected_bytes
                                                          : fr.content_length;
    const int64_t actual = file_size_or_zero(part);
    if (actual <= 0 || (expected > 0 && actual != expected)) {
        remove_quietly(part);
        return DownloadResult::failed(
            DownloadError::size_mismatch,
            "Size mismatch: expected " + std::to_string(expected)
                + " bytes, received " + std::to_string(actual));
    }

    std::filesystem::rename(part, model_file(), ec);
    if (ec) {
        remove_quietly(part);
        return DownloadResult::failed(DownloadError::io,
                                      "Cannot move model into place: " + ec.message());
    }

    Logger::debug(std::string(kTag) + "Downloaded: " + artifact_.file_name + " ("
                  + std::to_string(actual / kBytesPerMegabyte) + "MB)");
    return DownloadResult::success(1);
}

} // namespace vnt
