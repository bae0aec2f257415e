#pragma once

#include "ArtifactFetcher.hpp"
#include "Types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace vnt {

/// A named model file an engine needs on local storage.
struct ModelArtifact {
    std::string engine_id;
    std::string url;
    std::string file_name;
    int64_t     expected_bytes = 0;   // 0 = accept the server's Content-Length
};

struct DownloadPolicy {
    int                       max_attempts           = 3;
    std::chrono::seconds      attempt_timeout        {300};
    std::chrono::milliseconds backoff_base           {1000};
    int64_t                   min_free_storage_bytes = 100 * kBytesPerMegabyte;
};

enum class Readiness {
    ready,
    no_wifi,
    insufficient_storage,
    already_present
};

inline const char* to_string(Readiness r) {
    switch (r) {
        case Readiness::ready:                return "Ready";
        case Readiness::no_wifi:              return "NoWifi";
        case Readiness::insufficient_storage: return "InsufficientStorage";
        case Readiness::already_present:      return "AlreadyPresent";
    }
    return "Ready";
}

enum class DownloadError {
    none,
    no_wifi,
    insufficient_storage,
    timeout,
    network,
    http_status,
    size_mismatch,
    io
};

inline const char* to_string(DownloadError e) {
    switch (e) {
        case DownloadError::none:                 return "none";
        case DownloadError::no_wifi:              return "no_wifi";
        case DownloadError::insufficient_storage: return "insufficient_storage";
        case DownloadError::timeout:              return "timeout";
        case DownloadError::network:              return "network";
        case DownloadError::http_status:          return "http_status";
        case DownloadError::size_mismatch:        return "size_mismatch";
        case DownloadError::io:                   return "io";
    }
    return "none";
}

struct DownloadResult {
    bool          ok       = false;
    DownloadError error    = DownloadError::none;
    std::string   reason;
    int           attempts = 0;

    static DownloadResult success(int attempts) {
        return DownloadResult{true, DownloadError::none, "", attempts};
    }
    static DownloadResult failed(DownloadError error, std::string reason, int attempts = 0) {
        return DownloadResult{false, error, std::move(reason), attempts};
    }
};

/// Ensures one model artifact is present on local storage.
///
/// Lifecycle of the file:
///
///   absent --download--> <name>.part --verify size--> <name> (present)
///                              |
///                       mismatch / error --> .part removed (absent)
///
/// A transfer never starts on a metered network or when free storage is
/// below the policy floor.  Failed attempts are retried with exponential
/// backoff (base * 2^attempt) up to the policy's attempt budget; each
/// attempt has its own deadline.
///
/// download() is single-flight: while a transfer is in progress, other
/// callers block on the same result instead of starting their own.
///
/// Consent is not tracked here.  Callers must only invoke download() for
/// clips whose owner granted it.
class ModelArtifactManager {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /// @param sleeper  Waits between attempts; defaults to sleep_for.
    ModelArtifactManager(ModelArtifact artifact,
                         std::string model_dir,
                         DownloadPolicy policy,
                         std::shared_ptr<ArtifactFetcher> fetcher,
                         Sleeper sleeper = nullptr);
    ~ModelArtifactManager();

    // Non-copyable.
    ModelArtifactManager(const ModelArtifactManager&) = delete;
    ModelArtifactManager& operator=(const ModelArtifactManager&) = delete;

    const ModelArtifact& artifact() const { return artifact_; }
    const DownloadPolicy& policy() const { return policy_; }

    /// True when the verified model file exists with the expected size.
    bool are_models_present() const;

    /// Evaluate download preconditions against a device snapshot.
    Readiness can_download(const DeviceInfo& device) const;

    /// Download the artifact if absent.  Blocks; never call from a UI thread.
    DownloadResult download(const DeviceInfo& device,
                            ProgressCallback progress = nullptr);

    /// Absolute path of the verified model file.
    std::string model_file() const;

    /// Remove the model (and any partial transfer).  Returns false on I/O error.
    bool delete_models();

    /// Size of the model file on disk, 0 if absent.
    int64_t model_size_bytes() const;

    bool is_download_in_flight() const;

private:
    DownloadResult run_download(const DeviceInfo& device,
                                const ProgressCallback& progress);
    DownloadResult attempt_once(const ProgressCallback& progress);
    std::string partial_file() const;
    void clear_in_flight();

    ModelArtifact                       artifact_;
    std::string                         model_dir_;
    DownloadPolicy                      policy_;
    std::shared_ptr<ArtifactFetcher>    fetcher_;
    Sleeper                             sleeper_;

    mutable std::mutex                  mu_;
    std::shared_future<DownloadResult>  in_flight_;
};

} // namespace vnt
