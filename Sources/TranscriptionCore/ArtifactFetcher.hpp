#pragma once

#include "Types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace vnt {

enum class FetchStatus {
    ok,
    timeout,
    network_error,
    http_error,
    io_error
};

struct FetchResult {
    FetchStatus status         = FetchStatus::network_error;
    int         http_status    = 0;
    int64_t     bytes_written  = 0;
    int64_t     content_length = -1;   // -1 when the server did not send one
    std::string message;
};

/// Transfers one remote file to a local path.
class ArtifactFetcher {
public:
    virtual ~ArtifactFetcher() = default;

    /// GET `url` into `dest_path` (truncating it).  Must give up and return
    /// FetchStatus::timeout once `deadline` passes.  `progress` (may be null)
    /// receives 0-100 when the total size is known.
    virtual FetchResult fetch(const std::string& url,
                              const std::string& dest_path,
                              const ProgressCallback& progress,
                              std::chrono::steady_clock::time_point deadline) = 0;
};

/// Plain HTTP(S) GET through cpp-httplib.  Redirects are followed (model
/// hosts answer with a 302 to a CDN); no authentication is sent.
class HttpArtifactFetcher : public ArtifactFetcher {
public:
    FetchResult fetch(const std::string& url,
                      const std::string& dest_path,
                      const ProgressCallback& progress,
                      std::chrono::steady_clock::time_point deadline) override;

    /// Split "https://host[:port]/path?q" into ("https://host[:port]", "/path?q").
    /// Returns false if `url` has no scheme.
    static bool split_url(const std::string& url,
                          std::string& scheme_host_port,
                          std::string& path);
};

} // namespace vnt
