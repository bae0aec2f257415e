#include "ArtifactFetcher.hpp"

#include "Logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <fstream>

#include <httplib.h>

namespace vnt {

bool HttpArtifactFetcher::split_url(const std::string& url,
                                    std::string& scheme_host_port,
                                    std::string& path) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return false;
    }
    const auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        scheme_host_port = url;
        path = "/";
    } else {
        scheme_host_port = url.substr(0, path_start);
        path = url.substr(path_start);
    }
    return scheme_host_port.size() > scheme_end + 3;
}

FetchResult HttpArtifactFetcher::fetch(const std::string& url,
                                       const std::string& dest_path,
                                       const ProgressCallback& progress,
                                       std::chrono::steady_clock::time_point deadline) {
    FetchResult result;

    std::string base;
    std::string path;
    if (!split_url(url, base, path)) {
        result.message = "Malformed URL: " + url;
        return result;
    }

    std::ofstream out(dest_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        result.status = FetchStatus::io_error;
        result.message = "Cannot open " + dest_path + " for writing";
        return result;
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::seconds>(
        deadline - std::chrono::steady_clock::now());
    const time_t timeout_sec = std::max<time_t>(1, static_cast<time_t>(remaining.count()));

    httplib::Client cli(base);
    cli.set_follow_location(true);
    cli.set_connection_timeout(timeout_sec, 0);
    cli.set_read_timeout(timeout_sec, 0);

    Logger::debug("[HttpArtifactFetcher] Downloading: " + url);

    bool timed_out = false;
    bool write_failed = false;
    int last_percent = -1;

    auto res = cli.Get(
        path,
        [&](const httplib::Response& response) {
            result.http_status = response.status;
            if (response.has_header("Content-Length")) {
                const std::string value = response.get_header_value("Content-Length");
                result.content_length = static_cast<int64_t>(
                    std::strtoll(value.c_str(), nullptr, 10));
            }
            return response.status == 200;
        },
        [&](const char* data, size_t len) {
            if (std::chrono::steady_clock::now() > deadline) {
                timed_out = true;
                return false;
            }
            out.write(data, static_cast<std::streamsize>(len));
            if (!out) {
                write_failed = true;
                return false;
            }
            result.bytes_written += static_cast<int64_t>(len);
            if (progress && result.content_length > 0) {
                int percent = static_cast<int>(result.bytes_written * 100 / result.content_length);
                if (percent != last_percent) {
                    last_percent = percent;
                    progress(percent);
                }
            }
            return true;
        });

    out.flush();
    out.close();

    if (timed_out) {
        result.status = FetchStatus::timeout;
        result.message = "Download exceeded its deadline";
    } else if (write_failed) {
        result.status = FetchStatus::io_error;
        result.message = "Write to " + dest_path + " failed";
    } else if (result.http_status != 0 && result.http_status != 200) {
        result.status = FetchStatus::http_error;
        result.message = "HTTP error: " + std::to_string(result.http_status);
    } else if (!res) {
        const auto err = res.error();
        result.status = (err == httplib::Error::Read || err == httplib::Error::Connection)
                        && std::chrono::steady_clock::now() > deadline
            ? FetchStatus::timeout
            : FetchStatus::network_error;
        result.message = httplib::to_string(err);
    } else {
        result.status = FetchStatus::ok;
    }

    if (result.status != FetchStatus::ok) {
        Logger::warn("[HttpArtifactFetcher] " + url + ": " + result.message);
    }
    return result;
}

} // namespace vnt
