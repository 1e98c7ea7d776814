#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

struct HttpOptions {
    int connect_timeout_sec = 0;  // 0 = library default
    int read_timeout_sec = 0;
};

struct UrlParts {
    std::string scheme;
    std::string host;
    int port = 443;
    std::string path;
};

/// Split "scheme://host[:port]/path?query". Host is empty if the URL has no scheme.
UrlParts parse_url(const std::string& url);

/// GET the whole body. Throws UpdateError(ErrorKind::Network) on transport
/// failure or a non-2xx status.
std::string http_get(const std::string& url, const HttpOptions& options);

/// Streaming GET. `on_response` receives the Content-Length (0 if absent)
/// before the first chunk; `on_chunk` returns false to abort.
/// Returns false if the receiver aborted, true once the body is complete.
/// Throws UpdateError(ErrorKind::Network) on transport failure or non-2xx.
bool http_stream(const std::string& url,
                 const HttpOptions& options,
                 std::function<void(int64_t content_length)> on_response,
                 std::function<bool(const char* data, size_t length)> on_chunk);
