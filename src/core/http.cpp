#include "core/http.hpp"
#include "core/errors.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>

#ifndef APP_VERSION
#define APP_VERSION "0.0.0"
#endif

// ════════════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════════════

UrlParts parse_url(const std::string& url) {
    UrlParts parts;
    auto pos = url.find("://");
    if (pos != std::string::npos) {
        parts.scheme = url.substr(0, pos);
        auto rest = url.substr(pos + 3);
        auto path_pos = rest.find('/');
        if (path_pos != std::string::npos) {
            parts.host = rest.substr(0, path_pos);
            parts.path = rest.substr(path_pos);
        } else {
            parts.host = rest;
            parts.path = "/";
        }
    }
    auto colon = parts.host.find(':');
    if (colon != std::string::npos) {
        try {
            parts.port = std::stoi(parts.host.substr(colon + 1));
        } catch (const std::exception&) {
            parts.port = 0;
        }
        parts.host = parts.host.substr(0, colon);
    } else {
        parts.port = (parts.scheme == "https") ? 443 : 80;
    }
    return parts;
}

static httplib::Headers default_headers() {
    return {
        {"User-Agent", std::string("discord-updater/") + APP_VERSION},
    };
}

template <typename Client>
static void configure(Client& cli, const HttpOptions& options) {
    if (options.connect_timeout_sec > 0) {
        cli.set_connection_timeout(options.connect_timeout_sec, 0);
    }
    if (options.read_timeout_sec > 0) {
        cli.set_read_timeout(options.read_timeout_sec, 0);
    }
    cli.set_follow_location(true);
}

/// Run `fn` with a plain or TLS client for the URL's scheme
template <typename Fn>
static httplib::Result with_client(const UrlParts& parts, const HttpOptions& options, Fn&& fn) {
    if (parts.scheme == "https") {
        httplib::SSLClient cli(parts.host, parts.port);
        configure(cli, options);
        return fn(cli);
    }
    httplib::Client cli(parts.host, parts.port);
    configure(cli, options);
    return fn(cli);
}

static UrlParts checked_parts(const std::string& url) {
    auto parts = parse_url(url);
    if (parts.host.empty() || parts.port <= 0 ||
        (parts.scheme != "http" && parts.scheme != "https")) {
        throw UpdateError(ErrorKind::Network, "invalid URL: " + url);
    }
    return parts;
}

static bool is_success(int status) {
    return status >= 200 && status < 300;
}

// ════════════════════════════════════════════════════════════════
// Requests
// ════════════════════════════════════════════════════════════════

std::string http_get(const std::string& url, const HttpOptions& options) {
    auto parts = checked_parts(url);

    auto res = with_client(parts, options, [&](auto& cli) {
        return cli.Get(parts.path, default_headers());
    });

    if (!res) {
        throw UpdateError(ErrorKind::Network,
                          "GET " + url + " failed: " + httplib::to_string(res.error()));
    }
    if (!is_success(res->status)) {
        throw UpdateError(ErrorKind::Network,
                          "GET " + url + " returned HTTP " + std::to_string(res->status));
    }
    return res->body;
}

bool http_stream(const std::string& url,
                 const HttpOptions& options,
                 std::function<void(int64_t)> on_response,
                 std::function<bool(const char*, size_t)> on_chunk) {
    auto parts = checked_parts(url);

    int status = 0;
    bool receiver_aborted = false;

    auto response_handler = [&](const httplib::Response& response) -> bool {
        status = response.status;
        if (!is_success(status)) return false;

        int64_t content_length = 0;
        if (response.has_header("Content-Length")) {
            try {
                content_length = std::stoll(response.get_header_value("Content-Length"));
            } catch (const std::exception&) {
                content_length = 0;
            }
        }
        if (on_response) on_response(content_length);
        return true;
    };

    auto content_receiver = [&](const char* data, size_t data_length) -> bool {
        if (!on_chunk(data, data_length)) {
            receiver_aborted = true;
            return false;
        }
        return true;
    };

    auto res = with_client(parts, options, [&](auto& cli) {
        return cli.Get(parts.path, default_headers(), response_handler, content_receiver);
    });

    if (receiver_aborted) {
        return false;
    }
    if (status != 0 && !is_success(status)) {
        throw UpdateError(ErrorKind::Network,
                          "GET " + url + " returned HTTP " + std::to_string(status));
    }
    if (!res) {
        throw UpdateError(ErrorKind::Network,
                          "GET " + url + " failed: " + httplib::to_string(res.error()));
    }
    if (!is_success(res->status)) {
        throw UpdateError(ErrorKind::Network,
                          "GET " + url + " returned HTTP " + std::to_string(res->status));
    }
    return true;
}
