#include "core/downloader.hpp"
#include "core/errors.hpp"
#include "core/progress.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

Downloader::Downloader(HttpOptions options) : options_(options) {}

void Downloader::download(const std::string& url,
                          const std::string& dest_path,
                          ProgressSink& sink) const {
    std::ofstream out(dest_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw UpdateError(ErrorKind::Io, "cannot open " + dest_path + " for writing");
    }

    int64_t total_bytes = 0;
    int64_t received_bytes = 0;
    bool write_failed = false;

    auto on_response = [&](int64_t content_length) {
        total_bytes = content_length;
        ProgressEvent e;
        e.kind = ProgressEvent::Kind::Started;
        e.total = total_bytes;
        sink.on_event(e);
    };

    auto on_chunk = [&](const char* data, size_t length) -> bool {
        out.write(data, static_cast<std::streamsize>(length));
        if (!out.good()) {
            write_failed = true;  // disk full, quota, ...
            return false;
        }
        received_bytes += static_cast<int64_t>(length);

        ProgressEvent e;
        e.kind = ProgressEvent::Kind::Advanced;
        e.received = received_bytes;
        e.total = total_bytes;
        sink.on_event(e);
        return true;
    };

    auto discard_partial = [&]() {
        out.close();
        std::error_code ec;
        fs::remove(dest_path, ec);
    };

    try {
        http_stream(url, options_, on_response, on_chunk);
    } catch (const UpdateError&) {
        discard_partial();
        sink.on_event(ProgressEvent{ProgressEvent::Kind::Finished, received_bytes, total_bytes, ""});
        throw;
    }

    if (write_failed) {
        discard_partial();
        sink.on_event(ProgressEvent{ProgressEvent::Kind::Finished, received_bytes, total_bytes, ""});
        throw UpdateError(ErrorKind::Io, "failed writing " + dest_path);
    }

    out.close();
    if (out.fail()) {
        std::error_code ec;
        fs::remove(dest_path, ec);
        sink.on_event(ProgressEvent{ProgressEvent::Kind::Finished, received_bytes, total_bytes, ""});
        throw UpdateError(ErrorKind::Io, "failed closing " + dest_path);
    }

    sink.on_event(ProgressEvent{ProgressEvent::Kind::Finished, received_bytes, total_bytes, ""});
}
