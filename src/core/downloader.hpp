#pragma once

#include "core/http.hpp"

#include <string>

class ProgressSink;

class Downloader {
public:
    explicit Downloader(HttpOptions options = {});

    /// Stream `url` into `dest_path`, reporting Started/Advanced/Finished
    /// events to `sink`. On failure the partial file is removed.
    /// Throws UpdateError (Network or Io).
    void download(const std::string& url,
                  const std::string& dest_path,
                  ProgressSink& sink) const;

private:
    HttpOptions options_;
};
