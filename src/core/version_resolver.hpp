#pragma once

#include "core/http.hpp"
#include "core/version.hpp"

#include <string>

class VersionResolver {
public:
    VersionResolver(std::string endpoint_url, HttpOptions options = {});

    /// GET the version endpoint and parse its payload
    Version fetch_latest() const;

    /// Read <install_path>/resources/build_info.json
    static Version read_installed(const std::string& install_path);

    static std::string build_info_path(const std::string& install_path);

private:
    std::string endpoint_url_;
    HttpOptions options_;
};
