#include "core/version_resolver.hpp"
#include "core/errors.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

VersionResolver::VersionResolver(std::string endpoint_url, HttpOptions options)
    : endpoint_url_(std::move(endpoint_url)), options_(options) {}

Version VersionResolver::fetch_latest() const {
    std::string body = http_get(endpoint_url_, options_);
    try {
        return parse_version_payload(body);
    } catch (const UpdateError& e) {
        throw UpdateError(e.kind(), "latest version from " + endpoint_url_ + ": " + e.what());
    }
}

std::string VersionResolver::build_info_path(const std::string& install_path) {
    return (fs::path(install_path) / "resources" / "build_info.json").string();
}

Version VersionResolver::read_installed(const std::string& install_path) {
    std::string path = build_info_path(install_path);

    std::ifstream in(path);
    if (!in.is_open()) {
        throw UpdateError(ErrorKind::Io, "cannot read installed version: " + path);
    }
    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        throw UpdateError(ErrorKind::Io, "error reading " + path);
    }

    try {
        return parse_version_payload(content.str());
    } catch (const UpdateError& e) {
        throw UpdateError(e.kind(), path + ": " + e.what());
    }
}
